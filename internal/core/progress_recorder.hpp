#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/model/game_image.hpp"
#include "internal/model/game_vector.hpp"
#include "internal/model/image_batch.hpp"

namespace rulebook::db {
class Repository;
}

namespace rulebook::core {

enum class RecordResult {
  kApplied,
  kDuplicate, // image already had a final outcome, nothing changed
};

/*
  ProgressRecorder

  Single writer of image processing state and batch counters.

  Every update is one transaction:

      image row  +  vector row  +  batch row (GetBatchForUpdate)

  so concurrent workers finishing images of the same batch never lose
  a counter increment. The image row is read with GetImageForUpdate, so
  two deliveries of the same job cannot both count it. Transactions that
  lose a commit race are re-run a bounded number of times
  (db::RunInTransaction).

  A batch counts an image exactly once, when the image moves from a
  pending state (UPLOADED / PROCESSING / RETRYING) to COMPLETED or FAILED.
*/
class ProgressRecorder {
 public:
  explicit ProgressRecorder(std::shared_ptr<db::Repository> repository);

  // UPLOADED/RETRYING -> PROCESSING. Returns the stored image, or nullopt
  // when it already reached a final state. Throws util::NotFound.
  std::optional<model::GameImage> BeginProcessing(const std::string& image_id);

  // Image COMPLETED; the vector (if any) replaces previous rows of the image.
  RecordResult RecordSuccess(const std::string& image_id, const std::optional<model::GameVector>& vector);

  // Image RETRYING with the error kept; the batch is not counted yet.
  RecordResult RecordRetrying(const std::string& image_id, const std::string& error, std::uint32_t retry_count);

  // Image FAILED for good; the batch counts a failure.
  RecordResult RecordFailure(const std::string& image_id, const std::string& error);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace rulebook::core
