#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/util/time.hpp"

namespace rulebook::model {

enum class BatchStatus : std::uint8_t {
  kPending            = 1,
  kProcessing         = 2,
  kCompleted          = 3,
  kFailed             = 4,
  kPartiallyCompleted = 5,
  kRetrying           = 6,
};

constexpr bool IsTerminal(BatchStatus status) {
  return status == BatchStatus::kCompleted || status == BatchStatus::kFailed || status == BatchStatus::kPartiallyCompleted;
}

std::string_view           ToString(BatchStatus status);
std::optional<BatchStatus> BatchStatusFromString(std::string_view value);

/*
  ImageBatch

  Progress record for one multi-file upload.

  Invariants (enforced by every mutator):
    processed_images + failed_images <= total_images
    retry_count <= max_retries
    terminal states never change again

  After creation only the progress recorder mutates counters.
*/
struct ImageBatch {
  std::string id;
  std::string game_id;

  std::uint32_t total_images     = 0;
  std::uint32_t processed_images = 0;
  std::uint32_t failed_images    = 0;

  BatchStatus status = BatchStatus::kPending;

  std::uint32_t retry_count = 0;
  std::uint32_t max_retries = 3;

  util::TimePoint                created_at{};
  std::optional<util::TimePoint> processing_started_at;
  std::optional<util::TimePoint> completed_at;

  static ImageBatch Create(std::string id, std::string game_id, std::uint32_t total_images, std::uint32_t max_retries, util::TimePoint now);

  bool IsTerminal() const {
    return model::IsTerminal(status);
  }

  // every image has an outcome for the current round
  bool AllOutcomesRecorded() const {
    return processed_images + failed_images == total_images;
  }

  bool CanRetry() const {
    return failed_images > 0 && retry_count < max_retries && !IsTerminal();
  }

  // Drops one file that never made it to storage. Only legal before processing starts.
  void ExcludeImage();

  // Removes one image that has no outcome yet (deleted while queued or
  // in flight) and re-evaluates the status. An emptied batch completes.
  void DropPendingImage(util::TimePoint now);

  // Applies one final image outcome and re-evaluates the status.
  void RecordOutcome(bool success, util::TimePoint now);

  // Failed images go back to the queue; successes stay counted.
  void StartRetry();

  std::string ProgressRatio() const;
  std::string FailedRatio() const;
  double      CompletionPercentage() const;
  double      FailurePercentage() const;

 private:
  void Evaluate(util::TimePoint now);
};

} // namespace rulebook::model
