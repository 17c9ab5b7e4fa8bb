#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/model/game_image.hpp"
#include "internal/model/game_vector.hpp"
#include "internal/model/image_batch.hpp"
#include "internal/model/search_pair.hpp"

namespace rulebook::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All access goes through a Transaction
  - Reads inside a transaction see its writes
  - GetBatchForUpdate() / GetImageForUpdate() make the row exclusive to
    the caller's transaction until it ends (row lock, writer lock, or a
    conflict raised at Commit())
  - Deleting an image deletes its vector rows

  The DB is the source of truth for:
    batch progress
    image processing state
    extracted content + embeddings
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Image batches
  // ---------------------------------------------------------------------

  virtual Result InsertBatch(Transaction&, const model::ImageBatch&) = 0;

  virtual std::optional<model::ImageBatch> GetBatch(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::ImageBatch> GetBatchForUpdate(Transaction&, const std::string& id) = 0;

  virtual Result UpdateBatch(Transaction&, const model::ImageBatch&) = 0;

  virtual Result DeleteBatch(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Game images
  // ---------------------------------------------------------------------

  virtual Result InsertImage(Transaction&, const model::GameImage&) = 0;

  virtual std::optional<model::GameImage> GetImage(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::GameImage> GetImageForUpdate(Transaction&, const std::string& id) = 0;

  virtual Result UpdateImage(Transaction&, const model::GameImage&) = 0;

  virtual Result DeleteImage(Transaction&, const std::string& id) = 0;

  // Touches only last_job_id; safe against a worker updating the same row.
  virtual Result SetImageJob(Transaction&, const std::string& image_id, const std::string& job_id) = 0;

  virtual std::vector<model::GameImage> ListImagesByBatch(Transaction&, const std::string& batch_id) = 0;

  // Oldest first, by updated_at.
  virtual std::vector<model::GameImage> ListImagesByStatus(Transaction&, model::ImageStatus status, util::TimePoint updated_before,
                                                           std::size_t limit) = 0;

  // ---------------------------------------------------------------------
  // Vectors
  // ---------------------------------------------------------------------

  virtual Result InsertVector(Transaction&, const model::GameVector&) = 0;

  virtual std::optional<model::GameVector> GetVectorByImage(Transaction&, const std::string& image_id) = 0;

  virtual Result DeleteVectorsByImage(Transaction&, const std::string& image_id) = 0;

  /*
    Cosine-similarity search over one pair.

    Only rows whose selected embedding is non-null are ranked. Results
    carry every content field of the row. Throws util::DimensionMismatch
    when the query and a stored embedding disagree on length.
  */
  virtual std::vector<model::ScoredVector> SearchVectors(Transaction&, const std::string& game_id, const model::Embedding& query,
                                                         model::SearchPair pair, std::size_t limit, double threshold) = 0;
};

} // namespace rulebook::db
