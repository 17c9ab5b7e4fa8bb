#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace rulebook::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertBatch(Transaction&, const model::ImageBatch&) override;
  std::optional<model::ImageBatch> GetBatch(Transaction&, const std::string&) override;
  std::optional<model::ImageBatch> GetBatchForUpdate(Transaction&, const std::string&) override;
  Result UpdateBatch(Transaction&, const model::ImageBatch&) override;
  Result DeleteBatch(Transaction&, const std::string&) override;

  Result InsertImage(Transaction&, const model::GameImage&) override;
  std::optional<model::GameImage> GetImage(Transaction&, const std::string&) override;
  std::optional<model::GameImage> GetImageForUpdate(Transaction&, const std::string&) override;
  Result UpdateImage(Transaction&, const model::GameImage&) override;
  Result DeleteImage(Transaction&, const std::string&) override;
  Result SetImageJob(Transaction&, const std::string& image_id, const std::string& job_id) override;
  std::vector<model::GameImage> ListImagesByBatch(Transaction&, const std::string& batch_id) override;
  std::vector<model::GameImage> ListImagesByStatus(Transaction&, model::ImageStatus status, util::TimePoint updated_before,
                                                   std::size_t limit) override;

  Result InsertVector(Transaction&, const model::GameVector&) override;
  std::optional<model::GameVector> GetVectorByImage(Transaction&, const std::string& image_id) override;
  Result DeleteVectorsByImage(Transaction&, const std::string& image_id) override;
  std::vector<model::ScoredVector> SearchVectors(Transaction&, const std::string& game_id, const model::Embedding& query,
                                                 model::SearchPair pair, std::size_t limit, double threshold) override;

private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception& e);
};

}
