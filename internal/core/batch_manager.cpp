#include "batch_manager.hpp"

#include <optional>
#include <stdexcept>

#include "internal/db/api/repository.hpp"
#include "internal/db/api/tx_retry.hpp"
#include "internal/observability/logging.hpp"
#include "internal/queue/queue_service.hpp"
#include "internal/storage/object_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace rulebook::core {

using observability::IntField;
using observability::StringField;

namespace {

constexpr const char* kDefaultContentType = "application/octet-stream";

} // namespace

std::string ProgressMessage(const model::ImageBatch& batch) {
  switch (batch.status) {
    case model::BatchStatus::kPending:
      return "Pending - " + std::to_string(batch.total_images) + " images to process";
    case model::BatchStatus::kProcessing:
      return "Processing - " + batch.ProgressRatio() + " images processed";
    case model::BatchStatus::kRetrying:
      return "Retrying - " + batch.ProgressRatio() + " images processed, " + batch.FailedRatio() + " failed (attempt " +
             std::to_string(batch.retry_count) + "/" + std::to_string(batch.max_retries) + ")";
    case model::BatchStatus::kCompleted:
      return "Completed - " + batch.ProgressRatio() + " images processed successfully";
    case model::BatchStatus::kPartiallyCompleted:
      return "Partially completed - " + batch.ProgressRatio() + " images processed, " + batch.FailedRatio() + " permanent failures";
    case model::BatchStatus::kFailed:
      return "Failed - " + batch.FailedRatio() + " images failed after " + std::to_string(batch.retry_count) + " attempts";
  }
  return "Unknown status";
}

BatchManager::BatchManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<storage::ObjectStore> objects,
                           std::shared_ptr<queue::QueueService> queue, BatchOptions options)
    : repository_(std::move(repository)), objects_(std::move(objects)), queue_(std::move(queue)), options_(options) {
  if (!repository_ || !objects_ || !queue_) throw std::invalid_argument("BatchManager: missing dependency");
}

CreateBatchResult BatchManager::CreateBatch(const std::string& game_id, const std::string& uploader_id, const std::vector<UploadFile>& files) {
  if (game_id.empty()) throw util::InvalidArgument("create batch: game_id is required");
  if (files.empty()) throw util::InvalidArgument("create batch: no files");

  const auto now   = util::Now();
  auto       batch = model::ImageBatch::Create(util::NewId(), game_id, static_cast<std::uint32_t>(files.size()), options_.max_retries, now);
  db::RunInTransaction(*repository_, "insert_batch", [&](db::Transaction& tx) {
    db::ThrowIfError(repository_->InsertBatch(tx, batch), "insert batch");
  });

  // ------------------------------------------------------------------
  // Per-file upload + image row
  // ------------------------------------------------------------------

  std::vector<model::GameImage> stored;
  std::uint32_t                 excluded = 0;
  std::string                   last_error;

  for (const auto& file : files) {
    model::GameImage image;
    image.id                = util::NewId();
    image.game_id           = game_id;
    image.original_filename = file.filename;
    image.uploaded_by       = uploader_id;
    image.batch_id          = batch.id;
    image.created_at        = util::Now();
    image.updated_at        = image.created_at;

    std::optional<std::string> object_path;
    try {
      if (!file.content || file.content->size() == 0) {
        throw util::InvalidArgument("file is empty");
      }

      const auto object = objects_->Upload(game_id, image.id, file.content, file.filename,
                                           file.content_type.empty() ? kDefaultContentType : file.content_type);
      object_path       = object.path;
      image.file_path   = object.path;
      image.blob_url    = object.url;
      image.file_size   = static_cast<std::uint64_t>(file.content->size());

      db::RunInTransaction(*repository_, "insert_image", [&](db::Transaction& tx) {
        db::ThrowIfError(repository_->InsertImage(tx, image), "insert image");
      });

      stored.push_back(std::move(image));
    } catch (const std::exception& e) {
      ++excluded;
      last_error = e.what();
      RULEBOOK_LOG_WARN("upload failed, file excluded from batch",
                        {StringField("batch_id", batch.id), StringField("file", file.filename), StringField("error", e.what())});

      if (object_path) {
        try {
          objects_->Delete(*object_path);
        } catch (const std::exception& cleanup) {
          RULEBOOK_LOG_WARN("failed to remove object of excluded file", {StringField("path", *object_path), StringField("error", cleanup.what())});
        }
      }
    }
  }

  if (stored.empty()) {
    db::RunInTransaction(*repository_, "delete_batch", [&](db::Transaction& tx) {
      db::ThrowIfError(repository_->DeleteBatch(tx, batch.id), "delete batch " + batch.id);
    });
    throw util::InvalidArgument("create batch: none of " + std::to_string(files.size()) + " files could be stored: " + last_error);
  }

  if (excluded > 0) {
    db::RunInTransaction(*repository_, "exclude_images", [&](db::Transaction& tx) {
      auto current = repository_->GetBatchForUpdate(tx, batch.id);
      if (!current) throw util::NotFound("batch disappeared during creation: " + batch.id);
      for (std::uint32_t i = 0; i < excluded; ++i) current->ExcludeImage();
      db::ThrowIfError(repository_->UpdateBatch(tx, *current), "update batch " + batch.id);
    });
  }

  // ------------------------------------------------------------------
  // Jobs
  // ------------------------------------------------------------------

  CreateBatchResult result;
  result.batch_id       = batch.id;
  result.uploaded_count = static_cast<std::uint32_t>(stored.size());

  for (const auto& image : stored) {
    try {
      result.job_ids.push_back(EnqueueImage(image));
    } catch (const std::exception& e) {
      RULEBOOK_LOG_ERROR("enqueue failed, image left for reconciliation",
                         {StringField("batch_id", batch.id), StringField("image_id", image.id), StringField("error", e.what())});
    }
  }

  RULEBOOK_LOG_INFO("batch created", {StringField("batch_id", batch.id), StringField("game_id", game_id), IntField("images", result.uploaded_count),
                                      IntField("excluded", excluded), IntField("jobs", static_cast<std::int64_t>(result.job_ids.size()))});
  return result;
}

std::string BatchManager::EnqueueImage(const model::GameImage& image) {
  model::ProcessingJob job;
  job.image_id    = image.id;
  job.game_id     = image.game_id;
  job.blob_path   = image.file_path;
  job.filename    = image.original_filename;
  job.batch_id    = image.batch_id;
  job.max_retries = options_.job_max_retries;
  if (!image.uploaded_by.empty()) job.metadata["uploaded_by"] = image.uploaded_by;

  auto job_id = queue_->Enqueue(std::move(job));

  // The job is queued at this point; failing to record its id only means
  // the sweeper may later send a duplicate, which workers skip.
  try {
    db::RunInTransaction(*repository_, "set_image_job", [&](db::Transaction& tx) {
      db::ThrowIfError(repository_->SetImageJob(tx, image.id, job_id), "record job of image " + image.id);
    });
  } catch (const std::exception& e) {
    RULEBOOK_LOG_WARN("job queued but its id was not recorded on the image",
                      {StringField("image_id", image.id), StringField("job_id", job_id), StringField("error", e.what())});
  }
  return job_id;
}

model::ImageBatch BatchManager::GetBatch(const std::string& batch_id) {
  auto tx    = repository_->Begin();
  auto batch = repository_->GetBatch(*tx, batch_id);
  tx->Commit();
  if (!batch) throw util::NotFound("batch not found: " + batch_id);
  return *batch;
}

RetryBatchResult BatchManager::RetryBatch(const std::string& batch_id) {
  RetryBatchResult              result;
  std::vector<model::GameImage> retried;
  db::RunInTransaction(*repository_, "retry_batch", [&](db::Transaction& tx) {
    retried.clear();
    auto batch = repository_->GetBatchForUpdate(tx, batch_id);
    if (!batch) throw util::NotFound("batch not found: " + batch_id);

    batch->StartRetry();
    db::ThrowIfError(repository_->UpdateBatch(tx, *batch), "update batch " + batch_id);

    const auto now = util::Now();
    for (auto image : repository_->ListImagesByBatch(tx, batch_id)) {
      if (image.processing_status != model::ImageStatus::kFailed) continue;

      image.processing_status = model::ImageStatus::kRetrying;
      image.retry_count       = 0;
      image.last_job_id.clear();
      image.processing_completed_at.reset();
      image.updated_at = now;
      db::ThrowIfError(repository_->UpdateImage(tx, image), "update image " + image.id);
      retried.push_back(std::move(image));
    }
    result.batch = *batch;
  });

  for (const auto& image : retried) {
    try {
      result.job_ids.push_back(EnqueueImage(image));
    } catch (const std::exception& e) {
      RULEBOOK_LOG_ERROR("enqueue failed, image left for reconciliation",
                         {StringField("batch_id", batch_id), StringField("image_id", image.id), StringField("error", e.what())});
    }
  }

  RULEBOOK_LOG_INFO("batch retry started", {StringField("batch_id", batch_id), IntField("attempt", result.batch.retry_count),
                                            IntField("images", static_cast<std::int64_t>(retried.size()))});
  return result;
}

model::GameImage BatchManager::GetImage(const std::string& image_id) {
  auto tx    = repository_->Begin();
  auto image = repository_->GetImage(*tx, image_id);
  tx->Commit();
  if (!image) throw util::NotFound("image not found: " + image_id);
  return *image;
}

void BatchManager::DeleteImage(const std::string& image_id) {
  const auto path = db::RunInTransaction(*repository_, "delete_image", [&](db::Transaction& tx) {
    auto image = repository_->GetImageForUpdate(tx, image_id);
    if (!image) throw util::NotFound("image not found: " + image_id);

    // An image without an outcome is still counted in total_images;
    // drop it so the remaining images can finish the batch.
    const bool pending = image->processing_status != model::ImageStatus::kCompleted &&
                         image->processing_status != model::ImageStatus::kFailed;
    if (pending && image->batch_id) {
      auto batch = repository_->GetBatchForUpdate(tx, *image->batch_id);
      if (batch && !batch->IsTerminal() && !batch->AllOutcomesRecorded()) {
        const auto before = batch->status;
        batch->DropPendingImage(util::Now());
        db::ThrowIfError(repository_->UpdateBatch(tx, *batch), "update batch " + batch->id);
        if (batch->status != before && batch->IsTerminal()) {
          RULEBOOK_LOG_INFO("batch finished", {StringField("batch_id", batch->id), StringField("status", model::ToString(batch->status)),
                                               StringField("processed", batch->ProgressRatio()), StringField("failed", batch->FailedRatio())});
        }
      }
    }

    db::ThrowIfError(repository_->DeleteImage(tx, image_id), "delete image " + image_id);
    return image->file_path;
  });

  if (path.empty()) return;
  try {
    if (!objects_->Delete(path)) {
      RULEBOOK_LOG_WARN("image object already gone", {StringField("image_id", image_id), StringField("path", path)});
    }
  } catch (const std::exception& e) {
    RULEBOOK_LOG_WARN("failed to delete image object", {StringField("image_id", image_id), StringField("path", path), StringField("error", e.what())});
  }
}

} // namespace rulebook::core
