#include "internal/model/image_batch.hpp"

#include "internal/util/errors.hpp"

namespace rulebook::model {

std::string_view ToString(BatchStatus status) {
  switch (status) {
    case BatchStatus::kPending:
      return "pending";
    case BatchStatus::kProcessing:
      return "processing";
    case BatchStatus::kCompleted:
      return "completed";
    case BatchStatus::kFailed:
      return "failed";
    case BatchStatus::kPartiallyCompleted:
      return "partially_completed";
    case BatchStatus::kRetrying:
      return "retrying";
  }
  return "unknown";
}

std::optional<BatchStatus> BatchStatusFromString(std::string_view value) {
  for (auto status : {BatchStatus::kPending, BatchStatus::kProcessing, BatchStatus::kCompleted, BatchStatus::kFailed,
                      BatchStatus::kPartiallyCompleted, BatchStatus::kRetrying}) {
    if (ToString(status) == value) {
      return status;
    }
  }
  return std::nullopt;
}

ImageBatch ImageBatch::Create(std::string id, std::string game_id, std::uint32_t total_images, std::uint32_t max_retries, util::TimePoint now) {
  if (total_images == 0) {
    throw util::InvalidArgument("image batch must contain at least one image");
  }

  ImageBatch batch;
  batch.id           = std::move(id);
  batch.game_id      = std::move(game_id);
  batch.total_images = total_images;
  batch.max_retries  = max_retries;
  batch.status       = BatchStatus::kPending;
  batch.created_at   = now;
  return batch;
}

void ImageBatch::ExcludeImage() {
  if (status != BatchStatus::kPending || processed_images != 0 || failed_images != 0) {
    throw util::InvalidState("batch " + id + ": images can only be excluded before processing starts");
  }
  if (total_images == 0) {
    throw util::InvalidState("batch " + id + ": no images left to exclude");
  }
  --total_images;
}

void ImageBatch::DropPendingImage(util::TimePoint now) {
  if (IsTerminal()) {
    throw util::InvalidState("batch " + id + " is " + std::string(ToString(status)) + "; images can no longer be removed");
  }
  if (AllOutcomesRecorded()) {
    throw util::InvalidState("batch " + id + ": no image without an outcome (" + ProgressRatio() + ")");
  }

  --total_images;
  Evaluate(now);
}

void ImageBatch::RecordOutcome(bool success, util::TimePoint now) {
  if (IsTerminal()) {
    throw util::InvalidState("batch " + id + " is " + std::string(ToString(status)) + "; outcome rejected");
  }
  if (processed_images + failed_images >= total_images) {
    throw util::InvalidState("batch " + id + ": every image already has an outcome (" + ProgressRatio() + ")");
  }

  if (status == BatchStatus::kPending) {
    status                = BatchStatus::kProcessing;
    processing_started_at = now;
  } else if (status == BatchStatus::kRetrying) {
    status = BatchStatus::kProcessing;
  }

  if (success) {
    ++processed_images;
  } else {
    ++failed_images;
  }

  Evaluate(now);
}

void ImageBatch::Evaluate(util::TimePoint now) {
  if (!AllOutcomesRecorded() || CanRetry()) {
    return;
  }

  if (failed_images == 0) {
    status = BatchStatus::kCompleted;
  } else if (processed_images == 0) {
    status = BatchStatus::kFailed;
  } else {
    status = BatchStatus::kPartiallyCompleted;
  }
  completed_at = now;
}

void ImageBatch::StartRetry() {
  if (!CanRetry()) {
    throw util::InvalidState("batch " + id + " cannot be retried (failed=" + std::to_string(failed_images) +
                             ", retry_count=" + std::to_string(retry_count) + "/" + std::to_string(max_retries) + ")");
  }

  ++retry_count;
  failed_images = 0;
  status        = BatchStatus::kRetrying;
}

std::string ImageBatch::ProgressRatio() const {
  return std::to_string(processed_images) + "/" + std::to_string(total_images);
}

std::string ImageBatch::FailedRatio() const {
  return std::to_string(failed_images) + "/" + std::to_string(total_images);
}

double ImageBatch::CompletionPercentage() const {
  if (total_images == 0) return 0.0;
  return 100.0 * static_cast<double>(processed_images) / static_cast<double>(total_images);
}

double ImageBatch::FailurePercentage() const {
  if (total_images == 0) return 0.0;
  return 100.0 * static_cast<double>(failed_images) / static_cast<double>(total_images);
}

} // namespace rulebook::model
