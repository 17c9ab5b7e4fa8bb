#include "progress_recorder.hpp"

#include <stdexcept>

#include "internal/db/api/repository.hpp"
#include "internal/db/api/tx_retry.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace rulebook::core {

using observability::IntField;
using observability::StringField;

namespace {

bool HasFinalOutcome(const model::GameImage& image) {
  return image.processing_status == model::ImageStatus::kCompleted || image.processing_status == model::ImageStatus::kFailed;
}

// Row-locked so duplicate deliveries of one job serialize on the image.
model::GameImage LoadImage(db::Repository& repo, db::Transaction& tx, const std::string& image_id) {
  auto image = repo.GetImageForUpdate(tx, image_id);
  if (!image) {
    throw util::NotFound("image not found: " + image_id);
  }
  return *image;
}

// Counts one final image outcome on its batch. A batch that is already
// terminal or fully counted keeps its state; the image row still updates.
void CountOutcome(db::Repository& repo, db::Transaction& tx, const model::GameImage& image, bool success, util::TimePoint now) {
  if (!image.batch_id) {
    return;
  }

  auto batch = repo.GetBatchForUpdate(tx, *image.batch_id);
  if (!batch) {
    RULEBOOK_LOG_WARN("image references missing batch", {StringField("image_id", image.id), StringField("batch_id", *image.batch_id)});
    return;
  }

  if (batch->IsTerminal() || batch->AllOutcomesRecorded()) {
    RULEBOOK_LOG_WARN("batch already has every outcome, not counting image",
                      {StringField("batch_id", batch->id), StringField("image_id", image.id), StringField("status", model::ToString(batch->status)),
                       StringField("progress", batch->ProgressRatio())});
    return;
  }

  const auto before = batch->status;
  batch->RecordOutcome(success, now);
  db::ThrowIfError(repo.UpdateBatch(tx, *batch), "update batch " + batch->id);

  if (batch->status != before && batch->IsTerminal()) {
    RULEBOOK_LOG_INFO("batch finished", {StringField("batch_id", batch->id), StringField("status", model::ToString(batch->status)),
                                         StringField("processed", batch->ProgressRatio()), StringField("failed", batch->FailedRatio())});
  } else if (batch->AllOutcomesRecorded() && batch->CanRetry()) {
    RULEBOOK_LOG_INFO("batch awaiting retry", {StringField("batch_id", batch->id), StringField("failed", batch->FailedRatio()),
                                               IntField("retry_count", batch->retry_count), IntField("max_retries", batch->max_retries)});
  }
}

} // namespace

ProgressRecorder::ProgressRecorder(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) throw std::invalid_argument("ProgressRecorder: repository is null");
}

std::optional<model::GameImage> ProgressRecorder::BeginProcessing(const std::string& image_id) {
  return db::RunInTransaction(*repository_, "begin_processing", [&](db::Transaction& tx) -> std::optional<model::GameImage> {
    auto image = LoadImage(*repository_, tx, image_id);
    if (HasFinalOutcome(image)) {
      return std::nullopt;
    }

    const auto now                 = util::Now();
    image.processing_status        = model::ImageStatus::kProcessing;
    image.processing_started_at    = now;
    image.processing_completed_at.reset();
    image.updated_at               = now;
    db::ThrowIfError(repository_->UpdateImage(tx, image), "update image " + image_id);
    return image;
  });
}

RecordResult ProgressRecorder::RecordSuccess(const std::string& image_id, const std::optional<model::GameVector>& vector) {
  return db::RunInTransaction(*repository_, "record_success", [&](db::Transaction& tx) {
    auto image = LoadImage(*repository_, tx, image_id);
    if (HasFinalOutcome(image)) {
      return RecordResult::kDuplicate;
    }

    const auto now = util::Now();

    if (vector) {
      auto row       = *vector;
      row.image_id   = image.id;
      row.game_id    = image.game_id;
      row.created_at = now;
      if (row.id.empty()) row.id = util::NewId();

      db::ThrowIfError(repository_->DeleteVectorsByImage(tx, image.id), "delete vectors of image " + image.id);
      db::ThrowIfError(repository_->InsertVector(tx, row), "insert vector for image " + image.id);
    }

    image.processing_status       = model::ImageStatus::kCompleted;
    image.processing_error.reset();
    image.processing_completed_at = now;
    image.updated_at              = now;
    db::ThrowIfError(repository_->UpdateImage(tx, image), "update image " + image.id);

    CountOutcome(*repository_, tx, image, true, now);
    return RecordResult::kApplied;
  });
}

RecordResult ProgressRecorder::RecordRetrying(const std::string& image_id, const std::string& error, std::uint32_t retry_count) {
  return db::RunInTransaction(*repository_, "record_retrying", [&](db::Transaction& tx) {
    auto image = LoadImage(*repository_, tx, image_id);
    if (HasFinalOutcome(image)) {
      return RecordResult::kDuplicate;
    }

    image.processing_status = model::ImageStatus::kRetrying;
    image.processing_error  = error;
    image.retry_count       = retry_count;
    image.updated_at        = util::Now();
    db::ThrowIfError(repository_->UpdateImage(tx, image), "update image " + image.id);
    return RecordResult::kApplied;
  });
}

RecordResult ProgressRecorder::RecordFailure(const std::string& image_id, const std::string& error) {
  return db::RunInTransaction(*repository_, "record_failure", [&](db::Transaction& tx) {
    auto image = LoadImage(*repository_, tx, image_id);
    if (HasFinalOutcome(image)) {
      return RecordResult::kDuplicate;
    }

    const auto now                = util::Now();
    image.processing_status       = model::ImageStatus::kFailed;
    image.processing_error        = error;
    image.processing_completed_at = now;
    image.updated_at              = now;
    db::ThrowIfError(repository_->UpdateImage(tx, image), "update image " + image.id);

    CountOutcome(*repository_, tx, image, false, now);
    return RecordResult::kApplied;
  });
}

} // namespace rulebook::core
