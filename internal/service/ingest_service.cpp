#include "ingest_service.hpp"

#include <arrow/buffer.h>

#include <vector>

#include "internal/core/batch_manager.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "observe_rpc.hpp"

namespace rulebook::service {

using namespace rulebook::ingest::v1;

namespace {

// model and wire enums share numeric values
rulebook::ingest::v1::BatchStatus ToProto(model::BatchStatus status) {
  return static_cast<rulebook::ingest::v1::BatchStatus>(static_cast<int>(status));
}

rulebook::ingest::v1::ImageStatus ToProto(model::ImageStatus status) {
  return static_cast<rulebook::ingest::v1::ImageStatus>(static_cast<int>(status));
}

rulebook::ingest::v1::ImageBatch ToProto(const model::ImageBatch& batch) {
  rulebook::ingest::v1::ImageBatch out;
  out.set_id(batch.id);
  out.set_game_id(batch.game_id);
  out.set_total_images(batch.total_images);
  out.set_processed_images(batch.processed_images);
  out.set_failed_images(batch.failed_images);
  out.set_status(ToProto(batch.status));
  out.set_retry_count(batch.retry_count);
  out.set_max_retries(batch.max_retries);
  *out.mutable_created_at() = util::ToProto(batch.created_at);
  if (batch.processing_started_at) *out.mutable_processing_started_at() = util::ToProto(*batch.processing_started_at);
  if (batch.completed_at) *out.mutable_completed_at() = util::ToProto(*batch.completed_at);

  out.set_progress_ratio(batch.ProgressRatio());
  out.set_failed_ratio(batch.FailedRatio());
  out.set_completion_percentage(batch.CompletionPercentage());
  out.set_failure_percentage(batch.FailurePercentage());
  out.set_can_retry(batch.CanRetry());
  return out;
}

rulebook::ingest::v1::GameImage ToProto(const model::GameImage& image) {
  rulebook::ingest::v1::GameImage out;
  out.set_id(image.id);
  out.set_game_id(image.game_id);
  out.set_file_path(image.file_path);
  out.set_blob_url(image.blob_url);
  out.set_original_filename(image.original_filename);
  out.set_file_size(image.file_size);
  out.set_uploaded_by(image.uploaded_by);
  out.set_processing_status(ToProto(image.processing_status));
  out.set_processing_error(image.processing_error.value_or(""));
  out.set_retry_count(image.retry_count);
  out.set_batch_id(image.batch_id.value_or(""));
  *out.mutable_created_at() = util::ToProto(image.created_at);
  if (image.processing_started_at) *out.mutable_processing_started_at() = util::ToProto(*image.processing_started_at);
  if (image.processing_completed_at) *out.mutable_processing_completed_at() = util::ToProto(*image.processing_completed_at);
  return out;
}

void RequireId(const std::string& value, const char* field) {
  if (value.empty()) {
    throw util::InvalidArgument(std::string(field) + " is required");
  }
}

} // namespace

IngestService::IngestService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

CreateBatchResponse IngestService::CreateBatch(const CreateBatchRequest& req) {
  return ObserveRpc("IngestService.CreateBatch", "game.id", req.game_id(), [&] {
    std::vector<core::UploadFile> files;
    files.reserve(static_cast<std::size_t>(req.files_size()));
    for (const auto& file : req.files()) {
      files.push_back({file.filename(), arrow::Buffer::FromString(file.content()), file.content_type()});
    }

    auto result = ctx_.batches->CreateBatch(req.game_id(), req.uploader_id(), files);

    CreateBatchResponse resp;
    resp.set_batch_id(result.batch_id);
    resp.set_uploaded_count(result.uploaded_count);
    for (auto& job_id : result.job_ids) resp.add_job_ids(std::move(job_id));
    return resp;
  });
}

GetBatchStatusResponse IngestService::GetBatchStatus(const GetBatchStatusRequest& req) {
  return ObserveRpc("IngestService.GetBatchStatus", "batch.id", req.batch_id(), [&] {
    RequireId(req.batch_id(), "batch_id");
    const auto batch = ctx_.batches->GetBatch(req.batch_id());

    GetBatchStatusResponse resp;
    *resp.mutable_batch() = ToProto(batch);
    resp.set_progress_message(core::ProgressMessage(batch));
    return resp;
  });
}

RetryBatchResponse IngestService::RetryBatch(const RetryBatchRequest& req) {
  return ObserveRpc("IngestService.RetryBatch", "batch.id", req.batch_id(), [&] {
    RequireId(req.batch_id(), "batch_id");
    auto result = ctx_.batches->RetryBatch(req.batch_id());

    RetryBatchResponse resp;
    *resp.mutable_batch() = ToProto(result.batch);
    for (auto& job_id : result.job_ids) resp.add_job_ids(std::move(job_id));
    return resp;
  });
}

GetImageStatusResponse IngestService::GetImageStatus(const GetImageStatusRequest& req) {
  return ObserveRpc("IngestService.GetImageStatus", "image.id", req.image_id(), [&] {
    RequireId(req.image_id(), "image_id");

    GetImageStatusResponse resp;
    *resp.mutable_image() = ToProto(ctx_.batches->GetImage(req.image_id()));
    return resp;
  });
}

void IngestService::DeleteImage(const DeleteImageRequest& req) {
  ObserveRpc("IngestService.DeleteImage", "image.id", req.image_id(), [&] {
    RequireId(req.image_id(), "image_id");
    ctx_.batches->DeleteImage(req.image_id());
  });
}

} // namespace rulebook::service
