#include "queue_service.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "job_codec.hpp"

namespace rulebook::queue {

namespace {

std::string JobKey(const std::string& job_id) {
  return "job:" + job_id;
}

std::string StatusKey(const std::string& job_id) {
  return "job_status:" + job_id;
}

std::string ErrorKey(const std::string& job_id) {
  return "job_error:" + job_id;
}

} // namespace

QueueService::QueueService(std::shared_ptr<QueueStore> store, QueueOptions options)
    : store_(std::move(store)), options_(std::move(options)) {
  if (!store_) throw std::invalid_argument("QueueService: store is null");
}

std::string QueueService::MakeJobId(const std::string& image_id, util::TimePoint now) {
  return "job_" + image_id + "_" + util::EpochStamp(now);
}

std::string QueueService::Enqueue(model::ProcessingJob job) {
  const auto now = util::Now();
  job.schema_version = model::ProcessingJob::kSchemaVersion;
  job.job_id         = MakeJobId(job.image_id, now);
  job.created_at     = now;

  // status first: a consumer may pop the id as soon as it is pushed
  store_->Put(JobKey(job.job_id), EncodeJob(job), options_.job_ttl);
  SetStatus(job.job_id, model::JobStatus::kQueued);
  store_->Push(options_.list_name, job.job_id);
  return job.job_id;
}

std::optional<model::ProcessingJob> QueueService::Dequeue() {
  auto job_id = store_->Pop(options_.list_name, options_.dequeue_timeout);
  if (!job_id) return std::nullopt;

  auto payload = store_->Get(JobKey(*job_id));
  if (!payload) {
    RULEBOOK_LOG_WARN("job payload missing, dropping", {observability::StringField("job_id", *job_id)});
    return std::nullopt;
  }

  try {
    return DecodeJob(*payload);
  } catch (const util::MalformedPayload& e) {
    RULEBOOK_LOG_ERROR("malformed job payload dropped", {observability::StringField("job_id", *job_id), observability::StringField("error", e.what())});
    SetStatus(*job_id, model::JobStatus::kFailed);
    store_->Put(ErrorKey(*job_id), "malformed payload", options_.job_ttl);
    return std::nullopt;
  }
}

void QueueService::MarkProcessing(const std::string& job_id) {
  SetStatus(job_id, model::JobStatus::kProcessing);
}

void QueueService::MarkCompleted(const std::string& job_id) {
  SetStatus(job_id, model::JobStatus::kCompleted);
}

void QueueService::MarkFailed(const std::string& job_id, const std::string& error) {
  SetStatus(job_id, model::JobStatus::kFailed);
  store_->Put(ErrorKey(job_id), error, options_.job_ttl);
}

bool QueueService::Retry(const std::string& job_id) {
  auto payload = store_->Get(JobKey(job_id));
  if (!payload) return false;

  model::ProcessingJob job;
  try {
    job = DecodeJob(*payload);
  } catch (const util::MalformedPayload& e) {
    RULEBOOK_LOG_ERROR("malformed job payload, not retrying", {observability::StringField("job_id", job_id), observability::StringField("error", e.what())});
    return false;
  }

  if (job.retry_count >= job.max_retries) return false;

  job.retry_count += 1;
  job.retried_at = util::Now();

  store_->Put(JobKey(job_id), EncodeJob(job), options_.job_ttl);
  SetStatus(job_id, model::JobStatus::kRetrying);
  store_->Push(options_.list_name, job_id);
  return true;
}

std::optional<model::JobStatus> QueueService::GetStatus(const std::string& job_id) {
  auto value = store_->Get(StatusKey(job_id));
  if (!value) return std::nullopt;
  return model::JobStatusFromString(*value);
}

std::optional<std::string> QueueService::GetError(const std::string& job_id) {
  return store_->Get(ErrorKey(job_id));
}

void QueueService::Close() {
  store_->Close();
}

void QueueService::SetStatus(const std::string& job_id, model::JobStatus status) {
  store_->Put(StatusKey(job_id), std::string(model::ToString(status)), options_.job_ttl);
}

} // namespace rulebook::queue
