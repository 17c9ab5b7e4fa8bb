#include "processing_worker.hpp"

#include <stdexcept>

#include "internal/ai/ai_client.hpp"
#include "internal/core/progress_recorder.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/queue/queue_service.hpp"
#include "internal/storage/object_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace rulebook::worker {

using observability::IntField;
using observability::StringField;

namespace {

constexpr std::int32_t kDefaultPageNumber = 1;

std::int32_t PageNumber(const model::ProcessingJob& job) {
  auto it = job.metadata.find("page_number");
  if (it == job.metadata.end()) return kDefaultPageNumber;
  try {
    return std::stoi(it->second);
  } catch (const std::exception&) {
    return kDefaultPageNumber;
  }
}

} // namespace

ProcessingWorker::ProcessingWorker(std::string name, std::shared_ptr<queue::QueueService> queue, std::shared_ptr<core::ProgressRecorder> recorder,
                                   std::shared_ptr<storage::ObjectStore> objects, std::shared_ptr<ai::AiProcessingClient> ai,
                                   std::chrono::milliseconds reconnect_backoff)
    : name_(std::move(name)),
      queue_(std::move(queue)),
      recorder_(std::move(recorder)),
      objects_(std::move(objects)),
      ai_(std::move(ai)),
      reconnect_backoff_(reconnect_backoff) {
  if (!queue_ || !recorder_ || !objects_ || !ai_) throw std::invalid_argument("ProcessingWorker: missing dependency");
}

ProcessingWorker::~ProcessingWorker() {
  Stop();
}

void ProcessingWorker::Start() {
  if (thread_.joinable()) return; // already running
  running_ = true;
  thread_  = std::thread(&ProcessingWorker::Run, this);
}

void ProcessingWorker::Stop() {
  {
    std::lock_guard<std::mutex> lock(backoff_mutex_);
    running_ = false;
  }
  backoff_cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void ProcessingWorker::Run() {
  RULEBOOK_LOG_INFO("processing worker started", {StringField("worker", name_)});
  while (running_) {
    ProcessNext();
  }
  RULEBOOK_LOG_INFO("processing worker stopped", {StringField("worker", name_)});
}

bool ProcessingWorker::ProcessNext() {
  std::optional<model::ProcessingJob> job;
  try {
    job = queue_->Dequeue();
  } catch (const util::Unavailable& e) {
    RULEBOOK_LOG_WARN("queue unavailable, reconnecting", {StringField("worker", name_), StringField("error", e.what()),
                                                          IntField("backoff_ms", reconnect_backoff_.count())});
    std::unique_lock<std::mutex> lock(backoff_mutex_);
    backoff_cv_.wait_for(lock, reconnect_backoff_, [&] { return !running_.load(); });
    return false;
  } catch (const std::exception& e) {
    RULEBOOK_LOG_ERROR("dequeue failed", {StringField("worker", name_), StringField("error", e.what())});
    std::unique_lock<std::mutex> lock(backoff_mutex_);
    backoff_cv_.wait_for(lock, reconnect_backoff_, [&] { return !running_.load(); });
    return false;
  }

  if (!job) return false;

  Process(*job);
  return true;
}

void ProcessingWorker::Process(const model::ProcessingJob& job) {
  const auto started_at = std::chrono::steady_clock::now();

  observability::SpanScope span("ProcessingWorker.Process");
  span.SetAttribute("job.id", job.job_id);
  span.SetAttribute("image.id", job.image_id);

  RULEBOOK_LOG_INFO("job dequeued", {StringField("worker", name_), StringField("job_id", job.job_id), StringField("image_id", job.image_id),
                                     StringField("batch_id", job.batch_id.value_or("")), IntField("retry_count", job.retry_count)});

  try {
    queue_->MarkProcessing(job.job_id);
  } catch (const std::exception& e) {
    RULEBOOK_LOG_WARN("could not record job status", {StringField("job_id", job.job_id), StringField("error", e.what())});
  }

  try {
    auto image = recorder_->BeginProcessing(job.image_id);
    if (!image) {
      RULEBOOK_LOG_INFO("image already has an outcome, skipping job", {StringField("job_id", job.job_id), StringField("image_id", job.image_id)});
      queue_->MarkCompleted(job.job_id);
      observability::Metrics::Instance().RecordJobOutcome("dropped");
      return;
    }

    auto bytes  = objects_->Download(job.blob_path.empty() ? image->file_path : job.blob_path);
    auto result = ai_->Process(bytes, job.filename.empty() ? image->original_filename : job.filename);
    if (!result.success) {
      throw std::runtime_error("AI processing failed: " + result.error.value_or("no extraction succeeded"));
    }

    std::optional<model::GameVector> vector;
    if (result.HasAnyContent()) {
      model::GameVector row;
      row.id          = util::NewId();
      row.game_id     = image->game_id;
      row.image_id    = image->id;
      row.page_number = PageNumber(job);
      row.ocr         = std::move(result.ocr);
      row.description = std::move(result.description);
      row.labels      = std::move(result.labels);
      vector          = std::move(row);
    } else {
      RULEBOOK_LOG_WARN("nothing extracted, vector skipped", {StringField("job_id", job.job_id), StringField("image_id", job.image_id)});
    }

    if (recorder_->RecordSuccess(job.image_id, vector) == core::RecordResult::kDuplicate) {
      RULEBOOK_LOG_INFO("image completed concurrently, result discarded", {StringField("job_id", job.job_id), StringField("image_id", job.image_id)});
    }
    queue_->MarkCompleted(job.job_id);

    const auto elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
    observability::Metrics::Instance().RecordJobOutcome("completed");
    observability::Metrics::Instance().ObserveJobDurationMs(elapsed_ms);
    RULEBOOK_LOG_INFO("job completed", {StringField("job_id", job.job_id), StringField("image_id", job.image_id),
                                        StringField("batch_id", job.batch_id.value_or("")), observability::DoubleField("duration_ms", elapsed_ms)});
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    HandleFailure(job, e.what());
  }
}

void ProcessingWorker::HandleFailure(const model::ProcessingJob& job, const std::string& error) {
  RULEBOOK_LOG_WARN("job failed", {StringField("job_id", job.job_id), StringField("image_id", job.image_id),
                                   StringField("batch_id", job.batch_id.value_or("")), StringField("error", error)});

  try {
    queue_->MarkFailed(job.job_id, error);
  } catch (const std::exception& e) {
    RULEBOOK_LOG_WARN("could not record job failure", {StringField("job_id", job.job_id), StringField("error", e.what())});
  }

  try {
    if (job.retry_count < job.max_retries) {
      if (recorder_->RecordRetrying(job.image_id, error, job.retry_count + 1) == core::RecordResult::kDuplicate) {
        return;
      }

      bool requeued = false;
      try {
        requeued = queue_->Retry(job.job_id);
      } catch (const std::exception& e) {
        RULEBOOK_LOG_WARN("job retry failed", {StringField("job_id", job.job_id), StringField("error", e.what())});
      }

      if (requeued) {
        observability::Metrics::Instance().RecordJobOutcome("retried");
        RULEBOOK_LOG_INFO("job retried", {StringField("job_id", job.job_id), StringField("image_id", job.image_id),
                                          IntField("retry_count", job.retry_count + 1), IntField("max_retries", job.max_retries)});
        return;
      }
    }

    recorder_->RecordFailure(job.image_id, error);
    observability::Metrics::Instance().RecordJobOutcome("failed");
    RULEBOOK_LOG_ERROR("job failed permanently", {StringField("job_id", job.job_id), StringField("image_id", job.image_id),
                                                  StringField("batch_id", job.batch_id.value_or("")), StringField("error", error)});
  } catch (const util::NotFound&) {
    observability::Metrics::Instance().RecordJobOutcome("dropped");
    RULEBOOK_LOG_WARN("image gone, job dropped", {StringField("job_id", job.job_id), StringField("image_id", job.image_id)});
  } catch (const std::exception& e) {
    RULEBOOK_LOG_ERROR("failed to record job outcome",
                       {StringField("job_id", job.job_id), StringField("image_id", job.image_id), StringField("error", e.what())});
  }
}

} // namespace rulebook::worker
