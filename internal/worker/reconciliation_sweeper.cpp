#include "reconciliation_sweeper.hpp"

#include <stdexcept>
#include <vector>

#include "internal/core/batch_manager.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/queue/queue_service.hpp"
#include "internal/util/time.hpp"

namespace rulebook::worker {

using observability::IntField;
using observability::StringField;

ReconciliationSweeper::ReconciliationSweeper(std::shared_ptr<db::Repository> repository, std::shared_ptr<queue::QueueService> queue,
                                             std::shared_ptr<core::BatchManager> batches, ReconciliationOptions options)
    : repository_(std::move(repository)), queue_(std::move(queue)), batches_(std::move(batches)), options_(options) {
  if (!repository_ || !queue_ || !batches_) throw std::invalid_argument("ReconciliationSweeper: missing dependency");
}

ReconciliationSweeper::~ReconciliationSweeper() {
  Stop();
}

void ReconciliationSweeper::Start() {
  if (thread_.joinable()) return; // already running
  running_ = true;
  thread_  = std::thread(&ReconciliationSweeper::Run, this);
}

void ReconciliationSweeper::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void ReconciliationSweeper::Run() {
  while (running_) {
    {
      std::unique_lock<std::mutex> lock(mutex_);
      if (cv_.wait_for(lock, options_.interval, [&] { return !running_.load(); })) {
        break;
      }
    }

    try {
      SweepOnce();
    } catch (const std::exception& e) {
      RULEBOOK_LOG_WARN("reconciliation sweep failed", {StringField("error", e.what())});
    }
  }
}

std::size_t ReconciliationSweeper::SweepOnce() {
  const auto cutoff = util::Now() - options_.orphan_age;

  std::vector<model::GameImage> candidates;
  {
    auto tx = repository_->Begin();
    for (auto status : {model::ImageStatus::kUploaded, model::ImageStatus::kRetrying}) {
      auto images = repository_->ListImagesByStatus(*tx, status, cutoff, options_.max_images_per_sweep);
      candidates.insert(candidates.end(), images.begin(), images.end());
    }
    tx->Commit();
  }

  std::size_t requeued = 0;
  for (const auto& image : candidates) {
    if (!image.last_job_id.empty()) {
      const auto status = queue_->GetStatus(image.last_job_id);
      if (status && *status != model::JobStatus::kCompleted && *status != model::JobStatus::kFailed) {
        continue;
      }
    }

    try {
      const auto job_id = batches_->EnqueueImage(image);
      ++requeued;
      RULEBOOK_LOG_WARN("orphan image re-enqueued", {StringField("image_id", image.id), StringField("batch_id", image.batch_id.value_or("")),
                                                     StringField("status", model::ToString(image.processing_status)),
                                                     StringField("previous_job_id", image.last_job_id), StringField("job_id", job_id)});
    } catch (const std::exception& e) {
      RULEBOOK_LOG_WARN("orphan re-enqueue failed", {StringField("image_id", image.id), StringField("error", e.what())});
    }
  }

  if (!candidates.empty()) {
    RULEBOOK_LOG_INFO("reconciliation sweep done", {IntField("candidates", static_cast<std::int64_t>(candidates.size())),
                                                    IntField("requeued", static_cast<std::int64_t>(requeued))});
  }
  return requeued;
}

} // namespace rulebook::worker
