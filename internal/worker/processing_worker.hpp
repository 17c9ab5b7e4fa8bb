#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "internal/model/processing_job.hpp"

namespace rulebook::ai {
class AiProcessingClient;
}
namespace rulebook::core {
class ProgressRecorder;
}
namespace rulebook::queue {
class QueueService;
}
namespace rulebook::storage {
class ObjectStore;
}

namespace rulebook::worker {

/*
  Background consumer of the image processing queue.

  Per job:
      dequeue -> image PROCESSING -> download -> AI -> vector + COMPLETED

  Any failure marks the job failed; while the job has retries left the
  image goes to RETRYING and the job is re-queued, otherwise the image
  is FAILED and its batch counts the failure.

  Stop() is cooperative: the job in flight finishes first, an idle
  worker returns after the current dequeue wait.
*/
class ProcessingWorker {
 public:
  ProcessingWorker(std::string name, std::shared_ptr<queue::QueueService> queue, std::shared_ptr<core::ProgressRecorder> recorder,
                   std::shared_ptr<storage::ObjectStore> objects, std::shared_ptr<ai::AiProcessingClient> ai,
                   std::chrono::milliseconds reconnect_backoff);
  ~ProcessingWorker();

  void Start();
  void Stop();

  // One loop iteration; true when a job was handled.
  bool ProcessNext();

 private:
  void Run();
  void Process(const model::ProcessingJob& job);
  void HandleFailure(const model::ProcessingJob& job, const std::string& error);

  std::string                             name_;
  std::shared_ptr<queue::QueueService>    queue_;
  std::shared_ptr<core::ProgressRecorder> recorder_;
  std::shared_ptr<storage::ObjectStore>   objects_;
  std::shared_ptr<ai::AiProcessingClient> ai_;
  std::chrono::milliseconds               reconnect_backoff_;

  std::thread       thread_;
  std::atomic<bool> running_{false};

  std::mutex              backoff_mutex_;
  std::condition_variable backoff_cv_;
};

} // namespace rulebook::worker
