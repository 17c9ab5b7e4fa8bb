#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "internal/model/processing_job.hpp"
#include "queue_store.hpp"

namespace rulebook::queue {

struct QueueOptions {
  std::string               list_name = "image_processing_queue";
  std::chrono::seconds      job_ttl{86400};
  std::chrono::milliseconds dequeue_timeout{30000};
};

/*
  QueueService

  Durable job queue on top of a QueueStore.

  Records (all with the configured TTL):
    job:{id}          encoded ProcessingJob
    job_status:{id}   queued | processing | completed | failed | retrying
    job_error:{id}    last failure message

  Error contract:
    - empty queue / expired payload -> std::nullopt
    - malformed payload             -> logged, status failed, std::nullopt
    - store unreachable             -> util::Unavailable (caller backs off)
*/
class QueueService {
 public:
  QueueService(std::shared_ptr<QueueStore> store, QueueOptions options);

  // Assigns job_id and created_at, returns the job id.
  std::string Enqueue(model::ProcessingJob job);

  // Blocks up to the dequeue timeout.
  std::optional<model::ProcessingJob> Dequeue();

  void MarkProcessing(const std::string& job_id);
  void MarkCompleted(const std::string& job_id);
  void MarkFailed(const std::string& job_id, const std::string& error);

  // false once retry_count reached max_retries or the payload is gone
  bool Retry(const std::string& job_id);

  std::optional<model::JobStatus> GetStatus(const std::string& job_id);
  std::optional<std::string>      GetError(const std::string& job_id);

  void Close();

  const QueueOptions& Options() const {
    return options_;
  }

  // job_{image_id}_{seconds}.{micros}
  static std::string MakeJobId(const std::string& image_id, util::TimePoint now);

 private:
  void SetStatus(const std::string& job_id, model::JobStatus status);

  std::shared_ptr<QueueStore> store_;
  QueueOptions                options_;
};

} // namespace rulebook::queue
