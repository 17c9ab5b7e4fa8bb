#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>

namespace rulebook::core {
class BatchManager;
}
namespace rulebook::db {
class Repository;
}
namespace rulebook::queue {
class QueueService;
}

namespace rulebook::worker {

struct ReconciliationOptions {
  std::chrono::seconds interval{300};
  std::chrono::seconds orphan_age{900};
  std::size_t          max_images_per_sweep = 500;
};

/*
  Periodic repair of images that wait for a job that does not exist.

  An image is an orphan when it is UPLOADED or RETRYING, has not been
  touched for `orphan_age`, and its last job id is empty, has no status
  record left in the queue, or already reports completed/failed.
  Each orphan gets a fresh job.
*/
class ReconciliationSweeper {
 public:
  ReconciliationSweeper(std::shared_ptr<db::Repository> repository, std::shared_ptr<queue::QueueService> queue,
                        std::shared_ptr<core::BatchManager> batches, ReconciliationOptions options);
  ~ReconciliationSweeper();

  void Start();
  void Stop();

  // Returns the number of images re-enqueued.
  std::size_t SweepOnce();

 private:
  void Run();

  std::shared_ptr<db::Repository>      repository_;
  std::shared_ptr<queue::QueueService> queue_;
  std::shared_ptr<core::BatchManager>  batches_;
  ReconciliationOptions                options_;

  std::thread             thread_;
  std::atomic<bool>       running_{false};
  std::mutex              mutex_;
  std::condition_variable cv_;
};

} // namespace rulebook::worker
