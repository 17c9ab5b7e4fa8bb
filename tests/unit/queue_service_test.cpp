#include "internal/queue/queue_service.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/queue/memory_queue_store.hpp"
#include "internal/util/errors.hpp"
#if RULEBOOK_DB_SQLITE
#include "internal/queue/sqlite_queue_store.hpp"
#endif

namespace {

using rulebook::model::JobStatus;
using rulebook::model::ProcessingJob;
using rulebook::queue::MemoryQueueStore;
using rulebook::queue::QueueOptions;
using rulebook::queue::QueueService;
using rulebook::queue::QueueStore;

QueueOptions FastOptions() {
  QueueOptions options;
  options.list_name       = "test_queue";
  options.job_ttl         = std::chrono::seconds(60);
  options.dequeue_timeout = std::chrono::milliseconds(50);
  return options;
}

ProcessingJob MakeJob(const std::string& image_id, std::uint32_t max_retries = 3) {
  ProcessingJob job;
  job.image_id    = image_id;
  job.game_id     = "game-1";
  job.blob_path   = "games/game-1/images/" + image_id + "_page.png";
  job.filename    = "page.png";
  job.batch_id    = "batch-1";
  job.max_retries = max_retries;
  return job;
}

/*
  Store that fails while `down` is set, the way a SQL store behaves
  after its connection dropped.
*/
class FlakyQueueStore final : public QueueStore {
 public:
  std::atomic<bool> down{false};
  std::atomic<int>  failures{0};

  void Put(const std::string& key, const std::string& value, std::chrono::seconds ttl) override {
    Check();
    inner_.Put(key, value, ttl);
  }
  std::optional<std::string> Get(const std::string& key) override {
    Check();
    return inner_.Get(key);
  }
  bool Delete(const std::string& key) override {
    Check();
    return inner_.Delete(key);
  }
  void Push(const std::string& list, const std::string& value) override {
    Check();
    inner_.Push(list, value);
  }
  std::optional<std::string> Pop(const std::string& list, std::chrono::milliseconds timeout) override {
    Check();
    return inner_.Pop(list, timeout);
  }
  void Close() override {
    inner_.Close();
  }

 private:
  void Check() {
    if (down) {
      ++failures;
      throw rulebook::util::Unavailable("connection refused");
    }
  }

  MemoryQueueStore inner_;
};

void TestEnqueueDequeueAndStatusLifecycle() {
  QueueService queue(std::make_shared<MemoryQueueStore>(), FastOptions());

  const auto job_id = queue.Enqueue(MakeJob("img-1"));
  assert(job_id.rfind("job_img-1_", 0) == 0);
  assert(queue.GetStatus(job_id) == JobStatus::kQueued);

  auto job = queue.Dequeue();
  assert(job.has_value());
  assert(job->job_id == job_id);
  assert(job->image_id == "img-1");
  assert(job->batch_id == std::optional<std::string>("batch-1"));

  queue.MarkProcessing(job_id);
  assert(queue.GetStatus(job_id) == JobStatus::kProcessing);

  queue.MarkFailed(job_id, "boom");
  assert(queue.GetStatus(job_id) == JobStatus::kFailed);
  assert(queue.GetError(job_id) == std::optional<std::string>("boom"));

  queue.MarkCompleted(job_id);
  assert(queue.GetStatus(job_id) == JobStatus::kCompleted);

  assert(!queue.GetStatus("job_unknown").has_value());
}

void TestEmptyDequeueReturnsWithinTimeout() {
  QueueService queue(std::make_shared<MemoryQueueStore>(), FastOptions());

  const auto started = std::chrono::steady_clock::now();
  auto       job     = queue.Dequeue();
  const auto elapsed = std::chrono::steady_clock::now() - started;

  assert(!job.has_value());
  assert(elapsed >= std::chrono::milliseconds(40));
  assert(elapsed < std::chrono::seconds(5));
}

void TestFifoOrderForFreshJobs() {
  QueueService queue(std::make_shared<MemoryQueueStore>(), FastOptions());

  const auto first  = queue.Enqueue(MakeJob("img-a"));
  const auto second = queue.Enqueue(MakeJob("img-b"));

  assert(queue.Dequeue()->job_id == first);
  assert(queue.Dequeue()->job_id == second);
}

void TestRetryRequeuesUntilBudgetIsSpent() {
  QueueService queue(std::make_shared<MemoryQueueStore>(), FastOptions());

  const auto job_id = queue.Enqueue(MakeJob("img-1", 2));
  assert(queue.Dequeue().has_value());

  assert(queue.Retry(job_id));
  assert(queue.GetStatus(job_id) == JobStatus::kRetrying);
  auto retried = queue.Dequeue();
  assert(retried.has_value());
  assert(retried->job_id == job_id);
  assert(retried->retry_count == 1);
  assert(retried->retried_at.has_value());

  assert(queue.Retry(job_id));
  assert(queue.Dequeue()->retry_count == 2);

  assert(!queue.Retry(job_id));
  assert(!queue.Dequeue().has_value());
}

void TestRetriedJobGoesBehindNewerJobs() {
  QueueService queue(std::make_shared<MemoryQueueStore>(), FastOptions());

  const auto first = queue.Enqueue(MakeJob("img-a"));
  assert(queue.Dequeue()->job_id == first);

  const auto second = queue.Enqueue(MakeJob("img-b"));
  assert(queue.Retry(first));

  assert(queue.Dequeue()->job_id == second);
  assert(queue.Dequeue()->job_id == first);
}

void TestRetryOfUnknownJobIsRefused() {
  QueueService queue(std::make_shared<MemoryQueueStore>(), FastOptions());
  assert(!queue.Retry("job_missing_1.000000"));
}

void TestMalformedPayloadIsDroppedAndMarkedFailed() {
  auto         store = std::make_shared<MemoryQueueStore>();
  QueueService queue(store, FastOptions());

  store->Put("job:job_bad", "{not json", std::chrono::seconds(60));
  store->Push("test_queue", "job_bad");

  assert(!queue.Dequeue().has_value());
  assert(queue.GetStatus("job_bad") == JobStatus::kFailed);
  assert(queue.GetError("job_bad") == std::optional<std::string>("malformed payload"));

  // the queue keeps serving well-formed jobs afterwards
  const auto job_id = queue.Enqueue(MakeJob("img-1"));
  assert(queue.Dequeue()->job_id == job_id);
}

void TestMissingPayloadIsNoJob() {
  auto         store = std::make_shared<MemoryQueueStore>();
  QueueService queue(store, FastOptions());

  store->Push("test_queue", "job_expired");
  assert(!queue.Dequeue().has_value());
}

void TestConnectionLossIsDistinctFromEmptyQueue() {
  auto         store = std::make_shared<FlakyQueueStore>();
  QueueService queue(store, FastOptions());

  const auto job_id = queue.Enqueue(MakeJob("img-1"));

  store->down = true;
  bool threw  = false;
  try {
    queue.Dequeue();
  } catch (const rulebook::util::Unavailable&) {
    threw = true;
  }
  assert(threw);
  assert(store->failures == 1);

  // recovered store serves the job that was queued before the outage
  store->down = false;
  auto job    = queue.Dequeue();
  assert(job.has_value());
  assert(job->job_id == job_id);
}

void TestConcurrentConsumersNeverShareAJob() {
  QueueService queue(std::make_shared<MemoryQueueStore>(), FastOptions());

  constexpr int kJobs = 50;
  for (int i = 0; i < kJobs; ++i) {
    queue.Enqueue(MakeJob("img-" + std::to_string(i)));
  }

  std::mutex               seen_mutex;
  std::vector<std::string> seen;
  std::vector<std::thread> consumers;
  for (int c = 0; c < 4; ++c) {
    consumers.emplace_back([&] {
      while (auto job = queue.Dequeue()) {
        std::lock_guard<std::mutex> lock(seen_mutex);
        seen.push_back(job->job_id);
      }
    });
  }
  for (auto& consumer : consumers) consumer.join();

  assert(seen.size() == kJobs);
  assert(std::set<std::string>(seen.begin(), seen.end()).size() == kJobs);
}

void TestClosedQueueStopsServing() {
  QueueService queue(std::make_shared<MemoryQueueStore>(), FastOptions());
  queue.Close();

  assert(!queue.Dequeue().has_value());

  bool threw = false;
  try {
    queue.Enqueue(MakeJob("img-1"));
  } catch (const rulebook::util::Unavailable&) {
    threw = true;
  }
  assert(threw);
}

#if RULEBOOK_DB_SQLITE
void TestSqliteStoreKeepsJobsAcrossReopen() {
  const auto path = (std::filesystem::temp_directory_path() /
                     ("rulebook_queue_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + ".db"))
                        .string();

  std::string job_id;
  {
    QueueService queue(std::make_shared<rulebook::queue::SqliteQueueStore>(path), FastOptions());
    job_id = queue.Enqueue(MakeJob("img-durable"));
    queue.Close();
  }
  {
    QueueService queue(std::make_shared<rulebook::queue::SqliteQueueStore>(path), FastOptions());
    assert(queue.GetStatus(job_id) == JobStatus::kQueued);
    auto job = queue.Dequeue();
    assert(job.has_value());
    assert(job->image_id == "img-durable");
    assert(!queue.Dequeue().has_value());
    queue.Close();
  }
  std::filesystem::remove(path);
}
#endif

} // namespace

void TestExpiredRecordsArePurgedOnPut() {
  MemoryQueueStore store;
  store.Put("a", "1", std::chrono::seconds(0));
  store.Put("b", "2", std::chrono::seconds(0));
  assert(store.RecordCount() == 1);

  store.Put("c", "3", std::chrono::seconds(60));
  store.Put("d", "4", std::chrono::seconds(0));
  assert(store.RecordCount() == 2);
  assert(!store.Get("a").has_value());
  assert(store.Get("c") == std::optional<std::string>("3"));
}

int main() {
  TestEnqueueDequeueAndStatusLifecycle();
  TestEmptyDequeueReturnsWithinTimeout();
  TestFifoOrderForFreshJobs();
  TestRetryRequeuesUntilBudgetIsSpent();
  TestRetriedJobGoesBehindNewerJobs();
  TestRetryOfUnknownJobIsRefused();
  TestMalformedPayloadIsDroppedAndMarkedFailed();
  TestMissingPayloadIsNoJob();
  TestConnectionLossIsDistinctFromEmptyQueue();
  TestConcurrentConsumersNeverShareAJob();
  TestClosedQueueStopsServing();
  TestExpiredRecordsArePurgedOnPut();
#if RULEBOOK_DB_SQLITE
  TestSqliteStoreKeepsJobsAcrossReopen();
#endif

  std::cout << "rulebook_unit_queue_service: pass\n";
  return 0;
}
