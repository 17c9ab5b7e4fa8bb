#include "internal/worker/processing_worker.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/batch_manager.hpp"
#include "internal/core/progress_recorder.hpp"
#include "internal/db/memory/memory_repository.hpp"
#if RULEBOOK_DB_SQLITE
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif
#include "internal/queue/memory_queue_store.hpp"
#include "internal/queue/queue_service.hpp"
#include "test_fakes.hpp"

namespace {

using rulebook::core::UploadFile;
using rulebook::model::BatchStatus;
using rulebook::model::ImageStatus;
using rulebook::model::JobStatus;
using rulebook::worker::ProcessingWorker;

constexpr std::size_t kDims = 4;

struct Fixture {
  std::shared_ptr<rulebook::db::Repository>           repo;
  std::shared_ptr<rulebook::testing::FakeObjectStore> objects = std::make_shared<rulebook::testing::FakeObjectStore>();
  std::shared_ptr<rulebook::testing::FakeAiClient>    ai      = std::make_shared<rulebook::testing::FakeAiClient>(kDims);
  std::shared_ptr<rulebook::queue::QueueService>      queue;
  std::shared_ptr<rulebook::core::BatchManager>       batches;
  std::shared_ptr<rulebook::core::ProgressRecorder>   recorder;

  explicit Fixture(std::uint32_t                             job_max_retries = 3,
                   std::shared_ptr<rulebook::db::Repository> repository      = std::make_shared<rulebook::db::memory::MemoryRepository>())
      : repo(std::move(repository)), recorder(std::make_shared<rulebook::core::ProgressRecorder>(repo)) {
    rulebook::queue::QueueOptions options;
    options.dequeue_timeout = std::chrono::milliseconds(20);
    queue   = std::make_shared<rulebook::queue::QueueService>(std::make_shared<rulebook::queue::MemoryQueueStore>(), options);
    batches = std::make_shared<rulebook::core::BatchManager>(repo, objects, queue, rulebook::core::BatchOptions{3, job_max_retries});
  }

  std::unique_ptr<ProcessingWorker> MakeWorker(const std::string& name) {
    return std::make_unique<ProcessingWorker>(name, queue, recorder, objects, ai, std::chrono::milliseconds(10));
  }

  std::vector<rulebook::model::GameImage> Images(const std::string& batch_id) {
    auto tx     = repo->Begin();
    auto images = repo->ListImagesByBatch(*tx, batch_id);
    tx->Commit();
    return images;
  }

  std::optional<rulebook::model::GameVector> VectorOf(const std::string& image_id) {
    auto tx     = repo->Begin();
    auto vector = repo->GetVectorByImage(*tx, image_id);
    tx->Commit();
    return vector;
  }
};

UploadFile File(const std::string& name, const std::string& content) {
  return UploadFile{name, arrow::Buffer::FromString(content), "image/png"};
}

void TestWorkerCompletesBatch() {
  Fixture f;
  auto    created = f.batches->CreateBatch("game-1", "user-1", {File("p1.png", "one"), File("p2.png", "two")});
  auto    worker  = f.MakeWorker("worker-0");

  assert(f.batches->GetBatch(created.batch_id).status == BatchStatus::kPending);

  assert(worker->ProcessNext());
  auto batch = f.batches->GetBatch(created.batch_id);
  assert(batch.status == BatchStatus::kProcessing);
  assert(batch.ProgressRatio() == "1/2");

  assert(worker->ProcessNext());
  batch = f.batches->GetBatch(created.batch_id);
  assert(batch.status == BatchStatus::kCompleted);
  assert(batch.ProgressRatio() == "2/2");

  assert(!worker->ProcessNext());

  for (const auto& image : f.Images(created.batch_id)) {
    assert(image.processing_status == ImageStatus::kCompleted);
    assert(f.queue->GetStatus(image.last_job_id) == JobStatus::kCompleted);

    auto vector = f.VectorOf(image.id);
    assert(vector.has_value());
    assert(vector->page_number == 1);
    assert(vector->ocr.content == std::optional<std::string>("text of " + image.original_filename));
    assert(vector->labels.embedding.has_value());
    assert(!vector->description.content.has_value());
  }
}

void TestFailingImageIsRetriedThenFailedThenRecoveredByBatchRetry() {
  Fixture f(1);
  f.ai->SetFailing("bad", true);

  auto created = f.batches->CreateBatch("game-1", "user-1", {File("bad.png", "bad")});
  auto worker  = f.MakeWorker("worker-0");
  auto image   = f.Images(created.batch_id).at(0);

  // first attempt: job re-queued, batch not counted
  assert(worker->ProcessNext());
  image = f.batches->GetImage(image.id);
  assert(image.processing_status == ImageStatus::kRetrying);
  assert(image.retry_count == 1);
  assert(image.processing_error.has_value());
  assert(f.queue->GetStatus(image.last_job_id) == JobStatus::kRetrying);
  assert(f.batches->GetBatch(created.batch_id).failed_images == 0);

  // second attempt: job budget spent
  assert(worker->ProcessNext());
  image = f.batches->GetImage(image.id);
  assert(image.processing_status == ImageStatus::kFailed);
  assert(f.queue->GetStatus(image.last_job_id) == JobStatus::kFailed);

  auto batch = f.batches->GetBatch(created.batch_id);
  assert(batch.failed_images == 1);
  assert(!batch.IsTerminal());
  assert(batch.CanRetry());
  assert(!worker->ProcessNext());

  f.ai->SetFailing("bad", false);
  auto retry = f.batches->RetryBatch(created.batch_id);
  assert(retry.job_ids.size() == 1);

  assert(worker->ProcessNext());
  batch = f.batches->GetBatch(created.batch_id);
  assert(batch.status == BatchStatus::kCompleted);
  assert(batch.ProgressRatio() == "1/1");
  assert(batch.retry_count == 1);
}

void TestEmptyExtractionCompletesWithoutVector() {
  Fixture f;
  f.ai->extract_nothing = true;

  auto created = f.batches->CreateBatch("game-1", "user-1", {File("blank.png", "blank")});
  auto worker  = f.MakeWorker("worker-0");

  assert(worker->ProcessNext());
  auto image = f.Images(created.batch_id).at(0);
  assert(image.processing_status == ImageStatus::kCompleted);
  assert(!f.VectorOf(image.id).has_value());
  assert(f.batches->GetBatch(created.batch_id).status == BatchStatus::kCompleted);
}

void TestJobForFinishedImageIsSkipped() {
  Fixture f;
  auto    created = f.batches->CreateBatch("game-1", "user-1", {File("p1.png", "one")});
  auto    worker  = f.MakeWorker("worker-0");
  assert(worker->ProcessNext());
  assert(f.ai->calls == 1);

  auto image  = f.Images(created.batch_id).at(0);
  auto job_id = f.batches->EnqueueImage(image);

  assert(worker->ProcessNext());
  assert(f.ai->calls == 1);
  assert(f.queue->GetStatus(job_id) == JobStatus::kCompleted);
  assert(f.batches->GetBatch(created.batch_id).processed_images == 1);
}

void TestJobForDeletedImageIsDropped() {
  Fixture f;
  auto    created = f.batches->CreateBatch("game-1", "user-1", {File("p1.png", "one")});
  auto    image   = f.Images(created.batch_id).at(0);
  f.batches->DeleteImage(image.id);

  auto worker = f.MakeWorker("worker-0");
  assert(worker->ProcessNext());
  assert(f.ai->calls == 0);
  assert(f.queue->GetStatus(image.last_job_id) == JobStatus::kFailed);
  assert(!worker->ProcessNext());
}

void TestStartingTwiceKeepsOneThread() {
  Fixture f;
  auto    created = f.batches->CreateBatch("game-1", "user-1", {File("p1.png", "one")});
  auto    worker  = f.MakeWorker("worker-0");
  worker->Start();
  worker->Start();

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
  while (!f.batches->GetBatch(created.batch_id).IsTerminal() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  worker->Stop();
  worker->Stop();

  assert(f.batches->GetBatch(created.batch_id).status == BatchStatus::kCompleted);
  assert(f.ai->calls == 1);
}

#if RULEBOOK_DB_SQLITE
void TestConcurrentWorkersShareOneBatch() {
  auto db = std::make_shared<rulebook::db::sqlite::SqliteDB>(":memory:", false);
  rulebook::db::sqlite::BootstrapSqliteSchema(*db);

  Fixture                 f(3, std::make_shared<rulebook::db::sqlite::SqliteRepository>(db));
  std::vector<UploadFile> files;
  for (int i = 0; i < 12; ++i) {
    files.push_back(File("p" + std::to_string(i) + ".png", "content " + std::to_string(i)));
  }
  auto created = f.batches->CreateBatch("game-1", "user-1", files);

  std::vector<std::unique_ptr<ProcessingWorker>> workers;
  for (int i = 0; i < 3; ++i) {
    workers.push_back(f.MakeWorker("worker-" + std::to_string(i)));
    workers.back()->Start();
  }

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(20);
  while (!f.batches->GetBatch(created.batch_id).IsTerminal() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  for (auto& worker : workers) worker->Stop();

  auto batch = f.batches->GetBatch(created.batch_id);
  assert(batch.status == BatchStatus::kCompleted);
  assert(batch.ProgressRatio() == "12/12");
  assert(batch.failed_images == 0);
  assert(f.ai->calls == 12);
}
#endif

} // namespace

int main() {
  TestWorkerCompletesBatch();
  TestFailingImageIsRetriedThenFailedThenRecoveredByBatchRetry();
  TestEmptyExtractionCompletesWithoutVector();
  TestJobForFinishedImageIsSkipped();
  TestJobForDeletedImageIsDropped();
  TestStartingTwiceKeepsOneThread();
#if RULEBOOK_DB_SQLITE
  TestConcurrentWorkersShareOneBatch();
#endif

  std::cout << "rulebook_unit_processing_worker: pass\n";
  return 0;
}
