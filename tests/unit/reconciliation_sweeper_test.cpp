#include "internal/worker/reconciliation_sweeper.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/core/batch_manager.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/queue/memory_queue_store.hpp"
#include "internal/queue/queue_service.hpp"
#include "internal/util/time.hpp"
#include "test_fakes.hpp"

namespace {

using rulebook::model::ImageStatus;
using rulebook::model::JobStatus;
using rulebook::worker::ReconciliationOptions;
using rulebook::worker::ReconciliationSweeper;

struct Fixture {
  std::shared_ptr<rulebook::db::memory::MemoryRepository> repo    = std::make_shared<rulebook::db::memory::MemoryRepository>();
  std::shared_ptr<rulebook::testing::FakeObjectStore>     objects = std::make_shared<rulebook::testing::FakeObjectStore>();
  std::shared_ptr<rulebook::queue::QueueService>          queue;
  std::shared_ptr<rulebook::core::BatchManager>           batches;

  Fixture() {
    rulebook::queue::QueueOptions options;
    options.dequeue_timeout = std::chrono::milliseconds(20);
    queue   = std::make_shared<rulebook::queue::QueueService>(std::make_shared<rulebook::queue::MemoryQueueStore>(), options);
    batches = std::make_shared<rulebook::core::BatchManager>(repo, objects, queue, rulebook::core::BatchOptions{});

    auto tx = repo->Begin();
    rulebook::db::ThrowIfError(repo->InsertBatch(*tx, rulebook::model::ImageBatch::Create("b1", "game-1", 8, 3, rulebook::util::Now())),
                               "insert batch");
    tx->Commit();
  }

  ReconciliationSweeper Sweeper(std::size_t max_images = 500) {
    ReconciliationOptions options;
    options.orphan_age           = std::chrono::seconds(60);
    options.max_images_per_sweep = max_images;
    return ReconciliationSweeper(repo, queue, batches, options);
  }

  rulebook::model::GameImage Seed(const std::string& id, ImageStatus status, std::chrono::seconds age, const std::string& last_job_id = "") {
    rulebook::model::GameImage image;
    image.id                = id;
    image.game_id           = "game-1";
    image.batch_id          = "b1";
    image.file_path         = "games/game-1/images/" + id + "_page.png";
    image.original_filename = "page.png";
    image.processing_status = status;
    image.last_job_id       = last_job_id;
    image.created_at        = rulebook::util::Now() - age;
    image.updated_at        = image.created_at;

    auto tx = repo->Begin();
    rulebook::db::ThrowIfError(repo->InsertImage(*tx, image), "insert image");
    tx->Commit();
    return image;
  }

  std::string LiveJob(const std::string& image_id) {
    rulebook::model::ProcessingJob job;
    job.image_id = image_id;
    job.game_id  = "game-1";
    return queue->Enqueue(job);
  }
};

void TestOrphansAreReenqueued() {
  Fixture    f;
  const auto old = std::chrono::seconds(3600);

  f.Seed("never-queued", ImageStatus::kUploaded, old);
  f.Seed("expired-job", ImageStatus::kRetrying, old, "job_expired-job_1.000000");

  const auto finished = f.LiveJob("finished-job");
  f.queue->MarkFailed(finished, "boom");
  f.Seed("finished-job", ImageStatus::kRetrying, old, finished);

  f.Seed("live-job", ImageStatus::kUploaded, old, f.LiveJob("live-job"));
  f.Seed("too-young", ImageStatus::kUploaded, std::chrono::seconds(0));
  f.Seed("in-flight", ImageStatus::kProcessing, old);
  f.Seed("done", ImageStatus::kCompleted, old);

  auto sweeper = f.Sweeper();
  assert(sweeper.SweepOnce() == 3);

  for (const char* id : {"never-queued", "expired-job", "finished-job"}) {
    auto image = f.batches->GetImage(id);
    assert(!image.last_job_id.empty());
    assert(image.last_job_id != finished);
    assert(f.queue->GetStatus(image.last_job_id) == JobStatus::kQueued);
  }
  assert(f.batches->GetImage("too-young").last_job_id.empty());
  assert(f.batches->GetImage("in-flight").last_job_id.empty());

  // every pending image now has a live job
  assert(sweeper.SweepOnce() == 0);
}

void TestSweepIsBounded() {
  Fixture f;
  for (int i = 0; i < 5; ++i) {
    f.Seed("orphan-" + std::to_string(i), ImageStatus::kUploaded, std::chrono::seconds(3600 + i));
  }

  auto sweeper = f.Sweeper(2);
  assert(sweeper.SweepOnce() == 2);
  // oldest first
  assert(!f.batches->GetImage("orphan-4").last_job_id.empty());
  assert(!f.batches->GetImage("orphan-3").last_job_id.empty());
  assert(f.batches->GetImage("orphan-0").last_job_id.empty());
}

void TestStopReturnsPromptly() {
  Fixture               f;
  ReconciliationOptions options;
  options.interval = std::chrono::seconds(3600);
  ReconciliationSweeper sweeper(f.repo, f.queue, f.batches, options);

  const auto started = std::chrono::steady_clock::now();
  sweeper.Start();
  sweeper.Stop();
  assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(5));
}

void TestStartingTwiceIsHarmless() {
  Fixture               f;
  ReconciliationOptions options;
  options.interval = std::chrono::seconds(3600);
  ReconciliationSweeper sweeper(f.repo, f.queue, f.batches, options);

  sweeper.Start();
  sweeper.Start();
  sweeper.Stop();
  sweeper.Stop();
}

} // namespace

int main() {
  TestOrphansAreReenqueued();
  TestSweepIsBounded();
  TestStopReturnsPromptly();
  TestStartingTwiceIsHarmless();

  std::cout << "rulebook_unit_reconciliation_sweeper: pass\n";
  return 0;
}
