#include "internal/core/progress_recorder.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#if RULEBOOK_DB_SQLITE
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using rulebook::core::ProgressRecorder;
using rulebook::core::RecordResult;
using rulebook::model::BatchStatus;
using rulebook::model::ImageStatus;

struct Fixture {
  std::shared_ptr<rulebook::db::Repository> repo;
  ProgressRecorder                          recorder;

  explicit Fixture(std::shared_ptr<rulebook::db::Repository> repository = std::make_shared<rulebook::db::memory::MemoryRepository>())
      : repo(std::move(repository)), recorder(repo) {}

  std::vector<std::string> SeedBatch(const std::string& batch_id, std::uint32_t images, std::uint32_t max_retries) {
    const auto now   = rulebook::util::Now();
    auto       batch = rulebook::model::ImageBatch::Create(batch_id, "game-1", images, max_retries, now);

    std::vector<std::string> ids;
    auto                     tx = repo->Begin();
    rulebook::db::ThrowIfError(repo->InsertBatch(*tx, batch), "insert batch");
    for (std::uint32_t i = 0; i < images; ++i) {
      rulebook::model::GameImage image;
      image.id         = batch_id + "-img-" + std::to_string(i);
      image.game_id    = "game-1";
      image.batch_id   = batch_id;
      image.created_at = now;
      image.updated_at = now;
      rulebook::db::ThrowIfError(repo->InsertImage(*tx, image), "insert image");
      ids.push_back(image.id);
    }
    tx->Commit();
    return ids;
  }

  rulebook::model::ImageBatch Batch(const std::string& id) {
    auto tx    = repo->Begin();
    auto batch = repo->GetBatch(*tx, id);
    tx->Commit();
    return *batch;
  }

  rulebook::model::GameImage Image(const std::string& id) {
    auto tx    = repo->Begin();
    auto image = repo->GetImage(*tx, id);
    tx->Commit();
    return *image;
  }

  // Replays what BatchManager::RetryBatch does to the rows.
  void StartRetry(const std::string& batch_id) {
    auto tx    = repo->Begin();
    auto batch = repo->GetBatchForUpdate(*tx, batch_id);
    batch->StartRetry();
    rulebook::db::ThrowIfError(repo->UpdateBatch(*tx, *batch), "update batch");
    for (auto image : repo->ListImagesByBatch(*tx, batch_id)) {
      if (image.processing_status != ImageStatus::kFailed) continue;
      image.processing_status = ImageStatus::kRetrying;
      rulebook::db::ThrowIfError(repo->UpdateImage(*tx, image), "update image");
    }
    tx->Commit();
  }
};

rulebook::model::GameVector Vector(const std::string& text) {
  rulebook::model::GameVector vector;
  vector.ocr.content   = text;
  vector.ocr.embedding = rulebook::model::Embedding{1.0f, 0.0f};
  return vector;
}

void TestSuccessfulBatchCompletes() {
  Fixture f;
  auto    ids = f.SeedBatch("b1", 2, 3);

  auto started = f.recorder.BeginProcessing(ids[0]);
  assert(started.has_value());
  assert(started->processing_status == ImageStatus::kProcessing);
  assert(started->processing_started_at.has_value());

  assert(f.recorder.RecordSuccess(ids[0], Vector("first")) == RecordResult::kApplied);
  auto batch = f.Batch("b1");
  assert(batch.status == BatchStatus::kProcessing);
  assert(batch.ProgressRatio() == "1/2");
  assert(batch.processing_started_at.has_value());

  assert(f.recorder.RecordSuccess(ids[1], Vector("second")) == RecordResult::kApplied);
  batch = f.Batch("b1");
  assert(batch.status == BatchStatus::kCompleted);
  assert(batch.ProgressRatio() == "2/2");
  assert(batch.completed_at.has_value());

  auto image = f.Image(ids[0]);
  assert(image.processing_status == ImageStatus::kCompleted);
  assert(image.processing_completed_at.has_value());

  auto tx     = f.repo->Begin();
  auto vector = f.repo->GetVectorByImage(*tx, ids[1]);
  tx->Commit();
  assert(vector.has_value());
  assert(vector->ocr.content == std::optional<std::string>("second"));
  assert(vector->game_id == "game-1");
}

void TestFinalOutcomeIsCountedOnce() {
  Fixture f;
  auto    ids = f.SeedBatch("b1", 2, 3);

  assert(f.recorder.RecordSuccess(ids[0], std::nullopt) == RecordResult::kApplied);
  assert(f.recorder.RecordSuccess(ids[0], std::nullopt) == RecordResult::kDuplicate);
  assert(f.recorder.RecordFailure(ids[0], "late failure") == RecordResult::kDuplicate);
  assert(f.recorder.RecordRetrying(ids[0], "late failure", 1) == RecordResult::kDuplicate);
  assert(!f.recorder.BeginProcessing(ids[0]).has_value());

  auto batch = f.Batch("b1");
  assert(batch.processed_images == 1);
  assert(batch.failed_images == 0);
  assert(f.Image(ids[0]).processing_status == ImageStatus::kCompleted);
}

void TestRetryingDoesNotCountTheBatch() {
  Fixture f;
  auto    ids = f.SeedBatch("b1", 1, 3);

  assert(f.recorder.RecordRetrying(ids[0], "timeout", 1) == RecordResult::kApplied);
  auto image = f.Image(ids[0]);
  assert(image.processing_status == ImageStatus::kRetrying);
  assert(image.retry_count == 1);
  assert(image.processing_error == std::optional<std::string>("timeout"));

  auto batch = f.Batch("b1");
  assert(batch.processed_images == 0);
  assert(batch.failed_images == 0);
  assert(batch.status == BatchStatus::kPending);
}

void TestAllFailedBatchWaitsForRetryThenFails() {
  Fixture f;
  auto    ids = f.SeedBatch("b1", 2, 1);

  f.recorder.RecordFailure(ids[0], "bad image");
  f.recorder.RecordFailure(ids[1], "bad image");

  auto batch = f.Batch("b1");
  assert(!batch.IsTerminal());
  assert(batch.CanRetry());
  assert(batch.retry_count == 0);

  f.StartRetry("b1");
  batch = f.Batch("b1");
  assert(batch.status == BatchStatus::kRetrying);
  assert(batch.retry_count == 1);
  assert(batch.failed_images == 0);

  f.recorder.RecordFailure(ids[0], "bad image");
  assert(f.Batch("b1").status == BatchStatus::kProcessing);
  f.recorder.RecordFailure(ids[1], "bad image");

  batch = f.Batch("b1");
  assert(batch.status == BatchStatus::kFailed);
  assert(batch.failed_images == 2);
  assert(batch.completed_at.has_value());
}

void TestMixedOutcomeEndsPartiallyCompleted() {
  Fixture f;
  auto    ids = f.SeedBatch("b1", 2, 0);

  f.recorder.RecordSuccess(ids[0], std::nullopt);
  f.recorder.RecordFailure(ids[1], "bad image");

  auto batch = f.Batch("b1");
  assert(batch.status == BatchStatus::kPartiallyCompleted);
  assert(batch.processed_images + batch.failed_images == batch.total_images);
}

void TestSuccessReplacesEarlierVector() {
  Fixture f;
  auto    ids = f.SeedBatch("b1", 1, 3);

  {
    auto tx = f.repo->Begin();
    auto v  = Vector("stale");
    v.id       = "stale-vector";
    v.game_id  = "game-1";
    v.image_id = ids[0];
    rulebook::db::ThrowIfError(f.repo->InsertVector(*tx, v), "insert vector");
    tx->Commit();
  }

  f.recorder.RecordSuccess(ids[0], Vector("fresh"));

  auto tx   = f.repo->Begin();
  auto hits = f.repo->SearchVectors(*tx, "game-1", rulebook::model::Embedding{1.0f, 0.0f}, rulebook::model::SearchPair::kOcr, 10, 0.0);
  tx->Commit();
  assert(hits.size() == 1);
  assert(hits[0].vector.ocr.content == std::optional<std::string>("fresh"));
}

void TestUnknownImageIsNotFound() {
  Fixture f;
  bool    threw = false;
  try {
    f.recorder.RecordSuccess("missing", std::nullopt);
  } catch (const rulebook::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

#if RULEBOOK_DB_SQLITE
// SQLite serializes writers, so no update is lost to a conflict either.
void TestConcurrentOutcomesNeverLoseAnIncrement() {
  auto db = std::make_shared<rulebook::db::sqlite::SqliteDB>(":memory:", false);
  rulebook::db::sqlite::BootstrapSqliteSchema(*db);

  Fixture       f(std::make_shared<rulebook::db::sqlite::SqliteRepository>(db));
  constexpr int kImages  = 24;
  constexpr int kThreads = 4;
  auto          ids      = f.SeedBatch("b1", kImages, 0);

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      for (int i = t; i < kImages; i += kThreads) {
        if (i % 3 == 0) {
          f.recorder.RecordFailure(ids[i], "bad image");
        } else {
          f.recorder.RecordSuccess(ids[i], Vector("page " + std::to_string(i)));
        }
      }
    });
  }
  for (auto& thread : threads) thread.join();

  auto batch = f.Batch("b1");
  assert(batch.processed_images == 16);
  assert(batch.failed_images == 8);
  assert(batch.status == BatchStatus::kPartiallyCompleted);
}
#endif

void TestStaleWriterLosesToRecorder() {
  Fixture f;
  auto    ids = f.SeedBatch("b1", 2, 3);

  // snapshot taken before the recorder commits
  auto stale = f.repo->Begin();
  f.recorder.RecordSuccess(ids[0], std::nullopt);
  auto image              = *f.repo->GetImage(*stale, ids[1]);
  image.processing_status = ImageStatus::kProcessing;
  rulebook::db::ThrowIfError(f.repo->UpdateImage(*stale, image), "update image");

  bool conflicted = false;
  try {
    stale->Commit();
  } catch (const rulebook::util::TransactionConflict&) {
    conflicted = true;
  }
  assert(conflicted);

  f.recorder.RecordSuccess(ids[1], std::nullopt);
  assert(f.Batch("b1").status == BatchStatus::kCompleted);
}

// Several deliveries of the same job finish at once; the batch counts
// the image once and exactly one delivery reports kApplied.
void CheckDuplicateDeliveriesCountOnce(Fixture& f) {
  auto ids = f.SeedBatch("dup", 2, 0);

  std::atomic<int>         applied{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&, t] {
      const auto result = (t % 2 == 0) ? f.recorder.RecordSuccess(ids[0], Vector("page")) : f.recorder.RecordFailure(ids[0], "late failure");
      if (result == RecordResult::kApplied) ++applied;
    });
  }
  for (auto& thread : threads) thread.join();

  assert(applied == 1);
  auto batch = f.Batch("dup");
  assert(batch.processed_images + batch.failed_images == 1);
  assert(batch.status == BatchStatus::kProcessing);

  f.recorder.RecordSuccess(ids[1], std::nullopt);
  batch = f.Batch("dup");
  assert(batch.processed_images + batch.failed_images == 2);
  assert(batch.IsTerminal());
}

void TestDuplicateDeliveriesCountOnce() {
  Fixture f;
  CheckDuplicateDeliveriesCountOnce(f);

#if RULEBOOK_DB_SQLITE
  auto db = std::make_shared<rulebook::db::sqlite::SqliteDB>(":memory:", false);
  rulebook::db::sqlite::BootstrapSqliteSchema(*db);
  Fixture sqlite(std::make_shared<rulebook::db::sqlite::SqliteRepository>(db));
  CheckDuplicateDeliveriesCountOnce(sqlite);
#endif
}

} // namespace

int main() {
  TestSuccessfulBatchCompletes();
  TestFinalOutcomeIsCountedOnce();
  TestRetryingDoesNotCountTheBatch();
  TestAllFailedBatchWaitsForRetryThenFails();
  TestMixedOutcomeEndsPartiallyCompleted();
  TestSuccessReplacesEarlierVector();
  TestUnknownImageIsNotFound();
  TestStaleWriterLosesToRecorder();
  TestDuplicateDeliveriesCountOnce();
#if RULEBOOK_DB_SQLITE
  TestConcurrentOutcomesNeverLoseAnIncrement();
#endif

  std::cout << "rulebook_unit_progress_recorder: pass\n";
  return 0;
}
