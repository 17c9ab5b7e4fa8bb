#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/ai/openai_client.hpp"
#include "internal/core/batch_manager.hpp"
#include "internal/core/progress_recorder.hpp"
#include "internal/core/retrieval_engine.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/ingest_server.hpp"
#include "internal/grpc/retrieval_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/queue/memory_queue_store.hpp"
#include "internal/queue/queue_service.hpp"
#include "internal/service/ingest_service.hpp"
#include "internal/service/retrieval_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/storage/arrow_object_store.hpp"
#include "internal/worker/processing_worker.hpp"
#include "internal/worker/reconciliation_sweeper.hpp"
#if RULEBOOK_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/queue/sqlite_queue_store.hpp"
#endif
#if RULEBOOK_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#include "internal/db/postgres/pg_schema.hpp"
#include "internal/queue/pg_queue_store.hpp"
#endif

namespace rulebook::factory {

using namespace rulebook;
using observability::IntField;
using observability::StringField;

namespace {

std::shared_ptr<db::Repository> BuildRepository(const rulebook::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if RULEBOOK_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    db::sqlite::BootstrapSqliteSchema(*sqlite_db);
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if RULEBOOK_DB_POSTGRES
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), database.postgres().pool_size());
    db::postgres::BootstrapPostgresSchema(*pool, config.ai().embedding_dimensions());
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  RULEBOOK_LOG_WARN("no database configured, using the in-memory repository");
  return std::make_shared<db::memory::MemoryRepository>();
}

std::shared_ptr<queue::QueueStore> BuildQueueStore(const rulebook::runtime::config::QueueConfig& config) {
  switch (config.backend()) {
    case rulebook::runtime::config::QUEUE_BACKEND_SQLITE:
#if RULEBOOK_DB_SQLITE
      return std::make_shared<queue::SqliteQueueStore>(config.sqlite_path());
#else
      throw std::runtime_error("sqlite queue requested but not enabled at build time");
#endif
    case rulebook::runtime::config::QUEUE_BACKEND_POSTGRES:
#if RULEBOOK_DB_POSTGRES
      return std::make_shared<queue::PgQueueStore>(config.postgres_uri());
#else
      throw std::runtime_error("postgres queue requested but not enabled at build time");
#endif
    default:
      return std::make_shared<queue::MemoryQueueStore>();
  }
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const rulebook::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Persistence + queue
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  queue::QueueOptions queue_options;
  queue_options.list_name       = config.queue().list_name();
  queue_options.job_ttl         = std::chrono::seconds(config.queue().job_ttl_sec());
  queue_options.dequeue_timeout = std::chrono::milliseconds(config.queue().dequeue_timeout_ms());
  app.queue = std::make_shared<queue::QueueService>(BuildQueueStore(config.queue()), queue_options);

  // ------------------------------------------------------------------
  // External collaborators
  // ------------------------------------------------------------------
  std::shared_ptr<storage::ObjectStore> objects = storage::ArrowObjectStore::Make(config.object_store());

  auto ai_client = std::make_shared<ai::OpenAiClient>(config.ai());
  const auto [ai_ok, ai_message] = ai_client->TestConnection();
  if (ai_ok) {
    RULEBOOK_LOG_INFO("AI service reachable", {StringField("endpoint", config.ai().endpoint())});
  } else {
    RULEBOOK_LOG_WARN("AI service check failed", {StringField("endpoint", config.ai().endpoint()), StringField("message", ai_message)});
  }

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  core::BatchOptions batch_options;
  batch_options.max_retries     = config.batch().max_retries();
  batch_options.job_max_retries = config.queue().default_max_retries();

  auto batches   = std::make_shared<core::BatchManager>(app.repository, objects, app.queue, batch_options);
  auto recorder  = std::make_shared<core::ProgressRecorder>(app.repository);
  auto retrieval = std::make_shared<core::RetrievalEngine>(app.repository, ai_client, config.ai().embedding_dimensions());

  // ------------------------------------------------------------------
  // Workers
  // ------------------------------------------------------------------
  const auto backoff = std::chrono::milliseconds(config.queue().reconnect_backoff_ms());
  for (std::uint32_t i = 0; i < config.workers().threads(); ++i) {
    auto worker = std::make_shared<worker::ProcessingWorker>("worker-" + std::to_string(i), app.queue, recorder, objects, ai_client, backoff);
    worker->Start();
    app.workers.push_back(std::move(worker));
  }

  if (config.reconciliation().enabled()) {
    worker::ReconciliationOptions options;
    options.interval             = std::chrono::seconds(config.reconciliation().interval_sec());
    options.orphan_age           = std::chrono::seconds(config.reconciliation().orphan_age_sec());
    options.max_images_per_sweep = config.reconciliation().max_images_per_sweep();

    app.sweeper = std::make_shared<worker::ReconciliationSweeper>(app.repository, app.queue, batches, options);
    app.sweeper->Start();
  }

  RULEBOOK_LOG_INFO("pipeline started", {IntField("workers", config.workers().threads()), observability::BoolField("reconciliation", app.sweeper != nullptr)});

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.batches   = batches;
  ctx.retrieval = retrieval;

  auto ingest_service    = std::make_shared<service::IngestService>(ctx);
  auto retrieval_service = std::make_shared<service::RetrievalService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::IngestServer>(ingest_service));
  app.grpc_services.push_back(std::make_unique<grpc::RetrievalServer>(retrieval_service));

  return app;
}

void Shutdown(Application& app) {
  if (app.sweeper) app.sweeper->Stop();
  for (auto& worker : app.workers) worker->Stop();
  if (app.queue) app.queue->Close();
}

} // namespace rulebook::factory
