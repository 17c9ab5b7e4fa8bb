#include "pg_queue_store.hpp"

#include <algorithm>
#include <pqxx/pqxx>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace rulebook::queue {

namespace {

void BootstrapQueueSchema(pqxx::connection& conn) {
  pqxx::work tx(conn);
  tx.exec("CREATE TABLE IF NOT EXISTS queue_records (key TEXT PRIMARY KEY, value TEXT NOT NULL, expires_at_ms BIGINT NOT NULL);");
  tx.exec("CREATE TABLE IF NOT EXISTS queue_items (seq BIGSERIAL PRIMARY KEY, list TEXT NOT NULL, value TEXT NOT NULL);");
  tx.exec("CREATE INDEX IF NOT EXISTS idx_queue_items_list ON queue_items(list, seq);");
  tx.commit();
}

int64_t NowMs() {
  return util::ToUnixMillis(util::Now());
}

} // namespace

PgQueueStore::PgQueueStore(std::string conninfo, std::chrono::milliseconds poll_interval)
    : conninfo_(std::move(conninfo)), poll_interval_(poll_interval) {
}

PgQueueStore::~PgQueueStore() = default;

/*
  The connection mutex is held for the whole call: one pqxx::connection
  is never used by two threads at once.
*/
template <typename Fn>
decltype(auto) PgQueueStore::WithConnection(Fn&& fn) {
  std::lock_guard lock(conn_mutex_);
  if (closed_) throw util::Unavailable("queue store closed");

  try {
    if (!conn_) {
      auto conn = std::make_unique<pqxx::connection>(conninfo_);
      BootstrapQueueSchema(*conn);
      conn_ = std::move(conn);
    }
    return fn(*conn_);
  } catch (const pqxx::broken_connection& e) {
    conn_.reset();
    RULEBOOK_LOG_WARN("queue store connection dropped", {observability::StringField("error", e.what())});
    throw util::Unavailable(std::string("postgres queue store: ") + e.what());
  }
}

void PgQueueStore::Put(const std::string& key, const std::string& value, std::chrono::seconds ttl) {
  WithConnection([&](pqxx::connection& conn) {
    const int64_t now = NowMs();
    pqxx::work    tx(conn);
    tx.exec_params("DELETE FROM queue_records WHERE expires_at_ms<=$1", now);
    tx.exec_params(
        "INSERT INTO queue_records(key,value,expires_at_ms) VALUES($1,$2,$3) "
        "ON CONFLICT(key) DO UPDATE SET value=EXCLUDED.value, expires_at_ms=EXCLUDED.expires_at_ms",
        key, value, now + std::chrono::duration_cast<std::chrono::milliseconds>(ttl).count());
    tx.commit();
  });
}

std::optional<std::string> PgQueueStore::Get(const std::string& key) {
  return WithConnection([&](pqxx::connection& conn) -> std::optional<std::string> {
    pqxx::nontransaction tx(conn);
    auto                 res = tx.exec_params("SELECT value FROM queue_records WHERE key=$1 AND expires_at_ms>$2", key, NowMs());
    if (res.empty()) return std::nullopt;
    return std::string(res[0][0].c_str());
  });
}

bool PgQueueStore::Delete(const std::string& key) {
  return WithConnection([&](pqxx::connection& conn) {
    pqxx::nontransaction tx(conn);
    auto                 res = tx.exec_params("DELETE FROM queue_records WHERE key=$1", key);
    return res.affected_rows() > 0;
  });
}

void PgQueueStore::Push(const std::string& list, const std::string& value) {
  WithConnection([&](pqxx::connection& conn) {
    pqxx::nontransaction tx(conn);
    tx.exec_params("INSERT INTO queue_items(list,value) VALUES($1,$2)", list, value);
  });
}

std::optional<std::string> PgQueueStore::Pop(const std::string& list, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  for (;;) {
    if (closed_) return std::nullopt;

    auto value = WithConnection([&](pqxx::connection& conn) -> std::optional<std::string> {
      pqxx::work tx(conn);
      auto       res = tx.exec_params(
          "DELETE FROM queue_items WHERE seq = (SELECT seq FROM queue_items WHERE list=$1 ORDER BY seq FOR UPDATE SKIP LOCKED LIMIT 1) "
          "RETURNING value",
          list);
      tx.commit();
      if (res.empty()) return std::nullopt;
      return std::string(res[0][0].c_str());
    });
    if (value) return value;

    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) return std::nullopt;

    std::unique_lock lock(close_mutex_);
    close_cv_.wait_for(lock, std::min<std::chrono::steady_clock::duration>(poll_interval_, deadline - now), [&] { return closed_.load(); });
  }
}

void PgQueueStore::Close() {
  {
    std::lock_guard lock(close_mutex_);
    closed_ = true;
  }
  close_cv_.notify_all();

  std::lock_guard lock(conn_mutex_);
  conn_.reset();
}

} // namespace rulebook::queue
