#include "sqlite_queue_store.hpp"

#include <algorithm>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_statement.hpp"
#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace rulebook::queue {

using db::sqlite::BindI64;
using db::sqlite::BindText;
using db::sqlite::ColI64;
using db::sqlite::ColText;
using db::sqlite::Statement;

namespace {

void BootstrapQueueSchema(db::sqlite::SqliteDB& db) {
  db.Exec("CREATE TABLE IF NOT EXISTS queue_records (key TEXT PRIMARY KEY, value TEXT NOT NULL, expires_at_ms INTEGER NOT NULL);");
  db.Exec("CREATE TABLE IF NOT EXISTS queue_items (seq INTEGER PRIMARY KEY AUTOINCREMENT, list TEXT NOT NULL, value TEXT NOT NULL);");
  db.Exec("CREATE INDEX IF NOT EXISTS idx_queue_items_list ON queue_items(list, seq);");
}

int64_t NowMs() {
  return util::ToUnixMillis(util::Now());
}

} // namespace

SqliteQueueStore::SqliteQueueStore(std::string path, std::chrono::milliseconds poll_interval)
    : path_(std::move(path)), poll_interval_(poll_interval) {
}

template <typename Fn>
decltype(auto) SqliteQueueStore::WithDb(Fn&& fn) {
  std::shared_ptr<db::sqlite::SqliteDB> conn;
  {
    std::lock_guard lock(conn_mutex_);
    if (closed_) throw util::Unavailable("queue store closed");
    if (!db_) {
      auto opened = std::make_shared<db::sqlite::SqliteDB>(path_);
      BootstrapQueueSchema(*opened);
      db_ = std::move(opened);
    }
    conn = db_;
  }

  try {
    return fn(conn);
  } catch (const std::runtime_error& e) {
    {
      std::lock_guard lock(conn_mutex_);
      if (db_ == conn) db_.reset();
    }
    RULEBOOK_LOG_WARN("queue store connection dropped", {observability::StringField("store", path_), observability::StringField("error", e.what())});
    throw util::Unavailable(std::string("sqlite queue store: ") + e.what());
  }
}

void SqliteQueueStore::Put(const std::string& key, const std::string& value, std::chrono::seconds ttl) {
  WithDb([&](std::shared_ptr<db::sqlite::SqliteDB>& conn) {
    db::sqlite::SqliteTransaction tx(conn);
    const int64_t                 now = NowMs();
    {
      Statement purge(conn->Handle(), "DELETE FROM queue_records WHERE expires_at_ms<=?;");
      BindI64(purge.get(), 1, now);
      purge.Run();
    }
    {
      Statement st(conn->Handle(), "INSERT OR REPLACE INTO queue_records(key,value,expires_at_ms) VALUES(?,?,?);");
      BindText(st.get(), 1, key);
      BindText(st.get(), 2, value);
      BindI64(st.get(), 3, now + std::chrono::duration_cast<std::chrono::milliseconds>(ttl).count());
      st.Run();
    }
    tx.Commit();
  });
}

std::optional<std::string> SqliteQueueStore::Get(const std::string& key) {
  return WithDb([&](std::shared_ptr<db::sqlite::SqliteDB>& conn) -> std::optional<std::string> {
    std::lock_guard lock(conn->TxMutex());
    Statement       st(conn->Handle(), "SELECT value FROM queue_records WHERE key=? AND expires_at_ms>?;");
    BindText(st.get(), 1, key);
    BindI64(st.get(), 2, NowMs());
    if (!st.NextRow()) return std::nullopt;
    return ColText(st.get(), 0);
  });
}

bool SqliteQueueStore::Delete(const std::string& key) {
  return WithDb([&](std::shared_ptr<db::sqlite::SqliteDB>& conn) {
    std::lock_guard lock(conn->TxMutex());
    Statement       st(conn->Handle(), "DELETE FROM queue_records WHERE key=?;");
    BindText(st.get(), 1, key);
    st.Run();
    return sqlite3_changes(conn->Handle()) > 0;
  });
}

void SqliteQueueStore::Push(const std::string& list, const std::string& value) {
  WithDb([&](std::shared_ptr<db::sqlite::SqliteDB>& conn) {
    std::lock_guard lock(conn->TxMutex());
    Statement       st(conn->Handle(), "INSERT INTO queue_items(list,value) VALUES(?,?);");
    BindText(st.get(), 1, list);
    BindText(st.get(), 2, value);
    st.Run();
  });
}

std::optional<std::string> SqliteQueueStore::TryPop(const std::string& list) {
  return WithDb([&](std::shared_ptr<db::sqlite::SqliteDB>& conn) -> std::optional<std::string> {
    db::sqlite::SqliteTransaction tx(conn);

    int64_t     seq = 0;
    std::string value;
    {
      Statement st(conn->Handle(), "SELECT seq,value FROM queue_items WHERE list=? ORDER BY seq LIMIT 1;");
      BindText(st.get(), 1, list);
      if (!st.NextRow()) return std::nullopt; // tx rolls back
      seq   = ColI64(st.get(), 0);
      value = ColText(st.get(), 1);
    }
    {
      Statement st(conn->Handle(), "DELETE FROM queue_items WHERE seq=?;");
      BindI64(st.get(), 1, seq);
      st.Run();
    }
    tx.Commit();
    return value;
  });
}

std::optional<std::string> SqliteQueueStore::Pop(const std::string& list, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  for (;;) {
    if (closed_) return std::nullopt;

    if (auto value = TryPop(list)) return value;

    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) return std::nullopt;

    std::unique_lock lock(close_mutex_);
    close_cv_.wait_for(lock, std::min<std::chrono::steady_clock::duration>(poll_interval_, deadline - now), [&] { return closed_.load(); });
  }
}

void SqliteQueueStore::Close() {
  {
    std::lock_guard lock(close_mutex_);
    closed_ = true;
  }
  close_cv_.notify_all();

  std::lock_guard lock(conn_mutex_);
  db_.reset();
}

} // namespace rulebook::queue
