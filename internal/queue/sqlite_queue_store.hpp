#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>

#include "queue_store.hpp"

namespace rulebook::db::sqlite {
class SqliteDB;
}

namespace rulebook::queue {

/*
  Durable store in a SQLite file.

  Pop polls inside BEGIN IMMEDIATE, so consumers in other processes
  sharing the file never receive the same value.
*/
class SqliteQueueStore final : public QueueStore {
 public:
  explicit SqliteQueueStore(std::string path, std::chrono::milliseconds poll_interval = std::chrono::milliseconds(50));

  void Put(const std::string& key, const std::string& value, std::chrono::seconds ttl) override;
  std::optional<std::string> Get(const std::string& key) override;
  bool Delete(const std::string& key) override;
  void Push(const std::string& list, const std::string& value) override;
  std::optional<std::string> Pop(const std::string& list, std::chrono::milliseconds timeout) override;
  void Close() override;

 private:
  // Runs fn on the (lazily opened) connection; faults drop it and raise util::Unavailable.
  template <typename Fn>
  decltype(auto) WithDb(Fn&& fn);

  std::optional<std::string> TryPop(const std::string& list);

  std::string               path_;
  std::chrono::milliseconds poll_interval_;

  std::mutex                            conn_mutex_;
  std::shared_ptr<db::sqlite::SqliteDB> db_;

  std::mutex              close_mutex_;
  std::condition_variable close_cv_;
  std::atomic<bool>       closed_{false};
};

} // namespace rulebook::queue
