#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>

#include "queue_store.hpp"

namespace pqxx {
class connection;
}

namespace rulebook::queue {

/*
  Durable store in PostgreSQL.

  Pop deletes the head row with FOR UPDATE SKIP LOCKED, so any number
  of consumers (in any process) can pop the same list concurrently.
*/
class PgQueueStore final : public QueueStore {
 public:
  explicit PgQueueStore(std::string conninfo, std::chrono::milliseconds poll_interval = std::chrono::milliseconds(100));
  ~PgQueueStore();

  void Put(const std::string& key, const std::string& value, std::chrono::seconds ttl) override;
  std::optional<std::string> Get(const std::string& key) override;
  bool Delete(const std::string& key) override;
  void Push(const std::string& list, const std::string& value) override;
  std::optional<std::string> Pop(const std::string& list, std::chrono::milliseconds timeout) override;
  void Close() override;

 private:
  // Runs fn on the (lazily opened) connection; a broken connection is dropped and raises util::Unavailable.
  template <typename Fn>
  decltype(auto) WithConnection(Fn&& fn);

  std::string               conninfo_;
  std::chrono::milliseconds poll_interval_;

  std::mutex                        conn_mutex_;
  std::unique_ptr<pqxx::connection> conn_;

  std::mutex              close_mutex_;
  std::condition_variable close_cv_;
  std::atomic<bool>       closed_{false};
};

} // namespace rulebook::queue
