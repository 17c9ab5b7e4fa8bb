#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <unordered_map>

#include "queue_store.hpp"

namespace rulebook::queue {

/*
  Process-local store. Nothing survives a restart.
*/
class MemoryQueueStore final : public QueueStore {
 public:
  void Put(const std::string& key, const std::string& value, std::chrono::seconds ttl) override;
  std::optional<std::string> Get(const std::string& key) override;
  bool Delete(const std::string& key) override;
  void Push(const std::string& list, const std::string& value) override;
  std::optional<std::string> Pop(const std::string& list, std::chrono::milliseconds timeout) override;
  void Close() override;

  // Stored key/value records, expired ones included until the next Put.
  std::size_t RecordCount();

 private:
  struct Record {
    std::string                           value;
    std::chrono::steady_clock::time_point expires_at;
  };

  std::mutex                                               mutex_;
  std::condition_variable                                  cv_;
  std::unordered_map<std::string, Record>                  records_;
  std::unordered_map<std::string, std::deque<std::string>> lists_;
  bool                                                     closed_ = false;
};

} // namespace rulebook::queue
