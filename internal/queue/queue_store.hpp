#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace rulebook::queue {

/*
  QueueStore

  Minimal key/value + list primitives the job queue is built on.

  - Put/Get/Delete: records expire after their TTL
  - Push appends to the tail of a named list, Pop removes from its head
  - Pop blocks up to `timeout`; an empty list is std::nullopt, never an error
  - Pop is atomic across concurrent consumers (each value is delivered once)
  - Connectivity faults raise util::Unavailable; the next call reconnects
  - After Close(), Pop returns std::nullopt immediately
*/
class QueueStore {
 public:
  virtual ~QueueStore() = default;

  virtual void Put(const std::string& key, const std::string& value, std::chrono::seconds ttl) = 0;

  virtual std::optional<std::string> Get(const std::string& key) = 0;

  // false if the key did not exist
  virtual bool Delete(const std::string& key) = 0;

  virtual void Push(const std::string& list, const std::string& value) = 0;

  virtual std::optional<std::string> Pop(const std::string& list, std::chrono::milliseconds timeout) = 0;

  virtual void Close() = 0;
};

} // namespace rulebook::queue
