#include "memory_queue_store.hpp"

#include "internal/util/errors.hpp"

namespace rulebook::queue {

void MemoryQueueStore::Put(const std::string& key, const std::string& value, std::chrono::seconds ttl) {
  std::lock_guard lock(mutex_);
  if (closed_) throw util::Unavailable("queue store closed");

  // Most records are never read again once their job ends; expiry is
  // enforced here rather than on lookup alone.
  const auto now = std::chrono::steady_clock::now();
  std::erase_if(records_, [&](const auto& entry) { return entry.second.expires_at <= now; });

  records_[key] = Record{value, now + ttl};
}

std::optional<std::string> MemoryQueueStore::Get(const std::string& key) {
  std::lock_guard lock(mutex_);
  if (closed_) throw util::Unavailable("queue store closed");

  auto it = records_.find(key);
  if (it == records_.end()) return std::nullopt;
  if (it->second.expires_at <= std::chrono::steady_clock::now()) {
    records_.erase(it);
    return std::nullopt;
  }
  return it->second.value;
}

bool MemoryQueueStore::Delete(const std::string& key) {
  std::lock_guard lock(mutex_);
  if (closed_) throw util::Unavailable("queue store closed");
  return records_.erase(key) > 0;
}

std::size_t MemoryQueueStore::RecordCount() {
  std::lock_guard lock(mutex_);
  return records_.size();
}

void MemoryQueueStore::Push(const std::string& list, const std::string& value) {
  {
    std::lock_guard lock(mutex_);
    if (closed_) throw util::Unavailable("queue store closed");
    lists_[list].push_back(value);
  }
  cv_.notify_one();
}

std::optional<std::string> MemoryQueueStore::Pop(const std::string& list, std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);

  const bool ready = cv_.wait_for(lock, timeout, [&] {
    if (closed_) return true;
    auto it = lists_.find(list);
    return it != lists_.end() && !it->second.empty();
  });
  if (!ready || closed_) return std::nullopt;

  auto&       items = lists_[list];
  std::string value = std::move(items.front());
  items.pop_front();
  return value;
}

void MemoryQueueStore::Close() {
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

} // namespace rulebook::queue
