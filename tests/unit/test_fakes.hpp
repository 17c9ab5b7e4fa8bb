#pragma once

#include <arrow/buffer.h>

#include <atomic>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>

#include "internal/ai/ai_client.hpp"
#include "internal/storage/object_store.hpp"
#include "internal/util/errors.hpp"

namespace rulebook::testing {

/*
  In-process object store. Filenames listed in `rejected` fail the
  upload the way an unreachable bucket would.
*/
class FakeObjectStore final : public storage::ObjectStore {
 public:
  std::set<std::string> rejected;

  storage::StoredObject Upload(const std::string& game_id, const std::string& image_id, const std::shared_ptr<arrow::Buffer>& bytes,
                               const std::string& filename, const std::string&) override {
    if (rejected.count(filename) > 0) throw std::runtime_error("upload refused: " + filename);

    storage::StoredObject stored;
    stored.path = "games/" + game_id + "/images/" + image_id + "_" + filename;
    stored.url  = "mem://" + stored.path;

    std::lock_guard<std::mutex> lock(mutex_);
    objects_[stored.path] = bytes->ToString();
    return stored;
  }

  std::shared_ptr<arrow::Buffer> Download(const std::string& path) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = objects_.find(path);
    if (it == objects_.end()) throw util::NotFound("object not found: " + path);
    return arrow::Buffer::FromString(it->second);
  }

  bool Delete(const std::string& path) override {
    std::lock_guard<std::mutex> lock(mutex_);
    return objects_.erase(path) > 0;
  }

  std::size_t Size() {
    std::lock_guard<std::mutex> lock(mutex_);
    return objects_.size();
  }

  bool Contains(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    return objects_.count(path) > 0;
  }

 private:
  std::mutex                         mutex_;
  std::map<std::string, std::string> objects_;
};

// One-hot embedding along `axis`.
inline model::Embedding UnitEmbedding(std::size_t dimensions, std::size_t axis) {
  model::Embedding out(dimensions, 0.0f);
  out[axis % dimensions] = 1.0f;
  return out;
}

/*
  Deterministic AI client. Files whose content was marked with
  SetFailing() make Process() throw; every other file yields OCR text and labels.
*/
class FakeAiClient final : public ai::AiProcessingClient, public ai::EmbeddingClient {
 public:
  explicit FakeAiClient(std::size_t dimensions) : dimensions_(dimensions) {}

  bool                  extract_nothing = false;
  std::atomic<int>      calls{0};

  ai::AiProcessingResult Process(const std::shared_ptr<arrow::Buffer>& bytes, const std::string& filename) override {
    ++calls;
    const auto content = bytes->ToString();
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (failing_.count(content) > 0) throw std::runtime_error("vision model rejected " + filename);
    }

    ai::AiProcessingResult result;
    if (extract_nothing) return result;

    result.ocr.content      = "text of " + filename;
    result.ocr.embedding    = UnitEmbedding(dimensions_, 0);
    result.labels.content   = "labels of " + filename;
    result.labels.embedding = UnitEmbedding(dimensions_, 1);
    return result;
  }

  std::pair<bool, std::string> TestConnection() override {
    return {true, "ok"};
  }

  model::Embedding Embed(const std::string& text) override {
    return UnitEmbedding(dimensions_, text.size());
  }

  void SetFailing(const std::string& content, bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail) {
      failing_.insert(content);
    } else {
      failing_.erase(content);
    }
  }

 private:
  std::size_t           dimensions_;
  std::mutex            mutex_;
  std::set<std::string> failing_;
};

} // namespace rulebook::testing
