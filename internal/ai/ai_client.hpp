#pragma once

#include <arrow/buffer.h>

#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "internal/model/game_vector.hpp"

namespace rulebook::ai {

/*
  Outcome of one image analysis.

  Each pair is independent: a disabled or failed extraction leaves it
  empty. success is false only when no enabled extraction could be
  requested at all.
*/
struct AiProcessingResult {
  model::VectorPair ocr;
  model::VectorPair description;
  model::VectorPair labels;

  bool                       success = true;
  std::optional<std::string> error;

  bool HasAnyContent() const {
    return ocr.content.has_value() || description.content.has_value() || labels.content.has_value();
  }
};

class EmbeddingClient {
 public:
  virtual ~EmbeddingClient() = default;

  // Exactly the configured number of components; throws otherwise.
  virtual model::Embedding Embed(const std::string& text) = 0;
};

class AiProcessingClient {
 public:
  virtual ~AiProcessingClient() = default;

  virtual AiProcessingResult Process(const std::shared_ptr<arrow::Buffer>& bytes, const std::string& filename) = 0;

  // (ok, human readable message)
  virtual std::pair<bool, std::string> TestConnection() = 0;
};

} // namespace rulebook::ai
