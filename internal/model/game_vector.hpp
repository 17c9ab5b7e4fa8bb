#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/search_pair.hpp"
#include "internal/util/time.hpp"

namespace rulebook::model {

using Embedding = std::vector<float>;

struct VectorPair {
  std::optional<std::string> content;
  std::optional<Embedding>   embedding;
};

/*
  GameVector

  One row per processed image holding up to three independent pairs.
  Any subset may be populated.
*/
struct GameVector {
  std::string  id;
  std::string  game_id;
  std::string  image_id;
  std::int32_t page_number = 0;

  VectorPair ocr;
  VectorPair description;
  VectorPair labels;

  util::TimePoint created_at{};

  const VectorPair& Pair(SearchPair pair) const {
    switch (pair) {
      case SearchPair::kOcr:
        return ocr;
      case SearchPair::kDescription:
        return description;
      case SearchPair::kLabels:
        return labels;
    }
    return ocr;
  }

  bool HasAnyEmbedding() const {
    return ocr.embedding.has_value() || description.embedding.has_value() || labels.embedding.has_value();
  }
};

// Query-time result; the score is never persisted.
struct ScoredVector {
  GameVector vector;
  double     similarity_score = 0.0;
};

} // namespace rulebook::model
