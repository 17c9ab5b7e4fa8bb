#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "internal/model/game_vector.hpp"
#include "internal/model/search_pair.hpp"

namespace rulebook::db::common {

/*
  In-process cosine ranking shared by backends without a native vector
  index (memory, SQLite).
*/

// Throws util::DimensionMismatch if the lengths differ. Zero vectors score 0.
double CosineSimilarity(const model::Embedding& a, const model::Embedding& b);

// 1 - cosine distance, clamped to [0, 1].
double ClampScore(double similarity);

// Ranks candidates of one game on `pair`, dropping rows without that
// embedding, filtering by threshold, best first, at most `limit` rows.
std::vector<model::ScoredVector> RankVectors(std::vector<model::GameVector> candidates, const model::Embedding& query, model::SearchPair pair,
                                             std::size_t limit, double threshold);

} // namespace rulebook::db::common
