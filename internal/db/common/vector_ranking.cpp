#include "internal/db/common/vector_ranking.hpp"

#include <algorithm>
#include <cmath>

#include "internal/util/errors.hpp"

namespace rulebook::db::common {

double CosineSimilarity(const model::Embedding& a, const model::Embedding& b) {
  if (a.size() != b.size()) {
    throw util::DimensionMismatch("embedding dimension mismatch: query has " + std::to_string(a.size()) + ", stored vector has " +
                                  std::to_string(b.size()));
  }

  double dot    = 0.0;
  double norm_a = 0.0;
  double norm_b = 0.0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    dot += static_cast<double>(a[i]) * static_cast<double>(b[i]);
    norm_a += static_cast<double>(a[i]) * static_cast<double>(a[i]);
    norm_b += static_cast<double>(b[i]) * static_cast<double>(b[i]);
  }

  if (norm_a == 0.0 || norm_b == 0.0) {
    return 0.0;
  }
  return dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
}

double ClampScore(double similarity) {
  if (std::isnan(similarity)) return 0.0;
  return std::clamp(similarity, 0.0, 1.0);
}

std::vector<model::ScoredVector> RankVectors(std::vector<model::GameVector> candidates, const model::Embedding& query, model::SearchPair pair,
                                             std::size_t limit, double threshold) {
  std::vector<model::ScoredVector> scored;
  scored.reserve(candidates.size());

  for (auto& candidate : candidates) {
    const auto& selected = candidate.Pair(pair);
    if (!selected.embedding) {
      continue;
    }

    const double score = ClampScore(CosineSimilarity(query, *selected.embedding));
    if (score < threshold) {
      continue;
    }
    scored.push_back(model::ScoredVector{std::move(candidate), score});
  }

  std::stable_sort(scored.begin(), scored.end(), [](const auto& lhs, const auto& rhs) { return lhs.similarity_score > rhs.similarity_score; });
  if (scored.size() > limit) {
    scored.resize(limit);
  }
  return scored;
}

} // namespace rulebook::db::common
