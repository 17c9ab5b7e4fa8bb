#include "retrieval_engine.hpp"

#include <cmath>
#include <stdexcept>

#include "internal/ai/ai_client.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace rulebook::core {

RetrievalEngine::RetrievalEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<ai::EmbeddingClient> embeddings,
                                 std::uint32_t dimensions)
    : repository_(std::move(repository)), embeddings_(std::move(embeddings)), dimensions_(dimensions) {
  if (!repository_) throw std::invalid_argument("RetrievalEngine: repository is null");
  if (dimensions_ == 0) throw std::invalid_argument("RetrievalEngine: dimensions must be positive");
}

void RetrievalEngine::Validate(const std::string& game_id, std::size_t limit, double threshold) const {
  if (game_id.empty()) throw util::InvalidArgument("search: game_id is required");
  if (limit < 1 || limit > kMaxLimit) {
    throw util::InvalidArgument("search: limit must be between 1 and " + std::to_string(kMaxLimit) + ", got " + std::to_string(limit));
  }
  if (!std::isfinite(threshold) || threshold < 0.0 || threshold > 1.0) {
    throw util::InvalidArgument("search: threshold must be between 0 and 1");
  }
}

std::vector<model::ScoredVector> RetrievalEngine::Search(const std::string& game_id, const model::Embedding& query, model::SearchPair pair,
                                                         std::size_t limit, double threshold) {
  Validate(game_id, limit, threshold);
  if (query.size() != dimensions_) {
    throw util::DimensionMismatch("search: query has " + std::to_string(query.size()) + " components, expected " + std::to_string(dimensions_));
  }

  observability::SpanScope span("RetrievalEngine.Search");
  span.SetAttribute("game.id", game_id);
  span.SetAttribute("search.pair", model::ToString(pair));

  auto tx   = repository_->Begin();
  auto hits = repository_->SearchVectors(*tx, game_id, query, pair, limit, threshold);
  tx->Commit();

  span.SetAttribute("search.hits", static_cast<std::int64_t>(hits.size()));
  return hits;
}

std::vector<model::ScoredVector> RetrievalEngine::SearchText(const std::string& game_id, const std::string& text, model::SearchPair pair,
                                                             std::size_t limit, double threshold) {
  Validate(game_id, limit, threshold);
  if (text.empty()) throw util::InvalidArgument("search: query text is empty");
  if (!embeddings_) throw util::InvalidState("search: text queries need an embedding client");

  return Search(game_id, embeddings_->Embed(text), pair, limit, threshold);
}

} // namespace rulebook::core
