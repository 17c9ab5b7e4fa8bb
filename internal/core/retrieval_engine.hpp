#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/model/game_vector.hpp"
#include "internal/model/search_pair.hpp"

namespace rulebook::db {
class Repository;
}
namespace rulebook::ai {
class EmbeddingClient;
}

namespace rulebook::core {

/*
  Decoupled multi-modal retrieval.

  `pair` decides which embedding ranks the rows; every hit carries all
  of its row's contents regardless. Rows without the selected embedding
  are left out, not scored as zero.

  Validation happens before any query:
    limit      in [1, kMaxLimit]
    threshold  in [0, 1]
    query      exactly `dimensions` components (util::DimensionMismatch)
*/
class RetrievalEngine {
 public:
  static constexpr std::size_t kMaxLimit = 100;

  RetrievalEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<ai::EmbeddingClient> embeddings, std::uint32_t dimensions);

  std::vector<model::ScoredVector> Search(const std::string& game_id, const model::Embedding& query, model::SearchPair pair, std::size_t limit,
                                          double threshold);

  // Embeds the text first; needs an embedding client.
  std::vector<model::ScoredVector> SearchText(const std::string& game_id, const std::string& text, model::SearchPair pair, std::size_t limit,
                                              double threshold);

 private:
  void Validate(const std::string& game_id, std::size_t limit, double threshold) const;

  std::shared_ptr<db::Repository>      repository_;
  std::shared_ptr<ai::EmbeddingClient> embeddings_;
  std::uint32_t                        dimensions_;
};

} // namespace rulebook::core
