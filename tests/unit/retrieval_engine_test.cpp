#include "internal/core/retrieval_engine.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "test_fakes.hpp"

namespace {

using rulebook::core::RetrievalEngine;
using rulebook::model::SearchPair;
using rulebook::testing::UnitEmbedding;

constexpr std::uint32_t kDims = 4;

struct Fixture {
  std::shared_ptr<rulebook::db::memory::MemoryRepository> repo = std::make_shared<rulebook::db::memory::MemoryRepository>();
  std::shared_ptr<rulebook::testing::FakeAiClient>        ai   = std::make_shared<rulebook::testing::FakeAiClient>(kDims);
  RetrievalEngine                                         engine{repo, ai, kDims};

  void AddRow(const std::string& id, const std::string& game_id, rulebook::model::GameVector vector) {
    rulebook::model::GameImage image;
    image.id         = "img-" + id;
    image.game_id    = game_id;
    image.created_at = rulebook::util::Now();
    image.updated_at = image.created_at;

    vector.id       = "vec-" + id;
    vector.game_id  = game_id;
    vector.image_id = image.id;

    auto tx = repo->Begin();
    rulebook::db::ThrowIfError(repo->InsertImage(*tx, image), "insert image");
    rulebook::db::ThrowIfError(repo->InsertVector(*tx, vector), "insert vector");
    tx->Commit();
  }
};

template <typename Fn>
bool ThrowsInvalidArgument(Fn&& fn) {
  try {
    fn();
  } catch (const rulebook::util::InvalidArgument&) {
    return true;
  }
  return false;
}

void TestLabelsOnlyRowIsInvisibleToOtherPairs() {
  Fixture f;
  rulebook::model::GameVector row;
  row.labels.content   = "card token dice";
  row.labels.embedding = UnitEmbedding(kDims, 2);
  f.AddRow("labels-only", "game-1", row);

  assert(f.engine.Search("game-1", UnitEmbedding(kDims, 2), SearchPair::kOcr, 10, 0.0).empty());
  assert(f.engine.Search("game-1", UnitEmbedding(kDims, 2), SearchPair::kDescription, 10, 0.0).empty());

  auto hits = f.engine.Search("game-1", UnitEmbedding(kDims, 2), SearchPair::kLabels, 10, 0.0);
  assert(hits.size() == 1);
  assert(hits[0].vector.labels.content == std::optional<std::string>("card token dice"));
  assert(!hits[0].vector.ocr.content.has_value());
  assert(!hits[0].vector.description.content.has_value());
}

void TestHitCarriesEveryContentOfItsRow() {
  Fixture f;
  rulebook::model::GameVector row;
  row.ocr.content           = "Setup: shuffle the deck";
  row.ocr.embedding         = UnitEmbedding(kDims, 0);
  row.description.content   = "A page with a diagram";
  row.description.embedding = UnitEmbedding(kDims, 1);
  row.labels.content        = "deck setup";
  f.AddRow("full", "game-1", row);

  auto hits = f.engine.Search("game-1", UnitEmbedding(kDims, 1), SearchPair::kDescription, 10, 0.5);
  assert(hits.size() == 1);
  assert(std::abs(hits[0].similarity_score - 1.0) < 1e-6);
  assert(hits[0].vector.ocr.content == std::optional<std::string>("Setup: shuffle the deck"));
  assert(hits[0].vector.labels.content == std::optional<std::string>("deck setup"));
  assert(!hits[0].vector.labels.embedding.has_value());
}

void TestRankingThresholdLimitAndGameScope() {
  Fixture f;
  for (int i = 0; i < 3; ++i) {
    rulebook::model::GameVector row;
    row.ocr.content   = "page " + std::to_string(i);
    row.ocr.embedding = rulebook::model::Embedding{1.0f, static_cast<float>(i), 0.0f, 0.0f};
    f.AddRow("g1-" + std::to_string(i), "game-1", row);
  }
  rulebook::model::GameVector other;
  other.ocr.content   = "other game";
  other.ocr.embedding = UnitEmbedding(kDims, 0);
  f.AddRow("g2", "game-2", other);

  const auto query = UnitEmbedding(kDims, 0);

  auto all = f.engine.Search("game-1", query, SearchPair::kOcr, 10, 0.0);
  assert(all.size() == 3);
  assert(all[0].vector.ocr.content == std::optional<std::string>("page 0"));
  assert(all[1].similarity_score >= all[2].similarity_score);

  auto top = f.engine.Search("game-1", query, SearchPair::kOcr, 1, 0.0);
  assert(top.size() == 1);
  assert(top[0].vector.ocr.content == std::optional<std::string>("page 0"));

  // cos(page 1) ~ 0.707, cos(page 2) ~ 0.447
  auto close = f.engine.Search("game-1", query, SearchPair::kOcr, 10, 0.6);
  assert(close.size() == 2);
}

void TestInvalidRequestsFailBeforeQuerying() {
  Fixture    f;
  const auto query = UnitEmbedding(kDims, 0);

  assert(ThrowsInvalidArgument([&] { rulebook::model::ParseSearchPair("unsupported"); }));
  assert(rulebook::model::ParseSearchPair("labels") == SearchPair::kLabels);

  assert(ThrowsInvalidArgument([&] { f.engine.Search("", query, SearchPair::kOcr, 10, 0.5); }));
  assert(ThrowsInvalidArgument([&] { f.engine.Search("game-1", query, SearchPair::kOcr, 0, 0.5); }));
  assert(ThrowsInvalidArgument([&] { f.engine.Search("game-1", query, SearchPair::kOcr, RetrievalEngine::kMaxLimit + 1, 0.5); }));
  assert(ThrowsInvalidArgument([&] { f.engine.Search("game-1", query, SearchPair::kOcr, 10, 1.5); }));
  assert(ThrowsInvalidArgument([&] { f.engine.Search("game-1", query, SearchPair::kOcr, 10, -0.1); }));
  assert(ThrowsInvalidArgument([&] { f.engine.Search("game-1", query, SearchPair::kOcr, 10, std::numeric_limits<double>::quiet_NaN()); }));

  bool mismatch = false;
  try {
    f.engine.Search("game-1", rulebook::model::Embedding{1.0f, 0.0f}, SearchPair::kOcr, 10, 0.5);
  } catch (const rulebook::util::DimensionMismatch&) {
    mismatch = true;
  }
  assert(mismatch);
}

void TestTextSearchEmbedsTheQuery() {
  Fixture f;
  rulebook::model::GameVector row;
  row.ocr.content   = "scoring";
  row.ocr.embedding = UnitEmbedding(kDims, 3);
  f.AddRow("text", "game-1", row);

  // the fake embeds a text along the axis of its length
  auto hits = f.engine.SearchText("game-1", "abc", SearchPair::kOcr, 5, 0.9);
  assert(hits.size() == 1);
  assert(hits[0].vector.ocr.content == std::optional<std::string>("scoring"));

  RetrievalEngine no_embeddings(f.repo, nullptr, kDims);
  bool            refused = false;
  try {
    no_embeddings.SearchText("game-1", "abc", SearchPair::kOcr, 5, 0.9);
  } catch (const rulebook::util::InvalidState&) {
    refused = true;
  }
  assert(refused);
}

} // namespace

int main() {
  TestLabelsOnlyRowIsInvisibleToOtherPairs();
  TestHitCarriesEveryContentOfItsRow();
  TestRankingThresholdLimitAndGameScope();
  TestInvalidRequestsFailBeforeQuerying();
  TestTextSearchEmbedsTheQuery();

  std::cout << "rulebook_unit_retrieval_engine: pass\n";
  return 0;
}
