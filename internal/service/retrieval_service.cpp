#include "retrieval_service.hpp"

#include "internal/core/retrieval_engine.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"

namespace rulebook::service {

using namespace rulebook::ingest::v1;

namespace {

model::SearchPair FromProto(rulebook::ingest::v1::SearchPair pair) {
  switch (pair) {
    case SEARCH_PAIR_OCR:
      return model::SearchPair::kOcr;
    case SEARCH_PAIR_DESCRIPTION:
      return model::SearchPair::kDescription;
    case SEARCH_PAIR_LABELS:
      return model::SearchPair::kLabels;
    default:
      throw util::InvalidArgument("search: pair must be one of ocr, description, labels");
  }
}

} // namespace

RetrievalService::RetrievalService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

SearchResponse RetrievalService::Search(const SearchRequest& req) {
  return ObserveRpc("RetrievalService.Search", "game.id", req.game_id(), [&] {
    const auto pair = FromProto(req.pair());

    std::vector<model::ScoredVector> hits;
    switch (req.query_case()) {
      case SearchRequest::kEmbedding: {
        const model::Embedding query(req.embedding().values().begin(), req.embedding().values().end());
        hits = ctx_.retrieval->Search(req.game_id(), query, pair, req.limit(), req.threshold());
        break;
      }
      case SearchRequest::kText:
        hits = ctx_.retrieval->SearchText(req.game_id(), req.text(), pair, req.limit(), req.threshold());
        break;
      default:
        throw util::InvalidArgument("search: embedding or text query is required");
    }

    SearchResponse resp;
    for (const auto& scored : hits) {
      auto* hit = resp.add_hits();
      hit->set_vector_id(scored.vector.id);
      hit->set_game_id(scored.vector.game_id);
      hit->set_image_id(scored.vector.image_id);
      hit->set_page_number(scored.vector.page_number);
      if (scored.vector.ocr.content) hit->set_ocr_content(*scored.vector.ocr.content);
      if (scored.vector.description.content) hit->set_description_content(*scored.vector.description.content);
      if (scored.vector.labels.content) hit->set_labels_content(*scored.vector.labels.content);
      hit->set_similarity_score(scored.similarity_score);
    }
    return resp;
  });
}

} // namespace rulebook::service
