#pragma once

#include "rulebook/ingest/v1.hpp"
#include "service_context.hpp"

namespace rulebook::service {

class RetrievalService {
 public:
  explicit RetrievalService(ServiceContext ctx);

  // Embedding or text query; the pair must be set.
  rulebook::ingest::v1::SearchResponse Search(const rulebook::ingest::v1::SearchRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace rulebook::service
