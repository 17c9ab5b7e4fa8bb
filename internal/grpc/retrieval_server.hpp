#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/retrieval_service.hpp"
#include "rulebook/ingest/v1.hpp"

namespace rulebook::grpc {

class RetrievalServer final : public rulebook::ingest::v1::RetrievalService::Service {
 public:
  explicit RetrievalServer(std::shared_ptr<rulebook::service::RetrievalService> svc);

  ::grpc::Status Search(::grpc::ServerContext*, const rulebook::ingest::v1::SearchRequest*, rulebook::ingest::v1::SearchResponse*) override;

 private:
  std::shared_ptr<rulebook::service::RetrievalService> service_;
};

} // namespace rulebook::grpc
