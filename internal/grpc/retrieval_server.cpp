#include "retrieval_server.hpp"

#include "grpc_error.hpp"

namespace rulebook::grpc {

RetrievalServer::RetrievalServer(std::shared_ptr<rulebook::service::RetrievalService> svc) : service_(std::move(svc)) {
}

::grpc::Status RetrievalServer::Search(::grpc::ServerContext*, const rulebook::ingest::v1::SearchRequest* req,
                                       rulebook::ingest::v1::SearchResponse* resp) {
  try {
    *resp = service_->Search(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace rulebook::grpc
