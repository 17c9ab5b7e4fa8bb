#include "ingest_server.hpp"

#include "grpc_error.hpp"

namespace rulebook::grpc {

IngestServer::IngestServer(std::shared_ptr<rulebook::service::IngestService> svc) : service_(std::move(svc)) {
}

::grpc::Status IngestServer::CreateBatch(::grpc::ServerContext*, const rulebook::ingest::v1::CreateBatchRequest* req,
                                         rulebook::ingest::v1::CreateBatchResponse* resp) {
  try {
    *resp = service_->CreateBatch(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status IngestServer::GetBatchStatus(::grpc::ServerContext*, const rulebook::ingest::v1::GetBatchStatusRequest* req,
                                            rulebook::ingest::v1::GetBatchStatusResponse* resp) {
  try {
    *resp = service_->GetBatchStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status IngestServer::RetryBatch(::grpc::ServerContext*, const rulebook::ingest::v1::RetryBatchRequest* req,
                                        rulebook::ingest::v1::RetryBatchResponse* resp) {
  try {
    *resp = service_->RetryBatch(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status IngestServer::GetImageStatus(::grpc::ServerContext*, const rulebook::ingest::v1::GetImageStatusRequest* req,
                                            rulebook::ingest::v1::GetImageStatusResponse* resp) {
  try {
    *resp = service_->GetImageStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status IngestServer::DeleteImage(::grpc::ServerContext*, const rulebook::ingest::v1::DeleteImageRequest* req, google::protobuf::Empty*) {
  try {
    service_->DeleteImage(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace rulebook::grpc
