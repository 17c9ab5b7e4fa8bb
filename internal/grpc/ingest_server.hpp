#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/ingest_service.hpp"
#include "rulebook/ingest/v1.hpp"

namespace rulebook::grpc {

class IngestServer final : public rulebook::ingest::v1::IngestService::Service {
 public:
  explicit IngestServer(std::shared_ptr<rulebook::service::IngestService> svc);

  ::grpc::Status CreateBatch(::grpc::ServerContext*, const rulebook::ingest::v1::CreateBatchRequest*,
                             rulebook::ingest::v1::CreateBatchResponse*) override;

  ::grpc::Status GetBatchStatus(::grpc::ServerContext*, const rulebook::ingest::v1::GetBatchStatusRequest*,
                                rulebook::ingest::v1::GetBatchStatusResponse*) override;

  ::grpc::Status RetryBatch(::grpc::ServerContext*, const rulebook::ingest::v1::RetryBatchRequest*,
                            rulebook::ingest::v1::RetryBatchResponse*) override;

  ::grpc::Status GetImageStatus(::grpc::ServerContext*, const rulebook::ingest::v1::GetImageStatusRequest*,
                                rulebook::ingest::v1::GetImageStatusResponse*) override;

  ::grpc::Status DeleteImage(::grpc::ServerContext*, const rulebook::ingest::v1::DeleteImageRequest*, google::protobuf::Empty*) override;

 private:
  std::shared_ptr<rulebook::service::IngestService> service_;
};

} // namespace rulebook::grpc
