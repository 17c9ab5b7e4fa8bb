#pragma once

#include "rulebook/ingest/v1.hpp"
#include "service_context.hpp"

namespace rulebook::service {

class IngestService {
 public:
  explicit IngestService(ServiceContext ctx);

  rulebook::ingest::v1::CreateBatchResponse CreateBatch(const rulebook::ingest::v1::CreateBatchRequest& req);

  rulebook::ingest::v1::GetBatchStatusResponse GetBatchStatus(const rulebook::ingest::v1::GetBatchStatusRequest& req);

  rulebook::ingest::v1::RetryBatchResponse RetryBatch(const rulebook::ingest::v1::RetryBatchRequest& req);

  rulebook::ingest::v1::GetImageStatusResponse GetImageStatus(const rulebook::ingest::v1::GetImageStatusRequest& req);

  void DeleteImage(const rulebook::ingest::v1::DeleteImageRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace rulebook::service
