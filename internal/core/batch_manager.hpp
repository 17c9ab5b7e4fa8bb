#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/model/game_image.hpp"
#include "internal/model/image_batch.hpp"

namespace rulebook::db {
class Repository;
}
namespace rulebook::queue {
class QueueService;
}
namespace rulebook::storage {
class ObjectStore;
}

namespace rulebook::core {

struct UploadFile {
  std::string                    filename;
  std::shared_ptr<arrow::Buffer> content;
  std::string                    content_type;
};

struct CreateBatchResult {
  std::string              batch_id;
  std::uint32_t            uploaded_count = 0;
  std::vector<std::string> job_ids;
};

struct RetryBatchResult {
  model::ImageBatch        batch;
  std::vector<std::string> job_ids;
};

struct BatchOptions {
  std::uint32_t max_retries     = 3; // batch-level StartRetry budget
  std::uint32_t job_max_retries = 3; // queue-level retries per job
};

// Human readable summary of a batch, one wording per status.
std::string ProgressMessage(const model::ImageBatch& batch);

/*
  BatchManager

  Upload-side use cases. After creation the batch row belongs to the
  ProgressRecorder; this class only reads it, except for RetryBatch.

  CreateBatch:
    1. batch row with total = number of files
    2. per file: object upload + image row; a failing file is excluded
       and its object removed
    3. no survivor -> batch deleted, util::InvalidArgument
     (database writes retry on util::TransactionConflict, so a commit
     race never excludes a file)
    4. one job per image; a failed enqueue leaves last_job_id empty and
       the reconciliation sweeper picks the image up later
*/
class BatchManager {
 public:
  BatchManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<storage::ObjectStore> objects,
               std::shared_ptr<queue::QueueService> queue, BatchOptions options);

  CreateBatchResult CreateBatch(const std::string& game_id, const std::string& uploader_id, const std::vector<UploadFile>& files);

  model::ImageBatch GetBatch(const std::string& batch_id);

  // Requires CanRetry(); moves FAILED images to RETRYING and re-enqueues them.
  RetryBatchResult RetryBatch(const std::string& batch_id);

  model::GameImage GetImage(const std::string& image_id);

  // Deletes the row (vectors cascade) and then the stored object. An
  // image still waiting for an outcome is taken out of its batch total.
  void DeleteImage(const std::string& image_id);

  // Enqueues a fresh job for the image and records its id on the row.
  std::string EnqueueImage(const model::GameImage& image);

 private:
  std::shared_ptr<db::Repository>       repository_;
  std::shared_ptr<storage::ObjectStore> objects_;
  std::shared_ptr<queue::QueueService>  queue_;
  BatchOptions                          options_;
};

} // namespace rulebook::core
