#include "internal/queue/job_codec.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using rulebook::model::ProcessingJob;
using rulebook::queue::DecodeJob;
using rulebook::queue::EncodeJob;

bool IsMalformed(const std::string& payload) {
  try {
    DecodeJob(payload);
  } catch (const rulebook::util::MalformedPayload&) {
    return true;
  }
  return false;
}

void TestEncodedJobKeepsEveryField() {
  ProcessingJob job;
  job.job_id      = "job_img-1_1700000000.000001";
  job.image_id    = "img-1";
  job.game_id     = "game-1";
  job.blob_path   = "games/game-1/images/img-1_page.png";
  job.filename    = "page.png";
  job.batch_id    = "batch-1";
  job.retry_count = 2;
  job.max_retries = 5;
  job.metadata    = {{"uploaded_by", "user-7"}};
  job.created_at  = rulebook::util::FromUnixMillis(1700000000123);

  const auto decoded = DecodeJob(EncodeJob(job));
  assert(decoded.schema_version == ProcessingJob::kSchemaVersion);
  assert(decoded.job_id == job.job_id);
  assert(decoded.batch_id == job.batch_id);
  assert(decoded.retry_count == 2);
  assert(decoded.max_retries == 5);
  assert(decoded.metadata.at("uploaded_by") == "user-7");
  assert(rulebook::util::ToUnixMillis(decoded.created_at) == 1700000000123);
  assert(!decoded.retried_at.has_value());
}

void TestJobWithoutBatchDecodesWithoutBatch() {
  ProcessingJob job;
  job.job_id   = "job-1";
  job.image_id = "img-1";

  const auto decoded = DecodeJob(EncodeJob(job));
  assert(!decoded.batch_id.has_value());
}

void TestOlderPayloadWithoutVersionDecodesWithDefaults() {
  const auto decoded = DecodeJob(R"({"job_id":"job-1","image_id":"img-1","game_id":"g","unknown_later_field":true})");
  assert(decoded.schema_version == 0);
  assert(decoded.job_id == "job-1");
  assert(decoded.retry_count == 0);
  assert(decoded.metadata.empty());
}

void TestNewerVersionIsRejected() {
  assert(IsMalformed(R"({"schema_version":99,"job_id":"job-1","image_id":"img-1"})"));
}

void TestGarbageAndIncompletePayloadsAreRejected() {
  assert(IsMalformed("not json at all"));
  assert(IsMalformed(R"({"job_id":"job-1"})"));
  assert(IsMalformed(R"({"image_id":"img-1"})"));
}

} // namespace

int main() {
  TestEncodedJobKeepsEveryField();
  TestJobWithoutBatchDecodesWithoutBatch();
  TestOlderPayloadWithoutVersionDecodesWithDefaults();
  TestNewerVersionIsRejected();
  TestGarbageAndIncompletePayloadsAreRejected();

  std::cout << "rulebook_unit_job_codec: pass\n";
  return 0;
}
