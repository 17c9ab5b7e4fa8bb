#include "job_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"
#include "rulebook/ingest/queue/v1/job.pb.h"

namespace rulebook::queue {

namespace pb = rulebook::ingest::queue::v1;

std::string EncodeJob(const model::ProcessingJob& job) {
  pb::ProcessingJob msg;
  msg.set_schema_version(model::ProcessingJob::kSchemaVersion);
  msg.set_job_id(job.job_id);
  msg.set_image_id(job.image_id);
  msg.set_game_id(job.game_id);
  msg.set_blob_path(job.blob_path);
  msg.set_filename(job.filename);
  if (job.batch_id) msg.set_batch_id(*job.batch_id);
  msg.set_retry_count(job.retry_count);
  msg.set_max_retries(job.max_retries);
  for (const auto& [key, value] : job.metadata) {
    (*msg.mutable_metadata())[key] = value;
  }
  msg.set_created_at_ms(util::ToUnixMillis(job.created_at));
  msg.set_retried_at_ms(util::ToUnixMillis(job.retried_at));

  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(msg, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("failed to encode job " + job.job_id + ": " + std::string(status.message()));
  }
  return json;
}

model::ProcessingJob DecodeJob(std::string_view payload) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  pb::ProcessingJob msg;
  auto              status = google::protobuf::util::JsonStringToMessage(std::string(payload), &msg, options);
  if (!status.ok()) {
    throw util::MalformedPayload("unparsable job payload: " + std::string(status.message()));
  }

  // version 0 is a payload written before the field existed
  if (msg.schema_version() > model::ProcessingJob::kSchemaVersion) {
    throw util::MalformedPayload("unsupported job schema_version " + std::to_string(msg.schema_version()));
  }
  if (msg.job_id().empty() || msg.image_id().empty()) {
    throw util::MalformedPayload("job payload without job_id/image_id");
  }

  model::ProcessingJob job;
  job.schema_version = msg.schema_version();
  job.job_id         = msg.job_id();
  job.image_id       = msg.image_id();
  job.game_id        = msg.game_id();
  job.blob_path      = msg.blob_path();
  job.filename       = msg.filename();
  if (!msg.batch_id().empty()) job.batch_id = msg.batch_id();
  job.retry_count = msg.retry_count();
  job.max_retries = msg.max_retries();
  for (const auto& entry : msg.metadata()) {
    job.metadata[entry.first] = entry.second;
  }
  job.created_at = util::FromUnixMillis(msg.created_at_ms());
  job.retried_at = util::OptionalFromUnixMillis(msg.retried_at_ms());
  return job;
}

} // namespace rulebook::queue
