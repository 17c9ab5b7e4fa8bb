#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "internal/util/time.hpp"

namespace rulebook::model {

/*
  ProcessingJob

  Immutable descriptor of one queued image. The queue keeps it as a
  versioned payload; older versions decode with defaults for fields
  they did not carry.
*/
struct ProcessingJob {
  static constexpr std::uint32_t kSchemaVersion = 1;

  std::uint32_t schema_version = kSchemaVersion;

  std::string                job_id;
  std::string                image_id;
  std::string                game_id;
  std::string                blob_path;
  std::string                filename;
  std::optional<std::string> batch_id;

  std::uint32_t retry_count = 0;
  std::uint32_t max_retries = 3;

  std::map<std::string, std::string> metadata;

  util::TimePoint                created_at{};
  std::optional<util::TimePoint> retried_at;
};

enum class JobStatus : std::uint8_t {
  kQueued,
  kProcessing,
  kCompleted,
  kFailed,
  kRetrying,
};

std::string_view         ToString(JobStatus status);
std::optional<JobStatus> JobStatusFromString(std::string_view value);

} // namespace rulebook::model
