#include "internal/model/processing_job.hpp"

namespace rulebook::model {

std::string_view ToString(JobStatus status) {
  switch (status) {
    case JobStatus::kQueued:
      return "queued";
    case JobStatus::kProcessing:
      return "processing";
    case JobStatus::kCompleted:
      return "completed";
    case JobStatus::kFailed:
      return "failed";
    case JobStatus::kRetrying:
      return "retrying";
  }
  return "unknown";
}

std::optional<JobStatus> JobStatusFromString(std::string_view value) {
  for (auto status : {JobStatus::kQueued, JobStatus::kProcessing, JobStatus::kCompleted, JobStatus::kFailed, JobStatus::kRetrying}) {
    if (ToString(status) == value) {
      return status;
    }
  }
  return std::nullopt;
}

} // namespace rulebook::model
