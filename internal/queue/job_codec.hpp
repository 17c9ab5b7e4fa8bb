#pragma once

#include <string>
#include <string_view>

#include "internal/model/processing_job.hpp"

namespace rulebook::queue {

/*
  Queue payload encoding: ProcessingJob proto as JSON.

  Decode accepts schema_version <= current (missing fields take their
  defaults, unknown fields are ignored) and throws
  util::MalformedPayload for newer versions or unparsable text.
*/
std::string          EncodeJob(const model::ProcessingJob& job);
model::ProcessingJob DecodeJob(std::string_view payload);

} // namespace rulebook::queue
