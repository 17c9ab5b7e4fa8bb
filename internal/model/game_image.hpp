#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/util/time.hpp"

namespace rulebook::model {

enum class ImageStatus : std::uint8_t {
  kUploaded   = 1,
  kProcessing = 2,
  kCompleted  = 3,
  kFailed     = 4,
  kRetrying   = 5,
};

std::string_view           ToString(ImageStatus status);
std::optional<ImageStatus> ImageStatusFromString(std::string_view value);

struct GameImage {
  std::string   id;
  std::string   game_id;
  std::string   file_path;
  std::string   blob_url;
  std::string   original_filename;
  std::uint64_t file_size = 0;
  std::string   uploaded_by;

  ImageStatus                processing_status = ImageStatus::kUploaded;
  std::optional<std::string> processing_error;
  std::uint32_t              retry_count = 0;

  // non-owning back reference
  std::optional<std::string> batch_id;

  // most recent queue job; empty until the first enqueue succeeds
  std::string last_job_id;

  util::TimePoint                created_at{};
  util::TimePoint                updated_at{};
  std::optional<util::TimePoint> processing_started_at;
  std::optional<util::TimePoint> processing_completed_at;
};

} // namespace rulebook::model
