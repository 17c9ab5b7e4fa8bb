#include "internal/model/game_image.hpp"

namespace rulebook::model {

std::string_view ToString(ImageStatus status) {
  switch (status) {
    case ImageStatus::kUploaded:
      return "uploaded";
    case ImageStatus::kProcessing:
      return "processing";
    case ImageStatus::kCompleted:
      return "completed";
    case ImageStatus::kFailed:
      return "failed";
    case ImageStatus::kRetrying:
      return "retrying";
  }
  return "unknown";
}

std::optional<ImageStatus> ImageStatusFromString(std::string_view value) {
  for (auto status : {ImageStatus::kUploaded, ImageStatus::kProcessing, ImageStatus::kCompleted, ImageStatus::kFailed, ImageStatus::kRetrying}) {
    if (ToString(status) == value) {
      return status;
    }
  }
  return std::nullopt;
}

} // namespace rulebook::model
