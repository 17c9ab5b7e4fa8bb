#pragma once

#include <string>

#include "internal/util/errors.hpp"

namespace rulebook::storage::common {

/*
  Reduces a client-supplied filename to its last path component.
  Rejects names that would escape or alias the image directory.
*/
inline std::string SanitizeFilename(const std::string& filename) {
  const auto  slash = filename.find_last_of("/\\");
  std::string base  = slash == std::string::npos ? filename : filename.substr(slash + 1);

  if (base.empty()) {
    throw util::InvalidArgument("filename must not be empty");
  }
  if (base == "." || base == "..") {
    throw util::InvalidArgument("filename must not be a relative path component");
  }
  if (base.find('\0') != std::string::npos) {
    throw util::InvalidArgument("filename contains invalid character");
  }
  return base;
}

// games/{game_id}/images/{image_id}_{filename}
inline std::string ImageObjectKey(const std::string& game_id, const std::string& image_id, const std::string& filename) {
  if (game_id.empty() || game_id.find('/') != std::string::npos || image_id.empty() || image_id.find('/') != std::string::npos) {
    throw util::InvalidArgument("game id and image id must be non-empty path components");
  }
  return "games/" + game_id + "/images/" + image_id + "_" + SanitizeFilename(filename);
}

inline std::string JoinPath(const std::string& root, const std::string& key) {
  if (root.empty()) return key;
  if (root.back() == '/') return root + key;
  return root + "/" + key;
}

} // namespace rulebook::storage::common
