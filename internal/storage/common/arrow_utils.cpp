#include "arrow_utils.hpp"

#include <arrow/filesystem/s3fs.h>

namespace rulebook::storage::common {

namespace {

arrow::Status EnsureS3Initialized() {
  if (arrow::fs::IsS3Initialized()) return arrow::Status::OK();
  return arrow::fs::EnsureS3Initialized();
}

} // namespace

arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(const std::string& uri) {
  if (uri.rfind("s3://", 0) == 0) {
    ARROW_RETURN_NOT_OK(EnsureS3Initialized());
  }

  std::string resolved_path;
  ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::FileSystemFromUriOrPath(uri, &resolved_path));
  return std::make_pair(std::move(fs), resolved_path);
}

} // namespace rulebook::storage::common
