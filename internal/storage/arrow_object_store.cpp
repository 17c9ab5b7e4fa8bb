#include "arrow_object_store.hpp"

#include <arrow/io/interfaces.h>
#include <arrow/result.h>
#include <arrow/util/key_value_metadata.h>

#include <algorithm>

#include "config/config.pb.h"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace rulebook::storage {

using namespace rulebook::storage::common;

ArrowObjectStore::ArrowObjectStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path, std::string url_base)
    : fs_(std::move(fs)), root_path_(std::move(root_path)), url_base_(std::move(url_base)) {
  if (!fs_) throw std::invalid_argument("ArrowObjectStore: filesystem is null");
}

std::shared_ptr<ArrowObjectStore> ArrowObjectStore::Make(const runtime::config::ObjectStoreConfig& config) {
  auto [fs, root_path] = Unwrap(ResolveFileSystem(config.root_uri()));

  if (fs->type_name() == "local") {
    Unwrap(fs->CreateDir(root_path, /*recursive=*/true));
  }

  std::string url_base = config.public_base_url().empty() ? config.root_uri() : config.public_base_url();
  return std::make_shared<ArrowObjectStore>(std::move(fs), std::move(root_path), std::move(url_base));
}

std::string ArrowObjectStore::FullPath(const std::string& path) const {
  if (path.empty() || path.front() == '/') {
    throw util::InvalidArgument("invalid object path '" + path + "'");
  }
  std::size_t start = 0;
  while (start <= path.size()) {
    const auto end       = std::min(path.find('/', start), path.size());
    const auto component = path.substr(start, end - start);
    if (component.empty() || component == "." || component == "..") {
      throw util::InvalidArgument("invalid object path '" + path + "'");
    }
    start = end + 1;
  }
  return JoinPath(root_path_, path);
}

/*
  Upload buffer as object.

  The local filesystem needs the parent directory to exist; object
  stores have no directories.
*/
StoredObject ArrowObjectStore::Upload(const std::string& game_id, const std::string& image_id, const std::shared_ptr<arrow::Buffer>& bytes,
                                      const std::string& filename, const std::string& content_type) {
  StoredObject stored;
  stored.path = ImageObjectKey(game_id, image_id, filename);
  stored.url  = JoinPath(url_base_, stored.path);

  const auto full_path = FullPath(stored.path);
  if (fs_->type_name() == "local") {
    Unwrap(fs_->CreateDir(full_path.substr(0, full_path.find_last_of('/')), /*recursive=*/true));
  }

  std::shared_ptr<const arrow::KeyValueMetadata> metadata;
  if (!content_type.empty()) {
    metadata = arrow::key_value_metadata({"Content-Type"}, {content_type});
  }

  auto out = Unwrap(fs_->OpenOutputStream(full_path, metadata));
  Unwrap(out->Write(bytes->data(), bytes->size()));
  Unwrap(out->Close());
  return stored;
}

/*
  Download full object
*/
std::shared_ptr<arrow::Buffer> ArrowObjectStore::Download(const std::string& path) {
  const auto full_path = FullPath(path);
  auto       info      = Unwrap(fs_->GetFileInfo(full_path));
  if (info.type() == arrow::fs::FileType::NotFound) {
    throw util::NotFound("object not found: " + path);
  }
  return ReadAll(Unwrap(fs_->OpenInputFile(full_path)));
}

bool ArrowObjectStore::Delete(const std::string& path) {
  const auto full_path = FullPath(path);
  auto       info      = Unwrap(fs_->GetFileInfo(full_path));
  if (info.type() == arrow::fs::FileType::NotFound) return false;
  Unwrap(fs_->DeleteFile(full_path));
  return true;
}

} // namespace rulebook::storage
