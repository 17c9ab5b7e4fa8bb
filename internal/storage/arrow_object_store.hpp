#pragma once

#include <arrow/filesystem/filesystem.h>

#include <memory>
#include <string>

#include "internal/storage/object_store.hpp"

namespace rulebook::runtime::config {
class ObjectStoreConfig;
}

namespace rulebook::storage {

/*
  Image storage on an Arrow filesystem (local directory, S3 / MinIO).

  Object key layout:

      <root>/games/<game_id>/images/<image_id>_<filename>

  Objects are written once and never modified.
*/
class ArrowObjectStore final : public ObjectStore {
 public:
  ArrowObjectStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path, std::string url_base);

  // Resolves root_uri (file:// or s3://) into a filesystem.
  static std::shared_ptr<ArrowObjectStore> Make(const runtime::config::ObjectStoreConfig& config);

  StoredObject Upload(const std::string& game_id, const std::string& image_id, const std::shared_ptr<arrow::Buffer>& bytes,
                      const std::string& filename, const std::string& content_type) override;

  std::shared_ptr<arrow::Buffer> Download(const std::string& path) override;

  bool Delete(const std::string& path) override;

 private:
  std::string FullPath(const std::string& path) const;

  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string                            root_path_;
  std::string                            url_base_;
};

} // namespace rulebook::storage
