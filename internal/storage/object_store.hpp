#pragma once

#include <arrow/buffer.h>

#include <memory>
#include <string>

namespace rulebook::storage {

struct StoredObject {
  std::string path; // key inside the store, kept on the image row
  std::string url;  // externally reachable location
};

/*
  Opaque byte store for uploaded images.

  Every object is an Arrow Buffer; callers never handle raw pointers.
*/
class ObjectStore {
 public:
  virtual ~ObjectStore() = default;

  // Throws util::InvalidArgument for unusable filenames.
  virtual StoredObject Upload(const std::string& game_id, const std::string& image_id, const std::shared_ptr<arrow::Buffer>& bytes,
                              const std::string& filename, const std::string& content_type) = 0;

  // Throws util::NotFound when the object does not exist.
  virtual std::shared_ptr<arrow::Buffer> Download(const std::string& path) = 0;

  // false when nothing was stored under `path`
  virtual bool Delete(const std::string& path) = 0;
};

using ObjectStorePtr = std::shared_ptr<ObjectStore>;

} // namespace rulebook::storage
