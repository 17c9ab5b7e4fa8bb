#include "memory_repository.hpp"

#include <algorithm>

#include "internal/db/common/vector_ranking.hpp"
#include "memory_tx.hpp"

namespace rulebook::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Batches
// ------------------------------------------------------------------

Result MemoryRepository::InsertBatch(Transaction& t, const model::ImageBatch& b) {
  auto& s = TX(t).Mutable();
  if (s.batches.contains(b.id)) return Result::Err(ErrorCode::AlreadyExists, "batch " + b.id);
  s.batches[b.id] = b;
  return Result::Ok();
}

std::optional<model::ImageBatch> MemoryRepository::GetBatch(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.batches.find(id);
  if (it == s.batches.end()) return std::nullopt;
  return it->second;
}

// Optimistic: the row is not locked, a concurrent writer surfaces as a conflict at Commit().
std::optional<model::ImageBatch> MemoryRepository::GetBatchForUpdate(Transaction& t, const std::string& id) {
  return GetBatch(t, id);
}

Result MemoryRepository::UpdateBatch(Transaction& t, const model::ImageBatch& b) {
  auto& s = TX(t).Mutable();
  if (!s.batches.contains(b.id)) return Result::Err(ErrorCode::NotFound, "batch " + b.id);
  s.batches[b.id] = b;
  return Result::Ok();
}

Result MemoryRepository::DeleteBatch(Transaction& t, const std::string& id) {
  auto& s = TX(t).Mutable();
  if (s.batches.erase(id) == 0) return Result::Err(ErrorCode::NotFound, "batch " + id);
  for (auto& [_, image] : s.images) {
    if (image.batch_id && *image.batch_id == id) {
      image.batch_id.reset();
    }
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Images
// ------------------------------------------------------------------

Result MemoryRepository::InsertImage(Transaction& t, const model::GameImage& image) {
  auto& s = TX(t).Mutable();
  if (s.images.contains(image.id)) return Result::Err(ErrorCode::AlreadyExists, "image " + image.id);
  if (image.batch_id && !s.batches.contains(*image.batch_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "image " + image.id + " references unknown batch " + *image.batch_id);
  }
  s.images[image.id] = image;
  return Result::Ok();
}

std::optional<model::GameImage> MemoryRepository::GetImage(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.images.find(id);
  if (it == s.images.end()) return std::nullopt;
  return it->second;
}

// Conflicts are detected at Commit(); same as GetBatchForUpdate.
std::optional<model::GameImage> MemoryRepository::GetImageForUpdate(Transaction& t, const std::string& id) {
  return GetImage(t, id);
}

Result MemoryRepository::UpdateImage(Transaction& t, const model::GameImage& image) {
  auto& s = TX(t).Mutable();
  if (!s.images.contains(image.id)) return Result::Err(ErrorCode::NotFound, "image " + image.id);
  s.images[image.id] = image;
  return Result::Ok();
}

Result MemoryRepository::DeleteImage(Transaction& t, const std::string& id) {
  auto& s = TX(t).Mutable();
  if (s.images.erase(id) == 0) return Result::Err(ErrorCode::NotFound, "image " + id);
  std::erase_if(s.vectors, [&](const auto& entry) { return entry.second.image_id == id; });
  return Result::Ok();
}

Result MemoryRepository::SetImageJob(Transaction& t, const std::string& image_id, const std::string& job_id) {
  auto& s  = TX(t).Mutable();
  auto  it = s.images.find(image_id);
  if (it == s.images.end()) return Result::Err(ErrorCode::NotFound, "image " + image_id);
  it->second.last_job_id = job_id;
  return Result::Ok();
}

std::vector<model::GameImage> MemoryRepository::ListImagesByBatch(Transaction& t, const std::string& batch_id) {
  const auto&                   s = TX(t).View();
  std::vector<model::GameImage> out;
  for (const auto& [_, image] : s.images) {
    if (image.batch_id && *image.batch_id == batch_id) {
      out.push_back(image);
    }
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.created_at < b.created_at || (a.created_at == b.created_at && a.id < b.id); });
  return out;
}

std::vector<model::GameImage> MemoryRepository::ListImagesByStatus(Transaction& t, model::ImageStatus status, util::TimePoint updated_before,
                                                                   std::size_t limit) {
  const auto&                   s = TX(t).View();
  std::vector<model::GameImage> out;
  for (const auto& [_, image] : s.images) {
    if (image.processing_status == status && image.updated_at < updated_before) {
      out.push_back(image);
    }
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.updated_at < b.updated_at; });
  if (out.size() > limit) out.resize(limit);
  return out;
}

// ------------------------------------------------------------------
// Vectors
// ------------------------------------------------------------------

Result MemoryRepository::InsertVector(Transaction& t, const model::GameVector& v) {
  auto& s = TX(t).Mutable();
  if (s.vectors.contains(v.id)) return Result::Err(ErrorCode::AlreadyExists, "vector " + v.id);
  if (!s.images.contains(v.image_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "vector " + v.id + " references unknown image " + v.image_id);
  }
  s.vectors[v.id] = v;
  return Result::Ok();
}

std::optional<model::GameVector> MemoryRepository::GetVectorByImage(Transaction& t, const std::string& image_id) {
  const auto& s = TX(t).View();
  for (const auto& [_, v] : s.vectors) {
    if (v.image_id == image_id) return v;
  }
  return std::nullopt;
}

Result MemoryRepository::DeleteVectorsByImage(Transaction& t, const std::string& image_id) {
  auto& s = TX(t).Mutable();
  std::erase_if(s.vectors, [&](const auto& entry) { return entry.second.image_id == image_id; });
  return Result::Ok();
}

std::vector<model::ScoredVector> MemoryRepository::SearchVectors(Transaction& t, const std::string& game_id, const model::Embedding& query,
                                                                 model::SearchPair pair, std::size_t limit, double threshold) {
  const auto&                    s = TX(t).View();
  std::vector<model::GameVector> candidates;
  for (const auto& [_, v] : s.vectors) {
    if (v.game_id == game_id) {
      candidates.push_back(v);
    }
  }
  // deterministic tie order
  std::sort(candidates.begin(), candidates.end(), [](const auto& a, const auto& b) { return a.id < b.id; });
  return common::RankVectors(std::move(candidates), query, pair, limit, threshold);
}

} // namespace rulebook::db::memory
