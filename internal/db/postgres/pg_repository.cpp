#include "pg_repository.hpp"

#include <cstdlib>
#include <optional>
#include <sstream>

#include "internal/util/errors.hpp"
#include "pg_statements.hpp"

namespace rulebook::db::postgres {

namespace {

std::optional<int64_t> OptMillis(const std::optional<util::TimePoint>& tp) {
  if (!tp) return std::nullopt;
  return util::ToUnixMillis(*tp);
}

// pgvector text literal: '[0.1,0.2,...]'
std::optional<std::string> VectorLiteral(const std::optional<model::Embedding>& e) {
  if (!e) return std::nullopt;
  std::ostringstream out;
  out.precision(9);
  out << '[';
  for (std::size_t i = 0; i < e->size(); ++i) {
    if (i > 0) out << ',';
    out << (*e)[i];
  }
  out << ']';
  return out.str();
}

std::optional<model::Embedding> ParseVector(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  std::string_view text = f.view();
  if (text.size() < 2 || text.front() != '[' || text.back() != ']') {
    throw std::runtime_error("malformed vector literal from postgres");
  }

  model::Embedding out;
  const std::string body(text.substr(1, text.size() - 2));
  const char*       cursor = body.c_str();
  while (*cursor != '\0') {
    char* end = nullptr;
    out.push_back(std::strtof(cursor, &end));
    if (end == cursor) throw std::runtime_error("malformed vector literal from postgres");
    cursor = end;
    if (*cursor == ',') ++cursor;
  }
  return out;
}

std::optional<std::string> OptText(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return std::string(f.c_str());
}

std::optional<util::TimePoint> OptTime(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return util::FromUnixMillis(f.as<int64_t>());
}

model::ImageBatch ReadBatch(const pqxx::row& row) {
  model::ImageBatch b;
  b.id               = row[0].c_str();
  b.game_id          = row[1].c_str();
  b.total_images     = row[2].as<std::uint32_t>();
  b.processed_images = row[3].as<std::uint32_t>();
  b.failed_images    = row[4].as<std::uint32_t>();

  const auto status = model::BatchStatusFromString(row[5].c_str());
  if (!status) throw std::runtime_error("unknown batch status in row " + b.id);
  b.status = *status;

  b.retry_count           = row[6].as<std::uint32_t>();
  b.max_retries           = row[7].as<std::uint32_t>();
  b.created_at            = util::FromUnixMillis(row[8].as<int64_t>());
  b.processing_started_at = OptTime(row[9]);
  b.completed_at          = OptTime(row[10]);
  return b;
}

model::GameImage ReadImage(const pqxx::row& row) {
  model::GameImage i;
  i.id                = row[0].c_str();
  i.game_id           = row[1].c_str();
  i.file_path         = row[2].c_str();
  i.blob_url          = row[3].c_str();
  i.original_filename = row[4].c_str();
  i.file_size         = row[5].as<std::uint64_t>();
  i.uploaded_by       = row[6].c_str();

  const auto status = model::ImageStatusFromString(row[7].c_str());
  if (!status) throw std::runtime_error("unknown image status in row " + i.id);
  i.processing_status = *status;

  i.processing_error        = OptText(row[8]);
  i.retry_count             = row[9].as<std::uint32_t>();
  i.batch_id                = OptText(row[10]);
  i.last_job_id             = row[11].c_str();
  i.created_at              = util::FromUnixMillis(row[12].as<int64_t>());
  i.updated_at              = util::FromUnixMillis(row[13].as<int64_t>());
  i.processing_started_at   = OptTime(row[14]);
  i.processing_completed_at = OptTime(row[15]);
  return i;
}

model::GameVector ReadVector(const pqxx::row& row) {
  model::GameVector v;
  v.id                    = row[0].c_str();
  v.game_id               = row[1].c_str();
  v.image_id              = row[2].c_str();
  v.page_number           = row[3].as<std::int32_t>();
  v.ocr.content           = OptText(row[4]);
  v.ocr.embedding         = ParseVector(row[5]);
  v.description.content   = OptText(row[6]);
  v.description.embedding = ParseVector(row[7]);
  v.labels.content        = OptText(row[8]);
  v.labels.embedding      = ParseVector(row[9]);
  v.created_at            = util::FromUnixMillis(row[10].as<int64_t>());
  return v;
}

std::string StatusText(model::BatchStatus s) {
  return std::string(model::ToString(s));
}

std::string StatusText(model::ImageStatus s) {
  return std::string(model::ToString(s));
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) return Result::Err(ErrorCode::Conflict, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  if (dynamic_cast<const pqxx::data_exception*>(&e)) return Result::Err(ErrorCode::InvalidArgument, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Batches
// ------------------------------------------------------------------

Result PgRepository::InsertBatch(Transaction& t, const model::ImageBatch& b) {
  try {
    TX(t).Work().exec_prepared(stmt::kInsertBatch, b.id, b.game_id, b.total_images, b.processed_images, b.failed_images, StatusText(b.status),
                               b.retry_count, b.max_retries, util::ToUnixMillis(b.created_at), OptMillis(b.processing_started_at),
                               OptMillis(b.completed_at));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ImageBatch> PgRepository::GetBatch(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared(stmt::kGetBatch, id);
  if (res.empty()) return std::nullopt;
  return ReadBatch(res[0]);
}

// Row lock held until the transaction ends.
std::optional<model::ImageBatch> PgRepository::GetBatchForUpdate(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared(stmt::kGetBatchForUpdate, id);
  if (res.empty()) return std::nullopt;
  return ReadBatch(res[0]);
}

Result PgRepository::UpdateBatch(Transaction& t, const model::ImageBatch& b) {
  try {
    auto res = TX(t).Work().exec_prepared(stmt::kUpdateBatch, b.id, b.game_id, b.total_images, b.processed_images, b.failed_images,
                                          StatusText(b.status), b.retry_count, b.max_retries, OptMillis(b.processing_started_at),
                                          OptMillis(b.completed_at));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "batch " + b.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteBatch(Transaction& t, const std::string& id) {
  try {
    auto res = TX(t).Work().exec_prepared(stmt::kDeleteBatch, id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "batch " + id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Images
// ------------------------------------------------------------------

Result PgRepository::InsertImage(Transaction& t, const model::GameImage& i) {
  try {
    TX(t).Work().exec_prepared(stmt::kInsertImage, i.id, i.game_id, i.file_path, i.blob_url, i.original_filename, static_cast<int64_t>(i.file_size),
                               i.uploaded_by, StatusText(i.processing_status), i.processing_error, i.retry_count, i.batch_id, i.last_job_id,
                               util::ToUnixMillis(i.created_at), util::ToUnixMillis(i.updated_at), OptMillis(i.processing_started_at),
                               OptMillis(i.processing_completed_at));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::GameImage> PgRepository::GetImage(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared(stmt::kGetImage, id);
  if (res.empty()) return std::nullopt;
  return ReadImage(res[0]);
}

std::optional<model::GameImage> PgRepository::GetImageForUpdate(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared(stmt::kGetImageForUpdate, id);
  if (res.empty()) return std::nullopt;
  return ReadImage(res[0]);
}

Result PgRepository::UpdateImage(Transaction& t, const model::GameImage& i) {
  try {
    auto res = TX(t).Work().exec_prepared(stmt::kUpdateImage, i.id, i.game_id, i.file_path, i.blob_url, i.original_filename,
                                          static_cast<int64_t>(i.file_size), i.uploaded_by, StatusText(i.processing_status), i.processing_error,
                                          i.retry_count, i.batch_id, i.last_job_id, util::ToUnixMillis(i.updated_at),
                                          OptMillis(i.processing_started_at), OptMillis(i.processing_completed_at));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "image " + i.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteImage(Transaction& t, const std::string& id) {
  try {
    auto res = TX(t).Work().exec_prepared(stmt::kDeleteImage, id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "image " + id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::SetImageJob(Transaction& t, const std::string& image_id, const std::string& job_id) {
  try {
    auto res = TX(t).Work().exec_prepared(stmt::kSetImageJob, image_id, job_id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "image " + image_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::GameImage> PgRepository::ListImagesByBatch(Transaction& t, const std::string& batch_id) {
  auto res = TX(t).Work().exec_prepared(stmt::kListImagesByBatch, batch_id);

  std::vector<model::GameImage> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadImage(row));
  return out;
}

std::vector<model::GameImage> PgRepository::ListImagesByStatus(Transaction& t, model::ImageStatus status, util::TimePoint updated_before,
                                                               std::size_t limit) {
  auto res = TX(t).Work().exec_prepared(stmt::kListImagesByStatus, StatusText(status), util::ToUnixMillis(updated_before),
                                        static_cast<int64_t>(limit));

  std::vector<model::GameImage> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadImage(row));
  return out;
}

// ------------------------------------------------------------------
// Vectors
// ------------------------------------------------------------------

Result PgRepository::InsertVector(Transaction& t, const model::GameVector& v) {
  try {
    TX(t).Work().exec_prepared(stmt::kInsertVector, v.id, v.game_id, v.image_id, v.page_number, v.ocr.content, VectorLiteral(v.ocr.embedding),
                               v.description.content, VectorLiteral(v.description.embedding), v.labels.content,
                               VectorLiteral(v.labels.embedding), util::ToUnixMillis(v.created_at));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::GameVector> PgRepository::GetVectorByImage(Transaction& t, const std::string& image_id) {
  auto res = TX(t).Work().exec_prepared(stmt::kGetVectorByImage, image_id);
  if (res.empty()) return std::nullopt;
  return ReadVector(res[0]);
}

Result PgRepository::DeleteVectorsByImage(Transaction& t, const std::string& image_id) {
  try {
    TX(t).Work().exec_prepared(stmt::kDeleteVectorsByImage, image_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

/*
  Ranking runs in the database: 1 - cosine distance, clamped to [0, 1]
  so it matches the in-process backends.
*/
std::vector<model::ScoredVector> PgRepository::SearchVectors(Transaction& t, const std::string& game_id, const model::Embedding& query,
                                                             model::SearchPair pair, std::size_t limit, double threshold) {
  const std::string embedding(model::ColumnsFor(pair).embedding);
  // a zero vector yields NaN distance; it scores 0 like the in-process backends
  const std::string score = "GREATEST(0, LEAST(1, 1 - COALESCE(NULLIF(" + embedding + " <=> $2::vector, 'NaN'::float8), 1)))";
  const std::string sql   = "SELECT " + std::string(kVectorSelect) + ", " + score + " AS similarity FROM game_vectors WHERE game_id=$1 AND " +
                          embedding + " IS NOT NULL AND " + score + " >= $3 ORDER BY similarity DESC, id LIMIT $4";

  pqxx::result res;
  try {
    res = TX(t).Work().exec_params(sql, game_id, *VectorLiteral(query), threshold, static_cast<int64_t>(limit));
  } catch (const pqxx::data_exception& e) {
    // pgvector: "different vector dimensions N and M"
    throw util::DimensionMismatch(std::string("vector search: ") + e.what());
  }

  std::vector<model::ScoredVector> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::ScoredVector scored;
    scored.vector           = ReadVector(row);
    scored.similarity_score = row[11].as<double>();
    out.push_back(std::move(scored));
  }
  return out;
}

} // namespace rulebook::db::postgres
