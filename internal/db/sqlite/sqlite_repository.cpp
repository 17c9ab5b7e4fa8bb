#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <cstring>
#include <stdexcept>

#include "internal/db/common/vector_ranking.hpp"
#include "sqlite_statement.hpp"

namespace rulebook::db::sqlite {

using rulebook::db::ErrorCode;
using rulebook::db::Result;

namespace {

constexpr const char* kBatchColumns =
    "id,game_id,total_images,processed_images,failed_images,status,retry_count,max_retries,"
    "created_at_ms,processing_started_at_ms,completed_at_ms";

constexpr const char* kImageColumns =
    "id,game_id,file_path,blob_url,original_filename,file_size,uploaded_by,processing_status,processing_error,"
    "retry_count,batch_id,last_job_id,created_at_ms,updated_at_ms,processing_started_at_ms,processing_completed_at_ms";

constexpr const char* kVectorColumns =
    "id,game_id,image_id,page_number,ocr_content,ocr_embedding,description_content,description_embedding,"
    "labels_content,labels_embedding,created_at_ms";

void BindTime(sqlite3_stmt* st, int idx, util::TimePoint tp) {
  BindI64(st, idx, util::ToUnixMillis(tp));
}

void BindOptTime(sqlite3_stmt* st, int idx, const std::optional<util::TimePoint>& tp) {
  if (tp) {
    BindTime(st, idx, *tp);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

// float32 in host byte order
void BindEmbedding(sqlite3_stmt* st, int idx, const std::optional<model::Embedding>& e) {
  if (!e) {
    sqlite3_bind_null(st, idx);
    return;
  }
  sqlite3_bind_blob(st, idx, e->data(), static_cast<int>(e->size() * sizeof(float)), SQLITE_TRANSIENT);
}

util::TimePoint ColTime(sqlite3_stmt* st, int col) {
  return util::FromUnixMillis(ColI64(st, col));
}

std::optional<util::TimePoint> ColOptTime(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColTime(st, col);
}

std::optional<model::Embedding> ColEmbedding(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  const void* data  = sqlite3_column_blob(st, col);
  const int   bytes = sqlite3_column_bytes(st, col);
  if (bytes % static_cast<int>(sizeof(float)) != 0) {
    throw std::runtime_error("corrupt embedding blob");
  }
  model::Embedding out(static_cast<std::size_t>(bytes) / sizeof(float));
  if (bytes > 0) std::memcpy(out.data(), data, static_cast<std::size_t>(bytes));
  return out;
}

model::ImageBatch ReadBatch(sqlite3_stmt* st) {
  model::ImageBatch b;
  b.id               = ColText(st, 0);
  b.game_id          = ColText(st, 1);
  b.total_images     = static_cast<std::uint32_t>(ColI64(st, 2));
  b.processed_images = static_cast<std::uint32_t>(ColI64(st, 3));
  b.failed_images    = static_cast<std::uint32_t>(ColI64(st, 4));

  const auto status = model::BatchStatusFromString(ColText(st, 5));
  if (!status) throw std::runtime_error("unknown batch status in row " + b.id);
  b.status = *status;

  b.retry_count           = static_cast<std::uint32_t>(ColI64(st, 6));
  b.max_retries           = static_cast<std::uint32_t>(ColI64(st, 7));
  b.created_at            = ColTime(st, 8);
  b.processing_started_at = ColOptTime(st, 9);
  b.completed_at          = ColOptTime(st, 10);
  return b;
}

model::GameImage ReadImage(sqlite3_stmt* st) {
  model::GameImage i;
  i.id                = ColText(st, 0);
  i.game_id           = ColText(st, 1);
  i.file_path         = ColText(st, 2);
  i.blob_url          = ColText(st, 3);
  i.original_filename = ColText(st, 4);
  i.file_size         = static_cast<std::uint64_t>(ColI64(st, 5));
  i.uploaded_by       = ColText(st, 6);

  const auto status = model::ImageStatusFromString(ColText(st, 7));
  if (!status) throw std::runtime_error("unknown image status in row " + i.id);
  i.processing_status = *status;

  i.processing_error        = ColOptText(st, 8);
  i.retry_count             = static_cast<std::uint32_t>(ColI64(st, 9));
  i.batch_id                = ColOptText(st, 10);
  i.last_job_id             = ColText(st, 11);
  i.created_at              = ColTime(st, 12);
  i.updated_at              = ColTime(st, 13);
  i.processing_started_at   = ColOptTime(st, 14);
  i.processing_completed_at = ColOptTime(st, 15);
  return i;
}

model::GameVector ReadVector(sqlite3_stmt* st) {
  model::GameVector v;
  v.id                    = ColText(st, 0);
  v.game_id               = ColText(st, 1);
  v.image_id              = ColText(st, 2);
  v.page_number           = static_cast<std::int32_t>(ColI64(st, 3));
  v.ocr.content           = ColOptText(st, 4);
  v.ocr.embedding         = ColEmbedding(st, 5);
  v.description.content   = ColOptText(st, 6);
  v.description.embedding = ColEmbedding(st, 7);
  v.labels.content        = ColOptText(st, 8);
  v.labels.embedding      = ColEmbedding(st, 9);
  v.created_at            = ColTime(st, 10);
  return v;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT: {
      const int ext = sqlite3_extended_errcode(db);
      if (ext == SQLITE_CONSTRAINT_PRIMARYKEY || ext == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    }
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Batches
// ------------------------------------------------------------------

Result SqliteRepository::InsertBatch(Transaction& t, const model::ImageBatch& b) {
  auto*     db = TX(t).Handle();
  Statement st(db, std::string("INSERT INTO image_batches(") + kBatchColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?);");

  BindText(st.get(), 1, b.id);
  BindText(st.get(), 2, b.game_id);
  BindI64(st.get(), 3, b.total_images);
  BindI64(st.get(), 4, b.processed_images);
  BindI64(st.get(), 5, b.failed_images);
  BindText(st.get(), 6, std::string(model::ToString(b.status)));
  BindI64(st.get(), 7, b.retry_count);
  BindI64(st.get(), 8, b.max_retries);
  BindTime(st.get(), 9, b.created_at);
  BindOptTime(st.get(), 10, b.processing_started_at);
  BindOptTime(st.get(), 11, b.completed_at);

  return Translate(db, st.Step());
}

std::optional<model::ImageBatch> SqliteRepository::GetBatch(Transaction& t, const std::string& id) {
  Statement st(TX(t).Handle(), std::string("SELECT ") + kBatchColumns + " FROM image_batches WHERE id=?;");
  BindText(st.get(), 1, id);
  if (!st.NextRow()) return std::nullopt;
  return ReadBatch(st.get());
}

// BEGIN IMMEDIATE already holds the database write lock.
std::optional<model::ImageBatch> SqliteRepository::GetBatchForUpdate(Transaction& t, const std::string& id) {
  return GetBatch(t, id);
}

Result SqliteRepository::UpdateBatch(Transaction& t, const model::ImageBatch& b) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "UPDATE image_batches SET game_id=?,total_images=?,processed_images=?,failed_images=?,status=?,retry_count=?,"
               "max_retries=?,processing_started_at_ms=?,completed_at_ms=? WHERE id=?;");

  BindText(st.get(), 1, b.game_id);
  BindI64(st.get(), 2, b.total_images);
  BindI64(st.get(), 3, b.processed_images);
  BindI64(st.get(), 4, b.failed_images);
  BindText(st.get(), 5, std::string(model::ToString(b.status)));
  BindI64(st.get(), 6, b.retry_count);
  BindI64(st.get(), 7, b.max_retries);
  BindOptTime(st.get(), 8, b.processing_started_at);
  BindOptTime(st.get(), 9, b.completed_at);
  BindText(st.get(), 10, b.id);

  auto r = Translate(db, st.Step());
  if (r && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "batch " + b.id);
  return r;
}

Result SqliteRepository::DeleteBatch(Transaction& t, const std::string& id) {
  auto*     db = TX(t).Handle();
  Statement st(db, "DELETE FROM image_batches WHERE id=?;");
  BindText(st.get(), 1, id);

  auto r = Translate(db, st.Step());
  if (r && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "batch " + id);
  return r;
}

// ------------------------------------------------------------------
// Images
// ------------------------------------------------------------------

Result SqliteRepository::InsertImage(Transaction& t, const model::GameImage& i) {
  auto*     db = TX(t).Handle();
  Statement st(db, std::string("INSERT INTO game_images(") + kImageColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);");

  BindText(st.get(), 1, i.id);
  BindText(st.get(), 2, i.game_id);
  BindText(st.get(), 3, i.file_path);
  BindText(st.get(), 4, i.blob_url);
  BindText(st.get(), 5, i.original_filename);
  BindI64(st.get(), 6, static_cast<int64_t>(i.file_size));
  BindText(st.get(), 7, i.uploaded_by);
  BindText(st.get(), 8, std::string(model::ToString(i.processing_status)));
  BindOptText(st.get(), 9, i.processing_error);
  BindI64(st.get(), 10, i.retry_count);
  BindOptText(st.get(), 11, i.batch_id);
  BindText(st.get(), 12, i.last_job_id);
  BindTime(st.get(), 13, i.created_at);
  BindTime(st.get(), 14, i.updated_at);
  BindOptTime(st.get(), 15, i.processing_started_at);
  BindOptTime(st.get(), 16, i.processing_completed_at);

  return Translate(db, st.Step());
}

std::optional<model::GameImage> SqliteRepository::GetImage(Transaction& t, const std::string& id) {
  Statement st(TX(t).Handle(), std::string("SELECT ") + kImageColumns + " FROM game_images WHERE id=?;");
  BindText(st.get(), 1, id);
  if (!st.NextRow()) return std::nullopt;
  return ReadImage(st.get());
}

// The transaction already holds the database writer lock.
std::optional<model::GameImage> SqliteRepository::GetImageForUpdate(Transaction& t, const std::string& id) {
  return GetImage(t, id);
}

Result SqliteRepository::UpdateImage(Transaction& t, const model::GameImage& i) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "UPDATE game_images SET game_id=?,file_path=?,blob_url=?,original_filename=?,file_size=?,uploaded_by=?,"
               "processing_status=?,processing_error=?,retry_count=?,batch_id=?,last_job_id=?,updated_at_ms=?,"
               "processing_started_at_ms=?,processing_completed_at_ms=? WHERE id=?;");

  BindText(st.get(), 1, i.game_id);
  BindText(st.get(), 2, i.file_path);
  BindText(st.get(), 3, i.blob_url);
  BindText(st.get(), 4, i.original_filename);
  BindI64(st.get(), 5, static_cast<int64_t>(i.file_size));
  BindText(st.get(), 6, i.uploaded_by);
  BindText(st.get(), 7, std::string(model::ToString(i.processing_status)));
  BindOptText(st.get(), 8, i.processing_error);
  BindI64(st.get(), 9, i.retry_count);
  BindOptText(st.get(), 10, i.batch_id);
  BindText(st.get(), 11, i.last_job_id);
  BindTime(st.get(), 12, i.updated_at);
  BindOptTime(st.get(), 13, i.processing_started_at);
  BindOptTime(st.get(), 14, i.processing_completed_at);
  BindText(st.get(), 15, i.id);

  auto r = Translate(db, st.Step());
  if (r && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "image " + i.id);
  return r;
}

Result SqliteRepository::DeleteImage(Transaction& t, const std::string& id) {
  auto*     db = TX(t).Handle();
  Statement st(db, "DELETE FROM game_images WHERE id=?;");
  BindText(st.get(), 1, id);

  auto r = Translate(db, st.Step());
  if (r && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "image " + id);
  return r;
}

Result SqliteRepository::SetImageJob(Transaction& t, const std::string& image_id, const std::string& job_id) {
  auto*     db = TX(t).Handle();
  Statement st(db, "UPDATE game_images SET last_job_id=? WHERE id=?;");
  BindText(st.get(), 1, job_id);
  BindText(st.get(), 2, image_id);

  auto r = Translate(db, st.Step());
  if (r && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "image " + image_id);
  return r;
}

std::vector<model::GameImage> SqliteRepository::ListImagesByBatch(Transaction& t, const std::string& batch_id) {
  Statement st(TX(t).Handle(), std::string("SELECT ") + kImageColumns + " FROM game_images WHERE batch_id=? ORDER BY created_at_ms, id;");
  BindText(st.get(), 1, batch_id);

  std::vector<model::GameImage> out;
  while (st.NextRow()) out.push_back(ReadImage(st.get()));
  return out;
}

std::vector<model::GameImage> SqliteRepository::ListImagesByStatus(Transaction& t, model::ImageStatus status, util::TimePoint updated_before,
                                                                   std::size_t limit) {
  Statement st(TX(t).Handle(), std::string("SELECT ") + kImageColumns +
                                   " FROM game_images WHERE processing_status=? AND updated_at_ms<? ORDER BY updated_at_ms LIMIT ?;");
  BindText(st.get(), 1, std::string(model::ToString(status)));
  BindTime(st.get(), 2, updated_before);
  BindI64(st.get(), 3, static_cast<int64_t>(limit));

  std::vector<model::GameImage> out;
  while (st.NextRow()) out.push_back(ReadImage(st.get()));
  return out;
}

// ------------------------------------------------------------------
// Vectors
// ------------------------------------------------------------------

Result SqliteRepository::InsertVector(Transaction& t, const model::GameVector& v) {
  auto*     db = TX(t).Handle();
  Statement st(db, std::string("INSERT INTO game_vectors(") + kVectorColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?);");

  BindText(st.get(), 1, v.id);
  BindText(st.get(), 2, v.game_id);
  BindText(st.get(), 3, v.image_id);
  BindI64(st.get(), 4, v.page_number);
  BindOptText(st.get(), 5, v.ocr.content);
  BindEmbedding(st.get(), 6, v.ocr.embedding);
  BindOptText(st.get(), 7, v.description.content);
  BindEmbedding(st.get(), 8, v.description.embedding);
  BindOptText(st.get(), 9, v.labels.content);
  BindEmbedding(st.get(), 10, v.labels.embedding);
  BindTime(st.get(), 11, v.created_at);

  return Translate(db, st.Step());
}

std::optional<model::GameVector> SqliteRepository::GetVectorByImage(Transaction& t, const std::string& image_id) {
  Statement st(TX(t).Handle(), std::string("SELECT ") + kVectorColumns + " FROM game_vectors WHERE image_id=? ORDER BY created_at_ms DESC LIMIT 1;");
  BindText(st.get(), 1, image_id);
  if (!st.NextRow()) return std::nullopt;
  return ReadVector(st.get());
}

Result SqliteRepository::DeleteVectorsByImage(Transaction& t, const std::string& image_id) {
  auto*     db = TX(t).Handle();
  Statement st(db, "DELETE FROM game_vectors WHERE image_id=?;");
  BindText(st.get(), 1, image_id);
  return Translate(db, st.Step());
}

std::vector<model::ScoredVector> SqliteRepository::SearchVectors(Transaction& t, const std::string& game_id, const model::Embedding& query,
                                                                 model::SearchPair pair, std::size_t limit, double threshold) {
  const auto columns = model::ColumnsFor(pair);
  Statement  st(TX(t).Handle(), std::string("SELECT ") + kVectorColumns + " FROM game_vectors WHERE game_id=? AND " +
                                   std::string(columns.embedding) + " IS NOT NULL ORDER BY id;");
  BindText(st.get(), 1, game_id);

  std::vector<model::GameVector> candidates;
  while (st.NextRow()) candidates.push_back(ReadVector(st.get()));

  return common::RankVectors(std::move(candidates), query, pair, limit, threshold);
}

} // namespace rulebook::db::sqlite
