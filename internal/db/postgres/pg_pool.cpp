#include "pg_pool.hpp"

#include "pg_statements.hpp"

namespace rulebook::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn.release());
        } catch (...) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare(stmt::kGetBatch, "SELECT " + std::string(kBatchColumns) + " FROM image_batches WHERE id=$1");
  conn.prepare(stmt::kGetBatchForUpdate, "SELECT " + std::string(kBatchColumns) + " FROM image_batches WHERE id=$1 FOR UPDATE");
  conn.prepare(stmt::kInsertBatch,
               "INSERT INTO image_batches(" + std::string(kBatchColumns) + ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11)");
  conn.prepare(stmt::kUpdateBatch,
               "UPDATE image_batches SET game_id=$2,total_images=$3,processed_images=$4,failed_images=$5,status=$6,"
               "retry_count=$7,max_retries=$8,processing_started_at_ms=$9,completed_at_ms=$10 WHERE id=$1");
  conn.prepare(stmt::kDeleteBatch, "DELETE FROM image_batches WHERE id=$1");

  conn.prepare(stmt::kGetImage, "SELECT " + std::string(kImageColumns) + " FROM game_images WHERE id=$1");
  conn.prepare(stmt::kGetImageForUpdate, "SELECT " + std::string(kImageColumns) + " FROM game_images WHERE id=$1 FOR UPDATE");
  conn.prepare(stmt::kInsertImage, "INSERT INTO game_images(" + std::string(kImageColumns) +
                                       ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16)");
  conn.prepare(stmt::kUpdateImage,
               "UPDATE game_images SET game_id=$2,file_path=$3,blob_url=$4,original_filename=$5,file_size=$6,uploaded_by=$7,"
               "processing_status=$8,processing_error=$9,retry_count=$10,batch_id=$11,last_job_id=$12,updated_at_ms=$13,"
               "processing_started_at_ms=$14,processing_completed_at_ms=$15 WHERE id=$1");
  conn.prepare(stmt::kDeleteImage, "DELETE FROM game_images WHERE id=$1");
  conn.prepare(stmt::kSetImageJob, "UPDATE game_images SET last_job_id=$2 WHERE id=$1");
  conn.prepare(stmt::kListImagesByBatch,
               "SELECT " + std::string(kImageColumns) + " FROM game_images WHERE batch_id=$1 ORDER BY created_at_ms, id");
  conn.prepare(stmt::kListImagesByStatus, "SELECT " + std::string(kImageColumns) +
                                              " FROM game_images WHERE processing_status=$1 AND updated_at_ms<$2 ORDER BY updated_at_ms LIMIT $3");

  conn.prepare(stmt::kInsertVector, "INSERT INTO game_vectors(" + std::string(kVectorColumns) +
                                        ") VALUES($1,$2,$3,$4,$5,$6::vector,$7,$8::vector,$9,$10::vector,$11)");
  conn.prepare(stmt::kGetVectorByImage, "SELECT " + std::string(kVectorSelect) +
                                            " FROM game_vectors WHERE image_id=$1 ORDER BY created_at_ms DESC LIMIT 1");
  conn.prepare(stmt::kDeleteVectorsByImage, "DELETE FROM game_vectors WHERE image_id=$1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    if (conn->is_open()) {
      idle_.emplace_back(conn);
    } else {
      delete conn;
      --live_connections_;
    }
  }
  cv_.notify_one();
}

} // namespace rulebook::db::postgres
