#include "pg_schema.hpp"

#include <string>

namespace rulebook::db::postgres {

void BootstrapPostgresSchema(PgPool& pool, std::uint32_t embedding_dimensions) {
  const std::string vector_type = "vector(" + std::to_string(embedding_dimensions) + ")";

  // pooled connections prepare statements against these tables, so they
  // cannot be used before the tables exist
  pqxx::connection conn(pool.ConnInfo());
  pqxx::work       tx(conn);

  tx.exec("CREATE EXTENSION IF NOT EXISTS vector;");
  tx.exec(
      "CREATE TABLE IF NOT EXISTS image_batches ("
      " id TEXT PRIMARY KEY, game_id TEXT NOT NULL,"
      " total_images INTEGER NOT NULL CHECK (total_images >= 0),"
      " processed_images INTEGER NOT NULL DEFAULT 0 CHECK (processed_images >= 0),"
      " failed_images INTEGER NOT NULL DEFAULT 0 CHECK (failed_images >= 0),"
      " status TEXT NOT NULL, retry_count INTEGER NOT NULL DEFAULT 0, max_retries INTEGER NOT NULL DEFAULT 3,"
      " created_at_ms BIGINT NOT NULL, processing_started_at_ms BIGINT, completed_at_ms BIGINT,"
      " CHECK (processed_images + failed_images <= total_images), CHECK (retry_count <= max_retries));");
  tx.exec(
      "CREATE TABLE IF NOT EXISTS game_images ("
      " id TEXT PRIMARY KEY, game_id TEXT NOT NULL, file_path TEXT NOT NULL, blob_url TEXT NOT NULL,"
      " original_filename TEXT NOT NULL, file_size BIGINT NOT NULL, uploaded_by TEXT NOT NULL,"
      " processing_status TEXT NOT NULL, processing_error TEXT, retry_count INTEGER NOT NULL DEFAULT 0,"
      " batch_id TEXT REFERENCES image_batches(id) ON DELETE SET NULL, last_job_id TEXT NOT NULL DEFAULT '',"
      " created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL,"
      " processing_started_at_ms BIGINT, processing_completed_at_ms BIGINT);");
  tx.exec("CREATE INDEX IF NOT EXISTS idx_game_images_batch ON game_images(batch_id);");
  tx.exec("CREATE INDEX IF NOT EXISTS idx_game_images_status ON game_images(processing_status, updated_at_ms);");
  tx.exec(
      "CREATE TABLE IF NOT EXISTS game_vectors ("
      " id TEXT PRIMARY KEY, game_id TEXT NOT NULL,"
      " image_id TEXT NOT NULL REFERENCES game_images(id) ON DELETE CASCADE, page_number INTEGER NOT NULL DEFAULT 0,"
      " ocr_content TEXT, ocr_embedding " + vector_type + ","
      " description_content TEXT, description_embedding " + vector_type + ","
      " labels_content TEXT, labels_embedding " + vector_type + ","
      " created_at_ms BIGINT NOT NULL);");
  tx.exec("CREATE INDEX IF NOT EXISTS idx_game_vectors_game ON game_vectors(game_id);");
  tx.exec("CREATE INDEX IF NOT EXISTS idx_game_vectors_image ON game_vectors(image_id);");

  tx.exec("SELECT id,game_id,total_images,processed_images,failed_images,status,retry_count,max_retries,created_at_ms FROM image_batches LIMIT 1;");
  tx.exec("SELECT id,batch_id,last_job_id,processing_status,updated_at_ms FROM game_images LIMIT 1;");
  tx.exec("SELECT id,image_id,ocr_embedding,description_embedding,labels_embedding FROM game_vectors LIMIT 1;");
  tx.commit();
}

} // namespace rulebook::db::postgres
