#include "sqlite_schema.hpp"

#include <string>
#include <vector>

namespace rulebook::db::sqlite {

void BootstrapSqliteSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS image_batches ("
      " id TEXT PRIMARY KEY, game_id TEXT NOT NULL,"
      " total_images INTEGER NOT NULL CHECK (total_images >= 0),"
      " processed_images INTEGER NOT NULL DEFAULT 0 CHECK (processed_images >= 0),"
      " failed_images INTEGER NOT NULL DEFAULT 0 CHECK (failed_images >= 0),"
      " status TEXT NOT NULL, retry_count INTEGER NOT NULL DEFAULT 0, max_retries INTEGER NOT NULL DEFAULT 3,"
      " created_at_ms INTEGER NOT NULL, processing_started_at_ms INTEGER, completed_at_ms INTEGER,"
      " CHECK (processed_images + failed_images <= total_images), CHECK (retry_count <= max_retries));",

      "CREATE TABLE IF NOT EXISTS game_images ("
      " id TEXT PRIMARY KEY, game_id TEXT NOT NULL, file_path TEXT NOT NULL, blob_url TEXT NOT NULL,"
      " original_filename TEXT NOT NULL, file_size INTEGER NOT NULL, uploaded_by TEXT NOT NULL,"
      " processing_status TEXT NOT NULL, processing_error TEXT, retry_count INTEGER NOT NULL DEFAULT 0,"
      " batch_id TEXT REFERENCES image_batches(id) ON DELETE SET NULL, last_job_id TEXT NOT NULL DEFAULT '',"
      " created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL,"
      " processing_started_at_ms INTEGER, processing_completed_at_ms INTEGER);",
      "CREATE INDEX IF NOT EXISTS idx_game_images_batch ON game_images(batch_id);",
      "CREATE INDEX IF NOT EXISTS idx_game_images_status ON game_images(processing_status, updated_at_ms);",

      "CREATE TABLE IF NOT EXISTS game_vectors ("
      " id TEXT PRIMARY KEY, game_id TEXT NOT NULL,"
      " image_id TEXT NOT NULL REFERENCES game_images(id) ON DELETE CASCADE, page_number INTEGER NOT NULL DEFAULT 0,"
      " ocr_content TEXT, ocr_embedding BLOB, description_content TEXT, description_embedding BLOB,"
      " labels_content TEXT, labels_embedding BLOB, created_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_game_vectors_game ON game_vectors(game_id);",
      "CREATE INDEX IF NOT EXISTS idx_game_vectors_image ON game_vectors(image_id);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }

  db.Exec("SELECT id,game_id,total_images,processed_images,failed_images,status,retry_count,max_retries,created_at_ms FROM image_batches LIMIT 1;");
  db.Exec("SELECT id,batch_id,last_job_id,processing_status,updated_at_ms FROM game_images LIMIT 1;");
  db.Exec("SELECT id,image_id,ocr_embedding,description_embedding,labels_embedding FROM game_vectors LIMIT 1;");
}

} // namespace rulebook::db::sqlite
