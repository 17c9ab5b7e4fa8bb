#pragma once

namespace rulebook::db::postgres {

inline constexpr const char* kBatchColumns =
    "id,game_id,total_images,processed_images,failed_images,status,retry_count,max_retries,"
    "created_at_ms,processing_started_at_ms,completed_at_ms";

inline constexpr const char* kImageColumns =
    "id,game_id,file_path,blob_url,original_filename,file_size,uploaded_by,processing_status,processing_error,"
    "retry_count,batch_id,last_job_id,created_at_ms,updated_at_ms,processing_started_at_ms,processing_completed_at_ms";

inline constexpr const char* kVectorColumns =
    "id,game_id,image_id,page_number,ocr_content,ocr_embedding,description_content,description_embedding,"
    "labels_content,labels_embedding,created_at_ms";

// pgvector columns come back in their text form: '[1,2,3]'
inline constexpr const char* kVectorSelect =
    "id,game_id,image_id,page_number,ocr_content,ocr_embedding::text,description_content,description_embedding::text,"
    "labels_content,labels_embedding::text,created_at_ms";

// Prepared statement names installed on every pooled connection.
namespace stmt {
inline constexpr const char* kGetBatch             = "get_batch";
inline constexpr const char* kGetBatchForUpdate    = "get_batch_for_update";
inline constexpr const char* kInsertBatch          = "insert_batch";
inline constexpr const char* kUpdateBatch          = "update_batch";
inline constexpr const char* kDeleteBatch          = "delete_batch";
inline constexpr const char* kGetImage             = "get_image";
inline constexpr const char* kGetImageForUpdate    = "get_image_for_update";
inline constexpr const char* kInsertImage          = "insert_image";
inline constexpr const char* kUpdateImage          = "update_image";
inline constexpr const char* kDeleteImage          = "delete_image";
inline constexpr const char* kSetImageJob          = "set_image_job";
inline constexpr const char* kListImagesByBatch    = "list_images_by_batch";
inline constexpr const char* kListImagesByStatus   = "list_images_by_status";
inline constexpr const char* kInsertVector         = "insert_vector";
inline constexpr const char* kGetVectorByImage     = "get_vector_by_image";
inline constexpr const char* kDeleteVectorsByImage = "delete_vectors_by_image";
} // namespace stmt

} // namespace rulebook::db::postgres
