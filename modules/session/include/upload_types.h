#ifndef CHUNKFLOW_UPLOAD_TYPES_H
#define CHUNKFLOW_UPLOAD_TYPES_H

#include "clock.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chunkflow {

// Open string-keyed metadata carried by sessions, chunks and batches
using Metadata = nlohmann::json;

// ============================================================================
// CONSTANTS
// ============================================================================

constexpr int64_t KIB = 1024;
constexpr int64_t MIB = 1024 * KIB;
constexpr int64_t GIB = 1024 * MIB;

constexpr int64_t MAX_FILE_SIZE = 5 * GIB;
constexpr size_t MAX_FILENAME_LENGTH = 255;

// Storage-key prefix of a within-batch dedup record whose source is not stored yet
constexpr const char* DEDUP_PENDING_PREFIX = "dedup_pending:";

// ============================================================================
// ENUMS
// ============================================================================

enum class UploadStatus {
    PENDING,          // Created, waiting for chunks
    UPLOADING,        // Chunks arriving
    ASSEMBLING,       // All chunks present, concatenating
    VIRUS_SCANNING,   // Assembled file handed to the scanner
    FINALIZING,       // Scan clean, creating the asset
    COMPLETED,        // Terminal
    FAILED,           // Retryable
    CANCELLED,        // Terminal
    VIRUS_DETECTED    // Terminal unless manually requeued
};

enum class ChunkStatus {
    PENDING,
    COMPLETED,
    FAILED
};

enum class QueueStatus {
    PENDING,
    PROCESSING,
    COMPLETED,
    FAILED,
    CANCELLED
};

enum class DraggableType {
    FOLDER,
    FILE,
    MIXED
};

const char* upload_status_to_string(UploadStatus s);
std::optional<UploadStatus> upload_status_from_string(const std::string& s);
const char* chunk_status_to_string(ChunkStatus s);
std::optional<ChunkStatus> chunk_status_from_string(const std::string& s);
const char* queue_status_to_string(QueueStatus s);
std::optional<QueueStatus> queue_status_from_string(const std::string& s);
const char* draggable_type_to_string(DraggableType t);
std::optional<DraggableType> draggable_type_from_string(const std::string& s);

// uploading / assembling / virus_scanning / finalizing
bool is_active_status(UploadStatus s);
// completed / cancelled / virus_detected
bool is_terminal_status(UploadStatus s);

// ============================================================================
// RECORDS
// ============================================================================

struct UploadSession {
    std::string id;
    std::string workspace_id;
    std::string container_id;
    std::string user_id;
    std::string ip_address;
    std::string batch_id;                 // Owning QueueItem (empty for standalone uploads)
    std::string filename;
    int64_t total_size = 0;               // Declared bytes
    int chunks_count = 0;                 // Expected chunk numbers 1..chunks_count
    UploadStatus status = UploadStatus::PENDING;
    Metadata metadata = Metadata::object();
    std::string assembled_file_path;      // Set once assembly succeeds
    SystemTime created_at{};
    SystemTime updated_at{};

    int retry_count() const;
    std::string priority() const;         // high / normal / low (default normal)
};

struct ChunkRecord {
    std::string session_id;
    int chunk_number = 0;                 // 1-based
    int64_t size = 0;
    std::string checksum;                 // lowercase sha256 hex
    ChunkStatus status = ChunkStatus::PENDING;
    std::string storage_key;              // Opaque ChunkStore key or dedup placeholder
    Metadata metadata = Metadata::object();
    SystemTime created_at{};
    SystemTime updated_at{};

    bool has_pending_dedup_key() const;
};

struct QueueItem {
    std::string batch_id;
    std::string workspace_id;
    std::string user_id;
    std::string draggable_name;
    DraggableType draggable_type = DraggableType::FILE;
    std::string original_path;
    int total_files = 0;
    int completed_files = 0;
    int failed_files = 0;
    QueueStatus status = QueueStatus::PENDING;
    Metadata metadata = Metadata::object();
    std::vector<std::string> session_ids;
    SystemTime created_at{};
    SystemTime updated_at{};

    // Counts never trusted raw: negatives floor at 0, overflow is clamped.
    int pending_files() const;
    double progress_percentage() const;
    bool is_active() const;               // pending or processing

    // Bumps a counter and closes the batch once every file is accounted for.
    void mark_file_completed();
    void mark_file_failed();
};

// One chunk as submitted by a client, before it is stored
struct ChunkPayload {
    int chunk_number = 0;
    int64_t size = 0;                     // Declared size, must match data.size()
    std::string checksum;                 // Declared sha256 hex
    std::vector<uint8_t> data;
};

struct AssetRecord {
    std::string id;
    std::string workspace_id;
    std::string container_id;
    std::string user_id;
    std::string filename;
    std::string file_path;
    int64_t file_size = 0;
    std::string content_type;
    std::string upload_session_id;
    SystemTime created_at{};
};

// ============================================================================
// SESSION RULES
// ============================================================================

/**
 * True when a filename is safe to store: no traversal, no reserved device
 * names, no characters rejected by common filesystems.
 */
bool is_filename_safe(const std::string& filename);

/**
 * Validate required session fields, size bounds and filename safety.
 * @throws ValidationError listing every problem found
 */
void validate_session(const UploadSession& session);

/**
 * Validate chunk fields (number > 0, size > 0, checksum present, completed
 * chunks carry a storage key).
 * @throws ValidationError
 */
void validate_chunk(const ChunkRecord& chunk);

// Chunk size suggested to clients for a file of this size
int64_t recommended_chunk_size(int64_t total_size);

// Failed > 24h ago, or pending without activity for > 1h (limits configurable)
bool is_session_expired(const UploadSession& session, SystemTime now,
                        int failed_ttl_hours = 24, int pending_ttl_hours = 1);

// completed / chunks_count * 100, rounded to 2 places
double session_progress_percentage(const UploadSession& session, int completed_chunks);

// ============================================================================
// JSON (persistence snapshots, status reports)
// ============================================================================

void to_json(nlohmann::json& j, const UploadSession& s);
void from_json(const nlohmann::json& j, UploadSession& s);
void to_json(nlohmann::json& j, const ChunkRecord& c);
void from_json(const nlohmann::json& j, ChunkRecord& c);
void to_json(nlohmann::json& j, const QueueItem& q);
void from_json(const nlohmann::json& j, QueueItem& q);
void to_json(nlohmann::json& j, const AssetRecord& a);
void from_json(const nlohmann::json& j, AssetRecord& a);

} // namespace chunkflow

#endif // CHUNKFLOW_UPLOAD_TYPES_H
