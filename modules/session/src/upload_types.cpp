#include "upload_types.h"
#include "upload_errors.h"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace chunkflow {

// ============================================================================
// Enum <-> string
// ============================================================================

const char* upload_status_to_string(UploadStatus s) {
    switch (s) {
        case UploadStatus::PENDING:        return "pending";
        case UploadStatus::UPLOADING:      return "uploading";
        case UploadStatus::ASSEMBLING:     return "assembling";
        case UploadStatus::VIRUS_SCANNING: return "virus_scanning";
        case UploadStatus::FINALIZING:     return "finalizing";
        case UploadStatus::COMPLETED:      return "completed";
        case UploadStatus::FAILED:         return "failed";
        case UploadStatus::CANCELLED:      return "cancelled";
        case UploadStatus::VIRUS_DETECTED: return "virus_detected";
    }
    return "unknown";
}

std::optional<UploadStatus> upload_status_from_string(const std::string& s) {
    static const UploadStatus all[] = {
        UploadStatus::PENDING, UploadStatus::UPLOADING, UploadStatus::ASSEMBLING,
        UploadStatus::VIRUS_SCANNING, UploadStatus::FINALIZING, UploadStatus::COMPLETED,
        UploadStatus::FAILED, UploadStatus::CANCELLED, UploadStatus::VIRUS_DETECTED};
    for (UploadStatus st : all) {
        if (s == upload_status_to_string(st)) return st;
    }
    return std::nullopt;
}

const char* chunk_status_to_string(ChunkStatus s) {
    switch (s) {
        case ChunkStatus::PENDING:   return "pending";
        case ChunkStatus::COMPLETED: return "completed";
        case ChunkStatus::FAILED:    return "failed";
    }
    return "unknown";
}

std::optional<ChunkStatus> chunk_status_from_string(const std::string& s) {
    if (s == "pending") return ChunkStatus::PENDING;
    if (s == "completed") return ChunkStatus::COMPLETED;
    if (s == "failed") return ChunkStatus::FAILED;
    return std::nullopt;
}

const char* queue_status_to_string(QueueStatus s) {
    switch (s) {
        case QueueStatus::PENDING:    return "pending";
        case QueueStatus::PROCESSING: return "processing";
        case QueueStatus::COMPLETED:  return "completed";
        case QueueStatus::FAILED:     return "failed";
        case QueueStatus::CANCELLED:  return "cancelled";
    }
    return "unknown";
}

std::optional<QueueStatus> queue_status_from_string(const std::string& s) {
    if (s == "pending") return QueueStatus::PENDING;
    if (s == "processing") return QueueStatus::PROCESSING;
    if (s == "completed") return QueueStatus::COMPLETED;
    if (s == "failed") return QueueStatus::FAILED;
    if (s == "cancelled") return QueueStatus::CANCELLED;
    return std::nullopt;
}

const char* draggable_type_to_string(DraggableType t) {
    switch (t) {
        case DraggableType::FOLDER: return "folder";
        case DraggableType::FILE:   return "file";
        case DraggableType::MIXED:  return "mixed";
    }
    return "unknown";
}

std::optional<DraggableType> draggable_type_from_string(const std::string& s) {
    if (s == "folder") return DraggableType::FOLDER;
    if (s == "file") return DraggableType::FILE;
    if (s == "mixed") return DraggableType::MIXED;
    return std::nullopt;
}

bool is_active_status(UploadStatus s) {
    return s == UploadStatus::UPLOADING || s == UploadStatus::ASSEMBLING ||
           s == UploadStatus::VIRUS_SCANNING || s == UploadStatus::FINALIZING;
}

bool is_terminal_status(UploadStatus s) {
    return s == UploadStatus::COMPLETED || s == UploadStatus::CANCELLED ||
           s == UploadStatus::VIRUS_DETECTED;
}

// ============================================================================
// Record helpers
// ============================================================================

int UploadSession::retry_count() const {
    if (!metadata.is_object()) return 0;
    auto it = metadata.find("retry_count");
    if (it == metadata.end() || !it->is_number_integer()) return 0;
    return it->get<int>();
}

std::string UploadSession::priority() const {
    if (!metadata.is_object()) return "normal";
    auto it = metadata.find("priority");
    if (it == metadata.end() || !it->is_string()) return "normal";
    return it->get<std::string>();
}

bool ChunkRecord::has_pending_dedup_key() const {
    return storage_key.rfind(DEDUP_PENDING_PREFIX, 0) == 0;
}

int QueueItem::pending_files() const {
    const int total = std::max(0, total_files);
    const int done = std::max(0, completed_files) + std::max(0, failed_files);
    return std::max(0, total - done);
}

double QueueItem::progress_percentage() const {
    if (total_files <= 0) return 0.0;
    const int done = std::min(std::max(0, completed_files), total_files);
    const double pct = static_cast<double>(done) / total_files * 100.0;
    return std::round(pct * 10.0) / 10.0;
}

bool QueueItem::is_active() const {
    return status == QueueStatus::PENDING || status == QueueStatus::PROCESSING;
}

static void close_batch_if_done(QueueItem& q) {
    if (q.completed_files + q.failed_files >= q.total_files) {
        q.status = q.failed_files > 0 ? QueueStatus::FAILED : QueueStatus::COMPLETED;
    }
}

void QueueItem::mark_file_completed() {
    if (completed_files + failed_files < total_files) {
        ++completed_files;
    }
    close_batch_if_done(*this);
}

void QueueItem::mark_file_failed() {
    if (completed_files + failed_files < total_files) {
        ++failed_files;
    }
    close_batch_if_done(*this);
}

// ============================================================================
// Session rules
// ============================================================================

static std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

static bool is_reserved_device_name(const std::string& filename) {
    const std::string upper = to_upper(filename);
    const size_t dot = upper.find('.');
    const std::string stem = upper.substr(0, dot);

    if (stem == "CON" || stem == "PRN" || stem == "AUX" || stem == "NUL") return true;
    if (stem.size() == 4 && (stem.compare(0, 3, "COM") == 0 || stem.compare(0, 3, "LPT") == 0)) {
        return stem[3] >= '1' && stem[3] <= '9';
    }
    return false;
}

bool is_filename_safe(const std::string& filename) {
    if (filename.empty() || filename.size() > MAX_FILENAME_LENGTH) return false;

    bool all_space = true;
    bool all_dots = true;
    for (unsigned char c : filename) {
        if (!std::isspace(c)) all_space = false;
        if (c != '.') all_dots = false;
        if (c < 0x20 || c == 0x7f) return false;
        switch (c) {
            case '<': case '>': case ':': case '"': case '|':
            case '*': case '?': case '/': case '\\':
                return false;
            default:
                break;
        }
    }
    if (all_space || all_dots) return false;
    if (filename.find("..") != std::string::npos) return false;
    return !is_reserved_device_name(filename);
}

void validate_session(const UploadSession& session) {
    std::vector<std::string> errors;

    if (session.workspace_id.empty()) errors.push_back("workspace_id is required");
    if (session.filename.empty()) {
        errors.push_back("filename is required");
    } else if (session.filename.size() > MAX_FILENAME_LENGTH) {
        errors.push_back("filename is too long (maximum is 255 characters)");
    } else if (!is_filename_safe(session.filename)) {
        errors.push_back("filename contains invalid characters or patterns");
    }
    if (session.total_size <= 0) {
        errors.push_back("total_size must be greater than 0");
    } else if (session.total_size > MAX_FILE_SIZE) {
        errors.push_back("total_size exceeds the 5 GiB limit");
    }
    if (session.chunks_count <= 0) errors.push_back("chunks_count must be greater than 0");

    if (errors.empty()) return;

    std::string msg = "Invalid upload session: ";
    for (size_t i = 0; i < errors.size(); ++i) {
        if (i > 0) msg += "; ";
        msg += errors[i];
    }
    throw ValidationError(msg);
}

void validate_chunk(const ChunkRecord& chunk) {
    if (chunk.session_id.empty()) throw ValidationError("chunk session_id is required");
    if (chunk.chunk_number <= 0) {
        throw ValidationError("chunk_number must be greater than 0, got " +
                              std::to_string(chunk.chunk_number));
    }
    if (chunk.size <= 0) {
        throw ValidationError("chunk " + std::to_string(chunk.chunk_number) + " has size " +
                              std::to_string(chunk.size));
    }
    if (chunk.checksum.empty()) {
        throw ValidationError("chunk " + std::to_string(chunk.chunk_number) + " has no checksum");
    }
    if (chunk.status == ChunkStatus::COMPLETED && chunk.storage_key.empty()) {
        throw ValidationError("completed chunk " + std::to_string(chunk.chunk_number) +
                              " has no storage key");
    }
}

int64_t recommended_chunk_size(int64_t total_size) {
    if (total_size <= 10 * MIB) return MIB;
    if (total_size < GIB) return 5 * MIB;
    if (total_size <= 5 * GIB) return 10 * MIB;
    return 25 * MIB;
}

bool is_session_expired(const UploadSession& session, SystemTime now,
                        int failed_ttl_hours, int pending_ttl_hours) {
    const double age_hours = seconds_between(session.created_at, now) / 3600.0;
    if (session.status == UploadStatus::FAILED) return age_hours > failed_ttl_hours;
    if (session.status == UploadStatus::PENDING) return age_hours > pending_ttl_hours;
    return false;
}

double session_progress_percentage(const UploadSession& session, int completed_chunks) {
    if (session.chunks_count <= 0) return 0.0;
    const int done = std::min(std::max(0, completed_chunks), session.chunks_count);
    const double pct = static_cast<double>(done) / session.chunks_count * 100.0;
    return std::round(pct * 100.0) / 100.0;
}

// ============================================================================
// JSON
// ============================================================================

void to_json(nlohmann::json& j, const UploadSession& s) {
    j = nlohmann::json{
        {"id", s.id},
        {"workspace_id", s.workspace_id},
        {"container_id", s.container_id},
        {"user_id", s.user_id},
        {"ip_address", s.ip_address},
        {"batch_id", s.batch_id},
        {"filename", s.filename},
        {"total_size", s.total_size},
        {"chunks_count", s.chunks_count},
        {"status", upload_status_to_string(s.status)},
        {"metadata", s.metadata},
        {"assembled_file_path", s.assembled_file_path},
        {"created_at_ms", to_unix_ms(s.created_at)},
        {"updated_at_ms", to_unix_ms(s.updated_at)},
    };
}

void from_json(const nlohmann::json& j, UploadSession& s) {
    s.id = j.value("id", "");
    s.workspace_id = j.value("workspace_id", "");
    s.container_id = j.value("container_id", "");
    s.user_id = j.value("user_id", "");
    s.ip_address = j.value("ip_address", "");
    s.batch_id = j.value("batch_id", "");
    s.filename = j.value("filename", "");
    s.total_size = j.value("total_size", (int64_t)0);
    s.chunks_count = j.value("chunks_count", 0);
    s.status = upload_status_from_string(j.value("status", "pending")).value_or(UploadStatus::PENDING);
    s.metadata = j.value("metadata", Metadata::object());
    s.assembled_file_path = j.value("assembled_file_path", "");
    s.created_at = from_unix_ms(j.value("created_at_ms", (int64_t)0));
    s.updated_at = from_unix_ms(j.value("updated_at_ms", (int64_t)0));
}

void to_json(nlohmann::json& j, const ChunkRecord& c) {
    j = nlohmann::json{
        {"session_id", c.session_id},
        {"chunk_number", c.chunk_number},
        {"size", c.size},
        {"checksum", c.checksum},
        {"status", chunk_status_to_string(c.status)},
        {"storage_key", c.storage_key},
        {"metadata", c.metadata},
        {"created_at_ms", to_unix_ms(c.created_at)},
        {"updated_at_ms", to_unix_ms(c.updated_at)},
    };
}

void from_json(const nlohmann::json& j, ChunkRecord& c) {
    c.session_id = j.value("session_id", "");
    c.chunk_number = j.value("chunk_number", 0);
    c.size = j.value("size", (int64_t)0);
    c.checksum = j.value("checksum", "");
    c.status = chunk_status_from_string(j.value("status", "pending")).value_or(ChunkStatus::PENDING);
    c.storage_key = j.value("storage_key", "");
    c.metadata = j.value("metadata", Metadata::object());
    c.created_at = from_unix_ms(j.value("created_at_ms", (int64_t)0));
    c.updated_at = from_unix_ms(j.value("updated_at_ms", (int64_t)0));
}

void to_json(nlohmann::json& j, const QueueItem& q) {
    j = nlohmann::json{
        {"batch_id", q.batch_id},
        {"workspace_id", q.workspace_id},
        {"user_id", q.user_id},
        {"draggable_name", q.draggable_name},
        {"draggable_type", draggable_type_to_string(q.draggable_type)},
        {"original_path", q.original_path},
        {"total_files", q.total_files},
        {"completed_files", q.completed_files},
        {"failed_files", q.failed_files},
        {"status", queue_status_to_string(q.status)},
        {"metadata", q.metadata},
        {"session_ids", q.session_ids},
        {"created_at_ms", to_unix_ms(q.created_at)},
        {"updated_at_ms", to_unix_ms(q.updated_at)},
    };
}

void from_json(const nlohmann::json& j, QueueItem& q) {
    q.batch_id = j.value("batch_id", "");
    q.workspace_id = j.value("workspace_id", "");
    q.user_id = j.value("user_id", "");
    q.draggable_name = j.value("draggable_name", "");
    q.draggable_type = draggable_type_from_string(j.value("draggable_type", "file"))
                           .value_or(DraggableType::FILE);
    q.original_path = j.value("original_path", "");
    q.total_files = j.value("total_files", 0);
    q.completed_files = j.value("completed_files", 0);
    q.failed_files = j.value("failed_files", 0);
    q.status = queue_status_from_string(j.value("status", "pending")).value_or(QueueStatus::PENDING);
    q.metadata = j.value("metadata", Metadata::object());
    q.session_ids = j.value("session_ids", std::vector<std::string>{});
    q.created_at = from_unix_ms(j.value("created_at_ms", (int64_t)0));
    q.updated_at = from_unix_ms(j.value("updated_at_ms", (int64_t)0));
}

void to_json(nlohmann::json& j, const AssetRecord& a) {
    j = nlohmann::json{
        {"id", a.id},
        {"workspace_id", a.workspace_id},
        {"container_id", a.container_id},
        {"user_id", a.user_id},
        {"filename", a.filename},
        {"file_path", a.file_path},
        {"file_size", a.file_size},
        {"content_type", a.content_type},
        {"upload_session_id", a.upload_session_id},
        {"created_at_ms", to_unix_ms(a.created_at)},
    };
}

void from_json(const nlohmann::json& j, AssetRecord& a) {
    a.id = j.value("id", "");
    a.workspace_id = j.value("workspace_id", "");
    a.container_id = j.value("container_id", "");
    a.user_id = j.value("user_id", "");
    a.filename = j.value("filename", "");
    a.file_path = j.value("file_path", "");
    a.file_size = j.value("file_size", (int64_t)0);
    a.content_type = j.value("content_type", "");
    a.upload_session_id = j.value("upload_session_id", "");
    a.created_at = from_unix_ms(j.value("created_at_ms", (int64_t)0));
}

} // namespace chunkflow
