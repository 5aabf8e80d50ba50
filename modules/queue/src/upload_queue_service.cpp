#include "upload_queue_service.h"
#include "config_manager.h"
#include "logger.h"
#include "queue_orchestrator.h"
#include "telemetry.h"
#include "upload_errors.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <set>
#include <utility>

namespace chunkflow {

namespace {

std::string lowercase_extension(const std::string& filename) {
    std::string ext = std::filesystem::path(filename).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

bool is_folder_placeholder(const DraggableFile& f) {
    return f.size == 0 && f.type == "folder";
}

} // namespace

nlohmann::json WorkspaceQueueStats::to_json() const {
    return nlohmann::json{
        {"total_queues", total_queues},
        {"active_queues", active_queues},
        {"completed_queues", completed_queues},
        {"failed_queues", failed_queues},
        {"cancelled_queues", cancelled_queues},
        {"total_files_in_queues", total_files_in_queues},
        {"completed_files_in_queues", completed_files_in_queues},
        {"failed_files_in_queues", failed_files_in_queues}
    };
}

UploadQueueService::UploadQueueService(SessionRepository& repo, RateLimiter* rate_limiter)
    : m_repo(repo), m_rate_limiter(rate_limiter) {}

// ============================================================================
// Static helpers
// ============================================================================

std::string UploadQueueService::determine_file_type(const std::string& filename) {
    const std::string ext = lowercase_extension(filename);
    if (ext == ".mp3" || ext == ".wav" || ext == ".flac" || ext == ".aac" || ext == ".m4a") return "audio";
    if (ext == ".mp4" || ext == ".mov" || ext == ".avi" || ext == ".mkv") return "video";
    if (ext == ".jpg" || ext == ".jpeg" || ext == ".png" || ext == ".gif" || ext == ".bmp") return "image";
    if (ext == ".pdf") return "document";
    if (ext == ".zip" || ext == ".rar" || ext == ".7z") return "archive";
    return "unknown";
}

int UploadQueueService::calculate_chunks_count(int64_t file_size) {
    if (file_size <= MIB) return 1;

    int64_t chunk_size;
    if (file_size <= 10 * MIB) {
        chunk_size = MIB;
    } else if (file_size <= 100 * MIB) {
        chunk_size = 5 * MIB;
    } else if (file_size <= GIB) {
        chunk_size = 10 * MIB;
    } else {
        chunk_size = 25 * MIB;
    }
    return static_cast<int>((file_size + chunk_size - 1) / chunk_size);
}

std::vector<std::string> UploadQueueService::extract_folder_structure(const std::vector<DraggableFile>& files) {
    std::set<std::string> dirs;
    for (const auto& f : files) {
        const std::string dir = std::filesystem::path(f.path).parent_path().string();
        if (dir.empty() || dir == "." || dir == "/") continue;
        dirs.insert(dir);
    }
    std::vector<std::string> out;
    for (const auto& d : dirs) {
        if (out.size() >= MAX_FOLDER_STRUCTURE_ENTRIES) break;
        out.push_back(d);
    }
    return out;
}

void UploadQueueService::validate_draggable(const Draggable& draggable) {
    if (draggable.name.empty()) {
        throw ValidationError("draggable_name is required");
    }
    if (draggable.type.empty()) {
        throw ValidationError("draggable_type is required");
    }
    if (!draggable_type_from_string(draggable.type)) {
        throw ValidationError("draggable_type must be one of: folder, file, mixed");
    }
}

QueueItem UploadQueueService::require_batch(const std::string& batch_id) const {
    if (batch_id.empty()) {
        throw ValidationError("batch_id is required");
    }
    auto batch = m_repo.find_batch(batch_id);
    if (!batch) {
        throw ValidationError("Queue batch not found: " + batch_id);
    }
    return *batch;
}

// ============================================================================
// Batch lifecycle
// ============================================================================

QueueItem UploadQueueService::create_queue_batch(const std::string& workspace_id,
                                                 const std::string& user_id,
                                                 const std::string& ip_address,
                                                 const Draggable& draggable) {
    if (workspace_id.empty()) {
        throw ValidationError("workspace is required");
    }
    if (user_id.empty()) {
        throw ValidationError("user is required");
    }
    validate_draggable(draggable);

    std::vector<const DraggableFile*> uploadable;
    for (const auto& f : draggable.files) {
        if (is_folder_placeholder(f)) continue;
        uploadable.push_back(&f);
    }

    // Admit every session up front so a rejection leaves nothing behind
    if (m_rate_limiter) {
        size_t admitted = 0;
        try {
            for (; admitted < uploadable.size(); ++admitted) {
                m_rate_limiter->check_session_creation(user_id, ip_address);
            }
        } catch (const RateLimitExceeded& e) {
            for (size_t i = 0; i < admitted; ++i) {
                m_rate_limiter->track_session_completion(user_id, ip_address);
            }
            LOG_WARN("UQS: batch '" + draggable.name + "' rejected after " + std::to_string(admitted) +
                     " sessions: " + e.what());
            throw;
        }
    }

    QueueItem batch;
    batch.workspace_id = workspace_id;
    batch.user_id = user_id;
    batch.draggable_name = draggable.name;
    batch.draggable_type = *draggable_type_from_string(draggable.type);
    batch.original_path = draggable.original_path;
    batch.total_files = static_cast<int>(uploadable.size());
    batch.status = QueueStatus::PENDING;

    nlohmann::json meta = nlohmann::json::object();
    meta["upload_source"] = "unknown";
    meta["client_info"] = nlohmann::json::object();
    meta["original_folder_structure"] = extract_folder_structure(draggable.files);
    meta["created_by_service"] = "UploadQueueService";
    if (draggable.metadata.is_object()) {
        meta.update(draggable.metadata);
    }
    batch.metadata = meta;
    batch = m_repo.create_batch(batch);

    std::vector<std::string> session_ids;
    for (const DraggableFile* f : uploadable) {
        UploadSession s;
        s.workspace_id = workspace_id;
        s.container_id = draggable.container_id;
        s.user_id = user_id;
        s.ip_address = ip_address;
        s.batch_id = batch.batch_id;
        s.filename = f->name;
        s.total_size = std::max<int64_t>(f->size, 1);
        s.chunks_count = calculate_chunks_count(s.total_size);
        s.status = UploadStatus::PENDING;
        s.metadata["original_path"] = f->path;
        s.metadata["file_type"] = f->type.empty() ? determine_file_type(f->name) : f->type;
        s.metadata["created_by_service"] = "UploadQueueService";
        s.metadata["queue_context"] = {
            {"batch_id", batch.batch_id},
            {"draggable_name", batch.draggable_name}
        };

        try {
            session_ids.push_back(m_repo.create_session(std::move(s)).id);
        } catch (const ValidationError& e) {
            // Slots admitted for this file and the ones after it go unused
            if (m_rate_limiter) {
                for (size_t i = session_ids.size(); i < uploadable.size(); ++i) {
                    m_rate_limiter->track_session_completion(user_id, ip_address);
                }
            }
            for (const auto& id : session_ids) {
                release_session_slot(m_repo, m_rate_limiter, id);
                m_repo.remove_session(id);
            }
            m_repo.update_batch(batch.batch_id, [](QueueItem& q) {
                q.status = QueueStatus::FAILED;
                q.total_files = 0;
            });
            LOG_ERROR("UQS: failed to create session for '" + f->name + "': " + e.what());
            throw;
        }
    }

    auto stored = m_repo.update_batch(batch.batch_id, [&session_ids](QueueItem& q) { q.session_ids = session_ids; });
    Telemetry::getInstance().inc_counter("upload.batches_created");
    LOG_INFO("UQS: created queue batch " + batch.batch_id + " with " + std::to_string(session_ids.size()) + " files");
    return stored ? *stored : batch;
}

QueueItem UploadQueueService::create_queue_batch(const std::string& workspace_id,
                                                 const std::string& user_id,
                                                 const std::string& ip_address,
                                                 const Draggable& draggable,
                                                 const PreflightVerdict& verdict) {
    if (!verdict.allowed) {
        std::string reason = "Upload not allowed";
        for (size_t i = 0; i < verdict.warnings.size(); ++i) {
            reason += (i == 0 ? ": " : "; ") + verdict.warnings[i];
        }
        throw ValidationError(reason);
    }
    for (const auto& w : verdict.warnings) {
        LOG_WARN("UQS: preflight warning for '" + draggable.name + "': " + w);
    }

    Draggable annotated = draggable;
    if (!verdict.warnings.empty()) {
        if (!annotated.metadata.is_object()) annotated.metadata = nlohmann::json::object();
        annotated.metadata["preflight_warnings"] = verdict.warnings;
    }
    return create_queue_batch(workspace_id, user_id, ip_address, annotated);
}

QueueItem UploadQueueService::start_queue_processing(const std::string& batch_id) {
    const QueueItem batch = require_batch(batch_id);
    if (batch.status != QueueStatus::PENDING) {
        throw ValidationError("Queue item must be in pending state to start processing. Current state: " +
                              std::string(queue_status_to_string(batch.status)));
    }

    if (batch.total_files == 0) {
        LOG_INFO("UQS: empty queue " + batch_id + " marked as completed");
        return *m_repo.update_batch(batch_id, [](QueueItem& q) { q.status = QueueStatus::COMPLETED; });
    }

    auto updated = m_repo.update_batch(batch_id, [](QueueItem& q) { q.status = QueueStatus::PROCESSING; });
    for (const auto& s : m_repo.sessions_for_batch(batch_id)) {
        if (s.status != UploadStatus::PENDING) continue;
        try {
            m_repo.apply_event(s.id, UploadEvent::START_UPLOAD);
            LOG_DEBUG("UQS: started upload session " + s.id);
        } catch (const InvalidTransition& e) {
            LOG_WARN("UQS: could not start session " + s.id + ": " + e.what());
        }
    }
    LOG_INFO("UQS: started processing queue " + batch_id);
    return updated ? *updated : batch;
}

QueueItem UploadQueueService::cancel_queue(const std::string& batch_id) {
    require_batch(batch_id);

    int cancelled = 0;
    for (const auto& s : m_repo.sessions_for_batch(batch_id)) {
        if (s.status != UploadStatus::PENDING && !is_active_status(s.status)) continue;
        try {
            m_repo.apply_event(s.id, UploadEvent::CANCEL);
            release_session_slot(m_repo, m_rate_limiter, s.id);
            ++cancelled;
        } catch (const UploadError& e) {
            LOG_ERROR("UQS: failed to cancel session " + s.id + ": " + e.what());
        }
    }
    auto updated = m_repo.update_batch(batch_id, [](QueueItem& q) { q.status = QueueStatus::CANCELLED; });
    LOG_INFO("UQS: cancelled queue " + batch_id + " (" + std::to_string(cancelled) + " sessions)");
    return *updated;
}

QueueItem UploadQueueService::retry_failed_queue(const std::string& batch_id) {
    const QueueItem batch = require_batch(batch_id);
    if (batch.status == QueueStatus::CANCELLED) {
        throw ValidationError("Cancelled queue " + batch_id + " cannot be retried");
    }
    const int attempts = std::min(ConfigManager::getInstance().getQueueRetryAttempts(), MAX_RETRY_ATTEMPTS);

    int retried = 0;
    for (const auto& s : m_repo.sessions_for_batch(batch_id)) {
        if (s.status != UploadStatus::FAILED) continue;
        const int retry_count = s.retry_count();
        if (retry_count >= attempts) {
            LOG_INFO("UQS: session " + s.id + " (" + s.filename + "): maximum retry attempts reached");
            continue;
        }
        try {
            m_repo.apply_event(s.id, UploadEvent::RETRY, [retry_count](UploadSession& u) {
                u.metadata["retry_count"] = retry_count + 1;
                u.metadata.erase("failure_reason");
            });
            ++retried;
        } catch (const InvalidTransition& e) {
            LOG_WARN("UQS: could not retry session " + s.id + ": " + e.what());
        }
    }

    auto updated = m_repo.update_batch(batch_id, [retried](QueueItem& q) {
        q.failed_files = std::max(0, q.failed_files - retried);
        q.status = QueueStatus::PENDING;
    });
    LOG_INFO("UQS: retrying queue " + batch_id + " (" + std::to_string(retried) + " sessions)");
    return *updated;
}

// ============================================================================
// Reporting
// ============================================================================

nlohmann::json UploadQueueService::get_queue_status(const std::string& batch_id) const {
    const QueueItem batch = require_batch(batch_id);

    nlohmann::json sessions = nlohmann::json::array();
    for (const auto& s : m_repo.sessions_for_batch(batch_id)) {
        int64_t uploaded = 0;
        int completed = 0;
        for (const auto& c : m_repo.chunks_for_session(s.id)) {
            if (c.status != ChunkStatus::COMPLETED) continue;
            uploaded += c.size;
            ++completed;
        }
        sessions.push_back({
            {"id", s.id},
            {"filename", s.filename},
            {"status", upload_status_to_string(s.status)},
            {"progress_percentage", session_progress_percentage(s, completed)},
            {"total_size", s.total_size},
            {"uploaded_size", uploaded}
        });
    }

    return nlohmann::json{
        {"batch_id", batch.batch_id},
        {"draggable_name", batch.draggable_name},
        {"draggable_type", draggable_type_to_string(batch.draggable_type)},
        {"status", queue_status_to_string(batch.status)},
        {"total_files", batch.total_files},
        {"completed_files", batch.completed_files},
        {"failed_files", batch.failed_files},
        {"pending_files", batch.pending_files()},
        {"progress_percentage", batch.progress_percentage()},
        {"original_path", batch.original_path},
        {"created_at", to_iso8601(batch.created_at)},
        {"updated_at", to_iso8601(batch.updated_at)},
        {"metadata", batch.metadata},
        {"upload_sessions", sessions}
    };
}

std::vector<QueueItem> UploadQueueService::list_active_queues(const std::string& workspace_id) const {
    std::vector<QueueItem> out;
    for (auto& q : m_repo.list_batches(workspace_id)) {
        if (q.is_active()) out.push_back(std::move(q));
    }
    std::sort(out.begin(), out.end(), [](const QueueItem& a, const QueueItem& b) {
        return a.created_at > b.created_at;
    });
    return out;
}

WorkspaceQueueStats UploadQueueService::workspace_stats(const std::string& workspace_id) const {
    WorkspaceQueueStats stats;
    for (const auto& q : m_repo.list_batches(workspace_id)) {
        ++stats.total_queues;
        switch (q.status) {
            case QueueStatus::PENDING:
            case QueueStatus::PROCESSING: ++stats.active_queues; break;
            case QueueStatus::COMPLETED:  ++stats.completed_queues; break;
            case QueueStatus::FAILED:     ++stats.failed_queues; break;
            case QueueStatus::CANCELLED:  ++stats.cancelled_queues; break;
        }
        stats.total_files_in_queues += q.total_files;
        stats.completed_files_in_queues += q.completed_files;
        stats.failed_files_in_queues += q.failed_files;
    }
    return stats;
}

} // namespace chunkflow
