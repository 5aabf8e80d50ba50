#include "upload_cleanup.h"
#include "config_manager.h"
#include "logger.h"
#include "telemetry.h"
#include "upload_errors.h"

#include <chrono>
#include <filesystem>
#include <set>
#include <system_error>

namespace chunkflow {

nlohmann::json CleanupSummary::to_json() const {
    return nlohmann::json{
        {"expired_sessions_removed", expired_sessions_removed},
        {"cancelled_sessions_removed", cancelled_sessions_removed},
        {"stuck_sessions_failed", stuck_sessions_failed},
        {"orphaned_chunk_dirs_removed", orphaned_chunk_dirs_removed},
        {"chunks_deleted", chunks_deleted},
        {"errors", errors},
        {"duration_seconds", duration_seconds}
    };
}

UploadCleanup::Options UploadCleanup::Options::fromConfig() {
    auto& cfg = ConfigManager::getInstance();
    Options o;
    o.failed_ttl_hours = cfg.getFailedSessionTtlHours();
    o.pending_ttl_hours = cfg.getPendingSessionTtlHours();
    o.cancelled_ttl_hours = cfg.getCancelledSessionTtlHours();
    o.stuck_assembly_hours = cfg.getStuckAssemblyHours();
    return o;
}

UploadCleanup::UploadCleanup(SessionRepository& repo, ChunkStore& store, Options options,
                             RateLimiter* rate_limiter)
    : m_repo(repo), m_store(store), m_options(options), m_rate_limiter(rate_limiter) {}

CleanupSummary UploadCleanup::run() {
    const auto start = std::chrono::steady_clock::now();
    LOG_INFO("CLEAN: starting upload cleanup");

    CleanupSummary summary;
    cleanup_expired_sessions(summary);
    cleanup_stuck_assembling_sessions(summary);
    cleanup_orphaned_chunks(summary);

    summary.duration_seconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    auto& tel = Telemetry::getInstance();
    tel.inc_counter("upload.cleanup_runs");
    tel.inc_counter("upload.cleanup_sessions_removed",
                    summary.expired_sessions_removed + summary.cancelled_sessions_removed);

    LOG_INFO("CLEAN: completed in " + std::to_string(summary.duration_seconds) + "s: " +
             summary.to_json().dump());
    return summary;
}

void UploadCleanup::remove_session(const UploadSession& session, CleanupSummary& summary) {
    LOG_DEBUG("CLEAN: removing session " + session.id + " (" + upload_status_to_string(session.status) +
              ", " + session.filename + ")");

    summary.chunks_deleted += m_store.cleanup(session.id, m_repo.live_storage_keys(session.id));

    if (!session.assembled_file_path.empty()) {
        std::error_code ec;
        std::filesystem::remove(session.assembled_file_path, ec);
        if (ec) {
            LOG_WARN("CLEAN: could not delete assembled file " + session.assembled_file_path + ": " + ec.message());
        }
    }

    release_session_slot(m_repo, m_rate_limiter, session.id);
    m_repo.remove_session(session.id);
}

int UploadCleanup::cleanup_expired_sessions(CleanupSummary& summary) {
    const SystemTime now = m_repo.now();
    int removed = 0;

    for (const auto& s : m_repo.list_sessions()) {
        const bool expired = is_session_expired(s, now, m_options.failed_ttl_hours, m_options.pending_ttl_hours);
        const bool old_cancelled = s.status == UploadStatus::CANCELLED &&
            seconds_between(s.created_at, now) > m_options.cancelled_ttl_hours * 3600.0;
        if (!expired && !old_cancelled) continue;

        try {
            remove_session(s, summary);
            if (old_cancelled) {
                ++summary.cancelled_sessions_removed;
            } else {
                ++summary.expired_sessions_removed;
            }
            ++removed;
        } catch (const std::exception& e) {
            ++summary.errors;
            LOG_ERROR("CLEAN: failed to clean up session " + s.id + ": " + e.what());
        }
    }

    LOG_INFO("CLEAN: removed " + std::to_string(removed) + " expired sessions (" +
             std::to_string(summary.errors) + " errors)");
    return removed;
}

int UploadCleanup::cleanup_stuck_assembling_sessions(CleanupSummary& summary) {
    const SystemTime now = m_repo.now();
    const double limit_seconds = m_options.stuck_assembly_hours * 3600.0;
    int failed = 0;

    for (const auto& s : m_repo.list_sessions([](const UploadSession& u) {
             return u.status == UploadStatus::ASSEMBLING;
         })) {
        if (seconds_between(s.updated_at, now) <= limit_seconds) continue;

        LOG_WARN("CLEAN: marking stuck assembling session " + s.id + " as failed");
        try {
            m_repo.apply_event(s.id, UploadEvent::FAIL, [](UploadSession& u) {
                u.metadata["failure_reason"] = "assembly timeout";
            });
            release_session_slot(m_repo, m_rate_limiter, s.id);
            ++summary.stuck_sessions_failed;
            ++failed;
        } catch (const UploadError& e) {
            ++summary.errors;
            LOG_ERROR("CLEAN: failed to mark session " + s.id + " as failed: " + e.what());
        }
    }

    if (failed > 0) {
        LOG_INFO("CLEAN: marked " + std::to_string(failed) + " stuck sessions as failed");
    }
    return failed;
}

int UploadCleanup::cleanup_orphaned_chunks(CleanupSummary& summary) {
    int removed = 0;
    const std::set<std::string> live = m_repo.live_storage_keys();
    for (const auto& session_id : m_store.stored_sessions()) {
        if (m_repo.find_session(session_id)) continue;
        try {
            summary.chunks_deleted += m_store.cleanup(session_id, live);
            ++summary.orphaned_chunk_dirs_removed;
            ++removed;
        } catch (const StorageError& e) {
            ++summary.errors;
            LOG_ERROR("CLEAN: failed to remove orphaned chunks of " + session_id + ": " + e.what());
        }
    }
    if (removed > 0) {
        LOG_INFO("CLEAN: removed " + std::to_string(removed) + " orphaned chunk directories");
    }
    return removed;
}

} // namespace chunkflow
