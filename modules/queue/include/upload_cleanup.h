#ifndef CHUNKFLOW_UPLOAD_CLEANUP_H
#define CHUNKFLOW_UPLOAD_CLEANUP_H

#include "chunk_store.h"
#include "rate_limiter.h"
#include "session_repository.h"

#include <nlohmann/json.hpp>

#include <string>

namespace chunkflow {

struct CleanupSummary {
    int expired_sessions_removed = 0;     // failed or pending past their TTL
    int cancelled_sessions_removed = 0;
    int stuck_sessions_failed = 0;
    int orphaned_chunk_dirs_removed = 0;
    int chunks_deleted = 0;
    int errors = 0;
    double duration_seconds = 0.0;

    nlohmann::json to_json() const;
};

/**
 * Periodic sweeper over the session repository and chunk store.
 * Every step is best effort: a failure on one item is logged and counted,
 * and the sweep moves on.
 */
class UploadCleanup {
public:
    struct Options {
        int failed_ttl_hours = 24;
        int pending_ttl_hours = 1;
        int cancelled_ttl_hours = 24;
        int stuck_assembly_hours = 1;

        static Options fromConfig();
    };

    UploadCleanup(SessionRepository& repo, ChunkStore& store, Options options,
                  RateLimiter* rate_limiter = nullptr);

    CleanupSummary run();

    int cleanup_expired_sessions(CleanupSummary& summary);
    int cleanup_stuck_assembling_sessions(CleanupSummary& summary);
    int cleanup_orphaned_chunks(CleanupSummary& summary);

private:
    void remove_session(const UploadSession& session, CleanupSummary& summary);

    SessionRepository& m_repo;
    ChunkStore& m_store;
    Options m_options;
    RateLimiter* m_rate_limiter;
};

} // namespace chunkflow

#endif // CHUNKFLOW_UPLOAD_CLEANUP_H
