#ifndef CHUNKFLOW_PARALLEL_TRANSFER_ENGINE_H
#define CHUNKFLOW_PARALLEL_TRANSFER_ENGINE_H

#include "bandwidth_governor.h"
#include "chunk_store.h"
#include "dedup_index.h"
#include "rate_limiter.h"
#include "session_repository.h"
#include "upload_types.h"
#include "worker_pool.h"

#include <nlohmann/json.hpp>

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace chunkflow {

struct ChunkTransferResult {
    int chunk_number = 0;
    bool success = false;
    bool deduplicated = false;
    bool retryable = true;          // false for validation, rate-limit and cancellation failures
    int attempts = 0;
    int64_t size = 0;
    std::string storage_key;
    std::string error;
};

struct SessionTransferResult {
    std::string session_id;
    std::vector<ChunkTransferResult> chunks;   // sorted by chunk_number
    int succeeded = 0;
    int failed = 0;
    int deduplicated = 0;
    int64_t bytes_transferred = 0;             // bytes actually stored (dedup excluded)
    double duration_seconds = 0.0;
    bool assembly_ready = false;               // session moved to assembling
    UploadStatus status = UploadStatus::PENDING;
    DedupStats dedup_stats;
    std::string failure_reason;                // set when the integrity guard failed

    bool all_succeeded() const { return failed == 0; }
    nlohmann::json to_json() const;
};

struct TransferStatusReport {
    int total_chunks = 0;
    int completed_chunks = 0;
    int failed_chunks = 0;
    int pending_chunks = 0;
    std::vector<int> missing_chunks;
    double progress_percentage = 0.0;
    UploadStatus status = UploadStatus::PENDING;

    nlohmann::json to_json() const;
};

/**
 * Uploads the chunks of one session through a shared WorkerPool.
 *
 * Payloads are split into batches of max_concurrent; each batch runs in
 * parallel and is joined before the next starts. Per-chunk failures are
 * captured as results, retried within the call up to retry_attempts, and
 * never abort sibling transfers. The completeness check and the move to
 * assembling run under a per-session mutex. Each batch's streams share the
 * BandwidthGovernor limit with every other session's, and the limit adapts
 * to the measured store speed after each batch.
 */
class ParallelTransferEngine {
public:
    struct Options {
        int max_concurrent = 4;
        int retry_attempts = 2;
        bool verify_checksums = true;

        static Options fromConfig();
    };

    using SleepFn = std::function<void(double seconds)>;

    // rate_limiter and bandwidth may be null (no admission control / no throttling)
    ParallelTransferEngine(SessionRepository& repo,
                           ChunkStore& store,
                           const DeduplicationIndex& dedup,
                           RateLimiter* rate_limiter,
                           BandwidthGovernor* bandwidth,
                           WorkerPool& pool,
                           Options options,
                           SleepFn sleep_fn = nullptr);

    /**
     * @throws ValidationError for an unknown session
     * @throws InvalidTransition when the session is not pending/uploading
     */
    SessionTransferResult upload_chunks(const std::string& session_id,
                                        const std::vector<ChunkPayload>& chunks);

    // Re-submit only the payloads whose chunk record is currently failed.
    SessionTransferResult retry_failed_chunks(const std::string& session_id,
                                              const std::vector<ChunkPayload>& chunks);

    // Resolve dedup placeholders and, if every chunk is present and intact,
    // move the session to assembling. Returns true when it did.
    bool try_begin_assembly(const std::string& session_id, std::string* failure_reason = nullptr);

    TransferStatusReport upload_status(const std::string& session_id) const;

    const Options& options() const { return m_options; }
    BandwidthGovernor* bandwidth() const { return m_bandwidth; }
    // Sessions holding a per-session mutex (dropped once transfer is over)
    size_t tracked_sessions() const;

private:
    ChunkTransferResult transfer_one(const UploadSession& session, const ChunkPayload& payload);
    std::vector<ChunkTransferResult> run_batches(const UploadSession& session,
                                                 const std::vector<const ChunkPayload*>& payloads);
    void mark_chunk_failed(const UploadSession& session, const ChunkPayload& payload,
                           const std::string& error);
    std::shared_ptr<std::mutex> session_mutex(const std::string& session_id);
    void release_session_mutex(const std::string& session_id);

    SessionRepository& m_repo;
    ChunkStore& m_store;
    const DeduplicationIndex& m_dedup;
    RateLimiter* m_rate_limiter;
    BandwidthGovernor* m_bandwidth;
    WorkerPool& m_pool;
    Options m_options;
    SleepFn m_sleep;

    mutable std::mutex m_locks_mutex;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> m_session_locks;
};

} // namespace chunkflow

#endif // CHUNKFLOW_PARALLEL_TRANSFER_ENGINE_H
