#ifndef CHUNKFLOW_QUEUE_ORCHESTRATOR_H
#define CHUNKFLOW_QUEUE_ORCHESTRATOR_H

#include "assembler.h"
#include "chunk_source.h"
#include "parallel_transfer_engine.h"
#include "progress_tracker.h"
#include "rate_limiter.h"
#include "resource_monitor.h"
#include "scan_gate.h"
#include "session_repository.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace chunkflow {

constexpr int DEFAULT_MAX_CONCURRENT_UPLOADS = 3;
constexpr int DEFAULT_QUEUE_BANDWIDTH_KBPS = 10000;
constexpr int DEFAULT_RETRY_ATTEMPTS = 3;
constexpr int MAX_RETRY_ATTEMPTS = 5;

enum class PriorityStrategy {
    FIFO,
    SMALLEST_FIRST,
    LARGEST_FIRST,
    INTERLEAVED
};

const char* priority_strategy_to_string(PriorityStrategy s);
std::optional<PriorityStrategy> priority_strategy_from_string(const std::string& s);

enum class ErrorClass {
    TIMEOUT,
    OUT_OF_SPACE,
    STORAGE_LAYER,
    UNKNOWN
};

struct ErrorClassification {
    ErrorClass error_class = ErrorClass::UNKNOWN;
    std::string recovery_suggestion;
    std::string retry_recommendation;
};

struct QueueProcessResult {
    bool success = false;
    int total_uploads = 0;
    int completed_uploads = 0;
    int failed_uploads = 0;
    int paused_uploads = 0;
    std::vector<std::string> errors;
    std::vector<std::string> recovery_suggestions;
    std::vector<std::string> retry_recommendations;
    double total_processing_time = 0.0;
    double average_upload_speed = 0.0;
    std::optional<FinalMetrics> final_metrics;

    nlohmann::json to_json() const;
};

struct PauseResult {
    bool success = true;
    int paused_sessions = 0;
    int skipped_sessions = 0;
    std::vector<std::string> errors;
};

struct ResumeResult {
    bool success = true;
    int resumed_sessions = 0;
    int skipped_sessions = 0;
    std::vector<std::string> errors;
};

struct CancelResult {
    bool success = true;
    int cancelled_sessions = 0;
    int preserved_sessions = 0;
    std::vector<std::string> errors;
};

struct RetryResult {
    bool success = true;
    int retried_count = 0;
    int skipped_count = 0;
    std::vector<std::string> errors;
    std::vector<std::string> messages;
};

struct BandwidthAllocation {
    int per_stream_limit = 0;
    int total_allocated = 0;
    int streams = 0;
};

struct CleanupReport {
    bool success = false;
    std::vector<std::string> cleanup_actions;
    FinalMetrics final_metrics;
};

/**
 * Drives the sessions of one queue batch through transfer, assembly, scan and
 * finalization.
 *
 * Sessions are ordered by a priority strategy and split into groups balanced
 * by chunk count; groups run concurrently on the orchestrator's own pool while
 * each group processes its sessions in order. A session failure is classified,
 * recorded and marks that session failed; it never aborts the batch.
 *
 * bandwidth_limit_kbps caps the engine's BandwidthGovernor at the start of a
 * run; every group's streams then share that one limit.
 *
 * pause() and cancel() are cooperative: a running process_queue() stops
 * taking new work and in-flight sessions stop at their next stage boundary.
 */
class QueueOrchestrator {
public:
    struct Options {
        int max_concurrent_uploads = DEFAULT_MAX_CONCURRENT_UPLOADS;
        int bandwidth_limit_kbps = DEFAULT_QUEUE_BANDWIDTH_KBPS;
        int retry_attempts = DEFAULT_RETRY_ATTEMPTS;
        PriorityStrategy strategy = PriorityStrategy::SMALLEST_FIRST;
        double high_cpu_threshold = 0.85;
        double high_memory_threshold = 0.80;
        double min_upload_speed_kbps = 100.0;

        static Options fromConfig();
    };

    using ProgressCallback = std::function<void(const ProgressSnapshot&, const UploadSession&)>;

    QueueOrchestrator(std::string batch_id,
                      SessionRepository& repo,
                      ParallelTransferEngine& engine,
                      Assembler& assembler,
                      ScanGate& scan_gate,
                      ChunkSource& source,
                      Options options,
                      ResourceMonitor* monitor = nullptr,
                      RateLimiter* rate_limiter = nullptr,
                      std::shared_ptr<Clock> clock = SystemClock::shared());

    QueueOrchestrator(const QueueOrchestrator&) = delete;
    QueueOrchestrator& operator=(const QueueOrchestrator&) = delete;

    // Uses the configured strategy.
    QueueProcessResult process_queue();
    QueueProcessResult process_with_priority_order(PriorityStrategy strategy,
                                                   const ProgressCallback& callback = nullptr);

    PauseResult pause_queue();
    ResumeResult resume_queue();
    CancelResult cancel_queue();
    RetryResult retry_failed_uploads();

    ProgressSnapshot calculate_current_progress();
    CleanupReport cleanup_and_finalize();

    // Split of the engine's governor limit (bandwidth_limit_kbps without one)
    BandwidthAllocation calculate_bandwidth_allocation(int concurrent_streams) const;
    // max_concurrent_uploads, lowered by one (min 1) under resource pressure
    int calculate_optimal_concurrency();
    // high -> normal -> low, stable within a priority
    static std::vector<UploadSession> prioritize_for_resource_constraints(std::vector<UploadSession> sessions);
    static std::vector<UploadSession> prioritize_sessions(std::vector<UploadSession> sessions,
                                                          PriorityStrategy strategy);
    // Largest chunk count first into the lightest group
    static std::vector<std::vector<UploadSession>> concurrency_groups(const std::vector<UploadSession>& sessions,
                                                                      int max_groups);
    static ErrorClassification classify_error(const std::exception& error);

    ProgressTracker& progress_tracker() { return m_tracker; }
    const Options& options() const { return m_options; }
    bool is_paused() const { return m_paused.load(); }
    bool is_cancelled() const { return m_cancelled.load(); }

private:
    enum class Outcome { COMPLETED, FAILED, VIRUS_DETECTED, INTERRUPTED };

    Outcome drive_session(const std::string& session_id);
    void transfer_session(const UploadSession& session);
    bool interrupted() const;
    // Lower the shared governor to bandwidth_limit_kbps when it runs above it
    void apply_bandwidth_ceiling();

    void record_outcome(const UploadSession& session, Outcome outcome, QueueProcessResult& result);
    void handle_upload_error(const UploadSession& session, const std::exception& error,
                             QueueProcessResult& result);
    void handle_processing_error(const std::exception& error, QueueProcessResult& result);
    void update_batch_status(QueueStatus status);
    void finish_run(QueueProcessResult& result);

    std::string m_batch_id;
    SessionRepository& m_repo;
    ParallelTransferEngine& m_engine;
    Assembler& m_assembler;
    ScanGate& m_scan_gate;
    ChunkSource& m_source;
    Options m_options;
    ResourceMonitor* m_monitor;
    RateLimiter* m_rate_limiter;
    std::shared_ptr<Clock> m_clock;
    ProgressTracker m_tracker;

    std::atomic<bool> m_paused{false};
    std::atomic<bool> m_cancelled{false};
    std::mutex m_result_mutex;
};

} // namespace chunkflow

#endif // CHUNKFLOW_QUEUE_ORCHESTRATOR_H
