#include "queue_orchestrator.h"
#include "config_manager.h"
#include "logger.h"
#include "telemetry.h"
#include "upload_errors.h"
#include "worker_pool.h"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <future>
#include <map>
#include <numeric>

namespace chunkflow {

namespace {

int priority_rank(const UploadSession& s) {
    const std::string p = s.priority();
    if (p == "high") return 0;
    if (p == "low") return 2;
    return 1;
}

// Upper bound on stage steps for one session in one run
constexpr int kMaxDriveSteps = 8;

} // namespace

const char* priority_strategy_to_string(PriorityStrategy s) {
    switch (s) {
        case PriorityStrategy::FIFO:           return "fifo";
        case PriorityStrategy::SMALLEST_FIRST: return "smallest_first";
        case PriorityStrategy::LARGEST_FIRST:  return "largest_first";
        case PriorityStrategy::INTERLEAVED:    return "interleaved";
    }
    return "fifo";
}

std::optional<PriorityStrategy> priority_strategy_from_string(const std::string& s) {
    if (s == "fifo") return PriorityStrategy::FIFO;
    if (s == "smallest_first") return PriorityStrategy::SMALLEST_FIRST;
    if (s == "largest_first") return PriorityStrategy::LARGEST_FIRST;
    if (s == "interleaved") return PriorityStrategy::INTERLEAVED;
    return std::nullopt;
}

nlohmann::json QueueProcessResult::to_json() const {
    nlohmann::json j{
        {"success", success},
        {"total_uploads", total_uploads},
        {"completed_uploads", completed_uploads},
        {"failed_uploads", failed_uploads},
        {"paused_uploads", paused_uploads},
        {"errors", errors},
        {"recovery_suggestions", recovery_suggestions},
        {"retry_recommendations", retry_recommendations},
        {"total_processing_time", total_processing_time},
        {"average_upload_speed", average_upload_speed}
    };
    if (final_metrics) j["final_metrics"] = final_metrics->to_json();
    return j;
}

QueueOrchestrator::Options QueueOrchestrator::Options::fromConfig() {
    auto& cfg = ConfigManager::getInstance();
    Options o;
    o.max_concurrent_uploads = std::max(1, cfg.getQueueMaxConcurrentUploads());
    o.bandwidth_limit_kbps = cfg.getQueueBandwidthLimitKbps();
    o.retry_attempts = std::min(cfg.getQueueRetryAttempts(), MAX_RETRY_ATTEMPTS);
    const std::string strategy = cfg.getQueuePriorityStrategy();
    auto parsed = priority_strategy_from_string(strategy);
    if (!parsed) {
        LOG_WARN("QO: unknown priority strategy '" + strategy + "', using smallest_first");
    }
    o.strategy = parsed.value_or(PriorityStrategy::SMALLEST_FIRST);
    o.high_cpu_threshold = cfg.getHighCpuThreshold();
    o.high_memory_threshold = cfg.getHighMemoryThreshold();
    o.min_upload_speed_kbps = cfg.getMinUploadSpeedKbps();
    return o;
}

QueueOrchestrator::QueueOrchestrator(std::string batch_id,
                                     SessionRepository& repo,
                                     ParallelTransferEngine& engine,
                                     Assembler& assembler,
                                     ScanGate& scan_gate,
                                     ChunkSource& source,
                                     Options options,
                                     ResourceMonitor* monitor,
                                     RateLimiter* rate_limiter,
                                     std::shared_ptr<Clock> clock)
    : m_batch_id(std::move(batch_id)),
      m_repo(repo),
      m_engine(engine),
      m_assembler(assembler),
      m_scan_gate(scan_gate),
      m_source(source),
      m_options(options),
      m_monitor(monitor),
      m_rate_limiter(rate_limiter),
      m_clock(clock ? std::move(clock) : SystemClock::shared()),
      m_tracker(m_batch_id, repo, repo, m_clock, ProgressTracker::Options::fromConfig()) {
    if (m_batch_id.empty()) {
        throw ValidationError("Queue batch id is required");
    }
    m_options.max_concurrent_uploads = std::max(1, m_options.max_concurrent_uploads);
    m_options.retry_attempts = std::max(0, std::min(m_options.retry_attempts, MAX_RETRY_ATTEMPTS));
}

// ============================================================================
// Ordering and grouping
// ============================================================================

std::vector<UploadSession> QueueOrchestrator::prioritize_sessions(std::vector<UploadSession> sessions,
                                                                  PriorityStrategy strategy) {
    auto by_size = [](const UploadSession& a, const UploadSession& b) { return a.total_size < b.total_size; };

    switch (strategy) {
        case PriorityStrategy::FIFO:
            return sessions;
        case PriorityStrategy::SMALLEST_FIRST:
            std::stable_sort(sessions.begin(), sessions.end(), by_size);
            return sessions;
        case PriorityStrategy::LARGEST_FIRST:
            std::stable_sort(sessions.begin(), sessions.end(),
                             [](const UploadSession& a, const UploadSession& b) { return a.total_size > b.total_size; });
            return sessions;
        case PriorityStrategy::INTERLEAVED: {
            std::vector<UploadSession> small = sessions;
            std::stable_sort(small.begin(), small.end(), by_size);
            std::vector<UploadSession> large(small.rbegin(), small.rend());

            std::vector<UploadSession> out;
            std::set<std::string> seen;
            for (size_t i = 0; i < small.size(); ++i) {
                if (seen.insert(small[i].id).second) out.push_back(small[i]);
                if (seen.insert(large[i].id).second) out.push_back(large[i]);
            }
            return out;
        }
    }
    return sessions;
}

std::vector<UploadSession> QueueOrchestrator::prioritize_for_resource_constraints(std::vector<UploadSession> sessions) {
    std::stable_sort(sessions.begin(), sessions.end(), [](const UploadSession& a, const UploadSession& b) {
        return priority_rank(a) < priority_rank(b);
    });
    return sessions;
}

std::vector<std::vector<UploadSession>> QueueOrchestrator::concurrency_groups(
    const std::vector<UploadSession>& sessions, int max_groups) {

    std::vector<std::vector<UploadSession>> groups;
    if (sessions.empty()) return groups;

    const size_t n = std::min(sessions.size(), static_cast<size_t>(std::max(1, max_groups)));
    std::vector<std::vector<size_t>> members(n);
    std::vector<int64_t> load(n, 0);

    std::vector<size_t> order(sessions.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&sessions](size_t a, size_t b) {
        return sessions[a].chunks_count > sessions[b].chunks_count;
    });

    for (size_t idx : order) {
        const size_t target = static_cast<size_t>(std::min_element(load.begin(), load.end()) - load.begin());
        members[target].push_back(idx);
        load[target] += std::max(1, sessions[idx].chunks_count);
    }

    // Within a group, keep the priority order
    for (auto& m : members) {
        if (m.empty()) continue;
        std::sort(m.begin(), m.end());
        std::vector<UploadSession> group;
        for (size_t idx : m) group.push_back(sessions[idx]);
        groups.push_back(std::move(group));
    }
    return groups;
}

// ============================================================================
// Resource adaptation
// ============================================================================

BandwidthAllocation QueueOrchestrator::calculate_bandwidth_allocation(int concurrent_streams) const {
    BandwidthAllocation a;
    a.streams = std::max(1, concurrent_streams);
    const BandwidthGovernor* governor = m_engine.bandwidth();
    a.total_allocated = governor ? governor->limit_kbps() : m_options.bandwidth_limit_kbps;
    a.per_stream_limit = a.total_allocated / a.streams;
    return a;
}

void QueueOrchestrator::apply_bandwidth_ceiling() {
    BandwidthGovernor* governor = m_engine.bandwidth();
    const int ceiling = m_options.bandwidth_limit_kbps;
    if (!governor || ceiling <= 0) return;

    const int current = governor->limit_kbps();
    if (current == 0 || current > ceiling) {
        LOG_INFO("QO: capping bandwidth at " + std::to_string(ceiling) + " KB/s for batch " + m_batch_id);
        governor->set_limit_kbps(ceiling);
    }
}

int QueueOrchestrator::calculate_optimal_concurrency() {
    const int configured = m_options.max_concurrent_uploads;

    ResourceSample sample;
    if (m_monitor) sample = m_monitor->sample();

    const double speed = m_tracker.tracking_active() ? m_tracker.average_upload_speed() : 0.0;
    const bool slow = speed > 0.0 && speed < m_options.min_upload_speed_kbps;

    if (sample.cpu_usage > m_options.high_cpu_threshold ||
        sample.memory_usage > m_options.high_memory_threshold || slow) {
        const int reduced = std::max(configured - 1, 1);
        LOG_INFO("QO: reducing concurrency " + std::to_string(configured) + " -> " + std::to_string(reduced) +
                 " (cpu=" + std::to_string(sample.cpu_usage) + " mem=" + std::to_string(sample.memory_usage) +
                 " speed=" + std::to_string(speed) + " KB/s)");
        return reduced;
    }
    return configured;
}

// ============================================================================
// Error classification
// ============================================================================

ErrorClassification QueueOrchestrator::classify_error(const std::exception& error) {
    ErrorClassification c;
    if (dynamic_cast<const TransferTimeout*>(&error)) {
        c.error_class = ErrorClass::TIMEOUT;
        c.recovery_suggestion = "Check network connection and retry";
        c.retry_recommendation = "Network timeout - retry upload";
    } else if (auto* storage = dynamic_cast<const StorageError*>(&error)) {
        if (storage->cause() == StorageCause::NO_SPACE) {
            c.error_class = ErrorClass::OUT_OF_SPACE;
            c.recovery_suggestion = "Free up storage space and retry";
            c.retry_recommendation = "Storage full - free space and retry";
        } else {
            c.error_class = ErrorClass::STORAGE_LAYER;
            c.recovery_suggestion = "Database connection issue - retry queue";
            c.retry_recommendation = "Database error - retry processing";
        }
    } else if (dynamic_cast<const ChunkNotFoundError*>(&error)) {
        c.error_class = ErrorClass::STORAGE_LAYER;
        c.recovery_suggestion = "Database connection issue - retry queue";
        c.retry_recommendation = "Database error - retry processing";
    } else {
        c.error_class = ErrorClass::UNKNOWN;
        c.recovery_suggestion = "Unknown error - check logs and retry";
        c.retry_recommendation = "Unknown error - check logs and retry";
    }
    return c;
}

void QueueOrchestrator::handle_upload_error(const UploadSession& session, const std::exception& error,
                                            QueueProcessResult& result) {
    const ErrorClassification c = classify_error(error);
    {
        std::lock_guard<std::mutex> lock(m_result_mutex);
        ++result.failed_uploads;
        result.errors.push_back(session.filename + ": " + error.what());
        result.recovery_suggestions.push_back(c.recovery_suggestion);
        result.retry_recommendations.push_back(c.retry_recommendation);
    }

    const std::string reason = error.what();
    try {
        m_repo.apply_event(session.id, UploadEvent::FAIL, [&reason](UploadSession& s) {
            if (!s.metadata.contains("failure_reason")) s.metadata["failure_reason"] = reason;
        });
    } catch (const UploadError& e) {
        LOG_ERROR("QO: failed to update session status for " + session.id + ": " + e.what());
    }
    m_repo.update_batch(m_batch_id, [](QueueItem& q) { q.mark_file_failed(); });
    release_session_slot(m_repo, m_rate_limiter, session.id);

    Telemetry::getInstance().inc_counter("upload.sessions_failed");
    LOG_ERROR("QO: upload failed for " + session.filename + ": " + reason);
}

void QueueOrchestrator::handle_processing_error(const std::exception& error, QueueProcessResult& result) {
    const ErrorClassification c = classify_error(error);
    std::lock_guard<std::mutex> lock(m_result_mutex);
    result.success = false;
    result.errors.push_back(std::string("Queue processing failed: ") + error.what());
    switch (c.error_class) {
        case ErrorClass::TIMEOUT:
            result.recovery_suggestions.push_back("Check network connection and retry processing");
            result.retry_recommendations.push_back("Network timeout - retry queue processing");
            break;
        case ErrorClass::OUT_OF_SPACE:
            result.recovery_suggestions.push_back("Free up storage space and retry processing");
            result.retry_recommendations.push_back("Storage full - free space and retry");
            break;
        case ErrorClass::STORAGE_LAYER:
            result.recovery_suggestions.push_back("Database connection issue - retry queue processing");
            result.retry_recommendations.push_back("Database error - retry processing");
            break;
        case ErrorClass::UNKNOWN:
            result.recovery_suggestions.push_back("Unknown processing error - check logs and retry");
            result.retry_recommendations.push_back("Processing failed - check logs and retry queue");
            break;
    }
    LOG_ERROR(std::string("QO: queue processing error: ") + error.what());
}

// ============================================================================
// Processing
// ============================================================================

bool QueueOrchestrator::interrupted() const {
    return m_paused.load() || m_cancelled.load();
}

void QueueOrchestrator::update_batch_status(QueueStatus status) {
    m_repo.update_batch(m_batch_id, [status](QueueItem& q) { q.status = status; });
}

void QueueOrchestrator::transfer_session(const UploadSession& session) {
    const std::vector<int> missing = m_repo.missing_chunks(session.id);
    const std::vector<ChunkPayload> payloads = m_source.payloads_for(session, missing);

    const SessionTransferResult tr = m_engine.upload_chunks(session.id, payloads);
    if (tr.assembly_ready || interrupted()) return;

    if (tr.status == UploadStatus::FAILED) {
        // Integrity guard failed; drive_session reports the recorded reason
        return;
    }

    std::string first_error;
    for (const auto& c : tr.chunks) {
        if (!c.success && !c.error.empty()) {
            first_error = "chunk " + std::to_string(c.chunk_number) + ": " + c.error;
            break;
        }
    }
    throw UploadError(std::to_string(tr.failed) + " of " + std::to_string(session.chunks_count) +
                      " chunks failed to upload" + (first_error.empty() ? "" : " (" + first_error + ")"));
}

QueueOrchestrator::Outcome QueueOrchestrator::drive_session(const std::string& session_id) {
    for (int step = 0; step < kMaxDriveSteps; ++step) {
        if (interrupted()) return Outcome::INTERRUPTED;

        auto found = m_repo.find_session(session_id);
        if (!found) {
            throw ValidationError("Upload session not found: " + session_id);
        }
        const UploadSession& s = *found;

        try {
            switch (s.status) {
                case UploadStatus::PENDING: {
                    std::error_code ec;
                    if (!s.assembled_file_path.empty() &&
                        std::filesystem::exists(s.assembled_file_path, ec)) {
                        m_repo.apply_event(session_id, UploadEvent::RESUME_SCAN);
                        break;
                    }
                    transfer_session(s);
                    break;
                }
                case UploadStatus::UPLOADING:
                    transfer_session(s);
                    break;
                case UploadStatus::ASSEMBLING:
                    m_assembler.assemble(session_id);
                    break;
                case UploadStatus::VIRUS_SCANNING:
                    m_scan_gate.submit(session_id).get();
                    break;
                case UploadStatus::FINALIZING:
                    // Left over from an interrupted run; rescan from the assembled file
                    m_repo.apply_event(session_id, UploadEvent::PAUSE);
                    break;
                case UploadStatus::COMPLETED:
                    return Outcome::COMPLETED;
                case UploadStatus::VIRUS_DETECTED:
                    return Outcome::VIRUS_DETECTED;
                case UploadStatus::CANCELLED:
                    return Outcome::INTERRUPTED;
                case UploadStatus::FAILED:
                    throw UploadError(s.metadata.value("failure_reason", std::string("Upload failed")));
            }
        } catch (const InvalidTransition&) {
            // Paused or cancelled underneath a running stage
            if (interrupted()) return Outcome::INTERRUPTED;
            throw;
        }
    }
    throw UploadError("Session " + session_id + " did not settle");
}

void QueueOrchestrator::record_outcome(const UploadSession& session, Outcome outcome, QueueProcessResult& result) {
    switch (outcome) {
        case Outcome::COMPLETED: {
            {
                std::lock_guard<std::mutex> lock(m_result_mutex);
                ++result.completed_uploads;
            }
            m_repo.update_batch(m_batch_id, [](QueueItem& q) { q.mark_file_completed(); });
            LOG_INFO("QO: completed " + session.filename);
            break;
        }
        case Outcome::VIRUS_DETECTED: {
            {
                std::lock_guard<std::mutex> lock(m_result_mutex);
                ++result.failed_uploads;
                result.errors.push_back(session.filename + ": virus detected");
                result.recovery_suggestions.push_back("Virus detected - manual review required");
                result.retry_recommendations.push_back("Virus detected - do not retry");
            }
            m_repo.update_batch(m_batch_id, [](QueueItem& q) { q.mark_file_failed(); });
            break;
        }
        case Outcome::INTERRUPTED: {
            std::lock_guard<std::mutex> lock(m_result_mutex);
            ++result.paused_uploads;
            break;
        }
        case Outcome::FAILED:
            break;
    }
}

QueueProcessResult QueueOrchestrator::process_queue() {
    return process_with_priority_order(m_options.strategy);
}

QueueProcessResult QueueOrchestrator::process_with_priority_order(PriorityStrategy strategy,
                                                                  const ProgressCallback& callback) {
    QueueProcessResult result;
    if (m_cancelled.load()) {
        result.errors.push_back("Queue has been cancelled");
        return result;
    }
    m_paused = false;

    try {
        auto batch = m_repo.find_batch(m_batch_id);
        if (!batch) {
            throw ValidationError("Queue batch not found: " + m_batch_id);
        }

        if (!m_tracker.tracking_active()) m_tracker.start_tracking();
        update_batch_status(QueueStatus::PROCESSING);

        // Pending sessions, plus any left mid-pipeline by an interrupted run
        std::vector<UploadSession> sessions;
        for (auto& s : m_repo.sessions_for_batch(m_batch_id)) {
            if (s.status == UploadStatus::PENDING || is_active_status(s.status)) {
                sessions.push_back(std::move(s));
            }
        }
        result.total_uploads = static_cast<int>(sessions.size());

        if (sessions.empty()) {
            LOG_INFO("QO: no pending uploads in batch " + m_batch_id);
            if (batch->total_files == 0) update_batch_status(QueueStatus::COMPLETED);
            m_tracker.stop_tracking();
            result.success = true;
            return result;
        }

        const std::vector<UploadSession> ordered = prioritize_sessions(std::move(sessions), strategy);
        apply_bandwidth_ceiling();
        const int concurrency = calculate_optimal_concurrency();
        const auto groups = concurrency_groups(ordered, concurrency);
        const int total = static_cast<int>(ordered.size());
        std::atomic<int> position{0};

        LOG_INFO("QO: processing " + std::to_string(total) + " sessions of batch " + m_batch_id + " with " +
                 priority_strategy_to_string(strategy) + " strategy in " + std::to_string(groups.size()) +
                 " groups");

        WorkerPool pool("queue", groups.size(), 0);
        std::vector<std::future<void>> futures;
        for (const auto& group : groups) {
            futures.push_back(pool.submit_any([this, group, &result, &position, total, &callback] {
                for (const auto& session : group) {
                    if (interrupted()) {
                        std::lock_guard<std::mutex> lock(m_result_mutex);
                        ++result.paused_uploads;
                        continue;
                    }
                    const int index = ++position;
                    m_tracker.add_checkpoint("Processing " + session.filename + " (" + std::to_string(index) +
                                             "/" + std::to_string(total) + ")");
                    try {
                        record_outcome(session, drive_session(session.id), result);
                    } catch (const std::exception& e) {
                        handle_upload_error(session, e, result);
                    }

                    if (callback) {
                        auto latest = m_repo.find_session(session.id);
                        try {
                            callback(m_tracker.calculate_progress(), latest ? *latest : session);
                        } catch (const std::exception& e) {
                            LOG_WARN(std::string("QO: progress callback failed: ") + e.what());
                        }
                    }
                }
            }));
        }

        for (auto& f : futures) {
            try {
                f.get();
            } catch (const std::exception& e) {
                handle_processing_error(e, result);
            }
        }
        pool.shutdown(true);
    } catch (const std::exception& e) {
        handle_processing_error(e, result);
    }

    finish_run(result);
    return result;
}

void QueueOrchestrator::finish_run(QueueProcessResult& result) {
    if (m_tracker.tracking_active() && !m_paused.load()) {
        const FinalMetrics metrics = m_tracker.stop_tracking();
        result.total_processing_time = metrics.total_duration;
        result.average_upload_speed = metrics.average_upload_speed;
        result.final_metrics = metrics;
    }

    std::lock_guard<std::mutex> lock(m_result_mutex);
    bool processing_error = false;
    for (const auto& e : result.errors) {
        if (e.rfind("Queue processing failed", 0) == 0) processing_error = true;
    }
    result.success = !processing_error && result.failed_uploads == 0;

    LOG_INFO("QO: batch " + m_batch_id + " run finished (" + std::to_string(result.completed_uploads) + "/" +
             std::to_string(result.total_uploads) + " completed, " + std::to_string(result.failed_uploads) +
             " failed, " + std::to_string(result.paused_uploads) + " paused)");
}

// ============================================================================
// Control operations
// ============================================================================

PauseResult QueueOrchestrator::pause_queue() {
    PauseResult result;
    m_paused = true;

    if (m_tracker.tracking_active()) {
        m_tracker.add_checkpoint("Queue paused");
    }

    for (const auto& s : m_repo.sessions_for_batch(m_batch_id)) {
        try {
            if (is_active_status(s.status)) {
                m_repo.apply_event(s.id, UploadEvent::PAUSE);
                ++result.paused_sessions;
            } else if (s.status == UploadStatus::PENDING) {
                ++result.paused_sessions;
            } else {
                ++result.skipped_sessions;
            }
        } catch (const UploadError& e) {
            result.errors.push_back("Failed to pause " + s.filename + ": " + e.what());
            ++result.skipped_sessions;
            LOG_ERROR("QO: pause failed for " + s.filename + ": " + e.what());
        }
    }
    m_repo.update_batch(m_batch_id, [](QueueItem& q) { q.metadata["paused"] = true; });

    LOG_INFO("QO: paused batch " + m_batch_id + " (" + std::to_string(result.paused_sessions) + " paused, " +
             std::to_string(result.skipped_sessions) + " skipped)");
    return result;
}

ResumeResult QueueOrchestrator::resume_queue() {
    ResumeResult result;
    if (m_cancelled.load()) {
        result.success = false;
        result.errors.push_back("Queue has been cancelled");
        return result;
    }
    m_paused = false;

    if (!m_tracker.tracking_active()) m_tracker.start_tracking();
    m_tracker.add_checkpoint("Queue resumed");

    for (const auto& s : m_repo.sessions_for_batch(m_batch_id)) {
        if (s.status == UploadStatus::PENDING) {
            ++result.resumed_sessions;
        } else {
            ++result.skipped_sessions;
        }
    }
    m_repo.update_batch(m_batch_id, [](QueueItem& q) { q.metadata["paused"] = false; });

    LOG_INFO("QO: resumed batch " + m_batch_id + " (" + std::to_string(result.resumed_sessions) + " resumed, " +
             std::to_string(result.skipped_sessions) + " skipped)");
    return result;
}

CancelResult QueueOrchestrator::cancel_queue() {
    CancelResult result;
    m_cancelled = true;

    for (const auto& s : m_repo.sessions_for_batch(m_batch_id)) {
        if (s.status != UploadStatus::PENDING && !is_active_status(s.status)) {
            ++result.preserved_sessions;
            continue;
        }
        try {
            m_repo.apply_event(s.id, UploadEvent::CANCEL);
            release_session_slot(m_repo, m_rate_limiter, s.id);
            ++result.cancelled_sessions;
        } catch (const UploadError& e) {
            result.success = false;
            result.errors.push_back("Failed to cancel " + s.filename + ": " + e.what());
        }
    }
    update_batch_status(QueueStatus::CANCELLED);
    if (m_tracker.tracking_active()) m_tracker.stop_tracking();

    LOG_INFO("QO: cancelled batch " + m_batch_id + " (" + std::to_string(result.cancelled_sessions) +
             " cancelled, " + std::to_string(result.preserved_sessions) + " left intact)");
    return result;
}

RetryResult QueueOrchestrator::retry_failed_uploads() {
    RetryResult result;
    if (m_cancelled.load()) {
        result.success = false;
        result.errors.push_back("Queue has been cancelled");
        return result;
    }

    for (const auto& s : m_repo.sessions_for_batch(m_batch_id)) {
        if (s.status == UploadStatus::VIRUS_DETECTED) {
            ++result.skipped_count;
            result.messages.push_back("Session " + s.id + " (" + s.filename + "): virus detected, cannot retry");
            LOG_INFO("QO: skipping virus detected session " + s.id);
            continue;
        }
        if (s.status != UploadStatus::FAILED) continue;

        const int retry_count = s.retry_count();
        if (retry_count >= m_options.retry_attempts) {
            ++result.skipped_count;
            result.messages.push_back("Session " + s.id + " (" + s.filename + "): maximum retry attempts reached");
            LOG_INFO("QO: max retries exceeded for session " + s.id);
            continue;
        }

        try {
            m_repo.apply_event(s.id, UploadEvent::RETRY, [retry_count](UploadSession& u) {
                u.metadata["retry_count"] = retry_count + 1;
                u.metadata.erase("failure_reason");
            });
            m_repo.update_batch(m_batch_id, [](QueueItem& q) {
                q.failed_files = std::max(0, q.failed_files - 1);
                if (!q.is_active()) q.status = QueueStatus::PENDING;
            });
            ++result.retried_count;
            LOG_INFO("QO: retrying session " + s.id + " (attempt " + std::to_string(retry_count + 1) + ")");
        } catch (const UploadError& e) {
            result.success = false;
            result.errors.push_back("Failed to retry " + s.filename + ": " + e.what());
        }
    }
    return result;
}

ProgressSnapshot QueueOrchestrator::calculate_current_progress() {
    return m_tracker.calculate_progress();
}

CleanupReport QueueOrchestrator::cleanup_and_finalize() {
    CleanupReport report;
    if (!m_tracker.tracking_active()) m_tracker.start_tracking();
    m_tracker.add_checkpoint("Processing finalized");
    report.final_metrics = m_tracker.stop_tracking();
    report.cleanup_actions.push_back("calculated_final_metrics");

    for (const auto& s : m_repo.sessions_for_batch(m_batch_id)) {
        if (is_terminal_status(s.status) || s.status == UploadStatus::FAILED) {
            release_session_slot(m_repo, m_rate_limiter, s.id);
        }
    }
    report.cleanup_actions.push_back("released_resources");

    auto batch = m_repo.find_batch(m_batch_id);
    if (batch) {
        if (batch->completed_files + batch->failed_files >= batch->total_files && batch->is_active()) {
            m_repo.update_batch(m_batch_id, [](QueueItem& q) {
                q.status = q.failed_files > 0 ? QueueStatus::FAILED : QueueStatus::COMPLETED;
            });
        }
        report.cleanup_actions.push_back("updated_queue_status");
        report.success = batch->failed_files == 0 && batch->completed_files >= batch->total_files;
    }
    return report;
}

} // namespace chunkflow
