#include "parallel_transfer_engine.h"
#include "chunk_integrity.h"
#include "config_manager.h"
#include "content_hash.h"
#include "logger.h"
#include "telemetry.h"
#include "upload_errors.h"

#include <algorithm>
#include <chrono>
#include <future>
#include <map>
#include <set>
#include <thread>

namespace chunkflow {

// ============================================================================
// Result serialization
// ============================================================================

nlohmann::json SessionTransferResult::to_json() const {
    nlohmann::json j;
    j["session_id"] = session_id;
    j["succeeded"] = succeeded;
    j["failed"] = failed;
    j["deduplicated"] = deduplicated;
    j["bytes_transferred"] = bytes_transferred;
    j["duration_seconds"] = duration_seconds;
    j["assembly_ready"] = assembly_ready;
    j["status"] = upload_status_to_string(status);
    if (!failure_reason.empty()) j["failure_reason"] = failure_reason;
    j["deduplication_stats"] = {
        {"total_chunks", dedup_stats.total_chunks},
        {"chunks_to_upload", dedup_stats.chunks_to_upload},
        {"deduplicated_chunks", dedup_stats.deduplicated_chunks},
        {"bytes_saved", dedup_stats.bytes_saved},
        {"total_bytes", dedup_stats.total_bytes},
        {"deduplication_ratio", dedup_stats.deduplication_ratio},
    };
    j["chunks"] = nlohmann::json::array();
    for (const auto& c : chunks) {
        nlohmann::json cj{{"chunk_number", c.chunk_number}, {"success", c.success}};
        if (c.deduplicated) cj["deduplicated"] = true;
        if (!c.error.empty()) cj["error"] = c.error;
        j["chunks"].push_back(cj);
    }
    return j;
}

nlohmann::json TransferStatusReport::to_json() const {
    return nlohmann::json{
        {"total_chunks", total_chunks},
        {"completed_chunks", completed_chunks},
        {"failed_chunks", failed_chunks},
        {"pending_chunks", pending_chunks},
        {"chunks_ready_for_upload", missing_chunks},
        {"progress_percentage", progress_percentage},
        {"upload_session_status", upload_status_to_string(status)},
    };
}

ParallelTransferEngine::Options ParallelTransferEngine::Options::fromConfig() {
    auto& cfg = ConfigManager::getInstance();
    Options o;
    o.max_concurrent = std::max(1, cfg.getTransferMaxConcurrent());
    o.retry_attempts = std::max(0, cfg.getChunkRetryAttempts());
    return o;
}

// ============================================================================
// Engine
// ============================================================================

ParallelTransferEngine::ParallelTransferEngine(SessionRepository& repo,
                                               ChunkStore& store,
                                               const DeduplicationIndex& dedup,
                                               RateLimiter* rate_limiter,
                                               BandwidthGovernor* bandwidth,
                                               WorkerPool& pool,
                                               Options options,
                                               SleepFn sleep_fn)
    : m_repo(repo),
      m_store(store),
      m_dedup(dedup),
      m_rate_limiter(rate_limiter),
      m_bandwidth(bandwidth),
      m_pool(pool),
      m_options(options),
      m_sleep(std::move(sleep_fn)) {
    if (m_options.max_concurrent < 1) m_options.max_concurrent = 1;
    if (m_options.retry_attempts < 0) m_options.retry_attempts = 0;
    if (!m_sleep) {
        m_sleep = [](double seconds) {
            std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
        };
    }
}

std::shared_ptr<std::mutex> ParallelTransferEngine::session_mutex(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(m_locks_mutex);
    auto& slot = m_session_locks[session_id];
    if (!slot) slot = std::make_shared<std::mutex>();
    return slot;
}

void ParallelTransferEngine::release_session_mutex(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(m_locks_mutex);
    m_session_locks.erase(session_id);
}

size_t ParallelTransferEngine::tracked_sessions() const {
    std::lock_guard<std::mutex> lock(m_locks_mutex);
    return m_session_locks.size();
}

SessionTransferResult ParallelTransferEngine::upload_chunks(const std::string& session_id,
                                                            const std::vector<ChunkPayload>& chunks) {
    const auto started = std::chrono::steady_clock::now();

    auto found = m_repo.find_session(session_id);
    if (!found) {
        throw ValidationError("Unknown upload session " + session_id);
    }
    if (found->status != UploadStatus::PENDING && found->status != UploadStatus::UPLOADING) {
        throw InvalidTransition("Upload session " + session_id + " (" +
                                upload_status_to_string(found->status) + ") is not accepting chunks");
    }

    SessionTransferResult result;
    result.session_id = session_id;

    UploadSession session = *found;
    {
        auto lock_ptr = session_mutex(session_id);
        std::lock_guard<std::mutex> lock(*lock_ptr);
        if (!chunks.empty() && session.status == UploadStatus::PENDING) {
            session = m_repo.apply_event(session_id, UploadEvent::START_UPLOAD);
        }
    }

    // Malformed payloads are reported per chunk; the rest proceed.
    std::vector<ChunkPayload> valid;
    std::map<int, ChunkTransferResult> by_number;
    for (const auto& p : chunks) {
        std::string problem;
        if (p.chunk_number < 1 || p.chunk_number > session.chunks_count) {
            problem = "Invalid chunk number: " + std::to_string(p.chunk_number);
        } else if (p.size <= 0 || static_cast<int64_t>(p.data.size()) != p.size) {
            problem = "Invalid chunk data: size " + std::to_string(p.size) + " does not match " +
                      std::to_string(p.data.size()) + " bytes";
        } else if (p.checksum.empty()) {
            problem = "Invalid chunk data: missing checksum";
        }
        if (!problem.empty()) {
            ChunkTransferResult r;
            r.chunk_number = p.chunk_number;
            r.error = "Validation failed: " + problem;
            r.retryable = false;
            by_number[p.chunk_number] = r;
            continue;
        }
        valid.push_back(p);
    }

    // Dedup decisions are made once, before anything is dispatched.
    const DedupPlan plan = m_dedup.plan(session, valid);
    result.dedup_stats = plan.stats;
    for (auto& rec : m_dedup.make_records(session, valid, plan)) {
        ChunkTransferResult r;
        r.chunk_number = rec.chunk_number;
        r.size = rec.size;
        try {
            const ChunkRecord stored = m_repo.upsert_chunk(rec);
            r.success = true;
            r.deduplicated = true;
            r.storage_key = stored.storage_key;
        } catch (const UploadError& e) {
            r.error = std::string("Deduplication failed: ") + e.what();
        }
        by_number[r.chunk_number] = r;
    }

    std::vector<const ChunkPayload*> pending;
    for (const auto& p : valid) {
        if (plan.needs_upload(p.chunk_number)) pending.push_back(&p);
    }

    // First pass plus bounded retries of retryable failures
    for (int attempt = 0; attempt <= m_options.retry_attempts && !pending.empty(); ++attempt) {
        if (attempt > 0) {
            LOG_INFO("PTE: retrying " + std::to_string(pending.size()) + " chunks for session " +
                     session_id + " (attempt " + std::to_string(attempt + 1) + ")");
        }
        std::vector<ChunkTransferResult> batch_results = run_batches(session, pending);

        std::vector<const ChunkPayload*> retry;
        for (size_t i = 0; i < batch_results.size(); ++i) {
            ChunkTransferResult& r = batch_results[i];
            r.attempts = attempt + 1;
            if (r.success) {
                result.bytes_transferred += r.size;
            } else if (r.retryable) {
                retry.push_back(pending[i]);
            }
            by_number[r.chunk_number] = r;
        }
        pending.swap(retry);
    }

    for (const auto* p : pending) {
        mark_chunk_failed(session, *p, by_number[p->chunk_number].error);
    }

    for (auto& kv : by_number) {
        const ChunkTransferResult& r = kv.second;
        if (r.success) {
            ++result.succeeded;
            if (r.deduplicated) ++result.deduplicated;
        } else {
            ++result.failed;
        }
        result.chunks.push_back(r);
    }

    result.assembly_ready = try_begin_assembly(session_id, &result.failure_reason);
    if (auto latest = m_repo.find_session(session_id)) {
        result.status = latest->status;
    }
    // Nothing left to serialize once the transfer phase is over
    if (result.status != UploadStatus::PENDING && result.status != UploadStatus::UPLOADING) {
        release_session_mutex(session_id);
    }

    result.duration_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - started).count();
    Telemetry::getInstance().observe_hist_ms("upload.session_transfer_ms",
                                             static_cast<int64_t>(result.duration_seconds * 1000));

    LOG_INFO("PTE: session " + session_id + ": " + std::to_string(result.succeeded) + " ok, " +
             std::to_string(result.failed) + " failed, " + std::to_string(result.deduplicated) +
             " deduplicated" + (result.assembly_ready ? ", ready for assembly" : ""));
    return result;
}

std::vector<ChunkTransferResult> ParallelTransferEngine::run_batches(
    const UploadSession& session,
    const std::vector<const ChunkPayload*>& payloads) {

    std::vector<ChunkTransferResult> results(payloads.size());
    const size_t batch_size = static_cast<size_t>(m_options.max_concurrent);

    for (size_t start = 0; start < payloads.size(); start += batch_size) {
        const size_t end = std::min(start + batch_size, payloads.size());
        std::vector<std::future<void>> futures;
        futures.reserve(end - start);

        // Counted against the limit together with every other session's streams
        BandwidthGovernor::StreamLease lease(m_bandwidth, static_cast<int>(end - start));

        for (size_t i = start; i < end; ++i) {
            const ChunkPayload* payload = payloads[i];
            ChunkTransferResult* slot = &results[i];
            futures.push_back(m_pool.submit_any([this, &session, payload, slot] {
                *slot = transfer_one(session, *payload);
            }));
        }

        // Join the whole batch before starting the next one
        for (size_t i = 0; i < futures.size(); ++i) {
            try {
                futures[i].get();
            } catch (const std::exception& e) {
                ChunkTransferResult& r = results[start + i];
                r.chunk_number = payloads[start + i]->chunk_number;
                r.success = false;
                r.error = std::string("Upload failed: ") + e.what();
                LOG_ERROR("PTE: worker failure on chunk " + std::to_string(r.chunk_number) + ": " + e.what());
            }
        }

        if (m_bandwidth && m_bandwidth->auto_adapt()) {
            LOG_INFO("PTE: bandwidth limit now " + std::to_string(m_bandwidth->limit_kbps()) + " KB/s");
        }
    }
    return results;
}

ChunkTransferResult ParallelTransferEngine::transfer_one(const UploadSession& session,
                                                         const ChunkPayload& payload) {
    ChunkTransferResult r;
    r.chunk_number = payload.chunk_number;
    r.size = payload.size;

    // Cooperative cancellation: re-read status before doing any work
    auto current = m_repo.find_session(session.id);
    if (!current || current->status == UploadStatus::CANCELLED ||
        current->status == UploadStatus::FAILED) {
        r.error = "Upload skipped: session " +
                  std::string(current ? upload_status_to_string(current->status) : "removed");
        r.retryable = false;
        return r;
    }

    double store_seconds = 0.0;
    try {
        if (m_options.verify_checksums) {
            const std::string actual = sha256_hex(payload.data);
            if (actual != payload.checksum) {
                throw ValidationError("checksum mismatch for chunk " + std::to_string(payload.chunk_number));
            }
        }

        if (m_rate_limiter) {
            m_rate_limiter->check_chunk_upload(session.user_id, session.ip_address, session.id, payload.size);
        }

        const int per_stream_kbps = m_bandwidth ? m_bandwidth->shared_stream_kbps() : 0;
        if (per_stream_kbps > 0) {
            const double delay = (payload.size / 1024.0) / per_stream_kbps;
            if (delay > 0) {
                LOG_DEBUG("PTE: throttling chunk " + std::to_string(payload.chunk_number) + " for " +
                          std::to_string(delay) + "s at " + std::to_string(per_stream_kbps) + " KB/s");
                m_sleep(delay);
            }
        }

        // Only the write itself is measured
        const auto started = std::chrono::steady_clock::now();
        const std::string key = m_store.store(session.id, payload.chunk_number, payload.data);
        store_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();

        ChunkRecord rec;
        rec.session_id = session.id;
        rec.chunk_number = payload.chunk_number;
        rec.size = payload.size;
        rec.checksum = payload.checksum;
        rec.status = ChunkStatus::COMPLETED;
        rec.storage_key = key;
        m_repo.upsert_chunk(rec);

        r.success = true;
        r.storage_key = key;
        Telemetry::getInstance().inc_counter("upload.chunks_transferred");

    } catch (const ValidationError& e) {
        r.error = std::string("Validation failed: ") + e.what();
        r.retryable = false;
    } catch (const RateLimitExceeded& e) {
        r.error = std::string("Rate limited: ") + e.what();
        r.retryable = false;
    } catch (const StorageError& e) {
        r.error = std::string("Storage failed: ") + e.what();
    } catch (const std::exception& e) {
        r.error = std::string("Upload failed: ") + e.what();
    }

    if (m_bandwidth) {
        m_bandwidth->record_transfer(payload.size, store_seconds, r.success);
    }
    if (!r.success) {
        Telemetry::getInstance().inc_counter("upload.chunk_failures");
        LOG_WARN("PTE: chunk " + std::to_string(payload.chunk_number) + " of session " + session.id +
                 " failed: " + r.error);
    }
    return r;
}

void ParallelTransferEngine::mark_chunk_failed(const UploadSession& session,
                                               const ChunkPayload& payload,
                                               const std::string& error) {
    auto existing = m_repo.find_chunk(session.id, payload.chunk_number);
    if (existing && existing->status == ChunkStatus::COMPLETED) {
        return;  // An earlier upload of this chunk is still good
    }
    if (payload.size <= 0 || payload.checksum.empty()) {
        return;  // Not representable as a chunk record
    }

    ChunkRecord rec;
    rec.session_id = session.id;
    rec.chunk_number = payload.chunk_number;
    rec.size = payload.size;
    rec.checksum = payload.checksum;
    rec.status = ChunkStatus::FAILED;
    rec.metadata["error"] = error;
    try {
        m_repo.upsert_chunk(rec);
    } catch (const ValidationError& e) {
        LOG_WARN("PTE: could not record failed chunk " + std::to_string(payload.chunk_number) + ": " + e.what());
    }
}

bool ParallelTransferEngine::try_begin_assembly(const std::string& session_id, std::string* failure_reason) {
    auto lock_ptr = session_mutex(session_id);
    std::lock_guard<std::mutex> lock(*lock_ptr);

    auto session = m_repo.find_session(session_id);
    if (!session) return false;
    if (session->status != UploadStatus::UPLOADING && session->status != UploadStatus::PENDING) {
        return session->status == UploadStatus::ASSEMBLING;
    }

    m_dedup.resolve_pending(m_repo, session_id, /*drop_unresolvable=*/true);

    if (!m_repo.missing_chunks(session_id).empty()) {
        return false;
    }

    const IntegrityReport report = verify_session_chunks(*session, m_repo.chunks_for_session(session_id), m_store);
    if (!report.ok) {
        // Fail closed: never assemble from chunks that do not verify. The
        // broken ones go back to failed so a retry uploads them again.
        demote_broken_chunks(m_repo, session_id, report);
        const std::string reason = "chunk integrity check failed: " + report.summary();
        m_repo.apply_event(session_id, UploadEvent::FAIL, [&reason](UploadSession& s) {
            s.metadata["failure_reason"] = reason;
        });
        if (failure_reason) *failure_reason = reason;
        Telemetry::getInstance().inc_counter("upload.integrity_failures");
        LOG_ERROR("PTE: session " + session_id + " " + reason);
        return false;
    }

    m_repo.apply_event(session_id, UploadEvent::ALL_CHUNKS_RECEIVED);
    Telemetry::getInstance().inc_counter("upload.assembly_starts");
    LOG_INFO("PTE: all " + std::to_string(session->chunks_count) + " chunks present for session " +
             session_id + ", starting assembly");
    return true;
}

SessionTransferResult ParallelTransferEngine::retry_failed_chunks(const std::string& session_id,
                                                                  const std::vector<ChunkPayload>& chunks) {
    std::set<int> failed_numbers;
    for (const auto& c : m_repo.chunks_for_session(session_id)) {
        if (c.status == ChunkStatus::FAILED) failed_numbers.insert(c.chunk_number);
    }

    std::vector<ChunkPayload> retry;
    for (const auto& p : chunks) {
        if (failed_numbers.count(p.chunk_number)) retry.push_back(p);
    }
    LOG_INFO("PTE: retrying " + std::to_string(retry.size()) + " failed chunks for session " + session_id);
    return upload_chunks(session_id, retry);
}

TransferStatusReport ParallelTransferEngine::upload_status(const std::string& session_id) const {
    TransferStatusReport report;
    auto session = m_repo.find_session(session_id);
    if (!session) {
        throw ValidationError("Unknown upload session " + session_id);
    }

    report.total_chunks = session->chunks_count;
    report.status = session->status;
    for (const auto& c : m_repo.chunks_for_session(session_id)) {
        switch (c.status) {
            case ChunkStatus::COMPLETED: ++report.completed_chunks; break;
            case ChunkStatus::FAILED:    ++report.failed_chunks; break;
            case ChunkStatus::PENDING:   ++report.pending_chunks; break;
        }
    }
    report.missing_chunks = m_repo.missing_chunks(session_id);
    report.progress_percentage = session_progress_percentage(*session, report.completed_chunks);
    return report;
}

} // namespace chunkflow
