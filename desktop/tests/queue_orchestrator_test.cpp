#include "assembler.h"
#include "asset_catalog.h"
#include "chunk_source.h"
#include "chunk_store.h"
#include "dedup_index.h"
#include "parallel_transfer_engine.h"
#include "queue_orchestrator.h"
#include "resource_monitor.h"
#include "scan_gate.h"
#include "scanner_backend.h"
#include "session_repository.h"
#include "test_helpers.h"
#include "upload_errors.h"
#include "worker_pool.h"

#include <algorithm>
#include <filesystem>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace chunkflow;

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

// File bytes held in memory, keyed by filename
class MemoryChunkSource : public ChunkSource {
public:
    std::map<std::string, std::vector<uint8_t>> files;
    std::set<std::string> unreadable;

    std::vector<ChunkPayload> payloads_for(const UploadSession& session,
                                           const std::vector<int>& chunk_numbers) override {
        if (unreadable.count(session.filename)) {
            throw StorageError("cannot read " + session.filename);
        }
        const std::vector<uint8_t>& data = files.at(session.filename);
        const size_t chunk = static_cast<size_t>((session.total_size + session.chunks_count - 1) / session.chunks_count);
        std::vector<ChunkPayload> out;
        for (int n : chunk_numbers) {
            const size_t off = static_cast<size_t>(n - 1) * chunk;
            const size_t len = std::min(chunk, data.size() - off);
            out.push_back(test::make_payload(n, std::vector<uint8_t>(data.begin() + off, data.begin() + off + len)));
        }
        return out;
    }
};

class HookedScanner : public ScannerBackend {
public:
    bool infected = false;
    std::function<void()> during_scan;

    std::string name() const override { return "hooked"; }
    bool available() override { return true; }
    ScanVerdict scan(const std::string&) override {
        if (during_scan) {
            auto hook = std::move(during_scan);
            during_scan = nullptr;
            hook();
        }
        ScanVerdict v;
        v.clean = !infected;
        v.signature = infected ? "Win.Test.Dropper" : "";
        v.scanner = name();
        return v;
    }
};

class FixedMonitor : public ResourceMonitor {
public:
    ResourceSample value;
    ResourceSample sample() override { return value; }
};

struct Harness {
    test::TempDir dir{"orchestrator"};
    FileChunkStore store{dir.sub("chunks")};
    SessionRepository repo;
    DeduplicationIndex dedup{repo, store, DeduplicationIndex::Options{}};
    WorkerPool pool{"test-transfer", 4, 0};
    ParallelTransferEngine engine{repo, store, dedup, nullptr, nullptr, pool, ParallelTransferEngine::Options{}};
    InMemoryAssetCatalog catalog;
    Assembler assembler{repo, store, catalog, assembler_options()};
    std::shared_ptr<HookedScanner> scanner = std::make_shared<HookedScanner>();
    ScanGate gate{repo, catalog, scanner, ScanGate::Options{}};
    MemoryChunkSource source;

    Assembler::Options assembler_options() const {
        Assembler::Options o;
        o.assembly_dir = dir.sub("assembly");
        return o;
    }

    // One batch, one session per (filename, size); chunks of about 1000 bytes
    std::string add_batch(const std::vector<std::pair<std::string, size_t>>& files) {
        QueueItem q;
        q.workspace_id = "ws-1";
        q.user_id = "user-1";
        q.draggable_name = "Session Files";
        q.draggable_type = DraggableType::FOLDER;
        q.total_files = static_cast<int>(files.size());
        const std::string batch_id = repo.create_batch(q).batch_id;

        std::vector<std::string> ids;
        uint8_t seed = 1;
        for (const auto& f : files) {
            source.files[f.first] = test::pattern_bytes(f.second, seed++);
            UploadSession s = test::make_session(f.first, static_cast<int64_t>(f.second),
                                                 static_cast<int>((f.second + 999) / 1000));
            s.batch_id = batch_id;
            ids.push_back(repo.create_session(s).id);
        }
        repo.update_batch(batch_id, [&ids](QueueItem& b) { b.session_ids = ids; });
        return batch_id;
    }

    std::unique_ptr<QueueOrchestrator> orchestrator(const std::string& batch_id, int max_concurrent = 1,
                                                    int retry_attempts = DEFAULT_RETRY_ATTEMPTS,
                                                    ResourceMonitor* monitor = nullptr) {
        QueueOrchestrator::Options o;
        o.max_concurrent_uploads = max_concurrent;
        o.retry_attempts = retry_attempts;
        return std::make_unique<QueueOrchestrator>(batch_id, repo, engine, assembler, gate, source, o, monitor);
    }

    UploadSession session_named(const std::string& batch_id, const std::string& filename) const {
        for (const auto& s : repo.sessions_for_batch(batch_id)) {
            if (s.filename == filename) return s;
        }
        throw std::runtime_error("no session " + filename);
    }

    bool asset_matches(const std::string& batch_id, const std::string& filename) const {
        auto asset = catalog.find_by_session(session_named(batch_id, filename).id);
        return asset && test::read_file(asset->file_path) == source.files.at(filename);
    }
};

static bool test_batch_completes() {
    Harness h;
    const std::string batch_id = h.add_batch({{"bass.wav", 3500}, {"keys.wav", 1200}, {"vox.wav", 2600}});
    auto orch = h.orchestrator(batch_id, 2);

    std::vector<std::string> seen;
    QueueProcessResult r = orch->process_with_priority_order(
        PriorityStrategy::SMALLEST_FIRST,
        [&seen](const ProgressSnapshot&, const UploadSession& s) { seen.push_back(s.filename); });

    TEST_ASSERT(r.success, "run succeeds");
    TEST_ASSERT(r.total_uploads == 3 && r.completed_uploads == 3, "three completed");
    TEST_ASSERT(r.failed_uploads == 0 && r.errors.empty(), "no failures");
    TEST_ASSERT(r.final_metrics.has_value(), "final metrics attached");
    TEST_ASSERT(seen.size() == 3, "callback per session");

    const QueueItem batch = *h.repo.find_batch(batch_id);
    TEST_ASSERT(batch.status == QueueStatus::COMPLETED, "batch completed");
    TEST_ASSERT(batch.completed_files == 3, "completed count");
    for (const char* name : {"bass.wav", "keys.wav", "vox.wav"}) {
        TEST_ASSERT(h.asset_matches(batch_id, name), std::string("asset bytes match for ") + name);
    }
    TEST_ASSERT(!orch->progress_tracker().tracking_active(), "tracking stopped");
    std::cout << "PASS: batch completes" << std::endl;
    return true;
}

static bool test_pause_between_sessions_and_resume() {
    Harness h;
    const std::string batch_id = h.add_batch({{"a.wav", 1000}, {"b.wav", 2000}, {"c.wav", 3000}});
    auto orch = h.orchestrator(batch_id, 1);
    QueueOrchestrator* o = orch.get();

    bool paused = false;
    PauseResult pause;
    QueueProcessResult first = orch->process_with_priority_order(
        PriorityStrategy::SMALLEST_FIRST,
        [&](const ProgressSnapshot&, const UploadSession&) {
            if (!paused) {
                paused = true;
                pause = o->pause_queue();
            }
        });

    TEST_ASSERT(first.completed_uploads == 1, "first session finished before the pause");
    TEST_ASSERT(first.paused_uploads == 2, "remaining sessions paused");
    TEST_ASSERT(first.success, "pause is not a failure");
    TEST_ASSERT(pause.paused_sessions == 2 && pause.skipped_sessions == 1, "pause counts");
    TEST_ASSERT(h.session_named(batch_id, "b.wav").status == UploadStatus::PENDING, "paused session pending");
    TEST_ASSERT(h.repo.find_batch(batch_id)->metadata.value("paused", false), "batch marked paused");
    TEST_ASSERT(orch->progress_tracker().tracking_active(), "tracking survives a pause");

    ResumeResult resumed = orch->resume_queue();
    TEST_ASSERT(resumed.resumed_sessions == 2 && resumed.skipped_sessions == 1, "resume counts");

    QueueProcessResult second = orch->process_queue();
    TEST_ASSERT(second.success && second.completed_uploads == 2, "rest completed after resume");
    const QueueItem batch = *h.repo.find_batch(batch_id);
    TEST_ASSERT(batch.status == QueueStatus::COMPLETED && batch.completed_files == 3, "batch completed");
    TEST_ASSERT(h.catalog.size() == 3, "one asset per file");
    std::cout << "PASS: pause between sessions and resume" << std::endl;
    return true;
}

static bool test_pause_during_scan_keeps_assembled_file() {
    Harness h;
    const std::string batch_id = h.add_batch({{"master.wav", 4200}});
    auto orch = h.orchestrator(batch_id, 1);
    QueueOrchestrator* o = orch.get();
    h.scanner->during_scan = [o]() { o->pause_queue(); };

    QueueProcessResult first = orch->process_queue();
    TEST_ASSERT(first.paused_uploads == 1 && first.failed_uploads == 0, "session interrupted, not failed");

    UploadSession s = h.session_named(batch_id, "master.wav");
    TEST_ASSERT(s.status == UploadStatus::PENDING, "paused back to pending");
    TEST_ASSERT(!s.assembled_file_path.empty(), "assembled file kept on the session");
    TEST_ASSERT(test::read_file(s.assembled_file_path) == h.source.files["master.wav"], "assembled bytes intact");
    TEST_ASSERT(!std::filesystem::exists(h.store.session_dir(s.id)), "chunks already cleaned");

    orch->resume_queue();
    QueueProcessResult second = orch->process_queue();
    TEST_ASSERT(second.completed_uploads == 1 && second.success, "resumed scan completes");
    TEST_ASSERT(h.asset_matches(batch_id, "master.wav"), "asset built from the kept file");
    std::cout << "PASS: pause during scan keeps assembled file" << std::endl;
    return true;
}

static bool test_failure_is_classified_and_retried() {
    Harness h;
    const std::string batch_id = h.add_batch({{"ok.wav", 1500}, {"broken.wav", 2500}});
    h.source.unreadable.insert("broken.wav");
    auto orch = h.orchestrator(batch_id, 2, 1);

    QueueProcessResult r = orch->process_queue();
    TEST_ASSERT(!r.success, "run with a failure is not a success");
    TEST_ASSERT(r.completed_uploads == 1 && r.failed_uploads == 1, "one of each");
    TEST_ASSERT(r.errors.size() == 1 && r.errors[0].find("broken.wav: cannot read") == 0, "error names the file");
    TEST_ASSERT(r.recovery_suggestions[0] == "Database connection issue - retry queue", "storage suggestion");

    UploadSession broken = h.session_named(batch_id, "broken.wav");
    TEST_ASSERT(broken.status == UploadStatus::FAILED, "session failed");
    TEST_ASSERT(broken.metadata.value("failure_reason", "") == "cannot read broken.wav", "reason recorded");
    QueueItem batch = *h.repo.find_batch(batch_id);
    TEST_ASSERT(batch.status == QueueStatus::FAILED && batch.failed_files == 1, "batch closed as failed");

    RetryResult retry = orch->retry_failed_uploads();
    TEST_ASSERT(retry.retried_count == 1, "one retried");
    broken = h.session_named(batch_id, "broken.wav");
    TEST_ASSERT(broken.status == UploadStatus::PENDING && broken.retry_count() == 1, "retry bumps the count");
    TEST_ASSERT(!broken.metadata.contains("failure_reason"), "old reason cleared");
    batch = *h.repo.find_batch(batch_id);
    TEST_ASSERT(batch.failed_files == 0 && batch.status == QueueStatus::PENDING, "batch reopened");

    r = orch->process_queue();
    TEST_ASSERT(r.failed_uploads == 1 && r.total_uploads == 1, "only the failed session reprocessed");

    retry = orch->retry_failed_uploads();
    TEST_ASSERT(retry.retried_count == 0 && retry.skipped_count == 1, "attempts exhausted");
    TEST_ASSERT(retry.messages[0].find("maximum retry attempts reached") != std::string::npos, "exhaustion message");
    TEST_ASSERT(h.session_named(batch_id, "broken.wav").status == UploadStatus::FAILED, "still failed");
    std::cout << "PASS: failure is classified and retried" << std::endl;
    return true;
}

static bool test_retry_after_recovery_completes() {
    Harness h;
    const std::string batch_id = h.add_batch({{"late.wav", 1800}});
    h.source.unreadable.insert("late.wav");
    auto orch = h.orchestrator(batch_id);

    TEST_ASSERT(orch->process_queue().failed_uploads == 1, "first run fails");
    h.source.unreadable.clear();
    TEST_ASSERT(orch->retry_failed_uploads().retried_count == 1, "retried");

    QueueProcessResult r = orch->process_queue();
    TEST_ASSERT(r.success && r.completed_uploads == 1, "recovered on retry");
    const QueueItem batch = *h.repo.find_batch(batch_id);
    TEST_ASSERT(batch.status == QueueStatus::COMPLETED, "batch completed");
    TEST_ASSERT(batch.completed_files == 1 && batch.failed_files == 0, "counts after recovery");
    std::cout << "PASS: retry after recovery completes" << std::endl;
    return true;
}

static bool test_virus_detected_never_retried() {
    Harness h;
    h.scanner->infected = true;
    const std::string batch_id = h.add_batch({{"payload.zip", 1500}});
    auto orch = h.orchestrator(batch_id);

    QueueProcessResult r = orch->process_queue();
    TEST_ASSERT(r.failed_uploads == 1 && !r.success, "virus counts as failure");
    TEST_ASSERT(r.errors[0] == "payload.zip: virus detected", "virus error");
    TEST_ASSERT(r.retry_recommendations[0] == "Virus detected - do not retry", "do not retry");

    RetryResult retry = orch->retry_failed_uploads();
    TEST_ASSERT(retry.retried_count == 0 && retry.skipped_count == 1, "skipped");
    TEST_ASSERT(retry.messages[0].find("virus detected, cannot retry") != std::string::npos, "skip message");
    TEST_ASSERT(h.session_named(batch_id, "payload.zip").status == UploadStatus::VIRUS_DETECTED, "quarantined");
    TEST_ASSERT(h.catalog.size() == 0, "no asset");
    std::cout << "PASS: virus detected never retried" << std::endl;
    return true;
}

static bool test_cancel_preserves_completed() {
    Harness h;
    const std::string batch_id = h.add_batch({{"first.wav", 1000}, {"second.wav", 3000}});
    auto orch = h.orchestrator(batch_id, 1);
    QueueOrchestrator* o = orch.get();

    CancelResult cancel;
    bool cancelled = false;
    QueueProcessResult r = orch->process_with_priority_order(
        PriorityStrategy::SMALLEST_FIRST,
        [&](const ProgressSnapshot&, const UploadSession&) {
            if (!cancelled) {
                cancelled = true;
                cancel = o->cancel_queue();
            }
        });

    TEST_ASSERT(r.completed_uploads == 1, "first finished");
    TEST_ASSERT(cancel.cancelled_sessions == 1 && cancel.preserved_sessions == 1, "cancel counts");
    TEST_ASSERT(h.session_named(batch_id, "first.wav").status == UploadStatus::COMPLETED, "completed preserved");
    TEST_ASSERT(h.session_named(batch_id, "second.wav").status == UploadStatus::CANCELLED, "pending cancelled");
    TEST_ASSERT(h.repo.find_batch(batch_id)->status == QueueStatus::CANCELLED, "batch cancelled");
    TEST_ASSERT(h.asset_matches(batch_id, "first.wav"), "completed asset intact");

    QueueProcessResult again = orch->process_queue();
    TEST_ASSERT(!again.success && again.errors[0] == "Queue has been cancelled", "cancelled queue refuses work");
    TEST_ASSERT(!orch->resume_queue().success, "cancelled queue cannot resume");
    TEST_ASSERT(!orch->retry_failed_uploads().success, "cancelled queue cannot retry");
    std::cout << "PASS: cancel preserves completed" << std::endl;
    return true;
}

static bool test_empty_batch_completes() {
    Harness h;
    const std::string batch_id = h.add_batch({});
    auto orch = h.orchestrator(batch_id);
    QueueProcessResult r = orch->process_queue();
    TEST_ASSERT(r.success && r.total_uploads == 0, "nothing to do");
    TEST_ASSERT(h.repo.find_batch(batch_id)->status == QueueStatus::COMPLETED, "empty batch completed");

    CleanupReport cleanup = orch->cleanup_and_finalize();
    TEST_ASSERT(cleanup.success, "cleanup succeeds");
    TEST_ASSERT(cleanup.cleanup_actions.size() == 3, "three cleanup actions");
    std::cout << "PASS: empty batch completes" << std::endl;
    return true;
}

static std::vector<std::string> names(const std::vector<UploadSession>& sessions) {
    std::vector<std::string> out;
    for (const auto& s : sessions) out.push_back(s.filename);
    return out;
}

static bool test_ordering_and_grouping() {
    std::vector<UploadSession> sessions;
    const std::vector<std::pair<std::string, int64_t>> sizes = {{"m", 200}, {"s", 100}, {"l", 300}};
    for (const auto& sz : sizes) {
        UploadSession s = test::make_session(sz.first, sz.second, 1);
        s.id = "id-" + sz.first;
        sessions.push_back(s);
    }

    using V = std::vector<std::string>;
    TEST_ASSERT(names(QueueOrchestrator::prioritize_sessions(sessions, PriorityStrategy::FIFO)) == V({"m", "s", "l"}), "fifo");
    TEST_ASSERT(names(QueueOrchestrator::prioritize_sessions(sessions, PriorityStrategy::SMALLEST_FIRST)) == V({"s", "m", "l"}), "smallest first");
    TEST_ASSERT(names(QueueOrchestrator::prioritize_sessions(sessions, PriorityStrategy::LARGEST_FIRST)) == V({"l", "m", "s"}), "largest first");
    TEST_ASSERT(names(QueueOrchestrator::prioritize_sessions(sessions, PriorityStrategy::INTERLEAVED)) == V({"s", "l", "m"}), "interleaved");

    sessions[0].metadata["priority"] = "low";
    sessions[2].metadata["priority"] = "high";
    TEST_ASSERT(names(QueueOrchestrator::prioritize_for_resource_constraints(sessions)) == V({"l", "s", "m"}), "priority order");

    std::vector<UploadSession> chunked;
    const int counts[] = {5, 1, 1, 3};
    for (int i = 0; i < 4; ++i) {
        UploadSession s = test::make_session("f" + std::to_string(i), 100, counts[i]);
        s.id = "c" + std::to_string(i);
        chunked.push_back(s);
    }
    const auto groups = QueueOrchestrator::concurrency_groups(chunked, 2);
    TEST_ASSERT(groups.size() == 2, "two groups");
    TEST_ASSERT(names(groups[0]) == V({"f0"}), "heaviest alone");
    TEST_ASSERT(names(groups[1]) == V({"f1", "f2", "f3"}), "rest balanced, priority order kept");
    TEST_ASSERT(QueueOrchestrator::concurrency_groups(chunked, 10).size() == 4, "never more groups than sessions");
    TEST_ASSERT(QueueOrchestrator::concurrency_groups({}, 3).empty(), "no sessions, no groups");

    TEST_ASSERT(priority_strategy_from_string("interleaved") == PriorityStrategy::INTERLEAVED, "strategy parse");
    TEST_ASSERT(!priority_strategy_from_string("random").has_value(), "unknown strategy");
    std::cout << "PASS: ordering and grouping" << std::endl;
    return true;
}

static bool test_error_classification() {
    TEST_ASSERT(QueueOrchestrator::classify_error(TransferTimeout("t")).error_class == ErrorClass::TIMEOUT, "timeout");
    TEST_ASSERT(QueueOrchestrator::classify_error(StorageError("full", StorageCause::NO_SPACE)).error_class ==
                ErrorClass::OUT_OF_SPACE, "out of space");
    TEST_ASSERT(QueueOrchestrator::classify_error(StorageError("io")).error_class == ErrorClass::STORAGE_LAYER, "storage");
    TEST_ASSERT(QueueOrchestrator::classify_error(ChunkNotFoundError("x")).error_class == ErrorClass::STORAGE_LAYER,
                "missing chunk is a storage problem");
    const ErrorClassification unknown = QueueOrchestrator::classify_error(std::runtime_error("boom"));
    TEST_ASSERT(unknown.error_class == ErrorClass::UNKNOWN, "unknown");
    TEST_ASSERT(unknown.recovery_suggestion == "Unknown error - check logs and retry", "unknown suggestion");
    std::cout << "PASS: error classification" << std::endl;
    return true;
}

static bool test_resource_adaptation() {
    Harness h;
    const std::string batch_id = h.add_batch({{"x.wav", 100}});
    FixedMonitor monitor;
    auto orch = h.orchestrator(batch_id, 3, DEFAULT_RETRY_ATTEMPTS, &monitor);

    TEST_ASSERT(orch->calculate_optimal_concurrency() == 3, "idle machine keeps configured concurrency");
    monitor.value.cpu_usage = 0.95;
    TEST_ASSERT(orch->calculate_optimal_concurrency() == 2, "busy cpu lowers concurrency");
    monitor.value.cpu_usage = 0.1;
    monitor.value.memory_usage = 0.9;
    TEST_ASSERT(orch->calculate_optimal_concurrency() == 2, "memory pressure lowers concurrency");

    const BandwidthAllocation a = orch->calculate_bandwidth_allocation(3);
    TEST_ASSERT(a.streams == 3 && a.per_stream_limit == DEFAULT_QUEUE_BANDWIDTH_KBPS / 3, "even split");
    TEST_ASSERT(orch->calculate_bandwidth_allocation(0).streams == 1, "at least one stream");

    bool threw = false;
    try {
        h.orchestrator("");
    } catch (const ValidationError&) {
        threw = true;
    }
    TEST_ASSERT(threw, "batch id required");
    std::cout << "PASS: resource adaptation" << std::endl;
    return true;
}

static bool test_bandwidth_ceiling_caps_governor() {
    Harness h;
    const std::string batch_id = h.add_batch({{"pad.wav", 1800}});
    BandwidthGovernor governor(0);
    ParallelTransferEngine engine(h.repo, h.store, h.dedup, nullptr, &governor, h.pool,
                                  ParallelTransferEngine::Options{}, [](double) {});
    QueueOrchestrator::Options o;
    o.bandwidth_limit_kbps = 750;
    QueueOrchestrator orch(batch_id, h.repo, engine, h.assembler, h.gate, h.source, o, nullptr);

    TEST_ASSERT(orch.calculate_bandwidth_allocation(2).total_allocated == 0, "governor limit reported");
    QueueProcessResult r = orch.process_with_priority_order(PriorityStrategy::SMALLEST_FIRST);
    TEST_ASSERT(r.success && r.completed_uploads == 1, "run succeeds");
    TEST_ASSERT(governor.limit_kbps() == 750, "unlimited governor capped by the batch limit");

    const BandwidthAllocation a = orch.calculate_bandwidth_allocation(3);
    TEST_ASSERT(a.total_allocated == 750 && a.per_stream_limit == 250, "split of the governed limit");
    std::cout << "PASS: bandwidth ceiling caps governor" << std::endl;
    return true;
}

static bool test_meminfo_parsing() {
    std::istringstream typical("MemTotal:       16000000 kB\n"
                               "MemFree:         1000000 kB\n"
                               "MemAvailable:   12000000 kB\n"
                               "Buffers:          200000 kB\n");
    const auto usage = SystemResourceMonitor::memory_usage_from_meminfo(typical);
    TEST_ASSERT(usage.has_value(), "usage parsed");
    TEST_ASSERT(*usage > 0.2499 && *usage < 0.2501, "page cache counts as available");

    std::istringstream old_kernel("MemTotal:       16000000 kB\n"
                                  "MemFree:         1000000 kB\n");
    TEST_ASSERT(!SystemResourceMonitor::memory_usage_from_meminfo(old_kernel).has_value(),
                "no estimate without MemAvailable");

    std::istringstream empty("");
    TEST_ASSERT(!SystemResourceMonitor::memory_usage_from_meminfo(empty).has_value(), "empty input");
    std::cout << "PASS: meminfo parsing" << std::endl;
    return true;
}

int main() {
    std::cout << "Running queue orchestrator tests..." << std::endl;
    test::configure_unit_test_runtime();

    test_batch_completes();
    test_pause_between_sessions_and_resume();
    test_pause_during_scan_keeps_assembled_file();
    test_failure_is_classified_and_retried();
    test_retry_after_recovery_completes();
    test_virus_detected_never_retried();
    test_cancel_preserves_completed();
    test_empty_batch_completes();
    test_ordering_and_grouping();
    test_error_classification();
    test_resource_adaptation();
    test_bandwidth_ceiling_caps_governor();
    test_meminfo_parsing();

    if (tests_failed == 0) {
        std::cout << "ALL PASS" << std::endl;
        return 0;
    }
    std::cerr << tests_failed << " TESTS FAILED" << std::endl;
    return 1;
}
