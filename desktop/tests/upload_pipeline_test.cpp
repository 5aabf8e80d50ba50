#include "assembler.h"
#include "asset_catalog.h"
#include "chunk_store.h"
#include "dedup_index.h"
#include "parallel_transfer_engine.h"
#include "scan_gate.h"
#include "scanner_backend.h"
#include "session_repository.h"
#include "telemetry.h"
#include "test_helpers.h"
#include "upload_errors.h"
#include "worker_pool.h"

#include <filesystem>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
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

class FakeScanner : public ScannerBackend {
public:
    bool up = true;
    bool infected = false;
    std::string scan_error;
    int scans = 0;

    std::string name() const override { return "fake"; }
    bool available() override { return up; }
    ScanVerdict scan(const std::string& file_path) override {
        ++scans;
        if (!scan_error.empty()) throw ScanFailedError(scan_error);
        ScanVerdict v;
        v.clean = !infected;
        v.signature = infected ? "Eicar-Test-Signature" : "";
        v.scanner = name();
        std::error_code ec;
        v.file_size = static_cast<int64_t>(std::filesystem::file_size(file_path, ec));
        return v;
    }
};

// Everything one session needs from upload through assembly
struct Pipeline {
    test::TempDir dir{"pipeline"};
    FileChunkStore store{dir.sub("chunks")};
    SessionRepository repo;
    DeduplicationIndex dedup{repo, store, DeduplicationIndex::Options{}};
    WorkerPool pool{"test-transfer", 4, 0};
    ParallelTransferEngine engine{repo, store, dedup, nullptr, nullptr, pool, ParallelTransferEngine::Options{}};
    InMemoryAssetCatalog catalog;
    Assembler assembler{repo, store, catalog, assembler_options()};

    Assembler::Options assembler_options() const {
        Assembler::Options o;
        o.assembly_dir = dir.sub("assembly");
        return o;
    }

    ScanGate::Options gate_options(UnavailablePolicy policy) const {
        ScanGate::Options o;
        o.unavailable_policy = policy;
        return o;
    }

    // Upload every payload and assemble; the session ends in virus_scanning
    UploadSession upload_and_assemble(const std::string& filename, const std::vector<uint8_t>& data) {
        UploadSession s = repo.create_session(test::make_session(filename, static_cast<int64_t>(data.size()),
                                                                 static_cast<int>((data.size() + 999) / 1000)));
        engine.upload_chunks(s.id, test::split_payloads(data, 1000));
        assembler.assemble(s.id);
        return *repo.find_session(s.id);
    }
};

static bool test_out_of_order_upload_assembles_exact_bytes() {
    Pipeline p;
    const auto a = test::pattern_bytes(2500, 1);
    const auto b = test::pattern_bytes(2500, 2);
    const auto c = test::pattern_bytes(2000, 3);
    std::vector<uint8_t> data;
    for (const auto* part : {&a, &b, &a, &c}) data.insert(data.end(), part->begin(), part->end());

    const std::vector<ChunkPayload> payloads = test::split_payloads(data, 2500);
    TEST_ASSERT(payloads.size() == 4, "four chunks");

    UploadSession s = p.repo.create_session(test::make_session("take.wav", static_cast<int64_t>(data.size()), 4));
    SessionTransferResult first = p.engine.upload_chunks(s.id, {payloads[2], payloads[0]});
    TEST_ASSERT(first.succeeded == 2 && first.deduplicated == 1, "repeated block deduplicated");
    TEST_ASSERT(!first.assembly_ready, "not ready with chunks missing");
    TEST_ASSERT(first.status == UploadStatus::UPLOADING, "session uploading");
    TEST_ASSERT(first.bytes_transferred == 2500, "only one copy stored");

    TransferStatusReport status = p.engine.upload_status(s.id);
    TEST_ASSERT(status.missing_chunks == std::vector<int>({2, 4}), "chunks 2 and 4 missing");
    TEST_ASSERT(status.progress_percentage == 50.0, "half done");

    SessionTransferResult second = p.engine.upload_chunks(s.id, {payloads[3], payloads[1]});
    TEST_ASSERT(second.assembly_ready, "ready once every chunk arrived");
    TEST_ASSERT(second.status == UploadStatus::ASSEMBLING, "session assembling");

    const AssemblyResult assembled = p.assembler.assemble(s.id);
    TEST_ASSERT(assembled.bytes_written == static_cast<int64_t>(data.size()), "bytes written");
    TEST_ASSERT(test::read_file(assembled.assembled_file_path) == data, "assembled file is byte-exact");
    TEST_ASSERT(assembled.content_type == "audio/wav", "content type from extension");
    TEST_ASSERT(!std::filesystem::exists(p.store.session_dir(s.id)), "chunk files cleaned");

    s = *p.repo.find_session(s.id);
    TEST_ASSERT(s.status == UploadStatus::VIRUS_SCANNING, "session awaits scan");
    TEST_ASSERT(s.assembled_file_path == assembled.assembled_file_path, "assembled path recorded");

    auto scanner = std::make_shared<FakeScanner>();
    ScanGate gate(p.repo, p.catalog, scanner, p.gate_options(UnavailablePolicy::SKIP));
    TEST_ASSERT(gate.submit(s.id).get() == UploadStatus::COMPLETED, "clean scan completes");
    TEST_ASSERT(scanner->scans == 1, "scanned once");

    s = *p.repo.find_session(s.id);
    TEST_ASSERT(s.status == UploadStatus::COMPLETED, "session completed");
    TEST_ASSERT(s.metadata.value("virus_scan_status", "") == "clean", "scan status recorded");
    auto asset = p.catalog.find_by_session(s.id);
    TEST_ASSERT(asset.has_value(), "asset created");
    TEST_ASSERT(asset->file_size == static_cast<int64_t>(data.size()), "asset size");
    TEST_ASSERT(asset->id == s.metadata.value("asset_id", ""), "asset id recorded on session");

    bool threw = false;
    try {
        gate.process(s.id);
    } catch (const InvalidTransition&) {
        threw = true;
    }
    TEST_ASSERT(threw, "completed session cannot be scanned again");
    std::cout << "PASS: out-of-order upload assembles exact bytes" << std::endl;
    return true;
}

static bool test_size_mismatch_fails_without_output() {
    Pipeline p;
    const auto data = test::pattern_bytes(1200, 4);
    UploadSession s = p.repo.create_session(test::make_session("short.bin", 1000, 2));
    SessionTransferResult r = p.engine.upload_chunks(s.id, test::split_payloads(data, 600));
    TEST_ASSERT(r.assembly_ready, "chunks complete");

    bool threw = false;
    try {
        p.assembler.assemble(s.id);
    } catch (const AssemblyError& e) {
        threw = std::string(e.what()).find("File size mismatch") != std::string::npos;
    }
    TEST_ASSERT(threw, "200 bytes over the declared size is rejected");

    s = *p.repo.find_session(s.id);
    TEST_ASSERT(s.status == UploadStatus::FAILED, "session failed");
    TEST_ASSERT(s.metadata.value("failure_reason", "").find("expected 1000") != std::string::npos,
                "failure reason recorded");
    TEST_ASSERT(test::count_files(p.dir.sub("assembly")) == 0, "no partial output left");
    TEST_ASSERT(p.store.exists(p.store.key_for(s.id, 1)), "chunks kept for inspection");
    std::cout << "PASS: size mismatch fails without output" << std::endl;
    return true;
}

static bool test_small_size_difference_tolerated() {
    Pipeline p;
    const auto data = test::pattern_bytes(1050, 5);
    UploadSession s = p.repo.create_session(test::make_session("close.bin", 1000, 1));
    p.engine.upload_chunks(s.id, test::split_payloads(data, 2000));
    const AssemblyResult r = p.assembler.assemble(s.id);
    TEST_ASSERT(r.bytes_written == 1050, "50 bytes over is within tolerance");
    std::cout << "PASS: small size difference tolerated" << std::endl;
    return true;
}

static bool test_assembly_requires_assembling_state() {
    Pipeline p;
    UploadSession s = p.repo.create_session(test::make_session("early.bin", 3000, 3));
    p.engine.upload_chunks(s.id, {test::make_payload(1, test::pattern_bytes(1000, 6))});

    const AssemblyStatus status = p.assembler.assembly_status(s.id);
    TEST_ASSERT(!status.ready && status.missing_chunks.size() == 2, "not ready");

    bool threw = false;
    try {
        p.assembler.assemble(s.id);
    } catch (const InvalidTransition&) {
        threw = true;
    }
    TEST_ASSERT(threw, "assembling an uploading session is refused");
    s = *p.repo.find_session(s.id);
    TEST_ASSERT(s.status == UploadStatus::UPLOADING, "session keeps uploading");
    TEST_ASSERT(!s.metadata.contains("failure_reason"), "no failure recorded");

    p.repo.apply_event(s.id, UploadEvent::FAIL);
    threw = false;
    try {
        p.engine.upload_chunks(s.id, {test::make_payload(2, test::pattern_bytes(1000, 7))});
    } catch (const InvalidTransition&) {
        threw = true;
    }
    TEST_ASSERT(threw, "failed session rejects chunks");
    std::cout << "PASS: assembly requires assembling state" << std::endl;
    return true;
}

static bool test_bad_checksum_then_retry() {
    Pipeline p;
    const auto data = test::pattern_bytes(3000, 8);
    std::vector<ChunkPayload> payloads = test::split_payloads(data, 1000);
    UploadSession s = p.repo.create_session(test::make_session("retry.bin", 3000, 3));

    std::vector<ChunkPayload> sent = payloads;
    sent[1].checksum = std::string(64, '0');
    SessionTransferResult r = p.engine.upload_chunks(s.id, sent);
    TEST_ASSERT(r.succeeded == 2 && r.failed == 1, "one chunk failed");
    TEST_ASSERT(!r.chunks[1].retryable && r.chunks[1].attempts == 1, "checksum failures are not retried");
    TEST_ASSERT(r.chunks[1].error.find("checksum mismatch") != std::string::npos, "error names the cause");
    TEST_ASSERT(p.repo.failed_chunk_count(s.id) == 1, "failed chunk recorded");
    TEST_ASSERT(!r.assembly_ready, "incomplete session stays uploading");

    SessionTransferResult retried = p.engine.retry_failed_chunks(s.id, payloads);
    TEST_ASSERT(retried.chunks.size() == 1 && retried.chunks[0].chunk_number == 2, "only the failed chunk is resent");
    TEST_ASSERT(retried.assembly_ready, "retry completes the session");
    std::cout << "PASS: bad checksum then retry" << std::endl;
    return true;
}

static bool test_malformed_payloads_reported_per_chunk() {
    Pipeline p;
    UploadSession s = p.repo.create_session(test::make_session("bad.bin", 2000, 2));
    ChunkPayload too_far = test::make_payload(3, test::pattern_bytes(10, 9));
    ChunkPayload wrong_size = test::make_payload(1, test::pattern_bytes(10, 10));
    wrong_size.size = 11;
    ChunkPayload good = test::make_payload(2, test::pattern_bytes(1000, 11));

    SessionTransferResult r = p.engine.upload_chunks(s.id, {too_far, wrong_size, good});
    TEST_ASSERT(r.succeeded == 1 && r.failed == 2, "only the good chunk stored");
    TEST_ASSERT(r.chunks[0].error.find("Invalid chunk data") != std::string::npos, "size mismatch reported");
    TEST_ASSERT(r.chunks[2].error.find("Invalid chunk number") != std::string::npos, "out of range reported");
    std::cout << "PASS: malformed payloads reported per chunk" << std::endl;
    return true;
}

static bool test_pause_before_assembly_keeps_session() {
    Pipeline p;
    const auto data = test::pattern_bytes(2000, 18);
    UploadSession s = p.repo.create_session(test::make_session("paused.wav", 2000, 2));
    TEST_ASSERT(p.engine.upload_chunks(s.id, test::split_payloads(data, 1000)).assembly_ready, "chunks complete");

    // Paused after the queue picked the session but before assembly ran
    p.repo.apply_event(s.id, UploadEvent::PAUSE);
    bool threw = false;
    try {
        p.assembler.assemble(s.id);
    } catch (const InvalidTransition&) {
        threw = true;
    }
    TEST_ASSERT(threw, "assembling a paused session is refused");
    s = *p.repo.find_session(s.id);
    TEST_ASSERT(s.status == UploadStatus::PENDING, "session stays paused");
    TEST_ASSERT(!s.metadata.contains("failure_reason"), "pause is not a failure");
    TEST_ASSERT(p.store.exists(p.store.key_for(s.id, 1)), "chunks kept while paused");

    SessionTransferResult resumed = p.engine.upload_chunks(s.id, {});
    TEST_ASSERT(resumed.assembly_ready, "resume goes straight back to assembling");
    const AssemblyResult r = p.assembler.assemble(s.id);
    TEST_ASSERT(test::read_file(r.assembled_file_path) == data, "assembled after resume");
    std::cout << "PASS: pause before assembly keeps session" << std::endl;
    return true;
}

static bool test_shared_chunk_outlives_source_assembly() {
    Pipeline p;
    const auto x = test::pattern_bytes(1000, 20);
    const auto y = test::pattern_bytes(1000, 21);
    UploadSession a = p.repo.create_session(test::make_session("a.wav", 2000, 2));
    UploadSession b = p.repo.create_session(test::make_session("b.wav", 1000, 1));

    TEST_ASSERT(p.engine.upload_chunks(a.id, {test::make_payload(1, x), test::make_payload(2, y)}).assembly_ready,
                "a complete");
    SessionTransferResult rb = p.engine.upload_chunks(b.id, {test::make_payload(1, x)});
    TEST_ASSERT(rb.deduplicated == 1 && rb.assembly_ready, "b reuses a's chunk");
    const std::string shared_key = p.store.key_for(a.id, 1);
    TEST_ASSERT(p.repo.find_chunk(b.id, 1)->storage_key == shared_key, "b points at a's file");

    p.assembler.assemble(a.id);
    TEST_ASSERT(p.store.exists(shared_key), "file still backing b is kept");
    TEST_ASSERT(!p.store.exists(p.store.key_for(a.id, 2)), "a's unshared chunk cleaned");

    const AssemblyResult assembled = p.assembler.assemble(b.id);
    TEST_ASSERT(test::read_file(assembled.assembled_file_path) == x, "b assembles from the shared file");
    TEST_ASSERT(!p.store.exists(shared_key), "shared file released once b is assembled");
    std::cout << "PASS: shared chunk outlives source assembly" << std::endl;
    return true;
}

static bool test_lost_shared_chunk_uploaded_again() {
    Pipeline p;
    const auto x = test::pattern_bytes(1000, 22);
    const auto y = test::pattern_bytes(1000, 23);
    UploadSession a = p.repo.create_session(test::make_session("a.wav", 2000, 2));
    UploadSession b = p.repo.create_session(test::make_session("b.wav", 1000, 1));
    p.engine.upload_chunks(a.id, {test::make_payload(1, x), test::make_payload(2, y)});
    TEST_ASSERT(p.engine.upload_chunks(b.id, {test::make_payload(1, x)}).deduplicated == 1, "b reuses a's chunk");

    // The borrowed file disappears from under b
    const std::string shared_key = p.store.key_for(a.id, 1);
    TEST_ASSERT(std::filesystem::remove(shared_key), "file removed");

    bool threw = false;
    try {
        p.assembler.assemble(b.id);
    } catch (const AssemblyError& e) {
        threw = std::string(e.what()).find("file not found") != std::string::npos;
    }
    TEST_ASSERT(threw, "integrity check catches the lost file");
    TEST_ASSERT(p.repo.find_session(b.id)->status == UploadStatus::FAILED, "b failed");
    TEST_ASSERT(p.repo.missing_chunks(b.id) == std::vector<int>({1}), "lost chunk needs uploading again");

    p.repo.apply_event(b.id, UploadEvent::RETRY);
    SessionTransferResult again = p.engine.upload_chunks(b.id, {test::make_payload(1, x)});
    TEST_ASSERT(again.succeeded == 1 && again.deduplicated == 0, "stored afresh instead of reusing the dead file");
    TEST_ASSERT(again.assembly_ready, "retry completes b");
    TEST_ASSERT(p.repo.find_chunk(b.id, 1)->storage_key == p.store.key_for(b.id, 1), "b owns its copy");

    const AssemblyResult assembled = p.assembler.assemble(b.id);
    TEST_ASSERT(test::read_file(assembled.assembled_file_path) == x, "b assembles after retry");
    std::cout << "PASS: lost shared chunk uploaded again" << std::endl;
    return true;
}

static bool test_concurrent_final_chunks_start_one_assembly() {
    Pipeline p;
    const auto data = test::pattern_bytes(4000, 24);
    const std::vector<ChunkPayload> payloads = test::split_payloads(data, 1000);
    UploadSession s = p.repo.create_session(test::make_session("race.wav", 4000, 4));
    p.engine.upload_chunks(s.id, {payloads[0], payloads[1]});

    const int64_t starts_before = Telemetry::getInstance().counter_value("upload.assembly_starts");
    std::promise<void> go;
    std::shared_future<void> ready = go.get_future().share();
    auto send = [&p, &s, &payloads, ready] {
        ready.wait();
        try {
            return p.engine.upload_chunks(s.id, {payloads[2], payloads[3]}).assembly_ready ? 1 : 0;
        } catch (const InvalidTransition&) {
            return 0;  // the other call already moved the session on
        }
    };
    std::future<int> first = std::async(std::launch::async, send);
    std::future<int> second = std::async(std::launch::async, send);
    go.set_value();
    const int ready_count = first.get() + second.get();

    TEST_ASSERT(ready_count >= 1, "at least one caller sees assembly ready");
    TEST_ASSERT(Telemetry::getInstance().counter_value("upload.assembly_starts") - starts_before == 1,
                "exactly one move to assembling");
    TEST_ASSERT(p.repo.find_session(s.id)->status == UploadStatus::ASSEMBLING, "session assembling");
    TEST_ASSERT(p.engine.tracked_sessions() == 0, "session lock released after transfer");

    const AssemblyResult r = p.assembler.assemble(s.id);
    TEST_ASSERT(test::read_file(r.assembled_file_path) == data, "assembled once from all chunks");
    std::cout << "PASS: concurrent final chunks start one assembly" << std::endl;
    return true;
}

static bool test_measured_transfers_adapt_limit() {
    Pipeline p;
    BandwidthGovernor governor(1000);
    ParallelTransferEngine::Options o;
    o.max_concurrent = 4;
    ParallelTransferEngine engine(p.repo, p.store, p.dedup, nullptr, &governor, p.pool, o,
                                  [](double) {});

    std::vector<ChunkPayload> payloads;
    for (int i = 1; i <= 10; ++i) payloads.push_back(test::make_payload(i, test::pattern_bytes(102400, 30 + i)));
    UploadSession s = p.repo.create_session(test::make_session("fast.wav", 10 * 102400, 10));
    TEST_ASSERT(engine.upload_chunks(s.id, payloads).succeeded == 10, "all chunks stored");

    TEST_ASSERT(governor.history_size() == 10, "every transfer measured");
    TEST_ASSERT(governor.limit_kbps() != 1000, "limit follows the measured store speed");
    TEST_ASSERT(governor.active_streams() == 0, "streams returned after the batches");
    std::cout << "PASS: measured transfers adapt limit" << std::endl;
    return true;
}

static bool test_streams_share_one_limit() {
    Pipeline p;
    BandwidthGovernor governor(1000);
    std::vector<double> delays;
    std::mutex delays_mutex;
    ParallelTransferEngine engine(p.repo, p.store, p.dedup, nullptr, &governor, p.pool,
                                  ParallelTransferEngine::Options{},
                                  [&delays, &delays_mutex](double seconds) {
                                      std::lock_guard<std::mutex> lock(delays_mutex);
                                      delays.push_back(seconds);
                                  });

    UploadSession s = p.repo.create_session(test::make_session("shared.wav", 102400, 1));
    {
        // Three streams of another session are already open
        BandwidthGovernor::StreamLease others(&governor, 3);
        engine.upload_chunks(s.id, {test::make_payload(1, test::pattern_bytes(102400, 40))});
    }
    TEST_ASSERT(delays.size() == 1, "one throttled transfer");
    TEST_ASSERT(delays[0] > 0.399 && delays[0] < 0.401, "100 KB at a quarter of 1000 KB/s");
    TEST_ASSERT(governor.active_streams() == 0, "all streams returned");
    std::cout << "PASS: streams share one limit" << std::endl;
    return true;
}

static bool test_infected_file_quarantined() {
    Pipeline p;
    UploadSession s = p.upload_and_assemble("bad.zip", test::pattern_bytes(2500, 12));
    const std::string path = s.assembled_file_path;
    TEST_ASSERT(std::filesystem::exists(path), "assembled file exists before scan");

    auto scanner = std::make_shared<FakeScanner>();
    scanner->infected = true;
    ScanGate gate(p.repo, p.catalog, scanner, p.gate_options(UnavailablePolicy::SKIP));
    TEST_ASSERT(gate.process(s.id) == UploadStatus::VIRUS_DETECTED, "infected verdict");

    s = *p.repo.find_session(s.id);
    TEST_ASSERT(s.status == UploadStatus::VIRUS_DETECTED, "session quarantined");
    TEST_ASSERT(!std::filesystem::exists(path), "infected file deleted");
    TEST_ASSERT(s.metadata["virus_scan"].value("virus_name", "") == "Eicar-Test-Signature", "signature recorded");
    TEST_ASSERT(p.catalog.size() == 0, "no asset for infected upload");
    std::cout << "PASS: infected file quarantined" << std::endl;
    return true;
}

static bool test_scanner_unavailable_policies() {
    Pipeline p;
    auto scanner = std::make_shared<FakeScanner>();
    scanner->up = false;

    UploadSession skipped = p.upload_and_assemble("skip.bin", test::pattern_bytes(1500, 13));
    ScanGate lenient(p.repo, p.catalog, scanner, p.gate_options(UnavailablePolicy::SKIP));
    TEST_ASSERT(lenient.process(skipped.id) == UploadStatus::COMPLETED, "skip policy finalizes");
    skipped = *p.repo.find_session(skipped.id);
    TEST_ASSERT(skipped.metadata["virus_scan"].value("status", "") == "unavailable", "unavailable recorded");
    TEST_ASSERT(scanner->scans == 0, "scanner never invoked");

    UploadSession closed = p.upload_and_assemble("closed.bin", test::pattern_bytes(1500, 14));
    ScanGate strict(p.repo, p.catalog, scanner, p.gate_options(UnavailablePolicy::FAIL_CLOSED));
    TEST_ASSERT(strict.process(closed.id) == UploadStatus::FAILED, "fail_closed fails the session");
    closed = *p.repo.find_session(closed.id);
    TEST_ASSERT(closed.metadata.value("failure_reason", "").find("Virus scan unavailable") != std::string::npos,
                "reason recorded");

    UploadSession disabled = p.upload_and_assemble("off.bin", test::pattern_bytes(1500, 15));
    ScanGate::Options off = p.gate_options(UnavailablePolicy::FAIL_CLOSED);
    off.enabled = false;
    ScanGate no_scan(p.repo, p.catalog, scanner, off);
    TEST_ASSERT(no_scan.process(disabled.id) == UploadStatus::COMPLETED, "disabled scanning finalizes");
    TEST_ASSERT(p.repo.find_session(disabled.id)->metadata.value("virus_scan_status", "") == "skipped",
                "skipped recorded");
    std::cout << "PASS: scanner unavailable policies" << std::endl;
    return true;
}

static bool test_scan_error_fails_closed() {
    Pipeline p;
    UploadSession s = p.upload_and_assemble("stuck.wav", test::pattern_bytes(1500, 25));
    auto scanner = std::make_shared<FakeScanner>();
    scanner->scan_error = "clamscan timed out after 30s";

    // Even the lenient policy must not let an unscanned file through
    ScanGate gate(p.repo, p.catalog, scanner, p.gate_options(UnavailablePolicy::SKIP));
    TEST_ASSERT(gate.process(s.id) == UploadStatus::FAILED, "scan error fails the session");
    s = *p.repo.find_session(s.id);
    TEST_ASSERT(s.metadata.value("failure_reason", "").find("Virus scan failed") != std::string::npos,
                "reason recorded");
    TEST_ASSERT(s.metadata["virus_scan"].value("status", "") == "error", "error recorded");
    TEST_ASSERT(p.catalog.size() == 0, "no asset for an unscanned file");

    bool threw = false;
    try {
        ClamAvScanner().scan(p.dir.sub("missing.wav"));
    } catch (const ScanFailedError&) {
        threw = true;
    }
    TEST_ASSERT(threw, "a file that cannot be read is a scan failure");
    std::cout << "PASS: scan error fails closed" << std::endl;
    return true;
}

static bool test_duplicate_asset_name_rejected() {
    Pipeline p;
    auto scanner = std::make_shared<FakeScanner>();
    ScanGate gate(p.repo, p.catalog, scanner, p.gate_options(UnavailablePolicy::SKIP));

    UploadSession first = p.upload_and_assemble("song.mp3", test::pattern_bytes(1500, 16));
    TEST_ASSERT(gate.process(first.id) == UploadStatus::COMPLETED, "first upload completes");

    UploadSession second = p.repo.create_session(test::make_session("song.mp3", 1500, 2));
    p.engine.upload_chunks(second.id, test::split_payloads(test::pattern_bytes(1500, 17), 1000));
    bool threw = false;
    try {
        p.assembler.assemble(second.id);
    } catch (const AssemblyError& e) {
        threw = std::string(e.what()).find("already exists") != std::string::npos;
    }
    TEST_ASSERT(threw, "second asset with the same name rejected");
    std::cout << "PASS: duplicate asset name rejected" << std::endl;
    return true;
}

int main() {
    std::cout << "Running upload pipeline tests..." << std::endl;
    test::configure_unit_test_runtime();

    test_out_of_order_upload_assembles_exact_bytes();
    test_size_mismatch_fails_without_output();
    test_small_size_difference_tolerated();
    test_assembly_requires_assembling_state();
    test_pause_before_assembly_keeps_session();
    test_shared_chunk_outlives_source_assembly();
    test_lost_shared_chunk_uploaded_again();
    test_concurrent_final_chunks_start_one_assembly();
    test_measured_transfers_adapt_limit();
    test_streams_share_one_limit();
    test_bad_checksum_then_retry();
    test_malformed_payloads_reported_per_chunk();
    test_infected_file_quarantined();
    test_scanner_unavailable_policies();
    test_scan_error_fails_closed();
    test_duplicate_asset_name_rejected();

    if (tests_failed == 0) {
        std::cout << "ALL PASS" << std::endl;
        return 0;
    }
    std::cerr << tests_failed << " TESTS FAILED" << std::endl;
    return 1;
}
