#include "session_repository.h"
#include "test_helpers.h"
#include "upload_errors.h"
#include "upload_session_state_machine.h"
#include "upload_types.h"

#include <chrono>
#include <iostream>
#include <memory>
#include <string>

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

static bool transition_ok(UploadStatus from, UploadEvent event, UploadStatus expected) {
    UploadSessionStateMachine fsm;
    UploadSession s = test::make_session("a.wav", 10, 1);
    s.status = from;
    try {
        return fsm.handle_event(s, event, std::chrono::system_clock::now()) == expected && s.status == expected;
    } catch (const InvalidTransition&) {
        return false;
    }
}

static bool transition_rejected(UploadStatus from, UploadEvent event) {
    UploadSessionStateMachine fsm;
    UploadSession s = test::make_session("a.wav", 10, 1);
    s.status = from;
    try {
        fsm.handle_event(s, event, std::chrono::system_clock::now());
    } catch (const InvalidTransition&) {
        return s.status == from;
    }
    return false;
}

static bool test_happy_path_transitions() {
    TEST_ASSERT(transition_ok(UploadStatus::PENDING, UploadEvent::START_UPLOAD, UploadStatus::UPLOADING), "pending -> uploading");
    TEST_ASSERT(transition_ok(UploadStatus::UPLOADING, UploadEvent::ALL_CHUNKS_RECEIVED, UploadStatus::ASSEMBLING), "uploading -> assembling");
    TEST_ASSERT(transition_ok(UploadStatus::PENDING, UploadEvent::ALL_CHUNKS_RECEIVED, UploadStatus::ASSEMBLING), "fully deduplicated pending -> assembling");
    TEST_ASSERT(transition_ok(UploadStatus::ASSEMBLING, UploadEvent::ASSEMBLY_SUCCEEDED, UploadStatus::VIRUS_SCANNING), "assembling -> virus_scanning");
    TEST_ASSERT(transition_ok(UploadStatus::VIRUS_SCANNING, UploadEvent::SCAN_CLEAN, UploadStatus::FINALIZING), "clean -> finalizing");
    TEST_ASSERT(transition_ok(UploadStatus::VIRUS_SCANNING, UploadEvent::SCAN_SKIPPED, UploadStatus::FINALIZING), "skipped -> finalizing");
    TEST_ASSERT(transition_ok(UploadStatus::VIRUS_SCANNING, UploadEvent::SCAN_INFECTED, UploadStatus::VIRUS_DETECTED), "infected -> virus_detected");
    TEST_ASSERT(transition_ok(UploadStatus::FINALIZING, UploadEvent::FINALIZED, UploadStatus::COMPLETED), "finalizing -> completed");
    std::cout << "PASS: happy path transitions" << std::endl;
    return true;
}

static bool test_pause_retry_and_terminal_rules() {
    TEST_ASSERT(transition_ok(UploadStatus::UPLOADING, UploadEvent::PAUSE, UploadStatus::PENDING), "pause uploading");
    TEST_ASSERT(transition_ok(UploadStatus::VIRUS_SCANNING, UploadEvent::PAUSE, UploadStatus::PENDING), "pause scanning");
    TEST_ASSERT(transition_ok(UploadStatus::PENDING, UploadEvent::PAUSE, UploadStatus::PENDING), "pause pending is a no-op");
    TEST_ASSERT(transition_ok(UploadStatus::PENDING, UploadEvent::RESUME_SCAN, UploadStatus::VIRUS_SCANNING), "resume scan");
    TEST_ASSERT(transition_ok(UploadStatus::FAILED, UploadEvent::RETRY, UploadStatus::PENDING), "retry failed");
    TEST_ASSERT(transition_ok(UploadStatus::VIRUS_DETECTED, UploadEvent::MANUAL_REQUEUE, UploadStatus::PENDING), "manual requeue");
    TEST_ASSERT(transition_ok(UploadStatus::ASSEMBLING, UploadEvent::FAIL, UploadStatus::FAILED), "fail from assembling");
    TEST_ASSERT(transition_ok(UploadStatus::FINALIZING, UploadEvent::CANCEL, UploadStatus::CANCELLED), "cancel finalizing");

    TEST_ASSERT(transition_rejected(UploadStatus::VIRUS_DETECTED, UploadEvent::RETRY), "virus_detected is never auto-retried");
    TEST_ASSERT(transition_rejected(UploadStatus::COMPLETED, UploadEvent::FAIL), "completed is terminal");
    TEST_ASSERT(transition_rejected(UploadStatus::COMPLETED, UploadEvent::CANCEL), "completed cannot be cancelled");
    TEST_ASSERT(transition_rejected(UploadStatus::CANCELLED, UploadEvent::RETRY), "cancelled cannot be retried");
    TEST_ASSERT(transition_rejected(UploadStatus::UPLOADING, UploadEvent::FINALIZED), "no stage skipping");
    TEST_ASSERT(transition_rejected(UploadStatus::VIRUS_SCANNING, UploadEvent::START_UPLOAD), "no re-entry to upload");
    TEST_ASSERT(transition_rejected(UploadStatus::COMPLETED, UploadEvent::PAUSE), "completed cannot be paused");
    std::cout << "PASS: pause, retry and terminal rules" << std::endl;
    return true;
}

static bool test_filename_rules() {
    TEST_ASSERT(is_filename_safe("Mix Final v2.wav"), "plain name is safe");
    TEST_ASSERT(!is_filename_safe(""), "empty name");
    TEST_ASSERT(!is_filename_safe("   "), "whitespace only");
    TEST_ASSERT(!is_filename_safe("..."), "dots only");
    TEST_ASSERT(!is_filename_safe("a..b.wav"), "double dot");
    TEST_ASSERT(!is_filename_safe("dir/file.wav"), "path separator");
    TEST_ASSERT(!is_filename_safe("what?.wav"), "question mark");
    TEST_ASSERT(!is_filename_safe("tab\there.wav"), "control character");
    TEST_ASSERT(!is_filename_safe("CON"), "reserved device");
    TEST_ASSERT(!is_filename_safe("lpt3.txt"), "reserved device with extension");
    TEST_ASSERT(is_filename_safe("COM10.txt"), "COM10 is not reserved");
    TEST_ASSERT(!is_filename_safe(std::string(256, 'a')), "too long");

    bool threw = false;
    try {
        validate_session(test::make_session("../evil.wav", 10, 1));
    } catch (const ValidationError&) {
        threw = true;
    }
    TEST_ASSERT(threw, "unsafe filename should fail validation");

    threw = false;
    try {
        validate_session(test::make_session("huge.wav", MAX_FILE_SIZE + 1, 1));
    } catch (const ValidationError& e) {
        threw = std::string(e.what()).find("5 GiB") != std::string::npos;
    }
    TEST_ASSERT(threw, "oversized session should fail validation");
    std::cout << "PASS: filename rules" << std::endl;
    return true;
}

static bool test_size_progress_and_expiry() {
    TEST_ASSERT(recommended_chunk_size(5 * MIB) == MIB, "small files use 1 MiB chunks");
    TEST_ASSERT(recommended_chunk_size(500 * MIB) == 5 * MIB, "medium files use 5 MiB chunks");
    TEST_ASSERT(recommended_chunk_size(2 * GIB) == 10 * MIB, "large files use 10 MiB chunks");
    TEST_ASSERT(recommended_chunk_size(6 * GIB) == 25 * MIB, "huge files use 25 MiB chunks");

    UploadSession s = test::make_session("a.wav", 300, 3);
    TEST_ASSERT(session_progress_percentage(s, 1) == 33.33, "1 of 3 is 33.33%");
    TEST_ASSERT(session_progress_percentage(s, 5) == 100.0, "progress clamps at 100");

    const SystemTime now = std::chrono::system_clock::now();
    s.status = UploadStatus::PENDING;
    s.created_at = now - std::chrono::minutes(90);
    TEST_ASSERT(is_session_expired(s, now), "pending for 90 minutes is expired");
    s.created_at = now - std::chrono::minutes(30);
    TEST_ASSERT(!is_session_expired(s, now), "pending for 30 minutes is not expired");
    s.status = UploadStatus::FAILED;
    s.created_at = now - std::chrono::hours(25);
    TEST_ASSERT(is_session_expired(s, now), "failed for 25 hours is expired");
    s.status = UploadStatus::COMPLETED;
    TEST_ASSERT(!is_session_expired(s, now), "completed never expires");
    std::cout << "PASS: size, progress and expiry" << std::endl;
    return true;
}

static bool test_queue_item_counters() {
    QueueItem q;
    q.total_files = 3;
    q.status = QueueStatus::PROCESSING;
    q.mark_file_completed();
    q.mark_file_failed();
    TEST_ASSERT(q.pending_files() == 1, "one file pending");
    TEST_ASSERT(q.status == QueueStatus::PROCESSING, "batch still open");
    q.mark_file_completed();
    TEST_ASSERT(q.status == QueueStatus::FAILED, "batch with a failure closes as failed");
    q.mark_file_completed();
    TEST_ASSERT(q.completed_files == 2, "counters never exceed total_files");

    QueueItem broken;
    broken.total_files = 2;
    broken.completed_files = 5;
    broken.failed_files = -3;
    TEST_ASSERT(broken.pending_files() == 0, "inconsistent counts are clamped");
    TEST_ASSERT(broken.progress_percentage() == 100.0, "progress clamps at 100");
    std::cout << "PASS: queue item counters" << std::endl;
    return true;
}

static bool test_repository_events_and_chunks() {
    auto clock = std::make_shared<ManualClock>();
    SessionRepository repo(clock);
    const UploadSession s = repo.create_session(test::make_session("a.wav", 300, 3));
    TEST_ASSERT(!s.id.empty(), "id assigned");

    TEST_ASSERT(repo.missing_chunks(s.id).size() == 3, "all chunks missing at start");

    ChunkRecord c;
    c.session_id = s.id;
    c.chunk_number = 2;
    c.size = 100;
    c.checksum = std::string(64, 'a');
    c.status = ChunkStatus::COMPLETED;
    c.storage_key = "/tmp/x";
    repo.upsert_chunk(c);
    const auto missing = repo.missing_chunks(s.id);
    TEST_ASSERT(missing.size() == 2 && missing[0] == 1 && missing[1] == 3, "chunk 2 no longer missing");

    c.chunk_number = 4;
    bool threw = false;
    try {
        repo.upsert_chunk(c);
    } catch (const ValidationError&) {
        threw = true;
    }
    TEST_ASSERT(threw, "chunk number beyond chunks_count is rejected");

    clock->advance(std::chrono::seconds(5));
    const UploadSession up = repo.apply_event(s.id, UploadEvent::START_UPLOAD);
    TEST_ASSERT(up.status == UploadStatus::UPLOADING, "event applied");
    TEST_ASSERT(up.updated_at == clock->now(), "updated_at follows the clock");

    const UploadSession failed = repo.apply_event(s.id, UploadEvent::FAIL, [](UploadSession& u) {
        u.metadata["failure_reason"] = "disk";
    });
    TEST_ASSERT(failed.metadata.value("failure_reason", "") == "disk", "extra mutator applied with the event");

    threw = false;
    try {
        repo.apply_event(s.id, UploadEvent::FINALIZED);
    } catch (const InvalidTransition&) {
        threw = true;
    }
    TEST_ASSERT(threw, "illegal event raises InvalidTransition");
    TEST_ASSERT(repo.find_session(s.id)->status == UploadStatus::FAILED, "status unchanged after rejection");
    std::cout << "PASS: repository events and chunks" << std::endl;
    return true;
}

static bool test_repository_snapshot_round_trip() {
    test::TempDir dir("repo");
    const std::string path = dir.sub("sessions.json");
    std::string id;
    std::string batch_id;
    {
        SessionRepository repo;
        SessionRepository::Options opts;
        opts.path = path;
        TEST_ASSERT(repo.open(opts), "open new snapshot");

        QueueItem q;
        q.workspace_id = "ws-1";
        q.draggable_name = "Album";
        q.total_files = 1;
        batch_id = repo.create_batch(q).batch_id;

        UploadSession s = test::make_session("track.flac", 100, 1);
        s.batch_id = batch_id;
        s.metadata["priority"] = "high";
        id = repo.create_session(s).id;
        repo.apply_event(id, UploadEvent::START_UPLOAD);
        repo.close();
    }

    SessionRepository reopened;
    SessionRepository::Options opts;
    opts.path = path;
    TEST_ASSERT(reopened.open(opts), "reopen snapshot");
    auto s = reopened.find_session(id);
    TEST_ASSERT(s.has_value(), "session restored");
    TEST_ASSERT(s->status == UploadStatus::UPLOADING, "status restored");
    TEST_ASSERT(s->priority() == "high", "metadata restored");
    TEST_ASSERT(reopened.sessions_for_batch(batch_id).size() == 1, "batch membership restored");
    TEST_ASSERT(reopened.find_batch(batch_id)->draggable_name == "Album", "batch restored");
    std::cout << "PASS: repository snapshot round trip" << std::endl;
    return true;
}

int main() {
    std::cout << "Running upload session tests..." << std::endl;
    test::configure_unit_test_runtime();

    test_happy_path_transitions();
    test_pause_retry_and_terminal_rules();
    test_filename_rules();
    test_size_progress_and_expiry();
    test_queue_item_counters();
    test_repository_events_and_chunks();
    test_repository_snapshot_round_trip();

    if (tests_failed == 0) {
        std::cout << "ALL PASS" << std::endl;
        return 0;
    }
    std::cerr << tests_failed << " TESTS FAILED" << std::endl;
    return 1;
}
