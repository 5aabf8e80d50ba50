#pragma once

#include "clock.h"
#include "upload_session_state_machine.h"
#include "upload_sources.h"
#include "upload_types.h"

#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace chunkflow {

/**
 * Thread-safe store of upload sessions, their chunk records and queue batches.
 *
 * Optionally backed by a JSON snapshot file written with tmp + rename after
 * each mutation. Persistence failures are logged and reported as false; the
 * in-memory state stays authoritative.
 */
class SessionRepository : public ChunkLookup,
                          public BatchSource,
                          public ChunkMetricsSource {
public:
    struct Options {
        std::string path;
        bool enable = true;
        bool autosave = true;     // Save after every mutation
    };

    using SessionMutator = std::function<void(UploadSession&)>;
    using BatchMutator = std::function<void(QueueItem&)>;
    using SessionFilter = std::function<bool(const UploadSession&)>;

    explicit SessionRepository(std::shared_ptr<Clock> clock = SystemClock::shared());
    ~SessionRepository() override;

    SessionRepository(const SessionRepository&) = delete;
    SessionRepository& operator=(const SessionRepository&) = delete;

    // Load an existing snapshot (a missing file is not an error).
    bool open(const Options& options);
    bool save();
    void close();
    bool is_persistent() const;

    // -- Sessions --------------------------------------------------------

    // Assigns id and timestamps when empty.
    // @throws ValidationError via validate_session
    UploadSession create_session(UploadSession session);
    std::optional<UploadSession> find_session(const std::string& id) const;
    // Applies the mutator under the store lock and returns the updated copy.
    std::optional<UploadSession> update_session(const std::string& id, const SessionMutator& mutate);
    std::vector<UploadSession> list_sessions(const SessionFilter& filter = nullptr) const;
    /**
     * Run the state machine on a stored session under the store lock.
     * extra, when given, edits the session after the transition in the same
     * update (e.g. recording failure_reason).
     * @throws InvalidTransition, ValidationError for an unknown session
     */
    UploadSession apply_event(const std::string& id, UploadEvent event,
                              const SessionMutator& extra = nullptr);
    // Removes the session and its chunk records.
    bool remove_session(const std::string& id);

    // -- Chunks ----------------------------------------------------------

    // Insert or replace by (session_id, chunk_number).
    // @throws ValidationError via validate_chunk, or if the session is unknown
    ChunkRecord upsert_chunk(ChunkRecord chunk);
    std::optional<ChunkRecord> find_chunk(const std::string& session_id, int chunk_number) const;
    // Sorted by chunk_number
    std::vector<ChunkRecord> chunks_for_session(const std::string& session_id) const;
    // Expected numbers 1..chunks_count without a completed record
    std::vector<int> missing_chunks(const std::string& session_id) const;
    int failed_chunk_count(const std::string& session_id) const;
    bool remove_chunk(const std::string& session_id, int chunk_number);
    // Storage keys of completed chunks in sessions (other than the excluded one)
    // that have not been assembled yet. Their files must outlive any cleanup.
    std::set<std::string> live_storage_keys(const std::string& excluding_session_id = "") const;

    // -- Batches ---------------------------------------------------------

    QueueItem create_batch(QueueItem batch);
    std::optional<QueueItem> update_batch(const std::string& batch_id, const BatchMutator& mutate);
    std::vector<QueueItem> list_batches(const std::string& workspace_id = "") const;

    // -- ChunkLookup / BatchSource / ChunkMetricsSource -------------------

    std::vector<ChunkRecord> find_by_checksum(const std::string& workspace_id,
                                              const std::vector<std::string>& checksums) const override;
    std::optional<QueueItem> find_batch(const std::string& batch_id) const override;
    std::vector<UploadSession> sessions_for_batch(const std::string& batch_id) const override;
    ChunkTotals completed_chunk_totals(const std::vector<std::string>& session_ids) const override;
    int completed_chunk_count(const std::string& session_id) const override;

    SystemTime now() const;

private:
    UploadSessionStateMachine m_fsm;
    struct Impl;
    std::unique_ptr<Impl> m;
};

} // namespace chunkflow
