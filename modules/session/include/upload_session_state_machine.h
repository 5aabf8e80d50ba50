#ifndef CHUNKFLOW_UPLOAD_SESSION_STATE_MACHINE_H
#define CHUNKFLOW_UPLOAD_SESSION_STATE_MACHINE_H

#include "upload_types.h"

#include <optional>

namespace chunkflow {

// =======================================================
// FSM Input Events
// =======================================================
enum class UploadEvent {
    START_UPLOAD,           // First chunk accepted
    ALL_CHUNKS_RECEIVED,    // Completeness guard passed
    ASSEMBLY_SUCCEEDED,
    SCAN_CLEAN,
    SCAN_INFECTED,
    SCAN_SKIPPED,           // Scanner unavailable, policy = skip
    FINALIZED,              // Asset created
    PAUSE,
    RETRY,                  // Explicit retry of a failed session
    MANUAL_REQUEUE,         // Operator override after virus_detected
    RESUME_SCAN,            // Paused after assembly; the assembled file is still on disk
    FAIL,
    CANCEL
};

const char* upload_event_to_string(UploadEvent event);

// =======================================================
// Upload Session State Machine
// =======================================================
// The only place that decides session status changes. Callers apply side
// effects (storage, scan, asset creation) around it, never the status itself.
class UploadSessionStateMachine {
public:
    // (Session + Event) -> new status, written into the session.
    // Same-state results are no-ops (e.g. PAUSE on pending, CANCEL on cancelled).
    // @throws InvalidTransition when the event is illegal in the current status
    UploadStatus handle_event(UploadSession& session, UploadEvent event, SystemTime now) const;

    bool can_handle(UploadStatus current, UploadEvent event) const {
        return compute_transition(current, event).has_value();
    }

private:
    // Transition table (no side effects)
    std::optional<UploadStatus> compute_transition(UploadStatus current, UploadEvent event) const;
};

} // namespace chunkflow

#endif // CHUNKFLOW_UPLOAD_SESSION_STATE_MACHINE_H
