#include "upload_session_state_machine.h"
#include "upload_errors.h"
#include "logger.h"

namespace chunkflow {

const char* upload_event_to_string(UploadEvent event) {
    switch (event) {
        case UploadEvent::START_UPLOAD:        return "START_UPLOAD";
        case UploadEvent::ALL_CHUNKS_RECEIVED: return "ALL_CHUNKS_RECEIVED";
        case UploadEvent::ASSEMBLY_SUCCEEDED:  return "ASSEMBLY_SUCCEEDED";
        case UploadEvent::SCAN_CLEAN:          return "SCAN_CLEAN";
        case UploadEvent::SCAN_INFECTED:       return "SCAN_INFECTED";
        case UploadEvent::SCAN_SKIPPED:        return "SCAN_SKIPPED";
        case UploadEvent::FINALIZED:           return "FINALIZED";
        case UploadEvent::PAUSE:               return "PAUSE";
        case UploadEvent::RETRY:               return "RETRY";
        case UploadEvent::MANUAL_REQUEUE:      return "MANUAL_REQUEUE";
        case UploadEvent::RESUME_SCAN:         return "RESUME_SCAN";
        case UploadEvent::FAIL:                return "FAIL";
        case UploadEvent::CANCEL:              return "CANCEL";
    }
    return "UNKNOWN";
}

// ==========================================================
// FSM ENTRY POINT
// ==========================================================
UploadStatus UploadSessionStateMachine::handle_event(UploadSession& session,
                                                     UploadEvent event,
                                                     SystemTime now) const {
    const UploadStatus old_state = session.status;
    const std::optional<UploadStatus> next = compute_transition(old_state, event);

    if (!next) {
        LOG_WARN(std::string("[UploadFSM] rejected ") + upload_event_to_string(event) +
                 " in " + upload_status_to_string(old_state) + " session=" + session.id);
        throw InvalidTransition(std::string("Cannot apply ") + upload_event_to_string(event) +
                                " to session " + session.id + " in status " +
                                upload_status_to_string(old_state));
    }

    if (*next != old_state) {
        session.status = *next;
        session.updated_at = now;

        LOG_INFO(
            std::string("[UploadFSM] ") +
            upload_status_to_string(old_state) +
            " --(" + upload_event_to_string(event) + ")--> " +
            upload_status_to_string(*next) +
            " session=" + session.id
        );
    }
    return *next;
}

// ==========================================================
// TRANSITION TABLE (AUTHORITATIVE)
// ==========================================================
std::optional<UploadStatus> UploadSessionStateMachine::compute_transition(
    UploadStatus current,
    UploadEvent event
) const {

    // Failure and cancellation are reachable from every non-terminal state.
    if (!is_terminal_status(current)) {
        if (event == UploadEvent::CANCEL) return UploadStatus::CANCELLED;
        if (event == UploadEvent::FAIL) return UploadStatus::FAILED;
    }

    // Pause rolls any in-flight stage back to pending. Chunk data is untouched.
    if (event == UploadEvent::PAUSE &&
        (is_active_status(current) || current == UploadStatus::PENDING)) {
        return UploadStatus::PENDING;
    }

    switch (current) {

    // ------------------------------------------------------
    case UploadStatus::PENDING:
        if (event == UploadEvent::START_UPLOAD)
            return UploadStatus::UPLOADING;
        // Every chunk was satisfied by dedup before any transfer ran
        if (event == UploadEvent::ALL_CHUNKS_RECEIVED)
            return UploadStatus::ASSEMBLING;
        if (event == UploadEvent::RESUME_SCAN)
            return UploadStatus::VIRUS_SCANNING;
        break;

    // ------------------------------------------------------
    case UploadStatus::UPLOADING:
        if (event == UploadEvent::START_UPLOAD)
            return UploadStatus::UPLOADING;
        if (event == UploadEvent::ALL_CHUNKS_RECEIVED)
            return UploadStatus::ASSEMBLING;
        break;

    // ------------------------------------------------------
    case UploadStatus::ASSEMBLING:
        if (event == UploadEvent::ASSEMBLY_SUCCEEDED)
            return UploadStatus::VIRUS_SCANNING;
        break;

    // ------------------------------------------------------
    case UploadStatus::VIRUS_SCANNING:
        if (event == UploadEvent::SCAN_CLEAN || event == UploadEvent::SCAN_SKIPPED)
            return UploadStatus::FINALIZING;
        if (event == UploadEvent::SCAN_INFECTED)
            return UploadStatus::VIRUS_DETECTED;
        break;

    // ------------------------------------------------------
    case UploadStatus::FINALIZING:
        if (event == UploadEvent::FINALIZED)
            return UploadStatus::COMPLETED;
        break;

    // ------------------------------------------------------
    case UploadStatus::FAILED:
        if (event == UploadEvent::RETRY)
            return UploadStatus::PENDING;
        break;

    // ------------------------------------------------------
    case UploadStatus::VIRUS_DETECTED:
        // Never automatic: only an operator requeue leaves this state
        if (event == UploadEvent::MANUAL_REQUEUE)
            return UploadStatus::PENDING;
        break;

    // ------------------------------------------------------
    case UploadStatus::CANCELLED:
        if (event == UploadEvent::CANCEL)
            return UploadStatus::CANCELLED;
        break;

    // ------------------------------------------------------
    case UploadStatus::COMPLETED:
        break;
    }

    return std::nullopt;
}

} // namespace chunkflow
