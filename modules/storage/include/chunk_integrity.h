#ifndef CHUNKFLOW_CHUNK_INTEGRITY_H
#define CHUNKFLOW_CHUNK_INTEGRITY_H

#include "chunk_store.h"
#include "session_repository.h"
#include "upload_types.h"

#include <string>
#include <vector>

namespace chunkflow {

struct IntegrityReport {
    bool ok = false;
    int expected = 0;
    int verified = 0;
    std::vector<int> missing;             // No completed record for the number
    std::vector<int> broken;              // Completed record, but the file is gone, resized or unresolved
    std::vector<std::string> problems;    // Human-readable, one per defect

    // problems joined with "; " for failure_reason metadata
    std::string summary() const;
};

// Every chunk_number in 1..chunks_count has a completed record whose storage
// key resolves (no dedup placeholder) to a file of the recorded size.
IntegrityReport verify_session_chunks(const UploadSession& session,
                                      const std::vector<ChunkRecord>& chunks,
                                      const ChunkStore& store);

// Flip the report's broken records back to failed (storage key dropped) so
// missing_chunks lists them again. Returns the number demoted.
int demote_broken_chunks(SessionRepository& repo, const std::string& session_id,
                         const IntegrityReport& report);

} // namespace chunkflow

#endif // CHUNKFLOW_CHUNK_INTEGRITY_H
