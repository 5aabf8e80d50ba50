#ifndef CHUNKFLOW_UPLOAD_SOURCES_H
#define CHUNKFLOW_UPLOAD_SOURCES_H

#include "upload_types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chunkflow {

// Narrow read-only views over the session store. Dedup, progress tracking and
// the orchestrator depend on these rather than on SessionRepository itself.

class ChunkLookup {
public:
    virtual ~ChunkLookup() = default;

    // Completed chunks with a storage key, in sessions of this workspace,
    // whose checksum is in the list. Every copy is returned, oldest first, so
    // the caller can skip one whose file has gone.
    virtual std::vector<ChunkRecord> find_by_checksum(const std::string& workspace_id,
                                                      const std::vector<std::string>& checksums) const = 0;
};

class BatchSource {
public:
    virtual ~BatchSource() = default;

    virtual std::optional<QueueItem> find_batch(const std::string& batch_id) const = 0;
    virtual std::vector<UploadSession> sessions_for_batch(const std::string& batch_id) const = 0;
};

struct ChunkTotals {
    int64_t bytes = 0;
    int count = 0;
};

class ChunkMetricsSource {
public:
    virtual ~ChunkMetricsSource() = default;

    // Sum over completed chunks of the given sessions
    virtual ChunkTotals completed_chunk_totals(const std::vector<std::string>& session_ids) const = 0;
    virtual int completed_chunk_count(const std::string& session_id) const = 0;
};

} // namespace chunkflow

#endif // CHUNKFLOW_UPLOAD_SOURCES_H
