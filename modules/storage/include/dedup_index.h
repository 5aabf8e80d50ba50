#ifndef CHUNKFLOW_DEDUP_INDEX_H
#define CHUNKFLOW_DEDUP_INDEX_H

#include "chunk_store.h"
#include "clock.h"
#include "session_repository.h"
#include "upload_sources.h"
#include "upload_types.h"

#include <memory>
#include <set>
#include <string>
#include <vector>

namespace chunkflow {

struct DedupDecision {
    int chunk_number = 0;
    std::string checksum;
    std::string source;                   // "workspace" or "within_upload"
    std::string source_session_id;        // workspace scope only
    int source_chunk_number = 0;
    std::string storage_key;              // real key, or dedup_pending:<n>
    int64_t bytes_saved = 0;
};

struct DedupStats {
    int total_chunks = 0;
    int chunks_to_upload = 0;
    int deduplicated_chunks = 0;
    int64_t bytes_saved = 0;
    int64_t total_bytes = 0;
    double deduplication_ratio = 0.0;     // bytes_saved / total_bytes, 3 places
};

struct DedupPlan {
    std::vector<int> to_upload;           // chunk numbers whose bytes must be stored
    std::vector<DedupDecision> deduplicated;
    DedupStats stats;

    bool needs_upload(int chunk_number) const;
};

struct DedupResolution {
    int resolved = 0;
    int unresolved = 0;
    int dropped = 0;                      // placeholders removed because their source failed
};

/**
 * Chunk deduplication in two scopes, evaluated in order:
 *  (a) completed chunks elsewhere in the same workspace (ChunkLookup)
 *  (b) repeated checksums within the submitted list (first occurrence wins)
 * Source chunks are never modified.
 */
class DeduplicationIndex {
public:
    struct Options {
        bool enabled = true;
        // Skip the "file exists with recorded size" check on workspace matches.
        bool lenient = false;
    };

    DeduplicationIndex(const ChunkLookup& lookup, const ChunkStore& store,
                       Options options, std::shared_ptr<Clock> clock = SystemClock::shared());

    DedupPlan plan(const UploadSession& session, const std::vector<ChunkPayload>& chunks) const;

    // Completed chunk records for every deduplicated entry of the plan.
    std::vector<ChunkRecord> make_records(const UploadSession& session,
                                          const std::vector<ChunkPayload>& chunks,
                                          const DedupPlan& plan) const;

    /**
     * Replace dedup_pending:<n> keys with the source chunk's real key.
     * With drop_unresolvable, placeholders whose source chunk is not
     * completed are removed so the chunk counts as missing again.
     */
    DedupResolution resolve_pending(SessionRepository& repo, const std::string& session_id,
                                    bool drop_unresolvable) const;

    bool enabled() const { return m_options.enabled; }

private:
    bool verify_source(const ChunkRecord& chunk) const;

    const ChunkLookup& m_lookup;
    const ChunkStore& m_store;
    Options m_options;
    std::shared_ptr<Clock> m_clock;
};

} // namespace chunkflow

#endif // CHUNKFLOW_DEDUP_INDEX_H
