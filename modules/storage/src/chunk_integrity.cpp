#include "chunk_integrity.h"
#include "logger.h"

#include <map>

namespace chunkflow {

std::string IntegrityReport::summary() const {
    std::string out;
    for (size_t i = 0; i < problems.size(); ++i) {
        if (i > 0) out += "; ";
        out += problems[i];
    }
    return out;
}

IntegrityReport verify_session_chunks(const UploadSession& session,
                                      const std::vector<ChunkRecord>& chunks,
                                      const ChunkStore& store) {
    IntegrityReport report;
    report.expected = session.chunks_count;

    if (session.chunks_count <= 0) {
        report.problems.push_back("session declares no chunks");
        return report;
    }

    std::map<int, const ChunkRecord*> by_number;
    for (const auto& c : chunks) {
        if (c.chunk_number < 1 || c.chunk_number > session.chunks_count) {
            report.problems.push_back("unexpected chunk number " + std::to_string(c.chunk_number));
            continue;
        }
        by_number[c.chunk_number] = &c;
    }

    for (int n = 1; n <= session.chunks_count; ++n) {
        auto it = by_number.find(n);
        if (it == by_number.end() || it->second->status != ChunkStatus::COMPLETED) {
            report.missing.push_back(n);
            report.problems.push_back("chunk " + std::to_string(n) + " missing");
            continue;
        }

        const ChunkRecord& c = *it->second;
        if (c.storage_key.empty() || c.has_pending_dedup_key()) {
            report.broken.push_back(n);
            report.problems.push_back("chunk " + std::to_string(n) + " has unresolved storage key '" +
                                      c.storage_key + "'");
            continue;
        }

        const auto actual = store.size(c.storage_key);
        if (!actual) {
            report.broken.push_back(n);
            report.problems.push_back("chunk " + std::to_string(n) + " file not found");
            continue;
        }
        if (*actual != c.size) {
            report.broken.push_back(n);
            report.problems.push_back("chunk " + std::to_string(n) + " size mismatch: expected " +
                                      std::to_string(c.size) + ", found " + std::to_string(*actual));
            continue;
        }
        ++report.verified;
    }

    report.ok = report.problems.empty() && report.verified == session.chunks_count;
    return report;
}

int demote_broken_chunks(SessionRepository& repo, const std::string& session_id,
                         const IntegrityReport& report) {
    int demoted = 0;
    for (int n : report.broken) {
        auto chunk = repo.find_chunk(session_id, n);
        if (!chunk || chunk->status != ChunkStatus::COMPLETED) continue;

        const std::string lost_key = chunk->storage_key;
        chunk->status = ChunkStatus::FAILED;
        chunk->storage_key.clear();
        chunk->metadata.erase("pending_storage_key_update");
        chunk->metadata.erase("deduplicated_from");
        chunk->metadata.erase("deduplicated_from_chunk_number");
        chunk->metadata["error"] = "stored chunk lost: " + lost_key;
        repo.upsert_chunk(*chunk);
        ++demoted;
    }
    if (demoted > 0) {
        LOG_WARN("CI: " + std::to_string(demoted) + " chunks of session " + session_id +
                 " need to be uploaded again");
    }
    return demoted;
}

} // namespace chunkflow
