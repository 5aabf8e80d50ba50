#include "dedup_index.h"
#include "logger.h"
#include "telemetry.h"

#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace chunkflow {

bool DedupPlan::needs_upload(int chunk_number) const {
    return std::find(to_upload.begin(), to_upload.end(), chunk_number) != to_upload.end();
}

DeduplicationIndex::DeduplicationIndex(const ChunkLookup& lookup, const ChunkStore& store,
                                       Options options, std::shared_ptr<Clock> clock)
    : m_lookup(lookup),
      m_store(store),
      m_options(options),
      m_clock(clock ? std::move(clock) : SystemClock::shared()) {}

bool DeduplicationIndex::verify_source(const ChunkRecord& chunk) const {
    if (m_options.lenient) return true;
    const auto actual = m_store.size(chunk.storage_key);
    return actual && *actual == chunk.size;
}

DedupPlan DeduplicationIndex::plan(const UploadSession& session,
                                   const std::vector<ChunkPayload>& chunks) const {
    DedupPlan result;
    result.stats.total_chunks = static_cast<int>(chunks.size());
    for (const auto& c : chunks) {
        result.stats.total_bytes += c.size;
    }

    if (!m_options.enabled) {
        for (const auto& c : chunks) result.to_upload.push_back(c.chunk_number);
        result.stats.chunks_to_upload = result.stats.total_chunks;
        return result;
    }

    // (a) workspace scope
    std::vector<std::string> checksums;
    checksums.reserve(chunks.size());
    for (const auto& c : chunks) {
        if (!c.checksum.empty()) checksums.push_back(c.checksum);
    }
    std::sort(checksums.begin(), checksums.end());
    checksums.erase(std::unique(checksums.begin(), checksums.end()), checksums.end());

    std::unordered_map<std::string, ChunkRecord> existing;
    if (!checksums.empty()) {
        for (auto& rec : m_lookup.find_by_checksum(session.workspace_id, checksums)) {
            // A session never dedups against itself: re-uploads overwrite in place
            if (rec.session_id == session.id) continue;
            if (existing.count(rec.checksum)) continue;
            if (verify_source(rec)) {
                existing.emplace(rec.checksum, std::move(rec));
            } else {
                LOG_WARN("DEDUP: chunk " + rec.session_id + "/" + std::to_string(rec.chunk_number) +
                         " matched but file missing or resized: " + rec.storage_key);
            }
        }
    }

    // (b) within-list scope
    std::unordered_map<std::string, int> seen;

    for (const auto& c : chunks) {
        auto ex = existing.find(c.checksum);
        if (!c.checksum.empty() && ex != existing.end()) {
            DedupDecision d;
            d.chunk_number = c.chunk_number;
            d.checksum = c.checksum;
            d.source = "workspace";
            d.source_session_id = ex->second.session_id;
            d.source_chunk_number = ex->second.chunk_number;
            d.storage_key = ex->second.storage_key;
            d.bytes_saved = c.size;
            result.deduplicated.push_back(std::move(d));
            LOG_DEBUG("DEDUP: chunk " + std::to_string(c.chunk_number) + " reuses workspace chunk " +
                      ex->second.session_id + "/" + std::to_string(ex->second.chunk_number));
            continue;
        }

        auto prev = seen.find(c.checksum);
        if (!c.checksum.empty() && prev != seen.end()) {
            DedupDecision d;
            d.chunk_number = c.chunk_number;
            d.checksum = c.checksum;
            d.source = "within_upload";
            d.source_chunk_number = prev->second;
            d.storage_key = std::string(DEDUP_PENDING_PREFIX) + std::to_string(prev->second);
            d.bytes_saved = c.size;
            result.deduplicated.push_back(std::move(d));
            LOG_DEBUG("DEDUP: chunk " + std::to_string(c.chunk_number) + " duplicates chunk " +
                      std::to_string(prev->second) + " in same upload");
            continue;
        }

        result.to_upload.push_back(c.chunk_number);
        if (!c.checksum.empty()) seen.emplace(c.checksum, c.chunk_number);
    }

    DedupStats& st = result.stats;
    st.chunks_to_upload = static_cast<int>(result.to_upload.size());
    st.deduplicated_chunks = static_cast<int>(result.deduplicated.size());
    for (const auto& d : result.deduplicated) st.bytes_saved += d.bytes_saved;
    st.deduplication_ratio = st.total_bytes > 0
        ? std::round(static_cast<double>(st.bytes_saved) / st.total_bytes * 1000.0) / 1000.0
        : 0.0;

    if (st.deduplicated_chunks > 0) {
        Telemetry::getInstance().inc_counter("upload.dedup_hits", st.deduplicated_chunks);
        Telemetry::getInstance().inc_counter("upload.dedup_bytes_saved", st.bytes_saved);
    }
    LOG_INFO("DEDUP: session " + session.id + ": " + std::to_string(st.deduplicated_chunks) + "/" +
             std::to_string(st.total_chunks) + " chunks deduplicated, " +
             std::to_string(st.bytes_saved) + " bytes saved");
    return result;
}

std::vector<ChunkRecord> DeduplicationIndex::make_records(const UploadSession& session,
                                                          const std::vector<ChunkPayload>& chunks,
                                                          const DedupPlan& plan) const {
    std::unordered_map<int, const ChunkPayload*> by_number;
    for (const auto& c : chunks) by_number[c.chunk_number] = &c;

    const std::string now_iso = to_iso8601(m_clock->now());
    std::vector<ChunkRecord> records;
    records.reserve(plan.deduplicated.size());

    for (const auto& d : plan.deduplicated) {
        auto it = by_number.find(d.chunk_number);
        if (it == by_number.end()) continue;

        ChunkRecord rec;
        rec.session_id = session.id;
        rec.chunk_number = d.chunk_number;
        rec.size = it->second->size;
        rec.checksum = d.checksum;
        rec.status = ChunkStatus::COMPLETED;
        rec.storage_key = d.storage_key;
        rec.metadata["deduplicated_at"] = now_iso;
        rec.metadata["deduplication_source"] = d.source;
        if (d.source == "workspace") {
            rec.metadata["deduplicated_from"] = d.source_session_id + "/" + std::to_string(d.source_chunk_number);
        } else {
            rec.metadata["deduplicated_from_chunk_number"] = d.source_chunk_number;
            rec.metadata["pending_storage_key_update"] = true;
        }
        records.push_back(std::move(rec));
    }
    return records;
}

DedupResolution DeduplicationIndex::resolve_pending(SessionRepository& repo,
                                                    const std::string& session_id,
                                                    bool drop_unresolvable) const {
    DedupResolution res;
    const auto chunks = repo.chunks_for_session(session_id);

    std::unordered_map<int, const ChunkRecord*> by_number;
    for (const auto& c : chunks) by_number[c.chunk_number] = &c;

    for (const auto& c : chunks) {
        if (!c.has_pending_dedup_key()) continue;

        const int source_number = c.metadata.value("deduplicated_from_chunk_number", 0);
        auto src = by_number.find(source_number);
        const bool source_ready = src != by_number.end() &&
                                  src->second->status == ChunkStatus::COMPLETED &&
                                  !src->second->storage_key.empty() &&
                                  !src->second->has_pending_dedup_key();

        if (source_ready) {
            ChunkRecord updated = c;
            updated.storage_key = src->second->storage_key;
            updated.metadata.erase("pending_storage_key_update");
            repo.upsert_chunk(updated);
            ++res.resolved;
            LOG_DEBUG("DEDUP: resolved chunk " + std::to_string(c.chunk_number) + " -> chunk " +
                      std::to_string(source_number) + " in session " + session_id);
        } else if (drop_unresolvable) {
            repo.remove_chunk(session_id, c.chunk_number);
            ++res.dropped;
            LOG_WARN("DEDUP: source chunk " + std::to_string(source_number) + " not stored, dropping "
                     "placeholder for chunk " + std::to_string(c.chunk_number));
        } else {
            ++res.unresolved;
        }
    }
    return res;
}

} // namespace chunkflow
