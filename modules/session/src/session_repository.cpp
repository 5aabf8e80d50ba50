/**
 * session_repository.cpp
 * In-memory session/chunk/batch store with an optional JSON snapshot file.
 */

#include "session_repository.h"
#include "content_hash.h"
#include "logger.h"
#include "upload_errors.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <map>
#include <mutex>
#include <set>
#include <unordered_map>
#include <unordered_set>

using json = nlohmann::json;

namespace chunkflow {

namespace {

// Until a session has an assembled file, its chunk files are its only copy
bool needs_chunk_files(const UploadSession& s) {
    switch (s.status) {
        case UploadStatus::PENDING:
        case UploadStatus::UPLOADING:
        case UploadStatus::ASSEMBLING:
        case UploadStatus::FAILED:
            return s.assembled_file_path.empty();
        default:
            return false;
    }
}

} // namespace

// ============================================================================
// Impl class
// ============================================================================
struct SessionRepository::Impl {
    explicit Impl(std::shared_ptr<Clock> c) : clock(std::move(c)) {}

    bool load();
    bool save_atomic();
    // Called with mutex held after every mutation
    void persist() {
        if (is_open && autosave) save_atomic();
    }

    std::shared_ptr<Clock> clock;
    std::string path;
    bool is_open = false;
    bool autosave = true;
    mutable std::mutex mutex;

    std::unordered_map<std::string, UploadSession> sessions;
    // session id -> chunk_number -> record
    std::unordered_map<std::string, std::map<int, ChunkRecord>> chunks;
    std::unordered_map<std::string, QueueItem> batches;
};

bool SessionRepository::Impl::load() {
    // Called with mutex held
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        LOG_DEBUG("SessionRepository: No existing snapshot at " + path);
        return false;
    }

    try {
        json j;
        ifs >> j;

        if (!j.is_object() || !j.contains("sessions")) {
            LOG_WARN("SessionRepository: Invalid snapshot format in " + path);
            return false;
        }

        sessions.clear();
        chunks.clear();
        batches.clear();

        for (const auto& s : j["sessions"]) {
            UploadSession session = s.get<UploadSession>();
            if (!session.id.empty()) {
                sessions[session.id] = std::move(session);
            }
        }
        for (const auto& c : j.value("chunks", json::array())) {
            ChunkRecord chunk = c.get<ChunkRecord>();
            if (sessions.count(chunk.session_id) && chunk.chunk_number > 0) {
                chunks[chunk.session_id][chunk.chunk_number] = std::move(chunk);
            }
        }
        for (const auto& b : j.value("batches", json::array())) {
            QueueItem batch = b.get<QueueItem>();
            if (!batch.batch_id.empty()) {
                batches[batch.batch_id] = std::move(batch);
            }
        }

        LOG_DEBUG("SessionRepository: Loaded " + std::to_string(sessions.size()) + " sessions, " +
                  std::to_string(batches.size()) + " batches");
        return true;

    } catch (const std::exception& e) {
        LOG_WARN("SessionRepository: Failed to parse snapshot: " + std::string(e.what()));
        return false;
    }
}

bool SessionRepository::Impl::save_atomic() {
    // Called with mutex held
    const std::string tmp_path = path + ".tmp";

    try {
        json j;
        j["version"] = 1;
        j["sessions"] = json::array();
        j["chunks"] = json::array();
        j["batches"] = json::array();

        for (const auto& kv : sessions) {
            j["sessions"].push_back(kv.second);
        }
        for (const auto& kv : chunks) {
            for (const auto& ck : kv.second) {
                j["chunks"].push_back(ck.second);
            }
        }
        for (const auto& kv : batches) {
            j["batches"].push_back(kv.second);
        }

        std::ofstream ofs(tmp_path);
        if (!ofs.is_open()) {
            LOG_ERROR("SessionRepository: Cannot write temp file " + tmp_path);
            return false;
        }

        ofs << j.dump(2);
        ofs.close();

        if (ofs.fail()) {
            LOG_ERROR("SessionRepository: Failed to write temp file " + tmp_path);
            std::remove(tmp_path.c_str());
            return false;
        }

        if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
            LOG_ERROR("SessionRepository: Failed to rename temp file to " + path);
            std::remove(tmp_path.c_str());
            return false;
        }
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("SessionRepository: Exception during save: " + std::string(e.what()));
        std::remove(tmp_path.c_str());
        return false;
    }
}

// ============================================================================
// Lifecycle
// ============================================================================

SessionRepository::SessionRepository(std::shared_ptr<Clock> clock)
    : m(std::make_unique<Impl>(clock ? std::move(clock) : SystemClock::shared())) {}

SessionRepository::~SessionRepository() {
    close();
}

bool SessionRepository::open(const Options& options) {
    if (!options.enable || options.path.empty()) {
        LOG_INFO("SessionRepository: Persistence disabled by configuration");
        return false;
    }

    std::lock_guard<std::mutex> lock(m->mutex);
    if (m->is_open) {
        return true;
    }

    m->path = options.path;
    m->autosave = options.autosave;
    m->load();  // A missing file just means a fresh store
    m->is_open = true;

    LOG_INFO("SessionRepository: Opened snapshot " + m->path + " (" +
             std::to_string(m->sessions.size()) + " sessions loaded)");
    return true;
}

bool SessionRepository::save() {
    std::lock_guard<std::mutex> lock(m->mutex);
    if (!m->is_open) {
        return false;
    }
    return m->save_atomic();
}

void SessionRepository::close() {
    std::lock_guard<std::mutex> lock(m->mutex);
    if (!m->is_open) {
        return;
    }
    m->save_atomic();
    m->is_open = false;
    LOG_INFO("SessionRepository: Closed");
}

bool SessionRepository::is_persistent() const {
    std::lock_guard<std::mutex> lock(m->mutex);
    return m->is_open;
}

SystemTime SessionRepository::now() const {
    return m->clock->now();
}

// ============================================================================
// Sessions
// ============================================================================

UploadSession SessionRepository::create_session(UploadSession session) {
    validate_session(session);

    const SystemTime ts = m->clock->now();
    if (session.id.empty()) session.id = generate_uuid();
    if (session.created_at == SystemTime{}) session.created_at = ts;
    session.updated_at = ts;
    if (!session.metadata.is_object()) session.metadata = Metadata::object();

    std::lock_guard<std::mutex> lock(m->mutex);
    if (m->sessions.count(session.id)) {
        throw ValidationError("Upload session " + session.id + " already exists");
    }
    m->sessions[session.id] = session;
    m->persist();
    return session;
}

std::optional<UploadSession> SessionRepository::find_session(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m->mutex);
    auto it = m->sessions.find(id);
    if (it == m->sessions.end()) return std::nullopt;
    return it->second;
}

std::optional<UploadSession> SessionRepository::update_session(const std::string& id,
                                                               const SessionMutator& mutate) {
    std::lock_guard<std::mutex> lock(m->mutex);
    auto it = m->sessions.find(id);
    if (it == m->sessions.end()) return std::nullopt;

    UploadSession updated = it->second;
    mutate(updated);
    updated.id = id;  // Identity is not mutable
    updated.updated_at = m->clock->now();
    it->second = updated;
    m->persist();
    return updated;
}

std::vector<UploadSession> SessionRepository::list_sessions(const SessionFilter& filter) const {
    std::vector<UploadSession> result;
    {
        std::lock_guard<std::mutex> lock(m->mutex);
        result.reserve(m->sessions.size());
        for (const auto& kv : m->sessions) {
            if (!filter || filter(kv.second)) {
                result.push_back(kv.second);
            }
        }
    }
    std::sort(result.begin(), result.end(), [](const UploadSession& a, const UploadSession& b) {
        if (a.created_at != b.created_at) return a.created_at < b.created_at;
        return a.id < b.id;
    });
    return result;
}

UploadSession SessionRepository::apply_event(const std::string& id, UploadEvent event,
                                             const SessionMutator& extra) {
    std::lock_guard<std::mutex> lock(m->mutex);
    auto it = m->sessions.find(id);
    if (it == m->sessions.end()) {
        throw ValidationError("Unknown upload session " + id);
    }

    UploadSession updated = it->second;
    const SystemTime ts = m->clock->now();
    m_fsm.handle_event(updated, event, ts);
    if (extra) extra(updated);
    updated.id = id;
    updated.updated_at = ts;
    it->second = updated;
    m->persist();
    return updated;
}

bool SessionRepository::remove_session(const std::string& id) {
    std::lock_guard<std::mutex> lock(m->mutex);
    if (m->sessions.erase(id) == 0) {
        return false;
    }
    m->chunks.erase(id);
    m->persist();
    return true;
}

// ============================================================================
// Chunks
// ============================================================================

ChunkRecord SessionRepository::upsert_chunk(ChunkRecord chunk) {
    validate_chunk(chunk);

    std::lock_guard<std::mutex> lock(m->mutex);
    auto sit = m->sessions.find(chunk.session_id);
    if (sit == m->sessions.end()) {
        throw ValidationError("Unknown upload session " + chunk.session_id);
    }
    if (chunk.chunk_number > sit->second.chunks_count) {
        throw ValidationError("chunk_number " + std::to_string(chunk.chunk_number) +
                              " exceeds chunks_count " + std::to_string(sit->second.chunks_count));
    }

    const SystemTime ts = m->clock->now();
    auto& per_session = m->chunks[chunk.session_id];
    auto existing = per_session.find(chunk.chunk_number);
    chunk.created_at = existing != per_session.end() ? existing->second.created_at : ts;
    chunk.updated_at = ts;
    if (!chunk.metadata.is_object()) chunk.metadata = Metadata::object();

    per_session[chunk.chunk_number] = chunk;
    m->persist();
    return chunk;
}

std::optional<ChunkRecord> SessionRepository::find_chunk(const std::string& session_id,
                                                         int chunk_number) const {
    std::lock_guard<std::mutex> lock(m->mutex);
    auto it = m->chunks.find(session_id);
    if (it == m->chunks.end()) return std::nullopt;
    auto cit = it->second.find(chunk_number);
    if (cit == it->second.end()) return std::nullopt;
    return cit->second;
}

std::vector<ChunkRecord> SessionRepository::chunks_for_session(const std::string& session_id) const {
    std::vector<ChunkRecord> result;
    std::lock_guard<std::mutex> lock(m->mutex);
    auto it = m->chunks.find(session_id);
    if (it == m->chunks.end()) return result;
    result.reserve(it->second.size());
    for (const auto& kv : it->second) {
        result.push_back(kv.second);
    }
    return result;
}

std::vector<int> SessionRepository::missing_chunks(const std::string& session_id) const {
    std::vector<int> missing;
    std::lock_guard<std::mutex> lock(m->mutex);
    auto sit = m->sessions.find(session_id);
    if (sit == m->sessions.end()) return missing;

    auto cit = m->chunks.find(session_id);
    for (int n = 1; n <= sit->second.chunks_count; ++n) {
        bool have = false;
        if (cit != m->chunks.end()) {
            auto rec = cit->second.find(n);
            have = rec != cit->second.end() && rec->second.status == ChunkStatus::COMPLETED;
        }
        if (!have) missing.push_back(n);
    }
    return missing;
}

int SessionRepository::failed_chunk_count(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(m->mutex);
    auto it = m->chunks.find(session_id);
    if (it == m->chunks.end()) return 0;
    int failed = 0;
    for (const auto& kv : it->second) {
        if (kv.second.status == ChunkStatus::FAILED) ++failed;
    }
    return failed;
}

bool SessionRepository::remove_chunk(const std::string& session_id, int chunk_number) {
    std::lock_guard<std::mutex> lock(m->mutex);
    auto it = m->chunks.find(session_id);
    if (it == m->chunks.end() || it->second.erase(chunk_number) == 0) {
        return false;
    }
    m->persist();
    return true;
}

// ============================================================================
// Batches
// ============================================================================

QueueItem SessionRepository::create_batch(QueueItem batch) {
    const SystemTime ts = m->clock->now();
    if (batch.batch_id.empty()) batch.batch_id = generate_uuid();
    if (batch.created_at == SystemTime{}) batch.created_at = ts;
    batch.updated_at = ts;
    if (!batch.metadata.is_object()) batch.metadata = Metadata::object();

    std::lock_guard<std::mutex> lock(m->mutex);
    if (m->batches.count(batch.batch_id)) {
        throw ValidationError("Queue batch " + batch.batch_id + " already exists");
    }
    m->batches[batch.batch_id] = batch;
    m->persist();
    return batch;
}

std::optional<QueueItem> SessionRepository::update_batch(const std::string& batch_id,
                                                         const BatchMutator& mutate) {
    std::lock_guard<std::mutex> lock(m->mutex);
    auto it = m->batches.find(batch_id);
    if (it == m->batches.end()) return std::nullopt;

    QueueItem updated = it->second;
    mutate(updated);
    updated.batch_id = batch_id;

    // Clamp counters so completed + failed never exceeds total
    updated.total_files = std::max(0, updated.total_files);
    updated.completed_files = std::min(std::max(0, updated.completed_files), updated.total_files);
    updated.failed_files = std::min(std::max(0, updated.failed_files),
                                    updated.total_files - updated.completed_files);

    updated.updated_at = m->clock->now();
    it->second = updated;
    m->persist();
    return updated;
}

std::vector<QueueItem> SessionRepository::list_batches(const std::string& workspace_id) const {
    std::vector<QueueItem> result;
    {
        std::lock_guard<std::mutex> lock(m->mutex);
        for (const auto& kv : m->batches) {
            if (workspace_id.empty() || kv.second.workspace_id == workspace_id) {
                result.push_back(kv.second);
            }
        }
    }
    std::sort(result.begin(), result.end(), [](const QueueItem& a, const QueueItem& b) {
        return a.created_at < b.created_at;
    });
    return result;
}

std::optional<QueueItem> SessionRepository::find_batch(const std::string& batch_id) const {
    std::lock_guard<std::mutex> lock(m->mutex);
    auto it = m->batches.find(batch_id);
    if (it == m->batches.end()) return std::nullopt;
    return it->second;
}

std::vector<UploadSession> SessionRepository::sessions_for_batch(const std::string& batch_id) const {
    return list_sessions([&batch_id](const UploadSession& s) { return s.batch_id == batch_id; });
}

// ============================================================================
// Lookups
// ============================================================================

std::vector<ChunkRecord> SessionRepository::find_by_checksum(
    const std::string& workspace_id,
    const std::vector<std::string>& checksums) const {

    std::unordered_set<std::string> wanted(checksums.begin(), checksums.end());
    std::vector<ChunkRecord> result;

    std::lock_guard<std::mutex> lock(m->mutex);
    for (const auto& kv : m->chunks) {
        auto sit = m->sessions.find(kv.first);
        if (sit == m->sessions.end() || sit->second.workspace_id != workspace_id) {
            continue;
        }
        for (const auto& ck : kv.second) {
            const ChunkRecord& c = ck.second;
            if (c.status != ChunkStatus::COMPLETED || c.storage_key.empty() ||
                c.has_pending_dedup_key() || !wanted.count(c.checksum)) {
                continue;
            }
            result.push_back(c);
        }
    }

    // Oldest first so repeated lookups prefer the same source
    std::sort(result.begin(), result.end(), [](const ChunkRecord& a, const ChunkRecord& b) {
        if (a.created_at != b.created_at) return a.created_at < b.created_at;
        if (a.session_id != b.session_id) return a.session_id < b.session_id;
        return a.chunk_number < b.chunk_number;
    });
    return result;
}

std::set<std::string> SessionRepository::live_storage_keys(const std::string& excluding_session_id) const {
    std::set<std::string> keys;
    std::lock_guard<std::mutex> lock(m->mutex);
    for (const auto& kv : m->chunks) {
        if (kv.first == excluding_session_id) continue;
        auto sit = m->sessions.find(kv.first);
        if (sit == m->sessions.end() || !needs_chunk_files(sit->second)) continue;
        for (const auto& ck : kv.second) {
            const ChunkRecord& c = ck.second;
            if (c.status == ChunkStatus::COMPLETED && !c.storage_key.empty() && !c.has_pending_dedup_key()) {
                keys.insert(c.storage_key);
            }
        }
    }
    return keys;
}

ChunkTotals SessionRepository::completed_chunk_totals(const std::vector<std::string>& session_ids) const {
    ChunkTotals totals;
    std::lock_guard<std::mutex> lock(m->mutex);
    for (const auto& id : session_ids) {
        auto it = m->chunks.find(id);
        if (it == m->chunks.end()) continue;
        for (const auto& kv : it->second) {
            if (kv.second.status == ChunkStatus::COMPLETED) {
                totals.bytes += kv.second.size;
                ++totals.count;
            }
        }
    }
    return totals;
}

int SessionRepository::completed_chunk_count(const std::string& session_id) const {
    return completed_chunk_totals({session_id}).count;
}

} // namespace chunkflow
