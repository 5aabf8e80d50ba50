#include "assembler.h"
#include "chunk_integrity.h"
#include "config_manager.h"
#include "content_hash.h"
#include "logger.h"
#include "telemetry.h"
#include "upload_errors.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <set>
#include <system_error>

namespace fs = std::filesystem;

namespace chunkflow {

nlohmann::json AssemblyStatus::to_json() const {
    return nlohmann::json{
        {"ready", ready},
        {"missing_chunks", missing_chunks},
        {"completed_chunks", completed_chunks},
        {"total_chunks", total_chunks},
        {"session_status", upload_status_to_string(session_status)}
    };
}

Assembler::Options Assembler::Options::fromConfig() {
    auto& cfg = ConfigManager::getInstance();
    Options o;
    o.assembly_dir = cfg.getAssemblyDir();
    o.size_tolerance_bytes = std::max<int64_t>(0, cfg.getAssemblySizeToleranceBytes());
    return o;
}

Assembler::Assembler(SessionRepository& repo, ChunkStore& store, const AssetCatalog& catalog, Options options)
    : m_repo(repo), m_store(store), m_catalog(catalog), m_options(std::move(options)) {}

std::string Assembler::determine_content_type(const std::string& filename) {
    std::string ext = fs::path(filename).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    static const std::map<std::string, std::string> kTypes = {
        {".mp3", "audio/mpeg"},
        {".wav", "audio/wav"},
        {".aiff", "audio/aiff"},
        {".aif", "audio/aiff"},
        {".flac", "audio/flac"},
        {".m4a", "audio/mp4"},
        {".mp4", "video/mp4"},
        {".m4v", "video/mp4"},
        {".mov", "video/quicktime"},
        {".avi", "video/x-msvideo"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".png", "image/png"},
        {".gif", "image/gif"},
        {".pdf", "application/pdf"},
        {".zip", "application/zip"},
    };
    auto it = kTypes.find(ext);
    return it != kTypes.end() ? it->second : "application/octet-stream";
}

void Assembler::fail(const std::string& session_id, const std::string& reason) {
    LOG_ERROR("ASM: session " + session_id + " assembly failed: " + reason);
    Telemetry::getInstance().inc_counter("upload.assembly_failures");
    try {
        const auto current = m_repo.find_session(session_id);
        if (current && current->status != UploadStatus::ASSEMBLING) {
            throw InvalidTransition("Session " + session_id + " left assembling (status: " +
                                    upload_status_to_string(current->status) + ")");
        }
        m_repo.apply_event(session_id, UploadEvent::FAIL, [&reason](UploadSession& s) {
            s.metadata["failure_reason"] = reason;
        });
    } catch (const InvalidTransition& e) {
        LOG_WARN("ASM: not failing session " + session_id + ": " + e.what());
        throw;
    } catch (const UploadError& e) {
        LOG_WARN("ASM: could not mark session " + session_id + " failed: " + e.what());
    }
    throw AssemblyError(reason);
}

std::string Assembler::output_path_for(const UploadSession& session) const {
    std::string ext = fs::path(session.filename).extension().string();
    const std::string name = "assembled_" + session.id + "_" + random_hex(8) + ext;
    return (fs::path(m_options.assembly_dir) / name).string();
}

AssemblyResult Assembler::assemble(const std::string& session_id) {
    const auto start = std::chrono::steady_clock::now();

    auto found = m_repo.find_session(session_id);
    if (!found) {
        throw AssemblyError("Upload session not found: " + session_id);
    }
    const UploadSession session = *found;

    // Paused or cancelled since the caller looked; leave the status alone
    if (session.status != UploadStatus::ASSEMBLING) {
        throw InvalidTransition(std::string("Session ") + session_id + " is not ready for assembly (status: " +
                                upload_status_to_string(session.status) + ")");
    }

    const std::vector<ChunkRecord> chunks = m_repo.chunks_for_session(session_id);
    const IntegrityReport integrity = verify_session_chunks(session, chunks, m_store);
    if (!integrity.missing.empty()) {
        std::string list;
        for (size_t i = 0; i < integrity.missing.size(); ++i) {
            if (i > 0) list += ", ";
            list += std::to_string(integrity.missing[i]);
        }
        fail(session_id, "Missing chunks: " + list);
    }
    if (!integrity.ok) {
        // A retry has to upload these again
        demote_broken_chunks(m_repo, session_id, integrity);
        fail(session_id, "Chunk integrity check failed: " + integrity.summary());
    }

    if (m_catalog.exists(session.workspace_id, session.container_id, session.filename)) {
        fail(session_id, "An asset named '" + session.filename + "' already exists in this location");
    }

    std::error_code ec;
    fs::create_directories(m_options.assembly_dir, ec);
    if (ec) {
        fail(session_id, "Cannot create assembly directory " + m_options.assembly_dir + ": " + ec.message());
    }

    const std::string output_path = output_path_for(session);
    LOG_INFO("ASM: assembling " + std::to_string(session.chunks_count) + " chunks of session " +
             session_id + " into " + output_path);

    int64_t written = 0;
    std::string copy_error;
    {
        std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            fail(session_id, "Cannot open assembly output " + output_path);
        }
        try {
            // chunks_for_session is ordered by chunk_number
            for (const auto& chunk : chunks) {
                if (chunk.chunk_number < 1 || chunk.chunk_number > session.chunks_count) continue;
                written += m_store.stream_to(chunk.storage_key, out);
            }
            out.flush();
            if (!out) copy_error = "Failed to write assembled file " + output_path;
        } catch (const UploadError& e) {
            copy_error = e.what();
        }
    }

    auto discard_output = [&output_path]() {
        std::error_code rm_ec;
        fs::remove(output_path, rm_ec);
        if (rm_ec) {
            LOG_WARN("ASM: could not remove partial output " + output_path + ": " + rm_ec.message());
        }
    };

    if (!copy_error.empty()) {
        discard_output();
        fail(session_id, copy_error);
    }

    const int64_t difference = written > session.total_size ? written - session.total_size
                                                            : session.total_size - written;
    if (difference > m_options.size_tolerance_bytes) {
        discard_output();
        fail(session_id, "File size mismatch: expected " + std::to_string(session.total_size) +
                         " bytes, got " + std::to_string(written) + " bytes");
    }

    try {
        m_repo.apply_event(session_id, UploadEvent::ASSEMBLY_SUCCEEDED, [&output_path](UploadSession& s) {
            s.assembled_file_path = output_path;
            s.metadata.erase("failure_reason");
        });
    } catch (const InvalidTransition&) {
        // Cancelled while copying
        discard_output();
        throw;
    }

    AssemblyResult result;
    result.session_id = session_id;
    result.assembled_file_path = output_path;
    result.content_type = determine_content_type(session.filename);
    result.bytes_written = written;
    result.chunks_assembled = static_cast<int>(chunks.size());

    if (m_options.cleanup_chunks) {
        result.chunks_cleaned = release_chunks(session_id, chunks);
    }

    result.duration_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    Telemetry::getInstance().inc_counter("upload.assemblies");
    Telemetry::getInstance().observe_hist_ms("upload.assembly_ms",
                                             static_cast<int64_t>(result.duration_seconds * 1000.0));
    LOG_INFO("ASM: session " + session_id + " assembled (" + std::to_string(written) + " bytes, " +
             std::to_string(result.chunks_cleaned) + " chunk files cleaned)");
    return result;
}

int Assembler::release_chunks(const std::string& session_id, const std::vector<ChunkRecord>& chunks) {
    // Files still backing another session's upload stay on disk
    const std::set<std::string> live = m_repo.live_storage_keys(session_id);
    int cleaned = m_store.cleanup(session_id, live);

    // Chunks borrowed from another session's directory through dedup
    for (const auto& chunk : chunks) {
        if (!chunk.metadata.contains("deduplicated_from") || live.count(chunk.storage_key)) continue;
        try {
            if (m_store.remove(chunk.storage_key)) ++cleaned;
        } catch (const StorageError& e) {
            LOG_WARN("ASM: could not delete shared chunk " + chunk.storage_key + ": " + e.what());
        }
    }
    return cleaned;
}

AssemblyStatus Assembler::assembly_status(const std::string& session_id) const {
    AssemblyStatus status;
    auto session = m_repo.find_session(session_id);
    if (!session) {
        throw ValidationError("Upload session not found: " + session_id);
    }
    status.session_status = session->status;
    status.total_chunks = session->chunks_count;
    status.completed_chunks = m_repo.completed_chunk_count(session_id);
    status.missing_chunks = m_repo.missing_chunks(session_id);
    status.ready = status.missing_chunks.empty() &&
                   (session->status == UploadStatus::UPLOADING ||
                    session->status == UploadStatus::ASSEMBLING);
    return status;
}

} // namespace chunkflow
