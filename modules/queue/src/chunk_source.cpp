#include "chunk_source.h"
#include "content_hash.h"
#include "logger.h"
#include "upload_errors.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>

namespace chunkflow {

LocalFileChunkSource::LocalFileChunkSource(std::string base_dir) : m_base_dir(std::move(base_dir)) {}

int64_t LocalFileChunkSource::chunk_size_for(const UploadSession& session) {
    if (session.chunks_count <= 0) return 0;
    return (session.total_size + session.chunks_count - 1) / session.chunks_count;
}

std::string LocalFileChunkSource::resolve_path(const UploadSession& session) const {
    std::string path = session.metadata.value("local_path", "");
    if (path.empty()) path = session.metadata.value("original_path", "");
    if (path.empty()) {
        throw StorageError("No local source path recorded for session " + session.id);
    }
    std::filesystem::path p(path);
    if (p.is_relative() && !m_base_dir.empty()) {
        p = std::filesystem::path(m_base_dir) / p;
    }
    return p.string();
}

std::vector<ChunkPayload> LocalFileChunkSource::payloads_for(const UploadSession& session,
                                                             const std::vector<int>& chunk_numbers) {
    std::vector<ChunkPayload> payloads;
    if (chunk_numbers.empty()) return payloads;

    const std::string path = resolve_path(session);
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        const int err = errno;
        throw StorageError("Cannot open source file " + path + ": " + std::strerror(err),
                           (err == EACCES || err == EPERM) ? StorageCause::PERMISSION : StorageCause::IO);
    }

    const int64_t chunk_size = chunk_size_for(session);
    for (int n : chunk_numbers) {
        if (n < 1 || n > session.chunks_count) {
            LOG_WARN("QO: skipping out-of-range chunk " + std::to_string(n) + " for session " + session.id);
            continue;
        }
        const int64_t offset = static_cast<int64_t>(n - 1) * chunk_size;
        const int64_t len = std::min(chunk_size, session.total_size - offset);
        if (len <= 0) continue;

        ChunkPayload p;
        p.chunk_number = n;
        p.data.resize(static_cast<size_t>(len));
        in.clear();
        in.seekg(offset);
        in.read(reinterpret_cast<char*>(p.data.data()), len);
        const std::streamsize got = in.gcount();
        if (got <= 0) {
            throw StorageError("Source file " + path + " is shorter than declared (" +
                               std::to_string(session.total_size) + " bytes)");
        }
        // A short read is passed on as is; the size check at assembly rejects it
        p.data.resize(static_cast<size_t>(got));
        p.size = static_cast<int64_t>(p.data.size());
        p.checksum = sha256_hex(p.data);
        payloads.push_back(std::move(p));
    }
    return payloads;
}

} // namespace chunkflow
