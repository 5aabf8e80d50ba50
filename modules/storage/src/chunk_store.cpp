#include "chunk_store.h"
#include "content_hash.h"
#include "logger.h"
#include "telemetry.h"
#include "upload_errors.h"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace chunkflow {

namespace {

StorageCause cause_from_errno(int err) {
    switch (err) {
        case EACCES:
        case EPERM:
        case EROFS:
            return StorageCause::PERMISSION;
        case ENOSPC:
#ifdef EDQUOT
        case EDQUOT:
#endif
            return StorageCause::NO_SPACE;
        default:
            return StorageCause::IO;
    }
}

[[noreturn]] void throw_storage_error(const std::string& action, const std::string& path, int err) {
    const StorageCause cause = cause_from_errno(err);
    std::string prefix;
    switch (cause) {
        case StorageCause::PERMISSION: prefix = "Permission denied"; break;
        case StorageCause::NO_SPACE:   prefix = "No space left on device"; break;
        case StorageCause::IO:         prefix = "Failed to " + action; break;
    }
    throw StorageError(prefix + ": " + path + " (" + std::strerror(err) + ")", cause);
}

bool is_safe_session_id(const std::string& id) {
    if (id.empty() || id == "." || id == "..") return false;
    return id.find('/') == std::string::npos && id.find('\\') == std::string::npos;
}

// Write all bytes, retrying on EINTR and short writes
bool write_fully(int fd, const uint8_t* data, size_t len) {
    size_t off = 0;
    while (off < len) {
        const ssize_t n = ::write(fd, data + off, len - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        off += static_cast<size_t>(n);
    }
    return true;
}

} // namespace

FileChunkStore::FileChunkStore(std::string base_dir) : m_base_dir(std::move(base_dir)) {
    if (m_base_dir.empty()) {
        throw ValidationError("Chunk storage base directory cannot be empty");
    }
    std::error_code ec;
    fs::create_directories(m_base_dir, ec);
    if (ec) {
        throw_storage_error("create chunk storage directory", m_base_dir, ec.value());
    }
    LOG_DEBUG("CS: chunk store at " + m_base_dir);
}

std::string FileChunkStore::session_dir(const std::string& session_id) const {
    return (fs::path(m_base_dir) / ("session_" + session_id)).string();
}

std::string FileChunkStore::key_for(const std::string& session_id, int chunk_number) const {
    return (fs::path(session_dir(session_id)) / ("chunk_" + std::to_string(chunk_number) + ".tmp")).string();
}

std::string FileChunkStore::store(const std::string& session_id, int chunk_number,
                                  const std::vector<uint8_t>& data) {
    if (!is_safe_session_id(session_id)) {
        throw ValidationError("Invalid session id for chunk storage: '" + session_id + "'");
    }
    if (chunk_number <= 0) {
        throw ValidationError("Chunk number must be positive, got " + std::to_string(chunk_number));
    }

    StageTimer timer("upload.chunk_store_ms");
    const std::string dir = session_dir(session_id);
    const std::string key = key_for(session_id, chunk_number);

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw_storage_error("create session directory", dir, ec.value());
    }

    // Unique temp name so concurrent re-uploads of one chunk never interleave
    const std::string tmp = key + ".part-" + random_hex(4);
    const int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw_storage_error("store chunk", tmp, errno);
    }

    if (!write_fully(fd, data.data(), data.size()) || ::fsync(fd) != 0) {
        const int err = errno;
        ::close(fd);
        ::unlink(tmp.c_str());
        throw_storage_error("store chunk", key, err);
    }
    if (::close(fd) != 0) {
        const int err = errno;
        ::unlink(tmp.c_str());
        throw_storage_error("store chunk", key, err);
    }
    if (::rename(tmp.c_str(), key.c_str()) != 0) {
        const int err = errno;
        ::unlink(tmp.c_str());
        throw_storage_error("store chunk", key, err);
    }

    Telemetry::getInstance().inc_counter("upload.chunks_stored");
    Telemetry::getInstance().inc_counter("upload.bytes_stored", static_cast<int64_t>(data.size()));

    LOG_DEBUG("CS: stored chunk " + std::to_string(chunk_number) + " of session " + session_id +
              " (" + std::to_string(data.size()) + " bytes)");
    return key;
}

bool FileChunkStore::exists(const std::string& key) const {
    if (key.empty()) return false;
    struct stat st{};
    return ::stat(key.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

std::vector<uint8_t> FileChunkStore::read(const std::string& key) const {
    if (key.empty()) {
        throw ValidationError("Storage key cannot be blank");
    }
    if (!exists(key)) {
        throw ChunkNotFoundError("Chunk not found: " + key);
    }

    std::ifstream in(key, std::ios::binary);
    if (!in) {
        throw_storage_error("read chunk", key, errno != 0 ? errno : EIO);
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw StorageError("Failed to read chunk: " + key);
    }
    return bytes;
}

int64_t FileChunkStore::stream_to(const std::string& key, std::ostream& out) const {
    if (key.empty()) {
        throw ValidationError("Storage key cannot be blank");
    }
    if (!exists(key)) {
        throw ChunkNotFoundError("Chunk not found: " + key);
    }

    std::ifstream in(key, std::ios::binary);
    if (!in) {
        throw_storage_error("read chunk", key, errno != 0 ? errno : EIO);
    }

    char buf[64 * 1024];
    int64_t total = 0;
    while (in) {
        in.read(buf, sizeof(buf));
        const std::streamsize n = in.gcount();
        if (n <= 0) break;
        out.write(buf, n);
        if (!out) {
            throw StorageError("Failed to write assembled output while copying " + key);
        }
        total += n;
    }
    if (in.bad()) {
        throw StorageError("Failed to read chunk: " + key);
    }
    return total;
}

std::optional<int64_t> FileChunkStore::size(const std::string& key) const {
    if (key.empty()) return std::nullopt;
    struct stat st{};
    if (::stat(key.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) return std::nullopt;
    return static_cast<int64_t>(st.st_size);
}

bool FileChunkStore::remove(const std::string& key) {
    if (key.empty() || !exists(key)) return false;
    if (::unlink(key.c_str()) != 0) {
        if (errno == ENOENT) return false;
        throw_storage_error("delete chunk", key, errno);
    }
    return true;
}

int FileChunkStore::cleanup(const std::string& session_id, const std::set<std::string>& keep_keys) {
    if (!is_safe_session_id(session_id)) {
        LOG_WARN("CS: refusing cleanup for invalid session id '" + session_id + "'");
        return 0;
    }

    const fs::path dir = session_dir(session_id);
    std::error_code ec;
    if (!fs::exists(dir, ec)) return 0;

    int deleted = 0;
    int kept = 0;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string path = it->path().string();
        if (keep_keys.count(path)) {
            ++kept;
            continue;
        }
        try {
            if (remove(path)) ++deleted;
        } catch (const StorageError& e) {
            LOG_WARN("CS: failed to delete " + path + ": " + e.what());
        }
    }
    if (ec) {
        LOG_WARN("CS: error listing " + dir.string() + ": " + ec.message());
    }

    std::error_code rm_ec;
    if (fs::is_empty(dir, rm_ec) && !rm_ec) {
        fs::remove(dir, rm_ec);
        if (rm_ec) {
            LOG_WARN("CS: could not remove " + dir.string() + ": " + rm_ec.message());
        }
    }

    if (deleted > 0 || kept > 0) {
        LOG_DEBUG("CS: cleaned " + std::to_string(deleted) + " chunks of session " + session_id +
                  (kept > 0 ? ", kept " + std::to_string(kept) + " still shared" : ""));
    }
    return deleted;
}

std::vector<std::string> FileChunkStore::stored_sessions() const {
    std::vector<std::string> ids;
    std::error_code ec;
    for (fs::directory_iterator it(m_base_dir, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        std::error_code type_ec;
        if (it->is_directory(type_ec) && name.rfind("session_", 0) == 0) {
            ids.push_back(name.substr(8));
        }
    }
    if (ec) {
        LOG_WARN("CS: error listing " + m_base_dir + ": " + ec.message());
    }
    return ids;
}

ChunkStorageStats FileChunkStore::storage_stats() const {
    ChunkStorageStats stats;
    stats.backend_type = "local_filesystem";
    stats.base_path = m_base_dir;

    std::error_code ec;
    for (fs::recursive_directory_iterator it(m_base_dir, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec) || name.rfind("chunk_", 0) != 0 ||
            it->path().extension() != ".tmp") {
            continue;
        }
        ++stats.total_chunks;
        std::error_code size_ec;
        const auto sz = it->file_size(size_ec);
        if (!size_ec) stats.total_size += static_cast<int64_t>(sz);
    }
    if (ec) {
        LOG_ERROR("CS: error calculating storage stats: " + ec.message());
    }
    return stats;
}

} // namespace chunkflow
