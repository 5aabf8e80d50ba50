#ifndef CHUNKFLOW_CHUNK_STORE_H
#define CHUNKFLOW_CHUNK_STORE_H

#include <cstdint>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <vector>

namespace chunkflow {

struct ChunkStorageStats {
    std::string backend_type;
    std::string base_path;
    int64_t total_chunks = 0;
    int64_t total_size = 0;
};

/**
 * Bytes-at-rest for chunks. Keys are opaque to callers and stable for a
 * given (session, chunk_number), so a re-upload overwrites in place.
 */
class ChunkStore {
public:
    virtual ~ChunkStore() = default;

    // @throws ValidationError on bad arguments, StorageError on I/O failure
    virtual std::string store(const std::string& session_id, int chunk_number,
                              const std::vector<uint8_t>& data) = 0;

    virtual bool exists(const std::string& key) const = 0;

    // @throws ChunkNotFoundError, StorageError
    virtual std::vector<uint8_t> read(const std::string& key) const = 0;

    // Copies the chunk into out and returns the byte count.
    // @throws ChunkNotFoundError, StorageError
    virtual int64_t stream_to(const std::string& key, std::ostream& out) const = 0;

    // nullopt when the key does not resolve
    virtual std::optional<int64_t> size(const std::string& key) const = 0;

    // false for a blank or missing key
    // @throws StorageError when the file exists but cannot be removed
    virtual bool remove(const std::string& key) = 0;

    // Best-effort removal of the chunks the session owns, except keep_keys
    // (files another session still points at). Returns the count removed.
    virtual int cleanup(const std::string& session_id, const std::set<std::string>& keep_keys) = 0;
    int cleanup(const std::string& session_id) { return cleanup(session_id, {}); }

    // Session ids that still have a chunk directory
    virtual std::vector<std::string> stored_sessions() const = 0;

    virtual ChunkStorageStats storage_stats() const = 0;
};

// Local filesystem layout: <base>/session_<id>/chunk_<n>.tmp
class FileChunkStore : public ChunkStore {
public:
    // Creates base_dir if needed.
    // @throws StorageError
    explicit FileChunkStore(std::string base_dir);

    std::string store(const std::string& session_id, int chunk_number,
                      const std::vector<uint8_t>& data) override;
    bool exists(const std::string& key) const override;
    std::vector<uint8_t> read(const std::string& key) const override;
    int64_t stream_to(const std::string& key, std::ostream& out) const override;
    std::optional<int64_t> size(const std::string& key) const override;
    bool remove(const std::string& key) override;
    using ChunkStore::cleanup;
    int cleanup(const std::string& session_id, const std::set<std::string>& keep_keys) override;
    std::vector<std::string> stored_sessions() const override;
    ChunkStorageStats storage_stats() const override;

    std::string key_for(const std::string& session_id, int chunk_number) const;
    std::string session_dir(const std::string& session_id) const;
    const std::string& base_dir() const { return m_base_dir; }

private:
    std::string m_base_dir;
};

} // namespace chunkflow

#endif // CHUNKFLOW_CHUNK_STORE_H
