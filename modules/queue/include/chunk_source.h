#ifndef CHUNKFLOW_CHUNK_SOURCE_H
#define CHUNKFLOW_CHUNK_SOURCE_H

#include "upload_types.h"

#include <cstdint>
#include <string>
#include <vector>

namespace chunkflow {

// Supplies the bytes of a session's chunks to the orchestrator.
class ChunkSource {
public:
    virtual ~ChunkSource() = default;

    // Payloads (with sha256 checksums) for the given chunk numbers.
    // @throws StorageError when the source data cannot be read
    virtual std::vector<ChunkPayload> payloads_for(const UploadSession& session,
                                                   const std::vector<int>& chunk_numbers) = 0;
};

/**
 * Slices a local file into chunks of total_size / chunks_count (rounded up),
 * the last chunk taking the remainder. The file path comes from
 * metadata.local_path, falling back to metadata.original_path.
 */
class LocalFileChunkSource : public ChunkSource {
public:
    // Relative paths are resolved against base_dir when it is set.
    explicit LocalFileChunkSource(std::string base_dir = "");

    std::vector<ChunkPayload> payloads_for(const UploadSession& session,
                                           const std::vector<int>& chunk_numbers) override;

    static int64_t chunk_size_for(const UploadSession& session);

private:
    std::string resolve_path(const UploadSession& session) const;

    std::string m_base_dir;
};

} // namespace chunkflow

#endif // CHUNKFLOW_CHUNK_SOURCE_H
