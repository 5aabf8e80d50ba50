#ifndef CHUNKFLOW_CONTENT_HASH_H
#define CHUNKFLOW_CONTENT_HASH_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace chunkflow {

/**
 * SHA-256 of a buffer as lowercase hex (64 chars).
 * Chunk checksums and dedup keys use this form.
 */
std::string sha256_hex(const uint8_t* data, size_t len);
std::string sha256_hex(const std::vector<uint8_t>& data);

/**
 * SHA-256 of a whole file, streamed.
 * @throws StorageError if the file cannot be read
 */
std::string sha256_file_hex(const std::string& path);

// Random RFC 4122 version-4 id, used for sessions, batches and assets
std::string generate_uuid();

// n random bytes rendered as 2n hex chars
std::string random_hex(size_t n_bytes);

} // namespace chunkflow

#endif // CHUNKFLOW_CONTENT_HASH_H
