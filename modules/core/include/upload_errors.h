#ifndef CHUNKFLOW_UPLOAD_ERRORS_H
#define CHUNKFLOW_UPLOAD_ERRORS_H

#include <stdexcept>
#include <string>

namespace chunkflow {

// Base of every pipeline failure. Catch this to handle any upload error.
class UploadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed chunk metadata, out-of-range chunk_number, bad session fields
class ValidationError : public UploadError {
public:
    using UploadError::UploadError;
};

enum class StorageCause {
    PERMISSION,     // EACCES / EPERM
    NO_SPACE,       // ENOSPC / EDQUOT
    IO,             // anything else
};

class StorageError : public UploadError {
public:
    StorageError(const std::string& message, StorageCause cause = StorageCause::IO)
        : UploadError(message), m_cause(cause) {}

    StorageCause cause() const { return m_cause; }

private:
    StorageCause m_cause;
};

class ChunkNotFoundError : public UploadError {
public:
    using UploadError::UploadError;
};

// Missing chunks, size mismatch, name collision
class AssemblyError : public UploadError {
public:
    using UploadError::UploadError;
};

enum class RateLimitType {
    USER_SESSIONS,
    IP_SESSIONS,
    CONCURRENT_USER,
    CONCURRENT_IP,
    SESSION_CHUNKS,
    CHUNK_FREQUENCY,
    USER_BANDWIDTH,
    IP_BANDWIDTH,
};

const char* rate_limit_type_to_string(RateLimitType type);

class RateLimitExceeded : public UploadError {
public:
    RateLimitExceeded(const std::string& message, RateLimitType type, int retry_after_sec)
        : UploadError(message), m_type(type), m_retry_after(retry_after_sec) {}

    RateLimitType limit_type() const { return m_type; }
    // Seconds until the window resets; 0 when waiting does not help.
    int retry_after() const { return m_retry_after; }

private:
    RateLimitType m_type;
    int m_retry_after;
};

// No scanner to talk to (daemon down, binary missing)
class ScannerUnavailableError : public UploadError {
public:
    using UploadError::UploadError;
};

// The scanner ran but produced no verdict: unreadable file, timeout, scan error
class ScanFailedError : public UploadError {
public:
    using UploadError::UploadError;
};

class InvalidTransition : public UploadError {
public:
    using UploadError::UploadError;
};

// A blocking step (scan verdict, pool drain) exceeded its deadline
class TransferTimeout : public UploadError {
public:
    using UploadError::UploadError;
};

} // namespace chunkflow

#endif // CHUNKFLOW_UPLOAD_ERRORS_H
