#include "upload_errors.h"

namespace chunkflow {

const char* rate_limit_type_to_string(RateLimitType type) {
    switch (type) {
        case RateLimitType::USER_SESSIONS: return "user_sessions";
        case RateLimitType::IP_SESSIONS: return "ip_sessions";
        case RateLimitType::CONCURRENT_USER: return "concurrent_user";
        case RateLimitType::CONCURRENT_IP: return "concurrent_ip";
        case RateLimitType::SESSION_CHUNKS: return "session_chunks";
        case RateLimitType::CHUNK_FREQUENCY: return "chunk_frequency";
        case RateLimitType::USER_BANDWIDTH: return "user_bandwidth";
        case RateLimitType::IP_BANDWIDTH: return "ip_bandwidth";
    }
    return "unknown";
}

} // namespace chunkflow
