#ifndef CHUNKFLOW_RATE_LIMITER_H
#define CHUNKFLOW_RATE_LIMITER_H

#include "clock.h"
#include "counter_store.h"
#include "upload_errors.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <string>

namespace chunkflow {

class SessionRepository;

struct RateLimits {
    int user_sessions_per_hour = 15;
    int ip_sessions_per_hour = 25;
    int chunks_per_minute = 200;           // per user
    int chunks_per_session = 50;
    int64_t user_bandwidth_per_hour = 2LL * 1024 * 1024 * 1024;
    int64_t ip_bandwidth_per_hour = 3LL * 1024 * 1024 * 1024;
    int concurrent_sessions_per_user = 3;
    int concurrent_sessions_per_ip = 5;

    // rate_limits section of ConfigManager
    static RateLimits fromConfig();
};

struct RateLimitStatus {
    int64_t user_session_count = 0;
    int64_t ip_session_count = 0;
    int64_t user_chunks_count = 0;
    int64_t user_bandwidth_used = 0;
    int64_t ip_bandwidth_used = 0;
    int64_t concurrent_user_sessions = 0;
    int64_t concurrent_ip_sessions = 0;
    int time_until_reset = 0;              // seconds to the next hour bucket
    RateLimits limits;

    nlohmann::json to_json() const;
};

/**
 * Sliding-window admission control for session creation and chunk uploads.
 *
 * Counters are incremented first and then compared; a count above its limit
 * raises RateLimitExceeded. Checks run in a fixed order so the reported
 * limit_type is deterministic.
 */
class RateLimiter {
public:
    RateLimiter(CounterStore& store, RateLimits limits,
                std::shared_ptr<Clock> clock = SystemClock::shared());

    // user_sessions -> ip_sessions -> concurrent_user -> concurrent_ip
    // @throws RateLimitExceeded
    void check_session_creation(const std::string& user_id, const std::string& ip_address);

    // session_chunks -> chunk_frequency -> user_bandwidth -> ip_bandwidth
    // @throws RateLimitExceeded
    void check_chunk_upload(const std::string& user_id, const std::string& ip_address,
                            const std::string& session_id, int64_t chunk_size);

    // Release the concurrency slots taken at session creation
    void track_session_completion(const std::string& user_id, const std::string& ip_address);

    RateLimitStatus status(const std::string& user_id, const std::string& ip_address) const;
    void reset(const std::string& user_id, const std::string& ip_address);

    const RateLimits& limits() const { return m_limits; }

private:
    std::string user_session_key(const std::string& user_id) const;
    std::string ip_session_key(const std::string& ip) const;
    std::string user_chunks_key(const std::string& user_id) const;
    std::string session_chunks_key(const std::string& session_id) const;
    std::string user_bandwidth_key(const std::string& user_id) const;
    std::string ip_bandwidth_key(const std::string& ip) const;
    std::string concurrent_user_key(const std::string& user_id) const;
    std::string concurrent_ip_key(const std::string& ip) const;

    std::string current_hour() const;
    std::string current_minute() const;
    int seconds_until_next_hour() const;
    int seconds_until_next_minute() const;

    [[noreturn]] void reject(const std::string& message, RateLimitType type, int retry_after) const;

    CounterStore& m_store;
    RateLimits m_limits;
    std::shared_ptr<Clock> m_clock;
};

/**
 * Release the concurrency slots of a session once it stops being in flight.
 * Idempotent: the release is recorded in session metadata.
 * @return true if slots were released by this call
 */
bool release_session_slot(SessionRepository& repo, RateLimiter* limiter, const std::string& session_id);

} // namespace chunkflow

#endif // CHUNKFLOW_RATE_LIMITER_H
