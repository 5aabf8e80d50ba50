#include "rate_limiter.h"
#include "config_manager.h"
#include "logger.h"
#include "session_repository.h"
#include "telemetry.h"

#include <chrono>
#include <cstdio>

namespace chunkflow {

namespace {

const std::chrono::seconds HOURLY_TTL(3600);
const std::chrono::seconds MINUTE_TTL(60);
const std::chrono::seconds SESSION_TTL(24 * 3600);
const std::chrono::seconds NO_EXPIRY(0);

const int CONCURRENCY_RETRY_AFTER_SEC = 60;

std::string subject_or(const std::string& value, const char* fallback) {
    return value.empty() ? std::string(fallback) : value;
}

std::string format_bytes(int64_t bytes) {
    char buf[32];
    if (bytes >= 1024LL * 1024 * 1024) {
        std::snprintf(buf, sizeof(buf), "%.1f GB", bytes / (1024.0 * 1024 * 1024));
    } else if (bytes >= 1024 * 1024) {
        std::snprintf(buf, sizeof(buf), "%.1f MB", bytes / (1024.0 * 1024));
    } else {
        std::snprintf(buf, sizeof(buf), "%.1f KB", bytes / 1024.0);
    }
    return buf;
}

} // namespace

RateLimits RateLimits::fromConfig() {
    auto& cfg = ConfigManager::getInstance();
    RateLimits l;
    l.user_sessions_per_hour = cfg.getUserSessionsPerHour();
    l.ip_sessions_per_hour = cfg.getIpSessionsPerHour();
    l.chunks_per_minute = cfg.getChunksPerMinute();
    l.chunks_per_session = cfg.getChunksPerSession();
    l.user_bandwidth_per_hour = cfg.getUserBandwidthPerHour();
    l.ip_bandwidth_per_hour = cfg.getIpBandwidthPerHour();
    l.concurrent_sessions_per_user = cfg.getConcurrentSessionsPerUser();
    l.concurrent_sessions_per_ip = cfg.getConcurrentSessionsPerIp();
    return l;
}

nlohmann::json RateLimitStatus::to_json() const {
    return nlohmann::json{
        {"user_session_count", user_session_count},
        {"ip_session_count", ip_session_count},
        {"user_chunks_count", user_chunks_count},
        {"user_bandwidth_used", user_bandwidth_used},
        {"ip_bandwidth_used", ip_bandwidth_used},
        {"concurrent_user_sessions", concurrent_user_sessions},
        {"concurrent_ip_sessions", concurrent_ip_sessions},
        {"time_until_reset", time_until_reset},
        {"rate_limits", {
            {"user_sessions_per_hour", limits.user_sessions_per_hour},
            {"ip_sessions_per_hour", limits.ip_sessions_per_hour},
            {"chunks_per_minute", limits.chunks_per_minute},
            {"chunks_per_session", limits.chunks_per_session},
            {"user_bandwidth_per_hour", limits.user_bandwidth_per_hour},
            {"ip_bandwidth_per_hour", limits.ip_bandwidth_per_hour},
            {"concurrent_sessions_per_user", limits.concurrent_sessions_per_user},
            {"concurrent_sessions_per_ip", limits.concurrent_sessions_per_ip},
        }},
    };
}

RateLimiter::RateLimiter(CounterStore& store, RateLimits limits, std::shared_ptr<Clock> clock)
    : m_store(store),
      m_limits(limits),
      m_clock(clock ? std::move(clock) : SystemClock::shared()) {}

// ============================================================================
// Keys
// ============================================================================

std::string RateLimiter::user_session_key(const std::string& user_id) const {
    return "upload_rate_limit:user:" + subject_or(user_id, "anonymous") + ":sessions:" + current_hour();
}

std::string RateLimiter::ip_session_key(const std::string& ip) const {
    return "upload_rate_limit:ip:" + subject_or(ip, "unknown") + ":sessions:" + current_hour();
}

std::string RateLimiter::user_chunks_key(const std::string& user_id) const {
    return "upload_rate_limit:user:" + subject_or(user_id, "anonymous") + ":chunks:" + current_minute();
}

std::string RateLimiter::session_chunks_key(const std::string& session_id) const {
    return "upload_rate_limit:session:" + session_id + ":chunks";
}

std::string RateLimiter::user_bandwidth_key(const std::string& user_id) const {
    return "upload_rate_limit:user:" + subject_or(user_id, "anonymous") + ":bandwidth:" + current_hour();
}

std::string RateLimiter::ip_bandwidth_key(const std::string& ip) const {
    return "upload_rate_limit:ip:" + subject_or(ip, "unknown") + ":bandwidth:" + current_hour();
}

std::string RateLimiter::concurrent_user_key(const std::string& user_id) const {
    return "upload_rate_limit:user:" + subject_or(user_id, "anonymous") + ":concurrent";
}

std::string RateLimiter::concurrent_ip_key(const std::string& ip) const {
    return "upload_rate_limit:ip:" + subject_or(ip, "unknown") + ":concurrent";
}

std::string RateLimiter::current_hour() const {
    return format_utc(m_clock->now(), "%Y%m%d%H");
}

std::string RateLimiter::current_minute() const {
    return format_utc(m_clock->now(), "%Y%m%d%H%M");
}

int RateLimiter::seconds_until_next_hour() const {
    const int64_t secs = to_unix_ms(m_clock->now()) / 1000;
    return static_cast<int>(3600 - secs % 3600);
}

int RateLimiter::seconds_until_next_minute() const {
    const int64_t secs = to_unix_ms(m_clock->now()) / 1000;
    return static_cast<int>(60 - secs % 60);
}

void RateLimiter::reject(const std::string& message, RateLimitType type, int retry_after) const {
    Telemetry::getInstance().inc_counter(std::string("upload.rate_limited.") + rate_limit_type_to_string(type));
    LOG_WARN("RL: " + message + " (" + rate_limit_type_to_string(type) + ", retry after " +
             std::to_string(retry_after) + "s)");
    throw RateLimitExceeded(message, type, retry_after);
}

// ============================================================================
// Checks
// ============================================================================

void RateLimiter::check_session_creation(const std::string& user_id, const std::string& ip_address) {
    const int64_t user_sessions = m_store.increment(user_session_key(user_id), HOURLY_TTL);
    const int64_t ip_sessions = m_store.increment(ip_session_key(ip_address), HOURLY_TTL);
    const int64_t concurrent_user = m_store.increment(concurrent_user_key(user_id), NO_EXPIRY);
    const int64_t concurrent_ip = m_store.increment(concurrent_ip_key(ip_address), NO_EXPIRY);

    try {
        if (user_sessions > m_limits.user_sessions_per_hour) {
            reject("Too many upload sessions created. Limit: " +
                   std::to_string(m_limits.user_sessions_per_hour) + " per hour",
                   RateLimitType::USER_SESSIONS, seconds_until_next_hour());
        }
        if (ip_sessions > m_limits.ip_sessions_per_hour) {
            reject("Too many upload sessions from IP. Limit: " +
                   std::to_string(m_limits.ip_sessions_per_hour) + " per hour",
                   RateLimitType::IP_SESSIONS, seconds_until_next_hour());
        }
        if (concurrent_user > m_limits.concurrent_sessions_per_user) {
            reject("Too many concurrent upload sessions. Limit: " +
                   std::to_string(m_limits.concurrent_sessions_per_user),
                   RateLimitType::CONCURRENT_USER, CONCURRENCY_RETRY_AFTER_SEC);
        }
        if (concurrent_ip > m_limits.concurrent_sessions_per_ip) {
            reject("Too many concurrent upload sessions from IP. Limit: " +
                   std::to_string(m_limits.concurrent_sessions_per_ip),
                   RateLimitType::CONCURRENT_IP, CONCURRENCY_RETRY_AFTER_SEC);
        }
    } catch (const RateLimitExceeded&) {
        // A rejected session never started, so it must not hold a concurrency slot
        m_store.decrement(concurrent_user_key(user_id));
        m_store.decrement(concurrent_ip_key(ip_address));
        throw;
    }
}

void RateLimiter::check_chunk_upload(const std::string& user_id, const std::string& ip_address,
                                     const std::string& session_id, int64_t chunk_size) {
    const int64_t user_chunks = m_store.increment(user_chunks_key(user_id), MINUTE_TTL);
    int64_t session_chunks = 0;
    if (!session_id.empty()) {
        session_chunks = m_store.increment(session_chunks_key(session_id), SESSION_TTL);
    }
    int64_t user_bandwidth = 0;
    int64_t ip_bandwidth = 0;
    if (chunk_size > 0) {
        user_bandwidth = m_store.increment(user_bandwidth_key(user_id), HOURLY_TTL, chunk_size);
        ip_bandwidth = m_store.increment(ip_bandwidth_key(ip_address), HOURLY_TTL, chunk_size);
    }

    if (!session_id.empty() && session_chunks > m_limits.chunks_per_session) {
        reject("Too many chunks for this session. Limit: " +
               std::to_string(m_limits.chunks_per_session) + " chunks",
               RateLimitType::SESSION_CHUNKS, 0);
    }
    if (user_chunks > m_limits.chunks_per_minute) {
        reject("Too many chunks uploaded too quickly. Limit: " +
               std::to_string(m_limits.chunks_per_minute) + " per minute",
               RateLimitType::CHUNK_FREQUENCY, seconds_until_next_minute());
    }
    if (chunk_size > 0) {
        if (user_bandwidth > m_limits.user_bandwidth_per_hour) {
            reject("Bandwidth limit exceeded. Limit: " + format_bytes(m_limits.user_bandwidth_per_hour) +
                   " per hour", RateLimitType::USER_BANDWIDTH, seconds_until_next_hour());
        }
        if (ip_bandwidth > m_limits.ip_bandwidth_per_hour) {
            reject("IP bandwidth limit exceeded. Limit: " + format_bytes(m_limits.ip_bandwidth_per_hour) +
                   " per hour", RateLimitType::IP_BANDWIDTH, seconds_until_next_hour());
        }
    }
}

void RateLimiter::track_session_completion(const std::string& user_id, const std::string& ip_address) {
    m_store.decrement(concurrent_user_key(user_id));
    m_store.decrement(concurrent_ip_key(ip_address));
}

RateLimitStatus RateLimiter::status(const std::string& user_id, const std::string& ip_address) const {
    RateLimitStatus s;
    s.user_session_count = m_store.get(user_session_key(user_id));
    s.ip_session_count = m_store.get(ip_session_key(ip_address));
    s.user_chunks_count = m_store.get(user_chunks_key(user_id));
    s.user_bandwidth_used = m_store.get(user_bandwidth_key(user_id));
    s.ip_bandwidth_used = m_store.get(ip_bandwidth_key(ip_address));
    s.concurrent_user_sessions = m_store.get(concurrent_user_key(user_id));
    s.concurrent_ip_sessions = m_store.get(concurrent_ip_key(ip_address));
    s.time_until_reset = seconds_until_next_hour();
    s.limits = m_limits;
    return s;
}

void RateLimiter::reset(const std::string& user_id, const std::string& ip_address) {
    size_t removed = 0;
    if (!user_id.empty()) {
        removed += m_store.reset("upload_rate_limit:user:" + user_id + ":");
    }
    if (!ip_address.empty()) {
        removed += m_store.reset("upload_rate_limit:ip:" + ip_address + ":");
    }
    LOG_INFO("RL: reset " + std::to_string(removed) + " counters for user=" + user_id +
             " ip=" + ip_address);
}

bool release_session_slot(SessionRepository& repo, RateLimiter* limiter, const std::string& session_id) {
    if (!limiter) return false;

    bool newly_released = false;
    auto updated = repo.update_session(session_id, [&newly_released](UploadSession& s) {
        if (s.metadata.value("concurrency_released", false)) return;
        s.metadata["concurrency_released"] = true;
        newly_released = true;
    });
    if (!updated || !newly_released) return false;

    limiter->track_session_completion(updated->user_id, updated->ip_address);
    LOG_DEBUG("RL: released concurrency slot of session " + session_id);
    return true;
}

} // namespace chunkflow
