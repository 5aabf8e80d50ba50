#ifndef CHUNKFLOW_BANDWIDTH_GOVERNOR_H
#define CHUNKFLOW_BANDWIDTH_GOVERNOR_H

#include "clock.h"

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace chunkflow {

constexpr int DEFAULT_BANDWIDTH_KBPS = 1000;
constexpr int MIN_BANDWIDTH_KBPS = 50;
constexpr int MAX_BANDWIDTH_KBPS = 1000000;

struct BandwidthStats {
    int64_t total_bytes_uploaded = 0;
    double total_upload_time = 0.0;       // seconds, 3 places
    double average_speed_kbps = 0.0;      // 2 places
    int theoretical_speed_kbps = 0;       // current limit
    double efficiency_percentage = 0.0;   // avg / limit * 100, capped at 100
    int successful_uploads = 0;
    int total_uploads = 0;
    double success_rate = 0.0;            // percent, 2 places
    std::string window_description;
};

enum class BandwidthHealth {
    UNDERUTILIZED,
    OPTIMAL,
    OVERUTILIZED,
    UNKNOWN
};

struct BandwidthHealthReport {
    BandwidthHealth status = BandwidthHealth::UNKNOWN;
    double utilization = 0.0;
    std::string message;
};

const char* bandwidth_health_to_string(BandwidthHealth h);

/**
 * Throughput ceiling for chunk transfers.
 *
 * The delay for a transfer of S KB at limit L KB/s is S / L seconds. A limit
 * of 0 means unlimited. The limit is shared by every open stream, whichever
 * session it belongs to. Measured transfers are kept in a bounded history and
 * can pull the limit toward the observed network speed.
 */
class BandwidthGovernor {
public:
    struct Limits {
        int min_kbps = MIN_BANDWIDTH_KBPS;
        int max_kbps = MAX_BANDWIDTH_KBPS;
        size_t history_max_entries = 1000;
        int history_max_age_hours = 24;
        size_t adapt_sample_size = 10;
        size_t adapt_min_samples = 5;
        double adapt_threshold = 0.2;     // fraction of the current limit
    };

    // @throws ValidationError when limit_kbps < 0
    explicit BandwidthGovernor(int limit_kbps = DEFAULT_BANDWIDTH_KBPS,
                               std::shared_ptr<Clock> clock = SystemClock::shared());
    BandwidthGovernor(int limit_kbps, Limits limits, std::shared_ptr<Clock> clock);

    // Built from ConfigManager (bandwidth section)
    static std::unique_ptr<BandwidthGovernor> fromConfig(std::shared_ptr<Clock> clock = SystemClock::shared());

    bool is_unlimited() const;
    int limit_kbps() const;
    // 0 = unlimited, anything else clamped to [min, max]
    // @throws ValidationError when limit_kbps < 0
    void set_limit_kbps(int limit_kbps);

    double delay_seconds(double size_kb) const;
    // Limit split across n parallel streams (0 when unlimited)
    int per_stream_kbps(int concurrent_streams) const;

    // Holds n streams open against the limit for its lifetime. A null
    // governor makes it a no-op.
    class StreamLease {
    public:
        StreamLease(BandwidthGovernor* governor, int streams);
        ~StreamLease();

        StreamLease(const StreamLease&) = delete;
        StreamLease& operator=(const StreamLease&) = delete;

    private:
        BandwidthGovernor* m_governor;
        int m_streams;
    };

    // Streams open right now, across every session
    int active_streams() const;
    // Limit split across every open stream (0 when unlimited)
    int shared_stream_kbps() const;
    static double measure_speed_kbps(double size_kb, double duration_seconds);

    // Move the limit toward a measured speed:
    //   faster than the limit  -> 0.8 * measured
    //   slower than the limit  -> max(measured, min)
    void adapt(double measured_kbps);

    void record_transfer(int64_t bytes, double duration_seconds, bool success);

    // Adapt from the recent successful transfers when they differ enough from
    // the limit. Returns true if the limit changed.
    bool auto_adapt();

    // window: only transfers newer than now - window
    BandwidthStats statistics(std::optional<std::chrono::seconds> window = std::nullopt) const;
    // Efficiency over the last 5 minutes
    double current_utilization() const;
    BandwidthHealthReport health_check() const;

    size_t history_size() const;

private:
    struct TransferSample {
        int64_t bytes = 0;
        double duration = 0.0;
        bool success = true;
        SystemTime timestamp;
        double speed_kbps = 0.0;
    };

    // Called with m_mutex held
    void adapt_locked(double measured_kbps);
    int clamp_limit(int kbps) const;

    std::shared_ptr<Clock> m_clock;
    Limits m_limits;
    mutable std::mutex m_mutex;
    int m_limit_kbps;
    int m_active_streams = 0;
    std::deque<TransferSample> m_history;
};

} // namespace chunkflow

#endif // CHUNKFLOW_BANDWIDTH_GOVERNOR_H
