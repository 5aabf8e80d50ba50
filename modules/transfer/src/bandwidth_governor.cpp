#include "bandwidth_governor.h"
#include "config_manager.h"
#include "logger.h"
#include "telemetry.h"
#include "upload_errors.h"

#include <algorithm>
#include <cmath>

namespace chunkflow {

namespace {

double round_to(double v, int places) {
    const double f = std::pow(10.0, places);
    return std::round(v * f) / f;
}

} // namespace

const char* bandwidth_health_to_string(BandwidthHealth h) {
    switch (h) {
        case BandwidthHealth::UNDERUTILIZED: return "underutilized";
        case BandwidthHealth::OPTIMAL:       return "optimal";
        case BandwidthHealth::OVERUTILIZED:  return "overutilized";
        case BandwidthHealth::UNKNOWN:       return "unknown";
    }
    return "unknown";
}

BandwidthGovernor::BandwidthGovernor(int limit_kbps, std::shared_ptr<Clock> clock)
    : BandwidthGovernor(limit_kbps, Limits{}, std::move(clock)) {}

BandwidthGovernor::BandwidthGovernor(int limit_kbps, Limits limits, std::shared_ptr<Clock> clock)
    : m_clock(clock ? std::move(clock) : SystemClock::shared()),
      m_limits(limits),
      m_limit_kbps(0) {
    if (limit_kbps < 0) {
        throw ValidationError("Bandwidth limit must be positive (use 0 for unlimited)");
    }
    m_limit_kbps = limit_kbps == 0 ? 0 : clamp_limit(limit_kbps);
}

std::unique_ptr<BandwidthGovernor> BandwidthGovernor::fromConfig(std::shared_ptr<Clock> clock) {
    auto& cfg = ConfigManager::getInstance();
    Limits limits;
    limits.min_kbps = cfg.getBandwidthMinKbps();
    limits.max_kbps = cfg.getBandwidthMaxKbps();
    limits.history_max_entries = static_cast<size_t>(std::max(1, cfg.getBandwidthHistoryMaxEntries()));
    limits.history_max_age_hours = cfg.getBandwidthHistoryMaxAgeHours();
    limits.adapt_sample_size = static_cast<size_t>(std::max(1, cfg.getBandwidthAdaptSampleSize()));
    limits.adapt_min_samples = static_cast<size_t>(std::max(1, cfg.getBandwidthAdaptMinSamples()));
    limits.adapt_threshold = cfg.getBandwidthAdaptThreshold();
    return std::make_unique<BandwidthGovernor>(cfg.getBandwidthLimitKbps(), limits, std::move(clock));
}

int BandwidthGovernor::clamp_limit(int kbps) const {
    return std::max(m_limits.min_kbps, std::min(kbps, m_limits.max_kbps));
}

bool BandwidthGovernor::is_unlimited() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_limit_kbps == 0;
}

int BandwidthGovernor::limit_kbps() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_limit_kbps;
}

void BandwidthGovernor::set_limit_kbps(int limit_kbps) {
    if (limit_kbps < 0) {
        throw ValidationError("Bandwidth limit must be positive (use 0 for unlimited)");
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_limit_kbps = limit_kbps == 0 ? 0 : clamp_limit(limit_kbps);
    Telemetry::getInstance().set_gauge("upload.bandwidth_limit_kbps", m_limit_kbps);
    LOG_INFO("BW: Rate limit set to " + std::to_string(m_limit_kbps) + " KB/s");
}

double BandwidthGovernor::delay_seconds(double size_kb) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_limit_kbps == 0 || size_kb <= 0) return 0.0;
    return size_kb / m_limit_kbps;
}

int BandwidthGovernor::per_stream_kbps(int concurrent_streams) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_limit_kbps == 0) return 0;
    if (concurrent_streams <= 1) return m_limit_kbps;
    return std::max(1, m_limit_kbps / concurrent_streams);
}

BandwidthGovernor::StreamLease::StreamLease(BandwidthGovernor* governor, int streams)
    : m_governor(governor), m_streams(std::max(0, streams)) {
    if (!m_governor || m_streams == 0) return;
    std::lock_guard<std::mutex> lock(m_governor->m_mutex);
    m_governor->m_active_streams += m_streams;
}

BandwidthGovernor::StreamLease::~StreamLease() {
    if (!m_governor || m_streams == 0) return;
    std::lock_guard<std::mutex> lock(m_governor->m_mutex);
    m_governor->m_active_streams -= m_streams;
}

int BandwidthGovernor::active_streams() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_active_streams;
}

int BandwidthGovernor::shared_stream_kbps() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_limit_kbps == 0) return 0;
    // Never round down to 0, which would read as unlimited
    return std::max(1, m_limit_kbps / std::max(1, m_active_streams));
}

double BandwidthGovernor::measure_speed_kbps(double size_kb, double duration_seconds) {
    if (duration_seconds <= 0) return 0.0;
    return size_kb / duration_seconds;
}

void BandwidthGovernor::adapt(double measured_kbps) {
    std::lock_guard<std::mutex> lock(m_mutex);
    adapt_locked(measured_kbps);
}

void BandwidthGovernor::adapt_locked(double measured_kbps) {
    if (m_limit_kbps == 0) return;

    const int current = m_limit_kbps;
    if (measured_kbps > current) {
        // Network can take more: follow it conservatively
        m_limit_kbps = clamp_limit(static_cast<int>(measured_kbps * 0.8));
        LOG_INFO("BW: limit increased " + std::to_string(current) + " -> " +
                 std::to_string(m_limit_kbps) + " KB/s");
    } else if (measured_kbps < current) {
        m_limit_kbps = clamp_limit(std::max(static_cast<int>(measured_kbps), m_limits.min_kbps));
        LOG_INFO("BW: limit decreased " + std::to_string(current) + " -> " +
                 std::to_string(m_limit_kbps) + " KB/s");
    }
    Telemetry::getInstance().set_gauge("upload.bandwidth_limit_kbps", m_limit_kbps);
}

void BandwidthGovernor::record_transfer(int64_t bytes, double duration_seconds, bool success) {
    TransferSample s;
    s.bytes = bytes;
    s.duration = duration_seconds;
    s.success = success;
    s.timestamp = m_clock->now();
    s.speed_kbps = duration_seconds > 0 ? (bytes / 1024.0) / duration_seconds : 0.0;

    std::lock_guard<std::mutex> lock(m_mutex);
    m_history.push_back(s);

    // Keep the most recent entries inside the age window
    while (m_history.size() > m_limits.history_max_entries) {
        m_history.pop_front();
    }
    const SystemTime cutoff = s.timestamp - std::chrono::hours(m_limits.history_max_age_hours);
    while (!m_history.empty() && m_history.front().timestamp <= cutoff) {
        m_history.pop_front();
    }
}

bool BandwidthGovernor::auto_adapt() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_limit_kbps == 0) return false;

    const size_t n = std::min(m_limits.adapt_sample_size, m_history.size());
    double sum = 0.0;
    size_t successes = 0;
    for (size_t i = m_history.size() - n; i < m_history.size(); ++i) {
        if (m_history[i].success) {
            sum += m_history[i].speed_kbps;
            ++successes;
        }
    }
    if (successes == 0) return false;

    const double average = sum / successes;
    if (successes < m_limits.adapt_min_samples ||
        std::abs(average - m_limit_kbps) <= m_limit_kbps * m_limits.adapt_threshold) {
        return false;
    }

    const int before = m_limit_kbps;
    adapt_locked(average);
    return m_limit_kbps != before;
}

BandwidthStats BandwidthGovernor::statistics(std::optional<std::chrono::seconds> window) const {
    const SystemTime now = m_clock->now();

    std::lock_guard<std::mutex> lock(m_mutex);
    BandwidthStats stats;
    stats.theoretical_speed_kbps = m_limit_kbps;

    int64_t total_bytes = 0;
    double total_time = 0.0;
    int successes = 0;
    int count = 0;
    for (const auto& s : m_history) {
        if (window && s.timestamp <= now - *window) continue;
        total_bytes += s.bytes;
        total_time += s.duration;
        if (s.success) ++successes;
        ++count;
    }

    if (count == 0) {
        stats.window_description = "No data";
        return stats;
    }

    const double average = total_time > 0 ? (total_bytes / 1024.0) / total_time : 0.0;
    stats.total_bytes_uploaded = total_bytes;
    stats.total_upload_time = round_to(total_time, 3);
    stats.average_speed_kbps = round_to(average, 2);
    stats.efficiency_percentage = m_limit_kbps > 0
        ? std::min(round_to(average / m_limit_kbps * 100.0, 2), 100.0)
        : 100.0;
    stats.successful_uploads = successes;
    stats.total_uploads = count;
    stats.success_rate = round_to(static_cast<double>(successes) / count * 100.0, 2);
    stats.window_description = window
        ? "Last " + std::to_string(window->count() / 60) + " minutes"
        : "All time";
    return stats;
}

double BandwidthGovernor::current_utilization() const {
    const BandwidthStats stats = statistics(std::chrono::seconds(5 * 60));
    if (stats.total_uploads == 0) return 0.0;
    return stats.efficiency_percentage;
}

BandwidthHealthReport BandwidthGovernor::health_check() const {
    BandwidthHealthReport report;
    report.utilization = current_utilization();
    const std::string pct = std::to_string(static_cast<int>(std::round(report.utilization))) + "%";

    if (report.utilization < 0 || report.utilization > 100) {
        report.status = BandwidthHealth::UNKNOWN;
        report.message = "Unable to determine bandwidth utilization.";
    } else if (report.utilization <= 20) {
        report.status = BandwidthHealth::UNDERUTILIZED;
        report.message = "Bandwidth underutilized (" + pct + "). Consider increasing limit.";
    } else if (report.utilization <= 85) {
        report.status = BandwidthHealth::OPTIMAL;
        report.message = "Bandwidth utilization optimal (" + pct + ").";
    } else {
        report.status = BandwidthHealth::OVERUTILIZED;
        report.message = "Bandwidth overutilized (" + pct + "). Consider decreasing limit.";
    }
    return report;
}

size_t BandwidthGovernor::history_size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_history.size();
}

} // namespace chunkflow
