#include "telemetry.h"
#include "logger.h"

#include <algorithm>
#include <fstream>

namespace chunkflow {

namespace {

int64_t wall_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

int64_t value_or_zero(const std::map<std::string, int64_t>& m, const std::string& key) {
    auto it = m.find(key);
    return it == m.end() ? 0 : it->second;
}

double ratio(int64_t part, int64_t whole) {
    return whole > 0 ? static_cast<double>(part) / static_cast<double>(whole) : 0.0;
}

} // namespace

Telemetry& Telemetry::getInstance() {
    static Telemetry instance;
    return instance;
}

void Telemetry::initialize(const std::string& component, const Config& cfg) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_component = component;
    m_file_path = cfg.file_path;
    m_enabled = cfg.enabled;
    m_log_json = cfg.log_json;
    m_flush_interval_ms = cfg.flush_interval_ms;

    const int64_t now = wall_ms();
    if (m_start_ms == 0) m_start_ms = now;
    if (m_last_flush_ms == 0) m_last_flush_ms = now;
}

bool Telemetry::is_enabled() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_enabled;
}

void Telemetry::tick() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_enabled || m_flush_interval_ms <= 0) return;
        const int64_t now = wall_ms();
        if (now - m_last_flush_ms < m_flush_interval_ms) return;
        m_last_flush_ms = now;
    }
    flush("periodic");
}

void Telemetry::flush(const std::string& reason) {
    std::string line;
    std::string path;
    bool log_json = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_enabled) return;
        line = snapshot_locked(reason, wall_ms()).dump();
        path = m_file_path;
        log_json = m_log_json;
    }
    if (log_json) {
        LOG_INFO("TELEMETRY " + line);
    }
    if (!path.empty()) append_line(path, line);
}

nlohmann::json Telemetry::snapshot(const std::string& reason) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_enabled) return nlohmann::json::object();
    return snapshot_locked(reason, wall_ms());
}

std::string Telemetry::snapshot_json(const std::string& reason) const {
    return snapshot(reason).dump();
}

nlohmann::json Telemetry::snapshot_locked(const std::string& reason, int64_t now) const {
    nlohmann::json out;
    out["ts_ms"] = now;
    out["uptime_ms"] = m_start_ms > 0 ? now - m_start_ms : 0;
    out["reason"] = reason;
    out["component"] = m_component;
    out["counters"] = m_counters;
    out["gauges"] = m_gauges;

    nlohmann::json timings = nlohmann::json::object();
    for (const auto& kv : m_timings) {
        timings[kv.first] = {
            {"count", kv.second.count},
            {"sum", kv.second.sum_ms},
            {"min", kv.second.min_ms},
            {"max", kv.second.max_ms},
            {"mean", kv.second.mean_ms()}
        };
    }
    out["hists_ms"] = std::move(timings);

    const int64_t stored = value_or_zero(m_counters, "upload.chunks_stored");
    const int64_t dedup_hits = value_or_zero(m_counters, "upload.dedup_hits");
    const int64_t transferred = value_or_zero(m_counters, "upload.chunks_transferred");
    const int64_t chunk_failures = value_or_zero(m_counters, "upload.chunk_failures");
    const int64_t completed = value_or_zero(m_counters, "upload.sessions_completed");
    const int64_t failed = value_or_zero(m_counters, "upload.sessions_failed");
    out["upload"] = {
        {"dedup_ratio", ratio(dedup_hits, stored + dedup_hits)},
        {"bytes_saved", value_or_zero(m_counters, "upload.dedup_bytes_saved")},
        {"chunk_failure_rate", ratio(chunk_failures, transferred + chunk_failures)},
        {"session_failure_rate", ratio(failed, completed + failed)}
    };
    return out;
}

void Telemetry::append_line(const std::string& path, const std::string& line) const {
    std::ofstream out(path, std::ios::out | std::ios::app);
    if (!out.is_open()) {
        LOG_WARN("Telemetry: cannot open " + path + " for append");
        return;
    }
    out << line << "\n";
    if (!out) {
        LOG_WARN("Telemetry: short write to " + path);
    }
}

void Telemetry::inc_counter(const std::string& name, int64_t delta) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_enabled) return;
    m_counters[name] += delta;
}

void Telemetry::set_gauge(const std::string& name, int64_t value) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_enabled) return;
    m_gauges[name] = value;
}

void Telemetry::observe_hist_ms(const std::string& name, int64_t ms) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_enabled) return;
    StageTiming& t = m_timings[name];
    t.min_ms = t.count == 0 ? ms : std::min(t.min_ms, ms);
    t.max_ms = t.count == 0 ? ms : std::max(t.max_ms, ms);
    t.sum_ms += ms;
    ++t.count;
}

int64_t Telemetry::counter_value(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return value_or_zero(m_counters, name);
}

int64_t Telemetry::gauge_value(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return value_or_zero(m_gauges, name);
}

Telemetry::StageTiming Telemetry::timing(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_timings.find(name);
    return it == m_timings.end() ? StageTiming{} : it->second;
}

void Telemetry::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_counters.clear();
    m_gauges.clear();
    m_timings.clear();
}

StageTimer::~StageTimer() {
    Telemetry::getInstance().observe_hist_ms(m_name, elapsed_ms());
}

int64_t StageTimer::elapsed_ms() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - m_start)
        .count();
}

} // namespace chunkflow
