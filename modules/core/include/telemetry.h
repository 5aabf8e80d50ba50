#ifndef CHUNKFLOW_TELEMETRY_H
#define CHUNKFLOW_TELEMETRY_H

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>

namespace chunkflow {

/**
 * Process-local upload pipeline metrics.
 *
 * Counters only grow (upload.chunks_stored, upload.dedup_hits, ...), gauges
 * hold the last value set (upload.bandwidth_limit_kbps) and stage timings are
 * summarized as count/sum/min/max milliseconds. A flush logs one JSON line
 * and optionally appends it to a JSONL file. Every call is a no-op until
 * initialize() enables collection.
 */
class Telemetry final {
public:
    struct Config {
        bool enabled = true;
        bool log_json = true;
        int flush_interval_ms = 30000;
        std::string file_path;         // JSONL sink, empty for none
    };

    struct StageTiming {
        int64_t count = 0;
        int64_t sum_ms = 0;
        int64_t min_ms = 0;
        int64_t max_ms = 0;

        double mean_ms() const { return count > 0 ? static_cast<double>(sum_ms) / count : 0.0; }
    };

    static Telemetry& getInstance();

    // Safe to call again to change settings; the uptime origin is kept.
    void initialize(const std::string& component, const Config& cfg);
    bool is_enabled() const;

    // Flushes once flush_interval_ms has passed since the previous flush.
    void tick();
    void flush(const std::string& reason);

    // counters, gauges, stage timings and the derived upload summary
    nlohmann::json snapshot(const std::string& reason = "snapshot") const;
    std::string snapshot_json(const std::string& reason = "snapshot") const;

    void inc_counter(const std::string& name, int64_t delta = 1);
    void set_gauge(const std::string& name, int64_t value);
    void observe_hist_ms(const std::string& name, int64_t ms);

    int64_t counter_value(const std::string& name) const;
    int64_t gauge_value(const std::string& name) const;
    StageTiming timing(const std::string& name) const;

    // Drop every metric (tests).
    void clear();

private:
    Telemetry() = default;
    Telemetry(const Telemetry&) = delete;
    Telemetry& operator=(const Telemetry&) = delete;

    nlohmann::json snapshot_locked(const std::string& reason, int64_t now) const;
    void append_line(const std::string& path, const std::string& line) const;

    mutable std::mutex m_mutex;
    bool m_enabled = false;
    bool m_log_json = true;
    int m_flush_interval_ms = 30000;
    int64_t m_start_ms = 0;
    int64_t m_last_flush_ms = 0;
    std::string m_component;
    std::string m_file_path;

    std::map<std::string, int64_t> m_counters;
    std::map<std::string, int64_t> m_gauges;
    std::map<std::string, StageTiming> m_timings;
};

// Records the lifetime of a pipeline stage into a Telemetry timing.
class StageTimer {
public:
    explicit StageTimer(std::string name)
        : m_name(std::move(name)), m_start(std::chrono::steady_clock::now()) {}
    ~StageTimer();

    StageTimer(const StageTimer&) = delete;
    StageTimer& operator=(const StageTimer&) = delete;

    int64_t elapsed_ms() const;

private:
    std::string m_name;
    std::chrono::steady_clock::time_point m_start;
};

} // namespace chunkflow

#endif // CHUNKFLOW_TELEMETRY_H
