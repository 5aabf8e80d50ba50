#include "progress_tracker.h"
#include "config_manager.h"
#include "logger.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numeric>

namespace chunkflow {

namespace {

constexpr double BYTES_PER_KB = 1024.0;
constexpr double SECONDS_PER_MINUTE = 60.0;
constexpr size_t TREND_MIN_POINTS = 3;
constexpr double TREND_SLOPE_THRESHOLD = 0.1;
constexpr double FILES_WEIGHT = 0.3;
constexpr double BYTES_WEIGHT = 0.7;
constexpr double BASELINE_SPEED_KBPS = 1024.0;

double round_to(double v, int places) {
    const double f = std::pow(10.0, places);
    return std::round(v * f) / f;
}

// Per-pair rates over consecutive checkpoints, never negative
template <typename Fn>
std::vector<double> pair_rates(const std::vector<ProgressCheckpoint>& cps, Fn delta) {
    std::vector<double> rates;
    for (size_t i = 1; i < cps.size(); ++i) {
        const double dt = seconds_between(cps[i - 1].timestamp, cps[i].timestamp);
        if (dt <= 0) continue;
        rates.push_back(std::max(0.0, delta(cps[i - 1], cps[i]) / dt));
    }
    return rates;
}

bool is_in_flight(UploadStatus s) {
    return s == UploadStatus::UPLOADING || s == UploadStatus::ASSEMBLING ||
           s == UploadStatus::VIRUS_SCANNING;
}

} // namespace

const char* trend_direction_to_string(TrendDirection d) {
    switch (d) {
        case TrendDirection::ACCELERATING: return "accelerating";
        case TrendDirection::DECELERATING: return "decelerating";
        case TrendDirection::STEADY:       return "steady";
    }
    return "steady";
}

const char* throughput_trend_to_string(ThroughputTrend t) {
    switch (t) {
        case ThroughputTrend::INCREASING: return "increasing";
        case ThroughputTrend::DECREASING: return "decreasing";
        case ThroughputTrend::STEADY:     return "steady";
    }
    return "steady";
}

// ============================================================================
// JSON views
// ============================================================================

nlohmann::json ProgressTrend::to_json() const {
    return nlohmann::json{
        {"direction", trend_direction_to_string(direction)},
        {"files_per_minute", files_per_minute},
        {"bytes_per_second", bytes_per_second},
        {"trend_confidence", confidence},
        {"recent_acceleration", acceleration},
        {"prediction_accuracy", prediction_accuracy}
    };
}

nlohmann::json CurrentFileProgress::to_json() const {
    return nlohmann::json{
        {"session_id", session_id},
        {"filename", filename},
        {"status", upload_status_to_string(status)},
        {"progress_percentage", progress_percentage},
        {"bytes_uploaded", bytes_uploaded},
        {"total_size", total_size},
        {"chunks_completed", chunks_completed},
        {"chunks_total", chunks_total}
    };
}

nlohmann::json ProgressSnapshot::to_json() const {
    nlohmann::json j{
        {"batch_id", batch_id},
        {"draggable_name", draggable_name},
        {"total_files", total_files},
        {"completed_files", completed_files},
        {"failed_files", failed_files},
        {"pending_files", pending_files},
        {"overall_progress_percentage", overall_progress_percentage},
        {"bytes_progress_percentage", bytes_progress_percentage},
        {"bytes_transferred", bytes_transferred},
        {"total_bytes_expected", total_bytes_expected},
        {"bytes_remaining", bytes_remaining},
        {"upload_speed_kbps", upload_speed_kbps},
        {"average_upload_speed_kbps", average_upload_speed_kbps},
        {"time_elapsed", time_elapsed},
        {"estimated_completion_time", estimated_completion_time},
        {"queue_status", queue_status},
        {"tracking_active", tracking_active}
    };
    j["current_file_progress"] = current_file ? current_file->to_json() : nlohmann::json(nullptr);
    return j;
}

nlohmann::json ThroughputMetrics::to_json() const {
    return nlohmann::json{
        {"files_per_hour", files_per_hour},
        {"mb_per_hour", mb_per_hour},
        {"concurrent_streams", concurrent_streams},
        {"average_file_size", average_file_size},
        {"throughput_trend", throughput_trend_to_string(trend)}
    };
}

nlohmann::json FinalMetrics::to_json() const {
    return nlohmann::json{
        {"total_duration", total_duration},
        {"average_upload_speed", average_upload_speed},
        {"files_processed", files_processed},
        {"completed_files", completed_files},
        {"failed_files", failed_files},
        {"total_bytes_transferred", total_bytes_transferred},
        {"final_status", final_status},
        {"efficiency_score", efficiency_score},
        {"throughput_metrics", throughput.to_json()},
        {"success_rate", success_rate},
        {"checkpoints_recorded", checkpoints_recorded},
        {"broadcast_count", broadcast_count}
    };
}

nlohmann::json TrackingStatistics::to_json() const {
    return nlohmann::json{
        {"tracking_duration", tracking_duration},
        {"checkpoints_recorded", checkpoints_recorded},
        {"broadcast_count", broadcast_count},
        {"average_checkpoint_interval", average_checkpoint_interval},
        {"performance_score", performance_score}
    };
}

// ============================================================================
// ProgressTracker
// ============================================================================

ProgressTracker::Options ProgressTracker::Options::fromConfig() {
    auto& cfg = ConfigManager::getInstance();
    Options o;
    o.broadcast_interval_seconds = std::max(0, cfg.getProgressBroadcastIntervalMs()) / 1000.0;
    o.max_checkpoints = static_cast<size_t>(std::max(1, cfg.getProgressMaxCheckpoints()));
    return o;
}

ProgressTracker::ProgressTracker(std::string batch_id, const BatchSource& batches,
                                 const ChunkMetricsSource& metrics, std::shared_ptr<Clock> clock)
    : ProgressTracker(std::move(batch_id), batches, metrics, std::move(clock), Options{}) {}

ProgressTracker::ProgressTracker(std::string batch_id, const BatchSource& batches,
                                 const ChunkMetricsSource& metrics, std::shared_ptr<Clock> clock,
                                 Options options)
    : m_batch_id(std::move(batch_id)),
      m_batches(batches),
      m_metrics(metrics),
      m_clock(clock ? std::move(clock) : SystemClock::shared()),
      m_options(options) {
    if (m_options.max_checkpoints == 0) m_options.max_checkpoints = 1;
    LOG_DEBUG("PT: tracker created for batch " + m_batch_id);
}

void ProgressTracker::set_listener(Listener listener) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_listener = std::move(listener);
}

QueueItem ProgressTracker::batch_or_empty() const {
    auto batch = m_batches.find_batch(m_batch_id);
    if (batch) return *batch;
    QueueItem empty;
    empty.batch_id = m_batch_id;
    return empty;
}

int64_t ProgressTracker::bytes_transferred() const {
    std::vector<std::string> ids;
    for (const auto& s : m_batches.sessions_for_batch(m_batch_id)) ids.push_back(s.id);
    if (ids.empty()) return 0;
    return m_metrics.completed_chunk_totals(ids).bytes;
}

int64_t ProgressTracker::bytes_expected() const {
    int64_t total = 0;
    for (const auto& s : m_batches.sessions_for_batch(m_batch_id)) total += std::max<int64_t>(0, s.total_size);
    return total;
}

int ProgressTracker::active_sessions() const {
    int n = 0;
    for (const auto& s : m_batches.sessions_for_batch(m_batch_id)) {
        if (is_in_flight(s.status)) ++n;
    }
    return n;
}

double ProgressTracker::elapsed_locked() const {
    if (!m_start_time) return 0.0;
    return std::max(0.0, seconds_between(*m_start_time, m_clock->now()));
}

void ProgressTracker::start_tracking() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const SystemTime now = m_clock->now();
        m_start_time = now;
        m_last_speed_time = now;
        m_last_bytes_snapshot = bytes_transferred();
        m_tracking = true;
        m_broadcast_count = 0;

        ProgressCheckpoint cp;
        cp.timestamp = now;
        cp.completed_files = batch_or_empty().completed_files;
        cp.bytes_transferred = m_last_bytes_snapshot;
        cp.active_sessions = active_sessions();
        cp.notes = "Tracking started";
        add_checkpoint_locked(std::move(cp));
    }
    LOG_INFO("PT: tracking started for batch " + m_batch_id);
    broadcast();
}

FinalMetrics ProgressTracker::stop_tracking() {
    FinalMetrics metrics;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_tracking) return final_metrics_locked();
        m_tracking = false;
        metrics = final_metrics_locked();

        ProgressCheckpoint cp;
        cp.timestamp = m_clock->now();
        cp.completed_files = metrics.completed_files;
        cp.bytes_transferred = metrics.total_bytes_transferred;
        cp.active_sessions = active_sessions();
        cp.notes = "Tracking completed";
        add_checkpoint_locked(std::move(cp));
        metrics.checkpoints_recorded = m_checkpoints.size();
    }
    broadcast("completed");
    LOG_INFO("PT: tracking completed for batch " + m_batch_id);
    return metrics;
}

bool ProgressTracker::tracking_active() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tracking;
}

ProgressSnapshot ProgressTracker::calculate_progress() {
    auto found = m_batches.find_batch(m_batch_id);
    ProgressSnapshot p;
    p.batch_id = m_batch_id;

    if (!found) {
        p.overall_progress_percentage = 100.0;
        p.queue_status = "deleted";
        return p;
    }

    const QueueItem& batch = *found;
    p.draggable_name = batch.draggable_name;
    p.total_files = batch.total_files;
    p.completed_files = batch.completed_files;
    p.failed_files = batch.failed_files;
    p.pending_files = safe_pending_files(batch);
    p.overall_progress_percentage = overall_progress_percentage(batch);
    p.queue_status = queue_status_to_string(batch.status);

    if (!tracking_active()) {
        p.tracking_active = false;
        return p;
    }

    p.tracking_active = true;
    p.bytes_transferred = bytes_transferred();
    p.total_bytes_expected = bytes_expected();
    p.bytes_remaining = std::max<int64_t>(0, p.total_bytes_expected - p.bytes_transferred);
    if (p.total_bytes_expected > 0) {
        p.bytes_progress_percentage =
            round_to(static_cast<double>(p.bytes_transferred) / p.total_bytes_expected * 100.0, 1);
    }
    p.upload_speed_kbps = calculate_upload_speed();
    p.current_file = current_file_progress();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        p.time_elapsed = elapsed_locked();
        p.average_upload_speed_kbps = average_speed_locked();
        p.estimated_completion_time = eta_locked(batch);
        m_last_known = p.to_json();
    }
    return p;
}

double ProgressTracker::calculate_upload_speed() {
    const int64_t current_bytes = bytes_transferred();

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_start_time || !m_last_speed_time) return 0.0;

    const SystemTime now = m_clock->now();
    const double dt = seconds_between(*m_last_speed_time, now);
    if (dt < 0.1) return 0.0;

    const int64_t diff = current_bytes - m_last_bytes_snapshot;
    m_last_speed_time = now;
    m_last_bytes_snapshot = current_bytes;
    return std::max(0.0, diff / dt / BYTES_PER_KB);
}

double ProgressTracker::average_speed_locked() const {
    if (!m_start_time) return 0.0;
    const double elapsed = elapsed_locked();
    if (elapsed <= 0) return 0.0;
    return round_to(bytes_transferred() / elapsed / BYTES_PER_KB, 2);
}

double ProgressTracker::average_upload_speed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return average_speed_locked();
}

double ProgressTracker::eta_locked(const QueueItem& batch) const {
    if (!m_start_time || batch.completed_files <= 0) return 0.0;
    const double elapsed = elapsed_locked();
    if (elapsed <= 0) return 0.0;
    const double files_per_second = batch.completed_files / elapsed;
    const int remaining = safe_pending_files(batch);
    if (remaining <= 0 || files_per_second <= 0) return 0.0;
    return remaining / files_per_second;
}

double ProgressTracker::estimate_completion_time() const {
    const QueueItem batch = batch_or_empty();
    std::lock_guard<std::mutex> lock(m_mutex);
    return eta_locked(batch);
}

std::optional<CurrentFileProgress> ProgressTracker::current_file_progress() const {
    const auto sessions = m_batches.sessions_for_batch(m_batch_id);
    const UploadSession* current = nullptr;
    for (const auto& s : sessions) {
        if (!is_in_flight(s.status)) continue;
        if (!current || s.updated_at >= current->updated_at) current = &s;
    }
    if (!current) return std::nullopt;

    CurrentFileProgress f;
    f.session_id = current->id;
    f.filename = current->filename;
    f.status = current->status;
    f.total_size = current->total_size;
    f.chunks_total = current->chunks_count;
    f.chunks_completed = m_metrics.completed_chunk_count(current->id);
    f.bytes_uploaded = m_metrics.completed_chunk_totals({current->id}).bytes;
    f.progress_percentage = session_progress_percentage(*current, f.chunks_completed);
    return f;
}

void ProgressTracker::add_checkpoint_locked(ProgressCheckpoint cp) {
    m_checkpoints.push_back(std::move(cp));
    while (m_checkpoints.size() > m_options.max_checkpoints) {
        m_checkpoints.pop_front();
    }
}

void ProgressTracker::add_checkpoint(const std::string& notes, std::optional<int> completed_files,
                                     std::optional<int64_t> bytes, std::optional<SystemTime> timestamp) {
    ProgressCheckpoint cp;
    cp.timestamp = timestamp ? *timestamp : m_clock->now();
    cp.completed_files = completed_files ? *completed_files : batch_or_empty().completed_files;
    cp.bytes_transferred = bytes ? *bytes : bytes_transferred();
    cp.active_sessions = active_sessions();
    cp.notes = notes;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        add_checkpoint_locked(std::move(cp));
    }
    maybe_broadcast();
}

std::vector<ProgressCheckpoint> ProgressTracker::checkpoints() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::vector<ProgressCheckpoint>(m_checkpoints.begin(), m_checkpoints.end());
}

// ----------------------------------------------------------------------------
// Trend analysis
// ----------------------------------------------------------------------------

int ProgressTracker::safe_pending_files(const QueueItem& batch) {
    const int total = std::max(0, batch.total_files);
    const int completed = std::max(0, batch.completed_files);
    const int failed = std::max(0, batch.failed_files);

    if (completed > total || failed > total || completed + failed > total) {
        LOG_WARN("PT: inconsistent counts for batch " + batch.batch_id + " (total=" + std::to_string(total) +
                 " completed=" + std::to_string(completed) + " failed=" + std::to_string(failed) + ")");
        if (total <= 0) return 0;
        return std::max(0, total - std::min(completed, failed));
    }
    return std::max(0, total - completed - failed);
}

double ProgressTracker::overall_progress_percentage(const QueueItem& batch) {
    if (batch.total_files <= 0) return 100.0;
    const int processed = std::max(0, batch.completed_files) + std::max(0, batch.failed_files);
    if (processed > batch.total_files) return 100.0;
    const double pct = round_to(static_cast<double>(processed) / batch.total_files * 100.0, 1);
    return std::max(0.0, std::min(pct, 100.0));
}

double ProgressTracker::linear_regression_slope(const std::vector<double>& values) {
    const size_t n = values.size();
    if (n < 2) return 0.0;

    double sum_x = 0, sum_y = 0, sum_xy = 0, sum_xx = 0;
    for (size_t i = 0; i < n; ++i) {
        const double x = static_cast<double>(i);
        sum_x += x;
        sum_y += values[i];
        sum_xy += x * values[i];
        sum_xx += x * x;
    }
    const double denom = n * sum_xx - sum_x * sum_x;
    if (denom == 0) return 0.0;
    return (n * sum_xy - sum_x * sum_y) / denom;
}

RateTrend ProgressTracker::analyze_rate_trend(const std::vector<double>& rates) {
    RateTrend t;
    if (rates.size() < 2) return t;

    t.slope = linear_regression_slope(rates);

    const double mean = std::accumulate(rates.begin(), rates.end(), 0.0) / rates.size();
    double variance = 0.0;
    for (double r : rates) variance += (r - mean) * (r - mean);
    variance /= rates.size();
    const double base = variance > 0 ? 1.0 / (1.0 + std::sqrt(variance)) : 1.0;
    t.confidence = (base + std::min(std::abs(t.slope), 1.0)) / 2.0;

    if (t.slope > TREND_SLOPE_THRESHOLD) {
        t.direction = TrendDirection::ACCELERATING;
    } else if (t.slope < -TREND_SLOPE_THRESHOLD) {
        t.direction = TrendDirection::DECELERATING;
    }
    return t;
}

RateTrend ProgressTracker::combine_trends(const RateTrend& files, const RateTrend& bytes) {
    RateTrend combined;
    combined.confidence = files.confidence * FILES_WEIGHT + bytes.confidence * BYTES_WEIGHT;
    combined.slope = files.slope * FILES_WEIGHT + bytes.slope * BYTES_WEIGHT;
    if (files.direction == bytes.direction) {
        combined.direction = files.direction;
    } else if (combined.confidence > 0.7) {
        combined.direction = bytes.direction;
    } else {
        combined.direction = TrendDirection::STEADY;
    }
    return combined;
}

ProgressTrend ProgressTracker::trend_locked() const {
    ProgressTrend trend;
    if (m_checkpoints.size() < TREND_MIN_POINTS) return trend;

    const std::vector<ProgressCheckpoint> recent(m_checkpoints.end() - static_cast<std::ptrdiff_t>(TREND_MIN_POINTS), m_checkpoints.end());
    const auto file_rates = pair_rates(recent, [](const ProgressCheckpoint& a, const ProgressCheckpoint& b) {
        return static_cast<double>(b.completed_files - a.completed_files) * SECONDS_PER_MINUTE;
    });
    const auto byte_rates = pair_rates(recent, [](const ProgressCheckpoint& a, const ProgressCheckpoint& b) {
        return static_cast<double>(b.bytes_transferred - a.bytes_transferred);
    });

    const RateTrend combined = combine_trends(analyze_rate_trend(file_rates), analyze_rate_trend(byte_rates));
    trend.direction = combined.direction;
    trend.confidence = combined.confidence;
    trend.acceleration = combined.slope;
    trend.files_per_minute = file_rates.empty() ? 0.0 : file_rates.back();
    trend.bytes_per_second = byte_rates.empty() ? 0.0 : byte_rates.back();
    // No prediction history is kept; report a fixed estimate once a trend exists
    trend.prediction_accuracy = 0.8;
    return trend;
}

ProgressTrend ProgressTracker::progress_trend() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return trend_locked();
}

// ----------------------------------------------------------------------------
// Efficiency / throughput
// ----------------------------------------------------------------------------

double ProgressTracker::efficiency_locked() const {
    if (!m_start_time || elapsed_locked() <= 0) return 0.0;

    const double upload_eff = std::min(average_speed_locked() / BASELINE_SPEED_KBPS, 1.0);

    const auto sessions = m_batches.sessions_for_batch(m_batch_id);
    double time_eff = 0.0;
    if (!sessions.empty()) {
        time_eff = std::min(static_cast<double>(active_sessions()) / sessions.size(), 1.0);
    }

    const QueueItem batch = batch_or_empty();
    const double penalty = batch.total_files > 0
        ? static_cast<double>(std::max(0, batch.failed_files)) / batch.total_files * 0.5
        : 0.0;

    const double score = std::max((upload_eff + time_eff) / 2.0 - penalty, 0.0);
    return std::min(score, 1.0);
}

double ProgressTracker::efficiency_score() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return efficiency_locked();
}

ThroughputMetrics ProgressTracker::throughput_locked() const {
    ThroughputMetrics t;
    const double elapsed = elapsed_locked();
    const QueueItem batch = batch_or_empty();
    if (elapsed > 0) {
        t.files_per_hour = batch.completed_files / elapsed * 3600.0;
        t.mb_per_hour = bytes_transferred() / elapsed * 3600.0 / BYTES_PER_KB / BYTES_PER_KB;
    }
    t.concurrent_streams = active_sessions();

    int64_t total = 0;
    int counted = 0;
    for (const auto& s : m_batches.sessions_for_batch(m_batch_id)) {
        if (s.total_size <= 0) continue;
        total += s.total_size;
        ++counted;
    }
    t.average_file_size = counted > 0 ? total / counted : 0;

    if (m_checkpoints.size() >= 3) {
        const std::vector<ProgressCheckpoint> recent(m_checkpoints.end() - 3, m_checkpoints.end());
        std::vector<double> throughputs;
        for (size_t i = 1; i < recent.size(); ++i) {
            const double dt = seconds_between(recent[i - 1].timestamp, recent[i].timestamp);
            if (dt <= 0) continue;
            throughputs.push_back((recent[i].bytes_transferred - recent[i - 1].bytes_transferred) / dt);
        }
        if (throughputs.size() >= 2) {
            if (throughputs.back() > throughputs.front() * 1.1) {
                t.trend = ThroughputTrend::INCREASING;
            } else if (throughputs.back() < throughputs.front() * 0.9) {
                t.trend = ThroughputTrend::DECREASING;
            }
        }
    }
    return t;
}

ThroughputMetrics ProgressTracker::throughput_metrics() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return throughput_locked();
}

FinalMetrics ProgressTracker::final_metrics_locked() const {
    const QueueItem batch = batch_or_empty();
    FinalMetrics m;
    m.total_duration = elapsed_locked();
    m.average_upload_speed = average_speed_locked();
    m.completed_files = std::max(0, batch.completed_files);
    m.failed_files = std::max(0, batch.failed_files);
    m.files_processed = m.completed_files + m.failed_files;
    m.total_bytes_transferred = bytes_transferred();
    m.final_status = queue_status_to_string(batch.status);
    m.efficiency_score = efficiency_locked();
    m.throughput = throughput_locked();
    m.success_rate = m.files_processed > 0
        ? static_cast<double>(m.completed_files) / m.files_processed
        : 1.0;
    m.checkpoints_recorded = m_checkpoints.size();
    m.broadcast_count = m_broadcast_count;
    return m;
}

FinalMetrics ProgressTracker::final_metrics() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return final_metrics_locked();
}

TrackingStatistics ProgressTracker::tracking_statistics() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    TrackingStatistics s;
    if (!m_tracking) return s;

    s.tracking_duration = elapsed_locked();
    s.checkpoints_recorded = m_checkpoints.size();
    s.broadcast_count = m_broadcast_count;
    if (m_checkpoints.size() >= 2) {
        s.average_checkpoint_interval =
            seconds_between(m_checkpoints.front().timestamp, m_checkpoints.back().timestamp) /
            (m_checkpoints.size() - 1);
    }
    const double accuracy = m_checkpoints.size() >= 3 ? 0.8 : 0.0;
    s.performance_score = (efficiency_locked() + accuracy) / 2.0;
    return s;
}

// ----------------------------------------------------------------------------
// Broadcasting
// ----------------------------------------------------------------------------

void ProgressTracker::broadcast(const std::string& status) {
    nlohmann::json payload;
    Listener listener;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_last_broadcast = m_clock->now();
        ++m_broadcast_count;
        listener = m_listener;
        if (!listener) return;

        if (m_last_known) {
            payload = *m_last_known;
        } else {
            const QueueItem batch = batch_or_empty();
            payload = {
                {"batch_id", m_batch_id},
                {"completed_files", batch.completed_files},
                {"total_files", batch.total_files},
                {"overall_progress_percentage", overall_progress_percentage(batch)}
            };
        }
        if (!status.empty()) payload["status"] = status;
    }

    try {
        listener(payload);
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("PT: progress listener failed: ") + e.what());
    }
}

void ProgressTracker::maybe_broadcast() {
    bool due = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        due = !m_last_broadcast ||
              seconds_between(*m_last_broadcast, m_clock->now()) >= m_options.broadcast_interval_seconds;
    }
    if (due) broadcast();
}

void ProgressTracker::force_broadcast() {
    broadcast();
}

} // namespace chunkflow
