#ifndef CHUNKFLOW_PROGRESS_TRACKER_H
#define CHUNKFLOW_PROGRESS_TRACKER_H

#include "clock.h"
#include "upload_sources.h"
#include "upload_types.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace chunkflow {

enum class TrendDirection {
    ACCELERATING,
    DECELERATING,
    STEADY
};

enum class ThroughputTrend {
    INCREASING,
    DECREASING,
    STEADY
};

const char* trend_direction_to_string(TrendDirection d);
const char* throughput_trend_to_string(ThroughputTrend t);

struct ProgressCheckpoint {
    SystemTime timestamp{};
    int completed_files = 0;
    int64_t bytes_transferred = 0;
    int active_sessions = 0;
    std::string notes;
};

struct RateTrend {
    TrendDirection direction = TrendDirection::STEADY;
    double confidence = 0.0;
    double slope = 0.0;
};

struct ProgressTrend {
    TrendDirection direction = TrendDirection::STEADY;
    double files_per_minute = 0.0;
    double bytes_per_second = 0.0;
    double confidence = 0.0;
    double acceleration = 0.0;
    double prediction_accuracy = 0.0;

    nlohmann::json to_json() const;
};

struct CurrentFileProgress {
    std::string session_id;
    std::string filename;
    UploadStatus status = UploadStatus::PENDING;
    double progress_percentage = 0.0;
    int64_t bytes_uploaded = 0;
    int64_t total_size = 0;
    int chunks_completed = 0;
    int chunks_total = 0;

    nlohmann::json to_json() const;
};

struct ProgressSnapshot {
    std::string batch_id;
    std::string draggable_name;
    int total_files = 0;
    int completed_files = 0;
    int failed_files = 0;
    int pending_files = 0;
    double overall_progress_percentage = 0.0;
    double bytes_progress_percentage = 0.0;
    int64_t bytes_transferred = 0;
    int64_t total_bytes_expected = 0;
    int64_t bytes_remaining = 0;
    double upload_speed_kbps = 0.0;
    double average_upload_speed_kbps = 0.0;
    double time_elapsed = 0.0;
    double estimated_completion_time = 0.0;
    std::string queue_status;
    bool tracking_active = false;
    std::optional<CurrentFileProgress> current_file;

    nlohmann::json to_json() const;
};

struct ThroughputMetrics {
    double files_per_hour = 0.0;
    double mb_per_hour = 0.0;
    int concurrent_streams = 0;
    int64_t average_file_size = 0;
    ThroughputTrend trend = ThroughputTrend::STEADY;

    nlohmann::json to_json() const;
};

struct FinalMetrics {
    double total_duration = 0.0;
    double average_upload_speed = 0.0;
    int files_processed = 0;
    int completed_files = 0;
    int failed_files = 0;
    int64_t total_bytes_transferred = 0;
    std::string final_status;
    double efficiency_score = 0.0;
    ThroughputMetrics throughput;
    double success_rate = 1.0;
    size_t checkpoints_recorded = 0;
    int broadcast_count = 0;

    nlohmann::json to_json() const;
};

struct TrackingStatistics {
    double tracking_duration = 0.0;
    size_t checkpoints_recorded = 0;
    int broadcast_count = 0;
    double average_checkpoint_interval = 0.0;
    double performance_score = 0.0;

    nlohmann::json to_json() const;
};

/**
 * Progress, speed, ETA and trend for one queue batch.
 *
 * Reads batch and chunk state through BatchSource / ChunkMetricsSource and
 * keeps a bounded ring of checkpoints. Updates are pushed to a listener at
 * most once per broadcast interval.
 */
class ProgressTracker {
public:
    using Listener = std::function<void(const nlohmann::json&)>;

    struct Options {
        double broadcast_interval_seconds = 0.5;
        size_t max_checkpoints = 10;

        static Options fromConfig();
    };

    ProgressTracker(std::string batch_id, const BatchSource& batches, const ChunkMetricsSource& metrics,
                    std::shared_ptr<Clock> clock = SystemClock::shared());
    ProgressTracker(std::string batch_id, const BatchSource& batches, const ChunkMetricsSource& metrics,
                    std::shared_ptr<Clock> clock, Options options);

    void set_listener(Listener listener);

    void start_tracking();
    FinalMetrics stop_tracking();
    bool tracking_active() const;

    ProgressSnapshot calculate_progress();

    // KB/s since the previous call; 0 if less than 0.1s elapsed
    double calculate_upload_speed();
    double average_upload_speed() const;
    // pending / (completed / elapsed), 0 until a file completes
    double estimate_completion_time() const;
    std::optional<CurrentFileProgress> current_file_progress() const;

    // Missing values are read from the batch.
    void add_checkpoint(const std::string& notes = "",
                        std::optional<int> completed_files = std::nullopt,
                        std::optional<int64_t> bytes_transferred = std::nullopt,
                        std::optional<SystemTime> timestamp = std::nullopt);
    std::vector<ProgressCheckpoint> checkpoints() const;

    ProgressTrend progress_trend() const;
    double efficiency_score() const;
    ThroughputMetrics throughput_metrics() const;
    FinalMetrics final_metrics() const;
    TrackingStatistics tracking_statistics() const;

    void force_broadcast();

    // -- Pure helpers ----------------------------------------------------

    // total - completed - failed with inconsistent counts tolerated
    static int safe_pending_files(const QueueItem& batch);
    // (completed + failed) / total, 100 when total <= 0
    static double overall_progress_percentage(const QueueItem& batch);
    static double linear_regression_slope(const std::vector<double>& values);
    static RateTrend analyze_rate_trend(const std::vector<double>& rates);
    static RateTrend combine_trends(const RateTrend& files, const RateTrend& bytes);

private:
    int64_t bytes_transferred() const;
    int64_t bytes_expected() const;
    int active_sessions() const;
    QueueItem batch_or_empty() const;

    // Callers hold m_mutex
    double elapsed_locked() const;
    double average_speed_locked() const;
    double eta_locked(const QueueItem& batch) const;
    ProgressTrend trend_locked() const;
    double efficiency_locked() const;
    ThroughputMetrics throughput_locked() const;
    FinalMetrics final_metrics_locked() const;

    void add_checkpoint_locked(ProgressCheckpoint cp);
    void broadcast(const std::string& status = "");
    void maybe_broadcast();

    std::string m_batch_id;
    const BatchSource& m_batches;
    const ChunkMetricsSource& m_metrics;
    std::shared_ptr<Clock> m_clock;
    Options m_options;

    mutable std::mutex m_mutex;
    bool m_tracking = false;
    std::optional<SystemTime> m_start_time;
    std::optional<SystemTime> m_last_speed_time;
    int64_t m_last_bytes_snapshot = 0;
    std::optional<SystemTime> m_last_broadcast;
    int m_broadcast_count = 0;
    std::deque<ProgressCheckpoint> m_checkpoints;
    std::optional<nlohmann::json> m_last_known;
    Listener m_listener;
};

} // namespace chunkflow

#endif // CHUNKFLOW_PROGRESS_TRACKER_H
