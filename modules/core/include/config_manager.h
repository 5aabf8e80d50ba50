#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <initializer_list>
#include <mutex>
#include <string>
#include <vector>

using json = nlohmann::json;

/**
 * Process-wide configuration backed by config.json.
 *
 * Every getter has a built-in default, so a missing file or a partial file
 * still yields a usable pipeline. Tests override individual keys through
 * setValueAtPath() or load a whole document with loadFromString().
 */
class ConfigManager {
public:
    static ConfigManager& getInstance();

    bool loadConfig(const std::string& config_path);
    bool loadFromString(const std::string& json_text);
    bool saveConfig(const std::string& config_path) const;

    // Drop every loaded value; getters fall back to defaults.
    void reset();

    // Set (creating intermediate objects) e.g. {"rate_limits", "chunks_per_minute"}.
    bool setValueAtPath(const std::vector<std::string>& path, const json& value);
    json getSnapshot() const;

    // Storage
    std::string getChunkStorageDir() const;
    std::string getAssemblyDir() const;
    std::string getSessionDbPath() const;
    bool isSessionPersistenceEnabled() const;

    // Bandwidth governor
    int getBandwidthLimitKbps() const;
    int getBandwidthMinKbps() const;
    int getBandwidthMaxKbps() const;
    int getBandwidthHistoryMaxEntries() const;
    int getBandwidthHistoryMaxAgeHours() const;
    int getBandwidthAdaptSampleSize() const;
    int getBandwidthAdaptMinSamples() const;
    double getBandwidthAdaptThreshold() const;

    // Rate limits
    int getUserSessionsPerHour() const;
    int getIpSessionsPerHour() const;
    int getChunksPerMinute() const;
    int getChunksPerSession() const;
    int64_t getUserBandwidthPerHour() const;
    int64_t getIpBandwidthPerHour() const;
    int getConcurrentSessionsPerUser() const;
    int getConcurrentSessionsPerIp() const;

    // Transfer engine
    int getTransferMaxConcurrent() const;
    int getTransferPoolWorkers() const;
    int getTransferQueueCapacity() const;
    int getChunkRetryAttempts() const;
    bool isDedupLenient() const;

    // Queue orchestrator
    int getQueueMaxConcurrentUploads() const;
    int getQueueRetryAttempts() const;
    std::string getQueuePriorityStrategy() const;
    int getQueueBandwidthLimitKbps() const;
    double getHighCpuThreshold() const;
    double getHighMemoryThreshold() const;
    double getMinUploadSpeedKbps() const;

    // Assembly
    int64_t getAssemblySizeToleranceBytes() const;

    // Scanner
    bool isScannerEnabled() const;
    std::string getScannerUnavailablePolicy() const;
    std::string getClamdHost() const;
    int getClamdPort() const;
    int getScanTimeoutSec() const;
    int getScanWorkers() const;

    // Progress tracking
    int getProgressBroadcastIntervalMs() const;
    int getProgressMaxCheckpoints() const;

    // Cleanup
    int getFailedSessionTtlHours() const;
    int getPendingSessionTtlHours() const;
    int getCancelledSessionTtlHours() const;
    int getStuckAssemblyHours() const;

    // Logging
    std::string getLogLevel() const;
    std::string getLogFilePath() const;
    bool isAsyncLogging() const;

    // Telemetry
    bool isTelemetryEnabled() const;
    int getTelemetryFlushIntervalMs() const;
    std::string getTelemetryFilePath() const;

private:
    ConfigManager() = default;

    template <typename T>
    T getValue(std::initializer_list<const char*> path, const T& fallback) const;

    mutable std::mutex m_mutex;
    json m_config = json::object();
};
