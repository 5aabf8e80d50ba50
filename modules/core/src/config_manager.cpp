#include "config_manager.h"
#include "logger.h"
#include <fstream>
#include <cstdio>

ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::loadConfig(const std::string& config_path) {
    try {
        std::ifstream config_file(config_path);
        if (!config_file.is_open()) {
            LOG_ERROR("CFG: Failed to open config file: " + config_path);
            return false;
        }
        json parsed;
        config_file >> parsed;
        if (!parsed.is_object()) {
            LOG_ERROR("CFG: Top-level value must be an object: " + config_path);
            return false;
        }
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_config = std::move(parsed);
        }
        LOG_INFO("CFG: Configuration loaded from " + config_path);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("CFG: Config loading failed: " + std::string(e.what()));
        return false;
    }
}

bool ConfigManager::loadFromString(const std::string& json_text) {
    try {
        json parsed = json::parse(json_text);
        if (!parsed.is_object()) {
            return false;
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config = std::move(parsed);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("CFG: Invalid config text: " + std::string(e.what()));
        return false;
    }
}

bool ConfigManager::saveConfig(const std::string& config_path) const {
    const std::string tmp_path = config_path + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out.is_open()) {
            LOG_ERROR("CFG: Cannot write " + tmp_path);
            return false;
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        out << m_config.dump(2) << '\n';
        if (!out) {
            LOG_ERROR("CFG: Short write to " + tmp_path);
            return false;
        }
    }
    if (std::rename(tmp_path.c_str(), config_path.c_str()) != 0) {
        LOG_ERROR("CFG: Failed to replace " + config_path);
        std::remove(tmp_path.c_str());
        return false;
    }
    return true;
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_config = json::object();
}

bool ConfigManager::setValueAtPath(const std::vector<std::string>& path, const json& value) {
    if (path.empty()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    json* node = &m_config;
    for (size_t i = 0; i + 1 < path.size(); ++i) {
        json& next = (*node)[path[i]];
        if (!next.is_object()) {
            next = json::object();
        }
        node = &next;
    }
    (*node)[path.back()] = value;
    return true;
}

json ConfigManager::getSnapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_config;
}

template <typename T>
T ConfigManager::getValue(std::initializer_list<const char*> path, const T& fallback) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const json* node = &m_config;
    for (const char* key : path) {
        if (!node->is_object()) {
            return fallback;
        }
        auto it = node->find(key);
        if (it == node->end()) {
            return fallback;
        }
        node = &(*it);
    }
    try {
        return node->get<T>();
    } catch (const json::exception& e) {
        LOG_WARN("CFG: Wrong type for config key, using default: " + std::string(e.what()));
        return fallback;
    }
}

// ============================================================================
// Storage
// ============================================================================

std::string ConfigManager::getChunkStorageDir() const {
    return getValue<std::string>({"storage", "chunk_dir"}, "storage/chunks");
}

std::string ConfigManager::getAssemblyDir() const {
    return getValue<std::string>({"storage", "assembly_dir"}, "storage/assembly");
}

std::string ConfigManager::getSessionDbPath() const {
    return getValue<std::string>({"storage", "session_db", "path"}, "storage/sessions.json");
}

bool ConfigManager::isSessionPersistenceEnabled() const {
    return getValue<bool>({"storage", "session_db", "enabled"}, false);
}

// ============================================================================
// Bandwidth governor
// ============================================================================

int ConfigManager::getBandwidthLimitKbps() const {
    return getValue<int>({"bandwidth", "limit_kbps"}, 1000);
}

int ConfigManager::getBandwidthMinKbps() const {
    return getValue<int>({"bandwidth", "min_kbps"}, 50);
}

int ConfigManager::getBandwidthMaxKbps() const {
    return getValue<int>({"bandwidth", "max_kbps"}, 1000000);
}

int ConfigManager::getBandwidthHistoryMaxEntries() const {
    return getValue<int>({"bandwidth", "history_max_entries"}, 1000);
}

int ConfigManager::getBandwidthHistoryMaxAgeHours() const {
    return getValue<int>({"bandwidth", "history_max_age_hours"}, 24);
}

int ConfigManager::getBandwidthAdaptSampleSize() const {
    return getValue<int>({"bandwidth", "adapt_sample_size"}, 10);
}

int ConfigManager::getBandwidthAdaptMinSamples() const {
    return getValue<int>({"bandwidth", "adapt_min_samples"}, 5);
}

double ConfigManager::getBandwidthAdaptThreshold() const {
    return getValue<double>({"bandwidth", "adapt_threshold"}, 0.2);
}

// ============================================================================
// Rate limits
// ============================================================================

int ConfigManager::getUserSessionsPerHour() const {
    return getValue<int>({"rate_limits", "user_sessions_per_hour"}, 15);
}

int ConfigManager::getIpSessionsPerHour() const {
    return getValue<int>({"rate_limits", "ip_sessions_per_hour"}, 25);
}

int ConfigManager::getChunksPerMinute() const {
    return getValue<int>({"rate_limits", "chunks_per_minute"}, 200);
}

int ConfigManager::getChunksPerSession() const {
    return getValue<int>({"rate_limits", "chunks_per_session"}, 50);
}

int64_t ConfigManager::getUserBandwidthPerHour() const {
    return getValue<int64_t>({"rate_limits", "user_bandwidth_per_hour"}, 2LL * 1024 * 1024 * 1024);
}

int64_t ConfigManager::getIpBandwidthPerHour() const {
    return getValue<int64_t>({"rate_limits", "ip_bandwidth_per_hour"}, 3LL * 1024 * 1024 * 1024);
}

int ConfigManager::getConcurrentSessionsPerUser() const {
    return getValue<int>({"rate_limits", "concurrent_sessions_per_user"}, 3);
}

int ConfigManager::getConcurrentSessionsPerIp() const {
    return getValue<int>({"rate_limits", "concurrent_sessions_per_ip"}, 5);
}

// ============================================================================
// Transfer engine
// ============================================================================

int ConfigManager::getTransferMaxConcurrent() const {
    return getValue<int>({"transfer", "max_concurrent"}, 4);
}

int ConfigManager::getTransferPoolWorkers() const {
    return getValue<int>({"transfer", "pool_workers"}, 4);
}

int ConfigManager::getTransferQueueCapacity() const {
    return getValue<int>({"transfer", "queue_capacity"}, 64);
}

int ConfigManager::getChunkRetryAttempts() const {
    return getValue<int>({"transfer", "chunk_retry_attempts"}, 2);
}

bool ConfigManager::isDedupLenient() const {
    return getValue<bool>({"transfer", "dedup_lenient"}, false);
}

// ============================================================================
// Queue orchestrator
// ============================================================================

int ConfigManager::getQueueMaxConcurrentUploads() const {
    return getValue<int>({"queue", "max_concurrent_uploads"}, 3);
}

int ConfigManager::getQueueRetryAttempts() const {
    return getValue<int>({"queue", "retry_attempts"}, 3);
}

std::string ConfigManager::getQueuePriorityStrategy() const {
    return getValue<std::string>({"queue", "priority_strategy"}, "smallest_first");
}

int ConfigManager::getQueueBandwidthLimitKbps() const {
    return getValue<int>({"queue", "bandwidth_limit_kbps"}, 10000);
}

double ConfigManager::getHighCpuThreshold() const {
    return getValue<double>({"queue", "high_cpu_threshold"}, 0.85);
}

double ConfigManager::getHighMemoryThreshold() const {
    return getValue<double>({"queue", "high_memory_threshold"}, 0.80);
}

double ConfigManager::getMinUploadSpeedKbps() const {
    return getValue<double>({"queue", "min_upload_speed_kbps"}, 100.0);
}

// ============================================================================
// Assembly / scanner
// ============================================================================

int64_t ConfigManager::getAssemblySizeToleranceBytes() const {
    return getValue<int64_t>({"assembly", "size_tolerance_bytes"}, 100);
}

bool ConfigManager::isScannerEnabled() const {
    return getValue<bool>({"scanner", "enabled"}, true);
}

std::string ConfigManager::getScannerUnavailablePolicy() const {
    return getValue<std::string>({"scanner", "unavailable_policy"}, "skip");
}

std::string ConfigManager::getClamdHost() const {
    return getValue<std::string>({"scanner", "clamd_host"}, "127.0.0.1");
}

int ConfigManager::getClamdPort() const {
    return getValue<int>({"scanner", "clamd_port"}, 3310);
}

int ConfigManager::getScanTimeoutSec() const {
    return getValue<int>({"scanner", "timeout_sec"}, 30);
}

int ConfigManager::getScanWorkers() const {
    return getValue<int>({"scanner", "workers"}, 1);
}

// ============================================================================
// Progress / cleanup
// ============================================================================

int ConfigManager::getProgressBroadcastIntervalMs() const {
    return getValue<int>({"progress", "broadcast_interval_ms"}, 500);
}

int ConfigManager::getProgressMaxCheckpoints() const {
    return getValue<int>({"progress", "max_checkpoints"}, 10);
}

int ConfigManager::getFailedSessionTtlHours() const {
    return getValue<int>({"cleanup", "failed_session_ttl_hours"}, 24);
}

int ConfigManager::getPendingSessionTtlHours() const {
    return getValue<int>({"cleanup", "pending_session_ttl_hours"}, 1);
}

int ConfigManager::getCancelledSessionTtlHours() const {
    return getValue<int>({"cleanup", "cancelled_session_ttl_hours"}, 24);
}

int ConfigManager::getStuckAssemblyHours() const {
    return getValue<int>({"cleanup", "stuck_assembly_hours"}, 1);
}

// ============================================================================
// Logging / telemetry
// ============================================================================

std::string ConfigManager::getLogLevel() const {
    return getValue<std::string>({"logging", "level"}, "info");
}

std::string ConfigManager::getLogFilePath() const {
    return getValue<std::string>({"logging", "file_path"}, "");
}

bool ConfigManager::isAsyncLogging() const {
    return getValue<bool>({"logging", "async"}, false);
}

bool ConfigManager::isTelemetryEnabled() const {
    return getValue<bool>({"telemetry", "enabled"}, true);
}

int ConfigManager::getTelemetryFlushIntervalMs() const {
    return getValue<int>({"telemetry", "flush_interval_ms"}, 30000);
}

std::string ConfigManager::getTelemetryFilePath() const {
    return getValue<std::string>({"telemetry", "file_path"}, "");
}
