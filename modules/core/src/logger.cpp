#include "logger.h"
#include <mutex>
#include <string>
#include <iostream>
#include <fstream>
#include <queue>
#include <thread>
#include <memory>
#include <condition_variable>
#include <atomic>
#include <chrono>
#include <ctime>
#include <cctype>
#include <cstdio>
#include <utility>

/**
 * @brief Tag prefixed to every line.
 */
static std::string g_sessionId = "chunkflow";

/**
 * @brief Protects the tag, level, callback and file sink.
 */
static std::mutex g_logMutex;

/**
 * @brief Global log level. Default: INFO (skips DEBUG messages)
 */
static std::atomic<LogLevel> g_log_level(LogLevel::INFO);

static std::function<void(const std::string&)> g_log_callback;
static std::ofstream g_log_file;

/**
 * @brief Async logging state
 */
static std::atomic<bool> g_async_logging_enabled(false);
static std::queue<std::string> g_log_queue;
static std::mutex g_log_queue_mutex;
static std::condition_variable g_log_queue_cv;
static std::atomic<bool> g_log_thread_running(false);
static std::unique_ptr<std::thread> g_log_thread;

static std::string format_timestamp() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t t = system_clock::to_time_t(now);
    const auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm_buf);

    char out[48];
    std::snprintf(out, sizeof(out), "%s.%03d", buf, static_cast<int>(ms));
    return out;
}

/**
 * @brief Writes one formatted line to every sink.
 * Caller must hold g_logMutex.
 */
static void emit_line_locked(const std::string& line) {
    std::cerr << line << std::endl;
    if (g_log_file.is_open()) {
        g_log_file << line << '\n';
        g_log_file.flush();
    }
    if (g_log_callback) {
        g_log_callback(line);
    }
}

void setSessionId(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_sessionId = session_id;
}

void setLogCallback(std::function<void(const std::string&)> callback) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_log_callback = std::move(callback);
}

bool setLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    if (g_log_file.is_open()) {
        g_log_file.close();
    }
    if (path.empty()) {
        return true;
    }
    g_log_file.open(path, std::ios::out | std::ios::app);
    if (!g_log_file.is_open()) {
        std::cerr << "ERROR: Failed to open log file: " << path << std::endl;
        return false;
    }
    return true;
}

void set_log_level(LogLevel level) {
    g_log_level.store(level);
}

LogLevel get_log_level() {
    return g_log_level.load();
}

LogLevel log_level_from_string(const std::string& value) {
    std::string v = value;
    for (auto& c : v) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    if (v == "debug") return LogLevel::DEBUG;
    if (v == "info") return LogLevel::INFO;
    if (v == "warn" || v == "warning") return LogLevel::WARNING;
    if (v == "error") return LogLevel::ERROR;
    if (v == "none") return LogLevel::NONE;
    return LogLevel::INFO;
}

/**
 * @brief Background writer for async mode.
 * Swaps out the whole queue per wakeup and drains it before exiting.
 */
static void async_log_worker() {
    std::queue<std::string> batch;
    for (;;) {
        {
            std::unique_lock<std::mutex> lock(g_log_queue_mutex);
            g_log_queue_cv.wait(lock, [] { return !g_log_queue.empty() || !g_log_thread_running; });
            if (g_log_queue.empty() && !g_log_thread_running) return;
            std::swap(batch, g_log_queue);
        }

        std::lock_guard<std::mutex> sink_lock(g_logMutex);
        for (; !batch.empty(); batch.pop()) {
            emit_line_locked(batch.front());
        }
    }
}

void enable_async_logging() {
    if (g_async_logging_enabled.exchange(true)) return;

    g_log_thread_running = true;
    g_log_thread = std::make_unique<std::thread>(async_log_worker);
}

void disable_async_logging() {
    if (!g_async_logging_enabled) return;

    g_log_thread_running = false;
    g_log_queue_cv.notify_all();

    if (g_log_thread && g_log_thread->joinable()) {
        g_log_thread->join();
    }
    g_log_thread.reset();

    g_async_logging_enabled = false;
}

bool is_async_logging_enabled() {
    return g_async_logging_enabled.load();
}

static const char* level_label(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR:   return "ERROR";
        case LogLevel::NONE:    break;
    }
    return "";
}

static void write_line(const char* label, const std::string& message) {
    std::string line = format_timestamp();
    {
        std::lock_guard<std::mutex> lock(g_logMutex);
        line += " [" + g_sessionId + "]";
    }
    if (label[0] != '\0') {
        line += " ";
        line += label;
    }
    line += " " + message;

    if (!is_async_logging_enabled()) {
        std::lock_guard<std::mutex> lock(g_logMutex);
        emit_line_locked(line);
        return;
    }
    {
        std::lock_guard<std::mutex> lock(g_log_queue_mutex);
        g_log_queue.push(std::move(line));
    }
    g_log_queue_cv.notify_one();
}

void nativeLog(const std::string& message) {
    write_line("", message);
}

void log_at(LogLevel level, const std::string& message) {
    write_line(level_label(level), message);
}
