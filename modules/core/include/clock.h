#ifndef CHUNKFLOW_CLOCK_H
#define CHUNKFLOW_CLOCK_H

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace chunkflow {

using SystemTime = std::chrono::system_clock::time_point;

// Wall-clock source. Rate-limit buckets, expiry and progress timing read time
// through this so tests can move it explicitly.
class Clock {
public:
    virtual ~Clock() = default;
    virtual SystemTime now() const = 0;
};

class SystemClock : public Clock {
public:
    SystemTime now() const override { return std::chrono::system_clock::now(); }

    static std::shared_ptr<Clock> shared();
};

class ManualClock : public Clock {
public:
    explicit ManualClock(SystemTime start = std::chrono::system_clock::now()) : m_now(start) {}

    SystemTime now() const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_now;
    }

    template <typename Rep, typename Period>
    void advance(std::chrono::duration<Rep, Period> d) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_now += std::chrono::duration_cast<std::chrono::system_clock::duration>(d);
    }

    void set(SystemTime t) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_now = t;
    }

private:
    mutable std::mutex m_mutex;
    SystemTime m_now;
};

// strftime in UTC, e.g. format_utc(t, "%Y%m%d%H")
std::string format_utc(SystemTime t, const char* fmt);
// ISO-8601 UTC with a trailing Z
std::string to_iso8601(SystemTime t);

int64_t to_unix_ms(SystemTime t);
SystemTime from_unix_ms(int64_t ms);

inline double seconds_between(SystemTime from, SystemTime to) {
    return std::chrono::duration<double>(to - from).count();
}

} // namespace chunkflow

#endif // CHUNKFLOW_CLOCK_H
