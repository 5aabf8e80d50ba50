#include "clock.h"

#include <ctime>

namespace chunkflow {

std::shared_ptr<Clock> SystemClock::shared() {
    static std::shared_ptr<Clock> instance = std::make_shared<SystemClock>();
    return instance;
}

std::string format_utc(SystemTime t, const char* fmt) {
    const std::time_t tt = std::chrono::system_clock::to_time_t(t);
    std::tm tm_buf{};
    gmtime_r(&tt, &tm_buf);
    char buf[64];
    const size_t n = std::strftime(buf, sizeof(buf), fmt, &tm_buf);
    return std::string(buf, n);
}

std::string to_iso8601(SystemTime t) {
    return format_utc(t, "%Y-%m-%dT%H:%M:%SZ");
}

int64_t to_unix_ms(SystemTime t) {
    using namespace std::chrono;
    return duration_cast<milliseconds>(t.time_since_epoch()).count();
}

SystemTime from_unix_ms(int64_t ms) {
    using namespace std::chrono;
    return SystemTime(duration_cast<system_clock::duration>(milliseconds(ms)));
}

} // namespace chunkflow
