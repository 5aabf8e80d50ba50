#ifndef CHUNKFLOW_RESOURCE_MONITOR_H
#define CHUNKFLOW_RESOURCE_MONITOR_H

#include <cstdint>
#include <istream>
#include <mutex>
#include <optional>

namespace chunkflow {

// Fractions in [0, 1]
struct ResourceSample {
    double cpu_usage = 0.0;
    double memory_usage = 0.0;
};

class ResourceMonitor {
public:
    virtual ~ResourceMonitor() = default;
    virtual ResourceSample sample() = 0;
};

// CPU from /proc/stat deltas between calls, memory from MemAvailable in
// /proc/meminfo (sysinfo() when that is missing). The first CPU sample reads 0.
class SystemResourceMonitor : public ResourceMonitor {
public:
    ResourceSample sample() override;

    // 1 - MemAvailable / MemTotal, nullopt unless both fields are present
    static std::optional<double> memory_usage_from_meminfo(std::istream& meminfo);

private:
    std::mutex m_mutex;
    uint64_t m_last_idle = 0;
    uint64_t m_last_total = 0;
};

} // namespace chunkflow

#endif // CHUNKFLOW_RESOURCE_MONITOR_H
