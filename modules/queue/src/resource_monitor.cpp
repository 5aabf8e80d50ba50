#include "resource_monitor.h"
#include "logger.h"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <string>

#include <sys/sysinfo.h>

namespace chunkflow {

namespace {

bool read_linux_cpu_times(uint64_t& idle_ticks, uint64_t& total_ticks) {
    std::ifstream stat("/proc/stat");
    if (!stat.is_open()) return false;
    std::string cpu;
    uint64_t user = 0, nice = 0, system = 0, idle = 0, iowait = 0, irq = 0, softirq = 0, steal = 0;
    stat >> cpu >> user >> nice >> system >> idle >> iowait >> irq >> softirq >> steal;
    if (cpu != "cpu") return false;
    idle_ticks = idle + iowait;
    total_ticks = user + nice + system + idle + iowait + irq + softirq + steal;
    return total_ticks > 0;
}

double clamp_fraction(double v) {
    return std::max(0.0, std::min(1.0, v));
}

} // namespace

std::optional<double> SystemResourceMonitor::memory_usage_from_meminfo(std::istream& meminfo) {
    uint64_t total_kb = 0;
    uint64_t available_kb = 0;
    bool have_total = false;
    bool have_available = false;

    std::string line;
    while (std::getline(meminfo, line) && !(have_total && have_available)) {
        std::istringstream fields(line);
        std::string key;
        uint64_t value = 0;
        if (!(fields >> key >> value)) continue;
        if (key == "MemTotal:") {
            total_kb = value;
            have_total = true;
        } else if (key == "MemAvailable:") {
            available_kb = value;
            have_available = true;
        }
    }
    if (!have_total || !have_available || total_kb == 0) return std::nullopt;
    return clamp_fraction(1.0 - static_cast<double>(available_kb) / static_cast<double>(total_kb));
}

ResourceSample SystemResourceMonitor::sample() {
    ResourceSample res;

    std::ifstream meminfo("/proc/meminfo");
    std::optional<double> memory;
    if (meminfo.is_open()) memory = memory_usage_from_meminfo(meminfo);
    if (memory) {
        res.memory_usage = *memory;
    } else {
        // Older kernels: free + buffers undercounts reclaimable cache
        struct sysinfo si{};
        if (sysinfo(&si) == 0 && si.totalram > 0) {
            const double total = static_cast<double>(si.totalram) * si.mem_unit;
            const double avail = static_cast<double>(si.freeram + si.bufferram) * si.mem_unit;
            res.memory_usage = clamp_fraction((total - avail) / total);
        }
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    uint64_t idle = 0, total = 0;
    if (read_linux_cpu_times(idle, total)) {
        if (m_last_total > 0 && total > m_last_total) {
            const uint64_t d_total = total - m_last_total;
            const uint64_t d_idle = idle - m_last_idle;
            if (d_total >= d_idle) {
                res.cpu_usage = static_cast<double>(d_total - d_idle) / static_cast<double>(d_total);
            }
        }
        m_last_idle = idle;
        m_last_total = total;
    } else {
        LOG_DEBUG("QO: /proc/stat unavailable, reporting cpu usage 0");
    }
    return res;
}

} // namespace chunkflow
