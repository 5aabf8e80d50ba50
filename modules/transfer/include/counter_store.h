#ifndef CHUNKFLOW_COUNTER_STORE_H
#define CHUNKFLOW_COUNTER_STORE_H

#include "clock.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace chunkflow {

// Expiring integer counters. Production backends (a shared cache) implement
// this; the pipeline only needs the in-memory one.
class CounterStore {
public:
    virtual ~CounterStore() = default;

    // Add amount and return the new value. ttl of zero means no expiry.
    // The expiry is set when the counter is created and not extended.
    virtual int64_t increment(const std::string& key, std::chrono::seconds ttl, int64_t amount = 1) = 0;
    // Subtract one, floored at 0
    virtual int64_t decrement(const std::string& key) = 0;
    // 0 for a missing or expired key
    virtual int64_t get(const std::string& key) const = 0;
    // Drop every key starting with prefix (empty prefix = everything)
    virtual size_t reset(const std::string& prefix) = 0;
};

class InMemoryCounterStore : public CounterStore {
public:
    explicit InMemoryCounterStore(std::shared_ptr<Clock> clock = SystemClock::shared());

    int64_t increment(const std::string& key, std::chrono::seconds ttl, int64_t amount = 1) override;
    int64_t decrement(const std::string& key) override;
    int64_t get(const std::string& key) const override;
    size_t reset(const std::string& prefix) override;

    // Drop expired entries; returns how many were removed
    size_t purge_expired();
    size_t size() const;

private:
    struct Entry {
        int64_t value = 0;
        bool expires = false;
        SystemTime expires_at{};
    };

    bool is_expired(const Entry& e, SystemTime now) const {
        return e.expires && now >= e.expires_at;
    }

    std::shared_ptr<Clock> m_clock;
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, Entry> m_entries;
};

} // namespace chunkflow

#endif // CHUNKFLOW_COUNTER_STORE_H
