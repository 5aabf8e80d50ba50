#include "counter_store.h"

#include <algorithm>

namespace chunkflow {

InMemoryCounterStore::InMemoryCounterStore(std::shared_ptr<Clock> clock)
    : m_clock(clock ? std::move(clock) : SystemClock::shared()) {}

int64_t InMemoryCounterStore::increment(const std::string& key, std::chrono::seconds ttl, int64_t amount) {
    const SystemTime now = m_clock->now();
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_entries.find(key);
    if (it == m_entries.end() || is_expired(it->second, now)) {
        Entry e;
        e.expires = ttl.count() > 0;
        e.expires_at = now + ttl;
        it = m_entries.insert_or_assign(key, e).first;
    }
    it->second.value += amount;
    return it->second.value;
}

int64_t InMemoryCounterStore::decrement(const std::string& key) {
    const SystemTime now = m_clock->now();
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_entries.find(key);
    if (it == m_entries.end() || is_expired(it->second, now)) {
        return 0;
    }
    it->second.value = std::max<int64_t>(0, it->second.value - 1);
    return it->second.value;
}

int64_t InMemoryCounterStore::get(const std::string& key) const {
    const SystemTime now = m_clock->now();
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_entries.find(key);
    if (it == m_entries.end() || is_expired(it->second, now)) {
        return 0;
    }
    return it->second.value;
}

size_t InMemoryCounterStore::reset(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t removed = 0;
    for (auto it = m_entries.begin(); it != m_entries.end(); ) {
        if (it->first.compare(0, prefix.size(), prefix) == 0) {
            it = m_entries.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t InMemoryCounterStore::purge_expired() {
    const SystemTime now = m_clock->now();
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t removed = 0;
    for (auto it = m_entries.begin(); it != m_entries.end(); ) {
        if (is_expired(it->second, now)) {
            it = m_entries.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t InMemoryCounterStore::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

} // namespace chunkflow
