#include "worker_pool.h"
#include "logger.h"

#include <algorithm>
#include <memory>
#include <stdexcept>

namespace chunkflow {

WorkerPool::WorkerPool(std::string name, size_t num_workers, size_t queue_capacity)
    : m_name(std::move(name)),
      m_num_workers(num_workers > 0 ? num_workers
                                    : std::max<size_t>(1, std::thread::hardware_concurrency())),
      m_capacity(queue_capacity),
      m_queues(m_num_workers),
      m_running(true),
      m_round_robin_counter(0) {

    for (size_t i = 0; i < m_num_workers; ++i) {
        m_workers.emplace_back([this, i] { worker_loop(i); });
    }
    LOG_DEBUG("POOL[" + m_name + "]: started " + std::to_string(m_num_workers) +
              " workers, capacity " + std::to_string(m_capacity));
}

WorkerPool::~WorkerPool() {
    shutdown(true);
}

std::future<void> WorkerPool::submit(const std::string& key, Task task) {
    return enqueue(get_worker_id(key), std::move(task));
}

std::future<void> WorkerPool::submit_any(Task task) {
    return enqueue(m_round_robin_counter.fetch_add(1) % m_num_workers, std::move(task));
}

bool WorkerPool::try_submit_any(Task task, std::future<void>& out) {
    if (!m_running) return false;

    const size_t worker_id = m_round_robin_counter.fetch_add(1) % m_num_workers;
    auto& q = m_queues[worker_id];

    auto packaged = std::make_shared<std::packaged_task<void()>>(std::move(task));
    {
        std::lock_guard<std::mutex> lock(q.mutex);
        if (!m_running || (m_capacity > 0 && q.tasks.size() >= m_capacity)) {
            return false;
        }
        out = packaged->get_future();
        q.tasks.push([packaged] { (*packaged)(); });
    }
    q.not_empty.notify_one();
    return true;
}

std::future<void> WorkerPool::enqueue(size_t worker_id, Task task) {
    auto& q = m_queues[worker_id];
    auto packaged = std::make_shared<std::packaged_task<void()>>(std::move(task));
    std::future<void> fut = packaged->get_future();

    {
        std::unique_lock<std::mutex> lock(q.mutex);
        // Backpressure: wait for room in this worker's queue.
        q.not_full.wait(lock, [this, &q] {
            return !m_running || m_capacity == 0 || q.tasks.size() < m_capacity;
        });
        if (!m_running) {
            throw std::runtime_error("WorkerPool " + m_name + " is shut down");
        }
        q.tasks.push([packaged] { (*packaged)(); });
    }
    q.not_empty.notify_one();
    return fut;
}

void WorkerPool::shutdown(bool blocking) {
    if (m_running.exchange(false)) {
        for (auto& q : m_queues) {
            // Lock so a worker cannot miss the wakeup between its check and wait.
            std::lock_guard<std::mutex> lock(q.mutex);
            q.not_empty.notify_all();
            q.not_full.notify_all();
        }
    }

    if (blocking) {
        for (auto& worker : m_workers) {
            if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
                worker.join();
            }
        }
    }
}

size_t WorkerPool::pending_tasks() const {
    size_t total = 0;
    for (size_t i = 0; i < m_num_workers; ++i) {
        const WorkerQueue& q = m_queues[i];
        std::lock_guard<std::mutex> lock(q.mutex);
        total += q.tasks.size();
    }
    return total;
}

void WorkerPool::worker_loop(size_t worker_id) {
    auto& q = m_queues[worker_id];
    while (true) {
        std::unique_lock<std::mutex> lock(q.mutex);
        q.not_empty.wait(lock, [this, &q] {
            return !q.tasks.empty() || !m_running;
        });

        // Drain remaining work before exiting.
        if (q.tasks.empty()) {
            break;
        }

        Task task = std::move(q.tasks.front());
        q.tasks.pop();
        lock.unlock();
        q.not_full.notify_one();

        // The packaged_task wrapper captures exceptions into the caller's future.
        task();
    }
}

size_t WorkerPool::get_worker_id(const std::string& key) const {
    // Consistent hashing: same key always goes to same worker
    size_t hash_val = 0;
    for (char c : key) {
        hash_val = hash_val * 31 + static_cast<unsigned char>(c);
    }
    return hash_val % m_num_workers;
}

} // namespace chunkflow
