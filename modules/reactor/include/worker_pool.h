#ifndef CHUNKFLOW_WORKER_POOL_H
#define CHUNKFLOW_WORKER_POOL_H

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace chunkflow {

/**
 * Fixed set of worker threads, each fed by its own bounded queue.
 *
 * Keyed submissions hash to one worker, so tasks sharing a key run in order.
 * Unkeyed submissions are spread round-robin. When the chosen queue is full,
 * submit blocks until a slot frees up (backpressure); try_submit_any returns
 * false instead.
 *
 * Every submission returns a future. An exception thrown by the task is
 * stored in that future, never dropped.
 */
class WorkerPool {
public:
    using Task = std::function<void()>;

    /**
     * @param name Used in log lines
     * @param num_workers Worker threads (0 = hardware concurrency)
     * @param queue_capacity Max queued tasks per worker (0 = unbounded)
     */
    WorkerPool(std::string name, size_t num_workers, size_t queue_capacity);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * Submit a task routed by key (e.g. a session id).
     * Tasks with the same key are processed sequentially.
     * @throws std::runtime_error if the pool is shut down
     */
    std::future<void> submit(const std::string& key, Task task);

    /**
     * Submit a task with no ordering requirement.
     * @throws std::runtime_error if the pool is shut down
     */
    std::future<void> submit_any(Task task);

    /**
     * Non-blocking variant of submit_any.
     * @return false when the selected queue is full or the pool is stopped
     */
    bool try_submit_any(Task task, std::future<void>& out);

    /**
     * Stop accepting work. Already-queued tasks still run.
     * @param blocking wait for the workers to drain and exit
     */
    void shutdown(bool blocking = true);

    size_t worker_count() const { return m_num_workers; }
    size_t queue_capacity() const { return m_capacity; }
    size_t pending_tasks() const;
    bool is_running() const { return m_running.load(); }

private:
    struct WorkerQueue {
        std::queue<Task> tasks;
        mutable std::mutex mutex;
        std::condition_variable not_empty;
        std::condition_variable not_full;
    };

    std::future<void> enqueue(size_t worker_id, Task task);
    void worker_loop(size_t worker_id);
    size_t get_worker_id(const std::string& key) const;

    std::string m_name;
    size_t m_num_workers;
    size_t m_capacity;
    std::vector<WorkerQueue> m_queues;  // One queue per worker
    std::vector<std::thread> m_workers;
    std::atomic<bool> m_running;
    std::atomic<size_t> m_round_robin_counter;
};

} // namespace chunkflow

#endif // CHUNKFLOW_WORKER_POOL_H
