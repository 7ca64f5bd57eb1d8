#ifndef FERRY_EVENT_THREAD_POOL_H
#define FERRY_EVENT_THREAD_POOL_H

#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <vector>
#include <functional>
#include <memory>
#include <atomic>
#include <chrono>
#include <string>

namespace ferry {

/**
 * Background job pool.
 * Jobs submitted with the same key run on the same worker, in submission order.
 * The server runs its request handlers on one pool and work that must not
 * block a response (archive extraction, delayed deletes) on another.
 */
class EventThreadPool {
public:
    using Task = std::function<void()>;

    /**
     * num_workers: number of worker threads (0 = CPU count)
     */
    explicit EventThreadPool(size_t num_workers = 0);
    ~EventThreadPool();

    EventThreadPool(const EventThreadPool&) = delete;
    EventThreadPool& operator=(const EventThreadPool&) = delete;

    /**
     * Jobs with the same key are processed sequentially.
     * Returns false once the pool is shut down.
     */
    bool submit(const std::string& key, Task task);

    // Round-robin, no ordering requirement
    bool submit_any(Task task);

    /**
     * Stop accepting jobs. Queued jobs still run before the workers exit.
     */
    void shutdown();

    // Blocks until nothing is queued or running, or the timeout expires.
    bool wait_idle(std::chrono::milliseconds timeout);

    size_t worker_count() const { return m_num_workers; }
    size_t pending_tasks() const { return m_in_flight.load(); }

private:
    void worker_loop(size_t worker_id);
    size_t get_worker_id(const std::string& key) const;
    bool enqueue(size_t worker_id, Task task);
    void finish_one();

    size_t m_num_workers;
    std::vector<std::queue<Task>> m_queues;  // One queue per worker
    std::vector<std::mutex> m_queue_mutexes;
    std::vector<std::condition_variable> m_queue_cvs;
    std::vector<std::thread> m_workers;
    std::atomic<bool> m_running;
    std::atomic<size_t> m_round_robin_counter;

    std::atomic<size_t> m_in_flight;
    std::mutex m_idle_mutex;
    std::condition_variable m_idle_cv;
};

} // namespace ferry

#endif // FERRY_EVENT_THREAD_POOL_H
