#include "event_thread_pool.h"
#include "logger.h"

#include <algorithm>

namespace ferry {

EventThreadPool::EventThreadPool(size_t num_workers)
    : m_num_workers(num_workers > 0 ? num_workers : std::max(1u, std::thread::hardware_concurrency())),
      m_queues(m_num_workers),
      m_queue_mutexes(m_num_workers),
      m_queue_cvs(m_num_workers),
      m_running(true),
      m_round_robin_counter(0),
      m_in_flight(0) {
    for (size_t i = 0; i < m_num_workers; ++i) {
        m_workers.emplace_back([this, i] { worker_loop(i); });
    }
}

EventThreadPool::~EventThreadPool() {
    shutdown();
}

bool EventThreadPool::enqueue(size_t worker_id, Task task) {
    {
        std::lock_guard<std::mutex> lock(m_queue_mutexes[worker_id]);
        if (!m_running) return false;
        ++m_in_flight;
        m_queues[worker_id].push(std::move(task));
    }
    m_queue_cvs[worker_id].notify_one();
    return true;
}

bool EventThreadPool::submit(const std::string& key, Task task) {
    return enqueue(get_worker_id(key), std::move(task));
}

bool EventThreadPool::submit_any(Task task) {
    size_t worker_id = m_round_robin_counter.fetch_add(1) % m_num_workers;
    return enqueue(worker_id, std::move(task));
}

void EventThreadPool::shutdown() {
    for (size_t i = 0; i < m_num_workers; ++i) {
        std::lock_guard<std::mutex> lock(m_queue_mutexes[i]);
        m_running = false;
    }
    for (auto& cv : m_queue_cvs) {
        cv.notify_all();
    }
    for (auto& worker : m_workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    m_workers.clear();
}

bool EventThreadPool::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_idle_mutex);
    return m_idle_cv.wait_for(lock, timeout, [this] { return m_in_flight.load() == 0; });
}

void EventThreadPool::finish_one() {
    if (m_in_flight.fetch_sub(1) == 1) {
        std::lock_guard<std::mutex> lock(m_idle_mutex);
        m_idle_cv.notify_all();
    }
}

void EventThreadPool::worker_loop(size_t worker_id) {
    while (true) {
        std::unique_lock<std::mutex> lock(m_queue_mutexes[worker_id]);
        m_queue_cvs[worker_id].wait(lock, [this, worker_id] {
            return !m_queues[worker_id].empty() || !m_running;
        });

        if (m_queues[worker_id].empty()) {
            if (!m_running) break;
            continue;
        }

        Task task = std::move(m_queues[worker_id].front());
        m_queues[worker_id].pop();
        lock.unlock();

        // Execute outside the lock; one failing job must not kill the worker
        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("POOL: background job failed: ") + e.what());
        }
        finish_one();
    }
}

size_t EventThreadPool::get_worker_id(const std::string& key) const {
    size_t hash_val = 0;
    for (char c : key) {
        hash_val = hash_val * 31 + static_cast<unsigned char>(c);
    }
    return hash_val % m_num_workers;
}

} // namespace ferry
