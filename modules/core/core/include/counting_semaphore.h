#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace ferry {

// Admission control only: no fairness beyond the order waiters wake in.
class CountingSemaphore {
public:
    explicit CountingSemaphore(int permits) : m_permits(permits) {}

    CountingSemaphore(const CountingSemaphore&) = delete;
    CountingSemaphore& operator=(const CountingSemaphore&) = delete;

    void acquire() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait(lock, [this] { return m_permits > 0; });
        --m_permits;
    }

    // Gives up when pred() turns true while waiting. Returns true if a permit was taken.
    template <typename Pred>
    bool acquire_unless(Pred pred, std::chrono::milliseconds poll = std::chrono::milliseconds(50)) {
        std::unique_lock<std::mutex> lock(m_mutex);
        while (m_permits <= 0) {
            if (pred()) {
                return false;
            }
            m_cv.wait_for(lock, poll);
        }
        if (pred()) {
            return false;
        }
        --m_permits;
        return true;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            ++m_permits;
        }
        m_cv.notify_one();
    }

    int available() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_permits;
    }

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    int m_permits;
};

// Releases on scope exit.
class SemaphoreGuard {
public:
    explicit SemaphoreGuard(CountingSemaphore& sem) : m_sem(sem) {}
    ~SemaphoreGuard() { m_sem.release(); }

    SemaphoreGuard(const SemaphoreGuard&) = delete;
    SemaphoreGuard& operator=(const SemaphoreGuard&) = delete;

private:
    CountingSemaphore& m_sem;
};

} // namespace ferry
