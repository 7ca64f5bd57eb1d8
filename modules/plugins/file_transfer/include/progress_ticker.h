#ifndef FERRY_PROGRESS_TICKER_H
#define FERRY_PROGRESS_TICKER_H

#include "transfer_types.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace ferry::transfer {

/**
 * Samples an atomic byte counter at a fixed interval and reports it.
 * Workers only call add(); the callback runs on the ticker thread, plus once
 * more from stop() with the final figures.
 */
class ProgressTicker {
public:
    ProgressTicker(int64_t total, int64_t already_done, std::chrono::milliseconds interval, ProgressCallback callback);
    ~ProgressTicker();

    ProgressTicker(const ProgressTicker&) = delete;
    ProgressTicker& operator=(const ProgressTicker&) = delete;

    void add(int64_t bytes) { m_done.fetch_add(bytes, std::memory_order_relaxed); }
    int64_t transferred() const { return m_done.load() - m_base; }

    // Joins the ticker thread. With report_final, emits one last sample.
    void stop(bool report_final = true);

    double elapsed_seconds() const;

private:
    void run();
    TransferProgress sample() const;

    const int64_t m_total;
    const int64_t m_base;
    const std::chrono::milliseconds m_interval;
    ProgressCallback m_callback;
    const std::chrono::steady_clock::time_point m_started;

    std::atomic<int64_t> m_done;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_stopping = false;
    std::thread m_thread;
};

} // namespace ferry::transfer

#endif // FERRY_PROGRESS_TICKER_H
