#include "progress_ticker.h"

namespace ferry::transfer {

ProgressTicker::ProgressTicker(int64_t total, int64_t already_done, std::chrono::milliseconds interval,
                               ProgressCallback callback)
    : m_total(total),
      m_base(already_done),
      m_interval(interval),
      m_callback(std::move(callback)),
      m_started(std::chrono::steady_clock::now()),
      m_done(already_done) {
    if (m_callback) {
        m_thread = std::thread(&ProgressTicker::run, this);
    }
}

ProgressTicker::~ProgressTicker() {
    stop(false);
}

double ProgressTicker::elapsed_seconds() const {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - m_started).count();
}

TransferProgress ProgressTicker::sample() const {
    TransferProgress p;
    p.bytes_done = m_done.load(std::memory_order_relaxed);
    p.total = m_total;
    p.fraction = m_total > 0 ? static_cast<double>(p.bytes_done) / static_cast<double>(m_total) : 1.0;
    if (p.fraction > 1.0) {
        p.fraction = 1.0;
    }
    double elapsed = elapsed_seconds();
    if (elapsed > 0) {
        p.bytes_per_second = static_cast<double>(p.bytes_done - m_base) / elapsed;
    }
    return p;
}

void ProgressTicker::run() {
    std::unique_lock<std::mutex> lock(m_mutex);
    while (!m_stopping) {
        if (m_cv.wait_for(lock, m_interval, [this] { return m_stopping; })) {
            break;
        }
        lock.unlock();
        m_callback(sample());
        lock.lock();
    }
}

void ProgressTicker::stop(bool report_final) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping) {
            return;
        }
        m_stopping = true;
    }
    m_cv.notify_all();
    if (m_thread.joinable()) {
        m_thread.join();
    }
    if (report_final && m_callback) {
        m_callback(sample());
    }
}

} // namespace ferry::transfer
