#include "transport_session.h"
#include "logger.h"

#include <algorithm>

namespace ferry::transport {

namespace {
constexpr uint32_t kCloseLingerMs = 2000;
}

TransportSession::TransportSession(uint32_t conv, std::string remote, const TransportTuning& tuning,
                                   int arq_mtu, DatagramSender sender)
    : m_conv(conv),
      m_remote(std::move(remote)),
      m_arq(conv, tuning, arq_mtu, std::move(sender)),
      m_max_backlog(2 * static_cast<size_t>(std::max(1, tuning.send_window))) {}

IoStatus TransportSession::read(uint8_t* buf, size_t len, size_t& n, std::chrono::milliseconds timeout) {
    n = 0;
    std::unique_lock<std::mutex> lock(m_mutex);
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (m_arq.readable() == 0) {
        if (m_closed) {
            return IoStatus::Closed;
        }
        if (m_readable.wait_until(lock, deadline) == std::cv_status::timeout && m_arq.readable() == 0) {
            return m_closed ? IoStatus::Closed : IoStatus::Timeout;
        }
    }
    n = m_arq.recv(buf, len);
    return IoStatus::Ok;
}

bool TransportSession::write(const uint8_t* data, size_t len) {
    std::unique_lock<std::mutex> lock(m_mutex);
    // Feed in window-sized slices so a large write never balloons the queue
    const size_t slice = m_arq.mss() * 64;
    while (len > 0) {
        m_writable.wait(lock, [this] { return m_closed || m_arq.wait_send() < m_max_backlog; });
        if (m_closed) {
            return false;
        }
        size_t take = std::min(len, slice);
        m_arq.send(data, take);
        data += take;
        len -= take;
    }
    return true;
}

void TransportSession::close() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_closed.exchange(true)) {
        return;
    }
    m_readable.notify_all();
    m_writable.notify_all();
    LOG_DEBUG("ARQ: conv " + std::to_string(m_conv) + " to " + m_remote + " closed");
}

void TransportSession::fail(const std::string& reason) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_link_failed = true;
    if (!m_closed.exchange(true)) {
        LOG_WARN("ARQ: conv " + std::to_string(m_conv) + " to " + m_remote + " failed: " + reason);
    }
    m_readable.notify_all();
    m_writable.notify_all();
}

void TransportSession::on_input(const uint8_t* data, size_t len, uint32_t now_ms) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_link_failed) {
        return;
    }
    m_arq.update(now_ms);
    if (!m_arq.input(data, len)) {
        LOG_DEBUG("ARQ: malformed segment from " + m_remote);
        return;
    }
    // Acknowledge immediately instead of waiting for the next interval
    m_arq.flush();
    if (m_arq.readable() > 0) {
        m_readable.notify_all();
    }
    if (m_arq.wait_send() < m_max_backlog) {
        m_writable.notify_all();
    }
}

void TransportSession::tick(uint32_t now_ms) {
    bool dead = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_link_failed) {
            return;
        }
        m_arq.update(now_ms);
        dead = m_arq.dead();
    }
    if (dead) {
        fail("retransmission limit reached");
    }
}

bool TransportSession::finished(uint32_t now_ms) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_closed) {
        return false;
    }
    if (m_link_failed || m_arq.wait_send() == 0) {
        return true;
    }
    if (!m_linger_armed) {
        m_linger_armed = true;
        m_linger_deadline = now_ms + kCloseLingerMs;
    }
    return static_cast<int32_t>(now_ms - m_linger_deadline) >= 0;
}

} // namespace ferry::transport
