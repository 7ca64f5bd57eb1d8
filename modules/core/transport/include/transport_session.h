#pragma once

#include "arq_session.h"
#include "io_status.h"
#include "settings.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

namespace ferry::transport {

/**
 * One reliable, ordered byte stream to a remote UDP peer.
 *
 * User threads call read/write/close. The owning endpoint's I/O thread feeds
 * datagrams in through on_input() and drives timers through tick().
 */
class TransportSession {
public:
    using DatagramSender = std::function<void(const uint8_t* data, size_t len)>;

    TransportSession(uint32_t conv, std::string remote, const TransportTuning& tuning,
                     int arq_mtu, DatagramSender sender);

    TransportSession(const TransportSession&) = delete;
    TransportSession& operator=(const TransportSession&) = delete;

    // Blocks until at least one byte is readable, the session closes, or the timeout expires.
    IoStatus read(uint8_t* buf, size_t len, size_t& n, std::chrono::milliseconds timeout);

    // Queues all of data, blocking while the send backlog exceeds twice the send window.
    // Returns false if the session closed first.
    bool write(const uint8_t* data, size_t len);

    // Stops user I/O. Queued data keeps flushing until acknowledged or the linger expires.
    void close();
    bool is_closed() const { return m_closed.load(); }

    uint32_t conv() const { return m_conv; }
    const std::string& remote_address() const { return m_remote; }

    // I/O thread side
    void on_input(const uint8_t* data, size_t len, uint32_t now_ms);
    void tick(uint32_t now_ms);
    // True once closed and either drained or past the linger deadline
    bool finished(uint32_t now_ms);
    void fail(const std::string& reason);

private:
    const uint32_t m_conv;
    const std::string m_remote;

    mutable std::mutex m_mutex;
    std::condition_variable m_readable;
    std::condition_variable m_writable;
    ArqSession m_arq;
    size_t m_max_backlog;

    std::atomic<bool> m_closed{false};
    bool m_link_failed = false;
    bool m_linger_armed = false;
    uint32_t m_linger_deadline = 0;
};

} // namespace ferry::transport
