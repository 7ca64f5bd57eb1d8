#pragma once

#include "byte_stream.h"
#include "mux_frame.h"
#include "settings.h"
#include "transport_session.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace ferry::mux {

class MuxSession;

// One logical stream inside a MuxSession, flow-controlled independently.
class MuxStream : public ByteStream {
public:
    MuxStream(uint32_t id, std::weak_ptr<MuxSession> session, const MuxConfig& config);
    ~MuxStream() override;

    IoStatus read(uint8_t* buf, size_t len, size_t& n, std::chrono::milliseconds timeout) override;
    bool write(const uint8_t* data, size_t len) override;
    void close() override;
    uint32_t id() const override { return m_id; }

    // Called from the session's receive loop
    void push_data(std::vector<uint8_t>&& data);
    void on_fin();
    void on_update(uint32_t consumed, uint32_t window);
    void on_session_closed();

private:
    const uint32_t m_id;
    std::weak_ptr<MuxSession> m_session;
    const size_t m_max_frame;
    const uint32_t m_window;

    std::mutex m_mutex;
    std::condition_variable m_read_cv;
    std::condition_variable m_write_cv;

    std::deque<std::vector<uint8_t>> m_chunks;
    size_t m_chunk_offset = 0;
    uint32_t m_consumed = 0;
    uint32_t m_consumed_reported = 0;

    uint32_t m_sent = 0;
    uint32_t m_peer_consumed = 0;
    uint32_t m_peer_window;

    bool m_fin_received = false;
    bool m_local_closed = false;
    bool m_session_closed = false;
};

/**
 * Many independent byte streams over one TransportSession.
 * Closing the session closes every stream on it.
 */
class MuxSession : public std::enable_shared_from_this<MuxSession> {
public:
    static std::shared_ptr<MuxSession> client(std::shared_ptr<transport::TransportSession> conn, const MuxConfig& config);
    static std::shared_ptr<MuxSession> server(std::shared_ptr<transport::TransportSession> conn, const MuxConfig& config);

    ~MuxSession();

    MuxSession(const MuxSession&) = delete;
    MuxSession& operator=(const MuxSession&) = delete;

    // nullptr when the session is closed
    std::shared_ptr<MuxStream> open_stream();
    // nullptr on timeout or when the session is closed
    std::shared_ptr<MuxStream> accept_stream(std::chrono::milliseconds timeout);

    void close();
    bool is_closed() const { return m_closed.load(); }
    size_t stream_count() const;
    std::string remote_address() const;

    bool write_frame(FrameCmd cmd, uint32_t stream_id, const uint8_t* payload, size_t len);
    void stream_closed(uint32_t stream_id);

private:
    MuxSession(std::shared_ptr<transport::TransportSession> conn, const MuxConfig& config, bool is_client);

    void start();
    void recv_loop();
    void keepalive_loop();
    bool read_full(uint8_t* buf, size_t len);
    void handle_frame(const FrameHeader& header, std::vector<uint8_t>&& payload);

    std::shared_ptr<transport::TransportSession> m_conn;
    MuxConfig m_config;
    const bool m_is_client;

    std::atomic<bool> m_closed{false};
    std::mutex m_write_mutex;

    mutable std::mutex m_streams_mutex;
    std::unordered_map<uint32_t, std::shared_ptr<MuxStream>> m_streams;
    uint32_t m_next_id;

    std::mutex m_accept_mutex;
    std::condition_variable m_accept_cv;
    std::deque<std::shared_ptr<MuxStream>> m_accept_queue;

    std::atomic<int64_t> m_last_recv_ms{0};
    std::mutex m_keepalive_mutex;
    std::condition_variable m_keepalive_cv;

    std::thread m_recv_thread;
    std::thread m_keepalive_thread;
};

} // namespace ferry::mux
