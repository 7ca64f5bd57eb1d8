#include "mux_session.h"
#include "logger.h"

#include <algorithm>
#include <cstring>

namespace ferry::mux {

namespace {

constexpr size_t kAcceptBacklog = 1024;
constexpr auto kReadPoll = std::chrono::milliseconds(1000);

int64_t steady_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

void put_u32(uint8_t* p, uint32_t v) {
    p[0] = static_cast<uint8_t>(v);
    p[1] = static_cast<uint8_t>(v >> 8);
    p[2] = static_cast<uint8_t>(v >> 16);
    p[3] = static_cast<uint8_t>(v >> 24);
}

uint32_t get_u32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

} // namespace

// ---------------------------------------------------------------------------
// MuxStream
// ---------------------------------------------------------------------------

MuxStream::MuxStream(uint32_t id, std::weak_ptr<MuxSession> session, const MuxConfig& config)
    : m_id(id),
      m_session(std::move(session)),
      m_max_frame(std::clamp<size_t>(static_cast<size_t>(config.max_frame_size), 1024, kMaxFramePayload)),
      m_window(static_cast<uint32_t>(std::max(config.max_stream_buffer, 64 * 1024))),
      m_peer_window(m_window) {}

MuxStream::~MuxStream() = default;

IoStatus MuxStream::read(uint8_t* buf, size_t len, size_t& n, std::chrono::milliseconds timeout) {
    n = 0;
    uint32_t report = 0;
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        bool ready = m_read_cv.wait_for(lock, timeout, [this] {
            return !m_chunks.empty() || m_fin_received || m_local_closed || m_session_closed;
        });
        if (m_chunks.empty()) {
            if (m_local_closed || m_session_closed) return IoStatus::Closed;
            if (m_fin_received) return IoStatus::Eof;
            if (!ready) return IoStatus::Timeout;
        }

        while (n < len && !m_chunks.empty()) {
            auto& front = m_chunks.front();
            size_t take = std::min(len - n, front.size() - m_chunk_offset);
            std::memcpy(buf + n, front.data() + m_chunk_offset, take);
            n += take;
            m_chunk_offset += take;
            if (m_chunk_offset == front.size()) {
                m_chunks.pop_front();
                m_chunk_offset = 0;
            }
        }
        m_consumed += static_cast<uint32_t>(n);
        if (m_consumed - m_consumed_reported >= m_window / 2) {
            m_consumed_reported = m_consumed;
            report = m_consumed;
        }
    }

    if (report != 0) {
        if (auto session = m_session.lock()) {
            uint8_t payload[kUpdPayloadSize];
            put_u32(payload, report);
            put_u32(payload + 4, m_window);
            session->write_frame(FrameCmd::UPD, m_id, payload, sizeof(payload));
        }
    }
    return IoStatus::Ok;
}

bool MuxStream::write(const uint8_t* data, size_t len) {
    while (len > 0) {
        size_t take = 0;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_write_cv.wait(lock, [this] {
                return m_local_closed || m_session_closed || m_fin_received ||
                       static_cast<uint32_t>(m_sent - m_peer_consumed) < m_peer_window;
            });
            // A peer FIN closes the stream in both directions
            if (m_local_closed || m_session_closed || m_fin_received) {
                return false;
            }
            uint32_t room = m_peer_window - static_cast<uint32_t>(m_sent - m_peer_consumed);
            take = std::min({len, m_max_frame, static_cast<size_t>(room)});
            m_sent += static_cast<uint32_t>(take);
        }

        auto session = m_session.lock();
        if (!session || !session->write_frame(FrameCmd::PSH, m_id, data, take)) {
            return false;
        }
        data += take;
        len -= take;
    }
    return true;
}

void MuxStream::close() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_local_closed) {
            return;
        }
        m_local_closed = true;
    }
    m_read_cv.notify_all();
    m_write_cv.notify_all();

    if (auto session = m_session.lock()) {
        session->write_frame(FrameCmd::FIN, m_id, nullptr, 0);
        session->stream_closed(m_id);
    }
}

void MuxStream::push_data(std::vector<uint8_t>&& data) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_local_closed) {
            return;
        }
        m_chunks.push_back(std::move(data));
    }
    m_read_cv.notify_all();
}

void MuxStream::on_fin() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_fin_received = true;
    }
    m_read_cv.notify_all();
    m_write_cv.notify_all();
}

void MuxStream::on_update(uint32_t consumed, uint32_t window) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_peer_consumed = consumed;
        m_peer_window = window;
    }
    m_write_cv.notify_all();
}

void MuxStream::on_session_closed() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_session_closed = true;
    }
    m_read_cv.notify_all();
    m_write_cv.notify_all();
}

// ---------------------------------------------------------------------------
// MuxSession
// ---------------------------------------------------------------------------

std::shared_ptr<MuxSession> MuxSession::client(std::shared_ptr<transport::TransportSession> conn, const MuxConfig& config) {
    std::shared_ptr<MuxSession> session(new MuxSession(std::move(conn), config, true));
    session->start();
    return session;
}

std::shared_ptr<MuxSession> MuxSession::server(std::shared_ptr<transport::TransportSession> conn, const MuxConfig& config) {
    std::shared_ptr<MuxSession> session(new MuxSession(std::move(conn), config, false));
    session->start();
    return session;
}

MuxSession::MuxSession(std::shared_ptr<transport::TransportSession> conn, const MuxConfig& config, bool is_client)
    : m_conn(std::move(conn)),
      m_config(config),
      m_is_client(is_client),
      m_next_id(is_client ? 1 : 2) {}

MuxSession::~MuxSession() {
    close();
    for (auto* t : {&m_recv_thread, &m_keepalive_thread}) {
        if (!t->joinable()) continue;
        if (t->get_id() == std::this_thread::get_id()) {
            t->detach();
        } else {
            t->join();
        }
    }
}

void MuxSession::start() {
    m_last_recv_ms = steady_ms();
    m_recv_thread = std::thread(&MuxSession::recv_loop, this);
    m_keepalive_thread = std::thread(&MuxSession::keepalive_loop, this);
}

std::string MuxSession::remote_address() const {
    return m_conn->remote_address();
}

size_t MuxSession::stream_count() const {
    std::lock_guard<std::mutex> lock(m_streams_mutex);
    return m_streams.size();
}

std::shared_ptr<MuxStream> MuxSession::open_stream() {
    if (m_closed) {
        return nullptr;
    }
    std::shared_ptr<MuxStream> stream;
    {
        std::lock_guard<std::mutex> lock(m_streams_mutex);
        uint32_t id = m_next_id;
        m_next_id += 2;
        stream = std::make_shared<MuxStream>(id, weak_from_this(), m_config);
        m_streams[id] = stream;
    }
    if (!write_frame(FrameCmd::SYN, stream->id(), nullptr, 0)) {
        stream_closed(stream->id());
        return nullptr;
    }
    return stream;
}

std::shared_ptr<MuxStream> MuxSession::accept_stream(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_accept_mutex);
    m_accept_cv.wait_for(lock, timeout, [this] { return !m_accept_queue.empty() || m_closed; });
    if (m_accept_queue.empty()) {
        return nullptr;
    }
    auto stream = m_accept_queue.front();
    m_accept_queue.pop_front();
    return stream;
}

void MuxSession::close() {
    if (m_closed.exchange(true)) {
        return;
    }
    m_conn->close();

    std::unordered_map<uint32_t, std::shared_ptr<MuxStream>> streams;
    {
        std::lock_guard<std::mutex> lock(m_streams_mutex);
        streams.swap(m_streams);
    }
    for (auto& entry : streams) {
        entry.second->on_session_closed();
    }
    {
        std::lock_guard<std::mutex> lock(m_accept_mutex);
        for (auto& s : m_accept_queue) {
            s->on_session_closed();
        }
        m_accept_queue.clear();
    }
    m_accept_cv.notify_all();
    {
        std::lock_guard<std::mutex> lock(m_keepalive_mutex);
    }
    m_keepalive_cv.notify_all();
    LOG_DEBUG("MUX: session to " + m_conn->remote_address() + " closed");
}

bool MuxSession::write_frame(FrameCmd cmd, uint32_t stream_id, const uint8_t* payload, size_t len) {
    if (m_closed || len > kMaxFramePayload) {
        return false;
    }
    std::vector<uint8_t> frame(kFrameHeaderSize + len);
    FrameHeader header;
    header.cmd = cmd;
    header.length = static_cast<uint16_t>(len);
    header.stream_id = stream_id;
    encode_frame_header(header, frame.data());
    if (len > 0) {
        std::memcpy(frame.data() + kFrameHeaderSize, payload, len);
    }

    bool ok;
    {
        std::lock_guard<std::mutex> lock(m_write_mutex);
        ok = m_conn->write(frame.data(), frame.size());
    }
    if (!ok) {
        close();
    }
    return ok;
}

void MuxSession::stream_closed(uint32_t stream_id) {
    std::lock_guard<std::mutex> lock(m_streams_mutex);
    m_streams.erase(stream_id);
}

bool MuxSession::read_full(uint8_t* buf, size_t len) {
    size_t got = 0;
    while (got < len) {
        size_t n = 0;
        IoStatus status = m_conn->read(buf + got, len - got, n, kReadPoll);
        if (status == IoStatus::Ok) {
            got += n;
            m_last_recv_ms = steady_ms();
        } else if (status == IoStatus::Timeout) {
            if (m_closed) return false;
        } else {
            return false;
        }
    }
    return true;
}

void MuxSession::recv_loop() {
    uint8_t raw[kFrameHeaderSize];
    while (!m_closed) {
        if (!read_full(raw, sizeof(raw))) {
            break;
        }
        FrameHeader header;
        if (!decode_frame_header(raw, header)) {
            LOG_WARN("MUX: invalid frame header from " + m_conn->remote_address());
            break;
        }
        std::vector<uint8_t> payload(header.length);
        if (header.length > 0 && !read_full(payload.data(), payload.size())) {
            break;
        }
        handle_frame(header, std::move(payload));
    }
    close();
}

void MuxSession::handle_frame(const FrameHeader& header, std::vector<uint8_t>&& payload) {
    switch (header.cmd) {
        case FrameCmd::NOP:
            break;
        case FrameCmd::SYN: {
            std::shared_ptr<MuxStream> stream;
            {
                std::lock_guard<std::mutex> lock(m_streams_mutex);
                if (m_streams.count(header.stream_id) != 0) {
                    break;
                }
                stream = std::make_shared<MuxStream>(header.stream_id, weak_from_this(), m_config);
                m_streams[header.stream_id] = stream;
            }
            std::lock_guard<std::mutex> lock(m_accept_mutex);
            if (m_accept_queue.size() >= kAcceptBacklog) {
                LOG_WARN("MUX: accept backlog full, dropping stream " + std::to_string(header.stream_id));
                std::lock_guard<std::mutex> streams_lock(m_streams_mutex);
                m_streams.erase(header.stream_id);
                break;
            }
            m_accept_queue.push_back(stream);
            m_accept_cv.notify_one();
            break;
        }
        case FrameCmd::FIN:
        case FrameCmd::PSH:
        case FrameCmd::UPD: {
            std::shared_ptr<MuxStream> stream;
            {
                std::lock_guard<std::mutex> lock(m_streams_mutex);
                auto it = m_streams.find(header.stream_id);
                if (it != m_streams.end()) {
                    stream = it->second;
                }
            }
            if (!stream) {
                break;
            }
            if (header.cmd == FrameCmd::PSH) {
                stream->push_data(std::move(payload));
            } else if (header.cmd == FrameCmd::FIN) {
                stream->on_fin();
            } else if (payload.size() >= kUpdPayloadSize) {
                stream->on_update(get_u32(payload.data()), get_u32(payload.data() + 4));
            }
            break;
        }
    }
}

void MuxSession::keepalive_loop() {
    const auto interval = std::chrono::milliseconds(std::max(100, m_config.keepalive_interval_ms));
    const int64_t timeout_ms = std::max(m_config.keepalive_timeout_ms, m_config.keepalive_interval_ms);

    std::unique_lock<std::mutex> lock(m_keepalive_mutex);
    while (!m_closed) {
        m_keepalive_cv.wait_for(lock, interval, [this] { return m_closed.load(); });
        if (m_closed) {
            break;
        }
        lock.unlock();
        if (steady_ms() - m_last_recv_ms.load() > timeout_ms) {
            LOG_WARN("MUX: no traffic from " + m_conn->remote_address() + " for " +
                     std::to_string(timeout_ms) + " ms, closing session");
            close();
            lock.lock();
            break;
        }
        write_frame(FrameCmd::NOP, 0, nullptr, 0);
        lock.lock();
    }
}

} // namespace ferry::mux
