#include "session.h"
#include "errors.h"
#include "logger.h"

#include <condition_variable>
#include <mutex>
#include <thread>

namespace ferry::rpc {

// ---------------------------------------------------------------------------
// Session
// ---------------------------------------------------------------------------

std::shared_ptr<Session> Session::dial(const std::string& host, uint16_t port, const crypto::Key& key,
                                       const TransportTuning& tuning, const MuxConfig& mux_config) {
    auto endpoint = transport::UdpEndpoint::connect(host, port, key, tuning);
    if (!endpoint) {
        return nullptr;
    }
    auto conn = endpoint->open_session();
    if (!conn) {
        return nullptr;
    }
    auto mux = mux::MuxSession::client(conn, mux_config);
    return std::shared_ptr<Session>(new Session(std::move(endpoint), std::move(mux), conn->remote_address()));
}

Session::Session(std::unique_ptr<transport::UdpEndpoint> endpoint, std::shared_ptr<mux::MuxSession> mux,
                 std::string remote)
    : m_endpoint(std::move(endpoint)),
      m_mux(mux),
      m_client(mux),
      m_remote(std::move(remote)) {}

Session::~Session() {
    close();
}

void Session::close() {
    if (m_closed.exchange(true)) {
        return;
    }
    m_mux->close();
    m_endpoint->close();
    LOG_INFO("RPC: session to " + m_remote + " closed");
}

bool Session::is_closed() const {
    return m_closed.load() || m_mux->is_closed();
}

// ---------------------------------------------------------------------------
// Connector
// ---------------------------------------------------------------------------

const char* connection_state_name(ConnectionState state) {
    switch (state) {
        case ConnectionState::DISCONNECTED: return "disconnected";
        case ConnectionState::DIALING: return "dialing";
        case ConnectionState::AWAITING_HANDSHAKE_RESPONSE: return "awaiting_handshake_response";
        case ConnectionState::CONNECTED: return "connected";
        case ConnectionState::FAILED: return "failed";
    }
    return "unknown";
}

namespace {

// Single-slot handoff between the dial worker and the waiting caller.
struct HandoffSlot {
    std::mutex mutex;
    std::condition_variable cv;
    bool dialed = false;
    bool done = false;
    bool abandoned = false;
    std::shared_ptr<Session> session;
    std::string error;
};

// Any response byte proves the server could decrypt us, i.e. the key matches.
bool probe(Session& session, std::chrono::milliseconds timeout) {
    auto stream = session.mux()->open_stream();
    if (!stream) {
        return false;
    }
    wire::RequestHead head;
    head.method = "HEAD";
    head.action = "";
    wire::write_request_head(*stream, head);

    uint8_t byte = 0;
    size_t n = 0;
    IoStatus status = stream->read(&byte, 1, n, timeout);
    stream->close();
    return status == IoStatus::Ok && n == 1;
}

} // namespace

Connector::Connector(TransportTuning tuning, MuxConfig mux_config, std::chrono::milliseconds handshake_timeout)
    : m_tuning(tuning), m_mux_config(mux_config), m_handshake_timeout(handshake_timeout) {}

void Connector::set_state(ConnectionState state) {
    m_state = state;
    LOG_DEBUG(std::string("RPC: connection state -> ") + connection_state_name(state));
    if (m_on_state) {
        m_on_state(state);
    }
}

std::shared_ptr<Session> Connector::connect(const std::string& address, const std::string& passphrase) {
    crypto::Key key = crypto::derive_key(passphrase);

    std::string host;
    uint16_t port = 0;
    if (!transport::split_host_port(address, host, port)) {
        set_state(ConnectionState::FAILED);
        throw ConnectionError("invalid server address: " + address);
    }

    set_state(ConnectionState::DIALING);
    auto deadline = std::chrono::steady_clock::now() + m_handshake_timeout;
    auto slot = std::make_shared<HandoffSlot>();
    TransportTuning tuning = m_tuning;
    MuxConfig mux_config = m_mux_config;
    std::chrono::milliseconds probe_timeout = m_handshake_timeout;

    std::thread([slot, host, port, key, tuning, mux_config, probe_timeout] {
        std::shared_ptr<Session> session;
        std::string error;
        try {
            session = Session::dial(host, port, key, tuning, mux_config);
            if (!session) {
                error = "cannot open transport to " + host + ":" + std::to_string(port);
            } else {
                {
                    std::lock_guard<std::mutex> lock(slot->mutex);
                    slot->dialed = true;
                }
                slot->cv.notify_all();
                if (!probe(*session, probe_timeout)) {
                    error = kHandshakeFailedMessage;
                }
            }
        } catch (const std::exception& e) {
            error = e.what();
        }
        if (!error.empty() && session) {
            session->close();
            session.reset();
        }

        std::unique_lock<std::mutex> lock(slot->mutex);
        if (slot->abandoned) {
            // The caller already gave up; the session is ours to dispose of
            lock.unlock();
            if (session) {
                LOG_DEBUG("RPC: handshake finished after timeout, closing late session");
                session->close();
            }
            return;
        }
        slot->session = std::move(session);
        slot->error = std::move(error);
        slot->done = true;
        slot->cv.notify_all();
    }).detach();

    std::unique_lock<std::mutex> lock(slot->mutex);
    if (slot->cv.wait_until(lock, deadline, [&] { return slot->dialed || slot->done; }) && !slot->done) {
        lock.unlock();
        set_state(ConnectionState::AWAITING_HANDSHAKE_RESPONSE);
        lock.lock();
    }
    slot->cv.wait_until(lock, deadline, [&] { return slot->done; });

    if (!slot->done) {
        slot->abandoned = true;
        lock.unlock();
        set_state(ConnectionState::FAILED);
        LOG_WARN("RPC: no handshake response from " + address + " within " +
                 std::to_string(m_handshake_timeout.count()) + " ms");
        throw ConnectionError(kHandshakeFailedMessage);
    }

    std::shared_ptr<Session> session = std::move(slot->session);
    std::string error = slot->error;
    lock.unlock();

    if (!session) {
        set_state(ConnectionState::FAILED);
        LOG_WARN("RPC: connect to " + address + " failed: " + error);
        throw ConnectionError(error.empty() ? kHandshakeFailedMessage : error);
    }
    set_state(ConnectionState::CONNECTED);
    LOG_INFO("RPC: connected to " + address);
    return session;
}

} // namespace ferry::rpc
