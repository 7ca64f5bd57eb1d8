#pragma once

#include "key_derivation.h"
#include "mux_session.h"
#include "request_client.h"
#include "settings.h"
#include "udp_endpoint.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace ferry::rpc {

/**
 * One encrypted transport connection plus its multiplexed-stream context.
 * Closing it fails every in-flight stream immediately.
 */
class Session {
public:
    // Opens the transport and multiplexing layers. Returns nullptr if the socket cannot be set up.
    // No packet has been acknowledged yet: use Connector for a validated session.
    static std::shared_ptr<Session> dial(const std::string& host, uint16_t port, const crypto::Key& key,
                                         const TransportTuning& tuning, const MuxConfig& mux_config);

    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    void close();
    bool is_closed() const;

    const RequestClient& client() const { return m_client; }
    std::shared_ptr<mux::MuxSession> mux() const { return m_mux; }
    std::string remote_address() const { return m_remote; }

private:
    Session(std::unique_ptr<transport::UdpEndpoint> endpoint, std::shared_ptr<mux::MuxSession> mux,
            std::string remote);

    std::unique_ptr<transport::UdpEndpoint> m_endpoint;
    std::shared_ptr<mux::MuxSession> m_mux;
    RequestClient m_client;
    std::string m_remote;
    std::atomic<bool> m_closed{false};
};

enum class ConnectionState {
    DISCONNECTED,
    DIALING,
    AWAITING_HANDSHAKE_RESPONSE,
    CONNECTED,
    FAILED,
};

const char* connection_state_name(ConnectionState state);

/**
 * Dials a server and proves the key with a handshake probe.
 *
 * The dial and probe run on a background thread; the caller waits at most the
 * handshake timeout. Success and timeout race through a single-slot handoff:
 * whichever side loses is responsible for closing the session, so none leaks.
 * A wrong key and an unreachable server both surface as the same ConnectionError.
 */
class Connector {
public:
    using StateCallback = std::function<void(ConnectionState)>;

    Connector(TransportTuning tuning, MuxConfig mux_config, std::chrono::milliseconds handshake_timeout);

    void set_state_callback(StateCallback callback) { m_on_state = std::move(callback); }

    // Throws InvalidKeyError for an empty passphrase, ConnectionError on failure or timeout.
    std::shared_ptr<Session> connect(const std::string& address, const std::string& passphrase);

    ConnectionState state() const { return m_state.load(); }

private:
    void set_state(ConnectionState state);

    TransportTuning m_tuning;
    MuxConfig m_mux_config;
    std::chrono::milliseconds m_handshake_timeout;
    std::atomic<ConnectionState> m_state{ConnectionState::DISCONNECTED};
    StateCallback m_on_state;
};

inline constexpr const char* kHandshakeFailedMessage = "connection timeout (server unreachable or wrong key)";

} // namespace ferry::rpc
