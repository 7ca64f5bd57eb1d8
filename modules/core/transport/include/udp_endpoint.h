#ifndef FERRY_UDP_ENDPOINT_H
#define FERRY_UDP_ENDPOINT_H

#include "key_derivation.h"
#include "settings.h"
#include "transport_session.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace ferry::transport {

// Splits "host:port" or "[v6]:port". Returns false when the port is missing or invalid.
bool split_host_port(const std::string& address, std::string& host, uint16_t& port);

/**
 * Encrypted UDP socket plus the I/O thread that drives every session on it.
 *
 * A client endpoint is connected to one server and opens sessions itself.
 * A listening endpoint demultiplexes datagrams by (remote address, conversation)
 * and hands new sessions to accept(). Datagrams that fail authentication are
 * dropped without a reply, so a wrong key looks exactly like silence.
 */
class UdpEndpoint {
public:
    // Returns nullptr (and logs) when the address cannot be resolved or the socket fails.
    static std::unique_ptr<UdpEndpoint> connect(const std::string& host, uint16_t port,
                                                const crypto::Key& key, const TransportTuning& tuning);
    static std::unique_ptr<UdpEndpoint> listen(const std::string& bind_address, uint16_t port,
                                               const crypto::Key& key, const TransportTuning& tuning);

    ~UdpEndpoint();

    UdpEndpoint(const UdpEndpoint&) = delete;
    UdpEndpoint& operator=(const UdpEndpoint&) = delete;

    // Client endpoints only. Starts a new conversation with the server.
    std::shared_ptr<TransportSession> open_session();

    // Listening endpoints only. Returns nullptr on timeout or after close().
    std::shared_ptr<TransportSession> accept(std::chrono::milliseconds timeout);

    // Closes every session, gives queued data a short drain window, then stops the I/O thread.
    void close();

    uint16_t local_port() const;
    std::string local_address() const;
    size_t session_count() const;

private:
    class UdpImpl;
    explicit UdpEndpoint(std::unique_ptr<UdpImpl> impl);
    std::unique_ptr<UdpImpl> m_impl;
};

} // namespace ferry::transport

#endif // FERRY_UDP_ENDPOINT_H
