#pragma once

#include "byte_stream.h"
#include "cancellation.h"
#include "mux_session.h"
#include "wire_protocol.h"

#include <chrono>
#include <memory>
#include <string>

namespace ferry::rpc {

inline constexpr std::chrono::milliseconds kDefaultIoTimeout{60000};

/**
 * One request/response exchange on its own stream.
 * If a cancellation token is given, canceling it closes the stream and the
 * blocked call throws CancellationError instead of ConnectionError.
 */
class ClientExchange {
public:
    ClientExchange(std::shared_ptr<ByteStream> stream, std::chrono::milliseconds io_timeout,
                   CancellationToken* cancel);
    ~ClientExchange();

    ClientExchange(const ClientExchange&) = delete;
    ClientExchange& operator=(const ClientExchange&) = delete;

    void send_head(const wire::RequestHead& head);
    void write_body(const void* data, size_t len);

    const wire::ResponseHead& read_response_head();
    // Returns 0 once the declared body is exhausted.
    size_t read_body(uint8_t* buf, size_t len);
    std::string read_body_all();
    int64_t body_remaining() const { return m_remaining; }

    void set_io_timeout(std::chrono::milliseconds timeout) { m_io_timeout = timeout; }
    void close();

private:
    // Called from a catch block: rethrows, or throws CancellationError if the token fired.
    [[noreturn]] void rethrow() const;

    std::shared_ptr<ByteStream> m_stream;
    std::chrono::milliseconds m_io_timeout;
    CancellationToken* m_cancel;
    CancellationSubscription m_subscription;
    wire::ResponseHead m_head;
    bool m_head_read = false;
    int64_t m_remaining = 0;
};

struct Response {
    wire::ResponseHead head;
    std::string body;
};

// Opens a fresh stream per request on a multiplexed session.
class RequestClient {
public:
    explicit RequestClient(std::shared_ptr<mux::MuxSession> session,
                           std::chrono::milliseconds io_timeout = kDefaultIoTimeout);

    // Throws ConnectionError when the session is closed.
    std::unique_ptr<ClientExchange> open(CancellationToken* cancel = nullptr) const;

    // Buffered request. The response is returned whatever its status.
    Response call(wire::RequestHead head, const std::string& body = "",
                  CancellationToken* cancel = nullptr) const;
    Response call(wire::RequestHead head, const std::string& body, CancellationToken* cancel,
                  std::chrono::milliseconds timeout) const;

    bool is_open() const { return !m_session->is_closed(); }
    std::chrono::milliseconds io_timeout() const { return m_io_timeout; }

private:
    std::shared_ptr<mux::MuxSession> m_session;
    std::chrono::milliseconds m_io_timeout;
};

} // namespace ferry::rpc
