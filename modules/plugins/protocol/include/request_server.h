#pragma once

#include "byte_stream.h"
#include "event_thread_pool.h"
#include "wire_protocol.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace ferry::rpc {

// Server side of one exchange. The body must be consumed before responding.
class ServerExchange {
public:
    ServerExchange(std::shared_ptr<ByteStream> stream, wire::RequestHead request,
                   std::chrono::milliseconds io_timeout);

    const wire::RequestHead& request() const { return m_request; }

    // Returns 0 once the declared body is exhausted. Throws ConnectionError on a broken stream.
    size_t read_body(uint8_t* buf, size_t len);
    // Throws ProtocolError(413) when the body is larger than limit.
    std::string read_body_all(int64_t limit);
    // Reads and discards whatever is left of the request body.
    void drain_body();

    void respond(int status, const std::string& body,
                 const std::map<std::string, std::string>& headers = {});
    void begin_response(int status, int64_t content_length,
                        const std::map<std::string, std::string>& headers = {});
    void write(const void* data, size_t len);

    bool responded() const { return m_responded; }

private:
    std::shared_ptr<ByteStream> m_stream;
    wire::RequestHead m_request;
    std::chrono::milliseconds m_io_timeout;
    int64_t m_body_remaining;
    bool m_responded = false;
};

class RequestHandler {
public:
    virtual ~RequestHandler() = default;
    virtual void handle(ServerExchange& exchange) = 0;
};

/**
 * Generic request/response server over any StreamAcceptor.
 * Each accepted stream carries one request and is handled on the worker pool.
 * Handler exceptions become status codes; nothing escapes the accept loop.
 *
 * serve() may run on several threads at once, one per acceptor. shutdown()
 * (and the destructor) runs every queued request to completion and joins the
 * workers, so no handler outlives the server.
 */
class RequestServer {
public:
    RequestServer(std::shared_ptr<RequestHandler> handler, std::chrono::milliseconds io_timeout,
                  size_t num_workers);
    ~RequestServer();

    RequestServer(const RequestServer&) = delete;
    RequestServer& operator=(const RequestServer&) = delete;

    // Blocks until the acceptor closes or stop() is called.
    void serve(StreamAcceptor& acceptor);
    // Ends every serve() loop. Requests already accepted keep running.
    void stop();
    // stop(), then drain the pool and join its workers.
    void shutdown();

    // Waits for in-flight requests to finish. Returns false on timeout.
    bool wait_idle(std::chrono::milliseconds timeout);

    static int status_for(const std::exception& e);

private:
    void handle_stream(std::shared_ptr<ByteStream> stream);

    std::shared_ptr<RequestHandler> m_handler;
    std::chrono::milliseconds m_io_timeout;
    std::atomic<bool> m_stopped{false};
    EventThreadPool m_pool;
};

} // namespace ferry::rpc
