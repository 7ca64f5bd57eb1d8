#include "request_server.h"
#include "errors.h"
#include "logger.h"

#include <algorithm>
#include <vector>

namespace ferry::rpc {

namespace {
constexpr auto kAcceptPoll = std::chrono::milliseconds(500);
}

ServerExchange::ServerExchange(std::shared_ptr<ByteStream> stream, wire::RequestHead request,
                               std::chrono::milliseconds io_timeout)
    : m_stream(std::move(stream)),
      m_request(std::move(request)),
      m_io_timeout(io_timeout),
      m_body_remaining(std::max<int64_t>(0, m_request.content_length)) {}

size_t ServerExchange::read_body(uint8_t* buf, size_t len) {
    if (m_body_remaining == 0 || len == 0) {
        return 0;
    }
    size_t want = static_cast<size_t>(std::min<int64_t>(m_body_remaining, static_cast<int64_t>(len)));
    size_t n = 0;
    IoStatus status = m_stream->read(buf, want, n, m_io_timeout);
    if (status != IoStatus::Ok) {
        throw ConnectionError("request body truncated, " + std::to_string(m_body_remaining) + " bytes missing");
    }
    m_body_remaining -= static_cast<int64_t>(n);
    return n;
}

std::string ServerExchange::read_body_all(int64_t limit) {
    if (m_body_remaining > limit) {
        throw ProtocolError(wire::kStatusTooLarge, "request body exceeds " + std::to_string(limit) + " bytes");
    }
    std::string body(static_cast<size_t>(m_body_remaining), '\0');
    size_t off = 0;
    while (m_body_remaining > 0) {
        off += read_body(reinterpret_cast<uint8_t*>(&body[off]), body.size() - off);
    }
    return body;
}

void ServerExchange::drain_body() {
    std::vector<uint8_t> scratch(64 * 1024);
    while (read_body(scratch.data(), scratch.size()) > 0) {
    }
}

void ServerExchange::respond(int status, const std::string& body,
                             const std::map<std::string, std::string>& headers) {
    begin_response(status, static_cast<int64_t>(body.size()), headers);
    if (!body.empty()) {
        write(body.data(), body.size());
    }
}

void ServerExchange::begin_response(int status, int64_t content_length,
                                    const std::map<std::string, std::string>& headers) {
    wire::ResponseHead head;
    head.status = status;
    head.headers = headers;
    head.content_length = content_length;
    m_responded = true;
    wire::write_response_head(*m_stream, head);
}

void ServerExchange::write(const void* data, size_t len) {
    wire::write_all(*m_stream, data, len);
}

RequestServer::RequestServer(std::shared_ptr<RequestHandler> handler, std::chrono::milliseconds io_timeout,
                             size_t num_workers)
    : m_handler(std::move(handler)), m_io_timeout(io_timeout), m_pool(num_workers) {}

RequestServer::~RequestServer() {
    shutdown();
}

void RequestServer::stop() {
    m_stopped = true;
}

void RequestServer::shutdown() {
    stop();
    m_pool.shutdown();
}

bool RequestServer::wait_idle(std::chrono::milliseconds timeout) {
    return m_pool.wait_idle(timeout);
}

int RequestServer::status_for(const std::exception& e) {
    if (const auto* fe = dynamic_cast<const FerryError*>(&e)) {
        switch (fe->category()) {
            case ErrorCategory::PathSafety:
                return wire::kStatusForbidden;
            case ErrorCategory::Protocol: {
                int status = static_cast<const ProtocolError*>(fe)->status();
                return status >= 400 ? status : wire::kStatusBadRequest;
            }
            case ErrorCategory::Configuration:
                return wire::kStatusBadRequest;
            default:
                return wire::kStatusInternalError;
        }
    }
    return wire::kStatusInternalError;
}

void RequestServer::serve(StreamAcceptor& acceptor) {
    LOG_DEBUG("RPC: serving " + acceptor.local_address());
    while (!m_stopped && !acceptor.is_closed()) {
        auto stream = acceptor.accept(kAcceptPoll);
        if (!stream) {
            continue;
        }
        if (!m_pool.submit_any([this, stream] { handle_stream(stream); })) {
            LOG_DEBUG("RPC: server shutting down, dropping stream");
            stream->close();
            break;
        }
    }
    LOG_DEBUG("RPC: stopped serving " + acceptor.local_address());
}

void RequestServer::handle_stream(std::shared_ptr<ByteStream> stream) {
    std::shared_ptr<RequestHandler> handler = m_handler;
    try {
        wire::RequestHead head = wire::read_request_head(*stream, m_io_timeout);
        ServerExchange exchange(stream, std::move(head), m_io_timeout);
        try {
            handler->handle(exchange);
            if (!exchange.responded()) {
                exchange.respond(wire::kStatusOk, "");
            }
        } catch (const ConnectionError& e) {
            LOG_DEBUG(std::string("RPC: stream broke during ") + exchange.request().action + ": " + e.what());
        } catch (const std::exception& e) {
            int status = status_for(e);
            LOG_WARN("RPC: " + exchange.request().method + " " + exchange.request().action + " failed (" +
                     std::to_string(status) + "): " + e.what());
            if (!exchange.responded()) {
                exchange.respond(status, e.what());
            }
        }
    } catch (const std::exception& e) {
        LOG_DEBUG(std::string("RPC: dropping stream: ") + e.what());
    }
    stream->close();
}

} // namespace ferry::rpc
