#include "request_client.h"
#include "errors.h"
#include "logger.h"

#include <algorithm>

namespace ferry::rpc {

ClientExchange::ClientExchange(std::shared_ptr<ByteStream> stream, std::chrono::milliseconds io_timeout,
                               CancellationToken* cancel)
    : m_stream(std::move(stream)),
      m_io_timeout(io_timeout),
      m_cancel(cancel),
      m_subscription(cancel, [s = m_stream] { s->close(); }) {}

ClientExchange::~ClientExchange() {
    m_stream->close();
}

void ClientExchange::close() {
    m_stream->close();
}

void ClientExchange::rethrow() const {
    if (m_cancel && m_cancel->is_canceled()) {
        throw CancellationError();
    }
    throw;
}

void ClientExchange::send_head(const wire::RequestHead& head) {
    try {
        wire::write_request_head(*m_stream, head);
    } catch (const ConnectionError&) {
        rethrow();
    }
}

void ClientExchange::write_body(const void* data, size_t len) {
    try {
        wire::write_all(*m_stream, data, len);
    } catch (const ConnectionError&) {
        rethrow();
    }
}

const wire::ResponseHead& ClientExchange::read_response_head() {
    if (!m_head_read) {
        try {
            m_head = wire::read_response_head(*m_stream, m_io_timeout);
        } catch (const ConnectionError&) {
            rethrow();
        }
        m_head_read = true;
        m_remaining = std::max<int64_t>(0, m_head.content_length);
    }
    return m_head;
}

size_t ClientExchange::read_body(uint8_t* buf, size_t len) {
    read_response_head();
    if (m_remaining == 0 || len == 0) {
        return 0;
    }
    size_t want = static_cast<size_t>(std::min<int64_t>(m_remaining, static_cast<int64_t>(len)));
    size_t n = 0;
    IoStatus status = m_stream->read(buf, want, n, m_io_timeout);
    if (status != IoStatus::Ok) {
        if (m_cancel && m_cancel->is_canceled()) {
            throw CancellationError();
        }
        if (status == IoStatus::Timeout) {
            throw ConnectionError("response body read timed out");
        }
        throw ConnectionError("stream ended with " + std::to_string(m_remaining) + " body bytes outstanding");
    }
    m_remaining -= static_cast<int64_t>(n);
    return n;
}

std::string ClientExchange::read_body_all() {
    read_response_head();
    std::string body(static_cast<size_t>(m_remaining), '\0');
    size_t off = 0;
    while (m_remaining > 0) {
        off += read_body(reinterpret_cast<uint8_t*>(&body[off]), body.size() - off);
    }
    return body;
}

RequestClient::RequestClient(std::shared_ptr<mux::MuxSession> session, std::chrono::milliseconds io_timeout)
    : m_session(std::move(session)), m_io_timeout(io_timeout) {}

std::unique_ptr<ClientExchange> RequestClient::open(CancellationToken* cancel) const {
    if (cancel) {
        cancel->throw_if_canceled();
    }
    auto stream = m_session->open_stream();
    if (!stream) {
        throw ConnectionError("session is closed");
    }
    return std::make_unique<ClientExchange>(stream, m_io_timeout, cancel);
}

Response RequestClient::call(wire::RequestHead head, const std::string& body, CancellationToken* cancel) const {
    return call(std::move(head), body, cancel, m_io_timeout);
}

Response RequestClient::call(wire::RequestHead head, const std::string& body, CancellationToken* cancel,
                             std::chrono::milliseconds timeout) const {
    auto exchange = open(cancel);
    exchange->set_io_timeout(timeout);
    head.content_length = static_cast<int64_t>(body.size());
    exchange->send_head(head);
    if (!body.empty()) {
        exchange->write_body(body.data(), body.size());
    }
    Response response;
    response.head = exchange->read_response_head();
    response.body = exchange->read_body_all();
    LOG_DEBUG("RPC: " + head.method + " " + head.action + " -> " + std::to_string(response.head.status));
    return response;
}

} // namespace ferry::rpc
