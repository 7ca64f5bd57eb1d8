#pragma once

#include "byte_stream.h"
#include "mux_session.h"

#include <memory>

namespace ferry::mux {

// Exposes the streams a peer opens on one MuxSession as a StreamAcceptor.
class MuxStreamAcceptor : public StreamAcceptor {
public:
    explicit MuxStreamAcceptor(std::shared_ptr<MuxSession> session) : m_session(std::move(session)) {}

    std::shared_ptr<ByteStream> accept(std::chrono::milliseconds timeout) override {
        return m_session->accept_stream(timeout);
    }

    void close() override { m_session->close(); }
    bool is_closed() const override { return m_session->is_closed(); }
    std::string local_address() const override { return "mux:" + m_session->remote_address(); }

private:
    std::shared_ptr<MuxSession> m_session;
};

} // namespace ferry::mux
