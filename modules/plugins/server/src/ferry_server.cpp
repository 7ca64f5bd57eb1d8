#include "ferry_server.h"
#include "errors.h"
#include "key_derivation.h"
#include "logger.h"
#include "mux_stream_acceptor.h"
#include "request_client.h"

#include <filesystem>

namespace ferry::server {

namespace {
constexpr auto kAcceptPoll = std::chrono::milliseconds(500);
constexpr size_t kJobWorkers = 2;
constexpr size_t kRequestWorkers = 16;
}

FerryServer::FerryServer(ServerOptions options, std::string passphrase, TransportTuning tuning, MuxConfig mux_config)
    : m_options(std::move(options)),
      m_passphrase(std::move(passphrase)),
      m_tuning(tuning),
      m_mux_config(mux_config) {}

FerryServer::~FerryServer() {
    stop();
}

bool FerryServer::start() {
    if (m_running) {
        return true;
    }
    if (m_passphrase.empty()) {
        throw ConfigurationError("encryption key is required");
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(m_options.root_dir, ec)) {
        throw ConfigurationError("root directory does not exist: " + m_options.root_dir);
    }

    crypto::Key key = crypto::derive_key(m_passphrase);
    auto files = std::make_shared<FileService>(m_options.root_dir);
    m_jobs = std::make_shared<EventThreadPool>(kJobWorkers);
    m_requests = std::make_shared<rpc::RequestServer>(std::make_shared<FileRequestHandler>(files, m_jobs),
                                                      rpc::kDefaultIoTimeout, kRequestWorkers);

    m_endpoint = transport::UdpEndpoint::listen(m_options.bind_address, m_options.port, key, m_tuning);
    if (!m_endpoint) {
        LOG_ERROR("SERVER: cannot listen on " + m_options.bind_address + ":" + std::to_string(m_options.port));
        m_requests.reset();
        m_jobs->shutdown();
        m_jobs.reset();
        return false;
    }

    m_running = true;
    m_accept_thread = std::thread(&FerryServer::accept_loop, this);
    LOG_INFO("SERVER: serving " + files->guard().root().string() + " on " + m_endpoint->local_address());
    return true;
}

void FerryServer::stop() {
    if (!m_running.exchange(false)) {
        return;
    }
    LOG_INFO("SERVER: stopping");
    m_requests->stop();
    if (m_accept_thread.joinable()) {
        m_accept_thread.join();
    }
    reap_sessions(true);
    // Requests still running finish here; their streams are already closed.
    m_requests->shutdown();
    m_endpoint->close();
    m_jobs->shutdown();
}

uint16_t FerryServer::port() const {
    return m_endpoint ? m_endpoint->local_port() : 0;
}

size_t FerryServer::session_count() const {
    std::lock_guard<std::mutex> lock(m_sessions_mutex);
    size_t live = 0;
    for (const auto& slot : m_sessions) {
        if (!slot.done->load()) ++live;
    }
    return live;
}

void FerryServer::accept_loop() {
    while (m_running) {
        reap_sessions(false);

        auto conn = m_endpoint->accept(kAcceptPoll);
        if (!conn) {
            continue;
        }
        auto mux = mux::MuxSession::server(conn, m_mux_config);
        auto done = std::make_shared<std::atomic<bool>>(false);
        LOG_INFO("SERVER: session from " + conn->remote_address());

        std::shared_ptr<rpc::RequestServer> requests = m_requests;
        std::thread worker([mux, done, requests] {
            mux::MuxStreamAcceptor acceptor(mux);
            requests->serve(acceptor);
            mux->close();
            LOG_INFO("SERVER: session from " + mux->remote_address() + " ended");
            done->store(true);
        });

        std::lock_guard<std::mutex> lock(m_sessions_mutex);
        m_sessions.push_back(SessionSlot{mux, std::move(worker), done});
    }
}

void FerryServer::reap_sessions(bool all) {
    std::vector<SessionSlot> finished;
    {
        std::lock_guard<std::mutex> lock(m_sessions_mutex);
        for (auto it = m_sessions.begin(); it != m_sessions.end();) {
            if (all || it->done->load()) {
                finished.push_back(std::move(*it));
                it = m_sessions.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& slot : finished) {
        if (all) {
            slot.mux->close();
        }
        if (slot.thread.joinable()) {
            slot.thread.join();
        }
    }
}

} // namespace ferry::server
