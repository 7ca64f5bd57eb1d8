#ifndef FERRY_SERVER_H
#define FERRY_SERVER_H

#include "event_thread_pool.h"
#include "file_request_handler.h"
#include "mux_session.h"
#include "request_server.h"
#include "settings.h"
#include "udp_endpoint.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace ferry::server {

/**
 * Serves one root directory over encrypted reliable UDP.
 *
 * Every accepted transport session gets its own MuxSession and a thread running
 * the shared RequestServer on it. Sessions end when the peer goes quiet past the
 * keepalive timeout or closes; their threads are reaped by the accept loop.
 */
class FerryServer {
public:
    FerryServer(ServerOptions options, std::string passphrase, TransportTuning tuning, MuxConfig mux_config);
    ~FerryServer();

    FerryServer(const FerryServer&) = delete;
    FerryServer& operator=(const FerryServer&) = delete;

    // Throws ConfigurationError without a passphrase or with a missing root.
    // Returns false if the socket cannot be bound.
    bool start();
    void stop();

    bool is_running() const { return m_running.load(); }
    uint16_t port() const;
    size_t session_count() const;

private:
    struct SessionSlot {
        std::shared_ptr<mux::MuxSession> mux;
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void accept_loop();
    void reap_sessions(bool all);

    ServerOptions m_options;
    std::string m_passphrase;
    TransportTuning m_tuning;
    MuxConfig m_mux_config;

    std::unique_ptr<transport::UdpEndpoint> m_endpoint;
    std::shared_ptr<EventThreadPool> m_jobs;
    std::shared_ptr<rpc::RequestServer> m_requests;

    std::atomic<bool> m_running{false};
    std::thread m_accept_thread;

    mutable std::mutex m_sessions_mutex;
    std::vector<SessionSlot> m_sessions;
};

} // namespace ferry::server

#endif // FERRY_SERVER_H
