#include "udp_endpoint.h"
#include "packet_cipher.h"
#include "logger.h"

#include <sodium.h>
#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace ferry::transport {

namespace {

constexpr size_t kRecvBufferSize = 64 * 1024;
constexpr int kSocketBufferBytes = 4 * 1024 * 1024;
constexpr size_t kAcceptBacklog = 128;
constexpr int kMaxDatagramsPerWake = 256;
constexpr uint32_t kClosedConvMemoryMs = 60000;
constexpr auto kCloseDrain = std::chrono::milliseconds(1000);

std::string sockaddr_to_string(const sockaddr_storage& addr) {
    char host[INET6_ADDRSTRLEN] = {0};
    uint16_t port = 0;
    if (addr.ss_family == AF_INET) {
        const auto* v4 = reinterpret_cast<const sockaddr_in*>(&addr);
        inet_ntop(AF_INET, &v4->sin_addr, host, sizeof(host));
        port = ntohs(v4->sin_port);
        return std::string(host) + ":" + std::to_string(port);
    }
    if (addr.ss_family == AF_INET6) {
        const auto* v6 = reinterpret_cast<const sockaddr_in6*>(&addr);
        inet_ntop(AF_INET6, &v6->sin6_addr, host, sizeof(host));
        port = ntohs(v6->sin6_port);
        return "[" + std::string(host) + "]:" + std::to_string(port);
    }
    return "unknown";
}

bool resolve(const std::string& host, uint16_t port, bool passive, sockaddr_storage& out, socklen_t& out_len) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_DGRAM;
    if (passive) {
        hints.ai_flags = AI_PASSIVE;
    }
    addrinfo* result = nullptr;
    std::string service = std::to_string(port);
    const char* node = host.empty() ? nullptr : host.c_str();
    int rc = getaddrinfo(node, service.c_str(), &hints, &result);
    if (rc != 0 || result == nullptr) {
        nativeLog("UDP Error: cannot resolve " + host + ": " + gai_strerror(rc));
        return false;
    }
    std::memcpy(&out, result->ai_addr, result->ai_addrlen);
    out_len = static_cast<socklen_t>(result->ai_addrlen);
    freeaddrinfo(result);
    return true;
}

} // namespace

bool split_host_port(const std::string& address, std::string& host, uint16_t& port) {
    std::string port_part;
    if (!address.empty() && address.front() == '[') {
        size_t close = address.find(']');
        if (close == std::string::npos || close + 1 >= address.size() || address[close + 1] != ':') {
            return false;
        }
        host = address.substr(1, close - 1);
        port_part = address.substr(close + 2);
    } else {
        size_t colon = address.rfind(':');
        if (colon == std::string::npos) {
            return false;
        }
        host = address.substr(0, colon);
        port_part = address.substr(colon + 1);
    }
    if (port_part.empty() || port_part.size() > 5 ||
        port_part.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    unsigned long value = std::stoul(port_part);
    if (value > 65535) {
        return false;
    }
    port = static_cast<uint16_t>(value);
    return true;
}

class UdpEndpoint::UdpImpl {
public:
    UdpImpl(const crypto::Key& key, const TransportTuning& tuning, bool listening)
        : m_cipher(key),
          m_tuning(tuning),
          m_arq_mtu(tuning.mtu - static_cast<int>(crypto::PacketCipher::kOverhead)),
          m_listening(listening),
          m_epoch(std::chrono::steady_clock::now()) {}

    ~UdpImpl() { stop(); }

    bool open_socket(const sockaddr_storage& addr, socklen_t len, bool do_bind) {
        m_sock = socket(addr.ss_family, SOCK_DGRAM, 0);
        if (m_sock < 0) {
            nativeLog("UDP Error: Failed to create socket: " + std::string(strerror(errno)));
            return false;
        }
        if (fcntl(m_sock, F_SETFL, O_NONBLOCK) < 0) {
            nativeLog("UDP Error: fcntl(O_NONBLOCK) failed: " + std::string(strerror(errno)));
            return false;
        }
        int bufsize = kSocketBufferBytes;
        if (setsockopt(m_sock, SOL_SOCKET, SO_RCVBUF, &bufsize, sizeof(bufsize)) < 0 ||
            setsockopt(m_sock, SOL_SOCKET, SO_SNDBUF, &bufsize, sizeof(bufsize)) < 0) {
            LOG_DEBUG("UDP: could not enlarge socket buffers: " + std::string(strerror(errno)));
        }

        if (do_bind) {
            int opt = 1;
            if (setsockopt(m_sock, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
                nativeLog("UDP Error: setsockopt(SO_REUSEADDR) failed: " + std::string(strerror(errno)));
                return false;
            }
            if (bind(m_sock, reinterpret_cast<const sockaddr*>(&addr), len) < 0) {
                nativeLog("UDP Error: Failed to bind socket: " + std::string(strerror(errno)));
                return false;
            }
        } else {
            if (::connect(m_sock, reinterpret_cast<const sockaddr*>(&addr), len) < 0) {
                nativeLog("UDP Error: connect failed: " + std::string(strerror(errno)));
                return false;
            }
            m_remote = sockaddr_to_string(addr);
        }

        sockaddr_storage local{};
        socklen_t local_len = sizeof(local);
        if (getsockname(m_sock, reinterpret_cast<sockaddr*>(&local), &local_len) == 0) {
            m_local = sockaddr_to_string(local);
            if (local.ss_family == AF_INET) {
                m_local_port = ntohs(reinterpret_cast<sockaddr_in*>(&local)->sin_port);
            } else if (local.ss_family == AF_INET6) {
                m_local_port = ntohs(reinterpret_cast<sockaddr_in6*>(&local)->sin6_port);
            }
        }
        return true;
    }

    void start() {
        m_running = true;
        m_thread = std::thread(&UdpImpl::io_loop, this);
    }

    void stop() {
        if (m_sock < 0 && !m_thread.joinable()) {
            return;
        }
        std::vector<std::shared_ptr<TransportSession>> sessions;
        {
            std::lock_guard<std::mutex> lock(m_sessions_mutex);
            m_stopping = true;
            for (auto& entry : m_sessions) {
                sessions.push_back(entry.second);
            }
        }
        for (auto& s : sessions) {
            s->close();
        }
        {
            std::lock_guard<std::mutex> lock(m_accept_mutex);
            m_accept_queue.clear();
        }
        m_accept_cv.notify_all();

        if (m_thread.joinable()) {
            m_stop_deadline = std::chrono::steady_clock::now() + kCloseDrain;
            m_drain_requested = true;
            m_thread.join();
        }
        if (m_sock >= 0) {
            ::close(m_sock);
            m_sock = -1;
        }
        // Anything still registered can no longer make progress
        std::lock_guard<std::mutex> lock(m_sessions_mutex);
        for (auto& entry : m_sessions) {
            entry.second->fail("endpoint closed");
        }
        m_sessions.clear();
    }

    std::shared_ptr<TransportSession> open_session() {
        uint32_t conv = 0;
        while (conv == 0) {
            conv = randombytes_random();
        }
        auto session = make_session(conv, m_remote, nullptr, 0);
        std::lock_guard<std::mutex> lock(m_sessions_mutex);
        if (m_stopping) {
            return nullptr;
        }
        m_sessions[session_key(m_remote, conv)] = session;
        LOG_DEBUG("ARQ: opened conv " + std::to_string(conv) + " to " + m_remote);
        return session;
    }

    std::shared_ptr<TransportSession> accept(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(m_accept_mutex);
        m_accept_cv.wait_for(lock, timeout, [this] { return !m_accept_queue.empty() || m_stopping; });
        if (m_accept_queue.empty()) {
            return nullptr;
        }
        auto session = m_accept_queue.front();
        m_accept_queue.pop_front();
        return session;
    }

    size_t session_count() const {
        std::lock_guard<std::mutex> lock(m_sessions_mutex);
        return m_sessions.size();
    }

    bool listening() const { return m_listening; }
    uint16_t local_port() const { return m_local_port; }
    const std::string& local_address() const { return m_local; }

private:
    static std::string session_key(const std::string& remote, uint32_t conv) {
        return remote + "#" + std::to_string(conv);
    }

    uint32_t now_ms() const {
        return static_cast<uint32_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - m_epoch).count());
    }

    std::shared_ptr<TransportSession> make_session(uint32_t conv, const std::string& remote,
                                                   const sockaddr_storage* addr, socklen_t addr_len) {
        sockaddr_storage dest{};
        if (addr != nullptr) {
            std::memcpy(&dest, addr, addr_len);
        }
        const bool connected = addr == nullptr;
        // Output runs on the I/O thread only
        auto sender = [this, dest, addr_len, connected](const uint8_t* data, size_t len) {
            send_datagram(data, len, connected ? nullptr : &dest, addr_len);
        };
        return std::make_shared<TransportSession>(conv, remote, m_tuning, m_arq_mtu, sender);
    }

    void send_datagram(const uint8_t* data, size_t len, const sockaddr_storage* dest, socklen_t dest_len) {
        std::vector<uint8_t> sealed = m_cipher.seal(data, len);
        ssize_t sent;
        if (dest == nullptr) {
            sent = ::send(m_sock, sealed.data(), sealed.size(), 0);
        } else {
            sent = ::sendto(m_sock, sealed.data(), sealed.size(), 0,
                            reinterpret_cast<const sockaddr*>(dest), dest_len);
        }
        if (sent < 0) {
            // Dropped datagrams are recovered by retransmission
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != ENOBUFS && errno != ECONNREFUSED) {
                LOG_WARN("UDP_SEND_ERROR: " + std::string(strerror(errno)));
            }
        }
    }

    void handle_datagram(const uint8_t* data, size_t len, const sockaddr_storage& from, socklen_t from_len, uint32_t now) {
        if (!m_cipher.open(data, len, m_plain)) {
            LOG_DEBUG("UDP_RECEIVE_ERROR: dropping unauthenticated datagram");
            return;
        }
        uint32_t conv = 0;
        if (!ArqSession::peek_conv(m_plain.data(), m_plain.size(), conv)) {
            return;
        }

        std::string remote = m_listening ? sockaddr_to_string(from) : m_remote;
        std::string key = session_key(remote, conv);

        std::shared_ptr<TransportSession> session;
        bool is_new = false;
        {
            std::lock_guard<std::mutex> lock(m_sessions_mutex);
            auto it = m_sessions.find(key);
            if (it != m_sessions.end()) {
                session = it->second;
            } else if (m_listening && !m_stopping && m_closed_convs.find(key) == m_closed_convs.end()) {
                session = make_session(conv, remote, &from, from_len);
                m_sessions[key] = session;
                is_new = true;
            }
        }
        if (!session) {
            return;
        }

        if (is_new) {
            std::lock_guard<std::mutex> lock(m_accept_mutex);
            if (m_accept_queue.size() >= kAcceptBacklog) {
                LOG_WARN("ARQ: accept backlog full, refusing " + remote);
                session->fail("accept backlog full");
            } else {
                LOG_INFO("ARQ: new session conv " + std::to_string(conv) + " from " + remote);
                m_accept_queue.push_back(session);
                m_accept_cv.notify_one();
            }
        }
        session->on_input(m_plain.data(), m_plain.size(), now);
    }

    void tick_all(uint32_t now) {
        std::vector<std::pair<std::string, std::shared_ptr<TransportSession>>> sessions;
        {
            std::lock_guard<std::mutex> lock(m_sessions_mutex);
            sessions.assign(m_sessions.begin(), m_sessions.end());
        }
        std::vector<std::string> finished;
        for (auto& entry : sessions) {
            entry.second->tick(now);
            if (entry.second->finished(now)) {
                finished.push_back(entry.first);
            }
        }

        std::lock_guard<std::mutex> lock(m_sessions_mutex);
        for (const auto& key : finished) {
            m_sessions.erase(key);
            m_closed_convs[key] = now;
        }
        for (auto it = m_closed_convs.begin(); it != m_closed_convs.end();) {
            if (now - it->second > kClosedConvMemoryMs) {
                it = m_closed_convs.erase(it);
            } else {
                ++it;
            }
        }
    }

    void io_loop() {
        std::vector<uint8_t> buf(kRecvBufferSize);
        const uint32_t interval = static_cast<uint32_t>(std::max(1, m_tuning.interval_ms));
        uint32_t next_tick = now_ms();

        while (m_running) {
            uint32_t now = now_ms();
            int wait = static_cast<int32_t>(next_tick - now) > 0 ? static_cast<int>(next_tick - now) : 0;

            pollfd pfd{};
            pfd.fd = m_sock;
            pfd.events = POLLIN;
            int rc = poll(&pfd, 1, wait);
            if (rc < 0) {
                if (errno == EINTR) continue;
                nativeLog("UDP Error: poll() failed in io loop: " + std::string(strerror(errno)));
                break;
            }

            if (rc > 0 && (pfd.revents & POLLIN)) {
                for (int i = 0; i < kMaxDatagramsPerWake; ++i) {
                    sockaddr_storage from{};
                    socklen_t from_len = sizeof(from);
                    ssize_t n = recvfrom(m_sock, buf.data(), buf.size(), MSG_DONTWAIT,
                                         reinterpret_cast<sockaddr*>(&from), &from_len);
                    if (n < 0) {
                        if (errno != EAGAIN && errno != EWOULDBLOCK && errno != ECONNREFUSED && errno != EINTR) {
                            LOG_DEBUG("UDP: recvfrom failed: " + std::string(strerror(errno)));
                        }
                        break;
                    }
                    handle_datagram(buf.data(), static_cast<size_t>(n), from, from_len, now_ms());
                }
            }

            now = now_ms();
            if (static_cast<int32_t>(now - next_tick) >= 0) {
                tick_all(now);
                next_tick = now + interval;
            }

            if (m_drain_requested) {
                bool empty;
                {
                    std::lock_guard<std::mutex> lock(m_sessions_mutex);
                    empty = m_sessions.empty();
                }
                if (empty || std::chrono::steady_clock::now() >= m_stop_deadline) {
                    break;
                }
            }
        }
        m_running = false;
    }

    crypto::PacketCipher m_cipher;
    TransportTuning m_tuning;
    int m_arq_mtu;
    bool m_listening;
    std::chrono::steady_clock::time_point m_epoch;

    int m_sock = -1;
    std::string m_remote;
    std::string m_local;
    uint16_t m_local_port = 0;

    std::thread m_thread;
    std::atomic<bool> m_running{false};
    std::atomic<bool> m_drain_requested{false};
    std::chrono::steady_clock::time_point m_stop_deadline;
    std::vector<uint8_t> m_plain;

    mutable std::mutex m_sessions_mutex;
    std::unordered_map<std::string, std::shared_ptr<TransportSession>> m_sessions;
    std::unordered_map<std::string, uint32_t> m_closed_convs;
    std::atomic<bool> m_stopping{false};

    std::mutex m_accept_mutex;
    std::condition_variable m_accept_cv;
    std::deque<std::shared_ptr<TransportSession>> m_accept_queue;
};

UdpEndpoint::UdpEndpoint(std::unique_ptr<UdpImpl> impl) : m_impl(std::move(impl)) {}

UdpEndpoint::~UdpEndpoint() {
    close();
}

std::unique_ptr<UdpEndpoint> UdpEndpoint::connect(const std::string& host, uint16_t port,
                                                  const crypto::Key& key, const TransportTuning& tuning) {
    sockaddr_storage addr{};
    socklen_t len = 0;
    if (!resolve(host, port, false, addr, len)) {
        return nullptr;
    }
    auto impl = std::make_unique<UdpImpl>(key, tuning, false);
    if (!impl->open_socket(addr, len, false)) {
        return nullptr;
    }
    impl->start();
    return std::unique_ptr<UdpEndpoint>(new UdpEndpoint(std::move(impl)));
}

std::unique_ptr<UdpEndpoint> UdpEndpoint::listen(const std::string& bind_address, uint16_t port,
                                                 const crypto::Key& key, const TransportTuning& tuning) {
    sockaddr_storage addr{};
    socklen_t len = 0;
    if (!resolve(bind_address, port, true, addr, len)) {
        return nullptr;
    }
    auto impl = std::make_unique<UdpImpl>(key, tuning, true);
    if (!impl->open_socket(addr, len, true)) {
        return nullptr;
    }
    impl->start();
    nativeLog("UDP server started successfully on " + impl->local_address());
    return std::unique_ptr<UdpEndpoint>(new UdpEndpoint(std::move(impl)));
}

std::shared_ptr<TransportSession> UdpEndpoint::open_session() {
    if (m_impl->listening()) {
        return nullptr;
    }
    return m_impl->open_session();
}

std::shared_ptr<TransportSession> UdpEndpoint::accept(std::chrono::milliseconds timeout) {
    if (!m_impl->listening()) {
        return nullptr;
    }
    return m_impl->accept(timeout);
}

void UdpEndpoint::close() {
    m_impl->stop();
}

uint16_t UdpEndpoint::local_port() const {
    return m_impl->local_port();
}

std::string UdpEndpoint::local_address() const {
    return m_impl->local_address();
}

size_t UdpEndpoint::session_count() const {
    return m_impl->session_count();
}

} // namespace ferry::transport
