#pragma once

#include <cstdint>
#include <string>

namespace ferry {

inline constexpr int64_t kMiB = 1024 * 1024;

// Reliable-UDP tuning. Applied system-wide, never per call.
struct TransportTuning {
    int mtu = 1350;
    int send_window = 1024;
    int receive_window = 1024;
    bool nodelay = true;
    int interval_ms = 10;
    int fast_resend = 2;
    bool no_congestion = true;
    int dead_link = 20;
    int min_rto_ms = 30;
};

struct MuxConfig {
    int keepalive_interval_ms = 10000;
    int keepalive_timeout_ms = 30000;
    int max_frame_size = 32768;
    int max_stream_buffer = 1024 * 1024;
};

struct ServerOptions {
    std::string root_dir = ".";
    std::string bind_address = "0.0.0.0";
    uint16_t port = 9000;
};

struct ClientOptions {
    std::string server_address = "127.0.0.1:9000";
    int handshake_timeout_ms = 3000;
    int chunk_workers = 8;
    int64_t chunk_threshold_bytes = 4 * kMiB;
    int progress_interval_ms = 500;
};

struct PackTransferConfig {
    bool enabled = false;
    int64_t threshold_bytes = 10 * kMiB;
    // Empty means the system temp directory.
    std::string scratch_dir;
};

struct TaskManagerConfig {
    int max_parallel = 3;
    int retention_seconds = 300;
};

} // namespace ferry
