#include "config_manager.h"
#include "logger.h"

#include <fstream>

ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::loadConfig(const std::string& config_path) {
    try {
        std::ifstream config_file(config_path);
        if (!config_file.is_open()) {
            LOG_WARN("CONFIG: Failed to open config file: " + config_path + ", using defaults");
            return false;
        }
        json parsed;
        config_file >> parsed;
        if (!parsed.is_object()) {
            LOG_ERROR("CONFIG: Top level of " + config_path + " is not an object");
            return false;
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config = std::move(parsed);
        LOG_INFO("CONFIG: Configuration loaded successfully from: " + config_path);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("CONFIG: Config loading failed: " + std::string(e.what()));
        return false;
    }
}

bool ConfigManager::loadFromString(const std::string& json_text) {
    try {
        json parsed = json::parse(json_text);
        if (!parsed.is_object()) {
            return false;
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config = std::move(parsed);
        return true;
    } catch (const json::exception& e) {
        LOG_ERROR("CONFIG: Invalid configuration text: " + std::string(e.what()));
        return false;
    }
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_config = json::object();
}

json ConfigManager::section(const char* name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_config.find(name);
    if (it == m_config.end() || !it->is_object()) {
        return json::object();
    }
    return *it;
}

std::string ConfigManager::getPassphrase() const {
    return section("security").value("passphrase", std::string());
}

void ConfigManager::setPassphrase(const std::string& passphrase) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_config["security"]["passphrase"] = passphrase;
}

std::string ConfigManager::getLogLevel() const {
    return section("logging").value("level", std::string("info"));
}

bool ConfigManager::isAsyncLogging() const {
    return section("logging").value("async", false);
}

ferry::TransportTuning ConfigManager::getTransportTuning() const {
    ferry::TransportTuning t;
    json s = section("transport");
    t.mtu = s.value("mtu", t.mtu);
    t.send_window = s.value("send_window", t.send_window);
    t.receive_window = s.value("receive_window", t.receive_window);
    t.nodelay = s.value("nodelay", t.nodelay);
    t.interval_ms = s.value("interval_ms", t.interval_ms);
    t.fast_resend = s.value("fast_resend", t.fast_resend);
    t.no_congestion = s.value("no_congestion", t.no_congestion);
    t.dead_link = s.value("dead_link", t.dead_link);
    t.min_rto_ms = s.value("min_rto_ms", t.min_rto_ms);
    return t;
}

ferry::MuxConfig ConfigManager::getMuxConfig() const {
    ferry::MuxConfig m;
    json s = section("mux");
    m.keepalive_interval_ms = s.value("keepalive_interval_ms", m.keepalive_interval_ms);
    m.keepalive_timeout_ms = s.value("keepalive_timeout_ms", m.keepalive_timeout_ms);
    m.max_frame_size = s.value("max_frame_size", m.max_frame_size);
    m.max_stream_buffer = s.value("max_stream_buffer", m.max_stream_buffer);
    return m;
}

ferry::ServerOptions ConfigManager::getServerOptions() const {
    ferry::ServerOptions o;
    json s = section("server");
    o.root_dir = s.value("root_dir", o.root_dir);
    o.bind_address = s.value("bind_address", o.bind_address);
    o.port = static_cast<uint16_t>(s.value("port", static_cast<int>(o.port)));
    return o;
}

ferry::ClientOptions ConfigManager::getClientOptions() const {
    ferry::ClientOptions o;
    json s = section("client");
    o.server_address = s.value("server_address", o.server_address);
    o.handshake_timeout_ms = s.value("handshake_timeout_ms", o.handshake_timeout_ms);
    o.chunk_workers = s.value("chunk_workers", o.chunk_workers);
    o.chunk_threshold_bytes = s.value("chunk_threshold_bytes", o.chunk_threshold_bytes);
    o.progress_interval_ms = s.value("progress_interval_ms", o.progress_interval_ms);
    return o;
}

ferry::PackTransferConfig ConfigManager::getPackTransferConfig() const {
    ferry::PackTransferConfig p;
    json s = section("pack_transfer");
    p.enabled = s.value("enabled", p.enabled);
    p.threshold_bytes = s.value("threshold_bytes", p.threshold_bytes);
    p.scratch_dir = s.value("scratch_dir", p.scratch_dir);
    return p;
}

ferry::TaskManagerConfig ConfigManager::getTaskManagerConfig() const {
    ferry::TaskManagerConfig t;
    json s = section("tasks");
    t.max_parallel = s.value("max_parallel", t.max_parallel);
    t.retention_seconds = s.value("retention_seconds", t.retention_seconds);
    return t;
}
