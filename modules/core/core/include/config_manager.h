#pragma once

#include "settings.h"

#include <nlohmann/json.hpp>
#include <mutex>
#include <string>

using json = nlohmann::json;

// Process-wide configuration. Every getter falls back to a compiled-in default,
// so a missing or partial document is valid.
class ConfigManager {
public:
    static ConfigManager& getInstance();

    bool loadConfig(const std::string& config_path);
    bool loadFromString(const std::string& json_text);
    void reset();

    // Security
    std::string getPassphrase() const;
    void setPassphrase(const std::string& passphrase);

    // Logging
    std::string getLogLevel() const;
    bool isAsyncLogging() const;

    ferry::TransportTuning getTransportTuning() const;
    ferry::MuxConfig getMuxConfig() const;
    ferry::ServerOptions getServerOptions() const;
    ferry::ClientOptions getClientOptions() const;
    ferry::PackTransferConfig getPackTransferConfig() const;
    ferry::TaskManagerConfig getTaskManagerConfig() const;

private:
    ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    json section(const char* name) const;

    mutable std::mutex m_mutex;
    json m_config = json::object();
};
