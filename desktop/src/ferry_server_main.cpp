#include "config_manager.h"
#include "errors.h"
#include "ferry_server.h"
#include "logger.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {

std::atomic<bool> g_stop{false};

void handle_signal(int) {
    g_stop = true;
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --root DIR        Directory to serve (default: server.root_dir or .)\n"
              << "  --port PORT       UDP listen port (default: 9000)\n"
              << "  --bind ADDR       Bind address (default: 0.0.0.0)\n"
              << "  --key PASSPHRASE  Shared passphrase (default: security.passphrase)\n"
              << "  --config FILE     Path to configuration file (default: config.json)\n"
              << "  --log-level LVL   Log level: debug|info|warning|error|none\n"
              << "  --async-log       Write log lines from a background thread\n"
              << "  --help            Show this help message\n"
              << std::endl;
}

bool take_value(int argc, char* argv[], int& i, std::string& out) {
    if (i + 1 >= argc) {
        std::cerr << "Error: " << argv[i] << " requires an argument" << std::endl;
        return false;
    }
    out = argv[++i];
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    // Ignore SIGPIPE to prevent process termination on socket write errors
    signal(SIGPIPE, SIG_IGN);
    signal(SIGINT, handle_signal);
    signal(SIGTERM, handle_signal);

    set_log_tag("server");

    std::string config_path = "config.json";
    std::string root_dir;
    std::string port_text;
    std::string bind_address;
    std::string passphrase;
    std::string log_level;
    bool async_log = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        bool ok = true;
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--config") {
            ok = take_value(argc, argv, i, config_path);
        } else if (arg == "--root") {
            ok = take_value(argc, argv, i, root_dir);
        } else if (arg == "--port") {
            ok = take_value(argc, argv, i, port_text);
        } else if (arg == "--bind") {
            ok = take_value(argc, argv, i, bind_address);
        } else if (arg == "--key") {
            ok = take_value(argc, argv, i, passphrase);
        } else if (arg == "--log-level") {
            ok = take_value(argc, argv, i, log_level);
        } else if (arg == "--async-log") {
            async_log = true;
        } else {
            std::cerr << "Error: Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
        if (!ok) {
            return 1;
        }
    }

    // A missing file is fine: every setting has a default
    ConfigManager& config = ConfigManager::getInstance();
    if (std::filesystem::exists(config_path)) {
        if (!config.loadConfig(config_path)) {
            std::cerr << "Error: cannot parse " << config_path << std::endl;
            return 1;
        }
    }

    set_log_level(parse_log_level(log_level.empty() ? config.getLogLevel() : log_level));
    if (async_log || config.isAsyncLogging()) {
        enable_async_logging();
    }

    ferry::ServerOptions options = config.getServerOptions();
    if (!root_dir.empty()) {
        options.root_dir = root_dir;
    }
    if (!bind_address.empty()) {
        options.bind_address = bind_address;
    }
    if (!port_text.empty()) {
        try {
            int p = std::stoi(port_text);
            if (p < 1 || p > 65535) {
                std::cerr << "Error: Port must be between 1 and 65535" << std::endl;
                return 1;
            }
            options.port = static_cast<uint16_t>(p);
        } catch (const std::exception& e) {
            std::cerr << "Error: Invalid port number: " << e.what() << std::endl;
            return 1;
        }
    }
    if (passphrase.empty()) {
        passphrase = config.getPassphrase();
    }

    ferry::server::FerryServer server(options, passphrase, config.getTransportTuning(), config.getMuxConfig());
    try {
        if (!server.start()) {
            std::cerr << "Error: cannot listen on " << options.bind_address << ":" << options.port << std::endl;
            return 1;
        }
    } catch (const ferry::FerryError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "Serving " << options.root_dir << " on " << options.bind_address << ":" << server.port()
              << std::endl;

    while (!g_stop.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    nativeLog("MAIN: shutting down");
    server.stop();
    disable_async_logging();
    return 0;
}
