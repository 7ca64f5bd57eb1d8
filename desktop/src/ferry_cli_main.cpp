#include "config_manager.h"
#include "errors.h"
#include "ferry_client.h"
#include "logger.h"
#include "task_manager.h"

#include <chrono>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace {

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS] COMMAND [ARGS...]\n\n"
              << "Options:\n"
              << "  --server ADDR     host:port of the server (default: client.server_address)\n"
              << "  --key PASSPHRASE  Shared passphrase (default: security.passphrase)\n"
              << "  --config FILE     Path to configuration file (default: config.json)\n"
              << "  --log-level LVL   Log level: debug|info|warning|error|none (default: warning)\n"
              << "  --pack            Enable pack transfer for this run\n"
              << "  --help            Show this help message\n"
              << "\nCommands:\n"
              << "  ls PATH [-r]                   List a directory\n"
              << "  stat PATH                      Show file details\n"
              << "  checksum PATH                  Print the SHA-256 of a remote file\n"
              << "  get REMOTE LOCAL               Download a file or directory\n"
              << "  put LOCAL REMOTE               Upload a file or directory\n"
              << "  rm PATH                        Delete a file or directory\n"
              << "  mkdir PATH                     Create a directory\n"
              << "  mv OLD NEW                     Rename\n"
              << "  cp SRC DST                     Copy on the server\n"
              << "  chmod MODE PATH                Change permissions (octal)\n"
              << "  cat PATH                       Print a text file (up to 1 MiB)\n"
              << "  write PATH LOCAL               Replace a text file with LOCAL's content\n"
              << "  compress OUTPUT FORMAT PATH..  Create an archive (zip|tar|targz|gzip)\n"
              << "  extract ARCHIVE [DEST]         Unpack an archive on the server\n"
              << "  batch-get LOCAL_DIR REMOTE..   Download several paths as queued tasks\n"
              << "  batch-put REMOTE_DIR LOCAL..   Upload several paths as queued tasks\n"
              << std::endl;
}

std::string format_rate(double bytes_per_second) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f MB/s", bytes_per_second / (1024.0 * 1024.0));
    return buf;
}

void print_progress(const ferry::transfer::TransferProgress& p) {
    std::fprintf(stderr, "\r%6.1f%%  %s   ", p.fraction * 100.0, format_rate(p.bytes_per_second).c_str());
    std::fflush(stderr);
}

void print_report(const ferry::transfer::TransferReport& r) {
    std::fprintf(stderr, "\n");
    std::cout << r.bytes_transferred << " bytes in " << r.elapsed_seconds << " s";
    if (r.chunk_count > 0) std::cout << ", " << r.chunk_count << " chunks";
    if (r.resumed_from > 0) std::cout << ", resumed at " << r.resumed_from;
    if (r.packed) std::cout << ", packed";
    std::cout << std::endl;
}

std::string join_remote(const std::string& dir, const std::string& name) {
    if (dir.empty() || dir.back() == '/') {
        return dir + name;
    }
    return dir + "/" + name;
}

std::string remote_base(const std::string& path) {
    std::string p = path;
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    size_t slash = p.find_last_of('/');
    return slash == std::string::npos ? p : p.substr(slash + 1);
}

// Waits until every task is terminal, then prints one line per task.
int wait_for_tasks(ferry::tasks::TaskManager& manager, const std::vector<std::string>& ids) {
    for (;;) {
        bool active = false;
        for (const auto& id : ids) {
            auto snap = manager.get_task(id);
            if (snap && !ferry::tasks::is_terminal(snap->status)) {
                active = true;
            }
        }
        if (!active) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    int failures = 0;
    for (const auto& id : ids) {
        auto snap = manager.get_task(id);
        if (!snap) continue;
        std::cout << ferry::tasks::task_status_name(snap->status) << "  " << ferry::tasks::task_type_name(snap->type)
                  << "  " << (snap->type == ferry::tasks::TaskType::DOWNLOAD ? snap->remote_path : snap->local_path);
        if (snap->has_error) {
            std::cout << "  (" << ferry::category_name(snap->error_category) << ": " << snap->error_message << ")";
        }
        std::cout << std::endl;
        if (snap->status != ferry::tasks::TaskStatus::COMPLETED) {
            ++failures;
        }
    }
    return failures == 0 ? 0 : 1;
}

int run_command(ferry::FerryClient& client, const std::vector<std::string>& args) {
    const std::string& cmd = args[0];
    auto need = [&args, &cmd](size_t n) {
        if (args.size() < n + 1) {
            throw ferry::ConfigurationError(cmd + " needs " + std::to_string(n) + " argument(s)");
        }
    };

    if (cmd == "ls") {
        need(1);
        bool recursive = args.size() > 2 && args[2] == "-r";
        for (const auto& item : client.list(args[1], recursive)) {
            std::printf("%s %12lld  %s%s\n", item.mode.c_str(), static_cast<long long>(item.size), item.path.c_str(),
                        item.is_dir ? "/" : "");
        }
    } else if (cmd == "stat") {
        need(1);
        nlohmann::json j = client.stat(args[1]);
        std::cout << j.dump(2) << std::endl;
    } else if (cmd == "checksum") {
        need(1);
        std::cout << client.checksum(args[1]) << std::endl;
    } else if (cmd == "get") {
        need(2);
        print_report(client.download(args[1], args[2], print_progress, nullptr));
    } else if (cmd == "put") {
        need(2);
        print_report(client.upload(args[1], args[2], print_progress, nullptr));
    } else if (cmd == "rm") {
        need(1);
        client.remove(args[1]);
    } else if (cmd == "mkdir") {
        need(1);
        client.make_directory(args[1]);
    } else if (cmd == "mv") {
        need(2);
        client.rename(args[1], args[2]);
    } else if (cmd == "cp") {
        need(2);
        client.copy(args[1], args[2]);
    } else if (cmd == "chmod") {
        need(2);
        client.chmod(args[2], args[1]);
    } else if (cmd == "cat") {
        need(1);
        std::cout << client.read_text(args[1]);
    } else if (cmd == "write") {
        need(2);
        std::ifstream in(args[2], std::ios::binary);
        if (!in) {
            throw ferry::IOError("cannot open " + args[2]);
        }
        std::ostringstream content;
        content << in.rdbuf();
        client.save_text(args[1], content.str());
    } else if (cmd == "compress") {
        need(3);
        std::vector<std::string> sources(args.begin() + 3, args.end());
        std::cout << client.compress(sources, args[1], args[2], nullptr) << std::endl;
    } else if (cmd == "extract") {
        need(1);
        std::cout << client.extract(args[1], args.size() > 2 ? args[2] : "", nullptr) << std::endl;
    } else if (cmd == "batch-get" || cmd == "batch-put") {
        need(2);
        ferry::tasks::TaskManager manager(client, ConfigManager::getInstance().getTaskManagerConfig());
        std::vector<std::string> ids;
        for (size_t i = 2; i < args.size(); ++i) {
            if (cmd == "batch-get") {
                std::string local = (std::filesystem::path(args[1]) / remote_base(args[i])).string();
                ids.push_back(manager.add_download(args[i], local));
            } else {
                std::string name = std::filesystem::path(args[i]).filename().string();
                ids.push_back(manager.add_upload(args[i], join_remote(args[1], name)));
            }
        }
        return wait_for_tasks(manager, ids);
    } else {
        throw ferry::ConfigurationError("unknown command: " + cmd);
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    // Ignore SIGPIPE to prevent process termination on socket write errors
    signal(SIGPIPE, SIG_IGN);
    set_log_tag("client");

    std::string config_path = "config.json";
    std::string server_address;
    std::string passphrase;
    std::string log_level;
    bool pack = false;
    std::vector<std::string> command;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (!command.empty()) {
            command.push_back(arg);
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--config" || arg == "--server" || arg == "--key" || arg == "--log-level") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires an argument" << std::endl;
                return 1;
            }
            std::string value = argv[++i];
            if (arg == "--config") config_path = value;
            else if (arg == "--server") server_address = value;
            else if (arg == "--key") passphrase = value;
            else log_level = value;
        } else if (arg == "--pack") {
            pack = true;
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "Error: Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        } else {
            command.push_back(arg);
        }
    }
    if (command.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    ConfigManager& config = ConfigManager::getInstance();
    if (std::filesystem::exists(config_path) && !config.loadConfig(config_path)) {
        std::cerr << "Error: cannot parse " << config_path << std::endl;
        return 1;
    }
    set_log_level(parse_log_level(log_level.empty() ? config.getLogLevel() : log_level));

    ferry::ClientOptions options = config.getClientOptions();
    if (!server_address.empty()) {
        options.server_address = server_address;
    }
    if (passphrase.empty()) {
        passphrase = config.getPassphrase();
    }
    ferry::PackTransferConfig pack_config = config.getPackTransferConfig();
    if (pack) {
        pack_config.enabled = true;
    }

    ferry::FerryClient client(options, config.getTransportTuning(), config.getMuxConfig(), pack_config);
    client.set_state_callback([](ferry::rpc::ConnectionState state) {
        LOG_DEBUG(std::string("MAIN: connection ") + ferry::rpc::connection_state_name(state));
    });
    try {
        client.connect(passphrase);
        int rc = run_command(client, command);
        client.close();
        return rc;
    } catch (const ferry::FerryError& e) {
        std::cerr << "\nError (" << ferry::category_name(e.category()) << "): " << e.what() << std::endl;
        return 2;
    }
}
