#include "errors.h"
#include "event_thread_pool.h"
#include "ferry_client.h"
#include "ferry_server.h"
#include "file_hash.h"
#include "file_request_handler.h"
#include "file_service.h"
#include "key_derivation.h"
#include "logger.h"
#include "mux_session.h"
#include "mux_stream_acceptor.h"
#include "request_server.h"
#include "udp_endpoint.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

namespace fs = std::filesystem;
using namespace ferry;

namespace {

constexpr int64_t kThreshold = 256 * 1024;
const std::string kPassphrase = "abc";

// Server root, client scratch area and a running loopback server.
struct Harness {
    fs::path base;
    fs::path root;
    fs::path local;
    std::unique_ptr<server::FerryServer> srv;

    Harness() {
        base = fs::temp_directory_path() / ("ferry_e2e_" + crypto::random_hex(6));
        root = base / "served";
        local = base / "local";
        fs::create_directories(root);
        fs::create_directories(local);

        ServerOptions options;
        options.root_dir = root.string();
        options.bind_address = "127.0.0.1";
        options.port = 0;
        srv = std::make_unique<server::FerryServer>(options, kPassphrase, TransportTuning{}, MuxConfig{});
    }
    ~Harness() {
        if (srv) srv->stop();
        std::error_code ec;
        fs::remove_all(base, ec);
    }

    ClientOptions client_options(uint16_t port = 0) const {
        ClientOptions o;
        o.server_address = "127.0.0.1:" + std::to_string(port ? port : srv->port());
        o.handshake_timeout_ms = 3000;
        o.chunk_workers = 4;
        o.chunk_threshold_bytes = kThreshold;
        o.progress_interval_ms = 50;
        return o;
    }

    std::unique_ptr<FerryClient> client(PackTransferConfig pack = PackTransferConfig{}) const {
        auto c = std::make_unique<FerryClient>(client_options(), TransportTuning{}, MuxConfig{}, pack);
        c->connect(kPassphrase);
        return c;
    }

    std::unique_ptr<FerryClient> client_for(uint16_t port) const {
        auto c = std::make_unique<FerryClient>(client_options(port), TransportTuning{}, MuxConfig{},
                                               PackTransferConfig{});
        c->connect(kPassphrase);
        return c;
    }
};

void write_pattern(const fs::path& p, int64_t size, uint32_t seed) {
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    uint32_t x = seed | 1u;
    for (int64_t i = 0; i < size; ++i) {
        x ^= x << 13;
        x ^= x >> 17;
        x ^= x << 5;
        out.put(static_cast<char>(x));
    }
}

std::string read_file(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

bool wait_for(const std::function<bool()>& pred, int timeout_ms = 10000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return pred();
}

// Serves the real file handler, with switches to misreport checksums or to
// answer ranged downloads with the whole file.
class MisbehavingHandler : public rpc::RequestHandler {
public:
    std::atomic<bool> wrong_checksum{false};
    std::atomic<bool> ignore_range{false};

    MisbehavingHandler(fs::path root, std::shared_ptr<rpc::RequestHandler> inner)
        : m_root(std::move(root)), m_inner(std::move(inner)) {}

    void handle(rpc::ServerExchange& ex) override {
        const wire::RequestHead& req = ex.request();
        if (wrong_checksum && req.action == "checksum") {
            ex.respond(wire::kStatusOk, std::string(64, '0'));
            return;
        }
        if (ignore_range && req.method == "GET" && req.action == "download" &&
            !req.header(wire::kHeaderRange).empty()) {
            ex.respond(wire::kStatusOk, read_file(m_root / fs::path(req.param("path")).relative_path()));
            return;
        }
        m_inner->handle(ex);
    }

private:
    fs::path m_root;
    std::shared_ptr<rpc::RequestHandler> m_inner;
};

// A loopback server assembled from the transport, mux and request layers
// around a MisbehavingHandler.
struct MisbehavingServer {
    std::shared_ptr<EventThreadPool> jobs = std::make_shared<EventThreadPool>(1);
    std::shared_ptr<MisbehavingHandler> handler;
    std::unique_ptr<rpc::RequestServer> requests;
    std::unique_ptr<transport::UdpEndpoint> endpoint;
    std::atomic<bool> running{true};
    std::mutex mutex;
    std::vector<std::shared_ptr<mux::MuxSession>> sessions;
    std::vector<std::thread> serving;
    std::thread accept_thread;

    explicit MisbehavingServer(const fs::path& root) {
        auto files = std::make_shared<server::FileService>(root);
        handler = std::make_shared<MisbehavingHandler>(root, std::make_shared<server::FileRequestHandler>(files, jobs));
        requests = std::make_unique<rpc::RequestServer>(handler, std::chrono::milliseconds(10000), 4);
        endpoint = transport::UdpEndpoint::listen("127.0.0.1", 0, crypto::derive_key(kPassphrase), TransportTuning{});
        if (!endpoint) {
            return;
        }
        accept_thread = std::thread([this] {
            while (running) {
                auto conn = endpoint->accept(std::chrono::milliseconds(200));
                if (!conn) {
                    continue;
                }
                auto mux = mux::MuxSession::server(conn, MuxConfig{});
                std::lock_guard<std::mutex> lock(mutex);
                sessions.push_back(mux);
                serving.emplace_back([this, mux] {
                    mux::MuxStreamAcceptor acceptor(mux);
                    requests->serve(acceptor);
                });
            }
        });
    }

    ~MisbehavingServer() {
        running = false;
        if (accept_thread.joinable()) {
            accept_thread.join();
        }
        requests->stop();
        for (auto& session : sessions) {
            session->close();
        }
        for (auto& t : serving) {
            t.join();
        }
        requests->shutdown();
        if (endpoint) {
            endpoint->close();
        }
        jobs->shutdown();
    }

    uint16_t port() const { return endpoint->local_port(); }
};

template <typename Fn>
bool raises_integrity(Fn fn) {
    try {
        fn();
    } catch (const IntegrityError&) {
        return true;
    }
    return false;
}

template <typename Fn>
bool raises_path_safety(Fn fn) {
    try {
        fn();
    } catch (const PathSafetyError&) {
        return true;
    }
    return false;
}

} // namespace

bool test_round_trips(Harness& h) {
    std::cout << "Testing upload and download round trips..." << std::endl;
    auto client = h.client();

    const std::vector<int64_t> sizes = {0, 1, kThreshold - 1, kThreshold, kThreshold + 1, 3 * kThreshold + 17,
                                        4 * kMiB + 5};
    uint32_t seed = 1;
    for (int64_t size : sizes) {
        std::string name = "file_" + std::to_string(size) + ".bin";
        fs::path src = h.local / name;
        write_pattern(src, size, seed++);

        auto up = client->upload(src.string(), "/rt/" + name, nullptr, nullptr);
        TEST_ASSERT(up.bytes_transferred == size, "uploaded " << up.bytes_transferred << " of " << size);
        TEST_ASSERT(fs::file_size(h.root / "rt" / name) == static_cast<uintmax_t>(size), "server size for " << name);
        TEST_ASSERT(client->checksum("/rt/" + name) == crypto::sha256_file_hex(src.string()),
                    "server checksum for " << name);

        fs::path back = h.local / ("back_" + name);
        auto down = client->download("/rt/" + name, back.string(), nullptr, nullptr);
        TEST_ASSERT(down.bytes_transferred == size, "downloaded " << down.bytes_transferred << " of " << size);
        TEST_ASSERT(read_file(back) == read_file(src), "content differs for " << name);
        if (size > kThreshold) {
            TEST_ASSERT(down.chunk_count > 1, "large download should be chunked");
        }
    }
    return true;
}

bool test_resume(Harness& h) {
    std::cout << "Testing download resume..." << std::endl;
    auto client = h.client();

    fs::path remote_file = h.root / "resume.bin";
    write_pattern(remote_file, 100000, 99);

    fs::path dst = h.local / "resume.bin";
    {
        // First 40000 bytes already present
        std::string all = read_file(remote_file);
        std::ofstream out(dst, std::ios::binary);
        out.write(all.data(), 40000);
    }
    auto partial = client->download("/resume.bin", dst.string(), nullptr, nullptr);
    TEST_ASSERT(partial.resumed_from == 40000, "resumed_from " << partial.resumed_from);
    TEST_ASSERT(partial.bytes_transferred == 60000, "only the tail should move, got " << partial.bytes_transferred);
    TEST_ASSERT(read_file(dst) == read_file(remote_file), "resumed content differs");

    auto again = client->download("/resume.bin", dst.string(), nullptr, nullptr);
    TEST_ASSERT(again.bytes_transferred == 0, "complete file should transfer nothing");
    return true;
}

bool test_wrong_key(Harness& h) {
    std::cout << "Testing connection with the wrong key..." << std::endl;

    ClientOptions options = h.client_options();
    options.handshake_timeout_ms = 1500;
    FerryClient client(options, TransportTuning{}, MuxConfig{});
    std::mutex states_mutex;
    std::vector<rpc::ConnectionState> states;
    client.set_state_callback([&](rpc::ConnectionState state) {
        std::lock_guard<std::mutex> lock(states_mutex);
        states.push_back(state);
    });

    auto started = std::chrono::steady_clock::now();
    bool threw = false;
    try {
        client.connect("xyz");
    } catch (const ConnectionError&) {
        threw = true;
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    TEST_ASSERT(threw, "wrong key should be a ConnectionError");
    TEST_ASSERT(elapsed.count() < 5000, "handshake should give up near its timeout, took " << elapsed.count() << " ms");
    TEST_ASSERT(!client.is_connected(), "client must stay disconnected");
    {
        std::lock_guard<std::mutex> lock(states_mutex);
        TEST_ASSERT(!states.empty() && states.front() == rpc::ConnectionState::DIALING, "dial reported first");
        TEST_ASSERT(states.back() == rpc::ConnectionState::FAILED, "handshake failure reported last");
    }

    threw = false;
    try {
        client.list("/");
    } catch (const ConnectionError&) {
        threw = true;
    }
    TEST_ASSERT(threw, "calls without a session raise ConnectionError");
    return true;
}

bool test_path_escapes(Harness& h) {
    std::cout << "Testing path escapes over the wire..." << std::endl;
    auto client = h.client();

    fs::path outside = h.base / "outside.txt";
    {
        std::ofstream out(outside);
        out << "keep";
    }
    fs::path src = h.local / "escape.txt";
    write_pattern(src, 10, 5);

    TEST_ASSERT(raises_path_safety([&] { client->list("../"); }), "list escape");
    TEST_ASSERT(raises_path_safety([&] { client->remove("../outside.txt"); }), "delete escape");
    TEST_ASSERT(raises_path_safety([&] { client->upload(src.string(), "../outside.txt", nullptr, nullptr); }),
                "upload escape");
    TEST_ASSERT(raises_path_safety([&] { client->make_directory("/../../made"); }), "mkdir escape");

    TEST_ASSERT(read_file(outside) == "keep", "file outside the root must be untouched");
    TEST_ASSERT(!fs::exists(h.base / "made"), "no directory created outside the root");

    // The session survives rejected requests
    TEST_ASSERT(client->is_connected(), "still connected after rejections");
    client->make_directory("/after-escape");
    TEST_ASSERT(fs::is_directory(h.root / "after-escape"), "requests still served");
    return true;
}

bool test_file_operations(Harness& h) {
    std::cout << "Testing remote file operations..." << std::endl;
    auto client = h.client();

    TEST_ASSERT(h.srv->session_count() >= 1, "server tracks the connected session");

    client->make_directory("/ops/inner");
    TEST_ASSERT(fs::is_directory(h.root / "ops" / "inner"), "mkdir");

    client->save_text("/ops/notes.txt", "hello\n");
    TEST_ASSERT(client->read_text("/ops/notes.txt") == "hello\n", "edit round trip");

    client->rename("/ops/notes.txt", "/ops/inner/renamed.txt");
    TEST_ASSERT(fs::exists(h.root / "ops" / "inner" / "renamed.txt"), "rename");

    client->copy("/ops/inner", "/ops/copied");
    TEST_ASSERT(fs::exists(h.root / "ops" / "copied" / "renamed.txt"), "copy");

    client->chmod("/ops/copied/renamed.txt", "640");
    wire::FileStat st = client->stat("/ops/copied/renamed.txt");
    TEST_ASSERT(st.mode_num == 0640 && st.size == 6 && !st.is_dir, "stat after chmod");

    auto items = client->list("/ops", false);
    TEST_ASSERT(items.size() == 2 && items[0].name == "copied" && items[1].name == "inner", "listing");
    auto all = client->list("/ops", true);
    TEST_ASSERT(all.size() == 4, "recursive listing has " << all.size() << " entries");

    client->remove("/ops/copied");
    TEST_ASSERT(!fs::exists(h.root / "ops" / "copied"), "delete");

    bool not_found = false;
    try {
        client->stat("/ops/missing");
    } catch (const ProtocolError& e) {
        not_found = e.status() == 404;
    }
    TEST_ASSERT(not_found, "missing path is a 404");

    bool root_refused = false;
    try {
        client->remove("/");
    } catch (const ProtocolError& e) {
        root_refused = e.status() == 400;
    }
    TEST_ASSERT(root_refused, "deleting the root is refused");
    return true;
}

bool test_server_archives(Harness& h) {
    std::cout << "Testing server-side compress and extract..." << std::endl;
    auto client = h.client();

    fs::create_directories(h.root / "pack" / "a");
    write_pattern(h.root / "pack" / "a" / "one.bin", 5000, 7);
    write_pattern(h.root / "pack" / "two.bin", 3000, 8);

    std::string reply = client->compress({"/pack/a", "/pack/two.bin"}, "/pack.zip", "zip", nullptr);
    TEST_ASSERT(reply.find("Compressed 2 items") != std::string::npos, "compress reply: " << reply);
    TEST_ASSERT(fs::is_regular_file(h.root / "pack.zip"), "archive created");

    // Default destination is the archive name without its extension
    fs::remove_all(h.root / "pack");
    reply = client->extract("/pack.zip", "", nullptr);
    TEST_ASSERT(reply.find("Extracted to /pack") != std::string::npos, "extract reply: " << reply);
    TEST_ASSERT(fs::file_size(h.root / "pack" / "a" / "one.bin") == 5000, "extracted to the default directory");

    client->extract("/pack.zip", "/unzipped", nullptr);
    TEST_ASSERT(read_file(h.root / "unzipped" / "a" / "one.bin") == read_file(h.root / "pack" / "a" / "one.bin"),
                "extracted file content");
    TEST_ASSERT(fs::is_regular_file(h.root / "pack.zip"), "explicit extract keeps the archive");
    TEST_ASSERT(fs::is_regular_file(h.root / "unzipped" / "two.bin"), "second source extracted");

    bool bad_format = false;
    try {
        client->compress({"/pack"}, "/pack.rar", "rar", nullptr);
    } catch (const ProtocolError& e) {
        bad_format = e.status() == 400;
    }
    TEST_ASSERT(bad_format, "unknown format is a 400");
    return true;
}

bool test_packed_folder_round_trip(Harness& h) {
    std::cout << "Testing packed folder upload and download..." << std::endl;
    auto client = h.client();

    fs::path tree = h.local / "album";
    fs::create_directories(tree / "2024" / "summer");
    write_pattern(tree / "2024" / "summer" / "beach.raw", 300000, 11);
    write_pattern(tree / "2024" / "index.txt", 120, 12);
    fs::create_directories(tree / "empty");

    auto up = client->upload(tree.string(), "/photos/album", nullptr, nullptr);
    TEST_ASSERT(up.packed, "folder upload must be packed");

    // Extraction runs in the background on the server
    TEST_ASSERT(wait_for([&] {
        return fs::exists(h.root / "photos" / "album" / "2024" / "summer" / "beach.raw") &&
               !fs::exists(h.root / "photos" / "album.tar.gz");
    }),
                "server did not unpack the folder");
    TEST_ASSERT(read_file(h.root / "photos" / "album" / "2024" / "summer" / "beach.raw") ==
                    read_file(tree / "2024" / "summer" / "beach.raw"),
                "unpacked content differs");
    TEST_ASSERT(fs::is_directory(h.root / "photos" / "album" / "empty"), "empty directory kept");

    fs::path fetched = h.local / "fetched";
    auto down = client->download("/photos/album", fetched.string(), nullptr, nullptr);
    TEST_ASSERT(down.packed, "directory download must be packed");
    TEST_ASSERT(read_file(fetched / "2024" / "index.txt") == read_file(tree / "2024" / "index.txt"),
                "downloaded folder content differs");
    TEST_ASSERT(fs::is_directory(fetched / "empty"), "empty directory downloaded");
    TEST_ASSERT(!fs::exists(h.root / "photos" / "album.tar.gz"), "remote archive removed after download");

    bool exists = false;
    try {
        client->download("/photos/album", fetched.string(), nullptr, nullptr);
    } catch (const IOError&) {
        exists = true;
    }
    TEST_ASSERT(exists, "downloading a folder over an existing directory is refused");
    return true;
}

bool test_packed_large_file(Harness& h) {
    std::cout << "Testing packed transfer of a large file..." << std::endl;

    PackTransferConfig pack;
    pack.enabled = true;
    pack.threshold_bytes = 64 * 1024;
    pack.scratch_dir = (h.base / "scratch").string();
    fs::create_directories(pack.scratch_dir);
    auto client = h.client(pack);

    fs::path src = h.local / "large.log";
    {
        std::ofstream out(src);
        for (int i = 0; i < 20000; ++i) {
            out << "line " << i << " of a very compressible log file\n";
        }
    }
    auto up = client->upload(src.string(), "/logs/large.log", nullptr, nullptr);
    TEST_ASSERT(up.packed, "file over the threshold is packed");
    TEST_ASSERT(up.bytes_transferred < static_cast<int64_t>(fs::file_size(src)), "packed upload is smaller");
    TEST_ASSERT(wait_for([&] { return fs::exists(h.root / "logs" / "large.log"); }), "server unpacked the file");
    TEST_ASSERT(wait_for([&] { return !fs::exists(h.root / "logs" / "large.log.tar.gz"); }),
                "server removes the uploaded archive");
    TEST_ASSERT(read_file(h.root / "logs" / "large.log") == read_file(src), "unpacked file content");

    fs::path back = h.local / "large_back.log";
    auto down = client->download("/logs/large.log", back.string(), nullptr, nullptr);
    TEST_ASSERT(down.packed, "large file download is packed");
    TEST_ASSERT(read_file(back) == read_file(src), "packed download content");
    TEST_ASSERT(fs::is_empty(pack.scratch_dir), "scratch archives are cleaned up");
    return true;
}

bool test_checksum_mismatch(Harness& h) {
    std::cout << "Testing checksum mismatch after a transfer..." << std::endl;
    MisbehavingServer srv(h.root);
    TEST_ASSERT(srv.endpoint, "cannot start the misbehaving server");
    auto client = h.client_for(srv.port());

    fs::path src = h.local / "tamper_src.bin";
    write_pattern(src, 3 * kThreshold + 5, 41);
    fs::path small = h.root / "tamper" / "small.bin";
    fs::create_directories(small.parent_path());
    write_pattern(small, 1000, 42);

    srv.handler->wrong_checksum = true;
    TEST_ASSERT(raises_integrity([&] { client->upload(src.string(), "/tamper/up.bin", nullptr, nullptr); }),
                "chunked upload with a bad server checksum must raise IntegrityError");
    TEST_ASSERT(read_file(h.root / "tamper" / "up.bin") == read_file(src), "every chunk still landed");

    TEST_ASSERT(raises_integrity([&] {
        client->download("/tamper/small.bin", (h.local / "small_back.bin").string(), nullptr, nullptr);
    }),
                "single-stream download must raise IntegrityError");
    TEST_ASSERT(raises_integrity([&] {
        client->download("/tamper/up.bin", (h.local / "up_back.bin").string(), nullptr, nullptr);
    }),
                "chunked download must raise IntegrityError");

    srv.handler->wrong_checksum = false;
    fs::remove(h.local / "up_back.bin");
    auto ok = client->download("/tamper/up.bin", (h.local / "up_back.bin").string(), nullptr, nullptr);
    TEST_ASSERT(ok.chunk_count > 1, "expected a chunked download");
    TEST_ASSERT(read_file(h.local / "up_back.bin") == read_file(src), "honest checksum passes");
    return true;
}

bool test_range_ignored_by_server(Harness& h) {
    std::cout << "Testing resume against a server that ignores ranges..." << std::endl;
    MisbehavingServer srv(h.root);
    TEST_ASSERT(srv.endpoint, "cannot start the misbehaving server");
    srv.handler->ignore_range = true;
    auto client = h.client_for(srv.port());

    const int64_t size = 100000;
    fs::path remote_file = h.root / "norange.bin";
    write_pattern(remote_file, size, 77);
    fs::path dst = h.local / "norange.bin";
    {
        std::string all = read_file(remote_file);
        std::ofstream out(dst, std::ios::binary);
        out.write(all.data(), 40000);
    }

    std::mutex mutex;
    std::vector<transfer::TransferProgress> samples;
    auto report = client->download("/norange.bin", dst.string(),
                                   [&](const transfer::TransferProgress& p) {
                                       std::lock_guard<std::mutex> lock(mutex);
                                       samples.push_back(p);
                                   },
                                   nullptr);
    TEST_ASSERT(report.resumed_from == 0, "the whole file was resent, resumed_from " << report.resumed_from);
    TEST_ASSERT(report.bytes_transferred == size, "bytes_transferred " << report.bytes_transferred);
    TEST_ASSERT(read_file(dst) == read_file(remote_file), "content differs");

    std::lock_guard<std::mutex> lock(mutex);
    TEST_ASSERT(!samples.empty(), "no progress reported");
    for (const auto& p : samples) {
        TEST_ASSERT(p.bytes_done <= size && p.fraction <= 1.0,
                    "progress overcounted: " << p.bytes_done << " of " << size);
    }
    TEST_ASSERT(samples.back().bytes_done == size, "final progress " << samples.back().bytes_done);
    return true;
}

int main() {
    std::cout << "Running End-to-End Tests..." << std::endl;
    set_log_level(LogLevel::WARNING);

    Harness h;
    if (!h.srv->start()) {
        std::cerr << "cannot start loopback server" << std::endl;
        return 1;
    }

    test_round_trips(h);
    test_resume(h);
    test_checksum_mismatch(h);
    test_range_ignored_by_server(h);
    test_wrong_key(h);
    test_path_escapes(h);
    test_file_operations(h);
    test_server_archives(h);
    test_packed_folder_round_trip(h);
    test_packed_large_file(h);

    if (tests_failed == 0) {
        std::cout << "ALL END-TO-END TESTS PASSED" << std::endl;
        return 0;
    } else {
        std::cerr << tests_failed << " TESTS FAILED" << std::endl;
        return 1;
    }
}
