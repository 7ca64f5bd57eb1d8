#include "byte_range.h"
#include "errors.h"
#include "list_item.h"
#include "request_server.h"
#include "settings.h"
#include "transfer_types.h"
#include "wire_protocol.h"

#include <algorithm>
#include <atomic>
#include <cstring>
#include <deque>
#include <iostream>
#include <memory>
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

using namespace ferry;

namespace {

// Loopback stream: everything written becomes readable.
class BufferStream : public ByteStream {
public:
    IoStatus read(uint8_t* buf, size_t len, size_t& n, std::chrono::milliseconds) override {
        if (m_pos >= m_data.size()) {
            n = 0;
            return IoStatus::Eof;
        }
        n = std::min(len, m_data.size() - m_pos);
        std::memcpy(buf, m_data.data() + m_pos, n);
        m_pos += n;
        return IoStatus::Ok;
    }
    bool write(const uint8_t* data, size_t len) override {
        m_data.append(reinterpret_cast<const char*>(data), len);
        return true;
    }
    void close() override {}
    uint32_t id() const override { return 1; }

    std::string& data() { return m_data; }

private:
    std::string m_data;
    size_t m_pos = 0;
};

constexpr std::chrono::milliseconds kTimeout{100};

// Hands out a fixed set of streams, then reports itself closed.
class ScriptedAcceptor : public StreamAcceptor {
public:
    explicit ScriptedAcceptor(std::vector<std::shared_ptr<BufferStream>> streams)
        : m_streams(streams.begin(), streams.end()) {}

    std::shared_ptr<ByteStream> accept(std::chrono::milliseconds) override {
        if (m_streams.empty()) {
            m_closed = true;
            return nullptr;
        }
        auto next = m_streams.front();
        m_streams.pop_front();
        return next;
    }
    void close() override { m_closed = true; }
    bool is_closed() const override { return m_closed; }
    std::string local_address() const override { return "scripted"; }

private:
    std::deque<std::shared_ptr<BufferStream>> m_streams;
    bool m_closed = false;
};

// Takes a while per request and counts completions.
class SlowHandler : public rpc::RequestHandler {
public:
    explicit SlowHandler(std::shared_ptr<std::atomic<int>> done) : m_done(std::move(done)) {}

    void handle(rpc::ServerExchange& ex) override {
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        if (ex.request().action == "fail") {
            throw ProtocolError(wire::kStatusNotFound, "no such thing");
        }
        m_done->fetch_add(1);
        ex.respond(wire::kStatusOk, "handled " + ex.request().action);
    }

private:
    std::shared_ptr<std::atomic<int>> m_done;
};

} // namespace

bool test_range_parsing() {
    std::cout << "Testing Range header parsing..." << std::endl;

    auto r = wire::parse_range("bytes=0-99");
    TEST_ASSERT(r && r->start == 0 && r->end == 99, "bytes=0-99");

    r = wire::parse_range("bytes=4096-");
    TEST_ASSERT(r && r->start == 4096 && r->open_ended(), "open-ended range");

    TEST_ASSERT(!wire::parse_range("bytes=-500"), "suffix ranges are not supported");
    TEST_ASSERT(!wire::parse_range("bytes=10-5"), "end before start");
    TEST_ASSERT(!wire::parse_range("items=0-5"), "wrong unit");
    TEST_ASSERT(!wire::parse_range("bytes=0-5,10-20"), "multi-range");

    TEST_ASSERT(wire::format_range(5, 9) == "bytes=5-9", "format_range");
    TEST_ASSERT(wire::format_open_range(7) == "bytes=7-", "format_open_range");
    return true;
}

bool test_content_range_parsing() {
    std::cout << "Testing Content-Range header parsing..." << std::endl;

    auto cr = wire::parse_content_range("bytes 100-199/1000");
    TEST_ASSERT(cr && cr->start == 100 && cr->end == 199 && cr->total == 1000, "bytes 100-199/1000");

    cr = wire::parse_content_range("bytes 0-9/*");
    TEST_ASSERT(cr && cr->total == -1, "unknown total");

    TEST_ASSERT(!wire::parse_content_range("bytes 0-1000/1000"), "end must be below total");
    TEST_ASSERT(!wire::parse_content_range("bytes 9-0/10"), "inverted span");
    TEST_ASSERT(!wire::parse_content_range("bytes */10"), "complete length is not a span");

    auto total = wire::parse_complete_length("bytes */10");
    TEST_ASSERT(total && *total == 10, "bytes */10");
    TEST_ASSERT(!wire::parse_complete_length("bytes 0-1/10"), "span is not a complete length");
    TEST_ASSERT(wire::format_content_range(0, 9, 10) == "bytes 0-9/10", "format_content_range");
    return true;
}

bool test_chunk_plan_partitions() {
    std::cout << "Testing chunk plans partition the file..." << std::endl;

    const int64_t threshold = 4 * kMiB;
    const std::vector<int64_t> sizes = {1, 17, threshold - 1, threshold, threshold + 1, 8 * threshold,
                                        8 * threshold + 3, 33 * threshold + 12345};
    const std::vector<int> workers = {1, 3, 8, 16};

    for (int64_t size : sizes) {
        for (int n : workers) {
            auto chunks = transfer::plan_chunks(size, n, threshold);
            TEST_ASSERT(!chunks.empty(), "empty plan for size " << size);
            TEST_ASSERT(chunks.front().start == 0, "first chunk must start at 0");
            TEST_ASSERT(chunks.back().end == size, "last chunk must end at " << size);
            TEST_ASSERT(static_cast<int>(chunks.size()) <= n, "more chunks than workers for size " << size);
            for (size_t i = 0; i < chunks.size(); ++i) {
                TEST_ASSERT(chunks[i].index == static_cast<int>(i), "chunk index out of order");
                TEST_ASSERT(chunks[i].length() > 0, "empty chunk");
                if (i > 0) {
                    TEST_ASSERT(chunks[i].start == chunks[i - 1].end, "gap or overlap at chunk " << i);
                }
                if (i + 1 < chunks.size()) {
                    TEST_ASSERT(chunks[i].length() >= threshold, "inner chunk below threshold");
                }
            }
        }
    }

    TEST_ASSERT(transfer::plan_chunks(0, 8, threshold).empty(), "size 0 gives no chunks");

    // 8 workers, 64 MiB: eight 8 MiB chunks
    auto even = transfer::plan_chunks(64 * kMiB, 8, threshold);
    TEST_ASSERT(even.size() == 8 && even[0].length() == 8 * kMiB, "64 MiB over 8 workers");
    TEST_ASSERT(even[7].last() == 64 * kMiB - 1, "inclusive end of last chunk");

    // Chunk size is raised to the threshold, so fewer chunks than workers
    auto small = transfer::plan_chunks(10 * kMiB, 8, threshold);
    TEST_ASSERT(small.size() == 3, "10 MiB should give 3 chunks, got " << small.size());
    return true;
}

bool test_head_frames() {
    std::cout << "Testing request and response head frames..." << std::endl;

    BufferStream stream;
    wire::RequestHead req;
    req.method = "PUT";
    req.action = "upload";
    req.params["path"] = "/a b/c.txt";
    req.headers[wire::kHeaderContentRange] = "bytes 0-9/20";
    req.content_length = 10;
    wire::write_request_head(stream, req);

    wire::RequestHead got = wire::read_request_head(stream, kTimeout);
    TEST_ASSERT(got.method == "PUT" && got.action == "upload", "method/action");
    TEST_ASSERT(got.param("path") == "/a b/c.txt", "path param");
    TEST_ASSERT(got.param("missing", "dflt") == "dflt", "param fallback");
    TEST_ASSERT(got.header(wire::kHeaderContentRange) == "bytes 0-9/20", "header");
    TEST_ASSERT(got.content_length == 10, "content length");

    wire::ResponseHead resp;
    resp.status = wire::kStatusPartialContent;
    resp.headers[wire::kHeaderFileSize] = "20";
    resp.content_length = 10;
    wire::write_response_head(stream, resp);
    wire::ResponseHead rgot = wire::read_response_head(stream, kTimeout);
    TEST_ASSERT(rgot.status == 206 && rgot.ok(), "206 is a success status");
    TEST_ASSERT(rgot.header(wire::kHeaderFileSize) == "20", "response header");
    return true;
}

bool test_malformed_frames() {
    std::cout << "Testing malformed head frames..." << std::endl;

    {
        // A response frame where a request is expected
        BufferStream stream;
        wire::write_response_head(stream, wire::ResponseHead{});
        bool threw = false;
        try {
            wire::read_request_head(stream, kTimeout);
        } catch (const ProtocolError&) {
            threw = true;
        }
        TEST_ASSERT(threw, "wrong frame type should be a ProtocolError");
    }
    {
        BufferStream stream;
        std::string frame = wire::encode_frame(wire::FrameType::REQUEST_HEAD, "{not json");
        stream.write(reinterpret_cast<const uint8_t*>(frame.data()), frame.size());
        bool threw = false;
        try {
            wire::read_request_head(stream, kTimeout);
        } catch (const ProtocolError& e) {
            threw = e.status() == wire::kStatusBadRequest;
        }
        TEST_ASSERT(threw, "invalid JSON should be a 400 ProtocolError");
    }
    {
        // Stream ends mid-frame
        BufferStream stream;
        std::string frame = wire::encode_frame(wire::FrameType::REQUEST_HEAD, "{}");
        stream.write(reinterpret_cast<const uint8_t*>(frame.data()), frame.size() - 1);
        bool threw = false;
        try {
            wire::read_request_head(stream, kTimeout);
        } catch (const ConnectionError&) {
            threw = true;
        }
        TEST_ASSERT(threw, "truncated frame should be a ConnectionError");
    }
    return true;
}

bool test_list_item_json() {
    std::cout << "Testing listing JSON field names..." << std::endl;

    wire::FileStat st;
    st.name = "a.txt";
    st.path = "/docs/a.txt";
    st.size = 42;
    st.mod_time = 1700000000;
    st.is_dir = false;
    st.mode = "-rw-r--r--";
    st.mode_num = 0644;

    nlohmann::json j = st;
    TEST_ASSERT(j["name"] == "a.txt" && j["path"] == "/docs/a.txt", "name/path");
    TEST_ASSERT(j["size"] == 42 && j["modTime"] == 1700000000, "size/modTime");
    TEST_ASSERT(j["isDir"] == false && j["mode"] == "-rw-r--r--", "isDir/mode");
    TEST_ASSERT(j["modeNum"] == 0644, "modeNum");

    wire::ListItem item = nlohmann::json::parse(R"({"name":"d","path":"/d","size":0,"modTime":5,"isDir":true,"mode":"drwxr-xr-x"})")
                              .get<wire::ListItem>();
    TEST_ASSERT(item.is_dir && item.mod_time == 5 && item.path == "/d", "ListItem from JSON");
    return true;
}

bool test_request_server_drains_on_shutdown() {
    std::cout << "Testing request server shutdown with requests in flight..." << std::endl;

    const int kRequests = 6;
    std::vector<std::shared_ptr<BufferStream>> streams;
    for (int i = 0; i < kRequests; ++i) {
        auto stream = std::make_shared<BufferStream>();
        wire::RequestHead req;
        req.method = "GET";
        req.action = i == 0 ? "fail" : "job" + std::to_string(i);
        wire::write_request_head(*stream, req);
        streams.push_back(stream);
    }

    auto done = std::make_shared<std::atomic<int>>(0);
    {
        auto server = std::make_unique<rpc::RequestServer>(std::make_shared<SlowHandler>(done), kTimeout, 2);
        ScriptedAcceptor acceptor(streams);
        server->serve(acceptor);
        TEST_ASSERT(done->load() < kRequests - 1, "serve() should return before the handlers finish");
        server.reset();
        TEST_ASSERT(done->load() == kRequests - 1,
                    "destroying the server must wait for every request, finished " << done->load());
    }

    wire::ResponseHead failed = wire::read_response_head(*streams[0], kTimeout);
    TEST_ASSERT(failed.status == wire::kStatusNotFound, "handler error becomes its status, got " << failed.status);
    for (int i = 1; i < kRequests; ++i) {
        wire::ResponseHead resp = wire::read_response_head(*streams[i], kTimeout);
        TEST_ASSERT(resp.status == wire::kStatusOk, "request " << i << " answered with " << resp.status);
    }

    // Nothing is accepted once the server is shut down
    auto late = std::make_shared<BufferStream>();
    rpc::RequestServer stopped(std::make_shared<SlowHandler>(done), kTimeout, 1);
    stopped.shutdown();
    ScriptedAcceptor after({late});
    stopped.serve(after);
    TEST_ASSERT(late->data().empty(), "a stopped server must not answer");
    return true;
}

int main() {
    std::cout << "Running Protocol Tests..." << std::endl;

    test_range_parsing();
    test_content_range_parsing();
    test_chunk_plan_partitions();
    test_head_frames();
    test_malformed_frames();
    test_list_item_json();
    test_request_server_drains_on_shutdown();

    if (tests_failed == 0) {
        std::cout << "ALL PROTOCOL TESTS PASSED" << std::endl;
        return 0;
    } else {
        std::cerr << tests_failed << " TESTS FAILED" << std::endl;
        return 1;
    }
}
