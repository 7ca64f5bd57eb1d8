#include "transfer_engine.h"
#include "byte_range.h"
#include "counting_semaphore.h"
#include "errors.h"
#include "file_hash.h"
#include "logger.h"

#include <algorithm>
#include <condition_variable>
#include <cstdio>
#include <deque>
#include <exception>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace ferry::transfer {

namespace {

constexpr size_t kCopyBufferSize = 256 * 1024;

wire::RequestHead make_head(const std::string& method, const std::string& action, const std::string& path) {
    wire::RequestHead head;
    head.method = method;
    head.action = action;
    head.params["path"] = path;
    return head;
}

[[noreturn]] void fail_with_response(rpc::ClientExchange& ex) {
    const wire::ResponseHead& head = ex.read_response_head();
    std::string body;
    try {
        body = ex.read_body_all();
    } catch (const ConnectionError&) {
        body = "(no detail)";
    }
    throw_for_status(head.status, body);
}

void expect_ok(rpc::ClientExchange& ex) {
    const wire::ResponseHead& head = ex.read_response_head();
    if (!head.ok()) {
        fail_with_response(ex);
    }
    ex.read_body_all();
}

// Streams [offset, offset + len) of a local file as the request body.
void send_file_range(rpc::ClientExchange& ex, const std::string& local_path, int64_t offset, int64_t len,
                     ProgressTicker& ticker, CancellationToken* cancel) {
    std::ifstream in(local_path, std::ios::binary);
    if (!in) {
        throw IOError("cannot open " + local_path);
    }
    in.seekg(offset);
    std::vector<char> buf(kCopyBufferSize);
    int64_t left = len;
    while (left > 0) {
        if (cancel) cancel->throw_if_canceled();
        size_t want = static_cast<size_t>(std::min<int64_t>(left, static_cast<int64_t>(buf.size())));
        in.read(buf.data(), static_cast<std::streamsize>(want));
        size_t got = static_cast<size_t>(in.gcount());
        if (got == 0) {
            throw IOError(local_path + " changed size during upload");
        }
        try {
            ex.write_body(buf.data(), got);
        } catch (const ConnectionError&) {
            // The server may have rejected the request and closed the stream early
            bool rejected = false;
            try {
                rejected = !ex.read_response_head().ok();
            } catch (const ConnectionError&) {
                rejected = false;
            }
            if (rejected) {
                fail_with_response(ex);
            }
            throw;
        }
        ticker.add(static_cast<int64_t>(got));
        left -= static_cast<int64_t>(got);
    }
}

// Copies the response body into out. Returns the byte count.
int64_t receive_body(rpc::ClientExchange& ex, std::ofstream& out, const std::string& path, ProgressTicker& ticker,
                     CancellationToken* cancel) {
    std::vector<uint8_t> buf(kCopyBufferSize);
    int64_t total = 0;
    size_t n;
    while ((n = ex.read_body(buf.data(), buf.size())) > 0) {
        out.write(reinterpret_cast<const char*>(buf.data()), static_cast<std::streamsize>(n));
        if (!out) {
            throw IOError("write failed: " + path);
        }
        ticker.add(static_cast<int64_t>(n));
        total += static_cast<int64_t>(n);
        if (cancel) cancel->throw_if_canceled();
    }
    return total;
}

int64_t local_size(const std::string& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) {
        throw IOError("cannot stat " + path + ": " + ec.message());
    }
    return static_cast<int64_t>(size);
}

void ensure_parent(const std::string& path) {
    fs::path parent = fs::path(path).parent_path();
    if (parent.empty()) {
        return;
    }
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        throw IOError("cannot create directory " + parent.string() + ": " + ec.message());
    }
}

// Removes the chunk directory however the download ends.
class TempDirGuard {
public:
    explicit TempDirGuard(fs::path dir) : m_dir(std::move(dir)) {}
    ~TempDirGuard() {
        std::error_code ec;
        fs::remove_all(m_dir, ec);
        if (ec) {
            LOG_WARN("XFER: could not remove " + m_dir.string() + ": " + ec.message());
        }
    }
    TempDirGuard(const TempDirGuard&) = delete;
    TempDirGuard& operator=(const TempDirGuard&) = delete;

private:
    fs::path m_dir;
};

std::string chunk_file_name(const fs::path& dir, int index) {
    char name[32];
    std::snprintf(name, sizeof(name), "chunk_%04d.tmp", index);
    return (dir / name).string();
}

} // namespace

TransferEngine::TransferEngine(std::shared_ptr<rpc::Session> session, ClientOptions options)
    : m_session(std::move(session)), m_options(std::move(options)) {}

// ============================================================================
// REMOTE QUERIES
// ============================================================================

int64_t TransferEngine::remote_size(const std::string& remote_path, CancellationToken* cancel) const {
    auto ex = m_session->client().open(cancel);
    ex->send_head(make_head("HEAD", "download", remote_path));
    const wire::ResponseHead& head = ex->read_response_head();
    if (!head.ok()) {
        fail_with_response(*ex);
    }
    const std::string value = head.header(wire::kHeaderFileSize);
    try {
        size_t used = 0;
        int64_t size = std::stoll(value, &used);
        if (used != value.size() || size < 0) {
            throw std::invalid_argument(value);
        }
        return size;
    } catch (const std::logic_error&) {
        throw ProtocolError(head.status, "server sent no usable file size for " + remote_path);
    }
}

std::string TransferEngine::remote_checksum(const std::string& remote_path, CancellationToken* cancel) const {
    rpc::Response resp = m_session->client().call(make_head("GET", "checksum", remote_path), "", cancel);
    if (!resp.head.ok()) {
        throw_for_status(resp.head.status, resp.body);
    }
    std::string sum = resp.body;
    while (!sum.empty() && (sum.back() == '\n' || sum.back() == '\r' || sum.back() == ' ')) {
        sum.pop_back();
    }
    return sum;
}

void TransferEngine::verify(const std::string& remote_path, const std::string& local_path,
                            CancellationToken* cancel) const {
    std::string remote = remote_checksum(remote_path, cancel);
    std::string local = crypto::sha256_file_hex(local_path);
    if (remote != local) {
        LOG_ERROR("XFER: checksum mismatch for " + remote_path + " (remote " + remote + ", local " + local + ")");
        throw IntegrityError(remote, local);
    }
    LOG_DEBUG("XFER: checksum verified for " + remote_path);
}

// ============================================================================
// PARALLEL CHUNK EXECUTION
// ============================================================================

void TransferEngine::run_chunks(const std::vector<Chunk>& chunks, CancellationToken* cancel,
                                const ChunkWork& work) const {
    struct ChunkResult {
        int index;
        std::exception_ptr error;
    };

    CancellationToken abort;
    CancellationSubscription link(cancel, [&abort] { abort.cancel(); });
    CountingSemaphore slots(std::max(1, m_options.chunk_workers));

    std::mutex results_mutex;
    std::condition_variable results_cv;
    std::deque<ChunkResult> results;

    std::vector<std::thread> workers;
    workers.reserve(chunks.size());
    for (const Chunk& chunk : chunks) {
        workers.emplace_back([&, chunk] {
            ChunkResult result{chunk.index, nullptr};
            if (!slots.acquire_unless([&abort] { return abort.is_canceled(); })) {
                result.error = std::make_exception_ptr(CancellationError());
            } else {
                SemaphoreGuard slot(slots);
                try {
                    work(chunk, &abort);
                } catch (...) {
                    result.error = std::current_exception();
                }
            }
            {
                std::lock_guard<std::mutex> lock(results_mutex);
                results.push_back(result);
            }
            results_cv.notify_one();
        });
    }

    // Completion order is arbitrary; only the first failure matters
    std::exception_ptr first_error;
    int failed_index = -1;
    for (size_t received = 0; received < chunks.size(); ++received) {
        ChunkResult result;
        {
            std::unique_lock<std::mutex> lock(results_mutex);
            results_cv.wait(lock, [&results] { return !results.empty(); });
            result = results.front();
            results.pop_front();
        }
        if (result.error && !first_error) {
            first_error = result.error;
            failed_index = result.index;
            abort.cancel();
        }
    }
    for (auto& t : workers) {
        t.join();
    }

    if (cancel && cancel->is_canceled()) {
        throw CancellationError();
    }
    if (first_error) {
        LOG_WARN("XFER: chunk " + std::to_string(failed_index) + " failed, abandoning transfer");
        std::rethrow_exception(first_error);
    }
}

// ============================================================================
// DOWNLOAD
// ============================================================================

TransferReport TransferEngine::download(const std::string& remote_path, const std::string& local_path,
                                        ProgressCallback progress, CancellationToken* cancel) {
    int64_t size = remote_size(remote_path, cancel);
    if (size < m_options.chunk_threshold_bytes) {
        return download_single(remote_path, local_path, size, std::move(progress), cancel);
    }
    return download_parallel(remote_path, local_path, size, std::move(progress), cancel);
}

TransferReport TransferEngine::download_single(const std::string& remote_path, const std::string& local_path,
                                               int64_t size, ProgressCallback progress, CancellationToken* cancel) {
    TransferReport report;
    int64_t start = 0;
    std::error_code ec;
    if (size > 0 && fs::is_regular_file(local_path, ec)) {
        start = local_size(local_path);
    }

    if (size > 0 && start >= size) {
        LOG_INFO("XFER: " + local_path + " already complete, nothing to download");
        report.resumed_from = start;
        return report;
    }

    ensure_parent(local_path);
    wire::RequestHead head = make_head("GET", "download", remote_path);
    if (start > 0) {
        head.headers[wire::kHeaderRange] = wire::format_open_range(start);
        LOG_INFO("XFER: resuming " + remote_path + " at byte " + std::to_string(start));
    }

    auto ex = m_session->client().open(cancel);
    ex->send_head(head);
    const wire::ResponseHead& resp = ex->read_response_head();
    if (resp.status != wire::kStatusOk && resp.status != wire::kStatusPartialContent) {
        fail_with_response(*ex);
    }
    if (start > 0 && resp.status == wire::kStatusOk) {
        LOG_WARN("XFER: server ignored the range for " + remote_path + ", downloading from the start");
        start = 0;
    }

    // Counts from wherever the response actually starts
    ProgressTicker ticker(size, start, std::chrono::milliseconds(m_options.progress_interval_ms), progress);

    std::ofstream out;
    if (start > 0) {
        out.open(local_path, std::ios::binary | std::ios::in | std::ios::out);
        out.seekp(start);
    } else {
        out.open(local_path, std::ios::binary | std::ios::trunc);
    }
    if (!out) {
        throw IOError("cannot open " + local_path + " for writing");
    }

    int64_t received = receive_body(*ex, out, local_path, ticker, cancel);
    out.close();
    if (!out) {
        throw IOError("close failed: " + local_path);
    }
    ticker.stop();

    verify(remote_path, local_path, cancel);

    report.bytes_transferred = received;
    report.resumed_from = start;
    report.elapsed_seconds = ticker.elapsed_seconds();
    LOG_INFO("XFER: downloaded " + remote_path + " (" + std::to_string(received) + " bytes)");
    return report;
}

void TransferEngine::download_chunk(const std::string& remote_path, const Chunk& chunk, const std::string& chunk_file,
                                    ProgressTicker& ticker, CancellationToken* cancel) const {
    wire::RequestHead head = make_head("GET", "download", remote_path);
    head.headers[wire::kHeaderRange] = wire::format_range(chunk.start, chunk.last());

    auto ex = m_session->client().open(cancel);
    ex->send_head(head);
    const wire::ResponseHead& resp = ex->read_response_head();
    if (resp.status != wire::kStatusPartialContent && resp.status != wire::kStatusOk) {
        fail_with_response(*ex);
    }
    if (resp.content_length != chunk.length()) {
        throw ProtocolError(resp.status, "chunk " + std::to_string(chunk.index) + ": expected " +
                                             std::to_string(chunk.length()) + " bytes, server sent " +
                                             std::to_string(resp.content_length));
    }

    std::ofstream out(chunk_file, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw IOError("cannot create " + chunk_file);
    }
    receive_body(*ex, out, chunk_file, ticker, cancel);
    out.close();
    if (!out) {
        throw IOError("close failed: " + chunk_file);
    }
}

TransferReport TransferEngine::download_parallel(const std::string& remote_path, const std::string& local_path,
                                                 int64_t size, ProgressCallback progress,
                                                 CancellationToken* cancel) {
    std::vector<Chunk> chunks = plan_chunks(size, m_options.chunk_workers, m_options.chunk_threshold_bytes);
    LOG_DEBUG("XFER: parallel download: size=" + std::to_string(size) + ", chunks=" + std::to_string(chunks.size()));

    ensure_parent(local_path);
    fs::path local(local_path);
    fs::path temp_dir = local.parent_path() / (".tmp_" + local.filename().string());
    std::error_code ec;
    fs::remove_all(temp_dir, ec);
    fs::create_directories(temp_dir, ec);
    if (ec) {
        throw IOError("cannot create " + temp_dir.string() + ": " + ec.message());
    }
    TempDirGuard cleanup(temp_dir);

    ProgressTicker ticker(size, 0, std::chrono::milliseconds(m_options.progress_interval_ms), progress);
    run_chunks(chunks, cancel, [&](const Chunk& chunk, CancellationToken* chunk_cancel) {
        download_chunk(remote_path, chunk, chunk_file_name(temp_dir, chunk.index), ticker, chunk_cancel);
    });
    ticker.stop();

    // Merge strictly by index
    {
        std::ofstream out(local_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw IOError("cannot create " + local_path);
        }
        std::vector<char> buf(kCopyBufferSize);
        for (const Chunk& chunk : chunks) {
            std::ifstream in(chunk_file_name(temp_dir, chunk.index), std::ios::binary);
            if (!in) {
                out.close();
                fs::remove(local_path, ec);
                throw IOError("missing chunk " + std::to_string(chunk.index));
            }
            while (in) {
                in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
                out.write(buf.data(), in.gcount());
            }
            if (!out) {
                out.close();
                fs::remove(local_path, ec);
                throw IOError("write failed while merging chunk " + std::to_string(chunk.index));
            }
        }
    }

    verify(remote_path, local_path, cancel);

    TransferReport report;
    report.bytes_transferred = ticker.transferred();
    report.chunk_count = static_cast<int>(chunks.size());
    report.elapsed_seconds = ticker.elapsed_seconds();
    LOG_INFO("XFER: downloaded " + remote_path + " in " + std::to_string(chunks.size()) + " chunks");
    return report;
}

// ============================================================================
// UPLOAD
// ============================================================================

TransferReport TransferEngine::upload(const std::string& local_path, const std::string& remote_path,
                                      const UploadOptions& upload_options, ProgressCallback progress,
                                      CancellationToken* cancel) {
    std::error_code ec;
    if (!fs::is_regular_file(local_path, ec)) {
        throw IOError("not a regular file: " + local_path);
    }
    int64_t size = local_size(local_path);

    TransferReport report = size < m_options.chunk_threshold_bytes
                                ? upload_single(local_path, remote_path, size, std::move(progress), cancel)
                                : upload_parallel(local_path, remote_path, size, std::move(progress), cancel);

    verify(remote_path, local_path, cancel);
    if (upload_options.auto_extract) {
        finalize_upload(remote_path, size, cancel);
    }
    return report;
}

TransferReport TransferEngine::upload_single(const std::string& local_path, const std::string& remote_path,
                                             int64_t size, ProgressCallback progress, CancellationToken* cancel) {
    ProgressTicker ticker(size, 0, std::chrono::milliseconds(m_options.progress_interval_ms), progress);

    wire::RequestHead head = make_head("PUT", "upload", remote_path);
    head.content_length = size;
    auto ex = m_session->client().open(cancel);
    ex->send_head(head);
    send_file_range(*ex, local_path, 0, size, ticker, cancel);
    expect_ok(*ex);
    ticker.stop();

    TransferReport report;
    report.bytes_transferred = ticker.transferred();
    report.elapsed_seconds = ticker.elapsed_seconds();
    LOG_INFO("XFER: uploaded " + local_path + " (" + std::to_string(size) + " bytes)");
    return report;
}

void TransferEngine::upload_chunk(const std::string& local_path, const std::string& remote_path, const Chunk& chunk,
                                  int64_t size, ProgressTicker& ticker, CancellationToken* cancel) const {
    wire::RequestHead head = make_head("PUT", "upload", remote_path);
    head.headers[wire::kHeaderContentRange] = wire::format_content_range(chunk.start, chunk.last(), size);
    head.content_length = chunk.length();

    auto ex = m_session->client().open(cancel);
    ex->send_head(head);
    send_file_range(*ex, local_path, chunk.start, chunk.length(), ticker, cancel);
    expect_ok(*ex);
}

TransferReport TransferEngine::upload_parallel(const std::string& local_path, const std::string& remote_path,
                                               int64_t size, ProgressCallback progress, CancellationToken* cancel) {
    std::vector<Chunk> chunks = plan_chunks(size, m_options.chunk_workers, m_options.chunk_threshold_bytes);
    LOG_DEBUG("XFER: parallel upload: size=" + std::to_string(size) + ", chunks=" + std::to_string(chunks.size()));

    ProgressTicker ticker(size, 0, std::chrono::milliseconds(m_options.progress_interval_ms), progress);
    run_chunks(chunks, cancel, [&](const Chunk& chunk, CancellationToken* chunk_cancel) {
        upload_chunk(local_path, remote_path, chunk, size, ticker, chunk_cancel);
    });
    ticker.stop();

    TransferReport report;
    report.bytes_transferred = ticker.transferred();
    report.chunk_count = static_cast<int>(chunks.size());
    report.elapsed_seconds = ticker.elapsed_seconds();
    LOG_INFO("XFER: uploaded " + local_path + " in " + std::to_string(chunks.size()) + " chunks");
    return report;
}

void TransferEngine::finalize_upload(const std::string& remote_path, int64_t size, CancellationToken* cancel) const {
    wire::RequestHead head = make_head("PUT", "upload", remote_path);
    head.headers[wire::kHeaderContentRange] = wire::format_complete_length(size);
    head.headers[wire::kHeaderAutoExtract] = "1";
    rpc::Response resp = m_session->client().call(head, "", cancel);
    if (!resp.head.ok()) {
        throw_for_status(resp.head.status, resp.body);
    }
}

} // namespace ferry::transfer
