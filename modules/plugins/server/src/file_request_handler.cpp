#include "file_request_handler.h"
#include "archive.h"
#include "byte_range.h"
#include "errors.h"
#include "logger.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <thread>

namespace fs = std::filesystem;

namespace ferry::server {

namespace {

constexpr size_t kIoBufferSize = 256 * 1024;

// Closes a raw descriptor on scope exit.
class FdGuard {
public:
    explicit FdGuard(int fd) : m_fd(fd) {}
    ~FdGuard() {
        if (m_fd >= 0) ::close(m_fd);
    }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int get() const { return m_fd; }

private:
    int m_fd;
};

bool is_tar_gz(const fs::path& p) {
    const std::string name = p.filename().string();
    const std::string suffix = ".tar.gz";
    return name.size() > suffix.size() && name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool flag_set(const std::string& value) {
    return value == "1" || value == "true";
}

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> out;
    size_t pos = 0;
    while (pos <= value.size()) {
        size_t comma = value.find(',', pos);
        if (comma == std::string::npos) comma = value.size();
        std::string item = value.substr(pos, comma - pos);
        size_t b = item.find_first_not_of(" \t");
        size_t e = item.find_last_not_of(" \t");
        if (b != std::string::npos) {
            out.push_back(item.substr(b, e - b + 1));
        }
        pos = comma + 1;
    }
    return out;
}

const std::string& require(const wire::RequestHead& req, const std::string& name, std::string& storage) {
    storage = req.param(name);
    if (storage.empty()) {
        throw ProtocolError(wire::kStatusBadRequest, "missing " + name + " parameter");
    }
    return storage;
}

int64_t file_size_of(int fd, const std::string& path) {
    struct stat st {};
    if (::fstat(fd, &st) != 0) {
        throw IOError("cannot stat " + path + ": " + std::strerror(errno));
    }
    return static_cast<int64_t>(st.st_size);
}

} // namespace

FileRequestHandler::FileRequestHandler(std::shared_ptr<FileService> files, std::shared_ptr<EventThreadPool> jobs)
    : m_files(std::move(files)), m_jobs(std::move(jobs)) {
    m_routes[""] = {{"GET", "HEAD", "PUT"}, &FileRequestHandler::handle_probe};
    m_routes["download"] = {{"GET", "HEAD"}, &FileRequestHandler::handle_download};
    m_routes["upload"] = {{"PUT"}, &FileRequestHandler::handle_upload};
    m_routes["list"] = {{"GET"}, &FileRequestHandler::handle_list};
    m_routes["stat"] = {{"GET"}, &FileRequestHandler::handle_stat};
    m_routes["checksum"] = {{"GET"}, &FileRequestHandler::handle_checksum};
    m_routes["delete"] = {{"DELETE"}, &FileRequestHandler::handle_delete};
    m_routes["mkdir"] = {{"POST"}, &FileRequestHandler::handle_mkdir};
    m_routes["rename"] = {{"POST"}, &FileRequestHandler::handle_rename};
    m_routes["copy"] = {{"POST"}, &FileRequestHandler::handle_copy};
    m_routes["chmod"] = {{"POST"}, &FileRequestHandler::handle_chmod};
    m_routes["edit"] = {{"GET", "PUT"}, &FileRequestHandler::handle_edit};
    m_routes["compress"] = {{"POST"}, &FileRequestHandler::handle_compress};
    m_routes["extract"] = {{"POST"}, &FileRequestHandler::handle_extract};
}

void FileRequestHandler::handle(rpc::ServerExchange& ex) {
    const wire::RequestHead& req = ex.request();
    LOG_DEBUG("FS: " + req.method + " " + (req.action.empty() ? "/" : req.action) + " " + req.param("path"));

    auto it = m_routes.find(req.action);
    if (it == m_routes.end()) {
        throw ProtocolError(wire::kStatusBadRequest, "unknown action: " + req.action);
    }
    const Route& route = it->second;
    if (std::find(route.methods.begin(), route.methods.end(), req.method) == route.methods.end()) {
        throw ProtocolError(wire::kStatusMethodNotAllowed, "method not allowed");
    }
    (this->*route.action)(ex);
}

void FileRequestHandler::handle_probe(rpc::ServerExchange& ex) {
    const wire::RequestHead& req = ex.request();
    if (req.method == "PUT") {
        handle_upload(ex);
    } else if (!req.param("path").empty()) {
        handle_download(ex);
    } else {
        ex.respond(wire::kStatusOk, "");
    }
}

void FileRequestHandler::handle_download(rpc::ServerExchange& ex) {
    const wire::RequestHead& req = ex.request();
    std::string path;
    fs::path target = m_files->existing(require(req, "path", path));
    if (fs::is_directory(target)) {
        throw ProtocolError(wire::kStatusBadRequest, "is a directory: " + path);
    }

    FdGuard fd(::open(target.c_str(), O_RDONLY | O_CLOEXEC));
    if (fd.get() < 0) {
        throw IOError("cannot open " + path + ": " + std::strerror(errno));
    }
    const int64_t size = file_size_of(fd.get(), path);

    int status = wire::kStatusOk;
    int64_t start = 0;
    int64_t length = size;
    std::map<std::string, std::string> headers{{wire::kHeaderFileSize, std::to_string(size)}};

    const std::string range_value = req.header(wire::kHeaderRange);
    if (!range_value.empty()) {
        auto range = wire::parse_range(range_value);
        if (!range || range->start >= size) {
            ex.respond(wire::kStatusRangeNotSatisfiable, "range not satisfiable",
                       {{wire::kHeaderContentRange, wire::format_complete_length(size)},
                        {wire::kHeaderFileSize, std::to_string(size)}});
            return;
        }
        int64_t end = (range->open_ended() || range->end >= size) ? size - 1 : range->end;
        start = range->start;
        length = end - start + 1;
        status = wire::kStatusPartialContent;
        headers[wire::kHeaderContentRange] = wire::format_content_range(start, end, size);
    }

    if (req.method == "HEAD") {
        ex.begin_response(status, 0, headers);
        return;
    }

    ex.begin_response(status, length, headers);
    std::vector<uint8_t> buf(kIoBufferSize);
    int64_t sent = 0;
    while (sent < length) {
        size_t want = static_cast<size_t>(std::min<int64_t>(length - sent, static_cast<int64_t>(buf.size())));
        ssize_t n = ::pread(fd.get(), buf.data(), want, static_cast<off_t>(start + sent));
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            throw IOError("short read on " + path + " at offset " + std::to_string(start + sent));
        }
        ex.write(buf.data(), static_cast<size_t>(n));
        sent += n;
    }
}

void FileRequestHandler::handle_upload(rpc::ServerExchange& ex) {
    const wire::RequestHead& req = ex.request();
    std::string path;
    fs::path target = m_files->guard().resolve(require(req, "path", path));
    const bool auto_extract = flag_set(req.header(wire::kHeaderAutoExtract));
    const std::string range_value = req.header(wire::kHeaderContentRange);

    // "bytes */total" finalizes a chunked upload without writing
    if (auto total = wire::parse_complete_length(range_value)) {
        ex.drain_body();
        std::error_code ec;
        auto size = fs::file_size(target, ec);
        if (ec || static_cast<int64_t>(size) != *total) {
            throw ProtocolError(wire::kStatusBadRequest, "upload incomplete: " + path);
        }
        if (auto_extract && is_tar_gz(target)) {
            schedule_extract(target);
        }
        ex.respond(wire::kStatusOk, "OK\nTotal: " + std::to_string(size) + " bytes",
                   {{wire::kHeaderFileSize, std::to_string(size)}});
        return;
    }

    bool ranged = false;
    int64_t offset = 0;
    int64_t total = -1;
    if (!range_value.empty()) {
        auto cr = wire::parse_content_range(range_value);
        if (!cr) {
            throw ProtocolError(wire::kStatusBadRequest, "invalid Content-Range: " + range_value);
        }
        if (cr->end - cr->start + 1 != req.content_length) {
            throw ProtocolError(wire::kStatusBadRequest, "Content-Range does not match body length");
        }
        ranged = true;
        offset = cr->start;
        total = cr->total;
    }

    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        throw IOError("cannot create directory for " + path + ": " + ec.message());
    }

    // Ranged writes never truncate; other workers may be writing the same file
    int flags = ranged ? (O_CREAT | O_RDWR) : (O_CREAT | O_WRONLY | O_TRUNC);
    FdGuard fd(::open(target.c_str(), flags | O_CLOEXEC, 0644));
    if (fd.get() < 0) {
        throw IOError("cannot open " + path + ": " + std::strerror(errno));
    }

    std::vector<uint8_t> buf(kIoBufferSize);
    int64_t written = 0;
    size_t n;
    while ((n = ex.read_body(buf.data(), buf.size())) > 0) {
        size_t done = 0;
        while (done < n) {
            ssize_t w = ::pwrite(fd.get(), buf.data() + done, n - done, static_cast<off_t>(offset + written));
            if (w < 0) {
                if (errno == EINTR) continue;
                throw IOError("write failed on " + path + ": " + std::strerror(errno));
            }
            done += static_cast<size_t>(w);
            written += w;
        }
    }

    if (::fsync(fd.get()) != 0) {
        throw IOError("fsync failed on " + path + ": " + std::strerror(errno));
    }

    int64_t size = file_size_of(fd.get(), path);
    if (ranged && total >= 0 && size > total) {
        // Stale tail from an older, longer file
        if (::ftruncate(fd.get(), static_cast<off_t>(total)) != 0) {
            throw IOError("truncate failed on " + path + ": " + std::strerror(errno));
        }
        size = total;
    }

    if (auto_extract && !ranged && is_tar_gz(target)) {
        schedule_extract(target);
    }

    ex.respond(wire::kStatusOk,
               "OK\nUploaded: " + std::to_string(written) + " bytes\nTotal: " + std::to_string(size) + " bytes",
               {{wire::kHeaderUploadedBytes, std::to_string(written)}, {wire::kHeaderFileSize, std::to_string(size)}});
}

void FileRequestHandler::handle_list(rpc::ServerExchange& ex) {
    const wire::RequestHead& req = ex.request();
    auto items = m_files->list(req.param("path"), flag_set(req.param("recursive")));
    nlohmann::json body = items;
    ex.respond(wire::kStatusOk, body.dump(), {{"Content-Type", "application/json"}});
}

void FileRequestHandler::handle_stat(rpc::ServerExchange& ex) {
    std::string path;
    nlohmann::json body = m_files->stat(require(ex.request(), "path", path));
    ex.respond(wire::kStatusOk, body.dump(), {{"Content-Type", "application/json"}});
}

void FileRequestHandler::handle_checksum(rpc::ServerExchange& ex) {
    std::string path;
    ex.respond(wire::kStatusOk, m_files->checksum(require(ex.request(), "path", path)));
}

void FileRequestHandler::handle_delete(rpc::ServerExchange& ex) {
    std::string path;
    m_files->remove(require(ex.request(), "path", path));
    ex.respond(wire::kStatusOk, "OK");
}

void FileRequestHandler::handle_mkdir(rpc::ServerExchange& ex) {
    std::string path;
    m_files->make_directory(require(ex.request(), "path", path));
    ex.respond(wire::kStatusOk, "OK");
}

void FileRequestHandler::handle_rename(rpc::ServerExchange& ex) {
    const wire::RequestHead& req = ex.request();
    m_files->rename(req.param("old"), req.param("new"));
    ex.respond(wire::kStatusOk, "OK");
}

void FileRequestHandler::handle_copy(rpc::ServerExchange& ex) {
    const wire::RequestHead& req = ex.request();
    m_files->copy(req.param("src"), req.param("dst"));
    ex.respond(wire::kStatusOk, "OK");
}

void FileRequestHandler::handle_chmod(rpc::ServerExchange& ex) {
    const wire::RequestHead& req = ex.request();
    uint32_t mode = m_files->chmod(req.param("path"), req.param("mode"));
    char text[16];
    std::snprintf(text, sizeof(text), "%o", mode);
    ex.respond(wire::kStatusOk, std::string("OK\nMode changed to ") + text);
}

void FileRequestHandler::handle_edit(rpc::ServerExchange& ex) {
    const wire::RequestHead& req = ex.request();
    std::string path;
    require(req, "path", path);
    if (req.method == "GET") {
        ex.respond(wire::kStatusOk, m_files->read_text(path), {{"Content-Type", "text/plain; charset=utf-8"}});
        return;
    }
    std::string content = ex.read_body_all(kMaxEditSize);
    m_files->write_text(path, content);
    ex.respond(wire::kStatusOk, "OK");
}

void FileRequestHandler::handle_compress(rpc::ServerExchange& ex) {
    const wire::RequestHead& req = ex.request();
    std::string paths_param;
    std::string output_param;
    require(req, "paths", paths_param);
    require(req, "output", output_param);
    archive::ArchiveFormat format = archive::parse_format(req.param("format", "zip"));

    std::vector<fs::path> sources;
    for (const auto& p : split_list(paths_param)) {
        sources.push_back(m_files->existing(p));
    }
    fs::path output = m_files->guard().resolve(output_param);
    std::error_code ec;
    fs::create_directories(output.parent_path(), ec);
    if (ec) {
        throw IOError("cannot create directory for " + output_param + ": " + ec.message());
    }

    size_t count = archive::create_archive(sources, output, format);
    ex.respond(wire::kStatusOk, "OK\nCompressed " + std::to_string(count) + " items to " +
                                    m_files->guard().to_request_path(output));
}

void FileRequestHandler::handle_extract(rpc::ServerExchange& ex) {
    const wire::RequestHead& req = ex.request();
    std::string path;
    fs::path archive_path = m_files->existing(require(req, "path", path));

    std::string dest_param = req.param("dest");
    fs::path dest = dest_param.empty()
                        ? m_files->guard().resolve(
                              m_files->guard().to_request_path(archive::default_extract_dir(archive_path)))
                        : m_files->guard().resolve(dest_param);

    archive::extract_archive(archive_path, dest);
    ex.respond(wire::kStatusOk, "OK\nExtracted to " + m_files->guard().to_request_path(dest));
}

void FileRequestHandler::schedule_extract(const fs::path& archive_path) {
    LOG_INFO("FS: auto-extract queued for " + m_files->guard().to_request_path(archive_path));
    fs::path dest = archive_path.parent_path();
    bool queued = m_jobs->submit(archive_path.string(), [archive_path, dest]() {
        try {
            archive::extract_archive(archive_path, dest);
        } catch (const std::exception& e) {
            LOG_ERROR("FS: auto-extract of " + archive_path.string() + " failed: " + e.what());
            return;
        }
        for (int i = 0; i < kArchiveDeleteAttempts; ++i) {
            std::error_code ec;
            fs::remove(archive_path, ec);
            if (!ec) {
                LOG_DEBUG("FS: removed temporary archive " + archive_path.string());
                return;
            }
            LOG_DEBUG("FS: retry " + std::to_string(i + 1) + " removing " + archive_path.string() + ": " +
                      ec.message());
            std::this_thread::sleep_for(std::chrono::milliseconds((1 << i) * 100));
        }
        LOG_WARN("FS: failed to remove temporary archive after retries: " + archive_path.string());
    });
    if (!queued) {
        LOG_WARN("FS: job pool stopped, auto-extract skipped for " + archive_path.string());
    }
}

} // namespace ferry::server
