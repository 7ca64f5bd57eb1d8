#include "archive_io.h"
#include "errors.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <limits>

namespace ferry::archive {

namespace {

constexpr unsigned kGzipBufferSize = 256 * 1024;

class PlainOutput : public ArchiveOutput {
public:
    explicit PlainOutput(const std::string& path) : m_path(path), m_file(std::fopen(path.c_str(), "wb")) {
        if (!m_file) {
            throw IOError("cannot create " + path + ": " + std::strerror(errno));
        }
    }
    ~PlainOutput() override {
        if (m_file) std::fclose(m_file);
    }
    void write(const void* data, size_t len) override {
        if (len > 0 && std::fwrite(data, 1, len, m_file) != len) {
            throw IOError("write failed on " + m_path + ": " + std::strerror(errno));
        }
    }
    void finish() override {
        if (!m_file) return;
        std::FILE* f = m_file;
        m_file = nullptr;
        if (std::fclose(f) != 0) {
            throw IOError("close failed on " + m_path + ": " + std::strerror(errno));
        }
    }

private:
    std::string m_path;
    std::FILE* m_file;
};

class PlainInput : public ArchiveInput {
public:
    explicit PlainInput(const std::string& path) : m_path(path), m_file(std::fopen(path.c_str(), "rb")) {
        if (!m_file) {
            throw IOError("cannot open " + path + ": " + std::strerror(errno));
        }
    }
    ~PlainInput() override { std::fclose(m_file); }
    size_t read(void* buf, size_t len) override {
        size_t n = std::fread(buf, 1, len, m_file);
        if (n < len && std::ferror(m_file)) {
            throw IOError("read failed on " + m_path);
        }
        return n;
    }

private:
    std::string m_path;
    std::FILE* m_file;
};

class GzipOutput : public ArchiveOutput {
public:
    explicit GzipOutput(const std::string& path) : m_gz(path, "wb6") {}
    void write(const void* data, size_t len) override { m_gz.write(data, len); }
    void finish() override { m_gz.close(); }

private:
    GzipFile m_gz;
};

class GzipInput : public ArchiveInput {
public:
    explicit GzipInput(const std::string& path) : m_gz(path, "rb") {}
    size_t read(void* buf, size_t len) override { return m_gz.read(buf, len); }

private:
    GzipFile m_gz;
};

} // namespace

GzipFile::GzipFile(const std::string& path, const char* mode) : m_path(path) {
    m_file = gzopen(path.c_str(), mode);
    if (!m_file) {
        throw IOError("cannot open gzip stream " + path + ": " + std::strerror(errno));
    }
    gzbuffer(m_file, kGzipBufferSize);
}

GzipFile::~GzipFile() {
    if (m_file) gzclose(m_file);
}

void GzipFile::write(const void* data, size_t len) {
    const char* p = static_cast<const char*>(data);
    while (len > 0) {
        unsigned chunk = static_cast<unsigned>(std::min<size_t>(len, std::numeric_limits<int>::max()));
        int written = gzwrite(m_file, p, chunk);
        if (written <= 0) {
            int errnum = 0;
            const char* msg = gzerror(m_file, &errnum);
            throw IOError("gzip write failed on " + m_path + ": " + (msg ? msg : "unknown"));
        }
        p += written;
        len -= static_cast<size_t>(written);
    }
}

size_t GzipFile::read(void* buf, size_t len) {
    unsigned chunk = static_cast<unsigned>(std::min<size_t>(len, std::numeric_limits<int>::max()));
    int n = gzread(m_file, buf, chunk);
    if (n < 0) {
        int errnum = 0;
        const char* msg = gzerror(m_file, &errnum);
        throw IOError("gzip read failed on " + m_path + ": " + (msg ? msg : "unknown"));
    }
    return static_cast<size_t>(n);
}

void GzipFile::close() {
    if (!m_file) return;
    gzFile f = m_file;
    m_file = nullptr;
    int rc = gzclose(f);
    if (rc != Z_OK) {
        throw IOError("gzip close failed on " + m_path + " (" + std::to_string(rc) + ")");
    }
}

std::unique_ptr<ArchiveOutput> open_output(const std::string& path, bool gzip) {
    if (gzip) {
        return std::make_unique<GzipOutput>(path);
    }
    return std::make_unique<PlainOutput>(path);
}

std::unique_ptr<ArchiveInput> open_input(const std::string& path, bool gzip) {
    if (gzip) {
        return std::make_unique<GzipInput>(path);
    }
    return std::make_unique<PlainInput>(path);
}

size_t read_fully(ArchiveInput& in, void* buf, size_t len) {
    size_t got = 0;
    char* p = static_cast<char*>(buf);
    while (got < len) {
        size_t n = in.read(p + got, len - got);
        if (n == 0) break;
        got += n;
    }
    return got;
}

} // namespace ferry::archive
