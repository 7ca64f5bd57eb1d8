#pragma once

#include <zlib.h>

#include <cstddef>
#include <cstdio>
#include <memory>
#include <string>

namespace ferry::archive {

// Sequential byte sink for archive writers. Throws IOError on failure.
class ArchiveOutput {
public:
    virtual ~ArchiveOutput() = default;
    virtual void write(const void* data, size_t len) = 0;
    // Flushes and closes. Must be called for the output to be complete.
    virtual void finish() = 0;
};

// Sequential byte source for archive readers. read() returns 0 at end of input.
class ArchiveInput {
public:
    virtual ~ArchiveInput() = default;
    virtual size_t read(void* buf, size_t len) = 0;
};

std::unique_ptr<ArchiveOutput> open_output(const std::string& path, bool gzip);
std::unique_ptr<ArchiveInput> open_input(const std::string& path, bool gzip);

// Reads exactly len bytes unless the input ends first. Returns bytes read.
size_t read_fully(ArchiveInput& in, void* buf, size_t len);

// gzip stream over zlib's gzFile.
class GzipFile {
public:
    GzipFile(const std::string& path, const char* mode);
    ~GzipFile();

    GzipFile(const GzipFile&) = delete;
    GzipFile& operator=(const GzipFile&) = delete;

    void write(const void* data, size_t len);
    size_t read(void* buf, size_t len);
    void close();

private:
    std::string m_path;
    gzFile m_file = nullptr;
};

} // namespace ferry::archive
