#pragma once

#include "archive_io.h"

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <string>

namespace ferry::archive {

inline constexpr size_t kTarBlockSize = 512;

enum class TarEntryType : char {
    REGULAR = '0',
    DIRECTORY = '5',
    SYMLINK = '2',
    OTHER = '?',
};

struct TarEntry {
    std::string name;
    TarEntryType type = TarEntryType::REGULAR;
    uint32_t mode = 0644;
    uint64_t size = 0;
    std::time_t mtime = 0;
    std::string link_target;
};

// ustar writer. Names longer than the header allows use a GNU long-name record.
class TarWriter {
public:
    explicit TarWriter(ArchiveOutput& out) : m_out(out) {}

    // Adds a file or directory tree. archive_name is the entry name of the root.
    void add_path(const std::filesystem::path& source, const std::string& archive_name);

    void add_directory(const std::string& name, uint32_t mode, std::time_t mtime);
    void add_file(const std::filesystem::path& source, const std::string& name);

    // Writes the two terminating zero blocks.
    void close();

private:
    void write_header(const TarEntry& entry);
    void pad(uint64_t size);

    ArchiveOutput& m_out;
};

// Sequential ustar/GNU/PAX reader (names only; other PAX keys are ignored).
class TarReader {
public:
    explicit TarReader(ArchiveInput& in) : m_in(in) {}

    // Advances to the next entry, skipping unread data of the previous one. False at end.
    bool next(TarEntry& entry);

    // Reads the current entry's data. Returns 0 once it is exhausted.
    size_t read(void* buf, size_t len);

private:
    bool read_header_block(uint8_t* block);
    std::string read_payload_string(uint64_t size);
    void skip_remaining();

    ArchiveInput& m_in;
    uint64_t m_remaining = 0;
    uint64_t m_padding = 0;
};

// True when block is a plausible ustar/GNU header (valid checksum).
bool looks_like_tar_header(const uint8_t* block);

} // namespace ferry::archive
