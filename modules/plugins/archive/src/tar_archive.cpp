#include "tar_archive.h"
#include "errors.h"
#include "logger.h"

#include <sys/stat.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <vector>

namespace fs = std::filesystem;

namespace ferry::archive {

namespace {

constexpr size_t kNameLen = 100;
constexpr size_t kPrefixLen = 155;
constexpr size_t kCopyBufferSize = 64 * 1024;
constexpr uint64_t kMaxMetaRecord = 1024 * 1024;

void write_octal(uint8_t* field, size_t width, uint64_t value) {
    // width-1 octal digits plus NUL; otherwise GNU base-256
    uint64_t limit = 1ull << (3 * (width - 1));
    if (value < limit) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%0*llo", static_cast<int>(width - 1),
                      static_cast<unsigned long long>(value));
        std::memcpy(field, buf, width - 1);
        field[width - 1] = '\0';
        return;
    }
    std::memset(field, 0, width);
    for (size_t i = width - 1; i > 0; --i) {
        field[i] = static_cast<uint8_t>(value & 0xFF);
        value >>= 8;
    }
    field[0] = 0x80;
}

uint64_t parse_numeric(const uint8_t* field, size_t width) {
    if (field[0] & 0x80) {
        uint64_t value = field[0] & 0x7F;
        for (size_t i = 1; i < width; ++i) {
            value = (value << 8) | field[i];
        }
        return value;
    }
    uint64_t value = 0;
    size_t i = 0;
    while (i < width && (field[i] == ' ' || field[i] == '\0')) {
        if (field[i] == '\0' && i > 0) break;
        ++i;
    }
    for (; i < width; ++i) {
        if (field[i] < '0' || field[i] > '7') break;
        value = (value << 3) | static_cast<uint64_t>(field[i] - '0');
    }
    return value;
}

std::string field_string(const uint8_t* field, size_t width) {
    size_t len = 0;
    while (len < width && field[len] != '\0') ++len;
    return std::string(reinterpret_cast<const char*>(field), len);
}

unsigned compute_checksum(const uint8_t* block) {
    unsigned sum = 0;
    for (size_t i = 0; i < kTarBlockSize; ++i) {
        sum += (i >= 148 && i < 156) ? static_cast<unsigned>(' ') : block[i];
    }
    return sum;
}

bool all_zero(const uint8_t* block) {
    return std::all_of(block, block + kTarBlockSize, [](uint8_t b) { return b == 0; });
}

struct stat lstat_or_throw(const fs::path& path) {
    struct stat st {};
    if (::lstat(path.c_str(), &st) != 0) {
        throw IOError("cannot stat " + path.string() + ": " + std::strerror(errno));
    }
    return st;
}

} // namespace

bool looks_like_tar_header(const uint8_t* block) {
    if (all_zero(block)) {
        return false;
    }
    uint64_t stored = parse_numeric(block + 148, 8);
    return stored == compute_checksum(block);
}

// ---------------------------------------------------------------------------
// TarWriter
// ---------------------------------------------------------------------------

void TarWriter::pad(uint64_t size) {
    static const uint8_t zeros[kTarBlockSize] = {0};
    size_t rem = static_cast<size_t>(size % kTarBlockSize);
    if (rem != 0) {
        m_out.write(zeros, kTarBlockSize - rem);
    }
}

void TarWriter::write_header(const TarEntry& entry) {
    std::string name = entry.name;
    std::string prefix;

    if (name.size() > kNameLen) {
        // Try a ustar prefix split first
        size_t split = name.find('/');
        while (split != std::string::npos && name.size() - split - 1 > kNameLen) {
            split = name.find('/', split + 1);
        }
        if (split != std::string::npos && split > 0 && split <= kPrefixLen && split + 1 < name.size()) {
            prefix = name.substr(0, split);
            name = name.substr(split + 1);
        } else {
            TarEntry longlink;
            longlink.name = "././@LongLink";
            longlink.type = static_cast<TarEntryType>('L');
            longlink.mode = 0;
            longlink.size = entry.name.size() + 1;
            write_header(longlink);
            m_out.write(entry.name.c_str(), entry.name.size() + 1);
            pad(entry.name.size() + 1);
            name = entry.name.substr(0, kNameLen);
        }
    }

    uint8_t block[kTarBlockSize];
    std::memset(block, 0, sizeof(block));
    std::memcpy(block, name.data(), std::min(name.size(), kNameLen));
    write_octal(block + 100, 8, entry.mode & 07777);
    write_octal(block + 108, 8, 0);
    write_octal(block + 116, 8, 0);
    write_octal(block + 124, 12, entry.size);
    write_octal(block + 136, 12, static_cast<uint64_t>(std::max<std::time_t>(0, entry.mtime)));
    block[156] = static_cast<uint8_t>(entry.type);
    if (!entry.link_target.empty()) {
        std::memcpy(block + 157, entry.link_target.data(), std::min(entry.link_target.size(), kNameLen));
    }
    std::memcpy(block + 257, "ustar", 6);
    std::memcpy(block + 263, "00", 2);
    if (!prefix.empty()) {
        std::memcpy(block + 345, prefix.data(), prefix.size());
    }

    char chk[8];
    std::snprintf(chk, sizeof(chk), "%06o", compute_checksum(block));
    std::memcpy(block + 148, chk, 6);
    block[154] = '\0';
    block[155] = ' ';

    m_out.write(block, sizeof(block));
}

void TarWriter::add_directory(const std::string& name, uint32_t mode, std::time_t mtime) {
    TarEntry entry;
    entry.name = name.empty() || name.back() == '/' ? name : name + "/";
    entry.type = TarEntryType::DIRECTORY;
    entry.mode = mode;
    entry.mtime = mtime;
    write_header(entry);
}

void TarWriter::add_file(const fs::path& source, const std::string& name) {
    struct stat st = lstat_or_throw(source);

    std::ifstream in(source, std::ios::binary);
    if (!in) {
        throw IOError("cannot open " + source.string());
    }

    TarEntry entry;
    entry.name = name;
    entry.type = TarEntryType::REGULAR;
    entry.mode = st.st_mode & 07777;
    entry.size = static_cast<uint64_t>(st.st_size);
    entry.mtime = st.st_mtime;
    write_header(entry);

    std::vector<char> buf(kCopyBufferSize);
    uint64_t left = entry.size;
    while (left > 0) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(left, buf.size()));
        in.read(buf.data(), static_cast<std::streamsize>(want));
        size_t got = static_cast<size_t>(in.gcount());
        if (got == 0) {
            throw IOError(source.string() + " shrank while being archived");
        }
        m_out.write(buf.data(), got);
        left -= got;
    }
    pad(entry.size);
}

void TarWriter::add_path(const fs::path& source, const std::string& archive_name) {
    struct stat st = lstat_or_throw(source);

    if (S_ISREG(st.st_mode)) {
        add_file(source, archive_name);
        return;
    }
    if (!S_ISDIR(st.st_mode)) {
        LOG_DEBUG("ARCHIVE: skipping non-regular entry " + source.string());
        return;
    }

    add_directory(archive_name, st.st_mode & 07777, st.st_mtime);

    std::vector<fs::directory_entry> entries;
    for (const auto& e : fs::recursive_directory_iterator(source)) {
        entries.push_back(e);
    }
    std::sort(entries.begin(), entries.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) { return a.path() < b.path(); });

    for (const auto& e : entries) {
        std::string rel = e.path().lexically_relative(source).generic_string();
        std::string name = archive_name + "/" + rel;
        auto status = e.symlink_status();
        if (fs::is_directory(status)) {
            struct stat dst = lstat_or_throw(e.path());
            add_directory(name, dst.st_mode & 07777, dst.st_mtime);
        } else if (fs::is_regular_file(status)) {
            add_file(e.path(), name);
        } else {
            LOG_DEBUG("ARCHIVE: skipping non-regular entry " + e.path().string());
        }
    }
}

void TarWriter::close() {
    static const uint8_t zeros[kTarBlockSize * 2] = {0};
    m_out.write(zeros, sizeof(zeros));
}

// ---------------------------------------------------------------------------
// TarReader
// ---------------------------------------------------------------------------

bool TarReader::read_header_block(uint8_t* block) {
    size_t got = read_fully(m_in, block, kTarBlockSize);
    if (got == 0) {
        return false;
    }
    if (got < kTarBlockSize) {
        throw IOError("truncated tar header");
    }
    return true;
}

void TarReader::skip_remaining() {
    uint8_t buf[kTarBlockSize];
    uint64_t left = m_remaining + m_padding;
    while (left > 0) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(left, sizeof(buf)));
        size_t got = read_fully(m_in, buf, want);
        if (got < want) {
            throw IOError("truncated tar entry");
        }
        left -= got;
    }
    m_remaining = 0;
    m_padding = 0;
}

std::string TarReader::read_payload_string(uint64_t size) {
    if (size > kMaxMetaRecord) {
        throw IOError("tar metadata record too large");
    }
    std::string data(static_cast<size_t>(size), '\0');
    if (read_fully(m_in, &data[0], data.size()) < data.size()) {
        throw IOError("truncated tar metadata record");
    }
    m_remaining = 0;
    m_padding = (kTarBlockSize - size % kTarBlockSize) % kTarBlockSize;
    skip_remaining();
    return data;
}

bool TarReader::next(TarEntry& entry) {
    skip_remaining();

    std::string pending_name;
    uint8_t block[kTarBlockSize];
    while (true) {
        if (!read_header_block(block) || all_zero(block)) {
            return false;
        }
        if (!looks_like_tar_header(block)) {
            throw IOError("corrupt tar header");
        }

        char type = static_cast<char>(block[156]);
        uint64_t size = parse_numeric(block + 124, 12);

        if (type == 'L') {
            std::string name = read_payload_string(size);
            pending_name = name.substr(0, name.find('\0'));
            continue;
        }
        if (type == 'x') {
            std::string records = read_payload_string(size);
            // "<len> key=value\n" records
            size_t pos = 0;
            while (pos < records.size()) {
                size_t space = records.find(' ', pos);
                if (space == std::string::npos) break;
                size_t len = static_cast<size_t>(std::strtoull(records.c_str() + pos, nullptr, 10));
                if (len == 0 || pos + len > records.size()) break;
                std::string record = records.substr(space + 1, pos + len - space - 2);
                size_t eq = record.find('=');
                if (eq != std::string::npos && record.compare(0, eq, "path") == 0) {
                    pending_name = record.substr(eq + 1);
                }
                pos += len;
            }
            continue;
        }
        if (type == 'g') {
            read_payload_string(size);
            continue;
        }

        std::string name = field_string(block, kNameLen);
        if (std::memcmp(block + 257, "ustar", 5) == 0) {
            std::string prefix = field_string(block + 345, kPrefixLen);
            if (!prefix.empty()) {
                name = prefix + "/" + name;
            }
        }

        entry = TarEntry{};
        entry.name = pending_name.empty() ? name : pending_name;
        entry.mode = static_cast<uint32_t>(parse_numeric(block + 100, 8));
        entry.size = size;
        entry.mtime = static_cast<std::time_t>(parse_numeric(block + 136, 12));
        entry.link_target = field_string(block + 157, kNameLen);
        switch (type) {
            case '0':
            case '\0':
            case '7':
                entry.type = TarEntryType::REGULAR;
                break;
            case '5':
                entry.type = TarEntryType::DIRECTORY;
                break;
            case '2':
                entry.type = TarEntryType::SYMLINK;
                break;
            default:
                entry.type = TarEntryType::OTHER;
                break;
        }
        if (entry.type == TarEntryType::SYMLINK || entry.type == TarEntryType::DIRECTORY) {
            entry.size = 0;
            size = (type == '5') ? size : 0;
        }
        m_remaining = size;
        m_padding = (kTarBlockSize - size % kTarBlockSize) % kTarBlockSize;
        return true;
    }
}

size_t TarReader::read(void* buf, size_t len) {
    if (m_remaining == 0 || len == 0) {
        return 0;
    }
    size_t want = static_cast<size_t>(std::min<uint64_t>(m_remaining, len));
    size_t n = m_in.read(buf, want);
    if (n == 0) {
        throw IOError("truncated tar entry data");
    }
    m_remaining -= n;
    return n;
}

} // namespace ferry::archive
