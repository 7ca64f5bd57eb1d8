#include "file_service.h"
#include "errors.h"
#include "file_hash.h"
#include "logger.h"
#include "wire_protocol.h"

#include <sys/stat.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

namespace ferry::server {

namespace {

struct stat stat_or_throw(const fs::path& path) {
    struct stat st {};
    if (::lstat(path.c_str(), &st) != 0) {
        if (errno == ENOENT || errno == ENOTDIR) {
            throw ProtocolError(wire::kStatusNotFound, "not found: " + path.filename().string());
        }
        throw IOError("cannot stat " + path.string() + ": " + std::strerror(errno));
    }
    return st;
}

void throw_fs(const std::string& what, const std::error_code& ec) {
    throw IOError(what + ": " + ec.message());
}

} // namespace

std::string permission_string(uint32_t st_mode) {
    std::string s(10, '-');
    if (S_ISDIR(st_mode)) {
        s[0] = 'd';
    } else if (S_ISLNK(st_mode)) {
        s[0] = 'L';
    }
    static const char kFlags[] = "rwxrwxrwx";
    for (int i = 0; i < 9; ++i) {
        if (st_mode & (1u << (8 - i))) {
            s[1 + i] = kFlags[i];
        }
    }
    return s;
}

FileService::FileService(const fs::path& root) : m_guard(root) {}

fs::path FileService::existing(const std::string& path) const {
    fs::path target = m_guard.resolve(path);
    stat_or_throw(target);
    return target;
}

wire::ListItem FileService::describe(const fs::path& target) const {
    struct stat st = stat_or_throw(target);
    wire::ListItem item;
    item.name = target == m_guard.root() ? std::string("/") : target.filename().string();
    item.path = m_guard.to_request_path(target);
    item.is_dir = S_ISDIR(st.st_mode);
    item.size = item.is_dir ? 0 : static_cast<int64_t>(st.st_size);
    item.mod_time = static_cast<int64_t>(st.st_mtime);
    item.mode = permission_string(st.st_mode);
    return item;
}

std::vector<wire::ListItem> FileService::list(const std::string& path, bool recursive) const {
    fs::path target = existing(path);
    if (!fs::is_directory(target)) {
        throw ProtocolError(wire::kStatusBadRequest, "not a directory: " + path);
    }

    std::vector<fs::path> entries;
    std::error_code ec;
    if (recursive) {
        for (fs::recursive_directory_iterator it(target, ec), end; !ec && it != end; it.increment(ec)) {
            entries.push_back(it->path());
        }
    } else {
        for (fs::directory_iterator it(target, ec), end; !ec && it != end; it.increment(ec)) {
            entries.push_back(it->path());
        }
    }
    if (ec) {
        throw_fs("cannot list " + path, ec);
    }
    std::sort(entries.begin(), entries.end());

    std::vector<wire::ListItem> items;
    items.reserve(entries.size());
    for (const auto& entry : entries) {
        try {
            items.push_back(describe(entry));
        } catch (const ProtocolError&) {
            // removed while listing
        }
    }
    LOG_DEBUG("FS: list " + m_guard.to_request_path(target) + " -> " + std::to_string(items.size()) + " entries");
    return items;
}

wire::FileStat FileService::stat(const std::string& path) const {
    fs::path target = existing(path);
    struct stat st = stat_or_throw(target);
    wire::FileStat result;
    static_cast<wire::ListItem&>(result) = describe(target);
    result.mode_num = static_cast<uint32_t>(st.st_mode & 0777);
    return result;
}

void FileService::remove(const std::string& path) const {
    fs::path target = existing(path);
    if (target == m_guard.root()) {
        throw ProtocolError(wire::kStatusBadRequest, "refusing to delete the root directory");
    }
    std::error_code ec;
    fs::remove_all(target, ec);
    if (ec) {
        throw_fs("cannot delete " + path, ec);
    }
    LOG_INFO("FS: deleted " + m_guard.to_request_path(target));
}

void FileService::make_directory(const std::string& path) const {
    fs::path target = m_guard.resolve(path);
    std::error_code ec;
    fs::create_directories(target, ec);
    if (ec) {
        throw_fs("cannot create directory " + path, ec);
    }
    if (!fs::is_directory(target)) {
        throw ProtocolError(wire::kStatusBadRequest, "not a directory: " + path);
    }
}

void FileService::rename(const std::string& from, const std::string& to) const {
    if (from.empty() || to.empty()) {
        throw ProtocolError(wire::kStatusBadRequest, "missing old or new path");
    }
    fs::path source = existing(from);
    fs::path target = m_guard.resolve(to);
    std::error_code ec;
    fs::rename(source, target, ec);
    if (ec) {
        throw_fs("cannot rename " + from, ec);
    }
    LOG_INFO("FS: renamed " + m_guard.to_request_path(source) + " -> " + m_guard.to_request_path(target));
}

void FileService::copy(const std::string& from, const std::string& to) const {
    if (from.empty() || to.empty()) {
        throw ProtocolError(wire::kStatusBadRequest, "missing source or destination path");
    }
    fs::path source = existing(from);
    fs::path target = m_guard.resolve(to);

    std::error_code ec;
    if (fs::is_directory(source)) {
        fs::path rel = target.lexically_relative(source);
        if (!rel.empty() && *rel.begin() != "..") {
            throw ProtocolError(wire::kStatusBadRequest, "cannot copy a directory into itself");
        }
        fs::copy(source, target, fs::copy_options::recursive | fs::copy_options::overwrite_existing, ec);
    } else {
        fs::create_directories(target.parent_path(), ec);
        if (!ec) {
            fs::copy_file(source, target, fs::copy_options::overwrite_existing, ec);
        }
    }
    if (ec) {
        throw_fs("cannot copy " + from, ec);
    }
}

uint32_t FileService::chmod(const std::string& path, const std::string& mode) const {
    if (path.empty() || mode.empty()) {
        throw ProtocolError(wire::kStatusBadRequest, "missing path or mode parameter");
    }
    uint32_t bits = 0;
    for (char c : mode) {
        if (c < '0' || c > '7' || bits > 07777) {
            throw ProtocolError(wire::kStatusBadRequest, "invalid mode format (use octal like 755)");
        }
        bits = (bits << 3) | static_cast<uint32_t>(c - '0');
    }
    if (bits > 07777) {
        throw ProtocolError(wire::kStatusBadRequest, "invalid mode format (use octal like 755)");
    }

    fs::path target = existing(path);
    if (::chmod(target.c_str(), static_cast<mode_t>(bits)) != 0) {
        throw IOError("cannot change permissions of " + path + ": " + std::strerror(errno));
    }
    return bits;
}

std::string FileService::checksum(const std::string& path) const {
    fs::path target = existing(path);
    if (!fs::is_regular_file(target)) {
        throw ProtocolError(wire::kStatusBadRequest, "not a regular file: " + path);
    }
    return crypto::sha256_file_hex(target.string());
}

std::string FileService::read_text(const std::string& path) const {
    fs::path target = existing(path);
    if (fs::is_directory(target)) {
        throw ProtocolError(wire::kStatusBadRequest, "cannot edit directory");
    }
    std::error_code ec;
    auto size = fs::file_size(target, ec);
    if (ec) {
        throw_fs("cannot read " + path, ec);
    }
    if (static_cast<int64_t>(size) > kMaxEditSize) {
        throw ProtocolError(wire::kStatusTooLarge, "file too large for editing (max 1MB)");
    }
    std::ifstream in(target, std::ios::binary);
    if (!in) {
        throw IOError("cannot open " + path);
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void FileService::write_text(const std::string& path, const std::string& content) const {
    if (static_cast<int64_t>(content.size()) > kMaxEditSize) {
        throw ProtocolError(wire::kStatusTooLarge, "content too large (max 1MB)");
    }
    fs::path target = m_guard.resolve(path);
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        throw_fs("cannot create directory for " + path, ec);
    }
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw IOError("cannot open " + path + " for writing");
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (!out) {
        throw IOError("write failed: " + path);
    }
}

} // namespace ferry::server
