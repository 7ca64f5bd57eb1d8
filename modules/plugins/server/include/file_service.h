#pragma once

#include "list_item.h"
#include "path_guard.h"
#include "settings.h"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace ferry::server {

inline constexpr int64_t kMaxEditSize = kMiB;

// "drwxr-xr-x" style rendering of a st_mode value.
std::string permission_string(uint32_t st_mode);

/**
 * Filesystem operations behind the request actions. Every path goes through
 * the PathGuard first. Failures are thrown as FerryError subclasses; a
 * missing target is ProtocolError(404).
 */
class FileService {
public:
    explicit FileService(const std::filesystem::path& root);

    const PathGuard& guard() const { return m_guard; }

    std::vector<wire::ListItem> list(const std::string& path, bool recursive) const;
    wire::FileStat stat(const std::string& path) const;

    void remove(const std::string& path) const;
    void make_directory(const std::string& path) const;
    void rename(const std::string& from, const std::string& to) const;
    void copy(const std::string& from, const std::string& to) const;
    // mode is octal text ("755" or "0755"). Returns the applied mode.
    uint32_t chmod(const std::string& path, const std::string& mode) const;

    // Hex SHA-256 of a regular file.
    std::string checksum(const std::string& path) const;

    std::string read_text(const std::string& path) const;
    void write_text(const std::string& path, const std::string& content) const;

    // Resolves and requires an existing entry (404 otherwise).
    std::filesystem::path existing(const std::string& path) const;

private:
    wire::ListItem describe(const std::filesystem::path& target) const;

    PathGuard m_guard;
};

} // namespace ferry::server
