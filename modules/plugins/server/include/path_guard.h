#pragma once

#include <filesystem>
#include <string>

namespace ferry::server {

/**
 * Maps request paths ("/dir/file", "dir/file", "") onto the served root.
 * Any ".." component, or a resolved location outside the root (including
 * through symlinks), raises PathSafetyError before the filesystem is touched.
 */
class PathGuard {
public:
    explicit PathGuard(const std::filesystem::path& root);

    std::filesystem::path resolve(const std::string& request_path) const;

    // "/a/b" for a path under the root, "/" for the root itself.
    std::string to_request_path(const std::filesystem::path& resolved) const;

    const std::filesystem::path& root() const { return m_root; }

private:
    bool contains(const std::filesystem::path& candidate) const;

    std::filesystem::path m_root;
};

} // namespace ferry::server
