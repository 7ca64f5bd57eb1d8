#include "path_guard.h"
#include "errors.h"
#include "logger.h"

#include <system_error>

namespace fs = std::filesystem;

namespace ferry::server {

PathGuard::PathGuard(const fs::path& root) {
    std::error_code ec;
    fs::path absolute = fs::absolute(root, ec);
    if (ec) {
        throw ConfigurationError("invalid root directory " + root.string() + ": " + ec.message());
    }
    m_root = fs::weakly_canonical(absolute, ec);
    if (ec) {
        m_root = absolute.lexically_normal();
    }
}

bool PathGuard::contains(const fs::path& candidate) const {
    fs::path rel = candidate.lexically_relative(m_root);
    if (rel.empty()) {
        return false;
    }
    return *rel.begin() != "..";
}

fs::path PathGuard::resolve(const std::string& request_path) const {
    fs::path joined = m_root;
    size_t pos = 0;
    while (pos <= request_path.size()) {
        size_t next = request_path.find_first_of("/\\", pos);
        if (next == std::string::npos) {
            next = request_path.size();
        }
        std::string part = request_path.substr(pos, next - pos);
        pos = next + 1;
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            LOG_WARN("FS: rejected traversal attempt: " + request_path);
            throw PathSafetyError(request_path);
        }
        joined /= part;
    }

    // Symlinks inside the root must not lead out of it
    std::error_code ec;
    fs::path real = fs::weakly_canonical(joined, ec);
    if (ec) {
        throw IOError("cannot resolve " + request_path + ": " + ec.message());
    }
    if (!contains(real)) {
        LOG_WARN("FS: rejected path resolving outside root: " + request_path);
        throw PathSafetyError(request_path);
    }
    return joined;
}

std::string PathGuard::to_request_path(const fs::path& resolved) const {
    fs::path rel = resolved.lexically_normal().lexically_relative(m_root);
    if (rel.empty() || rel == ".") {
        return "/";
    }
    return "/" + rel.generic_string();
}

} // namespace ferry::server
