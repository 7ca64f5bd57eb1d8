#include "archive.h"
#include "archive_io.h"
#include "errors.h"
#include "logger.h"
#include "tar_archive.h"
#include "wire_protocol.h"
#include "zip_archive.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <vector>

namespace fs = std::filesystem;

namespace ferry::archive {

namespace {

constexpr size_t kCopyBufferSize = 64 * 1024;

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string entry_base_name(const fs::path& source) {
    fs::path p = source.lexically_normal();
    std::string name = p.filename().string();
    if (name.empty() || name == ".") {
        name = p.parent_path().filename().string();
    }
    if (name.empty()) {
        throw ProtocolError(wire::kStatusBadRequest, "cannot archive " + source.string());
    }
    return name;
}

void apply_mode(const fs::path& target, uint32_t mode) {
    if (mode == 0) {
        return;
    }
    std::error_code ec;
    fs::permissions(target, static_cast<fs::perms>(mode & 0777), fs::perm_options::replace, ec);
    if (ec) {
        LOG_DEBUG("ARCHIVE: could not set mode on " + target.string() + ": " + ec.message());
    }
}

void write_tar(const std::vector<fs::path>& sources, const fs::path& output, bool gzip) {
    auto out = open_output(output.string(), gzip);
    TarWriter writer(*out);
    for (const auto& src : sources) {
        writer.add_path(src, entry_base_name(src));
    }
    writer.close();
    out->finish();
}

void write_zip(const std::vector<fs::path>& sources, const fs::path& output) {
    ZipWriter writer(output.string());
    for (const auto& src : sources) {
        writer.add_path(src, entry_base_name(src));
    }
    writer.close();
}

void write_gzip(const std::vector<fs::path>& sources, const fs::path& output) {
    if (sources.size() != 1 || !fs::is_regular_file(sources.front())) {
        throw ProtocolError(wire::kStatusBadRequest, "gzip format requires exactly one file");
    }
    std::ifstream in(sources.front(), std::ios::binary);
    if (!in) {
        throw IOError("cannot open " + sources.front().string());
    }
    GzipFile gz(output.string(), "wb6");
    std::vector<char> buf(kCopyBufferSize);
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        std::streamsize got = in.gcount();
        if (got > 0) {
            gz.write(buf.data(), static_cast<size_t>(got));
        }
    }
    if (in.bad()) {
        throw IOError("read failed on " + sources.front().string());
    }
    gz.close();
}

void extract_tar_stream(ArchiveInput& in, const fs::path& dest) {
    TarReader reader(in);
    TarEntry entry;
    std::vector<char> buf(kCopyBufferSize);
    size_t files = 0;

    while (reader.next(entry)) {
        if (entry.type == TarEntryType::SYMLINK || entry.type == TarEntryType::OTHER) {
            LOG_WARN("ARCHIVE: skipping unsupported tar entry " + entry.name);
            continue;
        }
        fs::path target = safe_entry_path(dest, entry.name);
        if (entry.type == TarEntryType::DIRECTORY) {
            fs::create_directories(target);
            continue;
        }

        fs::create_directories(target.parent_path());
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw IOError("cannot create " + target.string());
        }
        size_t n;
        while ((n = reader.read(buf.data(), buf.size())) > 0) {
            out.write(buf.data(), static_cast<std::streamsize>(n));
            if (!out) {
                throw IOError("write failed: " + target.string());
            }
        }
        out.close();
        apply_mode(target, entry.mode);
        ++files;
    }
    LOG_DEBUG("ARCHIVE: extracted " + std::to_string(files) + " files into " + dest.string());
}

void extract_zip(const fs::path& archive, const fs::path& dest) {
    ZipReader reader(archive.string());
    uint64_t count = reader.entry_count();
    for (uint64_t i = 0; i < count; ++i) {
        ZipEntryInfo info = reader.entry(i);
        fs::path target = safe_entry_path(dest, info.name);
        if (info.is_dir) {
            fs::create_directories(target);
            continue;
        }
        fs::create_directories(target.parent_path());
        reader.extract_to(i, target);
        apply_mode(target, info.mode);
    }
}

// A ".gz" holds either a tar stream or a single compressed file.
void extract_gz(const fs::path& archive, const fs::path& dest) {
    bool is_tar = false;
    {
        auto probe = open_input(archive.string(), true);
        uint8_t block[kTarBlockSize];
        if (read_fully(*probe, block, sizeof(block)) == sizeof(block)) {
            is_tar = looks_like_tar_header(block);
        }
    }
    if (is_tar) {
        auto in = open_input(archive.string(), true);
        extract_tar_stream(*in, dest);
        return;
    }

    std::string name = archive.filename().string();
    name = name.substr(0, name.size() - 3);
    fs::path target = safe_entry_path(dest, name);
    auto in = open_input(archive.string(), true);
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw IOError("cannot create " + target.string());
    }
    std::vector<char> buf(kCopyBufferSize);
    size_t n;
    while ((n = in->read(buf.data(), buf.size())) > 0) {
        out.write(buf.data(), static_cast<std::streamsize>(n));
        if (!out) {
            throw IOError("write failed: " + target.string());
        }
    }
}

} // namespace

ArchiveFormat parse_format(const std::string& name) {
    std::string f = lower(name);
    if (f == "zip") return ArchiveFormat::ZIP;
    if (f == "tar") return ArchiveFormat::TAR;
    if (f == "targz" || f == "tar.gz" || f == "tgz") return ArchiveFormat::TAR_GZ;
    if (f == "gzip" || f == "gz") return ArchiveFormat::GZIP;
    throw ProtocolError(wire::kStatusBadRequest, "unsupported format: " + name);
}

const char* format_name(ArchiveFormat format) {
    switch (format) {
        case ArchiveFormat::ZIP: return "zip";
        case ArchiveFormat::TAR: return "tar";
        case ArchiveFormat::TAR_GZ: return "targz";
        case ArchiveFormat::GZIP: return "gzip";
    }
    return "unknown";
}

ArchiveFormat detect_format(const fs::path& archive) {
    std::string name = lower(archive.filename().string());
    if (ends_with(name, ".zip")) return ArchiveFormat::ZIP;
    if (ends_with(name, ".tar.gz") || ends_with(name, ".tgz")) return ArchiveFormat::TAR_GZ;
    if (ends_with(name, ".tar")) return ArchiveFormat::TAR;
    if (ends_with(name, ".gz")) return ArchiveFormat::GZIP;
    throw ProtocolError(wire::kStatusBadRequest, "unsupported archive format: " + archive.filename().string());
}

fs::path default_extract_dir(const fs::path& archive) {
    std::string name = archive.filename().string();
    std::string lname = lower(name);
    size_t strip = 0;
    if (ends_with(lname, ".tar.gz")) {
        strip = 7;
    } else if (archive.has_extension()) {
        strip = archive.extension().string().size();
    }
    if (strip == 0 || strip >= name.size()) {
        return archive.parent_path() / (name + "_extracted");
    }
    return archive.parent_path() / name.substr(0, name.size() - strip);
}

fs::path safe_entry_path(const fs::path& dest, const std::string& name) {
    fs::path rel = fs::path(name).lexically_normal();
    if (name.empty() || rel.is_absolute() || rel.has_root_name()) {
        throw PathSafetyError(name);
    }
    for (const auto& part : rel) {
        if (part == "..") {
            throw PathSafetyError(name);
        }
    }

    fs::path base = dest.lexically_normal();
    fs::path target = (base / rel).lexically_normal();
    fs::path check = target.lexically_relative(base);
    if (check.empty() || *check.begin() == "..") {
        throw PathSafetyError(name);
    }
    return target;
}

size_t create_archive(const std::vector<fs::path>& sources, const fs::path& output, ArchiveFormat format) {
    if (sources.empty()) {
        throw ProtocolError(wire::kStatusBadRequest, "nothing to compress");
    }
    for (const auto& src : sources) {
        if (!fs::exists(fs::symlink_status(src))) {
            throw ProtocolError(wire::kStatusNotFound, "not found: " + src.filename().string());
        }
    }

    try {
        switch (format) {
            case ArchiveFormat::ZIP:
                write_zip(sources, output);
                break;
            case ArchiveFormat::TAR:
                write_tar(sources, output, false);
                break;
            case ArchiveFormat::TAR_GZ:
                write_tar(sources, output, true);
                break;
            case ArchiveFormat::GZIP:
                write_gzip(sources, output);
                break;
        }
    } catch (...) {
        std::error_code ec;
        fs::remove(output, ec);
        throw;
    }

    LOG_INFO("ARCHIVE: packed " + std::to_string(sources.size()) + " items into " + output.string() + " (" +
             format_name(format) + ")");
    return sources.size();
}

void pack_tar_gz(const fs::path& source, const std::string& root_name, const fs::path& output) {
    if (!fs::exists(fs::symlink_status(source))) {
        throw IOError("not found: " + source.string());
    }
    if (root_name.empty() || root_name == "." || root_name == ".." || root_name.find('/') != std::string::npos) {
        throw PathSafetyError(root_name);
    }
    try {
        auto out = open_output(output.string(), true);
        TarWriter writer(*out);
        writer.add_path(source, root_name);
        writer.close();
        out->finish();
    } catch (...) {
        std::error_code ec;
        fs::remove(output, ec);
        throw;
    }
    LOG_DEBUG("ARCHIVE: packed " + source.string() + " as " + root_name + " into " + output.string());
}

void extract_archive(const fs::path& archive, const fs::path& dest) {
    if (!fs::is_regular_file(archive)) {
        throw ProtocolError(wire::kStatusNotFound, "not found: " + archive.filename().string());
    }
    ArchiveFormat format = detect_format(archive);
    fs::create_directories(dest);

    switch (format) {
        case ArchiveFormat::ZIP:
            extract_zip(archive, dest);
            break;
        case ArchiveFormat::TAR: {
            auto in = open_input(archive.string(), false);
            extract_tar_stream(*in, dest);
            break;
        }
        case ArchiveFormat::TAR_GZ: {
            auto in = open_input(archive.string(), true);
            extract_tar_stream(*in, dest);
            break;
        }
        case ArchiveFormat::GZIP:
            extract_gz(archive, dest);
            break;
    }
    LOG_INFO("ARCHIVE: extracted " + archive.string() + " to " + dest.string());
}

} // namespace ferry::archive
