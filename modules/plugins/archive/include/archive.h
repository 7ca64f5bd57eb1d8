#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace ferry::archive {

enum class ArchiveFormat {
    ZIP,
    TAR,
    TAR_GZ,
    GZIP,
};

// Accepts "zip", "tar", "targz", "tar.gz", "tgz" and "gzip"/"gz". Throws ProtocolError(400) otherwise.
ArchiveFormat parse_format(const std::string& name);
const char* format_name(ArchiveFormat format);

// Format implied by the archive's file name. Throws ProtocolError(400) for unknown extensions.
ArchiveFormat detect_format(const std::filesystem::path& archive);

// Archive path with its archive extension removed ("a.tar.gz" -> "a").
std::filesystem::path default_extract_dir(const std::filesystem::path& archive);

// Resolves an archive entry name under dest. Throws PathSafetyError if it would land outside.
std::filesystem::path safe_entry_path(const std::filesystem::path& dest, const std::string& name);

// Packs sources (files or directories, each stored under its own base name) into output.
// GZIP takes exactly one regular file. Returns the number of sources packed.
size_t create_archive(const std::vector<std::filesystem::path>& sources,
                      const std::filesystem::path& output,
                      ArchiveFormat format);

// Packs one file or directory into a .tar.gz stored under root_name instead of its own name.
void pack_tar_gz(const std::filesystem::path& source, const std::string& root_name,
                 const std::filesystem::path& output);

// Unpacks archive into dest, creating dest if needed. A ".gz" that does not hold a tar
// stream is decompressed to dest/<name without .gz>.
void extract_archive(const std::filesystem::path& archive, const std::filesystem::path& dest);

} // namespace ferry::archive
