#pragma once

#include <zip.h>

#include <cstdint>
#include <filesystem>
#include <string>

namespace ferry::archive {

// Builds a zip file with libzip. Entries are read from disk when close() runs.
class ZipWriter {
public:
    explicit ZipWriter(const std::string& path);
    ~ZipWriter();

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    // Adds a file or a directory tree rooted at archive_name.
    void add_path(const std::filesystem::path& source, const std::string& archive_name);
    void close();

    size_t entry_count() const { return m_entries; }

private:
    void add_directory(const std::string& name, uint32_t mode);
    void add_file(const std::filesystem::path& source, const std::string& name, uint32_t mode);

    std::string m_path;
    zip_t* m_zip = nullptr;
    size_t m_entries = 0;
};

struct ZipEntryInfo {
    std::string name;
    uint64_t size = 0;
    bool is_dir = false;
    uint32_t mode = 0;  // 0 when the archive carries no unix mode
};

class ZipReader {
public:
    explicit ZipReader(const std::string& path);
    ~ZipReader();

    ZipReader(const ZipReader&) = delete;
    ZipReader& operator=(const ZipReader&) = delete;

    uint64_t entry_count() const;
    ZipEntryInfo entry(uint64_t index) const;

    // Writes the entry's data to target, replacing any existing file.
    void extract_to(uint64_t index, const std::filesystem::path& target) const;

private:
    std::string m_path;
    zip_t* m_zip = nullptr;
};

} // namespace ferry::archive
