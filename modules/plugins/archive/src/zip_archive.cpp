#include "zip_archive.h"
#include "errors.h"
#include "logger.h"

#include <sys/stat.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <vector>

namespace fs = std::filesystem;

namespace ferry::archive {

namespace {

constexpr size_t kCopyBufferSize = 64 * 1024;

std::string open_error_text(int code) {
    zip_error_t error;
    zip_error_init_with_code(&error, code);
    std::string text = zip_error_strerror(&error);
    zip_error_fini(&error);
    return text;
}

uint32_t file_mode(const fs::path& path) {
    struct stat st {};
    if (::lstat(path.c_str(), &st) != 0) {
        throw IOError("cannot stat " + path.string() + ": " + std::strerror(errno));
    }
    return static_cast<uint32_t>(st.st_mode);
}

} // namespace

ZipWriter::ZipWriter(const std::string& path) : m_path(path) {
    int err = 0;
    m_zip = zip_open(path.c_str(), ZIP_CREATE | ZIP_TRUNCATE, &err);
    if (!m_zip) {
        throw IOError("cannot create zip " + path + ": " + open_error_text(err));
    }
}

ZipWriter::~ZipWriter() {
    if (m_zip) {
        zip_discard(m_zip);
    }
}

void ZipWriter::add_directory(const std::string& name, uint32_t mode) {
    std::string dir_name = name.empty() || name.back() == '/' ? name : name + "/";
    zip_int64_t idx = zip_dir_add(m_zip, dir_name.c_str(), ZIP_FL_ENC_UTF_8);
    if (idx < 0) {
        throw IOError("zip: cannot add directory " + dir_name + ": " + zip_strerror(m_zip));
    }
    zip_file_set_external_attributes(m_zip, static_cast<zip_uint64_t>(idx), 0, ZIP_OPSYS_UNIX,
                                     (mode & 0177777u) << 16);
    ++m_entries;
}

void ZipWriter::add_file(const fs::path& source, const std::string& name, uint32_t mode) {
    zip_source_t* src = zip_source_file(m_zip, source.c_str(), 0, -1);
    if (!src) {
        throw IOError("zip: cannot read " + source.string() + ": " + zip_strerror(m_zip));
    }
    zip_int64_t idx = zip_file_add(m_zip, name.c_str(), src, ZIP_FL_OVERWRITE | ZIP_FL_ENC_UTF_8);
    if (idx < 0) {
        zip_source_free(src);
        throw IOError("zip: cannot add " + name + ": " + zip_strerror(m_zip));
    }
    zip_file_set_external_attributes(m_zip, static_cast<zip_uint64_t>(idx), 0, ZIP_OPSYS_UNIX,
                                     (mode & 0177777u) << 16);
    ++m_entries;
}

void ZipWriter::add_path(const fs::path& source, const std::string& archive_name) {
    uint32_t mode = file_mode(source);
    if (S_ISREG(mode)) {
        add_file(source, archive_name, mode);
        return;
    }
    if (!S_ISDIR(mode)) {
        LOG_DEBUG("ARCHIVE: skipping non-regular entry " + source.string());
        return;
    }

    add_directory(archive_name, mode);

    std::vector<fs::path> paths;
    for (const auto& e : fs::recursive_directory_iterator(source)) {
        paths.push_back(e.path());
    }
    std::sort(paths.begin(), paths.end());

    for (const auto& p : paths) {
        std::string name = archive_name + "/" + p.lexically_relative(source).generic_string();
        uint32_t entry_mode = file_mode(p);
        if (S_ISDIR(entry_mode)) {
            add_directory(name, entry_mode);
        } else if (S_ISREG(entry_mode)) {
            add_file(p, name, entry_mode);
        } else {
            LOG_DEBUG("ARCHIVE: skipping non-regular entry " + p.string());
        }
    }
}

void ZipWriter::close() {
    if (!m_zip) {
        return;
    }
    if (zip_close(m_zip) != 0) {
        std::string msg = zip_strerror(m_zip);
        zip_discard(m_zip);
        m_zip = nullptr;
        throw IOError("zip: cannot write " + m_path + ": " + msg);
    }
    m_zip = nullptr;
}

ZipReader::ZipReader(const std::string& path) : m_path(path) {
    int err = 0;
    m_zip = zip_open(path.c_str(), ZIP_RDONLY, &err);
    if (!m_zip) {
        throw IOError("cannot open zip " + path + ": " + open_error_text(err));
    }
}

ZipReader::~ZipReader() {
    if (m_zip) {
        zip_close(m_zip);
    }
}

uint64_t ZipReader::entry_count() const {
    zip_int64_t n = zip_get_num_entries(m_zip, 0);
    return n < 0 ? 0 : static_cast<uint64_t>(n);
}

ZipEntryInfo ZipReader::entry(uint64_t index) const {
    zip_stat_t st;
    zip_stat_init(&st);
    if (zip_stat_index(m_zip, index, 0, &st) != 0) {
        throw IOError("zip: cannot stat entry " + std::to_string(index) + ": " + zip_strerror(m_zip));
    }

    ZipEntryInfo info;
    info.name = (st.valid & ZIP_STAT_NAME) ? st.name : "";
    info.size = (st.valid & ZIP_STAT_SIZE) ? st.size : 0;
    info.is_dir = !info.name.empty() && info.name.back() == '/';

    zip_uint8_t opsys = 0;
    zip_uint32_t attributes = 0;
    if (zip_file_get_external_attributes(m_zip, index, 0, &opsys, &attributes) == 0 && opsys == ZIP_OPSYS_UNIX) {
        info.mode = (attributes >> 16) & 07777;
    }
    return info;
}

void ZipReader::extract_to(uint64_t index, const fs::path& target) const {
    zip_file_t* zf = zip_fopen_index(m_zip, index, 0);
    if (!zf) {
        throw IOError("zip: cannot open entry " + std::to_string(index) + ": " + zip_strerror(m_zip));
    }

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        zip_fclose(zf);
        throw IOError("cannot create " + target.string());
    }

    std::vector<char> buf(kCopyBufferSize);
    while (true) {
        zip_int64_t n = zip_fread(zf, buf.data(), buf.size());
        if (n < 0) {
            std::string msg = zip_file_strerror(zf);
            zip_fclose(zf);
            throw IOError("zip: read failed for " + target.string() + ": " + msg);
        }
        if (n == 0) {
            break;
        }
        out.write(buf.data(), n);
        if (!out) {
            zip_fclose(zf);
            throw IOError("write failed: " + target.string());
        }
    }
    zip_fclose(zf);
}

} // namespace ferry::archive
