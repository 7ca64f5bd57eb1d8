#include "archive.h"
#include "archive_io.h"
#include "errors.h"
#include "key_derivation.h"
#include "tar_archive.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

namespace fs = std::filesystem;
using namespace ferry;
using namespace ferry::archive;

namespace {

struct Workspace {
    fs::path dir;

    Workspace() {
        dir = fs::temp_directory_path() / ("ferry_archive_" + crypto::random_hex(6));
        fs::create_directories(dir / "project" / "src" / "deep");
        fs::create_directories(dir / "project" / "empty");
        write(dir / "project" / "README", "read me\n");
        write(dir / "project" / "src" / "main.c", "int main(void) { return 0; }\n");
        std::string blob;
        for (int i = 0; i < 200000; ++i) {
            blob.push_back(static_cast<char>((i * 31) & 0xff));
        }
        write(dir / "project" / "src" / "deep" / "blob.bin", blob);
        write(dir / "single.txt", "just one file\n");
    }
    ~Workspace() {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    static void write(const fs::path& p, const std::string& content) {
        std::ofstream out(p, std::ios::binary);
        out << content;
    }
};

std::string read_file(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

bool same_tree(const fs::path& a, const fs::path& b) {
    for (auto it = fs::recursive_directory_iterator(a); it != fs::recursive_directory_iterator(); ++it) {
        fs::path other = b / fs::relative(it->path(), a);
        if (it->is_directory()) {
            if (!fs::is_directory(other)) return false;
        } else if (!fs::is_regular_file(other) || read_file(it->path()) != read_file(other)) {
            return false;
        }
    }
    return true;
}

} // namespace

bool test_format_names() {
    std::cout << "Testing format names and extract directories..." << std::endl;

    TEST_ASSERT(parse_format("zip") == ArchiveFormat::ZIP, "zip");
    TEST_ASSERT(parse_format("TarGz") == ArchiveFormat::TAR_GZ, "targz, case-insensitive");
    TEST_ASSERT(parse_format("tgz") == ArchiveFormat::TAR_GZ, "tgz");
    TEST_ASSERT(parse_format("gz") == ArchiveFormat::GZIP, "gz");
    bool threw = false;
    try {
        parse_format("rar");
    } catch (const ProtocolError& e) {
        threw = e.status() == 400;
    }
    TEST_ASSERT(threw, "unknown format should be a 400");

    TEST_ASSERT(detect_format("a/b.tar.gz") == ArchiveFormat::TAR_GZ, "detect .tar.gz");
    TEST_ASSERT(detect_format("b.TGZ") == ArchiveFormat::TAR_GZ, "detect .tgz");
    TEST_ASSERT(detect_format("b.tar") == ArchiveFormat::TAR, "detect .tar");
    TEST_ASSERT(detect_format("b.zip") == ArchiveFormat::ZIP, "detect .zip");
    TEST_ASSERT(detect_format("b.txt.gz") == ArchiveFormat::GZIP, "detect .gz");

    TEST_ASSERT(default_extract_dir("/d/photos.tar.gz") == fs::path("/d/photos"), "strip .tar.gz");
    TEST_ASSERT(default_extract_dir("/d/photos.zip") == fs::path("/d/photos"), "strip .zip");
    TEST_ASSERT(default_extract_dir("/d/notes.txt.gz") == fs::path("/d/notes.txt"), "strip .gz");
    return true;
}

bool test_safe_entry_path() {
    std::cout << "Testing archive entry path safety..." << std::endl;

    fs::path dest = "/srv/out";
    TEST_ASSERT(safe_entry_path(dest, "a/b.txt") == fs::path("/srv/out/a/b.txt"), "plain entry");
    TEST_ASSERT(safe_entry_path(dest, "./a/./b.txt") == fs::path("/srv/out/a/b.txt"), "dot components");

    const std::vector<std::string> bad = {"../evil", "a/../../evil", "/etc/passwd", ""};
    for (const auto& name : bad) {
        bool threw = false;
        try {
            safe_entry_path(dest, name);
        } catch (const PathSafetyError&) {
            threw = true;
        }
        TEST_ASSERT(threw, "entry '" << name << "' should be rejected");
    }
    return true;
}

bool test_directory_round_trips() {
    std::cout << "Testing zip, tar and tar.gz round trips..." << std::endl;
    Workspace ws;

    const std::vector<std::pair<ArchiveFormat, std::string>> cases = {
        {ArchiveFormat::ZIP, "project.zip"},
        {ArchiveFormat::TAR, "project.tar"},
        {ArchiveFormat::TAR_GZ, "project.tar.gz"},
    };
    for (const auto& c : cases) {
        fs::path archive = ws.dir / c.second;
        size_t packed = create_archive({ws.dir / "project", ws.dir / "single.txt"}, archive, c.first);
        TEST_ASSERT(packed == 2, "two sources packed into " << c.second);
        TEST_ASSERT(fs::file_size(archive) > 0, "archive is empty: " << c.second);

        fs::path out = ws.dir / ("out_" + std::string(format_name(c.first)));
        extract_archive(archive, out);
        TEST_ASSERT(same_tree(ws.dir / "project", out / "project"), "tree differs after " << c.second);
        TEST_ASSERT(fs::is_directory(out / "project" / "empty"), "empty directory lost in " << c.second);
        TEST_ASSERT(read_file(out / "single.txt") == "just one file\n", "single file lost in " << c.second);
    }
    return true;
}

bool test_gzip_single_file() {
    std::cout << "Testing gzip of a single file..." << std::endl;
    Workspace ws;

    fs::path gz = ws.dir / "single.txt.gz";
    create_archive({ws.dir / "single.txt"}, gz, ArchiveFormat::GZIP);
    fs::path out = ws.dir / "unpacked";
    extract_archive(gz, out);
    TEST_ASSERT(read_file(out / "single.txt") == "just one file\n", "gunzipped content differs");

    bool threw = false;
    try {
        create_archive({ws.dir / "project"}, ws.dir / "project.gz", ArchiveFormat::GZIP);
    } catch (const ProtocolError& e) {
        threw = e.status() == 400;
    }
    TEST_ASSERT(threw, "gzip of a directory should be a 400");
    TEST_ASSERT(!fs::exists(ws.dir / "project.gz"), "failed archive must not be left behind");

    threw = false;
    try {
        create_archive({ws.dir / "missing"}, ws.dir / "x.zip", ArchiveFormat::ZIP);
    } catch (const ProtocolError& e) {
        threw = e.status() == 404;
    }
    TEST_ASSERT(threw, "missing source should be a 404");
    return true;
}

bool test_pack_under_new_name() {
    std::cout << "Testing pack_tar_gz with a renamed root..." << std::endl;
    Workspace ws;

    fs::path archive = ws.dir / "upload.tar.gz";
    pack_tar_gz(ws.dir / "project", "renamed", archive);
    fs::path out = ws.dir / "landing";
    extract_archive(archive, out);
    TEST_ASSERT(same_tree(ws.dir / "project", out / "renamed"), "packed tree differs");
    TEST_ASSERT(!fs::exists(out / "project"), "root must carry the new name");

    pack_tar_gz(ws.dir / "single.txt", "other.txt", ws.dir / "file.tar.gz");
    extract_archive(ws.dir / "file.tar.gz", out);
    TEST_ASSERT(read_file(out / "other.txt") == "just one file\n", "packed file renamed");

    bool threw = false;
    try {
        pack_tar_gz(ws.dir / "project", "a/b", ws.dir / "bad.tar.gz");
    } catch (const PathSafetyError&) {
        threw = true;
    }
    TEST_ASSERT(threw, "root name with a separator must be rejected");
    return true;
}

bool test_hostile_and_corrupt_archives() {
    std::cout << "Testing hostile and corrupt archives..." << std::endl;
    Workspace ws;

    // Entry that climbs out of the destination
    fs::path evil = ws.dir / "evil.tar";
    {
        auto out = open_output(evil.string(), false);
        TarWriter writer(*out);
        writer.add_file(ws.dir / "single.txt", "../escaped.txt");
        writer.close();
        out->finish();
    }
    bool threw = false;
    try {
        extract_archive(evil, ws.dir / "dest");
    } catch (const PathSafetyError&) {
        threw = true;
    }
    TEST_ASSERT(threw, "traversal entry should raise PathSafetyError");
    TEST_ASSERT(!fs::exists(ws.dir / "escaped.txt"), "nothing may be written outside the destination");

    fs::path corrupt = ws.dir / "corrupt.tar";
    Workspace::write(corrupt, std::string(1024, 'A'));
    threw = false;
    try {
        extract_archive(corrupt, ws.dir / "dest2");
    } catch (const IOError&) {
        threw = true;
    }
    TEST_ASSERT(threw, "corrupt tar should raise IOError");
    return true;
}

int main() {
    std::cout << "Running Archive Tests..." << std::endl;

    test_format_names();
    test_safe_entry_path();
    test_directory_round_trips();
    test_gzip_single_file();
    test_pack_under_new_name();
    test_hostile_and_corrupt_archives();

    if (tests_failed == 0) {
        std::cout << "ALL ARCHIVE TESTS PASSED" << std::endl;
        return 0;
    } else {
        std::cerr << tests_failed << " TESTS FAILED" << std::endl;
        return 1;
    }
}
