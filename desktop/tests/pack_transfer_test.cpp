#include "key_derivation.h"
#include "pack_transfer.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

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
using namespace ferry::transfer;

bool test_pack_policy() {
    std::cout << "Testing pack decisions..." << std::endl;

    PackTransferConfig config;
    config.enabled = true;
    config.threshold_bytes = 10 * kMiB;

    TEST_ASSERT(decide_pack(config, true, 0) == PackDecision::PACK, "empty directory is packed");
    TEST_ASSERT(decide_pack(config, true, 1) == PackDecision::PACK, "directories ignore the threshold");
    TEST_ASSERT(decide_pack(config, false, 10 * kMiB) == PackDecision::PACK, "file at the threshold is packed");
    TEST_ASSERT(decide_pack(config, false, 10 * kMiB - 1) == PackDecision::AS_IS, "file below the threshold");
    TEST_ASSERT(decide_pack(config, false, 0) == PackDecision::AS_IS, "empty file");

    config.enabled = false;
    TEST_ASSERT(decide_pack(config, true, 0) == PackDecision::AS_IS, "disabled never packs directories");
    TEST_ASSERT(decide_pack(config, false, 100 * kMiB) == PackDecision::AS_IS, "disabled never packs files");

    TEST_ASSERT(std::string(pack_decision_name(PackDecision::PACK)) == "pack", "decision name");
    return true;
}

bool test_scratch_names() {
    std::cout << "Testing scratch archive names..." << std::endl;

    PackTransferConfig config;
    TEST_ASSERT(scratch_directory(config) == fs::temp_directory_path(), "default scratch is the temp dir");

    config.scratch_dir = "/var/tmp/ferry-scratch";
    TEST_ASSERT(scratch_directory(config) == fs::path("/var/tmp/ferry-scratch"), "configured scratch dir");

    fs::path a = unique_scratch_archive(config, "photos");
    fs::path b = unique_scratch_archive(config, "photos");
    TEST_ASSERT(a != b, "scratch names must not collide");
    TEST_ASSERT(a.parent_path() == fs::path("/var/tmp/ferry-scratch"), "scratch archive lives in the scratch dir");
    std::string name = a.filename().string();
    TEST_ASSERT(name.rfind("photos-", 0) == 0, "name starts with the base: " << name);
    TEST_ASSERT(name.size() > 7 && name.compare(name.size() - 7, 7, ".tar.gz") == 0, "name ends with .tar.gz");
    TEST_ASSERT(!fs::exists(a), "nothing is created on disk");
    return true;
}

bool test_scratch_file_cleanup() {
    std::cout << "Testing scratch file cleanup..." << std::endl;

    PackTransferConfig config;
    fs::path kept;
    {
        ScratchFile scratch(unique_scratch_archive(config, "cleanup"));
        kept = scratch.path();
        std::ofstream out(kept, std::ios::binary);
        out << "archive bytes";
        out.close();
        TEST_ASSERT(fs::exists(kept), "scratch file not written");
    }
    TEST_ASSERT(!fs::exists(kept), "scratch file must be removed on scope exit");

    // Removing something that never existed is silent
    ScratchFile missing(unique_scratch_archive(config, "never"));
    missing.remove();
    missing.remove();
    TEST_ASSERT(!fs::exists(missing.path()), "missing scratch file stays missing");
    return true;
}

int main() {
    std::cout << "Running Pack Transfer Tests..." << std::endl;

    test_pack_policy();
    test_scratch_names();
    test_scratch_file_cleanup();

    if (tests_failed == 0) {
        std::cout << "ALL PACK TRANSFER TESTS PASSED" << std::endl;
        return 0;
    } else {
        std::cerr << tests_failed << " TESTS FAILED" << std::endl;
        return 1;
    }
}
