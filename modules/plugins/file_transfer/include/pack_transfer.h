#ifndef FERRY_PACK_TRANSFER_H
#define FERRY_PACK_TRANSFER_H

#include "settings.h"

#include <cstdint>
#include <filesystem>
#include <string>

namespace ferry::transfer {

enum class PackDecision {
    AS_IS,
    PACK,
};

const char* pack_decision_name(PackDecision decision);

/**
 * Decided once per top-level request:
 * - disabled: always AS_IS
 * - directory: always PACK
 * - file: PACK when size >= threshold_bytes
 */
PackDecision decide_pack(const PackTransferConfig& config, bool is_directory, int64_t size);

// Directory for temporary archives: scratch_dir, or the system temp directory.
std::filesystem::path scratch_directory(const PackTransferConfig& config);

// Unique "<base>-<random>.tar.gz" path inside the scratch directory. Nothing is created.
std::filesystem::path unique_scratch_archive(const PackTransferConfig& config, const std::string& base_name);

/**
 * Temporary archive owned for the duration of one packed transfer.
 * Removal is best-effort: a failure is logged and never thrown.
 */
class ScratchFile {
public:
    explicit ScratchFile(std::filesystem::path path) : m_path(std::move(path)) {}
    ~ScratchFile() { remove(); }

    ScratchFile(const ScratchFile&) = delete;
    ScratchFile& operator=(const ScratchFile&) = delete;

    const std::filesystem::path& path() const { return m_path; }
    void remove();

private:
    std::filesystem::path m_path;
    bool m_removed = false;
};

} // namespace ferry::transfer

#endif // FERRY_PACK_TRANSFER_H
