#include "pack_transfer.h"
#include "key_derivation.h"
#include "logger.h"

namespace fs = std::filesystem;

namespace ferry::transfer {

const char* pack_decision_name(PackDecision decision) {
    switch (decision) {
        case PackDecision::AS_IS: return "as-is";
        case PackDecision::PACK: return "pack";
    }
    return "unknown";
}

PackDecision decide_pack(const PackTransferConfig& config, bool is_directory, int64_t size) {
    if (!config.enabled) {
        return PackDecision::AS_IS;
    }
    if (is_directory) {
        return PackDecision::PACK;
    }
    return size >= config.threshold_bytes ? PackDecision::PACK : PackDecision::AS_IS;
}

fs::path scratch_directory(const PackTransferConfig& config) {
    if (!config.scratch_dir.empty()) {
        return fs::path(config.scratch_dir);
    }
    return fs::temp_directory_path();
}

fs::path unique_scratch_archive(const PackTransferConfig& config, const std::string& base_name) {
    std::string base = base_name.empty() ? std::string("ferry") : base_name;
    return scratch_directory(config) / (base + "-" + crypto::random_hex(6) + ".tar.gz");
}

void ScratchFile::remove() {
    if (m_removed || m_path.empty()) {
        return;
    }
    m_removed = true;
    std::error_code ec;
    fs::remove(m_path, ec);
    if (ec) {
        LOG_WARN("PACK: could not delete " + m_path.string() + ": " + ec.message());
    } else {
        LOG_DEBUG("PACK: deleted scratch archive " + m_path.string());
    }
}

} // namespace ferry::transfer
