#ifndef FERRY_TRANSFER_TYPES_H
#define FERRY_TRANSFER_TYPES_H

#include <cstdint>
#include <functional>
#include <vector>

namespace ferry::transfer {

// ============================================================================
// CHUNK PLANNING
// ============================================================================

/**
 * Contiguous byte span of a file moved by one worker.
 * end is exclusive; the wire form is inclusive (see last()).
 */
struct Chunk {
    int index = 0;
    int64_t start = 0;
    int64_t end = 0;

    int64_t length() const { return end - start; }
    int64_t last() const { return end - 1; }
};

/**
 * Splits [0, size) for `workers` parallel workers. Chunks are at least
 * `threshold` bytes, so small files yield fewer chunks than workers.
 * Returns an empty plan for size 0.
 */
std::vector<Chunk> plan_chunks(int64_t size, int workers, int64_t threshold);

// ============================================================================
// PROGRESS AND RESULTS
// ============================================================================

struct TransferProgress {
    int64_t bytes_done = 0;
    int64_t total = 0;
    double fraction = 0.0;       // 0..1
    double bytes_per_second = 0.0;
};

using ProgressCallback = std::function<void(const TransferProgress&)>;

struct TransferReport {
    int64_t bytes_transferred = 0;  // over the network
    int chunk_count = 0;            // 0 for single-stream transfers
    int64_t resumed_from = 0;
    double elapsed_seconds = 0.0;
    bool packed = false;
};

struct UploadOptions {
    // Ask the server to unpack a .tar.gz once it is complete
    bool auto_extract = false;
};

} // namespace ferry::transfer

#endif // FERRY_TRANSFER_TYPES_H
