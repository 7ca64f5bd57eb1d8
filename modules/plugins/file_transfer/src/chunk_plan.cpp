#include "transfer_types.h"

#include <algorithm>

namespace ferry::transfer {

std::vector<Chunk> plan_chunks(int64_t size, int workers, int64_t threshold) {
    std::vector<Chunk> chunks;
    if (size <= 0) {
        return chunks;
    }
    workers = std::max(workers, 1);
    threshold = std::max<int64_t>(threshold, 1);

    int64_t chunk_size = (size + workers - 1) / workers;
    chunk_size = std::max(chunk_size, threshold);
    const int64_t count = (size + chunk_size - 1) / chunk_size;

    chunks.reserve(static_cast<size_t>(count));
    for (int64_t i = 0; i < count; ++i) {
        Chunk c;
        c.index = static_cast<int>(i);
        c.start = i * chunk_size;
        c.end = std::min(c.start + chunk_size, size);
        chunks.push_back(c);
    }
    return chunks;
}

} // namespace ferry::transfer
