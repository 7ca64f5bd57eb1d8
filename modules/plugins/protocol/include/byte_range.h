#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace ferry::wire {

// Inclusive byte span, HTTP Range convention. end == -1 means "to the end".
struct ByteRange {
    int64_t start = 0;
    int64_t end = -1;

    bool open_ended() const { return end < 0; }
};

// "bytes=a-b" or "bytes=a-". Suffix ranges ("bytes=-n") and multi-ranges are not supported.
std::optional<ByteRange> parse_range(const std::string& value);
std::string format_range(int64_t start, int64_t end_inclusive);
std::string format_open_range(int64_t start);

struct ContentRange {
    int64_t start = 0;
    int64_t end = 0;     // inclusive
    int64_t total = -1;  // -1 when given as '*'
};

// "bytes a-b/total" or "bytes a-b/*"
std::optional<ContentRange> parse_content_range(const std::string& value);
std::string format_content_range(int64_t start, int64_t end_inclusive, int64_t total);

// "bytes */total": no span, only the complete length. Used in 416 responses and
// to finalize a chunked upload.
std::optional<int64_t> parse_complete_length(const std::string& value);
std::string format_complete_length(int64_t total);

} // namespace ferry::wire
