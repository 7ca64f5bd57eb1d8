#include "byte_range.h"

#include <cctype>

namespace ferry::wire {

namespace {

// Parses a non-negative decimal occupying value[pos, end). No sign, no whitespace.
bool parse_number(const std::string& value, size_t pos, size_t end, int64_t& out) {
    if (pos >= end || end - pos > 18) {
        return false;
    }
    int64_t n = 0;
    for (size_t i = pos; i < end; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(value[i]))) {
            return false;
        }
        n = n * 10 + (value[i] - '0');
    }
    out = n;
    return true;
}

} // namespace

std::optional<ByteRange> parse_range(const std::string& value) {
    const std::string prefix = "bytes=";
    if (value.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }
    size_t dash = value.find('-', prefix.size());
    if (dash == std::string::npos) {
        return std::nullopt;
    }
    ByteRange range;
    if (!parse_number(value, prefix.size(), dash, range.start)) {
        return std::nullopt;
    }
    if (dash + 1 == value.size()) {
        range.end = -1;
        return range;
    }
    if (!parse_number(value, dash + 1, value.size(), range.end) || range.end < range.start) {
        return std::nullopt;
    }
    return range;
}

std::string format_range(int64_t start, int64_t end_inclusive) {
    return "bytes=" + std::to_string(start) + "-" + std::to_string(end_inclusive);
}

std::string format_open_range(int64_t start) {
    return "bytes=" + std::to_string(start) + "-";
}

std::optional<ContentRange> parse_content_range(const std::string& value) {
    const std::string prefix = "bytes ";
    if (value.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }
    size_t dash = value.find('-', prefix.size());
    size_t slash = value.find('/', prefix.size());
    if (dash == std::string::npos || slash == std::string::npos || slash < dash) {
        return std::nullopt;
    }
    ContentRange cr;
    if (!parse_number(value, prefix.size(), dash, cr.start) ||
        !parse_number(value, dash + 1, slash, cr.end) || cr.end < cr.start) {
        return std::nullopt;
    }
    if (value.size() == slash + 2 && value[slash + 1] == '*') {
        cr.total = -1;
    } else if (!parse_number(value, slash + 1, value.size(), cr.total) || cr.total <= cr.end) {
        return std::nullopt;
    }
    return cr;
}

std::string format_content_range(int64_t start, int64_t end_inclusive, int64_t total) {
    return "bytes " + std::to_string(start) + "-" + std::to_string(end_inclusive) + "/" +
           std::to_string(total);
}

std::optional<int64_t> parse_complete_length(const std::string& value) {
    const std::string prefix = "bytes */";
    if (value.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }
    int64_t total = 0;
    if (!parse_number(value, prefix.size(), value.size(), total)) {
        return std::nullopt;
    }
    return total;
}

std::string format_complete_length(int64_t total) {
    return "bytes */" + std::to_string(total);
}

} // namespace ferry::wire
