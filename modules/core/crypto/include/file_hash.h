#pragma once

#include <string>

namespace ferry::crypto {

// Lowercase hex SHA-256 of the file content. Throws IOError if the file cannot be read.
std::string sha256_file_hex(const std::string& path);

std::string sha256_hex(const std::string& data);

} // namespace ferry::crypto
