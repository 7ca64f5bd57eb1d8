#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace ferry::crypto {

inline constexpr size_t kKeySize = 32;
inline constexpr int kPbkdf2Iterations = 4096;
inline constexpr const char* kKeySalt = "ferry-file-transfer";

using Key = std::array<uint8_t, kKeySize>;

// Initializes libsodium once per process. Throws std::runtime_error on failure.
void ensure_sodium();

// SHA-256(passphrase) fed through PBKDF2-HMAC-SHA256 with the fixed salt.
// Both peers derive the same key without exchanging anything. Throws InvalidKeyError on empty input.
Key derive_key(const std::string& passphrase);

// PBKDF2-HMAC-SHA256 (RFC 8018) for an arbitrary output length.
void pbkdf2_hmac_sha256(const uint8_t* password, size_t password_len,
                        const uint8_t* salt, size_t salt_len,
                        int iterations, uint8_t* out, size_t out_len);

std::string to_hex(const uint8_t* data, size_t len);

// Hex string of `bytes` random bytes from the libsodium generator.
std::string random_hex(size_t bytes);

} // namespace ferry::crypto
