#include "key_derivation.h"
#include "errors.h"
#include "logger.h"

#include <sodium.h>
#include <algorithm>
#include <cstring>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace ferry::crypto {

void ensure_sodium() {
    static std::once_flag once;
    static bool ok = false;
    std::call_once(once, [] {
        ok = sodium_init() >= 0;
        if (!ok) {
            LOG_ERROR("CRYPTO: sodium_init failed");
        }
    });
    if (!ok) {
        throw std::runtime_error("Failed to initialize libsodium");
    }
}

void pbkdf2_hmac_sha256(const uint8_t* password, size_t password_len,
                        const uint8_t* salt, size_t salt_len,
                        int iterations, uint8_t* out, size_t out_len) {
    uint8_t u[crypto_auth_hmacsha256_BYTES];
    uint8_t t[crypto_auth_hmacsha256_BYTES];
    std::vector<uint8_t> salt_block(salt, salt + salt_len);
    salt_block.resize(salt_len + 4);

    uint32_t block = 1;
    size_t produced = 0;
    while (produced < out_len) {
        salt_block[salt_len] = static_cast<uint8_t>(block >> 24);
        salt_block[salt_len + 1] = static_cast<uint8_t>(block >> 16);
        salt_block[salt_len + 2] = static_cast<uint8_t>(block >> 8);
        salt_block[salt_len + 3] = static_cast<uint8_t>(block);

        crypto_auth_hmacsha256_state st;
        crypto_auth_hmacsha256_init(&st, password, password_len);
        crypto_auth_hmacsha256_update(&st, salt_block.data(), salt_block.size());
        crypto_auth_hmacsha256_final(&st, u);
        std::memcpy(t, u, sizeof(t));

        for (int i = 1; i < iterations; ++i) {
            crypto_auth_hmacsha256_init(&st, password, password_len);
            crypto_auth_hmacsha256_update(&st, u, sizeof(u));
            crypto_auth_hmacsha256_final(&st, u);
            for (size_t j = 0; j < sizeof(t); ++j) {
                t[j] ^= u[j];
            }
        }

        size_t take = std::min(out_len - produced, sizeof(t));
        std::memcpy(out + produced, t, take);
        produced += take;
        ++block;
    }
    sodium_memzero(u, sizeof(u));
    sodium_memzero(t, sizeof(t));
}

Key derive_key(const std::string& passphrase) {
    if (passphrase.empty()) {
        throw InvalidKeyError();
    }
    ensure_sodium();

    uint8_t normalized[crypto_hash_sha256_BYTES];
    crypto_hash_sha256(normalized, reinterpret_cast<const uint8_t*>(passphrase.data()), passphrase.size());

    Key key{};
    pbkdf2_hmac_sha256(normalized, sizeof(normalized),
                       reinterpret_cast<const uint8_t*>(kKeySalt), std::strlen(kKeySalt),
                       kPbkdf2Iterations, key.data(), key.size());
    sodium_memzero(normalized, sizeof(normalized));
    return key;
}

std::string to_hex(const uint8_t* data, size_t len) {
    std::string hex(len * 2 + 1, '\0');
    sodium_bin2hex(&hex[0], hex.size(), data, len);
    hex.resize(len * 2);
    return hex;
}

std::string random_hex(size_t bytes) {
    ensure_sodium();
    std::string raw(bytes, '\0');
    randombytes_buf(&raw[0], raw.size());
    return to_hex(reinterpret_cast<const uint8_t*>(raw.data()), raw.size());
}

} // namespace ferry::crypto
