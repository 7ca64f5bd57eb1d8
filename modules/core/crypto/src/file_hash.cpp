#include "file_hash.h"
#include "key_derivation.h"
#include "errors.h"

#include <sodium.h>
#include <fstream>
#include <vector>

namespace ferry::crypto {

std::string sha256_file_hex(const std::string& path) {
    ensure_sodium();
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw IOError("cannot open for hashing: " + path);
    }

    crypto_hash_sha256_state st;
    crypto_hash_sha256_init(&st);
    std::vector<char> buf(256 * 1024);
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        std::streamsize got = in.gcount();
        if (got > 0) {
            crypto_hash_sha256_update(&st, reinterpret_cast<const uint8_t*>(buf.data()),
                                      static_cast<unsigned long long>(got));
        }
    }
    if (in.bad()) {
        throw IOError("read failed while hashing: " + path);
    }

    uint8_t digest[crypto_hash_sha256_BYTES];
    crypto_hash_sha256_final(&st, digest);
    return to_hex(digest, sizeof(digest));
}

std::string sha256_hex(const std::string& data) {
    ensure_sodium();
    uint8_t digest[crypto_hash_sha256_BYTES];
    crypto_hash_sha256(digest, reinterpret_cast<const uint8_t*>(data.data()), data.size());
    return to_hex(digest, sizeof(digest));
}

} // namespace ferry::crypto
