#pragma once

#include "key_derivation.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace ferry::crypto {

// Per-datagram authenticated encryption (XChaCha20-Poly1305).
// Wire layout: [nonce 24][ciphertext][tag 16].
class PacketCipher {
public:
    static constexpr size_t kNonceSize = 24;
    static constexpr size_t kTagSize = 16;
    static constexpr size_t kOverhead = kNonceSize + kTagSize;

    explicit PacketCipher(const Key& key);
    ~PacketCipher();

    PacketCipher(const PacketCipher&) = delete;
    PacketCipher& operator=(const PacketCipher&) = delete;

    std::vector<uint8_t> seal(const uint8_t* plain, size_t len) const;

    // Returns false when the datagram is too short or fails authentication.
    bool open(const uint8_t* sealed, size_t len, std::vector<uint8_t>& plain) const;

private:
    Key m_key;
};

} // namespace ferry::crypto
