#include "packet_cipher.h"

#include <sodium.h>

namespace ferry::crypto {

static_assert(PacketCipher::kNonceSize == crypto_aead_xchacha20poly1305_ietf_NPUBBYTES, "nonce size");
static_assert(PacketCipher::kTagSize == crypto_aead_xchacha20poly1305_ietf_ABYTES, "tag size");

PacketCipher::PacketCipher(const Key& key) : m_key(key) {
    ensure_sodium();
}

PacketCipher::~PacketCipher() {
    sodium_memzero(m_key.data(), m_key.size());
}

std::vector<uint8_t> PacketCipher::seal(const uint8_t* plain, size_t len) const {
    std::vector<uint8_t> out(kNonceSize + len + kTagSize);
    randombytes_buf(out.data(), kNonceSize);

    unsigned long long cipher_len = 0;
    crypto_aead_xchacha20poly1305_ietf_encrypt(
        out.data() + kNonceSize, &cipher_len,
        plain, len,
        nullptr, 0,
        nullptr, out.data(), m_key.data());
    out.resize(kNonceSize + static_cast<size_t>(cipher_len));
    return out;
}

bool PacketCipher::open(const uint8_t* sealed, size_t len, std::vector<uint8_t>& plain) const {
    if (len < kOverhead) {
        return false;
    }
    plain.resize(len - kOverhead);
    unsigned long long plain_len = 0;
    if (crypto_aead_xchacha20poly1305_ietf_decrypt(
            plain.data(), &plain_len, nullptr,
            sealed + kNonceSize, len - kNonceSize,
            nullptr, 0,
            sealed, m_key.data()) != 0) {
        plain.clear();
        return false;
    }
    plain.resize(static_cast<size_t>(plain_len));
    return true;
}

} // namespace ferry::crypto
