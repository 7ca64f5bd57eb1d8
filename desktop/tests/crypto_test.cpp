#include "errors.h"
#include "file_hash.h"
#include "key_derivation.h"
#include "packet_cipher.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

using namespace ferry;

bool test_pbkdf2_reference_vector() {
    std::cout << "Testing PBKDF2-HMAC-SHA256 reference vector..." << std::endl;

    // RFC 7914, section 11: P="passwd", S="salt", c=1
    const std::string password = "passwd";
    const std::string salt = "salt";
    uint8_t out[32];
    crypto::pbkdf2_hmac_sha256(reinterpret_cast<const uint8_t*>(password.data()), password.size(),
                               reinterpret_cast<const uint8_t*>(salt.data()), salt.size(), 1, out, sizeof(out));
    TEST_ASSERT(crypto::to_hex(out, sizeof(out)) ==
                    "55ac046e56e3089fec1691c22544b605f94185216dde0465e68b9d57c20dacbc",
                "PBKDF2 output does not match the published vector");
    return true;
}

bool test_key_derivation() {
    std::cout << "Testing key derivation..." << std::endl;

    crypto::Key a1 = crypto::derive_key("abc");
    crypto::Key a2 = crypto::derive_key("abc");
    crypto::Key b = crypto::derive_key("xyz");
    TEST_ASSERT(a1 == a2, "Same passphrase must give the same key");
    TEST_ASSERT(a1 != b, "Different passphrases must give different keys");

    bool threw = false;
    try {
        crypto::derive_key("");
    } catch (const InvalidKeyError&) {
        threw = true;
    }
    TEST_ASSERT(threw, "Empty passphrase should be rejected");
    return true;
}

bool test_packet_cipher() {
    std::cout << "Testing packet cipher..." << std::endl;

    crypto::PacketCipher cipher(crypto::derive_key("abc"));
    const std::string message = "ferry datagram payload";
    auto sealed = cipher.seal(reinterpret_cast<const uint8_t*>(message.data()), message.size());
    TEST_ASSERT(sealed.size() == message.size() + crypto::PacketCipher::kOverhead, "Unexpected sealed size");

    std::vector<uint8_t> plain;
    TEST_ASSERT(cipher.open(sealed.data(), sealed.size(), plain), "Open failed with the right key");
    TEST_ASSERT(std::string(plain.begin(), plain.end()) == message, "Decrypted text differs");

    auto again = cipher.seal(reinterpret_cast<const uint8_t*>(message.data()), message.size());
    TEST_ASSERT(again != sealed, "Nonces must differ between datagrams");

    crypto::PacketCipher other(crypto::derive_key("xyz"));
    TEST_ASSERT(!other.open(sealed.data(), sealed.size(), plain), "Wrong key must fail authentication");

    sealed[sealed.size() / 2] ^= 0x01;
    TEST_ASSERT(!cipher.open(sealed.data(), sealed.size(), plain), "Tampered datagram must be rejected");

    TEST_ASSERT(!cipher.open(sealed.data(), crypto::PacketCipher::kOverhead - 1, plain),
                "Short datagram must be rejected");
    return true;
}

bool test_sha256() {
    std::cout << "Testing SHA-256 helpers..." << std::endl;

    TEST_ASSERT(crypto::sha256_hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
                "sha256(abc) mismatch");
    TEST_ASSERT(crypto::sha256_hex("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855",
                "sha256('') mismatch");

    auto path = std::filesystem::temp_directory_path() / ("ferry_hash_" + crypto::random_hex(4));
    {
        std::ofstream out(path, std::ios::binary);
        out << "abc";
    }
    std::string file_hash = crypto::sha256_file_hex(path.string());
    std::filesystem::remove(path);
    TEST_ASSERT(file_hash == crypto::sha256_hex("abc"), "File hash differs from buffer hash");

    bool threw = false;
    try {
        crypto::sha256_file_hex(path.string());
    } catch (const IOError&) {
        threw = true;
    }
    TEST_ASSERT(threw, "Hashing a missing file should raise IOError");
    return true;
}

int main() {
    std::cout << "Running Crypto Tests..." << std::endl;

    test_pbkdf2_reference_vector();
    test_key_derivation();
    test_packet_cipher();
    test_sha256();

    if (tests_failed == 0) {
        std::cout << "ALL CRYPTO TESTS PASSED" << std::endl;
        return 0;
    } else {
        std::cerr << tests_failed << " TESTS FAILED" << std::endl;
        return 1;
    }
}
