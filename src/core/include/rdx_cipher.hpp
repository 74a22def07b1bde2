#pragma once

/**
 * @file rdx_cipher.hpp
 * @brief Packet encryption for frames carrying the CIPHER flag
 *
 * Key: PBKDF2-HMAC-SHA256(shared key, salt, iterations), 32 bytes.
 * Wire format: [nonce:12][ciphertext + Poly1305 tag:N+16]
 */

#include "rdx_secure_memory.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace rdx {

using Bytes = std::vector<uint8_t>;

class PacketCipher {
public:
    static constexpr const char* NAME = "chacha20-poly1305";
    static constexpr int DEFAULT_ITERATIONS = 1000;
    static constexpr size_t KEY_SIZE = 32;
    static constexpr size_t NONCE_SIZE = 12;
    static constexpr size_t TAG_SIZE = 16;

    /// Throws CipherError when the key is empty or derivation fails
    PacketCipher(const std::string& key, const Bytes& salt,
                 int iterations = DEFAULT_ITERATIONS);

    PacketCipher(const PacketCipher&) = delete;
    PacketCipher& operator=(const PacketCipher&) = delete;

    Bytes encrypt(const Bytes& plaintext) const;

    /// Throws CipherError on truncated input or a failed tag check
    Bytes decrypt(const Bytes& ciphertext) const;

    const Bytes& salt() const { return salt_; }
    int iterations() const { return iterations_; }

    static Bytes generate_salt();

private:
    SecureMemory key_;
    Bytes salt_;
    int iterations_;
};

} // namespace rdx
