/**
 * @file cipher.cpp
 * @brief ChaCha20-Poly1305 packet cipher
 * @note libsodium is REQUIRED - no fallback implementations
 */

#include "rdx_cipher.hpp"
#include "rdx_errors.hpp"

#ifndef HAVE_SODIUM
#error "libsodium is required for packet encryption. Please install libsodium and rebuild"
#endif

#include <sodium.h>
#include <openssl/evp.h>

#include <cstring>

namespace rdx {

static_assert(PacketCipher::KEY_SIZE == crypto_aead_chacha20poly1305_ietf_KEYBYTES,
              "key size mismatch");
static_assert(PacketCipher::NONCE_SIZE == crypto_aead_chacha20poly1305_ietf_NPUBBYTES,
              "nonce size mismatch");
static_assert(PacketCipher::TAG_SIZE == crypto_aead_chacha20poly1305_ietf_ABYTES,
              "tag size mismatch");

PacketCipher::PacketCipher(const std::string& key, const Bytes& salt, int iterations)
    : key_(KEY_SIZE), salt_(salt), iterations_(iterations)
{
    if (sodium_init() < 0) {
        throw CipherError("Failed to initialize libsodium");
    }
    if (key.empty()) {
        throw CipherError("empty encryption key");
    }
    if (iterations_ < 1) {
        throw CipherError("invalid key derivation iterations: " + std::to_string(iterations_));
    }
    if (PKCS5_PBKDF2_HMAC(key.data(), static_cast<int>(key.size()),
                          salt_.data(), static_cast<int>(salt_.size()),
                          iterations_, EVP_sha256(),
                          static_cast<int>(KEY_SIZE), key_.data()) != 1) {
        throw CipherError("PBKDF2 key derivation failed");
    }
}

Bytes PacketCipher::generate_salt() {
    return SecureOps::generate_random(32);
}

Bytes PacketCipher::encrypt(const Bytes& plaintext) const {
    Bytes out(NONCE_SIZE + plaintext.size() + TAG_SIZE);
    randombytes_buf(out.data(), NONCE_SIZE);

    unsigned long long ciphertext_len = 0;
    if (crypto_aead_chacha20poly1305_ietf_encrypt(
            out.data() + NONCE_SIZE, &ciphertext_len,
            plaintext.data(), plaintext.size(),
            nullptr, 0,
            nullptr,
            out.data(),
            key_.data()) != 0) {
        throw CipherError("ChaCha20-Poly1305 encryption failed");
    }
    out.resize(NONCE_SIZE + static_cast<size_t>(ciphertext_len));
    return out;
}

Bytes PacketCipher::decrypt(const Bytes& ciphertext) const {
    if (ciphertext.size() < NONCE_SIZE + TAG_SIZE) {
        throw CipherError("Ciphertext too short");
    }
    Bytes out(ciphertext.size() - NONCE_SIZE - TAG_SIZE);
    unsigned long long plaintext_len = 0;
    if (crypto_aead_chacha20poly1305_ietf_decrypt(
            out.data(), &plaintext_len,
            nullptr,
            ciphertext.data() + NONCE_SIZE, ciphertext.size() - NONCE_SIZE,
            nullptr, 0,
            ciphertext.data(),
            key_.data()) != 0) {
        throw CipherError("ChaCha20-Poly1305 decryption failed or authentication failed");
    }
    out.resize(static_cast<size_t>(plaintext_len));
    return out;
}

} // namespace rdx
