#pragma once

/**
 * @file rdx_digest.hpp
 * @brief Challenge digests: "xor" and "hmac+<hash>"
 *
 * HMAC responses are lowercase hex of HMAC(secret, salt). xor responses
 * are the secret xored with the salt, the salt zero padded or truncated
 * to the secret's length. md5 and sha1 are never offered or accepted.
 */

#include <cstddef>
#include <string>
#include <vector>

namespace rdx {

namespace Digest {
    constexpr const char* XOR = "xor";
    constexpr const char* HMAC_PREFIX = "hmac+";
    constexpr size_t MIN_SALT_LEN = 32;
    constexpr size_t MAX_SALT_LEN = 1023;
    constexpr size_t DEFAULT_SALT_LEN = 32;
}

/// Strongest first: hmac+sha512, hmac+sha384, hmac+sha256, hmac+sha224, xor
std::vector<std::string> supported_digests();

/// "hmac" is read as "hmac+sha256"; other names are returned unchanged
std::string normalize_digest(const std::string& name);

bool is_supported_digest(const std::string& name);
bool is_hmac_digest(const std::string& name);

/**
 * @brief Pick the digest to use from those a client offered
 *
 * Prefers the strongest HMAC, then xor. Throws UnsupportedDigestError
 * when nothing offered is usable.
 */
std::string choose_digest(const std::vector<std::string>& offered);

/// Throws UnsupportedDigestError for unknown digests
std::string gen_digest(const std::string& digest, const std::string& secret,
                       const std::string& salt);

/// Constant time; false for unknown digests or empty responses
bool verify_digest(const std::string& digest, const std::string& secret,
                   const std::string& salt, const std::string& response);

/// Bytewise xor over the shorter of the two inputs
std::string xor_bytes(const std::string& a, const std::string& b);

/// Salt mixing: xor of both salts, or the server salt alone
std::string combine_salts(const std::string& server_salt, const std::string& client_salt);

/// Hex encoding of @p len random bytes; len is clamped to [32, 1023]
std::string generate_salt(size_t len = Digest::DEFAULT_SALT_LEN);

} // namespace rdx
