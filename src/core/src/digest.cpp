#include "rdx_digest.hpp"
#include "rdx_errors.hpp"
#include "rdx_secure_memory.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <algorithm>

namespace rdx {

namespace {

const std::vector<std::string>& hmac_hashes() {
    static const std::vector<std::string> hashes = {"sha512", "sha384", "sha256", "sha224"};
    return hashes;
}

const EVP_MD* hash_for(const std::string& digest) {
    std::string hash = digest.substr(std::string(Digest::HMAC_PREFIX).size());
    if (hash == "sha512") return EVP_sha512();
    if (hash == "sha384") return EVP_sha384();
    if (hash == "sha256") return EVP_sha256();
    if (hash == "sha224") return EVP_sha224();
    return nullptr;
}

} // namespace

std::vector<std::string> supported_digests() {
    std::vector<std::string> out;
    for (const auto& h : hmac_hashes()) out.push_back(Digest::HMAC_PREFIX + h);
    out.emplace_back(Digest::XOR);
    return out;
}

std::string normalize_digest(const std::string& name) {
    if (name == "hmac") return "hmac+sha256";
    return name;
}

bool is_hmac_digest(const std::string& name) {
    std::string n = normalize_digest(name);
    return n.rfind(Digest::HMAC_PREFIX, 0) == 0 && hash_for(n) != nullptr;
}

bool is_supported_digest(const std::string& name) {
    return name == Digest::XOR || is_hmac_digest(name);
}

std::string choose_digest(const std::vector<std::string>& offered) {
    std::vector<std::string> normalized;
    for (const auto& d : offered) normalized.push_back(normalize_digest(d));

    for (const auto& h : hmac_hashes()) {
        std::string name = Digest::HMAC_PREFIX + h;
        if (std::find(normalized.begin(), normalized.end(), name) != normalized.end()) {
            return name;
        }
    }
    if (std::find(normalized.begin(), normalized.end(), Digest::XOR) != normalized.end()) {
        return Digest::XOR;
    }

    std::string list;
    for (const auto& d : offered) {
        if (!list.empty()) list += ", ";
        list += d;
    }
    throw UnsupportedDigestError("no supported digest in: " + (list.empty() ? "(none)" : list));
}

std::string xor_bytes(const std::string& a, const std::string& b) {
    size_t n = std::min(a.size(), b.size());
    std::string out(n, '\0');
    for (size_t i = 0; i < n; ++i) {
        out[i] = static_cast<char>(static_cast<uint8_t>(a[i]) ^ static_cast<uint8_t>(b[i]));
    }
    return out;
}

std::string combine_salts(const std::string& server_salt, const std::string& client_salt) {
    if (client_salt.empty()) return server_salt;
    return xor_bytes(server_salt, client_salt);
}

std::string gen_digest(const std::string& digest, const std::string& secret,
                       const std::string& salt) {
    std::string name = normalize_digest(digest);
    if (name == Digest::XOR) {
        std::string padded = salt;
        padded.resize(secret.size(), '\0');
        return xor_bytes(secret, padded);
    }
    const EVP_MD* md = is_hmac_digest(name) ? hash_for(name) : nullptr;
    if (!md) {
        throw UnsupportedDigestError("unsupported digest: " + digest);
    }
    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned int mac_len = 0;
    if (!HMAC(md, secret.data(), static_cast<int>(secret.size()),
              reinterpret_cast<const unsigned char*>(salt.data()), salt.size(),
              mac, &mac_len)) {
        throw UnsupportedDigestError("HMAC computation failed for " + name);
    }
    return SecureOps::to_hex(mac, mac_len);
}

bool verify_digest(const std::string& digest, const std::string& secret,
                   const std::string& salt, const std::string& response) {
    if (response.empty()) return false;
    std::string expected;
    try {
        expected = gen_digest(digest, secret, salt);
    } catch (const UnsupportedDigestError&) {
        return false;
    }
    return SecureOps::constant_time_equals(expected, response);
}

std::string generate_salt(size_t len) {
    len = std::clamp(len, Digest::MIN_SALT_LEN, Digest::MAX_SALT_LEN);
    return SecureOps::to_hex(SecureOps::generate_random(len));
}

} // namespace rdx
