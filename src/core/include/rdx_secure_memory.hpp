#ifndef RDX_SECURE_MEMORY_HPP
#define RDX_SECURE_MEMORY_HPP

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace rdx {

/**
 * @brief Key material buffer with auto-zeroing
 *
 * Uses sodium_memzero for guaranteed erasure; holds derived cipher keys.
 */
class SecureMemory {
public:
    SecureMemory();
    explicit SecureMemory(size_t size);
    SecureMemory(const uint8_t* data, size_t size);
    ~SecureMemory();

    // Disable copy - prevent accidental key duplication
    SecureMemory(const SecureMemory&) = delete;
    SecureMemory& operator=(const SecureMemory&) = delete;

    SecureMemory(SecureMemory&& other) noexcept;
    SecureMemory& operator=(SecureMemory&& other) noexcept;

    uint8_t* data() { return data_; }
    const uint8_t* data() const { return data_; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    void zero();

private:
    void release();

    uint8_t* data_ = nullptr;
    size_t size_ = 0;
};

/**
 * @brief Secret string with auto-zeroing destructor
 *
 * Holds shared passwords for the password authenticator and the
 * plaintext recovered during xor verification. Cannot be copied.
 */
class SecureString {
public:
    SecureString();
    explicit SecureString(const std::string& str);
    SecureString(const char* str, size_t len);
    ~SecureString();

    SecureString(const SecureString&) = delete;
    SecureString& operator=(const SecureString&) = delete;

    SecureString(SecureString&& other) noexcept;
    SecureString& operator=(SecureString&& other) noexcept;

    const char* c_str() const { return data_ ? data_ : ""; }
    const char* data() const { return data_; }
    size_t size() const { return size_; }
    size_t length() const { return size_; }
    bool empty() const { return size_ == 0; }

    void clear();

private:
    char* data_ = nullptr;
    size_t size_ = 0;
    size_t capacity_ = 0;
};

/**
 * @brief Small libsodium backed helpers used by digests and salts.
 */
namespace SecureOps {
    // Constant-time comparison; unequal lengths compare false
    bool constant_time_equals(const std::string& a, const std::string& b);

    // Cryptographically secure random bytes
    std::vector<uint8_t> generate_random(size_t size);

    // Lowercase hexadecimal
    std::string to_hex(const uint8_t* data, size_t len);
    std::string to_hex(const std::vector<uint8_t>& data);

    // Throws std::invalid_argument on odd length or non-hex characters
    std::vector<uint8_t> from_hex(const std::string& hex);
}

} // namespace rdx

#endif // RDX_SECURE_MEMORY_HPP
