#include "rdx_secure_memory.hpp"
#include <sodium.h>
#include <cstring>
#include <stdexcept>

namespace rdx {

namespace {

void ensure_sodium() {
    static const bool ready = (sodium_init() >= 0);
    if (!ready) {
        throw std::runtime_error("Failed to initialize libsodium");
    }
}

} // namespace

// ---- SecureMemory ------------------------------------------------------

SecureMemory::SecureMemory() = default;

SecureMemory::SecureMemory(size_t size)
    : size_(size)
{
    if (size > 0) {
        data_ = new uint8_t[size];
        std::memset(data_, 0, size_);
    }
}

SecureMemory::SecureMemory(const uint8_t* data, size_t size)
    : SecureMemory(size)
{
    if (data && size > 0) {
        std::memcpy(data_, data, size);
    }
}

SecureMemory::~SecureMemory() {
    release();
}

SecureMemory::SecureMemory(SecureMemory&& other) noexcept
    : data_(other.data_), size_(other.size_)
{
    other.data_ = nullptr;
    other.size_ = 0;
}

SecureMemory& SecureMemory::operator=(SecureMemory&& other) noexcept {
    if (this != &other) {
        release();
        data_ = other.data_;
        size_ = other.size_;
        other.data_ = nullptr;
        other.size_ = 0;
    }
    return *this;
}

void SecureMemory::zero() {
    if (data_ && size_ > 0) {
        sodium_memzero(data_, size_);
    }
}

void SecureMemory::release() {
    if (data_) {
        zero();
        delete[] data_;
        data_ = nullptr;
    }
    size_ = 0;
}

// ---- SecureString ------------------------------------------------------

SecureString::SecureString() = default;

SecureString::SecureString(const std::string& str)
    : SecureString(str.data(), str.size())
{}

SecureString::SecureString(const char* str, size_t len)
    : size_(len), capacity_(len + 1)
{
    data_ = new char[capacity_];
    if (str && len > 0) {
        std::memcpy(data_, str, size_);
    } else {
        size_ = 0;
    }
    data_[size_] = '\0';
}

SecureString::~SecureString() {
    clear();
}

SecureString::SecureString(SecureString&& other) noexcept
    : data_(other.data_), size_(other.size_), capacity_(other.capacity_)
{
    other.data_ = nullptr;
    other.size_ = 0;
    other.capacity_ = 0;
}

SecureString& SecureString::operator=(SecureString&& other) noexcept {
    if (this != &other) {
        clear();
        data_ = other.data_;
        size_ = other.size_;
        capacity_ = other.capacity_;
        other.data_ = nullptr;
        other.size_ = 0;
        other.capacity_ = 0;
    }
    return *this;
}

void SecureString::clear() {
    if (data_) {
        sodium_memzero(data_, capacity_);
        delete[] data_;
        data_ = nullptr;
    }
    size_ = 0;
    capacity_ = 0;
}

// ---- SecureOps ---------------------------------------------------------

namespace SecureOps {

bool constant_time_equals(const std::string& a, const std::string& b) {
    if (a.size() != b.size() || a.empty()) return false;
    ensure_sodium();
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::vector<uint8_t> generate_random(size_t size) {
    ensure_sodium();
    std::vector<uint8_t> result(size);
    if (size > 0) {
        randombytes_buf(result.data(), size);
    }
    return result;
}

std::string to_hex(const uint8_t* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0f]);
    }
    return out;
}

std::string to_hex(const std::vector<uint8_t>& data) {
    return to_hex(data.data(), data.size());
}

std::vector<uint8_t> from_hex(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("odd length hex string");
    }
    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = nibble(hex[i]);
        int lo = nibble(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("invalid hex character");
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

} // namespace SecureOps

} // namespace rdx
