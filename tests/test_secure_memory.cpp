/**
 * @file test_secure_memory.cpp
 * @brief Unit tests for SecureMemory, SecureString and SecureOps
 */

#include <gtest/gtest.h>
#include "rdx_secure_memory.hpp"
#include <cstring>
#include <set>
#include <stdexcept>
#include <vector>

using namespace rdx;

class SecureMemoryTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

// ---- Basic Allocation Tests ----

TEST_F(SecureMemoryTest, DefaultConstruction) {
    SecureMemory mem;

    EXPECT_EQ(mem.size(), 0u);
    EXPECT_EQ(mem.data(), nullptr);
    EXPECT_TRUE(mem.empty());
}

TEST_F(SecureMemoryTest, SizeConstructionIsZeroed) {
    SecureMemory mem(32);

    ASSERT_EQ(mem.size(), 32u);
    ASSERT_NE(mem.data(), nullptr);
    for (size_t i = 0; i < mem.size(); ++i) {
        EXPECT_EQ(mem.data()[i], 0);
    }
}

TEST_F(SecureMemoryTest, DataFromPointer) {
    const uint8_t data[] = {0x01, 0x02, 0x03, 0x04, 0x05};
    SecureMemory mem(data, sizeof(data));

    EXPECT_EQ(mem.size(), 5u);
    EXPECT_EQ(std::memcmp(mem.data(), data, 5), 0);
}

// ---- Move Semantics Tests ----

TEST_F(SecureMemoryTest, MoveConstruction) {
    SecureMemory original(32);
    std::memset(original.data(), 0xAB, 32);
    uint8_t* original_ptr = original.data();

    SecureMemory moved(std::move(original));

    EXPECT_EQ(moved.size(), 32u);
    EXPECT_EQ(moved.data(), original_ptr);
    EXPECT_EQ(moved.data()[0], 0xAB);
    EXPECT_EQ(original.size(), 0u);
    EXPECT_EQ(original.data(), nullptr);
}

TEST_F(SecureMemoryTest, MoveAssignment) {
    SecureMemory original(32);
    std::memset(original.data(), 0xCD, 32);
    SecureMemory target(16);

    target = std::move(original);

    EXPECT_EQ(target.size(), 32u);
    EXPECT_EQ(target.data()[0], 0xCD);
    EXPECT_EQ(original.data(), nullptr);
}

TEST_F(SecureMemoryTest, ZeroMethod) {
    SecureMemory mem(16);
    std::memset(mem.data(), 0x5A, 16);

    mem.zero();

    for (size_t i = 0; i < 16; ++i) {
        EXPECT_EQ(mem.data()[i], 0);
    }
    EXPECT_EQ(mem.size(), 16u);
}

// ---- SecureString Tests ----

TEST_F(SecureMemoryTest, SecureStringConstruction) {
    SecureString str(std::string("Hello, World!"));

    EXPECT_FALSE(str.empty());
    EXPECT_EQ(str.size(), 13u);
    EXPECT_STREQ(str.c_str(), "Hello, World!");
}

TEST_F(SecureMemoryTest, SecureStringEmpty) {
    SecureString str;

    EXPECT_TRUE(str.empty());
    EXPECT_STREQ(str.c_str(), "");
}

TEST_F(SecureMemoryTest, SecureStringWithEmbeddedNul) {
    const char raw[] = {'a', '\0', 'b'};
    SecureString str(raw, sizeof(raw));

    EXPECT_EQ(str.size(), 3u);
    EXPECT_EQ(std::string(str.data(), str.size()), std::string(raw, 3));
}

TEST_F(SecureMemoryTest, SecureStringMove) {
    SecureString original(std::string("Secret Password"));

    SecureString moved(std::move(original));

    EXPECT_STREQ(moved.c_str(), "Secret Password");
    EXPECT_TRUE(original.empty());
}

TEST_F(SecureMemoryTest, SecureStringClear) {
    SecureString str(std::string("gone"));
    str.clear();

    EXPECT_TRUE(str.empty());
    EXPECT_EQ(str.data(), nullptr);
}

// ---- SecureOps Tests ----

TEST_F(SecureMemoryTest, ConstantTimeEquals) {
    EXPECT_TRUE(SecureOps::constant_time_equals("abcdef", "abcdef"));
    EXPECT_FALSE(SecureOps::constant_time_equals("abcdef", "abcdeg"));
    EXPECT_FALSE(SecureOps::constant_time_equals("abc", "abcdef"));
    EXPECT_FALSE(SecureOps::constant_time_equals("", ""));
}

TEST_F(SecureMemoryTest, RandomBytesDiffer) {
    auto a = SecureOps::generate_random(32);
    auto b = SecureOps::generate_random(32);

    EXPECT_EQ(a.size(), 32u);
    EXPECT_NE(a, b);
    EXPECT_TRUE(SecureOps::generate_random(0).empty());
}

TEST_F(SecureMemoryTest, HexEncoding) {
    std::vector<uint8_t> bytes = {0x00, 0x7f, 0xab, 0xff};

    EXPECT_EQ(SecureOps::to_hex(bytes), "007fabff");
    EXPECT_EQ(SecureOps::from_hex("007FABff"), bytes);
    EXPECT_TRUE(SecureOps::from_hex("").empty());
}

TEST_F(SecureMemoryTest, HexRejectsMalformedInput) {
    EXPECT_THROW(SecureOps::from_hex("abc"), std::invalid_argument);
    EXPECT_THROW(SecureOps::from_hex("zz"), std::invalid_argument);
}

// ---- Edge Cases ----

TEST_F(SecureMemoryTest, MultipleAllocations) {
    std::vector<SecureMemory> memories;

    for (int i = 0; i < 100; ++i) {
        memories.emplace_back(256);
        std::memset(memories.back().data(), i, 256);
    }

    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(memories[i].data()[0], static_cast<uint8_t>(i));
    }
}
