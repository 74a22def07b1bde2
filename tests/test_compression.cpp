/**
 * @file test_compression.cpp
 * @brief zlib / lz4 payload compression and header driven decompression
 */

#include <gtest/gtest.h>
#include "rdx_compression.hpp"
#include "rdx_errors.hpp"
#include "rdx_frame.hpp"

#include <stdexcept>
#include <string>

using namespace rdx;

class CompressionTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::string text;
        for (int i = 0; i < 200; ++i) {
            text += "damage region " + std::to_string(i % 7) + " ";
        }
        data_.assign(text.begin(), text.end());
    }

    Bytes data_;
};

// ---- Names ----

TEST_F(CompressionTest, NamesRoundTrip) {
    for (auto c : {Compressor::NONE, Compressor::ZLIB, Compressor::LZ4, Compressor::LZO}) {
        EXPECT_EQ(compressor_from_string(compressor_to_string(c)), c);
    }
    EXPECT_THROW(compressor_from_string("brotli"), std::invalid_argument);
}

TEST_F(CompressionTest, HeaderFlags) {
    EXPECT_EQ(compressor_flag(Compressor::ZLIB), 0);
    EXPECT_EQ(compressor_flag(Compressor::NONE), 0);
    EXPECT_EQ(compressor_flag(Compressor::LZ4), FrameFlags::COMPRESS_LZ4);
    EXPECT_EQ(compressor_flag(Compressor::LZO), FrameFlags::COMPRESS_LZO);
}

TEST_F(CompressionTest, Availability) {
    EXPECT_TRUE(compressor_available(Compressor::ZLIB));
    EXPECT_TRUE(compressor_available(Compressor::NONE));
    EXPECT_FALSE(compressor_available(Compressor::LZO));

    auto names = available_compressors();
    ASSERT_FALSE(names.empty());
    EXPECT_EQ(names.front(), "zlib");
}

// ---- zlib ----

TEST_F(CompressionTest, ZlibShrinksRepetitiveData) {
    Bytes packed = compression::compress(Compressor::ZLIB, data_, 6);
    EXPECT_LT(packed.size(), data_.size());
    EXPECT_EQ(compression::decompress(0, 6, packed, 1 << 20), data_);
}

TEST_F(CompressionTest, LevelZeroIsStored) {
    EXPECT_EQ(compression::compress(Compressor::ZLIB, data_, 0), data_);
    EXPECT_EQ(compression::decompress(0, 0, data_, 1 << 20), data_);
}

TEST_F(CompressionTest, NoHeaderFlagPassesThrough) {
    EXPECT_EQ(compression::decompress(FrameFlags::NO_HEADER, 3, data_, 1 << 20), data_);
}

TEST_F(CompressionTest, CorruptZlibRaises) {
    Bytes garbage = {0x01, 0x02, 0x03, 0x04, 0x05};
    EXPECT_THROW(compression::decompress(0, 1, garbage, 1 << 20), CompressionError);

    Bytes packed = compression::compress(Compressor::ZLIB, data_, 6);
    packed.resize(packed.size() / 2);
    EXPECT_THROW(compression::decompress(0, 1, packed, 1 << 20), CompressionError);
}

TEST_F(CompressionTest, DecompressionSizeCap) {
    Bytes zeros(100000, 0);
    Bytes packed = compression::compress(Compressor::ZLIB, zeros, 9);
    EXPECT_THROW(compression::decompress(0, 9, packed, 1000), CompressionError);
}

// ---- lz4 / lzo ----

TEST_F(CompressionTest, Lz4RoundTrip) {
    if (!compressor_available(Compressor::LZ4)) {
        GTEST_SKIP() << "lz4 not built";
    }
    Bytes packed = compression::compress(Compressor::LZ4, data_, 1);
    // 4-byte little-endian size prefix
    ASSERT_GE(packed.size(), 4u);
    uint32_t size = packed[0] | (packed[1] << 8) | (packed[2] << 16) | (packed[3] << 24);
    EXPECT_EQ(size, data_.size());
    EXPECT_EQ(compression::decompress(FrameFlags::COMPRESS_LZ4, 1, packed, 1 << 20), data_);
}

TEST_F(CompressionTest, Lz4WithoutSupportRaises) {
    if (compressor_available(Compressor::LZ4)) {
        GTEST_SKIP() << "lz4 is built";
    }
    EXPECT_THROW(compression::decompress(FrameFlags::COMPRESS_LZ4, 1, data_, 1 << 20),
                 CompressionError);
}

TEST_F(CompressionTest, LzoAlwaysRaises) {
    EXPECT_THROW(compression::decompress(FrameFlags::COMPRESS_LZO, 1, data_, 1 << 20),
                 CompressionError);
    EXPECT_THROW(compression::compress(Compressor::LZO, data_, 1), CompressionError);
}

TEST_F(CompressionTest, SchemeACheckedBeforeSchemeB) {
    if (!compressor_available(Compressor::LZ4)) {
        GTEST_SKIP() << "lz4 not built";
    }
    Bytes packed = compression::compress(Compressor::LZ4, data_, 1);
    uint8_t both = FrameFlags::COMPRESS_LZ4 | FrameFlags::COMPRESS_LZO;
    EXPECT_EQ(compression::decompress(both, 1, packed, 1 << 20), data_);
}
