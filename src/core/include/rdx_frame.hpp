#pragma once

/**
 * @file rdx_frame.hpp
 * @brief Wire frame codec: 8-byte header, frame encoder, stream reader
 *
 * Header layout (network byte order):
 *   [0] magic 'P'  [1] flags  [2] compression level  [3] chunk index
 *   [4..7] payload size (uint32, big-endian)
 */

#include "rdx_compression.hpp"
#include "rdx_packet.hpp"

#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rdx {

class PacketCipher;

constexpr uint8_t  FRAME_MAGIC = 'P';
constexpr size_t   FRAME_HEADER_SIZE = 8;
constexpr uint32_t DEFAULT_MAX_PACKET_SIZE = 256u * 1024u * 1024u;
constexpr size_t   DEFAULT_CHUNK_THRESHOLD = 4096;

namespace FrameFlags {
    constexpr uint8_t ALT_SERIALIZATION   = 0x01;
    constexpr uint8_t CIPHER              = 0x02;
    constexpr uint8_t ALT_SERIALIZATION_2 = 0x04;
    constexpr uint8_t RESERVED_08         = 0x08;
    constexpr uint8_t COMPRESS_LZ4        = 0x10;   // scheme A
    constexpr uint8_t COMPRESS_LZO        = 0x20;   // scheme B
    constexpr uint8_t NO_HEADER           = 0x40;
    constexpr uint8_t RESERVED_80         = 0x80;

    constexpr uint8_t SERIALIZATION_MASK = ALT_SERIALIZATION | ALT_SERIALIZATION_2;
    constexpr uint8_t COMPRESSION_MASK   = COMPRESS_LZ4 | COMPRESS_LZO;
    constexpr uint8_t RESERVED_MASK      = RESERVED_08 | RESERVED_80;
}

/// "cipher|lz4", "none" for 0; reserved bits show as hex
std::string flags_to_string(uint8_t flags);

struct FrameHeader {
    uint8_t magic = FRAME_MAGIC;
    uint8_t flags = 0;
    uint8_t level = 0;
    uint8_t index = 0;
    uint32_t payload_size = 0;

    bool operator==(const FrameHeader& o) const {
        return magic == o.magic && flags == o.flags && level == o.level
            && index == o.index && payload_size == o.payload_size;
    }
    bool operator!=(const FrameHeader& o) const { return !(*this == o); }
};

/// Bit-exact for every flags value; performs no validation
std::array<uint8_t, FRAME_HEADER_SIZE> encode_header(uint8_t flags, uint8_t level,
                                                     uint8_t index, uint32_t payload_size);

/// Throws FormatError on a short buffer or a bad magic byte
FrameHeader decode_header(const uint8_t* buf, size_t len);
FrameHeader decode_header(const Bytes& buf);

struct Frame {
    FrameHeader header;
    Bytes payload;

    /// Header followed by payload; payload_size is taken from payload
    Bytes to_bytes() const;
};

// ===== Encoder =====

struct FrameEncoderOptions {
    Compressor compressor = Compressor::ZLIB;
    int level = 1;
    size_t chunk_threshold = DEFAULT_CHUNK_THRESHOLD;   // 0 disables chunking
};

/**
 * @brief Serialises packets into wire frames
 *
 * Large byte-string items (position 1..255) are sent first as raw chunk
 * frames and replaced by an empty string in the main frame (index 0).
 */
class FrameEncoder {
public:
    explicit FrameEncoder(FrameEncoderOptions options = FrameEncoderOptions());

    /// Throws CompressionError if the compressor is not available
    std::vector<Frame> encode(const Packet& packet) const;

    /// All frames of encode() concatenated
    Bytes encode_to_wire(const Packet& packet) const;

    void set_cipher(std::shared_ptr<const PacketCipher> cipher) { cipher_ = std::move(cipher); }
    bool has_cipher() const { return cipher_ != nullptr; }

    const FrameEncoderOptions& options() const { return options_; }

private:
    Frame make_frame(uint8_t flags, uint8_t level, uint8_t index, Bytes payload) const;

    FrameEncoderOptions options_;
    std::shared_ptr<const PacketCipher> cipher_;
};

// ===== Reader =====

/**
 * @brief Incremental frame parser
 *
 * feed() accepts arbitrary slices of the byte stream; next() returns a
 * packet once its main frame is complete. Errors are ProtocolError
 * subclasses and leave the reader unusable.
 */
class FrameReader {
public:
    explicit FrameReader(uint32_t max_packet_size = DEFAULT_MAX_PACKET_SIZE);

    void feed(const uint8_t* data, size_t len);
    void feed(const Bytes& data) { feed(data.data(), data.size()); }

    std::optional<Packet> next();

    void set_cipher(std::shared_ptr<const PacketCipher> cipher) { cipher_ = std::move(cipher); }

    size_t buffered() const { return buffer_.size() - offset_; }
    size_t pending_chunks() const { return chunks_.size(); }
    uint64_t frames_read() const { return frames_read_; }

private:
    void compact();

    uint32_t max_packet_size_;
    std::shared_ptr<const PacketCipher> cipher_;
    Bytes buffer_;
    size_t offset_ = 0;
    std::map<uint8_t, std::string> chunks_;
    uint64_t frames_read_ = 0;
};

} // namespace rdx
