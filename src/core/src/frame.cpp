#include "rdx_frame.hpp"
#include "rdx_cipher.hpp"
#include "rdx_errors.hpp"
#include "rdx_logger.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <utility>

namespace rdx {

std::string flags_to_string(uint8_t flags) {
    static const std::pair<uint8_t, const char*> names[] = {
        {FrameFlags::ALT_SERIALIZATION,   "rencode"},
        {FrameFlags::CIPHER,              "cipher"},
        {FrameFlags::ALT_SERIALIZATION_2, "yaml"},
        {FrameFlags::COMPRESS_LZ4,        "lz4"},
        {FrameFlags::COMPRESS_LZO,        "lzo"},
        {FrameFlags::NO_HEADER,           "noheader"},
    };
    if (flags == 0) return "none";

    std::string out;
    uint8_t known = 0;
    for (const auto& n : names) {
        if (flags & n.first) {
            if (!out.empty()) out += '|';
            out += n.second;
            known |= n.first;
        }
    }
    uint8_t rest = flags & static_cast<uint8_t>(~known);
    if (rest) {
        std::ostringstream oss;
        oss << "0x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(rest);
        if (!out.empty()) out += '|';
        out += oss.str();
    }
    return out;
}

// ===== Header =====

std::array<uint8_t, FRAME_HEADER_SIZE> encode_header(uint8_t flags, uint8_t level,
                                                     uint8_t index, uint32_t payload_size) {
    return {
        FRAME_MAGIC,
        flags,
        level,
        index,
        static_cast<uint8_t>((payload_size >> 24) & 0xff),
        static_cast<uint8_t>((payload_size >> 16) & 0xff),
        static_cast<uint8_t>((payload_size >> 8) & 0xff),
        static_cast<uint8_t>(payload_size & 0xff),
    };
}

FrameHeader decode_header(const uint8_t* buf, size_t len) {
    if (buf == nullptr || len < FRAME_HEADER_SIZE) {
        throw FormatError("frame header too short: " + std::to_string(len) + " bytes");
    }
    if (buf[0] != FRAME_MAGIC) {
        std::ostringstream oss;
        oss << "invalid frame magic 0x" << std::hex << std::setw(2) << std::setfill('0')
            << static_cast<int>(buf[0]);
        throw FormatError(oss.str());
    }
    FrameHeader h;
    h.magic = buf[0];
    h.flags = buf[1];
    h.level = buf[2];
    h.index = buf[3];
    h.payload_size = (static_cast<uint32_t>(buf[4]) << 24)
                   | (static_cast<uint32_t>(buf[5]) << 16)
                   | (static_cast<uint32_t>(buf[6]) << 8)
                   |  static_cast<uint32_t>(buf[7]);
    return h;
}

FrameHeader decode_header(const Bytes& buf) {
    return decode_header(buf.data(), buf.size());
}

Bytes Frame::to_bytes() const {
    auto h = encode_header(header.flags, header.level, header.index,
                           static_cast<uint32_t>(payload.size()));
    Bytes out;
    out.reserve(FRAME_HEADER_SIZE + payload.size());
    out.insert(out.end(), h.begin(), h.end());
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

// ===== FrameEncoder =====

FrameEncoder::FrameEncoder(FrameEncoderOptions options)
    : options_(options)
{
    if (options_.level < 0) options_.level = 0;
    if (options_.level > 9) options_.level = 9;
    if (!compressor_available(options_.compressor)) {
        throw CompressionError(std::string(compressor_to_string(options_.compressor))
                               + " compression is not available");
    }
}

Frame FrameEncoder::make_frame(uint8_t flags, uint8_t level, uint8_t index, Bytes payload) const {
    if (cipher_) {
        payload = cipher_->encrypt(payload);
        flags |= FrameFlags::CIPHER;
    }
    if (payload.size() > UINT32_MAX) {
        throw FormatError("frame payload too large");
    }
    Frame frame;
    frame.header.flags = flags;
    frame.header.level = level;
    frame.header.index = index;
    frame.header.payload_size = static_cast<uint32_t>(payload.size());
    frame.payload = std::move(payload);
    return frame;
}

std::vector<Frame> FrameEncoder::encode(const Packet& packet) const {
    std::vector<Frame> frames;
    Packet body = packet;

    if (options_.chunk_threshold > 0) {
        size_t last = std::min<size_t>(body.size(), 256);
        for (size_t i = 1; i < last; ++i) {
            Value& item = body[i];
            if (!item.is_bytes() || item.as_bytes().size() < options_.chunk_threshold) continue;
            const std::string& raw = item.as_bytes();
            frames.push_back(make_frame(0, 0, static_cast<uint8_t>(i),
                                        Bytes(raw.begin(), raw.end())));
            item = Value(std::string());
        }
    }

    std::string encoded = encode_packet(body);
    Bytes payload(encoded.begin(), encoded.end());
    uint8_t flags = 0;
    uint8_t level = 0;
    if (options_.level > 0 && options_.compressor != Compressor::NONE) {
        payload = compression::compress(options_.compressor, payload, options_.level);
        flags |= compressor_flag(options_.compressor);
        level = static_cast<uint8_t>(options_.level);
    }
    frames.push_back(make_frame(flags, level, 0, std::move(payload)));
    return frames;
}

Bytes FrameEncoder::encode_to_wire(const Packet& packet) const {
    Bytes out;
    for (const auto& frame : encode(packet)) {
        Bytes b = frame.to_bytes();
        out.insert(out.end(), b.begin(), b.end());
    }
    return out;
}

// ===== FrameReader =====

FrameReader::FrameReader(uint32_t max_packet_size)
    : max_packet_size_(max_packet_size)
{}

void FrameReader::feed(const uint8_t* data, size_t len) {
    if (len == 0) return;
    buffer_.insert(buffer_.end(), data, data + len);
}

void FrameReader::compact() {
    if (offset_ == 0) return;
    if (offset_ >= buffer_.size()) {
        buffer_.clear();
    } else {
        buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset_));
    }
    offset_ = 0;
}

std::optional<Packet> FrameReader::next() {
    while (true) {
        if (buffered() < FRAME_HEADER_SIZE) {
            compact();
            return std::nullopt;
        }
        FrameHeader header = decode_header(buffer_.data() + offset_, buffered());
        if (header.payload_size > max_packet_size_) {
            throw FormatError("frame payload of " + std::to_string(header.payload_size)
                              + " bytes exceeds limit of " + std::to_string(max_packet_size_));
        }
        if (buffered() < FRAME_HEADER_SIZE + header.payload_size) {
            return std::nullopt;
        }

        auto begin = buffer_.begin() + static_cast<std::ptrdiff_t>(offset_ + FRAME_HEADER_SIZE);
        Bytes payload(begin, begin + header.payload_size);
        offset_ += FRAME_HEADER_SIZE + header.payload_size;
        ++frames_read_;

        if (header.flags & FrameFlags::CIPHER) {
            if (!cipher_) {
                throw ProtocolError("received an encrypted frame but encryption is not enabled");
            }
            payload = cipher_->decrypt(payload);
        } else if (cipher_) {
            throw ProtocolError("received an unencrypted frame on an encrypted connection");
        }

        Bytes data = compression::decompress(header.flags, header.level, payload, max_packet_size_);

        if (header.index > 0) {
            RDX_LOG_TRACE("raw chunk " << static_cast<int>(header.index)
                          << " of " << data.size() << " bytes");
            chunks_[header.index] = std::string(data.begin(), data.end());
            size_t total = 0;
            for (const auto& c : chunks_) total += c.second.size();
            if (total > max_packet_size_) {
                throw FormatError("raw chunks exceed packet size limit");
            }
            continue;
        }

        if (header.flags & FrameFlags::SERIALIZATION_MASK) {
            throw ProtocolError("unsupported packet serialisation: " + flags_to_string(
                header.flags & FrameFlags::SERIALIZATION_MASK));
        }

        Packet packet = decode_packet(std::string(data.begin(), data.end()));
        for (auto& chunk : chunks_) {
            if (chunk.first >= packet.size()) {
                throw ProtocolError("raw chunk index " + std::to_string(chunk.first)
                                    + " beyond packet of " + std::to_string(packet.size()) + " items");
            }
            packet[chunk.first] = Value(std::move(chunk.second));
        }
        chunks_.clear();
        compact();
        return packet;
    }
}

} // namespace rdx
