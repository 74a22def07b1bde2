#include "rdx_compression.hpp"
#include "rdx_errors.hpp"
#include "rdx_frame.hpp"

#include <zlib.h>
#ifdef HAVE_LZ4
#include <lz4.h>
#endif

#include <algorithm>
#include <stdexcept>

namespace rdx {

const char* compressor_to_string(Compressor c) {
    switch (c) {
        case Compressor::NONE: return "none";
        case Compressor::ZLIB: return "zlib";
        case Compressor::LZ4:  return "lz4";
        case Compressor::LZO:  return "lzo";
    }
    return "unknown";
}

Compressor compressor_from_string(const std::string& name) {
    if (name == "none") return Compressor::NONE;
    if (name == "zlib") return Compressor::ZLIB;
    if (name == "lz4")  return Compressor::LZ4;
    if (name == "lzo")  return Compressor::LZO;
    throw std::invalid_argument("unknown compressor: " + name);
}

uint8_t compressor_flag(Compressor c) {
    switch (c) {
        case Compressor::LZ4: return FrameFlags::COMPRESS_LZ4;
        case Compressor::LZO: return FrameFlags::COMPRESS_LZO;
        default:              return 0;
    }
}

bool compressor_available(Compressor c) {
    switch (c) {
        case Compressor::NONE:
        case Compressor::ZLIB:
            return true;
        case Compressor::LZ4:
#ifdef HAVE_LZ4
            return true;
#else
            return false;
#endif
        case Compressor::LZO:
            return false;
    }
    return false;
}

std::vector<std::string> available_compressors() {
    std::vector<std::string> names;
    for (auto c : {Compressor::ZLIB, Compressor::LZ4, Compressor::LZO}) {
        if (compressor_available(c)) names.emplace_back(compressor_to_string(c));
    }
    return names;
}

namespace compression {

// ===== zlib =====

Bytes zlib_compress(const uint8_t* data, size_t len, int level) {
    level = std::clamp(level, 1, 9);
    uLongf out_len = compressBound(static_cast<uLong>(len));
    Bytes out(out_len);
    int rc = compress2(out.data(), &out_len, data, static_cast<uLong>(len), level);
    if (rc != Z_OK) {
        throw CompressionError("zlib compress failed: " + std::to_string(rc));
    }
    out.resize(out_len);
    return out;
}

Bytes zlib_decompress(const uint8_t* data, size_t len, size_t max_size) {
    z_stream zs{};
    if (inflateInit(&zs) != Z_OK) {
        throw CompressionError("zlib inflateInit failed");
    }

    Bytes out;
    uint8_t chunk[16384];
    zs.next_in = const_cast<Bytef*>(data);
    zs.avail_in = static_cast<uInt>(len);

    int rc = Z_OK;
    while (rc != Z_STREAM_END) {
        zs.next_out = chunk;
        zs.avail_out = sizeof(chunk);
        rc = inflate(&zs, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END) {
            inflateEnd(&zs);
            throw CompressionError("zlib inflate failed: " + std::to_string(rc));
        }
        size_t produced = sizeof(chunk) - zs.avail_out;
        if (out.size() + produced > max_size) {
            inflateEnd(&zs);
            throw CompressionError("decompressed payload exceeds " + std::to_string(max_size) + " bytes");
        }
        out.insert(out.end(), chunk, chunk + produced);
        if (rc == Z_OK && zs.avail_in == 0 && produced == 0) {
            inflateEnd(&zs);
            throw CompressionError("truncated zlib stream");
        }
    }
    inflateEnd(&zs);
    return out;
}

// ===== lz4 =====

#ifdef HAVE_LZ4

Bytes lz4_compress(const uint8_t* data, size_t len, int level) {
    if (len > static_cast<size_t>(LZ4_MAX_INPUT_SIZE)) {
        throw CompressionError("payload too large for lz4");
    }
    int bound = LZ4_compressBound(static_cast<int>(len));
    Bytes out(4 + static_cast<size_t>(bound));
    uint32_t n = static_cast<uint32_t>(len);
    out[0] = static_cast<uint8_t>(n & 0xff);
    out[1] = static_cast<uint8_t>((n >> 8) & 0xff);
    out[2] = static_cast<uint8_t>((n >> 16) & 0xff);
    out[3] = static_cast<uint8_t>((n >> 24) & 0xff);
    // higher levels trade speed for size: lower acceleration
    int acceleration = std::max(1, 10 - std::clamp(level, 1, 9));
    int written = LZ4_compress_fast(reinterpret_cast<const char*>(data),
                                    reinterpret_cast<char*>(out.data() + 4),
                                    static_cast<int>(len), bound, acceleration);
    if (written <= 0) {
        throw CompressionError("lz4 compress failed");
    }
    out.resize(4 + static_cast<size_t>(written));
    return out;
}

Bytes lz4_decompress(const uint8_t* data, size_t len, size_t max_size) {
    if (len < 4) {
        throw CompressionError("lz4 payload too short");
    }
    size_t size = static_cast<size_t>(data[0])
                | (static_cast<size_t>(data[1]) << 8)
                | (static_cast<size_t>(data[2]) << 16)
                | (static_cast<size_t>(data[3]) << 24);
    if (size > max_size) {
        throw CompressionError("decompressed payload exceeds " + std::to_string(max_size) + " bytes");
    }
    Bytes out(size);
    int rc = LZ4_decompress_safe(reinterpret_cast<const char*>(data + 4),
                                 reinterpret_cast<char*>(out.data()),
                                 static_cast<int>(len - 4), static_cast<int>(size));
    if (rc < 0 || static_cast<size_t>(rc) != size) {
        throw CompressionError("lz4 decompress failed");
    }
    return out;
}

#else

Bytes lz4_compress(const uint8_t*, size_t, int) {
    throw CompressionError("lz4 support not built");
}

Bytes lz4_decompress(const uint8_t*, size_t, size_t) {
    throw CompressionError("lz4 support not built");
}

#endif

// ===== dispatch =====

Bytes compress(Compressor c, const Bytes& data, int level) {
    if (level <= 0) return data;
    switch (c) {
        case Compressor::NONE: return data;
        case Compressor::ZLIB: return zlib_compress(data.data(), data.size(), level);
        case Compressor::LZ4:  return lz4_compress(data.data(), data.size(), level);
        case Compressor::LZO:  break;
    }
    throw CompressionError(std::string(compressor_to_string(c)) + " compression is not supported");
}

Bytes decompress(uint8_t flags, uint8_t level, const Bytes& payload, size_t max_size) {
    if (flags & FrameFlags::NO_HEADER) {
        return payload;
    }
    if (flags & FrameFlags::COMPRESS_LZ4) {
        return lz4_decompress(payload.data(), payload.size(), max_size);
    }
    if (flags & FrameFlags::COMPRESS_LZO) {
        throw CompressionError("lzo compression is not supported");
    }
    if (level == 0) {
        return payload;
    }
    return zlib_decompress(payload.data(), payload.size(), max_size);
}

} // namespace compression

} // namespace rdx
