#ifndef RDX_COMPRESSION_HPP
#define RDX_COMPRESSION_HPP

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace rdx {

using Bytes = std::vector<uint8_t>;

/**
 * @brief Packet payload compressors
 *
 * zlib is the implicit default (no header flag, level > 0). lz4 is
 * compression scheme A (0x10) and needs HAVE_LZ4. lzo is scheme B (0x20):
 * recognised on the wire but not built, so it always raises.
 */
enum class Compressor {
    NONE,
    ZLIB,
    LZ4,
    LZO
};

const char* compressor_to_string(Compressor c);

/// Throws std::invalid_argument for unknown names
Compressor compressor_from_string(const std::string& name);

/// Header flag bits announcing @p c (0 for zlib and none)
uint8_t compressor_flag(Compressor c);

bool compressor_available(Compressor c);

/// Names usable in protocol.compressor on this build
std::vector<std::string> available_compressors();

namespace compression {

Bytes zlib_compress(const uint8_t* data, size_t len, int level);
Bytes zlib_decompress(const uint8_t* data, size_t len, size_t max_size);

// Block format with a little-endian uint32 size prefix
Bytes lz4_compress(const uint8_t* data, size_t len, int level);
Bytes lz4_decompress(const uint8_t* data, size_t len, size_t max_size);

/// Compress with @p c; level 0 or Compressor::NONE returns the input
Bytes compress(Compressor c, const Bytes& data, int level);

/**
 * @brief Undo payload compression as announced by a frame header
 *
 * NO_HEADER returns the payload verbatim. Otherwise scheme A is checked
 * before scheme B; without either, level > 0 means zlib and level 0 means
 * stored. Output larger than @p max_size raises CompressionError.
 */
Bytes decompress(uint8_t flags, uint8_t level, const Bytes& payload, size_t max_size);

} // namespace compression

} // namespace rdx

#endif // RDX_COMPRESSION_HPP
