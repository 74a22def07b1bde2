#include "rdx_errors.hpp"
#include "rdx_frame.hpp"
#include "rdx_logger.hpp"
#include <cstdint>
#include <cstddef>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    static bool quiet = [] {
        rdx::Logger::instance().setLevel(rdx::LogLevel::NONE);
        return true;
    }();
    (void)quiet;

    // Small limit so huge declared payload sizes are rejected early
    rdx::FrameReader reader(1u << 20);

    // Feed in two slices to exercise partial header handling
    size_t split = size > 0 ? data[0] % (size + 1) : 0;
    try {
        reader.feed(data, split);
        while (reader.next()) {}
        reader.feed(data + split, size - split);
        while (reader.next()) {}
    } catch (const rdx::ProtocolError&) {
        // expected for malformed input
    }

    return 0;
}
