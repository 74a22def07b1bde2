#pragma once

/**
 * @file rdx_channel.hpp
 * @brief Packet level view of a transport: frame encoder plus frame reader
 */

#include "rdx_frame.hpp"
#include "rdx_transport.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace rdx {

class PacketChannel {
public:
    PacketChannel(std::unique_ptr<Transport> transport,
                  FrameEncoderOptions encoder_options = FrameEncoderOptions(),
                  uint32_t max_packet_size = DEFAULT_MAX_PACKET_SIZE);
    ~PacketChannel();

    PacketChannel(const PacketChannel&) = delete;
    PacketChannel& operator=(const PacketChannel&) = delete;

    /// Thread-safe. Returns bytes written; throws TransportError
    size_t send(const Packet& packet);

    /**
     * @brief Next complete packet
     * @param timeout_ms negative waits forever
     * @return nullopt on timeout
     * @throws TransportError when the peer closed the stream
     * @throws ProtocolError on an invalid frame
     */
    std::optional<Packet> read(int timeout_ms);

    // Encryption is switched on per direction during the handshake
    void set_write_cipher(std::shared_ptr<const PacketCipher> cipher);
    void set_read_cipher(std::shared_ptr<const PacketCipher> cipher);

    void close();
    bool is_open() const { return transport_->is_open(); }
    std::string describe() const { return transport_->describe(); }

    uint64_t packets_sent() const;
    uint64_t packets_received() const { return packets_received_.load(); }
    uint64_t bytes_sent() const;

private:
    std::unique_ptr<Transport> transport_;
    FrameEncoder encoder_;
    FrameReader reader_;

    mutable std::mutex send_mutex_;
    uint64_t packets_sent_ = 0;
    uint64_t bytes_sent_ = 0;
    std::atomic<uint64_t> packets_received_{0};
};

} // namespace rdx
