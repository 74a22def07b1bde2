#include "rdx_channel.hpp"
#include "rdx_cipher.hpp"
#include "rdx_errors.hpp"
#include "rdx_logger.hpp"

#include <chrono>
#include <stdexcept>

namespace rdx {

PacketChannel::PacketChannel(std::unique_ptr<Transport> transport,
                             FrameEncoderOptions encoder_options,
                             uint32_t max_packet_size)
    : transport_(std::move(transport))
    , encoder_(encoder_options)
    , reader_(max_packet_size)
{
    if (!transport_) {
        throw std::invalid_argument("PacketChannel requires a transport");
    }
}

PacketChannel::~PacketChannel() {
    transport_->close();
}

size_t PacketChannel::send(const Packet& packet) {
    std::lock_guard<std::mutex> lock(send_mutex_);
    Bytes wire = encoder_.encode_to_wire(packet);
    transport_->send(wire);
    ++packets_sent_;
    bytes_sent_ += wire.size();
    RDX_LOG_TRACE(transport_->describe() << ": sent " << packet.type()
                  << " (" << wire.size() << " bytes)");
    return wire.size();
}

std::optional<Packet> PacketChannel::read(int timeout_ms) {
    using Clock = std::chrono::steady_clock;
    const auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms < 0 ? 0 : timeout_ms);

    while (true) {
        auto packet = reader_.next();
        if (packet) {
            ++packets_received_;
            RDX_LOG_TRACE(transport_->describe() << ": received " << packet->type());
            return packet;
        }

        int wait_ms = -1;
        if (timeout_ms >= 0) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - Clock::now()).count();
            if (remaining <= 0) return std::nullopt;
            wait_ms = static_cast<int>(remaining);
        }
        if (!transport_->wait_readable(wait_ms)) {
            if (!transport_->is_open()) {
                throw TransportError(transport_->describe() + ": connection closed");
            }
            continue;
        }

        Bytes data = transport_->receive();
        if (data.empty()) {
            throw TransportError(transport_->describe() + ": connection closed by peer");
        }
        reader_.feed(data);
    }
}

void PacketChannel::set_write_cipher(std::shared_ptr<const PacketCipher> cipher) {
    std::lock_guard<std::mutex> lock(send_mutex_);
    encoder_.set_cipher(std::move(cipher));
}

void PacketChannel::set_read_cipher(std::shared_ptr<const PacketCipher> cipher) {
    reader_.set_cipher(std::move(cipher));
}

void PacketChannel::close() {
    transport_->close();
}

uint64_t PacketChannel::packets_sent() const {
    std::lock_guard<std::mutex> lock(send_mutex_);
    return packets_sent_;
}

uint64_t PacketChannel::bytes_sent() const {
    std::lock_guard<std::mutex> lock(send_mutex_);
    return bytes_sent_;
}

} // namespace rdx
