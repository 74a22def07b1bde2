#pragma once

/**
 * @file rdx_client.hpp
 * @brief Client side of the handshake plus a small packet API
 */

#include "rdx_channel.hpp"
#include "rdx_packet.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rdx {

struct ClientOptions {
    std::string username;
    std::string password;
    std::vector<std::string> digests;       // empty: every supported digest
    std::string encryption_key;             // non-empty enables encryption
    int timeout_ms = 10000;
    FrameEncoderOptions encoder;
    uint32_t max_packet_size = DEFAULT_MAX_PACKET_SIZE;
};

class Client {
public:
    Client(std::unique_ptr<Transport> transport, ClientOptions options);
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    /**
     * @brief Run the handshake
     * @return the server's hello capabilities
     * @throws AuthenticationFailure when the server refuses or times out
     * @throws ProtocolError, TransportError
     */
    Value::Dict connect();

    bool is_connected() const { return connected_; }

    size_t send(const Packet& packet);

    /// nullopt on timeout; a negative timeout waits forever
    std::optional<Packet> read(int timeout_ms);

    void ping(int64_t echo_time);
    void ack_damage(uint64_t sequence, int wid, int width, int height, int decode_time_ms);
    void disconnect(const std::string& reason);

    /// Number of challenges answered during connect()
    int challenges_answered() const { return challenges_; }

private:
    std::string answer(const std::string& digest, const std::string& salt,
                       std::string& client_salt) const;

    ClientOptions options_;
    PacketChannel channel_;
    bool connected_ = false;
    int challenges_ = 0;
};

} // namespace rdx
