#include "rdx_client.hpp"
#include "rdx_cipher.hpp"
#include "rdx_digest.hpp"
#include "rdx_errors.hpp"
#include "rdx_logger.hpp"
#include "rdx_session.hpp"

#include <chrono>

namespace rdx {

Client::Client(std::unique_ptr<Transport> transport, ClientOptions options)
    : options_(std::move(options))
    , channel_(std::move(transport), options_.encoder, options_.max_packet_size)
{
    if (options_.digests.empty()) {
        options_.digests = supported_digests();
    }
}

Client::~Client() {
    channel_.close();
}

Value::Dict Client::connect() {
    using Clock = std::chrono::steady_clock;
    const auto deadline = Clock::now() + std::chrono::milliseconds(options_.timeout_ms);

    Value::List digests;
    for (const auto& d : options_.digests) digests.emplace_back(d);

    Value::Dict caps;
    caps["username"] = Value(options_.username);
    caps["version"] = Value(RDX_VERSION);
    caps["digests"] = Value(std::move(digests));

    std::shared_ptr<const PacketCipher> cipher;
    if (!options_.encryption_key.empty()) {
        cipher = std::make_shared<const PacketCipher>(options_.encryption_key, PacketCipher::generate_salt());
        caps["cipher"] = Value(PacketCipher::NAME);
        caps["cipher.salt"] = Value(SecureOps::to_hex(cipher->salt()));
        caps["cipher.iterations"] = Value(cipher->iterations());
    }

    channel_.send(Packet("hello", {Value(std::move(caps))}));
    if (cipher) {
        channel_.set_write_cipher(cipher);
        channel_.set_read_cipher(cipher);
    }

    while (true) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
        auto packet = channel_.read(left > 0 ? static_cast<int>(left) : 0);
        if (!packet) {
            throw AuthenticationFailure("timed out waiting for the server");
        }

        const std::string& type = packet->type();
        if (type == "challenge") {
            if (packet->size() < 3) {
                throw ProtocolError("short challenge packet");
            }
            std::string client_salt;
            std::string response = answer((*packet)[2].as_bytes(), (*packet)[1].as_bytes(), client_salt);
            ++challenges_;
            channel_.send(Packet("challenge-response", {Value(response), Value(client_salt)}));
        } else if (type == "hello") {
            if (packet->size() < 2 || !(*packet)[1].is_dict()) {
                throw ProtocolError("invalid server hello");
            }
            connected_ = true;
            RDX_LOG_INFO("connected to " << channel_.describe() << ", server version "
                         << (*packet)[1].get_string("version", "unknown"));
            return (*packet)[1].as_dict();
        } else if (type == "disconnect") {
            std::string reason = packet->size() > 1 && (*packet)[1].is_bytes()
                ? (*packet)[1].as_bytes() : "no reason given";
            throw AuthenticationFailure("server refused the connection: " + reason);
        } else {
            RDX_LOG_DEBUG("ignoring " << type << " packet during handshake");
        }
    }
}

std::string Client::answer(const std::string& digest, const std::string& salt,
                           std::string& client_salt) const {
    std::string name = normalize_digest(digest);
    bool offered = false;
    for (const auto& d : options_.digests) {
        if (normalize_digest(d) == name) offered = true;
    }
    if (!offered) {
        throw AuthenticationFailure("server requested digest '" + digest + "' which was not offered");
    }
    if (name == Digest::XOR && options_.encryption_key.empty()) {
        RDX_LOG_WARN("Warning: sending an xor password over an unencrypted connection");
    }

    client_salt = generate_salt(salt.size() / 2);
    std::string combined = combine_salts(salt, client_salt);
    return gen_digest(name, options_.password, combined);
}

size_t Client::send(const Packet& packet) {
    return channel_.send(packet);
}

std::optional<Packet> Client::read(int timeout_ms) {
    return channel_.read(timeout_ms);
}

void Client::ping(int64_t echo_time) {
    channel_.send(Packet("ping", {Value(echo_time)}));
}

void Client::ack_damage(uint64_t sequence, int wid, int width, int height, int decode_time_ms) {
    channel_.send(Packet("damage-sequence", {
        Value(sequence), Value(wid), Value(width), Value(height), Value(decode_time_ms),
    }));
}

void Client::disconnect(const std::string& reason) {
    if (channel_.is_open()) {
        try {
            channel_.send(Packet("disconnect", {Value(reason)}));
        } catch (const TransportError& e) {
            RDX_LOG_DEBUG("disconnect not delivered: " << e.what());
        }
    }
    connected_ = false;
    channel_.close();
}

} // namespace rdx
