#pragma once

/**
 * @file rdx_transport.hpp
 * @brief Byte stream transports: tcp, unix domain, vsock and socketpair
 *
 * URIs: tcp://host:port, unix:/path/to/socket, vsock://cid:port
 */

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace rdx {

using Bytes = std::vector<uint8_t>;

class Transport {
public:
    virtual ~Transport() = default;

    /// Writes everything or throws TransportError
    virtual size_t send(const uint8_t* data, size_t len) = 0;
    size_t send(const Bytes& data) { return send(data.data(), data.size()); }

    /// Up to @p max_len bytes; empty at end of stream. Throws TransportError
    virtual Bytes receive(size_t max_len = 65536) = 0;

    /// false on timeout
    virtual bool wait_readable(int timeout_ms) = 0;

    /// Wakes up blocked readers; further I/O fails
    virtual void close() = 0;
    virtual bool is_open() const = 0;
    virtual std::string describe() const = 0;
};

class SocketTransport : public Transport {
public:
    SocketTransport(int fd, std::string description);
    ~SocketTransport() override;

    SocketTransport(const SocketTransport&) = delete;
    SocketTransport& operator=(const SocketTransport&) = delete;

    size_t send(const uint8_t* data, size_t len) override;
    using Transport::send;
    Bytes receive(size_t max_len = 65536) override;
    bool wait_readable(int timeout_ms) override;
    void close() override;
    bool is_open() const override { return open_.load(); }
    std::string describe() const override { return description_; }

    bool set_no_delay(bool enable);

private:
    int fd_;
    std::string description_;
    std::atomic<bool> open_{true};
    std::mutex send_mutex_;
};

struct Endpoint {
    enum class Kind { TCP, UNIX, VSOCK };

    Kind kind = Kind::TCP;
    std::string host;
    uint16_t port = 0;
    std::string path;
    uint32_t cid = 0;

    std::string to_string() const;
};

/// Throws TransportError for malformed or unknown URIs
Endpoint parse_endpoint(const std::string& uri);

class SocketListener {
public:
    explicit SocketListener(const std::string& uri, int backlog = 16);
    ~SocketListener();

    SocketListener(const SocketListener&) = delete;
    SocketListener& operator=(const SocketListener&) = delete;

    /// nullptr on timeout or once closed
    std::unique_ptr<Transport> accept(int timeout_ms);

    void close();
    bool is_open() const { return open_.load(); }

    /// Bound endpoint; for tcp port 0 this carries the chosen port
    const Endpoint& endpoint() const { return endpoint_; }
    std::string describe() const { return endpoint_.to_string(); }

private:
    int fd_ = -1;
    Endpoint endpoint_;
    std::atomic<bool> open_{false};
};

std::unique_ptr<Transport> connect_transport(const std::string& uri);

/// Connected pair of unix stream sockets
std::pair<std::unique_ptr<Transport>, std::unique_ptr<Transport>> make_socketpair();

} // namespace rdx
