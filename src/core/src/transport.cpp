#include "rdx_transport.hpp"
#include "rdx_errors.hpp"
#include "rdx_logger.hpp"

#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#ifdef __linux__
#include <linux/vm_sockets.h>
#endif

namespace rdx {

namespace {

std::string errno_string(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

uint32_t parse_number(const std::string& text, const std::string& uri, uint32_t max) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw TransportError("invalid number '" + text + "' in " + uri);
    }
    unsigned long v = 0;
    try {
        v = std::stoul(text);
    } catch (const std::exception&) {
        throw TransportError("invalid number '" + text + "' in " + uri);
    }
    if (v > max) {
        throw TransportError("number out of range in " + uri);
    }
    return static_cast<uint32_t>(v);
}

} // namespace

// ===== SocketTransport =====

SocketTransport::SocketTransport(int fd, std::string description)
    : fd_(fd)
    , description_(std::move(description))
{}

SocketTransport::~SocketTransport() {
    close();
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

bool SocketTransport::set_no_delay(bool enable) {
    int flag = enable ? 1 : 0;
    return setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag)) == 0;
}

size_t SocketTransport::send(const uint8_t* data, size_t len) {
    std::lock_guard<std::mutex> lock(send_mutex_);
    size_t total = 0;
    while (total < len) {
        if (!open_) throw TransportError(description_ + ": connection closed");
        ssize_t n = ::send(fd_, data + total, len - total, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw TransportError(errno_string(description_ + ": send failed"));
        }
        total += static_cast<size_t>(n);
    }
    return total;
}

Bytes SocketTransport::receive(size_t max_len) {
    Bytes buf(max_len);
    while (true) {
        if (!open_) return Bytes();
        ssize_t n = ::recv(fd_, buf.data(), buf.size(), 0);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (!open_) return Bytes();
            throw TransportError(errno_string(description_ + ": receive failed"));
        }
        buf.resize(static_cast<size_t>(n));
        return buf;
    }
}

bool SocketTransport::wait_readable(int timeout_ms) {
    if (!open_) return true;
    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;
    int rc = ::poll(&pfd, 1, timeout_ms);
    if (rc < 0) {
        if (errno == EINTR) return false;
        throw TransportError(errno_string(description_ + ": poll failed"));
    }
    return rc > 0;
}

void SocketTransport::close() {
    bool expected = true;
    if (open_.compare_exchange_strong(expected, false) && fd_ >= 0) {
        ::shutdown(fd_, SHUT_RDWR);
        RDX_LOG_DEBUG(description_ << ": closed");
    }
}

// ===== Endpoints =====

std::string Endpoint::to_string() const {
    switch (kind) {
        case Kind::TCP:   return "tcp://" + host + ":" + std::to_string(port);
        case Kind::UNIX:  return "unix:" + path;
        case Kind::VSOCK: return "vsock://" + std::to_string(cid) + ":" + std::to_string(port);
    }
    return "?";
}

Endpoint parse_endpoint(const std::string& uri) {
    Endpoint ep;
    if (uri.rfind("tcp://", 0) == 0) {
        std::string rest = uri.substr(6);
        size_t colon = rest.rfind(':');
        if (colon == std::string::npos || colon == 0) {
            throw TransportError("expected tcp://host:port, got " + uri);
        }
        ep.kind = Endpoint::Kind::TCP;
        ep.host = rest.substr(0, colon);
        if (ep.host.size() > 2 && ep.host.front() == '[' && ep.host.back() == ']') {
            ep.host = ep.host.substr(1, ep.host.size() - 2);
        }
        ep.port = static_cast<uint16_t>(parse_number(rest.substr(colon + 1), uri, 65535));
        return ep;
    }
    if (uri.rfind("unix:", 0) == 0) {
        ep.kind = Endpoint::Kind::UNIX;
        ep.path = uri.substr(5);
        if (ep.path.rfind("//", 0) == 0) ep.path = ep.path.substr(2);
        if (ep.path.empty()) throw TransportError("missing socket path in " + uri);
        if (ep.path.size() >= sizeof(sockaddr_un::sun_path)) {
            throw TransportError("socket path too long: " + ep.path);
        }
        return ep;
    }
    if (uri.rfind("vsock://", 0) == 0) {
        std::string rest = uri.substr(8);
        size_t colon = rest.find(':');
        if (colon == std::string::npos) {
            throw TransportError("expected vsock://cid:port, got " + uri);
        }
        ep.kind = Endpoint::Kind::VSOCK;
        ep.cid = parse_number(rest.substr(0, colon), uri, UINT32_MAX);
        ep.port = static_cast<uint16_t>(parse_number(rest.substr(colon + 1), uri, 65535));
        return ep;
    }
    throw TransportError("unsupported transport: " + uri);
}

// ===== SocketListener =====

SocketListener::SocketListener(const std::string& uri, int backlog)
    : endpoint_(parse_endpoint(uri))
{
    switch (endpoint_.kind) {
        case Endpoint::Kind::TCP: {
            addrinfo hints{};
            hints.ai_family = AF_UNSPEC;
            hints.ai_socktype = SOCK_STREAM;
            hints.ai_flags = AI_PASSIVE;
            addrinfo* res = nullptr;
            std::string port = std::to_string(endpoint_.port);
            int rc = getaddrinfo(endpoint_.host.c_str(), port.c_str(), &hints, &res);
            if (rc != 0) {
                throw TransportError("cannot resolve " + endpoint_.host + ": " + gai_strerror(rc));
            }
            fd_ = ::socket(res->ai_family, res->ai_socktype, res->ai_protocol);
            if (fd_ < 0) {
                freeaddrinfo(res);
                throw TransportError(errno_string("socket"));
            }
            int one = 1;
            setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
            if (::bind(fd_, res->ai_addr, res->ai_addrlen) < 0) {
                int err = errno;
                freeaddrinfo(res);
                ::close(fd_);
                fd_ = -1;
                errno = err;
                throw TransportError(errno_string("bind " + uri));
            }
            freeaddrinfo(res);

            sockaddr_storage bound{};
            socklen_t len = sizeof(bound);
            if (getsockname(fd_, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
                if (bound.ss_family == AF_INET) {
                    endpoint_.port = ntohs(reinterpret_cast<sockaddr_in*>(&bound)->sin_port);
                } else if (bound.ss_family == AF_INET6) {
                    endpoint_.port = ntohs(reinterpret_cast<sockaddr_in6*>(&bound)->sin6_port);
                }
            }
            break;
        }
        case Endpoint::Kind::UNIX: {
            fd_ = ::socket(AF_UNIX, SOCK_STREAM, 0);
            if (fd_ < 0) throw TransportError(errno_string("socket"));
            ::unlink(endpoint_.path.c_str());
            sockaddr_un addr{};
            addr.sun_family = AF_UNIX;
            std::strncpy(addr.sun_path, endpoint_.path.c_str(), sizeof(addr.sun_path) - 1);
            if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
                int err = errno;
                ::close(fd_);
                fd_ = -1;
                errno = err;
                throw TransportError(errno_string("bind " + uri));
            }
            break;
        }
        case Endpoint::Kind::VSOCK: {
#ifdef __linux__
            fd_ = ::socket(AF_VSOCK, SOCK_STREAM, 0);
            if (fd_ < 0) throw TransportError(errno_string("vsock socket"));
            sockaddr_vm addr{};
            addr.svm_family = AF_VSOCK;
            addr.svm_cid = endpoint_.cid;
            addr.svm_port = endpoint_.port;
            if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
                int err = errno;
                ::close(fd_);
                fd_ = -1;
                errno = err;
                throw TransportError(errno_string("bind " + uri));
            }
#else
            throw TransportError("vsock is only available on Linux");
#endif
            break;
        }
    }

    if (::listen(fd_, backlog) < 0) {
        int err = errno;
        ::close(fd_);
        fd_ = -1;
        errno = err;
        throw TransportError(errno_string("listen " + uri));
    }
    open_ = true;
    RDX_LOG_INFO("listening on " << endpoint_.to_string());
}

SocketListener::~SocketListener() {
    close();
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    if (endpoint_.kind == Endpoint::Kind::UNIX) {
        ::unlink(endpoint_.path.c_str());
    }
}

void SocketListener::close() {
    bool expected = true;
    if (open_.compare_exchange_strong(expected, false) && fd_ >= 0) {
        ::shutdown(fd_, SHUT_RDWR);
    }
}

std::unique_ptr<Transport> SocketListener::accept(int timeout_ms) {
    if (!open_) return nullptr;
    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;
    int rc = ::poll(&pfd, 1, timeout_ms);
    if (rc <= 0 || !open_) {
        if (rc < 0 && errno != EINTR) {
            throw TransportError(errno_string("poll " + describe()));
        }
        return nullptr;
    }

    sockaddr_storage peer{};
    socklen_t len = sizeof(peer);
    int fd = ::accept(fd_, reinterpret_cast<sockaddr*>(&peer), &len);
    if (fd < 0) {
        if (errno == EINTR || errno == EAGAIN || errno == ECONNABORTED || !open_) return nullptr;
        throw TransportError(errno_string("accept " + describe()));
    }

    std::string description = describe();
    if (peer.ss_family == AF_INET || peer.ss_family == AF_INET6) {
        char host[NI_MAXHOST] = {0};
        char serv[NI_MAXSERV] = {0};
        if (getnameinfo(reinterpret_cast<sockaddr*>(&peer), len, host, sizeof(host),
                        serv, sizeof(serv), NI_NUMERICHOST | NI_NUMERICSERV) == 0) {
            description = std::string("tcp://") + host + ":" + serv;
        }
    }
    auto transport = std::make_unique<SocketTransport>(fd, description);
    if (endpoint_.kind == Endpoint::Kind::TCP) transport->set_no_delay(true);
    return transport;
}

// ===== Client side =====

std::unique_ptr<Transport> connect_transport(const std::string& uri) {
    Endpoint ep = parse_endpoint(uri);
    int fd = -1;

    switch (ep.kind) {
        case Endpoint::Kind::TCP: {
            addrinfo hints{};
            hints.ai_family = AF_UNSPEC;
            hints.ai_socktype = SOCK_STREAM;
            addrinfo* res = nullptr;
            std::string port = std::to_string(ep.port);
            int rc = getaddrinfo(ep.host.c_str(), port.c_str(), &hints, &res);
            if (rc != 0) {
                throw TransportError("cannot resolve " + ep.host + ": " + gai_strerror(rc));
            }
            int last_errno = 0;
            for (addrinfo* ai = res; ai; ai = ai->ai_next) {
                fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
                if (fd < 0) {
                    last_errno = errno;
                    continue;
                }
                if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) break;
                last_errno = errno;
                ::close(fd);
                fd = -1;
            }
            freeaddrinfo(res);
            if (fd < 0) {
                errno = last_errno;
                throw TransportError(errno_string("connect " + uri));
            }
            auto t = std::make_unique<SocketTransport>(fd, ep.to_string());
            t->set_no_delay(true);
            return t;
        }
        case Endpoint::Kind::UNIX: {
            fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
            if (fd < 0) throw TransportError(errno_string("socket"));
            sockaddr_un addr{};
            addr.sun_family = AF_UNIX;
            std::strncpy(addr.sun_path, ep.path.c_str(), sizeof(addr.sun_path) - 1);
            if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
                int err = errno;
                ::close(fd);
                errno = err;
                throw TransportError(errno_string("connect " + uri));
            }
            break;
        }
        case Endpoint::Kind::VSOCK: {
#ifdef __linux__
            fd = ::socket(AF_VSOCK, SOCK_STREAM, 0);
            if (fd < 0) throw TransportError(errno_string("vsock socket"));
            sockaddr_vm addr{};
            addr.svm_family = AF_VSOCK;
            addr.svm_cid = ep.cid;
            addr.svm_port = ep.port;
            if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
                int err = errno;
                ::close(fd);
                errno = err;
                throw TransportError(errno_string("connect " + uri));
            }
#else
            throw TransportError("vsock is only available on Linux");
#endif
            break;
        }
    }
    return std::make_unique<SocketTransport>(fd, ep.to_string());
}

std::pair<std::unique_ptr<Transport>, std::unique_ptr<Transport>> make_socketpair() {
    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) < 0) {
        throw TransportError(errno_string("socketpair"));
    }
    return {std::make_unique<SocketTransport>(fds[0], "socketpair:0"),
            std::make_unique<SocketTransport>(fds[1], "socketpair:1")};
}

} // namespace rdx
