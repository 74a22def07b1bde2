#include "rdx_session.hpp"
#include "rdx_cipher.hpp"
#include "rdx_digest.hpp"
#include "rdx_errors.hpp"
#include "rdx_logger.hpp"

#include <chrono>
#include <limits>
#include <stdexcept>

namespace rdx {

namespace {

using Clock = std::chrono::steady_clock;

FrameEncoderOptions encoder_options_for(const ServerOptions& options) {
    FrameEncoderOptions enc;
    try {
        enc.compressor = compressor_from_string(options.compressor);
    } catch (const std::invalid_argument& e) {
        RDX_LOG_WARN("Warning: " << e.what() << ", using zlib");
        enc.compressor = Compressor::ZLIB;
    }
    if (!compressor_available(enc.compressor)) {
        RDX_LOG_WARN("Warning: compressor " << compressor_to_string(enc.compressor)
                     << " is not available, using zlib");
        enc.compressor = Compressor::ZLIB;
    }
    enc.level = options.compression_level;
    enc.chunk_threshold = static_cast<size_t>(options.chunk_threshold);
    return enc;
}

int remaining_ms(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

int window_id(const Value& value) {
    int64_t wid = value.as_int();
    if (wid < std::numeric_limits<int>::min() || wid > std::numeric_limits<int>::max()) {
        throw ProtocolError("window id " + std::to_string(wid) + " out of range");
    }
    return static_cast<int>(wid);
}

} // namespace

const char* session_state_to_string(SessionState state) {
    switch (state) {
        case SessionState::HANDSHAKE: return "handshake";
        case SessionState::ACTIVE:    return "active";
        case SessionState::CLOSED:    return "closed";
    }
    return "unknown";
}

Session::Session(uint64_t id,
                 std::unique_ptr<Transport> transport,
                 std::shared_ptr<const ServerOptions> options,
                 AuthenticatorFactory auth_factory,
                 std::shared_ptr<TimerQueue> timers)
    : id_(id)
    , options_(options ? std::move(options) : std::make_shared<const ServerOptions>())
    , channel_(std::move(transport), encoder_options_for(*options_), options_->max_packet_size)
    , auth_factory_(std::move(auth_factory))
    , timers_(std::move(timers))
{
    if (!auth_factory_) {
        throw std::invalid_argument("Session requires an authenticator factory");
    }
}

Session::~Session() {
    teardown();
}

void Session::set_capture_source(std::shared_ptr<CaptureSource> capture) {
    std::lock_guard<std::mutex> lock(mutex_);
    capture_ = std::move(capture);
}

std::string Session::username() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return username_;
}

std::string Session::describe() const {
    return "session " + std::to_string(id_) + " (" + channel_.describe() + ")";
}

// ===== Lifecycle =====

void Session::run() {
    RDX_LOG_INFO(describe() << ": new connection");
    try {
        if (handshake()) {
            serve();
        }
    } catch (const TransportError& e) {
        if (!closing_) {
            RDX_LOG_INFO(describe() << ": connection lost: " << e.what());
        }
    } catch (const ProtocolError& e) {
        RDX_LOG_WARN(describe() << ": protocol error: " << e.what());
        send_disconnect(std::string("protocol error: ") + e.what());
    } catch (const std::exception& e) {
        RDX_LOG_ERROR("Error: " << describe() << ": " << e.what());
        send_disconnect("server error");
    }
    teardown();
}

void Session::close(const std::string& reason) {
    if (closing_.exchange(true)) return;
    RDX_LOG_INFO(describe() << ": closing: " << reason);
    send_disconnect(reason);
    channel_.close();
}

void Session::send_disconnect(const std::string& reason) {
    if (!channel_.is_open()) return;
    try {
        channel_.send(Packet("disconnect", {Value(reason)}));
    } catch (const std::exception& e) {
        RDX_LOG_DEBUG(describe() << ": could not send disconnect: " << e.what());
    }
}

void Session::teardown() {
    std::map<int, std::shared_ptr<DamageScheduler>> windows;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        windows.swap(windows_);
    }
    for (auto& w : windows) {
        w.second->cleanup();
    }
    authenticator_.reset();
    closing_ = true;
    channel_.close();
    if (state_.exchange(SessionState::CLOSED) != SessionState::CLOSED) {
        RDX_LOG_DEBUG(describe() << ": closed after " << channel_.packets_received()
                      << " packets received, " << channel_.packets_sent() << " sent");
    }
}

// ===== Handshake =====

bool Session::handshake() {
    const auto deadline = Clock::now() + std::chrono::milliseconds(options_->auth_timeout_ms);

    auto hello = channel_.read(remaining_ms(deadline));
    if (!hello) {
        RDX_LOG_WARN(describe() << ": no hello before authentication timeout");
        send_disconnect("authentication timeout");
        return false;
    }
    if (hello->type() != "hello" || hello->size() < 2 || !(*hello)[1].is_dict()) {
        RDX_LOG_WARN(describe() << ": expected hello, got " << hello->type());
        send_disconnect("invalid hello packet");
        return false;
    }

    const Value& caps = (*hello)[1];
    std::string username = caps.get_string("username");
    std::vector<std::string> digests = caps.get_string_list("digests");
    {
        std::lock_guard<std::mutex> lock(mutex_);
        username_ = username;
        client_version_ = caps.get_string("version");
    }
    RDX_LOG_DEBUG(describe() << ": hello from '" << username << "', client version "
                  << caps.get_string("version", "unknown"));

    if (!setup_encryption(caps)) {
        return false;
    }

    while (true) {
        if (!authenticator_) {
            authenticator_ = auth_factory_(username);
            if (!authenticator_) {
                throw std::runtime_error("authenticator factory returned nothing");
            }
        }

        bool passed = false;
        if (!authenticator_->requires_challenge()) {
            passed = authenticator_->authenticate("", "");
        } else {
            auto challenge = authenticator_->get_challenge(digests);
            if (!challenge) {
                if (authenticator_->state() != AuthState::AUTHENTICATED) {
                    RDX_LOG_WARN(describe() << ": " << authenticator_->name()
                                 << " authentication cannot use any offered digest");
                    send_disconnect("authentication failed: no supported digest");
                    return false;
                }
                passed = true;
            } else {
                channel_.send(Packet("challenge", {Value(challenge->salt), Value(challenge->digest)}));

                auto response = channel_.read(remaining_ms(deadline));
                if (!response) {
                    RDX_LOG_WARN(describe() << ": authentication timeout");
                    send_disconnect("authentication timeout");
                    return false;
                }
                if (response->type() == "disconnect") {
                    RDX_LOG_INFO(describe() << ": client disconnected during authentication");
                    return false;
                }
                if (response->type() != "challenge-response" || response->size() < 2) {
                    send_disconnect("invalid challenge response");
                    return false;
                }
                std::string client_salt;
                if (response->size() > 2) {
                    client_salt = (*response)[2].as_bytes();
                }
                passed = authenticator_->authenticate((*response)[1].as_bytes(), client_salt);
                if (!passed && authenticator_->state() == AuthState::INIT) {
                    // more chain members left to challenge
                    continue;
                }
            }
        }

        if (passed) break;

        ++auth_failures_;
        RDX_LOG_WARN(describe() << ": authentication of '" << username << "' failed ("
                     << auth_failures_ << "/" << options_->auth_max_attempts << ")");
        authenticator_.reset();
        if (auth_failures_ >= options_->auth_max_attempts) {
            send_disconnect("authentication failed");
            return false;
        }
    }

    RDX_LOG_INFO(describe() << ": '" << username << "' authenticated using "
                 << authenticator_->name());
    authenticator_.reset();

    Value::Dict server_caps;
    server_caps["version"] = Value(RDX_VERSION);
    server_caps["username"] = Value(username);
    server_caps["compressor"] = Value(options_->compressor);
    server_caps["encryption"] = Value(options_->encryption_enabled ? PacketCipher::NAME : "");
    server_caps["max_packet_size"] = Value(options_->max_packet_size);
    server_caps["batch.min_delay"] = Value(options_->batch.min_delay);
    server_caps["batch.max_delay"] = Value(options_->batch.max_delay);
    channel_.send(Packet("hello", {Value(std::move(server_caps))}));

    state_ = SessionState::ACTIVE;
    if (on_active_) {
        on_active_(*this);
    }
    return true;
}

bool Session::setup_encryption(const Value& caps) {
    std::string cipher = caps.get_string("cipher");
    if (!options_->encryption_enabled) {
        if (!cipher.empty()) {
            RDX_LOG_WARN(describe() << ": client requested " << cipher
                         << " but encryption is not enabled");
            send_disconnect("encryption is not enabled on this server");
            return false;
        }
        return true;
    }

    if (cipher.empty()) {
        RDX_LOG_WARN(describe() << ": client did not enable encryption");
        send_disconnect("encryption required");
        return false;
    }
    if (cipher != PacketCipher::NAME) {
        send_disconnect("unsupported cipher: " + cipher);
        return false;
    }

    int64_t iterations = caps.get_int("cipher.iterations", PacketCipher::DEFAULT_ITERATIONS);
    if (iterations < 1 || iterations > 1000000) {
        send_disconnect("invalid cipher iterations");
        return false;
    }
    try {
        Bytes salt = SecureOps::from_hex(caps.get_string("cipher.salt"));
        if (salt.empty()) {
            send_disconnect("missing cipher salt");
            return false;
        }
        auto packet_cipher = std::make_shared<const PacketCipher>(
            options_->encryption_key, salt, static_cast<int>(iterations));
        channel_.set_read_cipher(packet_cipher);
        channel_.set_write_cipher(packet_cipher);
    } catch (const std::invalid_argument& e) {
        RDX_LOG_WARN(describe() << ": bad cipher salt: " << e.what());
        send_disconnect("invalid cipher salt");
        return false;
    }
    RDX_LOG_DEBUG(describe() << ": " << cipher << " enabled, " << iterations << " iterations");
    return true;
}

// ===== Packet loop =====

void Session::serve() {
    while (!closing_) {
        auto packet = channel_.read(-1);
        if (packet) {
            handle_packet(*packet);
        }
    }
}

void Session::handle_packet(const Packet& packet) {
    const std::string& type = packet.type();

    if (type == "damage-sequence") {
        if (packet.size() < 3) {
            throw ProtocolError("short damage-sequence packet");
        }
        uint64_t sequence = static_cast<uint64_t>(packet[1].as_int());
        int wid = window_id(packet[2]);
        auto w = window(wid);
        if (w) {
            w->ack(sequence);
        } else {
            RDX_LOG_DEBUG(describe() << ": ack for unknown window " << wid);
        }
    } else if (type == "ping") {
        Value echo = packet.size() > 1 ? packet[1] : Value(0);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++pings_;
        }
        channel_.send(Packet("ping_echo", {echo}));
    } else if (type == "ping_echo") {
        RDX_LOG_TRACE(describe() << ": ping_echo");
    } else if (type == "focus") {
        int focused = packet.size() > 1 ? window_id(packet[1]) : 0;
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& w : windows_) {
            w.second->set_focus(w.first == focused);
        }
    } else if (type == "suspend" || type == "resume") {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& w : windows_) {
            if (type == "suspend") {
                w.second->go_idle();
            } else {
                w.second->no_idle();
            }
        }
    } else if (type == "disconnect") {
        std::string reason = packet.size() > 1 && packet[1].is_bytes() ? packet[1].as_bytes() : "";
        RDX_LOG_INFO(describe() << ": client disconnected: " << reason);
        closing_ = true;
    } else {
        RDX_LOG_DEBUG(describe() << ": ignoring " << type << " packet");
    }
}

size_t Session::send_packet(const Packet& packet) {
    return channel_.send(packet);
}

// ===== Windows =====

std::shared_ptr<DamageScheduler> Session::add_window(int wid, int width, int height) {
    if (state_ != SessionState::ACTIVE) {
        throw std::logic_error("windows can only be added to an active session");
    }
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("invalid window size");
    }

    std::weak_ptr<Session> self = weak_from_this();
    DamageScheduler::PacketSender sender = [self](const Packet& packet) -> size_t {
        auto session = self.lock();
        if (!session) {
            throw TransportError("session is gone");
        }
        return session->send_packet(packet);
    };

    std::lock_guard<std::mutex> lock(mutex_);
    if (windows_.count(wid)) {
        throw std::invalid_argument("window " + std::to_string(wid) + " already exists");
    }
    auto scheduler = DamageScheduler::create(wid, width, height, options_->batch,
                                             timers_, capture_, std::move(sender));
    windows_[wid] = scheduler;
    RDX_LOG_DEBUG(describe() << ": added window " << wid << " " << width << "x" << height);
    return scheduler;
}

bool Session::remove_window(int wid) {
    std::shared_ptr<DamageScheduler> scheduler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = windows_.find(wid);
        if (it == windows_.end()) return false;
        scheduler = it->second;
        windows_.erase(it);
    }
    scheduler->cleanup();
    return true;
}

std::shared_ptr<DamageScheduler> Session::window(int wid) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = windows_.find(wid);
    return it == windows_.end() ? nullptr : it->second;
}

size_t Session::window_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return windows_.size();
}

bool Session::damage(int wid, const Region& region) {
    auto w = window(wid);
    if (!w) return false;
    w->damage(region);
    return true;
}

std::map<std::string, double> Session::get_info() const {
    std::map<std::string, double> info;
    info["id"] = static_cast<double>(id_);
    info["state"] = static_cast<double>(state_.load());
    info["packets.sent"] = static_cast<double>(channel_.packets_sent());
    info["packets.received"] = static_cast<double>(channel_.packets_received());
    info["bytes.sent"] = static_cast<double>(channel_.bytes_sent());
    info["auth.failures"] = auth_failures_.load();

    std::map<int, std::shared_ptr<DamageScheduler>> windows;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        info["pings"] = static_cast<double>(pings_);
        windows = windows_;
    }
    info["windows"] = static_cast<double>(windows.size());
    for (const auto& w : windows) {
        std::string prefix = "window." + std::to_string(w.first) + ".";
        for (const auto& kv : w.second->get_info()) {
            info[prefix + kv.first] = kv.second;
        }
    }
    return info;
}

} // namespace rdx
