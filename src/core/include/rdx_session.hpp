#pragma once

/**
 * @file rdx_session.hpp
 * @brief Server side of one client connection
 *
 * Handshake:
 *   client -> hello {username, digests, version, [cipher, cipher.salt, cipher.iterations]}
 *   server -> challenge [salt, digest]               (when required)
 *   client -> challenge-response [response, client_salt]
 *   server -> hello {...} | disconnect [reason]
 *
 * Once authenticated the session serves damage-sequence acks, ping,
 * focus, suspend/resume and disconnect until either side hangs up.
 */

#include "rdx_auth.hpp"
#include "rdx_channel.hpp"
#include "rdx_damage.hpp"
#include "rdx_options.hpp"
#include "rdx_timer.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace rdx {

constexpr const char* RDX_VERSION = "1.0.0";

enum class SessionState {
    HANDSHAKE,
    ACTIVE,
    CLOSED
};

const char* session_state_to_string(SessionState state);

/// Builds a fresh authenticator for each authentication attempt
using AuthenticatorFactory = std::function<std::unique_ptr<Authenticator>(const std::string& username)>;

class Session : public std::enable_shared_from_this<Session> {
public:
    using ActiveCallback = std::function<void(Session&)>;

    Session(uint64_t id,
            std::unique_ptr<Transport> transport,
            std::shared_ptr<const ServerOptions> options,
            AuthenticatorFactory auth_factory,
            std::shared_ptr<TimerQueue> timers);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /// Called once authentication succeeds, before packets are served
    void set_active_callback(ActiveCallback cb) { on_active_ = std::move(cb); }
    void set_capture_source(std::shared_ptr<CaptureSource> capture);

    /// Handshake then packet loop; returns once the connection is gone. Never throws
    void run();

    /// Sends disconnect [reason] if still possible, then tears down
    void close(const std::string& reason);

    SessionState state() const { return state_.load(); }
    uint64_t id() const { return id_; }
    std::string username() const;
    std::string describe() const;

    // ===== Windows =====

    /// Throws std::logic_error unless the session is ACTIVE
    std::shared_ptr<DamageScheduler> add_window(int wid, int width, int height);
    bool remove_window(int wid);
    std::shared_ptr<DamageScheduler> window(int wid) const;
    size_t window_count() const;

    /// false for unknown windows
    bool damage(int wid, const Region& region);

    /// Thread-safe; throws TransportError
    size_t send_packet(const Packet& packet);

    std::map<std::string, double> get_info() const;

private:
    bool handshake();
    bool setup_encryption(const Value& caps);
    void serve();
    void handle_packet(const Packet& packet);
    void send_disconnect(const std::string& reason);
    void teardown();

    const uint64_t id_;
    std::shared_ptr<const ServerOptions> options_;
    PacketChannel channel_;
    AuthenticatorFactory auth_factory_;
    std::shared_ptr<TimerQueue> timers_;
    std::shared_ptr<CaptureSource> capture_;
    ActiveCallback on_active_;

    std::atomic<SessionState> state_{SessionState::HANDSHAKE};
    std::atomic<bool> closing_{false};
    std::unique_ptr<Authenticator> authenticator_;
    std::atomic<int> auth_failures_{0};

    mutable std::mutex mutex_;
    std::string username_;
    std::string client_version_;
    std::map<int, std::shared_ptr<DamageScheduler>> windows_;
    uint64_t pings_ = 0;
};

} // namespace rdx
