#pragma once

/**
 * @file rdx_server.hpp
 * @brief Listeners, accept loops and the live session table
 *
 * Every accepted connection becomes a Session that runs on the shared
 * ThreadPool; one pool worker is busy for the lifetime of a session.
 */

#include "rdx_auth.hpp"
#include "rdx_options.hpp"
#include "rdx_session.hpp"
#include "rdx_thread_pool.hpp"
#include "rdx_timer.hpp"
#include "rdx_transport.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace rdx {

class Server {
public:
    using SessionCallback = std::function<void(Session&)>;

    Server(std::shared_ptr<const ServerOptions> options, AuthenticatorFactory auth_factory);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    /**
     * @brief Build an authenticator factory for options.auth_mode
     *
     * The mode is validated once up front.
     * @throws std::invalid_argument for unknown modes or missing options
     */
    static AuthenticatorFactory make_auth_factory(const ServerOptions& options,
                                                  const AuthOptions& auth_options);

    /// Bind every listener and start accepting. Throws TransportError
    void start();

    /// Close listeners, disconnect sessions, join workers. Idempotent
    void stop();

    /// Block until stop() has been called
    void wait();

    bool is_running() const { return running_.load(); }

    /// Called on the session's worker once it authenticated
    void set_session_callback(SessionCallback cb) { on_session_ = std::move(cb); }
    void set_capture_source(std::shared_ptr<CaptureSource> capture) { capture_ = std::move(capture); }

    std::vector<Endpoint> endpoints() const;
    std::vector<std::shared_ptr<Session>> sessions() const;
    size_t session_count() const;

    std::map<std::string, double> get_info() const;

private:
    void accept_loop(SocketListener* listener);
    void run_session(const std::shared_ptr<Session>& session);

    std::shared_ptr<const ServerOptions> options_;
    AuthenticatorFactory auth_factory_;
    SessionCallback on_session_;
    std::shared_ptr<CaptureSource> capture_;

    std::unique_ptr<ThreadPool> pool_;
    std::shared_ptr<TimerQueue> timers_;
    std::vector<std::unique_ptr<SocketListener>> listeners_;
    std::vector<std::thread> accept_threads_;

    mutable std::mutex mutex_;
    std::condition_variable stopped_cv_;
    std::map<uint64_t, std::shared_ptr<Session>> sessions_;
    uint64_t next_session_id_ = 1;
    uint64_t total_sessions_ = 0;
    std::atomic<bool> running_{false};
    bool stopped_ = false;
};

} // namespace rdx
