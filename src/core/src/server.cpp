#include "rdx_server.hpp"
#include "rdx_errors.hpp"
#include "rdx_logger.hpp"

#include <stdexcept>

namespace rdx {

namespace {
constexpr int ACCEPT_POLL_MS = 250;
}

Server::Server(std::shared_ptr<const ServerOptions> options, AuthenticatorFactory auth_factory)
    : options_(std::move(options))
    , auth_factory_(std::move(auth_factory))
{
    if (!options_) {
        throw std::invalid_argument("Server requires options");
    }
    if (!auth_factory_) {
        throw std::invalid_argument("Server requires an authenticator factory");
    }
}

Server::~Server() {
    stop();
}

AuthenticatorFactory Server::make_auth_factory(const ServerOptions& options,
                                               const AuthOptions& auth_options) {
    std::string mode = options.auth_mode;
    AuthOptions opts = auth_options;
    if (opts.password.empty()) {
        opts.password = options.auth_password;
    }

    // Fail at start-up rather than on the first connection
    AuthFactory::create(mode, "", opts);

    return [mode, opts](const std::string& username) {
        return AuthFactory::create(mode, username, opts);
    };
}

// ===== Lifecycle =====

void Server::start() {
    if (running_) {
        throw std::logic_error("server already running");
    }
    if (options_->bind.empty()) {
        throw TransportError("no listener configured (server.bind is empty)");
    }

    std::vector<std::unique_ptr<SocketListener>> listeners;
    for (const auto& uri : options_->bind) {
        listeners.push_back(std::make_unique<SocketListener>(uri));
        RDX_LOG_INFO("listening on " << listeners.back()->describe());
    }

    timers_ = std::make_shared<TimerQueue>();
    pool_ = std::make_unique<ThreadPool>(static_cast<size_t>(options_->workers), "rdx-sessions");
    listeners_ = std::move(listeners);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = false;
    }
    running_ = true;

    for (auto& listener : listeners_) {
        accept_threads_.emplace_back(&Server::accept_loop, this, listener.get());
    }
    RDX_LOG_INFO("server started with " << options_->workers << " session workers, auth mode "
                 << options_->auth_mode);
}

void Server::stop() {
    if (!running_.exchange(false)) return;
    RDX_LOG_INFO("stopping server");

    for (auto& listener : listeners_) {
        listener->close();
    }
    for (auto& t : accept_threads_) {
        if (t.joinable()) t.join();
    }
    accept_threads_.clear();

    for (auto& session : sessions()) {
        session->close("server shutdown");
    }
    if (pool_) {
        pool_->shutdown();
    }
    if (timers_) {
        timers_->shutdown();
    }
    listeners_.clear();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_.clear();
        stopped_ = true;
    }
    stopped_cv_.notify_all();
    RDX_LOG_INFO("server stopped");
}

void Server::wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    stopped_cv_.wait(lock, [this] { return stopped_; });
}

// ===== Accepting =====

void Server::accept_loop(SocketListener* listener) {
    while (running_) {
        std::unique_ptr<Transport> transport;
        try {
            transport = listener->accept(ACCEPT_POLL_MS);
        } catch (const TransportError& e) {
            if (!running_) break;
            RDX_LOG_ERROR("Error: " << e.what());
            continue;
        }
        if (!transport) continue;

        uint64_t id;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            id = next_session_id_++;
        }

        std::shared_ptr<Session> session;
        try {
            session = std::make_shared<Session>(id, std::move(transport), options_,
                                                auth_factory_, timers_);
        } catch (const std::exception& e) {
            RDX_LOG_ERROR("Error: cannot create session: " << e.what());
            continue;
        }
        session->set_capture_source(capture_);
        if (on_session_) {
            session->set_active_callback(on_session_);
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            sessions_[id] = session;
            ++total_sessions_;
        }
        if (pool_->active_threads() >= pool_->total_threads()) {
            RDX_LOG_WARN("all " << pool_->total_threads() << " session workers are busy, "
                         << session->describe() << " is queued");
        }

        try {
            pool_->submit([this, session] { run_session(session); });
        } catch (const std::runtime_error& e) {
            RDX_LOG_WARN(session->describe() << ": not started: " << e.what());
            session->close("server shutdown");
            std::lock_guard<std::mutex> lock(mutex_);
            sessions_.erase(id);
        }
    }
}

void Server::run_session(const std::shared_ptr<Session>& session) {
    session->run();
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.erase(session->id());
}

// ===== Introspection =====

std::vector<Endpoint> Server::endpoints() const {
    std::vector<Endpoint> out;
    for (const auto& listener : listeners_) {
        out.push_back(listener->endpoint());
    }
    return out;
}

std::vector<std::shared_ptr<Session>> Server::sessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<Session>> out;
    out.reserve(sessions_.size());
    for (const auto& s : sessions_) {
        out.push_back(s.second);
    }
    return out;
}

size_t Server::session_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::map<std::string, double> Server::get_info() const {
    std::map<std::string, double> info;
    info["running"] = running_ ? 1 : 0;
    info["listeners"] = static_cast<double>(listeners_.size());
    if (pool_) {
        info["workers"] = static_cast<double>(pool_->total_threads());
        info["workers.active"] = static_cast<double>(pool_->active_threads());
        info["workers.queued"] = static_cast<double>(pool_->pending_tasks());
    }
    std::lock_guard<std::mutex> lock(mutex_);
    info["sessions"] = static_cast<double>(sessions_.size());
    info["sessions.total"] = static_cast<double>(total_sessions_);
    return info;
}

} // namespace rdx
