#include "Application.hpp"
#include <chrono>
#include <stdexcept>
#include <thread>

namespace rdx {

Application::Application(int& argc, char** argv)
    : initialized_(false)
    , config_loaded_(false)
    , argc_(argc)
    , argv_(argv)
{
    parseArguments();
}

Application::~Application() {
    shutdown();
}

int Application::run(const std::atomic<bool>& keep_running) {
    if (!initialized_) {
        initialize();
    }

    server_->start();
    for (const auto& ep : server_->endpoints()) {
        RDX_LOG_INFO("accepting connections on " << ep.to_string());
    }

    while (keep_running && server_->is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    shutdown();
    return 0;
}

void Application::loadConfig(const std::string& config_path) {
    config_path_ = config_path;
    auto& cfg = rdx::Config::instance();
    if (!cfg.loadFromFile(config_path)) {
        RDX_LOG_WARN("Config file not found: " << config_path << ", using defaults");
    } else {
        config_loaded_ = true;
        RDX_LOG_INFO("Configuration loaded from: " << config_path);
    }
}

void Application::saveConfig(const std::string& config_path) const {
    auto& cfg = rdx::Config::instance();
    if (cfg.saveToFile(config_path)) {
        RDX_LOG_INFO("Configuration saved to: " << config_path);
    } else {
        RDX_LOG_ERROR("Failed to save configuration to: " << config_path);
    }
}

void Application::initialize() {
    if (initialized_) return;

    auto& cfg = rdx::Config::instance();
    for (const auto& kv : overrides_) {
        cfg.set(kv.first, kv.second);
    }
    auto source = default_config_source(cfg);
    options_ = ServerOptions::load(*source);

    initializeLogging();
    RDX_LOG_INFO("Initializing RDX server v" << RDX_VERSION);

    initializeDiscovery();
    initializeServer();

    initialized_ = true;
    RDX_LOG_INFO("RDX server initialized");
}

void Application::shutdown() {
    if (!initialized_) return;

    RDX_LOG_INFO("Shutting down RDX server");

    if (server_) {
        server_->stop();
    }
    if (service_listener_) {
        service_listener_->stop();
        service_listener_.reset();
    }
    server_.reset();
    initialized_ = false;
}

void Application::initializeLogging() {
    auto& log = rdx::Logger::instance();

    log.setLevel(Logger::levelFromString(options_->log_level));
    log.setConsoleOutput(options_->log_console);

    if (!options_->log_file.empty() && !log.setFileOutput(options_->log_file)) {
        RDX_LOG_WARN("Cannot open log file: " << options_->log_file);
    }
}

void Application::initializeDiscovery() {
    DiscoveryRegistry registry({
        make_static_backend(options_->discovery_static, options_->discovery_static_peers),
    });

    auto listener_class = registry.get_listener_class();
    if (!listener_class) {
        RDX_LOG_DEBUG("No service discovery back-end available");
        return;
    }
    service_listener_ = listener_class->create();
    service_listener_->start();
    RDX_LOG_INFO("Service discovery using " << listener_class->backend << ", "
                 << service_listener_->peers().size() << " known peers");
}

void Application::initializeServer() {
    AuthenticatorFactory factory = Server::make_auth_factory(*options_, auth_options_);
    server_ = std::make_unique<Server>(options_, std::move(factory));
    server_->set_capture_source(capture_);
}

void Application::parseArguments() {
    for (int i = 1; i < argc_; ++i) {
        std::string arg(argv_[i]);
        if (arg == "--config" && i + 1 < argc_) {
            loadConfig(std::string(argv_[++i]));
        } else if (arg == "--bind" && i + 1 < argc_) {
            overrides_["server.bind"] = argv_[++i];
        } else if (arg == "--auth" && i + 1 < argc_) {
            overrides_["auth.mode"] = argv_[++i];
        } else if (arg == "--log-level" && i + 1 < argc_) {
            overrides_["log.level"] = argv_[++i];
        } else {
            throw std::invalid_argument("unknown argument: " + arg);
        }
    }
}

} // namespace rdx
