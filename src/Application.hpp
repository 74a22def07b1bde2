#ifndef RDX_APPLICATION_HPP
#define RDX_APPLICATION_HPP

#include <atomic>
#include <map>
#include <memory>
#include <string>

#include "rdx_auth.hpp"
#include "rdx_config.hpp"
#include "rdx_damage.hpp"
#include "rdx_discovery.hpp"
#include "rdx_logger.hpp"
#include "rdx_options.hpp"
#include "rdx_server.hpp"

namespace rdx {

/**
 * @brief Server process orchestrator
 *
 * Loads configuration, sets up logging, resolves ServerOptions, picks a
 * discovery back-end, builds the authenticator factory and runs the
 * server until asked to stop.
 */
class Application {
public:
    Application(int& argc, char** argv);
    ~Application();

    // Prevent copying
    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    // Serve until keep_running turns false or the server stops
    int run(const std::atomic<bool>& keep_running);

    // Configuration
    void loadConfig(const std::string& config_path);
    void saveConfig(const std::string& config_path) const;

    // Collaborators supplied by an embedder
    void setIdentityCheck(std::shared_ptr<IdentityCheck> check) { auth_options_.identity_check = std::move(check); }
    void setCaptureSource(std::shared_ptr<CaptureSource> capture) { capture_ = std::move(capture); }

    // Component access
    Server* server() const { return server_.get(); }
    const ServerOptions* options() const { return options_.get(); }
    Config& config() { return rdx::Config::instance(); }
    Logger& logger() { return rdx::Logger::instance(); }

    // Lifecycle management
    void initialize();
    void shutdown();

    bool isInitialized() const { return initialized_; }
    bool configLoaded() const { return config_loaded_; }

private:
    std::shared_ptr<const ServerOptions> options_;
    std::unique_ptr<Server> server_;
    std::unique_ptr<ServiceListener> service_listener_;
    std::shared_ptr<CaptureSource> capture_;
    AuthOptions auth_options_;

    // Application state
    bool initialized_;
    bool config_loaded_;
    std::string config_path_;
    std::map<std::string, std::string> overrides_;   // command line, applied over the file
    int argc_;
    char** argv_;

    // Private initialization helpers
    void initializeLogging();
    void initializeDiscovery();
    void initializeServer();
    void parseArguments();
};

} // namespace rdx

#endif // RDX_APPLICATION_HPP
