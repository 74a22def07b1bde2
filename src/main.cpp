#include "Application.hpp"
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>

namespace {

std::atomic<bool> g_running(true);

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running = false;  // Only set flag, cleanup happens in run()
    }
}

} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        // Explicit --config arguments are handled by the constructor
        rdx::Application app(argc, argv);

        if (!app.configLoaded()) {
            const char* config_env = std::getenv("RDX_CONFIG");
            if (config_env) {
                app.loadConfig(config_env);
            } else {
                app.loadConfig("config/rdx.conf");
            }
        }

        app.initialize();
        return app.run(g_running);

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
