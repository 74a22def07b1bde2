#include "rdx_discovery.hpp"
#include "rdx_logger.hpp"

#include <memory>

namespace rdx {

DiscoveryRegistry::DiscoveryRegistry(std::vector<DiscoveryBackend> backends)
    : backends_(std::move(backends))
{}

std::optional<ListenerClass> DiscoveryRegistry::get_listener_class() const {
    for (const auto& backend : backends_) {
        if (!backend.enabled) {
            RDX_LOG_DEBUG("discovery: " << backend.name << " is disabled");
            continue;
        }
        if (!backend.probe) {
            RDX_LOG_DEBUG("discovery: " << backend.name << " has no probe");
            continue;
        }
        std::optional<ListenerFactory> factory;
        try {
            factory = backend.probe();
        } catch (const std::exception& e) {
            RDX_LOG_WARN("Warning: discovery back-end " << backend.name << " failed: " << e.what());
            continue;
        }
        if (!factory || !*factory) {
            RDX_LOG_DEBUG("discovery: " << backend.name << " is not available");
            continue;
        }
        RDX_LOG_DEBUG("discovery: using " << backend.name);
        return ListenerClass{backend.name, std::move(*factory)};
    }
    RDX_LOG_DEBUG("discovery: no usable back-end");
    return std::nullopt;
}

StaticServiceListener::StaticServiceListener(std::vector<std::string> peers)
    : peers_(std::move(peers))
{}

void StaticServiceListener::start() {
    running_ = true;
    for (const auto& p : peers_) {
        RDX_LOG_INFO("discovery: static peer " << p);
    }
}

void StaticServiceListener::stop() {
    running_ = false;
}

std::vector<std::string> StaticServiceListener::peers() const {
    return running_ ? peers_ : std::vector<std::string>();
}

DiscoveryBackend make_static_backend(bool enabled, std::vector<std::string> peers) {
    DiscoveryBackend backend;
    backend.name = "static";
    backend.enabled = enabled;
    backend.probe = [peers = std::move(peers)]() -> std::optional<ListenerFactory> {
        if (peers.empty()) return std::nullopt;
        return ListenerFactory([peers] {
            return std::unique_ptr<ServiceListener>(std::make_unique<StaticServiceListener>(peers));
        });
    };
    return backend;
}

} // namespace rdx
