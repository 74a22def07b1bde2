#ifndef RDX_DISCOVERY_HPP
#define RDX_DISCOVERY_HPP

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rdx {

/// Watches for peers advertised by one discovery mechanism
class ServiceListener {
public:
    virtual ~ServiceListener() = default;
    virtual std::string name() const = 0;
    virtual void start() = 0;
    virtual void stop() = 0;
    virtual std::vector<std::string> peers() const = 0;
};

using ListenerFactory = std::function<std::unique_ptr<ServiceListener>()>;

/// Returns a factory when the back-end is usable on this host
using DiscoveryProbe = std::function<std::optional<ListenerFactory>()>;

struct DiscoveryBackend {
    std::string name;
    bool enabled = true;
    DiscoveryProbe probe;
};

struct ListenerClass {
    std::string backend;
    ListenerFactory create;
};

/**
 * @brief Ordered list of advertisement back-ends, fixed at start-up
 *
 * The first enabled back-end whose probe succeeds wins. A probe that
 * throws or comes back empty is logged and skipped.
 */
class DiscoveryRegistry {
public:
    explicit DiscoveryRegistry(std::vector<DiscoveryBackend> backends = {});

    std::optional<ListenerClass> get_listener_class() const;

    const std::vector<DiscoveryBackend>& backends() const { return backends_; }

private:
    const std::vector<DiscoveryBackend> backends_;
};

/// Reports a fixed list of peers
class StaticServiceListener : public ServiceListener {
public:
    explicit StaticServiceListener(std::vector<std::string> peers);

    std::string name() const override { return "static"; }
    void start() override;
    void stop() override;
    std::vector<std::string> peers() const override;

    bool running() const { return running_; }

private:
    std::vector<std::string> peers_;
    bool running_ = false;
};

/// The "static" back-end; probing fails when @p peers is empty
DiscoveryBackend make_static_backend(bool enabled, std::vector<std::string> peers);

} // namespace rdx

#endif // RDX_DISCOVERY_HPP
