/**
 * @file test_discovery.cpp
 * @brief Discovery back-end registry selection
 */

#include <gtest/gtest.h>
#include "rdx_discovery.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace rdx;

namespace {

class NamedListener : public ServiceListener {
public:
    explicit NamedListener(std::string name) : name_(std::move(name)) {}
    std::string name() const override { return name_; }
    void start() override {}
    void stop() override {}
    std::vector<std::string> peers() const override { return {}; }

private:
    std::string name_;
};

} // namespace

class DiscoveryTest : public ::testing::Test {
protected:
    DiscoveryBackend backend(const std::string& name, bool enabled) {
        DiscoveryBackend b;
        b.name = name;
        b.enabled = enabled;
        b.probe = [this, name]() -> std::optional<ListenerFactory> {
            probed_.push_back(name);
            return ListenerFactory([name] {
                return std::unique_ptr<ServiceListener>(std::make_unique<NamedListener>(name));
            });
        };
        return b;
    }

    std::vector<std::string> probed_;
};

TEST_F(DiscoveryTest, DisabledBackendSkipped) {
    DiscoveryRegistry registry({backend("A", false), backend("B", true)});
    auto cls = registry.get_listener_class();
    ASSERT_TRUE(cls.has_value());
    EXPECT_EQ(cls->backend, "B");
    EXPECT_EQ(cls->create()->name(), "B");
    EXPECT_EQ(probed_, (std::vector<std::string>{"B"}));
}

TEST_F(DiscoveryTest, AllDisabledGivesNothing) {
    DiscoveryRegistry registry({backend("A", false), backend("B", false)});
    EXPECT_FALSE(registry.get_listener_class().has_value());
    EXPECT_TRUE(probed_.empty());

    EXPECT_FALSE(DiscoveryRegistry().get_listener_class().has_value());
}

TEST_F(DiscoveryTest, FirstUsableBackendWins) {
    DiscoveryRegistry registry({backend("A", true), backend("B", true)});
    auto cls = registry.get_listener_class();
    ASSERT_TRUE(cls.has_value());
    EXPECT_EQ(cls->backend, "A");
    EXPECT_EQ(probed_, (std::vector<std::string>{"A"}));
}

TEST_F(DiscoveryTest, FailingProbesAreSkipped) {
    DiscoveryBackend throws;
    throws.name = "broken";
    throws.probe = []() -> std::optional<ListenerFactory> {
        throw std::runtime_error("daemon not running");
    };
    DiscoveryBackend unavailable;
    unavailable.name = "missing";
    unavailable.probe = []() -> std::optional<ListenerFactory> { return std::nullopt; };
    DiscoveryBackend no_probe;
    no_probe.name = "empty";

    DiscoveryRegistry registry({throws, unavailable, no_probe, backend("C", true)});
    auto cls = registry.get_listener_class();
    ASSERT_TRUE(cls.has_value());
    EXPECT_EQ(cls->backend, "C");
}

TEST_F(DiscoveryTest, StaticBackend) {
    DiscoveryRegistry none({make_static_backend(true, {})});
    EXPECT_FALSE(none.get_listener_class().has_value());

    DiscoveryRegistry registry({make_static_backend(true, {"tcp://10.0.0.2:14500"})});
    auto cls = registry.get_listener_class();
    ASSERT_TRUE(cls.has_value());
    EXPECT_EQ(cls->backend, "static");

    auto listener = cls->create();
    EXPECT_EQ(listener->name(), "static");
    EXPECT_TRUE(listener->peers().empty());
    listener->start();
    EXPECT_EQ(listener->peers(), (std::vector<std::string>{"tcp://10.0.0.2:14500"}));
    listener->stop();
    EXPECT_TRUE(listener->peers().empty());
}
