/**
 * @file test_session.cpp
 * @brief Handshake, authentication and packet loop over real sockets
 */

#include <gtest/gtest.h>
#include "rdx_cipher.hpp"
#include "rdx_client.hpp"
#include "rdx_errors.hpp"
#include "rdx_server.hpp"
#include "rdx_session.hpp"
#include "rdx_transport.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

using namespace rdx;

namespace {

bool wait_until(const std::function<bool()>& pred, int timeout_ms = 3000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

class SolidCapture : public CaptureSource {
public:
    std::optional<CapturedImage> capture(int, const Region& region) override {
        CapturedImage image;
        image.encoding = "rgb24";
        image.data.assign(static_cast<size_t>(region.pixels()) * 3, '\x7f');
        return image;
    }
};

class FixedIdentityCheck : public IdentityCheck {
public:
    bool check(const std::string& username, const std::string& password) override {
        return username == "root" && password == "toor";
    }
};

} // namespace

class SessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        options_ = std::make_shared<ServerOptions>();
        options_->auth_password = "s3cret";
        options_->auth_timeout_ms = 3000;
        options_->batch.min_delay = 5;
        options_->batch.start_delay = 5;
        timers_ = std::make_shared<TimerQueue>();
    }

    void TearDown() override {
        client_.reset();
        if (session_) session_->close("test finished");
        if (thread_.joinable()) thread_.join();
        session_.reset();
        timers_->shutdown();
    }

    // Starts a session on one end of a socketpair, returns the client end
    void start(const std::string& mode, ClientOptions client_options = ClientOptions()) {
        options_->auth_mode = mode;
        AuthOptions auth;
        auth.identity_check = std::make_shared<FixedIdentityCheck>();
        auto factory = Server::make_auth_factory(*options_, auth);

        auto pair = make_socketpair();
        session_ = std::make_shared<Session>(1, std::move(pair.first), options_, factory, timers_);
        session_->set_capture_source(std::make_shared<SolidCapture>());
        auto session = session_;
        thread_ = std::thread([session] { session->run(); });

        if (client_options.username.empty()) client_options.username = "alice";
        client_options.timeout_ms = 3000;
        client_ = std::make_unique<Client>(std::move(pair.second), std::move(client_options));
    }

    void finish() {
        if (thread_.joinable()) thread_.join();
    }

    std::shared_ptr<ServerOptions> options_;
    std::shared_ptr<TimerQueue> timers_;
    std::shared_ptr<Session> session_;
    std::thread thread_;
    std::unique_ptr<Client> client_;
};

// ---- Handshake ----

TEST_F(SessionTest, NoAuthentication) {
    start("none");
    auto caps = client_->connect();

    EXPECT_TRUE(client_->is_connected());
    EXPECT_EQ(client_->challenges_answered(), 0);
    EXPECT_EQ(Value(caps).get_string("version"), RDX_VERSION);
    EXPECT_EQ(Value(caps).get_string("username"), "alice");
    EXPECT_EQ(Value(caps).get_int("batch.min_delay"), 5);

    ASSERT_TRUE(wait_until([&] { return session_->state() == SessionState::ACTIVE; }));
    EXPECT_EQ(session_->username(), "alice");
}

TEST_F(SessionTest, PasswordAuthentication) {
    ClientOptions opts;
    opts.password = "s3cret";
    start("password", opts);

    EXPECT_NO_THROW(client_->connect());
    EXPECT_EQ(client_->challenges_answered(), 1);
}

TEST_F(SessionTest, PlainHmacDigest) {
    ClientOptions opts;
    opts.password = "s3cret";
    opts.digests = {"hmac"};
    start("password", opts);

    EXPECT_NO_THROW(client_->connect());
}

TEST_F(SessionTest, WrongPasswordExhaustsAttempts) {
    options_->auth_max_attempts = 3;
    ClientOptions opts;
    opts.password = "guess";
    start("password", opts);

    EXPECT_THROW(client_->connect(), AuthenticationFailure);
    EXPECT_EQ(client_->challenges_answered(), 3);

    finish();
    EXPECT_EQ(session_->state(), SessionState::CLOSED);
    EXPECT_DOUBLE_EQ(session_->get_info().at("auth.failures"), 3.0);
}

TEST_F(SessionTest, NoCommonDigest) {
    ClientOptions opts;
    opts.password = "s3cret";
    opts.digests = {"xor"};
    start("password", opts);

    EXPECT_THROW(client_->connect(), AuthenticationFailure);
}

TEST_F(SessionTest, SystemAuthenticationOverXor) {
    ClientOptions opts;
    opts.username = "root";
    opts.password = "toor";
    start("sys", opts);

    EXPECT_NO_THROW(client_->connect());
    EXPECT_EQ(client_->challenges_answered(), 1);
}

TEST_F(SessionTest, ChainNeedsEveryMember) {
    ClientOptions opts;
    opts.username = "root";
    opts.password = "toor";
    start("none,sys,allow", opts);

    EXPECT_NO_THROW(client_->connect());
    EXPECT_EQ(client_->challenges_answered(), 2);
}

TEST_F(SessionTest, RejectMode) {
    options_->auth_max_attempts = 1;
    start("reject");
    EXPECT_THROW(client_->connect(), AuthenticationFailure);
}

TEST_F(SessionTest, HelloTimeout) {
    options_->auth_timeout_ms = 200;
    start("none");

    auto packet = client_->read(3000);
    ASSERT_TRUE(packet.has_value());
    EXPECT_EQ(packet->type(), "disconnect");
    EXPECT_EQ((*packet)[1].as_bytes(), "authentication timeout");
    finish();
    EXPECT_EQ(session_->state(), SessionState::CLOSED);
}

TEST_F(SessionTest, FirstPacketMustBeHello) {
    start("none");
    client_->send(Packet("ping", {Value(1)}));

    auto packet = client_->read(3000);
    ASSERT_TRUE(packet.has_value());
    EXPECT_EQ(packet->type(), "disconnect");
    EXPECT_EQ((*packet)[1].as_bytes(), "invalid hello packet");
}

// ---- Encryption ----

TEST_F(SessionTest, EncryptedSession) {
    options_->encryption_enabled = true;
    options_->encryption_key = "shared key";
    ClientOptions opts;
    opts.password = "s3cret";
    opts.encryption_key = "shared key";
    start("password", opts);

    auto caps = client_->connect();
    EXPECT_EQ(Value(caps).get_string("encryption"), PacketCipher::NAME);

    client_->ping(77);
    auto echo = client_->read(3000);
    ASSERT_TRUE(echo.has_value());
    EXPECT_EQ(echo->type(), "ping_echo");
}

TEST_F(SessionTest, EncryptionKeyMismatch) {
    options_->encryption_enabled = true;
    options_->encryption_key = "shared key";
    ClientOptions opts;
    opts.encryption_key = "other key";
    start("none", opts);

    EXPECT_THROW(client_->connect(), ProtocolError);
}

TEST_F(SessionTest, EncryptionRequiredByServer) {
    options_->encryption_enabled = true;
    options_->encryption_key = "shared key";
    start("none");

    try {
        client_->connect();
        FAIL() << "connect should have been refused";
    } catch (const AuthenticationFailure& e) {
        EXPECT_NE(std::string(e.what()).find("encryption required"), std::string::npos);
    }
}

TEST_F(SessionTest, EncryptionNotOfferedByServer) {
    ClientOptions opts;
    opts.encryption_key = "shared key";
    start("none", opts);

    EXPECT_THROW(client_->connect(), ProtocolError);
}

// ---- Packet loop ----

TEST_F(SessionTest, PingEcho) {
    start("none");
    client_->connect();

    client_->ping(123456);
    auto echo = client_->read(3000);
    ASSERT_TRUE(echo.has_value());
    EXPECT_EQ(echo->type(), "ping_echo");
    EXPECT_EQ((*echo)[1].as_int(), 123456);
    EXPECT_TRUE(wait_until([&] { return session_->get_info().at("pings") == 1.0; }));
}

TEST_F(SessionTest, DrawAndAcknowledge) {
    start("none");
    client_->connect();
    ASSERT_TRUE(wait_until([&] { return session_->state() == SessionState::ACTIVE; }));

    auto window = session_->add_window(1, 64, 48);
    EXPECT_EQ(session_->window_count(), 1u);
    EXPECT_TRUE(session_->damage(1, Region{0, 0, 8, 8}));
    EXPECT_FALSE(session_->damage(2, Region{0, 0, 8, 8}));

    auto draw = client_->read(3000);
    ASSERT_TRUE(draw.has_value());
    EXPECT_EQ(draw->type(), "draw");
    EXPECT_EQ((*draw)[1].as_int(), 1);
    EXPECT_EQ((*draw)[7].as_bytes().size(), 8u * 8u * 3u);
    uint64_t seq = static_cast<uint64_t>((*draw)[8].as_int());
    EXPECT_EQ(window->pending_acks(), 1u);

    client_->ack_damage(seq, 1, 8, 8, 2);
    EXPECT_TRUE(wait_until([&] { return window->pending_acks() == 0; }));

    auto info = session_->get_info();
    EXPECT_DOUBLE_EQ(info.at("windows"), 1.0);
    EXPECT_EQ(info.count("window.1.delay"), 1u);

    EXPECT_TRUE(session_->remove_window(1));
    EXPECT_FALSE(session_->remove_window(1));
}

TEST_F(SessionTest, WindowRules) {
    start("none");
    EXPECT_THROW(session_->add_window(1, 10, 10), std::logic_error);

    client_->connect();
    ASSERT_TRUE(wait_until([&] { return session_->state() == SessionState::ACTIVE; }));
    EXPECT_THROW(session_->add_window(1, 0, 10), std::invalid_argument);
    session_->add_window(1, 10, 10);
    EXPECT_THROW(session_->add_window(1, 10, 10), std::invalid_argument);
}

TEST_F(SessionTest, SuspendLocksWindows) {
    start("none");
    client_->connect();
    ASSERT_TRUE(wait_until([&] { return session_->state() == SessionState::ACTIVE; }));
    auto window = session_->add_window(3, 100, 100);

    client_->send(Packet("suspend"));
    EXPECT_TRUE(wait_until([&] { return window->batch_snapshot().locked; }));

    client_->send(Packet("resume"));
    EXPECT_TRUE(wait_until([&] { return !window->batch_snapshot().locked; }));
}

TEST_F(SessionTest, ClientDisconnect) {
    start("none");
    client_->connect();
    client_->disconnect("bye");
    finish();
    EXPECT_EQ(session_->state(), SessionState::CLOSED);
}

TEST_F(SessionTest, ServerClose) {
    start("none");
    client_->connect();
    ASSERT_TRUE(wait_until([&] { return session_->state() == SessionState::ACTIVE; }));

    session_->close("maintenance");
    auto packet = client_->read(3000);
    ASSERT_TRUE(packet.has_value());
    EXPECT_EQ(packet->type(), "disconnect");
    EXPECT_EQ((*packet)[1].as_bytes(), "maintenance");

    finish();
    EXPECT_EQ(session_->state(), SessionState::CLOSED);
}

TEST_F(SessionTest, MalformedAckIsProtocolError) {
    start("none");
    client_->connect();
    client_->send(Packet("damage-sequence", {Value(1)}));

    auto packet = client_->read(3000);
    ASSERT_TRUE(packet.has_value());
    EXPECT_EQ(packet->type(), "disconnect");
    EXPECT_EQ((*packet)[1].as_bytes().rfind("protocol error", 0), 0u);
    finish();
}

TEST_F(SessionTest, OversizedWindowIdIsProtocolError) {
    start("none");
    client_->connect();
    client_->send(Packet("damage-sequence", {Value(1), Value(int64_t(1) << 40)}));

    auto packet = client_->read(3000);
    ASSERT_TRUE(packet.has_value());
    EXPECT_EQ(packet->type(), "disconnect");
    EXPECT_NE((*packet)[1].as_bytes().find("out of range"), std::string::npos);
    finish();
}

// ---- Server ----

class ServerTest : public ::testing::Test {
protected:
    void TearDown() override {
        if (server_) server_->stop();
    }

    std::unique_ptr<Server> server_;
};

TEST_F(ServerTest, AcceptsTcpClients) {
    auto options = std::make_shared<ServerOptions>();
    options->bind = {"tcp://127.0.0.1:0"};
    options->workers = 2;
    server_ = std::make_unique<Server>(options, Server::make_auth_factory(*options, AuthOptions()));
    server_->start();
    EXPECT_TRUE(server_->is_running());
    EXPECT_THROW(server_->start(), std::logic_error);

    auto endpoints = server_->endpoints();
    ASSERT_EQ(endpoints.size(), 1u);
    ASSERT_NE(endpoints[0].port, 0);

    ClientOptions opts;
    opts.username = "tcp-user";
    Client client(connect_transport(endpoints[0].to_string()), opts);
    client.connect();
    EXPECT_TRUE(wait_until([&] { return server_->session_count() == 1; }));

    client.disconnect("done");
    EXPECT_TRUE(wait_until([&] { return server_->session_count() == 0; }));

    server_->stop();
    EXPECT_FALSE(server_->is_running());
    server_->stop();
}

TEST_F(ServerTest, StartupChecks) {
    auto options = std::make_shared<ServerOptions>();
    server_ = std::make_unique<Server>(options, Server::make_auth_factory(*options, AuthOptions()));
    EXPECT_THROW(server_->start(), TransportError);

    ServerOptions bad;
    bad.auth_mode = "password";
    EXPECT_THROW(Server::make_auth_factory(bad, AuthOptions()), std::invalid_argument);
    bad.auth_mode = "telepathy";
    EXPECT_THROW(Server::make_auth_factory(bad, AuthOptions()), std::invalid_argument);
}
