// ============================================================
// proxy_app_test.cpp -- Start/stop lifecycle, dispatch order,
//   lazy repair, error reporting
// ============================================================

#include "../proxy/proxy_app.hpp"
#include "../tunnel/kcp_dialer.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

using namespace testing_support;

namespace {

const char* kRemote = "192.0.2.10:29900";

std::string config_json(int conn, const std::string& local = "127.0.0.1:0") {
    return std::string("{\"remoteaddr\":\"") + kRemote + "\",\"localaddr\":\"" + local +
           "\",\"conn\":" + std::to_string(conn) + "}";
}

struct ProxyAppFixture : public ::testing::Test {
    std::shared_ptr<FakeSessionFactory> factory = std::make_shared<FakeSessionFactory>();
    std::shared_ptr<ThreadPerTaskRunner> runner = std::make_shared<ThreadPerTaskRunner>();
    std::unique_ptr<ProxyApp> app = std::make_unique<ProxyApp>(factory, runner);

    void TearDown() override {
        app->stop();
        EXPECT_TRUE(runner->wait_idle(std::chrono::seconds(5)));
    }

    // Connect one client and return the session id that served it
    int dispatch_one(std::vector<TcpSocket>& clients, std::vector<RemoteStream>& remotes) {
        clients.push_back(connect_to(app->local_address()));
        RemoteStream r;
        if (!factory->pop_remote(r)) return -1;
        int id = r.session_id;
        remotes.push_back(std::move(r));
        return id;
    }
};

// Fails every dial with something other than a SessionError
class ThrowingFactory : public SessionFactory {
public:
    std::shared_ptr<TransportSession> create(const TransportOptions&) override {
        throw std::length_error("session table exhausted");
    }
};

} // namespace

TEST_F(ProxyAppFixture, MissingRemoteAddrFailsValidation) {
    std::string err = app->start(R"({"remoteaddr":"","localaddr":"127.0.0.1:0"})");
    EXPECT_NE(err.find("remoteaddr"), std::string::npos);
    EXPECT_EQ(err.rfind("Validate Error: ", 0), 0u);
    EXPECT_FALSE(app->is_running());
    EXPECT_EQ(factory->create_calls(), 0);
}

TEST_F(ProxyAppFixture, MalformedJsonIsConfigError) {
    std::string err = app->start("{not json");
    EXPECT_EQ(err.rfind("Config Error: ", 0), 0u);
    EXPECT_FALSE(app->is_running());
}

TEST_F(ProxyAppFixture, UnsupportedSmuxVersionIsValidateError) {
    std::string err = app->start(R"({"remoteaddr":"192.0.2.10:29900","smuxver":3})");
    EXPECT_EQ(err, "Validate Error: unsupported smux version: 3");
    EXPECT_FALSE(app->is_running());
}

TEST_F(ProxyAppFixture, BindFailureIsListenError) {
    TcpSocket occupied;
    occupied.bind_and_listen("127.0.0.1", 0);

    std::string err = app->start(config_json(2, occupied.local_addr()));
    EXPECT_EQ(err.rfind("Listen Error: ", 0), 0u);
    EXPECT_FALSE(app->is_running());
    EXPECT_EQ(factory->create_calls(), 0);
}

TEST_F(ProxyAppFixture, MalformedLocalAddrIsListenError) {
    std::string err = app->start(config_json(2, "127.0.0.1"));
    EXPECT_EQ(err, "Listen Error: invalid local address: 127.0.0.1");
    EXPECT_FALSE(app->is_running());
    EXPECT_EQ(factory->create_calls(), 0);
}

TEST(ProxyAppKcpTest, MalformedRemoteAddrIsSessionError) {
    ProxyApp kcp_app(std::make_shared<KcpSessionFactory>());
    std::string err = kcp_app.start(R"({"remoteaddr":"no-port","localaddr":"127.0.0.1:0"})");
    EXPECT_EQ(err.rfind("Session Error: ", 0), 0u) << err;
    EXPECT_NE(err.find("no-port"), std::string::npos);
    EXPECT_FALSE(kcp_app.is_running());
    EXPECT_EQ(kcp_app.local_address(), "");
}

TEST(ProxyAppKcpTest, AnyPoolFailureIsSessionError) {
    ProxyApp throwing_app(std::make_shared<ThrowingFactory>());
    std::string err = throwing_app.start(R"({"remoteaddr":"192.0.2.10:29900","localaddr":"127.0.0.1:0"})");
    EXPECT_EQ(err, "Session Error: session table exhausted");
    EXPECT_FALSE(throwing_app.is_running());
    EXPECT_EQ(throwing_app.session_count(), 0);
}

TEST_F(ProxyAppFixture, StartRollsBackWhenAnySessionFails) {
    factory->fail_after(2);
    std::string err = app->start(config_json(3));
    EXPECT_EQ(err.rfind("Session Error: ", 0), 0u);
    EXPECT_FALSE(app->is_running());
    EXPECT_EQ(app->local_address(), "");
    EXPECT_EQ(app->session_count(), 0);
    ASSERT_EQ(factory->created(), 2);
    for (auto& s : factory->sessions()) {
        EXPECT_TRUE(s->is_closed());
    }

    // Nothing was left behind: a later start succeeds
    factory->fail_after(-1);
    EXPECT_EQ(app->start(config_json(3)), "");
    EXPECT_TRUE(app->is_running());
}

TEST_F(ProxyAppFixture, StartCreatesPoolAndReportsAddress) {
    ASSERT_EQ(app->start(config_json(3)), "");
    EXPECT_TRUE(app->is_running());
    EXPECT_EQ(factory->created(), 3);
    EXPECT_EQ(app->session_count(), 3);
    EXPECT_EQ(factory->last_opts().remote_addr, kRemote);

    std::string host;
    int port = 0;
    ASSERT_TRUE(utils::split_host_port(app->local_address(), host, port));
    EXPECT_EQ(host, "127.0.0.1");
    EXPECT_GT(port, 0);

    EXPECT_EQ(app->config().conn, 3);
    EXPECT_EQ(app->config().mode, Mode::Fast);
}

TEST_F(ProxyAppFixture, SecondStartIsRejected) {
    ASSERT_EQ(app->start(config_json(1)), "");
    EXPECT_EQ(app->start(config_json(1)), "Proxy already running");
    EXPECT_TRUE(app->is_running());
    EXPECT_EQ(factory->created(), 1);
}

TEST_F(ProxyAppFixture, ConnectionsRotateThroughSlotsInAcceptOrder) {
    ASSERT_EQ(app->start(config_json(3)), "");

    std::vector<TcpSocket> clients;
    std::vector<RemoteStream> remotes;
    std::vector<int> order;
    for (int i = 0; i < 7; ++i) {
        order.push_back(dispatch_one(clients, remotes));
    }
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 0, 1, 2, 0}));
    EXPECT_EQ(factory->created(), 3);
}

TEST_F(ProxyAppFixture, DeadSessionIsRepairedBeforeForwarding) {
    ASSERT_EQ(app->start(config_json(3)), "");
    std::vector<TcpSocket> clients;
    std::vector<RemoteStream> remotes;

    factory->session(1)->close();

    EXPECT_EQ(dispatch_one(clients, remotes), 0);
    EXPECT_EQ(dispatch_one(clients, remotes), 3);   // slot 1, fresh session
    EXPECT_EQ(factory->created(), 4);
    EXPECT_EQ(app->session_count(), 3);

    EXPECT_EQ(dispatch_one(clients, remotes), 2);
    EXPECT_EQ(dispatch_one(clients, remotes), 0);
    EXPECT_EQ(dispatch_one(clients, remotes), 3);   // replacement reused
    EXPECT_EQ(factory->created(), 4);
}

TEST_F(ProxyAppFixture, FailedRepairDropsOnlyThatConnection) {
    ASSERT_EQ(app->start(config_json(2)), "");
    factory->session(1)->close();
    factory->fail_after(2);

    std::vector<TcpSocket> clients;
    std::vector<RemoteStream> remotes;
    EXPECT_EQ(dispatch_one(clients, remotes), 0);

    // Slot 1 cannot be repaired: the client is closed without a stream
    TcpSocket dropped = connect_to(app->local_address());
    char c;
    EXPECT_EQ(dropped.recv_some(&c, 1), 0u);
    EXPECT_TRUE(app->is_running());

    factory->fail_after(-1);
    EXPECT_EQ(dispatch_one(clients, remotes), 0);
    EXPECT_EQ(dispatch_one(clients, remotes), 2);
}

TEST_F(ProxyAppFixture, RelaysDataEndToEnd) {
    ASSERT_EQ(app->start(config_json(1)), "");
    TcpSocket client = connect_to(app->local_address());
    RemoteStream remote;
    ASSERT_TRUE(factory->pop_remote(remote));

    client.send_all("hello", 5);
    EXPECT_EQ(remote.end->read_exact(5), "hello");
    remote.end->write_str("world");
    EXPECT_EQ(recv_exact(client, 5), "world");
}

TEST_F(ProxyAppFixture, StopClosesEverything) {
    ASSERT_EQ(app->start(config_json(3)), "");
    std::string addr = app->local_address();

    TcpSocket client = connect_to(addr);
    RemoteStream remote;
    ASSERT_TRUE(factory->pop_remote(remote));

    app->stop();
    EXPECT_FALSE(app->is_running());
    EXPECT_EQ(app->local_address(), "");
    EXPECT_EQ(app->session_count(), 0);
    for (auto& s : factory->sessions()) {
        EXPECT_TRUE(s->is_closed());
    }

    // The in-flight forwarder unwinds on its own
    char c;
    EXPECT_EQ(client.recv_some(&c, 1), 0u);
    EXPECT_TRUE(runner->wait_idle(std::chrono::seconds(5)));

    // The listener is gone
    EXPECT_THROW(connect_to(addr), std::runtime_error);
}

TEST_F(ProxyAppFixture, StopWhenStoppedIsNoOp) {
    app->stop();
    EXPECT_FALSE(app->is_running());

    ASSERT_EQ(app->start(config_json(1)), "");
    app->stop();
    app->stop();
    EXPECT_FALSE(app->is_running());
}

TEST_F(ProxyAppFixture, RestartAfterStop) {
    ASSERT_EQ(app->start(config_json(2)), "");
    app->stop();
    ASSERT_EQ(app->start(config_json(2)), "");
    EXPECT_TRUE(app->is_running());
    EXPECT_EQ(factory->created(), 4);
    EXPECT_EQ(app->session_count(), 2);

    std::vector<TcpSocket> clients;
    std::vector<RemoteStream> remotes;
    EXPECT_EQ(dispatch_one(clients, remotes), 2);
}

TEST_F(ProxyAppFixture, DestructorStopsRunningProxy) {
    ASSERT_EQ(app->start(config_json(2)), "");
    app.reset();
    for (auto& s : factory->sessions()) {
        EXPECT_TRUE(s->is_closed());
    }
    app = std::make_unique<ProxyApp>(factory, runner);
}
