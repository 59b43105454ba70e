/**
 * @file reliable_client_test.cpp
 * @brief End-to-end call path (rate limit, retry, breaker, transport) against fake_mcp_server.
 */

#include "client/reliable_client.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <thread>

#include "helpers/fake_server.hpp"

using namespace tether::client;
using namespace tether::reliability;
using tether::testing::fake_server_config;
using nlohmann::json;

namespace {

ReliabilityConfig fast_reliability() {
    ReliabilityConfig config;
    config.retry.max_retries = 3;
    config.retry.base_delay_ms = 20;
    config.retry.max_delay_ms = 200;
    config.retry.jitter_factor = 0.0;
    config.circuit_breaker.failure_threshold = 5;
    config.circuit_breaker.recovery_timeout_ms = 60000;
    config.rate_limit.min_interval_ms = 0;
    config.request_timeout_ms = 2000;
    return config;
}

}  // namespace

class ReliableClientTest : public ::testing::Test {
protected:
    std::shared_ptr<ProcessSupervisor> supervisor = std::make_shared<ProcessSupervisor>();
    std::unique_ptr<ReliableClient> client;

    void make_client(const ServerConfig &server, const ReliabilityConfig &config = fast_reliability()) {
        client = std::make_unique<ReliableClient>(supervisor, server, config);
    }

    void TearDown() override {
        if (client) {
            client->disconnect();
        }
        supervisor->stop_all();
    }
};

// ---------------------------------------------------------------------------
// Basic calls
// ---------------------------------------------------------------------------

TEST_F(ReliableClientTest, CallBeforeConnectFailsFast) {
    make_client(fake_server_config("fake"));
    try {
        client->call("echo", json::object());
        FAIL() << "expected ConnectionError";
    } catch (const ConnectionError &e) {
        EXPECT_EQ(e.code(), ErrorCode::CONNECTION);
        EXPECT_NE(std::string(e.what()).find("Not connected to server 'fake'"), std::string::npos);
    }
    EXPECT_EQ(client->stats("echo").attempts, 0);
    EXPECT_FALSE(client->is_connected());
}

TEST_F(ReliableClientTest, EchoCall) {
    make_client(fake_server_config("fake"));
    client->connect();
    EXPECT_TRUE(client->is_connected());

    json result = client->call("echo", json{{"msg", "hi"}});
    EXPECT_EQ(result["msg"], "hi");

    auto stats = client->stats("echo");
    EXPECT_EQ(stats.attempts, 1);
    EXPECT_EQ(stats.failures, 0);
    EXPECT_EQ(stats.retries, 0);
    EXPECT_EQ(stats.breaker_state, CircuitState::CLOSED);
}

TEST_F(ReliableClientTest, ListTools) {
    make_client(fake_server_config("fake"));
    client->connect();

    auto tools = client->list_tools();
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0].name, "echo_tool");
    EXPECT_EQ(tools[0].input_schema.required, (std::vector<std::string>{"text"}));
    EXPECT_EQ(tools[1].name, "failing_tool");
}

TEST_F(ReliableClientTest, CallToolReturnsContent) {
    make_client(fake_server_config("fake"));
    client->connect();

    ToolRequest request;
    request.name = "echo_tool";
    request.arguments = {{"text", "round trip"}};
    ToolResponse response = client->call_tool(request);

    EXPECT_FALSE(response.is_error);
    EXPECT_EQ(response.first_text(), "round trip");
    EXPECT_EQ(client->stats("tool:echo_tool").attempts, 1);
}

TEST_F(ReliableClientTest, ToolErrorResultThrowsRemoteError) {
    make_client(fake_server_config("fake"));
    client->connect();

    ToolRequest request;
    request.name = "failing_tool";
    try {
        client->call_tool(request);
        FAIL() << "expected RemoteError";
    } catch (const RemoteError &e) {
        EXPECT_STREQ(e.what(), "tool exploded");
        EXPECT_TRUE(e.data().value("isError", false));
    }
    // The call itself succeeded at the transport level
    EXPECT_EQ(client->stats("tool:failing_tool").attempts, 1);
    EXPECT_EQ(client->stats("tool:failing_tool").breaker_failure_count, 0);
}

TEST_F(ReliableClientTest, EmptyToolNameRejected) {
    make_client(fake_server_config("fake"));
    client->connect();
    EXPECT_THROW(client->call_tool(ToolRequest{}), InvalidArgumentError);
}

// ---------------------------------------------------------------------------
// Retry and circuit breaker
// ---------------------------------------------------------------------------

TEST_F(ReliableClientTest, RemoteErrorIsNotRetried) {
    make_client(fake_server_config("fake"));
    client->connect();

    EXPECT_THROW(client->call("no/such/method", json::object()), RemoteError);
    auto stats = client->stats("no/such/method");
    EXPECT_EQ(stats.attempts, 1);
    EXPECT_EQ(stats.failures, 1);
    EXPECT_EQ(stats.retries, 0);
    EXPECT_NE(stats.last_failure.find("Method not found"), std::string::npos);
}

TEST_F(ReliableClientTest, TimeoutsAreRetried) {
    ReliabilityConfig config = fast_reliability();
    config.request_timeout_ms = 100;
    make_client(fake_server_config("fake"), config);
    client->connect();

    EXPECT_THROW(client->call("sleep", json{{"ms", 400}}), TimeoutError);
    auto stats = client->stats("sleep");
    EXPECT_EQ(stats.attempts, 3);
    EXPECT_EQ(stats.failures, 3);
    EXPECT_EQ(stats.retries, 2);

    // Session survives the timeouts
    EXPECT_EQ(client->call("echo", json{{"ok", true}})["ok"], true);
}

TEST_F(ReliableClientTest, CircuitOpensPerOperationKey) {
    ReliabilityConfig config = fast_reliability();
    config.retry.max_retries = 1;
    config.circuit_breaker.failure_threshold = 2;
    make_client(fake_server_config("fake"), config);
    client->connect();

    EXPECT_THROW(client->call("bad", "no/such/method", json::object()), RemoteError);
    EXPECT_THROW(client->call("bad", "no/such/method", json::object()), RemoteError);
    EXPECT_EQ(client->stats("bad").breaker_state, CircuitState::OPEN);

    // Rejected without reaching the server
    EXPECT_THROW(client->call("bad", "no/such/method", json::object()), CircuitBreakerOpenError);
    EXPECT_EQ(client->stats("bad").attempts, 2);

    // Other keys are unaffected
    EXPECT_EQ(client->call("good", "echo", json{{"v", 1}})["v"], 1);

    client->reset_stats("bad");
    auto reset = client->stats("bad");
    EXPECT_EQ(reset.attempts, 0);
    EXPECT_EQ(reset.breaker_state, CircuitState::CLOSED);
    EXPECT_THROW(client->call("bad", "no/such/method", json::object()), RemoteError);
}

TEST_F(ReliableClientTest, RecoversFromCrashThroughRetry) {
    make_client(fake_server_config("fake", {"--crash-after=2"}), [] {
        ReliabilityConfig config = fast_reliability();
        config.retry.max_retries = 5;
        config.retry.base_delay_ms = 50;
        return config;
    }());
    client->connect();

    EXPECT_EQ(client->call("echo", json{{"n", 1}})["n"], 1);
    // Second request kills the server; a retry lands on the restarted process
    EXPECT_EQ(client->call("echo", json{{"n", 2}})["n"], 2);

    EXPECT_GE(client->stats("echo").retries, 1);
    EXPECT_EQ(supervisor->status("fake")->restart_attempts, 1);
}

TEST_F(ReliableClientTest, FailedServerSurfacesRestartLimit) {
    ServerConfig server = fake_server_config("fake", {"--crash-after=1"});
    server.max_restart_attempts = 0;
    ReliabilityConfig config = fast_reliability();
    config.retry.max_retries = 1;
    make_client(server, config);
    client->connect();

    EXPECT_THROW(client->call("echo", json::object()), ConnectionLostError);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::chrono::steady_clock::now() < deadline && supervisor->status("fake")->state != ServerState::FAILED) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ASSERT_EQ(supervisor->status("fake")->state, ServerState::FAILED);

    EXPECT_THROW(client->call("echo", json::object()), RestartLimitExceededError);
}

// ---------------------------------------------------------------------------
// Rate limiting and lifecycle
// ---------------------------------------------------------------------------

TEST_F(ReliableClientTest, RateLimitSpacesCalls) {
    ReliabilityConfig config = fast_reliability();
    config.rate_limit.min_interval_ms = 100;
    make_client(fake_server_config("fake"), config);
    client->connect();

    auto start = std::chrono::steady_clock::now();
    for (int i = 0; i < 3; ++i) {
        client->call("echo", json{{"i", i}});
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    EXPECT_GE(elapsed.count(), 190);
}

TEST_F(ReliableClientTest, DisconnectStopsServer) {
    make_client(fake_server_config("fake"));
    client->connect();
    client->call("echo", json::object());

    client->disconnect();
    EXPECT_FALSE(client->is_connected());
    EXPECT_FALSE(supervisor->has_server("fake"));
    EXPECT_THROW(client->call("echo", json::object()), ConnectionError);

    client->disconnect();  // no-op
}

TEST_F(ReliableClientTest, AllStatsListsEveryKey) {
    make_client(fake_server_config("fake"));
    client->connect();
    client->call("echo", json::object());
    client->call("ping", json::object());

    auto all = client->all_stats();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].operation, "echo");
    EXPECT_EQ(all[1].operation, "ping");
}
