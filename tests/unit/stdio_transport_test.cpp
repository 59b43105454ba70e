/**
 * @file stdio_transport_test.cpp
 * @brief StdioTransport against the fake_mcp_server helper.
 *
 * Tests:
 * - Handshake results and protocol negotiation
 * - Request/response correlation, including out-of-order replies
 * - Timeouts leave the session usable
 * - A crash fails every pending request and fires the loss handler
 * - Malformed lines and unknown ids are skipped
 * - Server-initiated requests and notifications
 */

#include "client/stdio_transport.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "helpers/fake_server.hpp"

using namespace tether::client;
using tether::testing::fake_server_config;
using nlohmann::json;

class StdioTransportTest : public ::testing::Test {
protected:
    std::unique_ptr<StdioTransport> transport;

    void connect_with(const std::vector<std::string> &args = {}) {
        transport = std::make_unique<StdioTransport>(fake_server_config("fake", args));
        ASSERT_NO_THROW(transport->connect());
    }

    void TearDown() override {
        if (transport) {
            transport->disconnect();
        }
    }
};

// ---------------------------------------------------------------------------
// Handshake
// ---------------------------------------------------------------------------

TEST_F(StdioTransportTest, ConnectRecordsHandshakeResults) {
    connect_with();
    EXPECT_TRUE(transport->is_connected());
    EXPECT_TRUE(transport->is_process_running());
    EXPECT_GT(transport->pid(), 0);
    EXPECT_EQ(transport->negotiated_protocol_version(), ClientIdentity{}.protocol_version);
    EXPECT_EQ(transport->server_info()["name"], "fake-mcp-server");
    EXPECT_TRUE(transport->server_capabilities().contains("tools"));
    EXPECT_EQ(transport->pending_count(), 0u);
}

TEST_F(StdioTransportTest, UnsupportedProtocolVersionFailsConnect) {
    transport = std::make_unique<StdioTransport>(fake_server_config("fake", {"--mode=bad-version"}));
    try {
        transport->connect();
        FAIL() << "expected ConnectionError";
    } catch (const ConnectionError &e) {
        EXPECT_EQ(e.code(), ErrorCode::CONNECTION);
        EXPECT_NE(std::string(e.what()).find("Unsupported protocol version: 1999-01-01"), std::string::npos);
    }
    EXPECT_FALSE(transport->is_connected());
    EXPECT_FALSE(transport->is_process_running());
}

TEST_F(StdioTransportTest, SilentServerTimesOutHandshake) {
    ServerConfig config = fake_server_config("fake", {"--mode=silent"});
    config.connect_timeout_ms = 200;
    transport = std::make_unique<StdioTransport>(config);
    try {
        transport->connect();
        FAIL() << "expected ConnectionError";
    } catch (const ConnectionError &e) {
        EXPECT_NE(std::string(e.what()).find("Handshake timed out"), std::string::npos);
    }
    EXPECT_FALSE(transport->is_connected());
}

TEST_F(StdioTransportTest, MissingExecutableIsSpawnError) {
    ServerConfig config;
    config.name = "ghost";
    config.command_line = {"/nonexistent/mcp-server"};
    transport = std::make_unique<StdioTransport>(config);
    try {
        transport->connect();
        FAIL() << "expected ProcessSpawnError";
    } catch (const ProcessSpawnError &e) {
        EXPECT_EQ(e.code(), ErrorCode::PROCESS_SPAWN);
        EXPECT_NE(std::string(e.what()).find("Executable not found"), std::string::npos);
    }
}

TEST_F(StdioTransportTest, ServerExitingBeforeHandshake) {
    transport = std::make_unique<StdioTransport>(fake_server_config("fake", {"--mode=exit-immediately"}));
    EXPECT_THROW(transport->connect(), ConnectionError);
    EXPECT_FALSE(transport->is_connected());
}

TEST_F(StdioTransportTest, SendBeforeConnectFails) {
    transport = std::make_unique<StdioTransport>(fake_server_config("fake"));
    EXPECT_THROW(transport->send("ping", nullptr, 1000), ConnectionError);
    EXPECT_FALSE(transport->ping(100));
}

// ---------------------------------------------------------------------------
// Requests
// ---------------------------------------------------------------------------

TEST_F(StdioTransportTest, EchoReturnsParams) {
    connect_with();
    json result = transport->send("echo", json{{"text", "hello"}, {"n", 3}}, 2000);
    EXPECT_EQ(result["text"], "hello");
    EXPECT_EQ(result["n"], 3);
    EXPECT_TRUE(transport->ping(1000));
}

TEST_F(StdioTransportTest, ConcurrentRequestsResolveOutOfOrder) {
    connect_with();

    const int kRequests = 8;
    std::vector<std::future<json>> results;
    for (int i = 0; i < kRequests; ++i) {
        // Later requests answer first
        int delay = (kRequests - i) * 30;
        results.push_back(std::async(std::launch::async, [this, i, delay]() {
            return transport->send("echo", json{{"index", i}, {"delay_ms", delay}}, 5000);
        }));
    }
    for (int i = 0; i < kRequests; ++i) {
        json result = results[i].get();
        EXPECT_EQ(result["index"], i);
    }
    EXPECT_EQ(transport->pending_count(), 0u);
}

TEST_F(StdioTransportTest, TimeoutLeavesSessionUsable) {
    connect_with();
    try {
        transport->send("sleep", json{{"ms", 500}}, 100);
        FAIL() << "expected TimeoutError";
    } catch (const TimeoutError &e) {
        EXPECT_NE(std::string(e.what()).find("timed out after 100ms"), std::string::npos);
    }
    EXPECT_EQ(transport->pending_count(), 0u);

    // The late reply is dropped; new requests still work
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    EXPECT_EQ(transport->send("echo", json{{"after", true}}, 2000)["after"], true);
    EXPECT_TRUE(transport->is_connected());
}

TEST_F(StdioTransportTest, ErrorReplyBecomesRemoteError) {
    connect_with();
    try {
        transport->send("no/such/method", json::object(), 2000);
        FAIL() << "expected RemoteError";
    } catch (const RemoteError &e) {
        EXPECT_EQ(e.rpc_code(), -32601);
        EXPECT_NE(std::string(e.what()).find("Method not found"), std::string::npos);
    }
    EXPECT_TRUE(transport->is_connected());
}

TEST_F(StdioTransportTest, SkipsMalformedLines) {
    connect_with({"--mode=malformed"});
    EXPECT_EQ(transport->send("echo", json{{"v", 1}}, 2000)["v"], 1);
    EXPECT_EQ(transport->send("echo", json{{"v", 2}}, 2000)["v"], 2);
}

TEST_F(StdioTransportTest, DropsResponsesForUnknownIds) {
    connect_with({"--mode=unknown-id"});
    json result = transport->send("echo", json{{"v", "ok"}}, 2000);
    EXPECT_EQ(result["v"], "ok");
    EXPECT_FALSE(result.contains("stray"));
}

// ---------------------------------------------------------------------------
// Connection loss
// ---------------------------------------------------------------------------

TEST_F(StdioTransportTest, CrashFailsAllPendingRequests) {
    connect_with({"--crash-after=3"});

    std::mutex mutex;
    std::condition_variable cv;
    std::string lost_reason;
    transport->set_connection_lost_handler([&](const std::string &reason) {
        std::lock_guard<std::mutex> lock(mutex);
        lost_reason = reason;
        cv.notify_all();
    });

    auto slow1 = std::async(std::launch::async, [this]() { return transport->send("sleep", json{{"ms", 5000}}, 10000); });
    auto slow2 = std::async(std::launch::async, [this]() { return transport->send("sleep", json{{"ms", 5000}}, 10000); });
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    // Third request makes the server exit
    EXPECT_THROW(transport->send("echo", json::object(), 10000), ConnectionLostError);
    EXPECT_THROW(slow1.get(), ConnectionLostError);
    EXPECT_THROW(slow2.get(), ConnectionLostError);

    {
        std::unique_lock<std::mutex> lock(mutex);
        ASSERT_TRUE(cv.wait_for(lock, std::chrono::seconds(5), [&] { return !lost_reason.empty(); }));
    }
    EXPECT_FALSE(transport->is_connected());
    EXPECT_EQ(transport->pending_count(), 0u);
    EXPECT_FALSE(transport->last_error().empty());

    // Later calls fail fast with the recorded reason
    EXPECT_THROW(transport->send("echo", json::object(), 1000), ConnectionLostError);
}

TEST_F(StdioTransportTest, DisconnectFailsPendingRequests) {
    connect_with();
    auto slow = std::async(std::launch::async, [this]() { return transport->send("sleep", json{{"ms", 5000}}, 10000); });
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    transport->disconnect();
    EXPECT_THROW(slow.get(), ConnectionLostError);
    EXPECT_FALSE(transport->is_connected());
    EXPECT_THROW(transport->send("echo", json::object(), 1000), ConnectionError);

    transport->disconnect();  // idempotent
}

TEST_F(StdioTransportTest, ReconnectAfterDisconnect) {
    connect_with();
    pid_t first = transport->pid();
    transport->disconnect();

    ASSERT_NO_THROW(transport->connect());
    EXPECT_TRUE(transport->is_connected());
    EXPECT_NE(transport->pid(), first);
    EXPECT_EQ(transport->send("echo", json{{"x", 1}}, 2000)["x"], 1);
}

// ---------------------------------------------------------------------------
// Server-initiated traffic and process environment
// ---------------------------------------------------------------------------

TEST_F(StdioTransportTest, DeliversNotifications) {
    connect_with();
    std::promise<json> received;
    auto future = received.get_future();
    std::atomic<bool> delivered{false};
    transport->set_notification_handler([&](const std::string &method, const json &params) {
        if (method == "notifications/message" && !delivered.exchange(true)) {
            received.set_value(params);
        }
    });

    transport->send("notify-me", json::object(), 2000);
    ASSERT_EQ(future.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(future.get()["text"], "hello");
}

TEST_F(StdioTransportTest, SendsClientNotifications) {
    connect_with();
    transport->notify("notifications/progress", json{{"progress", 3}});

    // Lines are handled in order, so the notification precedes this request
    json seen = transport->send("notifications/received", json::object(), 2000)["notifications"];
    ASSERT_TRUE(seen.is_array());
    ASSERT_GE(seen.size(), 2u);
    EXPECT_EQ(seen[0]["method"], "notifications/initialized");
    EXPECT_EQ(seen.back()["method"], "notifications/progress");
    EXPECT_EQ(seen.back()["params"]["progress"], 3);
}

TEST_F(StdioTransportTest, NotifyRequiresConnection) {
    connect_with();
    transport->disconnect();
    EXPECT_THROW(transport->notify("notifications/progress"), ConnectionError);
}

TEST_F(StdioTransportTest, AnswersServerPing) {
    connect_with();
    json result = transport->send("server/ping-client", json::object(), 2000);
    ASSERT_TRUE(result.contains("client_reply"));
    EXPECT_EQ(result["client_reply"]["id"], "srv-1");
    EXPECT_TRUE(result["client_reply"].contains("result"));
}

TEST_F(StdioTransportTest, AppliesEnvironmentAndWorkingDirectory) {
    ServerConfig config = fake_server_config("fake");
    config.environment["TETHER_TEST_VALUE"] = "forty-two";
    std::string dir = std::filesystem::temp_directory_path().string();
    config.working_directory = dir;

    transport = std::make_unique<StdioTransport>(config);
    ASSERT_NO_THROW(transport->connect());

    EXPECT_EQ(transport->send("env/get", json{{"name", "TETHER_TEST_VALUE"}}, 2000)["value"], "forty-two");
    EXPECT_EQ(std::filesystem::canonical(transport->send("cwd", json::object(), 2000)["cwd"].get<std::string>()),
              std::filesystem::canonical(dir));
}
