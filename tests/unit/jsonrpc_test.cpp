/**
 * @file jsonrpc_test.cpp
 * @brief Unit tests for JSON-RPC envelope encoding and classification.
 */

#include "client/jsonrpc.hpp"

#include <gtest/gtest.h>

using namespace tether::client;
using nlohmann::json;

// ---------------------------------------------------------------------------
// Encoding
// ---------------------------------------------------------------------------

TEST(JsonRpcTest, RequestOmitsNullParams) {
    json request = jsonrpc::make_request(7, "ping", nullptr);
    EXPECT_EQ(request["jsonrpc"], "2.0");
    EXPECT_EQ(request["id"], 7);
    EXPECT_EQ(request["method"], "ping");
    EXPECT_FALSE(request.contains("params"));

    json with_params = jsonrpc::make_request(8, "echo", json{{"a", 1}});
    EXPECT_EQ(with_params["params"]["a"], 1);
}

TEST(JsonRpcTest, EncodedMessageIsOneLine) {
    json message = jsonrpc::make_request(1, "echo", json{{"text", "line1\nline2"}});
    std::string line = jsonrpc::encode(message);
    EXPECT_EQ(line.find('\n'), std::string::npos);
    EXPECT_EQ(json::parse(line), message);
}

TEST(JsonRpcTest, ErrorResponseShape) {
    json response = jsonrpc::make_error_response("srv-1", jsonrpc::kMethodNotFound, "Method not found");
    EXPECT_EQ(response["id"], "srv-1");
    EXPECT_EQ(response["error"]["code"], -32601);
}

// ---------------------------------------------------------------------------
// Decoding
// ---------------------------------------------------------------------------

TEST(JsonRpcTest, DecodesResultResponse) {
    jsonrpc::IncomingMessage message;
    std::string error;
    ASSERT_TRUE(jsonrpc::decode(R"({"jsonrpc":"2.0","id":3,"result":{"ok":true}})", message, error)) << error;
    EXPECT_EQ(message.kind, jsonrpc::MessageKind::RESPONSE);
    ASSERT_TRUE(message.id.has_value());
    EXPECT_EQ(*message.id, 3);
    EXPECT_TRUE(message.has_result);
    EXPECT_FALSE(message.has_error);
    EXPECT_EQ(message.result["ok"], true);
}

TEST(JsonRpcTest, NumericStringIdResolves) {
    jsonrpc::IncomingMessage message;
    std::string error;
    ASSERT_TRUE(jsonrpc::decode(R"({"jsonrpc":"2.0","id":"42","result":null})", message, error));
    ASSERT_TRUE(message.id.has_value());
    EXPECT_EQ(*message.id, 42);
}

TEST(JsonRpcTest, NonNumericStringIdHasNoIntegerForm) {
    jsonrpc::IncomingMessage message;
    std::string error;
    ASSERT_TRUE(jsonrpc::decode(R"({"jsonrpc":"2.0","id":"abc","method":"ping"})", message, error));
    EXPECT_EQ(message.kind, jsonrpc::MessageKind::REQUEST);
    EXPECT_FALSE(message.id.has_value());
    EXPECT_EQ(message.raw_id, "abc");
}

TEST(JsonRpcTest, ClassifiesNotifications) {
    jsonrpc::IncomingMessage message;
    std::string error;
    ASSERT_TRUE(jsonrpc::decode(R"({"jsonrpc":"2.0","method":"notifications/message","params":{"x":1}})", message,
                                error));
    EXPECT_EQ(message.kind, jsonrpc::MessageKind::NOTIFICATION);
    EXPECT_EQ(message.method, "notifications/message");
    EXPECT_EQ(message.params["x"], 1);

    ASSERT_TRUE(jsonrpc::decode(R"({"jsonrpc":"2.0","id":null,"method":"tick"})", message, error));
    EXPECT_EQ(message.kind, jsonrpc::MessageKind::NOTIFICATION);
}

TEST(JsonRpcTest, ResponseWithoutResultOrErrorIsStillAResponse) {
    jsonrpc::IncomingMessage message;
    std::string error;
    ASSERT_TRUE(jsonrpc::decode(R"({"jsonrpc":"2.0","id":5})", message, error));
    EXPECT_EQ(message.kind, jsonrpc::MessageKind::RESPONSE);
    EXPECT_FALSE(message.has_result);
    EXPECT_FALSE(message.has_error);
}

TEST(JsonRpcTest, RejectsMalformedInput) {
    jsonrpc::IncomingMessage message;
    std::string error;
    EXPECT_FALSE(jsonrpc::decode("not json {", message, error));
    EXPECT_EQ(error, "Invalid JSON");
    EXPECT_FALSE(jsonrpc::decode("[1,2,3]", message, error));
    EXPECT_FALSE(jsonrpc::decode(R"({"jsonrpc":"2.0"})", message, error));
    EXPECT_FALSE(jsonrpc::decode(R"({"id":1,"result":1,"error":{}})", message, error));
    EXPECT_FALSE(jsonrpc::decode(R"({"id":{"nested":1},"result":1})", message, error));
    EXPECT_FALSE(jsonrpc::decode(R"({"method":5})", message, error));
}

TEST(JsonRpcTest, ExtractErrorToleratesMissingFields) {
    int code = 0;
    std::string message;
    json data;

    jsonrpc::extract_error(json{{"code", -32000}, {"message", "boom"}, {"data", {1, 2}}}, code, message, data);
    EXPECT_EQ(code, -32000);
    EXPECT_EQ(message, "boom");
    EXPECT_EQ(data, json({1, 2}));

    jsonrpc::extract_error(json::object(), code, message, data);
    EXPECT_EQ(code, jsonrpc::kInternalError);
    EXPECT_EQ(message, "Unknown remote error");
    EXPECT_TRUE(data.is_null());

    jsonrpc::extract_error(json("plain text"), code, message, data);
    EXPECT_EQ(message, "plain text");
}
