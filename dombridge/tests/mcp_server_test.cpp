#include <gtest/gtest.h>

#include "mcp_server.hpp"
#include "request_correlator.hpp"
#include "selector_store.hpp"
#include "sse_hub.hpp"
#include "test_helpers.hpp"
#include "tool_catalog.hpp"
#include "tool_dispatcher.hpp"

#include <httplib.h>

#include <chrono>
#include <thread>

using namespace dombridge;

namespace {

class McpServerTest : public ::testing::Test {
protected:
    McpServerTest()
        : selectors(scratch.file("selectors.json").string()),
          dispatcher(ToolCatalog::builtin(), correlator, transport, selectors),
          handler(dispatcher, sse) {
        dispatcher.set_default_timeout(std::chrono::milliseconds(100));
    }

    nlohmann::json rpc(const std::string& method, nlohmann::json params = nlohmann::json::object()) {
        auto response = handler.handle({{"jsonrpc", "2.0"}, {"id", 7}, {"method", method}, {"params", params}});
        return response ? *response : nlohmann::json(nullptr);
    }

    ScratchDir scratch;
    FakeTransport transport;
    RequestCorrelator correlator;
    SelectorStore selectors;
    ToolDispatcher dispatcher;
    SseHub sse;
    mcp::RequestHandler handler;
};

} // namespace

TEST_F(McpServerTest, InitializeReportsServerInfo) {
    nlohmann::json response = rpc("initialize");

    EXPECT_EQ(response["id"], 7);
    EXPECT_EQ(response["result"]["protocolVersion"], "2024-11-05");
    EXPECT_EQ(response["result"]["serverInfo"]["name"], "llmcp-browser-automation");
    EXPECT_TRUE(response["result"]["capabilities"].contains("tools"));
}

TEST_F(McpServerTest, ToolsListHasEightTools) {
    nlohmann::json tools = rpc("tools/list")["result"]["tools"];

    ASSERT_EQ(tools.size(), 8u);
    for (const auto& tool : tools) {
        EXPECT_TRUE(tool.contains("name"));
        EXPECT_TRUE(tool.contains("description"));
        EXPECT_EQ(tool["inputSchema"]["type"], "object");
    }
    EXPECT_EQ(tools[2]["inputSchema"]["required"], nlohmann::json({"selector", "text"}));
}

TEST_F(McpServerTest, EmptyListsForResourcesAndPrompts) {
    EXPECT_EQ(rpc("resources/list")["result"]["resources"], nlohmann::json::array());
    EXPECT_EQ(rpc("prompts/list")["result"]["prompts"], nlohmann::json::array());
}

TEST_F(McpServerTest, UnknownMethodIsMethodNotFound) {
    nlohmann::json response = rpc("tools/delete");

    EXPECT_EQ(response["error"]["code"], mcp::kMethodNotFound);
    EXPECT_EQ(response["id"], 7);
}

TEST_F(McpServerTest, NotificationGets204) {
    mcp::HttpReply reply = handler.handle_body(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");

    EXPECT_EQ(reply.status, 204);
    EXPECT_TRUE(reply.body.empty());
}

TEST_F(McpServerTest, MalformedBodyGets400ParseError) {
    mcp::HttpReply reply = handler.handle_body("{not json");

    EXPECT_EQ(reply.status, 400);
    nlohmann::json body = nlohmann::json::parse(reply.body);
    EXPECT_EQ(body["error"]["code"], mcp::kParseError);
    EXPECT_TRUE(body["id"].is_null());
}

TEST_F(McpServerTest, MissingMethodIsInvalidRequest) {
    mcp::HttpReply reply = handler.handle_body(R"({"jsonrpc":"2.0","id":1})");

    EXPECT_EQ(reply.status, 200);
    EXPECT_EQ(nlohmann::json::parse(reply.body)["error"]["code"], mcp::kInvalidRequest);
}

TEST_F(McpServerTest, ToolCallSuccessIsTextContent) {
    transport.set_responder([this](const nlohmann::json& command) {
        correlator.resolve(make_result(command["request_id"], "mcp",
                                       {{"success", true}, {"url", "https://example.com"}, {"title", "Example"}}));
    });

    nlohmann::json result = rpc("tools/call", {{"name", "get_page_info"}, {"arguments", nlohmann::json::object()}})["result"];

    EXPECT_FALSE(result.value("isError", false));
    ASSERT_EQ(result["content"].size(), 1u);
    EXPECT_EQ(result["content"][0]["type"], "text");
    nlohmann::json text = nlohmann::json::parse(result["content"][0]["text"].get<std::string>());
    EXPECT_EQ(text["title"], "Example");
    EXPECT_FALSE(text.contains("success"));
}

TEST_F(McpServerTest, ToolCallWithoutClientsIsErrorContent) {
    transport.set_clients(0);

    nlohmann::json result = rpc("tools/call", {{"name", "click_element"}, {"arguments", {{"selector", "#a"}}}})["result"];

    EXPECT_EQ(result["isError"], true);
    EXPECT_EQ(result["content"][0]["text"], "Error: No extension clients connected");
}

TEST_F(McpServerTest, ToolCallTimeoutIsErrorContent) {
    nlohmann::json result = rpc("tools/call", {{"name", "get_page_info"}})["result"];

    EXPECT_EQ(result["isError"], true);
    EXPECT_NE(result["content"][0]["text"].get<std::string>().find("timeout"), std::string::npos);
}

TEST_F(McpServerTest, UnknownToolIsInvalidParams) {
    nlohmann::json response = rpc("tools/call", {{"name", "launch_rocket"}});

    EXPECT_EQ(response["error"]["code"], mcp::kInvalidParams);
}

TEST_F(McpServerTest, RequestsAreMirroredToMonitoringStream) {
    auto subscriber = sse.subscribe();
    rpc("tools/list");

    std::string message;
    ASSERT_EQ(subscriber->next(message, std::chrono::milliseconds(100)), SseSubscriber::Poll::Message);
    nlohmann::json event = nlohmann::json::parse(message);
    EXPECT_EQ(event["type"], "request");
    EXPECT_EQ(event["method"], "tools/list");
    EXPECT_EQ(event["id"], 7);
}

TEST_F(McpServerTest, HttpEndpointsServeHealthAndPreflight) {
    mcp::ServerConfig config;
    config.host = "127.0.0.1";
    config.port = 0;
    mcp::HttpServer server(config, handler, dispatcher, sse);
    ASSERT_TRUE(server.start());
    ASSERT_GT(server.port(), 0);

    httplib::Client client("127.0.0.1", server.port());
    auto health = client.Get("/mcp/v1/health");
    ASSERT_TRUE(health);
    EXPECT_EQ(health->status, 200);
    nlohmann::json body = nlohmann::json::parse(health->body);
    EXPECT_EQ(body["status"], "healthy");
    EXPECT_EQ(body["available_tools"], 8);
    EXPECT_EQ(body["extension_clients"], 1);
    EXPECT_EQ(body["port"], server.port());
    EXPECT_EQ(health->get_header_value("Access-Control-Allow-Origin"), "*");

    auto preflight = client.Options("/mcp/v1/message");
    ASSERT_TRUE(preflight);
    EXPECT_EQ(preflight->status, 204);

    auto notification = client.Post("/mcp/v1/message", R"({"jsonrpc":"2.0","method":"notifications/initialized"})",
                                    "application/json");
    ASSERT_TRUE(notification);
    EXPECT_EQ(notification->status, 204);

    server.stop();
}

TEST_F(McpServerTest, MonitoringStreamFraming) {
    mcp::ServerConfig config;
    config.host = "127.0.0.1";
    config.port = 0;
    config.keepalive = std::chrono::milliseconds(50);
    mcp::HttpServer server(config, handler, dispatcher, sse);
    ASSERT_TRUE(server.start());

    std::string received;
    std::thread reader([&received, port = server.port()] {
        httplib::Client client("127.0.0.1", port);
        client.set_read_timeout(5, 0);
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        client.Get("/mcp/v1/sse", [&received, deadline](const char* data, size_t length) {
            received.append(data, length);
            return received.find("\"tools/list\"") == std::string::npos &&
                std::chrono::steady_clock::now() < deadline;
        });
    });

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (sse.subscriber_count() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ASSERT_EQ(sse.subscriber_count(), 1u);
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    rpc("tools/list");

    reader.join();
    server.stop();

    const std::string connected = "event: connected\n";
    const auto first = received.find(connected);
    ASSERT_EQ(first, 0u);
    EXPECT_EQ(received.find(connected, first + 1), std::string::npos);
    EXPECT_NE(received.find(":keepalive\n\n"), std::string::npos);

    const auto any_request = received.find("\"tools/list\"");
    ASSERT_NE(any_request, std::string::npos);
    const auto line_start = received.rfind("\ndata: ", any_request);
    ASSERT_NE(line_start, std::string::npos);
    const auto line_end = received.find("\n\n", any_request);
    ASSERT_NE(line_end, std::string::npos);
    nlohmann::json event = nlohmann::json::parse(received.substr(line_start + 7, line_end - line_start - 7));
    EXPECT_EQ(event["method"], "tools/list");
    EXPECT_EQ(event["type"], "request");
}

TEST_F(McpServerTest, MonitoringStreamsAreCapped) {
    mcp::ServerConfig config;
    config.host = "127.0.0.1";
    config.port = 0;
    config.max_sse_streams = 0;
    mcp::HttpServer server(config, handler, dispatcher, sse);
    ASSERT_TRUE(server.start());

    httplib::Client client("127.0.0.1", server.port());
    auto stream = client.Get("/mcp/v1/sse");
    ASSERT_TRUE(stream);
    EXPECT_EQ(stream->status, 503);
    EXPECT_EQ(sse.subscriber_count(), 0u);

    auto health = client.Get("/mcp/v1/health");
    ASSERT_TRUE(health);
    EXPECT_EQ(health->status, 200);

    server.stop();
}
