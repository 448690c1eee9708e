#include <catch2/catch_test_macros.hpp>

#include <azmcp/mcp/mcp_server.hpp>
#include <azmcp/mcp/tool_handlers.hpp>

#include "../mocks/mock_http_client.hpp"

#include <sstream>
#include <string>
#include <vector>

using namespace azmcp;
using namespace azmcp::testing;

namespace {

std::string Framed(const nlohmann::json& msg) {
    return EncodeFrame(msg.dump());
}

std::vector<nlohmann::json> ParseFrames(const std::string& wire) {
    FrameBuffer buffer;
    buffer.Append(wire);
    std::vector<nlohmann::json> out;
    while (auto frame = buffer.Next()) {
        out.push_back(nlohmann::json::parse(frame->body));
    }
    REQUIRE(buffer.Size() == 0);
    REQUIRE(buffer.DiscardedHeaders() == 0);
    return out;
}

nlohmann::json ToolCall(int id, const std::string& name, const nlohmann::json& args) {
    return {{"jsonrpc", "2.0"},
            {"id", id},
            {"method", "tools/call"},
            {"params", {{"name", name}, {"arguments", args}}}};
}

// Pricing service wired to a mock upstream; sleeps are skipped.
struct PricingFixture {
    MockHttpClient http;
    RetryingFetcher fetcher{http, RetryPolicy{}, [](std::chrono::milliseconds) {}};
    PriceCatalog catalog{fetcher, "/api/retail/prices"};

    Dispatcher MakeDispatcher() {
        ToolRegistry registry;
        RegisterPricingTools(registry, catalog, PricingDefaults{});
        return Dispatcher(std::move(registry),
                          ServerIdentity{ServiceName(ServiceKind::Pricing), "0.1.0"});
    }
};

Dispatcher MakePingOnlyDispatcher() {
    return Dispatcher(ToolRegistry{}, ServerIdentity{"test-mcp", "0.0.1"});
}

} // anonymous namespace

// ===========================================================================
// Framed I/O
// ===========================================================================

TEST_CASE("McpServer: answers framed requests in order", "[mcp][server]") {
    std::istringstream in(
        Framed({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"}}) +
        Framed({{"jsonrpc", "2.0"}, {"id", 2}, {"method", "ping"}}) +
        Framed({{"jsonrpc", "2.0"}, {"id", 3}, {"method", "tools/list"}}));
    std::ostringstream out;
    McpServer server(MakePingOnlyDispatcher(), in, out);

    auto stats = server.Run();

    auto responses = ParseFrames(out.str());
    REQUIRE(responses.size() == 3);
    CHECK(responses[0]["id"] == 1);
    CHECK(responses[0]["result"]["serverInfo"]["name"] == "test-mcp");
    CHECK(responses[1]["id"] == 2);
    CHECK(responses[1]["result"]["status"] == "ok");
    CHECK(responses[2]["id"] == 3);
    CHECK(responses[2]["result"]["tools"].empty());

    CHECK(stats.frames_decoded == 3);
    CHECK(stats.responses_written == 3);
    CHECK(stats.frames_dropped == 0);
}

TEST_CASE("McpServer: notification produces no output bytes", "[mcp][server]") {
    std::istringstream in(Framed(
        {{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}));
    std::ostringstream out;
    McpServer server(MakePingOnlyDispatcher(), in, out);

    auto stats = server.Run();

    CHECK(out.str().empty());
    CHECK(stats.frames_decoded == 1);
    CHECK(stats.responses_written == 0);
}

TEST_CASE("McpServer: invalid JSON body is dropped, next frame served",
          "[mcp][server]") {
    std::istringstream in(EncodeFrame("{not json") +
                          Framed({{"jsonrpc", "2.0"}, {"id", 5}, {"method", "ping"}}));
    std::ostringstream out;
    McpServer server(MakePingOnlyDispatcher(), in, out);

    auto stats = server.Run();

    auto responses = ParseFrames(out.str());
    REQUIRE(responses.size() == 1);
    CHECK(responses[0]["id"] == 5);
    CHECK(stats.frames_dropped == 1);
}

TEST_CASE("McpServer: malformed header is skipped", "[mcp][server]") {
    std::istringstream in(std::string("Content-Length: x\r\n\r\n") +
                          Framed({{"jsonrpc", "2.0"}, {"id", 6}, {"method", "ping"}}));
    std::ostringstream out;
    McpServer server(MakePingOnlyDispatcher(), in, out);

    auto stats = server.Run();

    auto responses = ParseFrames(out.str());
    REQUIRE(responses.size() == 1);
    CHECK(responses[0]["id"] == 6);
    CHECK(stats.malformed_headers == 1);
}

TEST_CASE("McpServer: truncated trailing frame ends cleanly at EOF",
          "[mcp][server]") {
    std::istringstream in(
        Framed({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "ping"}}) +
        "Content-Length: 50\r\n\r\n{\"jsonrpc\"");
    std::ostringstream out;
    McpServer server(MakePingOnlyDispatcher(), in, out);

    auto stats = server.Run();

    CHECK(ParseFrames(out.str()).size() == 1);
    CHECK(stats.frames_decoded == 1);
}

TEST_CASE("McpServer: empty input exits immediately", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakePingOnlyDispatcher(), in, out);

    auto stats = server.Run();
    CHECK(out.str().empty());
    CHECK(stats.frames_decoded == 0);
}

TEST_CASE("McpServer: oversized frame gets an error and alignment holds",
          "[mcp][server]") {
    // The padding embeds a complete frame; it must not be served.
    const auto hidden = EncodeFrame(R"({"jsonrpc":"2.0","id":99,"method":"ping"})");
    const auto big = Framed({{"jsonrpc", "2.0"},
                            {"id", 1},
                            {"method", "ping"},
                            {"params", {{"pad", hidden + std::string(200, 'x')}}}});
    const auto small = Framed({{"jsonrpc", "2.0"}, {"id", 2}, {"method", "ping"}});
    std::istringstream in(big + small);
    std::ostringstream out;
    McpServer server(MakePingOnlyDispatcher(), in, out, 100);

    auto stats = server.Run();

    auto responses = ParseFrames(out.str());
    REQUIRE(responses.size() == 2);
    CHECK(responses[0]["id"].is_null());
    CHECK(responses[0]["error"]["code"] == -32603);
    CHECK(responses[0]["error"]["message"].get<std::string>().find("100 byte limit") !=
          std::string::npos);
    CHECK(responses[1]["id"] == 2);
    CHECK(stats.oversized_frames == 1);
    CHECK(stats.malformed_headers == 0);
    CHECK(stats.frames_decoded == 1);
    CHECK(stats.responses_written == 2);
}

// ===========================================================================
// Pricing scenario
// ===========================================================================

TEST_CASE("McpServer: pricing session end to end", "[mcp][server][pricing]") {
    PricingFixture fx;
    fx.http.EnqueueResponse(200, PriceItemsBody(10));      // price_search
    fx.http.EnqueueResponse(200, R"({"Items":[]})");       // cost_estimate

    std::istringstream in(
        Framed({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"}}) +
        Framed({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}) +
        Framed(ToolCall(2, "price_search", {{"sku", "Standard_D2s_v3"}})) +
        Framed(ToolCall(3, "cost_estimate", {{"sku", "Nonexistent"}, {"quantity", 2}})) +
        Framed(ToolCall(4, "nope", nlohmann::json::object())));
    std::ostringstream out;
    McpServer server(fx.MakeDispatcher(), in, out);

    auto stats = server.Run();

    auto responses = ParseFrames(out.str());
    REQUIRE(responses.size() == 4);

    CHECK(responses[0]["result"]["serverInfo"]["name"] == "azure-pricing-mcp");

    const auto& search = responses[1]["result"];
    CHECK(responses[1]["id"] == 2);
    CHECK(search["status"] == "ok");
    CHECK(search["tool"] == "price_search");
    CHECK(search["count"] == 10);
    CHECK(search["items"].size() <= 5);

    CHECK(responses[2]["id"] == 3);
    CHECK(responses[2]["result"] == nlohmann::json({{"status", "not-found"},
                                                    {"tool", "cost_estimate"},
                                                    {"sku", "Nonexistent"}}));

    CHECK(responses[3]["id"] == 4);
    CHECK(responses[3]["error"]["code"] == -32601);
    CHECK(responses[3]["error"]["message"] == "Unknown tool: nope");

    CHECK(fx.http.GetCallCount() == 2);
    CHECK(stats.frames_decoded == 5);
    CHECK(stats.responses_written == 4);
}

TEST_CASE("McpServer: upstream exhaustion is a server error, loop continues",
          "[mcp][server][pricing]") {
    PricingFixture fx;
    fx.http.SetStickyResponse(ConnectionRefused("/api/retail/prices"));

    std::istringstream in(
        Framed(ToolCall(1, "price_search", {{"sku", "B2s"}})) +
        Framed({{"jsonrpc", "2.0"}, {"id", 2}, {"method", "ping"}}));
    std::ostringstream out;
    McpServer server(fx.MakeDispatcher(), in, out);

    server.Run();

    auto responses = ParseFrames(out.str());
    REQUIRE(responses.size() == 2);
    CHECK(responses[0]["error"]["code"] == -32000);
    CHECK(responses[0]["error"]["message"].get<std::string>().rfind("Server error: ", 0) == 0);
    CHECK(responses[1]["result"]["status"] == "ok");
    CHECK(fx.http.GetCallCount() == 3);
}

TEST_CASE("McpServer: rejected sku is a server error, missing sku is -32602",
          "[mcp][server][pricing]") {
    PricingFixture fx;

    std::istringstream in(
        Framed(ToolCall(1, "price_search", {{"sku", "   "}})) +
        Framed(ToolCall(2, "price_search", nlohmann::json::object())) +
        Framed(ToolCall(3, "cost_estimate", {{"sku", "B2s"}, {"quantity", "two"}})));
    std::ostringstream out;
    McpServer server(fx.MakeDispatcher(), in, out);

    server.Run();

    auto responses = ParseFrames(out.str());
    REQUIRE(responses.size() == 3);
    CHECK(responses[0]["error"]["code"] == -32000);
    CHECK(responses[0]["error"]["message"] == "Server error: sku must be a non-empty string");
    CHECK(responses[1]["error"]["code"] == -32602);
    CHECK(responses[1]["error"]["message"] == "Missing required argument: sku");
    CHECK(responses[2]["error"]["code"] == -32602);
    CHECK(responses[2]["error"]["message"] == "quantity must be an integer");
    CHECK(fx.http.GetCallCount() == 0);
}
