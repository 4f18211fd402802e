#include <catch2/catch_test_macros.hpp>

#include <memory_mcp/core/version.hpp>
#include <memory_mcp/mcp/mcp_server.hpp>
#include <memory_mcp/mcp/memory_tools.hpp>
#include <memory_mcp/memory/memory_store.hpp>

#include "../mocks/mock_memory_store.hpp"

#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

using namespace memory_mcp;
using namespace memory_mcp::testing;

namespace {

ToolRegistry MakeRegistry(IMemoryStore& store) {
    ToolRegistry registry;
    RegisterMemoryTools(registry, store);
    return registry;
}

nlohmann::json Request(int id, const std::string& method,
                       nlohmann::json params = nlohmann::json::object()) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
}

nlohmann::json CallTool(int id, const std::string& name, nlohmann::json arguments) {
    return Request(id, "tools/call", {{"name", name}, {"arguments", arguments}});
}

std::vector<nlohmann::json> ParseLines(const std::string& output) {
    std::vector<nlohmann::json> lines;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty()) {
            lines.push_back(nlohmann::json::parse(line));
        }
    }
    return lines;
}

// Server wired to a mock store with in-memory streams.
struct ServerFixture {
    MockMemoryStore store;
    std::istringstream in;
    std::ostringstream out;
    McpServer server{MakeRegistry(store), in, out};
};

} // anonymous namespace

// ===========================================================================
// initialize
// ===========================================================================

TEST_CASE("McpServer: initialize returns capabilities", "[mcp][server]") {
    ServerFixture f;
    CHECK(f.server.State() == ServerState::Uninitialized);

    auto response = f.server.HandleMessage(Request(1, "initialize", {
        {"protocolVersion", "2024-11-05"},
        {"capabilities", nlohmann::json::object()},
        {"clientInfo", {{"name", "test-client"}, {"version", "1.0"}}}
    }));
    REQUIRE(response.has_value());

    auto& r = *response;
    CHECK(r["jsonrpc"] == "2.0");
    CHECK(r["id"] == 1);
    CHECK(r["result"]["protocolVersion"] == "2024-11-05");
    CHECK(r["result"]["serverInfo"]["name"] == "memory-mcp");
    CHECK(r["result"]["serverInfo"]["version"] == kVersion);
    CHECK(r["result"]["capabilities"] == nlohmann::json({{"tools", nlohmann::json::object()}}));
    CHECK(f.server.State() == ServerState::Ready);
}

TEST_CASE("McpServer: protocol version negotiation", "[mcp][server]") {
    ServerFixture f;

    SECTION("supported versions are echoed") {
        for (const char* version : kSupportedProtocolVersions) {
            auto r = f.server.HandleMessage(
                Request(1, "initialize", {{"protocolVersion", version}}));
            REQUIRE(r.has_value());
            CHECK((*r)["result"]["protocolVersion"] == version);
        }
    }

    SECTION("unknown version gets the newest") {
        auto r = f.server.HandleMessage(
            Request(1, "initialize", {{"protocolVersion", "1999-01-01"}}));
        REQUIRE(r.has_value());
        CHECK((*r)["result"]["protocolVersion"] == "2025-06-18");
    }

    SECTION("missing version gets the newest") {
        auto r = f.server.HandleMessage(Request(1, "initialize"));
        REQUIRE(r.has_value());
        CHECK((*r)["result"]["protocolVersion"] == "2025-06-18");
    }
}

TEST_CASE("McpServer: initialize tolerates odd clientInfo fields", "[mcp][server]") {
    ServerFixture f;

    SECTION("numeric name") {
        auto r = f.server.HandleMessage(
            Request(1, "initialize", {{"clientInfo", {{"name", 42}}}}));
        REQUIRE(r.has_value());
        CHECK((*r)["result"]["serverInfo"]["name"] == "memory-mcp");
    }

    SECTION("non-string version") {
        auto r = f.server.HandleMessage(Request(1, "initialize", {
            {"clientInfo", {{"name", "client"}, {"version", {{"major", 1}}}}}}));
        REQUIRE(r.has_value());
        CHECK(r->contains("result"));
    }

    CHECK(f.server.State() == ServerState::Ready);
}

TEST_CASE("McpServer: Run keeps serving after an odd handshake", "[mcp][server]") {
    MockMemoryStore store;
    std::istringstream in(
        "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"initialize\","
        "\"params\":{\"clientInfo\":{\"name\":42}}}\n"
        "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"tools/list\"}\n");
    std::ostringstream out;
    McpServer server(MakeRegistry(store), in, out);

    server.Run();

    auto lines = ParseLines(out.str());
    REQUIRE(lines.size() == 2);
    CHECK(lines[0]["id"] == 1);
    CHECK(lines[0]["result"]["serverInfo"]["name"] == "memory-mcp");
    CHECK(lines[1]["id"] == 2);
    CHECK(lines[1]["result"]["tools"].size() == 2);
}

TEST_CASE("McpServer: repeated initialize is answered", "[mcp][server]") {
    ServerFixture f;
    REQUIRE(f.server.HandleMessage(Request(1, "initialize")).has_value());
    auto second = f.server.HandleMessage(Request(2, "initialize"));
    REQUIRE(second.has_value());
    CHECK((*second)["id"] == 2);
    CHECK(second->contains("result"));
    CHECK(f.server.State() == ServerState::Ready);
}

// ===========================================================================
// Notifications and ping
// ===========================================================================

TEST_CASE("McpServer: notifications get no response", "[mcp][server]") {
    ServerFixture f;

    nlohmann::json initialized = {
        {"jsonrpc", "2.0"},
        {"method", "notifications/initialized"}
    };
    CHECK_FALSE(f.server.HandleMessage(initialized).has_value());

    nlohmann::json unknown = {
        {"jsonrpc", "2.0"},
        {"method", "notifications/something_else"}
    };
    CHECK_FALSE(f.server.HandleMessage(unknown).has_value());
}

TEST_CASE("McpServer: ping returns empty result", "[mcp][server]") {
    ServerFixture f;
    auto r = f.server.HandleMessage(Request(7, "ping"));
    REQUIRE(r.has_value());
    CHECK((*r)["id"] == 7);
    CHECK((*r)["result"] == nlohmann::json::object());
}

// ===========================================================================
// tools/list
// ===========================================================================

TEST_CASE("McpServer: tools/list advertises both memory tools", "[mcp][server]") {
    ServerFixture f;
    auto r = f.server.HandleMessage(Request(2, "tools/list"));
    REQUIRE(r.has_value());

    auto& tools = (*r)["result"]["tools"];
    REQUIRE(tools.size() == 2);
    CHECK(tools[0]["name"] == "add_memory");
    CHECK(tools[1]["name"] == "get_memories");
    for (const auto& tool : tools) {
        CHECK(tool["description"].is_string());
        CHECK_FALSE(tool["description"].get<std::string>().empty());
        CHECK(tool["inputSchema"]["type"] == "object");
    }
    CHECK(tools[0]["inputSchema"]["required"] == nlohmann::json::array({"content"}));
}

TEST_CASE("McpServer: tools/list works before initialize", "[mcp][server]") {
    ServerFixture f;
    auto r = f.server.HandleMessage(Request(1, "tools/list"));
    REQUIRE(r.has_value());
    CHECK((*r)["result"]["tools"].size() == 2);
    CHECK(f.server.State() == ServerState::Uninitialized);
}

// ===========================================================================
// tools/call
// ===========================================================================

TEST_CASE("McpServer: add_memory success", "[mcp][server]") {
    ServerFixture f;
    auto r = f.server.HandleMessage(CallTool(3, "add_memory", {{"content", "likes tea"}}));
    REQUIRE(r.has_value());
    CHECK_FALSE(r->contains("error"));
    auto& content = (*r)["result"]["content"];
    REQUIRE(content.size() == 1);
    CHECK(content[0]["type"] == "text");
    CHECK(content[0]["text"] == "Memory saved successfully.");
    REQUIRE(f.store.Entries().size() == 1);
    CHECK(f.store.Entries()[0] == "likes tea");
}

TEST_CASE("McpServer: add_memory without content", "[mcp][server]") {
    ServerFixture f;
    auto r = f.server.HandleMessage(CallTool(4, "add_memory", nlohmann::json::object()));
    REQUIRE(r.has_value());
    CHECK((*r)["id"] == 4);
    CHECK((*r)["error"]["code"] == kInvalidParams);
    CHECK((*r)["error"]["data"]["kind"] == "invalid_arguments");
    CHECK(f.store.AppendCallCount() == 0);
}

TEST_CASE("McpServer: missing arguments means empty arguments", "[mcp][server]") {
    ServerFixture f;

    nlohmann::json get = Request(5, "tools/call", {{"name", "get_memories"}});
    auto r = f.server.HandleMessage(get);
    REQUIRE(r.has_value());
    CHECK((*r)["result"]["content"][0]["text"] == "No memories found yet.");

    nlohmann::json add = Request(6, "tools/call",
                                 {{"name", "add_memory"}, {"arguments", nullptr}});
    auto added = f.server.HandleMessage(add);
    REQUIRE(added.has_value());
    CHECK((*added)["error"]["data"]["kind"] == "invalid_arguments");
}

TEST_CASE("McpServer: non-object arguments", "[mcp][server]") {
    ServerFixture f;
    auto r = f.server.HandleMessage(CallTool(8, "add_memory", "just a string"));
    REQUIRE(r.has_value());
    CHECK((*r)["error"]["code"] == kInvalidParams);
    CHECK((*r)["error"]["data"]["kind"] == "invalid_arguments");
    CHECK(f.store.AppendCallCount() == 0);
}

TEST_CASE("McpServer: unknown tool wins over non-object arguments", "[mcp][server]") {
    ServerFixture f;
    auto r = f.server.HandleMessage(CallTool(16, "nonexistent_tool", 5));
    REQUIRE(r.has_value());
    CHECK((*r)["error"]["code"] == kInvalidParams);
    CHECK((*r)["error"]["data"]["kind"] == "unknown_tool");
}

TEST_CASE("McpServer: get_memories ignores non-object arguments", "[mcp][server]") {
    ServerFixture f;
    auto r = f.server.HandleMessage(
        CallTool(17, "get_memories", nlohmann::json::array({"unused"})));
    REQUIRE(r.has_value());
    CHECK_FALSE(r->contains("error"));
    CHECK((*r)["result"]["content"][0]["text"] == "No memories found yet.");
}

TEST_CASE("McpServer: unknown tool", "[mcp][server]") {
    ServerFixture f;
    auto r = f.server.HandleMessage(
        CallTool(9, "nonexistent_tool", nlohmann::json::object()));
    REQUIRE(r.has_value());
    CHECK((*r)["error"]["code"] == kInvalidParams);
    CHECK((*r)["error"]["data"]["kind"] == "unknown_tool");
    CHECK((*r)["error"]["message"].get<std::string>().find("nonexistent_tool") !=
          std::string::npos);
    CHECK(f.store.AppendCallCount() == 0);
    CHECK(f.store.ReadCallCount() == 0);
}

TEST_CASE("McpServer: tools/call without name", "[mcp][server]") {
    ServerFixture f;
    auto r = f.server.HandleMessage(Request(10, "tools/call", {{"arguments", nlohmann::json::object()}}));
    REQUIRE(r.has_value());
    CHECK((*r)["error"]["code"] == kInvalidParams);
    CHECK_FALSE((*r)["error"].contains("data"));
}

TEST_CASE("McpServer: store failure is an internal error", "[mcp][server]") {
    ServerFixture f;
    f.store.EnqueueAppendError(DiskFullError("AppendMemory"));

    auto r = f.server.HandleMessage(CallTool(11, "add_memory", {{"content", "x"}}));
    REQUIRE(r.has_value());
    CHECK((*r)["error"]["code"] == kInternalError);
    CHECK((*r)["error"]["data"]["kind"] == "internal_failure");
    CHECK((*r)["error"]["message"].get<std::string>().find("No space left") !=
          std::string::npos);
}

TEST_CASE("McpServer: ErrorCodeFor", "[mcp][server]") {
    CHECK(McpServer::ErrorCodeFor(ErrorCategory::UnknownTool) == -32602);
    CHECK(McpServer::ErrorCodeFor(ErrorCategory::InvalidArguments) == -32602);
    CHECK(McpServer::ErrorCodeFor(ErrorCategory::InternalFailure) == -32603);
    CHECK(McpServer::ErrorCodeFor(ErrorCategory::IoFailure) == -32603);
}

// ===========================================================================
// Malformed requests
// ===========================================================================

TEST_CASE("McpServer: unknown method", "[mcp][server]") {
    ServerFixture f;
    auto r = f.server.HandleMessage(Request(12, "resources/list"));
    REQUIRE(r.has_value());
    CHECK((*r)["error"]["code"] == kMethodNotFound);
    CHECK((*r)["error"]["message"] == "Method not found: resources/list");
}

TEST_CASE("McpServer: invalid jsonrpc version", "[mcp][server]") {
    ServerFixture f;

    nlohmann::json with_id = {{"jsonrpc", "1.0"}, {"id", 13}, {"method", "ping"}};
    auto r = f.server.HandleMessage(with_id);
    REQUIRE(r.has_value());
    CHECK((*r)["id"] == 13);
    CHECK((*r)["error"]["code"] == kInvalidRequest);

    nlohmann::json without_id = {{"method", "ping"}};
    CHECK_FALSE(f.server.HandleMessage(without_id).has_value());
}

TEST_CASE("McpServer: missing method", "[mcp][server]") {
    ServerFixture f;
    nlohmann::json msg = {{"jsonrpc", "2.0"}, {"id", 14}};
    auto r = f.server.HandleMessage(msg);
    REQUIRE(r.has_value());
    CHECK((*r)["error"]["code"] == kInvalidRequest);
}

TEST_CASE("McpServer: non-object message", "[mcp][server]") {
    ServerFixture f;
    auto r = f.server.HandleMessage(nlohmann::json::array({1, 2, 3}));
    REQUIRE(r.has_value());
    CHECK((*r)["id"].is_null());
    CHECK((*r)["error"]["code"] == kInvalidRequest);
}

TEST_CASE("McpServer: non-object params", "[mcp][server]") {
    ServerFixture f;
    nlohmann::json msg = {{"jsonrpc", "2.0"}, {"id", 15}, {"method", "tools/list"},
                          {"params", nlohmann::json::array()}};
    auto r = f.server.HandleMessage(msg);
    REQUIRE(r.has_value());
    CHECK((*r)["error"]["code"] == kInvalidParams);
}

// ===========================================================================
// Run loop
// ===========================================================================

TEST_CASE("McpServer: Run answers a parse error and keeps going", "[mcp][server]") {
    MockMemoryStore store;
    std::istringstream in(
        "{not json\n"
        "\n"
        "   \n"
        "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}\r\n");
    std::ostringstream out;
    McpServer server(MakeRegistry(store), in, out);

    server.Run();

    auto lines = ParseLines(out.str());
    REQUIRE(lines.size() == 2);
    CHECK(lines[0]["id"].is_null());
    CHECK(lines[0]["error"]["code"] == kParseError);
    CHECK(lines[1]["id"] == 1);
    CHECK(lines[1]["result"] == nlohmann::json::object());
}

TEST_CASE("McpServer: end-to-end session against a file store", "[mcp][server]") {
    namespace fs = std::filesystem;
    auto dir = fs::temp_directory_path() / "memory_mcp_test_e2e";
    fs::remove_all(dir);
    fs::create_directories(dir);
    MemoryStore store((dir / "memories.md").string());

    std::ostringstream script;
    script << Request(1, "initialize", {
                  {"protocolVersion", "2024-11-05"},
                  {"capabilities", nlohmann::json::object()},
                  {"clientInfo", {{"name", "e2e"}, {"version", "0.0.1"}}}}).dump() << "\n"
           << nlohmann::json({{"jsonrpc", "2.0"},
                              {"method", "notifications/initialized"}}).dump() << "\n"
           << Request(2, "tools/list").dump() << "\n"
           << CallTool(3, "add_memory", {{"content", "User likes coffee"}}).dump() << "\n"
           << CallTool(4, "get_memories", nlohmann::json::object()).dump() << "\n";

    std::istringstream in(script.str());
    std::ostringstream out;
    McpServer server(MakeRegistry(store), in, out);
    server.Run();

    auto lines = ParseLines(out.str());
    REQUIRE(lines.size() == 4);

    CHECK(lines[0]["id"] == 1);
    CHECK(lines[0]["result"]["serverInfo"]["name"] == "memory-mcp");

    CHECK(lines[1]["id"] == 2);
    CHECK(lines[1]["result"]["tools"].size() == 2);

    CHECK(lines[2]["id"] == 3);
    CHECK(lines[2]["result"]["content"][0]["text"] == "Memory saved successfully.");

    CHECK(lines[3]["id"] == 4);
    auto text = lines[3]["result"]["content"][0]["text"].get<std::string>();
    CHECK(text.find("User likes coffee") != std::string::npos);
    CHECK(text.rfind("## ", 0) == 0);

    CHECK(server.State() == ServerState::Ready);
    fs::remove_all(dir);
}
