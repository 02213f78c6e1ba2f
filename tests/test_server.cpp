#include <catch2/catch.hpp>
#include <fsgate/fsgate.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <chrono>
#include <vector>

namespace fs = std::filesystem;
using namespace fsgate;

static fs::path make_temp_dir() {
    auto tmp = fs::temp_directory_path() /
               ("fsgate_stest_" + std::to_string(
                    std::hash<std::thread::id>{}(std::this_thread::get_id())
                    ^ static_cast<size_t>(
                          std::chrono::steady_clock::now()
                              .time_since_epoch()
                              .count())));
    fs::create_directories(tmp);
    return fs::canonical(tmp);
}

/// Server wired to a vector of outgoing messages.
struct Harness {
    Sandbox           box;
    McpServer         server{box};
    std::vector<json> sent;

    Harness() {
        server.set_sink([this](const json& m) { sent.push_back(m); });
    }

    json request(const std::string& method, json params, int id = 1) {
        sent.clear();
        server.handle_line(json{{"jsonrpc", "2.0"}, {"id", id},
                                {"method", method}, {"params", params}}.dump());
        REQUIRE(sent.size() == 1);
        return sent[0];
    }

    void notify(const std::string& method) {
        sent.clear();
        server.handle_line(json{{"jsonrpc", "2.0"}, {"method", method}}.dump());
    }
};

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

TEST_CASE("server: initialize echoes the protocol version", "[server]") {
    Harness h;
    json r = h.request("initialize", {{"protocolVersion", "2025-03-26"},
                                      {"capabilities", json::object()}});
    CHECK(r.at("id") == 1);
    CHECK(r.at("result").at("protocolVersion") == "2025-03-26");
    CHECK(r.at("result").at("capabilities").contains("tools"));
    CHECK(r.at("result").at("serverInfo").at("name") == "fsgate");
    CHECK_FALSE(r.at("result").at("serverInfo").at("version").get<std::string>().empty());
    CHECK_FALSE(h.server.client_supports_roots());
}

TEST_CASE("server: ping and tools/list", "[server]") {
    Harness h;
    CHECK(h.request("ping", json::object()).at("result") == json::object());

    json tools = h.request("tools/list", json::object(), 2).at("result").at("tools");
    CHECK(tools.size() == 14);
    CHECK(tools[0].at("name") == "read_text_file");
}

TEST_CASE("server: tools/call wraps the tool result", "[server]") {
    auto dir = make_temp_dir();
    std::ofstream(dir / "a.txt") << "content";
    Harness h;
    h.box.replace_roots({dir.string()});

    json ok = h.request("tools/call", {{"name", "read_text_file"},
                                       {"arguments", {{"path", (dir / "a.txt").string()}}}});
    CHECK(ok.at("result").at("isError") == false);
    CHECK(ok.at("result").at("content")[0].at("text") == "content");

    json bad = h.request("tools/call", {{"name", "read_text_file"},
                                        {"arguments", {{"path", "/etc/passwd"}}}});
    CHECK(bad.at("result").at("isError") == true);
    CHECK_FALSE(bad.contains("error"));
    fs::remove_all(dir);
}

// ---------------------------------------------------------------------------
// Protocol errors
// ---------------------------------------------------------------------------

TEST_CASE("server: protocol errors", "[server]") {
    Harness h;

    SECTION("parse error") {
        h.server.handle_line("{not json");
        REQUIRE(h.sent.size() == 1);
        CHECK(h.sent[0].at("error").at("code") == rpc_error::PARSE_ERROR);
        CHECK(h.sent[0].at("id").is_null());
    }
    SECTION("unknown method") {
        json r = h.request("resources/list", json::object(), 7);
        CHECK(r.at("id") == 7);
        CHECK(r.at("error").at("code") == rpc_error::METHOD_NOT_FOUND);
    }
    SECTION("unknown tool") {
        json r = h.request("tools/call", {{"name", "rm_rf"}, {"arguments", json::object()}});
        CHECK(r.at("error").at("code") == rpc_error::INVALID_PARAMS);
    }
    SECTION("missing tool name") {
        json r = h.request("tools/call", json::object());
        CHECK(r.at("error").at("code") == rpc_error::INVALID_PARAMS);
    }
    SECTION("not an object") {
        h.server.handle_line("[1, 2]");
        REQUIRE(h.sent.size() == 1);
        CHECK(h.sent[0].at("error").at("code") == rpc_error::INVALID_REQUEST);
    }
    SECTION("wrong jsonrpc version") {
        h.server.handle_line(R"({"jsonrpc": "1.0", "id": 3, "method": "ping"})");
        REQUIRE(h.sent.size() == 1);
        CHECK(h.sent[0].at("error").at("code") == rpc_error::INVALID_REQUEST);
    }
    SECTION("notifications get no reply") {
        h.notify("notifications/cancelled");
        h.notify("notifications/initialized");
        CHECK(h.sent.empty());
    }
}

TEST_CASE("server: run reads lines until EOF", "[server]") {
    Sandbox box;
    McpServer server(box, McpServer::Options{"test-server", "9.9.9"});
    std::istringstream in(
        R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})" "\n"
        "\n"
        R"({"jsonrpc":"2.0","id":2,"method":"ping"})" "\n");
    std::ostringstream out;
    server.run(in, out);

    std::istringstream lines(out.str());
    std::string first, second, extra;
    REQUIRE(std::getline(lines, first));
    REQUIRE(std::getline(lines, second));
    CHECK_FALSE(std::getline(lines, extra));

    json init = json::parse(first);
    CHECK(init.at("result").at("serverInfo").at("version") == "9.9.9");
    CHECK(init.at("result").at("serverInfo").at("name") == "test-server");
    CHECK(json::parse(second).at("id") == 2);
}

// ---------------------------------------------------------------------------
// Client roots
// ---------------------------------------------------------------------------

TEST_CASE("server: client roots replace the allowed directories", "[server]") {
    auto dir = make_temp_dir();
    fs::create_directories(dir / "cli");
    fs::create_directories(dir / "client");
    Harness h;
    h.box.replace_roots({(dir / "cli").string()});

    h.request("initialize", {{"capabilities", {{"roots", {{"listChanged", true}}}}}});
    CHECK(h.server.client_supports_roots());

    h.notify("notifications/initialized");
    REQUIRE(h.sent.size() == 1);
    CHECK(h.sent[0].at("method") == "roots/list");
    CHECK(h.sent[0].at("id") == "roots-1");

    h.sent.clear();
    h.server.handle_line(json{
        {"jsonrpc", "2.0"},
        {"id", "roots-1"},
        {"result", {{"roots", {{{"uri", "file://" + (dir / "client").string()},
                                {"name", "client"}}}}}},
    }.dump());
    CHECK(h.sent.empty());
    CHECK(h.box.roots() == std::vector<std::string>{(dir / "client").string()});

    h.notify("notifications/roots/list_changed");
    REQUIRE(h.sent.size() == 1);
    CHECK(h.sent[0].at("id") == "roots-2");
    fs::remove_all(dir);
}

TEST_CASE("server: invalid client roots keep the current ones", "[server]") {
    auto dir = make_temp_dir();
    Harness h;
    h.box.replace_roots({dir.string()});
    h.request("initialize", {{"capabilities", {{"roots", json::object()}}}});

    SECTION("root that does not exist") {
        h.notify("notifications/initialized");
        h.server.handle_line(json{
            {"jsonrpc", "2.0"},
            {"id", "roots-1"},
            {"result", {{"roots", {{{"uri", "file://" + (dir / "gone").string()}}}}}},
        }.dump());
    }
    SECTION("empty roots list") {
        h.notify("notifications/initialized");
        h.server.handle_line(R"({"jsonrpc":"2.0","id":"roots-1","result":{"roots":[]}})");
    }
    SECTION("error response") {
        h.notify("notifications/initialized");
        h.server.handle_line(
            R"({"jsonrpc":"2.0","id":"roots-1","error":{"code":-32601,"message":"no"}})");
    }
    SECTION("response to an unknown request") {
        h.server.handle_line(R"({"jsonrpc":"2.0","id":"roots-99","result":{"roots":[]}})");
    }

    CHECK(h.box.roots() == std::vector<std::string>{dir.string()});
    fs::remove_all(dir);
}
