#include "fsgate/server.h"
#include "fsgate/error.h"
#include "fsgate/log.h"

#include <istream>
#include <ostream>
#include <string>
#include <vector>

#ifndef FSGATE_VERSION
#define FSGATE_VERSION "0.1.0"
#endif

namespace fsgate {

namespace {

constexpr const char* kDefaultProtocolVersion = "2024-11-05";

std::string id_key(const json& id) {
    return id.is_string() ? id.get<std::string>() : id.dump();
}

bool is_blank_line(const std::string& line) {
    return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // anonymous namespace

McpServer::McpServer(Sandbox& sandbox)
    : McpServer(sandbox, Options{})
{}

McpServer::McpServer(Sandbox& sandbox, Options options)
    : sandbox_(sandbox)
    , dispatcher_(sandbox)
    , options_(std::move(options))
{
    if (options_.version.empty()) options_.version = FSGATE_VERSION;
}

void McpServer::set_sink(Sink sink) {
    sink_ = std::move(sink);
}

void McpServer::send(const json& message) {
    if (sink_) sink_(message);
}

// ---------------------------------------------------------------------------
// Message loop
// ---------------------------------------------------------------------------

void McpServer::run(std::istream& in, std::ostream& out) {
    set_sink([&out](const json& message) {
        // File contents need not be valid UTF-8.
        out << message.dump(-1, ' ', false, json::error_handler_t::replace) << '\n';
        out.flush();
    });

    logger().info(options_.name + " " + options_.version + " listening on stdio");
    std::string line;
    while (std::getline(in, line)) {
        if (is_blank_line(line)) continue;
        handle_line(line);
    }
    logger().info("input closed, shutting down");
}

void McpServer::handle_line(const std::string& line) {
    json message;
    try {
        message = json::parse(line);
    } catch (const json::parse_error& e) {
        logger().warn(std::string("unparseable message: ") + e.what());
        send(make_error(nullptr, rpc_error::PARSE_ERROR, std::string("Parse error: ") + e.what()));
        return;
    }
    json response = handle_message(message);
    if (!response.is_null()) send(response);
}

json McpServer::handle_message(const json& message) {
    if (!message.is_object()) {
        return make_error(nullptr, rpc_error::INVALID_REQUEST, "Message must be an object");
    }
    json id = message.contains("id") ? message["id"] : json();

    if (!message.contains("method")) {
        if (!id.is_null() && (message.contains("result") || message.contains("error"))) {
            handle_response(message);
            return json();
        }
        return make_error(id, rpc_error::INVALID_REQUEST, "Missing method");
    }

    if (!message.contains("jsonrpc") || message["jsonrpc"] != "2.0") {
        return make_error(id, rpc_error::INVALID_REQUEST, "Missing or invalid jsonrpc version");
    }
    if (!message["method"].is_string()) {
        return make_error(id, rpc_error::INVALID_REQUEST, "Method must be a string");
    }

    std::string method = message["method"];
    json params = message.contains("params") ? message["params"] : json::object();
    bool notification = !message.contains("id");
    logger().debug("received " + method);

    if (method == "notifications/initialized") {
        if (client_roots_) request_roots();
        return json();
    }
    if (method == "notifications/roots/list_changed") {
        if (client_roots_) request_roots();
        return json();
    }
    if (notification) {
        // Notifications never get a response, known or not.
        return json();
    }

    if (method == "initialize") return handle_initialize(params, id);
    if (method == "ping") return make_result(id, json::object());
    if (method == "tools/list") {
        return make_result(id, {{"tools", dispatcher_.list_tools()}});
    }
    if (method == "tools/call") return handle_tools_call(params, id);

    return make_error(id, rpc_error::METHOD_NOT_FOUND, "Unknown method: " + method);
}

// ---------------------------------------------------------------------------
// Methods
// ---------------------------------------------------------------------------

json McpServer::handle_initialize(const json& params, const json& id) {
    std::string version = kDefaultProtocolVersion;
    if (params.is_object()) {
        if (params.contains("protocolVersion") && params["protocolVersion"].is_string()) {
            version = params["protocolVersion"].get<std::string>();
        }
        client_roots_ = params.contains("capabilities") &&
                        params["capabilities"].is_object() &&
                        params["capabilities"].contains("roots");
    }
    logger().info(std::string("client initialized, roots capability ") +
                  (client_roots_ ? "on" : "off"));

    json result = {
        {"protocolVersion", version},
        {"capabilities", {{"tools", json::object()}}},
        {"serverInfo", {{"name", options_.name}, {"version", options_.version}}},
    };
    return make_result(id, result);
}

json McpServer::handle_tools_call(const json& params, const json& id) {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        return make_error(id, rpc_error::INVALID_PARAMS, "Missing tool name");
    }
    std::string name = params["name"];
    if (!dispatcher_.has_tool(name)) {
        return make_error(id, rpc_error::INVALID_PARAMS, "Unknown tool: " + name);
    }
    json arguments = params.contains("arguments") ? params["arguments"] : json::object();
    ToolResult result = dispatcher_.call(name, arguments);
    if (result.is_error) {
        logger().warn(name + " failed: " + result.content[0].value("text", ""));
    }
    return make_result(id, result.to_json());
}

// ---------------------------------------------------------------------------
// Client roots
// ---------------------------------------------------------------------------

void McpServer::request_roots() {
    std::string id = "roots-" + std::to_string(next_request_++);
    pending_[id] = "roots/list";
    send({
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", "roots/list"},
        {"params", json::object()},
    });
}

void McpServer::handle_response(const json& message) {
    auto it = pending_.find(id_key(message["id"]));
    if (it == pending_.end()) {
        logger().warn("response to unknown request " + message["id"].dump());
        return;
    }
    std::string method = it->second;
    pending_.erase(it);

    if (message.contains("error")) {
        logger().warn(method + " failed: " + message["error"].dump());
        return;
    }
    if (method == "roots/list") apply_client_roots(message["result"]);
}

void McpServer::apply_client_roots(const json& result) {
    if (!result.is_object() || !result.contains("roots") || !result["roots"].is_array()) {
        logger().warn("malformed roots/list result ignored");
        return;
    }
    std::vector<std::string> candidates;
    for (const auto& root : result["roots"]) {
        if (!root.is_object() || !root.contains("uri") || !root["uri"].is_string()) {
            logger().warn("roots/list entry without uri, update rejected");
            return;
        }
        candidates.push_back(root["uri"].get<std::string>());
    }
    if (candidates.empty()) {
        logger().info("client sent no roots, keeping current allowed directories");
        return;
    }
    try {
        sandbox_.replace_roots(candidates);
    } catch (const FsGateError& e) {
        logger().error(std::string("roots update rejected: ") + e.what());
    }
}

// ---------------------------------------------------------------------------
// JSON-RPC helpers
// ---------------------------------------------------------------------------

json McpServer::make_result(const json& id, const json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result},
    };
}

json McpServer::make_error(const json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {{"code", code}, {"message", message}}},
    };
}

} // namespace fsgate
