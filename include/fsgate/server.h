#pragma once

#include "dispatcher.h"
#include "sandbox.h"

#include <nlohmann/json.hpp>

#include <functional>
#include <iosfwd>
#include <map>
#include <string>

namespace fsgate {

/// JSON-RPC error codes used on the wire.
namespace rpc_error {
constexpr int PARSE_ERROR      = -32700;
constexpr int INVALID_REQUEST  = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS   = -32602;
} // namespace rpc_error

/// Newline-delimited JSON-RPC 2.0 server exposing the filesystem tools.
///
/// Requests are handled one at a time in arrival order.  When the client
/// advertises the `roots` capability the server asks for its roots after
/// `notifications/initialized` and again on every
/// `notifications/roots/list_changed`; a valid answer replaces the active
/// roots, an invalid one is logged and ignored.
///
/// @code
///     fsgate::Sandbox box;
///     box.replace_roots({"/srv/docs"});
///     fsgate::McpServer server(box);
///     server.run(std::cin, std::cout);
/// @endcode
class McpServer {
public:
    struct Options {
        std::string name = "fsgate";
        std::string version;  ///< "" uses the library version.
    };

    /// Receives every outgoing message (responses and server requests).
    using Sink = std::function<void(const json&)>;

    explicit McpServer(Sandbox& sandbox);
    McpServer(Sandbox& sandbox, Options options);

    void set_sink(Sink sink);

    /// Parse one line and handle it; replies go to the sink.
    void handle_line(const std::string& line);

    /// Handle one decoded message.  Returns the response, or null for
    /// notifications and for responses to the server's own requests.
    json handle_message(const json& message);

    /// Read lines from `in` until EOF, writing messages to `out`.
    void run(std::istream& in, std::ostream& out);

    bool client_supports_roots() const { return client_roots_; }
    const ToolDispatcher& dispatcher() const { return dispatcher_; }

private:
    json handle_initialize(const json& params, const json& id);
    json handle_tools_call(const json& params, const json& id);
    void handle_response(const json& message);
    void apply_client_roots(const json& result);
    void request_roots();
    void send(const json& message);

    static json make_result(const json& id, const json& result);
    static json make_error(const json& id, int code, const std::string& message);

    Sandbox&       sandbox_;
    ToolDispatcher dispatcher_;
    Options        options_;
    Sink           sink_;
    bool           client_roots_ = false;
    int            next_request_ = 1;
    std::map<std::string, std::string> pending_; ///< Request id -> method.
};

} // namespace fsgate
