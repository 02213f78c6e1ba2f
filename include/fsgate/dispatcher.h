#pragma once

#include "sandbox.h"

#include <nlohmann/json.hpp>

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace fsgate {

using json = nlohmann::json;

/// Result of one tool call in MCP shape.
struct ToolResult {
    json content = json::array(); ///< Content items ({type, text} etc.).
    bool is_error = false;

    static ToolResult text(const std::string& s);
    static ToolResult error(const std::string& message);

    /// `{"content": [...], "isError": bool}`
    json to_json() const;
};

/// A tool as advertised by tools/list.
struct ToolDefinition {
    std::string name;
    std::string description;
    json        input_schema;
};

/// Maps tool names and JSON arguments onto Sandbox operations.
///
/// Failures inside a tool never escape call(): typed fsgate errors, bad
/// argument combinations and JSON type errors become results with
/// `isError` set and the text "Error: <message>".
class ToolDispatcher {
public:
    explicit ToolDispatcher(Sandbox& sandbox);

    /// Definitions in registration order.
    const std::vector<ToolDefinition>& tools() const { return tools_; }

    /// The tools/list payload.
    json list_tools() const;

    bool has_tool(const std::string& name) const;

    /// Run `name` with `arguments`.  An unknown name is an error result.
    ToolResult call(const std::string& name, const json& arguments) const;

private:
    using Handler = std::function<ToolResult(const json&)>;

    void add(ToolDefinition def, Handler handler);
    void register_tools();

    ToolResult read_text_file(const json& args) const;
    ToolResult read_media_file(const json& args) const;
    ToolResult read_multiple_files(const json& args) const;
    ToolResult write_file(const json& args) const;
    ToolResult edit_file(const json& args) const;
    ToolResult create_directory(const json& args) const;
    ToolResult list_directory(const json& args) const;
    ToolResult list_directory_with_sizes(const json& args) const;
    ToolResult directory_tree(const json& args) const;
    ToolResult move_file(const json& args) const;
    ToolResult search_files(const json& args) const;
    ToolResult get_file_info(const json& args) const;
    ToolResult list_allowed_directories(const json& args) const;

    Sandbox&                                 sandbox_;
    std::vector<ToolDefinition>              tools_;
    std::unordered_map<std::string, Handler> handlers_;
};

} // namespace fsgate
