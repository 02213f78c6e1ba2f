#include "fsgate/dispatcher.h"
#include "fsgate/error.h"
#include "fsgate/log.h"
#include "fsgate/reader.h"

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace fsgate {

// ---------------------------------------------------------------------------
// ToolResult
// ---------------------------------------------------------------------------

ToolResult ToolResult::text(const std::string& s) {
    ToolResult r;
    r.content.push_back({{"type", "text"}, {"text", s}});
    return r;
}

ToolResult ToolResult::error(const std::string& message) {
    ToolResult r = text("Error: " + message);
    r.is_error = true;
    return r;
}

json ToolResult::to_json() const {
    return {{"content", content}, {"isError", is_error}};
}

// ---------------------------------------------------------------------------
// Argument helpers
// ---------------------------------------------------------------------------

namespace {

const json& require(const json& args, const char* key) {
    if (!args.is_object() || !args.contains(key) || args.at(key).is_null()) {
        throw std::invalid_argument(std::string("missing required argument: ") + key);
    }
    return args.at(key);
}

std::string string_arg(const json& args, const char* key) {
    return require(args, key).get<std::string>();
}

std::optional<size_t> count_arg(const json& args, const char* key) {
    if (!args.is_object() || !args.contains(key) || args.at(key).is_null()) {
        return std::nullopt;
    }
    auto n = args.at(key).get<int64_t>();
    if (n < 0) {
        throw std::invalid_argument(std::string(key) + " must not be negative");
    }
    return static_cast<size_t>(n);
}

std::vector<std::string> string_list_arg(const json& args, const char* key) {
    if (!args.is_object() || !args.contains(key) || args.at(key).is_null()) {
        return {};
    }
    return args.at(key).get<std::vector<std::string>>();
}

json path_property(const std::string& description) {
    return {{"type", "string"}, {"description", description}};
}

json object_schema(json properties, std::vector<std::string> required) {
    return {
        {"type", "object"},
        {"properties", std::move(properties)},
        {"required", std::move(required)},
    };
}

json tree_to_json(const std::vector<DirectoryEntry>& entries) {
    json out = json::array();
    for (const auto& e : entries) {
        json node = {
            {"name", e.name},
            {"type", e.is_directory() ? "directory" : "file"},
        };
        if (e.children) node["children"] = tree_to_json(*e.children);
        out.push_back(std::move(node));
    }
    return out;
}

std::string format_time(int64_t seconds) {
    std::time_t t = static_cast<std::time_t>(seconds);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

std::string pad_right(const std::string& s, size_t width) {
    return s.size() >= width ? s : s + std::string(width - s.size(), ' ');
}

std::string pad_left(const std::string& s, size_t width) {
    return s.size() >= width ? s : std::string(width - s.size(), ' ') + s;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Registration
// ---------------------------------------------------------------------------

ToolDispatcher::ToolDispatcher(Sandbox& sandbox)
    : sandbox_(sandbox)
{
    register_tools();
}

void ToolDispatcher::add(ToolDefinition def, Handler handler) {
    handlers_[def.name] = std::move(handler);
    tools_.push_back(std::move(def));
}

void ToolDispatcher::register_tools() {
    json head_tail = {
        {"path", path_property("Absolute path of the file")},
        {"head", {{"type", "integer"}, {"description", "Return only the first N lines"}}},
        {"tail", {{"type", "integer"}, {"description", "Return only the last N lines"}}},
    };
    json excludes = {
        {"type", "array"},
        {"items", {{"type", "string"}}},
        {"description", "Glob patterns to leave out"},
    };

    add({"read_text_file",
         "Read the complete contents of a file as text. Use head or tail to "
         "read only the first or last N lines.",
         object_schema(head_tail, {"path"})},
        [this](const json& a) { return read_text_file(a); });

    add({"read_file",
         "Read the complete contents of a file as text. Deprecated: use read_text_file.",
         object_schema(head_tail, {"path"})},
        [this](const json& a) { return read_text_file(a); });

    add({"read_media_file",
         "Read an image or audio file and return its base64 data and MIME type.",
         object_schema({{"path", path_property("Absolute path of the file")}}, {"path"})},
        [this](const json& a) { return read_media_file(a); });

    add({"read_multiple_files",
         "Read several files at once. A file that cannot be read does not stop "
         "the others; its error is reported in place of its content.",
         object_schema({{"paths", {{"type", "array"}, {"items", {{"type", "string"}}}}}},
                       {"paths"})},
        [this](const json& a) { return read_multiple_files(a); });

    add({"write_file",
         "Create a new file or replace an existing one. The write is atomic.",
         object_schema({{"path", path_property("Absolute path of the file")},
                        {"content", {{"type", "string"}}}},
                       {"path", "content"})},
        [this](const json& a) { return write_file(a); });

    add({"edit_file",
         "Replace text in a file. Each edit replaces the first occurrence of "
         "oldText; indentation differences are tolerated. Returns a git-style "
         "diff. Set dryRun to preview without writing.",
         object_schema({{"path", path_property("Absolute path of the file")},
                        {"edits", {{"type", "array"},
                                   {"items", object_schema({{"oldText", {{"type", "string"}}},
                                                            {"newText", {{"type", "string"}}}},
                                                           {"oldText", "newText"})}}},
                        {"dryRun", {{"type", "boolean"}, {"default", false}}}},
                       {"path", "edits"})},
        [this](const json& a) { return edit_file(a); });

    add({"create_directory",
         "Create a directory, including missing parents. Succeeds if it already exists.",
         object_schema({{"path", path_property("Absolute path of the directory")}}, {"path"})},
        [this](const json& a) { return create_directory(a); });

    add({"list_directory",
         "List a directory; entries are prefixed with [FILE] or [DIR].",
         object_schema({{"path", path_property("Absolute path of the directory")}}, {"path"})},
        [this](const json& a) { return list_directory(a); });

    add({"list_directory_with_sizes",
         "List a directory with file sizes and totals.",
         object_schema({{"path", path_property("Absolute path of the directory")},
                        {"sortBy", {{"type", "string"},
                                    {"enum", json::array({"name", "size"})},
                                    {"default", "name"}}}},
                       {"path"})},
        [this](const json& a) { return list_directory_with_sizes(a); });

    add({"directory_tree",
         "Recursive JSON tree of a directory. Each entry has name, type and, "
         "for directories, children.",
         object_schema({{"path", path_property("Absolute path of the directory")},
                        {"excludePatterns", excludes}},
                       {"path"})},
        [this](const json& a) { return directory_tree(a); });

    add({"move_file",
         "Move or rename a file or directory. Fails if the destination exists.",
         object_schema({{"source", path_property("Absolute path to move")},
                        {"destination", path_property("Absolute path of the new location")}},
                       {"source", "destination"})},
        [this](const json& a) { return move_file(a); });

    add({"search_files",
         "Recursively find files and directories matching a glob pattern. "
         "A pattern without '/' matches names, otherwise relative paths.",
         object_schema({{"path", path_property("Absolute path of the directory to search")},
                        {"pattern", {{"type", "string"}}},
                        {"excludePatterns", excludes}},
                       {"path", "pattern"})},
        [this](const json& a) { return search_files(a); });

    add({"get_file_info",
         "Size, timestamps, type and permissions of a file or directory.",
         object_schema({{"path", path_property("Absolute path")}}, {"path"})},
        [this](const json& a) { return get_file_info(a); });

    add({"list_allowed_directories",
         "List the directories this server may access.",
         object_schema(json::object(), {})},
        [this](const json& a) { return list_allowed_directories(a); });
}

json ToolDispatcher::list_tools() const {
    json out = json::array();
    for (const auto& t : tools_) {
        out.push_back({
            {"name", t.name},
            {"description", t.description},
            {"inputSchema", t.input_schema},
        });
    }
    return out;
}

bool ToolDispatcher::has_tool(const std::string& name) const {
    return handlers_.count(name) > 0;
}

ToolResult ToolDispatcher::call(const std::string& name, const json& arguments) const {
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        return ToolResult::error("unknown tool: " + name);
    }
    logger().debug("tool call: " + name);
    try {
        return it->second(arguments);
    } catch (const FsGateError& e) {
        return ToolResult::error(e.what());
    } catch (const std::invalid_argument& e) {
        return ToolResult::error(e.what());
    } catch (const json::exception& e) {
        return ToolResult::error(std::string("invalid arguments: ") + e.what());
    } catch (const std::filesystem::filesystem_error& e) {
        return ToolResult::error(e.what());
    }
}

// ---------------------------------------------------------------------------
// Reads
// ---------------------------------------------------------------------------

ToolResult ToolDispatcher::read_text_file(const json& args) const {
    ReadOptions opts;
    opts.head = count_arg(args, "head");
    opts.tail = count_arg(args, "tail");
    return ToolResult::text(sandbox_.read_text(string_arg(args, "path"), opts));
}

ToolResult ToolDispatcher::read_media_file(const json& args) const {
    MediaContent media = sandbox_.read_media(string_arg(args, "path"));
    std::string type = media.is_image() ? "image" : media.is_audio() ? "audio" : "blob";
    ToolResult r;
    r.content.push_back({
        {"type", type},
        {"data", media.data},
        {"mimeType", media.mime_type},
    });
    return r;
}

ToolResult ToolDispatcher::read_multiple_files(const json& args) const {
    auto paths = require(args, "paths").get<std::vector<std::string>>();
    std::string out;
    for (size_t i = 0; i < paths.size(); ++i) {
        if (i > 0) out += "\n---\n";
        try {
            out += paths[i] + ":\n" + sandbox_.read_text(paths[i]) + "\n";
        } catch (const FsGateError& e) {
            out += paths[i] + ": Error - " + e.what();
        }
    }
    return ToolResult::text(out);
}

ToolResult ToolDispatcher::get_file_info(const json& args) const {
    FileInfo fi = sandbox_.info(string_arg(args, "path"));
    std::ostringstream ss;
    ss << "size: " << format_size(fi.size) << "\n"
       << "created: " << format_time(fi.created) << "\n"
       << "modified: " << format_time(fi.modified) << "\n"
       << "accessed: " << format_time(fi.accessed) << "\n"
       << "isDirectory: " << (fi.is_directory ? "true" : "false") << "\n"
       << "isFile: " << (fi.is_file ? "true" : "false") << "\n"
       << "isSymlink: " << (fi.is_symlink ? "true" : "false") << "\n"
       << "permissions: " << fi.permissions;
    return ToolResult::text(ss.str());
}

// ---------------------------------------------------------------------------
// Mutations
// ---------------------------------------------------------------------------

ToolResult ToolDispatcher::write_file(const json& args) const {
    std::string path = string_arg(args, "path");
    sandbox_.write_file(path, string_arg(args, "content"));
    return ToolResult::text("Successfully wrote to " + path);
}

ToolResult ToolDispatcher::edit_file(const json& args) const {
    std::string path = string_arg(args, "path");
    std::vector<EditOperation> edits;
    for (const auto& e : require(args, "edits")) {
        edits.push_back({string_arg(e, "oldText"), string_arg(e, "newText")});
    }
    bool dry_run = args.value("dryRun", false);
    return ToolResult::text(sandbox_.edit_file(path, edits, dry_run));
}

ToolResult ToolDispatcher::create_directory(const json& args) const {
    std::string path = string_arg(args, "path");
    sandbox_.create_directory(path);
    return ToolResult::text("Successfully created directory " + path);
}

ToolResult ToolDispatcher::move_file(const json& args) const {
    std::string source = string_arg(args, "source");
    std::string destination = string_arg(args, "destination");
    sandbox_.move(source, destination);
    return ToolResult::text("Successfully moved " + source + " to " + destination);
}

// ---------------------------------------------------------------------------
// Traversal
// ---------------------------------------------------------------------------

ToolResult ToolDispatcher::list_directory(const json& args) const {
    std::string out;
    for (const auto& e : sandbox_.list_directory(string_arg(args, "path"))) {
        if (!out.empty()) out += '\n';
        out += (e.is_directory() ? "[DIR] " : "[FILE] ") + e.name;
    }
    return ToolResult::text(out);
}

ToolResult ToolDispatcher::list_directory_with_sizes(const json& args) const {
    std::string sort = args.value("sortBy", std::string("name"));
    SortBy sort_by;
    if (sort == "name") {
        sort_by = SortBy::Name;
    } else if (sort == "size") {
        sort_by = SortBy::Size;
    } else {
        throw std::invalid_argument("sortBy must be \"name\" or \"size\"");
    }

    auto entries = sandbox_.list_with_sizes(string_arg(args, "path"), sort_by);
    std::string out;
    size_t files = 0, dirs = 0;
    uint64_t total = 0;
    for (const auto& e : entries) {
        std::string size;
        if (e.is_directory()) {
            ++dirs;
        } else {
            ++files;
            total += e.size.value_or(0);
            size = pad_left(format_size(e.size.value_or(0)), 10);
        }
        out += (e.is_directory() ? "[DIR] " : "[FILE] ") + pad_right(e.name, 30) + " " + size + "\n";
    }
    out += "\nTotal: " + std::to_string(files) + " files, " + std::to_string(dirs) + " directories\n";
    out += "Combined size: " + format_size(total);
    return ToolResult::text(out);
}

ToolResult ToolDispatcher::directory_tree(const json& args) const {
    DirectoryEntry root = sandbox_.tree(string_arg(args, "path"),
                                        string_list_arg(args, "excludePatterns"));
    return ToolResult::text(tree_to_json(*root.children).dump(2));
}

ToolResult ToolDispatcher::search_files(const json& args) const {
    auto cursor = sandbox_.search(string_arg(args, "path"),
                                  string_arg(args, "pattern"),
                                  string_list_arg(args, "excludePatterns"));
    std::string out;
    while (auto hit = cursor.next()) {
        if (!out.empty()) out += '\n';
        out += *hit;
    }
    return ToolResult::text(out.empty() ? "No matches found" : out);
}

ToolResult ToolDispatcher::list_allowed_directories(const json& /*args*/) const {
    std::string out = "Allowed directories:";
    for (const auto& r : sandbox_.roots()) out += "\n" + r;
    return ToolResult::text(out);
}

} // namespace fsgate
