#include "fsgate/roots.h"
#include "fsgate/error.h"
#include "fsgate/log.h"
#include "fsgate/paths.h"

#include <atomic>
#include <cctype>
#include <filesystem>
#include <system_error>

namespace fsgate {

// ---------------------------------------------------------------------------
// RootSet
// ---------------------------------------------------------------------------

RootSet::RootSet(std::vector<Root> roots) {
    for (auto& r : roots) {
        bool dup = false;
        for (const auto& existing : roots_) {
            if (existing.path == r.path) { dup = true; break; }
        }
        if (dup) continue;
        if (r.alias == r.path) r.alias.clear();
        roots_.push_back(std::move(r));
    }
}

RootSet RootSet::from_paths(const std::vector<std::string>& real_paths) {
    std::vector<Root> roots;
    roots.reserve(real_paths.size());
    for (const auto& p : real_paths) roots.push_back({paths::normalize(p), ""});
    return RootSet(std::move(roots));
}

std::vector<std::string> RootSet::paths() const {
    std::vector<std::string> out;
    out.reserve(roots_.size());
    for (const auto& r : roots_) out.push_back(r.path);
    return out;
}

bool RootSet::contains(const std::string& real_path) const {
    for (const auto& r : roots_) {
        if (paths::is_within(real_path, r.path)) return true;
    }
    return false;
}

bool RootSet::admits(const std::string& normalized_path) const {
    for (const auto& r : roots_) {
        if (paths::is_within(normalized_path, r.path)) return true;
        if (!r.alias.empty() && paths::is_within(normalized_path, r.alias)) return true;
    }
    return false;
}

// ---------------------------------------------------------------------------
// Root URIs
// ---------------------------------------------------------------------------

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string percent_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            int hi = hex_value(s[i + 1]);
            int lo = hex_value(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        }
        out += s[i];
    }
    return out;
}

} // anonymous namespace

std::string root_uri_to_path(const std::string& uri) {
    static const std::string scheme = "file://";
    if (uri.compare(0, scheme.size(), scheme) == 0) {
        std::string rest = uri.substr(scheme.size());
        // file://localhost/x and file:///x both name /x
        if (!rest.empty() && rest[0] != '/') {
            auto slash = rest.find('/');
            std::string host = rest.substr(0, slash);
            if (host != "localhost") {
                throw InvalidPathError("unsupported root URI host: " + uri);
            }
            rest = slash == std::string::npos ? "/" : rest.substr(slash);
        }
        return percent_decode(rest);
    }
    auto colon = uri.find("://");
    if (colon != std::string::npos) {
        bool scheme_like = colon > 0;
        for (size_t i = 0; i < colon; ++i) {
            if (!std::isalpha(static_cast<unsigned char>(uri[i]))) { scheme_like = false; break; }
        }
        if (scheme_like) throw InvalidPathError("unsupported root URI: " + uri);
    }
    return uri;
}

// ---------------------------------------------------------------------------
// RootRegistry
// ---------------------------------------------------------------------------

RootRegistry::RootRegistry()
    : current_(std::make_shared<const RootSet>()) {}

void RootRegistry::replace_roots(const std::vector<std::string>& candidates) {
    namespace fs = std::filesystem;

    std::vector<RootSet::Root> validated;
    validated.reserve(candidates.size());

    for (const auto& candidate : candidates) {
        std::string norm = paths::normalize(root_uri_to_path(candidate));
        if (!paths::is_absolute(norm)) {
            norm = paths::normalize(fs::absolute(fs::path(norm)).generic_string());
        }

        std::error_code ec;
        auto status = fs::status(norm, ec);
        if (ec || !fs::exists(status)) throw RootNotFoundError(norm);
        if (!fs::is_directory(status)) throw RootNotADirectoryError(norm);

        auto real = fs::canonical(norm, ec);
        if (ec) {
            throw IoError("cannot resolve root " + norm + ": " + ec.message());
        }
        validated.push_back({paths::normalize(real.generic_string()), norm});
    }

    auto next = std::make_shared<const RootSet>(std::move(validated));
    std::atomic_store(&current_, next);

    if (next->empty()) {
        logger().warn("no allowed directories configured");
    } else {
        std::string joined;
        for (const auto& p : next->paths()) {
            if (!joined.empty()) joined += ", ";
            joined += p;
        }
        logger().info("allowed directories: " + joined);
    }
}

std::shared_ptr<const RootSet> RootRegistry::snapshot() const {
    return std::atomic_load(&current_);
}

std::vector<std::string> RootRegistry::list_roots() const {
    return snapshot()->paths();
}

} // namespace fsgate
