#include "objxfer/location.hpp"

#include <vector>

namespace objxfer {

std::string AliasConfig::validate() const {
    if (url.empty()) {
        return "url is required";
    }
    if (!url.starts_with("http://") && !url.starts_with("https://")) {
        return "url must start with http:// or https://";
    }
    if (url.find('/', url.find("://") + 3) != std::string::npos) {
        return "url must not contain a path";
    }
    if (access_key.empty() != secret_key.empty()) {
        return "access_key and secret_key must be set together";
    }
    if (region.empty()) {
        return "region must not be empty";
    }
    return "";
}

std::pair<std::string, std::string> split_alias(const std::string& aliased_url) {
    size_t slash = aliased_url.find('/');
    if (slash == std::string::npos) {
        return {aliased_url, ""};
    }
    return {aliased_url.substr(0, slash), aliased_url.substr(slash + 1)};
}

std::string clean_path(const std::string& path) {
    if (path.empty()) return path;

    bool absolute = path.front() == '/';
    bool trailing = path.size() > 1 && path.back() == '/';

    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string::npos) end = path.size();
        std::string part = path.substr(start, end - start);
        if (!part.empty() && part != ".") {
            parts.push_back(std::move(part));
        }
        start = end + 1;
    }

    std::string result = absolute ? "/" : "";
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += '/';
        result += parts[i];
    }
    if (trailing && !parts.empty()) result += '/';
    if (result.empty()) result = ".";
    return result;
}

std::string join_url(const std::string& base, const std::string& rel) {
    if (base.empty()) return rel;
    if (rel.empty()) return base;
    if (base.back() == '/') {
        return rel.front() == '/' ? base + rel.substr(1) : base + rel;
    }
    return rel.front() == '/' ? base + rel : base + "/" + rel;
}

std::string Location::full_url() const {
    if (kind == LocationKind::Filesystem || !config) {
        return path;
    }
    return path.empty() ? config->url : config->url + "/" + path;
}

bool looks_like_container(const Location& location) {
    const std::string& url = location.aliased_url;
    if (location.is_filesystem()) {
        return !url.empty() && url.back() == '/';
    }

    // Count segments the way a plain split on "/" would
    size_t fields = url.empty() ? 0 : 1;
    for (char c : url) {
        if (c == '/') ++fields;
    }
    switch (fields) {
        case 0:
        case 1:
            return false;
        case 2:
            return true;
        default:
            return url.back() == '/';
    }
}

std::optional<AliasConfig> LocationResolver::find(const std::string& alias) const {
    auto it = aliases_.find(alias);
    if (it == aliases_.end()) return std::nullopt;
    return it->second;
}

Location LocationResolver::resolve(const std::string& aliased_url) const {
    Location location;
    location.aliased_url = aliased_url;

    auto [alias, rest] = split_alias(aliased_url);
    location.alias = alias;

    auto config = find(alias);
    if (!config) {
        location.kind = LocationKind::Filesystem;
        location.path = aliased_url;
        return location;
    }

    location.kind = LocationKind::ObjectStore;
    location.config = std::move(config);
    location.path = rest;
    return location;
}

}  // namespace objxfer
