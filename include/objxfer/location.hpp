#pragma once

#include "objxfer/constants.hpp"

#include <map>
#include <optional>
#include <string>
#include <utility>

namespace objxfer {

/// Connection settings for one object-store alias.
struct AliasConfig {
    std::string url;  // http(s)://host[:port]
    std::string access_key;
    std::string secret_key;
    std::string session_token;
    std::string region = constants::DEFAULT_REGION;
    bool path_style = true;
    bool verify_ssl = true;

    // Returns an error message if invalid, empty string if OK
    std::string validate() const;
};

enum class LocationKind { Filesystem, ObjectStore };

/// A resolved address. Built fresh per command invocation.
struct Location {
    std::string alias;        // first path segment ("s3", "fsA", "" for absolute paths)
    std::string aliased_url;  // as supplied by the user, separators normalized
    std::string path;         // backend-native: filesystem path or "bucket/key"
    LocationKind kind = LocationKind::Filesystem;
    std::optional<AliasConfig> config;

    bool is_filesystem() const { return kind == LocationKind::Filesystem; }

    /// Fully qualified address (endpoint URL for object stores, path otherwise).
    std::string full_url() const;
};

/// "s3/bucket/key" -> {"s3", "bucket/key"}
std::pair<std::string, std::string> split_alias(const std::string& aliased_url);

/// Lexically clean a slash path: collapse "//" and "/./", keep a trailing "/".
std::string clean_path(const std::string& path);

/// Join a base aliased URL and a relative key with exactly one separator.
std::string join_url(const std::string& base, const std::string& rel);

/// Directory guess from the address shape alone, used when stat fails.
/// Filesystem: trailing separator. Object store: 0-1 segments never, exactly
/// alias/bucket always, deeper only with a trailing separator.
bool looks_like_container(const Location& location);

/// Maps alias names to object-store configurations.
class LocationResolver {
public:
    LocationResolver() = default;
    explicit LocationResolver(std::map<std::string, AliasConfig> aliases)
        : aliases_(std::move(aliases)) {}

    void add_alias(const std::string& name, AliasConfig config) {
        aliases_[name] = std::move(config);
    }

    std::optional<AliasConfig> find(const std::string& alias) const;

    /// Unregistered aliases resolve to filesystem locations.
    Location resolve(const std::string& aliased_url) const;

private:
    std::map<std::string, AliasConfig> aliases_;
};

}  // namespace objxfer
