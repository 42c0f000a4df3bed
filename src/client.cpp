#include "objxfer/client.hpp"
#include "objxfer/constants.hpp"
#include "objxfer/fs_client.hpp"
#include "objxfer/log.hpp"
#include "objxfer/s3_client.hpp"

#include <regex>

namespace objxfer {

ClientResult DefaultClientFactory::create(const Location& location) {
    ClientResult result;
    if (location.is_filesystem()) {
        result.client = std::make_unique<FsClient>(location);
        result.success = true;
        return result;
    }

    if (!location.config) {
        result.error = invalid_argument("no configuration for alias '" + location.alias + "'");
        return result;
    }
    std::string problem = location.config->validate();
    if (!problem.empty()) {
        result.error = invalid_argument("alias '" + location.alias + "': " + problem);
        return result;
    }

    result.client = std::make_unique<S3Client>(location);
    result.success = true;
    return result;
}

ClientResult new_client(const Environment& env, const std::string& aliased_url) {
    static const std::regex bare_url("^https?://", std::regex::icase);

    Location location = env.resolver.resolve(aliased_url);
    if (location.is_filesystem() && std::regex_search(aliased_url, bare_url)) {
        ClientResult result;
        result.error = invalid_argument("'" + aliased_url +
                                        "' is a URL; object stores must be addressed through an alias");
        return result;
    }

    auto result = env.factory->create(location);
    if (!result.success) {
        result.error = result.error.with_trace({aliased_url});
        return result;
    }
    log_debug("Created %s client for %s", result.client->type_name().c_str(),
              aliased_url.c_str());
    return result;
}

StatResult stat_url(const Environment& env, const std::string& aliased_url,
                    bool incomplete, bool preserve) {
    auto created = new_client(env, aliased_url);
    if (!created.success) {
        StatResult result;
        result.error = created.error;
        return result;
    }
    return created.client->stat(env.cancel, incomplete, preserve, env.keys.resolve(aliased_url));
}

bool is_container_like(const Environment& env, const std::string& aliased_url) {
    auto created = new_client(env, aliased_url);
    if (!created.success) {
        return false;
    }
    auto st = created.client->stat(env.cancel, false, false, env.keys.resolve(aliased_url));
    if (st.success) {
        return st.content.is_dir;
    }
    return looks_like_container(created.client->location());
}

Metadata extract_lock_settings(const Metadata& metadata, LockSettings& lock) {
    Metadata rest;
    for (const auto& [k, v] : metadata) {
        std::string canonical = canonical_header_key(k);
        if (canonical == constants::AMZ_OBJECT_LOCK_MODE) {
            lock.mode = v;
        } else if (canonical == constants::AMZ_OBJECT_LOCK_RETAIN_UNTIL_DATE) {
            lock.retain_until = v;
        } else if (canonical == constants::AMZ_OBJECT_LOCK_LEGAL_HOLD) {
            lock.legal_hold = v;
        } else {
            rest[k] = v;
        }
    }
    return rest;
}

}  // namespace objxfer
