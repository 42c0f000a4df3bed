#include "objxfer/encryption.hpp"
#include "objxfer/constants.hpp"
#include "objxfer/http.hpp"

#include <algorithm>
#include <cstdlib>
#include <cstring>

namespace objxfer {

static std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = s.find(sep, start);
        parts.push_back(s.substr(start, pos == std::string::npos ? std::string::npos : pos - start));
        if (pos == std::string::npos) break;
        start = pos + 1;
    }
    return parts;
}

static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

// "alias/rest" -> {"alias", "rest"}
static std::pair<std::string, std::string> split_alias_prefix(const std::string& path) {
    size_t slash = path.find('/');
    if (slash == std::string::npos) return {path, ""};
    return {path.substr(0, slash), path.substr(slash + 1)};
}

std::optional<Error> decode_encryption_key(const std::string& value,
                                           std::array<uint8_t, 32>& out) {
    if (value.size() == constants::ENCRYPTION_KEY_SIZE) {
        std::memcpy(out.data(), value.data(), out.size());
        return std::nullopt;
    }
    if (value.size() == constants::ENCRYPTION_KEY_BASE64_SIZE) {
        auto decoded = net::base64_decode(value);
        if (decoded && decoded->size() == constants::ENCRYPTION_KEY_SIZE) {
            std::copy(decoded->begin(), decoded->end(), out.begin());
            return std::nullopt;
        }
    }
    return invalid_argument(
        "Encryption key should be 32 bytes plain text key or 44 bytes base64 encoded key");
}

Sse resolve_key(const std::string& path, const std::vector<EncryptionKeyEntry>& entries) {
    const EncryptionKeyEntry* best = nullptr;
    for (const auto& entry : entries) {
        if (!path.starts_with(entry.prefix)) continue;
        if (!best || entry.prefix.size() > best->prefix.size()) {
            best = &entry;
        }
    }
    if (!best) return std::nullopt;
    return *best;
}

std::optional<Error> EncryptionKeyRegistry::add(const std::string& alias, const std::string& entry) {
    size_t eq = entry.find('=');
    if (eq == std::string::npos) {
        return invalid_argument("SSE-C prefix should be of the form prefix1=key1,...")
            .with_trace({entry});
    }

    EncryptionKeyEntry parsed;
    parsed.prefix = entry.substr(0, eq);
    parsed.type = SseType::Customer;
    if (auto err = decode_encryption_key(entry.substr(eq + 1), parsed.key)) {
        // Never echo the key material itself
        return err->with_trace({alias + "/" + parsed.prefix});
    }

    auto& list = by_alias_[alias];
    auto existing = std::find_if(list.begin(), list.end(), [&](const EncryptionKeyEntry& e) {
        return e.prefix == parsed.prefix;
    });
    if (existing != list.end()) {
        *existing = parsed;
    } else {
        list.push_back(parsed);
    }
    return std::nullopt;
}

void EncryptionKeyRegistry::add_default(const std::string& alias, const std::string& prefix) {
    EncryptionKeyEntry entry;
    entry.prefix = prefix;
    entry.type = SseType::S3;
    by_alias_[alias].push_back(entry);
}

const std::vector<EncryptionKeyEntry>& EncryptionKeyRegistry::entries(const std::string& alias) const {
    static const std::vector<EncryptionKeyEntry> empty_list;
    auto it = by_alias_.find(alias);
    return it == by_alias_.end() ? empty_list : it->second;
}

Sse EncryptionKeyRegistry::resolve(const std::string& aliased_path) const {
    auto [alias, rest] = split_alias_prefix(aliased_path);
    return resolve_key(rest, entries(alias));
}

std::optional<Error> EncryptionKeyRegistry::parse(const std::string& sse_keys,
                                                  const std::string& sse_default,
                                                  EncryptionKeyRegistry& out) {
    EncryptionKeyRegistry registry;

    std::vector<std::string> default_prefixes;
    if (!trim(sse_default).empty()) {
        for (const auto& raw : split(sse_default, ',')) {
            std::string p = trim(raw);
            if (p.empty()) continue;
            default_prefixes.push_back(p);
        }
    }

    if (!trim(sse_keys).empty()) {
        for (const auto& item : split(sse_keys, ',')) {
            if (trim(item).empty()) continue;
            size_t eq = item.find('=');
            if (eq == std::string::npos) {
                return invalid_argument("SSE-C prefix should be of the form prefix1=key1,...");
            }
            // Only the prefix is trimmed; spaces are valid key bytes
            std::string full_prefix = trim(item.substr(0, eq));
            for (const auto& d : default_prefixes) {
                if (full_prefix.starts_with(d) || d.starts_with(full_prefix)) {
                    return invalid_argument("SSE-S3 prefix '" + d +
                                            "' conflicts with SSE-C key prefix '" +
                                            full_prefix + "'");
                }
            }
            auto [alias, prefix] = split_alias_prefix(full_prefix);
            if (alias.empty()) {
                return invalid_argument("encryption key prefix '" + full_prefix +
                                        "' does not name an alias");
            }
            if (auto err = registry.add(alias, prefix + item.substr(eq))) {
                return err;
            }
        }
    }

    for (const auto& d : default_prefixes) {
        auto [alias, prefix] = split_alias_prefix(d);
        registry.add_default(alias, prefix);
    }

    out = std::move(registry);
    return std::nullopt;
}

std::optional<Error> load_encryption_keys(const std::string& encrypt_flag,
                                          const std::string& encrypt_key_flag,
                                          EncryptionKeyRegistry& out) {
    std::string sse_default;
    if (const char* env = std::getenv("OBJXFER_ENCRYPT")) sse_default = env;
    if (!encrypt_flag.empty()) sse_default = encrypt_flag;

    std::string sse_keys;
    if (const char* env = std::getenv("OBJXFER_ENCRYPT_KEY")) sse_keys = env;
    if (!encrypt_key_flag.empty()) sse_keys = encrypt_key_flag;

    return EncryptionKeyRegistry::parse(sse_keys, sse_default, out);
}

}  // namespace objxfer
