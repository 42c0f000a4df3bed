#pragma once

#include "objxfer/error.hpp"

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace objxfer {

enum class SseType {
    Customer,  // SSE-C: key supplied with every request
    S3         // backend-managed key (AES256)
};

/// A path prefix (relative to its alias) and the key that applies beneath it.
struct EncryptionKeyEntry {
    std::string prefix;
    SseType type = SseType::Customer;
    std::array<uint8_t, 32> key{};
};

/// Encryption to apply to one request; empty means none.
using Sse = std::optional<EncryptionKeyEntry>;

/// Decode a key given as 32 literal bytes or 44-character base64.
std::optional<Error> decode_encryption_key(const std::string& value,
                                           std::array<uint8_t, 32>& out);

/// Longest-prefix match of a path relative to the alias.
Sse resolve_key(const std::string& path, const std::vector<EncryptionKeyEntry>& entries);

/// Per-alias encryption keys for one invocation. Read-only once built.
class EncryptionKeyRegistry {
public:
    /// Parse "alias/prefix=key,alias2/prefix=key" and "alias/prefix,..." lists.
    /// Either may be empty. A key prefix covered by a default-SSE prefix is a
    /// conflict.
    static std::optional<Error> parse(const std::string& sse_keys,
                                      const std::string& sse_default,
                                      EncryptionKeyRegistry& out);

    /// Add one "prefix=key" entry for an alias.
    std::optional<Error> add(const std::string& alias, const std::string& entry);

    /// Add a backend-managed encryption prefix for an alias.
    void add_default(const std::string& alias, const std::string& prefix);

    const std::vector<EncryptionKeyEntry>& entries(const std::string& alias) const;

    /// Resolve for an aliased path such as "s3/bucket/key".
    Sse resolve(const std::string& aliased_path) const;

    bool empty() const { return by_alias_.empty(); }

private:
    std::map<std::string, std::vector<EncryptionKeyEntry>> by_alias_;
};

/// Build the registry from flags, falling back to OBJXFER_ENCRYPT and
/// OBJXFER_ENCRYPT_KEY. Flags take precedence over the environment.
std::optional<Error> load_encryption_keys(const std::string& encrypt_flag,
                                          const std::string& encrypt_key_flag,
                                          EncryptionKeyRegistry& out);

}  // namespace objxfer
