#pragma once

#include "objxfer/cancellation.hpp"
#include "objxfer/content.hpp"
#include "objxfer/encryption.hpp"
#include "objxfer/error.hpp"
#include "objxfer/location.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace objxfer {

class TransferMetrics;

// Result of a stat operation
struct StatResult {
    bool success = false;
    ContentDescriptor content;
    Error error;
};

// Result of a get operation
struct GetResult {
    bool success = false;
    std::unique_ptr<ReadStream> stream;
    Error error;
};

// Result of a put operation
struct PutResult {
    bool success = false;
    int64_t bytes = 0;
    Error error;
};

// Options for list operations
struct ListOptions {
    bool recursive = false;
    bool incomplete = false;  // list in-progress uploads instead of objects
    bool fetch_meta = false;  // stat every entry for full metadata
    DirOpt dir_opt = DirOpt::First;
};

/// Uniform access to one address on one backend.
///
/// A client is bound to the location it was created for; every operation
/// acts on that location. Descriptor URLs produced and consumed by a client
/// are in aliased form. Implementations are safe for concurrent use by the
/// listing and removal tasks of one bulk operation.
class Client {
public:
    virtual ~Client() = default;

    // Backend type name (for logging/debugging)
    virtual std::string type_name() const = 0;

    virtual const Location& location() const = 0;

    virtual StatResult stat(const CancellationToken& cancel, bool incomplete,
                            bool preserve, const Sse& sse) = 0;

    /// Lazy listing. Scan failures arrive in-band; cancelling stops the
    /// producer and closes the stream.
    virtual std::unique_ptr<ContentStream> list(const CancellationToken& cancel,
                                                const ListOptions& options) = 0;

    virtual GetResult get(const CancellationToken& cancel, const Sse& sse) = 0;

    /// Store size bytes from stream. Lock pseudo-metadata keys
    /// (X-Amz-Object-Lock-*) are applied as retention settings, never
    /// stored as metadata.
    virtual PutResult put(const CancellationToken& cancel, ReadStream& stream, int64_t size,
                          const Metadata& metadata, ProgressSink* progress, const Sse& sse,
                          bool md5, bool disable_multipart) = 0;

    /// In-backend copy of source (an aliased URL on the same alias) to this location.
    virtual std::optional<Error> copy(const CancellationToken& cancel, const std::string& source,
                                      int64_t size, ProgressSink* progress, const Sse& src_sse,
                                      const Sse& tgt_sse, const Metadata& metadata,
                                      bool disable_multipart) = 0;

    /// Remove every descriptor received on contents until it is closed.
    /// Only failures are emitted; the stream ends after contents is drained.
    virtual std::unique_ptr<ErrorStream> remove(const CancellationToken& cancel, bool incomplete,
                                                bool remove_bucket, bool bypass,
                                                std::shared_ptr<DescriptorChannel> contents) = 0;

    virtual std::optional<Error> put_retention(const CancellationToken& cancel,
                                               const std::string& mode,
                                               std::chrono::system_clock::time_point until,
                                               bool bypass_governance) = 0;

    virtual std::optional<Error> put_legal_hold(const CancellationToken& cancel,
                                                const std::string& status) = 0;
};

struct ClientResult {
    bool success = false;
    std::unique_ptr<Client> client;
    Error error;
};

/// Creates clients for resolved locations.
class ClientFactory {
public:
    virtual ~ClientFactory() = default;
    virtual ClientResult create(const Location& location) = 0;
};

/// Filesystem client for unregistered aliases, S3 client otherwise.
class DefaultClientFactory : public ClientFactory {
public:
    ClientResult create(const Location& location) override;
};

/// Everything an operation needs for one command invocation.
struct Environment {
    LocationResolver resolver;
    std::shared_ptr<ClientFactory> factory = std::make_shared<DefaultClientFactory>();
    EncryptionKeyRegistry keys;
    CancellationToken cancel;
    TransferMetrics* metrics = nullptr;
};

/// Resolve an aliased URL and create its client. Bare http(s) URLs are
/// rejected: object stores must be addressed through an alias.
ClientResult new_client(const Environment& env, const std::string& aliased_url);

/// Stat an aliased URL with the key the registry assigns to it.
StatResult stat_url(const Environment& env, const std::string& aliased_url,
                    bool incomplete = false, bool preserve = false);

/// Whether the address denotes a container. Stat is authoritative when the
/// address exists; otherwise the address shape decides.
bool is_container_like(const Environment& env, const std::string& aliased_url);

/// Lock pseudo-metadata (X-Amz-Object-Lock-*) carried in a metadata map.
struct LockSettings {
    std::string mode;
    std::string retain_until;  // RFC 3339
    std::string legal_hold;

    bool empty() const { return mode.empty() && retain_until.empty() && legal_hold.empty(); }
};

/// Split lock keys out of metadata, returning the rest.
Metadata extract_lock_settings(const Metadata& metadata, LockSettings& lock);

}  // namespace objxfer
