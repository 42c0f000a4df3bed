#pragma once

#include "objxfer/client.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace objxfer {

/// One object to move, built fresh per object and never reused.
struct TransferRequest {
    std::string source_alias;
    ContentDescriptor source_content;  // url is the aliased source path
    std::string target_alias;
    ContentDescriptor target_content;  // url is the aliased target path; carries overrides
    ProgressSink* progress = nullptr;
    bool disable_multipart = false;
    bool md5 = false;
    bool preserve = false;
};

/// Outcome for one object of a pipeline.
struct PipelineResult {
    std::string key;
    std::string target;  // copy only
    int64_t size = 0;
    bool dry_run = false;
    std::optional<Error> error;

    bool ok() const { return !error.has_value(); }
};

/// Source reader plus the metadata collected while opening it.
struct SourceStream {
    bool success = false;
    std::unique_ptr<ReadStream> stream;
    Metadata metadata;
    Error error;
};

/// Drop keys or values that are not valid HTTP header tokens, and every
/// server-side-encryption key.
Metadata filter_metadata(const Metadata& metadata);

/// Open a source for reading. With fetch_stat, collect its stored metadata
/// and detect a content type for local sources whose type is unknown.
SourceStream get_source_stream(const Environment& env, const std::string& aliased_url,
                               bool fetch_stat, const Sse& sse, bool preserve);

/// get_source_stream with the registry's key for the address.
SourceStream get_source_stream_from_url(const Environment& env, const std::string& aliased_url,
                                        bool fetch_stat = false);

/// Write stream to an address, applying lock settings as pseudo-metadata.
PutResult put_target_stream(const Environment& env, const std::string& aliased_url,
                            const LockSettings& lock, ReadStream& stream, int64_t size,
                            Metadata metadata, ProgressSink* progress, const Sse& sse,
                            bool md5, bool disable_multipart);

/// Write stream to an address with the registry's key and a content type
/// guessed from the name. size < 0 reads until end of stream.
PutResult put_target_stream_with_url(const Environment& env, const std::string& aliased_url,
                                     ReadStream& stream, int64_t size, bool md5,
                                     bool disable_multipart, Metadata metadata = {});

/// Copy one object. Same-alias pairs use an in-backend copy; anything else
/// streams through this process.
PipelineResult upload_source_to_target(const Environment& env, const TransferRequest& request);

// Options for the cp command
struct CopyOptions {
    bool recursive = false;
    Metadata attributes;  // --attr, user metadata for every target
    std::string retention_mode;
    std::string retention_duration;
    std::string legal_hold;
    bool disable_multipart = false;
    bool md5 = false;
    bool preserve = false;

    std::function<void(const PipelineResult&)> on_result;

    // Returns an error message if invalid, empty string if OK
    std::string validate() const;
};

/// Parse "k1=v1;k2=v2" into metadata.
std::optional<Error> parse_attributes(const std::string& text, Metadata& out);

/// Copy each source onto target. Returns the first failure; every source is
/// still attempted.
std::optional<Error> copy_targets(const Environment& env, const std::vector<std::string>& sources,
                                  const std::string& target, const CopyOptions& options);

}  // namespace objxfer
