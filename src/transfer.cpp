#include "objxfer/transfer.hpp"
#include "objxfer/constants.hpp"
#include "objxfer/content_type.hpp"
#include "objxfer/durations.hpp"
#include "objxfer/log.hpp"
#include "objxfer/metrics.hpp"

#include <algorithm>
#include <cctype>

namespace objxfer {

namespace {

// RFC 7230 tchar
bool is_token_char(unsigned char c) {
    if (std::isalnum(c)) return true;
    switch (c) {
        case '!': case '#': case '$': case '%': case '&': case '\'': case '*':
        case '+': case '-': case '.': case '^': case '_': case '`': case '|': case '~':
            return true;
        default:
            return false;
    }
}

bool valid_header_name(const std::string& name) {
    if (name.empty()) return false;
    return std::all_of(name.begin(), name.end(),
                       [](char c) { return is_token_char(static_cast<unsigned char>(c)); });
}

bool valid_header_value(const std::string& value) {
    for (char ch : value) {
        auto c = static_cast<unsigned char>(ch);
        if (c == '\t') continue;
        if (c < 0x20 || c == 0x7f) return false;
    }
    return true;
}

void layer(Metadata& into, const Metadata& from) {
    for (const auto& [k, v] : from) {
        into[canonical_header_key(k)] = v;
    }
}

std::string basename_of(const std::string& url) {
    std::string trimmed = url;
    while (trimmed.size() > 1 && trimmed.back() == '/') trimmed.pop_back();
    size_t slash = trimmed.rfind('/');
    return slash == std::string::npos ? trimmed : trimmed.substr(slash + 1);
}

std::string with_trailing_slash(const std::string& url) {
    return (!url.empty() && url.back() == '/') ? url : url + "/";
}

// Stored metadata of the source plus the target's user metadata.
std::optional<Error> get_all_metadata(const Environment& env, const TransferRequest& request,
                                      const Sse& src_sse, Metadata& out) {
    auto created = new_client(env, request.source_content.url);
    if (!created.success) return created.error;
    auto st = created.client->stat(env.cancel, false, request.preserve, src_sse);
    if (!st.success) {
        return st.error.with_trace({request.source_alias, request.source_content.url});
    }
    Metadata metadata;
    layer(metadata, st.content.metadata);
    layer(metadata, request.target_content.user_metadata);
    out = filter_metadata(metadata);
    return std::nullopt;
}

std::optional<Error> put_target_retention(const Environment& env, const std::string& target_url,
                                          const Metadata& metadata, bool bypass) {
    auto created = new_client(env, target_url);
    if (!created.success) return created.error;

    LockSettings lock;
    extract_lock_settings(metadata, lock);
    TimePoint until{};
    if (!lock.retain_until.empty()) {
        if (auto t = parse_rfc3339(lock.retain_until)) until = *t;
    }
    if (auto err = created.client->put_retention(env.cancel, lock.mode, until, bypass)) {
        return err->with_trace({target_url});
    }
    return std::nullopt;
}

void apply_lock(Metadata& metadata, const LockSettings& lock) {
    if (!lock.mode.empty()) metadata[constants::AMZ_OBJECT_LOCK_MODE] = lock.mode;
    if (!lock.retain_until.empty()) {
        metadata[constants::AMZ_OBJECT_LOCK_RETAIN_UNTIL_DATE] = lock.retain_until;
    }
    if (!lock.legal_hold.empty()) metadata[constants::AMZ_OBJECT_LOCK_LEGAL_HOLD] = lock.legal_hold;
}

}  // namespace

Metadata filter_metadata(const Metadata& metadata) {
    const std::string sse_prefix = canonical_header_key(constants::SERVER_ENCRYPTION_KEY_PREFIX);
    Metadata filtered;
    for (const auto& [k, v] : metadata) {
        if (!valid_header_name(k) || !valid_header_value(v)) continue;
        if (canonical_header_key(k).starts_with(sse_prefix)) continue;
        filtered[k] = v;
    }
    return filtered;
}

SourceStream get_source_stream(const Environment& env, const std::string& aliased_url,
                               bool fetch_stat, const Sse& sse, bool preserve) {
    SourceStream result;
    auto created = new_client(env, aliased_url);
    if (!created.success) {
        result.error = created.error;
        return result;
    }
    auto& client = *created.client;

    auto got = client.get(env.cancel, sse);
    if (!got.success) {
        result.error = got.error.with_trace({aliased_url});
        return result;
    }
    result.stream = std::move(got.stream);

    if (fetch_stat) {
        ContentDescriptor st;
        const ContentDescriptor* info = result.stream->object_info();
        if (info) {
            st = *info;
        } else {
            auto stat = client.stat(env.cancel, false, preserve, sse);
            if (!stat.success) {
                result.error = stat.error.with_trace({aliased_url});
                return result;
            }
            st = std::move(stat.content);
        }

        for (const auto& [k, v] : st.metadata) {
            if (valid_header_name(k) && valid_header_value(v)) result.metadata[k] = v;
        }
        // Preserved POSIX attributes travel as user metadata
        for (const auto& [k, v] : st.user_metadata) {
            if (valid_header_name(k) && valid_header_value(v)) result.metadata[k] = v;
        }

        // Unrecognized local files keep probing by content
        auto ct = result.metadata.find("Content-Type");
        if (ct != result.metadata.end() && ct->second == constants::DEFAULT_CONTENT_TYPE &&
            !info && result.stream->seekable()) {
            std::vector<uint8_t> head(constants::CONTENT_SNIFF_SIZE);
            size_t n = 0;
            if (auto err = read_full(*result.stream, head, n)) {
                result.error = err->with_trace({aliased_url});
                return result;
            }
            if (n > 0) {
                if (auto err = result.stream->seek(0)) {
                    result.error = err->with_trace({aliased_url});
                    return result;
                }
                ct->second = sniff_content_type(std::span<const uint8_t>(head.data(), n));
            }
        }
    }

    result.success = true;
    return result;
}

SourceStream get_source_stream_from_url(const Environment& env, const std::string& aliased_url,
                                        bool fetch_stat) {
    return get_source_stream(env, aliased_url, fetch_stat, env.keys.resolve(aliased_url), false);
}

PutResult put_target_stream(const Environment& env, const std::string& aliased_url,
                            const LockSettings& lock, ReadStream& stream, int64_t size,
                            Metadata metadata, ProgressSink* progress, const Sse& sse,
                            bool md5, bool disable_multipart) {
    auto created = new_client(env, aliased_url);
    if (!created.success) {
        PutResult result;
        result.error = created.error;
        return result;
    }

    apply_lock(metadata, lock);
    auto result = created.client->put(env.cancel, stream, size, metadata, progress, sse, md5,
                                      disable_multipart);
    if (!result.success) {
        result.error = result.error.with_trace({aliased_url});
    }
    return result;
}

PutResult put_target_stream_with_url(const Environment& env, const std::string& aliased_url,
                                     ReadStream& stream, int64_t size, bool md5,
                                     bool disable_multipart, Metadata metadata) {
    metadata["Content-Type"] = guess_content_type(aliased_url);
    return put_target_stream(env, aliased_url, LockSettings{}, stream, size, std::move(metadata),
                             nullptr, env.keys.resolve(aliased_url), md5, disable_multipart);
}

PipelineResult upload_source_to_target(const Environment& env, const TransferRequest& request) {
    const std::string& source_url = request.source_content.url;
    const std::string& target_url = request.target_content.url;
    const auto& target = request.target_content;
    int64_t length = request.source_content.size;

    PipelineResult result;
    result.key = source_url;
    result.target = target_url;
    result.size = length;

    auto fail = [&](const Error& err) {
        result.error = err.with_trace({source_url});
        return result;
    };

    Sse src_sse = env.keys.resolve(source_url);
    Sse tgt_sse = env.keys.resolve(target_url);

    LockSettings lock;
    if (target.retention_enabled) {
        std::string mode;
        if (auto err = parse_retention_mode(target.retention_mode, mode)) {
            return fail(err->with_trace({target_url}));
        }
        TimePoint until;
        if (auto err = retain_until_date(target.retention_duration, until)) {
            return fail(err->with_trace({target_url}));
        }
        lock.mode = mode;
        lock.retain_until = format_rfc3339(until);
    }
    if (target.legal_hold_enabled) {
        if (auto err = validate_legal_hold(target.legal_hold)) {
            return fail(err->with_trace({target.legal_hold}));
        }
        lock.legal_hold = target.legal_hold;
    }

    Metadata metadata;
    layer(metadata, request.source_content.metadata);
    layer(metadata, request.source_content.user_metadata);

    if (request.source_alias == request.target_alias) {
        if (metadata.empty()) {
            if (auto err = get_all_metadata(env, request, src_sse, metadata)) {
                return fail(*err);
            }
        }
        layer(metadata, target.metadata);
        layer(metadata, target.user_metadata);

        if (request.source_content.retention_enabled) {
            if (auto err = put_target_retention(env, target_url, metadata,
                                                target.bypass_governance)) {
                return fail(*err);
            }
            return result;
        }

        auto created = new_client(env, target_url);
        if (!created.success) return fail(created.error);

        Metadata send = filter_metadata(metadata);
        apply_lock(send, lock);
        auto err = created.client->copy(env.cancel, source_url, length, request.progress,
                                        src_sse, tgt_sse, send, request.disable_multipart);
        if (err && err->is(ErrorKind::RetentionConflict) && !lock.mode.empty()) {
            // Nothing but retention changes: update it in place
            log_debug("Copy of %s onto itself, updating retention only", source_url.c_str());
            err = put_target_retention(env, target_url, send, target.bypass_governance);
        }
        if (err) return fail(err->with_trace({target_url}));
        return result;
    }

    if (request.source_content.retention_enabled) {
        if (metadata.empty()) {
            if (auto err = get_all_metadata(env, request, src_sse, metadata)) {
                return fail(*err);
            }
        }
        layer(metadata, target.metadata);
        layer(metadata, target.user_metadata);
        if (auto err = put_target_retention(env, target_url, metadata, target.bypass_governance)) {
            return fail(*err);
        }
        return result;
    }

    auto source = get_source_stream(env, source_url, true, src_sse, request.preserve);
    if (!source.success) return fail(source.error);
    metadata = std::move(source.metadata);
    layer(metadata, target.metadata);
    layer(metadata, target.user_metadata);

    ReadStream& reader = *source.stream;
    PutResult put;
    if (reader.seekable() || length < 0) {
        put = put_target_stream(env, target_url, lock, reader, length, filter_metadata(metadata),
                                request.progress, tgt_sse, request.md5, request.disable_multipart);
    } else {
        LimitedReadStream limited(reader, static_cast<uint64_t>(length));
        put = put_target_stream(env, target_url, lock, limited, length, filter_metadata(metadata),
                                request.progress, tgt_sse, request.md5, request.disable_multipart);
    }
    if (!put.success) return fail(put.error);
    result.size = put.bytes;
    return result;
}

std::string CopyOptions::validate() const {
    if (!retention_mode.empty() && retention_duration.empty()) {
        return "--retention-mode requires --retention-duration";
    }
    if (retention_mode.empty() && !retention_duration.empty()) {
        return "--retention-duration requires --retention-mode";
    }
    if (!retention_mode.empty()) {
        std::string normalized;
        if (auto err = parse_retention_mode(retention_mode, normalized)) return err->message;
        std::chrono::hours validity;
        if (auto err = parse_retention_validity(retention_duration, validity)) return err->message;
    }
    if (!legal_hold.empty()) {
        if (auto err = validate_legal_hold(legal_hold)) return err->message;
    }
    return "";
}

std::optional<Error> parse_attributes(const std::string& text, Metadata& out) {
    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find(';', start);
        if (end == std::string::npos) end = text.size();
        std::string pair = text.substr(start, end - start);
        start = end + 1;
        if (pair.empty()) continue;

        size_t eq = pair.find('=');
        if (eq == std::string::npos || eq == 0) {
            return invalid_argument("attribute '" + pair + "' should be of the form key=value");
        }
        std::string key = pair.substr(0, eq);
        std::string value = pair.substr(eq + 1);
        if (!valid_header_name(key) || !valid_header_value(value)) {
            return invalid_argument("attribute '" + pair + "' is not a valid header");
        }
        out[key] = value;
    }
    return std::nullopt;
}

namespace {

ContentDescriptor target_descriptor(const std::string& url, const CopyOptions& options) {
    ContentDescriptor target;
    target.url = url;
    target.user_metadata = options.attributes;
    if (!options.retention_mode.empty()) {
        target.retention_enabled = true;
        target.retention_mode = options.retention_mode;
        target.retention_duration = options.retention_duration;
    }
    if (!options.legal_hold.empty()) {
        target.legal_hold_enabled = true;
        target.legal_hold = options.legal_hold;
    }
    return target;
}

PipelineResult copy_one(const Environment& env, ContentDescriptor source,
                        const std::string& target_url, const CopyOptions& options) {
    TransferRequest request;
    request.source_alias = split_alias(source.url).first;
    request.target_alias = split_alias(target_url).first;
    // Filesystem sources and targets share the unaliased pseudo-alias
    if (env.resolver.resolve(source.url).is_filesystem()) request.source_alias = "";
    if (env.resolver.resolve(target_url).is_filesystem()) request.target_alias = "";
    request.source_content = std::move(source);
    request.target_content = target_descriptor(target_url, options);
    request.disable_multipart = options.disable_multipart;
    request.md5 = options.md5;
    request.preserve = options.preserve;

    ProgressSink progress;
    request.progress = &progress;

    ScopedTimer timer(env.metrics ? env.metrics->duration("cp") : nullptr);
    auto result = upload_source_to_target(env, request);
    if (result.error) {
        log_error("Failed to copy '%s': %s", result.key.c_str(), result.error->to_string().c_str());
    }
    if (env.metrics) {
        env.metrics->record_object("cp", result.ok() ? "success" : "failure");
        if (result.ok()) env.metrics->record_bytes("cp", progress.total());
    }
    if (options.on_result) options.on_result(result);
    return result;
}

std::optional<Error> copy_source(const Environment& env, const std::string& source,
                                 const std::string& target, bool target_is_container,
                                 const CopyOptions& options) {
    auto st = stat_url(env, source, false, options.preserve);
    if (!st.success) {
        Error err = st.error.with_trace({source});
        log_error("Failed to copy '%s': %s", source.c_str(), err.to_string().c_str());
        return err;
    }

    if (!st.content.is_dir) {
        std::string target_url = target_is_container
            ? join_url(target, basename_of(source)) : target;
        st.content.url = source;
        auto result = copy_one(env, std::move(st.content), target_url, options);
        return result.error;
    }

    if (!options.recursive) {
        Error err = invalid_argument("'" + source + "' is a folder; use --recursive to copy it");
        log_error("%s", err.to_string().c_str());
        return err;
    }

    // "dir/" copies its contents, "dir" copies the folder itself
    std::string target_root = target;
    if (source.back() != '/') target_root = join_url(target, basename_of(source));
    std::string source_root = with_trailing_slash(source);

    auto created = new_client(env, source_root);
    if (!created.success) {
        log_error("Failed to copy '%s': %s", source.c_str(), created.error.to_string().c_str());
        return created.error;
    }

    ListOptions list_options;
    list_options.recursive = true;
    list_options.dir_opt = DirOpt::None;
    auto contents = created.client->list(env.cancel, list_options);

    std::optional<Error> first_error;
    while (auto item = contents->next()) {
        if (auto* err = std::get_if<Error>(&*item)) {
            log_error("Failed to list '%s': %s", source.c_str(), err->to_string().c_str());
            if (!first_error) first_error = *err;
            if (!err->is(ErrorKind::PermissionDenied)) break;
            continue;
        }
        auto& content = std::get<ContentDescriptor>(*item);
        if (content.is_dir) continue;
        if (!content.url.starts_with(source_root)) continue;
        std::string rel = content.url.substr(source_root.size());
        auto result = copy_one(env, content, join_url(target_root, rel), options);
        if (result.error && !first_error) first_error = result.error;
        if (env.cancel.cancelled()) break;
    }
    return first_error;
}

}  // namespace

std::optional<Error> copy_targets(const Environment& env, const std::vector<std::string>& sources,
                                  const std::string& target, const CopyOptions& options) {
    std::string problem = options.validate();
    if (!problem.empty()) {
        return invalid_argument(problem);
    }
    if (sources.empty()) {
        return invalid_argument("no source to copy");
    }

    bool target_is_container = sources.size() > 1 || options.recursive ||
                               is_container_like(env, target);
    if (sources.size() > 1 && !is_container_like(env, target)) {
        return invalid_argument("target '" + target + "' must be a folder when copying " +
                                std::to_string(sources.size()) + " sources");
    }

    std::optional<Error> first_error;
    for (const auto& source : sources) {
        if (env.cancel.cancelled()) break;
        auto err = copy_source(env, source, target, target_is_container, options);
        if (err && !first_error) first_error = err;
    }
    return first_error;
}

}  // namespace objxfer
