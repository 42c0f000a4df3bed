#include "objxfer/s3_client.hpp"
#include "objxfer/constants.hpp"
#include "objxfer/durations.hpp"
#include "objxfer/log.hpp"

#include <algorithm>
#include <future>
#include <set>
#include <sstream>
#include <stdexcept>
#include <tuple>

namespace objxfer {

// ============================================================================
// XML parsing helpers for S3 responses
// ============================================================================

namespace xml {

std::string get_element(const std::string& xml, const std::string& tag, size_t start_pos) {
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    size_t start = xml.find(open_tag, start_pos);
    if (start == std::string::npos) return "";
    start += open_tag.length();

    size_t end = xml.find(close_tag, start);
    if (end == std::string::npos) return "";

    return xml.substr(start, end - start);
}

std::vector<std::string> find_elements(const std::string& xml, const std::string& tag) {
    std::vector<std::string> results;
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    size_t pos = 0;
    while (pos < xml.size()) {
        size_t start = xml.find(open_tag, pos);
        if (start == std::string::npos) break;

        size_t content_start = start + open_tag.length();
        size_t end = xml.find(close_tag, content_start);
        if (end == std::string::npos) break;

        results.push_back(xml.substr(content_start, end - content_start));
        pos = end + close_tag.length();
    }

    return results;
}

std::string decode_entities(const std::string& s) {
    std::string result;
    result.reserve(s.size());

    size_t i = 0;
    while (i < s.size()) {
        if (s[i] == '&') {
            if (s.compare(i, 4, "&lt;") == 0) { result += '<'; i += 4; }
            else if (s.compare(i, 4, "&gt;") == 0) { result += '>'; i += 4; }
            else if (s.compare(i, 5, "&amp;") == 0) { result += '&'; i += 5; }
            else if (s.compare(i, 6, "&quot;") == 0) { result += '"'; i += 6; }
            else if (s.compare(i, 6, "&apos;") == 0) { result += '\''; i += 6; }
            else { result += s[i++]; }  // unknown entity, keep as-is
        } else {
            result += s[i++];
        }
    }

    return result;
}

std::string escape(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': result += "&amp;"; break;
            case '<': result += "&lt;"; break;
            case '>': result += "&gt;"; break;
            case '"': result += "&quot;"; break;
            case '\'': result += "&apos;"; break;
            default: result += c;
        }
    }
    return result;
}

}  // namespace xml

// ============================================================================
// Error mapping
// ============================================================================

static Error error_from_code(const std::string& code, const std::string& message, int status,
                             const std::string& resource) {
    std::string text = code.empty() ? "HTTP " + std::to_string(status) : code;
    if (!message.empty()) text += ": " + message;
    text = resource + ": " + text;

    if (code == "NoSuchKey" || code == "NoSuchBucket" || code == "NoSuchUpload" ||
        code == "NotFound") {
        return not_found(text);
    }
    if (code == "AccessDenied" || code == "AllAccessDisabled" || code == "InvalidAccessKeyId") {
        return permission_denied(text);
    }
    if (code == "InvalidRequest") {
        // Server-side copy onto itself without changes: only retention can be updated
        if (message.find("copy") != std::string::npos &&
            message.find("itself") != std::string::npos) {
            return Error(ErrorKind::RetentionConflict, text);
        }
        if (status == 409) {
            return Error(ErrorKind::RetentionConflict, text);
        }
        return invalid_argument(text);
    }
    if (code == "InvalidArgument" || code == "InvalidBucketName" || code == "KeyTooLongError" ||
        code == "InvalidDigest" || code == "MalformedXML" || code == "EntityTooLarge") {
        return invalid_argument(text);
    }

    switch (status) {
        case 404: return not_found(text);
        case 403: return permission_denied(text);
        case 400: return invalid_argument(text);
        default: return backend_failure(text);
    }
}

Error s3_error(const net::HttpResponse& response, const std::string& resource) {
    if (response.is_network_error) {
        return backend_failure(resource + ": " + response.error);
    }
    std::string body = response.body_string();
    std::string code = xml::get_element(body, "Code");
    std::string message = xml::decode_entities(xml::get_element(body, "Message"));
    return error_from_code(code, message, response.status_code, resource);
}

std::optional<uint64_t> parse_content_range_total(const std::string& value) {
    size_t slash = value.rfind('/');
    if (slash == std::string::npos || slash + 1 >= value.size()) return std::nullopt;
    std::string total = value.substr(slash + 1);
    if (total.find_first_not_of("0123456789") != std::string::npos) return std::nullopt;
    try {
        return std::stoull(total);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

// ============================================================================
// Ranged object reads
// ============================================================================

RangedObjectReadStream::RangedObjectReadStream(FetchRange fetch, ContentDescriptor info,
                                               uint64_t range_size)
    : fetch_(std::move(fetch))
    , info_(std::move(info))
    , size_(static_cast<uint64_t>(std::max<int64_t>(info_.size, 0)))
    , range_size_(std::max<uint64_t>(range_size, 1)) {}

void RangedObjectReadStream::prime(uint64_t offset, std::vector<uint8_t> data) {
    buffer_start_ = offset;
    buffer_ = std::move(data);
}

std::optional<Error> RangedObjectReadStream::read(std::span<uint8_t> buffer, size_t& n) {
    n = 0;
    if (buffer.empty() || position_ >= size_) return std::nullopt;

    if (position_ < buffer_start_ || position_ >= buffer_start_ + buffer_.size()) {
        uint64_t last = std::min(position_ + range_size_, size_) - 1;
        std::vector<uint8_t> body;
        if (auto err = fetch_(position_, last, body)) {
            return err;
        }
        if (body.empty()) {
            return backend_failure(info_.url + ": object ended at byte " +
                                   std::to_string(position_) + " of " + std::to_string(size_));
        }
        buffer_.clear();
        buffer_.shrink_to_fit();
        prime(position_, std::move(body));
    }

    size_t offset = static_cast<size_t>(position_ - buffer_start_);
    n = std::min(buffer.size(), buffer_.size() - offset);
    std::copy_n(buffer_.begin() + static_cast<std::ptrdiff_t>(offset), n, buffer.begin());
    position_ += n;
    return std::nullopt;
}

std::optional<Error> RangedObjectReadStream::seek(uint64_t offset) {
    if (offset > size_) {
        return invalid_argument("seek offset " + std::to_string(offset) +
                                " beyond end of " + info_.url);
    }
    position_ = offset;
    return std::nullopt;
}

// ============================================================================
// Request helpers shared with worker threads
// ============================================================================

namespace {

enum class SseUse { Write, Read, CopySource };

struct ListPage {
    bool success = false;
    std::vector<ContentDescriptor> objects;
    std::vector<ContentDescriptor> prefixes;
    bool truncated = false;
    std::string continuation_token;
    Error error;
};

struct Upload {
    std::string key;
    std::string upload_id;
    TimePoint initiated{};
};

struct UploadsPage {
    bool success = false;
    std::vector<Upload> uploads;
    bool truncated = false;
    std::string next_key_marker;
    std::string next_upload_id_marker;
    Error error;
};

std::string strip_quotes(const std::string& etag) {
    std::string result = etag;
    if (!result.empty() && result.front() == '"') result.erase(0, 1);
    if (!result.empty() && result.back() == '"') result.pop_back();
    return result;
}

// Ensure ETag has surrounding quotes (required for CompleteMultipartUpload)
std::string ensure_etag_quotes(const std::string& etag) {
    if (etag.empty()) return etag;
    std::string result = etag;
    if (result.front() != '"') result = "\"" + result;
    if (result.back() != '"') result += "\"";
    return result;
}

std::pair<std::string, std::string> split_bucket_key(const std::string& path) {
    size_t slash = path.find('/');
    if (slash == std::string::npos) return {path, ""};
    return {path.substr(0, slash), path.substr(slash + 1)};
}

bool is_standard_header(const std::string& canonical) {
    static const std::set<std::string> standard = {
        "Content-Type", "Cache-Control", "Content-Encoding", "Content-Disposition",
        "Content-Language", "Expires", "X-Amz-Storage-Class",
        "X-Amz-Website-Redirect-Location", "X-Amz-Tagging",
    };
    return standard.count(canonical) > 0;
}

ContentDescriptor descriptor_from_headers(const std::string& url, const net::HttpHeaders& headers) {
    ContentDescriptor content;
    content.url = url;
    content.size = static_cast<int64_t>(headers.content_length().value_or(0));
    if (auto lm = headers.get("Last-Modified")) {
        if (auto t = parse_http_date(*lm)) content.time = *t;
    }
    content.etag = strip_quotes(headers.get("ETag").value_or(""));
    content.storage_class = headers.get("x-amz-storage-class").value_or("STANDARD");
    if (auto expires = headers.get("Expires")) {
        if (auto t = parse_http_date(*expires)) content.expires = *t;
    }

    for (const auto& [name, value] : headers.all()) {
        std::string canonical = canonical_header_key(name);
        if (canonical.starts_with("X-Amz-Meta-")) {
            content.user_metadata[canonical] = value;
        } else if (canonical.starts_with("X-Amz-Object-Lock-") ||
                   canonical.starts_with(constants::SERVER_ENCRYPTION_KEY_PREFIX) ||
                   (is_standard_header(canonical) && canonical != "X-Amz-Storage-Class")) {
            content.metadata[canonical] = value;
        }
    }
    if (!content.metadata.count("Content-Type")) {
        content.metadata["Content-Type"] = constants::DEFAULT_CONTENT_TYPE;
    }
    return content;
}

}  // namespace

struct S3Client::Shared {
    std::string alias;
    AliasConfig config;
    net::AwsSigV4Signer signer;
    net::HttpClient http;

    static net::HttpClientConfig http_config(const AliasConfig& cfg) {
        net::HttpClientConfig hc;
        hc.user_agent = constants::USER_AGENT;
        hc.verify_ssl_by_default = cfg.verify_ssl;
        hc.connect_timeout = std::chrono::seconds(constants::DEFAULT_HTTP_CONNECT_TIMEOUT_SECONDS);
        hc.total_timeout = std::chrono::seconds(constants::DEFAULT_HTTP_REQUEST_TIMEOUT_SECONDS);
        hc.max_retries = constants::DEFAULT_HTTP_MAX_RETRIES;
        return hc;
    }

    Shared(std::string alias_name, const AliasConfig& cfg)
        : alias(std::move(alias_name))
        , config(cfg)
        , signer(cfg.access_key, cfg.secret_key, cfg.region, "s3")
        , http(http_config(cfg)) {}

    std::string aliased(const std::string& bucket, const std::string& key) const {
        std::string url = alias + "/" + bucket;
        if (!key.empty()) url += "/" + key;
        return url;
    }

    std::string build_url(const std::string& bucket, const std::string& key,
                          const std::string& query = "") const {
        std::string url;
        if (bucket.empty()) {
            url = config.url + "/";
        } else if (config.path_style) {
            url = config.url + "/" + net::url_encode_path(bucket);
            if (!key.empty()) url += "/" + net::url_encode_path(key);
        } else {
            auto parsed = net::ParsedUrl::parse(config.url);
            std::string scheme = parsed ? parsed->scheme : "https";
            std::string authority = parsed ? parsed->authority() : config.url;
            url = scheme + "://" + bucket + "." + authority + "/" + net::url_encode_path(key);
        }
        if (!query.empty()) url += "?" + query;
        return url;
    }

    net::HttpResponse execute(net::HttpRequest& request) {
        request.verify_ssl = config.verify_ssl;
        if (!config.access_key.empty()) {
            if (!config.session_token.empty()) {
                signer.sign_with_token(request, config.session_token);
            } else {
                signer.sign(request);
            }
        }
        return http.execute_with_retry(request);
    }

    static void apply_sse(net::HttpRequest& request, const Sse& sse, SseUse use) {
        if (!sse) return;
        if (sse->type == SseType::S3) {
            if (use == SseUse::Write) {
                request.headers.set("x-amz-server-side-encryption", "AES256");
            }
            return;
        }
        std::string prefix = use == SseUse::CopySource
            ? "x-amz-copy-source-server-side-encryption-customer-"
            : "x-amz-server-side-encryption-customer-";
        std::span<const uint8_t> key(sse->key);
        request.headers.set(prefix + "algorithm", "AES256");
        request.headers.set(prefix + "key", net::base64_encode(key));
        request.headers.set(prefix + "key-md5", net::md5_base64(key));
    }

    static void apply_metadata(net::HttpRequest& request, const Metadata& metadata) {
        for (const auto& [k, v] : metadata) {
            std::string canonical = canonical_header_key(k);
            if (is_standard_header(canonical) || canonical.starts_with("X-Amz-Meta-")) {
                request.headers.set(canonical, v);
            } else if (canonical.starts_with("X-Amz-")) {
                request.headers.set(canonical, v);
            } else {
                request.headers.set("X-Amz-Meta-" + k, v);
            }
        }
        if (!request.headers.has("Content-Type")) {
            request.headers.set_content_type(constants::DEFAULT_CONTENT_TYPE);
        }
    }

    static void apply_lock(net::HttpRequest& request, const LockSettings& lock) {
        if (!lock.mode.empty()) request.headers.set("x-amz-object-lock-mode", lock.mode);
        if (!lock.retain_until.empty()) {
            request.headers.set("x-amz-object-lock-retain-until-date", lock.retain_until);
        }
        if (!lock.legal_hold.empty()) {
            request.headers.set("x-amz-object-lock-legal-hold", lock.legal_hold);
        }
    }

    StatResult head_object(const std::string& bucket, const std::string& key, const Sse& sse) {
        StatResult result;
        auto request = net::HttpRequest::head(build_url(bucket, key));
        apply_sse(request, sse, SseUse::Read);
        auto response = execute(request);
        if (!response.ok()) {
            result.error = s3_error(response, aliased(bucket, key));
            return result;
        }
        result.content = descriptor_from_headers(aliased(bucket, key), response.headers);
        result.success = true;
        return result;
    }

    ListPage list_page(const std::string& bucket, const std::string& prefix, bool recursive,
                       const std::string& token, uint32_t max_keys) {
        ListPage page;
        std::vector<std::string> params;
        params.push_back("list-type=2");
        if (!prefix.empty()) params.push_back("prefix=" + net::url_encode(prefix));
        if (!recursive) params.push_back("delimiter=" + net::url_encode("/"));
        params.push_back("max-keys=" + std::to_string(max_keys));
        if (!token.empty()) params.push_back("continuation-token=" + net::url_encode(token));

        std::string query;
        for (size_t i = 0; i < params.size(); ++i) {
            if (i > 0) query += "&";
            query += params[i];
        }

        auto request = net::HttpRequest::get(build_url(bucket, "", query));
        auto response = execute(request);
        if (!response.ok()) {
            page.error = s3_error(response, aliased(bucket, prefix));
            return page;
        }

        std::string body = response.body_string();
        page.truncated = xml::get_element(body, "IsTruncated") == "true";
        page.continuation_token = xml::decode_entities(xml::get_element(body, "NextContinuationToken"));

        for (const auto& item : xml::find_elements(body, "Contents")) {
            ContentDescriptor content;
            std::string key = xml::decode_entities(xml::get_element(item, "Key"));
            content.url = aliased(bucket, key);
            std::string size_str = xml::get_element(item, "Size");
            if (!size_str.empty()) {
                try {
                    content.size = std::stoll(size_str);
                } catch (const std::exception&) {
                    // Leave size at zero for a malformed listing entry
                }
            }
            if (auto t = parse_rfc3339(xml::get_element(item, "LastModified"))) {
                content.time = *t;
            }
            content.etag = strip_quotes(xml::decode_entities(xml::get_element(item, "ETag")));
            content.storage_class = xml::get_element(item, "StorageClass");
            page.objects.push_back(std::move(content));
        }

        for (const auto& item : xml::find_elements(body, "CommonPrefixes")) {
            ContentDescriptor content;
            content.url = aliased(bucket, xml::decode_entities(xml::get_element(item, "Prefix")));
            content.is_dir = true;
            page.prefixes.push_back(std::move(content));
        }

        page.success = true;
        return page;
    }

    UploadsPage list_uploads(const std::string& bucket, const std::string& prefix,
                             const std::string& key_marker, const std::string& upload_id_marker) {
        UploadsPage page;
        std::string query = "uploads";
        if (!key_marker.empty()) query += "&key-marker=" + net::url_encode(key_marker);
        if (!prefix.empty()) query += "&prefix=" + net::url_encode(prefix);
        if (!upload_id_marker.empty()) {
            query += "&upload-id-marker=" + net::url_encode(upload_id_marker);
        }

        auto request = net::HttpRequest::get(build_url(bucket, "", query));
        auto response = execute(request);
        if (!response.ok()) {
            page.error = s3_error(response, aliased(bucket, prefix));
            return page;
        }

        std::string body = response.body_string();
        page.truncated = xml::get_element(body, "IsTruncated") == "true";
        page.next_key_marker = xml::decode_entities(xml::get_element(body, "NextKeyMarker"));
        page.next_upload_id_marker = xml::get_element(body, "NextUploadIdMarker");
        for (const auto& item : xml::find_elements(body, "Upload")) {
            Upload upload;
            upload.key = xml::decode_entities(xml::get_element(item, "Key"));
            upload.upload_id = xml::get_element(item, "UploadId");
            if (auto t = parse_rfc3339(xml::get_element(item, "Initiated"))) {
                upload.initiated = *t;
            }
            page.uploads.push_back(std::move(upload));
        }
        page.success = true;
        return page;
    }

    std::optional<Error> abort_upload(const std::string& bucket, const std::string& key,
                                      const std::string& upload_id) {
        auto request = net::HttpRequest::del(
            build_url(bucket, key, "uploadId=" + net::url_encode(upload_id)));
        auto response = execute(request);
        if (!response.ok()) {
            return s3_error(response, aliased(bucket, key));
        }
        return std::nullopt;
    }

    // Abort every in-progress upload of exactly this key.
    std::optional<Error> abort_uploads_for(const std::string& bucket, const std::string& key) {
        std::string key_marker;
        std::string id_marker;
        bool found = false;
        while (true) {
            auto page = list_uploads(bucket, key, key_marker, id_marker);
            if (!page.success) return page.error;
            for (const auto& upload : page.uploads) {
                if (upload.key != key) continue;
                found = true;
                if (auto err = abort_upload(bucket, key, upload.upload_id)) return err;
            }
            if (!page.truncated) break;
            key_marker = page.next_key_marker;
            id_marker = page.next_upload_id_marker;
        }
        if (!found) {
            return not_found(aliased(bucket, key) + ": no incomplete upload found");
        }
        return std::nullopt;
    }

    std::optional<Error> delete_object(const std::string& bucket, const std::string& key,
                                       bool bypass) {
        auto request = net::HttpRequest::del(build_url(bucket, key));
        if (bypass) request.headers.set("x-amz-bypass-governance-retention", "true");
        auto response = execute(request);
        if (!response.ok()) {
            return s3_error(response, aliased(bucket, key));
        }
        return std::nullopt;
    }

    // Multi-object delete; returns one error per key that could not be removed.
    std::vector<Error> delete_objects(const std::string& bucket,
                                      const std::vector<std::string>& keys, bool bypass) {
        std::vector<Error> failed;
        if (keys.empty()) return failed;

        std::ostringstream body;
        body << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
        body << "<Delete xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">\n";
        body << "  <Quiet>true</Quiet>\n";
        for (const auto& key : keys) {
            body << "  <Object><Key>" << xml::escape(key) << "</Key></Object>\n";
        }
        body << "</Delete>";

        auto request = net::HttpRequest::post(build_url(bucket, "", "delete"), body.str());
        request.headers.set_content_type("application/xml");
        request.headers.set("Content-MD5", net::md5_base64(std::span<const uint8_t>(request.body)));
        if (bypass) request.headers.set("x-amz-bypass-governance-retention", "true");

        auto response = execute(request);
        if (!response.ok()) {
            Error err = s3_error(response, aliased(bucket, ""));
            for (const auto& key : keys) {
                failed.push_back(err.with_trace({aliased(bucket, key)}));
            }
            return failed;
        }

        std::string result = response.body_string();
        for (const auto& item : xml::find_elements(result, "Error")) {
            std::string key = xml::decode_entities(xml::get_element(item, "Key"));
            std::string code = xml::get_element(item, "Code");
            std::string message = xml::decode_entities(xml::get_element(item, "Message"));
            failed.push_back(error_from_code(code, message, 0, aliased(bucket, key)));
        }
        return failed;
    }

    std::optional<Error> delete_bucket(const std::string& bucket) {
        auto request = net::HttpRequest::del(build_url(bucket, ""));
        auto response = execute(request);
        if (!response.ok()) {
            return s3_error(response, aliased(bucket, ""));
        }
        return std::nullopt;
    }

    std::string initiate_multipart(const std::string& bucket, const std::string& key,
                                   const Metadata& metadata, const LockSettings& lock,
                                   const Sse& sse, Error& error) {
        auto request = net::HttpRequest::post(build_url(bucket, key, "uploads"), "");
        apply_metadata(request, metadata);
        apply_lock(request, lock);
        apply_sse(request, sse, SseUse::Write);
        auto response = execute(request);
        if (!response.ok()) {
            error = s3_error(response, aliased(bucket, key));
            return "";
        }
        std::string upload_id = xml::get_element(response.body_string(), "UploadId");
        if (upload_id.empty()) {
            error = backend_failure(aliased(bucket, key) + ": missing UploadId in response");
        }
        return upload_id;
    }

    // Returns the part ETag (quoted), empty on failure
    std::string upload_part(const std::string& bucket, const std::string& key,
                            const std::string& upload_id, int part_number,
                            std::vector<uint8_t> data, const Sse& sse, bool md5, Error& error) {
        std::string query = "partNumber=" + std::to_string(part_number) +
                            "&uploadId=" + net::url_encode(upload_id);
        auto request = net::HttpRequest::put(build_url(bucket, key, query), std::move(data));
        if (md5) {
            request.headers.set("Content-MD5", net::md5_base64(std::span<const uint8_t>(request.body)));
        }
        if (sse && sse->type == SseType::Customer) apply_sse(request, sse, SseUse::Read);
        auto response = execute(request);
        if (!response.ok()) {
            error = s3_error(response, aliased(bucket, key));
            return "";
        }
        return ensure_etag_quotes(response.headers.get("ETag").value_or(""));
    }

    std::string upload_part_copy(const std::string& bucket, const std::string& key,
                                 const std::string& upload_id, int part_number,
                                 const std::string& copy_source, uint64_t start, uint64_t end,
                                 const Sse& src_sse, const Sse& tgt_sse, Error& error) {
        std::string query = "partNumber=" + std::to_string(part_number) +
                            "&uploadId=" + net::url_encode(upload_id);
        auto request = net::HttpRequest::put(build_url(bucket, key, query), {});
        request.headers.set("x-amz-copy-source", copy_source);
        request.headers.set("x-amz-copy-source-range",
                            "bytes=" + std::to_string(start) + "-" + std::to_string(end));
        apply_sse(request, src_sse, SseUse::CopySource);
        if (tgt_sse && tgt_sse->type == SseType::Customer) apply_sse(request, tgt_sse, SseUse::Read);
        auto response = execute(request);
        std::string body = response.body_string();
        if (!response.ok() || body.find("<Error>") != std::string::npos) {
            error = s3_error(response, aliased(bucket, key));
            return "";
        }
        return ensure_etag_quotes(xml::decode_entities(xml::get_element(body, "ETag")));
    }

    std::optional<Error> complete_multipart(const std::string& bucket, const std::string& key,
                                            const std::string& upload_id,
                                            const std::vector<std::pair<int, std::string>>& parts) {
        std::ostringstream body;
        body << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
        body << "<CompleteMultipartUpload xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">\n";
        for (const auto& [part_num, etag] : parts) {
            body << "  <Part>\n";
            body << "    <PartNumber>" << part_num << "</PartNumber>\n";
            body << "    <ETag>" << xml::escape(etag) << "</ETag>\n";
            body << "  </Part>\n";
        }
        body << "</CompleteMultipartUpload>";

        auto request = net::HttpRequest::post(
            build_url(bucket, key, "uploadId=" + net::url_encode(upload_id)), body.str());
        request.headers.set_content_type("application/xml");
        auto response = execute(request);
        // Completion can fail with 200 and an <Error> body
        if (!response.ok() || response.body_string().find("<Error>") != std::string::npos) {
            return s3_error(response, aliased(bucket, key));
        }
        return std::nullopt;
    }
};

// ============================================================================
// S3Client
// ============================================================================

S3Client::S3Client(Location location) : location_(std::move(location)) {
    std::tie(bucket_, key_) = split_bucket_key(location_.path);
    shared_ = std::make_shared<Shared>(location_.alias, location_.config.value_or(AliasConfig{}));
}

StatResult S3Client::stat(const CancellationToken& /*cancel*/, bool incomplete,
                          bool /*preserve*/, const Sse& sse) {
    StatResult result;
    if (bucket_.empty()) {
        result.error = invalid_argument("'" + location_.aliased_url +
                                        "' names an alias, not a bucket or object");
        return result;
    }

    auto prefix_exists = [&](const std::string& prefix, ContentDescriptor& out) {
        auto page = shared_->list_page(bucket_, prefix, false, "", 1);
        if (!page.success || (page.objects.empty() && page.prefixes.empty())) return false;
        out = ContentDescriptor{};
        out.url = shared_->aliased(bucket_, prefix);
        out.is_dir = true;
        return true;
    };

    if (key_.empty()) {
        auto request = net::HttpRequest::head(shared_->build_url(bucket_, ""));
        auto response = shared_->execute(request);
        if (!response.ok()) {
            result.error = s3_error(response, shared_->aliased(bucket_, ""));
            return result;
        }
        result.content.url = shared_->aliased(bucket_, "") + "/";
        result.content.is_dir = true;
        result.success = true;
        return result;
    }

    if (incomplete) {
        auto page = shared_->list_uploads(bucket_, key_, "", "");
        if (!page.success) {
            result.error = page.error;
            return result;
        }
        for (const auto& upload : page.uploads) {
            if (upload.key != key_) continue;
            result.content.url = shared_->aliased(bucket_, key_);
            result.content.time = upload.initiated;
            result.success = true;
            return result;
        }
        result.error = not_found(location_.aliased_url + ": no incomplete upload found");
        return result;
    }

    if (key_.back() == '/') {
        if (prefix_exists(key_, result.content)) {
            result.success = true;
        } else {
            result.error = not_found(location_.aliased_url + ": prefix does not exist");
        }
        return result;
    }

    result = shared_->head_object(bucket_, key_, sse);
    if (!result.success && result.error.is(ErrorKind::NotFound)) {
        ContentDescriptor dir;
        if (prefix_exists(key_ + "/", dir)) {
            result.content = dir;
            result.success = true;
        }
    }
    return result;
}

std::unique_ptr<ContentStream> S3Client::list(const CancellationToken& cancel,
                                              const ListOptions& options) {
    auto shared = shared_;
    std::string bucket = bucket_;
    std::string key = key_;
    return std::make_unique<ContentStream>(
        constants::LIST_QUEUE_DEPTH,
        [shared, bucket, key, options, cancel](Channel<ListItem>& out) {
            CancelRegistration registration(cancel, [&out]() { out.close(); });

            // Returns false when the consumer went away or the listing failed.
            auto list_bucket = [&](const std::string& b, const std::string& prefix) -> bool {
                if (options.incomplete) {
                    std::string key_marker;
                    std::string id_marker;
                    while (!cancel.cancelled()) {
                        auto page = shared->list_uploads(b, prefix, key_marker, id_marker);
                        if (!page.success) {
                            out.send(page.error);
                            return false;
                        }
                        for (const auto& upload : page.uploads) {
                            ContentDescriptor content;
                            content.url = shared->aliased(b, upload.key);
                            content.time = upload.initiated;
                            if (!out.send(std::move(content))) return false;
                        }
                        if (!page.truncated) return true;
                        key_marker = page.next_key_marker;
                        id_marker = page.next_upload_id_marker;
                    }
                    return false;
                }

                std::string token;
                while (!cancel.cancelled()) {
                    auto page = shared->list_page(b, prefix, options.recursive, token,
                                                  constants::LIST_PAGE_SIZE);
                    if (!page.success) {
                        out.send(page.error);
                        return false;
                    }
                    for (auto& content : page.objects) {
                        if (options.fetch_meta) {
                            auto [ob, ok] = split_bucket_key(split_alias(content.url).second);
                            auto st = shared->head_object(ob, ok, std::nullopt);
                            if (st.success) {
                                st.content.url = content.url;
                                st.content.storage_class = content.storage_class;
                                content = std::move(st.content);
                            } else if (!out.send(st.error)) {
                                return false;
                            }
                        }
                        if (!out.send(std::move(content))) return false;
                    }
                    if (options.dir_opt != DirOpt::None) {
                        for (auto& dir : page.prefixes) {
                            if (!out.send(std::move(dir))) return false;
                        }
                    }
                    if (!page.truncated) return true;
                    token = page.continuation_token;
                }
                return false;
            };

            if (!bucket.empty()) {
                list_bucket(bucket, key);
                return;
            }

            // Alias root: enumerate buckets
            auto request = net::HttpRequest::get(shared->build_url("", ""));
            auto response = shared->execute(request);
            if (!response.ok()) {
                out.send(s3_error(response, shared->alias));
                return;
            }
            std::string body = response.body_string();
            for (const auto& item : xml::find_elements(body, "Bucket")) {
                if (cancel.cancelled()) return;
                std::string name = xml::get_element(item, "Name");
                ContentDescriptor dir;
                dir.url = shared->aliased(name, "") + "/";
                dir.is_dir = true;
                if (auto t = parse_rfc3339(xml::get_element(item, "CreationDate"))) {
                    dir.time = *t;
                }
                if (!options.recursive) {
                    if (!out.send(std::move(dir))) return;
                    continue;
                }
                if (options.dir_opt == DirOpt::First && !out.send(dir)) return;
                if (!list_bucket(name, "")) return;
                if (options.dir_opt == DirOpt::Last && !out.send(dir)) return;
            }
        });
}

GetResult S3Client::get(const CancellationToken& cancel, const Sse& sse) {
    GetResult result;
    if (key_.empty()) {
        result.error = invalid_argument("'" + location_.aliased_url + "' is not an object");
        return result;
    }

    auto shared = shared_;
    std::string bucket = bucket_;
    std::string key = key_;
    std::string resource = location_.aliased_url;
    auto range_request = [shared, bucket, key, sse](uint64_t first, uint64_t last,
                                                     const std::string& etag) {
        auto request = net::HttpRequest::get(shared->build_url(bucket, key));
        request.headers.set("Range",
                            "bytes=" + std::to_string(first) + "-" + std::to_string(last));
        // A concurrent overwrite fails the read instead of mixing versions
        if (!etag.empty()) request.headers.set("If-Match", ensure_etag_quotes(etag));
        Shared::apply_sse(request, sse, SseUse::Read);
        return shared->execute(request);
    };

    auto response = range_request(0, constants::GET_RANGE_SIZE - 1, "");
    if (response.status_code == 416) {
        // Zero-length objects have no satisfiable range
        auto request = net::HttpRequest::get(shared_->build_url(bucket_, key_));
        Shared::apply_sse(request, sse, SseUse::Read);
        response = shared_->execute(request);
    }
    if (!response.ok()) {
        result.error = s3_error(response, resource);
        return result;
    }

    auto info = descriptor_from_headers(resource, response.headers);
    if (response.status_code != 206) {
        // The whole body came back in one response
        result.stream = std::make_unique<MemoryReadStream>(std::move(response.body),
                                                           std::move(info));
        result.success = true;
        return result;
    }

    auto total = parse_content_range_total(response.headers.get("Content-Range").value_or(""));
    if (!total) {
        result.error = backend_failure(resource + ": missing object size in Content-Range");
        return result;
    }
    info.size = static_cast<int64_t>(*total);

    std::string etag = info.etag;
    auto fetch = [range_request, cancel, resource, etag](uint64_t first, uint64_t last,
                                                          std::vector<uint8_t>& body)
        -> std::optional<Error> {
        if (cancel.cancelled()) {
            return backend_failure("download of " + resource + " cancelled");
        }
        auto ranged = range_request(first, last, etag);
        if (!ranged.ok()) return s3_error(ranged, resource);
        body = std::move(ranged.body);
        return std::nullopt;
    };
    auto stream = std::make_unique<RangedObjectReadStream>(std::move(fetch), std::move(info));
    stream->prime(0, std::move(response.body));
    result.stream = std::move(stream);
    result.success = true;
    return result;
}

PutResult S3Client::put(const CancellationToken& cancel, ReadStream& stream, int64_t size,
                        const Metadata& metadata, ProgressSink* progress, const Sse& sse,
                        bool md5, bool disable_multipart) {
    PutResult result;
    if (key_.empty()) {
        result.error = invalid_argument("'" + location_.aliased_url +
                                        "' does not name an object; an object key is required");
        return result;
    }

    LockSettings lock;
    Metadata headers = extract_lock_settings(metadata, lock);

    uint64_t part_size = constants::DEFAULT_MULTIPART_PART_SIZE;
    if (size > 0) {
        // Stay within the 10000 part limit
        part_size = std::max<uint64_t>(part_size, (static_cast<uint64_t>(size) + 9999) / 10000);
    }

    bool multipart = !disable_multipart &&
                     (size < 0 || static_cast<uint64_t>(size) > constants::DEFAULT_MULTIPART_THRESHOLD);

    auto single_put = [&](std::vector<uint8_t> data) {
        auto request = net::HttpRequest::put(shared_->build_url(bucket_, key_), std::move(data));
        Shared::apply_metadata(request, headers);
        Shared::apply_lock(request, lock);
        Shared::apply_sse(request, sse, SseUse::Write);
        if (md5) {
            request.headers.set("Content-MD5",
                                net::md5_base64(std::span<const uint8_t>(request.body)));
        }
        int64_t n = static_cast<int64_t>(request.body.size());
        auto response = shared_->execute(request);
        if (!response.ok()) {
            result.error = s3_error(response, location_.aliased_url);
            return;
        }
        if (progress) progress->add(static_cast<uint64_t>(n));
        result.bytes = n;
        result.success = true;
    };

    if (!multipart) {
        std::vector<uint8_t> data;
        if (size >= 0) {
            data.resize(static_cast<size_t>(size));
            size_t n = 0;
            if (auto err = read_full(stream, data, n)) {
                result.error = *err;
                return result;
            }
            if (n != data.size()) {
                result.error = backend_failure("unexpected end of input: read " + std::to_string(n) +
                                               " of " + std::to_string(size) + " bytes");
                return result;
            }
        } else {
            std::vector<uint8_t> buffer(constants::STREAM_BUFFER_SIZE);
            while (true) {
                size_t n = 0;
                if (auto err = stream.read(buffer, n)) {
                    result.error = *err;
                    return result;
                }
                if (n == 0) break;
                data.insert(data.end(), buffer.begin(), buffer.begin() + static_cast<ptrdiff_t>(n));
            }
        }
        single_put(std::move(data));
        return result;
    }

    // First part decides: a stream that ends inside it goes up in one request
    std::vector<uint8_t> first(part_size);
    size_t first_n = 0;
    if (auto err = read_full(stream, first, first_n)) {
        result.error = *err;
        return result;
    }
    if (first_n < part_size) {
        first.resize(first_n);
        if (size >= 0 && static_cast<int64_t>(first_n) != size) {
            result.error = backend_failure("unexpected end of input: read " +
                                           std::to_string(first_n) + " of " +
                                           std::to_string(size) + " bytes");
            return result;
        }
        single_put(std::move(first));
        return result;
    }

    Error init_error;
    std::string upload_id = shared_->initiate_multipart(bucket_, key_, headers, lock, sse, init_error);
    if (upload_id.empty()) {
        result.error = init_error;
        return result;
    }

    auto fail = [&](Error err) {
        if (auto abort_err = shared_->abort_upload(bucket_, key_, upload_id)) {
            log_warn("Failed to abort upload %s: %s", upload_id.c_str(),
                     abort_err->to_string().c_str());
        }
        result.error = std::move(err);
        return result;
    };

    std::vector<std::pair<int, std::string>> part_etags;
    int part_number = 1;
    int64_t total = 0;
    bool eof = false;
    std::vector<uint8_t> pending = std::move(first);

    while (!eof) {
        if (cancel.cancelled()) {
            return fail(backend_failure("upload to " + location_.aliased_url + " cancelled"));
        }

        // Read up to one batch of parts, then upload them in parallel
        std::vector<std::vector<uint8_t>> batch;
        if (!pending.empty()) batch.push_back(std::move(pending));
        pending.clear();
        while (batch.size() < constants::DEFAULT_UPLOAD_CONCURRENCY) {
            std::vector<uint8_t> chunk(part_size);
            size_t n = 0;
            if (auto err = read_full(stream, chunk, n)) {
                return fail(*err);
            }
            if (n == 0) {
                eof = true;
                break;
            }
            chunk.resize(n);
            batch.push_back(std::move(chunk));
            if (n < part_size) {
                eof = true;
                break;
            }
        }

        std::vector<std::future<std::pair<std::string, Error>>> futures;
        std::vector<int> numbers;
        for (auto& chunk : batch) {
            total += static_cast<int64_t>(chunk.size());
            uint64_t chunk_size = chunk.size();
            int num = part_number++;
            numbers.push_back(num);
            auto shared = shared_;
            futures.push_back(std::async(std::launch::async,
                [shared, this, &upload_id, num, data = std::move(chunk), &sse, md5, progress,
                 chunk_size]() mutable -> std::pair<std::string, Error> {
                    Error err;
                    std::string etag = shared->upload_part(bucket_, key_, upload_id, num,
                                                           std::move(data), sse, md5, err);
                    if (!etag.empty() && progress) progress->add(chunk_size);
                    return {etag, err};
                }));
        }

        std::optional<Error> batch_error;
        for (size_t i = 0; i < futures.size(); ++i) {
            auto [etag, err] = futures[i].get();
            if (etag.empty()) {
                if (!batch_error) batch_error = err;
            } else {
                part_etags.emplace_back(numbers[i], etag);
            }
        }
        if (batch_error) {
            return fail(*batch_error);
        }
    }

    if (size >= 0 && total != size) {
        return fail(backend_failure("unexpected end of input: read " + std::to_string(total) +
                                    " of " + std::to_string(size) + " bytes"));
    }

    if (auto err = shared_->complete_multipart(bucket_, key_, upload_id, part_etags)) {
        return fail(*err);
    }

    result.bytes = total;
    result.success = true;
    return result;
}

std::optional<Error> S3Client::copy(const CancellationToken& cancel, const std::string& source,
                                    int64_t size, ProgressSink* progress, const Sse& src_sse,
                                    const Sse& tgt_sse, const Metadata& metadata,
                                    bool disable_multipart) {
    auto [source_alias, source_path] = split_alias(source);
    if (source_alias != location_.alias) {
        return invalid_argument("server-side copy requires source '" + source +
                                "' on alias '" + location_.alias + "'");
    }
    auto [src_bucket, src_key] = split_bucket_key(source_path);
    if (src_bucket.empty() || src_key.empty() || key_.empty()) {
        return invalid_argument("server-side copy requires object names on both sides");
    }

    LockSettings lock;
    Metadata headers = extract_lock_settings(metadata, lock);
    std::string copy_source = "/" + net::url_encode_path(src_bucket + "/" + src_key);

    if (size >= 0 && static_cast<uint64_t>(size) > constants::MAX_SINGLE_COPY_SIZE) {
        if (disable_multipart) {
            return invalid_argument("objects larger than 5 GiB cannot be copied with multipart disabled");
        }

        Error init_error;
        std::string upload_id = shared_->initiate_multipart(bucket_, key_, headers, lock, tgt_sse, init_error);
        if (upload_id.empty()) return init_error;

        auto abort = [&]() {
            if (auto err = shared_->abort_upload(bucket_, key_, upload_id)) {
                log_warn("Failed to abort upload %s: %s", upload_id.c_str(),
                         err->to_string().c_str());
            }
        };

        std::vector<std::pair<int, std::string>> parts;
        uint64_t total = static_cast<uint64_t>(size);
        int part_number = 1;
        for (uint64_t start = 0; start < total; start += constants::DEFAULT_COPY_PART_SIZE) {
            if (cancel.cancelled()) {
                abort();
                return backend_failure("copy to " + location_.aliased_url + " cancelled");
            }
            uint64_t end = std::min(total, start + constants::DEFAULT_COPY_PART_SIZE) - 1;
            Error err;
            std::string etag = shared_->upload_part_copy(bucket_, key_, upload_id, part_number,
                                                         copy_source, start, end, src_sse, tgt_sse, err);
            if (etag.empty()) {
                abort();
                return err;
            }
            parts.emplace_back(part_number++, etag);
            if (progress) progress->add(end - start + 1);
        }
        if (auto err = shared_->complete_multipart(bucket_, key_, upload_id, parts)) {
            abort();
            return err;
        }
        return std::nullopt;
    }

    auto request = net::HttpRequest::put(shared_->build_url(bucket_, key_), {});
    request.headers.set("x-amz-copy-source", copy_source);
    request.headers.set("x-amz-metadata-directive", "REPLACE");
    Shared::apply_metadata(request, headers);
    Shared::apply_lock(request, lock);
    Shared::apply_sse(request, tgt_sse, SseUse::Write);
    Shared::apply_sse(request, src_sse, SseUse::CopySource);

    auto response = shared_->execute(request);
    if (!response.ok() || response.body_string().find("<Error>") != std::string::npos) {
        return s3_error(response, location_.aliased_url).with_trace({"copy from " + source});
    }
    if (progress && size > 0) progress->add(static_cast<uint64_t>(size));
    return std::nullopt;
}

std::unique_ptr<ErrorStream> S3Client::remove(const CancellationToken& cancel, bool incomplete,
                                              bool remove_bucket, bool bypass,
                                              std::shared_ptr<DescriptorChannel> contents) {
    auto shared = shared_;
    std::string root_bucket = bucket_;
    return std::make_unique<ErrorStream>(
        Channel<Error>::UNBOUNDED,
        [shared, root_bucket, cancel, incomplete, remove_bucket, bypass,
         contents](Channel<Error>& errors) {
            CancelRegistration registration(cancel, [contents]() { contents->close(); });

            std::string batch_bucket;
            std::vector<std::string> batch;

            auto flush = [&]() {
                if (batch.empty()) return;
                if (incomplete) {
                    for (const auto& key : batch) {
                        if (auto err = shared->abort_uploads_for(batch_bucket, key)) {
                            errors.send(*err);
                        }
                    }
                } else if (batch.size() == 1) {
                    if (auto err = shared->delete_object(batch_bucket, batch.front(), bypass)) {
                        errors.send(*err);
                    }
                } else {
                    for (auto& err : shared->delete_objects(batch_bucket, batch, bypass)) {
                        errors.send(std::move(err));
                    }
                }
                batch.clear();
            };

            while (true) {
                std::optional<ContentDescriptor> content;
                TryResult r = contents->try_receive(content);
                if (r == TryResult::WouldBlock) {
                    // Feeder is idle: push out what we have before blocking
                    flush();
                    content = contents->receive();
                    if (!content) break;
                } else if (r == TryResult::Closed) {
                    break;
                }
                if (cancel.cancelled()) break;

                auto [bucket, key] = split_bucket_key(split_alias(content->url).second);
                if (bucket.empty() || key.empty()) {
                    errors.send(invalid_argument("'" + content->url +
                                                 "' is not an object and cannot be removed"));
                    continue;
                }
                if (bucket != batch_bucket) {
                    flush();
                    batch_bucket = bucket;
                }
                batch.push_back(key);
                if (batch.size() >= constants::MAX_DELETE_BATCH) flush();
            }
            if (!cancel.cancelled()) flush();

            if (remove_bucket && !cancel.cancelled() && !root_bucket.empty()) {
                if (auto err = shared->delete_bucket(root_bucket)) {
                    errors.send(*err);
                }
            }
        });
}

std::optional<Error> S3Client::put_retention(const CancellationToken& /*cancel*/,
                                             const std::string& mode,
                                             std::chrono::system_clock::time_point until,
                                             bool bypass_governance) {
    if (key_.empty()) {
        return invalid_argument("'" + location_.aliased_url + "' is not an object");
    }

    std::ostringstream body;
    body << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    body << "<Retention xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">";
    body << "<Mode>" << xml::escape(mode) << "</Mode>";
    body << "<RetainUntilDate>" << format_rfc3339(until) << "</RetainUntilDate>";
    body << "</Retention>";
    std::string text = body.str();

    auto request = net::HttpRequest::put(shared_->build_url(bucket_, key_, "retention"),
                                         std::vector<uint8_t>(text.begin(), text.end()));
    request.headers.set_content_type("application/xml");
    request.headers.set("Content-MD5", net::md5_base64(std::span<const uint8_t>(request.body)));
    if (bypass_governance) request.headers.set("x-amz-bypass-governance-retention", "true");

    auto response = shared_->execute(request);
    if (!response.ok()) {
        return s3_error(response, location_.aliased_url);
    }
    return std::nullopt;
}

std::optional<Error> S3Client::put_legal_hold(const CancellationToken& /*cancel*/,
                                              const std::string& status) {
    if (key_.empty()) {
        return invalid_argument("'" + location_.aliased_url + "' is not an object");
    }

    std::string text = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
                       "<LegalHold xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\"><Status>" +
                       xml::escape(status) + "</Status></LegalHold>";
    auto request = net::HttpRequest::put(shared_->build_url(bucket_, key_, "legal-hold"),
                                         std::vector<uint8_t>(text.begin(), text.end()));
    request.headers.set_content_type("application/xml");
    request.headers.set("Content-MD5", net::md5_base64(std::span<const uint8_t>(request.body)));

    auto response = shared_->execute(request);
    if (!response.ok()) {
        return s3_error(response, location_.aliased_url);
    }
    return std::nullopt;
}

}  // namespace objxfer
