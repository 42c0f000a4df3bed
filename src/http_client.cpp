#include "objxfer/http.hpp"
#include "objxfer/constants.hpp"
#include "objxfer/log.hpp"

#include <curl/curl.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <set>
#include <sstream>
#include <thread>

namespace objxfer::net {

// ============================================================================
// Environment-based configuration helpers
// ============================================================================

// Request timeout from OBJXFER_REQUEST_TIMEOUT, or the given default
static std::chrono::milliseconds get_request_timeout(std::chrono::milliseconds fallback) {
    if (const char* env = std::getenv("OBJXFER_REQUEST_TIMEOUT")) {
        try {
            unsigned long secs = std::stoul(env);
            // Sanity check: at least 5 seconds, at most 1 hour
            if (secs >= 5 && secs <= 3600) {
                return std::chrono::seconds(secs);
            }
            log_warn("OBJXFER_REQUEST_TIMEOUT=%s out of range [5,3600], using default", env);
        } catch (const std::exception&) {
            log_warn("invalid OBJXFER_REQUEST_TIMEOUT=%s, using default", env);
        }
    }
    return fallback;
}

// ============================================================================
// Utility functions
// ============================================================================

const char* http_method_to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::DELETE: return "DELETE";
        case HttpMethod::HEAD: return "HEAD";
    }
    return "GET";
}

bool is_success_status(int status) {
    return status >= 200 && status < 300;
}

bool is_retryable_status(int status) {
    // Retry on server errors and rate limiting
    return status == 429 || status == 502 || status == 503 || status == 504;
}

static std::string encode_impl(const std::string& str, bool keep_slash) {
    std::ostringstream encoded;
    encoded << std::hex << std::uppercase;

    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' ||
            (keep_slash && c == '/')) {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }

    return encoded.str();
}

std::string url_encode(const std::string& str) {
    return encode_impl(str, false);
}

std::string url_encode_path(const std::string& str) {
    return encode_impl(str, true);
}

static const char* base64_chars =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string base64_encode(std::span<const uint8_t> data) {
    std::string result;
    result.reserve((data.size() + 2) / 3 * 4);

    size_t i = 0;
    while (i < data.size()) {
        size_t remaining = data.size() - i;
        uint32_t octet_a = data[i++];
        uint32_t octet_b = i < data.size() ? data[i++] : 0;
        uint32_t octet_c = i < data.size() ? data[i++] : 0;

        uint32_t triple = (octet_a << 16) + (octet_b << 8) + octet_c;

        result += base64_chars[(triple >> 18) & 0x3F];
        result += base64_chars[(triple >> 12) & 0x3F];
        result += remaining > 1 ? base64_chars[(triple >> 6) & 0x3F] : '=';
        result += remaining > 2 ? base64_chars[triple & 0x3F] : '=';
    }

    return result;
}

std::optional<std::vector<uint8_t>> base64_decode(const std::string& encoded) {
    if (encoded.empty() || encoded.size() % 4 != 0) return std::nullopt;

    int decode_table[256];
    std::fill(std::begin(decode_table), std::end(decode_table), -1);
    for (int i = 0; i < 64; ++i) {
        decode_table[static_cast<unsigned char>(base64_chars[i])] = i;
    }

    size_t padding = 0;
    if (encoded.back() == '=') ++padding;
    if (encoded.size() >= 2 && encoded[encoded.size() - 2] == '=') ++padding;

    std::vector<uint8_t> result;
    result.reserve(encoded.size() / 4 * 3);

    uint32_t val = 0;
    int bits = 0;
    size_t data_len = encoded.size() - padding;
    for (size_t i = 0; i < data_len; ++i) {
        int d = decode_table[static_cast<unsigned char>(encoded[i])];
        if (d < 0) return std::nullopt;
        val = (val << 6) | static_cast<uint32_t>(d);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            result.push_back(static_cast<uint8_t>((val >> bits) & 0xFF));
        }
    }
    return result;
}

static std::string to_hex(const unsigned char* data, size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::array<uint8_t, 16> md5_digest(std::span<const uint8_t> data) {
    std::array<uint8_t, 16> digest{};
    unsigned int len = 0;
    EVP_Digest(data.data(), data.size(), digest.data(), &len, EVP_md5(), nullptr);
    return digest;
}

std::string md5_base64(std::span<const uint8_t> data) {
    auto digest = md5_digest(data);
    return base64_encode(std::span<const uint8_t>(digest));
}

std::string sha256_hex(std::span<const uint8_t> data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(data.data(), data.size(), hash);
    return to_hex(hash, SHA256_DIGEST_LENGTH);
}

static std::string sha256_hex(const std::string& data) {
    return sha256_hex(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(data.data()), data.size()));
}

// ============================================================================
// HttpHeaders
// ============================================================================

std::string HttpHeaders::normalize_name(const std::string& name) {
    std::string result = name;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

void HttpHeaders::set(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)] = {value};
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
    std::string key = normalize_name(name);
    headers_[key].push_back(value);
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto it = headers_.find(normalize_name(name));
    if (it != headers_.end() && !it->second.empty()) {
        return it->second[0];
    }
    return std::nullopt;
}

bool HttpHeaders::has(const std::string& name) const {
    return headers_.find(normalize_name(name)) != headers_.end();
}

std::vector<HttpHeaders::HeaderPair> HttpHeaders::all() const {
    std::vector<HeaderPair> result;
    for (const auto& [name, values] : headers_) {
        for (const auto& value : values) {
            result.emplace_back(name, value);
        }
    }
    return result;
}

void HttpHeaders::set_content_type(const std::string& content_type) {
    set("Content-Type", content_type);
}

std::optional<std::string> HttpHeaders::content_type() const {
    return get("Content-Type");
}

std::optional<uint64_t> HttpHeaders::content_length() const {
    auto val = get("Content-Length");
    if (val) {
        try {
            return std::stoull(*val);
        } catch (const std::exception&) {
            // Malformed Content-Length
        }
    }
    return std::nullopt;
}

// ============================================================================
// HttpRequest / HttpResponse
// ============================================================================

HttpRequest HttpRequest::get(const std::string& url) {
    HttpRequest req;
    req.method = HttpMethod::GET;
    req.url = url;
    return req;
}

HttpRequest HttpRequest::head(const std::string& url) {
    HttpRequest req;
    req.method = HttpMethod::HEAD;
    req.url = url;
    return req;
}

HttpRequest HttpRequest::put(const std::string& url, std::vector<uint8_t> body) {
    HttpRequest req;
    req.method = HttpMethod::PUT;
    req.url = url;
    req.body = std::move(body);
    return req;
}

HttpRequest HttpRequest::post(const std::string& url, const std::string& body) {
    HttpRequest req;
    req.method = HttpMethod::POST;
    req.url = url;
    req.body.assign(body.begin(), body.end());
    return req;
}

HttpRequest HttpRequest::del(const std::string& url) {
    HttpRequest req;
    req.method = HttpMethod::DELETE;
    req.url = url;
    return req;
}

std::string HttpResponse::body_string() const {
    return std::string(body.begin(), body.end());
}

// ============================================================================
// ParsedUrl
// ============================================================================

std::optional<ParsedUrl> ParsedUrl::parse(const std::string& url) {
    ParsedUrl result;

    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return std::nullopt;
    }
    result.scheme = url.substr(0, scheme_end);
    size_t pos = scheme_end + 3;

    size_t host_end = url.find_first_of("/?", pos);
    if (host_end == std::string::npos) {
        host_end = url.size();
    }

    std::string host_port = url.substr(pos, host_end - pos);
    if (host_port.empty()) return std::nullopt;

    size_t colon_pos = host_port.rfind(':');
    if (colon_pos != std::string::npos && host_port.front() != '[') {
        result.host = host_port.substr(0, colon_pos);
        try {
            result.port = std::stoi(host_port.substr(colon_pos + 1));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    } else {
        result.host = host_port;
    }

    pos = host_end;
    if (pos < url.size() && url[pos] == '/') {
        size_t path_end = url.find('?', pos);
        if (path_end == std::string::npos) {
            path_end = url.size();
        }
        result.path = url.substr(pos, path_end - pos);
        pos = path_end;
    }

    if (pos < url.size() && url[pos] == '?') {
        result.query = url.substr(pos + 1);
    }

    return result;
}

std::string ParsedUrl::authority() const {
    bool default_port = port == 0 || (scheme == "https" && port == 443) ||
                        (scheme == "http" && port == 80);
    return default_port ? host : host + ":" + std::to_string(port);
}

// ============================================================================
// CURL callback functions
// ============================================================================

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::vector<uint8_t>*>(userdata);
    size_t bytes = size * nmemb;
    body->insert(body->end(), ptr, ptr + bytes);
    return bytes;
}

static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<HttpHeaders*>(userdata);
    size_t bytes = size * nitems;

    std::string line(buffer, bytes);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }

    // A new status line starts a fresh header block (redirects, 100-continue)
    if (line.starts_with("HTTP/")) {
        *headers = HttpHeaders{};
        return bytes;
    }
    if (line.empty()) {
        return bytes;
    }

    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        size_t start = value.find_first_not_of(" \t");
        value = start == std::string::npos ? "" : value.substr(start);
        headers->add(name, value);
    }

    return bytes;
}

struct ReadData {
    const uint8_t* data;
    size_t size;
    size_t pos;
};

static size_t read_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* rd = static_cast<ReadData*>(userdata);
    size_t to_copy = std::min(size * nitems, rd->size - rd->pos);
    if (to_copy > 0) {
        std::memcpy(buffer, rd->data + rd->pos, to_copy);
        rd->pos += to_copy;
    }
    return to_copy;
}

// ============================================================================
// HttpClient Implementation
// ============================================================================

class HttpClient::Impl {
public:
    explicit Impl(const HttpClientConfig& config) : config_(config) {
        static std::once_flag curl_init_flag;
        std::call_once(curl_init_flag, []() {
            curl_global_init(CURL_GLOBAL_ALL);
        });
        config_.total_timeout = get_request_timeout(config_.total_timeout);
    }

    HttpResponse execute(const HttpRequest& request) {
        HttpResponse response;

        CURL* curl = curl_easy_init();
        if (!curl) {
            response.error = "Failed to create curl handle";
            response.is_network_error = true;
            return response;
        }

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());

        switch (request.method) {
            case HttpMethod::GET:
                curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
                break;
            case HttpMethod::POST:
                curl_easy_setopt(curl, CURLOPT_POST, 1L);
                break;
            case HttpMethod::PUT:
                curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
                break;
            case HttpMethod::DELETE:
                curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
                break;
            case HttpMethod::HEAD:
                curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
                break;
        }

        struct curl_slist* headers_list = nullptr;
        for (const auto& [name, value] : request.headers.all()) {
            std::string header = name + ": " + value;
            headers_list = curl_slist_append(headers_list, header.c_str());
        }
        // Suppress curl's automatic "Expect: 100-continue"
        headers_list = curl_slist_append(headers_list, "Expect:");
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers_list);

        if (!config_.user_agent.empty()) {
            curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
        }

        ReadData read_data{request.body.data(), request.body.size(), 0};
        if (request.method == HttpMethod::PUT) {
            curl_easy_setopt(curl, CURLOPT_READFUNCTION, read_callback);
            curl_easy_setopt(curl, CURLOPT_READDATA, &read_data);
            // Empty-body PUT still needs Content-Length: 0
            curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE,
                             static_cast<curl_off_t>(request.body.size()));
        } else if (request.method == HttpMethod::POST) {
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.data());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(request.body.size()));
        }

        std::vector<uint8_t> response_body;
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(config_.connect_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                         static_cast<long>(config_.total_timeout.count()));

        bool verify = request.verify_ssl && config_.verify_ssl_by_default;
        if (!verify) {
            static std::once_flag warn_flag;
            std::call_once(warn_flag, []() {
                log_warn("SSL verification disabled via configuration; "
                         "connections are exposed to man-in-the-middle attacks");
            });
        }
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, verify ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, verify ? 2L : 0L);

        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        CURLcode res = curl_easy_perform(curl);
        if (res == CURLE_OK) {
            long status = 0;
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
            response.status_code = static_cast<int>(status);
            response.body = std::move(response_body);
        } else {
            response.error = curl_easy_strerror(res);
            response.is_network_error = true;
        }

        curl_slist_free_all(headers_list);
        curl_easy_cleanup(curl);

        log_debug("%s %s -> %d", http_method_to_string(request.method),
                  request.url.c_str(), response.status_code);
        return response;
    }

    HttpResponse execute_with_retry(const HttpRequest& request) {
        int retries = 0;
        auto delay = config_.initial_retry_delay;

        while (true) {
            HttpResponse response = execute(request);

            if (!response.is_network_error && !is_retryable_status(response.status_code)) {
                return response;
            }
            if (retries >= config_.max_retries) {
                return response;
            }

            std::this_thread::sleep_for(delay);
            delay *= 2;
            retries++;
        }
    }

    const HttpClientConfig& config() const { return config_; }

private:
    HttpClientConfig config_;
};

HttpClient::HttpClient(const HttpClientConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::execute(const HttpRequest& request) {
    return impl_->execute(request);
}

HttpResponse HttpClient::execute_with_retry(const HttpRequest& request) {
    return impl_->execute_with_retry(request);
}

const HttpClientConfig& HttpClient::config() const {
    return impl_->config();
}

// ============================================================================
// AwsSigV4Signer
// ============================================================================

AwsSigV4Signer::AwsSigV4Signer(const std::string& access_key_id,
                               const std::string& secret_access_key,
                               const std::string& region,
                               const std::string& service)
    : access_key_id_(access_key_id)
    , secret_access_key_(secret_access_key)
    , region_(region)
    , service_(service) {}

static std::vector<uint8_t> hmac_sha256(const std::vector<uint8_t>& key,
                                        const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    unsigned int hash_len = 0;

    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.c_str()), data.size(),
         hash, &hash_len);

    return std::vector<uint8_t>(hash, hash + hash_len);
}

static std::vector<uint8_t> hmac_sha256(const std::string& key, const std::string& data) {
    return hmac_sha256(std::vector<uint8_t>(key.begin(), key.end()), data);
}

static std::string format_utc_now(const char* fmt) {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&now, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, fmt);
    return oss.str();
}

// Query params arrive already encoded; sort them and give bare keys an "=".
static std::string build_canonical_query_string(const std::string& query) {
    if (query.empty()) {
        return "";
    }

    std::map<std::string, std::string> params;
    size_t pos = 0;
    while (pos < query.size()) {
        size_t amp = query.find('&', pos);
        if (amp == std::string::npos) amp = query.size();

        std::string param = query.substr(pos, amp - pos);
        size_t eq = param.find('=');
        if (eq != std::string::npos) {
            params[param.substr(0, eq)] = param.substr(eq + 1);
        } else {
            params[param] = "";
        }
        pos = amp + 1;
    }

    std::ostringstream oss;
    bool first = true;
    for (const auto& [key, value] : params) {
        if (!first) oss << "&";
        oss << key << "=" << value;
        first = false;
    }
    return oss.str();
}

std::string AwsSigV4Signer::get_canonical_request(const HttpRequest& request,
                                                  const std::string& signed_headers,
                                                  const std::string& payload_hash) const {
    auto url = ParsedUrl::parse(request.url);
    if (!url) return "";

    std::ostringstream oss;
    oss << http_method_to_string(request.method) << "\n";
    oss << (url->path.empty() ? "/" : url->path) << "\n";
    oss << build_canonical_query_string(url->query) << "\n";

    // Header names are already lower-case; values are trimmed
    for (const auto& [name, value] : request.headers.all()) {
        oss << name << ":" << value << "\n";
    }
    oss << "\n";
    oss << signed_headers << "\n";
    oss << payload_hash;

    return oss.str();
}

std::string AwsSigV4Signer::get_string_to_sign(const std::string& datetime,
                                               const std::string& date,
                                               const std::string& canonical_request) const {
    std::ostringstream oss;
    oss << "AWS4-HMAC-SHA256\n";
    oss << datetime << "\n";
    oss << date << "/" << region_ << "/" << service_ << "/aws4_request\n";
    oss << sha256_hex(canonical_request);
    return oss.str();
}

std::string AwsSigV4Signer::calculate_signature(const std::string& date,
                                                const std::string& string_to_sign) const {
    auto k_date = hmac_sha256("AWS4" + secret_access_key_, date);
    auto k_region = hmac_sha256(k_date, region_);
    auto k_service = hmac_sha256(k_region, service_);
    auto k_signing = hmac_sha256(k_service, "aws4_request");

    auto sig = hmac_sha256(k_signing, string_to_sign);
    return to_hex(sig.data(), sig.size());
}

void AwsSigV4Signer::sign(HttpRequest& request) const {
    std::string datetime = format_utc_now("%Y%m%dT%H%M%SZ");
    std::string date = format_utc_now("%Y%m%d");

    auto url = ParsedUrl::parse(request.url);
    if (!url) return;

    request.headers.set("Host", url->authority());
    request.headers.set("X-Amz-Date", datetime);

    std::string payload_hash;
    if (auto existing = request.headers.get("X-Amz-Content-Sha256"); existing && !existing->empty()) {
        payload_hash = *existing;
    } else {
        payload_hash = sha256_hex(std::span<const uint8_t>(request.body));
    }
    request.headers.set("X-Amz-Content-Sha256", payload_hash);

    std::set<std::string> header_names;
    for (const auto& [name, value] : request.headers.all()) {
        header_names.insert(name);
    }

    std::string signed_headers;
    for (const auto& h : header_names) {
        if (!signed_headers.empty()) signed_headers += ";";
        signed_headers += h;
    }

    std::string canonical_request = get_canonical_request(request, signed_headers, payload_hash);
    std::string string_to_sign = get_string_to_sign(datetime, date, canonical_request);
    std::string signature = calculate_signature(date, string_to_sign);

    std::ostringstream auth;
    auth << "AWS4-HMAC-SHA256 ";
    auth << "Credential=" << access_key_id_ << "/" << date << "/" << region_ << "/"
         << service_ << "/aws4_request, ";
    auth << "SignedHeaders=" << signed_headers << ", ";
    auth << "Signature=" << signature;

    request.headers.set("Authorization", auth.str());
}

void AwsSigV4Signer::sign_with_token(HttpRequest& request,
                                     const std::string& session_token) const {
    request.headers.set("X-Amz-Security-Token", session_token);
    sign(request);
}

}  // namespace objxfer::net
