#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace objxfer::net {

enum class HttpMethod { GET, POST, PUT, DELETE, HEAD };

const char* http_method_to_string(HttpMethod method);

bool is_success_status(int status);
bool is_retryable_status(int status);

// RFC 3986 encoding of everything outside the unreserved set.
std::string url_encode(const std::string& str);
// Same, but '/' is kept so object keys remain path-shaped.
std::string url_encode_path(const std::string& str);

std::string base64_encode(std::span<const uint8_t> data);
// Strict standard-alphabet decoding; nullopt on any malformed input.
std::optional<std::vector<uint8_t>> base64_decode(const std::string& encoded);

std::array<uint8_t, 16> md5_digest(std::span<const uint8_t> data);
std::string md5_base64(std::span<const uint8_t> data);
std::string sha256_hex(std::span<const uint8_t> data);

// Case-insensitive header multimap (names stored lower-case)
class HttpHeaders {
public:
    using HeaderPair = std::pair<std::string, std::string>;

    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);
    std::optional<std::string> get(const std::string& name) const;
    bool has(const std::string& name) const;
    std::vector<HeaderPair> all() const;

    void set_content_type(const std::string& content_type);
    std::optional<std::string> content_type() const;
    std::optional<uint64_t> content_length() const;

private:
    static std::string normalize_name(const std::string& name);
    std::map<std::string, std::vector<std::string>> headers_;
};

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    std::vector<uint8_t> body;
    bool verify_ssl = true;

    static HttpRequest get(const std::string& url);
    static HttpRequest head(const std::string& url);
    static HttpRequest put(const std::string& url, std::vector<uint8_t> body);
    static HttpRequest post(const std::string& url, const std::string& body);
    static HttpRequest del(const std::string& url);
};

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::vector<uint8_t> body;
    std::string error;
    bool is_network_error = false;

    bool ok() const { return !is_network_error && status_code >= 200 && status_code < 300; }
    std::string body_string() const;
};

struct ParsedUrl {
    std::string scheme;
    std::string host;
    int port = 0;
    std::string path;
    std::string query;

    static std::optional<ParsedUrl> parse(const std::string& url);
    // host[:port] as sent in the Host header
    std::string authority() const;
};

struct HttpClientConfig {
    std::string user_agent;
    bool verify_ssl_by_default = true;
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds total_timeout{300000};
    int max_retries = 3;
    std::chrono::milliseconds initial_retry_delay{100};
};

// Blocking HTTP client on top of libcurl easy handles.
class HttpClient {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse execute(const HttpRequest& request);

    // Retries network errors and 429/502/503/504 with exponential backoff.
    HttpResponse execute_with_retry(const HttpRequest& request);

    const HttpClientConfig& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// AWS Signature Version 4 request signing
class AwsSigV4Signer {
public:
    AwsSigV4Signer(const std::string& access_key_id,
                   const std::string& secret_access_key,
                   const std::string& region,
                   const std::string& service = "s3");

    void sign(HttpRequest& request) const;
    void sign_with_token(HttpRequest& request, const std::string& session_token) const;

private:
    std::string get_canonical_request(const HttpRequest& request,
                                      const std::string& signed_headers,
                                      const std::string& payload_hash) const;
    std::string get_string_to_sign(const std::string& datetime,
                                   const std::string& date,
                                   const std::string& canonical_request) const;
    std::string calculate_signature(const std::string& date,
                                    const std::string& string_to_sign) const;

    std::string access_key_id_;
    std::string secret_access_key_;
    std::string region_;
    std::string service_;
};

}  // namespace objxfer::net
