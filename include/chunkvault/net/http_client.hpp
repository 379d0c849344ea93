#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace chunkvault::net {

enum class HttpMethod { GET, POST, PUT, DELETE, HEAD };

const char* http_method_to_string(HttpMethod method);

bool is_success_status(int status);

/// 429 and the transient 5xx codes.
bool is_retryable_status(int status);

/// Percent-encode everything outside the RFC 3986 unreserved set. With
/// encode_slash = false, '/' passes through so object paths encode whole.
std::string url_encode(const std::string& str, bool encode_slash = true);

/// Header map keyed by lower-case name. Iteration order is sorted by name,
/// which is the order SigV4 wants.
class HttpHeaders {
public:
    using HeaderPair = std::pair<std::string, std::string>;

    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);
    void remove(const std::string& name);

    std::optional<std::string> get(const std::string& name) const;
    bool has(const std::string& name) const;
    std::vector<HeaderPair> all() const;

    void set_content_type(const std::string& content_type);
    void set_bearer_token(const std::string& token);
    std::optional<std::string> content_type() const;
    std::optional<size_t> content_length() const;

private:
    std::map<std::string, std::vector<std::string>> headers_;
};

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    // Zero means "use the client default"
    std::chrono::milliseconds connect_timeout{0};
    std::chrono::milliseconds total_timeout{0};

    static HttpRequest get(const std::string& url);
    static HttpRequest head(const std::string& url);
    static HttpRequest post(const std::string& url, const std::vector<uint8_t>& body);
    static HttpRequest post(const std::string& url, const std::string& body);
    static HttpRequest put(const std::string& url, const std::vector<uint8_t>& body);
    static HttpRequest del(const std::string& url);

    void set_json_body(const std::string& json);
};

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::vector<uint8_t> body;
    std::string error;
    bool is_network_error = false;
    std::chrono::milliseconds total_time{0};

    bool ok() const { return !is_network_error && is_success_status(status_code); }
    std::string body_string() const;
};

struct ParsedUrl {
    std::string scheme;
    std::string host;
    int port = 0;       // 0 when the URL names no port
    std::string path;
    std::string query;  // Without the leading '?'

    static std::optional<ParsedUrl> parse(const std::string& url);
};

struct HttpClientConfig {
    std::string user_agent = "chunkvault/1.0";
    bool verify_ssl = true;
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds total_timeout{60000};
    size_t max_idle_handles = 8;
};

/// Blocking libcurl client. Easy handles are kept in a small idle pool so
/// connections are reused across requests; safe to share between threads.
class HttpClient {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /// Transport failures come back with is_network_error set, never thrown.
    HttpResponse execute(const HttpRequest& request);

    const HttpClientConfig& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/// AWS Signature Version 4 signer for S3 and S3-compatible endpoints.
class AwsSigV4Signer {
public:
    AwsSigV4Signer(std::string access_key_id, std::string secret_access_key,
                   std::string region, std::string service = "s3");

    /// Adds host, x-amz-date, x-amz-content-sha256 and Authorization.
    void sign(HttpRequest& request) const;
    void sign_with_token(HttpRequest& request, const std::string& session_token) const;

private:
    std::string access_key_id_;
    std::string secret_access_key_;
    std::string region_;
    std::string service_;
};

}  // namespace chunkvault::net
