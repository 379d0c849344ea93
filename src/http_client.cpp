#include "chunkvault/net/http_client.hpp"
#include "chunkvault/chunker.hpp"

#include <curl/curl.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstring>
#include <ctime>
#include <mutex>
#include <span>

namespace chunkvault::net {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<uint8_t> to_bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

HttpRequest make_request(HttpMethod method, const std::string& url,
                         std::vector<uint8_t> body = {}) {
    HttpRequest req;
    req.method = method;
    req.url = url;
    req.body = std::move(body);
    return req;
}

}  // namespace

// ============================================================================
// Status codes and encoding
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
    return status / 100 == 2;
}

bool is_retryable_status(int status) {
    switch (status) {
        case 429:
        case 500:
        case 502:
        case 503:
        case 504:
            return true;
        default:
            return false;
    }
}

std::string url_encode(const std::string& str, bool encode_slash) {
    static const char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(str.size() * 3);
    for (unsigned char c : str) {
        bool unreserved = std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~';
        if (unreserved || (c == '/' && !encode_slash)) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

// ============================================================================
// HttpHeaders
// ============================================================================

void HttpHeaders::set(const std::string& name, const std::string& value) {
    headers_[lower(name)] = {value};
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
    headers_[lower(name)].push_back(value);
}

void HttpHeaders::remove(const std::string& name) {
    headers_.erase(lower(name));
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto it = headers_.find(lower(name));
    if (it == headers_.end() || it->second.empty()) return std::nullopt;
    return it->second.front();
}

bool HttpHeaders::has(const std::string& name) const {
    return headers_.count(lower(name)) > 0;
}

std::vector<HttpHeaders::HeaderPair> HttpHeaders::all() const {
    std::vector<HeaderPair> out;
    for (const auto& [name, values] : headers_) {
        for (const auto& value : values) out.emplace_back(name, value);
    }
    return out;
}

void HttpHeaders::set_content_type(const std::string& content_type) {
    set("content-type", content_type);
}

void HttpHeaders::set_bearer_token(const std::string& token) {
    set("authorization", "Bearer " + token);
}

std::optional<std::string> HttpHeaders::content_type() const {
    return get("content-type");
}

std::optional<size_t> HttpHeaders::content_length() const {
    auto value = get("content-length");
    if (!value) return std::nullopt;
    size_t length = 0;
    auto [ptr, ec] = std::from_chars(value->data(), value->data() + value->size(), length);
    if (ec != std::errc() || ptr != value->data() + value->size()) return std::nullopt;
    return length;
}

// ============================================================================
// HttpRequest / HttpResponse
// ============================================================================

HttpRequest HttpRequest::get(const std::string& url) {
    return make_request(HttpMethod::GET, url);
}

HttpRequest HttpRequest::head(const std::string& url) {
    return make_request(HttpMethod::HEAD, url);
}

HttpRequest HttpRequest::post(const std::string& url, const std::vector<uint8_t>& body) {
    return make_request(HttpMethod::POST, url, body);
}

HttpRequest HttpRequest::post(const std::string& url, const std::string& body) {
    return make_request(HttpMethod::POST, url, to_bytes(body));
}

HttpRequest HttpRequest::put(const std::string& url, const std::vector<uint8_t>& body) {
    return make_request(HttpMethod::PUT, url, body);
}

HttpRequest HttpRequest::del(const std::string& url) {
    return make_request(HttpMethod::DELETE, url);
}

void HttpRequest::set_json_body(const std::string& json) {
    body = to_bytes(json);
    headers.set_content_type("application/json");
}

std::string HttpResponse::body_string() const {
    return std::string(body.begin(), body.end());
}

// ============================================================================
// ParsedUrl
// ============================================================================

std::optional<ParsedUrl> ParsedUrl::parse(const std::string& url) {
    auto sep = url.find("://");
    if (sep == std::string::npos || sep == 0) return std::nullopt;

    ParsedUrl out;
    out.scheme = url.substr(0, sep);

    std::string rest = url.substr(sep + 3);
    if (auto hash = rest.find('#'); hash != std::string::npos) rest.resize(hash);

    auto authority_end = rest.find_first_of("/?");
    std::string authority = rest.substr(0, authority_end);
    std::string target = authority_end == std::string::npos ? "" : rest.substr(authority_end);
    if (authority.empty()) return std::nullopt;

    // "[v6]:port" or "host:port"
    std::string port_text;
    if (authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) return std::nullopt;
        out.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') return std::nullopt;
            port_text = authority.substr(close + 2);
        }
    } else if (auto colon = authority.rfind(':'); colon != std::string::npos) {
        out.host = authority.substr(0, colon);
        port_text = authority.substr(colon + 1);
    } else {
        out.host = authority;
    }
    if (!port_text.empty()) {
        auto [ptr, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(),
                                         out.port);
        if (ec != std::errc() || ptr != port_text.data() + port_text.size()) return std::nullopt;
    }

    auto q = target.find('?');
    out.path = target.substr(0, q);
    if (q != std::string::npos) out.query = target.substr(q + 1);
    return out;
}

// ============================================================================
// HttpClient
// ============================================================================

namespace {

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

struct UploadCursor {
    std::span<const uint8_t> data;
    size_t offset = 0;
};

size_t on_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::vector<uint8_t>*>(userdata);
    body->insert(body->end(), ptr, ptr + size * nmemb);
    return size * nmemb;
}

size_t on_header(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<HttpHeaders*>(userdata);
    std::string_view line(buffer, size * nitems);
    auto colon = line.find(':');
    // Status lines and the blank terminator carry no colon
    if (colon != std::string_view::npos && !line.starts_with("HTTP/")) {
        auto value = line.substr(colon + 1);
        auto first = value.find_first_not_of(" \t");
        auto last = value.find_last_not_of(" \t\r\n");
        headers->add(std::string(line.substr(0, colon)),
                     first == std::string_view::npos
                         ? std::string()
                         : std::string(value.substr(first, last - first + 1)));
    }
    return size * nitems;
}

size_t on_upload(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* cursor = static_cast<UploadCursor*>(userdata);
    size_t n = std::min(size * nitems, cursor->data.size() - cursor->offset);
    std::memcpy(buffer, cursor->data.data() + cursor->offset, n);
    cursor->offset += n;
    return n;
}

HeaderList build_header_list(const HttpHeaders& headers) {
    HeaderList list;
    for (const auto& [name, value] : headers.all()) {
        // "name:" with no value removes a header curl would add itself
        std::string line = value.empty() ? name + ":" : name + ": " + value;
        curl_slist* appended = curl_slist_append(list.get(), line.c_str());
        if (!appended) break;
        list.release();
        list.reset(appended);
    }
    return list;
}

}  // namespace

class HttpClient::Impl {
public:
    explicit Impl(const HttpClientConfig& config) : config_(config) {
        static std::once_flag global_init;
        std::call_once(global_init, [] { curl_global_init(CURL_GLOBAL_ALL); });
    }

    ~Impl() {
        for (CURL* handle : idle_) curl_easy_cleanup(handle);
    }

    HttpResponse execute(const HttpRequest& request) {
        HttpResponse response;
        CURL* curl = checkout();
        if (!curl) {
            response.error = "curl_easy_init failed";
            response.is_network_error = true;
            return response;
        }

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
        if (!config_.user_agent.empty()) {
            curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
        }
        long verify = config_.verify_ssl ? 1L : 0L;
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, verify);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, verify * 2);

        auto connect = request.connect_timeout.count() > 0 ? request.connect_timeout
                                                           : config_.connect_timeout;
        auto total = request.total_timeout.count() > 0 ? request.total_timeout
                                                       : config_.total_timeout;
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connect.count()));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(total.count()));

        UploadCursor cursor{request.body, 0};
        static const char no_body[] = "";
        switch (request.method) {
            case HttpMethod::GET:
                curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
                break;
            case HttpMethod::HEAD:
                curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
                break;
            case HttpMethod::DELETE:
                curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
                break;
            case HttpMethod::PUT:
                curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
                curl_easy_setopt(curl, CURLOPT_READFUNCTION, on_upload);
                curl_easy_setopt(curl, CURLOPT_READDATA, &cursor);
                curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE,
                                 static_cast<curl_off_t>(request.body.size()));
                break;
            case HttpMethod::POST:
                // An unset POSTFIELDS makes curl read the body from stdin
                curl_easy_setopt(curl, CURLOPT_POST, 1L);
                curl_easy_setopt(curl, CURLOPT_POSTFIELDS,
                                 request.body.empty()
                                     ? no_body
                                     : reinterpret_cast<const char*>(request.body.data()));
                curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                                 static_cast<curl_off_t>(request.body.size()));
                break;
        }

        HeaderList header_list = build_header_list(request.headers);
        if (header_list) curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());

        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, on_body);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, on_header);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

        auto started = std::chrono::steady_clock::now();
        CURLcode rc = curl_easy_perform(curl);
        response.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);

        if (rc == CURLE_OK) {
            long status = 0;
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
            response.status_code = static_cast<int>(status);
        } else {
            response.error = curl_easy_strerror(rc);
            response.is_network_error = true;
            response.body.clear();
        }

        checkin(curl);
        return response;
    }

    const HttpClientConfig& config() const { return config_; }

private:
    CURL* checkout() {
        std::lock_guard lock(mutex_);
        if (idle_.empty()) return curl_easy_init();
        CURL* handle = idle_.back();
        idle_.pop_back();
        return handle;
    }

    void checkin(CURL* handle) {
        curl_easy_reset(handle);
        std::lock_guard lock(mutex_);
        if (idle_.size() >= config_.max_idle_handles) {
            curl_easy_cleanup(handle);
            return;
        }
        idle_.push_back(handle);
    }

    HttpClientConfig config_;
    std::mutex mutex_;
    std::vector<CURL*> idle_;
};

HttpClient::HttpClient(const HttpClientConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::execute(const HttpRequest& request) {
    return impl_->execute(request);
}

const HttpClientConfig& HttpClient::config() const {
    return impl_->config();
}

// ============================================================================
// AwsSigV4Signer
// ============================================================================

namespace {

std::string hex_encode(std::span<const uint8_t> data) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (uint8_t b : data) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

std::string sha256_of(const std::string& s) {
    return sha256_hex(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(s.data()), s.size()));
}

std::vector<uint8_t> hmac(std::span<const uint8_t> key, const std::string& data) {
    std::vector<uint8_t> out(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(), out.data(), &len);
    out.resize(len);
    return out;
}

// YYYYMMDD'T'HHMMSS'Z'
std::string amz_datetime() {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buf[17];
    std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tm);
    return buf;
}

// Query parameters sorted by name; a bare key becomes "key=". Values are
// already encoded in the URL.
std::string canonical_query(const std::string& query) {
    std::map<std::string, std::string> params;
    size_t pos = 0;
    while (pos < query.size()) {
        auto end = query.find('&', pos);
        if (end == std::string::npos) end = query.size();
        auto item = query.substr(pos, end - pos);
        auto eq = item.find('=');
        if (!item.empty()) {
            params[item.substr(0, eq)] = eq == std::string::npos ? "" : item.substr(eq + 1);
        }
        pos = end + 1;
    }

    std::string out;
    for (const auto& [k, v] : params) {
        if (!out.empty()) out += '&';
        out += k + "=" + v;
    }
    return out;
}

}  // namespace

AwsSigV4Signer::AwsSigV4Signer(std::string access_key_id, std::string secret_access_key,
                               std::string region, std::string service)
    : access_key_id_(std::move(access_key_id))
    , secret_access_key_(std::move(secret_access_key))
    , region_(std::move(region))
    , service_(std::move(service)) {}

void AwsSigV4Signer::sign(HttpRequest& request) const {
    auto url = ParsedUrl::parse(request.url);
    if (!url) return;

    const std::string datetime = amz_datetime();
    const std::string date = datetime.substr(0, 8);
    const std::string scope = date + "/" + region_ + "/" + service_ + "/aws4_request";

    request.headers.set("host", url->port ? url->host + ":" + std::to_string(url->port)
                                          : url->host);
    request.headers.set("x-amz-date", datetime);
    auto payload_hash = request.headers.get("x-amz-content-sha256").value_or("");
    if (payload_hash.empty()) {
        payload_hash = sha256_hex(request.body);
        request.headers.set("x-amz-content-sha256", payload_hash);
    }

    // Header names are stored lower-case and iterate in sorted order.
    // Repeated headers fold into one comma-separated line.
    std::map<std::string, std::string> folded;
    for (const auto& [name, value] : request.headers.all()) {
        auto [it, inserted] = folded.emplace(name, value);
        if (!inserted) it->second += "," + value;
    }
    std::string canonical_headers;
    std::string signed_headers;
    for (const auto& [name, value] : folded) {
        canonical_headers += name + ":" + value + "\n";
        if (!signed_headers.empty()) signed_headers += ';';
        signed_headers += name;
    }

    std::string canonical_request = std::string(http_method_to_string(request.method)) + "\n" +
                                    (url->path.empty() ? "/" : url->path) + "\n" +
                                    canonical_query(url->query) + "\n" +
                                    canonical_headers + "\n" +
                                    signed_headers + "\n" +
                                    payload_hash;

    std::string string_to_sign = "AWS4-HMAC-SHA256\n" + datetime + "\n" + scope + "\n" +
                                 sha256_of(canonical_request);

    std::string secret = "AWS4" + secret_access_key_;
    auto key = hmac(std::span<const uint8_t>(
                        reinterpret_cast<const uint8_t*>(secret.data()), secret.size()),
                    date);
    for (const std::string& part : {region_, service_, std::string("aws4_request")}) {
        key = hmac(key, part);
    }
    std::string signature = hex_encode(hmac(key, string_to_sign));

    request.headers.set("authorization",
                        "AWS4-HMAC-SHA256 Credential=" + access_key_id_ + "/" + scope +
                        ", SignedHeaders=" + signed_headers + ", Signature=" + signature);
}

void AwsSigV4Signer::sign_with_token(HttpRequest& request, const std::string& session_token) const {
    request.headers.set("x-amz-security-token", session_token);
    sign(request);
}

}  // namespace chunkvault::net
