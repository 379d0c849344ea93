#include "chunkvault/storage/backend.hpp"
#include "chunkvault/core/constants.hpp"
#include "chunkvault/log.hpp"
#include "chunkvault/net/http_client.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <unistd.h>
#include <vector>

namespace chunkvault {

namespace {

// ============================================================================
// Shared helpers
// ============================================================================

// Number of lock shards for the local backend, overridable via
// CHUNKVAULT_STORAGE_SHARDS (1..4096)
size_t get_num_shards() {
    static size_t num_shards = []() {
        if (const char* env = std::getenv(constants::STORAGE_SHARDS_ENV)) {
            char* end = nullptr;
            unsigned long val = std::strtoul(env, &end, 10);
            if (end != env && *end == '\0' && val >= 1 && val <= 4096) {
                return static_cast<size_t>(val);
            }
            log_warn("Ignoring invalid %s=%s", constants::STORAGE_SHARDS_ENV, env);
        }
        return size_t{64};
    }();
    return num_shards;
}

// Parse "2023-12-15T14:30:00.000Z" or "2023-12-15T14:30:00Z"
std::chrono::system_clock::time_point parse_iso8601(const std::string& s) {
    int year = 0, month = 0, day = 0, hour = 0, min = 0, sec = 0, millis = 0;
    if (sscanf(s.c_str(), "%d-%d-%dT%d:%d:%d.%dZ",
               &year, &month, &day, &hour, &min, &sec, &millis) < 6 &&
        sscanf(s.c_str(), "%d-%d-%dT%d:%d:%dZ",
               &year, &month, &day, &hour, &min, &sec) != 6) {
        return {};
    }
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = min;
    tm.tm_sec = sec;
    time_t tt = timegm(&tm);
    if (tt == -1) return {};
    return std::chrono::system_clock::from_time_t(tt) + std::chrono::milliseconds(millis);
}

std::string describe_failure(const net::HttpResponse& response) {
    if (!response.error.empty()) return response.error;
    return "HTTP " + std::to_string(response.status_code);
}

/// A string that zeroes its buffer on destruction (credentials).
class SecureString {
public:
    SecureString() = default;
    SecureString(const std::string& s) : data_(s) {}
    SecureString(const SecureString& other) = default;
    SecureString& operator=(const SecureString& other) {
        if (this != &other) {
            secure_clear();
            data_ = other.data_;
        }
        return *this;
    }
    ~SecureString() { secure_clear(); }

    const std::string& str() const { return data_; }
    bool empty() const { return data_.empty(); }

private:
    void secure_clear() {
        if (data_.empty()) return;
        volatile char* p = const_cast<volatile char*>(data_.data());
        for (size_t i = 0; i < data_.size(); ++i) p[i] = 0;
        data_.clear();
    }

    std::string data_;
};

}  // namespace

// ============================================================================
// LocalStorageBackend - File system implementation
// ============================================================================

class LocalStorageBackend : public StorageBackend {
public:
    LocalStorageBackend(const std::filesystem::path& root, uint64_t quota_bytes)
        : root_(std::filesystem::absolute(root))
        , quota_bytes_(quota_bytes) {
        std::filesystem::create_directories(root_);

        shards_.resize(get_num_shards());
        for (auto& shard : shards_) {
            shard = std::make_unique<Shard>();
        }

        reload_counters();
        log_debug("Local backend at %s: %lu objects, %lu bytes",
                  root_.c_str(),
                  static_cast<unsigned long>(object_count_.load()),
                  static_cast<unsigned long>(total_bytes_.load()));
    }

    std::string type_name() const override { return "local"; }

    bool exists(const std::string& key) const override {
        auto path = safe_path(key);
        if (!path) return false;
        std::shared_lock lock(get_shard(key).mutex);
        return std::filesystem::is_regular_file(*path);
    }

    std::optional<ObjectMetadata> head(const std::string& key) const override {
        auto path = safe_path(key);
        if (!path) return std::nullopt;
        std::shared_lock lock(get_shard(key).mutex);

        std::error_code ec;
        auto size = std::filesystem::file_size(*path, ec);
        if (ec) return std::nullopt;

        ObjectMetadata meta;
        meta.size = size;
        auto ftime = std::filesystem::last_write_time(*path, ec);
        if (!ec) {
            meta.last_modified = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
                std::chrono::file_clock::to_sys(ftime));
        }
        meta.content_type = "application/octet-stream";
        return meta;
    }

    GetResult get(const std::string& key) const override {
        GetResult result;
        auto path = safe_path(key, &result.error_message);
        if (!path) return result;

        std::shared_lock lock(get_shard(key).mutex);

        std::error_code ec;
        const uint64_t size = std::filesystem::file_size(*path, ec);
        if (ec) {
            result.not_found = ec == std::errc::no_such_file_or_directory;
            result.error_message = (result.not_found ? "No object " : "Cannot stat ") + key;
            return result;
        }

        std::ifstream in(*path, std::ios::binary);
        result.data.resize(size);
        if (!in.read(reinterpret_cast<char*>(result.data.data()),
                     static_cast<std::streamsize>(size))) {
            result.data.clear();
            result.error_message = "Short read on " + key;
            return result;
        }

        result.metadata.size = size;
        result.success = true;
        return result;
    }

    PutResult put(const std::string& name,
                  std::span<const uint8_t> data,
                  const PutOptions& /*options*/) override {
        PutResult result;
        auto path = safe_path(name, &result.error_message);
        if (!path) return result;

        std::unique_lock lock(get_shard(name).mutex);

        std::error_code ec;
        const uint64_t replaced = std::filesystem::file_size(*path, ec);
        const bool existed = !ec;

        std::filesystem::create_directories(path->parent_path(), ec);
        if (ec) {
            result.error_message = "mkdir " + path->parent_path().string() + ": " + ec.message();
            return result;
        }

        // Readers never see a partial object: stage beside the target, then rename
        static std::atomic<uint64_t> staging_seq{0};
        std::filesystem::path staging = *path;
        staging += ".tmp." + std::to_string(::getpid()) + "." +
                   std::to_string(staging_seq.fetch_add(1, std::memory_order_relaxed));

        bool written = false;
        {
            std::ofstream out(staging, std::ios::binary | std::ios::trunc);
            written = out && out.write(reinterpret_cast<const char*>(data.data()),
                                       static_cast<std::streamsize>(data.size())) &&
                      out.flush();
        }
        if (written) std::filesystem::rename(staging, *path, ec);
        if (!written || ec) {
            result.error_message = "Cannot store " + name + ": " +
                                   (written ? ec.message() : std::string("write failed"));
            std::filesystem::remove(staging, ec);
            return result;
        }

        if (existed) {
            total_bytes_.fetch_sub(replaced, std::memory_order_relaxed);
        } else {
            object_count_.fetch_add(1, std::memory_order_relaxed);
        }
        total_bytes_.fetch_add(data.size(), std::memory_order_relaxed);

        result.remote_id = name;
        result.success = true;
        return result;
    }

    RemoveResult remove(const std::string& key) override {
        RemoveResult result;
        auto path = safe_path(key, &result.error_message);
        if (!path) return result;

        std::unique_lock lock(get_shard(key).mutex);

        std::error_code ec;
        uint64_t size = std::filesystem::file_size(*path, ec);
        if (ec) size = 0;

        bool removed = std::filesystem::remove(*path, ec);
        if (ec) {
            result.error_message = "Failed to remove " + key + ": " + ec.message();
            return result;
        }

        if (removed) {
            object_count_.fetch_sub(1, std::memory_order_relaxed);
            total_bytes_.fetch_sub(size, std::memory_order_relaxed);
        }
        result.success = true;
        result.existed = removed;
        return result;
    }

    ListResult list(const ListOptions& options) const override {
        ListResult result;
        std::vector<ListEntry> entries;

        try {
            for (const auto& entry : std::filesystem::recursive_directory_iterator(root_)) {
                if (!entry.is_regular_file()) continue;

                std::string key = std::filesystem::relative(entry.path(), root_).generic_string();
                if (key.find(".tmp.") != std::string::npos) continue;  // in-flight write
                if (!options.prefix.empty() && !key.starts_with(options.prefix)) continue;
                if (!options.continuation_token.empty() && key <= options.continuation_token) continue;

                ListEntry le;
                le.key = key;
                le.name = key;
                le.size = entry.file_size();
                le.last_modified = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
                    std::chrono::file_clock::to_sys(entry.last_write_time()));
                entries.push_back(std::move(le));
            }
        } catch (const std::filesystem::filesystem_error& e) {
            result.error_message = e.what();
            return result;
        }

        std::sort(entries.begin(), entries.end(),
                  [](const ListEntry& a, const ListEntry& b) { return a.key < b.key; });

        if (options.max_keys > 0 && entries.size() > options.max_keys) {
            entries.resize(options.max_keys);
            result.truncated = true;
            result.continuation_token = entries.back().key;
        }

        result.entries = std::move(entries);
        result.success = true;
        return result;
    }

    SizeInfo size_info() const override {
        SizeInfo info;
        info.used_bytes = total_bytes_.load(std::memory_order_relaxed);
        if (quota_bytes_ > 0) {
            info.total_bytes = quota_bytes_;
        } else {
            std::error_code ec;
            auto space = std::filesystem::space(root_, ec);
            if (ec) {
                info.error_message = "Failed to query filesystem space: " + ec.message();
                return info;
            }
            info.total_bytes = space.capacity;
        }
        info.success = true;
        return info;
    }

    bool is_healthy() const override {
        return std::filesystem::exists(root_) &&
               std::filesystem::is_directory(root_);
    }

private:
    struct Shard {
        mutable std::shared_mutex mutex;
    };

    Shard& get_shard(const std::string& key) const {
        size_t hash = std::hash<std::string>{}(key);
        return *shards_[hash % shards_.size()];
    }

    // Keys are relative paths below root_. Absolute keys, ".." segments and
    // symlinks that resolve outside root_ are refused.
    std::filesystem::path key_to_path(const std::string& key) const {
        const std::filesystem::path relative(key);
        bool escapes = key.empty() || relative.is_absolute();
        for (const auto& part : relative) {
            if (part == "..") escapes = true;
        }
        if (!escapes) {
            std::error_code ec;
            auto base = std::filesystem::weakly_canonical(root_, ec);
            auto target = std::filesystem::weakly_canonical(root_ / relative, ec);
            auto rel = target.lexically_relative(base);
            escapes = !ec && (rel.empty() || *rel.begin() == "..");
        }
        if (escapes) {
            throw std::invalid_argument("Storage key escapes backend root: " + key);
        }
        return root_ / relative;
    }

    // key_to_path without the exception, for result-returning operations
    std::optional<std::filesystem::path> safe_path(const std::string& key,
                                                   std::string* error = nullptr) const {
        try {
            return key_to_path(key);
        } catch (const std::invalid_argument& e) {
            if (error) *error = e.what();
            return std::nullopt;
        }
    }

    void reload_counters() {
        uint64_t count = 0;
        uint64_t bytes = 0;
        std::error_code ec;
        for (auto it = std::filesystem::recursive_directory_iterator(root_, ec);
             !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
            if (!it->is_regular_file()) continue;
            if (it->path().filename().string().find(".tmp.") != std::string::npos) continue;
            ++count;
            bytes += it->file_size();
        }
        object_count_.store(count, std::memory_order_relaxed);
        total_bytes_.store(bytes, std::memory_order_relaxed);
    }

    std::filesystem::path root_;
    uint64_t quota_bytes_;
    std::vector<std::unique_ptr<Shard>> shards_;

    std::atomic<uint64_t> object_count_{0};
    std::atomic<uint64_t> total_bytes_{0};
};

// ============================================================================
// XML parsing helpers for S3 responses
// ============================================================================

namespace xml {

// Bodies of each <tag>...</tag>, in document order. ListObjectsV2 responses
// carry no attributes or nesting of the same tag, so a flat scan suffices.
std::vector<std::string> find_elements(const std::string& doc, const std::string& tag) {
    std::vector<std::string> out;
    const std::string open = "<" + tag + ">";
    const std::string close = "</" + tag + ">";
    for (size_t at = doc.find(open); at != std::string::npos; at = doc.find(open, at)) {
        const size_t body = at + open.size();
        const size_t stop = doc.find(close, body);
        if (stop == std::string::npos) break;
        out.push_back(doc.substr(body, stop - body));
        at = stop + close.size();
    }
    return out;
}

// First <tag> body, or "" when absent
std::string get_element(const std::string& doc, const std::string& tag) {
    auto found = find_elements(doc, tag);
    return found.empty() ? std::string() : found.front();
}

std::string decode_entities(const std::string& s) {
    static const std::map<std::string, char> named = {
        {"lt", '<'}, {"gt", '>'}, {"amp", '&'}, {"quot", '"'}, {"apos", '\''},
    };
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        const size_t semi = s[i] == '&' ? s.find(';', i) : std::string::npos;
        if (semi != std::string::npos) {
            auto it = named.find(s.substr(i + 1, semi - i - 1));
            if (it != named.end()) {
                out += it->second;
                i = semi;
                continue;
            }
        }
        out += s[i];
    }
    return out;
}

}  // namespace xml

// ============================================================================
// S3StorageBackend - S3-compatible storage implementation
// ============================================================================

class S3StorageBackend : public StorageBackend {
public:
    struct Config {
        std::string bucket;
        std::string region = "us-east-1";
        std::string endpoint;     // Empty for AWS, custom for MinIO/etc
        std::string path_prefix;  // Key prefix inside the bucket
        SecureString access_key;
        SecureString secret_key;
        std::string session_token;
        bool use_path_style = false;
        bool verify_ssl = true;
        uint32_t connect_timeout_secs = constants::DEFAULT_HTTP_CONNECT_TIMEOUT_SECONDS;
        uint32_t request_timeout_secs = constants::DEFAULT_HTTP_REQUEST_TIMEOUT_SECONDS;
        uint32_t max_retries = constants::DEFAULT_BACKEND_MAX_RETRIES;
        uint64_t quota_bytes = 0;
    };

    explicit S3StorageBackend(const Config& config)
        : config_(config)
        , signer_(config.access_key.str(), config.secret_key.str(), config.region, "s3") {
        net::HttpClientConfig http_config;
        http_config.user_agent = "chunkvault-s3/1.0";
        http_config.verify_ssl = config_.verify_ssl;
        http_config.connect_timeout = std::chrono::milliseconds(config_.connect_timeout_secs * 1000);
        http_config.total_timeout = std::chrono::milliseconds(config_.request_timeout_secs * 1000);
        http_client_ = std::make_unique<net::HttpClient>(http_config);
    }

    std::string type_name() const override { return "s3"; }

    bool exists(const std::string& key) const override {
        return head(key).has_value();
    }

    std::optional<ObjectMetadata> head(const std::string& key) const override {
        auto request = net::HttpRequest::head(build_url(key));
        sign_request(request);

        auto response = http_client_->execute(request);
        if (!response.ok()) {
            return std::nullopt;
        }

        ObjectMetadata meta;
        meta.size = response.headers.content_length().value_or(0);
        meta.etag = response.headers.get("ETag").value_or("");
        meta.content_type = response.headers.content_type().value_or("application/octet-stream");
        return meta;
    }

    GetResult get(const std::string& key) const override {
        GetResult result;
        auto request = net::HttpRequest::get(build_url(key));
        sign_request(request);

        auto response = execute_with_retry(request);
        if (!response.ok()) {
            result.not_found = response.status_code == 404;
            result.error_message = describe_failure(response);
            return result;
        }

        result.success = true;
        result.data = std::move(response.body);
        result.metadata.size = result.data.size();
        result.metadata.etag = response.headers.get("ETag").value_or("");
        return result;
    }

    PutResult put(const std::string& name,
                  std::span<const uint8_t> data,
                  const PutOptions& options) override {
        PutResult result;

        auto request = net::HttpRequest::put(build_url(name),
            std::vector<uint8_t>(data.begin(), data.end()));
        request.headers.set_content_type(options.content_type.empty()
            ? "application/octet-stream" : options.content_type);
        for (const auto& [k, v] : options.metadata) {
            request.headers.set("x-amz-meta-" + k, v);
        }
        sign_request(request);

        auto response = execute_with_retry(request);
        if (!response.ok()) {
            result.error_message = describe_failure(response);
            return result;
        }

        result.success = true;
        result.remote_id = name;
        result.etag = response.headers.get("ETag").value_or("");
        return result;
    }

    RemoveResult remove(const std::string& key) override {
        RemoveResult result;

        // S3 answers 204 whether or not the key existed
        bool existed = head(key).has_value();

        auto request = net::HttpRequest::del(build_url(key));
        sign_request(request);

        auto response = execute_with_retry(request);
        if (!response.ok() && response.status_code != 404) {
            result.error_message = describe_failure(response);
            return result;
        }

        result.success = true;
        result.existed = existed;
        return result;
    }

    ListResult list(const ListOptions& options) const override {
        ListResult result;

        std::vector<std::string> params;
        params.push_back("list-type=2");
        std::string prefix = config_.path_prefix + options.prefix;
        if (!prefix.empty()) {
            params.push_back("prefix=" + net::url_encode(prefix));
        }
        params.push_back("max-keys=" + std::to_string(options.max_keys));
        if (!options.continuation_token.empty()) {
            params.push_back("continuation-token=" + net::url_encode(options.continuation_token));
        }

        std::string url = bucket_url() + "/?";
        for (size_t i = 0; i < params.size(); ++i) {
            if (i > 0) url += "&";
            url += params[i];
        }

        auto request = net::HttpRequest::get(url);
        sign_request(request);

        auto response = execute_with_retry(request);
        if (!response.ok()) {
            result.error_message = describe_failure(response);
            return result;
        }

        return parse_list_response(response.body_string());
    }

    SizeInfo size_info() const override {
        SizeInfo info;
        info.total_bytes = config_.quota_bytes;

        ListOptions options;
        do {
            auto page = list(options);
            if (!page.success) {
                info.error_message = page.error_message;
                return info;
            }
            for (const auto& entry : page.entries) {
                info.used_bytes += entry.size;
            }
            options.continuation_token = page.truncated ? page.continuation_token : "";
        } while (!options.continuation_token.empty());

        info.success = true;
        return info;
    }

    bool is_healthy() const override {
        ListOptions options;
        options.max_keys = 1;
        return list(options).success;
    }

private:
    void sign_request(net::HttpRequest& request) const {
        if (!config_.session_token.empty()) {
            signer_.sign_with_token(request, config_.session_token);
        } else {
            signer_.sign(request);
        }
    }

    // Exponential backoff on retryable statuses and network errors
    net::HttpResponse execute_with_retry(const net::HttpRequest& request) const {
        net::HttpResponse response;
        uint32_t max_attempts = config_.max_retries + 1;
        for (uint32_t attempt = 1; attempt <= max_attempts; ++attempt) {
            response = http_client_->execute(request);
            if (response.ok() ||
                (!response.is_network_error && !net::is_retryable_status(response.status_code))) {
                break;
            }
            if (attempt < max_attempts) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100 * (1 << attempt)));
            }
        }
        return response;
    }

    std::string bucket_url() const {
        if (!config_.endpoint.empty()) {
            return config_.use_path_style ? config_.endpoint + "/" + config_.bucket
                                          : config_.endpoint;
        }
        if (config_.use_path_style) {
            return "https://s3." + config_.region + ".amazonaws.com/" + config_.bucket;
        }
        return "https://" + config_.bucket + ".s3." + config_.region + ".amazonaws.com";
    }

    std::string build_url(const std::string& key) const {
        return bucket_url() + "/" + net::url_encode(config_.path_prefix + key, false);
    }

    ListResult parse_list_response(const std::string& body) const {
        ListResult result;
        result.success = true;
        result.truncated = xml::get_element(body, "IsTruncated") == "true";
        result.continuation_token = xml::get_element(body, "NextContinuationToken");

        for (const auto& content : xml::find_elements(body, "Contents")) {
            std::string key = xml::decode_entities(xml::get_element(content, "Key"));
            if (!config_.path_prefix.empty() && key.starts_with(config_.path_prefix)) {
                key = key.substr(config_.path_prefix.size());
            }

            ListEntry entry;
            entry.key = key;
            entry.name = key;
            std::string size_str = xml::get_element(content, "Size");
            if (!size_str.empty()) {
                entry.size = std::strtoull(size_str.c_str(), nullptr, 10);
            }
            entry.last_modified = parse_iso8601(xml::get_element(content, "LastModified"));
            result.entries.push_back(std::move(entry));
        }

        return result;
    }

    Config config_;
    net::AwsSigV4Signer signer_;
    std::unique_ptr<net::HttpClient> http_client_;
};

// ============================================================================
// DropboxStorageBackend - Dropbox HTTP API v2
// ============================================================================

class DropboxStorageBackend : public StorageBackend {
public:
    struct Config {
        SecureString access_token;
        std::string folder_path = "/chunkvault";
        std::string api_url = "https://api.dropboxapi.com/2";
        std::string content_url = "https://content.dropboxapi.com/2";
        bool verify_ssl = true;
        uint32_t connect_timeout_secs = constants::DEFAULT_HTTP_CONNECT_TIMEOUT_SECONDS;
        uint32_t request_timeout_secs = constants::DEFAULT_HTTP_REQUEST_TIMEOUT_SECONDS;
    };

    explicit DropboxStorageBackend(const Config& config) : config_(config) {
        // Dropbox paths start with '/', and the root folder is ""
        auto& folder = config_.folder_path;
        while (!folder.empty() && folder.back() == '/') folder.pop_back();
        if (!folder.empty() && folder.front() != '/') folder.insert(folder.begin(), '/');

        net::HttpClientConfig http_config;
        http_config.user_agent = "chunkvault-dropbox/1.0";
        http_config.verify_ssl = config_.verify_ssl;
        http_config.connect_timeout = std::chrono::milliseconds(config_.connect_timeout_secs * 1000);
        http_config.total_timeout = std::chrono::milliseconds(config_.request_timeout_secs * 1000);
        http_client_ = std::make_unique<net::HttpClient>(http_config);
    }

    std::string type_name() const override { return "dropbox"; }

    bool exists(const std::string& key) const override {
        return head(key).has_value();
    }

    std::optional<ObjectMetadata> head(const std::string& key) const override {
        auto response = rpc("/files/get_metadata", {{"path", key}});
        if (!response.ok()) return std::nullopt;

        auto j = nlohmann::json::parse(response.body_string(), nullptr, false);
        if (j.is_discarded() || j.value(".tag", "") != "file") return std::nullopt;

        ObjectMetadata meta;
        meta.size = j.value("size", uint64_t{0});
        meta.etag = j.value("rev", "");
        meta.last_modified = parse_iso8601(j.value("server_modified", ""));
        meta.content_type = "application/octet-stream";
        return meta;
    }

    GetResult get(const std::string& key) const override {
        GetResult result;

        auto request = net::HttpRequest::post(config_.content_url + "/files/download",
                                              std::vector<uint8_t>{});
        request.headers.set_bearer_token(config_.access_token.str());
        request.headers.set("Dropbox-API-Arg", api_arg({{"path", key}}));
        request.headers.set("Content-Type", "");  // content endpoints reject form encoding

        auto response = http_client_->execute(request);
        if (!response.ok()) {
            result.error_message = error_summary(response);
            result.not_found = response.status_code == 409 &&
                               result.error_message.find("not_found") != std::string::npos;
            return result;
        }

        result.success = true;
        result.data = std::move(response.body);
        result.metadata.size = result.data.size();
        return result;
    }

    PutResult put(const std::string& name,
                  std::span<const uint8_t> data,
                  const PutOptions& /*options*/) override {
        PutResult result;
        std::string path = config_.folder_path + "/" + name;

        auto request = net::HttpRequest::post(config_.content_url + "/files/upload",
                                              std::vector<uint8_t>(data.begin(), data.end()));
        request.headers.set_bearer_token(config_.access_token.str());
        request.headers.set_content_type("application/octet-stream");
        request.headers.set("Dropbox-API-Arg", api_arg({
            {"path", path}, {"mode", "overwrite"}, {"autorename", false}, {"mute", true}}));

        auto response = http_client_->execute(request);
        if (!response.ok()) {
            result.error_message = error_summary(response);
            return result;
        }

        auto j = nlohmann::json::parse(response.body_string(), nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            result.error_message = "Malformed upload response from Dropbox";
            return result;
        }

        result.success = true;
        result.remote_id = j.value("path_display", path);
        result.etag = j.value("rev", "");
        return result;
    }

    RemoveResult remove(const std::string& key) override {
        RemoveResult result;
        auto response = rpc("/files/delete_v2", {{"path", key}});
        if (response.ok()) {
            result.success = true;
            result.existed = true;
            return result;
        }

        std::string summary = error_summary(response);
        if (response.status_code == 409 && summary.find("not_found") != std::string::npos) {
            result.success = true;
            result.existed = false;
            return result;
        }

        result.error_message = summary;
        return result;
    }

    ListResult list(const ListOptions& options) const override {
        ListResult result;

        net::HttpResponse response;
        if (options.continuation_token.empty()) {
            response = rpc("/files/list_folder", {
                {"path", config_.folder_path},
                {"recursive", false},
                {"limit", std::max<uint32_t>(1, std::min<uint32_t>(options.max_keys, 2000))}});
        } else {
            response = rpc("/files/list_folder/continue", {{"cursor", options.continuation_token}});
        }

        if (!response.ok()) {
            std::string summary = error_summary(response);
            // A folder that was never written to simply has no chunks yet
            if (response.status_code == 409 && summary.find("not_found") != std::string::npos) {
                result.success = true;
                return result;
            }
            result.error_message = summary;
            return result;
        }

        auto j = nlohmann::json::parse(response.body_string(), nullptr, false);
        if (j.is_discarded() || !j.contains("entries") || !j["entries"].is_array()) {
            result.error_message = "Malformed list_folder response from Dropbox";
            return result;
        }

        for (const auto& item : j["entries"]) {
            std::string name = item.value("name", "");
            if (!options.prefix.empty() && !name.starts_with(options.prefix)) continue;

            ListEntry entry;
            entry.key = item.value("path_display", "");
            entry.name = name;
            entry.is_directory = item.value(".tag", "") == "folder";
            entry.size = item.value("size", uint64_t{0});
            entry.last_modified = parse_iso8601(item.value("server_modified", ""));
            result.entries.push_back(std::move(entry));
        }

        result.truncated = j.value("has_more", false);
        if (result.truncated) {
            result.continuation_token = j.value("cursor", "");
        }
        result.success = true;
        return result;
    }

    SizeInfo size_info() const override {
        SizeInfo info;

        // RPC endpoints without arguments take a literal JSON null body
        auto request = net::HttpRequest::post(config_.api_url + "/users/get_space_usage",
                                              std::string("null"));
        request.headers.set_bearer_token(config_.access_token.str());
        request.headers.set_content_type("application/json");

        auto response = http_client_->execute(request);
        if (!response.ok()) {
            info.error_message = error_summary(response);
            return info;
        }

        auto j = nlohmann::json::parse(response.body_string(), nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            info.error_message = "Malformed space usage response from Dropbox";
            return info;
        }

        info.used_bytes = j.value("used", uint64_t{0});
        if (j.contains("allocation") && j["allocation"].is_object()) {
            info.total_bytes = j["allocation"].value("allocated", uint64_t{0});
        }
        info.success = true;
        return info;
    }

    bool is_healthy() const override {
        return size_info().success;
    }

private:
    static std::string api_arg(const nlohmann::json& arg) {
        // Header values must be ASCII
        return arg.dump(-1, ' ', true);
    }

    static std::string error_summary(const net::HttpResponse& response) {
        if (response.is_network_error) return response.error;
        auto j = nlohmann::json::parse(response.body_string(), nullptr, false);
        if (!j.is_discarded() && j.is_object() && j.contains("error_summary") &&
            j["error_summary"].is_string()) {
            return j["error_summary"].get<std::string>();
        }
        return describe_failure(response);
    }

    net::HttpResponse rpc(const std::string& endpoint, const nlohmann::json& args) const {
        auto request = net::HttpRequest::post(config_.api_url + endpoint, std::vector<uint8_t>{});
        request.headers.set_bearer_token(config_.access_token.str());
        request.set_json_body(args.dump());
        return http_client_->execute(request);
    }

    Config config_;
    std::unique_ptr<net::HttpClient> http_client_;
};

// ============================================================================
// StorageBackendFactory implementation
// ============================================================================

namespace {

using ParamMap = std::map<std::string, std::string>;

const std::string* find_param(const ParamMap& config, const char* key) {
    auto it = config.find(key);
    return (it == config.end() || it->second.empty()) ? nullptr : &it->second;
}

bool param_bool(const ParamMap& config, const char* key, bool fallback) {
    const auto* v = find_param(config, key);
    if (!v) return fallback;
    return *v == "true" || *v == "1" || *v == "yes";
}

uint64_t param_uint(const ParamMap& config, const char* key, uint64_t fallback) {
    const auto* v = find_param(config, key);
    if (!v) return fallback;
    try {
        size_t consumed = 0;
        uint64_t value = std::stoull(*v, &consumed);
        if (consumed == v->size()) return value;
    } catch (const std::exception&) {
        // reported below
    }
    throw std::runtime_error(std::string("Invalid numeric value for '") + key + "': " + *v);
}

}  // namespace

std::unique_ptr<StorageBackend> StorageBackendFactory::create(
    const std::string& type,
    const std::map<std::string, std::string>& config) {

    if (type == "local" || type == "nfs") {
        const auto* path = find_param(config, "path");
        if (!path) {
            throw std::runtime_error("Local backend requires 'path' config");
        }
        return std::make_unique<LocalStorageBackend>(*path, param_uint(config, "quota_bytes", 0));
    }

    if (type == "s3") {
        S3StorageBackend::Config s3_config;

        const auto* bucket = find_param(config, "bucket");
        if (!bucket) {
            throw std::runtime_error("S3 backend requires 'bucket' config");
        }
        s3_config.bucket = *bucket;

        if (const auto* v = find_param(config, "region")) s3_config.region = *v;
        if (const auto* v = find_param(config, "endpoint")) s3_config.endpoint = *v;
        if (const auto* v = find_param(config, "path_prefix")) s3_config.path_prefix = *v;
        if (const auto* v = find_param(config, "access_key")) s3_config.access_key = *v;
        if (const auto* v = find_param(config, "secret_key")) s3_config.secret_key = *v;
        if (const auto* v = find_param(config, "session_token")) s3_config.session_token = *v;
        s3_config.use_path_style = param_bool(config, "use_path_style", false);
        s3_config.verify_ssl = param_bool(config, "verify_ssl", true);
        s3_config.connect_timeout_secs = static_cast<uint32_t>(
            param_uint(config, "connect_timeout", s3_config.connect_timeout_secs));
        s3_config.request_timeout_secs = static_cast<uint32_t>(
            param_uint(config, "request_timeout", s3_config.request_timeout_secs));
        s3_config.max_retries = static_cast<uint32_t>(
            param_uint(config, "max_retries", s3_config.max_retries));
        s3_config.quota_bytes = param_uint(config, "quota_bytes", 0);

        return std::make_unique<S3StorageBackend>(s3_config);
    }

    if (type == "dropbox") {
        DropboxStorageBackend::Config dbx_config;

        const auto* token = find_param(config, "access_token");
        if (!token) {
            throw std::runtime_error("Dropbox backend requires 'access_token' config");
        }
        dbx_config.access_token = *token;

        if (const auto* v = find_param(config, "folder_path")) dbx_config.folder_path = *v;
        if (const auto* v = find_param(config, "api_url")) dbx_config.api_url = *v;
        if (const auto* v = find_param(config, "content_url")) dbx_config.content_url = *v;
        dbx_config.verify_ssl = param_bool(config, "verify_ssl", true);
        dbx_config.connect_timeout_secs = static_cast<uint32_t>(
            param_uint(config, "connect_timeout", dbx_config.connect_timeout_secs));
        dbx_config.request_timeout_secs = static_cast<uint32_t>(
            param_uint(config, "request_timeout", dbx_config.request_timeout_secs));

        return std::make_unique<DropboxStorageBackend>(dbx_config);
    }

    throw std::runtime_error("Unknown storage backend type: " + type);
}

std::unique_ptr<StorageBackend> StorageBackendFactory::create_local(
    const std::filesystem::path& root_path) {
    return std::make_unique<LocalStorageBackend>(root_path, 0);
}

std::unique_ptr<StorageBackend> StorageBackendFactory::create_s3(
    const std::string& bucket,
    const std::string& region,
    const std::string& endpoint,
    const std::string& access_key,
    const std::string& secret_key) {

    S3StorageBackend::Config config;
    config.bucket = bucket;
    config.region = region;
    config.endpoint = endpoint;
    config.access_key = access_key;
    config.secret_key = secret_key;
    return std::make_unique<S3StorageBackend>(config);
}

std::unique_ptr<StorageBackend> StorageBackendFactory::create_dropbox(
    const std::string& access_token,
    const std::string& folder_path) {

    DropboxStorageBackend::Config config;
    config.access_token = access_token;
    config.folder_path = folder_path;
    return std::make_unique<DropboxStorageBackend>(config);
}

}  // namespace chunkvault
