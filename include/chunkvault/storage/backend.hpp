#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace chunkvault {

// Metadata about a stored object
struct ObjectMetadata {
    uint64_t size = 0;
    std::chrono::system_clock::time_point last_modified;
    std::string content_type;
    std::string etag;
};

// Result of a put operation
struct PutResult {
    bool success = false;
    std::string remote_id;  // Opaque id to pass to get/remove later
    std::string etag;
    std::string error_message;
};

// Result of a get operation
struct GetResult {
    bool success = false;
    bool not_found = false;  // Set when the backend positively reports absence
    std::vector<uint8_t> data;
    ObjectMetadata metadata;
    std::string error_message;
};

// Result of a remove operation. Removing an absent object succeeds
// with existed = false.
struct RemoveResult {
    bool success = false;
    bool existed = false;
    std::string error_message;
};

// Entry in a listing operation
struct ListEntry {
    std::string key;   // Remote id
    std::string name;  // Object name relative to the backend root/folder
    uint64_t size = 0;
    std::chrono::system_clock::time_point last_modified;
    bool is_directory = false;
};

// Result of a list operation
struct ListResult {
    bool success = false;
    std::vector<ListEntry> entries;
    bool truncated = false;
    std::string continuation_token;
    std::string error_message;
};

// Options for put operations
struct PutOptions {
    std::string content_type = "application/octet-stream";
    std::map<std::string, std::string> metadata;
};

// Options for list operations
struct ListOptions {
    std::string prefix;
    uint32_t max_keys = 1000;
    std::string continuation_token;
};

// Capacity report. total_bytes is 0 when the backend cannot tell.
struct SizeInfo {
    bool success = false;
    uint64_t total_bytes = 0;
    uint64_t used_bytes = 0;
    std::string error_message;
};

// Abstract interface for chunk storage backends.
// Stores opaque byte blobs under a caller-chosen name and hands back a
// remote id; the engine never depends on the concrete backend type.
class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    // Backend type name (for logging/debugging)
    virtual std::string type_name() const = 0;

    // Check if an object exists
    virtual bool exists(const std::string& key) const = 0;

    // Get object metadata without downloading content
    virtual std::optional<ObjectMetadata> head(const std::string& key) const = 0;

    // Read object content by remote id
    virtual GetResult get(const std::string& key) const = 0;

    // Store a blob under name; the result carries the remote id
    virtual PutResult put(const std::string& name,
                          std::span<const uint8_t> data,
                          const PutOptions& options = {}) = 0;

    // Delete an object by remote id (idempotent)
    virtual RemoveResult remove(const std::string& key) = 0;

    // List stored objects
    virtual ListResult list(const ListOptions& options = {}) const = 0;

    // Capacity and usage
    virtual SizeInfo size_info() const = 0;

    // Health check
    virtual bool is_healthy() const = 0;
};

// Factory for creating storage backends from configuration
class StorageBackendFactory {
public:
    // Create a backend from a type name ("local", "nfs", "s3", "dropbox")
    // and its parameter map. Throws std::runtime_error on bad config.
    static std::unique_ptr<StorageBackend> create(
        const std::string& type,
        const std::map<std::string, std::string>& config);

    // Create a local filesystem backend
    static std::unique_ptr<StorageBackend> create_local(
        const std::filesystem::path& root_path);

    // Create an S3-compatible backend
    static std::unique_ptr<StorageBackend> create_s3(
        const std::string& bucket,
        const std::string& region,
        const std::string& endpoint = "",
        const std::string& access_key = "",
        const std::string& secret_key = "");

    // Create a Dropbox backend storing chunks under folder_path
    static std::unique_ptr<StorageBackend> create_dropbox(
        const std::string& access_token,
        const std::string& folder_path = "/chunkvault");
};

}  // namespace chunkvault
