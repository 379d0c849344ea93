#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace chunkvault {

/// Configuration for a single storage backend (local, nfs, s3, dropbox).
struct BackendConfig {
    std::string type;  // "local", "nfs", "s3", "dropbox"
    std::map<std::string, std::string> params;  // Passed to StorageBackendFactory

    bool empty() const { return type.empty(); }

    /// Validate required fields for this backend type.
    /// Returns error message or empty string on success.
    std::string validate() const;

    /// Parse "type" or "type:key=value,key=value". For local and nfs a bare
    /// "type:/some/path" sets the path. Returns empty optional on error.
    static std::optional<BackendConfig> parse(const std::string& text);
};

/// Configuration for the chunkvault tool and engine.
struct EngineConfig {
    // Ordered backend pool; backend_index in manifests refers to this order
    std::vector<BackendConfig> backends;

    uint64_t chunk_size = 5 * 1024 * 1024;  // 5 MB

    // Manifest persistence
    std::filesystem::path metadata_dir;  // Default: ./metadata
    std::string manifest_store = "json";  // "json" or "sqlite"

    // Recognized for compatibility with existing config files; chunks are
    // stored as plaintext.
    bool encryption_enabled = false;
    std::string encryption_key;

    // Logging
    bool verbose = false;
    std::filesystem::path log_file;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = 15;

    /// Parse global options up to the first non-option argument, whose
    /// position is stored in command_index (argc if none).
    /// Returns empty optional on error or --help (prints usage to stderr).
    static std::optional<EngineConfig> from_args(int argc, char* argv[], int& command_index);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Fill in defaults and environment credentials.
    void apply_defaults();

    /// Validate required fields. Returns error message or empty string.
    std::string validate() const;

    /// Location of the SQLite manifest database for manifest_store = sqlite.
    std::filesystem::path sqlite_path() const;
};

/// Usage text for the chunkvault command line.
const char* usage_text();

}  // namespace chunkvault
