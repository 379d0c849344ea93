#pragma once

#include "chunkvault/core/constants.hpp"
#include "chunkvault/manifest.hpp"
#include "chunkvault/manifest_store.hpp"
#include "chunkvault/placement.hpp"
#include "chunkvault/storage/backend.hpp"

#include <array>
#include <filesystem>
#include <istream>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace chunkvault {

struct Chunk;
class MetricsExporter;
struct EngineConfig;

struct UploadOptions {
    std::string file_id;  // Append a version to this file if it exists
    std::string notes;    // Version notes; a default is generated when empty
};

struct FileEntry {
    std::string file_id;
    std::string original_filename;
    uint64_t total_size = 0;
    Timestamp updated_at;
    size_t version_count = 0;
};

struct VersionSummary {
    std::string version_id;
    Timestamp created_at;
    bool is_current = false;
    std::string notes;
    size_t chunk_count = 0;
    uint64_t size_bytes = 0;
};

enum class DeleteStatus { Deleted, AlreadyAbsent, Partial };

/// A chunk that could not be removed from its backend.
struct ChunkFailure {
    std::string version_id;
    uint64_t chunk_index = 0;
    size_t backend_index = 0;
    std::string remote_id;
    std::string error;
};

struct DeleteResult {
    DeleteStatus status = DeleteStatus::Deleted;
    size_t chunks_deleted = 0;
    std::vector<ChunkFailure> failures;
    bool manifest_removed = false;
    std::string manifest_error;

    bool ok() const { return status != DeleteStatus::Partial; }
};

enum class RestoreResult { Restored, FileNotFound, VersionNotFound };

const char* to_string(DeleteStatus status);
const char* to_string(RestoreResult result);

struct BackendUsage {
    size_t backend_index = 0;
    std::string type_name;
    bool healthy = false;
    SizeInfo size;
};

struct EngineOptions {
    uint64_t chunk_size = constants::DEFAULT_CHUNK_SIZE;
};

/// Splits files into chunks, places them across an ordered backend pool and
/// tracks every upload as a version in the manifest store.
///
/// Chunks are written and read one at a time in index order. Manifest
/// read-modify-write is serialized per file_id by a striped lock set, and
/// between engines or processes sharing a store by its revision
/// check-and-set. A manifest is
/// only written after every chunk of the new version is stored; a failed
/// upload removes whatever it placed.
class ChunkEngine {
public:
    /// Throws ConfigurationError for an empty or null backend pool, a null
    /// store, a zero chunk size, or a placement strategy whose backend count
    /// differs from the pool. Placement defaults to round-robin.
    ChunkEngine(std::vector<std::unique_ptr<StorageBackend>> backends,
                std::unique_ptr<ManifestStore> store,
                const EngineOptions& options = {},
                std::unique_ptr<PlacementStrategy> placement = nullptr);
    ~ChunkEngine();

    ChunkEngine(const ChunkEngine&) = delete;
    ChunkEngine& operator=(const ChunkEngine&) = delete;

    /// Build backends and the manifest store from configuration.
    /// Throws ConfigurationError if a backend cannot be created.
    static std::unique_ptr<ChunkEngine> from_config(const EngineConfig& config);

    /// Optional metrics sink (not owned).
    void set_metrics(MetricsExporter* metrics) { metrics_ = metrics; }

    // --- Operations ---

    /// Store the stream as a new file, or as a new version of options.file_id
    /// when that file exists. Returns the file id.
    std::string upload(std::istream& input, const std::string& filename,
                       const UploadOptions& options = {});

    /// upload() from a path. filename defaults to the path's basename.
    /// Throws NotFoundError if the source does not exist.
    std::string upload_file(const std::filesystem::path& path,
                            const std::string& filename = "",
                            const UploadOptions& options = {});

    /// Write the current version to output, verifying every chunk.
    void download(const std::string& file_id, std::ostream& output);

    /// download() into a file, creating parent directories. The output is
    /// left incomplete if a chunk fails verification.
    void download_file(const std::string& file_id, const std::filesystem::path& path);

    /// Delete every chunk of every version, then the manifest. Failures are
    /// reported in the result, not thrown. A manifest that no longer decodes
    /// is removed too, after deleting the chunks its records still name; that
    /// delete is Partial with manifest_error set.
    DeleteResult remove_file(const std::string& file_id);

    /// Make an earlier version current. Metadata only.
    RestoreResult restore_version(const std::string& file_id, const std::string& version_id);

    /// Stored files sorted by filename (case-insensitive). Unreadable
    /// manifests are skipped with a warning.
    std::vector<FileEntry> list();

    /// Version history, newest first. Throws NotFoundError.
    std::vector<VersionSummary> list_versions(const std::string& file_id);

    std::optional<Manifest> stat(const std::string& file_id);

    /// Per-backend health and capacity. Never throws for a failing backend.
    std::vector<BackendUsage> backend_usage() const;

    // --- Introspection ---

    size_t backend_count() const { return backends_.size(); }
    StorageBackend& backend(size_t index) { return *backends_.at(index); }
    uint64_t chunk_size() const { return chunk_size_; }
    size_t file_count();

    /// Object name a chunk is stored under.
    static std::string chunk_object_name(const std::string& file_id,
                                         const std::string& version_id,
                                         uint64_t chunk_index);

private:
    std::optional<Manifest> load_manifest(const std::string& file_id);
    std::mutex& lock_for(const std::string& file_id);

    ChunkRecord place_chunk(const std::string& file_id, const std::string& version_id,
                            const Chunk& chunk);
    void commit_version(const std::string& file_id, const std::string& filename,
                        const Version& version, bool append);

    std::vector<uint8_t> fetch_chunk(const std::string& file_id, const ChunkRecord& record);
    uint64_t write_version(const Manifest& manifest, std::ostream& output);

    void delete_chunks(const Version& version, DeleteResult& result);
    std::vector<Version> recover_chunk_records(const std::string& file_id);
    void cleanup_chunks(const std::string& file_id, const Version& version);

    std::vector<std::unique_ptr<StorageBackend>> backends_;
    std::unique_ptr<ManifestStore> store_;
    std::unique_ptr<PlacementStrategy> placement_;
    uint64_t chunk_size_;

    MetricsExporter* metrics_ = nullptr;

    std::array<std::mutex, constants::MANIFEST_LOCK_STRIPES> manifest_locks_;
};

}  // namespace chunkvault
