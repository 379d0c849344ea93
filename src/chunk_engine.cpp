#include "chunkvault/chunk_engine.hpp"
#include "chunkvault/chunker.hpp"
#include "chunkvault/engine_config.hpp"
#include "chunkvault/errors.hpp"
#include "chunkvault/ids.hpp"
#include "chunkvault/log.hpp"
#include "chunkvault/manifest_store.hpp"
#include "chunkvault/metrics.hpp"
#include "chunkvault/placement.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <functional>

namespace chunkvault {

namespace {

Timestamp now() {
    return std::chrono::system_clock::now();
}

bool less_case_insensitive(const std::string& a, const std::string& b) {
    return std::lexicographical_compare(
        a.begin(), a.end(), b.begin(), b.end(),
        [](unsigned char x, unsigned char y) { return std::tolower(x) < std::tolower(y); });
}

}  // namespace

const char* to_string(DeleteStatus status) {
    switch (status) {
        case DeleteStatus::Deleted: return "deleted";
        case DeleteStatus::AlreadyAbsent: return "already absent";
        case DeleteStatus::Partial: return "partial";
    }
    return "unknown";
}

const char* to_string(RestoreResult result) {
    switch (result) {
        case RestoreResult::Restored: return "restored";
        case RestoreResult::FileNotFound: return "file not found";
        case RestoreResult::VersionNotFound: return "version not found";
    }
    return "unknown";
}

// ============================================================================
// Construction
// ============================================================================

ChunkEngine::ChunkEngine(std::vector<std::unique_ptr<StorageBackend>> backends,
                         std::unique_ptr<ManifestStore> store,
                         const EngineOptions& options,
                         std::unique_ptr<PlacementStrategy> placement)
    : backends_(std::move(backends))
    , store_(std::move(store))
    , placement_(std::move(placement))
    , chunk_size_(options.chunk_size) {

    if (backends_.empty()) {
        throw ConfigurationError("At least one storage backend is required");
    }
    for (size_t i = 0; i < backends_.size(); ++i) {
        if (!backends_[i]) {
            throw ConfigurationError("Backend " + std::to_string(i) + " is null");
        }
    }
    if (!store_) {
        throw ConfigurationError("A manifest store is required");
    }
    if (chunk_size_ == 0) {
        throw ConfigurationError("chunk_size must be greater than zero");
    }

    if (!placement_) {
        placement_ = std::make_unique<RoundRobinPlacement>(backends_.size());
    } else if (placement_->backend_count() != backends_.size()) {
        throw ConfigurationError("Placement strategy '" + placement_->name() + "' covers " +
                                 std::to_string(placement_->backend_count()) + " backends, " +
                                 std::to_string(backends_.size()) + " configured");
    }

    log_debug("Chunk engine: %zu backends, %s store, chunk size %lu, %s placement",
              backends_.size(), store_->type_name().c_str(),
              static_cast<unsigned long>(chunk_size_), placement_->name().c_str());
}

ChunkEngine::~ChunkEngine() = default;

std::unique_ptr<ChunkEngine> ChunkEngine::from_config(const EngineConfig& config) {
    std::vector<std::unique_ptr<StorageBackend>> backends;
    for (size_t i = 0; i < config.backends.size(); ++i) {
        const auto& bc = config.backends[i];
        try {
            backends.push_back(StorageBackendFactory::create(bc.type, bc.params));
        } catch (const std::runtime_error& e) {
            throw ConfigurationError("backend[" + std::to_string(i) + "] (" + bc.type + "): " + e.what());
        }
    }

    auto store = ManifestStore::create(config.manifest_store, config.metadata_dir);

    EngineOptions options;
    options.chunk_size = config.chunk_size;
    return std::make_unique<ChunkEngine>(std::move(backends), std::move(store), options);
}

std::string ChunkEngine::chunk_object_name(const std::string& file_id,
                                           const std::string& version_id,
                                           uint64_t chunk_index) {
    return file_id + "_" + version_id + "_chunk_" + std::to_string(chunk_index);
}

std::mutex& ChunkEngine::lock_for(const std::string& file_id) {
    return manifest_locks_[std::hash<std::string>{}(file_id) % manifest_locks_.size()];
}

std::optional<Manifest> ChunkEngine::load_manifest(const std::string& file_id) {
    // Ids that could never have been issued are simply absent
    if (!is_valid_file_id(file_id)) return std::nullopt;
    return store_->load(file_id);
}

size_t ChunkEngine::file_count() {
    return store_->list_keys().size();
}

// ============================================================================
// Upload
// ============================================================================

std::string ChunkEngine::upload(std::istream& input, const std::string& filename,
                                const UploadOptions& options) {
    std::optional<ScopedTimer> timer;
    if (metrics_) timer.emplace(metrics_->upload_duration());

    std::string file_id;
    bool append = false;
    if (!options.file_id.empty()) {
        if (load_manifest(options.file_id)) {
            file_id = options.file_id;
            append = true;
        } else {
            log_warn("File id %s not found; storing '%s' as a new file",
                     options.file_id.c_str(), filename.c_str());
        }
    }
    if (file_id.empty()) {
        file_id = generate_uuid();
    }

    Version version;
    version.version_id = generate_uuid();
    version.created_at = now();
    version.notes = options.notes;
    if (version.notes.empty()) {
        version.notes = append ? "Updated " + format_timestamp(version.created_at)
                               : "Initial version";
    }

    log_debug("Uploading '%s' as %s version %s", filename.c_str(), file_id.c_str(),
              version.version_id.c_str());

    uint64_t total_bytes = 0;
    try {
        ChunkSplitter splitter(input, chunk_size_);
        Chunk chunk;
        while (splitter.next(chunk)) {
            version.chunks.push_back(place_chunk(file_id, version.version_id, chunk));
        }
        total_bytes = splitter.bytes_read();

        commit_version(file_id, filename, version, append);
    } catch (const std::exception& e) {
        log_error("Upload of '%s' failed: %s", filename.c_str(), e.what());
        cleanup_chunks(file_id, version);
        if (metrics_) metrics_->uploads_failure().Increment();
        throw;
    }

    if (metrics_) {
        metrics_->uploads_success().Increment();
        metrics_->upload_bytes_total().Increment(static_cast<double>(total_bytes));
    }
    log_info("%s '%s' (%s): %zu chunks, %lu bytes",
             append ? "Updated" : "Uploaded", filename.c_str(), file_id.c_str(),
             version.chunks.size(), static_cast<unsigned long>(total_bytes));
    return file_id;
}

std::string ChunkEngine::upload_file(const std::filesystem::path& path,
                                     const std::string& filename,
                                     const UploadOptions& options) {
    if (!std::filesystem::is_regular_file(path)) {
        throw NotFoundError("Input file not found: " + path.string());
    }
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw std::runtime_error("Cannot open input file: " + path.string());
    }
    return upload(input, filename.empty() ? path.filename().string() : filename, options);
}

ChunkRecord ChunkEngine::place_chunk(const std::string& file_id, const std::string& version_id,
                                     const Chunk& chunk) {
    size_t index = placement_->next_backend(chunk.index);
    if (index >= backends_.size()) {
        throw ConfigurationError("Placement strategy '" + placement_->name() +
                                 "' chose backend " + std::to_string(index) + " of " +
                                 std::to_string(backends_.size()));
    }

    auto& backend = *backends_[index];
    auto name = chunk_object_name(file_id, version_id, chunk.index);
    log_debug("  chunk %lu (%zu bytes, %.8s...) -> backend %zu (%s) as %s",
              static_cast<unsigned long>(chunk.index), chunk.data.size(), chunk.hash.c_str(),
              index, backend.type_name().c_str(), name.c_str());

    auto result = backend.put(name, chunk.data);
    if (!result.success) {
        if (metrics_) metrics_->chunk_puts_failure().Increment();
        throw BackendError(index, chunk.index,
                           "Failed to store chunk " + std::to_string(chunk.index) +
                           " on backend " + std::to_string(index) + " (" +
                           backend.type_name() + "): " + result.error_message);
    }
    if (metrics_) metrics_->chunk_puts_success().Increment();

    ChunkRecord record;
    record.chunk_index = chunk.index;
    record.backend_index = index;
    record.remote_id = result.remote_id.empty() ? name : result.remote_id;
    record.size_bytes = chunk.data.size();
    record.content_hash = chunk.hash;
    return record;
}

void ChunkEngine::commit_version(const std::string& file_id, const std::string& filename,
                                 const Version& version, bool append) {
    std::lock_guard lock(lock_for(file_id));

    for (int attempt = 1; attempt <= constants::MAX_MANIFEST_COMMIT_ATTEMPTS; ++attempt) {
        Manifest manifest;
        if (append) {
            auto latest = store_->load(file_id);
            if (!latest) {
                throw ConflictError("File " + file_id + " was deleted during upload");
            }
            manifest = std::move(*latest);
        } else {
            manifest.file_id = file_id;
            manifest.original_filename = filename;
            manifest.chunk_size = chunk_size_;
            manifest.created_at = version.created_at;
        }

        manifest.add_version(version, now());
        if (store_->save(manifest)) return;

        if (!append) {
            throw ConflictError("Manifest for new file " + file_id + " already exists");
        }
        log_warn("Manifest %s changed during commit (attempt %d), retrying",
                 file_id.c_str(), attempt);
    }

    throw ConflictError("Manifest " + file_id + " kept changing; gave up after " +
                        std::to_string(constants::MAX_MANIFEST_COMMIT_ATTEMPTS) + " attempts");
}

// ============================================================================
// Download
// ============================================================================

void ChunkEngine::download(const std::string& file_id, std::ostream& output) {
    std::optional<ScopedTimer> timer;
    if (metrics_) timer.emplace(metrics_->download_duration());

    try {
        auto manifest = load_manifest(file_id);
        if (!manifest) {
            throw NotFoundError("No manifest found for file " + file_id);
        }
        uint64_t bytes = write_version(*manifest, output);
        if (metrics_) {
            metrics_->downloads_success().Increment();
            metrics_->download_bytes_total().Increment(static_cast<double>(bytes));
        }
    } catch (const std::exception&) {
        if (metrics_) metrics_->downloads_failure().Increment();
        throw;
    }
}

void ChunkEngine::download_file(const std::string& file_id, const std::filesystem::path& path) {
    // Fail before touching the output path
    if (!load_manifest(file_id)) {
        throw NotFoundError("No manifest found for file " + file_id);
    }

    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output) {
        throw std::runtime_error("Cannot open output file: " + path.string());
    }
    download(file_id, output);
    output.close();
    if (!output) {
        throw std::runtime_error("Failed to write output file: " + path.string());
    }
}

uint64_t ChunkEngine::write_version(const Manifest& manifest, std::ostream& output) {
    const auto& version = manifest.current_version();
    log_debug("Downloading '%s' (%s) version %s: %zu chunks",
              manifest.original_filename.c_str(), manifest.file_id.c_str(),
              version.version_id.c_str(), version.chunks.size());

    ChunkAssembler assembler(output);
    for (const auto& record : version.ordered_chunks()) {
        auto data = fetch_chunk(manifest.file_id, record);
        try {
            assembler.append(record, data);
        } catch (const IntegrityError& e) {
            if (metrics_) metrics_->integrity_failures().Increment();
            log_error("File %s: %s", manifest.file_id.c_str(), e.what());
            throw;
        }
    }

    output.flush();
    if (!output) {
        throw std::runtime_error("Failed to flush output for file " + manifest.file_id);
    }
    return assembler.bytes_written();
}

std::vector<uint8_t> ChunkEngine::fetch_chunk(const std::string& file_id, const ChunkRecord& record) {
    if (record.backend_index >= backends_.size()) {
        throw BackendError(record.backend_index, record.chunk_index,
                           "Chunk " + std::to_string(record.chunk_index) + " of file " + file_id +
                           ": backend index " + std::to_string(record.backend_index) +
                           " out of range (" + std::to_string(backends_.size()) + " configured)");
    }

    auto result = backends_[record.backend_index]->get(record.remote_id);
    if (!result.success) {
        if (metrics_) metrics_->chunk_gets_failure().Increment();
        std::string where = "Chunk " + std::to_string(record.chunk_index) + " of file " + file_id +
                            " (" + record.remote_id + ") on backend " +
                            std::to_string(record.backend_index);
        if (result.not_found) {
            throw NotFoundError(where + " is missing");
        }
        throw BackendError(record.backend_index, record.chunk_index,
                           where + " could not be read: " + result.error_message);
    }
    if (metrics_) metrics_->chunk_gets_success().Increment();
    return std::move(result.data);
}

// ============================================================================
// Delete
// ============================================================================

void ChunkEngine::delete_chunks(const Version& version, DeleteResult& result) {
    for (const auto& chunk : version.chunks) {
        std::string error;
        if (chunk.backend_index >= backends_.size()) {
            error = "backend index " + std::to_string(chunk.backend_index) + " out of range";
        } else {
            try {
                auto removed = backends_[chunk.backend_index]->remove(chunk.remote_id);
                if (!removed.success) {
                    error = removed.error_message.empty() ? "remove failed" : removed.error_message;
                }
            } catch (const std::exception& e) {
                error = e.what();
            }
        }

        if (error.empty()) {
            ++result.chunks_deleted;
            continue;
        }
        log_warn("Failed to delete chunk %lu (%s) from backend %zu: %s",
                 static_cast<unsigned long>(chunk.chunk_index), chunk.remote_id.c_str(),
                 chunk.backend_index, error.c_str());
        result.failures.push_back(ChunkFailure{
            version.version_id, chunk.chunk_index, chunk.backend_index, chunk.remote_id, error});
    }
}

void ChunkEngine::cleanup_chunks(const std::string& file_id, const Version& version) {
    if (version.chunks.empty()) return;

    DeleteResult result;
    delete_chunks(version, result);

    if (metrics_) {
        metrics_->cleanup_deleted().Increment(static_cast<double>(result.chunks_deleted));
        metrics_->cleanup_failed().Increment(static_cast<double>(result.failures.size()));
    }
    if (result.failures.empty()) {
        log_info("Cleaned up %zu chunks of failed upload %s", result.chunks_deleted, file_id.c_str());
    } else {
        log_warn("Cleanup of failed upload %s left %zu chunks behind",
                 file_id.c_str(), result.failures.size());
    }
}

std::vector<Version> ChunkEngine::recover_chunk_records(const std::string& file_id) {
    try {
        auto doc = store_->load_document(file_id);
        if (!doc) return {};
        return recover_versions(std::move(*doc));
    } catch (const ManifestFormatError& e) {
        log_warn("No chunk records recoverable from manifest %s: %s", file_id.c_str(), e.what());
    }
    return {};
}

DeleteResult ChunkEngine::remove_file(const std::string& file_id) {
    DeleteResult result;
    std::lock_guard lock(lock_for(file_id));

    // An unreadable manifest is still deleted; chunks are removed as far as
    // its records can be read, and the result is reported as partial.
    std::optional<Manifest> manifest;
    std::vector<Version> versions;
    bool unreadable = false;
    try {
        manifest = load_manifest(file_id);
        if (manifest) versions = manifest->versions;
    } catch (const ManifestFormatError& e) {
        unreadable = true;
        result.manifest_error = e.what();
        log_error("Manifest %s is unreadable (%s); deleting what it still names",
                  file_id.c_str(), e.what());
        versions = recover_chunk_records(file_id);
    }

    if (!manifest && !unreadable) {
        log_info("No manifest for %s; already deleted", file_id.c_str());
        result.status = DeleteStatus::AlreadyAbsent;
        if (metrics_) metrics_->deletes_absent().Increment();
        return result;
    }

    log_info("Deleting '%s' (%s): %zu versions",
             manifest ? manifest->original_filename.c_str() : "?", file_id.c_str(),
             versions.size());
    for (const auto& version : versions) {
        delete_chunks(version, result);
    }

    // Manifest last, so an interrupted delete can be retried
    try {
        store_->remove(file_id);
        result.manifest_removed = true;
    } catch (const std::exception& e) {
        if (!result.manifest_error.empty()) result.manifest_error += "; ";
        result.manifest_error += e.what();
        log_error("Failed to delete manifest %s: %s", file_id.c_str(), e.what());
    }

    if (result.failures.empty() && result.manifest_removed && !unreadable) {
        result.status = DeleteStatus::Deleted;
        if (metrics_) metrics_->deletes_deleted().Increment();
    } else {
        result.status = DeleteStatus::Partial;
        if (metrics_) metrics_->deletes_partial().Increment();
        log_warn("Partial delete of %s: %zu chunks could not be removed%s",
                 file_id.c_str(), result.failures.size(),
                 unreadable ? ", manifest was unreadable" : "");
    }
    return result;
}

// ============================================================================
// Versions
// ============================================================================

RestoreResult ChunkEngine::restore_version(const std::string& file_id, const std::string& version_id) {
    std::lock_guard lock(lock_for(file_id));

    for (int attempt = 1; attempt <= constants::MAX_MANIFEST_COMMIT_ATTEMPTS; ++attempt) {
        auto manifest = load_manifest(file_id);
        if (!manifest) {
            if (metrics_) metrics_->restores_failure().Increment();
            return RestoreResult::FileNotFound;
        }
        if (!manifest->set_current_version(version_id, now())) {
            if (metrics_) metrics_->restores_failure().Increment();
            return RestoreResult::VersionNotFound;
        }
        if (store_->save(*manifest)) {
            if (metrics_) metrics_->restores_success().Increment();
            log_info("Restored %s to version %s", file_id.c_str(), version_id.c_str());
            return RestoreResult::Restored;
        }
        log_warn("Manifest %s changed during restore (attempt %d), retrying",
                 file_id.c_str(), attempt);
    }

    if (metrics_) metrics_->restores_failure().Increment();
    throw ConflictError("Manifest " + file_id + " kept changing during restore");
}

std::vector<VersionSummary> ChunkEngine::list_versions(const std::string& file_id) {
    auto manifest = load_manifest(file_id);
    if (!manifest) {
        throw NotFoundError("No manifest found for file " + file_id);
    }

    std::vector<VersionSummary> out;
    out.reserve(manifest->versions.size());
    for (auto it = manifest->versions.rbegin(); it != manifest->versions.rend(); ++it) {
        VersionSummary s;
        s.version_id = it->version_id;
        s.created_at = it->created_at;
        s.is_current = it->is_current;
        s.notes = it->notes;
        s.chunk_count = it->chunks.size();
        s.size_bytes = it->total_bytes();
        out.push_back(std::move(s));
    }
    std::stable_sort(out.begin(), out.end(), [](const VersionSummary& a, const VersionSummary& b) {
        return a.created_at > b.created_at;
    });
    return out;
}

std::optional<Manifest> ChunkEngine::stat(const std::string& file_id) {
    return load_manifest(file_id);
}

// ============================================================================
// Listing
// ============================================================================

std::vector<FileEntry> ChunkEngine::list() {
    std::vector<FileEntry> entries;
    for (const auto& key : store_->list_keys()) {
        try {
            auto manifest = store_->load(key);
            if (!manifest) continue;  // deleted since list_keys()
            FileEntry entry;
            entry.file_id = manifest->file_id;
            entry.original_filename = manifest->original_filename;
            entry.total_size = manifest->total_size;
            entry.updated_at = manifest->updated_at;
            entry.version_count = manifest->versions.size();
            entries.push_back(std::move(entry));
        } catch (const std::exception& e) {
            log_warn("Skipping manifest %s: %s", key.c_str(), e.what());
        }
    }

    std::sort(entries.begin(), entries.end(), [](const FileEntry& a, const FileEntry& b) {
        if (less_case_insensitive(a.original_filename, b.original_filename)) return true;
        if (less_case_insensitive(b.original_filename, a.original_filename)) return false;
        return a.file_id < b.file_id;
    });
    return entries;
}

std::vector<BackendUsage> ChunkEngine::backend_usage() const {
    std::vector<BackendUsage> out;
    for (size_t i = 0; i < backends_.size(); ++i) {
        BackendUsage usage;
        usage.backend_index = i;
        usage.type_name = backends_[i]->type_name();
        try {
            usage.healthy = backends_[i]->is_healthy();
            usage.size = backends_[i]->size_info();
        } catch (const std::exception& e) {
            usage.healthy = false;
            usage.size.success = false;
            usage.size.error_message = e.what();
        }
        out.push_back(std::move(usage));
    }
    return out;
}

}  // namespace chunkvault
