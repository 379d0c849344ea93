#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace chunkvault {

using Timestamp = std::chrono::system_clock::time_point;

/// Where one chunk of one version lives.
struct ChunkRecord {
    uint64_t chunk_index = 0;
    size_t backend_index = 0;
    std::string remote_id;
    uint64_t size_bytes = 0;
    std::string content_hash;  // Lower-case hex SHA-256 of the plaintext chunk
};

/// One immutable snapshot of a file's content.
struct Version {
    std::string version_id;
    Timestamp created_at;
    bool is_current = false;
    std::string notes;
    std::vector<ChunkRecord> chunks;

    uint64_t total_bytes() const;

    /// Chunks sorted by chunk_index.
    std::vector<ChunkRecord> ordered_chunks() const;
};

/// Durable per-file record: identity plus append-only version history.
struct Manifest {
    std::string file_id;
    std::string original_filename;
    uint64_t total_size = 0;   // Size of the current version
    uint64_t chunk_size = 0;
    Timestamp created_at;
    Timestamp updated_at;
    std::vector<Version> versions;

    // Persistence token maintained by the ManifestStore. Zero means the
    // manifest has never been saved.
    uint64_t revision = 0;

    /// The flagged version, or the most recent one when none is flagged.
    /// Throws ManifestFormatError if there are no versions.
    const Version& current_version() const;

    const Version* find_version(const std::string& version_id) const;

    /// Append a version and make it the only current one.
    void add_version(Version version, Timestamp now);

    /// Make version_id current. Returns false if no such version exists.
    bool set_current_version(const std::string& version_id, Timestamp now);

    /// Repair zero or multiple current flags by keeping the most recent
    /// entry. Returns true if anything changed.
    bool normalize_current();
};

// --- Timestamps (persisted as float epoch seconds) ---

double to_epoch_seconds(Timestamp tp);
Timestamp from_epoch_seconds(double seconds);

/// Local time as "YYYY-MM-DD HH:MM:SS".
std::string format_timestamp(Timestamp tp);

// --- JSON codec ---

/// Encode at the current schema version.
nlohmann::json manifest_to_json(const Manifest& manifest);

/// Upgrade an older document in place to the current schema.
/// Throws ManifestFormatError if the document cannot be migrated.
void migrate_manifest_document(nlohmann::json& doc);

/// Migrate, decode and validate. Throws ManifestFormatError.
Manifest manifest_from_json(nlohmann::json doc);

/// Best-effort read of the chunk records in a document that fails
/// manifest_from_json(). Chunk entries without a usable remote_id and
/// backend_index are dropped; nothing is validated. Never throws.
std::vector<Version> recover_versions(nlohmann::json doc);

/// Structural checks on a decoded manifest. Returns an error message,
/// empty if valid.
std::string validate_manifest(const Manifest& manifest);

}  // namespace chunkvault
