#include "chunkvault/manifest.hpp"
#include "chunkvault/core/constants.hpp"
#include "chunkvault/errors.hpp"
#include "chunkvault/ids.hpp"
#include "chunkvault/log.hpp"

#include <algorithm>
#include <cmath>
#include <ctime>
#include <set>

namespace chunkvault {

namespace {

using json = nlohmann::json;

bool is_hex_digest(const std::string& s) {
    if (s.size() != 64) return false;
    return std::all_of(s.begin(), s.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    });
}

// Rename key `from` to `to` unless `to` is already present
void rename_key(json& obj, const char* from, const char* to) {
    if (!obj.contains(from)) return;
    if (!obj.contains(to)) {
        obj[to] = std::move(obj[from]);
    }
    obj.erase(from);
}

// Schema 1 chunk fields -> schema 2
void migrate_chunk(json& chunk) {
    if (!chunk.is_object()) {
        throw ManifestFormatError("Chunk entry is not an object");
    }
    rename_key(chunk, "index", "chunk_index");
    rename_key(chunk, "chunk_id", "remote_id");
    rename_key(chunk, "provider_index", "backend_index");
    rename_key(chunk, "size", "size_bytes");
    rename_key(chunk, "hash", "content_hash");
    if (chunk.contains("content_hash") && chunk["content_hash"].is_null()) {
        chunk["content_hash"] = "";
    }
}

void migrate_chunks(json& chunks) {
    if (!chunks.is_array()) {
        throw ManifestFormatError("'chunks' is not an array");
    }
    for (auto& chunk : chunks) migrate_chunk(chunk);
}

ChunkRecord chunk_from_json(const json& j) {
    ChunkRecord c;
    c.chunk_index = j.at("chunk_index").get<uint64_t>();
    c.backend_index = j.at("backend_index").get<size_t>();
    c.remote_id = j.at("remote_id").get<std::string>();
    c.size_bytes = j.at("size_bytes").get<uint64_t>();
    c.content_hash = j.value("content_hash", "");
    return c;
}

json chunk_to_json(const ChunkRecord& c) {
    return json{
        {"chunk_index", c.chunk_index},
        {"backend_index", c.backend_index},
        {"remote_id", c.remote_id},
        {"size_bytes", c.size_bytes},
        {"content_hash", c.content_hash},
    };
}

}  // namespace

// ============================================================================
// Version / Manifest
// ============================================================================

uint64_t Version::total_bytes() const {
    uint64_t total = 0;
    for (const auto& c : chunks) total += c.size_bytes;
    return total;
}

std::vector<ChunkRecord> Version::ordered_chunks() const {
    auto sorted = chunks;
    std::sort(sorted.begin(), sorted.end(), [](const ChunkRecord& a, const ChunkRecord& b) {
        return a.chunk_index < b.chunk_index;
    });
    return sorted;
}

const Version& Manifest::current_version() const {
    if (versions.empty()) {
        throw ManifestFormatError("Manifest " + file_id + " has no versions");
    }
    for (const auto& v : versions) {
        if (v.is_current) return v;
    }
    return versions.back();
}

const Version* Manifest::find_version(const std::string& version_id) const {
    for (const auto& v : versions) {
        if (v.version_id == version_id) return &v;
    }
    return nullptr;
}

void Manifest::add_version(Version version, Timestamp now) {
    for (auto& v : versions) v.is_current = false;
    version.is_current = true;
    total_size = version.total_bytes();
    updated_at = now;
    versions.push_back(std::move(version));
}

bool Manifest::set_current_version(const std::string& version_id, Timestamp now) {
    if (!find_version(version_id)) return false;
    for (auto& v : versions) {
        v.is_current = (v.version_id == version_id);
        if (v.is_current) total_size = v.total_bytes();
    }
    updated_at = now;
    return true;
}

bool Manifest::normalize_current() {
    if (versions.empty()) return false;
    size_t flagged = std::count_if(versions.begin(), versions.end(),
                                   [](const Version& v) { return v.is_current; });
    if (flagged == 1) return false;

    // Most recent by creation time; later position wins ties
    size_t newest = 0;
    for (size_t i = 1; i < versions.size(); ++i) {
        if (versions[i].created_at >= versions[newest].created_at) newest = i;
    }
    for (size_t i = 0; i < versions.size(); ++i) {
        versions[i].is_current = (i == newest);
    }
    return true;
}

// ============================================================================
// Timestamps
// ============================================================================

double to_epoch_seconds(Timestamp tp) {
    return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

Timestamp from_epoch_seconds(double seconds) {
    if (!std::isfinite(seconds)) return Timestamp{};
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::duration<double>(seconds)));
}

std::string format_timestamp(Timestamp tp) {
    time_t tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&tt, &tm);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

// ============================================================================
// JSON codec
// ============================================================================

json manifest_to_json(const Manifest& m) {
    json versions = json::array();
    for (const auto& v : m.versions) {
        json chunks = json::array();
        for (const auto& c : v.chunks) chunks.push_back(chunk_to_json(c));
        versions.push_back(json{
            {"version_id", v.version_id},
            {"created_at", to_epoch_seconds(v.created_at)},
            {"is_current", v.is_current},
            {"notes", v.notes},
            {"chunks", std::move(chunks)},
        });
    }

    return json{
        {"schema_version", constants::MANIFEST_SCHEMA_VERSION},
        {"revision", m.revision},
        {"file_id", m.file_id},
        {"original_filename", m.original_filename},
        {"total_size", m.total_size},
        {"chunk_size", m.chunk_size},
        {"created_at", to_epoch_seconds(m.created_at)},
        {"updated_at", to_epoch_seconds(m.updated_at)},
        {"versions", std::move(versions)},
    };
}

void migrate_manifest_document(json& doc) {
    if (!doc.is_object()) {
        throw ManifestFormatError("Manifest document is not a JSON object");
    }
    for (const char* required : {"original_filename", "total_size", "chunk_size"}) {
        if (!doc.contains(required)) {
            throw ManifestFormatError(std::string("Manifest is missing '") + required + "'");
        }
    }

    int schema = 0;
    if (doc.contains("schema_version")) {
        if (!doc["schema_version"].is_number_integer()) {
            throw ManifestFormatError("'schema_version' is not an integer");
        }
        schema = doc["schema_version"].get<int>();
    } else if (doc.contains("versions")) {
        schema = 1;
    }

    if (schema > constants::MANIFEST_SCHEMA_VERSION || schema < 0) {
        throw ManifestFormatError("Unsupported manifest schema version " + std::to_string(schema));
    }

    if (!doc.contains("created_at")) doc["created_at"] = 0.0;
    if (!doc.contains("updated_at")) doc["updated_at"] = doc["created_at"];

    if (schema == 0) {
        // Single flat chunk list, no history
        json chunks = doc.contains("chunks") ? std::move(doc["chunks"]) : json::array();
        doc.erase("chunks");
        migrate_chunks(chunks);

        doc["versions"] = json::array({json{
            {"version_id", "legacy-0"},
            {"created_at", doc["updated_at"]},
            {"is_current", true},
            {"notes", "Migrated from old format"},
            {"chunks", std::move(chunks)},
        }});
        schema = 1;
    }

    if (schema == 1) {
        if (!doc["versions"].is_array()) {
            throw ManifestFormatError("'versions' is not an array");
        }
        size_t i = 0;
        for (auto& v : doc["versions"]) {
            if (!v.is_object()) {
                throw ManifestFormatError("Version entry is not an object");
            }
            rename_key(v, "timestamp", "created_at");
            v.erase("timestamp_readable");
            if (!v.contains("version_id")) v["version_id"] = "legacy-" + std::to_string(i);
            if (!v.contains("created_at")) v["created_at"] = doc["created_at"];
            if (!v.contains("is_current")) v["is_current"] = true;
            if (!v.contains("chunks")) v["chunks"] = json::array();
            migrate_chunks(v["chunks"]);
            ++i;
        }
        doc.erase("created_at_readable");
        doc.erase("updated_at_readable");
    }

    doc["schema_version"] = constants::MANIFEST_SCHEMA_VERSION;
}

Manifest manifest_from_json(json doc) {
    Manifest m;
    try {
        migrate_manifest_document(doc);

        m.file_id = doc.value("file_id", "");
        m.original_filename = doc.at("original_filename").get<std::string>();
        m.total_size = doc.at("total_size").get<uint64_t>();
        m.chunk_size = doc.at("chunk_size").get<uint64_t>();
        m.created_at = from_epoch_seconds(doc.at("created_at").get<double>());
        m.updated_at = from_epoch_seconds(doc.at("updated_at").get<double>());
        // Documents written before revisions existed count as saved once
        m.revision = doc.value("revision", uint64_t{1});

        for (const auto& vj : doc.at("versions")) {
            Version v;
            v.version_id = vj.at("version_id").get<std::string>();
            v.created_at = from_epoch_seconds(vj.at("created_at").get<double>());
            v.is_current = vj.value("is_current", false);
            v.notes = vj.value("notes", "");
            for (const auto& cj : vj.at("chunks")) {
                v.chunks.push_back(chunk_from_json(cj));
            }
            m.versions.push_back(std::move(v));
        }
    } catch (const json::exception& e) {
        throw ManifestFormatError(std::string("Malformed manifest: ") + e.what());
    }

    if (m.normalize_current()) {
        log_warn("Manifest %s had inconsistent current-version flags; using most recent version",
                 m.file_id.c_str());
    }

    auto error = validate_manifest(m);
    if (!error.empty()) {
        throw ManifestFormatError("Invalid manifest " + m.file_id + ": " + error);
    }
    return m;
}

std::vector<Version> recover_versions(json doc) {
    std::vector<Version> out;
    if (!doc.is_object()) return out;

    // A flat schema 0 chunk list reads as one version
    if (!doc.contains("versions") && doc.contains("chunks")) {
        doc["versions"] = json::array({json{{"version_id", "legacy-0"},
                                            {"chunks", std::move(doc["chunks"])}}});
    }
    auto versions = doc.find("versions");
    if (versions == doc.end() || !versions->is_array()) return out;

    size_t position = 0;
    for (auto& vj : *versions) {
        if (!vj.is_object()) continue;
        Version v;
        auto id = vj.find("version_id");
        v.version_id = id != vj.end() && id->is_string() ? id->get<std::string>()
                                                         : "legacy-" + std::to_string(position);
        ++position;

        auto chunks = vj.find("chunks");
        if (chunks == vj.end() || !chunks->is_array()) {
            out.push_back(std::move(v));
            continue;
        }
        for (auto& cj : *chunks) {
            if (!cj.is_object()) continue;
            rename_key(cj, "index", "chunk_index");
            rename_key(cj, "chunk_id", "remote_id");
            rename_key(cj, "provider_index", "backend_index");
            auto remote = cj.find("remote_id");
            auto backend = cj.find("backend_index");
            if (remote == cj.end() || !remote->is_string() || remote->get<std::string>().empty() ||
                backend == cj.end() || !backend->is_number_unsigned()) {
                continue;
            }
            ChunkRecord c;
            c.remote_id = remote->get<std::string>();
            c.backend_index = backend->get<size_t>();
            auto index = cj.find("chunk_index");
            if (index != cj.end() && index->is_number_unsigned()) {
                c.chunk_index = index->get<uint64_t>();
            }
            v.chunks.push_back(std::move(c));
        }
        out.push_back(std::move(v));
    }
    return out;
}

std::string validate_manifest(const Manifest& m) {
    if (!is_valid_file_id(m.file_id)) return "invalid file_id '" + m.file_id + "'";
    if (m.chunk_size == 0) return "chunk_size is zero";
    if (m.versions.empty()) return "no versions";

    std::set<std::string> seen_ids;
    for (const auto& v : m.versions) {
        if (v.version_id.empty()) return "version with empty version_id";
        if (!seen_ids.insert(v.version_id).second) {
            return "duplicate version_id " + v.version_id;
        }

        auto chunks = v.ordered_chunks();
        for (size_t i = 0; i < chunks.size(); ++i) {
            const auto& c = chunks[i];
            if (c.chunk_index != i) {
                return "version " + v.version_id + " has non-contiguous chunk indices";
            }
            if (c.remote_id.empty()) {
                return "version " + v.version_id + " chunk " + std::to_string(i) +
                       " has no remote id";
            }
            if (!is_hex_digest(c.content_hash)) {
                return "version " + v.version_id + " chunk " + std::to_string(i) +
                       " has an invalid content hash";
            }
        }
    }
    return "";
}

}  // namespace chunkvault
