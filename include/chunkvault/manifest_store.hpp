#pragma once

#include "chunkvault/manifest.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace chunkvault {

/// Durable keyed storage for manifests.
///
/// save() is a check-and-set on Manifest::revision: it succeeds only if the
/// stored revision still equals the caller's (0 = must not exist yet), and
/// bumps the revision on success. A false return means someone else wrote
/// first; reload and retry. I/O failures throw.
class ManifestStore {
public:
    virtual ~ManifestStore() = default;

    virtual std::string type_name() const = 0;

    virtual bool save(Manifest& manifest) = 0;

    /// std::nullopt if absent. Throws ManifestFormatError if corrupt.
    virtual std::optional<Manifest> load(const std::string& file_id) = 0;

    /// The stored document as-is, without migration or validation.
    /// std::nullopt if absent. Throws ManifestFormatError if it is not JSON.
    virtual std::optional<nlohmann::json> load_document(const std::string& file_id) = 0;

    /// Returns true if a record was removed.
    virtual bool remove(const std::string& file_id) = 0;

    virtual std::vector<std::string> list_keys() = 0;

    /// "json" (directory of documents) or "sqlite" (single database file).
    /// Throws ConfigurationError for other types.
    static std::unique_ptr<ManifestStore> create(const std::string& type,
                                                 const std::filesystem::path& metadata_dir);
};

/// One indented JSON document per file: <dir>/<file_id>.json
///
/// Writers take an flock(2) on <dir>/.locks/<file_id>.lock around the
/// revision check and the rename, so the check-and-set holds between
/// processes sharing the directory. Readers rely on rename being atomic.
class JsonManifestStore : public ManifestStore {
public:
    explicit JsonManifestStore(const std::filesystem::path& dir);

    std::string type_name() const override { return "json"; }
    bool save(Manifest& manifest) override;
    std::optional<Manifest> load(const std::string& file_id) override;
    std::optional<nlohmann::json> load_document(const std::string& file_id) override;
    bool remove(const std::string& file_id) override;
    std::vector<std::string> list_keys() override;

private:
    std::filesystem::path path_for(const std::string& file_id) const;
    std::filesystem::path lock_path_for(const std::string& file_id) const;
    std::optional<std::string> read_text(const std::string& file_id) const;
    std::optional<uint64_t> stored_revision(const std::string& file_id) const;

    std::filesystem::path dir_;
    std::mutex mutex_;
};

/// Manifests as rows of a WAL-mode SQLite database.
class SqliteManifestStore : public ManifestStore {
public:
    explicit SqliteManifestStore(const std::filesystem::path& db_path);
    ~SqliteManifestStore() override;

    SqliteManifestStore(const SqliteManifestStore&) = delete;
    SqliteManifestStore& operator=(const SqliteManifestStore&) = delete;

    std::string type_name() const override { return "sqlite"; }
    bool save(Manifest& manifest) override;
    std::optional<Manifest> load(const std::string& file_id) override;
    std::optional<nlohmann::json> load_document(const std::string& file_id) override;
    bool remove(const std::string& file_id) override;
    std::vector<std::string> list_keys() override;

private:
    void prepare(const char* sql, sqlite3_stmt** stmt);

    // Stored revision and document text; caller holds mutex_
    std::optional<std::pair<uint64_t, std::string>> fetch(const std::string& file_id);
    void close();

    sqlite3* db_ = nullptr;
    std::mutex mutex_;

    sqlite3_stmt* stmt_insert_ = nullptr;
    sqlite3_stmt* stmt_update_ = nullptr;
    sqlite3_stmt* stmt_get_ = nullptr;
    sqlite3_stmt* stmt_delete_ = nullptr;
    sqlite3_stmt* stmt_list_ = nullptr;
};

}  // namespace chunkvault
