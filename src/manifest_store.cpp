#include "chunkvault/manifest_store.hpp"
#include "chunkvault/core/constants.hpp"
#include "chunkvault/errors.hpp"
#include "chunkvault/ids.hpp"
#include "chunkvault/log.hpp"

#include <sqlite3.h>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace chunkvault {

namespace {

using json = nlohmann::json;

constexpr const char* MANIFEST_SCHEMA = R"(
CREATE TABLE IF NOT EXISTS manifests (
    file_id TEXT PRIMARY KEY,
    revision INTEGER NOT NULL,
    document TEXT NOT NULL,
    updated_at INTEGER NOT NULL
) WITHOUT ROWID;
)";

int64_t now_epoch() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

void require_valid_id(const std::string& file_id) {
    if (!is_valid_file_id(file_id)) {
        throw std::invalid_argument("Invalid file id: '" + file_id + "'");
    }
}

// Parse a stored document; legacy documents may lack file_id
Manifest decode_stored(const std::string& file_id, const std::string& text) {
    auto doc = json::parse(text, nullptr, false);
    if (doc.is_discarded()) {
        throw ManifestFormatError("Manifest " + file_id + " is not valid JSON");
    }
    if (doc.is_object() && !doc.contains("file_id")) {
        doc["file_id"] = file_id;
    }
    auto manifest = manifest_from_json(std::move(doc));
    if (manifest.file_id != file_id) {
        throw ManifestFormatError("Manifest stored under " + file_id +
                                  " carries file_id " + manifest.file_id);
    }
    return manifest;
}

// Exclusive flock(2) on a lock file for the lifetime of the object
class FileLock {
public:
    explicit FileLock(const std::filesystem::path& path)
        : fd_(::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644)) {
        if (fd_ < 0) {
            throw std::runtime_error("Cannot open lock file " + path.string() + ": " +
                                     std::strerror(errno));
        }
        while (::flock(fd_, LOCK_EX) != 0) {
            if (errno == EINTR) continue;
            int err = errno;
            ::close(fd_);
            throw std::runtime_error("Cannot lock " + path.string() + ": " + std::strerror(err));
        }
    }

    ~FileLock() {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

private:
    int fd_;
};

// Execute a SQL statement with retry on SQLITE_BUSY
bool sql_exec(sqlite3* db, const char* sql) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        char* err = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
        if (rc == SQLITE_OK) return true;
        if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
            if (err) sqlite3_free(err);
            std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
            continue;
        }
        if (err) {
            log_error("SQL error: %s (rc=%d)", err, rc);
            sqlite3_free(err);
        }
        return false;
    }
    log_error("SQL timed out after retries");
    return false;
}

// Step a prepared statement with SQLITE_BUSY retry
int sql_step_retry(sqlite3_stmt* stmt) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_BUSY && rc != SQLITE_LOCKED) return rc;
        sqlite3_reset(stmt);
        std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
    }
    return SQLITE_BUSY;
}

}  // namespace

std::unique_ptr<ManifestStore> ManifestStore::create(const std::string& type,
                                                     const std::filesystem::path& metadata_dir) {
    if (type == "json") {
        return std::make_unique<JsonManifestStore>(metadata_dir);
    }
    if (type == "sqlite") {
        std::filesystem::create_directories(metadata_dir);
        return std::make_unique<SqliteManifestStore>(metadata_dir / constants::SQLITE_MANIFEST_FILE);
    }
    throw ConfigurationError("Unknown manifest store type: " + type);
}

// ============================================================================
// JsonManifestStore
// ============================================================================

JsonManifestStore::JsonManifestStore(const std::filesystem::path& dir) : dir_(dir) {
    std::filesystem::create_directories(dir_ / ".locks");
    log_debug("Manifests stored in %s", std::filesystem::absolute(dir_).c_str());
}

std::filesystem::path JsonManifestStore::path_for(const std::string& file_id) const {
    require_valid_id(file_id);
    return dir_ / (file_id + ".json");
}

std::filesystem::path JsonManifestStore::lock_path_for(const std::string& file_id) const {
    require_valid_id(file_id);
    return dir_ / ".locks" / (file_id + ".lock");
}

std::optional<std::string> JsonManifestStore::read_text(const std::string& file_id) const {
    auto path = path_for(file_id);
    std::ifstream in(path);
    if (!in) {
        if (!std::filesystem::exists(path)) return std::nullopt;
        throw std::runtime_error("Cannot open manifest " + path.string());
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

std::optional<uint64_t> JsonManifestStore::stored_revision(const std::string& file_id) const {
    auto text = read_text(file_id);
    if (!text) return std::nullopt;

    auto doc = json::parse(*text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        throw ManifestFormatError("Manifest " + file_id + " is not a JSON object");
    }
    auto it = doc.find("revision");
    if (it == doc.end()) return uint64_t{1};
    if (!it->is_number_unsigned()) {
        throw ManifestFormatError("Manifest " + file_id + " has a non-numeric revision");
    }
    return it->get<uint64_t>();
}

bool JsonManifestStore::save(Manifest& manifest) {
    std::lock_guard lock(mutex_);
    FileLock file_lock(lock_path_for(manifest.file_id));

    auto current = stored_revision(manifest.file_id);
    if (manifest.revision == 0 ? current.has_value()
                               : (!current || *current != manifest.revision)) {
        return false;
    }

    uint64_t next = manifest.revision + 1;
    auto doc = manifest_to_json(manifest);
    doc["revision"] = next;

    // Per-writer staging name; a crashed writer never clobbers a live one
    static std::atomic<uint64_t> staging_seq{0};
    auto path = path_for(manifest.file_id);
    auto staging = path;
    staging += ".tmp." + std::to_string(::getpid()) + "." +
               std::to_string(staging_seq.fetch_add(1, std::memory_order_relaxed));

    std::error_code ec;
    {
        std::ofstream out(staging, std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Cannot write manifest " + staging.string());
        }
        out << doc.dump(4);
        out.close();
        if (!out.good()) {
            std::filesystem::remove(staging, ec);
            throw std::runtime_error("Failed writing manifest " + staging.string());
        }
    }

    std::filesystem::rename(staging, path, ec);
    if (ec) {
        std::string reason = ec.message();
        std::filesystem::remove(staging, ec);
        throw std::runtime_error("Cannot replace manifest " + path.string() + ": " + reason);
    }

    manifest.revision = next;
    return true;
}

std::optional<Manifest> JsonManifestStore::load(const std::string& file_id) {
    std::lock_guard lock(mutex_);
    auto text = read_text(file_id);
    if (!text) return std::nullopt;
    return decode_stored(file_id, *text);
}

std::optional<json> JsonManifestStore::load_document(const std::string& file_id) {
    std::lock_guard lock(mutex_);
    auto text = read_text(file_id);
    if (!text) return std::nullopt;
    auto doc = json::parse(*text, nullptr, false);
    if (doc.is_discarded()) {
        throw ManifestFormatError("Manifest " + file_id + " is not valid JSON");
    }
    return doc;
}

bool JsonManifestStore::remove(const std::string& file_id) {
    std::lock_guard lock(mutex_);
    FileLock file_lock(lock_path_for(file_id));

    std::error_code ec;
    bool removed = std::filesystem::remove(path_for(file_id), ec);
    if (ec) {
        throw std::runtime_error("Cannot delete manifest " + file_id + ": " + ec.message());
    }
    return removed;
}

std::vector<std::string> JsonManifestStore::list_keys() {
    std::lock_guard lock(mutex_);

    std::vector<std::string> keys;
    for (const auto& entry : std::filesystem::directory_iterator(dir_)) {
        if (!entry.is_regular_file()) continue;
        if (entry.path().extension() != ".json") continue;
        auto stem = entry.path().stem().string();
        if (stem == "users") continue;  // account data shares the directory
        if (!is_valid_file_id(stem)) continue;
        keys.push_back(stem);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

// ============================================================================
// SqliteManifestStore
// ============================================================================

SqliteManifestStore::SqliteManifestStore(const std::filesystem::path& db_path) {
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Cannot open manifest database: " + msg);
    }

    // WAL mode for concurrent readers
    sql_exec(db_, "PRAGMA journal_mode=WAL");
    sql_exec(db_, "PRAGMA synchronous=NORMAL");
    sql_exec(db_, "PRAGMA busy_timeout=5000");

    try {
        if (!sql_exec(db_, MANIFEST_SCHEMA)) {
            throw std::runtime_error("Cannot create manifest schema in " + db_path.string());
        }

        prepare("INSERT OR IGNORE INTO manifests (file_id, revision, document, updated_at) "
                "VALUES (?1, ?2, ?3, ?4)", &stmt_insert_);
        prepare("UPDATE manifests SET revision = ?3, document = ?4, updated_at = ?5 "
                "WHERE file_id = ?1 AND revision = ?2", &stmt_update_);
        prepare("SELECT revision, document FROM manifests WHERE file_id = ?1", &stmt_get_);
        prepare("DELETE FROM manifests WHERE file_id = ?1", &stmt_delete_);
        prepare("SELECT file_id FROM manifests ORDER BY file_id", &stmt_list_);
    } catch (const std::exception&) {
        close();
        throw;
    }

    log_debug("Manifests stored in %s", db_path.c_str());
}

SqliteManifestStore::~SqliteManifestStore() {
    close();
}

void SqliteManifestStore::close() {
    for (auto** stmt : {&stmt_insert_, &stmt_update_, &stmt_get_, &stmt_delete_, &stmt_list_}) {
        if (*stmt) sqlite3_finalize(*stmt);
        *stmt = nullptr;
    }
    if (db_) {
        sqlite3_exec(db_, "PRAGMA wal_checkpoint(TRUNCATE)", nullptr, nullptr, nullptr);
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteManifestStore::prepare(const char* sql, sqlite3_stmt** stmt) {
    if (sqlite3_prepare_v2(db_, sql, -1, stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("Cannot prepare statement: ") + sqlite3_errmsg(db_));
    }
}

bool SqliteManifestStore::save(Manifest& manifest) {
    require_valid_id(manifest.file_id);
    std::lock_guard lock(mutex_);

    uint64_t next = manifest.revision + 1;
    auto doc = manifest_to_json(manifest);
    doc["revision"] = next;
    std::string text = doc.dump();
    int64_t now = now_epoch();

    sqlite3_stmt* stmt = nullptr;
    if (manifest.revision == 0) {
        stmt = stmt_insert_;
        sqlite3_reset(stmt);
        sqlite3_bind_text(stmt, 1, manifest.file_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 2, static_cast<int64_t>(next));
        sqlite3_bind_text(stmt, 3, text.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 4, now);
    } else {
        stmt = stmt_update_;
        sqlite3_reset(stmt);
        sqlite3_bind_text(stmt, 1, manifest.file_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 2, static_cast<int64_t>(manifest.revision));
        sqlite3_bind_int64(stmt, 3, static_cast<int64_t>(next));
        sqlite3_bind_text(stmt, 4, text.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 5, now);
    }

    int rc = sql_step_retry(stmt);
    sqlite3_reset(stmt);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("Cannot save manifest " + manifest.file_id + ": " +
                                 sqlite3_errmsg(db_));
    }
    if (sqlite3_changes(db_) == 0) {
        return false;  // revision moved on, or record already exists
    }

    manifest.revision = next;
    return true;
}

std::optional<std::pair<uint64_t, std::string>> SqliteManifestStore::fetch(
    const std::string& file_id) {
    sqlite3_reset(stmt_get_);
    sqlite3_bind_text(stmt_get_, 1, file_id.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sql_step_retry(stmt_get_);
    if (rc == SQLITE_DONE) {
        sqlite3_reset(stmt_get_);
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        sqlite3_reset(stmt_get_);
        throw std::runtime_error("Cannot load manifest " + file_id + ": " + sqlite3_errmsg(db_));
    }

    auto revision = static_cast<uint64_t>(sqlite3_column_int64(stmt_get_, 0));
    auto text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_get_, 1));
    std::string document = text ? text : "";
    sqlite3_reset(stmt_get_);
    return std::make_pair(revision, std::move(document));
}

std::optional<Manifest> SqliteManifestStore::load(const std::string& file_id) {
    require_valid_id(file_id);
    std::lock_guard lock(mutex_);

    auto row = fetch(file_id);
    if (!row) return std::nullopt;
    auto manifest = decode_stored(file_id, row->second);
    manifest.revision = row->first;
    return manifest;
}

std::optional<json> SqliteManifestStore::load_document(const std::string& file_id) {
    require_valid_id(file_id);
    std::lock_guard lock(mutex_);

    auto row = fetch(file_id);
    if (!row) return std::nullopt;
    auto doc = json::parse(row->second, nullptr, false);
    if (doc.is_discarded()) {
        throw ManifestFormatError("Manifest " + file_id + " is not valid JSON");
    }
    return doc;
}

bool SqliteManifestStore::remove(const std::string& file_id) {
    require_valid_id(file_id);
    std::lock_guard lock(mutex_);

    sqlite3_reset(stmt_delete_);
    sqlite3_bind_text(stmt_delete_, 1, file_id.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sql_step_retry(stmt_delete_);
    sqlite3_reset(stmt_delete_);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("Cannot delete manifest " + file_id + ": " + sqlite3_errmsg(db_));
    }
    return sqlite3_changes(db_) > 0;
}

std::vector<std::string> SqliteManifestStore::list_keys() {
    std::lock_guard lock(mutex_);

    std::vector<std::string> keys;
    sqlite3_reset(stmt_list_);
    // Only the first step may be retried: a retry resets the cursor
    int rc = sql_step_retry(stmt_list_);
    while (rc == SQLITE_ROW) {
        auto col = sqlite3_column_text(stmt_list_, 0);
        if (col) keys.emplace_back(reinterpret_cast<const char*>(col));
        rc = sqlite3_step(stmt_list_);
    }
    sqlite3_reset(stmt_list_);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("Cannot list manifests: ") + sqlite3_errmsg(db_));
    }
    return keys;
}

}  // namespace chunkvault
