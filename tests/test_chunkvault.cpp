// Test suite for chunkvault.
//
// Tests:
//   1. Placement strategy
//   2. Chunk splitter / assembler and SHA-256
//   3. Manifest codec and legacy document migration
//   4. Manifest stores (JSON files, SQLite) with revision check-and-set
//   5. Local storage backend
//   6. ChunkEngine with local backends
//      - Round trip across sizes, placement order
//      - Integrity and missing-chunk failures
//      - Versioning and restore
//      - Cleanup after failed uploads
//      - Idempotent and partial delete
//      - Manifest commit conflicts and concurrent appends
//      - Listing
//   7. Configuration parsing and validation
//   8. HTTP helpers
//   9. Metrics textfile output

#include "chunkvault/chunk_engine.hpp"
#include "chunkvault/chunker.hpp"
#include "chunkvault/engine_config.hpp"
#include "chunkvault/errors.hpp"
#include "chunkvault/ids.hpp"
#include "chunkvault/manifest.hpp"
#include "chunkvault/manifest_store.hpp"
#include "chunkvault/metrics.hpp"
#include "chunkvault/net/http_client.hpp"
#include "chunkvault/placement.hpp"
#include "chunkvault/storage/backend.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;
using namespace chunkvault;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name)                                                    \
    do {                                                              \
        std::cout << "  " << #name << "... " << std::flush;          \
    } while (0)

#define PASS()                                                        \
    do {                                                              \
        std::cout << "OK" << std::endl;                               \
        ++tests_passed;                                               \
    } while (0)

#define FAIL(msg)                                                     \
    do {                                                              \
        std::cout << "FAIL: " << msg << std::endl;                    \
        ++tests_failed;                                               \
    } while (0)

#define ASSERT_TRUE(cond, msg)                                        \
    do {                                                              \
        if (!(cond)) { FAIL(msg); return; }                           \
    } while (0)

#define ASSERT_EQ(a, b, msg)                                          \
    do {                                                              \
        if ((a) != (b)) {                                             \
            std::cout << "FAIL: " << msg << " (got \"" << (a)        \
                      << "\", expected \"" << (b) << "\")"            \
                      << std::endl;                                   \
            ++tests_failed;                                           \
            return;                                                   \
        }                                                             \
    } while (0)

#define ASSERT_EMPTY(s, msg)                                          \
    ASSERT_TRUE((s).empty(), msg ": " + (s))

#define ASSERT_NOT_EMPTY(s, msg)                                      \
    ASSERT_TRUE(!(s).empty(), msg)

/// Create a unique temp directory under /tmp.
static fs::path make_temp_dir(const std::string& prefix) {
    auto path = fs::temp_directory_path() / (prefix + "-XXXXXX");
    std::string tpl = path.string();
    char* result = mkdtemp(tpl.data());
    if (!result) throw std::runtime_error("mkdtemp failed");
    return fs::path(result);
}

/// Write binary content to a file.
static void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs.write(content.data(), content.size());
}

/// Read entire file into a string.
static std::string read_file(const fs::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(ifs)),
                       std::istreambuf_iterator<char>());
}

static std::vector<uint8_t> bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

/// Deterministic test payload of n bytes.
static std::string pattern(size_t n) {
    std::string s(n, '\0');
    for (size_t i = 0; i < n; ++i) s[i] = static_cast<char>('a' + (i * 7) % 26);
    return s;
}

static size_t count_files(const fs::path& dir) {
    size_t n = 0;
    for (const auto& e : fs::recursive_directory_iterator(dir)) {
        if (e.is_regular_file()) ++n;
    }
    return n;
}

/// True if fn throws E. Other exceptions are reported and count as false.
template <typename E, typename Fn>
static bool throws(Fn&& fn) {
    try {
        fn();
    } catch (const E&) {
        return true;
    } catch (const std::exception& e) {
        std::cout << "(unexpected exception: " << e.what() << ") ";
    }
    return false;
}

/// Backend dirs plus a metadata dir under one temp root.
struct Pool {
    fs::path root;
    std::vector<fs::path> dirs;
    fs::path meta;
};

static Pool make_pool(const std::string& prefix, size_t backends) {
    Pool pool;
    pool.root = make_temp_dir(prefix);
    for (size_t i = 0; i < backends; ++i) {
        pool.dirs.push_back(pool.root / ("backend" + std::to_string(i)));
        fs::create_directories(pool.dirs.back());
    }
    pool.meta = pool.root / "metadata";
    return pool;
}

static std::vector<std::unique_ptr<StorageBackend>> local_backends(const Pool& pool) {
    std::vector<std::unique_ptr<StorageBackend>> backends;
    for (const auto& dir : pool.dirs) {
        backends.push_back(StorageBackendFactory::create_local(dir));
    }
    return backends;
}

static std::unique_ptr<ChunkEngine> make_engine(const Pool& pool, uint64_t chunk_size,
                                                const std::string& store = "json") {
    EngineOptions options;
    options.chunk_size = chunk_size;
    return std::make_unique<ChunkEngine>(local_backends(pool),
                                         ManifestStore::create(store, pool.meta), options);
}

static std::string upload_string(ChunkEngine& engine, const std::string& data,
                                 const std::string& name, const UploadOptions& options = {}) {
    std::istringstream in(data);
    return engine.upload(in, name, options);
}

static std::string download_string(ChunkEngine& engine, const std::string& file_id) {
    std::ostringstream out;
    engine.download(file_id, out);
    return out.str();
}

/// Wraps a backend and injects put/get/remove failures.
class FaultyBackend : public StorageBackend {
public:
    explicit FaultyBackend(std::unique_ptr<StorageBackend> inner) : inner_(std::move(inner)) {}

    int fail_put_at = 0;  // 1-based put number that fails; 0 = never
    bool throw_on_put = false;
    bool fail_removes = false;
    bool fail_gets = false;
    int puts = 0;

    std::string type_name() const override { return "faulty-" + inner_->type_name(); }
    bool exists(const std::string& key) const override { return inner_->exists(key); }
    std::optional<ObjectMetadata> head(const std::string& key) const override {
        return inner_->head(key);
    }

    GetResult get(const std::string& key) const override {
        if (fail_gets) {
            GetResult r;
            r.error_message = "injected get failure";
            return r;
        }
        return inner_->get(key);
    }

    PutResult put(const std::string& name, std::span<const uint8_t> data,
                  const PutOptions& options) override {
        ++puts;
        if (fail_put_at > 0 && puts == fail_put_at) {
            if (throw_on_put) throw std::runtime_error("injected put exception");
            PutResult r;
            r.error_message = "injected put failure";
            return r;
        }
        return inner_->put(name, data, options);
    }

    RemoveResult remove(const std::string& key) override {
        if (fail_removes) {
            RemoveResult r;
            r.error_message = "injected remove failure";
            return r;
        }
        return inner_->remove(key);
    }

    ListResult list(const ListOptions& options) const override { return inner_->list(options); }
    SizeInfo size_info() const override { return inner_->size_info(); }
    bool is_healthy() const override { return inner_->is_healthy(); }

private:
    std::unique_ptr<StorageBackend> inner_;
};

/// Wraps a manifest store; before a save() it can act as a competing
/// writer, either appending a version of its own or deleting the record.
class RacingStore : public ManifestStore {
public:
    explicit RacingStore(std::unique_ptr<ManifestStore> inner) : inner_(std::move(inner)) {}

    int competing_appends = 0;  // saves of existing records to pre-empt
    bool delete_before_save = false;
    int saves = 0;

    std::string type_name() const override { return inner_->type_name(); }

    bool save(Manifest& manifest) override {
        ++saves;
        if (delete_before_save) {
            delete_before_save = false;
            inner_->remove(manifest.file_id);
        } else if (competing_appends > 0 && manifest.revision > 0) {
            --competing_appends;
            auto other = inner_->load(manifest.file_id);
            if (other) {
                auto now = std::chrono::system_clock::now();
                Version v;
                v.version_id = "competing-" + std::to_string(saves);
                v.created_at = now;
                v.notes = "competing writer";
                v.chunks = other->current_version().chunks;
                other->add_version(v, now);
                inner_->save(*other);
            }
        }
        return inner_->save(manifest);
    }

    std::optional<Manifest> load(const std::string& file_id) override {
        return inner_->load(file_id);
    }
    std::optional<nlohmann::json> load_document(const std::string& file_id) override {
        return inner_->load_document(file_id);
    }
    bool remove(const std::string& file_id) override { return inner_->remove(file_id); }
    std::vector<std::string> list_keys() override { return inner_->list_keys(); }

private:
    std::unique_ptr<ManifestStore> inner_;
};

/// Serves the given bytes, then fails the stream.
class FailingStreambuf : public std::streambuf {
public:
    explicit FailingStreambuf(std::string data) : data_(std::move(data)) {
        setg(data_.data(), data_.data(), data_.data() + data_.size());
    }

protected:
    int_type underflow() override {
        throw std::runtime_error("simulated read failure");
    }

private:
    std::string data_;
};

static Manifest sample_manifest(const std::string& file_id) {
    auto now = std::chrono::system_clock::now();
    Manifest m;
    m.file_id = file_id;
    m.original_filename = "report.pdf";
    m.chunk_size = 4;
    m.created_at = now;

    Version v;
    v.version_id = "v1";
    v.created_at = now;
    v.notes = "Initial version";
    ChunkRecord c;
    c.chunk_index = 0;
    c.backend_index = 0;
    c.remote_id = "r0";
    c.size_bytes = 3;
    c.content_hash = sha256_hex(bytes("abc"));
    v.chunks.push_back(c);
    m.add_version(v, now);
    return m;
}

static const std::string ABC_SHA256 =
    "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

// ---------------------------------------------------------------------------
// 1. Placement
// ---------------------------------------------------------------------------

static void test_placement() {
    std::cout << "\n=== Placement ===" << std::endl;

    {
        TEST(round_robin_is_index_mod_n);
        RoundRobinPlacement p(3);
        ASSERT_EQ(p.backend_count(), 3u, "backend count");
        size_t expected[] = {0, 1, 2, 0, 1, 2, 0};
        for (uint64_t i = 0; i < 7; ++i) {
            ASSERT_EQ(p.next_backend(i), expected[i], "backend for chunk " << i);
        }
        ASSERT_EQ(p.next_backend(1000001), 1000001u % 3, "large index");
        PASS();
    }
    {
        TEST(zero_backends_rejected);
        ASSERT_TRUE(throws<ConfigurationError>([] { RoundRobinPlacement p(0); }),
                    "N = 0 should throw ConfigurationError");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 2. Chunker
// ---------------------------------------------------------------------------

static void test_chunker() {
    std::cout << "\n=== Chunker ===" << std::endl;

    {
        TEST(sha256_known_vectors);
        ASSERT_EQ(sha256_hex(bytes("abc")), ABC_SHA256, "sha256(abc)");
        ASSERT_EQ(sha256_hex(bytes("")),
                  "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855",
                  "sha256 of empty input");
        PASS();
    }
    {
        TEST(split_sizes);
        struct Case { size_t size; std::vector<size_t> chunks; };
        std::vector<Case> cases = {
            {0, {0}}, {3, {3}}, {4, {4}}, {8, {4, 4}}, {11, {4, 4, 3}},
        };
        for (const auto& c : cases) {
            std::istringstream in(pattern(c.size));
            ChunkSplitter splitter(in, 4);
            Chunk chunk;
            std::vector<size_t> got;
            while (splitter.next(chunk)) {
                ASSERT_EQ(chunk.index, got.size(), "chunk index");
                ASSERT_EQ(chunk.hash, sha256_hex(chunk.data), "hash computed at read time");
                got.push_back(chunk.data.size());
            }
            ASSERT_TRUE(got == c.chunks, "chunk sizes for input of " << c.size << " bytes");
            ASSERT_EQ(splitter.bytes_read(), c.size, "bytes read");
        }
        PASS();
    }
    {
        TEST(zero_chunk_size_rejected);
        std::istringstream in("data");
        ASSERT_TRUE(throws<std::invalid_argument>([&] { ChunkSplitter s(in, 0); }),
                    "chunk_size 0 should be invalid_argument");
        PASS();
    }
    {
        TEST(stream_failure_throws);
        FailingStreambuf buf("0123456789");
        std::istream in(&buf);
        ChunkSplitter splitter(in, 4);
        Chunk chunk;
        ASSERT_TRUE(splitter.next(chunk), "first chunk");
        ASSERT_TRUE(splitter.next(chunk), "second chunk");
        ASSERT_TRUE(throws<std::runtime_error>([&] { splitter.next(chunk); }),
                    "third chunk should surface the read failure");
        PASS();
    }
    {
        TEST(assembler_verifies_and_appends);
        std::ostringstream out;
        ChunkAssembler assembler(out);
        ChunkRecord r0{0, 0, "a", 3, sha256_hex(bytes("abc"))};
        ChunkRecord r1{1, 1, "b", 2, sha256_hex(bytes("de"))};
        assembler.append(r0, bytes("abc"));
        assembler.append(r1, bytes("de"));
        ASSERT_EQ(out.str(), "abcde", "assembled output");
        ASSERT_EQ(assembler.bytes_written(), 5u, "bytes written");
        PASS();
    }
    {
        TEST(assembler_rejects_hash_mismatch);
        std::ostringstream out;
        ChunkAssembler assembler(out);
        ChunkRecord r0{0, 0, "a", 3, ABC_SHA256};
        try {
            assembler.append(r0, bytes("abd"));
            FAIL("tampered chunk accepted");
            return;
        } catch (const IntegrityError& e) {
            ASSERT_EQ(e.chunk_index(), 0u, "chunk index");
            ASSERT_EQ(e.expected(), ABC_SHA256, "expected hash");
            ASSERT_EQ(e.actual(), sha256_hex(bytes("abd")), "actual hash");
            ASSERT_TRUE(std::string(e.what()).find("hash mismatch") != std::string::npos,
                        "message names the mismatch");
        }
        ASSERT_TRUE(out.str().empty(), "nothing written for a bad chunk");
        PASS();
    }
    {
        TEST(assembler_rejects_size_mismatch_and_gaps);
        std::ostringstream out;
        ChunkAssembler assembler(out);
        ChunkRecord r0{0, 0, "a", 4, ABC_SHA256};
        ASSERT_TRUE(throws<IntegrityError>([&] { assembler.append(r0, bytes("abc")); }),
                    "short chunk should fail");
        ChunkRecord r1{1, 0, "b", 3, ABC_SHA256};
        ASSERT_TRUE(throws<IntegrityError>([&] { assembler.append(r1, bytes("abc")); }),
                    "chunk 1 before chunk 0 should fail");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 3. Manifest codec
// ---------------------------------------------------------------------------

static void test_manifest_codec() {
    std::cout << "\n=== Manifest codec ===" << std::endl;

    {
        TEST(encode_decode_preserves_fields);
        auto m = sample_manifest("file-1");
        m.revision = 7;
        auto j = manifest_to_json(m);
        ASSERT_EQ(j["schema_version"].get<int>(), 2, "schema version written");
        ASSERT_TRUE(j["versions"][0]["chunks"][0].contains("content_hash"), "schema-2 chunk names");

        auto back = manifest_from_json(j);
        ASSERT_EQ(back.file_id, "file-1", "file_id");
        ASSERT_EQ(back.original_filename, "report.pdf", "filename");
        ASSERT_EQ(back.total_size, 3u, "total_size");
        ASSERT_EQ(back.revision, 7u, "revision");
        ASSERT_EQ(back.versions.size(), 1u, "versions");
        ASSERT_EQ(back.current_version().chunks[0].remote_id, "r0", "remote id");
        ASSERT_EQ(back.current_version().notes, "Initial version", "notes");
        PASS();
    }
    {
        TEST(migrates_flat_chunk_list);
        auto doc = nlohmann::json::parse(R"({
            "file_id": "legacy-file",
            "original_filename": "old.bin",
            "total_size": 3,
            "chunk_size": 4,
            "created_at": 1700000000.5,
            "chunks": [{"chunk_index": 0, "chunk_id": "/vault/old_chunk_0",
                        "provider_index": 1, "size": 3,
                        "hash": "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"}]
        })");
        auto m = manifest_from_json(doc);
        ASSERT_EQ(m.versions.size(), 1u, "one synthetic version");
        const auto& v = m.current_version();
        ASSERT_TRUE(v.is_current, "synthetic version is current");
        ASSERT_EQ(v.notes, "Migrated from old format", "migration note");
        ASSERT_EQ(v.chunks[0].remote_id, "/vault/old_chunk_0", "chunk_id -> remote_id");
        ASSERT_EQ(v.chunks[0].backend_index, 1u, "provider_index -> backend_index");
        ASSERT_EQ(v.chunks[0].size_bytes, 3u, "size -> size_bytes");
        ASSERT_EQ(m.revision, 1u, "unversioned document counts as saved once");
        PASS();
    }
    {
        TEST(migrates_original_field_names);
        auto doc = nlohmann::json::parse(R"({
            "file_id": "f2", "original_filename": "a.txt", "total_size": 3, "chunk_size": 4,
            "created_at": 1700000000, "updated_at": 1700000100,
            "versions": [
              {"version_id": "a", "timestamp": 1700000000, "is_current": false, "notes": "first",
               "chunks": [{"index": 0, "chunk_id": "x", "provider_index": 0, "size": 3,
                           "hash": "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"}]},
              {"version_id": "b", "timestamp": 1700000100, "is_current": true, "notes": "second",
               "timestamp_readable": "2023-11-14 22:15:00",
               "chunks": [{"chunk_index": 0, "chunk_id": "y", "provider_index": 0, "size": 3,
                           "hash": "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"}]}
            ]
        })");
        auto m = manifest_from_json(doc);
        ASSERT_EQ(m.versions.size(), 2u, "both versions kept");
        ASSERT_EQ(m.current_version().version_id, "b", "current version");
        ASSERT_EQ(to_epoch_seconds(m.versions[0].created_at), 1700000000.0, "timestamp -> created_at");
        ASSERT_EQ(m.versions[0].chunks[0].chunk_index, 0u, "index -> chunk_index");
        PASS();
    }
    {
        TEST(inconsistent_current_flags_repaired);
        auto m = sample_manifest("file-3");
        Version v2 = m.versions[0];
        v2.version_id = "v2";
        v2.created_at += std::chrono::seconds(10);
        m.versions.push_back(v2);
        m.versions[0].is_current = true;
        m.versions[1].is_current = true;

        auto back = manifest_from_json(manifest_to_json(m));
        ASSERT_EQ(back.current_version().version_id, "v2", "most recent wins");
        ASSERT_TRUE(!back.versions[0].is_current, "older flag cleared");

        m.versions[0].is_current = false;
        m.versions[1].is_current = false;
        back = manifest_from_json(manifest_to_json(m));
        ASSERT_TRUE(back.versions[1].is_current, "no flag: most recent becomes current");
        PASS();
    }
    {
        TEST(corrupt_documents_rejected);
        ASSERT_TRUE(throws<ManifestFormatError>([] {
            manifest_from_json(nlohmann::json::array());
        }), "non-object document");
        ASSERT_TRUE(throws<ManifestFormatError>([] {
            manifest_from_json(nlohmann::json{{"file_id", "x"}, {"total_size", 1}, {"chunk_size", 4}});
        }), "missing original_filename");

        auto gap = manifest_to_json(sample_manifest("file-4"));
        gap["versions"][0]["chunks"][0]["chunk_index"] = 1;
        ASSERT_TRUE(throws<ManifestFormatError>([&] { manifest_from_json(gap); }),
                    "chunk indices must start at 0");

        auto bad_hash = manifest_to_json(sample_manifest("file-5"));
        bad_hash["versions"][0]["chunks"][0]["content_hash"] = "not-a-hash";
        ASSERT_TRUE(throws<ManifestFormatError>([&] { manifest_from_json(bad_hash); }),
                    "hash must be 64 hex chars");

        auto wrong_type = manifest_to_json(sample_manifest("file-6"));
        wrong_type["total_size"] = "big";
        ASSERT_TRUE(throws<ManifestFormatError>([&] { manifest_from_json(wrong_type); }),
                    "type errors are format errors");

        auto future = manifest_to_json(sample_manifest("file-7"));
        future["schema_version"] = 99;
        ASSERT_TRUE(throws<ManifestFormatError>([&] { manifest_from_json(future); }),
                    "unknown schema version");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 4. Manifest stores
// ---------------------------------------------------------------------------

static void run_store_checks(const std::string& type) {
    auto tmpdir = make_temp_dir("chunkvault-store-" + type);
    auto store = ManifestStore::create(type, tmpdir);
    ASSERT_EQ(store->type_name(), type, "store type");

    {
        TEST(save_new_then_load);
        auto m = sample_manifest("doc-1");
        ASSERT_TRUE(store->save(m), "first save succeeds");
        ASSERT_EQ(m.revision, 1u, "revision bumped");
        auto loaded = store->load("doc-1");
        ASSERT_TRUE(loaded.has_value(), "loads back");
        ASSERT_EQ(loaded->revision, 1u, "stored revision");
        ASSERT_EQ(loaded->original_filename, "report.pdf", "content");
        PASS();
    }
    {
        TEST(stale_revision_rejected);
        auto a = *store->load("doc-1");
        auto b = *store->load("doc-1");
        a.original_filename = "first-writer.pdf";
        ASSERT_TRUE(store->save(a), "first writer wins");
        ASSERT_EQ(a.revision, 2u, "revision 2");
        b.original_filename = "second-writer.pdf";
        ASSERT_TRUE(!store->save(b), "second writer loses");
        ASSERT_EQ(b.revision, 1u, "loser keeps its revision");
        ASSERT_EQ(store->load("doc-1")->original_filename, "first-writer.pdf", "winner persisted");
        PASS();
    }
    {
        TEST(create_over_existing_rejected);
        auto dup = sample_manifest("doc-1");
        ASSERT_TRUE(!store->save(dup), "revision 0 means must not exist");
        PASS();
    }
    {
        TEST(list_and_remove);
        auto m2 = sample_manifest("doc-2");
        ASSERT_TRUE(store->save(m2), "save doc-2");
        auto keys = store->list_keys();
        ASSERT_EQ(keys.size(), 2u, "two keys");
        ASSERT_EQ(keys[0], "doc-1", "sorted keys");
        ASSERT_TRUE(store->remove("doc-1"), "remove existing");
        ASSERT_TRUE(!store->remove("doc-1"), "remove again is a no-op");
        ASSERT_TRUE(!store->load("doc-1").has_value(), "gone");
        ASSERT_EQ(store->list_keys().size(), 1u, "one key left");
        PASS();
    }
    {
        TEST(invalid_ids_rejected);
        ASSERT_TRUE(throws<std::invalid_argument>([&] { store->load("../etc/passwd"); }),
                    "path-like id");
        PASS();
    }

    store.reset();
    fs::remove_all(tmpdir);
}

static void test_manifest_stores() {
    std::cout << "\n=== Manifest store (json) ===" << std::endl;
    run_store_checks("json");

    std::cout << "\n=== Manifest store (sqlite) ===" << std::endl;
    run_store_checks("sqlite");

    std::cout << "\n=== Manifest store (misc) ===" << std::endl;

    auto tmpdir = make_temp_dir("chunkvault-store-misc");
    {
        TEST(json_store_corrupt_file);
        JsonManifestStore store(tmpdir);
        write_file(tmpdir / "broken.json", "{ not json");
        ASSERT_TRUE(throws<ManifestFormatError>([&] { store.load("broken"); }),
                    "corrupt document raises ManifestFormatError");
        PASS();
    }
    {
        TEST(json_store_ignores_foreign_files);
        JsonManifestStore store(tmpdir);
        write_file(tmpdir / "users.json", "{}");
        write_file(tmpdir / "notes.txt", "hello");
        write_file(tmpdir / "half.json.tmp", "{}");
        auto keys = store.list_keys();
        ASSERT_EQ(keys.size(), 1u, "only manifest documents listed");
        ASSERT_EQ(keys[0], "broken", "broken.json is still a key");
        PASS();
    }
    {
        TEST(json_store_reads_legacy_document);
        JsonManifestStore store(tmpdir);
        write_file(tmpdir / "old-file.json", R"({
            "original_filename": "old.bin", "total_size": 3, "chunk_size": 4,
            "chunks": [{"chunk_index": 0, "chunk_id": "c0", "provider_index": 0, "size": 3,
                        "hash": "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"}]
        })");
        auto m = store.load("old-file");
        ASSERT_TRUE(m.has_value(), "legacy document loads");
        ASSERT_EQ(m->file_id, "old-file", "file_id taken from the key");
        ASSERT_EQ(m->revision, 1u, "legacy revision");
        m->original_filename = "renamed.bin";
        ASSERT_TRUE(store.save(*m), "legacy document can be updated");
        auto doc = nlohmann::json::parse(read_file(tmpdir / "old-file.json"));
        ASSERT_EQ(doc["schema_version"].get<int>(), 2, "rewritten at current schema");
        ASSERT_EQ(doc["revision"].get<uint64_t>(), 2u, "revision stored");
        PASS();
    }
    {
        TEST(unknown_store_type);
        ASSERT_TRUE(throws<ConfigurationError>([&] { ManifestStore::create("xml", tmpdir); }),
                    "unknown store type");
        PASS();
    }
    {
        TEST(json_store_load_document_is_raw);
        JsonManifestStore store(tmpdir);
        auto doc = store.load_document("old-file");
        ASSERT_TRUE(doc.has_value(), "document present");
        ASSERT_EQ((*doc)["original_filename"].get<std::string>(), "renamed.bin", "raw content");
        ASSERT_TRUE(!store.load_document("never-stored").has_value(), "absent");
        ASSERT_TRUE(throws<ManifestFormatError>([&] { store.load_document("broken"); }),
                    "non-JSON document");
        PASS();
    }
    {
        TEST(file_id_charset);
        ASSERT_TRUE(is_valid_file_id("0f8e-Ab_9"), "letters digits dash underscore");
        ASSERT_TRUE(!is_valid_file_id("a.b"), "dot rejected");
        ASSERT_TRUE(!is_valid_file_id(".."), "dot-dot rejected");
        ASSERT_TRUE(!is_valid_file_id("a/b"), "slash rejected");
        ASSERT_TRUE(!is_valid_file_id(""), "empty rejected");
        ASSERT_TRUE(is_valid_file_id(std::string(128, 'x')), "128 characters allowed");
        ASSERT_TRUE(!is_valid_file_id(std::string(129, 'x')), "129 characters rejected");
        PASS();
    }
    fs::remove_all(tmpdir);

    {
        TEST(json_store_separate_instances_serialize_writes);
        auto dir = make_temp_dir("chunkvault-store-race");
        {
            JsonManifestStore seed(dir);
            auto m = sample_manifest("shared");
            seed.save(m);
        }

        // Two store objects on one directory share nothing but the files,
        // as two processes would
        constexpr int kAppendsPerWriter = 20;
        std::atomic<int> errors{0};
        auto writer = [&](const std::string& tag) {
            JsonManifestStore store(dir);
            try {
                for (int i = 0; i < kAppendsPerWriter; ++i) {
                    for (;;) {
                        auto m = store.load("shared");
                        auto now = std::chrono::system_clock::now();
                        Version v = m->current_version();
                        v.version_id = tag + "-" + std::to_string(i);
                        m->add_version(v, now);
                        if (store.save(*m)) break;
                    }
                }
            } catch (const std::exception& e) {
                std::cout << "(writer " << tag << ": " << e.what() << ") ";
                ++errors;
            }
        };
        std::thread a(writer, "a");
        std::thread b(writer, "b");
        a.join();
        b.join();
        ASSERT_EQ(errors.load(), 0, "writers ran cleanly");

        JsonManifestStore check(dir);
        auto m = check.load("shared");
        ASSERT_TRUE(m.has_value(), "manifest readable");
        ASSERT_EQ(m->versions.size(), size_t{1 + 2 * kAppendsPerWriter}, "no append lost");
        ASSERT_EQ(m->revision, uint64_t{1 + 2 * kAppendsPerWriter}, "one revision per save");
        for (const auto& e : fs::directory_iterator(dir)) {
            ASSERT_TRUE(e.path().filename().string().find(".tmp") == std::string::npos,
                        "staging file left behind: " << e.path());
        }
        fs::remove_all(dir);
        PASS();
    }
    {
        TEST(sqlite_list_keys_unique_under_writes);
        auto dir = make_temp_dir("chunkvault-store-sqlite-list");
        auto reader = ManifestStore::create("sqlite", dir);
        std::atomic<bool> done{false};
        std::atomic<int> errors{0};
        std::thread writer([&] {
            try {
                auto store = ManifestStore::create("sqlite", dir);
                for (int i = 0; i < 200; ++i) {
                    auto m = sample_manifest("doc-" + std::to_string(1000 + i));
                    store->save(m);
                }
            } catch (const std::exception& e) {
                std::cout << "(writer: " << e.what() << ") ";
                ++errors;
            }
            done = true;
        });

        bool unique = true;
        while (!done && unique) {
            auto keys = reader->list_keys();
            unique = std::adjacent_find(keys.begin(), keys.end(),
                                        [](const std::string& x, const std::string& y) {
                                            return x >= y;
                                        }) == keys.end();
        }
        writer.join();
        ASSERT_EQ(errors.load(), 0, "writer ran cleanly");
        ASSERT_TRUE(unique, "listing returned a key twice or out of order");
        ASSERT_EQ(reader->list_keys().size(), 200u, "all rows listed");
        reader.reset();
        fs::remove_all(dir);
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 5. Local storage backend
// ---------------------------------------------------------------------------

static void test_local_backend() {
    std::cout << "\n=== Local backend ===" << std::endl;

    auto tmpdir = make_temp_dir("chunkvault-local");
    auto backend = StorageBackendFactory::create_local(tmpdir);

    {
        TEST(put_get_round_trip);
        auto put = backend->put("f1_v1_chunk_0", bytes("chunk-data"));
        ASSERT_TRUE(put.success, "put: " + put.error_message);
        ASSERT_EQ(put.remote_id, "f1_v1_chunk_0", "remote id");
        auto got = backend->get(put.remote_id);
        ASSERT_TRUE(got.success, "get: " + got.error_message);
        ASSERT_TRUE(got.data == bytes("chunk-data"), "content");
        ASSERT_TRUE(backend->exists(put.remote_id), "exists");
        ASSERT_EQ(backend->head(put.remote_id)->size, 10u, "head size");
        PASS();
    }
    {
        TEST(missing_object_reports_not_found);
        auto got = backend->get("nope");
        ASSERT_TRUE(!got.success, "get fails");
        ASSERT_TRUE(got.not_found, "not_found set");
        PASS();
    }
    {
        TEST(remove_is_idempotent);
        auto first = backend->remove("f1_v1_chunk_0");
        ASSERT_TRUE(first.success && first.existed, "first remove");
        auto second = backend->remove("f1_v1_chunk_0");
        ASSERT_TRUE(second.success, "second remove succeeds");
        ASSERT_TRUE(!second.existed, "second remove reports absence");
        PASS();
    }
    {
        TEST(path_traversal_rejected);
        auto put = backend->put("../escape", bytes("x"));
        ASSERT_TRUE(!put.success, "traversal put fails");
        ASSERT_NOT_EMPTY(put.error_message, "error message");
        ASSERT_TRUE(!fs::exists(tmpdir.parent_path() / "escape"), "nothing written outside root");
        auto got = backend->get("/etc/passwd");
        ASSERT_TRUE(!got.success && !got.not_found, "absolute key rejected");
        PASS();
    }
    {
        TEST(list_by_prefix);
        backend->put("fa_v_chunk_0", bytes("1"));
        backend->put("fa_v_chunk_1", bytes("22"));
        backend->put("fb_v_chunk_0", bytes("333"));
        ListOptions options;
        options.prefix = "fa_";
        auto listed = backend->list(options);
        ASSERT_TRUE(listed.success, "list");
        ASSERT_EQ(listed.entries.size(), 2u, "prefix filter");
        ASSERT_EQ(listed.entries[1].size, 2u, "entry size");

        ListOptions page;
        page.max_keys = 2;
        auto first = backend->list(page);
        ASSERT_TRUE(first.truncated, "first page truncated");
        page.continuation_token = first.continuation_token;
        auto second = backend->list(page);
        ASSERT_EQ(second.entries.size(), 1u, "second page");
        ASSERT_TRUE(!second.truncated, "last page");
        PASS();
    }
    {
        TEST(size_info_tracks_usage);
        auto info = backend->size_info();
        ASSERT_TRUE(info.success, "size_info: " + info.error_message);
        ASSERT_EQ(info.used_bytes, 6u, "used bytes");
        ASSERT_TRUE(info.total_bytes > 0, "filesystem capacity");

        auto reopened = StorageBackendFactory::create("local", {{"path", tmpdir.string()},
                                                                {"quota_bytes", "1000"}});
        auto reinfo = reopened->size_info();
        ASSERT_EQ(reinfo.used_bytes, 6u, "usage rebuilt from disk");
        ASSERT_EQ(reinfo.total_bytes, 1000u, "quota as total");
        PASS();
    }
    {
        TEST(factory_rejects_bad_config);
        ASSERT_TRUE(throws<std::runtime_error>([] {
            StorageBackendFactory::create("ftp", {});
        }), "unknown type");
        ASSERT_TRUE(throws<std::runtime_error>([] {
            StorageBackendFactory::create("s3", {{"region", "us-east-1"}});
        }), "s3 without bucket");
        ASSERT_TRUE(throws<std::runtime_error>([&] {
            StorageBackendFactory::create("local", {{"path", tmpdir.string()}, {"quota_bytes", "lots"}});
        }), "non-numeric quota");
        auto dbx = StorageBackendFactory::create("dropbox", {{"access_token", "t"}});
        ASSERT_EQ(dbx->type_name(), "dropbox", "dropbox backend constructed");
        auto nfs = StorageBackendFactory::create("nfs", {{"path", tmpdir.string()}});
        ASSERT_EQ(nfs->type_name(), "local", "nfs maps to local");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 6. ChunkEngine
// ---------------------------------------------------------------------------

static void test_engine_round_trip() {
    std::cout << "\n=== ChunkEngine round trip ===" << std::endl;

    auto pool = make_pool("chunkvault-rt", 3);
    auto engine = make_engine(pool, 4);

    {
        TEST(sizes_zero_short_exact_and_remainder);
        struct Case { size_t size; size_t chunks; };
        for (const auto& c : std::vector<Case>{{0, 1}, {3, 1}, {4, 1}, {11, 3}, {40, 10}}) {
            auto data = pattern(c.size);
            auto id = upload_string(*engine, data, "file-" + std::to_string(c.size) + ".bin");
            ASSERT_TRUE(is_valid_file_id(id), "file id issued");
            ASSERT_EQ(download_string(*engine, id), data, "round trip of " << c.size << " bytes");
            auto m = engine->stat(id);
            ASSERT_TRUE(m.has_value(), "manifest stored");
            ASSERT_EQ(m->current_version().chunks.size(), c.chunks, "chunk count for " << c.size);
            ASSERT_EQ(m->total_size, c.size, "total size");
            ASSERT_EQ(m->chunk_size, 4u, "chunk size recorded");
        }
        PASS();
    }
    {
        TEST(placement_cycles_backends);
        auto before = std::vector<size_t>{count_files(pool.dirs[0]), count_files(pool.dirs[1]),
                                          count_files(pool.dirs[2])};
        auto id = upload_string(*engine, pattern(20), "five-chunks.bin");
        auto m = engine->stat(id);
        const auto& chunks = m->current_version().chunks;
        ASSERT_EQ(chunks.size(), 5u, "five chunks");
        size_t expected[] = {0, 1, 2, 0, 1};
        for (size_t i = 0; i < 5; ++i) {
            ASSERT_EQ(chunks[i].backend_index, expected[i], "backend of chunk " << i);
        }
        ASSERT_EQ(count_files(pool.dirs[0]) - before[0], 2u, "A holds chunks 0 and 3");
        ASSERT_EQ(count_files(pool.dirs[1]) - before[1], 2u, "B holds chunks 1 and 4");
        ASSERT_EQ(count_files(pool.dirs[2]) - before[2], 1u, "C holds chunk 2");
        ASSERT_EQ(chunks[3].remote_id,
                  ChunkEngine::chunk_object_name(id, m->current_version().version_id, 3),
                  "object name");
        PASS();
    }
    {
        TEST(upload_and_download_files);
        auto src = pool.root / "input" / "photo.jpg";
        write_file(src, pattern(13));
        auto id = engine->upload_file(src);
        ASSERT_EQ(engine->stat(id)->original_filename, "photo.jpg", "basename as filename");
        auto out = pool.root / "out" / "nested" / "photo.jpg";
        engine->download_file(id, out);
        ASSERT_EQ(read_file(out), pattern(13), "file round trip");
        ASSERT_TRUE(throws<NotFoundError>([&] { engine->upload_file(pool.root / "missing.bin"); }),
                    "missing source file");
        PASS();
    }

    engine.reset();
    fs::remove_all(pool.root);
}

static void test_engine_hello() {
    std::cout << "\n=== ChunkEngine end to end ===" << std::endl;

    auto pool = make_pool("chunkvault-hello", 2);
    auto engine = make_engine(pool, 2);

    {
        TEST(hello_over_two_backends);
        auto id = upload_string(*engine, "hello!", "hello.txt");
        auto m = engine->stat(id);
        const auto& chunks = m->current_version().chunks;
        ASSERT_EQ(chunks.size(), 3u, "three chunks");
        const char* parts[] = {"he", "ll", "o!"};
        size_t backends[] = {0, 1, 0};
        for (size_t i = 0; i < 3; ++i) {
            ASSERT_EQ(chunks[i].backend_index, backends[i], "backend of chunk " << i);
            ASSERT_EQ(chunks[i].content_hash, sha256_hex(bytes(parts[i])), "hash of chunk " << i);
            ASSERT_EQ(read_file(pool.dirs[backends[i]] / chunks[i].remote_id), parts[i],
                      "stored bytes of chunk " << i);
        }
        ASSERT_EQ(count_files(pool.dirs[0]), 2u, "A holds two chunks");
        ASSERT_EQ(count_files(pool.dirs[1]), 1u, "B holds one chunk");
        ASSERT_EQ(download_string(*engine, id), "hello!", "download");
        PASS();
    }

    engine.reset();
    fs::remove_all(pool.root);
}

static void test_engine_integrity() {
    std::cout << "\n=== ChunkEngine integrity ===" << std::endl;

    auto pool = make_pool("chunkvault-integrity", 3);
    auto engine = make_engine(pool, 4);
    auto id = upload_string(*engine, pattern(12), "data.bin");
    auto m = *engine->stat(id);
    auto chunk1 = m.current_version().chunks[1];
    auto chunk1_path = pool.dirs[chunk1.backend_index] / chunk1.remote_id;

    {
        TEST(corrupted_chunk_raises_integrity_error);
        write_file(chunk1_path, "XXXX");
        try {
            download_string(*engine, id);
            FAIL("corrupted chunk was accepted");
            return;
        } catch (const IntegrityError& e) {
            ASSERT_EQ(e.chunk_index(), 1u, "failing chunk index");
            ASSERT_EQ(e.expected(), chunk1.content_hash, "expected hash");
        }
        PASS();
    }
    {
        TEST(missing_chunk_raises_not_found);
        fs::remove(chunk1_path);
        ASSERT_TRUE(throws<NotFoundError>([&] { download_string(*engine, id); }),
                    "missing chunk");
        PASS();
    }
    {
        TEST(unknown_file_raises_not_found);
        auto out = pool.root / "never.bin";
        ASSERT_TRUE(throws<NotFoundError>([&] { engine->download_file("no-such-file", out); }),
                    "unknown file");
        ASSERT_TRUE(!fs::exists(out), "no output created for unknown file");
        ASSERT_TRUE(throws<NotFoundError>([&] { download_string(*engine, "../bad id"); }),
                    "malformed id");
        PASS();
    }
    {
        TEST(backend_index_out_of_range);
        std::vector<std::unique_ptr<StorageBackend>> one;
        one.push_back(StorageBackendFactory::create_local(pool.dirs[0]));
        auto small = std::make_unique<ChunkEngine>(
            std::move(one), ManifestStore::create("json", pool.meta), EngineOptions{4});
        auto id2 = upload_string(*engine, pattern(12), "spread.bin");
        try {
            download_string(*small, id2);
            FAIL("download should fail");
            return;
        } catch (const BackendError& e) {
            ASSERT_EQ(e.backend_index(), 1u, "offending backend index");
            ASSERT_TRUE(std::string(e.what()).find("out of range") != std::string::npos,
                        "message says out of range");
        }
        PASS();
    }
    {
        TEST(backend_read_failure);
        auto pool2 = make_pool("chunkvault-getfail", 1);
        auto inner = StorageBackendFactory::create_local(pool2.dirs[0]);
        auto faulty = std::make_unique<FaultyBackend>(std::move(inner));
        auto* fb = faulty.get();
        std::vector<std::unique_ptr<StorageBackend>> backends;
        backends.push_back(std::move(faulty));
        ChunkEngine e2(std::move(backends), ManifestStore::create("json", pool2.meta), EngineOptions{4});
        auto id3 = upload_string(e2, "abcdef", "x.bin");
        fb->fail_gets = true;
        ASSERT_TRUE(throws<BackendError>([&] { download_string(e2, id3); }), "get failure");
        fs::remove_all(pool2.root);
        PASS();
    }

    engine.reset();
    fs::remove_all(pool.root);
}

static void test_engine_versions() {
    std::cout << "\n=== ChunkEngine versions ===" << std::endl;

    auto pool = make_pool("chunkvault-versions", 2);
    auto engine = make_engine(pool, 4);
    auto v1_data = pattern(6);
    auto v2_data = std::string("second version, longer");

    auto id = upload_string(*engine, v1_data, "doc.txt");
    std::string v1_id = engine->stat(id)->current_version().version_id;

    {
        TEST(append_version_to_existing_file);
        UploadOptions options;
        options.file_id = id;
        auto same = upload_string(*engine, v2_data, "ignored-name.txt", options);
        ASSERT_EQ(same, id, "same file id");
        auto m = engine->stat(id);
        ASSERT_EQ(m->versions.size(), 2u, "two versions");
        ASSERT_EQ(m->original_filename, "doc.txt", "original filename kept");
        ASSERT_EQ(m->total_size, v2_data.size(), "total size follows current version");
        ASSERT_EQ(download_string(*engine, id), v2_data, "download returns newest");
        ASSERT_EQ(m->versions[0].notes, "Initial version", "default first note");
        ASSERT_TRUE(m->versions[1].notes.rfind("Updated ", 0) == 0, "default update note");
        PASS();
    }
    {
        TEST(list_versions_newest_first);
        auto versions = engine->list_versions(id);
        ASSERT_EQ(versions.size(), 2u, "two versions");
        ASSERT_TRUE(versions[0].is_current, "newest is current");
        ASSERT_EQ(versions[1].version_id, v1_id, "oldest last");
        ASSERT_EQ(versions[1].size_bytes, v1_data.size(), "size of v1");
        ASSERT_EQ(versions[1].chunk_count, 2u, "chunks of v1");
        ASSERT_TRUE(throws<NotFoundError>([&] { engine->list_versions("nope"); }), "unknown file");
        PASS();
    }
    {
        TEST(restore_previous_version);
        ASSERT_TRUE(engine->restore_version(id, v1_id) == RestoreResult::Restored, "restored");
        ASSERT_EQ(download_string(*engine, id), v1_data, "download returns v1");
        auto m = engine->stat(id);
        ASSERT_EQ(m->total_size, v1_data.size(), "total size follows restored version");
        ASSERT_EQ(m->versions.size(), 2u, "history untouched");
        size_t current = 0;
        for (const auto& v : m->versions) current += v.is_current ? 1 : 0;
        ASSERT_EQ(current, 1u, "exactly one current version");
        ASSERT_TRUE(engine->restore_version(id, v1_id) == RestoreResult::Restored, "idempotent");
        ASSERT_EQ(download_string(*engine, id), v1_data, "still v1");
        PASS();
    }
    {
        TEST(restore_unknown_targets);
        ASSERT_TRUE(engine->restore_version(id, "no-such-version") == RestoreResult::VersionNotFound,
                    "unknown version");
        ASSERT_TRUE(engine->restore_version("no-such-file", v1_id) == RestoreResult::FileNotFound,
                    "unknown file");
        PASS();
    }
    {
        TEST(unknown_file_id_creates_new_file);
        UploadOptions options;
        options.file_id = "does-not-exist";
        options.notes = "fresh";
        auto new_id = upload_string(*engine, "xyz", "new.txt", options);
        ASSERT_TRUE(new_id != "does-not-exist", "new id issued");
        auto m = engine->stat(new_id);
        ASSERT_EQ(m->versions.size(), 1u, "single version");
        ASSERT_EQ(m->current_version().notes, "fresh", "caller notes kept");
        PASS();
    }
    {
        TEST(sqlite_store_versions);
        auto pool2 = make_pool("chunkvault-versions-sql", 2);
        auto e2 = make_engine(pool2, 3, "sqlite");
        auto sid = upload_string(*e2, "one", "s.txt");
        auto first = e2->stat(sid)->current_version().version_id;
        UploadOptions options;
        options.file_id = sid;
        upload_string(*e2, "two two", "s.txt", options);
        ASSERT_EQ(download_string(*e2, sid), "two two", "newest");
        ASSERT_TRUE(e2->restore_version(sid, first) == RestoreResult::Restored, "restore");
        ASSERT_EQ(download_string(*e2, sid), "one", "restored");
        ASSERT_EQ(e2->stat(sid)->revision, 3u, "three saves");
        ASSERT_TRUE(fs::exists(pool2.meta / "manifests.db"), "database file");
        e2.reset();
        fs::remove_all(pool2.root);
        PASS();
    }

    engine.reset();
    fs::remove_all(pool.root);
}

static void test_engine_cleanup() {
    std::cout << "\n=== ChunkEngine failure cleanup ===" << std::endl;

    auto make_faulty = [](const Pool& pool, FaultyBackend*& handle) {
        std::vector<std::unique_ptr<StorageBackend>> backends;
        backends.push_back(StorageBackendFactory::create_local(pool.dirs[0]));
        auto faulty = std::make_unique<FaultyBackend>(StorageBackendFactory::create_local(pool.dirs[1]));
        handle = faulty.get();
        backends.push_back(std::move(faulty));
        return std::make_unique<ChunkEngine>(std::move(backends),
                                             ManifestStore::create("json", pool.meta),
                                             EngineOptions{4});
    };

    {
        TEST(failed_put_removes_placed_chunks);
        auto pool = make_pool("chunkvault-cleanup", 2);
        FaultyBackend* fb = nullptr;
        auto engine = make_faulty(pool, fb);
        fb->fail_put_at = 2;  // chunk 3: A0, B1, A2, B3
        try {
            upload_string(*engine, pattern(20), "doomed.bin");
            FAIL("upload should fail");
            return;
        } catch (const BackendError& e) {
            ASSERT_EQ(e.backend_index(), 1u, "failing backend");
            ASSERT_TRUE(e.chunk_index().has_value(), "chunk index recorded");
            ASSERT_EQ(*e.chunk_index(), 3u, "failing chunk");
        }
        ASSERT_EQ(count_files(pool.dirs[0]), 0u, "A cleaned up");
        ASSERT_EQ(count_files(pool.dirs[1]), 0u, "B cleaned up");
        ASSERT_TRUE(engine->list().empty(), "no manifest written");
        engine.reset();
        fs::remove_all(pool.root);
        PASS();
    }
    {
        TEST(throwing_backend_also_cleaned_up);
        auto pool = make_pool("chunkvault-cleanup-throw", 2);
        FaultyBackend* fb = nullptr;
        auto engine = make_faulty(pool, fb);
        fb->fail_put_at = 1;
        fb->throw_on_put = true;
        ASSERT_TRUE(throws<std::runtime_error>([&] { upload_string(*engine, pattern(8), "x.bin"); }),
                    "exception propagates");
        ASSERT_EQ(count_files(pool.dirs[0]), 0u, "chunk 0 cleaned up");
        ASSERT_TRUE(engine->list().empty(), "no manifest written");
        engine.reset();
        fs::remove_all(pool.root);
        PASS();
    }
    {
        TEST(stream_failure_cleans_up);
        auto pool = make_pool("chunkvault-cleanup-stream", 2);
        auto engine = make_engine(pool, 4);
        FailingStreambuf buf("0123456789");
        std::istream in(&buf);
        ASSERT_TRUE(throws<std::runtime_error>([&] { engine->upload(in, "stream.bin"); }),
                    "read failure propagates");
        ASSERT_EQ(count_files(pool.dirs[0]) + count_files(pool.dirs[1]), 0u, "chunks cleaned up");
        ASSERT_TRUE(engine->list().empty(), "no manifest written");
        engine.reset();
        fs::remove_all(pool.root);
        PASS();
    }
    {
        TEST(cleanup_failure_does_not_mask_error);
        auto pool = make_pool("chunkvault-cleanup-stuck", 2);
        FaultyBackend* fb = nullptr;
        auto engine = make_faulty(pool, fb);
        fb->fail_put_at = 2;
        fb->fail_removes = true;
        ASSERT_TRUE(throws<BackendError>([&] { upload_string(*engine, pattern(20), "y.bin"); }),
                    "original error propagates");
        ASSERT_EQ(count_files(pool.dirs[0]), 0u, "A still cleaned up");
        ASSERT_EQ(count_files(pool.dirs[1]), 1u, "B chunk stranded");
        ASSERT_TRUE(engine->list().empty(), "no manifest written");
        engine.reset();
        fs::remove_all(pool.root);
        PASS();
    }
    {
        TEST(failed_append_keeps_previous_version);
        auto pool = make_pool("chunkvault-cleanup-append", 2);
        FaultyBackend* fb = nullptr;
        auto engine = make_faulty(pool, fb);
        auto id = upload_string(*engine, "abcdefgh", "keep.bin");
        fb->fail_put_at = fb->puts + 1;
        UploadOptions options;
        options.file_id = id;
        ASSERT_TRUE(throws<BackendError>([&] { upload_string(*engine, pattern(8), "keep.bin", options); }),
                    "append fails");
        ASSERT_EQ(engine->stat(id)->versions.size(), 1u, "history unchanged");
        ASSERT_EQ(download_string(*engine, id), "abcdefgh", "old content intact");
        engine.reset();
        fs::remove_all(pool.root);
        PASS();
    }
}

static void test_engine_delete() {
    std::cout << "\n=== ChunkEngine delete ===" << std::endl;

    {
        TEST(delete_removes_all_versions);
        auto pool = make_pool("chunkvault-delete", 2);
        auto engine = make_engine(pool, 4);
        auto id = upload_string(*engine, pattern(10), "a.bin");
        UploadOptions options;
        options.file_id = id;
        upload_string(*engine, pattern(7), "a.bin", options);

        auto result = engine->remove_file(id);
        ASSERT_TRUE(result.status == DeleteStatus::Deleted, "deleted");
        ASSERT_TRUE(result.ok(), "ok");
        ASSERT_EQ(result.chunks_deleted, 5u, "3 + 2 chunks removed");
        ASSERT_TRUE(result.manifest_removed, "manifest removed");
        ASSERT_EQ(count_files(pool.dirs[0]) + count_files(pool.dirs[1]), 0u, "no chunks left");
        ASSERT_TRUE(!engine->stat(id).has_value(), "manifest gone");
        ASSERT_TRUE(throws<NotFoundError>([&] { download_string(*engine, id); }), "download fails");

        auto again = engine->remove_file(id);
        ASSERT_TRUE(again.status == DeleteStatus::AlreadyAbsent, "second delete is a no-op");
        ASSERT_TRUE(again.ok(), "no-op is success");
        engine.reset();
        fs::remove_all(pool.root);
        PASS();
    }
    {
        TEST(already_missing_chunk_counts_as_deleted);
        auto pool = make_pool("chunkvault-delete-missing", 2);
        auto engine = make_engine(pool, 4);
        auto id = upload_string(*engine, pattern(8), "b.bin");
        auto chunk = engine->stat(id)->current_version().chunks[0];
        fs::remove(pool.dirs[chunk.backend_index] / chunk.remote_id);
        auto result = engine->remove_file(id);
        ASSERT_TRUE(result.status == DeleteStatus::Deleted, "still fully deleted");
        ASSERT_EQ(result.chunks_deleted, 2u, "both chunks accounted for");
        engine.reset();
        fs::remove_all(pool.root);
        PASS();
    }
    {
        TEST(partial_delete_reports_stranded_chunks);
        auto pool = make_pool("chunkvault-delete-partial", 2);
        std::vector<std::unique_ptr<StorageBackend>> backends;
        backends.push_back(StorageBackendFactory::create_local(pool.dirs[0]));
        auto faulty = std::make_unique<FaultyBackend>(StorageBackendFactory::create_local(pool.dirs[1]));
        auto* fb = faulty.get();
        backends.push_back(std::move(faulty));
        ChunkEngine engine(std::move(backends), ManifestStore::create("json", pool.meta), EngineOptions{4});

        auto id = upload_string(engine, pattern(16), "c.bin");
        fb->fail_removes = true;
        auto result = engine.remove_file(id);
        ASSERT_TRUE(result.status == DeleteStatus::Partial, "partial");
        ASSERT_TRUE(!result.ok(), "not ok");
        ASSERT_EQ(result.chunks_deleted, 2u, "A chunks removed");
        ASSERT_EQ(result.failures.size(), 2u, "B chunks stranded");
        ASSERT_EQ(result.failures[0].backend_index, 1u, "failure names backend");
        ASSERT_NOT_EMPTY(result.failures[0].error, "failure carries error");
        ASSERT_TRUE(result.manifest_removed, "manifest still removed");
        ASSERT_TRUE(!engine.stat(id).has_value(), "file no longer listed");
        ASSERT_EQ(count_files(pool.dirs[1]), 2u, "stranded bytes remain");
        fs::remove_all(pool.root);
        PASS();
    }
    {
        TEST(hashless_legacy_manifest_deleted);
        auto pool = make_pool("chunkvault-delete-legacy", 2);
        auto engine = make_engine(pool, 4);
        write_file(pool.dirs[0] / "old_c0", "abcd");
        write_file(pool.dirs[1] / "old_c1", "ef");
        write_file(pool.meta / "legacy-file.json", R"({
            "original_filename": "old.bin", "total_size": 6, "chunk_size": 4,
            "versions": [{"version_id": "v1", "timestamp": 1700000000.0, "chunks": [
                {"index": 0, "chunk_id": "old_c0", "provider_index": 0, "size": 4, "hash": null},
                {"index": 1, "chunk_id": "old_c1", "provider_index": 1, "size": 2, "hash": null}
            ]}]
        })");
        ASSERT_TRUE(throws<ManifestFormatError>([&] { engine->stat("legacy-file"); }),
                    "record does not validate");

        DeleteResult result;
        try {
            result = engine->remove_file("legacy-file");
        } catch (const std::exception& e) {
            FAIL("remove_file threw: " << e.what());
            return;
        }
        ASSERT_TRUE(result.status == DeleteStatus::Partial, "reported as partial");
        ASSERT_NOT_EMPTY(result.manifest_error, "decode error carried");
        ASSERT_TRUE(result.manifest_removed, "record removed");
        ASSERT_EQ(result.chunks_deleted, 2u, "chunks named by the record removed");
        ASSERT_TRUE(result.failures.empty(), "no chunk failures");
        ASSERT_EQ(count_files(pool.dirs[0]) + count_files(pool.dirs[1]), 0u, "no chunks left");
        ASSERT_TRUE(!fs::exists(pool.meta / "legacy-file.json"), "document gone");
        ASSERT_TRUE(engine->remove_file("legacy-file").status == DeleteStatus::AlreadyAbsent,
                    "second delete is a no-op");
        engine.reset();
        fs::remove_all(pool.root);
        PASS();
    }
    {
        TEST(non_json_manifest_deleted);
        auto pool = make_pool("chunkvault-delete-garbage", 2);
        auto engine = make_engine(pool, 4);
        write_file(pool.meta / "garbage.json", "{\"file_id\": 12");
        auto result = engine->remove_file("garbage");
        ASSERT_TRUE(result.status == DeleteStatus::Partial, "reported as partial");
        ASSERT_NOT_EMPTY(result.manifest_error, "parse error carried");
        ASSERT_TRUE(result.manifest_removed, "record removed");
        ASSERT_EQ(result.chunks_deleted, 0u, "nothing recoverable");
        ASSERT_TRUE(!fs::exists(pool.meta / "garbage.json"), "document gone");
        ASSERT_TRUE(engine->list().empty(), "nothing left to list");
        engine.reset();
        fs::remove_all(pool.root);
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 6b. Manifest commit conflicts
// ---------------------------------------------------------------------------

static void test_engine_commit() {
    std::cout << "\n=== ChunkEngine manifest commit ===" << std::endl;

    auto racing_engine = [](const Pool& pool, RacingStore*& handle) {
        auto store = std::make_unique<RacingStore>(ManifestStore::create("json", pool.meta));
        handle = store.get();
        return std::make_unique<ChunkEngine>(local_backends(pool), std::move(store),
                                             EngineOptions{4});
    };

    {
        TEST(stale_revision_reloaded_and_retried);
        auto pool = make_pool("chunkvault-commit-retry", 2);
        RacingStore* rs = nullptr;
        auto engine = racing_engine(pool, rs);
        auto id = upload_string(*engine, "aaaa", "r.bin");
        rs->competing_appends = 1;
        UploadOptions options;
        options.file_id = id;
        upload_string(*engine, "bbbbbb", "r.bin", options);

        ASSERT_EQ(rs->saves, 3, "one save for create, two for the contested append");
        auto m = engine->stat(id);
        ASSERT_EQ(m->versions.size(), 3u, "ours, competing, ours");
        ASSERT_EQ(m->versions[1].notes, "competing writer", "competing version kept");
        ASSERT_TRUE(m->current_version().notes != "competing writer", "our version is current");
        ASSERT_EQ(download_string(*engine, id), "bbbbbb", "new content served");
        engine.reset();
        fs::remove_all(pool.root);
        PASS();
    }
    {
        TEST(retries_exhausted_raises_conflict);
        auto pool = make_pool("chunkvault-commit-exhausted", 2);
        RacingStore* rs = nullptr;
        auto engine = racing_engine(pool, rs);
        auto id = upload_string(*engine, "aaaa", "x.bin");
        size_t stored = count_files(pool.dirs[0]) + count_files(pool.dirs[1]);

        rs->competing_appends = constants::MAX_MANIFEST_COMMIT_ATTEMPTS;
        UploadOptions options;
        options.file_id = id;
        ASSERT_TRUE(throws<ConflictError>([&] { upload_string(*engine, pattern(9), "x.bin", options); }),
                    "gives up");
        ASSERT_EQ(count_files(pool.dirs[0]) + count_files(pool.dirs[1]), stored,
                  "chunks of the rejected version cleaned up");
        auto m = engine->stat(id);
        ASSERT_EQ(m->versions.size(), size_t{1 + constants::MAX_MANIFEST_COMMIT_ATTEMPTS},
                  "only competing versions appended");
        ASSERT_EQ(download_string(*engine, id), "aaaa", "existing content intact");
        engine.reset();
        fs::remove_all(pool.root);
        PASS();
    }
    {
        TEST(file_deleted_during_append_raises_conflict);
        auto pool = make_pool("chunkvault-commit-deleted", 2);
        RacingStore* rs = nullptr;
        auto engine = racing_engine(pool, rs);
        auto id = upload_string(*engine, "aaaa", "d.bin");
        size_t stored = count_files(pool.dirs[0]) + count_files(pool.dirs[1]);

        rs->delete_before_save = true;
        UploadOptions options;
        options.file_id = id;
        ASSERT_TRUE(throws<ConflictError>([&] { upload_string(*engine, pattern(9), "d.bin", options); }),
                    "append to a vanished file");
        ASSERT_EQ(count_files(pool.dirs[0]) + count_files(pool.dirs[1]), stored,
                  "new chunks cleaned up");
        ASSERT_TRUE(!engine->stat(id).has_value(), "not resurrected");
        engine.reset();
        fs::remove_all(pool.root);
        PASS();
    }
    {
        TEST(concurrent_appends_from_two_engines);
        auto pool = make_pool("chunkvault-commit-threads", 2);
        auto first = make_engine(pool, 4);
        auto second = make_engine(pool, 4);
        auto id = upload_string(*first, "seed", "shared.bin");

        constexpr int kAppends = 5;
        std::atomic<int> committed{0};
        std::atomic<int> errors{0};
        auto appender = [&](ChunkEngine* engine, char fill) {
            UploadOptions options;
            options.file_id = id;
            for (int i = 0; i < kAppends; ++i) {
                try {
                    upload_string(*engine, std::string(6, fill), "shared.bin", options);
                    ++committed;
                } catch (const ConflictError&) {
                    // Rejected cleanly; nothing was committed
                } catch (const std::exception& e) {
                    std::cout << "(append: " << e.what() << ") ";
                    ++errors;
                }
            }
        };
        std::thread a(appender, first.get(), 'a');
        std::thread b(appender, second.get(), 'b');
        a.join();
        b.join();

        ASSERT_EQ(errors.load(), 0, "no unexpected failures");
        ASSERT_TRUE(committed.load() > 0, "appends committed");
        auto m = first->stat(id);
        ASSERT_EQ(m->versions.size(), size_t(1 + committed.load()),
                  "every committed append is in the history");
        size_t chunks = 0;
        for (const auto& v : m->versions) chunks += v.chunks.size();
        ASSERT_EQ(count_files(pool.dirs[0]) + count_files(pool.dirs[1]), chunks,
                  "no orphaned chunks");
        first.reset();
        second.reset();
        fs::remove_all(pool.root);
        PASS();
    }
}

static void test_engine_listing() {
    std::cout << "\n=== ChunkEngine listing ===" << std::endl;

    auto pool = make_pool("chunkvault-list", 2);
    auto engine = make_engine(pool, 4);

    {
        TEST(list_sorted_case_insensitive);
        auto b = upload_string(*engine, "bbb", "b.txt");
        auto a = upload_string(*engine, "aaa", "A.txt");
        auto c = upload_string(*engine, "ccc", "c.txt");
        auto files = engine->list();
        ASSERT_EQ(files.size(), 3u, "three files");
        ASSERT_EQ(files[0].original_filename, "A.txt", "first");
        ASSERT_EQ(files[1].original_filename, "b.txt", "second");
        ASSERT_EQ(files[2].original_filename, "c.txt", "third");
        ASSERT_EQ(files[0].file_id, a, "id of first");
        ASSERT_EQ(files[1].total_size, 3u, "size");
        ASSERT_EQ(engine->file_count(), 3u, "file count");
        PASS();
    }
    {
        TEST(list_skips_corrupt_records);
        write_file(pool.meta / "garbage.json", "{\"file_id\": 12");
        write_file(pool.meta / "empty-versions.json",
                   R"({"file_id": "empty-versions", "original_filename": "x", "total_size": 0,
                       "chunk_size": 4, "versions": []})");
        auto files = engine->list();
        ASSERT_EQ(files.size(), 3u, "corrupt records skipped");
        PASS();
    }
    {
        TEST(backend_usage_reports_each_backend);
        auto usage = engine->backend_usage();
        ASSERT_EQ(usage.size(), 2u, "two backends");
        ASSERT_EQ(usage[0].type_name, "local", "type");
        ASSERT_TRUE(usage[0].healthy, "healthy");
        ASSERT_TRUE(usage[0].size.success, "size known");
        ASSERT_EQ(usage[0].size.used_bytes + usage[1].size.used_bytes, 9u, "bytes stored");
        PASS();
    }

    engine.reset();
    fs::remove_all(pool.root);
}

static void test_engine_configuration() {
    std::cout << "\n=== ChunkEngine configuration ===" << std::endl;

    auto pool = make_pool("chunkvault-config", 3);

    {
        TEST(zero_backends_rejected);
        ASSERT_TRUE(throws<ConfigurationError>([&] {
            ChunkEngine e({}, ManifestStore::create("json", pool.meta));
        }), "empty backend list");
        PASS();
    }
    {
        TEST(missing_store_rejected);
        ASSERT_TRUE(throws<ConfigurationError>([&] {
            ChunkEngine e(local_backends(pool), nullptr);
        }), "null store");
        PASS();
    }
    {
        TEST(zero_chunk_size_rejected);
        ASSERT_TRUE(throws<ConfigurationError>([&] {
            ChunkEngine e(local_backends(pool), ManifestStore::create("json", pool.meta), EngineOptions{0});
        }), "chunk size 0");
        PASS();
    }
    {
        TEST(placement_must_match_pool);
        ASSERT_TRUE(throws<ConfigurationError>([&] {
            ChunkEngine e(local_backends(pool), ManifestStore::create("json", pool.meta),
                          EngineOptions{4}, std::make_unique<RoundRobinPlacement>(2));
        }), "strategy over 2 backends with 3 configured");
        PASS();
    }
    {
        TEST(from_config_builds_engine);
        EngineConfig config;
        for (const auto& dir : pool.dirs) {
            config.backends.push_back(BackendConfig{"local", {{"path", dir.string()}}});
        }
        config.chunk_size = 5;
        config.metadata_dir = pool.meta;
        config.manifest_store = "sqlite";
        auto engine = ChunkEngine::from_config(config);
        ASSERT_EQ(engine->backend_count(), 3u, "backends");
        ASSERT_EQ(engine->chunk_size(), 5u, "chunk size");
        auto id = upload_string(*engine, "configured", "cfg.txt");
        ASSERT_EQ(download_string(*engine, id), "configured", "round trip");

        config.backends.push_back(BackendConfig{"s3", {}});
        ASSERT_TRUE(throws<ConfigurationError>([&] { ChunkEngine::from_config(config); }),
                    "bad backend surfaces as ConfigurationError");
        PASS();
    }

    fs::remove_all(pool.root);
}

// ---------------------------------------------------------------------------
// 7. Configuration
// ---------------------------------------------------------------------------

static void test_config() {
    std::cout << "\n=== Configuration ===" << std::endl;

    {
        TEST(backend_validation);
        BackendConfig bc;
        ASSERT_NOT_EMPTY(bc.validate(), "empty type");
        bc.type = "ftp";
        ASSERT_TRUE(bc.validate().find("unknown") != std::string::npos, "unknown type");
        bc.type = "s3";
        ASSERT_TRUE(bc.validate().find("bucket") != std::string::npos, "s3 needs bucket");
        bc.params["bucket"] = "b";
        ASSERT_EMPTY(bc.validate(), "s3 with bucket");
        bc = BackendConfig{"dropbox", {}};
        ASSERT_TRUE(bc.validate().find("access_token") != std::string::npos, "dropbox needs token");
        bc = BackendConfig{"local", {}};
        ASSERT_TRUE(bc.validate().find("path") != std::string::npos, "local needs path");
        bc = BackendConfig{"nfs", {{"path", "/nonexistent/chunkvault/xyz"}}};
        ASSERT_TRUE(bc.validate().find("does not exist") != std::string::npos, "nfs path must exist");
        bc.params["path"] = "/tmp";
        ASSERT_EMPTY(bc.validate(), "nfs with existing path");
        PASS();
    }
    {
        TEST(backend_spec_parsing);
        auto local = BackendConfig::parse("local:/srv/chunks");
        ASSERT_TRUE(local.has_value(), "local parses");
        ASSERT_EQ(local->params["path"], "/srv/chunks", "bare path");
        auto s3 = BackendConfig::parse("s3:bucket=b,region=eu-west-1");
        ASSERT_TRUE(s3.has_value(), "s3 parses");
        ASSERT_EQ(s3->type, "s3", "type");
        ASSERT_EQ(s3->params["bucket"], "b", "bucket");
        ASSERT_EQ(s3->params["region"], "eu-west-1", "region");
        ASSERT_TRUE(!BackendConfig::parse("s3:bucket").has_value(), "missing '='");
        ASSERT_TRUE(!BackendConfig::parse(":x=y").has_value(), "missing type");
        PASS();
    }
    {
        TEST(cli_parsing);
        const char* args[] = {
            "chunkvault",
            "--backend", "local:/tmp/a",
            "--backend", "s3:bucket=b",
            "--chunk-size", "1024",
            "--manifest-store", "sqlite",
            "--verbose",
            "download", "id", "--chunk-size",
        };
        int command_index = 0;
        auto cfg = EngineConfig::from_args(13, const_cast<char**>(args), command_index);
        ASSERT_TRUE(cfg.has_value(), "should parse");
        ASSERT_EQ(command_index, 10, "command position");
        ASSERT_EQ(cfg->backends.size(), 2u, "two backends in order");
        ASSERT_EQ(cfg->backends[0].type, "local", "first backend");
        ASSERT_EQ(cfg->chunk_size, 1024u, "chunk size");
        ASSERT_EQ(cfg->manifest_store, "sqlite", "store");
        ASSERT_TRUE(cfg->verbose, "verbose");
        ASSERT_EQ(cfg->metadata_dir.string(), "metadata", "default metadata dir");
        ASSERT_EQ(cfg->sqlite_path().string(), "metadata/manifests.db", "sqlite path");
        PASS();
    }
    {
        TEST(cli_rejects_bad_values);
        int command_index = 0;
        const char* bad_size[] = {"chunkvault", "--chunk-size", "big", "list"};
        ASSERT_TRUE(!EngineConfig::from_args(4, const_cast<char**>(bad_size), command_index),
                    "non-numeric chunk size");
        const char* unknown[] = {"chunkvault", "--bogus", "list"};
        ASSERT_TRUE(!EngineConfig::from_args(3, const_cast<char**>(unknown), command_index),
                    "unknown option");
        const char* dangling[] = {"chunkvault", "--backend"};
        ASSERT_TRUE(!EngineConfig::from_args(2, const_cast<char**>(dangling), command_index),
                    "missing value");
        PASS();
    }
    {
        TEST(json_config);
        auto tmpdir = make_temp_dir("chunkvault-cfg");
        auto path = tmpdir / "config.json";
        write_file(path, R"({
            "buckets": [
                {"type": "local", "path": "/tmp/x"},
                {"type": "dropbox", "credentials": "tok123", "folder_path": "/vault"},
                {"type": "s3", "bucket": "b", "use_path_style": true,
                 "credentials": {"access_key": "AK", "secret_key": "SK"}}
            ],
            "chunk_size": 2048,
            "encryption_enabled": true,
            "manifest_store": "sqlite",
            "metrics_interval": 30
        })");
        EngineConfig cfg;
        ASSERT_TRUE(cfg.load_json(path), "loads");
        ASSERT_EQ(cfg.backends.size(), 3u, "three backends");
        ASSERT_EQ(cfg.backends[1].params["access_token"], "tok123", "dropbox credentials");
        ASSERT_EQ(cfg.backends[1].params["folder_path"], "/vault", "folder path");
        ASSERT_EQ(cfg.backends[2].params["access_key"], "AK", "flattened credentials");
        ASSERT_EQ(cfg.backends[2].params["use_path_style"], "true", "bool param");
        ASSERT_EQ(cfg.chunk_size, 2048u, "chunk size");
        ASSERT_TRUE(cfg.encryption_enabled, "encryption flag");
        ASSERT_EQ(cfg.metrics_interval_secs, 30u, "metrics interval");

        write_file(path, "{ broken");
        EngineConfig broken;
        ASSERT_TRUE(!broken.load_json(path), "malformed file rejected");
        ASSERT_TRUE(!broken.load_json(tmpdir / "missing.json"), "missing file rejected");
        fs::remove_all(tmpdir);
        PASS();
    }
    {
        TEST(validation);
        EngineConfig cfg;
        cfg.apply_defaults();
        ASSERT_TRUE(cfg.validate().find("backend") != std::string::npos, "no backends");
        cfg.backends.push_back(BackendConfig{"local", {{"path", "/tmp"}}});
        ASSERT_EMPTY(cfg.validate(), "minimal config");
        cfg.manifest_store = "xml";
        ASSERT_TRUE(cfg.validate().find("manifest_store") != std::string::npos, "bad store");
        cfg.manifest_store = "json";
        cfg.chunk_size = 0;
        ASSERT_TRUE(cfg.validate().find("chunk_size") != std::string::npos, "zero chunk size");
        cfg.chunk_size = 4;
        cfg.backends.push_back(BackendConfig{"s3", {}});
        ASSERT_TRUE(cfg.validate().find("backend[1]") != std::string::npos, "names the backend");
        PASS();
    }
    {
        TEST(environment_credentials);
        setenv("AWS_ACCESS_KEY_ID", "ENVKEY", 1);
        setenv("CHUNKVAULT_ENCRYPTION_KEY", "envsecret", 1);
        EngineConfig cfg;
        cfg.backends.push_back(BackendConfig{"s3", {{"bucket", "b"}}});
        cfg.backends.push_back(BackendConfig{"s3", {{"bucket", "c"}, {"access_key", "CLI"}}});
        cfg.encryption_key = "from-file";
        cfg.apply_defaults();
        ASSERT_EQ(cfg.backends[0].params["access_key"], "ENVKEY", "env fills missing key");
        ASSERT_EQ(cfg.backends[1].params["access_key"], "CLI", "explicit key wins");
        ASSERT_EQ(cfg.encryption_key, "envsecret", "env overrides file key");
        unsetenv("AWS_ACCESS_KEY_ID");
        unsetenv("CHUNKVAULT_ENCRYPTION_KEY");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 8. HTTP helpers
// ---------------------------------------------------------------------------

static void test_http_helpers() {
    std::cout << "\n=== HTTP helpers ===" << std::endl;

    {
        TEST(url_encoding);
        ASSERT_EQ(net::url_encode("a b/c"), "a%20b%2Fc", "slash encoded");
        ASSERT_EQ(net::url_encode("a b/c", false), "a%20b/c", "slash kept");
        ASSERT_EQ(net::url_encode("A-z_0.9~"), "A-z_0.9~", "unreserved untouched");
        PASS();
    }
    {
        TEST(url_parsing);
        auto url = net::ParsedUrl::parse("https://minio.local:9000/bucket/key?list-type=2");
        ASSERT_TRUE(url.has_value(), "parses");
        ASSERT_EQ(url->scheme, "https", "scheme");
        ASSERT_EQ(url->host, "minio.local", "host");
        ASSERT_EQ(url->port, 9000, "port");
        ASSERT_EQ(url->path, "/bucket/key", "path");
        ASSERT_EQ(url->query, "list-type=2", "query");
        ASSERT_TRUE(!net::ParsedUrl::parse("not a url").has_value(), "rejects garbage");
        PASS();
    }
    {
        TEST(headers_case_insensitive);
        net::HttpHeaders h;
        h.set("Content-Type", "application/json");
        ASSERT_EQ(h.get("content-type").value_or(""), "application/json", "lookup");
        h.set("Content-Length", "42");
        ASSERT_EQ(h.content_length().value_or(0), 42u, "content length");
        h.remove("CONTENT-TYPE");
        ASSERT_TRUE(!h.has("content-type"), "removed");
        PASS();
    }
    {
        TEST(retryable_statuses);
        ASSERT_TRUE(net::is_retryable_status(503), "503 retryable");
        ASSERT_TRUE(net::is_retryable_status(429), "429 retryable");
        ASSERT_TRUE(!net::is_retryable_status(404), "404 final");
        ASSERT_TRUE(net::is_success_status(204), "204 success");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 9. Metrics
// ---------------------------------------------------------------------------

static void test_metrics() {
    std::cout << "\n=== Metrics ===" << std::endl;

    auto pool = make_pool("chunkvault-metrics", 2);
    auto prom_path = pool.root / "chunkvault.prom";

    {
        TEST(engine_operations_exported);
        auto engine = make_engine(pool, 4);
        MetricsExporter exporter(prom_path, std::chrono::seconds(60), {{"instance", "test"}});
        exporter.set_engine(engine.get());
        engine->set_metrics(&exporter);
        exporter.start();

        auto id = upload_string(*engine, pattern(10), "m.bin");
        download_string(*engine, id);
        engine->remove_file("absent-file");

        exporter.stop();
        engine->set_metrics(nullptr);

        auto content = read_file(prom_path);
        ASSERT_TRUE(!content.empty(), ".prom file written");
        for (const char* name : {"chunkvault_uploads_total", "chunkvault_upload_bytes_total",
                                 "chunkvault_chunk_puts_total", "chunkvault_chunk_gets_total",
                                 "chunkvault_deletes_total", "chunkvault_files_total",
                                 "chunkvault_backends_configured",
                                 "chunkvault_download_duration_seconds"}) {
            ASSERT_TRUE(content.find(name) != std::string::npos, "should contain " << name);
        }
        ASSERT_TRUE(content.find("instance=\"test\"") != std::string::npos, "constant label");
        ASSERT_TRUE(content.find("result=\"absent\"") != std::string::npos, "delete outcome label");

        auto tmp_path = prom_path;
        tmp_path += ".tmp";
        ASSERT_TRUE(!fs::exists(tmp_path), ".tmp file should not persist");
        PASS();
    }
    {
        TEST(integrity_failure_counted);
        fs::remove(prom_path);
        auto engine = make_engine(pool, 4);
        MetricsExporter exporter(prom_path, std::chrono::seconds(60), {});
        engine->set_metrics(&exporter);
        exporter.start();
        auto id = upload_string(*engine, pattern(8), "bad.bin");
        auto chunk = engine->stat(id)->current_version().chunks[0];
        write_file(pool.dirs[chunk.backend_index] / chunk.remote_id, "ZZZZ");
        ASSERT_TRUE(throws<IntegrityError>([&] { download_string(*engine, id); }), "corrupt");
        exporter.stop();
        engine->set_metrics(nullptr);
        auto content = read_file(prom_path);
        ASSERT_TRUE(content.find("chunkvault_integrity_failures_total 1") != std::string::npos,
                    "integrity failure recorded");
        PASS();
    }
    {
        TEST(stop_without_start_writes_nothing);
        fs::remove(prom_path);
        MetricsExporter exporter(prom_path, std::chrono::seconds(60), {});
        exporter.stop();
        ASSERT_TRUE(!fs::exists(prom_path), "no snapshot from an idle exporter");
        PASS();
    }
    {
        TEST(engine_destroyed_before_exporter);
        fs::remove(prom_path);
        auto engine = make_engine(pool, 4);
        auto exporter = std::make_unique<MetricsExporter>(
            prom_path, std::chrono::seconds(60), std::map<std::string, std::string>{});
        exporter->set_engine(engine.get());
        engine->set_metrics(exporter.get());
        exporter->start();
        upload_string(*engine, pattern(6), "order.bin");
        exporter->stop();
        ASSERT_TRUE(fs::exists(prom_path), "final snapshot on stop");

        // Engine torn down first; the exporter must not call back into it
        fs::remove(prom_path);
        engine.reset();
        exporter.reset();
        ASSERT_TRUE(!fs::exists(prom_path), "destructor after stop() leaves the engine alone");
        PASS();
    }

    fs::remove_all(pool.root);
}

// ---------------------------------------------------------------------------
// Main
// ---------------------------------------------------------------------------

int main() {
    std::cout << "chunkvault test suite" << std::endl;
    std::cout << "=====================" << std::endl;

    test_placement();
    test_chunker();
    test_manifest_codec();
    test_manifest_stores();
    test_local_backend();
    test_engine_round_trip();
    test_engine_hello();
    test_engine_integrity();
    test_engine_versions();
    test_engine_cleanup();
    test_engine_delete();
    test_engine_commit();
    test_engine_listing();
    test_engine_configuration();
    test_config();
    test_http_helpers();
    test_metrics();

    std::cout << "\n=====================" << std::endl;
    std::cout << "Results: " << tests_passed << " passed, "
              << tests_failed << " failed" << std::endl;

    return tests_failed > 0 ? 1 : 0;
}
