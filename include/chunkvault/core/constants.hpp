#pragma once

#include <cstddef>
#include <cstdint>

namespace chunkvault::constants {

// Chunking
constexpr uint64_t DEFAULT_CHUNK_SIZE = 5 * 1024 * 1024;  // 5MB

// Manifest store
constexpr const char* DEFAULT_METADATA_DIR = "metadata";
constexpr const char* DEFAULT_MANIFEST_STORE = "json";
constexpr const char* SQLITE_MANIFEST_FILE = "manifests.db";
constexpr int MANIFEST_SCHEMA_VERSION = 2;
constexpr size_t MAX_FILE_ID_LENGTH = 128;

// Engine
constexpr size_t MANIFEST_LOCK_STRIPES = 64;
constexpr int MAX_MANIFEST_COMMIT_ATTEMPTS = 5;

// HTTP defaults for remote backends
constexpr uint32_t DEFAULT_HTTP_CONNECT_TIMEOUT_SECONDS = 10;
constexpr uint32_t DEFAULT_HTTP_REQUEST_TIMEOUT_SECONDS = 60;
constexpr uint32_t DEFAULT_BACKEND_MAX_RETRIES = 3;

// Metrics
constexpr size_t DEFAULT_METRICS_INTERVAL_SECONDS = 15;

// Environment
constexpr const char* ENCRYPTION_KEY_ENV = "CHUNKVAULT_ENCRYPTION_KEY";
constexpr const char* DROPBOX_TOKEN_ENV = "DROPBOX_ACCESS_TOKEN";
constexpr const char* STORAGE_SHARDS_ENV = "CHUNKVAULT_STORAGE_SHARDS";

}  // namespace chunkvault::constants
