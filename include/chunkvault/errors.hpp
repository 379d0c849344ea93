#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace chunkvault {

/// Base class for all errors raised by the chunk engine.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Invalid engine setup: no backends, bad placement, bad options.
class ConfigurationError : public Error {
public:
    using Error::Error;
};

/// A manifest, a chunk or a source file does not exist.
class NotFoundError : public Error {
public:
    using Error::Error;
};

/// A persisted manifest could not be parsed, migrated or validated.
class ManifestFormatError : public Error {
public:
    using Error::Error;
};

/// A manifest kept changing underneath a read-modify-write.
class ConflictError : public Error {
public:
    using Error::Error;
};

/// Reassembled chunk does not match its recorded size or SHA-256.
class IntegrityError : public Error {
public:
    IntegrityError(uint64_t chunk_index, std::string expected, std::string actual,
                   const std::string& message)
        : Error(message)
        , chunk_index_(chunk_index)
        , expected_(std::move(expected))
        , actual_(std::move(actual)) {}

    uint64_t chunk_index() const { return chunk_index_; }
    const std::string& expected() const { return expected_; }
    const std::string& actual() const { return actual_; }

private:
    uint64_t chunk_index_;
    std::string expected_;
    std::string actual_;
};

/// A storage backend failed to put, get or delete a chunk.
class BackendError : public Error {
public:
    BackendError(size_t backend_index, std::optional<uint64_t> chunk_index,
                 const std::string& message)
        : Error(message)
        , backend_index_(backend_index)
        , chunk_index_(chunk_index) {}

    size_t backend_index() const { return backend_index_; }
    std::optional<uint64_t> chunk_index() const { return chunk_index_; }

private:
    size_t backend_index_;
    std::optional<uint64_t> chunk_index_;
};

}  // namespace chunkvault
