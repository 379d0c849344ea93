#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace chunkvault {

/// Decides which backend receives each chunk of an upload.
class PlacementStrategy {
public:
    virtual ~PlacementStrategy() = default;

    virtual std::string name() const = 0;

    /// Number of backends this strategy places over.
    virtual size_t backend_count() const = 0;

    /// Backend index in [0, backend_count()) for the given chunk.
    virtual size_t next_backend(uint64_t chunk_index) const = 0;
};

/// chunk_index mod N. Stateless, so concurrent uploads place identically.
class RoundRobinPlacement : public PlacementStrategy {
public:
    /// Throws ConfigurationError when backend_count is zero.
    explicit RoundRobinPlacement(size_t backend_count);

    std::string name() const override { return "round_robin"; }
    size_t backend_count() const override { return backend_count_; }
    size_t next_backend(uint64_t chunk_index) const override;

private:
    size_t backend_count_;
};

}  // namespace chunkvault
