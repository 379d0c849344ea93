#include "chunkvault/placement.hpp"
#include "chunkvault/errors.hpp"

namespace chunkvault {

RoundRobinPlacement::RoundRobinPlacement(size_t backend_count)
    : backend_count_(backend_count) {
    if (backend_count_ == 0) {
        throw ConfigurationError("Round-robin placement needs at least one backend");
    }
}

size_t RoundRobinPlacement::next_backend(uint64_t chunk_index) const {
    return static_cast<size_t>(chunk_index % backend_count_);
}

}  // namespace chunkvault
