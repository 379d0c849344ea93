#pragma once

#include <cstdint>
#include <istream>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <vector>

namespace chunkvault {

struct ChunkRecord;

/// Lower-case hex SHA-256 of data (64 characters).
std::string sha256_hex(std::span<const uint8_t> data);

/// One window of the input stream, hashed at read time.
struct Chunk {
    uint64_t index = 0;
    std::vector<uint8_t> data;
    std::string hash;
};

/// Splits a stream into sequential chunk_size windows; the last one may be
/// shorter. An empty stream yields exactly one zero-length chunk.
class ChunkSplitter {
public:
    /// Throws std::invalid_argument when chunk_size is zero.
    ChunkSplitter(std::istream& input, uint64_t chunk_size);

    /// Fill out with the next chunk. Returns false once the stream is
    /// exhausted. Throws std::runtime_error if the stream goes bad.
    bool next(Chunk& out);

    uint64_t chunks_read() const { return next_index_; }
    uint64_t bytes_read() const { return bytes_read_; }

private:
    std::istream& input_;
    uint64_t chunk_size_;
    uint64_t next_index_ = 0;
    uint64_t bytes_read_ = 0;
    bool done_ = false;
};

/// Verifies fetched chunks against their records and appends them to a sink
/// in strictly ascending index order.
class ChunkAssembler {
public:
    explicit ChunkAssembler(std::ostream& output);

    /// Throws IntegrityError on order, size or hash mismatch and
    /// std::runtime_error when the sink fails.
    void append(const ChunkRecord& record, std::span<const uint8_t> data);

    uint64_t bytes_written() const { return bytes_written_; }
    uint64_t chunks_written() const { return chunks_written_; }

private:
    std::ostream& output_;
    std::optional<uint64_t> last_index_;
    uint64_t bytes_written_ = 0;
    uint64_t chunks_written_ = 0;
};

}  // namespace chunkvault
