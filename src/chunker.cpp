#include "chunkvault/chunker.hpp"
#include "chunkvault/errors.hpp"
#include "chunkvault/manifest.hpp"

#include <openssl/evp.h>

#include <stdexcept>

namespace chunkvault {

std::string sha256_hex(std::span<const uint8_t> data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest(SHA-256) failed");
    }

    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        out += hex[digest[i] >> 4];
        out += hex[digest[i] & 0x0F];
    }
    return out;
}

// ============================================================================
// ChunkSplitter
// ============================================================================

ChunkSplitter::ChunkSplitter(std::istream& input, uint64_t chunk_size)
    : input_(input)
    , chunk_size_(chunk_size) {
    if (chunk_size_ == 0) {
        throw std::invalid_argument("chunk_size must be greater than zero");
    }
}

bool ChunkSplitter::next(Chunk& out) {
    if (done_) return false;

    out.index = next_index_;
    out.data.resize(chunk_size_);
    input_.read(reinterpret_cast<char*>(out.data.data()),
                static_cast<std::streamsize>(chunk_size_));
    auto got = static_cast<uint64_t>(input_.gcount());

    if (input_.bad()) {
        throw std::runtime_error("Read error on input stream at chunk " +
                                 std::to_string(next_index_));
    }
    out.data.resize(got);

    if (got == 0 && next_index_ > 0) {
        done_ = true;
        return false;
    }

    if (got < chunk_size_ || input_.peek() == std::char_traits<char>::eof()) {
        done_ = true;
    }
    if (input_.bad()) {
        throw std::runtime_error("Read error on input stream at chunk " +
                                 std::to_string(next_index_));
    }

    out.hash = sha256_hex(out.data);
    bytes_read_ += got;
    ++next_index_;
    return true;
}

// ============================================================================
// ChunkAssembler
// ============================================================================

ChunkAssembler::ChunkAssembler(std::ostream& output) : output_(output) {}

void ChunkAssembler::append(const ChunkRecord& record, std::span<const uint8_t> data) {
    uint64_t expected_index = last_index_ ? *last_index_ + 1 : 0;
    if (record.chunk_index != expected_index) {
        throw IntegrityError(record.chunk_index,
                             std::to_string(expected_index),
                             std::to_string(record.chunk_index),
                             "Chunk " + std::to_string(record.chunk_index) +
                             " out of order: expected index " + std::to_string(expected_index));
    }

    if (data.size() != record.size_bytes) {
        throw IntegrityError(record.chunk_index,
                             std::to_string(record.size_bytes),
                             std::to_string(data.size()),
                             "Chunk " + std::to_string(record.chunk_index) +
                             " size mismatch: expected " + std::to_string(record.size_bytes) +
                             " bytes, got " + std::to_string(data.size()));
    }

    std::string actual = sha256_hex(data);
    if (actual != record.content_hash) {
        throw IntegrityError(record.chunk_index, record.content_hash, actual,
                             "Chunk " + std::to_string(record.chunk_index) +
                             " hash mismatch: expected " + record.content_hash +
                             ", got " + actual);
    }

    output_.write(reinterpret_cast<const char*>(data.data()),
                  static_cast<std::streamsize>(data.size()));
    if (!output_) {
        throw std::runtime_error("Failed to write chunk " +
                                 std::to_string(record.chunk_index) + " to output");
    }

    last_index_ = record.chunk_index;
    bytes_written_ += data.size();
    ++chunks_written_;
}

}  // namespace chunkvault
