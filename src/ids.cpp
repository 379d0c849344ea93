#include "chunkvault/ids.hpp"
#include "chunkvault/core/constants.hpp"

#include <openssl/rand.h>

#include <array>
#include <cctype>
#include <cstdint>
#include <stdexcept>

namespace chunkvault {

std::string generate_uuid() {
    std::array<uint8_t, 16> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed while generating an id");
    }

    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);  // version 4
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant

    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) out += '-';
        out += hex[bytes[i] >> 4];
        out += hex[bytes[i] & 0x0F];
    }
    return out;
}

bool is_valid_file_id(const std::string& file_id) {
    if (file_id.empty() || file_id.size() > constants::MAX_FILE_ID_LENGTH) return false;
    for (unsigned char c : file_id) {
        if (!std::isalnum(c) && c != '-' && c != '_') return false;
    }
    return true;
}

}  // namespace chunkvault
