#pragma once

#include <string>

namespace chunkvault {

/// Random RFC 4122 version 4 UUID in canonical lower-case form.
/// Throws std::runtime_error if the OpenSSL RNG fails.
std::string generate_uuid();

/// File ids are used as store keys and object-name prefixes, so they are
/// restricted to [A-Za-z0-9_-] and a bounded length.
bool is_valid_file_id(const std::string& file_id);

}  // namespace chunkvault
