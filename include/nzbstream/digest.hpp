#pragma once

#include <string>

namespace nzbstream {

// Lowercase hex SHA-256; empty on digest failure.
std::string sha256Hex(const std::string& data);

} // namespace nzbstream
