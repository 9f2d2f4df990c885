#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <string>

namespace peel {

// Lowercase hex SHA-256 of everything `reader` yields; empty on failure.
std::string Sha256Hex(IReader& reader);
Result Sha256HexFile(const std::string& path, std::string& out_hex);

} // namespace peel
