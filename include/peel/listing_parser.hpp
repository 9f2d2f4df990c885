#pragma once

#include "peel/tool_registry.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace peel {

// Extracts entry names from a listing tool's stdout.
std::vector<std::string> ParseListing(ListingFormat format, std::string_view output);

} // namespace peel
