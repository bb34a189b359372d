#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace canister {

// Reads a whole module image from `path`, or from stdin when `path` is "-".
Result LoadModuleImage(const std::string& path, std::vector<std::uint8_t>& out);

} // namespace canister
