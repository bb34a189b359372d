#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace canister::config::detail {

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err);
bool ParseJsonObject(const std::string& text, nlohmann::json& out, std::string& err);

// Lookups leave `out` untouched when the key is absent. They fail, setting `err`,
// when the key is present with the wrong type.
bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out, std::string& err);
bool GetU64IfPresent(const nlohmann::json& j, const char* key, std::uint64_t& out, std::string& err);

} // namespace canister::config::detail
