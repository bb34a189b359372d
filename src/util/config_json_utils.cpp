#include "util/config_json_utils.hpp"

#include <fstream>

namespace canister::config::detail {

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool ParseJsonObject(const std::string& text, nlohmann::json& out, std::string& err) {
    out = nlohmann::json::parse(text, nullptr, false);
    if (out.is_discarded()) {
        err = "invalid JSON";
        return false;
    }
    if (!out.is_object()) {
        err = "root must be JSON object";
        return false;
    }
    return true;
}

bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string()) {
        err = std::string(key) + " must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetU64IfPresent(const nlohmann::json& j, const char* key, std::uint64_t& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!(it->is_number_unsigned() || it->is_number_integer())) {
        err = std::string(key) + " must be an integer";
        return false;
    }
    auto v = it->get<long long>();
    if (v < 0) {
        err = std::string(key) + " must not be negative";
        return false;
    }
    out = static_cast<std::uint64_t>(v);
    return true;
}

} // namespace canister::config::detail
