#include "mgmt/types.hpp"

namespace canister {

const char* ToString(InstallMode::Kind kind) {
    switch (kind) {
        case InstallMode::Kind::Install:   return "install";
        case InstallMode::Kind::Reinstall: return "reinstall";
        case InstallMode::Kind::Upgrade:   return "upgrade";
    }
    return "unknown";
}

std::expected<InstallMode, std::string> ParseInstallMode(std::string_view name) {
    if (name == "install") return InstallMode::Install();
    if (name == "reinstall") return InstallMode::Reinstall();
    if (name == "upgrade") return InstallMode::Upgrade();
    return std::unexpected("unknown install mode: " + std::string(name));
}

} // namespace canister
