#pragma once

#include "crypto/sha256.hpp"

#include <expected>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace canister {

// Passed to the host unchanged; never interpreted locally.
struct InstallMode {
    enum class Kind { Install, Reinstall, Upgrade };

    Kind kind = Kind::Install;
    // Only meaningful for upgrades.
    std::optional<bool> skip_pre_upgrade;

    static InstallMode Install() { return {Kind::Install, std::nullopt}; }
    static InstallMode Reinstall() { return {Kind::Reinstall, std::nullopt}; }
    static InstallMode Upgrade(std::optional<bool> skip_pre_upgrade = std::nullopt) {
        return {Kind::Upgrade, skip_pre_upgrade};
    }
};

const char* ToString(InstallMode::Kind kind);
std::expected<InstallMode, std::string> ParseInstallMode(std::string_view name);

// Ordered chunk digests; duplicates are kept at every position they occur.
using ChunkManifest = std::vector<ChunkDigest>;

// Digests currently held by a canister's chunk store.
using RemoteChunkSet = std::set<ChunkDigest>;

} // namespace canister
