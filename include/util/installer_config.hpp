#pragma once

#include "mgmt/chunking.hpp"
#include "mgmt/install_orchestrator.hpp"
#include "util/logger.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace canister {

// Installer settings read from a JSON object. Every key is optional:
//
//   MaxChunkSize       1 .. 1 MiB
//   OneShotThreshold   module size up to which install_code is used
//   UploadParallelism  >= 1
//   ChunkStoreCleanup  "after-success" | "always" | "never"
//   LogLevel           "debug" | "info" | "warn" | "error" | "none"
struct InstallerConfig {
    std::uint64_t max_chunk_size = kMaxChunkBytes;
    std::uint64_t one_shot_threshold = kDefaultOneShotThreshold;
    std::uint64_t upload_parallelism = 1;
    ChunkStoreCleanup cleanup = ChunkStoreCleanup::AfterSuccess;
    std::optional<LogLevel> log_level;

    static Result LoadFromFile(const std::string& path, InstallerConfig& out);
    static Result Parse(const std::string& json_text, InstallerConfig& out);

    void ApplyTo(InstallOptions& options) const;
};

} // namespace canister
