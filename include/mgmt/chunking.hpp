#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <span>
#include <variant>
#include <vector>

namespace canister {

// Largest chunk the host's chunk store accepts.
inline constexpr std::uint64_t kMaxChunkBytes = 1024 * 1024ULL;

// 2 MiB ingress message ceiling minus room for the rest of the call.
inline constexpr std::uint64_t kDefaultOneShotThreshold = (185ULL * 1024 * 1024) / 100;

using Chunk = std::span<const std::uint8_t>;

struct ChunkingOptions {
    std::uint64_t max_chunk_size = kMaxChunkBytes;
    // Modules no larger than this go out in a single install_code call.
    std::uint64_t threshold = kDefaultOneShotThreshold;
};

struct OneShotPlan {
    std::span<const std::uint8_t> module;
};

struct ChunkedPlan {
    // Views into the module, in module byte order.
    std::vector<Chunk> chunks;
};

using InstallPlan = std::variant<OneShotPlan, ChunkedPlan>;

// Fixed windows of max_chunk_size; the last chunk takes the remainder. An empty
// module yields a single empty chunk.
Result SplitIntoChunks(std::span<const std::uint8_t> module,
                       std::uint64_t max_chunk_size,
                       std::vector<Chunk>& out);

Result PlanInstall(std::span<const std::uint8_t> module,
                   const ChunkingOptions& options,
                   InstallPlan& out);

} // namespace canister
