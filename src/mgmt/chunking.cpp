#include "mgmt/chunking.hpp"

#include <algorithm>
#include <string>

namespace canister {

Result SplitIntoChunks(std::span<const std::uint8_t> module,
                       std::uint64_t max_chunk_size,
                       std::vector<Chunk>& out) {
    out.clear();
    if (max_chunk_size == 0)
        return Result::Fail(ErrorKind::Validation, "max chunk size must be positive");

    if (module.empty()) {
        out.push_back(module);
        return Result::Ok();
    }

    out.reserve(static_cast<size_t>((module.size() + max_chunk_size - 1) / max_chunk_size));
    size_t offset = 0;
    while (offset < module.size()) {
        const size_t n = static_cast<size_t>(
            std::min<std::uint64_t>(max_chunk_size, module.size() - offset));
        out.push_back(module.subspan(offset, n));
        offset += n;
    }
    return Result::Ok();
}

Result PlanInstall(std::span<const std::uint8_t> module,
                   const ChunkingOptions& options,
                   InstallPlan& out) {
    if (options.max_chunk_size == 0)
        return Result::Fail(ErrorKind::Validation, "max chunk size must be positive");

    if (module.size() <= options.threshold) {
        out = OneShotPlan{module};
        return Result::Ok();
    }

    ChunkedPlan plan;
    auto sr = SplitIntoChunks(module, options.max_chunk_size, plan.chunks);
    if (!sr.is_ok())
        return sr;
    out = std::move(plan);
    return Result::Ok();
}

} // namespace canister
