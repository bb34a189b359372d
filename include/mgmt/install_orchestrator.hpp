#pragma once

#include "agent/principal.hpp"
#include "agent/transport.hpp"
#include "mgmt/chunk_store_client.hpp"
#include "mgmt/chunking.hpp"
#include "mgmt/install_progress.hpp"
#include "mgmt/types.hpp"
#include "util/cancel_token.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <cstdint>
#include <future>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace canister {

// What InstallAuto does with the chunk store once a chunked install has run.
enum class ChunkStoreCleanup {
    AfterSuccess,  // clear only when the install call succeeded
    Always,        // clear after every chunked run that reached the host
    Never,
};

const char* ToString(ChunkStoreCleanup cleanup);
std::optional<ChunkStoreCleanup> ParseChunkStoreCleanup(std::string_view name);

struct InstallOptions {
    ChunkingOptions chunking;
    std::size_t upload_parallelism = 1;
    ChunkStoreCleanup cleanup = ChunkStoreCleanup::AfterSuccess;

    // Store contents the caller already knows; skips the stored_chunks query.
    std::optional<RemoteChunkSet> known_chunks;

    CancelToken cancel;
    IInstallProgress* progress = nullptr;
};

struct InstallReport {
    InstallState state = InstallState::Planning;
    // Phase the run was in when it failed. Failing in Installing means the install call
    // may have taken effect; query the canister status before retrying.
    InstallState failed_at = InstallState::Planning;
    bool chunked = false;

    ChunkManifest manifest;
    ChunkDigest module_digest{};

    std::size_t chunks_uploaded = 0;
    std::size_t chunks_skipped = 0;

    bool cleanup_ran = false;
    Result cleanup;
};

// Drives one install against one target: planning, dedup-aware chunk upload and the
// terminal install call. Every error aborts the run; nothing is retried.
class InstallOrchestrator {
public:
    InstallOrchestrator(ITransport& transport, InstallOptions options);

    // Uploads the chunks the target does not hold yet, then installs the module they
    // form. The install call is only issued once every upload has been verified.
    Result InstallChunked(const Principal& target,
                          std::span<const Chunk> chunks,
                          const InstallMode& mode,
                          std::span<const std::uint8_t> init_arg,
                          InstallReport& report);

    // Picks one-shot or chunked installation by module size. A chunked install clears
    // the target's chunk store afterwards according to InstallOptions::cleanup, so do
    // not mix it with manual chunk uploads to the same canister.
    Result InstallAuto(const Principal& target,
                       std::span<const std::uint8_t> module,
                       const InstallMode& mode,
                       std::span<const std::uint8_t> init_arg,
                       InstallReport& report);

    // Runs InstallAuto on its own thread. The orchestrator, module and report must
    // outlive the returned future.
    std::future<Result> InstallAutoAsync(const Principal& target,
                                         std::span<const std::uint8_t> module,
                                         const InstallMode& mode,
                                         std::vector<std::uint8_t> init_arg,
                                         InstallReport& report);

    const InstallOptions& Options() const { return options_; }

private:
    struct UploadJob {
        std::size_t chunk_index;
        ChunkDigest digest;
    };

    Result UploadMissing(const Principal& target,
                         std::span<const Chunk> chunks,
                         const std::vector<UploadJob>& jobs,
                         std::size_t chunks_total,
                         InstallReport& report);

    Result IssueCall(const std::optional<CallDescriptor>& call, const char* what);
    Result ApplyCleanup(const Principal& target, bool install_ok, InstallReport& report);
    Result Fail(InstallReport& report, Result error);
    void Notify(const InstallProgressEvent& e);

    ITransport& transport_;
    InstallOptions options_;
    ChunkStoreClient chunk_store_;
};

} // namespace canister
