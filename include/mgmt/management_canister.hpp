#pragma once

#include "agent/call.hpp"
#include "agent/principal.hpp"
#include "mgmt/types.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace canister {

// Management canister methods used for code installation.
enum class MgmtMethod {
    InstallCode,
    UploadChunk,
    ClearChunkStore,
    StoredChunks,
    InstallChunkedCode,
};

// Wire name, e.g. "install_chunked_code".
std::string_view MethodName(MgmtMethod method);
std::optional<MgmtMethod> ParseMethodName(std::string_view name);

// Builds descriptors for calls to the management canister. Every call is routed by the
// canister it acts on; nothing here performs I/O.
class ManagementCanister {
public:
    static Result UploadChunk(const Principal& canister_id,
                              std::span<const std::uint8_t> chunk,
                              std::optional<CallDescriptor>& out);

    static Result StoredChunks(const Principal& canister_id, std::optional<CallDescriptor>& out);

    static Result ClearChunkStore(const Principal& canister_id,
                                  std::optional<CallDescriptor>& out);

    static Result InstallCode(const Principal& canister_id,
                              const InstallMode& mode,
                              std::span<const std::uint8_t> wasm_module,
                              std::span<const std::uint8_t> init_arg,
                              std::optional<CallDescriptor>& out);

    static Result InstallChunkedCode(const Principal& canister_id,
                                     const InstallMode& mode,
                                     const ChunkManifest& manifest,
                                     const ChunkDigest& module_digest,
                                     std::span<const std::uint8_t> init_arg,
                                     std::optional<CallDescriptor>& out);

    static Result ValidateTarget(const Principal& canister_id);
};

} // namespace canister
