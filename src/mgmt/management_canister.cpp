#include "mgmt/management_canister.hpp"

#include "mgmt/arg_codec.hpp"

#include <array>
#include <utility>

namespace canister {

namespace {

constexpr std::array<std::pair<MgmtMethod, std::string_view>, 5> kMethodNames{{
    {MgmtMethod::InstallCode, "install_code"},
    {MgmtMethod::UploadChunk, "upload_chunk"},
    {MgmtMethod::ClearChunkStore, "clear_chunk_store"},
    {MgmtMethod::StoredChunks, "stored_chunks"},
    {MgmtMethod::InstallChunkedCode, "install_chunked_code"},
}};

Result BuildCall(MgmtMethod method,
                 const Principal& canister_id,
                 std::vector<std::uint8_t> arg,
                 std::optional<CallDescriptor>& out) {
    return CallBuilder(Principal::ManagementCanister(), std::string(MethodName(method)))
        .WithArg(std::move(arg))
        .WithEffectiveCanisterId(canister_id)
        .Build(out);
}

} // namespace

std::string_view MethodName(MgmtMethod method) {
    for (const auto& [m, name] : kMethodNames) {
        if (m == method) return name;
    }
    return {};
}

std::optional<MgmtMethod> ParseMethodName(std::string_view name) {
    for (const auto& [m, n] : kMethodNames) {
        if (n == name) return m;
    }
    return std::nullopt;
}

Result ManagementCanister::ValidateTarget(const Principal& canister_id) {
    if (canister_id.IsEmpty())
        return Result::Fail(ErrorKind::Validation, "target canister id is empty");
    return Result::Ok();
}

Result ManagementCanister::UploadChunk(const Principal& canister_id,
                                       std::span<const std::uint8_t> chunk,
                                       std::optional<CallDescriptor>& out) {
    auto vr = ValidateTarget(canister_id);
    if (!vr.is_ok())
        return vr;
    return BuildCall(MgmtMethod::UploadChunk,
                     canister_id,
                     EncodeUploadChunkArg(canister_id, chunk),
                     out);
}

Result ManagementCanister::StoredChunks(const Principal& canister_id,
                                        std::optional<CallDescriptor>& out) {
    auto vr = ValidateTarget(canister_id);
    if (!vr.is_ok())
        return vr;
    return BuildCall(MgmtMethod::StoredChunks, canister_id, EncodeCanisterIdArg(canister_id), out);
}

Result ManagementCanister::ClearChunkStore(const Principal& canister_id,
                                           std::optional<CallDescriptor>& out) {
    auto vr = ValidateTarget(canister_id);
    if (!vr.is_ok())
        return vr;
    return BuildCall(
        MgmtMethod::ClearChunkStore, canister_id, EncodeCanisterIdArg(canister_id), out);
}

Result ManagementCanister::InstallCode(const Principal& canister_id,
                                       const InstallMode& mode,
                                       std::span<const std::uint8_t> wasm_module,
                                       std::span<const std::uint8_t> init_arg,
                                       std::optional<CallDescriptor>& out) {
    auto vr = ValidateTarget(canister_id);
    if (!vr.is_ok())
        return vr;
    return BuildCall(MgmtMethod::InstallCode,
                     canister_id,
                     EncodeInstallCodeArg(mode, canister_id, wasm_module, init_arg),
                     out);
}

Result ManagementCanister::InstallChunkedCode(const Principal& canister_id,
                                              const InstallMode& mode,
                                              const ChunkManifest& manifest,
                                              const ChunkDigest& module_digest,
                                              std::span<const std::uint8_t> init_arg,
                                              std::optional<CallDescriptor>& out) {
    auto vr = ValidateTarget(canister_id);
    if (!vr.is_ok())
        return vr;
    if (manifest.empty())
        return Result::Fail(ErrorKind::Validation, "chunk manifest is empty");
    return BuildCall(
        MgmtMethod::InstallChunkedCode,
        canister_id,
        EncodeInstallChunkedCodeArg(mode, canister_id, manifest, module_digest, init_arg),
        out);
}

} // namespace canister
