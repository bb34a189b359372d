#include "mgmt/arg_codec.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <string>

namespace canister {

using json = nlohmann::json;

namespace {

json Blob(std::span<const std::uint8_t> bytes) {
    return json::binary(std::vector<std::uint8_t>(bytes.begin(), bytes.end()));
}

json ModeToJson(const InstallMode& mode) {
    json j = json::object();
    if (mode.kind == InstallMode::Kind::Upgrade && mode.skip_pre_upgrade.has_value()) {
        j[ToString(mode.kind)] = json{{"skip_pre_upgrade", *mode.skip_pre_upgrade}};
    } else {
        j[ToString(mode.kind)] = nullptr;
    }
    return j;
}

Result ParseReply(std::span<const std::uint8_t> reply, json& out) {
    out = json::from_cbor(reply.begin(), reply.end(), true, false);
    if (out.is_discarded())
        return Result::Fail(ErrorKind::Protocol, "reply is not valid CBOR");
    return Result::Ok();
}

Result DigestFromBlob(const json& j, ChunkDigest& out) {
    if (!j.is_binary())
        return Result::Fail(ErrorKind::Protocol, "hash is not a byte string");
    const auto& bytes = j.get_binary();
    if (bytes.size() != out.size()) {
        return Result::Fail(ErrorKind::Protocol,
                            "hash has " + std::to_string(bytes.size()) + " bytes, expected " +
                                std::to_string(out.size()));
    }
    std::copy(bytes.begin(), bytes.end(), out.begin());
    return Result::Ok();
}

Result HashFromRecord(const json& record, ChunkDigest& out) {
    if (!record.is_object())
        return Result::Fail(ErrorKind::Protocol, "chunk hash record is not a map");
    auto it = record.find("hash");
    if (it == record.end())
        return Result::Fail(ErrorKind::Protocol, "chunk hash record has no 'hash' field");
    return DigestFromBlob(*it, out);
}

} // namespace

std::vector<std::uint8_t> EncodeCanisterIdArg(const Principal& canister_id) {
    const json j = {{"canister_id", Blob(canister_id.Bytes())}};
    return json::to_cbor(j);
}

std::vector<std::uint8_t> EncodeUploadChunkArg(const Principal& canister_id,
                                               std::span<const std::uint8_t> chunk) {
    const json j = {
        {"canister_id", Blob(canister_id.Bytes())},
        {"chunk", Blob(chunk)},
    };
    return json::to_cbor(j);
}

std::vector<std::uint8_t> EncodeInstallCodeArg(const InstallMode& mode,
                                               const Principal& canister_id,
                                               std::span<const std::uint8_t> wasm_module,
                                               std::span<const std::uint8_t> init_arg) {
    const json j = {
        {"mode", ModeToJson(mode)},
        {"canister_id", Blob(canister_id.Bytes())},
        {"wasm_module", Blob(wasm_module)},
        {"arg", Blob(init_arg)},
    };
    return json::to_cbor(j);
}

std::vector<std::uint8_t> EncodeInstallChunkedCodeArg(const InstallMode& mode,
                                                      const Principal& target_canister,
                                                      const ChunkManifest& chunk_hashes,
                                                      const ChunkDigest& wasm_module_hash,
                                                      std::span<const std::uint8_t> init_arg) {
    json hashes = json::array();
    for (const auto& digest : chunk_hashes) {
        hashes.push_back(json{{"hash", Blob(digest)}});
    }
    const json j = {
        {"mode", ModeToJson(mode)},
        {"target_canister", Blob(target_canister.Bytes())},
        {"chunk_hashes_list", std::move(hashes)},
        {"wasm_module_hash", Blob(wasm_module_hash)},
        {"arg", Blob(init_arg)},
    };
    return json::to_cbor(j);
}

Result DecodeUploadChunkReply(std::span<const std::uint8_t> reply, ChunkDigest& out) {
    json j;
    auto pr = ParseReply(reply, j);
    if (!pr.is_ok())
        return Wrap(pr, "upload_chunk");
    auto hr = HashFromRecord(j, out);
    if (!hr.is_ok())
        return Wrap(hr, "upload_chunk");
    return Result::Ok();
}

Result DecodeStoredChunksReply(std::span<const std::uint8_t> reply, RemoteChunkSet& out) {
    out.clear();
    json j;
    auto pr = ParseReply(reply, j);
    if (!pr.is_ok())
        return Wrap(pr, "stored_chunks");
    if (!j.is_array())
        return Result::Fail(ErrorKind::Protocol, "stored_chunks: reply is not an array");

    for (const auto& record : j) {
        ChunkDigest digest{};
        auto hr = HashFromRecord(record, digest);
        if (!hr.is_ok())
            return Wrap(hr, "stored_chunks");
        out.insert(digest);
    }
    return Result::Ok();
}

Result DecodeEmptyReply(std::span<const std::uint8_t> reply) {
    if (reply.empty())
        return Result::Ok();
    json j;
    auto pr = ParseReply(reply, j);
    if (!pr.is_ok())
        return pr;
    if (!j.is_null())
        return Result::Fail(ErrorKind::Protocol,
                            std::string("expected empty reply, got ") + j.type_name());
    return Result::Ok();
}

} // namespace canister
