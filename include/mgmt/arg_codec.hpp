#pragma once

#include "agent/principal.hpp"
#include "mgmt/types.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace canister {

// Argument and reply encoding of the management canister methods. Arguments are CBOR
// maps; byte fields are CBOR byte strings.

std::vector<std::uint8_t> EncodeCanisterIdArg(const Principal& canister_id);

std::vector<std::uint8_t> EncodeUploadChunkArg(const Principal& canister_id,
                                               std::span<const std::uint8_t> chunk);

std::vector<std::uint8_t> EncodeInstallCodeArg(const InstallMode& mode,
                                               const Principal& canister_id,
                                               std::span<const std::uint8_t> wasm_module,
                                               std::span<const std::uint8_t> init_arg);

std::vector<std::uint8_t> EncodeInstallChunkedCodeArg(const InstallMode& mode,
                                                      const Principal& target_canister,
                                                      const ChunkManifest& chunk_hashes,
                                                      const ChunkDigest& wasm_module_hash,
                                                      std::span<const std::uint8_t> init_arg);

// Decoders return ErrorKind::Protocol when the reply does not match its schema.
Result DecodeUploadChunkReply(std::span<const std::uint8_t> reply, ChunkDigest& out);
Result DecodeStoredChunksReply(std::span<const std::uint8_t> reply, RemoteChunkSet& out);
Result DecodeEmptyReply(std::span<const std::uint8_t> reply);

} // namespace canister
