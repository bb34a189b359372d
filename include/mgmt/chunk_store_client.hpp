#pragma once

#include "agent/principal.hpp"
#include "agent/transport.hpp"
#include "mgmt/types.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <span>

namespace canister {

// One round trip per operation against a canister's chunk store.
class ChunkStoreClient {
public:
    ChunkStoreClient(ITransport& transport, std::uint64_t max_chunk_size);

    // Idempotent. The digest reported by the host must equal the local one; a
    // mismatch is a validation error and the chunk must not be referenced.
    Result UploadChunk(const Principal& target,
                       std::span<const std::uint8_t> chunk,
                       ChunkDigest& out_digest);

    // Same as above for a chunk whose digest the caller already computed.
    Result UploadChunk(const Principal& target,
                       std::span<const std::uint8_t> chunk,
                       const ChunkDigest& expected,
                       ChunkDigest& out_digest);

    Result StoredChunks(const Principal& target, RemoteChunkSet& out);

    // Destructive: invalidates every digest a pending install might still reference.
    Result ClearChunkStore(const Principal& target);

    std::uint64_t MaxChunkSize() const { return max_chunk_size_; }

private:
    ITransport& transport_;
    std::uint64_t max_chunk_size_;
};

} // namespace canister
