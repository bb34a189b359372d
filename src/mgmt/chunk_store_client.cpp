#include "mgmt/chunk_store_client.hpp"

#include "mgmt/arg_codec.hpp"
#include "mgmt/management_canister.hpp"
#include "util/logger.hpp"

#include <optional>
#include <stdexcept>
#include <vector>

namespace canister {

ChunkStoreClient::ChunkStoreClient(ITransport& transport, std::uint64_t max_chunk_size)
    : transport_(transport), max_chunk_size_(max_chunk_size) {}

Result ChunkStoreClient::UploadChunk(const Principal& target,
                                     std::span<const std::uint8_t> chunk,
                                     ChunkDigest& out_digest) {
    ChunkDigest expected{};
    try {
        expected = Sha256Digest(chunk);
    } catch (const std::exception& e) {
        return Result::Fail(ErrorKind::Validation, std::string("upload_chunk: ") + e.what());
    }
    return UploadChunk(target, chunk, expected, out_digest);
}

Result ChunkStoreClient::UploadChunk(const Principal& target,
                                     std::span<const std::uint8_t> chunk,
                                     const ChunkDigest& expected,
                                     ChunkDigest& out_digest) {
    if (chunk.size() > max_chunk_size_) {
        return Result::Fail(ErrorKind::Validation,
                            "chunk of " + std::to_string(chunk.size()) +
                                " bytes exceeds maximum chunk size " +
                                std::to_string(max_chunk_size_));
    }

    std::optional<CallDescriptor> call;
    auto br = ManagementCanister::UploadChunk(target, chunk, call);
    if (!br.is_ok())
        return br;

    std::vector<std::uint8_t> reply;
    auto cr = transport_.Call(*call, reply);
    if (!cr.is_ok())
        return Wrap(cr, "upload_chunk");

    ChunkDigest reported{};
    auto dr = DecodeUploadChunkReply(reply, reported);
    if (!dr.is_ok())
        return dr;

    if (reported != expected) {
        return Result::Fail(ErrorKind::Validation,
                            "upload_chunk: host reported digest " + DigestToHex(reported) +
                                ", expected " + DigestToHex(expected));
    }

    LogDebug("uploaded chunk %s (%zu bytes) to %s",
             DigestToHex(expected).c_str(),
             chunk.size(),
             target.ToText().c_str());
    out_digest = reported;
    return Result::Ok();
}

Result ChunkStoreClient::StoredChunks(const Principal& target, RemoteChunkSet& out) {
    std::optional<CallDescriptor> call;
    auto br = ManagementCanister::StoredChunks(target, call);
    if (!br.is_ok())
        return br;

    std::vector<std::uint8_t> reply;
    auto cr = transport_.Call(*call, reply);
    if (!cr.is_ok())
        return Wrap(cr, "stored_chunks");

    return DecodeStoredChunksReply(reply, out);
}

Result ChunkStoreClient::ClearChunkStore(const Principal& target) {
    std::optional<CallDescriptor> call;
    auto br = ManagementCanister::ClearChunkStore(target, call);
    if (!br.is_ok())
        return br;

    std::vector<std::uint8_t> reply;
    auto cr = transport_.Call(*call, reply);
    if (!cr.is_ok())
        return Wrap(cr, "clear_chunk_store");

    auto dr = DecodeEmptyReply(reply);
    if (!dr.is_ok())
        return Wrap(dr, "clear_chunk_store");

    LogDebug("cleared chunk store of %s", target.ToText().c_str());
    return Result::Ok();
}

} // namespace canister
