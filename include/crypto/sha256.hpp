#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace canister {

inline constexpr std::size_t kDigestSize = 32;

// SHA-256 of one chunk or of a whole module.
using ChunkDigest = std::array<std::uint8_t, kDigestSize>;

ChunkDigest Sha256Digest(std::span<const std::uint8_t> data);

std::string DigestToHex(const ChunkDigest& digest);
std::expected<ChunkDigest, std::string> DigestFromHex(std::string_view hex);

class Sha256Hasher {
public:
    Sha256Hasher();
    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;
    Sha256Hasher(Sha256Hasher&&) noexcept;
    Sha256Hasher& operator=(Sha256Hasher&&) noexcept;
    ~Sha256Hasher();

    void Update(std::span<const std::uint8_t> data);

    // Throws std::runtime_error if the digest context failed; the hasher is spent afterwards.
    ChunkDigest Final();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace canister
