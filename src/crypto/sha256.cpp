#include "crypto/sha256.hpp"

#include <openssl/evp.h>

#include <stdexcept>

namespace canister {

namespace {

class EvpCtx final {
public:
    EvpCtx() : ctx_(EVP_MD_CTX_new()) {}
    EvpCtx(const EvpCtx&) = delete;
    EvpCtx& operator=(const EvpCtx&) = delete;
    ~EvpCtx() {
        if (ctx_) EVP_MD_CTX_free(ctx_);
    }

    EVP_MD_CTX* get() const { return ctx_; }
    bool ok() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_ = nullptr;
};

bool InitSha256(EvpCtx& ctx) {
    return ctx.ok() && EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) == 1;
}

bool UpdateSha256(EvpCtx& ctx, std::span<const std::uint8_t> data) {
    if (data.empty()) return true;
    return EVP_DigestUpdate(ctx.get(), data.data(), data.size()) == 1;
}

bool FinalSha256(EvpCtx& ctx, ChunkDigest& out) {
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1) return false;
    return len == out.size();
}

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

struct Sha256Hasher::Impl {
    EvpCtx ctx;
    bool initialized = false;
    bool failed = false;
    bool finalized = false;
};

Sha256Hasher::Sha256Hasher() : impl_(std::make_unique<Impl>()) {
    impl_->initialized = InitSha256(impl_->ctx);
}

Sha256Hasher::Sha256Hasher(Sha256Hasher&&) noexcept = default;
Sha256Hasher& Sha256Hasher::operator=(Sha256Hasher&&) noexcept = default;
Sha256Hasher::~Sha256Hasher() = default;

void Sha256Hasher::Update(std::span<const std::uint8_t> data) {
    if (!impl_ || !impl_->initialized || impl_->failed || impl_->finalized) return;
    if (!UpdateSha256(impl_->ctx, data)) {
        impl_->failed = true;
    }
}

ChunkDigest Sha256Hasher::Final() {
    if (!impl_ || !impl_->initialized || impl_->failed || impl_->finalized)
        throw std::runtime_error("sha256 context unusable");
    impl_->finalized = true;
    ChunkDigest digest{};
    if (!FinalSha256(impl_->ctx, digest))
        throw std::runtime_error("sha256 finalize failed");
    return digest;
}

ChunkDigest Sha256Digest(std::span<const std::uint8_t> data) {
    Sha256Hasher hasher;
    hasher.Update(data);
    return hasher.Final();
}

std::string DigestToHex(const ChunkDigest& digest) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(digest.size() * 2);
    for (size_t i = 0; i < digest.size(); ++i) {
        out[i * 2] = kHex[(digest[i] >> 4) & 0xF];
        out[i * 2 + 1] = kHex[digest[i] & 0xF];
    }
    return out;
}

std::expected<ChunkDigest, std::string> DigestFromHex(std::string_view hex) {
    if (hex.size() != kDigestSize * 2) {
        return std::unexpected("digest must be " + std::to_string(kDigestSize * 2) +
                               " hex characters, got " + std::to_string(hex.size()));
    }
    ChunkDigest out{};
    for (size_t i = 0; i < out.size(); ++i) {
        const int hi = HexValue(hex[i * 2]);
        const int lo = HexValue(hex[i * 2 + 1]);
        if (hi < 0 || lo < 0)
            return std::unexpected("invalid hex character at offset " + std::to_string(i * 2));
        out[i] = static_cast<std::uint8_t>((hi << 4) | lo);
    }
    return out;
}

} // namespace canister
