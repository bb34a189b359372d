#include "agent/principal.hpp"

#include <zlib.h>

#include <array>

namespace canister {

namespace {

constexpr char kBase32Alphabet[] = "abcdefghijklmnopqrstuvwxyz234567";

std::array<std::uint8_t, 4> Crc32BigEndian(std::span<const std::uint8_t> bytes) {
    uLong crc = crc32(0L, Z_NULL, 0);
    if (!bytes.empty()) {
        crc = crc32(crc, bytes.data(), static_cast<uInt>(bytes.size()));
    }
    return {static_cast<std::uint8_t>((crc >> 24) & 0xFF),
            static_cast<std::uint8_t>((crc >> 16) & 0xFF),
            static_cast<std::uint8_t>((crc >> 8) & 0xFF),
            static_cast<std::uint8_t>(crc & 0xFF)};
}

std::string Base32Encode(std::span<const std::uint8_t> data) {
    std::string out;
    std::uint32_t buffer = 0;
    int bits = 0;
    for (std::uint8_t b : data) {
        buffer = (buffer << 8) | b;
        bits += 8;
        while (bits >= 5) {
            out.push_back(kBase32Alphabet[(buffer >> (bits - 5)) & 0x1F]);
            bits -= 5;
        }
    }
    if (bits > 0) {
        out.push_back(kBase32Alphabet[(buffer << (5 - bits)) & 0x1F]);
    }
    return out;
}

std::expected<std::vector<std::uint8_t>, std::string> Base32Decode(std::string_view text) {
    std::vector<std::uint8_t> out;
    std::uint32_t buffer = 0;
    int bits = 0;
    for (char c : text) {
        int v = -1;
        if (c >= 'a' && c <= 'z') v = c - 'a';
        else if (c >= 'A' && c <= 'Z') v = c - 'A';
        else if (c >= '2' && c <= '7') v = c - '2' + 26;
        if (v < 0)
            return std::unexpected(std::string("invalid base32 character '") + c + "'");
        buffer = (buffer << 5) | static_cast<std::uint32_t>(v);
        bits += 5;
        if (bits >= 8) {
            out.push_back(static_cast<std::uint8_t>((buffer >> (bits - 8)) & 0xFF));
            bits -= 8;
        }
    }
    return out;
}

} // namespace

std::expected<Principal, std::string> Principal::FromBytes(std::span<const std::uint8_t> bytes) {
    if (bytes.size() > kMaxLength) {
        return std::unexpected("principal too long: " + std::to_string(bytes.size()) + " bytes");
    }
    Principal p;
    p.bytes_.assign(bytes.begin(), bytes.end());
    return p;
}

std::expected<Principal, std::string> Principal::FromText(std::string_view text) {
    std::string compact;
    compact.reserve(text.size());
    for (char c : text) {
        if (c != '-') compact.push_back(c);
    }

    auto decoded = Base32Decode(compact);
    if (!decoded)
        return std::unexpected("invalid principal '" + std::string(text) + "': " + decoded.error());
    if (decoded->size() < 4)
        return std::unexpected("invalid principal '" + std::string(text) + "': too short");

    const std::span<const std::uint8_t> body(decoded->data() + 4, decoded->size() - 4);
    auto parsed = FromBytes(body);
    if (!parsed)
        return parsed;

    // Only the canonical spelling is accepted, which also checks the crc.
    if (parsed->ToText() != text) {
        return std::unexpected("invalid principal '" + std::string(text) +
                               "': checksum or grouping mismatch");
    }
    return parsed;
}

std::string Principal::ToText() const {
    std::vector<std::uint8_t> payload;
    payload.reserve(bytes_.size() + 4);
    const auto crc = Crc32BigEndian(bytes_);
    payload.insert(payload.end(), crc.begin(), crc.end());
    payload.insert(payload.end(), bytes_.begin(), bytes_.end());

    const std::string encoded = Base32Encode(payload);
    std::string out;
    out.reserve(encoded.size() + encoded.size() / 5);
    for (size_t i = 0; i < encoded.size(); ++i) {
        if (i > 0 && i % 5 == 0) out.push_back('-');
        out.push_back(encoded[i]);
    }
    return out;
}

} // namespace canister
