#pragma once

#include <compare>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace canister {

// Identity of a canister (or of the management canister, which is the empty principal).
class Principal {
public:
    static constexpr std::size_t kMaxLength = 29;

    Principal() = default;

    static std::expected<Principal, std::string> FromBytes(std::span<const std::uint8_t> bytes);

    // Textual form: base32(crc32_be(bytes) || bytes), lowercase, grouped by 5 with '-'.
    static std::expected<Principal, std::string> FromText(std::string_view text);

    static Principal ManagementCanister() { return Principal{}; }

    const std::vector<std::uint8_t>& Bytes() const { return bytes_; }
    bool IsEmpty() const { return bytes_.empty(); }
    std::string ToText() const;

    auto operator<=>(const Principal&) const = default;

private:
    std::vector<std::uint8_t> bytes_;
};

} // namespace canister
