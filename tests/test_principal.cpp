#include <gtest/gtest.h>

#include "agent/principal.hpp"

#include <vector>

namespace canister {

TEST(PrincipalTest, ManagementCanisterText) {
    EXPECT_EQ(Principal::ManagementCanister().ToText(), "aaaaa-aa");

    auto parsed = Principal::FromText("aaaaa-aa");
    ASSERT_TRUE(parsed.has_value()) << parsed.error();
    EXPECT_TRUE(parsed->IsEmpty());
}

TEST(PrincipalTest, CanisterIdText) {
    const std::vector<std::uint8_t> raw{0, 0, 0, 0, 0, 0, 0, 2, 1, 1};
    auto p = Principal::FromBytes(raw);
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->ToText(), "ryjl3-tyaaa-aaaaa-aaaba-cai");

    auto parsed = Principal::FromText("ryjl3-tyaaa-aaaaa-aaaba-cai");
    ASSERT_TRUE(parsed.has_value()) << parsed.error();
    EXPECT_EQ(parsed->Bytes(), raw);
    EXPECT_EQ(*parsed, *p);
}

TEST(PrincipalTest, RejectsBadChecksum) {
    auto parsed = Principal::FromText("ryjl3-tyaaa-aaaaa-aaaba-caa");
    EXPECT_FALSE(parsed.has_value());
}

TEST(PrincipalTest, RejectsBadCharactersAndGrouping) {
    EXPECT_FALSE(Principal::FromText("ryjl3-tyaaa-aaaaa-aaaba-ca1").has_value());
    EXPECT_FALSE(Principal::FromText("ryjl3tyaaa-aaaaa-aaaba-cai").has_value());
    EXPECT_FALSE(Principal::FromText("").has_value());
}

TEST(PrincipalTest, RejectsOverlongBytes) {
    const std::vector<std::uint8_t> raw(Principal::kMaxLength + 1, 7);
    EXPECT_FALSE(Principal::FromBytes(raw).has_value());
}

} // namespace canister
