// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <spool/core/byte_string.hpp>
#include <spool/runtime/program_ids.hpp>
#include <spool/runtime/pubkey.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

using namespace spool;

namespace
{
    // SVSPxpvHdN29nkVg9rPapPNDddN5DipNLRUFhyjFThE
    constexpr Pubkey PROGRAM{
        0x0687accdfdec68a1620ce43beb02d173a49f3866c4a83e3a7ded3264a7f8e895_bytes32};

    Pubkey parse(std::string_view const text)
    {
        auto const key = parse_pubkey(text);
        EXPECT_TRUE(key.has_value()) << text;
        return key.value();
    }
}

TEST(Pubkey, text_form)
{
    EXPECT_EQ(to_string(SYSTEM_PROGRAM_ID), std::string(32, '1'));
    EXPECT_EQ(
        to_string(STAKE_PROGRAM_ID),
        "Stake11111111111111111111111111111111111111");
    EXPECT_EQ(
        to_string(TOKEN_PROGRAM_ID),
        "TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA");
    EXPECT_EQ(
        to_string(PROGRAM), "SVSPxpvHdN29nkVg9rPapPNDddN5DipNLRUFhyjFThE");
    EXPECT_EQ(
        parse("metaqbxxUerdq28cj1RbAWkYQm3ybzjb6a8bt518x1s"),
        METADATA_PROGRAM_ID);
    EXPECT_EQ(
        parse("ATokenGPvbdGVxr1b2hvZbsiqW5xWH25efTNsLJA8knL"),
        ASSOCIATED_TOKEN_PROGRAM_ID);
}

TEST(Pubkey, parse_rejects_wrong_length)
{
    auto const short_key = parse_pubkey("2NEpo7TZRRrLZSi2U");
    ASSERT_TRUE(short_key.has_error());
    EXPECT_EQ(short_key.error(), PubkeyError::InvalidLength);

    EXPECT_TRUE(parse_pubkey("not base58!").has_error());
}

TEST(Pubkey, find_program_address)
{
    std::vector<byte_string_view> const seeds{to_byte_string_view("hello")};
    auto const res = try_find_program_address(seeds, PROGRAM);
    ASSERT_TRUE(res.has_value());
    auto const [address, bump] = res.value();
    EXPECT_EQ(address, parse("BiunbKiekkoPyfsDfuGXgzkBSJL3RiVC21sneEF5PAbP"));
    EXPECT_EQ(bump, 252);

    // the found bump recreates the address
    uint8_t const bump_seed[1] = {bump};
    std::vector<byte_string_view> const with_bump{
        to_byte_string_view("hello"), to_byte_string_view(bump_seed)};
    auto const created = create_program_address(with_bump, PROGRAM);
    ASSERT_TRUE(created.has_value());
    EXPECT_EQ(created.value(), address);
}

TEST(Pubkey, create_program_address_rejects_on_curve)
{
    // vote account KRAKEnMdmT4EfM8ykTFH6yLoCd5vNLcQvJwF66Y2dag derives its
    // pool with bump 254 because bump 255 lands on the curve
    auto const vote = parse("KRAKEnMdmT4EfM8ykTFH6yLoCd5vNLcQvJwF66Y2dag");
    uint8_t const bump[1] = {255};
    std::vector<byte_string_view> const seeds{
        to_byte_string_view("pool"),
        {vote.bytes, sizeof(vote.bytes)},
        to_byte_string_view(bump)};
    auto const res = create_program_address(seeds, PROGRAM);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), PubkeyError::InvalidSeeds);
}

TEST(Pubkey, seed_limits)
{
    std::string const long_seed(MAX_SEED_LEN + 1, 'x');
    std::vector<byte_string_view> const too_long{
        to_byte_string_view(long_seed)};
    EXPECT_EQ(
        create_program_address(too_long, PROGRAM).error(),
        PubkeyError::MaxSeedLengthExceeded);

    std::vector<byte_string_view> const too_many(
        MAX_SEEDS, to_byte_string_view("a"));
    EXPECT_EQ(
        try_find_program_address(too_many, PROGRAM).error(),
        PubkeyError::MaxSeedLengthExceeded);
}

TEST(Pubkey, create_with_seed)
{
    auto const base = parse("GtaYCtXWCrciizttN5mx9P38niTQPGWpfu6DnSgAr3Cj");
    auto const res = create_with_seed(base, "seed", STAKE_PROGRAM_ID);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(
        res.value(), parse("4n245vkgffc7xVHPcpb2fYpSFrzCh7VLsHiGvb8RxtaJ"));

    EXPECT_EQ(
        create_with_seed(base, std::string(MAX_SEED_LEN + 1, 's'), PROGRAM)
            .error(),
        PubkeyError::MaxSeedLengthExceeded);

    // an owner ending in the derived address marker
    Pubkey owner{};
    std::copy(
        PDA_MARKER.begin(),
        PDA_MARKER.end(),
        owner.bytes + sizeof(owner.bytes) - PDA_MARKER.size());
    EXPECT_EQ(
        create_with_seed(base, "seed", owner).error(),
        PubkeyError::IllegalOwner);
}
