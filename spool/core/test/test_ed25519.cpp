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
#include <spool/core/bytes.hpp>
#include <spool/core/ed25519.hpp>
#include <spool/core/sha256.hpp>

#include <gtest/gtest.h>

using namespace spool;

TEST(Sha256, digest)
{
    EXPECT_EQ(
        sha256(to_byte_string_view("abc")),
        0xba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad_bytes32);

    // incremental updates hash the concatenation
    EXPECT_EQ(
        Sha256{}
            .update(to_byte_string_view("a"))
            .update(to_byte_string_view("bc"))
            .finalize(),
        sha256(to_byte_string_view("abc")));
}

TEST(Ed25519, keypair_from_seed_is_deterministic)
{
    auto const seed =
        0x0101010101010101010101010101010101010101010101010101010101010101_bytes32;
    auto const a = keypair_from_seed(seed);
    auto const b = keypair_from_seed(seed);
    EXPECT_EQ(a.pubkey, b.pubkey);
    EXPECT_EQ(a.secret, b.secret);
    EXPECT_TRUE(is_on_curve(a.pubkey));

    auto const c = generate_keypair();
    EXPECT_NE(a.pubkey, c.pubkey);
    EXPECT_TRUE(is_on_curve(c.pubkey));
}

TEST(Ed25519, is_on_curve)
{
    // a wallet address
    EXPECT_TRUE(is_on_curve(
        0xec15d8c24908cd547e49afb67082cbf4899bf332ec298ad1654c2bb651a2f248_bytes32));
    // a program derived address
    EXPECT_FALSE(is_on_curve(
        0xb60e7a74c5dbf703edbb5c6fa9856e99890a345cbdec0316a739da0c8ce119af_bytes32));
}
