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

#include <spool/native/metadata/metadata_state.hpp>
#include <spool/native/token/associated_token.hpp>
#include <spool/pool/address.hpp>
#include <spool/pool/id.hpp>
#include <spool/pool/token_metadata.hpp>
#include <spool/runtime/pubkey.hpp>

#include <gtest/gtest.h>

#include <string>
#include <string_view>

using namespace spool;
using namespace spool::pool;

namespace
{
    Pubkey parse(std::string_view const text)
    {
        auto const key = parse_pubkey(text);
        EXPECT_TRUE(key.has_value()) << text;
        return key.value();
    }

    Pubkey const VOTE = parse("KRAKEnMdmT4EfM8ykTFH6yLoCd5vNLcQvJwF66Y2dag");
    Pubkey const POOL = parse("DFg1LDoYH1LHwBBiiUrZNAb6ehNZ28WjtsnhfBtPMsbL");
}

TEST(PoolAddress, pool_from_vote_account)
{
    auto const [pool, bump] = find_pool_address_and_bump(
        SINGLE_POOL_PROGRAM_ID, VOTE, PoolAddress::Pool);
    EXPECT_EQ(pool, POOL);
    EXPECT_EQ(bump, 254);
    EXPECT_EQ(find_pool_address(SINGLE_POOL_PROGRAM_ID, VOTE), POOL);

    // the first candidate is a curve point
    auto const on_curve = create_pool_address(
        SINGLE_POOL_PROGRAM_ID, VOTE, PoolAddress::Pool, 255);
    ASSERT_TRUE(on_curve.has_error());
    EXPECT_EQ(on_curve.error(), PubkeyError::InvalidSeeds);

    auto const again = create_pool_address(
        SINGLE_POOL_PROGRAM_ID, VOTE, PoolAddress::Pool, bump);
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again.value(), POOL);
}

TEST(PoolAddress, siblings_from_pool)
{
    EXPECT_EQ(
        find_pool_stake_address(SINGLE_POOL_PROGRAM_ID, POOL),
        parse("FLy15izWfFv8zEh5YYdcZAsDYZQ2rLBcvpPARQ2VaPbn"));
    EXPECT_EQ(
        find_pool_mint_address(SINGLE_POOL_PROGRAM_ID, POOL),
        parse("89ZWz5iDWuxTzoXCXcBxRY9o9nPd6nmiotrJyr2AUarR"));
    EXPECT_EQ(
        find_pool_onramp_address(SINGLE_POOL_PROGRAM_ID, POOL),
        parse("2EtBSU3gQZnAFSpx8P2mYEoGVUJnTSMPs9W5aJahHAz8"));
    EXPECT_EQ(
        find_pool_stake_authority_address(SINGLE_POOL_PROGRAM_ID, POOL),
        parse("FNXjPq6mxo9gZDieXY2hFyBdHkMwrZvvSBWw58dwRkev"));
    EXPECT_EQ(
        find_pool_mint_authority_address(SINGLE_POOL_PROGRAM_ID, POOL),
        parse("5swi2RGteTqddysKU6uJjqvvh4UkNHyUUJuKjyNTjNty"));
    EXPECT_EQ(
        find_pool_mpl_authority_address(SINGLE_POOL_PROGRAM_ID, POOL),
        parse("889nkoJpfbWi4wA89tkTHNM6x9rDscGXshGxyEM7b6JT"));
}

TEST(PoolAddress, bumps)
{
    auto const bump = [](PoolAddress const kind) {
        return find_pool_address_and_bump(SINGLE_POOL_PROGRAM_ID, POOL, kind)
            .second;
    };
    EXPECT_EQ(bump(PoolAddress::Stake), 255);
    EXPECT_EQ(bump(PoolAddress::Mint), 251);
    EXPECT_EQ(bump(PoolAddress::OnRamp), 255);
    EXPECT_EQ(bump(PoolAddress::StakeAuthority), 252);
    EXPECT_EQ(bump(PoolAddress::MintAuthority), 254);
    EXPECT_EQ(bump(PoolAddress::MplAuthority), 255);
}

TEST(PoolAddress, seed_prefixes)
{
    EXPECT_EQ(seed_prefix(PoolAddress::Pool), "pool");
    EXPECT_EQ(seed_prefix(PoolAddress::Stake), "stake");
    EXPECT_EQ(seed_prefix(PoolAddress::Mint), "mint");
    EXPECT_EQ(seed_prefix(PoolAddress::OnRamp), "onramp");
    EXPECT_EQ(seed_prefix(PoolAddress::StakeAuthority), "stake_authority");
    EXPECT_EQ(seed_prefix(PoolAddress::MintAuthority), "mint_authority");
    EXPECT_EQ(seed_prefix(PoolAddress::MplAuthority), "mpl_authority");
}

TEST(PoolAddress, default_deposit_account)
{
    auto const wallet = parse("GtaYCtXWCrciizttN5mx9P38niTQPGWpfu6DnSgAr3Cj");
    auto const [address, seed] =
        find_default_deposit_account_address_and_seed(POOL, wallet);
    EXPECT_EQ(seed, "svspDFg1LDoYH1LHwBBiiUrZNAb6ehNZ");
    EXPECT_EQ(seed.size(), MAX_SEED_LEN);
    EXPECT_EQ(
        address, parse("BbfrNeJrd82cSFsULXT9zG8SvLLB8WsTc1gQsDFy3Sed"));
    EXPECT_EQ(find_default_deposit_account_address(POOL, wallet), address);
}

TEST(PoolAddress, token_accounts)
{
    auto const wallet = parse("GtaYCtXWCrciizttN5mx9P38niTQPGWpfu6DnSgAr3Cj");
    auto const mint = find_pool_mint_address(SINGLE_POOL_PROGRAM_ID, POOL);
    EXPECT_EQ(
        token::get_associated_token_address(wallet, mint),
        parse("6CcGGdt248A45CntCgkUGd9VidYSHk6MCmVedmT2kSip"));
    EXPECT_EQ(
        metadata::find_metadata_address(mint),
        parse("7KmdY7soXt2zXUefjgvSGSMKCHKDFnTu7SpUFDqT6xkh"));
}

TEST(PoolAddress, default_token_names)
{
    EXPECT_EQ(default_token_name(VOTE), "SPL Single Pool KRAKEnMdmT4EfM8");
    EXPECT_EQ(default_token_symbol(VOTE), "stKRAKEnM");
}

TEST(PoolAddress, signer_seeds)
{
    PoolSignerSeeds const signer{VOTE, PoolAddress::Pool, 254};
    auto const seeds = signer.seeds();
    ASSERT_EQ(seeds.size(), 3u);
    EXPECT_EQ(seeds[0], to_byte_string_view("pool"));
    EXPECT_EQ(seeds[1], to_byte_string_view(VOTE.bytes));
    ASSERT_EQ(seeds[2].size(), 1u);
    EXPECT_EQ(seeds[2][0], 254);

    auto const address =
        create_program_address(seeds, SINGLE_POOL_PROGRAM_ID);
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(address.value(), POOL);
}
