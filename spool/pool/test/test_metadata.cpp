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

#include <spool/native/metadata/metadata_error.hpp>
#include <spool/native/metadata/metadata_state.hpp>
#include <spool/pool/error.hpp>
#include <spool/pool/id.hpp>
#include <spool/pool/instruction.hpp>
#include <spool/pool/state.hpp>
#include <spool/pool/token_metadata.hpp>
#include <spool/runtime/account.hpp>
#include <spool/test/pool_fixture.hpp>

#include <gtest/gtest.h>

#include <utility>

using namespace spool;
using namespace spool::pool;

namespace
{
    class TokenMetadataTest : public test::PoolFixture
    {
    protected:
        Pubkey metadata_address{metadata::find_metadata_address(pool_mint)};

        metadata::Metadata load() const
        {
            auto const *const account = bank.get_account(metadata_address);
            EXPECT_NE(account, nullptr);
            auto const res = metadata::load_metadata(*account);
            EXPECT_TRUE(res.has_value());
            return res.value();
        }

        SinglePool load_record() const
        {
            return decode_pool(
                       SINGLE_POOL_PROGRAM_ID, bank.get_account(pool)->data)
                .value();
        }

        // rewrites the pool in the layout that predates stored bumps
        void make_legacy()
        {
            Account account = *bank.get_account(pool);
            account.data.clear();
            account.data.push_back(
                static_cast<unsigned char>(SinglePoolAccountType::Pool));
            account.data.append(vote.bytes, sizeof(vote.bytes));
            bank.set_account(pool, std::move(account));
        }
    };
}

TEST_F(TokenMetadataTest, created_with_pool)
{
    initialize_pool(false);

    auto const metadata = load();
    EXPECT_EQ(metadata.mint, pool_mint);
    EXPECT_EQ(metadata.update_authority, mpl_authority);
    EXPECT_EQ(metadata.data.name, default_token_name(vote));
    EXPECT_EQ(metadata.data.symbol, default_token_symbol(vote));
    EXPECT_EQ(metadata.data.uri, "");
    EXPECT_TRUE(load_record().has_metadata);
}

TEST_F(TokenMetadataTest, created_afterwards)
{
    initialize_pool();
    EXPECT_EQ(bank.get_account(metadata_address), nullptr);
    EXPECT_FALSE(load_record().has_metadata);

    auto const res =
        process({create_token_metadata(SINGLE_POOL_PROGRAM_ID, pool, payer)});
    ASSERT_FALSE(res.has_error()) << res.error().message().c_str();
    EXPECT_EQ(load().data.name, default_token_name(vote));
    EXPECT_TRUE(load_record().has_metadata);
}

TEST_F(TokenMetadataTest, created_once)
{
    initialize_pool(false);
    auto const res =
        process({create_token_metadata(SINGLE_POOL_PROGRAM_ID, pool, payer)});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), metadata::MetadataError::AlreadyInitialized);
}

TEST_F(TokenMetadataTest, checks_metadata_address)
{
    initialize_pool();
    auto ix = create_token_metadata(SINGLE_POOL_PROGRAM_ID, pool, payer);
    ix.accounts[5].pubkey = test::make_address(40);
    auto const res = process({ix});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), SinglePoolError::InvalidMetadataAccount);
}

TEST_F(TokenMetadataTest, legacy_pool_keeps_its_layout)
{
    initialize_pool();
    make_legacy();
    ASSERT_TRUE(load_record().legacy);

    auto const res =
        process({create_token_metadata(SINGLE_POOL_PROGRAM_ID, pool, payer)});
    ASSERT_FALSE(res.has_error()) << res.error().message().c_str();
    EXPECT_EQ(load().mint, pool_mint);
    EXPECT_EQ(bank.get_account(pool)->data.size(), LEGACY_POOL_SIZE);
}

TEST_F(TokenMetadataTest, updated_by_vote_withdrawer)
{
    initialize_pool(false);

    auto const res = process(
        {update_token_metadata(
            SINGLE_POOL_PROGRAM_ID,
            vote,
            vote_withdrawer,
            "Kraken Staked SOL",
            "kSOL",
            "https://example.com/ksol.json")},
        {vote_withdrawer});
    ASSERT_FALSE(res.has_error()) << res.error().message().c_str();

    auto const metadata = load();
    EXPECT_EQ(metadata.data.name, "Kraken Staked SOL");
    EXPECT_EQ(metadata.data.symbol, "kSOL");
    EXPECT_EQ(metadata.data.uri, "https://example.com/ksol.json");
    EXPECT_EQ(metadata.update_authority, mpl_authority);
}

TEST_F(TokenMetadataTest, update_requires_vote_withdrawer)
{
    initialize_pool(false);
    auto const impostor = test::make_address(41);
    bank.airdrop(impostor, LAMPORTS_PER_SOL);

    auto const res = process(
        {update_token_metadata(
            SINGLE_POOL_PROGRAM_ID, vote, impostor, "name", "sym", "")},
        {impostor});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), SinglePoolError::InvalidMetadataSigner);
    EXPECT_EQ(load().data.name, default_token_name(vote));
}

TEST_F(TokenMetadataTest, update_requires_signature)
{
    initialize_pool(false);

    auto ix = update_token_metadata(
        SINGLE_POOL_PROGRAM_ID, vote, vote_withdrawer, "name", "sym", "");
    ix.accounts[3].is_signer = false;
    auto const res = process({ix});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), SinglePoolError::SignatureMissing);
}

TEST_F(TokenMetadataTest, update_checks_lengths)
{
    initialize_pool(false);

    auto const res = process(
        {update_token_metadata(
            SINGLE_POOL_PROGRAM_ID,
            vote,
            vote_withdrawer,
            std::string(metadata::MAX_NAME_LENGTH + 1, 'x'),
            "sym",
            "")},
        {vote_withdrawer});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), metadata::MetadataError::NameTooLong);
}
