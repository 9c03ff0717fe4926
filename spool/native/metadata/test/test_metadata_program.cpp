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

#include <spool/bank/bank.hpp>
#include <spool/native/metadata/metadata_error.hpp>
#include <spool/native/metadata/metadata_instruction.hpp>
#include <spool/native/metadata/metadata_state.hpp>
#include <spool/native/system/system_instruction.hpp>
#include <spool/native/token/token_instruction.hpp>
#include <spool/native/token/token_state.hpp>
#include <spool/runtime/account.hpp>
#include <spool/runtime/instruction_error.hpp>
#include <spool/runtime/program_ids.hpp>

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

using namespace spool;
using namespace spool::metadata;

namespace
{
    constexpr Pubkey PAYER{0x01_bytes32};
    constexpr Pubkey MINT{0x02_bytes32};
    constexpr Pubkey MINT_AUTHORITY{0x03_bytes32};
    constexpr Pubkey UPDATE_AUTHORITY{0x04_bytes32};

    class MetadataProgramTest : public ::testing::Test
    {
    protected:
        Bank bank;
        Pubkey metadata{find_metadata_address(MINT)};
        DataV2 const data{
            .name = "Pool Token",
            .symbol = "POOL",
            .uri = "",
            .seller_fee_basis_points = 0};

        MetadataProgramTest()
        {
            bank.airdrop(PAYER, 100 * LAMPORTS_PER_SOL);
            auto const res = process(
                {system::create_account(
                     PAYER,
                     MINT,
                     bank.rent().minimum_balance(token::MINT_SIZE),
                     token::MINT_SIZE,
                     TOKEN_PROGRAM_ID),
                 token::initialize_mint2(
                     MINT, MINT_AUTHORITY, std::nullopt, 9)},
                {MINT});
            EXPECT_FALSE(res.has_error()) << res.error().message().c_str();
        }

        Result<void> process(
            std::vector<Instruction> instructions,
            std::vector<Pubkey> signers = {})
        {
            signers.push_back(PAYER);
            return bank.process_transaction(
                Transaction{std::move(instructions), std::move(signers)});
        }

        Result<void> create(DataV2 const &with, bool const is_mutable = true)
        {
            return process(
                {create_metadata_accounts_v3(
                    metadata,
                    MINT,
                    MINT_AUTHORITY,
                    PAYER,
                    UPDATE_AUTHORITY,
                    with,
                    is_mutable)},
                {MINT_AUTHORITY});
        }

        Metadata stored() const
        {
            auto const *const account = bank.get_account(metadata);
            EXPECT_NE(account, nullptr);
            auto const res = load_metadata(*account);
            EXPECT_TRUE(res.has_value());
            return res.value();
        }
    };
}

TEST(MetadataState, address)
{
    // metadata of mint 89ZWz5iDWuxTzoXCXcBxRY9o9nPd6nmiotrJyr2AUarR
    EXPECT_EQ(
        find_metadata_address(
            0x6a3338d5aa9a360758b21b8870130836f89abbed49789a480eb116de84d7bf7e_bytes32),
        0x5df50a1335f6d762833ff37adfe059b5e634ccbe8559e73914a86584347d940a_bytes32);
}

TEST_F(MetadataProgramTest, create)
{
    auto const res = create(data);
    ASSERT_FALSE(res.has_error()) << res.error().message().c_str();

    auto const *const account = bank.get_account(metadata);
    ASSERT_NE(account, nullptr);
    EXPECT_EQ(account->owner, METADATA_PROGRAM_ID);
    EXPECT_EQ(account->data.size(), METADATA_SIZE);
    EXPECT_EQ(account->lamports, bank.rent().minimum_balance(METADATA_SIZE));

    auto const record = stored();
    EXPECT_EQ(record.update_authority, UPDATE_AUTHORITY);
    EXPECT_EQ(record.mint, MINT);
    EXPECT_EQ(record.data, data);
    EXPECT_TRUE(record.is_mutable);

    EXPECT_EQ(create(data).error(), MetadataError::AlreadyInitialized);
}

TEST_F(MetadataProgramTest, create_requires_mint_authority)
{
    auto const res = process(
        {create_metadata_accounts_v3(
            metadata, MINT, PAYER, PAYER, UPDATE_AUTHORITY, data, true)});
    EXPECT_EQ(res.error(), MetadataError::InvalidMintAuthority);
    EXPECT_EQ(bank.get_account(metadata), nullptr);
}

TEST_F(MetadataProgramTest, field_limits)
{
    DataV2 long_name = data;
    long_name.name = std::string(MAX_NAME_LENGTH + 1, 'n');
    EXPECT_EQ(create(long_name).error(), MetadataError::NameTooLong);

    DataV2 long_symbol = data;
    long_symbol.symbol = std::string(MAX_SYMBOL_LENGTH + 1, 's');
    EXPECT_EQ(create(long_symbol).error(), MetadataError::SymbolTooLong);

    DataV2 long_uri = data;
    long_uri.uri = std::string(MAX_URI_LENGTH + 1, 'u');
    EXPECT_EQ(create(long_uri).error(), MetadataError::UriTooLong);
}

TEST_F(MetadataProgramTest, update)
{
    ASSERT_FALSE(create(data).has_error());

    DataV2 const renamed{
        .name = "Renamed",
        .symbol = "RN",
        .uri = "https://example.com/rn.json",
        .seller_fee_basis_points = 0};
    UpdateMetadataAccountV2 const update{
        .data = renamed,
        .update_authority = std::nullopt,
        .primary_sale_happened = std::nullopt,
        .is_mutable = std::nullopt};

    auto const wrong = process(
        {update_metadata_accounts_v2(metadata, MINT_AUTHORITY, update)},
        {MINT_AUTHORITY});
    EXPECT_EQ(wrong.error(), MetadataError::UpdateAuthorityIncorrect);

    ASSERT_FALSE(
        process(
            {update_metadata_accounts_v2(metadata, UPDATE_AUTHORITY, update)},
            {UPDATE_AUTHORITY})
            .has_error());
    EXPECT_EQ(stored().data, renamed);
}

TEST_F(MetadataProgramTest, immutable_data)
{
    ASSERT_FALSE(create(data, false).has_error());
    UpdateMetadataAccountV2 const update{
        .data = data,
        .update_authority = std::nullopt,
        .primary_sale_happened = std::nullopt,
        .is_mutable = std::nullopt};
    auto const res = process(
        {update_metadata_accounts_v2(metadata, UPDATE_AUTHORITY, update)},
        {UPDATE_AUTHORITY});
    EXPECT_EQ(res.error(), MetadataError::DataIsImmutable);
}
