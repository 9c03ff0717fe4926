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

#include <spool/core/likely.h>
#include <spool/core/little_endian.hpp>
#include <spool/native/metadata/metadata_state.hpp>
#include <spool/native/stake/stake_instruction.hpp>
#include <spool/native/stake/stake_state.hpp>
#include <spool/native/system/system_instruction.hpp>
#include <spool/native/token/token_instruction.hpp>
#include <spool/native/token/token_state.hpp>
#include <spool/pool/address.hpp>
#include <spool/pool/id.hpp>
#include <spool/pool/instruction.hpp>
#include <spool/pool/state.hpp>
#include <spool/runtime/codec.hpp>
#include <spool/runtime/instruction_error.hpp>
#include <spool/runtime/program_ids.hpp>

#include <boost/outcome/try.hpp>

#include <concepts>
#include <type_traits>
#include <utility>

SPOOL_ANONYMOUS_NAMESPACE_BEGIN

using pool::SinglePoolInstructionKind;

byte_string encode_tag(SinglePoolInstructionKind const kind)
{
    byte_string data;
    encode_fixed(data, static_cast<uint8_t>(kind));
    return data;
}

SPOOL_ANONYMOUS_NAMESPACE_END

SPOOL_POOL_NAMESPACE_BEGIN

Result<SinglePoolInstruction> decode_instruction(byte_string_view enc)
{
    auto decoded = [&]() -> Result<SinglePoolInstruction> {
        BOOST_OUTCOME_TRY(auto const tag, decode_fixed<uint8_t>(enc));
        switch (static_cast<SinglePoolInstructionKind>(tag)) {
        case SinglePoolInstructionKind::InitializePool:
            return InitializePool{};
        case SinglePoolInstructionKind::ReplenishPool:
            return ReplenishPool{};
        case SinglePoolInstructionKind::DepositStake:
            return DepositStake{};
        case SinglePoolInstructionKind::WithdrawStake: {
            BOOST_OUTCOME_TRY(auto const authority, decode_fixed<Pubkey>(enc));
            BOOST_OUTCOME_TRY(auto const amount, decode_fixed<u64_le>(enc));
            return WithdrawStake{authority, amount.native()};
        }
        case SinglePoolInstructionKind::CreateTokenMetadata:
            return CreateTokenMetadata{};
        case SinglePoolInstructionKind::UpdateTokenMetadata: {
            BOOST_OUTCOME_TRY(auto name, decode_string(enc));
            BOOST_OUTCOME_TRY(auto symbol, decode_string(enc));
            BOOST_OUTCOME_TRY(auto uri, decode_string(enc));
            return UpdateTokenMetadata{
                std::move(name), std::move(symbol), std::move(uri)};
        }
        case SinglePoolInstructionKind::InitializePoolOnRamp:
            return InitializePoolOnRamp{};
        }
        return InstructionError::InvalidInstructionData;
    }();

    if (SPOOL_UNLIKELY(decoded.has_error() || decode_end(enc).has_error())) {
        return InstructionError::InvalidInstructionData;
    }
    return decoded;
}

byte_string encode_instruction(SinglePoolInstruction const &instruction)
{
    return std::visit(
        [](auto const &ix) {
            using T = std::decay_t<decltype(ix)>;
            if constexpr (std::same_as<T, InitializePool>) {
                return encode_tag(SinglePoolInstructionKind::InitializePool);
            }
            else if constexpr (std::same_as<T, ReplenishPool>) {
                return encode_tag(SinglePoolInstructionKind::ReplenishPool);
            }
            else if constexpr (std::same_as<T, DepositStake>) {
                return encode_tag(SinglePoolInstructionKind::DepositStake);
            }
            else if constexpr (std::same_as<T, WithdrawStake>) {
                auto data =
                    encode_tag(SinglePoolInstructionKind::WithdrawStake);
                encode_fixed(data, ix.user_stake_authority);
                encode_fixed(data, u64_le{ix.token_amount});
                return data;
            }
            else if constexpr (std::same_as<T, CreateTokenMetadata>) {
                return encode_tag(
                    SinglePoolInstructionKind::CreateTokenMetadata);
            }
            else if constexpr (std::same_as<T, UpdateTokenMetadata>) {
                auto data =
                    encode_tag(SinglePoolInstructionKind::UpdateTokenMetadata);
                encode_string(data, ix.name);
                encode_string(data, ix.symbol);
                encode_string(data, ix.uri);
                return data;
            }
            else {
                static_assert(std::same_as<T, InitializePoolOnRamp>);
                return encode_tag(
                    SinglePoolInstructionKind::InitializePoolOnRamp);
            }
        },
        instruction);
}

std::vector<Instruction> initialize(
    Pubkey const &program_id, Pubkey const &vote, Pubkey const &payer,
    Rent const &rent, uint64_t const minimum_pool_balance,
    bool const skip_metadata)
{
    auto const pool = find_pool_address(program_id, vote);
    auto const stake_space = stake::STAKE_STATE_SIZE;
    std::vector<Instruction> instructions{
        system::transfer(payer, pool, rent.minimum_balance(POOL_SIZE)),
        system::transfer(
            payer,
            find_pool_stake_address(program_id, pool),
            rent.minimum_balance(stake_space) + minimum_pool_balance),
        system::transfer(
            payer,
            find_pool_mint_address(program_id, pool),
            rent.minimum_balance(token::MINT_SIZE)),
        initialize_pool(program_id, vote),
    };
    auto onramp = create_pool_onramp(program_id, pool, payer, rent);
    instructions.insert(
        instructions.end(),
        std::make_move_iterator(onramp.begin()),
        std::make_move_iterator(onramp.end()));
    if (!skip_metadata) {
        instructions.push_back(create_token_metadata(program_id, pool, payer));
    }
    return instructions;
}

Instruction initialize_pool(Pubkey const &program_id, Pubkey const &vote)
{
    auto const pool = find_pool_address(program_id, vote);
    return {
        program_id,
        {AccountMeta::readonly(vote),
         AccountMeta::writable(pool),
         AccountMeta::writable(find_pool_stake_address(program_id, pool)),
         AccountMeta::writable(find_pool_mint_address(program_id, pool)),
         AccountMeta::readonly(
             find_pool_stake_authority_address(program_id, pool)),
         AccountMeta::readonly(
             find_pool_mint_authority_address(program_id, pool)),
         AccountMeta::readonly(SYSTEM_PROGRAM_ID),
         AccountMeta::readonly(TOKEN_PROGRAM_ID),
         AccountMeta::readonly(STAKE_PROGRAM_ID)},
        encode_instruction(InitializePool{})};
}

Instruction replenish_pool(Pubkey const &program_id, Pubkey const &vote)
{
    auto const pool = find_pool_address(program_id, vote);
    return {
        program_id,
        {AccountMeta::readonly(vote),
         AccountMeta::readonly(pool),
         AccountMeta::writable(find_pool_stake_address(program_id, pool)),
         AccountMeta::writable(find_pool_onramp_address(program_id, pool)),
         AccountMeta::readonly(
             find_pool_stake_authority_address(program_id, pool)),
         AccountMeta::readonly(STAKE_PROGRAM_ID)},
        encode_instruction(ReplenishPool{})};
}

std::vector<Instruction> deposit(
    Pubkey const &program_id, Pubkey const &pool, Pubkey const &user_stake,
    Pubkey const &user_token, Pubkey const &user_lamports,
    Pubkey const &user_withdraw_authority)
{
    auto const stake_authority =
        find_pool_stake_authority_address(program_id, pool);
    return {
        stake::authorize(
            user_stake,
            user_withdraw_authority,
            stake_authority,
            stake::StakeAuthorize::Staker),
        stake::authorize(
            user_stake,
            user_withdraw_authority,
            stake_authority,
            stake::StakeAuthorize::Withdrawer),
        deposit_stake(
            program_id, pool, user_stake, user_token, user_lamports),
    };
}

Instruction deposit_stake(
    Pubkey const &program_id, Pubkey const &pool, Pubkey const &user_stake,
    Pubkey const &user_token, Pubkey const &user_lamports)
{
    return {
        program_id,
        {AccountMeta::readonly(pool),
         AccountMeta::writable(find_pool_stake_address(program_id, pool)),
         AccountMeta::writable(find_pool_mint_address(program_id, pool)),
         AccountMeta::readonly(
             find_pool_stake_authority_address(program_id, pool)),
         AccountMeta::readonly(
             find_pool_mint_authority_address(program_id, pool)),
         AccountMeta::writable(user_stake),
         AccountMeta::writable(user_token),
         AccountMeta::writable(user_lamports),
         AccountMeta::readonly(TOKEN_PROGRAM_ID),
         AccountMeta::readonly(STAKE_PROGRAM_ID)},
        encode_instruction(DepositStake{})};
}

std::vector<Instruction> withdraw(
    Pubkey const &program_id, Pubkey const &pool, Pubkey const &user_stake,
    Pubkey const &user_stake_authority, Pubkey const &user_token,
    Pubkey const &user_token_authority, uint64_t const token_amount,
    std::optional<Pubkey> const &payer, Rent const &rent)
{
    std::vector<Instruction> instructions;
    if (payer.has_value()) {
        instructions.push_back(system::create_account(
            *payer,
            user_stake,
            rent.minimum_balance(stake::STAKE_STATE_SIZE),
            stake::STAKE_STATE_SIZE,
            STAKE_PROGRAM_ID));
    }
    instructions.push_back(token::approve(
        user_token,
        find_pool_mint_authority_address(program_id, pool),
        user_token_authority,
        token_amount));
    instructions.push_back(withdraw_stake(
        program_id,
        pool,
        user_stake,
        user_stake_authority,
        user_token,
        token_amount));
    return instructions;
}

Instruction withdraw_stake(
    Pubkey const &program_id, Pubkey const &pool, Pubkey const &user_stake,
    Pubkey const &user_stake_authority, Pubkey const &user_token,
    uint64_t const token_amount)
{
    return {
        program_id,
        {AccountMeta::readonly(pool),
         AccountMeta::writable(find_pool_stake_address(program_id, pool)),
         AccountMeta::writable(find_pool_mint_address(program_id, pool)),
         AccountMeta::readonly(
             find_pool_stake_authority_address(program_id, pool)),
         AccountMeta::readonly(
             find_pool_mint_authority_address(program_id, pool)),
         AccountMeta::writable(user_stake),
         AccountMeta::writable(user_token),
         AccountMeta::readonly(TOKEN_PROGRAM_ID),
         AccountMeta::readonly(STAKE_PROGRAM_ID)},
        encode_instruction(WithdrawStake{user_stake_authority, token_amount})};
}

std::vector<Instruction> create_and_delegate_user_stake(
    Pubkey const &program_id, Pubkey const &vote, Pubkey const &user_wallet,
    Rent const &rent, uint64_t const stake_amount)
{
    auto const pool = find_pool_address(program_id, vote);
    auto const [stake_address, seed] =
        find_default_deposit_account_address_and_seed(pool, user_wallet);
    auto instructions = stake::create_account_with_seed(
        user_wallet,
        stake_address,
        user_wallet,
        seed,
        stake::Authorized::both(user_wallet),
        stake::Lockup{},
        rent.minimum_balance(stake::STAKE_STATE_SIZE) + stake_amount);
    instructions.push_back(
        stake::delegate_stake(stake_address, user_wallet, vote));
    return instructions;
}

Instruction create_token_metadata(
    Pubkey const &program_id, Pubkey const &pool, Pubkey const &payer)
{
    auto const mint = find_pool_mint_address(program_id, pool);
    return {
        program_id,
        {AccountMeta::writable(pool),
         AccountMeta::readonly(mint),
         AccountMeta::readonly(
             find_pool_mint_authority_address(program_id, pool)),
         AccountMeta::readonly(
             find_pool_mpl_authority_address(program_id, pool)),
         AccountMeta::writable(payer, true),
         AccountMeta::writable(metadata::find_metadata_address(mint)),
         AccountMeta::readonly(METADATA_PROGRAM_ID),
         AccountMeta::readonly(SYSTEM_PROGRAM_ID)},
        encode_instruction(CreateTokenMetadata{})};
}

Instruction update_token_metadata(
    Pubkey const &program_id, Pubkey const &vote,
    Pubkey const &authorized_withdrawer, std::string name, std::string symbol,
    std::string uri)
{
    auto const pool = find_pool_address(program_id, vote);
    auto const mint = find_pool_mint_address(program_id, pool);
    return {
        program_id,
        {AccountMeta::readonly(vote),
         AccountMeta::readonly(pool),
         AccountMeta::readonly(
             find_pool_mpl_authority_address(program_id, pool)),
         AccountMeta::readonly(authorized_withdrawer, true),
         AccountMeta::writable(metadata::find_metadata_address(mint)),
         AccountMeta::readonly(METADATA_PROGRAM_ID)},
        encode_instruction(UpdateTokenMetadata{
            std::move(name), std::move(symbol), std::move(uri)})};
}

Instruction
initialize_pool_onramp(Pubkey const &program_id, Pubkey const &pool)
{
    return {
        program_id,
        {AccountMeta::readonly(pool),
         AccountMeta::writable(find_pool_onramp_address(program_id, pool)),
         AccountMeta::readonly(
             find_pool_stake_authority_address(program_id, pool)),
         AccountMeta::readonly(SYSTEM_PROGRAM_ID),
         AccountMeta::readonly(STAKE_PROGRAM_ID)},
        encode_instruction(InitializePoolOnRamp{})};
}

std::vector<Instruction> create_pool_onramp(
    Pubkey const &program_id, Pubkey const &pool, Pubkey const &payer,
    Rent const &rent)
{
    return {
        system::transfer(
            payer,
            find_pool_onramp_address(program_id, pool),
            rent.minimum_balance(stake::STAKE_STATE_SIZE)),
        initialize_pool_onramp(program_id, pool),
    };
}

SPOOL_POOL_NAMESPACE_END
