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

#include <spool/core/little_endian.hpp>
#include <spool/native/token/token_instruction.hpp>
#include <spool/runtime/codec.hpp>
#include <spool/runtime/instruction_error.hpp>
#include <spool/runtime/program_ids.hpp>

#include <boost/outcome/try.hpp>

SPOOL_ANONYMOUS_NAMESPACE_BEGIN

using token::TokenInstructionKind;

byte_string
encode_amount(TokenInstructionKind const kind, uint64_t const amount)
{
    byte_string data;
    encode_fixed(data, static_cast<uint8_t>(kind));
    encode_fixed(data, u64_le{amount});
    return data;
}

Instruction
token_instruction(std::vector<AccountMeta> accounts, byte_string data)
{
    return {TOKEN_PROGRAM_ID, std::move(accounts), std::move(data)};
}

SPOOL_ANONYMOUS_NAMESPACE_END

SPOOL_TOKEN_NAMESPACE_BEGIN

Result<TokenInstruction> decode_token_instruction(byte_string_view enc)
{
    auto decoded = [&]() -> Result<TokenInstruction> {
        BOOST_OUTCOME_TRY(auto const tag, decode_fixed<uint8_t>(enc));
        switch (static_cast<TokenInstructionKind>(tag)) {
        case TokenInstructionKind::InitializeMint2: {
            BOOST_OUTCOME_TRY(auto const decimals, decode_fixed<uint8_t>(enc));
            BOOST_OUTCOME_TRY(auto const authority, decode_fixed<Pubkey>(enc));
            BOOST_OUTCOME_TRY(
                auto const has_freeze, decode_fixed<uint8_t>(enc));
            std::optional<Pubkey> freeze;
            if (has_freeze == 1) {
                BOOST_OUTCOME_TRY(auto const key, decode_fixed<Pubkey>(enc));
                freeze = key;
            }
            else if (has_freeze != 0) {
                return InstructionError::InvalidInstructionData;
            }
            return InitializeMint2{decimals, authority, freeze};
        }
        case TokenInstructionKind::InitializeAccount3: {
            BOOST_OUTCOME_TRY(auto const owner, decode_fixed<Pubkey>(enc));
            return InitializeAccount3{owner};
        }
        case TokenInstructionKind::Transfer: {
            BOOST_OUTCOME_TRY(auto const amount, decode_fixed<u64_le>(enc));
            return Transfer{amount.native()};
        }
        case TokenInstructionKind::Approve: {
            BOOST_OUTCOME_TRY(auto const amount, decode_fixed<u64_le>(enc));
            return Approve{amount.native()};
        }
        case TokenInstructionKind::MintTo: {
            BOOST_OUTCOME_TRY(auto const amount, decode_fixed<u64_le>(enc));
            return MintTo{amount.native()};
        }
        case TokenInstructionKind::Burn: {
            BOOST_OUTCOME_TRY(auto const amount, decode_fixed<u64_le>(enc));
            return Burn{amount.native()};
        }
        }
        return InstructionError::InvalidInstructionData;
    }();

    if (SPOOL_UNLIKELY(decoded.has_error() || decode_end(enc).has_error())) {
        return InstructionError::InvalidInstructionData;
    }
    return decoded;
}

Instruction initialize_mint2(
    Pubkey const &mint, Pubkey const &mint_authority,
    std::optional<Pubkey> const &freeze_authority, uint8_t const decimals)
{
    byte_string data;
    encode_fixed(
        data, static_cast<uint8_t>(TokenInstructionKind::InitializeMint2));
    encode_fixed(data, decimals);
    encode_fixed(data, mint_authority);
    encode_fixed(data, static_cast<uint8_t>(freeze_authority.has_value()));
    if (freeze_authority.has_value()) {
        encode_fixed(data, *freeze_authority);
    }
    return token_instruction({AccountMeta::writable(mint)}, std::move(data));
}

Instruction initialize_account3(
    Pubkey const &account, Pubkey const &mint, Pubkey const &owner)
{
    byte_string data;
    encode_fixed(
        data, static_cast<uint8_t>(TokenInstructionKind::InitializeAccount3));
    encode_fixed(data, owner);
    return token_instruction(
        {AccountMeta::writable(account), AccountMeta::readonly(mint)},
        std::move(data));
}

Instruction transfer(
    Pubkey const &source, Pubkey const &destination, Pubkey const &authority,
    uint64_t const amount)
{
    return token_instruction(
        {AccountMeta::writable(source),
         AccountMeta::writable(destination),
         AccountMeta::readonly(authority, true)},
        encode_amount(TokenInstructionKind::Transfer, amount));
}

Instruction approve(
    Pubkey const &source, Pubkey const &delegate, Pubkey const &owner,
    uint64_t const amount)
{
    return token_instruction(
        {AccountMeta::writable(source),
         AccountMeta::readonly(delegate),
         AccountMeta::readonly(owner, true)},
        encode_amount(TokenInstructionKind::Approve, amount));
}

Instruction mint_to(
    Pubkey const &mint, Pubkey const &destination, Pubkey const &authority,
    uint64_t const amount)
{
    return token_instruction(
        {AccountMeta::writable(mint),
         AccountMeta::writable(destination),
         AccountMeta::readonly(authority, true)},
        encode_amount(TokenInstructionKind::MintTo, amount));
}

Instruction burn(
    Pubkey const &account, Pubkey const &mint, Pubkey const &authority,
    uint64_t const amount)
{
    return token_instruction(
        {AccountMeta::writable(account),
         AccountMeta::writable(mint),
         AccountMeta::readonly(authority, true)},
        encode_amount(TokenInstructionKind::Burn, amount));
}

SPOOL_TOKEN_NAMESPACE_END
