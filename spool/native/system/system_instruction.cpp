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
#include <spool/native/system/system_instruction.hpp>
#include <spool/runtime/codec.hpp>
#include <spool/runtime/instruction_error.hpp>
#include <spool/runtime/program_ids.hpp>

#include <boost/outcome/try.hpp>

SPOOL_ANONYMOUS_NAMESPACE_BEGIN

using system::SystemInstructionKind;

// bincode prefixes strings with a 64 bit length
void encode_bincode_string(byte_string &out, std::string_view const s)
{
    encode_fixed(out, u64_le{s.size()});
    out += to_byte_string_view(s);
}

Result<std::string> decode_bincode_string(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto const length, decode_fixed<u64_le>(enc));
    if (SPOOL_UNLIKELY(enc.size() < length.native())) {
        return CodecError::InputTooShort;
    }
    std::string s{
        reinterpret_cast<char const *>(enc.data()),
        static_cast<size_t>(length.native())};
    enc.remove_prefix(static_cast<size_t>(length.native()));
    return s;
}

byte_string encode_tag(SystemInstructionKind const kind)
{
    byte_string data;
    encode_fixed(data, u32_le{static_cast<uint32_t>(kind)});
    return data;
}

SPOOL_ANONYMOUS_NAMESPACE_END

SPOOL_SYSTEM_NAMESPACE_BEGIN

Result<SystemInstruction> decode_system_instruction(byte_string_view enc)
{
    auto const tag = decode_fixed<u32_le>(enc);
    if (SPOOL_UNLIKELY(tag.has_error())) {
        return InstructionError::InvalidInstructionData;
    }

    auto decoded = [&]() -> Result<SystemInstruction> {
        switch (static_cast<SystemInstructionKind>(tag.value().native())) {
        case SystemInstructionKind::CreateAccount: {
            BOOST_OUTCOME_TRY(auto const lamports, decode_fixed<u64_le>(enc));
            BOOST_OUTCOME_TRY(auto const space, decode_fixed<u64_le>(enc));
            BOOST_OUTCOME_TRY(auto const owner, decode_fixed<Pubkey>(enc));
            return CreateAccount{lamports.native(), space.native(), owner};
        }
        case SystemInstructionKind::Assign: {
            BOOST_OUTCOME_TRY(auto const owner, decode_fixed<Pubkey>(enc));
            return Assign{owner};
        }
        case SystemInstructionKind::Transfer: {
            BOOST_OUTCOME_TRY(auto const lamports, decode_fixed<u64_le>(enc));
            return Transfer{lamports.native()};
        }
        case SystemInstructionKind::CreateAccountWithSeed: {
            BOOST_OUTCOME_TRY(auto const base, decode_fixed<Pubkey>(enc));
            BOOST_OUTCOME_TRY(auto seed, decode_bincode_string(enc));
            BOOST_OUTCOME_TRY(auto const lamports, decode_fixed<u64_le>(enc));
            BOOST_OUTCOME_TRY(auto const space, decode_fixed<u64_le>(enc));
            BOOST_OUTCOME_TRY(auto const owner, decode_fixed<Pubkey>(enc));
            return CreateAccountWithSeed{
                base,
                std::move(seed),
                lamports.native(),
                space.native(),
                owner};
        }
        case SystemInstructionKind::Allocate: {
            BOOST_OUTCOME_TRY(auto const space, decode_fixed<u64_le>(enc));
            return Allocate{space.native()};
        }
        }
        return InstructionError::InvalidInstructionData;
    }();

    if (SPOOL_UNLIKELY(decoded.has_error() || decode_end(enc).has_error())) {
        return InstructionError::InvalidInstructionData;
    }
    return decoded;
}

Instruction create_account(
    Pubkey const &from, Pubkey const &to, uint64_t const lamports,
    uint64_t const space, Pubkey const &owner)
{
    auto data = encode_tag(SystemInstructionKind::CreateAccount);
    encode_fixed(data, u64_le{lamports});
    encode_fixed(data, u64_le{space});
    encode_fixed(data, owner);
    return {
        SYSTEM_PROGRAM_ID,
        {AccountMeta::writable(from, true), AccountMeta::writable(to, true)},
        std::move(data)};
}

Instruction assign(Pubkey const &account, Pubkey const &owner)
{
    auto data = encode_tag(SystemInstructionKind::Assign);
    encode_fixed(data, owner);
    return {
        SYSTEM_PROGRAM_ID,
        {AccountMeta::writable(account, true)},
        std::move(data)};
}

Instruction
transfer(Pubkey const &from, Pubkey const &to, uint64_t const lamports)
{
    auto data = encode_tag(SystemInstructionKind::Transfer);
    encode_fixed(data, u64_le{lamports});
    return {
        SYSTEM_PROGRAM_ID,
        {AccountMeta::writable(from, true), AccountMeta::writable(to)},
        std::move(data)};
}

Instruction create_account_with_seed(
    Pubkey const &from, Pubkey const &to, Pubkey const &base,
    std::string_view const seed, uint64_t const lamports, uint64_t const space,
    Pubkey const &owner)
{
    auto data = encode_tag(SystemInstructionKind::CreateAccountWithSeed);
    encode_fixed(data, base);
    encode_bincode_string(data, seed);
    encode_fixed(data, u64_le{lamports});
    encode_fixed(data, u64_le{space});
    encode_fixed(data, owner);
    return {
        SYSTEM_PROGRAM_ID,
        {AccountMeta::writable(from, true),
         AccountMeta::writable(to),
         AccountMeta::readonly(base, true)},
        std::move(data)};
}

Instruction allocate(Pubkey const &account, uint64_t const space)
{
    auto data = encode_tag(SystemInstructionKind::Allocate);
    encode_fixed(data, u64_le{space});
    return {
        SYSTEM_PROGRAM_ID,
        {AccountMeta::writable(account, true)},
        std::move(data)};
}

SPOOL_SYSTEM_NAMESPACE_END
