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

#pragma once

#include <spool/core/assert.h>
#include <spool/core/byte_string.hpp>
#include <spool/core/config.hpp>
#include <spool/core/likely.h>
#include <spool/core/little_endian.hpp>
#include <spool/core/result.hpp>
#include <spool/core/unaligned.hpp>
#include <spool/runtime/codec_error.hpp>
#include <spool/runtime/pubkey.hpp>

#include <boost/outcome/try.hpp>

#include <concepts>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <type_traits>

SPOOL_NAMESPACE_BEGIN

// Instruction data is a tag followed by fixed width little endian fields and
// length prefixed strings, the borsh convention. Decoders consume from the
// front of the view.

template <typename T>
concept FixedField = LittleEndianType<T> || std::same_as<T, Pubkey> ||
                     std::same_as<T, uint8_t>;

template <FixedField T>
Result<T> decode_fixed(byte_string_view &enc)
{
    if (SPOOL_UNLIKELY(enc.size() < sizeof(T))) {
        return CodecError::InputTooShort;
    }
    T output{};
    std::memcpy(&output, enc.data(), sizeof(T));
    enc.remove_prefix(sizeof(T));
    return output;
}

inline Result<std::string> decode_string(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto const length, decode_fixed<u32_le>(enc));
    if (SPOOL_UNLIKELY(enc.size() < length.native())) {
        return CodecError::InputTooShort;
    }
    std::string output{
        reinterpret_cast<char const *>(enc.data()), length.native()};
    enc.remove_prefix(length.native());
    return output;
}

inline Result<void> decode_end(byte_string_view const enc)
{
    if (SPOOL_UNLIKELY(!enc.empty())) {
        return CodecError::TrailingBytes;
    }
    return outcome::success();
}

template <FixedField T>
void encode_fixed(byte_string &out, T const &value)
{
    out.append(reinterpret_cast<unsigned char const *>(&value), sizeof(T));
}

inline void encode_string(byte_string &out, std::string_view const value)
{
    encode_fixed(out, u32_le{static_cast<uint32_t>(value.size())});
    out += to_byte_string_view(value);
}

// Account state is stored as packed structs of byte-aligned fields
template <typename T>
    requires std::is_trivially_copyable_v<T>
Result<T> decode_layout(byte_string_view const data)
{
    static_assert(alignof(T) == 1);
    if (SPOOL_UNLIKELY(data.size() < sizeof(T))) {
        return CodecError::InputTooShort;
    }
    return unaligned_load<T>(data.data());
}

template <typename T>
    requires std::is_trivially_copyable_v<T>
void encode_layout(byte_string &data, T const &value)
{
    static_assert(alignof(T) == 1);
    SPOOL_ASSERT(data.size() >= sizeof(T));
    unaligned_store(data.data(), value);
}

SPOOL_NAMESPACE_END
