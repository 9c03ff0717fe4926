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

#include <spool/core/base58.hpp>

#include <boost/outcome/config.hpp>
// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/generic_code.hpp>
#endif

#include <algorithm>
#include <array>
#include <cstdint>

SPOOL_ANONYMOUS_NAMESPACE_BEGIN

constexpr std::string_view ALPHABET{
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz"};

constexpr std::array<int8_t, 128> make_reverse_alphabet()
{
    std::array<int8_t, 128> table{};
    table.fill(-1);
    for (size_t i = 0; i < ALPHABET.size(); ++i) {
        table[static_cast<unsigned char>(ALPHABET[i])] =
            static_cast<int8_t>(i);
    }
    return table;
}

constexpr auto REVERSE_ALPHABET = make_reverse_alphabet();

SPOOL_ANONYMOUS_NAMESPACE_END

SPOOL_NAMESPACE_BEGIN

std::string base58_encode(byte_string_view const data)
{
    auto const zeros = static_cast<size_t>(std::distance(
        data.begin(),
        std::ranges::find_if(data, [](auto const b) { return b != 0; })));

    // base 58 digits, least significant first
    std::string digits;
    digits.reserve(data.size() * 138 / 100 + 1);
    for (auto const byte : data.substr(zeros)) {
        uint32_t carry = byte;
        for (auto &digit : digits) {
            carry += static_cast<uint32_t>(digit) << 8;
            digit = static_cast<char>(carry % 58);
            carry /= 58;
        }
        while (carry != 0) {
            digits.push_back(static_cast<char>(carry % 58));
            carry /= 58;
        }
    }

    std::string out(zeros, '1');
    out.reserve(zeros + digits.size());
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        out.push_back(ALPHABET[static_cast<size_t>(*it)]);
    }
    return out;
}

Result<byte_string> base58_decode(std::string_view const text)
{
    auto const ones = static_cast<size_t>(std::distance(
        text.begin(),
        std::ranges::find_if(text, [](char const c) { return c != '1'; })));

    // base 256 digits, least significant first
    byte_string bytes;
    bytes.reserve(text.size() * 733 / 1000 + 1);
    for (auto const c : text.substr(ones)) {
        auto const uc = static_cast<unsigned char>(c);
        if (uc >= REVERSE_ALPHABET.size() || REVERSE_ALPHABET[uc] < 0) {
            return Base58Error::InvalidCharacter;
        }
        auto carry = static_cast<uint32_t>(REVERSE_ALPHABET[uc]);
        for (auto &byte : bytes) {
            carry += static_cast<uint32_t>(byte) * 58;
            byte = static_cast<unsigned char>(carry & 0xff);
            carry >>= 8;
        }
        while (carry != 0) {
            bytes.push_back(static_cast<unsigned char>(carry & 0xff));
            carry >>= 8;
        }
    }

    byte_string out(ones, 0);
    out.append(bytes.rbegin(), bytes.rend());
    return out;
}

SPOOL_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<spool::Base58Error>::mapping> const &
quick_status_code_from_enum<spool::Base58Error>::value_mappings()
{
    using spool::Base58Error;

    static std::initializer_list<mapping> const v = {
        {Base58Error::Success, "success", {errc::success}},
        {Base58Error::InvalidCharacter, "invalid base58 character", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
