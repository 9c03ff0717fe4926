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

#include <spool/core/byte_string.hpp>
#include <spool/core/bytes.hpp>
#include <spool/core/config.hpp>
#include <spool/core/result.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <cstdint>
#include <initializer_list>
#include <span>
#include <string>
#include <string_view>
#include <utility>

SPOOL_NAMESPACE_BEGIN

using Pubkey = bytes32_t;

inline constexpr size_t MAX_SEED_LEN = 32;
inline constexpr size_t MAX_SEEDS = 16;

inline constexpr std::string_view PDA_MARKER{"ProgramDerivedAddress"};

enum class PubkeyError
{
    Success = 0,
    MaxSeedLengthExceeded,
    InvalidSeeds,
    IllegalOwner,
    NoViableBump,
    InvalidLength,
};

using Seeds = std::span<byte_string_view const>;

/// sha256(seeds || program_id || "ProgramDerivedAddress"), rejected when the
/// digest is a valid curve point
Result<Pubkey> create_program_address(Seeds, Pubkey const &program_id);

/// Searches the bump seed from 255 downwards and returns the first off-curve
/// address along with its bump
Result<std::pair<Pubkey, uint8_t>>
try_find_program_address(Seeds, Pubkey const &program_id);

/// sha256(base || seed || owner)
Result<Pubkey> create_with_seed(
    Pubkey const &base, std::string_view seed, Pubkey const &owner);

std::string to_string(Pubkey const &);
Result<Pubkey> parse_pubkey(std::string_view base58);

SPOOL_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<spool::PubkeyError>
    : quick_status_code_from_enum_defaults<spool::PubkeyError>
{
    static constexpr auto const domain_name = "Pubkey Error";
    static constexpr auto const domain_uuid =
        "0c4f9e3b-6a1d-4d8e-9f52-b37e1a60c2d8";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
