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

#include <initializer_list>
#include <string>
#include <string_view>

SPOOL_NAMESPACE_BEGIN

enum class Base58Error
{
    Success = 0,
    InvalidCharacter,
};

std::string base58_encode(byte_string_view);
Result<byte_string> base58_decode(std::string_view);

SPOOL_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<spool::Base58Error>
    : quick_status_code_from_enum_defaults<spool::Base58Error>
{
    static constexpr auto const domain_name = "Base58 Error";
    static constexpr auto const domain_uuid =
        "a3d6e1f2-8b47-4c09-b5e2-3f9d07c6a184";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
