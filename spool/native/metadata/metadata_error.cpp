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

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<quick_status_code_from_enum<
    spool::metadata::MetadataError>::mapping> const &
quick_status_code_from_enum<spool::metadata::MetadataError>::value_mappings()
{
    using spool::metadata::MetadataError;

    static std::initializer_list<mapping> const v = {
        {MetadataError::Success, "success", {errc::success}},
        {MetadataError::AlreadyInitialized, "already initialized", {}},
        {MetadataError::InvalidMetadataKey,
         "metadata account has an invalid key",
         {}},
        {MetadataError::DerivedKeyInvalid, "derived key invalid", {}},
        {MetadataError::NameTooLong, "name too long", {}},
        {MetadataError::SymbolTooLong, "symbol too long", {}},
        {MetadataError::UriTooLong, "uri too long", {}},
        {MetadataError::UpdateAuthorityIncorrect,
         "update authority is incorrect",
         {}},
        {MetadataError::DataIsImmutable, "data is immutable", {}},
        {MetadataError::InvalidMintAuthority,
         "mint authority provided does not match the authority on the mint",
         {}},
        {MetadataError::MintMismatch, "mint mismatch", {}},
        {MetadataError::UnsupportedData,
         "creators, collections and uses are not supported",
         {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
