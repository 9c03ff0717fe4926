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
#include <spool/runtime/account.hpp>
#include <spool/runtime/pubkey.hpp>

#include <cstdint>

SPOOL_NAMESPACE_BEGIN

/// A program's handle on one account of the instruction being processed.
/// Several handles share the account when a key is passed more than once.
class AccountInfo
{
    Pubkey key_;
    bool is_signer_;
    bool is_writable_;
    Account *account_;

public:
    AccountInfo(
        Pubkey const &key, bool const is_signer, bool const is_writable,
        Account &account)
        : key_{key}
        , is_signer_{is_signer}
        , is_writable_{is_writable}
        , account_{&account}
    {
    }

    Pubkey const &key() const noexcept
    {
        return key_;
    }

    bool is_signer() const noexcept
    {
        return is_signer_;
    }

    bool is_writable() const noexcept
    {
        return is_writable_;
    }

    uint64_t lamports() const noexcept
    {
        return account_->lamports;
    }

    void set_lamports(uint64_t const lamports) const noexcept
    {
        account_->lamports = lamports;
    }

    Pubkey const &owner() const noexcept
    {
        return account_->owner;
    }

    void assign(Pubkey const &owner) const noexcept
    {
        account_->owner = owner;
    }

    bool executable() const noexcept
    {
        return account_->executable;
    }

    byte_string_view data() const noexcept
    {
        return account_->data;
    }

    byte_string &data_mut() const noexcept
    {
        return account_->data;
    }

    bool data_is_empty() const noexcept
    {
        return account_->data.empty();
    }

    Account const &account() const noexcept
    {
        return *account_;
    }
};

SPOOL_NAMESPACE_END
