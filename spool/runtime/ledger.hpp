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

#include <spool/core/config.hpp>
#include <spool/runtime/account.hpp>
#include <spool/runtime/pubkey.hpp>

#include <cstddef>
#include <optional>
#include <unordered_map>
#include <vector>

SPOOL_NAMESPACE_BEGIN

/// Account store with nested checkpoints. Every checkpoint records the
/// original value of each account touched after it was pushed, so a rejected
/// checkpoint restores exactly the accounts it changed. Restoring is done in
/// place, references handed out by `touch` stay valid until `purge`.
class Ledger
{
public:
    using Journal = std::unordered_map<Pubkey, std::optional<Account>>;

private:
    std::unordered_map<Pubkey, Account> accounts_;
    std::vector<Journal> journals_;

public:
    Account const *find(Pubkey const &) const;

    /// Mutable access; creates an empty system-owned account if absent
    Account &touch(Pubkey const &);

    void store(Pubkey const &, Account);

    void push();
    void pop_accept();
    void pop_reject();

    /// Accounts touched since the innermost checkpoint, with their values
    /// when it was pushed
    Journal const &touched() const;

    size_t depth() const noexcept
    {
        return journals_.size();
    }

    /// Drops accounts left with zero lamports, only valid with no open
    /// checkpoint
    void purge();

    std::unordered_map<Pubkey, Account> const &accounts() const noexcept
    {
        return accounts_;
    }
};

SPOOL_NAMESPACE_END
