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

#include <spool/core/assert.h>
#include <spool/runtime/ledger.hpp>

#include <utility>

SPOOL_NAMESPACE_BEGIN

Account const *Ledger::find(Pubkey const &key) const
{
    auto const it = accounts_.find(key);
    return it == accounts_.end() ? nullptr : &it->second;
}

Account &Ledger::touch(Pubkey const &key)
{
    auto const it = accounts_.find(key);
    if (!journals_.empty()) {
        auto &journal = journals_.back();
        if (!journal.contains(key)) {
            journal.emplace(
                key,
                it == accounts_.end() ? std::nullopt
                                      : std::make_optional(it->second));
        }
    }
    if (it != accounts_.end()) {
        return it->second;
    }
    return accounts_[key];
}

void Ledger::store(Pubkey const &key, Account account)
{
    touch(key) = std::move(account);
}

void Ledger::push()
{
    journals_.emplace_back();
}

void Ledger::pop_accept()
{
    SPOOL_ASSERT(!journals_.empty());
    auto journal = std::move(journals_.back());
    journals_.pop_back();
    if (journals_.empty()) {
        return;
    }
    // the enclosing checkpoint keeps its own older record if it has one
    auto &parent = journals_.back();
    for (auto &[key, original] : journal) {
        parent.try_emplace(key, std::move(original));
    }
}

void Ledger::pop_reject()
{
    SPOOL_ASSERT(!journals_.empty());
    for (auto &[key, original] : journals_.back()) {
        if (original.has_value()) {
            accounts_[key] = std::move(original.value());
        }
        else {
            accounts_[key] = Account{};
        }
    }
    journals_.pop_back();
}

Ledger::Journal const &Ledger::touched() const
{
    SPOOL_ASSERT(!journals_.empty());
    return journals_.back();
}

void Ledger::purge()
{
    SPOOL_ASSERT(journals_.empty());
    std::erase_if(accounts_, [](auto const &entry) {
        return entry.second.lamports == 0;
    });
}

SPOOL_NAMESPACE_END
