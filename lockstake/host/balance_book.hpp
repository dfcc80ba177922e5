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

#include <lockstake/core/address.hpp>
#include <lockstake/core/config.hpp>
#include <lockstake/core/int.hpp>
#include <lockstake/core/result.hpp>
#include <lockstake/core/version_stack.hpp>
#include <lockstake/staking/transfer.hpp>

#include <utility>
#include <vector>

LOCKSTAKE_NAMESPACE_BEGIN

// Per-address balances of one asset, checkpointed like the stake ledger.
class BalanceBook
{
    VersionedMap<Address, uint256_t> balances_{};
    unsigned version_{0};

public:
    BalanceBook() = default;
    BalanceBook(BalanceBook &&) = delete;
    BalanceBook(BalanceBook const &) = delete;
    BalanceBook &operator=(BalanceBook &&) = delete;
    BalanceBook &operator=(BalanceBook const &) = delete;

    uint256_t balance(Address const &) const;

    Result<void> credit(Address const &, uint256_t const &);

    // fails with HostError::InsufficientBalance
    Result<void> debit(Address const &, uint256_t const &);

    void push();
    void pop_accept();
    void pop_reject();

    // nonzero balances ordered by address
    std::vector<std::pair<Address, uint256_t>> balances() const;
};

// Pays out of a custody account held in a BalanceBook.
class BookTransfer : public staking::TransferCapability
{
    BalanceBook &book_;
    Address custody_;

public:
    BookTransfer(BalanceBook &, Address const &custody);

    Result<void>
    transfer(Address const &recipient, uint256_t const &amount) override;
};

LOCKSTAKE_NAMESPACE_END
