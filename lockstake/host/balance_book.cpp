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

#include <lockstake/core/address.hpp>
#include <lockstake/core/assert.h>
#include <lockstake/core/checked_math.hpp>
#include <lockstake/core/config.hpp>
#include <lockstake/core/int.hpp>
#include <lockstake/core/likely.h>
#include <lockstake/core/result.hpp>
#include <lockstake/host/balance_book.hpp>
#include <lockstake/host/host_error.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <utility>
#include <vector>

LOCKSTAKE_NAMESPACE_BEGIN

uint256_t BalanceBook::balance(Address const &address) const
{
    uint256_t const *const held = balances_.find(address);
    return held ? *held : uint256_t{0};
}

Result<void>
BalanceBook::credit(Address const &address, uint256_t const &amount)
{
    BOOST_OUTCOME_TRY(auto const sum, checked_add(balance(address), amount));
    balances_.current(address, version_, 0) = sum;
    return outcome::success();
}

Result<void>
BalanceBook::debit(Address const &address, uint256_t const &amount)
{
    auto const held = balance(address);
    if (LOCKSTAKE_UNLIKELY(held < amount)) {
        return HostError::InsufficientBalance;
    }
    balances_.current(address, version_, 0) = held - amount;
    return outcome::success();
}

void BalanceBook::push()
{
    ++version_;
}

void BalanceBook::pop_accept()
{
    LOCKSTAKE_ASSERT(version_);

    balances_.pop_accept(version_);

    --version_;
}

void BalanceBook::pop_reject()
{
    LOCKSTAKE_ASSERT(version_);

    balances_.pop_reject(version_);

    --version_;
}

std::vector<std::pair<Address, uint256_t>> BalanceBook::balances() const
{
    auto result = balances_.sorted();
    std::erase_if(result, [](auto const &entry) { return entry.second == 0; });
    return result;
}

BookTransfer::BookTransfer(BalanceBook &book, Address const &custody)
    : book_{book}
    , custody_{custody}
{
}

Result<void>
BookTransfer::transfer(Address const &recipient, uint256_t const &amount)
{
    BOOST_OUTCOME_TRY(book_.debit(custody_, amount));
    return book_.credit(recipient, amount);
}

LOCKSTAKE_NAMESPACE_END
