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
#include <lockstake/core/version_stack.hpp>
#include <lockstake/staking/config.hpp>
#include <lockstake/staking/stake_ledger.hpp>
#include <lockstake/staking/stake_position.hpp>

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

LOCKSTAKE_STAKING_NAMESPACE_BEGIN

StakeLedger::StakeLedger(PoolState pool)
    : pool_{std::move(pool)}
{
}

std::optional<StakePosition> StakeLedger::get(Address const &account) const
{
    StakePosition const *const position = positions_.find(account);
    if (position == nullptr) {
        return std::nullopt;
    }
    return *position;
}

void StakeLedger::set(Address const &account, StakePosition const &position)
{
    positions_.current(account, version_, position) = position;
}

std::optional<uint64_t> StakeLedger::get_cursor(Address const &account) const
{
    uint64_t const *const cursor = cursors_.find(account);
    if (cursor == nullptr) {
        return std::nullopt;
    }
    return *cursor;
}

void StakeLedger::set_cursor(Address const &account, uint64_t const timestamp)
{
    cursors_.current(account, version_, timestamp) = timestamp;
}

PoolState const &StakeLedger::pool() const
{
    return pool_.recent();
}

PoolState &StakeLedger::pool_mut()
{
    return pool_.current(version_);
}

void StakeLedger::push()
{
    ++version_;
}

void StakeLedger::pop_accept()
{
    LOCKSTAKE_ASSERT(version_);

    positions_.pop_accept(version_);
    cursors_.pop_accept(version_);
    pool_.pop_accept(version_);

    --version_;
}

void StakeLedger::pop_reject()
{
    LOCKSTAKE_ASSERT(version_);

    positions_.pop_reject(version_);
    cursors_.pop_reject(version_);
    // the pool is created at version 0 so it is never left empty
    bool const pool_empty = pool_.pop_reject(version_);
    LOCKSTAKE_ASSERT(!pool_empty);

    --version_;
}

std::vector<std::pair<Address, StakePosition>> StakeLedger::positions() const
{
    return positions_.sorted();
}

LOCKSTAKE_STAKING_NAMESPACE_END
