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
#include <lockstake/core/version_stack.hpp>
#include <lockstake/staking/config.hpp>
#include <lockstake/staking/stake_position.hpp>

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

LOCKSTAKE_STAKING_NAMESPACE_BEGIN

// Account positions, accrual cursors and the pool counters. The ledger does
// no validation of its own. Writes made after push() are kept or discarded
// together by pop_accept() / pop_reject().
class StakeLedger
{
    VersionedMap<Address, StakePosition> positions_{};
    VersionedMap<Address, uint64_t> cursors_{};
    VersionStack<PoolState> pool_;
    unsigned version_{0};

public:
    explicit StakeLedger(PoolState pool);

    StakeLedger(StakeLedger &&) = delete;
    StakeLedger(StakeLedger const &) = delete;
    StakeLedger &operator=(StakeLedger &&) = delete;
    StakeLedger &operator=(StakeLedger const &) = delete;

    std::optional<StakePosition> get(Address const &) const;
    void set(Address const &, StakePosition const &);

    // timestamp up to which rewards have been paid out
    std::optional<uint64_t> get_cursor(Address const &) const;
    void set_cursor(Address const &, uint64_t);

    PoolState const &pool() const;
    PoolState &pool_mut();

    unsigned version() const
    {
        return version_;
    }

    void push();
    void pop_accept();
    void pop_reject();

    // every account with an entry, ordered by address
    std::vector<std::pair<Address, StakePosition>> positions() const;
};

LOCKSTAKE_STAKING_NAMESPACE_END
