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
#include <lockstake/core/int.hpp>
#include <lockstake/core/result.hpp>
#include <lockstake/staking/config.hpp>

#include <cstdint>

LOCKSTAKE_STAKING_NAMESPACE_BEGIN

class StakeLedger;

struct Accrual
{
    uint64_t periods;
    uint256_t reward;
};

// amount * reward_rate * periods * REWARD_SCALE_NUMERATOR /
// REWARD_SCALE_DENOMINATOR, truncated once at the end
Result<uint256_t> accrued_reward(
    uint256_t const &amount, uint256_t const &reward_rate, uint64_t periods);

// Whole accrual periods elapsed between the account's cursor and
// min(now, active_until), and the reward owed for them. An account without a
// cursor is treated as never having claimed. A closed position owes nothing.
//
// Fails with StakingError::StakeNotFound if the account has no entry.
Result<Accrual> elapsed_periods_and_reward(
    StakeLedger const &, Address const &account, uint64_t now);

// Start of the next whole accrual period counted from started_at, or
// active_until once the position has matured.
Result<uint64_t> next_accrual_boundary(
    StakeLedger const &, Address const &account, uint64_t now);

LOCKSTAKE_STAKING_NAMESPACE_END
