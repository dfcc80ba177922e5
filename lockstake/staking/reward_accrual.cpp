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
#include <lockstake/core/checked_math.hpp>
#include <lockstake/core/int.hpp>
#include <lockstake/core/likely.h>
#include <lockstake/core/result.hpp>
#include <lockstake/staking/config.hpp>
#include <lockstake/staking/constants.hpp>
#include <lockstake/staking/reward_accrual.hpp>
#include <lockstake/staking/stake_ledger.hpp>
#include <lockstake/staking/staking_error.hpp>

#include <boost/outcome/config.hpp>
#include <boost/outcome/try.hpp>

#include <algorithm>
#include <cstdint>

LOCKSTAKE_STAKING_NAMESPACE_BEGIN

Result<uint256_t> accrued_reward(
    uint256_t const &amount, uint256_t const &reward_rate,
    uint64_t const periods)
{
    BOOST_OUTCOME_TRY(auto const weighted, checked_mul(amount, reward_rate));
    BOOST_OUTCOME_TRY(auto const scaled, checked_mul(weighted, periods));
    BOOST_OUTCOME_TRY(
        auto const numerator, checked_mul(scaled, REWARD_SCALE_NUMERATOR));
    return numerator / REWARD_SCALE_DENOMINATOR;
}

Result<Accrual> elapsed_periods_and_reward(
    StakeLedger const &ledger, Address const &account, uint64_t const now)
{
    auto const position = ledger.get(account);
    if (LOCKSTAKE_UNLIKELY(!position.has_value())) {
        return StakingError::StakeNotFound;
    }
    if (!position->is_open()) {
        return Accrual{.periods = 0, .reward = 0};
    }

    uint64_t const t = std::min(now, position->active_until);
    uint64_t const cursor = ledger.get_cursor(account).value_or(0);
    BOOST_OUTCOME_TRY(auto const elapsed, checked_sub(t, cursor));
    uint64_t const periods = static_cast<uint64_t>(elapsed) / ACCRUAL_PERIOD;

    BOOST_OUTCOME_TRY(
        auto const reward,
        accrued_reward(position->amount, ledger.pool().reward_rate, periods));
    return Accrual{.periods = periods, .reward = reward};
}

Result<uint64_t> next_accrual_boundary(
    StakeLedger const &ledger, Address const &account, uint64_t const now)
{
    if (LOCKSTAKE_UNLIKELY(!ledger.get_cursor(account).has_value())) {
        return StakingError::ClaimCursorNotFound;
    }
    auto const position = ledger.get(account);
    if (LOCKSTAKE_UNLIKELY(!position.has_value())) {
        return StakingError::StakeNotFound;
    }

    if (now > position->active_until) {
        return position->active_until;
    }
    BOOST_OUTCOME_TRY(
        auto const elapsed, checked_sub(now, position->started_at));
    uint64_t const passed = static_cast<uint64_t>(elapsed) / ACCRUAL_PERIOD;
    BOOST_OUTCOME_TRY(
        auto const boundary,
        checked_add(
            (uint256_t{passed} + 1) * uint256_t{ACCRUAL_PERIOD},
            position->started_at));
    return checked_narrow(boundary);
}

LOCKSTAKE_STAKING_NAMESPACE_END
