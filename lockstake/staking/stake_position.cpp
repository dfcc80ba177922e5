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
#include <lockstake/core/int.hpp>
#include <lockstake/staking/config.hpp>
#include <lockstake/staking/constants.hpp>
#include <lockstake/staking/stake_position.hpp>

#include <algorithm>
#include <cstdint>

LOCKSTAKE_STAKING_NAMESPACE_BEGIN

bool PoolState::is_available_period(uint32_t const period) const noexcept
{
    return std::find(
               available_periods.begin(), available_periods.end(), period) !=
           available_periods.end();
}

PoolState make_pool_state(
    Address const &reward_token, uint256_t const &reward_conversion_rate)
{
    return PoolState{
        .reward_token = reward_token,
        .total_staked = 0,
        .rewards_balance = 0,
        .reward_rate = DEFAULT_REWARD_RATE,
        .early_withdraw_fee = DEFAULT_EARLY_WITHDRAW_FEE,
        .reward_conversion_rate = reward_conversion_rate,
        .available_periods = {
            DEFAULT_AVAILABLE_PERIODS.begin(),
            DEFAULT_AVAILABLE_PERIODS.end()}};
}

LOCKSTAKE_STAKING_NAMESPACE_END
