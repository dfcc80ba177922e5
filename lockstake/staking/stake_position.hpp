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
#include <lockstake/staking/config.hpp>

#include <cstdint>
#include <vector>

LOCKSTAKE_STAKING_NAMESPACE_BEGIN

// An account's locked principal. A position with a zero amount is closed;
// withdrawal zeroes every field rather than erasing the entry.
struct StakePosition
{
    uint256_t amount{};
    uint64_t started_at{};
    uint32_t period{};
    uint64_t active_until{};

    bool is_open() const noexcept
    {
        return amount != 0;
    }

    friend bool
    operator==(StakePosition const &, StakePosition const &) = default;
};

struct PoolState
{
    Address reward_token{};
    uint256_t total_staked{};
    uint256_t rewards_balance{};
    uint256_t reward_rate{};
    uint256_t early_withdraw_fee{};
    uint256_t reward_conversion_rate{};
    std::vector<uint32_t> available_periods{};

    bool is_available_period(uint32_t period) const noexcept;

    friend bool operator==(PoolState const &, PoolState const &) = default;
};

// empty pool with the default rate, fee and periods
PoolState make_pool_state(
    Address const &reward_token, uint256_t const &reward_conversion_rate);

LOCKSTAKE_STAKING_NAMESPACE_END
