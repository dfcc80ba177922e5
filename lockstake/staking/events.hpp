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
#include <variant>

LOCKSTAKE_STAKING_NAMESPACE_BEGIN

// event Stake(account indexed, staked_at, period, sum, total_staked)
//
// total_staked is the account's principal after the deposit.
struct StakeEvent
{
    Address account;
    uint64_t staked_at;
    uint32_t period;
    uint256_t sum;
    uint256_t total_staked;

    friend bool operator==(StakeEvent const &, StakeEvent const &) = default;
};

// event Withdraw(account indexed, sum, is_early)
struct WithdrawEvent
{
    Address account;
    uint256_t sum;
    bool is_early;

    friend bool
    operator==(WithdrawEvent const &, WithdrawEvent const &) = default;
};

// event Claim(account indexed, periods, amount)
//
// amount is in pool units, before the reward token conversion.
struct ClaimEvent
{
    Address account;
    uint64_t periods;
    uint256_t amount;

    friend bool operator==(ClaimEvent const &, ClaimEvent const &) = default;
};

// event RewardPoolUpdated(amount)
struct RewardPoolUpdatedEvent
{
    uint256_t amount;

    friend bool operator==(
        RewardPoolUpdatedEvent const &,
        RewardPoolUpdatedEvent const &) = default;
};

using Event = std::variant<
    StakeEvent, WithdrawEvent, ClaimEvent, RewardPoolUpdatedEvent>;

struct EventSink
{
    virtual ~EventSink() = default;

    virtual void emit(Event const &) = 0;
};

LOCKSTAKE_STAKING_NAMESPACE_END
