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
#include <lockstake/staking/events.hpp>

#include <cstdint>

LOCKSTAKE_STAKING_NAMESPACE_BEGIN

class StakeLedger;
struct TransferCapability;

// Identity, block time and attached value of the call being executed.
struct CallContext
{
    Address caller;
    uint64_t timestamp;
    uint256_t value;
};

struct StakeInfo
{
    uint256_t amount;
    uint64_t started_at;
    uint32_t period;
    uint64_t active_until;
    uint256_t rewards;
    uint64_t next_reward_date;

    friend bool operator==(StakeInfo const &, StakeInfo const &) = default;
};

class StakingContract
{
    StakeLedger &ledger_;
    TransferCapability &native_;
    TransferCapability &reward_token_;
    EventSink &events_;

public:
    StakingContract(
        StakeLedger &, TransferCapability &native,
        TransferCapability &reward_token, EventSink &);

    ///////////////
    // Mutations //
    ///////////////

    // Deposit the attached value. A top-up collects pending rewards first and
    // keeps the existing active_until.
    Result<void> stake(CallContext const &, uint32_t period);

    // Re-lock a matured position for a new period. The principal is kept.
    Result<void> extend(CallContext const &, uint32_t period);

    Result<void> withdraw(CallContext const &);

    // Returns the principal immediately and forfeits unclaimed rewards.
    Result<void> emergency_withdraw(CallContext const &);

    Result<void> claim(CallContext const &);

    // Adds the attached value to the reward pool.
    Result<void> update_rewards_pool(CallContext const &);

    ///////////
    // Reads //
    ///////////

    // lock length in accrual periods
    Result<uint64_t> get_staking_period(Address const &) const;
    Result<uint256_t> available_rewards(Address const &, uint64_t now) const;
    Result<uint64_t>
    passed_reward_periods(Address const &, uint64_t now) const;
    Result<StakeInfo> all_stake_info(Address const &, uint64_t now) const;
    Result<uint64_t> next_reward_date(Address const &, uint64_t now) const;

private:
    enum class CollectMode
    {
        // claim(): zero elapsed periods is fatal
        Direct,
        // side effect of another operation: zero elapsed periods is a no-op
        NonDirect,
    };

    // Writes the position for a deposit of `value`. A zero value re-locks
    // from `now` for the new period.
    Result<void> stake_apply(
        Address const &, uint32_t period, uint256_t const &value,
        uint64_t now);

    // Zeroes the position and sends `amount` back to the account.
    Result<void>
    withdraw_apply(Address const &, uint256_t const &amount, bool is_early);

    Result<void> collect_rewards(Address const &, uint64_t now, CollectMode);

    void emit(Event const &);
};

LOCKSTAKE_STAKING_NAMESPACE_END
