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
#include <lockstake/core/fmt/address_fmt.hpp>
#include <lockstake/core/fmt/int_fmt.hpp>
#include <lockstake/core/int.hpp>
#include <lockstake/core/likely.h>
#include <lockstake/core/lockstake_exception.hpp>
#include <lockstake/core/result.hpp>
#include <lockstake/staking/config.hpp>
#include <lockstake/staking/constants.hpp>
#include <lockstake/staking/events.hpp>
#include <lockstake/staking/fmt/event_fmt.hpp>
#include <lockstake/staking/reward_accrual.hpp>
#include <lockstake/staking/stake_ledger.hpp>
#include <lockstake/staking/stake_position.hpp>
#include <lockstake/staking/staking_contract.hpp>
#include <lockstake/staking/staking_error.hpp>
#include <lockstake/staking/transfer.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <cstdint>

LOCKSTAKE_STAKING_ANONYMOUS_NAMESPACE_BEGIN

Result<void> function_not_payable(uint256_t const &value)
{
    if (LOCKSTAKE_UNLIKELY(value != 0)) {
        return StakingError::ValueNonZero;
    }
    return outcome::success();
}

// now + period * PERIODS_PER_LOCK_UNIT accrual periods
Result<uint64_t> lock_end(uint64_t const now, uint32_t const period)
{
    BOOST_OUTCOME_TRY(
        auto const length,
        checked_mul(
            uint256_t{period},
            uint256_t{PERIODS_PER_LOCK_UNIT} * uint256_t{ACCRUAL_PERIOD}));
    BOOST_OUTCOME_TRY(auto const end, checked_add(length, now));
    return checked_narrow(end);
}

LOCKSTAKE_STAKING_ANONYMOUS_NAMESPACE_END

LOCKSTAKE_STAKING_NAMESPACE_BEGIN

StakingContract::StakingContract(
    StakeLedger &ledger, TransferCapability &native,
    TransferCapability &reward_token, EventSink &events)
    : ledger_{ledger}
    , native_{native}
    , reward_token_{reward_token}
    , events_{events}
{
}

void StakingContract::emit(Event const &event)
{
    LOG_DEBUG("StakingContract: emit {}", event);
    events_.emit(event);
}

Result<void> StakingContract::stake_apply(
    Address const &account, uint32_t const period, uint256_t const &value,
    uint64_t const now)
{
    if (LOCKSTAKE_UNLIKELY(!ledger_.pool().is_available_period(period))) {
        return StakingError::InvalidPeriod;
    }

    auto const existing = ledger_.get(account);
    bool const open = existing.has_value() && existing->is_open();

    uint256_t new_amount = value;
    if (open) {
        BOOST_OUTCOME_TRY(new_amount, checked_add(existing->amount, value));
    }

    // only a fresh position or a re-lock moves the maturity date
    uint64_t active_until;
    if (!open || value == 0) {
        BOOST_OUTCOME_TRY(active_until, lock_end(now, period));
    }
    else {
        active_until = existing->active_until;
    }

    ledger_.set(
        account,
        StakePosition{
            .amount = new_amount,
            .started_at = now,
            .period = period,
            .active_until = active_until});
    if (!open) {
        ledger_.set_cursor(account, now);
    }

    auto &pool = ledger_.pool_mut();
    BOOST_OUTCOME_TRY(pool.total_staked, checked_add(pool.total_staked, value));

    emit(StakeEvent{
        .account = account,
        .staked_at = now,
        .period = period,
        .sum = value,
        .total_staked = new_amount});
    return outcome::success();
}

Result<void> StakingContract::withdraw_apply(
    Address const &account, uint256_t const &amount, bool const is_early)
{
    ledger_.set(account, StakePosition{});

    auto const res = native_.transfer(account, amount);
    if (LOCKSTAKE_UNLIKELY(res.has_error())) {
        LOG_WARNING(
            "StakingContract: native transfer of {} to {} failed: {}",
            amount,
            account,
            res.error().message().c_str());
        return StakingError::TransferFailed;
    }

    emit(WithdrawEvent{.account = account, .sum = amount, .is_early = is_early});
    return outcome::success();
}

Result<void> StakingContract::collect_rewards(
    Address const &account, uint64_t const now, CollectMode const mode)
{
    auto const position = ledger_.get(account);
    if (!position.has_value() || !position->is_open()) {
        return outcome::success();
    }

    BOOST_OUTCOME_TRY(
        auto const accrual, elapsed_periods_and_reward(ledger_, account, now));
    if (mode == CollectMode::NonDirect && accrual.periods == 0) {
        return outcome::success();
    }

    auto &pool = ledger_.pool_mut();
    LOCKSTAKE_ASSERT_THROW(
        pool.rewards_balance >= accrual.reward, "not enough rewards");
    LOCKSTAKE_ASSERT_THROW(accrual.periods > 0, "too early");

    // the cursor moves by whole periods so partial periods carry over
    uint64_t const cursor = ledger_.get_cursor(account).value_or(0);
    ledger_.set_cursor(account, cursor + accrual.periods * ACCRUAL_PERIOD);
    pool.rewards_balance -= accrual.reward;

    BOOST_OUTCOME_TRY(
        auto const payout,
        checked_mul(accrual.reward, pool.reward_conversion_rate));

    emit(ClaimEvent{
        .account = account,
        .periods = accrual.periods,
        .amount = accrual.reward});

    auto const res = reward_token_.transfer(account, payout);
    if (LOCKSTAKE_UNLIKELY(res.has_error())) {
        LOG_WARNING(
            "StakingContract: reward token {} transfer of {} to {} failed: {}",
            pool.reward_token,
            payout,
            account,
            res.error().message().c_str());
        return StakingError::TransferFailed;
    }
    return outcome::success();
}

Result<void>
StakingContract::stake(CallContext const &ctx, uint32_t const period)
{
    LOCKSTAKE_ASSERT_THROW(ctx.value > 0, "amount should be > 0");

    auto const existing = ledger_.get(ctx.caller);
    if (existing.has_value() && existing->is_open()) {
        BOOST_OUTCOME_TRY(collect_rewards(
            ctx.caller, ctx.timestamp, CollectMode::NonDirect));
    }
    return stake_apply(ctx.caller, period, ctx.value, ctx.timestamp);
}

Result<void>
StakingContract::extend(CallContext const &ctx, uint32_t const period)
{
    BOOST_OUTCOME_TRY(function_not_payable(ctx.value));

    auto const existing = ledger_.get(ctx.caller);
    if (LOCKSTAKE_UNLIKELY(!existing.has_value())) {
        return StakingError::StakeNotFound;
    }
    if (LOCKSTAKE_UNLIKELY(!existing->is_open())) {
        return StakingError::NoStake;
    }
    if (existing->active_until >= ctx.timestamp) {
        return StakingError::StillActive;
    }

    BOOST_OUTCOME_TRY(
        collect_rewards(ctx.caller, ctx.timestamp, CollectMode::NonDirect));
    return stake_apply(ctx.caller, period, 0, ctx.timestamp);
}

Result<void> StakingContract::withdraw(CallContext const &ctx)
{
    BOOST_OUTCOME_TRY(function_not_payable(ctx.value));

    auto const existing = ledger_.get(ctx.caller);
    if (LOCKSTAKE_UNLIKELY(!existing.has_value() || !existing->is_open())) {
        return StakingError::NoStake;
    }

    BOOST_OUTCOME_TRY(
        collect_rewards(ctx.caller, ctx.timestamp, CollectMode::NonDirect));

    auto const position = ledger_.get(ctx.caller);
    if (LOCKSTAKE_UNLIKELY(!position.has_value())) {
        return StakingError::StakeNotFound;
    }
    return withdraw_apply(ctx.caller, position->amount, false);
}

Result<void> StakingContract::emergency_withdraw(CallContext const &ctx)
{
    BOOST_OUTCOME_TRY(function_not_payable(ctx.value));

    auto const existing = ledger_.get(ctx.caller);
    if (LOCKSTAKE_UNLIKELY(!existing.has_value() || !existing->is_open())) {
        return StakingError::NoStake;
    }
    return withdraw_apply(ctx.caller, existing->amount, true);
}

Result<void> StakingContract::claim(CallContext const &ctx)
{
    BOOST_OUTCOME_TRY(function_not_payable(ctx.value));

    auto const existing = ledger_.get(ctx.caller);
    if (LOCKSTAKE_UNLIKELY(!existing.has_value() || !existing->is_open())) {
        return StakingError::NoStake;
    }
    return collect_rewards(ctx.caller, ctx.timestamp, CollectMode::Direct);
}

Result<void> StakingContract::update_rewards_pool(CallContext const &ctx)
{
    LOCKSTAKE_ASSERT_THROW(ctx.value > 0, "amount should be > 0");

    auto &pool = ledger_.pool_mut();
    BOOST_OUTCOME_TRY(
        pool.rewards_balance, checked_add(pool.rewards_balance, ctx.value));

    emit(RewardPoolUpdatedEvent{.amount = ctx.value});
    return outcome::success();
}

Result<uint64_t>
StakingContract::get_staking_period(Address const &account) const
{
    auto const position = ledger_.get(account);
    if (LOCKSTAKE_UNLIKELY(!position.has_value())) {
        return StakingError::StakeNotFound;
    }
    if (!position->is_open()) {
        return uint64_t{0};
    }
    BOOST_OUTCOME_TRY(
        auto const length,
        checked_sub(position->active_until, position->started_at));
    return static_cast<uint64_t>(length) / ACCRUAL_PERIOD;
}

Result<uint256_t> StakingContract::available_rewards(
    Address const &account, uint64_t const now) const
{
    BOOST_OUTCOME_TRY(
        auto const accrual, elapsed_periods_and_reward(ledger_, account, now));
    return accrual.reward;
}

Result<uint64_t> StakingContract::passed_reward_periods(
    Address const &account, uint64_t const now) const
{
    BOOST_OUTCOME_TRY(
        auto const accrual, elapsed_periods_and_reward(ledger_, account, now));
    return accrual.periods;
}

Result<StakeInfo>
StakingContract::all_stake_info(Address const &account, uint64_t const now) const
{
    auto const position = ledger_.get(account);
    if (LOCKSTAKE_UNLIKELY(!position.has_value())) {
        return StakingError::StakeNotFound;
    }

    StakeInfo info{
        .amount = position->amount,
        .started_at = position->started_at,
        .period = position->period,
        .active_until = position->active_until,
        .rewards = 0,
        .next_reward_date = 0};
    if (position->is_open()) {
        BOOST_OUTCOME_TRY(
            auto const accrual,
            elapsed_periods_and_reward(ledger_, account, now));
        BOOST_OUTCOME_TRY(
            info.next_reward_date,
            next_accrual_boundary(ledger_, account, now));
        info.rewards = accrual.reward;
    }
    return info;
}

Result<uint64_t> StakingContract::next_reward_date(
    Address const &account, uint64_t const now) const
{
    return next_accrual_boundary(ledger_, account, now);
}

LOCKSTAKE_STAKING_NAMESPACE_END
