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
#include <lockstake/core/lockstake_exception.hpp>
#include <lockstake/core/result.hpp>
#include <lockstake/staking/constants.hpp>
#include <lockstake/staking/events.hpp>
#include <lockstake/staking/stake_ledger.hpp>
#include <lockstake/staking/stake_position.hpp>
#include <lockstake/staking/staking_contract.hpp>
#include <lockstake/staking/staking_error.hpp>
#include <lockstake/staking/transfer.hpp>

#include <boost/outcome/success_failure.hpp>

#include <evmc/evmc.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

using namespace lockstake;
using namespace lockstake::staking;
using namespace evmc::literals;

namespace
{
    constexpr Address ALICE{0xa11ce_address};
    constexpr Address BOB{0xb0b_address};
    constexpr Address REWARD_TOKEN{0x7e57_address};
    constexpr Address OPERATOR{0x0be7a702_address};

    constexpr uint64_t DAY{ACCRUAL_PERIOD};
    constexpr uint64_t T0{1'700'000'000};
    constexpr uint64_t SIX_MONTHS{6 * 30 * DAY};
    constexpr uint64_t TWELVE_MONTHS{12 * 30 * DAY};

    struct RecordingTransfer : public TransferCapability
    {
        std::vector<std::pair<Address, uint256_t>> sent;
        bool fail{false};

        Result<void>
        transfer(Address const &recipient, uint256_t const &amount) override
        {
            if (fail) {
                return StakingError::TransferFailed;
            }
            sent.emplace_back(recipient, amount);
            return outcome::success();
        }
    };

    struct RecordingSink : public EventSink
    {
        std::vector<Event> events;

        void emit(Event const &event) override
        {
            events.push_back(event);
        }
    };
}

struct Lockstake : public ::testing::Test
{
    StakeLedger ledger{make_pool_state(REWARD_TOKEN, 1)};
    RecordingTransfer native;
    RecordingTransfer reward_token;
    RecordingSink sink;
    StakingContract contract{ledger, native, reward_token, sink};

    void post_call(bool err)
    {
        if (!err) {
            ledger.pop_accept();
        }
        else {
            ledger.pop_reject();
        }
    }

    template <class F>
    Result<void> call(F &&f)
    {
        ledger.push();
        try {
            auto res = f();
            post_call(res.has_error());
            return res;
        }
        catch (LockstakeException const &) {
            ledger.pop_reject();
            throw;
        }
    }

    Result<void> stake(
        Address const &account, uint64_t now, uint256_t const &value,
        uint32_t period)
    {
        return call([&] {
            return contract.stake(
                CallContext{.caller = account, .timestamp = now, .value = value},
                period);
        });
    }

    Result<void> extend(Address const &account, uint64_t now, uint32_t period)
    {
        return call([&] {
            return contract.extend(
                CallContext{.caller = account, .timestamp = now, .value = 0},
                period);
        });
    }

    Result<void> withdraw(Address const &account, uint64_t now)
    {
        return call([&] {
            return contract.withdraw(
                CallContext{.caller = account, .timestamp = now, .value = 0});
        });
    }

    Result<void> emergency_withdraw(Address const &account, uint64_t now)
    {
        return call([&] {
            return contract.emergency_withdraw(
                CallContext{.caller = account, .timestamp = now, .value = 0});
        });
    }

    Result<void>
    claim(Address const &account, uint64_t now, uint256_t const &value = 0)
    {
        return call([&] {
            return contract.claim(
                CallContext{.caller = account, .timestamp = now, .value = value});
        });
    }

    Result<void> fund_pool(uint256_t const &value)
    {
        return call([&] {
            return contract.update_rewards_pool(CallContext{
                .caller = OPERATOR, .timestamp = T0, .value = value});
        });
    }
};

TEST_F(Lockstake, stake_opens_position)
{
    EXPECT_FALSE(stake(ALICE, T0, 10000, 6).has_error());

    EXPECT_EQ(
        ledger.get(ALICE),
        (StakePosition{
            .amount = 10000,
            .started_at = T0,
            .period = 6,
            .active_until = T0 + SIX_MONTHS}));
    EXPECT_EQ(ledger.get_cursor(ALICE), T0);
    EXPECT_EQ(ledger.pool().total_staked, 10000);

    ASSERT_EQ(sink.events.size(), 1);
    EXPECT_EQ(
        sink.events[0],
        Event{StakeEvent{
            .account = ALICE,
            .staked_at = T0,
            .period = 6,
            .sum = 10000,
            .total_staked = 10000}});
}

TEST_F(Lockstake, stake_zero_value_is_fatal)
{
    try {
        (void)stake(ALICE, T0, 0, 6);
        FAIL() << "expected LockstakeException";
    }
    catch (LockstakeException const &e) {
        EXPECT_EQ(std::string_view{e.message()}, "amount should be > 0");
    }
    EXPECT_FALSE(ledger.get(ALICE).has_value());
    EXPECT_EQ(ledger.version(), 0);
}

TEST_F(Lockstake, stake_invalid_period)
{
    auto const res = stake(ALICE, T0, 10000, 7);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), StakingError::InvalidPeriod);
    EXPECT_FALSE(ledger.get(ALICE).has_value());
    EXPECT_EQ(ledger.pool().total_staked, 0);
    EXPECT_TRUE(sink.events.empty());
}

TEST_F(Lockstake, total_staked_sums_deposits)
{
    EXPECT_FALSE(stake(ALICE, T0, 10000, 6).has_error());
    EXPECT_FALSE(stake(BOB, T0 + 10, 2500, 12).has_error());
    EXPECT_FALSE(stake(ALICE, T0 + 20, 1, 6).has_error());
    EXPECT_EQ(ledger.pool().total_staked, 12501);
}

TEST_F(Lockstake, top_up_keeps_active_until)
{
    EXPECT_FALSE(stake(ALICE, T0, 10000, 6).has_error());
    EXPECT_FALSE(stake(ALICE, T0 + DAY / 2, 5000, 12).has_error());

    // the stored period changes but maturity does not
    EXPECT_EQ(
        ledger.get(ALICE),
        (StakePosition{
            .amount = 15000,
            .started_at = T0 + DAY / 2,
            .period = 12,
            .active_until = T0 + SIX_MONTHS}));
    EXPECT_EQ(ledger.get_cursor(ALICE), T0);
    EXPECT_EQ(ledger.pool().total_staked, 15000);
    EXPECT_TRUE(reward_token.sent.empty());

    ASSERT_EQ(sink.events.size(), 2);
    auto const *event = std::get_if<StakeEvent>(&sink.events[1]);
    ASSERT_NE(event, nullptr);
    EXPECT_EQ(event->sum, 5000);
    EXPECT_EQ(event->total_staked, 15000);
}

TEST_F(Lockstake, top_up_collects_rewards)
{
    EXPECT_FALSE(fund_pool(1000).has_error());
    EXPECT_FALSE(stake(ALICE, T0, 10000, 6).has_error());
    EXPECT_FALSE(stake(ALICE, T0 + 3 * DAY + 100, 10000, 6).has_error());

    EXPECT_EQ(ledger.get_cursor(ALICE), T0 + 3 * DAY);
    EXPECT_EQ(ledger.pool().rewards_balance, 584);
    ASSERT_EQ(reward_token.sent.size(), 1);
    EXPECT_EQ(reward_token.sent[0].first, ALICE);
    EXPECT_EQ(reward_token.sent[0].second, 416);

    ASSERT_EQ(sink.events.size(), 4);
    EXPECT_EQ(
        sink.events[2],
        Event{ClaimEvent{.account = ALICE, .periods = 3, .amount = 416}});
    EXPECT_EQ(ledger.get(ALICE)->amount, 20000);
}

TEST_F(Lockstake, reopen_after_withdraw_is_a_fresh_deposit)
{
    EXPECT_FALSE(stake(ALICE, T0, 10000, 6).has_error());
    EXPECT_FALSE(withdraw(ALICE, T0 + 10).has_error());
    EXPECT_FALSE(stake(ALICE, T0 + 20, 3000, 12).has_error());

    EXPECT_EQ(
        ledger.get(ALICE),
        (StakePosition{
            .amount = 3000,
            .started_at = T0 + 20,
            .period = 12,
            .active_until = T0 + 20 + TWELVE_MONTHS}));
    EXPECT_EQ(ledger.get_cursor(ALICE), T0 + 20);
}

TEST_F(Lockstake, extend_before_maturity)
{
    EXPECT_FALSE(stake(ALICE, T0, 10000, 6).has_error());

    auto res = extend(ALICE, T0 + DAY, 12);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), StakingError::StillActive);

    // maturity itself is still active
    res = extend(ALICE, T0 + SIX_MONTHS, 12);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), StakingError::StillActive);
}

TEST_F(Lockstake, extend_after_maturity)
{
    EXPECT_FALSE(fund_pool(100000).has_error());
    EXPECT_FALSE(stake(ALICE, T0, 10000, 6).has_error());

    uint64_t const now = T0 + SIX_MONTHS + 10;
    EXPECT_FALSE(extend(ALICE, now, 12).has_error());

    EXPECT_EQ(
        ledger.get(ALICE),
        (StakePosition{
            .amount = 10000,
            .started_at = now,
            .period = 12,
            .active_until = now + TWELVE_MONTHS}));
    EXPECT_EQ(ledger.get_cursor(ALICE), T0 + SIX_MONTHS);
    EXPECT_EQ(ledger.pool().total_staked, 10000);
    EXPECT_EQ(ledger.pool().rewards_balance, 75000);
    ASSERT_EQ(reward_token.sent.size(), 1);
    EXPECT_EQ(reward_token.sent[0].second, 25000);

    auto const *event = std::get_if<StakeEvent>(&sink.events.back());
    ASSERT_NE(event, nullptr);
    EXPECT_EQ(event->sum, 0);
    EXPECT_EQ(event->total_staked, 10000);
}

TEST_F(Lockstake, extend_invalid_period)
{
    EXPECT_FALSE(fund_pool(100000).has_error());
    EXPECT_FALSE(stake(ALICE, T0, 10000, 6).has_error());

    auto const res = extend(ALICE, T0 + SIX_MONTHS + 10, 9);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), StakingError::InvalidPeriod);

    // the collection made before the period check is discarded with the call
    EXPECT_EQ(ledger.get_cursor(ALICE), T0);
    EXPECT_EQ(ledger.pool().rewards_balance, 100000);
}

TEST_F(Lockstake, extend_without_stake)
{
    auto res = extend(ALICE, T0, 6);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), StakingError::StakeNotFound);

    EXPECT_FALSE(stake(ALICE, T0, 10000, 6).has_error());
    EXPECT_FALSE(emergency_withdraw(ALICE, T0 + 1).has_error());

    res = extend(ALICE, T0 + 2 * SIX_MONTHS, 6);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), StakingError::NoStake);
}

TEST_F(Lockstake, withdraw_returns_principal)
{
    EXPECT_FALSE(stake(ALICE, T0, 10000, 6).has_error());
    EXPECT_FALSE(withdraw(ALICE, T0 + DAY / 2).has_error());

    ASSERT_EQ(native.sent.size(), 1);
    EXPECT_EQ(native.sent[0].first, ALICE);
    EXPECT_EQ(native.sent[0].second, 10000);
    EXPECT_EQ(ledger.get(ALICE), StakePosition{});
    EXPECT_TRUE(reward_token.sent.empty());

    // withdrawals leave the pool total alone
    EXPECT_EQ(ledger.pool().total_staked, 10000);

    EXPECT_EQ(
        sink.events.back(),
        Event{WithdrawEvent{.account = ALICE, .sum = 10000, .is_early = false}});

    auto const res = withdraw(ALICE, T0 + DAY);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), StakingError::NoStake);
    EXPECT_EQ(native.sent.size(), 1);
}

TEST_F(Lockstake, withdraw_collects_rewards)
{
    EXPECT_FALSE(fund_pool(1000).has_error());
    EXPECT_FALSE(stake(ALICE, T0, 10000, 6).has_error());
    EXPECT_FALSE(withdraw(ALICE, T0 + 3 * DAY).has_error());

    ASSERT_EQ(reward_token.sent.size(), 1);
    EXPECT_EQ(reward_token.sent[0].second, 416);
    ASSERT_EQ(native.sent.size(), 1);
    EXPECT_EQ(native.sent[0].second, 10000);
    EXPECT_EQ(ledger.pool().rewards_balance, 584);
}

TEST_F(Lockstake, withdraw_insolvent_pool_is_fatal)
{
    EXPECT_FALSE(stake(ALICE, T0, 10000, 6).has_error());
    EXPECT_THROW((void)withdraw(ALICE, T0 + 3 * DAY), LockstakeException);
    EXPECT_EQ(ledger.get(ALICE)->amount, 10000);
    EXPECT_TRUE(native.sent.empty());
}

TEST_F(Lockstake, withdraw_transfer_failed)
{
    EXPECT_FALSE(stake(ALICE, T0, 10000, 6).has_error());
    native.fail = true;

    auto const res = withdraw(ALICE, T0 + DAY / 2);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), StakingError::TransferFailed);
    EXPECT_EQ(ledger.get(ALICE)->amount, 10000);
}

TEST_F(Lockstake, emergency_withdraw_forfeits_rewards)
{
    EXPECT_FALSE(fund_pool(1000).has_error());
    EXPECT_FALSE(stake(ALICE, T0, 10000, 6).has_error());
    EXPECT_FALSE(emergency_withdraw(ALICE, T0 + 3 * DAY).has_error());

    ASSERT_EQ(native.sent.size(), 1);
    EXPECT_EQ(native.sent[0].second, 10000);
    EXPECT_TRUE(reward_token.sent.empty());
    EXPECT_EQ(ledger.pool().rewards_balance, 1000);
    EXPECT_EQ(ledger.get_cursor(ALICE), T0);
    EXPECT_EQ(ledger.get(ALICE), StakePosition{});
    EXPECT_EQ(
        sink.events.back(),
        Event{WithdrawEvent{.account = ALICE, .sum = 10000, .is_early = true}});

    auto const res = emergency_withdraw(ALICE, T0 + 4 * DAY);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), StakingError::NoStake);
}

TEST_F(Lockstake, claim_pays_converted_reward)
{
    ledger.pool_mut().reward_conversion_rate = 3;
    EXPECT_FALSE(fund_pool(1000).has_error());
    EXPECT_FALSE(stake(ALICE, T0, 10000, 6).has_error());
    EXPECT_FALSE(claim(ALICE, T0 + 3 * DAY + DAY / 2).has_error());

    ASSERT_EQ(reward_token.sent.size(), 1);
    EXPECT_EQ(reward_token.sent[0].first, ALICE);
    EXPECT_EQ(reward_token.sent[0].second, 1248);
    EXPECT_EQ(ledger.pool().rewards_balance, 584);
    EXPECT_EQ(ledger.get_cursor(ALICE), T0 + 3 * DAY);
    EXPECT_EQ(
        sink.events.back(),
        Event{ClaimEvent{.account = ALICE, .periods = 3, .amount = 416}});

    // the half period left over counts towards the next claim
    EXPECT_FALSE(claim(ALICE, T0 + 4 * DAY).has_error());
    EXPECT_EQ(ledger.get_cursor(ALICE), T0 + 4 * DAY);
    EXPECT_EQ(reward_token.sent.back().second, 3 * 138);
}

TEST_F(Lockstake, claim_without_elapsed_period_is_fatal)
{
    EXPECT_FALSE(fund_pool(1000).has_error());
    EXPECT_FALSE(stake(ALICE, T0, 10000, 6).has_error());

    try {
        (void)claim(ALICE, T0 + DAY - 1);
        FAIL() << "expected LockstakeException";
    }
    catch (LockstakeException const &e) {
        EXPECT_EQ(std::string_view{e.message()}, "too early");
    }
    EXPECT_EQ(ledger.version(), 0);
    EXPECT_EQ(ledger.get_cursor(ALICE), T0);

    // the same condition is a no-op when reached through another operation
    EXPECT_FALSE(stake(ALICE, T0 + DAY - 1, 1, 6).has_error());
    EXPECT_FALSE(withdraw(ALICE, T0 + DAY - 1).has_error());
    EXPECT_TRUE(reward_token.sent.empty());
}

TEST_F(Lockstake, claim_insolvent_pool_is_fatal)
{
    EXPECT_FALSE(fund_pool(100).has_error());
    EXPECT_FALSE(stake(ALICE, T0, 10000, 6).has_error());

    try {
        (void)claim(ALICE, T0 + 3 * DAY);
        FAIL() << "expected LockstakeException";
    }
    catch (LockstakeException const &e) {
        EXPECT_EQ(std::string_view{e.message()}, "not enough rewards");
    }
    EXPECT_EQ(ledger.pool().rewards_balance, 100);
    EXPECT_EQ(ledger.get_cursor(ALICE), T0);
    EXPECT_TRUE(reward_token.sent.empty());
}

TEST_F(Lockstake, claimants_compete_for_the_pool)
{
    EXPECT_FALSE(fund_pool(500).has_error());
    EXPECT_FALSE(stake(ALICE, T0, 10000, 6).has_error());
    EXPECT_FALSE(stake(BOB, T0, 10000, 6).has_error());

    EXPECT_FALSE(claim(ALICE, T0 + 3 * DAY).has_error());
    EXPECT_EQ(ledger.pool().rewards_balance, 84);

    try {
        (void)claim(BOB, T0 + 3 * DAY);
        FAIL() << "expected LockstakeException";
    }
    catch (LockstakeException const &e) {
        EXPECT_EQ(std::string_view{e.message()}, "not enough rewards");
    }
    EXPECT_EQ(ledger.pool().rewards_balance, 84);
    EXPECT_EQ(ledger.get_cursor(BOB), T0);
    EXPECT_EQ(ledger.get_cursor(ALICE), T0 + 3 * DAY);
    ASSERT_EQ(reward_token.sent.size(), 1);
    EXPECT_EQ(reward_token.sent[0].first, ALICE);

    // a top-up lets the later claimant through
    EXPECT_FALSE(fund_pool(332).has_error());
    EXPECT_FALSE(claim(BOB, T0 + 3 * DAY).has_error());
    EXPECT_EQ(ledger.pool().rewards_balance, 0);
}

TEST_F(Lockstake, claim_transfer_failed)
{
    EXPECT_FALSE(fund_pool(1000).has_error());
    EXPECT_FALSE(stake(ALICE, T0, 10000, 6).has_error());
    reward_token.fail = true;

    auto const res = claim(ALICE, T0 + 3 * DAY);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), StakingError::TransferFailed);
    EXPECT_EQ(ledger.pool().rewards_balance, 1000);
    EXPECT_EQ(ledger.get_cursor(ALICE), T0);
}

TEST_F(Lockstake, claim_without_stake)
{
    auto res = claim(ALICE, T0);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), StakingError::NoStake);

    EXPECT_FALSE(stake(ALICE, T0, 10000, 6).has_error());
    EXPECT_FALSE(withdraw(ALICE, T0 + 1).has_error());
    res = claim(ALICE, T0 + 3 * DAY);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), StakingError::NoStake);
}

TEST_F(Lockstake, non_payable_operations_reject_value)
{
    EXPECT_FALSE(fund_pool(1000).has_error());
    EXPECT_FALSE(stake(ALICE, T0, 10000, 6).has_error());

    auto const res = claim(ALICE, T0 + 3 * DAY, 1);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), StakingError::ValueNonZero);

    auto const extend_res = call([&] {
        return contract.extend(
            CallContext{
                .caller = ALICE, .timestamp = T0 + SIX_MONTHS + 1, .value = 5},
            12);
    });
    ASSERT_TRUE(extend_res.has_error());
    EXPECT_EQ(extend_res.assume_error(), StakingError::ValueNonZero);
}

TEST_F(Lockstake, update_rewards_pool)
{
    EXPECT_FALSE(fund_pool(100).has_error());
    EXPECT_FALSE(fund_pool(250).has_error());
    EXPECT_EQ(ledger.pool().rewards_balance, 350);

    ASSERT_EQ(sink.events.size(), 2);
    EXPECT_EQ(sink.events[1], Event{RewardPoolUpdatedEvent{.amount = 250}});

    EXPECT_THROW((void)fund_pool(0), LockstakeException);
    EXPECT_EQ(ledger.pool().rewards_balance, 350);
}

TEST_F(Lockstake, reads)
{
    EXPECT_FALSE(fund_pool(1000).has_error());
    EXPECT_FALSE(stake(ALICE, T0, 10000, 6).has_error());

    uint64_t const now = T0 + 3 * DAY + 5;
    EXPECT_EQ(contract.get_staking_period(ALICE).value(), 180);
    EXPECT_EQ(contract.available_rewards(ALICE, now).value(), 416);
    EXPECT_EQ(contract.passed_reward_periods(ALICE, now).value(), 3);
    EXPECT_EQ(contract.next_reward_date(ALICE, now).value(), T0 + 4 * DAY);
    EXPECT_EQ(
        contract.all_stake_info(ALICE, now).value(),
        (StakeInfo{
            .amount = 10000,
            .started_at = T0,
            .period = 6,
            .active_until = T0 + SIX_MONTHS,
            .rewards = 416,
            .next_reward_date = T0 + 4 * DAY}));

    EXPECT_FALSE(withdraw(ALICE, now).has_error());
    EXPECT_EQ(contract.get_staking_period(ALICE).value(), 0);
    EXPECT_EQ(contract.all_stake_info(ALICE, now).value(), StakeInfo{});
}

TEST_F(Lockstake, reads_unknown_account)
{
    auto const period = contract.get_staking_period(BOB);
    ASSERT_TRUE(period.has_error());
    EXPECT_EQ(period.assume_error(), StakingError::StakeNotFound);

    auto const rewards = contract.available_rewards(BOB, T0);
    ASSERT_TRUE(rewards.has_error());
    EXPECT_EQ(rewards.assume_error(), StakingError::StakeNotFound);

    auto const info = contract.all_stake_info(BOB, T0);
    ASSERT_TRUE(info.has_error());
    EXPECT_EQ(info.assume_error(), StakingError::StakeNotFound);

    auto const next = contract.next_reward_date(BOB, T0);
    ASSERT_TRUE(next.has_error());
    EXPECT_EQ(next.assume_error(), StakingError::ClaimCursorNotFound);
}

TEST_F(Lockstake, staking_period_after_late_top_up)
{
    EXPECT_FALSE(fund_pool(100000).has_error());
    EXPECT_FALSE(stake(ALICE, T0, 10000, 6).has_error());
    EXPECT_FALSE(stake(ALICE, T0 + SIX_MONTHS + DAY, 10, 6).has_error());

    auto const res = contract.get_staking_period(ALICE);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), MathError::Underflow);
}

TEST_F(Lockstake, reads_after_withdraw)
{
    EXPECT_FALSE(fund_pool(1000).has_error());
    EXPECT_FALSE(stake(ALICE, T0, 10000, 6).has_error());
    EXPECT_FALSE(withdraw(ALICE, T0 + DAY / 2).has_error());

    uint64_t const later = T0 + 10 * DAY;
    EXPECT_EQ(contract.available_rewards(ALICE, later).value(), 0);
    EXPECT_EQ(contract.passed_reward_periods(ALICE, later).value(), 0);
    EXPECT_EQ(contract.get_staking_period(ALICE).value(), 0);

    auto const info = contract.all_stake_info(ALICE, later);
    ASSERT_FALSE(info.has_error());
    EXPECT_EQ(info.value().amount, 0);
    EXPECT_EQ(info.value().rewards, 0);
}
