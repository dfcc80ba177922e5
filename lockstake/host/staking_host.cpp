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
#include <lockstake/core/config.hpp>
#include <lockstake/core/fmt/address_fmt.hpp>
#include <lockstake/core/fmt/int_fmt.hpp>
#include <lockstake/core/likely.h>
#include <lockstake/core/lockstake_exception.hpp>
#include <lockstake/core/result.hpp>
#include <lockstake/host/balance_book.hpp>
#include <lockstake/host/event_log.hpp>
#include <lockstake/host/staking_host.hpp>
#include <lockstake/staking/stake_ledger.hpp>
#include <lockstake/staking/stake_position.hpp>
#include <lockstake/staking/staking_contract.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

LOCKSTAKE_ANONYMOUS_NAMESPACE_BEGIN

constexpr std::array<std::pair<Method, std::string_view>, 6> METHOD_NAMES{{
    {Method::Stake, "stake"},
    {Method::Extend, "extend"},
    {Method::Withdraw, "withdraw"},
    {Method::EmergencyWithdraw, "emergency_withdraw"},
    {Method::Claim, "claim"},
    {Method::UpdateRewardsPool, "update_rewards_pool"},
}};

LOCKSTAKE_ANONYMOUS_NAMESPACE_END

LOCKSTAKE_NAMESPACE_BEGIN

std::string_view method_name(Method const method)
{
    for (auto const &[m, name] : METHOD_NAMES) {
        if (m == method) {
            return name;
        }
    }
    LOCKSTAKE_ABORT("unknown method");
}

std::optional<Method> method_from_name(std::string_view const name)
{
    for (auto const &[m, n] : METHOD_NAMES) {
        if (n == name) {
            return m;
        }
    }
    return std::nullopt;
}

std::string_view call_status_name(CallStatus const status)
{
    switch (status) {
    case CallStatus::Success:
        return "success";
    case CallStatus::Error:
        return "error";
    case CallStatus::Trap:
        return "trap";
    }
    LOCKSTAKE_ABORT("unknown call status");
}

StakingHost::StakingHost(
    Address const &contract_address, staking::PoolState pool)
    : contract_address_{contract_address}
    , ledger_{std::move(pool)}
    , native_{native_balances_, contract_address}
    , reward_token_{token_balances_, contract_address}
    , contract_{ledger_, native_, reward_token_, events_}
{
}

void StakingHost::push()
{
    ledger_.push();
    native_balances_.push();
    token_balances_.push();
    events_.push();
}

void StakingHost::pop_accept()
{
    ledger_.pop_accept();
    native_balances_.pop_accept();
    token_balances_.pop_accept();
    events_.pop_accept();
}

void StakingHost::pop_reject()
{
    ledger_.pop_reject();
    native_balances_.pop_reject();
    token_balances_.pop_reject();
    events_.pop_reject();
}

Result<void> StakingHost::dispatch(Call const &call)
{
    // attached value moves into custody before the contract runs
    if (call.value != 0) {
        BOOST_OUTCOME_TRY(native_balances_.debit(call.caller, call.value));
        BOOST_OUTCOME_TRY(
            native_balances_.credit(contract_address_, call.value));
    }

    staking::CallContext const ctx{
        .caller = call.caller, .timestamp = call.timestamp, .value = call.value};

    switch (call.method) {
    case Method::Stake:
        return contract_.stake(ctx, call.period);
    case Method::Extend:
        return contract_.extend(ctx, call.period);
    case Method::Withdraw:
        return contract_.withdraw(ctx);
    case Method::EmergencyWithdraw:
        return contract_.emergency_withdraw(ctx);
    case Method::Claim:
        return contract_.claim(ctx);
    case Method::UpdateRewardsPool:
        return contract_.update_rewards_pool(ctx);
    }
    LOCKSTAKE_ABORT("unknown method");
}

CallOutcome StakingHost::execute(Call const &call)
{
    LOG_INFO(
        "StakingHost: {} from {} at {} with value {}",
        method_name(call.method),
        call.caller,
        call.timestamp,
        call.value);

    push();
    try {
        auto const res = dispatch(call);
        if (LOCKSTAKE_UNLIKELY(res.has_error())) {
            pop_reject();
            std::string message{res.error().message().c_str()};
            LOG_INFO(
                "StakingHost: {} from {} reverted: {}",
                method_name(call.method),
                call.caller,
                message);
            return CallOutcome{
                .status = CallStatus::Error, .message = std::move(message)};
        }
    }
    catch (LockstakeException const &e) {
        pop_reject();
        LOG_WARNING(
            "StakingHost: {} from {} trapped at {}:{}: {}",
            method_name(call.method),
            call.caller,
            e.file(),
            e.line(),
            e.message());
        return CallOutcome{.status = CallStatus::Trap, .message = e.message()};
    }

    pop_accept();
    return CallOutcome{.status = CallStatus::Success, .message = {}};
}

LOCKSTAKE_NAMESPACE_END
