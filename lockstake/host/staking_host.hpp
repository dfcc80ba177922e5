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
#include <lockstake/core/config.hpp>
#include <lockstake/core/int.hpp>
#include <lockstake/core/result.hpp>
#include <lockstake/host/balance_book.hpp>
#include <lockstake/host/event_log.hpp>
#include <lockstake/staking/stake_ledger.hpp>
#include <lockstake/staking/stake_position.hpp>
#include <lockstake/staking/staking_contract.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

LOCKSTAKE_NAMESPACE_BEGIN

enum class Method
{
    Stake,
    Extend,
    Withdraw,
    EmergencyWithdraw,
    Claim,
    UpdateRewardsPool,
};

std::string_view method_name(Method);
std::optional<Method> method_from_name(std::string_view);

struct Call
{
    Address caller;
    uint64_t timestamp;
    uint256_t value;
    Method method;
    uint32_t period; // stake and extend only
};

enum class CallStatus
{
    Success,
    Error,
    Trap,
};

std::string_view call_status_name(CallStatus);

struct CallOutcome
{
    CallStatus status;
    std::string message;
};

// Runs calls against the staking contract one at a time. Every call either
// commits all of its writes or none of them.
class StakingHost
{
    Address contract_address_;
    staking::StakeLedger ledger_;
    BalanceBook native_balances_;
    BalanceBook token_balances_;
    EventLog events_;
    BookTransfer native_;
    BookTransfer reward_token_;
    staking::StakingContract contract_;

public:
    StakingHost(Address const &contract_address, staking::PoolState);

    StakingHost(StakingHost &&) = delete;
    StakingHost(StakingHost const &) = delete;
    StakingHost &operator=(StakingHost &&) = delete;
    StakingHost &operator=(StakingHost const &) = delete;

    CallOutcome execute(Call const &);

    Address const &contract_address() const
    {
        return contract_address_;
    }

    staking::StakingContract const &contract() const
    {
        return contract_;
    }

    staking::StakeLedger const &ledger() const
    {
        return ledger_;
    }

    BalanceBook &native_balances()
    {
        return native_balances_;
    }

    BalanceBook const &native_balances() const
    {
        return native_balances_;
    }

    // the contract's reward token holdings sit under contract_address()
    BalanceBook &token_balances()
    {
        return token_balances_;
    }

    BalanceBook const &token_balances() const
    {
        return token_balances_;
    }

    EventLog const &events() const
    {
        return events_;
    }

private:
    Result<void> dispatch(Call const &);

    void push();
    void pop_accept();
    void pop_reject();
};

LOCKSTAKE_NAMESPACE_END
