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
#include <lockstake/staking/stake_position.hpp>

#include <nlohmann/json_fwd.hpp>

#include <filesystem>
#include <utility>
#include <vector>

LOCKSTAKE_NAMESPACE_BEGIN

class StakingHost;

struct Genesis
{
    Address contract_address{};
    staking::PoolState pool{};
    std::vector<std::pair<Address, uint256_t>> native_alloc{};
    std::vector<std::pair<Address, uint256_t>> token_alloc{};
};

// Required keys: contract, reward_token, reward_conversion_rate. Optional:
// reward_rate, early_withdraw_fee, available_periods, native_alloc,
// token_alloc. Throws on malformed input.
Genesis parse_genesis(nlohmann::json const &);

Genesis read_genesis(std::filesystem::path const &);

// credits the initial allocations; must run before any call
void load_genesis(StakingHost &, Genesis const &);

LOCKSTAKE_NAMESPACE_END
