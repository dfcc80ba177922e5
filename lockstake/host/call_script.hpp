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
#include <lockstake/host/staking_host.hpp>

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

LOCKSTAKE_NAMESPACE_BEGIN

enum class Query
{
    StakingPeriod,
    AvailableRewards,
    PassedRewardPeriods,
    AllStakeInfo,
    NextRewardDate,
};

std::string_view query_name(Query);
std::optional<Query> query_from_name(std::string_view);

// read evaluated against committed state at `timestamp`
struct QueryStep
{
    Query query;
    Address account;
    uint64_t timestamp;
};

using Step = std::variant<Call, QueryStep>;

// A script is a JSON array. Calls look like
//   {"method": "stake", "caller": "0x..", "timestamp": 1, "value": "10",
//    "period": 6}
// and reads like
//   {"query": "all_stake_info", "account": "0x..", "timestamp": 1}
std::vector<Step> parse_steps(nlohmann::json const &);

std::vector<Step> read_steps(std::filesystem::path const &);

nlohmann::json run_query(StakingHost const &, QueryStep const &);

// one result object per step, in order
nlohmann::json run_steps(StakingHost &, std::vector<Step> const &);

// pool, positions with cursors, balances and events
nlohmann::json dump_state(StakingHost const &);

LOCKSTAKE_NAMESPACE_END
