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
#include <lockstake/core/basic_formatter.hpp>
#include <lockstake/core/config.hpp>
#include <lockstake/core/int.hpp>
#include <lockstake/core/result.hpp>
#include <lockstake/host/balance_book.hpp>
#include <lockstake/host/call_script.hpp>
#include <lockstake/host/from_json.hpp>
#include <lockstake/host/staking_host.hpp>
#include <lockstake/staking/events.hpp>
#include <lockstake/staking/stake_ledger.hpp>
#include <lockstake/staking/stake_position.hpp>
#include <lockstake/staking/staking_contract.hpp>

#include <nlohmann/json.hpp>

#include <array>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

LOCKSTAKE_ANONYMOUS_NAMESPACE_BEGIN

constexpr std::array<std::pair<Query, std::string_view>, 5> QUERY_NAMES{{
    {Query::StakingPeriod, "get_staking_period"},
    {Query::AvailableRewards, "available_rewards"},
    {Query::PassedRewardPeriods, "passed_reward_periods"},
    {Query::AllStakeInfo, "all_stake_info"},
    {Query::NextRewardDate, "next_reward_date"},
}};

Step parse_step(nlohmann::json const &json)
{
    if (json.contains("query")) {
        auto const name = json.at("query").get<std::string>();
        auto const query = query_from_name(name);
        if (!query) {
            throw std::invalid_argument{
                fmt::format("unknown query \"{}\"", name)};
        }
        return QueryStep{
            .query = query.value(),
            .account = json.at("account").get<Address>(),
            .timestamp = json.at("timestamp").get<uint64_t>()};
    }

    Call call{
        .caller = json.at("caller").get<Address>(),
        .timestamp = json.at("timestamp").get<uint64_t>(),
        .value = json.value("value", nlohmann::json(0)).get<uint256_t>(),
        .method = json.at("method").get<Method>(),
        .period = json.value("period", uint32_t{0})};
    if ((call.method == Method::Stake || call.method == Method::Extend) &&
        !json.contains("period")) {
        throw std::invalid_argument{fmt::format(
            "{} requires a period: {}", method_name(call.method), json.dump())};
    }
    return call;
}

template <class T>
nlohmann::json result_json(Result<T> const &res)
{
    if (res.has_error()) {
        return {{"error", res.error().message().c_str()}};
    }
    return {{"result", res.value()}};
}

nlohmann::json stake_info_json(staking::StakeInfo const &info)
{
    return {
        {"amount", info.amount},
        {"started_at", info.started_at},
        {"period", info.period},
        {"active_until", info.active_until},
        {"rewards", info.rewards},
        {"next_reward_date", info.next_reward_date}};
}

nlohmann::json event_json(staking::Event const &event)
{
    return std::visit(
        [](auto const &e) -> nlohmann::json {
            using E = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<E, staking::StakeEvent>) {
                return {
                    {"event", "Stake"},
                    {"account", e.account},
                    {"staked_at", e.staked_at},
                    {"period", e.period},
                    {"sum", e.sum},
                    {"total_staked", e.total_staked}};
            }
            else if constexpr (std::is_same_v<E, staking::WithdrawEvent>) {
                return {
                    {"event", "Withdraw"},
                    {"account", e.account},
                    {"sum", e.sum},
                    {"is_early", e.is_early}};
            }
            else if constexpr (std::is_same_v<E, staking::ClaimEvent>) {
                return {
                    {"event", "Claim"},
                    {"account", e.account},
                    {"periods", e.periods},
                    {"amount", e.amount}};
            }
            else {
                return {{"event", "RewardPoolUpdated"}, {"amount", e.amount}};
            }
        },
        event);
}

nlohmann::json balances_json(BalanceBook const &book)
{
    nlohmann::json json = nlohmann::json::object();
    for (auto const &[address, balance] : book.balances()) {
        json[nlohmann::json(address).get<std::string>()] = balance;
    }
    return json;
}

LOCKSTAKE_ANONYMOUS_NAMESPACE_END

LOCKSTAKE_NAMESPACE_BEGIN

std::string_view query_name(Query const query)
{
    for (auto const &[q, name] : QUERY_NAMES) {
        if (q == query) {
            return name;
        }
    }
    LOCKSTAKE_ABORT("unknown query");
}

std::optional<Query> query_from_name(std::string_view const name)
{
    for (auto const &[q, n] : QUERY_NAMES) {
        if (n == name) {
            return q;
        }
    }
    return std::nullopt;
}

std::vector<Step> parse_steps(nlohmann::json const &json)
{
    if (!json.is_array()) {
        throw std::invalid_argument{"call script must be a json array"};
    }
    std::vector<Step> steps;
    steps.reserve(json.size());
    for (auto const &item : json) {
        steps.push_back(parse_step(item));
    }
    return steps;
}

std::vector<Step> read_steps(std::filesystem::path const &calls_file)
{
    std::ifstream ifile(calls_file);
    if (!ifile) {
        throw std::runtime_error{
            fmt::format("cannot open call script {}", calls_file.string())};
    }
    return parse_steps(nlohmann::json::parse(ifile));
}

nlohmann::json run_query(StakingHost const &host, QueryStep const &step)
{
    auto const &contract = host.contract();
    nlohmann::json json{
        {"query", std::string{query_name(step.query)}}, {"account", step.account}};

    switch (step.query) {
    case Query::StakingPeriod:
        json.update(result_json(contract.get_staking_period(step.account)));
        break;
    case Query::AvailableRewards:
        json.update(result_json(
            contract.available_rewards(step.account, step.timestamp)));
        break;
    case Query::PassedRewardPeriods:
        json.update(result_json(
            contract.passed_reward_periods(step.account, step.timestamp)));
        break;
    case Query::AllStakeInfo: {
        auto const res = contract.all_stake_info(step.account, step.timestamp);
        if (res.has_error()) {
            json["error"] = res.error().message().c_str();
        }
        else {
            json["result"] = stake_info_json(res.value());
        }
        break;
    }
    case Query::NextRewardDate:
        json.update(result_json(
            contract.next_reward_date(step.account, step.timestamp)));
        break;
    }
    return json;
}

nlohmann::json run_steps(StakingHost &host, std::vector<Step> const &steps)
{
    nlohmann::json results = nlohmann::json::array();
    for (auto const &step : steps) {
        if (auto const *call = std::get_if<Call>(&step)) {
            auto const outcome = host.execute(*call);
            nlohmann::json json{
                {"method", call->method},
                {"caller", call->caller},
                {"status", std::string{call_status_name(outcome.status)}}};
            if (!outcome.message.empty()) {
                json["message"] = outcome.message;
            }
            results.push_back(std::move(json));
        }
        else {
            results.push_back(run_query(host, std::get<QueryStep>(step)));
        }
    }
    return results;
}

nlohmann::json dump_state(StakingHost const &host)
{
    auto const &ledger = host.ledger();
    auto const &pool = ledger.pool();

    nlohmann::json positions = nlohmann::json::object();
    for (auto const &[account, position] : ledger.positions()) {
        nlohmann::json entry{
            {"amount", position.amount},
            {"started_at", position.started_at},
            {"period", position.period},
            {"active_until", position.active_until}};
        if (auto const cursor = ledger.get_cursor(account)) {
            entry["last_reward_claim"] = cursor.value();
        }
        positions[nlohmann::json(account).get<std::string>()] =
            std::move(entry);
    }

    nlohmann::json events = nlohmann::json::array();
    for (auto const &event : host.events().events()) {
        events.push_back(event_json(event));
    }

    return {
        {"contract", host.contract_address()},
        {"pool",
         {{"reward_token", pool.reward_token},
          {"total_staked", pool.total_staked},
          {"rewards_balance", pool.rewards_balance},
          {"reward_rate", pool.reward_rate},
          {"early_withdraw_fee", pool.early_withdraw_fee},
          {"reward_conversion_rate", pool.reward_conversion_rate},
          {"available_periods", pool.available_periods}}},
        {"positions", std::move(positions)},
        {"native_balances", balances_json(host.native_balances())},
        {"token_balances", balances_json(host.token_balances())},
        {"events", std::move(events)}};
}

LOCKSTAKE_NAMESPACE_END
