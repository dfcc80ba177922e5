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
#include <lockstake/core/basic_formatter.hpp>
#include <lockstake/core/config.hpp>
#include <lockstake/core/int.hpp>
#include <lockstake/host/balance_book.hpp>
#include <lockstake/host/from_json.hpp>
#include <lockstake/host/genesis.hpp>
#include <lockstake/host/staking_host.hpp>
#include <lockstake/staking/stake_position.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

LOCKSTAKE_ANONYMOUS_NAMESPACE_BEGIN

std::vector<std::pair<Address, uint256_t>>
read_alloc(nlohmann::json const &json, char const *const key)
{
    std::vector<std::pair<Address, uint256_t>> alloc;
    if (!json.contains(key)) {
        return alloc;
    }
    for (auto const &item : json.at(key).items()) {
        alloc.emplace_back(
            nlohmann::json(item.key()).get<Address>(),
            item.value().get<uint256_t>());
    }
    return alloc;
}

void credit_alloc(
    BalanceBook &book,
    std::vector<std::pair<Address, uint256_t>> const &alloc,
    char const *const name)
{
    for (auto const &[address, amount] : alloc) {
        auto const res = book.credit(address, amount);
        if (res.has_error()) {
            throw std::runtime_error{fmt::format(
                "{} for {} overflows: {}",
                name,
                address,
                res.error().message().c_str())};
        }
    }
}

LOCKSTAKE_ANONYMOUS_NAMESPACE_END

LOCKSTAKE_NAMESPACE_BEGIN

Genesis parse_genesis(nlohmann::json const &json)
{
    Genesis genesis{};
    genesis.contract_address = json.at("contract").get<Address>();
    genesis.pool = staking::make_pool_state(
        json.at("reward_token").get<Address>(),
        json.at("reward_conversion_rate").get<uint256_t>());

    if (json.contains("reward_rate")) {
        genesis.pool.reward_rate = json.at("reward_rate").get<uint256_t>();
    }
    if (json.contains("early_withdraw_fee")) {
        genesis.pool.early_withdraw_fee =
            json.at("early_withdraw_fee").get<uint256_t>();
    }
    if (json.contains("available_periods")) {
        genesis.pool.available_periods =
            json.at("available_periods").get<std::vector<uint32_t>>();
        if (genesis.pool.available_periods.empty()) {
            throw std::invalid_argument{"available_periods is empty"};
        }
    }

    genesis.native_alloc = read_alloc(json, "native_alloc");
    genesis.token_alloc = read_alloc(json, "token_alloc");
    return genesis;
}

Genesis read_genesis(std::filesystem::path const &genesis_file)
{
    std::ifstream ifile(genesis_file);
    if (!ifile) {
        throw std::runtime_error{
            fmt::format("cannot open genesis file {}", genesis_file.string())};
    }
    return parse_genesis(nlohmann::json::parse(ifile));
}

void load_genesis(StakingHost &host, Genesis const &genesis)
{
    credit_alloc(host.native_balances(), genesis.native_alloc, "native_alloc");
    credit_alloc(host.token_balances(), genesis.token_alloc, "token_alloc");
}

LOCKSTAKE_NAMESPACE_END
