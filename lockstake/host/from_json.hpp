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
#include <lockstake/core/basic_formatter.hpp>
#include <lockstake/core/fmt/address_fmt.hpp>
#include <lockstake/core/int.hpp>
#include <lockstake/host/staking_host.hpp>

#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>
#include <intx/intx.hpp>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>

namespace nlohmann
{
    template <>
    struct adl_serializer<lockstake::Address>
    {
        static void from_json(nlohmann::json const &json, lockstake::Address &o)
        {
            auto const maybe_address =
                evmc::from_hex<lockstake::Address>(json.get<std::string>());
            if (!maybe_address) {
                throw std::invalid_argument{fmt::format(
                    "failed to convert json object {} to an address",
                    json.dump())};
            }
            o = maybe_address.value();
        }

        static void to_json(nlohmann::json &json, lockstake::Address const &o)
        {
            json = fmt::format("{}", o);
        }
    };

    // decimal or 0x-prefixed strings, or plain unsigned numbers
    template <>
    struct adl_serializer<lockstake::uint256_t>
    {
        static void
        from_json(nlohmann::json const &json, lockstake::uint256_t &o)
        {
            if (json.is_number_unsigned()) {
                o = json.get<uint64_t>();
                return;
            }
            if (json.is_number_integer() && json.get<int64_t>() >= 0) {
                o = static_cast<uint64_t>(json.get<int64_t>());
                return;
            }
            if (!json.is_string()) {
                throw std::invalid_argument{fmt::format(
                    "expected an unsigned amount, got {}", json.dump())};
            }
            o = intx::from_string<lockstake::uint256_t>(
                json.get<std::string>());
        }

        static void
        to_json(nlohmann::json &json, lockstake::uint256_t const &o)
        {
            json = intx::to_string(o);
        }
    };

    template <>
    struct adl_serializer<lockstake::Method>
    {
        static void from_json(nlohmann::json const &json, lockstake::Method &o)
        {
            auto const method =
                lockstake::method_from_name(json.get<std::string>());
            if (!method) {
                throw std::invalid_argument{
                    fmt::format("unknown method {}", json.dump())};
            }
            o = method.value();
        }

        static void to_json(nlohmann::json &json, lockstake::Method const &o)
        {
            json = std::string{lockstake::method_name(o)};
        }
    };
}
