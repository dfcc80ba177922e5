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

#include <lockstake/core/config.hpp>
#include <lockstake/core/int.hpp>
#include <lockstake/core/result.hpp>

#include <cstdint>
#include <initializer_list>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

LOCKSTAKE_NAMESPACE_BEGIN

enum class MathError
{
    Success = 0,
    Overflow,
    Underflow,
};

// Amounts, balances and reward products are uint256 and fail on wrap.
Result<uint256_t> checked_add(uint256_t const &x, uint256_t const &y);
Result<uint256_t> checked_sub(uint256_t const &x, uint256_t const &y);
Result<uint256_t> checked_mul(uint256_t const &x, uint256_t const &y);

// Timestamps and period counts are uint64. Intermediate arithmetic on them
// is done in uint256 and narrowed back here, failing with Overflow.
Result<uint64_t> checked_narrow(uint256_t const &x);

LOCKSTAKE_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<lockstake::MathError>
    : quick_status_code_from_enum_defaults<lockstake::MathError>
{
    static constexpr auto const domain_name = "Math Error";
    static constexpr auto const domain_uuid =
        "5d3f0a8e-61c2-4c7b-9a41-2e8c0b7f9d13";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
