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

#include <lockstake/core/checked_math.hpp>
#include <lockstake/core/likely.h>

#include <boost/outcome/config.hpp>
// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/generic_code.hpp>
#endif

#include <cstdint>
#include <limits>

LOCKSTAKE_NAMESPACE_BEGIN

Result<uint256_t> checked_add(uint256_t const &x, uint256_t const &y)
{
    if (LOCKSTAKE_UNLIKELY(y > UINT256_MAX - x)) {
        return MathError::Overflow;
    }
    return x + y;
}

Result<uint256_t> checked_sub(uint256_t const &x, uint256_t const &y)
{
    if (LOCKSTAKE_UNLIKELY(x < y)) {
        return MathError::Underflow;
    }
    return x - y;
}

Result<uint256_t> checked_mul(uint256_t const &x, uint256_t const &y)
{
    if (x != 0 && LOCKSTAKE_UNLIKELY(y > UINT256_MAX / x)) {
        return MathError::Overflow;
    }
    return x * y;
}

Result<uint64_t> checked_narrow(uint256_t const &x)
{
    if (LOCKSTAKE_UNLIKELY(x > std::numeric_limits<uint64_t>::max())) {
        return MathError::Overflow;
    }
    return static_cast<uint64_t>(x);
}

LOCKSTAKE_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<lockstake::MathError>::mapping> const &
quick_status_code_from_enum<lockstake::MathError>::value_mappings()
{
    using lockstake::MathError;

    static std::initializer_list<mapping> const v = {
        {MathError::Success, "success", {errc::success}},
        {MathError::Overflow, "overflow", {}},
        {MathError::Underflow, "underflow", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
