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

#include <lockstake/core/int.hpp>
#include <lockstake/staking/config.hpp>

#include <array>
#include <cstdint>

LOCKSTAKE_STAKING_NAMESPACE_BEGIN

// Length of one accrual period in seconds. Rewards accrue in whole periods.
inline constexpr uint64_t ACCRUAL_PERIOD{86400};

// A period code is a multiplier of this many accrual periods.
inline constexpr uint64_t PERIODS_PER_LOCK_UNIT{30};

inline constexpr uint256_t DEFAULT_REWARD_RATE{5};

// stored for configuration compatibility; no operation applies it
inline constexpr uint256_t DEFAULT_EARLY_WITHDRAW_FEE{10};

inline constexpr std::array<uint32_t, 2> DEFAULT_AVAILABLE_PERIODS{6, 12};

// reward = amount * reward_rate * periods * REWARD_SCALE_NUMERATOR /
//          REWARD_SCALE_DENOMINATOR
inline constexpr uint256_t REWARD_SCALE_NUMERATOR{100};
inline constexpr uint256_t REWARD_SCALE_DENOMINATOR{36000};

static_assert(REWARD_SCALE_DENOMINATOR != 0);

LOCKSTAKE_STAKING_NAMESPACE_END
