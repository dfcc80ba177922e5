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
#include <lockstake/core/int.hpp>
#include <lockstake/core/result.hpp>
#include <lockstake/staking/config.hpp>

LOCKSTAKE_STAKING_NAMESPACE_BEGIN

// Moves value out of the contract's custody. A failed transfer leaves the
// collaborator's own accounting untouched.
struct TransferCapability
{
    virtual ~TransferCapability() = default;

    virtual Result<void>
    transfer(Address const &recipient, uint256_t const &amount) = 0;
};

LOCKSTAKE_STAKING_NAMESPACE_END
