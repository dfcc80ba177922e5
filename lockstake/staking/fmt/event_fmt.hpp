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

#include <lockstake/core/basic_formatter.hpp>
#include <lockstake/core/fmt/address_fmt.hpp>
#include <lockstake/core/fmt/int_fmt.hpp>
#include <lockstake/staking/events.hpp>
#include <lockstake/staking/stake_position.hpp>

#include <quill/Quill.h>
#include <quill/bundled/fmt/format.h>

#include <variant>

template <>
struct quill::copy_loggable<lockstake::staking::StakePosition>
    : std::true_type
{
};

template <>
struct quill::copy_loggable<lockstake::staking::StakeEvent> : std::true_type
{
};

template <>
struct quill::copy_loggable<lockstake::staking::WithdrawEvent>
    : std::true_type
{
};

template <>
struct quill::copy_loggable<lockstake::staking::ClaimEvent> : std::true_type
{
};

template <>
struct quill::copy_loggable<lockstake::staking::RewardPoolUpdatedEvent>
    : std::true_type
{
};

template <>
struct quill::copy_loggable<lockstake::staking::Event> : std::true_type
{
};

template <>
struct fmt::formatter<lockstake::staking::StakePosition>
    : public lockstake::BasicFormatter
{
    template <typename FormatContext>
    auto format(
        lockstake::staking::StakePosition const &p, FormatContext &ctx) const
    {
        fmt::format_to(
            ctx.out(),
            "StakePosition{{"
            "Amount={} "
            "Started At={} "
            "Period={} "
            "Active Until={}"
            "}}",
            p.amount,
            p.started_at,
            p.period,
            p.active_until);
        return ctx.out();
    }
};

template <>
struct fmt::formatter<lockstake::staking::StakeEvent>
    : public lockstake::BasicFormatter
{
    template <typename FormatContext>
    auto
    format(lockstake::staking::StakeEvent const &e, FormatContext &ctx) const
    {
        fmt::format_to(
            ctx.out(),
            "Stake{{"
            "Account={} "
            "Staked At={} "
            "Period={} "
            "Sum={} "
            "Total Staked={}"
            "}}",
            e.account,
            e.staked_at,
            e.period,
            e.sum,
            e.total_staked);
        return ctx.out();
    }
};

template <>
struct fmt::formatter<lockstake::staking::WithdrawEvent>
    : public lockstake::BasicFormatter
{
    template <typename FormatContext>
    auto format(
        lockstake::staking::WithdrawEvent const &e, FormatContext &ctx) const
    {
        fmt::format_to(
            ctx.out(),
            "Withdraw{{"
            "Account={} "
            "Sum={} "
            "Is Early={}"
            "}}",
            e.account,
            e.sum,
            e.is_early);
        return ctx.out();
    }
};

template <>
struct fmt::formatter<lockstake::staking::ClaimEvent>
    : public lockstake::BasicFormatter
{
    template <typename FormatContext>
    auto
    format(lockstake::staking::ClaimEvent const &e, FormatContext &ctx) const
    {
        fmt::format_to(
            ctx.out(),
            "Claim{{"
            "Account={} "
            "Periods={} "
            "Amount={}"
            "}}",
            e.account,
            e.periods,
            e.amount);
        return ctx.out();
    }
};

template <>
struct fmt::formatter<lockstake::staking::RewardPoolUpdatedEvent>
    : public lockstake::BasicFormatter
{
    template <typename FormatContext>
    auto format(
        lockstake::staking::RewardPoolUpdatedEvent const &e,
        FormatContext &ctx) const
    {
        fmt::format_to(ctx.out(), "RewardPoolUpdated{{Amount={}}}", e.amount);
        return ctx.out();
    }
};

template <>
struct fmt::formatter<lockstake::staking::Event>
    : public lockstake::BasicFormatter
{
    template <typename FormatContext>
    auto format(lockstake::staking::Event const &e, FormatContext &ctx) const
    {
        std::visit(
            [&ctx](auto const &alt) { fmt::format_to(ctx.out(), "{}", alt); },
            e);
        return ctx.out();
    }
};
