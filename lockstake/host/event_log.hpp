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
#include <lockstake/core/version_stack.hpp>
#include <lockstake/staking/events.hpp>

#include <vector>

LOCKSTAKE_NAMESPACE_BEGIN

// Notifications in emission order. Events emitted by a rejected call are
// dropped with the rest of its writes.
class EventLog : public staking::EventSink
{
    VersionStack<std::vector<staking::Event>> events_{
        std::vector<staking::Event>{}};
    unsigned version_{0};

public:
    void emit(staking::Event const &) override;

    std::vector<staking::Event> const &events() const;

    void push();
    void pop_accept();
    void pop_reject();
};

LOCKSTAKE_NAMESPACE_END
