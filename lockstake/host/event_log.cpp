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

#include <lockstake/core/assert.h>
#include <lockstake/core/config.hpp>
#include <lockstake/host/event_log.hpp>
#include <lockstake/staking/events.hpp>

#include <vector>

LOCKSTAKE_NAMESPACE_BEGIN

void EventLog::emit(staking::Event const &event)
{
    events_.current(version_).push_back(event);
}

std::vector<staking::Event> const &EventLog::events() const
{
    return events_.recent();
}

void EventLog::push()
{
    ++version_;
}

void EventLog::pop_accept()
{
    LOCKSTAKE_ASSERT(version_);

    events_.pop_accept(version_);

    --version_;
}

void EventLog::pop_reject()
{
    LOCKSTAKE_ASSERT(version_);

    bool const empty = events_.pop_reject(version_);
    LOCKSTAKE_ASSERT(!empty);

    --version_;
}

LOCKSTAKE_NAMESPACE_END
