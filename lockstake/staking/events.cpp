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

#include <lockstake/staking/config.hpp>
#include <lockstake/staking/events.hpp>

#include <span>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

LOCKSTAKE_STAKING_NAMESPACE_BEGIN

std::string_view event_name(Event const &event)
{
    return std::visit(
        [](auto const &e) -> std::string_view {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, StakeCreated>) {
                return "StakeCreated";
            }
            else if constexpr (std::is_same_v<T, StakeWithdrawn>) {
                return "StakeWithdrawn";
            }
            else if constexpr (std::is_same_v<T, ExternalAttached>) {
                return "ExternalAttached";
            }
            else if constexpr (std::is_same_v<T, ExternalDetached>) {
                return "ExternalDetached";
            }
            else {
                static_assert(std::is_same_v<T, StakeExtended>);
                return "StakeExtended";
            }
        },
        event);
}

StakeId event_stake_id(Event const &event)
{
    return std::visit([](auto const &e) { return e.stake_id; }, event);
}

std::vector<Event>
events_for_stake(std::span<Event const> const events, StakeId const stake_id)
{
    std::vector<Event> filtered;
    for (auto const &event : events) {
        if (event_stake_id(event) == stake_id) {
            filtered.push_back(event);
        }
    }
    return filtered;
}

LOCKSTAKE_STAKING_NAMESPACE_END
