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
#include <lockstake/core/int.hpp>
#include <lockstake/sim/config.hpp>
#include <lockstake/sim/event_json.hpp>
#include <lockstake/staking/events.hpp>

#include <evmc/hex.hpp>
#include <intx/intx.hpp>
#include <nlohmann/json.hpp>

#include <span>
#include <string>
#include <type_traits>
#include <variant>

LOCKSTAKE_SIM_ANONYMOUS_NAMESPACE_BEGIN

std::string address_hex(Address const &address)
{
    return "0x" + evmc::hex({address.bytes, sizeof(address.bytes)});
}

std::string decimal(uint256_t const &value)
{
    return intx::to_string(value);
}

LOCKSTAKE_SIM_ANONYMOUS_NAMESPACE_END

LOCKSTAKE_SIM_NAMESPACE_BEGIN

using namespace staking;

nlohmann::json to_json(Event const &event)
{
    nlohmann::json j;
    j["event"] = std::string{event_name(event)};
    std::visit(
        [&j](auto const &e) {
            using T = std::decay_t<decltype(e)>;
            j["staker"] = address_hex(e.staker);
            j["stake_id"] = e.stake_id;
            if constexpr (std::is_same_v<T, StakeCreated>) {
                j["escrow"] = address_hex(e.escrow);
                j["level"] = e.level;
                j["amount"] = decimal(e.amount);
                j["lock_end_time"] = e.lock_end_time;
                j["points"] = decimal(e.points);
            }
            else if constexpr (std::is_same_v<T, StakeWithdrawn>) {
                j["amount"] = decimal(e.amount);
                j["points"] = decimal(e.points);
            }
            else if constexpr (
                std::is_same_v<T, ExternalAttached> ||
                std::is_same_v<T, ExternalDetached>) {
                j["external_id"] = decimal(e.external_id);
            }
            else {
                static_assert(std::is_same_v<T, StakeExtended>);
                j["lock_end_time"] = e.lock_end_time;
            }
        },
        event);
    return j;
}

nlohmann::json to_json(std::span<Event const> const events)
{
    auto j = nlohmann::json::array();
    for (auto const &event : events) {
        j.push_back(to_json(event));
    }
    return j;
}

LOCKSTAKE_SIM_NAMESPACE_END
