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
#include <lockstake/staking/config.hpp>
#include <lockstake/staking/types.hpp>

#include <span>
#include <string_view>
#include <variant>
#include <vector>

LOCKSTAKE_STAKING_NAMESPACE_BEGIN

struct StakeCreated
{
    Address staker;
    StakeId stake_id;
    Address escrow;
    LevelIndex level;
    uint256_t amount;
    Timestamp lock_end_time;
    uint256_t points;

    bool operator==(StakeCreated const &) const = default;
};

struct StakeWithdrawn
{
    Address staker;
    StakeId stake_id;
    uint256_t amount;
    uint256_t points;

    bool operator==(StakeWithdrawn const &) const = default;
};

struct ExternalAttached
{
    Address staker;
    StakeId stake_id;
    ExternalId external_id;

    bool operator==(ExternalAttached const &) const = default;
};

struct ExternalDetached
{
    Address staker;
    StakeId stake_id;
    ExternalId external_id;

    bool operator==(ExternalDetached const &) const = default;
};

struct StakeExtended
{
    Address staker;
    StakeId stake_id;
    Timestamp lock_end_time;

    bool operator==(StakeExtended const &) const = default;
};

using Event = std::variant<
    StakeCreated, StakeWithdrawn, ExternalAttached, ExternalDetached,
    StakeExtended>;

std::string_view event_name(Event const &);

StakeId event_stake_id(Event const &);

// Events concerning stake_id, in emission order
std::vector<Event> events_for_stake(std::span<Event const>, StakeId);

LOCKSTAKE_STAKING_NAMESPACE_END
