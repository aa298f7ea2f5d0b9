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

#include <cstdint>

LOCKSTAKE_STAKING_NAMESPACE_BEGIN

using namespace intx::literals;

// Stake ids are minted from 1 and never reused; 0 is never a valid id
using StakeId = uint64_t;

// Token id in the external vehicle registry; 0 means "no vehicle"
using ExternalId = uint256_t;

using LevelIndex = uint64_t;

// Seconds
using Timestamp = uint64_t;
using Duration = uint64_t;

// Index of an escrow in the registry's escrow arena
using EscrowId = uint32_t;

inline constexpr uint256_t TOKEN{1000000000000000000_u256};
inline constexpr Duration DAY{24 * 60 * 60};

// A stake record. amount == 0 marks a non-existent or withdrawn stake.
struct Stake
{
    LevelIndex level{0};
    uint256_t amount{0};
    Timestamp lock_end_time{0};
    ExternalId attached_external_id{0};

    bool operator==(Stake const &) const = default;
};

// Expired is derived, never stored
inline bool is_expired(Stake const &stake, Timestamp const now) noexcept
{
    return now > stake.lock_end_time;
}

LOCKSTAKE_STAKING_NAMESPACE_END
