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
#include <lockstake/core/result.hpp>
#include <lockstake/staking/config.hpp>
#include <lockstake/staking/types.hpp>

#include <cstddef>
#include <vector>

LOCKSTAKE_STAKING_NAMESPACE_BEGIN

struct StakeLevel
{
    uint256_t amount;
    Duration lock_duration;
    uint256_t points;

    bool operator==(StakeLevel const &) const = default;
};

// Immutable after construction
class StakeLevelTable
{
    std::vector<StakeLevel> levels_;

    explicit StakeLevelTable(std::vector<StakeLevel>);

public:
    static constexpr size_t MAX_LEVELS = 256;

    // Fails InvalidLevelTable unless 1 <= size <= MAX_LEVELS and amounts are
    // non-zero and strictly increase with the index
    static Result<StakeLevelTable> create(std::vector<StakeLevel>);

    Result<StakeLevel> get(LevelIndex) const;

    LevelIndex max_level() const noexcept
    {
        return levels_.size() - 1;
    }

    std::vector<StakeLevel> const &levels() const noexcept
    {
        return levels_;
    }
};

// 5000 / 10000 / 15000 tokens for 180 / 365 / 730 days
StakeLevelTable default_stake_levels();

LOCKSTAKE_STAKING_NAMESPACE_END
