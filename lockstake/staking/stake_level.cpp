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
#include <lockstake/core/result.hpp>
#include <lockstake/staking/config.hpp>
#include <lockstake/staking/stake_level.hpp>
#include <lockstake/staking/staking_error.hpp>

#include <utility>
#include <vector>

LOCKSTAKE_STAKING_NAMESPACE_BEGIN

StakeLevelTable::StakeLevelTable(std::vector<StakeLevel> levels)
    : levels_{std::move(levels)}
{
}

Result<StakeLevelTable> StakeLevelTable::create(std::vector<StakeLevel> levels)
{
    if (levels.empty() || levels.size() > MAX_LEVELS ||
        levels.front().amount == 0) {
        return StakingError::InvalidLevelTable;
    }
    for (size_t i = 1; i < levels.size(); ++i) {
        if (levels[i].amount <= levels[i - 1].amount) {
            return StakingError::InvalidLevelTable;
        }
    }
    return StakeLevelTable{std::move(levels)};
}

Result<StakeLevel> StakeLevelTable::get(LevelIndex const level) const
{
    if (level > max_level()) {
        return StakingError::InvalidLevel;
    }
    return levels_[level];
}

StakeLevelTable default_stake_levels()
{
    auto res = StakeLevelTable::create({
        {5'000 * TOKEN, 180 * DAY, 1000},
        {10'000 * TOKEN, 365 * DAY, 2000},
        {15'000 * TOKEN, 730 * DAY, 3000},
    });
    LOCKSTAKE_ASSERT(res.has_value());
    return std::move(res).value();
}

LOCKSTAKE_STAKING_NAMESPACE_END
