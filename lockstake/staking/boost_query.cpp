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
#include <lockstake/core/int.hpp>
#include <lockstake/staking/boost_query.hpp>
#include <lockstake/staking/collaborators.hpp>
#include <lockstake/staking/config.hpp>
#include <lockstake/staking/stake_level.hpp>
#include <lockstake/staking/staking_state.hpp>
#include <lockstake/staking/types.hpp>

LOCKSTAKE_STAKING_NAMESPACE_BEGIN

BoostQueryService::BoostQueryService(
    StakingState const &state, StakeLevelTable const &levels,
    ExternalRegistry const &external)
    : state_{state}
    , levels_{levels}
    , external_{external}
{
}

uint256_t BoostQueryService::points_for(
    ExternalId const &external_id, Timestamp const now) const
{
    if (external_id == 0) {
        return 0;
    }
    auto const stake_id = state_.attached_stake(external_id);
    if (!stake_id.has_value()) {
        return 0;
    }
    if (!external_.exists(external_id)) {
        return 0;
    }
    auto const *const stake = state_.find_stake(*stake_id);
    LOCKSTAKE_ASSERT(stake != nullptr);
    if (stake->lock_end_time < now) {
        return 0;
    }
    auto const level = levels_.get(stake->level);
    LOCKSTAKE_ASSERT(level.has_value());
    return level.value().points;
}

LOCKSTAKE_STAKING_NAMESPACE_END
