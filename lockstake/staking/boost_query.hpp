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
#include <lockstake/staking/collaborators.hpp>
#include <lockstake/staking/config.hpp>
#include <lockstake/staking/stake_level.hpp>
#include <lockstake/staking/staking_state.hpp>
#include <lockstake/staking/types.hpp>

LOCKSTAKE_STAKING_NAMESPACE_BEGIN

// Read side of the registry: boost points of an external id as a pure
// function of the stored stake and the supplied time.
class BoostQueryService
{
    StakingState const &state_;
    StakeLevelTable const &levels_;
    ExternalRegistry const &external_;

public:
    BoostQueryService(
        StakingState const &, StakeLevelTable const &,
        ExternalRegistry const &);

    // Zero when unattached, when the external item no longer exists, or
    // once lock_end_time < now
    uint256_t points_for(ExternalId const &, Timestamp now) const;
};

LOCKSTAKE_STAKING_NAMESPACE_END
