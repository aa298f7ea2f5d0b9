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

#include <lockstake/core/result.hpp>
#include <lockstake/sim/config.hpp>
#include <lockstake/staking/collaborators.hpp>
#include <lockstake/staking/types.hpp>

#include <atomic>

LOCKSTAKE_SIM_NAMESPACE_BEGIN

// Time set by the host
class ManualClock final : public staking::TimeOracle
{
    std::atomic<staking::Timestamp> now_;

public:
    explicit ManualClock(staking::Timestamp start = 0);

    // Fails MathError::Underflow when moving backwards
    Result<void> set(staking::Timestamp);
    // Fails MathError::Overflow past the end of time
    Result<void> advance(staking::Duration);

    staking::Timestamp now() const override;
};

// Wall clock seconds since the unix epoch, never going backwards
class SystemClock final : public staking::TimeOracle
{
    mutable std::atomic<staking::Timestamp> last_{0};

public:
    staking::Timestamp now() const override;
};

LOCKSTAKE_SIM_NAMESPACE_END
