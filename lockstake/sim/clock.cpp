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

#include <lockstake/core/checked_math.hpp>
#include <lockstake/core/result.hpp>
#include <lockstake/sim/clock.hpp>
#include <lockstake/sim/config.hpp>
#include <lockstake/staking/types.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>

LOCKSTAKE_SIM_NAMESPACE_BEGIN

using staking::Duration;
using staking::Timestamp;

ManualClock::ManualClock(Timestamp const start)
    : now_{start}
{
}

Result<void> ManualClock::set(Timestamp const now)
{
    if (now < now_.load(std::memory_order_acquire)) {
        return MathError::Underflow;
    }
    now_.store(now, std::memory_order_release);
    return outcome::success();
}

Result<void> ManualClock::advance(Duration const seconds)
{
    BOOST_OUTCOME_TRY(
        auto const now,
        checked_add(now_.load(std::memory_order_acquire), seconds));
    now_.store(now, std::memory_order_release);
    return outcome::success();
}

Timestamp ManualClock::now() const
{
    return now_.load(std::memory_order_acquire);
}

Timestamp SystemClock::now() const
{
    auto const wall = static_cast<Timestamp>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count());
    auto last = last_.load(std::memory_order_acquire);
    while (wall > last &&
           !last_.compare_exchange_weak(
               last, wall, std::memory_order_acq_rel)) {
    }
    return wall > last ? wall : last;
}

LOCKSTAKE_SIM_NAMESPACE_END
