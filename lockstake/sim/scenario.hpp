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
#include <lockstake/sim/clock.hpp>
#include <lockstake/sim/config.hpp>
#include <lockstake/sim/memory_ledger.hpp>
#include <lockstake/sim/memory_vehicle_registry.hpp>
#include <lockstake/staking/stake_registry.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>

LOCKSTAKE_SIM_NAMESPACE_BEGIN

// Replays JSON steps against a registry wired to the in-memory
// collaborators. A step looks like
//   {"op": "stake", "sender": "0x..", "level": 1, "external_id": "5",
//    "expect": "ok"}
// "expect" is optional and is either "ok" or the expected error message.
class ScenarioRunner
{
    staking::StakeRegistry &registry_;
    MemoryLedger &ledger_;
    MemoryVehicleRegistry &vehicles_;
    ManualClock *clock_;
    size_t unexpected_{0};

public:
    // clock is null when the registry runs on the system clock, in which
    // case advance_time steps are rejected
    ScenarioRunner(
        staking::StakeRegistry &, MemoryLedger &, MemoryVehicleRegistry &,
        ManualClock *clock);

    // Fails with ConfigError on a malformed step. Failing operations are not
    // errors; they are reported in the returned step record.
    Result<nlohmann::json> run_step(nlohmann::json const &step);

    // Accepts an array of steps or {"steps": [...]}. Returns
    // {"steps": [...], "unexpected": n}
    Result<nlohmann::json> run(nlohmann::json const &scenario);

    // Steps whose outcome differed from "expect"
    size_t unexpected() const
    {
        return unexpected_;
    }
};

LOCKSTAKE_SIM_NAMESPACE_END
