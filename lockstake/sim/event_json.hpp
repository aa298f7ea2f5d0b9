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

#include <lockstake/sim/config.hpp>
#include <lockstake/staking/events.hpp>

#include <nlohmann/json.hpp>

#include <span>

LOCKSTAKE_SIM_NAMESPACE_BEGIN

// {"event": name, ...fields}; addresses as 0x hex, amounts as decimal strings
nlohmann::json to_json(staking::Event const &);

nlohmann::json to_json(std::span<staking::Event const>);

LOCKSTAKE_SIM_NAMESPACE_END
