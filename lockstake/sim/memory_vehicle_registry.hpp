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
#include <lockstake/core/result.hpp>
#include <lockstake/core/unordered_map.hpp>
#include <lockstake/sim/config.hpp>
#include <lockstake/staking/collaborators.hpp>
#include <lockstake/staking/types.hpp>

#include <cstddef>

LOCKSTAKE_SIM_NAMESPACE_BEGIN

// Non-fungible vehicle ids and their owners. Lives outside the registry's
// transaction boundary.
class MemoryVehicleRegistry final : public staking::ExternalRegistry
{
    unordered_dense_map<staking::ExternalId, Address, Uint256Hash> owners_{};

public:
    Result<void> mint(staking::ExternalId const &, Address const &owner);
    Result<void> burn(staking::ExternalId const &);
    Result<void> transfer(
        Address const &from, Address const &to, staking::ExternalId const &);

    size_t size() const
    {
        return owners_.size();
    }

    bool exists(staking::ExternalId const &) const override;
    Result<Address> owner_of(staking::ExternalId const &) const override;
};

LOCKSTAKE_SIM_NAMESPACE_END
