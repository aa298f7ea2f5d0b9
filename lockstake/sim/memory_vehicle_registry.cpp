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

#include <lockstake/core/address.hpp>
#include <lockstake/core/result.hpp>
#include <lockstake/sim/config.hpp>
#include <lockstake/sim/memory_vehicle_registry.hpp>
#include <lockstake/staking/collaborators.hpp>
#include <lockstake/staking/types.hpp>

#include <boost/outcome/success_failure.hpp>

LOCKSTAKE_SIM_NAMESPACE_BEGIN

using staking::ExternalId;
using staking::RegistryError;

Result<void>
MemoryVehicleRegistry::mint(ExternalId const &id, Address const &owner)
{
    if (id == 0) {
        return RegistryError::NotFound;
    }
    if (!owners_.try_emplace(id, owner).second) {
        return RegistryError::AlreadyExists;
    }
    return outcome::success();
}

Result<void> MemoryVehicleRegistry::burn(ExternalId const &id)
{
    if (owners_.erase(id) == 0) {
        return RegistryError::NotFound;
    }
    return outcome::success();
}

Result<void> MemoryVehicleRegistry::transfer(
    Address const &from, Address const &to, ExternalId const &id)
{
    auto const it = owners_.find(id);
    if (it == owners_.end()) {
        return RegistryError::NotFound;
    }
    if (it->second != from) {
        return RegistryError::NotOwner;
    }
    it->second = to;
    return outcome::success();
}

bool MemoryVehicleRegistry::exists(ExternalId const &id) const
{
    return owners_.contains(id);
}

Result<Address> MemoryVehicleRegistry::owner_of(ExternalId const &id) const
{
    auto const it = owners_.find(id);
    if (it == owners_.end()) {
        return RegistryError::NotFound;
    }
    return it->second;
}

LOCKSTAKE_SIM_NAMESPACE_END
