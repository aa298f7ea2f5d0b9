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
#include <lockstake/core/unordered_map.hpp>
#include <lockstake/core/version_stack.hpp>
#include <lockstake/core/versioned_map.hpp>
#include <lockstake/staking/collaborators.hpp>
#include <lockstake/staking/config.hpp>
#include <lockstake/staking/escrow.hpp>
#include <lockstake/staking/events.hpp>
#include <lockstake/staking/types.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <vector>

LOCKSTAKE_STAKING_NAMESPACE_BEGIN

// All mutable registry state. Every slot is versioned so that a rejected
// call leaves no trace. Escrows and events only ever grow, so they are
// rolled back by truncation to the size recorded at push().
class StakingState
{
    struct Checkpoint
    {
        size_t escrows;
        size_t events;
    };

    unsigned version_{0};
    std::vector<Checkpoint> checkpoints_{};

    VersionStack<StakeId> last_stake_id_{StakeId{0}};
    VersionedMap<StakeId, Stake> stakes_{};
    VersionedMap<StakeId, Address> owners_{};
    VersionedMap<Address, EscrowId> staker_escrow_{};
    VersionedMap<ExternalId, StakeId, Uint256Hash> attachments_{};

    std::vector<EscrowAccount> escrows_{};
    std::vector<Event> events_{};

public:
    StakingState() = default;
    StakingState(StakingState &&) = delete;
    StakingState(StakingState const &) = delete;
    StakingState &operator=(StakingState &&) = delete;
    StakingState &operator=(StakingState const &) = delete;

    unsigned version() const
    {
        return version_;
    }

    StakeId last_stake_id() const;
    StakeId mint_stake_id();

    Stake const *find_stake(StakeId) const;
    void set_stake(StakeId, Stake const &);
    void erase_stake(StakeId);

    Address const *find_owner(StakeId) const;
    void set_owner(StakeId, Address const &);
    void erase_owner(StakeId);

    std::optional<EscrowId> escrow_id_of(Address const &staker) const;
    EscrowAccount const &escrow(EscrowId) const;
    EscrowId create_escrow(
        Address const &staker, Address const &registry, Ledger &);

    std::optional<StakeId> attached_stake(ExternalId const &) const;
    void set_attachment(ExternalId const &, StakeId);
    void erase_attachment(ExternalId const &);

    // Visits every live (external id, stake id) pair
    void for_each_attachment(
        std::function<void(ExternalId const &, StakeId)> const &) const;

    void emit(Event);

    std::vector<Event> const &events() const
    {
        return events_;
    }

    void push();
    void pop_accept();
    void pop_reject();
};

LOCKSTAKE_STAKING_NAMESPACE_END
