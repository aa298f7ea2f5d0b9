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
#include <lockstake/core/int.hpp>
#include <lockstake/core/result.hpp>
#include <lockstake/staking/boost_query.hpp>
#include <lockstake/staking/collaborators.hpp>
#include <lockstake/staking/config.hpp>
#include <lockstake/staking/events.hpp>
#include <lockstake/staking/registry_config.hpp>
#include <lockstake/staking/stake_level.hpp>
#include <lockstake/staking/staking_state.hpp>
#include <lockstake/staking/types.hpp>

#include <mutex>
#include <optional>
#include <span>
#include <vector>

LOCKSTAKE_STAKING_NAMESPACE_BEGIN

// Stake lifecycle and attachment registry. Every mutating call is atomic:
// the state and the ledger are checkpointed on entry and rolled back when
// the call returns an error.
class StakeRegistry
{
    RegistryConfig const config_;
    StakingState &state_;
    Ledger &ledger_;
    ExternalRegistry const &external_;
    TimeOracle const &time_;
    BoostQueryService const boost_;
    mutable std::mutex mutex_;

public:
    StakeRegistry(
        RegistryConfig, StakingState &, Ledger &, ExternalRegistry const &,
        TimeOracle const &);

    Address const &address() const noexcept
    {
        return config_.registry;
    }

    /////////////
    // Mutators //
    /////////////

    // Locks level.amount into the sender's escrow and optionally attaches
    // external_id. Returns the new stake id.
    Result<StakeId> stake(
        Address const &sender, LevelIndex, ExternalId const &external_id);

    // Moves to a strictly higher level, paying the difference and restarting
    // the lock. external_id 0 detaches; the currently attached id is a no-op.
    Result<void> upgrade_stake(
        Address const &sender, StakeId, LevelIndex new_level,
        ExternalId const &external_id);

    // Only once now > lock_end_time
    Result<void> withdraw(Address const &sender, StakeId);

    // All or nothing
    Result<void>
    withdraw(Address const &sender, std::span<StakeId const> stake_ids);

    Result<void> extend_staking(Address const &sender, StakeId);

    Result<void> attach_vehicle(
        Address const &sender, StakeId, ExternalId const &external_id);

    // Allowed for the stake owner and the external item owner
    Result<void>
    detach_vehicle(Address const &sender, ExternalId const &external_id);

    Result<void> transfer(
        Address const &sender, Address const &from, Address const &to,
        StakeId);

    // Voting delegation of the sender's escrow
    Result<void> delegate(Address const &sender, Address const &delegatee);

    // Development deployments only
    Result<void> set_expiration(
        Address const &sender, StakeId, Timestamp lock_end_time);

    /////////////
    // Getters //
    /////////////

    uint256_t get_boost_points(ExternalId const &) const;
    uint256_t get_baseline_points(ExternalId const &) const;

    Result<Address> owner_of(StakeId) const;
    std::optional<Stake> get_stake(StakeId) const;
    // Ledger address of the staker's escrow, if one was ever created
    std::optional<Address> escrow_of(Address const &staker) const;
    std::optional<StakeId> attached_stake(ExternalId const &) const;
    StakeId last_stake_id() const;
    StakeLevelTable const &stake_levels() const noexcept;
    std::vector<Event> events() const;

private:
    template <class F>
    auto transact(char const *name, F &&) -> decltype(std::declval<F>()());

    Result<Stake> owned_stake(Address const &owner, StakeId) const;
    EscrowId escrow_for(Address const &staker);
    Result<void> deposit(
        Address const &payer, EscrowId, uint256_t const &amount);

    void detach_external(StakeId, Stake &, Address const &owner);
    Result<void> attach_external(
        StakeId, Address const &owner, ExternalId const &, Timestamp now);

    Result<void> withdraw_one(Address const &sender, StakeId, Timestamp now);
};

LOCKSTAKE_STAKING_NAMESPACE_END
