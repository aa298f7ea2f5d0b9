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
#include <lockstake/core/assert.h>
#include <lockstake/staking/collaborators.hpp>
#include <lockstake/staking/config.hpp>
#include <lockstake/staking/escrow.hpp>
#include <lockstake/staking/events.hpp>
#include <lockstake/staking/staking_state.hpp>
#include <lockstake/staking/types.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <utility>

LOCKSTAKE_STAKING_NAMESPACE_BEGIN

StakeId StakingState::last_stake_id() const
{
    return last_stake_id_.recent();
}

StakeId StakingState::mint_stake_id()
{
    auto &id = last_stake_id_.current(version_);
    LOCKSTAKE_ASSERT(id < std::numeric_limits<StakeId>::max());
    return ++id;
}

Stake const *StakingState::find_stake(StakeId const id) const
{
    return stakes_.find(id);
}

void StakingState::set_stake(StakeId const id, Stake const &stake)
{
    stakes_.set(id, stake, version_);
}

void StakingState::erase_stake(StakeId const id)
{
    stakes_.erase(id, version_);
}

Address const *StakingState::find_owner(StakeId const id) const
{
    return owners_.find(id);
}

void StakingState::set_owner(StakeId const id, Address const &owner)
{
    owners_.set(id, owner, version_);
}

void StakingState::erase_owner(StakeId const id)
{
    owners_.erase(id, version_);
}

std::optional<EscrowId> StakingState::escrow_id_of(Address const &staker) const
{
    auto const *const id = staker_escrow_.find(staker);
    if (id == nullptr) {
        return std::nullopt;
    }
    return *id;
}

EscrowAccount const &StakingState::escrow(EscrowId const id) const
{
    LOCKSTAKE_ASSERT(id < escrows_.size());
    return escrows_[id];
}

EscrowId StakingState::create_escrow(
    Address const &staker, Address const &registry, Ledger &ledger)
{
    LOCKSTAKE_ASSERT(!staker_escrow_.contains(staker));
    LOCKSTAKE_ASSERT(escrows_.size() < std::numeric_limits<EscrowId>::max());

    auto const id = static_cast<EscrowId>(escrows_.size());
    escrows_.emplace_back(id, staker, registry, ledger);
    staker_escrow_.set(staker, id, version_);
    return id;
}

std::optional<StakeId>
StakingState::attached_stake(ExternalId const &external_id) const
{
    auto const *const id = attachments_.find(external_id);
    if (id == nullptr) {
        return std::nullopt;
    }
    return *id;
}

void StakingState::set_attachment(
    ExternalId const &external_id, StakeId const stake_id)
{
    LOCKSTAKE_ASSERT(external_id != 0);
    attachments_.set(external_id, stake_id, version_);
}

void StakingState::erase_attachment(ExternalId const &external_id)
{
    attachments_.erase(external_id, version_);
}

void StakingState::for_each_attachment(
    std::function<void(ExternalId const &, StakeId)> const &f) const
{
    attachments_.for_each(
        [&f](ExternalId const &external_id, StakeId const stake_id) {
            f(external_id, stake_id);
        });
}

void StakingState::emit(Event event)
{
    events_.push_back(std::move(event));
}

void StakingState::push()
{
    checkpoints_.push_back({escrows_.size(), events_.size()});
    ++version_;
}

void StakingState::pop_accept()
{
    LOCKSTAKE_ASSERT(version_);
    LOCKSTAKE_ASSERT(checkpoints_.size() == version_);

    last_stake_id_.pop_accept(version_);
    stakes_.pop_accept(version_);
    owners_.pop_accept(version_);
    staker_escrow_.pop_accept(version_);
    attachments_.pop_accept(version_);
    checkpoints_.pop_back();

    --version_;
}

void StakingState::pop_reject()
{
    LOCKSTAKE_ASSERT(version_);
    LOCKSTAKE_ASSERT(checkpoints_.size() == version_);

    last_stake_id_.pop_reject(version_);
    stakes_.pop_reject(version_);
    owners_.pop_reject(version_);
    staker_escrow_.pop_reject(version_);
    attachments_.pop_reject(version_);

    auto const &checkpoint = checkpoints_.back();
    LOCKSTAKE_ASSERT(checkpoint.escrows <= escrows_.size());
    LOCKSTAKE_ASSERT(checkpoint.events <= events_.size());
    escrows_.erase(
        escrows_.begin() + static_cast<std::ptrdiff_t>(checkpoint.escrows),
        escrows_.end());
    events_.erase(
        events_.begin() + static_cast<std::ptrdiff_t>(checkpoint.events),
        events_.end());
    checkpoints_.pop_back();

    --version_;
}

LOCKSTAKE_STAKING_NAMESPACE_END
