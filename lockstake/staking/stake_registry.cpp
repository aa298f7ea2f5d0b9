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
#include <lockstake/core/checked_math.hpp>
#include <lockstake/core/fmt/address_fmt.hpp> // NOLINT
#include <lockstake/core/fmt/int_fmt.hpp> // NOLINT
#include <lockstake/core/int.hpp>
#include <lockstake/core/likely.h>
#include <lockstake/core/result.hpp>
#include <lockstake/staking/boost_query.hpp>
#include <lockstake/staking/collaborators.hpp>
#include <lockstake/staking/config.hpp>
#include <lockstake/staking/escrow.hpp>
#include <lockstake/staking/events.hpp>
#include <lockstake/staking/registry_config.hpp>
#include <lockstake/staking/stake_level.hpp>
#include <lockstake/staking/stake_registry.hpp>
#include <lockstake/staking/staking_error.hpp>
#include <lockstake/staking/staking_state.hpp>
#include <lockstake/staking/types.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

LOCKSTAKE_STAKING_NAMESPACE_BEGIN

StakeRegistry::StakeRegistry(
    RegistryConfig config, StakingState &state, Ledger &ledger,
    ExternalRegistry const &external, TimeOracle const &time)
    : config_{std::move(config)}
    , state_{state}
    , ledger_{ledger}
    , external_{external}
    , time_{time}
    , boost_{state_, config_.levels, external_}
{
}

template <class F>
auto StakeRegistry::transact(char const *const name, F &&f)
    -> decltype(std::declval<F>()())
{
    std::lock_guard<std::mutex> const lock{mutex_};

    state_.push();
    ledger_.push();
    auto res = std::forward<F>(f)();
    if (res.has_error()) {
        ledger_.pop_reject();
        state_.pop_reject();
        LOG_DEBUG(
            "StakeRegistry: {} rejected -- {}",
            name,
            res.error().message().c_str());
    }
    else {
        ledger_.pop_accept();
        state_.pop_accept();
    }
    return res;
}

Result<Stake>
StakeRegistry::owned_stake(Address const &owner, StakeId const stake_id) const
{
    auto const *const recorded = state_.find_owner(stake_id);
    if (recorded == nullptr || *recorded != owner) {
        return StakingError::InvalidStakeId;
    }
    auto const *const stake = state_.find_stake(stake_id);
    LOCKSTAKE_ASSERT(stake != nullptr && stake->amount != 0);
    return *stake;
}

EscrowId StakeRegistry::escrow_for(Address const &staker)
{
    auto const id = state_.escrow_id_of(staker);
    if (id.has_value()) {
        return *id;
    }
    return state_.create_escrow(staker, config_.registry, ledger_);
}

Result<void> StakeRegistry::deposit(
    Address const &payer, EscrowId const escrow_id, uint256_t const &amount)
{
    BOOST_OUTCOME_TRY(
        auto const ok,
        ledger_.transfer_from(
            config_.registry,
            payer,
            state_.escrow(escrow_id).address(),
            amount));
    if (LOCKSTAKE_UNLIKELY(!ok)) {
        return StakingError::TransferFailed;
    }
    return outcome::success();
}

void StakeRegistry::detach_external(
    StakeId const stake_id, Stake &stake, Address const &owner)
{
    auto const external_id = stake.attached_external_id;
    LOCKSTAKE_ASSERT(external_id != 0);
    LOCKSTAKE_ASSERT(state_.attached_stake(external_id) == stake_id);

    state_.erase_attachment(external_id);
    stake.attached_external_id = 0;
    state_.set_stake(stake_id, stake);
    state_.emit(ExternalDetached{
        .staker = owner, .stake_id = stake_id, .external_id = external_id});
}

Result<void> StakeRegistry::attach_external(
    StakeId const stake_id, Address const &owner,
    ExternalId const &external_id, Timestamp const now)
{
    LOCKSTAKE_ASSERT(external_id != 0);

    if (!external_.exists(external_id)) {
        return StakingError::InvalidExternalId;
    }

    auto const holder = state_.attached_stake(external_id);
    if (holder.has_value()) {
        if (*holder == stake_id) {
            return StakingError::AlreadyAttached;
        }
        auto const *const previous = state_.find_stake(*holder);
        LOCKSTAKE_ASSERT(previous != nullptr);
        if (!is_expired(*previous, now)) {
            return StakingError::AlreadyAttached;
        }
        auto const *const previous_owner = state_.find_owner(*holder);
        LOCKSTAKE_ASSERT(previous_owner != nullptr);
        LOG_INFO(
            "StakeRegistry: external id {} moves from expired stake {} to "
            "stake {}",
            external_id,
            *holder,
            stake_id);
        Stake released = *previous;
        detach_external(*holder, released, *previous_owner);
    }

    auto const *const current = state_.find_stake(stake_id);
    LOCKSTAKE_ASSERT(current != nullptr);
    Stake stake = *current;
    if (stake.attached_external_id != 0) {
        detach_external(stake_id, stake, owner);
    }

    stake.attached_external_id = external_id;
    state_.set_stake(stake_id, stake);
    state_.set_attachment(external_id, stake_id);
    state_.emit(ExternalAttached{
        .staker = owner, .stake_id = stake_id, .external_id = external_id});
    return outcome::success();
}

Result<StakeId> StakeRegistry::stake(
    Address const &sender, LevelIndex const level,
    ExternalId const &external_id)
{
    return transact("stake", [&]() -> Result<StakeId> {
        BOOST_OUTCOME_TRY(auto const stake_level, config_.levels.get(level));
        auto const now = time_.now();
        BOOST_OUTCOME_TRY(
            auto const lock_end_time,
            checked_add(now, stake_level.lock_duration));

        auto const stake_id = state_.mint_stake_id();
        auto const escrow_id = escrow_for(sender);
        BOOST_OUTCOME_TRY(deposit(sender, escrow_id, stake_level.amount));

        state_.set_stake(
            stake_id,
            Stake{
                .level = level,
                .amount = stake_level.amount,
                .lock_end_time = lock_end_time,
                .attached_external_id = 0});
        state_.set_owner(stake_id, sender);
        state_.emit(StakeCreated{
            .staker = sender,
            .stake_id = stake_id,
            .escrow = state_.escrow(escrow_id).address(),
            .level = level,
            .amount = stake_level.amount,
            .lock_end_time = lock_end_time,
            .points = stake_level.points});

        if (external_id != 0) {
            BOOST_OUTCOME_TRY(
                attach_external(stake_id, sender, external_id, now));
        }
        return stake_id;
    });
}

Result<void> StakeRegistry::upgrade_stake(
    Address const &sender, StakeId const stake_id, LevelIndex const new_level,
    ExternalId const &external_id)
{
    return transact("upgrade_stake", [&]() -> Result<void> {
        BOOST_OUTCOME_TRY(auto stake, owned_stake(sender, stake_id));
        if (new_level <= stake.level) {
            return StakingError::InvalidLevel;
        }
        BOOST_OUTCOME_TRY(auto const next, config_.levels.get(new_level));
        BOOST_OUTCOME_TRY(auto const prev, config_.levels.get(stake.level));
        BOOST_OUTCOME_TRY(
            auto const amount_diff, checked_sub(next.amount, prev.amount));
        auto const now = time_.now();
        BOOST_OUTCOME_TRY(
            auto const lock_end_time, checked_add(now, next.lock_duration));

        auto const escrow_id = state_.escrow_id_of(sender);
        LOCKSTAKE_ASSERT(escrow_id.has_value());
        BOOST_OUTCOME_TRY(deposit(sender, *escrow_id, amount_diff));

        BOOST_OUTCOME_TRY(
            auto const amount, checked_add(stake.amount, amount_diff));
        stake.level = new_level;
        stake.amount = amount;
        stake.lock_end_time = lock_end_time;
        state_.set_stake(stake_id, stake);

        if (external_id == 0) {
            if (stake.attached_external_id != 0) {
                detach_external(stake_id, stake, sender);
            }
        }
        else if (external_id != stake.attached_external_id) {
            BOOST_OUTCOME_TRY(
                attach_external(stake_id, sender, external_id, now));
        }

        state_.emit(StakeCreated{
            .staker = sender,
            .stake_id = stake_id,
            .escrow = state_.escrow(*escrow_id).address(),
            .level = new_level,
            .amount = amount,
            .lock_end_time = lock_end_time,
            .points = next.points});
        return outcome::success();
    });
}

Result<void> StakeRegistry::withdraw_one(
    Address const &sender, StakeId const stake_id, Timestamp const now)
{
    BOOST_OUTCOME_TRY(auto stake, owned_stake(sender, stake_id));
    if (!is_expired(stake, now)) {
        return StakingError::TokensStillLocked;
    }
    if (stake.attached_external_id != 0) {
        detach_external(stake_id, stake, sender);
    }

    auto const escrow_id = state_.escrow_id_of(sender);
    LOCKSTAKE_ASSERT(escrow_id.has_value());
    BOOST_OUTCOME_TRY(state_.escrow(*escrow_id)
                          .release(config_.registry, stake.amount, sender));
    BOOST_OUTCOME_TRY(auto const level, config_.levels.get(stake.level));

    state_.erase_stake(stake_id);
    state_.erase_owner(stake_id);
    state_.emit(StakeWithdrawn{
        .staker = sender,
        .stake_id = stake_id,
        .amount = stake.amount,
        .points = level.points});
    return outcome::success();
}

Result<void>
StakeRegistry::withdraw(Address const &sender, StakeId const stake_id)
{
    return transact("withdraw", [&]() -> Result<void> {
        return withdraw_one(sender, stake_id, time_.now());
    });
}

Result<void> StakeRegistry::withdraw(
    Address const &sender, std::span<StakeId const> const stake_ids)
{
    return transact("withdraw", [&]() -> Result<void> {
        auto const now = time_.now();
        for (auto const stake_id : stake_ids) {
            BOOST_OUTCOME_TRY(withdraw_one(sender, stake_id, now));
        }
        return outcome::success();
    });
}

Result<void>
StakeRegistry::extend_staking(Address const &sender, StakeId const stake_id)
{
    return transact("extend_staking", [&]() -> Result<void> {
        BOOST_OUTCOME_TRY(auto stake, owned_stake(sender, stake_id));
        BOOST_OUTCOME_TRY(auto const level, config_.levels.get(stake.level));
        BOOST_OUTCOME_TRY(
            auto const lock_end_time,
            checked_add(time_.now(), level.lock_duration));

        stake.lock_end_time = lock_end_time;
        state_.set_stake(stake_id, stake);
        state_.emit(StakeExtended{
            .staker = sender,
            .stake_id = stake_id,
            .lock_end_time = lock_end_time});
        return outcome::success();
    });
}

Result<void> StakeRegistry::attach_vehicle(
    Address const &sender, StakeId const stake_id,
    ExternalId const &external_id)
{
    return transact("attach_vehicle", [&]() -> Result<void> {
        BOOST_OUTCOME_TRY(owned_stake(sender, stake_id));
        if (external_id == 0) {
            return StakingError::InvalidExternalId;
        }
        return attach_external(stake_id, sender, external_id, time_.now());
    });
}

Result<void> StakeRegistry::detach_vehicle(
    Address const &sender, ExternalId const &external_id)
{
    return transact("detach_vehicle", [&]() -> Result<void> {
        auto const stake_id = state_.attached_stake(external_id);
        if (!stake_id.has_value()) {
            return StakingError::NoActiveStaking;
        }
        auto const *const owner = state_.find_owner(*stake_id);
        LOCKSTAKE_ASSERT(owner != nullptr);
        if (*owner != sender) {
            auto const item_owner = external_.owner_of(external_id);
            if (item_owner.has_error()) {
                return StakingError::InvalidExternalId;
            }
            if (item_owner.value() != sender) {
                return StakingError::Unauthorized;
            }
        }
        auto const *const current = state_.find_stake(*stake_id);
        LOCKSTAKE_ASSERT(current != nullptr);
        Stake stake = *current;
        detach_external(*stake_id, stake, *owner);
        return outcome::success();
    });
}

Result<void> StakeRegistry::transfer(
    Address const &sender, Address const &from, Address const &to,
    StakeId const stake_id)
{
    return transact("transfer", [&]() -> Result<void> {
        if (sender != from) {
            return StakingError::Unauthorized;
        }
        BOOST_OUTCOME_TRY(auto const stake, owned_stake(from, stake_id));
        if (to == Address{}) {
            return StakingError::InvalidInput;
        }
        BOOST_OUTCOME_TRY(auto const level, config_.levels.get(stake.level));

        auto const from_escrow = state_.escrow_id_of(from);
        LOCKSTAKE_ASSERT(from_escrow.has_value());
        auto const to_escrow = escrow_for(to);
        if (*from_escrow != to_escrow) {
            BOOST_OUTCOME_TRY(
                state_.escrow(*from_escrow)
                    .move(
                        config_.registry,
                        stake.amount,
                        state_.escrow(to_escrow)));
        }

        state_.set_owner(stake_id, to);
        state_.emit(StakeWithdrawn{
            .staker = from,
            .stake_id = stake_id,
            .amount = stake.amount,
            .points = level.points});
        state_.emit(StakeCreated{
            .staker = to,
            .stake_id = stake_id,
            .escrow = state_.escrow(to_escrow).address(),
            .level = stake.level,
            .amount = stake.amount,
            .lock_end_time = stake.lock_end_time,
            .points = level.points});
        return outcome::success();
    });
}

Result<void>
StakeRegistry::delegate(Address const &sender, Address const &delegatee)
{
    return transact("delegate", [&]() -> Result<void> {
        auto const escrow_id = state_.escrow_id_of(sender);
        if (!escrow_id.has_value()) {
            return StakingError::EscrowNotFound;
        }
        return state_.escrow(*escrow_id)
            .delegate_voting_power(config_.registry, delegatee);
    });
}

Result<void> StakeRegistry::set_expiration(
    Address const &sender, StakeId const stake_id,
    Timestamp const lock_end_time)
{
    return transact("set_expiration", [&]() -> Result<void> {
        if (!config_.allow_set_expiration) {
            return StakingError::Unauthorized;
        }
        BOOST_OUTCOME_TRY(auto stake, owned_stake(sender, stake_id));
        BOOST_OUTCOME_TRY(auto const level, config_.levels.get(stake.level));
        auto const escrow_id = state_.escrow_id_of(sender);
        LOCKSTAKE_ASSERT(escrow_id.has_value());

        stake.lock_end_time = lock_end_time;
        state_.set_stake(stake_id, stake);
        state_.emit(StakeCreated{
            .staker = sender,
            .stake_id = stake_id,
            .escrow = state_.escrow(*escrow_id).address(),
            .level = stake.level,
            .amount = stake.amount,
            .lock_end_time = lock_end_time,
            .points = level.points});
        return outcome::success();
    });
}

uint256_t StakeRegistry::get_boost_points(ExternalId const &external_id) const
{
    std::lock_guard<std::mutex> const lock{mutex_};
    return boost_.points_for(external_id, time_.now());
}

uint256_t
StakeRegistry::get_baseline_points(ExternalId const &external_id) const
{
    return get_boost_points(external_id);
}

Result<Address> StakeRegistry::owner_of(StakeId const stake_id) const
{
    std::lock_guard<std::mutex> const lock{mutex_};
    auto const *const owner = state_.find_owner(stake_id);
    if (owner == nullptr) {
        return StakingError::InvalidStakeId;
    }
    return *owner;
}

std::optional<Stake> StakeRegistry::get_stake(StakeId const stake_id) const
{
    std::lock_guard<std::mutex> const lock{mutex_};
    auto const *const stake = state_.find_stake(stake_id);
    if (stake == nullptr) {
        return std::nullopt;
    }
    return *stake;
}

std::optional<Address> StakeRegistry::escrow_of(Address const &staker) const
{
    std::lock_guard<std::mutex> const lock{mutex_};
    auto const escrow_id = state_.escrow_id_of(staker);
    if (!escrow_id.has_value()) {
        return std::nullopt;
    }
    return state_.escrow(*escrow_id).address();
}

std::optional<StakeId>
StakeRegistry::attached_stake(ExternalId const &external_id) const
{
    std::lock_guard<std::mutex> const lock{mutex_};
    return state_.attached_stake(external_id);
}

StakeId StakeRegistry::last_stake_id() const
{
    std::lock_guard<std::mutex> const lock{mutex_};
    return state_.last_stake_id();
}

StakeLevelTable const &StakeRegistry::stake_levels() const noexcept
{
    return config_.levels;
}

std::vector<Event> StakeRegistry::events() const
{
    std::lock_guard<std::mutex> const lock{mutex_};
    return state_.events();
}

LOCKSTAKE_STAKING_NAMESPACE_END
