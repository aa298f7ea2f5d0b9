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
#include <lockstake/core/checked_math.hpp>
#include <lockstake/core/int.hpp>
#include <lockstake/sim/clock.hpp>
#include <lockstake/sim/memory_ledger.hpp>
#include <lockstake/sim/memory_vehicle_registry.hpp>
#include <lockstake/staking/boost_query.hpp>
#include <lockstake/staking/events.hpp>
#include <lockstake/staking/registry_config.hpp>
#include <lockstake/staking/stake_level.hpp>
#include <lockstake/staking/stake_registry.hpp>
#include <lockstake/staking/staking_error.hpp>
#include <lockstake/staking/staking_state.hpp>
#include <lockstake/staking/types.hpp>

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <thread>
#include <variant>
#include <vector>

using namespace lockstake;
using namespace lockstake::staking;

namespace
{
    constexpr Address REGISTRY{0x5e0};
    constexpr Address ALICE{0xa11ce};
    constexpr Address BOB{0xb0b};
    constexpr Address CAROL{0xca201};

    constexpr Timestamp T0{1'700'000'000};
    constexpr uint256_t FUNDS{10'000 * TOKEN};

    StakeLevelTable test_levels()
    {
        return StakeLevelTable::create({
                                           {500 * TOKEN, 180 * DAY, 1000},
                                           {1500 * TOKEN, 365 * DAY, 2000},
                                           {4000 * TOKEN, 730 * DAY, 3000},
                                       })
            .value();
    }

    RegistryConfig test_config(bool const allow_set_expiration = false)
    {
        return RegistryConfig{
            .registry = REGISTRY,
            .allow_set_expiration = allow_set_expiration,
            .levels = test_levels()};
    }
}

struct StakeRegistryTest : public ::testing::Test
{
    sim::MemoryLedger ledger;
    sim::MemoryVehicleRegistry vehicles;
    sim::ManualClock clock{T0};
    StakingState state;
    StakeRegistry registry{test_config(), state, ledger, vehicles, clock};

    void SetUp() override
    {
        fund(ALICE);
        fund(BOB);
        ASSERT_TRUE(vehicles.mint(5, ALICE).has_value());
        ASSERT_TRUE(vehicles.mint(7, ALICE).has_value());
        ASSERT_TRUE(vehicles.mint(8, ALICE).has_value());
        ASSERT_TRUE(vehicles.mint(9, CAROL).has_value());
    }

    void fund(Address const &staker)
    {
        ASSERT_TRUE(ledger.mint(staker, FUNDS).has_value());
        ledger.approve(staker, REGISTRY, UINT256_MAX);
    }

    void advance(Duration const seconds)
    {
        ASSERT_TRUE(clock.advance(seconds).has_value());
    }

    StakeId must_stake(
        Address const &staker, LevelIndex const level,
        ExternalId const &external_id = 0)
    {
        auto const res = registry.stake(staker, level, external_id);
        EXPECT_TRUE(res.has_value());
        return res.has_value() ? res.value() : StakeId{0};
    }

    uint256_t escrow_balance(Address const &staker) const
    {
        auto const escrow = registry.escrow_of(staker);
        return escrow.has_value() ? ledger.balance_of(*escrow) : uint256_t{0};
    }

    std::vector<Event> events_since(size_t const n) const
    {
        auto const all = registry.events();
        return std::vector<Event>(
            all.begin() + static_cast<std::ptrdiff_t>(n), all.end());
    }

    // sum of live stake amounts per staker equals the escrow balance
    void check_conservation(std::vector<Address> const &stakers) const
    {
        for (auto const &staker : stakers) {
            uint256_t total = 0;
            for (StakeId id = 1; id <= registry.last_stake_id(); ++id) {
                auto const owner = registry.owner_of(id);
                if (owner.has_value() && owner.value() == staker) {
                    total += registry.get_stake(id).value().amount;
                }
            }
            EXPECT_EQ(total, escrow_balance(staker));
        }
    }

    // external id -> stake id and stake -> external id agree
    void check_attachments() const
    {
        for (StakeId id = 1; id <= registry.last_stake_id(); ++id) {
            auto const stake = registry.get_stake(id);
            if (stake.has_value() && stake->attached_external_id != 0) {
                EXPECT_EQ(
                    registry.attached_stake(stake->attached_external_id), id);
            }
        }
        state.for_each_attachment(
            [this](ExternalId const &external_id, StakeId const stake_id) {
                auto const stake = registry.get_stake(stake_id);
                ASSERT_TRUE(stake.has_value());
                EXPECT_EQ(stake->attached_external_id, external_id);
            });
    }
};

TEST_F(StakeRegistryTest, stake_mints_ids_and_escrow)
{
    EXPECT_EQ(registry.last_stake_id(), 0);
    EXPECT_FALSE(registry.escrow_of(ALICE).has_value());

    auto const first = must_stake(ALICE, 0);
    auto const second = must_stake(ALICE, 1);
    EXPECT_EQ(first, 1);
    EXPECT_EQ(second, 2);
    EXPECT_EQ(registry.last_stake_id(), 2);

    auto const escrow = registry.escrow_of(ALICE);
    ASSERT_TRUE(escrow.has_value());
    EXPECT_EQ(ledger.balance_of(*escrow), 2000 * TOKEN);
    EXPECT_EQ(ledger.balance_of(ALICE), FUNDS - 2000 * TOKEN);
    EXPECT_EQ(registry.owner_of(first).value(), ALICE);

    auto const stake = registry.get_stake(second);
    ASSERT_TRUE(stake.has_value());
    EXPECT_EQ(stake->level, 1);
    EXPECT_EQ(stake->amount, 1500 * TOKEN);
    EXPECT_EQ(stake->lock_end_time, T0 + 365 * DAY);
    EXPECT_EQ(stake->attached_external_id, 0);

    auto const events = registry.events();
    ASSERT_EQ(events.size(), 2);
    EXPECT_EQ(
        events[1],
        Event{StakeCreated{
            .staker = ALICE,
            .stake_id = second,
            .escrow = *escrow,
            .level = 1,
            .amount = 1500 * TOKEN,
            .lock_end_time = T0 + 365 * DAY,
            .points = 2000}});

    // one escrow per staker, distinct across stakers
    must_stake(BOB, 0);
    EXPECT_NE(registry.escrow_of(BOB), escrow);
    check_conservation({ALICE, BOB});
}

TEST_F(StakeRegistryTest, stake_invalid_level)
{
    auto const res = registry.stake(ALICE, 3, 0);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), StakingError::InvalidLevel);
    EXPECT_EQ(registry.last_stake_id(), 0);
    EXPECT_FALSE(registry.escrow_of(ALICE).has_value());
    EXPECT_TRUE(registry.events().empty());
}

TEST_F(StakeRegistryTest, stake_ledger_errors_propagate)
{
    ASSERT_TRUE(ledger.mint(CAROL, 5000 * TOKEN).has_value());
    auto const no_allowance = registry.stake(CAROL, 0, 0);
    ASSERT_TRUE(no_allowance.has_error());
    EXPECT_EQ(
        no_allowance.assume_error(), sim::LedgerError::InsufficientAllowance);
    EXPECT_FALSE(registry.escrow_of(CAROL).has_value());
    EXPECT_EQ(registry.last_stake_id(), 0);

    ledger.approve(CAROL, REGISTRY, 100 * TOKEN);
    auto const low_allowance = registry.stake(CAROL, 0, 0);
    ASSERT_TRUE(low_allowance.has_error());
    EXPECT_EQ(
        low_allowance.assume_error(), sim::LedgerError::InsufficientAllowance);

    ledger.approve(CAROL, REGISTRY, UINT256_MAX);
    auto const first = registry.stake(CAROL, 2, 0);
    ASSERT_TRUE(first.has_value());
    auto const broke = registry.stake(CAROL, 2, 0);
    ASSERT_TRUE(broke.has_error());
    EXPECT_EQ(broke.assume_error(), sim::LedgerError::InsufficientBalance);
    EXPECT_EQ(registry.last_stake_id(), first.value());
    EXPECT_EQ(ledger.balance_of(CAROL), 1000 * TOKEN);
}

TEST_F(StakeRegistryTest, stake_transfer_refused)
{
    ledger.set_reject_transfers(true);
    auto const res = registry.stake(ALICE, 0, 0);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), StakingError::TransferFailed);
    EXPECT_EQ(ledger.balance_of(ALICE), FUNDS);
    EXPECT_EQ(registry.last_stake_id(), 0);
}

TEST_F(StakeRegistryTest, stake_with_unknown_external_id)
{
    auto const res = registry.stake(ALICE, 1, 42);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), StakingError::InvalidExternalId);

    // the whole call is undone, including the deposit and the new escrow
    EXPECT_EQ(registry.last_stake_id(), 0);
    EXPECT_FALSE(registry.escrow_of(ALICE).has_value());
    EXPECT_EQ(ledger.balance_of(ALICE), FUNDS);
    EXPECT_TRUE(registry.events().empty());
}

TEST_F(StakeRegistryTest, stake_with_external_id)
{
    auto const id = must_stake(ALICE, 1, 5);
    EXPECT_EQ(registry.attached_stake(5), id);
    EXPECT_EQ(registry.get_stake(id)->attached_external_id, 5);

    auto const events = registry.events();
    ASSERT_EQ(events.size(), 2);
    EXPECT_TRUE(std::holds_alternative<StakeCreated>(events[0]));
    EXPECT_EQ(
        events[1],
        Event{ExternalAttached{
            .staker = ALICE, .stake_id = id, .external_id = 5}});
    check_attachments();
}

TEST_F(StakeRegistryTest, expired_takeover)
{
    auto const x = must_stake(ALICE, 0, 9);

    auto const blocked = registry.stake(BOB, 0, 9);
    ASSERT_TRUE(blocked.has_error());
    EXPECT_EQ(blocked.assume_error(), StakingError::AlreadyAttached);

    // expiry is strictly after lock_end_time
    advance(180 * DAY);
    auto const at_boundary = registry.stake(BOB, 0, 9);
    ASSERT_TRUE(at_boundary.has_error());
    EXPECT_EQ(at_boundary.assume_error(), StakingError::AlreadyAttached);

    advance(1);
    auto const before = registry.events().size();
    auto const y = must_stake(BOB, 0, 9);

    auto const events = events_since(before);
    ASSERT_EQ(events.size(), 3);
    EXPECT_TRUE(std::holds_alternative<StakeCreated>(events[0]));
    EXPECT_EQ(
        events[1],
        Event{ExternalDetached{
            .staker = ALICE, .stake_id = x, .external_id = 9}});
    EXPECT_EQ(
        events[2],
        Event{
            ExternalAttached{.staker = BOB, .stake_id = y, .external_id = 9}});

    EXPECT_EQ(registry.attached_stake(9), y);
    EXPECT_EQ(registry.get_stake(x)->attached_external_id, 0);
    check_attachments();
}

TEST_F(StakeRegistryTest, lock_and_points_boundaries)
{
    auto const id = must_stake(ALICE, 1, 5);
    EXPECT_EQ(registry.get_boost_points(5), 2000);
    EXPECT_EQ(registry.get_baseline_points(5), 2000);

    advance(365 * DAY);
    auto const locked = registry.withdraw(ALICE, id);
    ASSERT_TRUE(locked.has_error());
    EXPECT_EQ(locked.assume_error(), StakingError::TokensStillLocked);
    EXPECT_EQ(registry.get_boost_points(5), 2000);

    advance(1);
    EXPECT_EQ(registry.get_boost_points(5), 0);
    EXPECT_EQ(registry.get_baseline_points(5), 0);

    auto const before = registry.events().size();
    ASSERT_TRUE(registry.withdraw(ALICE, id).has_value());
    auto const events = events_since(before);
    ASSERT_EQ(events.size(), 2);
    EXPECT_EQ(
        events[1],
        Event{StakeWithdrawn{
            .staker = ALICE,
            .stake_id = id,
            .amount = 1500 * TOKEN,
            .points = 2000}});
}

TEST_F(StakeRegistryTest, withdraw_round_trip)
{
    auto const id = must_stake(ALICE, 1, 5);
    auto const escrow = registry.escrow_of(ALICE).value();
    EXPECT_EQ(ledger.balance_of(escrow), 1500 * TOKEN);

    advance(365 * DAY + 1);
    auto const before = registry.events().size();
    ASSERT_TRUE(registry.withdraw(ALICE, id).has_value());

    EXPECT_EQ(ledger.balance_of(ALICE), FUNDS);
    EXPECT_EQ(ledger.balance_of(escrow), 0);
    EXPECT_FALSE(registry.attached_stake(5).has_value());
    EXPECT_FALSE(registry.get_stake(id).has_value());
    auto const owner = registry.owner_of(id);
    ASSERT_TRUE(owner.has_error());
    EXPECT_EQ(owner.assume_error(), StakingError::InvalidStakeId);

    auto const events = events_since(before);
    ASSERT_EQ(events.size(), 2);
    EXPECT_EQ(
        events[0],
        Event{ExternalDetached{
            .staker = ALICE, .stake_id = id, .external_id = 5}});
    EXPECT_TRUE(std::holds_alternative<StakeWithdrawn>(events[1]));

    // ids are never reused and the escrow survives
    auto const next = must_stake(ALICE, 0);
    EXPECT_EQ(next, id + 1);
    EXPECT_EQ(registry.escrow_of(ALICE), escrow);
    check_conservation({ALICE});
}

TEST_F(StakeRegistryTest, withdraw_errors)
{
    auto const id = must_stake(ALICE, 0);
    advance(180 * DAY + 1);

    auto const not_owner = registry.withdraw(BOB, id);
    ASSERT_TRUE(not_owner.has_error());
    EXPECT_EQ(not_owner.assume_error(), StakingError::InvalidStakeId);

    auto const unminted = registry.withdraw(ALICE, 77);
    ASSERT_TRUE(unminted.has_error());
    EXPECT_EQ(unminted.assume_error(), StakingError::InvalidStakeId);

    ASSERT_TRUE(registry.withdraw(ALICE, id).has_value());
    auto const twice = registry.withdraw(ALICE, id);
    ASSERT_TRUE(twice.has_error());
    EXPECT_EQ(twice.assume_error(), StakingError::InvalidStakeId);
}

TEST_F(StakeRegistryTest, withdraw_from_short_escrow)
{
    auto const id = must_stake(ALICE, 0, 5);
    auto const escrow = registry.escrow_of(ALICE).value();
    advance(180 * DAY + 1);

    // escrow drained outside the registry, the ledger reports a shortfall
    ASSERT_TRUE(ledger.transfer(escrow, CAROL, 1).value());
    auto const before = registry.events().size();

    auto const res = registry.withdraw(ALICE, id);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), StakingError::TransferFailed);

    EXPECT_EQ(registry.owner_of(id).value(), ALICE);
    EXPECT_EQ(registry.attached_stake(5), id);
    EXPECT_EQ(ledger.balance_of(escrow), 500 * TOKEN - 1);
    EXPECT_EQ(registry.events().size(), before);
    check_attachments();
}

TEST_F(StakeRegistryTest, batch_withdraw_is_all_or_nothing)
{
    auto const a = must_stake(ALICE, 0, 5);
    auto const b = must_stake(ALICE, 0);
    auto const c = must_stake(ALICE, 2);
    advance(180 * DAY + 1);

    auto const balance = ledger.balance_of(ALICE);
    auto const event_count = registry.events().size();

    std::vector<StakeId> const all{a, b, c};
    auto const res = registry.withdraw(ALICE, all);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), StakingError::TokensStillLocked);
    EXPECT_EQ(ledger.balance_of(ALICE), balance);
    EXPECT_EQ(registry.events().size(), event_count);
    EXPECT_TRUE(registry.get_stake(a).has_value());
    EXPECT_TRUE(registry.get_stake(b).has_value());
    EXPECT_EQ(registry.attached_stake(5), a);

    std::vector<StakeId> const duplicate{a, a};
    auto const dup = registry.withdraw(ALICE, duplicate);
    ASSERT_TRUE(dup.has_error());
    EXPECT_EQ(dup.assume_error(), StakingError::InvalidStakeId);
    EXPECT_TRUE(registry.get_stake(a).has_value());

    std::vector<StakeId> const expired{a, b};
    ASSERT_TRUE(registry.withdraw(ALICE, expired).has_value());
    EXPECT_EQ(ledger.balance_of(ALICE), balance + 1000 * TOKEN);
    EXPECT_FALSE(registry.get_stake(a).has_value());
    EXPECT_FALSE(registry.get_stake(b).has_value());
    EXPECT_TRUE(registry.get_stake(c).has_value());
    check_conservation({ALICE});
    check_attachments();
}

TEST_F(StakeRegistryTest, upgrade_moves_difference)
{
    auto const id = must_stake(ALICE, 0);
    advance(100 * DAY);

    auto const escrow = registry.escrow_of(ALICE).value();
    auto const before = registry.events().size();
    ASSERT_TRUE(registry.upgrade_stake(ALICE, id, 2, 0).has_value());

    EXPECT_EQ(ledger.balance_of(escrow), 4000 * TOKEN);
    EXPECT_EQ(ledger.balance_of(ALICE), FUNDS - 4000 * TOKEN);

    auto const stake = registry.get_stake(id);
    ASSERT_TRUE(stake.has_value());
    EXPECT_EQ(stake->level, 2);
    EXPECT_EQ(stake->amount, 4000 * TOKEN);
    EXPECT_EQ(stake->lock_end_time, T0 + 100 * DAY + 730 * DAY);

    auto const events = events_since(before);
    ASSERT_EQ(events.size(), 1);
    EXPECT_EQ(
        events[0],
        Event{StakeCreated{
            .staker = ALICE,
            .stake_id = id,
            .escrow = escrow,
            .level = 2,
            .amount = 4000 * TOKEN,
            .lock_end_time = T0 + 830 * DAY,
            .points = 3000}});
    check_conservation({ALICE});
}

TEST_F(StakeRegistryTest, upgrade_errors)
{
    auto const id = must_stake(ALICE, 1);

    auto const same = registry.upgrade_stake(ALICE, id, 1, 0);
    ASSERT_TRUE(same.has_error());
    EXPECT_EQ(same.assume_error(), StakingError::InvalidLevel);

    auto const down = registry.upgrade_stake(ALICE, id, 0, 0);
    ASSERT_TRUE(down.has_error());
    EXPECT_EQ(down.assume_error(), StakingError::InvalidLevel);

    auto const out_of_range = registry.upgrade_stake(ALICE, id, 3, 0);
    ASSERT_TRUE(out_of_range.has_error());
    EXPECT_EQ(out_of_range.assume_error(), StakingError::InvalidLevel);

    auto const not_owner = registry.upgrade_stake(BOB, id, 2, 0);
    ASSERT_TRUE(not_owner.has_error());
    EXPECT_EQ(not_owner.assume_error(), StakingError::InvalidStakeId);

    // a failed attachment undoes the payment
    auto const bad_external = registry.upgrade_stake(ALICE, id, 2, 42);
    ASSERT_TRUE(bad_external.has_error());
    EXPECT_EQ(bad_external.assume_error(), StakingError::InvalidExternalId);
    EXPECT_EQ(registry.get_stake(id)->level, 1);
    EXPECT_EQ(escrow_balance(ALICE), 1500 * TOKEN);
    check_conservation({ALICE});
}

TEST_F(StakeRegistryTest, upgrade_attachment_changes)
{
    auto const id = must_stake(ALICE, 0, 7);

    // same id: nothing happens on the attachment side
    auto before = registry.events().size();
    ASSERT_TRUE(registry.upgrade_stake(ALICE, id, 1, 7).has_value());
    auto events = events_since(before);
    ASSERT_EQ(events.size(), 1);
    EXPECT_TRUE(std::holds_alternative<StakeCreated>(events[0]));
    EXPECT_EQ(registry.attached_stake(7), id);

    // a new id replaces the old one, final restatement last
    before = registry.events().size();
    ASSERT_TRUE(registry.upgrade_stake(ALICE, id, 2, 8).has_value());
    events = events_since(before);
    ASSERT_EQ(events.size(), 3);
    EXPECT_EQ(
        events[0],
        Event{ExternalDetached{
            .staker = ALICE, .stake_id = id, .external_id = 7}});
    EXPECT_EQ(
        events[1],
        Event{ExternalAttached{
            .staker = ALICE, .stake_id = id, .external_id = 8}});
    EXPECT_TRUE(std::holds_alternative<StakeCreated>(events[2]));
    EXPECT_FALSE(registry.attached_stake(7).has_value());
    EXPECT_EQ(registry.attached_stake(8), id);
    check_attachments();
}

TEST_F(StakeRegistryTest, upgrade_with_zero_detaches)
{
    auto const id = must_stake(ALICE, 0, 7);
    auto const before = registry.events().size();
    ASSERT_TRUE(registry.upgrade_stake(ALICE, id, 1, 0).has_value());
    auto const events = events_since(before);
    ASSERT_EQ(events.size(), 2);
    EXPECT_EQ(
        events[0],
        Event{ExternalDetached{
            .staker = ALICE, .stake_id = id, .external_id = 7}});
    EXPECT_TRUE(std::holds_alternative<StakeCreated>(events[1]));
    EXPECT_FALSE(registry.attached_stake(7).has_value());
    EXPECT_EQ(registry.get_stake(id)->attached_external_id, 0);
}

TEST_F(StakeRegistryTest, extend_staking)
{
    auto const id = must_stake(ALICE, 0);
    advance(200 * DAY);

    ASSERT_TRUE(registry.extend_staking(ALICE, id).has_value());
    auto const lock_end_time = T0 + 200 * DAY + 180 * DAY;
    EXPECT_EQ(registry.get_stake(id)->lock_end_time, lock_end_time);
    EXPECT_EQ(
        registry.events().back(),
        Event{StakeExtended{
            .staker = ALICE, .stake_id = id, .lock_end_time = lock_end_time}});
    EXPECT_EQ(escrow_balance(ALICE), 500 * TOKEN);

    auto const not_owner = registry.extend_staking(BOB, id);
    ASSERT_TRUE(not_owner.has_error());
    EXPECT_EQ(not_owner.assume_error(), StakingError::InvalidStakeId);
}

TEST_F(StakeRegistryTest, attach_vehicle)
{
    auto const id = must_stake(ALICE, 1);
    auto const other = must_stake(BOB, 1);

    auto const not_owner = registry.attach_vehicle(BOB, id, 5);
    ASSERT_TRUE(not_owner.has_error());
    EXPECT_EQ(not_owner.assume_error(), StakingError::InvalidStakeId);

    auto const unknown = registry.attach_vehicle(ALICE, id, 42);
    ASSERT_TRUE(unknown.has_error());
    EXPECT_EQ(unknown.assume_error(), StakingError::InvalidExternalId);

    ASSERT_TRUE(registry.attach_vehicle(ALICE, id, 5).has_value());
    EXPECT_EQ(registry.get_boost_points(5), 2000);

    auto const again = registry.attach_vehicle(ALICE, id, 5);
    ASSERT_TRUE(again.has_error());
    EXPECT_EQ(again.assume_error(), StakingError::AlreadyAttached);

    auto const taken = registry.attach_vehicle(BOB, other, 5);
    ASSERT_TRUE(taken.has_error());
    EXPECT_EQ(taken.assume_error(), StakingError::AlreadyAttached);

    // switching ids detaches the previous one first
    auto const before = registry.events().size();
    ASSERT_TRUE(registry.attach_vehicle(ALICE, id, 7).has_value());
    auto const events = events_since(before);
    ASSERT_EQ(events.size(), 2);
    EXPECT_EQ(
        events[0],
        Event{ExternalDetached{
            .staker = ALICE, .stake_id = id, .external_id = 5}});
    EXPECT_EQ(
        events[1],
        Event{ExternalAttached{
            .staker = ALICE, .stake_id = id, .external_id = 7}});
    EXPECT_EQ(registry.get_boost_points(5), 0);
    EXPECT_EQ(registry.get_boost_points(7), 2000);
    check_attachments();
}

TEST_F(StakeRegistryTest, attach_vehicle_takes_over_expired_stake)
{
    auto const old_stake = must_stake(BOB, 0, 5);
    auto const id = must_stake(ALICE, 2, 7);
    advance(180 * DAY + 1);

    auto const before = registry.events().size();
    ASSERT_TRUE(registry.attach_vehicle(ALICE, id, 5).has_value());
    auto const events = events_since(before);
    ASSERT_EQ(events.size(), 3);
    // the forced detach names the previous stake's owner
    EXPECT_EQ(
        events[0],
        Event{ExternalDetached{
            .staker = BOB, .stake_id = old_stake, .external_id = 5}});
    EXPECT_EQ(
        events[1],
        Event{ExternalDetached{
            .staker = ALICE, .stake_id = id, .external_id = 7}});
    EXPECT_EQ(
        events[2],
        Event{ExternalAttached{
            .staker = ALICE, .stake_id = id, .external_id = 5}});
    EXPECT_EQ(registry.get_stake(old_stake)->attached_external_id, 0);
    EXPECT_EQ(registry.get_boost_points(5), 3000);
    check_attachments();
}

TEST_F(StakeRegistryTest, detach_vehicle)
{
    auto const unattached = registry.detach_vehicle(ALICE, 5);
    ASSERT_TRUE(unattached.has_error());
    EXPECT_EQ(unattached.assume_error(), StakingError::NoActiveStaking);

    auto const zero = registry.detach_vehicle(ALICE, 0);
    ASSERT_TRUE(zero.has_error());
    EXPECT_EQ(zero.assume_error(), StakingError::NoActiveStaking);

    // the staker may detach
    auto const id = must_stake(ALICE, 0, 5);
    ASSERT_TRUE(registry.detach_vehicle(ALICE, 5).has_value());
    EXPECT_EQ(
        registry.events().back(),
        Event{ExternalDetached{
            .staker = ALICE, .stake_id = id, .external_id = 5}});
    EXPECT_FALSE(registry.attached_stake(5).has_value());
    EXPECT_EQ(registry.get_stake(id)->attached_external_id, 0);

    auto const twice = registry.detach_vehicle(ALICE, 5);
    ASSERT_TRUE(twice.has_error());
    EXPECT_EQ(twice.assume_error(), StakingError::NoActiveStaking);

    // so may the vehicle owner, the event still names the staker
    auto const bobs = must_stake(BOB, 0, 9);
    auto const stranger = registry.detach_vehicle(ALICE, 9);
    ASSERT_TRUE(stranger.has_error());
    EXPECT_EQ(stranger.assume_error(), StakingError::Unauthorized);
    ASSERT_TRUE(registry.detach_vehicle(CAROL, 9).has_value());
    EXPECT_EQ(
        registry.events().back(),
        Event{ExternalDetached{
            .staker = BOB, .stake_id = bobs, .external_id = 9}});
    check_attachments();
}

TEST_F(StakeRegistryTest, detach_burned_vehicle)
{
    auto const id = must_stake(BOB, 0, 9);
    ASSERT_TRUE(vehicles.burn(9).has_value());
    EXPECT_EQ(registry.get_boost_points(9), 0);

    auto const unverifiable = registry.detach_vehicle(ALICE, 9);
    ASSERT_TRUE(unverifiable.has_error());
    EXPECT_EQ(unverifiable.assume_error(), StakingError::InvalidExternalId);

    ASSERT_TRUE(registry.detach_vehicle(BOB, 9).has_value());
    EXPECT_EQ(registry.get_stake(id)->attached_external_id, 0);
}

TEST_F(StakeRegistryTest, transfer_moves_custody)
{
    auto const id = must_stake(ALICE, 1, 5);
    auto const alice_escrow = registry.escrow_of(ALICE).value();
    auto const stake = registry.get_stake(id).value();
    advance(10 * DAY);

    EXPECT_FALSE(registry.escrow_of(CAROL).has_value());
    auto const before = registry.events().size();
    ASSERT_TRUE(registry.transfer(ALICE, ALICE, CAROL, id).has_value());

    auto const carol_escrow = registry.escrow_of(CAROL);
    ASSERT_TRUE(carol_escrow.has_value());
    EXPECT_EQ(ledger.balance_of(alice_escrow), 0);
    EXPECT_EQ(ledger.balance_of(*carol_escrow), 1500 * TOKEN);
    EXPECT_EQ(registry.owner_of(id).value(), CAROL);
    EXPECT_EQ(registry.get_stake(id), stake);
    EXPECT_EQ(registry.attached_stake(5), id);
    EXPECT_EQ(registry.get_boost_points(5), 2000);

    auto const events = events_since(before);
    ASSERT_EQ(events.size(), 2);
    EXPECT_EQ(
        events[0],
        Event{StakeWithdrawn{
            .staker = ALICE,
            .stake_id = id,
            .amount = 1500 * TOKEN,
            .points = 2000}});
    EXPECT_EQ(
        events[1],
        Event{StakeCreated{
            .staker = CAROL,
            .stake_id = id,
            .escrow = *carol_escrow,
            .level = 1,
            .amount = 1500 * TOKEN,
            .lock_end_time = T0 + 365 * DAY,
            .points = 2000}});

    // only the new owner can act on the stake
    advance(365 * DAY);
    auto const old_owner = registry.withdraw(ALICE, id);
    ASSERT_TRUE(old_owner.has_error());
    EXPECT_EQ(old_owner.assume_error(), StakingError::InvalidStakeId);
    ASSERT_TRUE(registry.withdraw(CAROL, id).has_value());
    EXPECT_EQ(ledger.balance_of(CAROL), 1500 * TOKEN);
    check_conservation({ALICE, BOB, CAROL});
}

TEST_F(StakeRegistryTest, transfer_errors)
{
    auto const id = must_stake(ALICE, 0);

    auto const not_sender = registry.transfer(BOB, ALICE, BOB, id);
    ASSERT_TRUE(not_sender.has_error());
    EXPECT_EQ(not_sender.assume_error(), StakingError::Unauthorized);

    auto const not_owner = registry.transfer(BOB, BOB, CAROL, id);
    ASSERT_TRUE(not_owner.has_error());
    EXPECT_EQ(not_owner.assume_error(), StakingError::InvalidStakeId);

    auto const to_zero = registry.transfer(ALICE, ALICE, Address{}, id);
    ASSERT_TRUE(to_zero.has_error());
    EXPECT_EQ(to_zero.assume_error(), StakingError::InvalidInput);

    ledger.set_reject_transfers(true);
    auto const refused = registry.transfer(ALICE, ALICE, CAROL, id);
    ASSERT_TRUE(refused.has_error());
    EXPECT_EQ(refused.assume_error(), StakingError::TransferFailed);
    EXPECT_FALSE(registry.escrow_of(CAROL).has_value());
    EXPECT_EQ(registry.owner_of(id).value(), ALICE);
}

TEST_F(StakeRegistryTest, transfer_to_existing_escrow_and_self)
{
    auto const id = must_stake(ALICE, 0);
    must_stake(BOB, 1);

    ASSERT_TRUE(registry.transfer(ALICE, ALICE, BOB, id).has_value());
    EXPECT_EQ(escrow_balance(BOB), 2000 * TOKEN);
    EXPECT_EQ(escrow_balance(ALICE), 0);

    auto const before = registry.events().size();
    ASSERT_TRUE(registry.transfer(BOB, BOB, BOB, id).has_value());
    EXPECT_EQ(escrow_balance(BOB), 2000 * TOKEN);
    EXPECT_EQ(registry.events().size(), before + 2);
    check_conservation({ALICE, BOB});
}

TEST_F(StakeRegistryTest, delegate_voting_power)
{
    auto const none = registry.delegate(ALICE, CAROL);
    ASSERT_TRUE(none.has_error());
    EXPECT_EQ(none.assume_error(), StakingError::EscrowNotFound);

    auto const id = must_stake(ALICE, 0);
    ASSERT_TRUE(registry.delegate(ALICE, CAROL).has_value());
    auto const escrow = registry.escrow_of(ALICE).value();
    EXPECT_EQ(ledger.delegates(escrow), CAROL);
    EXPECT_EQ(ledger.get_votes(CAROL), 500 * TOKEN);

    // withdrawing drops the voting power, the delegation itself persists
    advance(180 * DAY + 1);
    ASSERT_TRUE(registry.withdraw(ALICE, id).has_value());
    EXPECT_EQ(ledger.get_votes(CAROL), 0);
    must_stake(ALICE, 1);
    EXPECT_EQ(ledger.get_votes(CAROL), 1500 * TOKEN);
}

TEST_F(StakeRegistryTest, set_expiration_disabled)
{
    auto const id = must_stake(ALICE, 0);
    auto const res = registry.set_expiration(ALICE, id, T0);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), StakingError::Unauthorized);
    EXPECT_EQ(registry.get_stake(id)->lock_end_time, T0 + 180 * DAY);
}

TEST(StakeRegistry, set_expiration_enabled)
{
    sim::MemoryLedger ledger;
    sim::MemoryVehicleRegistry vehicles;
    sim::ManualClock clock{T0};
    StakingState state;
    StakeRegistry registry{test_config(true), state, ledger, vehicles, clock};
    ASSERT_TRUE(ledger.mint(ALICE, FUNDS).has_value());
    ledger.approve(ALICE, REGISTRY, UINT256_MAX);

    auto const id = registry.stake(ALICE, 2, 0).value();
    auto const not_owner = registry.set_expiration(BOB, id, T0);
    ASSERT_TRUE(not_owner.has_error());
    EXPECT_EQ(not_owner.assume_error(), StakingError::InvalidStakeId);

    ASSERT_TRUE(registry.set_expiration(ALICE, id, T0 - 1).has_value());
    EXPECT_EQ(registry.get_stake(id)->lock_end_time, T0 - 1);
    auto const *const created =
        std::get_if<StakeCreated>(&registry.events().back());
    ASSERT_NE(created, nullptr);
    EXPECT_EQ(created->lock_end_time, T0 - 1);
    EXPECT_EQ(created->level, 2);

    ASSERT_TRUE(registry.withdraw(ALICE, id).has_value());
    EXPECT_EQ(ledger.balance_of(ALICE), FUNDS);
}

TEST_F(StakeRegistryTest, lock_overflow_is_rejected)
{
    sim::ManualClock late{std::numeric_limits<Timestamp>::max() - DAY};
    StakingState late_state;
    StakeRegistry late_registry{
        test_config(), late_state, ledger, vehicles, late};
    auto const res = late_registry.stake(ALICE, 0, 0);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), MathError::Overflow);
    EXPECT_EQ(ledger.balance_of(ALICE), FUNDS);
}

TEST_F(StakeRegistryTest, invariants_hold_over_mixed_sequence)
{
    auto const a1 = must_stake(ALICE, 0, 5);
    auto const a2 = must_stake(ALICE, 1, 7);
    auto const b1 = must_stake(BOB, 0, 9);
    check_conservation({ALICE, BOB, CAROL});
    check_attachments();

    ASSERT_TRUE(registry.upgrade_stake(ALICE, a1, 2, 8).has_value());
    ASSERT_TRUE(registry.transfer(ALICE, ALICE, BOB, a2).has_value());
    check_conservation({ALICE, BOB, CAROL});
    check_attachments();

    advance(180 * DAY + 1);
    ASSERT_TRUE(registry.attach_vehicle(ALICE, a1, 9).has_value());
    ASSERT_TRUE(registry.withdraw(BOB, b1).has_value());
    check_conservation({ALICE, BOB, CAROL});
    check_attachments();

    auto const failed = registry.withdraw(BOB, a2);
    ASSERT_TRUE(failed.has_error());
    check_conservation({ALICE, BOB, CAROL});
    check_attachments();

    auto const a2_events = events_for_stake(registry.events(), a2);
    ASSERT_EQ(a2_events.size(), 4);
    EXPECT_TRUE(std::holds_alternative<StakeCreated>(a2_events[0]));
    EXPECT_TRUE(std::holds_alternative<ExternalAttached>(a2_events[1]));
    EXPECT_TRUE(std::holds_alternative<StakeWithdrawn>(a2_events[2]));
    EXPECT_TRUE(std::holds_alternative<StakeCreated>(a2_events[3]));
    EXPECT_EQ(event_name(a2_events[3]), "StakeCreated");
}

TEST_F(StakeRegistryTest, concurrent_callers)
{
    std::vector<Address> stakers;
    for (uint64_t i = 0; i < 4; ++i) {
        stakers.emplace_back(0xf000 + i);
        fund(stakers.back());
    }

    std::vector<std::thread> threads;
    for (auto const &staker : stakers) {
        threads.emplace_back([this, staker] {
            for (int i = 0; i < 5; ++i) {
                EXPECT_TRUE(registry.stake(staker, 0, 0).has_value());
            }
        });
    }
    for (auto &thread : threads) {
        thread.join();
    }

    EXPECT_EQ(registry.last_stake_id(), 20);
    EXPECT_EQ(registry.events().size(), 20);
    for (auto const &staker : stakers) {
        EXPECT_EQ(escrow_balance(staker), 2500 * TOKEN);
    }
    check_conservation(stakers);
}

TEST_F(StakeRegistryTest, boost_query)
{
    auto const levels = test_levels();
    BoostQueryService const boost{state, levels, vehicles};
    EXPECT_EQ(boost.points_for(0, T0), 0);
    EXPECT_EQ(boost.points_for(5, T0), 0);

    auto const id = must_stake(ALICE, 2, 5);
    auto const lock_end_time = registry.get_stake(id)->lock_end_time;
    EXPECT_EQ(boost.points_for(5, T0), 3000);
    EXPECT_EQ(boost.points_for(5, lock_end_time), 3000);
    EXPECT_EQ(boost.points_for(5, lock_end_time + 1), 0);

    ASSERT_TRUE(vehicles.burn(5).has_value());
    EXPECT_EQ(boost.points_for(5, T0), 0);
}
