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
#include <lockstake/core/fmt/int_fmt.hpp> // NOLINT
#include <lockstake/core/int.hpp>
#include <lockstake/core/likely.h>
#include <lockstake/core/result.hpp>
#include <lockstake/staking/collaborators.hpp>
#include <lockstake/staking/config.hpp>
#include <lockstake/staking/escrow.hpp>
#include <lockstake/staking/staking_error.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <cstddef>
#include <cstdint>

LOCKSTAKE_STAKING_NAMESPACE_BEGIN

EscrowAccount::EscrowAccount(
    EscrowId const id, Address const &owner, Address const &registry,
    Ledger &ledger)
    : id_{id}
    , owner_{owner}
    , registry_{registry}
    , address_{derive_address(registry, id)}
    , ledger_{&ledger}
{
}

Address EscrowAccount::derive_address(Address const &registry, EscrowId const id)
{
    Address address{};
    address.bytes[0] = 0xe5;
    address.bytes[1] = 0xc0;
    for (size_t i = 2; i < 16; ++i) {
        address.bytes[i] = registry.bytes[i + 4];
    }
    address.bytes[16] = static_cast<uint8_t>(id >> 24);
    address.bytes[17] = static_cast<uint8_t>(id >> 16);
    address.bytes[18] = static_cast<uint8_t>(id >> 8);
    address.bytes[19] = static_cast<uint8_t>(id);
    return address;
}

uint256_t EscrowAccount::balance() const
{
    return ledger_->balance_of(address_);
}

Result<void> EscrowAccount::release(
    Address const &caller, uint256_t const &amount,
    Address const &to) const
{
    if (caller != registry_) {
        return StakingError::Unauthorized;
    }
    auto const res = ledger_->transfer(address_, to, amount);
    if (LOCKSTAKE_UNLIKELY(res.has_error())) {
        LOG_DEBUG(
            "EscrowAccount: release of {} from escrow {} failed -- {}",
            amount,
            id_,
            res.error().message().c_str());
        return StakingError::TransferFailed;
    }
    if (LOCKSTAKE_UNLIKELY(!res.value())) {
        return StakingError::TransferFailed;
    }
    return outcome::success();
}

Result<void> EscrowAccount::move(
    Address const &caller, uint256_t const &amount,
    EscrowAccount const &to) const
{
    return release(caller, amount, to.address_);
}

Result<void> EscrowAccount::delegate_voting_power(
    Address const &caller, Address const &delegatee) const
{
    if (caller != owner_ && caller != registry_) {
        return StakingError::Unauthorized;
    }
    return ledger_->delegate(address_, delegatee);
}

LOCKSTAKE_STAKING_NAMESPACE_END
