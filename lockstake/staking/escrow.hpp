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
#include <lockstake/staking/collaborators.hpp>
#include <lockstake/staking/config.hpp>
#include <lockstake/staking/types.hpp>

LOCKSTAKE_STAKING_NAMESPACE_BEGIN

// Per-staker custody account. Holds every locked token of its owner under a
// synthetic ledger address. Only the registry can move funds out.
class EscrowAccount
{
    EscrowId id_;
    Address owner_;
    Address registry_;
    Address address_;
    Ledger *ledger_;

public:
    EscrowAccount(
        EscrowId, Address const &owner, Address const &registry, Ledger &);

    // Ledger address of escrow id under registry. Bytes 0-1 are 0xe5c0,
    // bytes 2-15 are taken from the registry address, bytes 16-19 hold the
    // id big endian.
    static Address derive_address(Address const &registry, EscrowId);

    EscrowId id() const noexcept
    {
        return id_;
    }

    Address const &owner() const noexcept
    {
        return owner_;
    }

    Address const &address() const noexcept
    {
        return address_;
    }

    uint256_t balance() const;

    // Ledger state sits behind ledger_, so custody operations are const.
    // Any ledger failure surfaces as TransferFailed.
    Result<void> release(
        Address const &caller, uint256_t const &amount,
        Address const &to) const;

    Result<void> move(
        Address const &caller, uint256_t const &amount,
        EscrowAccount const &to) const;

    // Callable by the owner or the registry
    Result<void> delegate_voting_power(
        Address const &caller, Address const &delegatee) const;
};

LOCKSTAKE_STAKING_NAMESPACE_END
