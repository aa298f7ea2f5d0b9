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
#include <lockstake/staking/config.hpp>
#include <lockstake/staking/types.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

LOCKSTAKE_STAKING_NAMESPACE_BEGIN

enum class RegistryError
{
    Success = 0,
    NotFound,
    AlreadyExists,
    NotOwner,
};

// The fungible token ledger that custodies staked funds. Transfers return
// false (or an error) when the ledger refuses them. The ledger takes part in
// the registry's transaction: every registry call is bracketed by push() and
// either pop_accept() or pop_reject().
class Ledger
{
public:
    virtual ~Ledger() = default;

    // Moves amount from payer to recipient using spender's allowance
    virtual Result<bool> transfer_from(
        Address const &spender, Address const &payer,
        Address const &recipient, uint256_t const &amount) = 0;

    virtual Result<bool> transfer(
        Address const &sender, Address const &recipient,
        uint256_t const &amount) = 0;

    // Voting delegation of delegator's whole balance
    virtual Result<void>
    delegate(Address const &delegator, Address const &delegatee) = 0;

    virtual uint256_t balance_of(Address const &) const = 0;

    virtual void push() = 0;
    virtual void pop_accept() = 0;
    virtual void pop_reject() = 0;
};

// Registry of external items (vehicles) a stake can be attached to
class ExternalRegistry
{
public:
    virtual ~ExternalRegistry() = default;

    virtual bool exists(ExternalId const &) const = 0;

    // Fails with RegistryError::NotFound for unknown or burned items
    virtual Result<Address> owner_of(ExternalId const &) const = 0;
};

// Non-decreasing current time, either wall clock or host supplied
class TimeOracle
{
public:
    virtual ~TimeOracle() = default;

    virtual Timestamp now() const = 0;
};

LOCKSTAKE_STAKING_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<lockstake::staking::RegistryError>
    : quick_status_code_from_enum_defaults<lockstake::staking::RegistryError>
{
    static constexpr auto const domain_name = "External Registry Error";
    static constexpr auto const domain_uuid =
        "1e6b9a40-7d2f-4c83-a5e1-93f0c4b8d672";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
