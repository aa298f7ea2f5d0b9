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
#include <lockstake/core/unordered_map.hpp>
#include <lockstake/core/version_stack.hpp>
#include <lockstake/core/versioned_map.hpp>
#include <lockstake/sim/config.hpp>
#include <lockstake/staking/collaborators.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <cstddef>
#include <initializer_list>
#include <optional>

LOCKSTAKE_SIM_NAMESPACE_BEGIN

enum class LedgerError
{
    Success = 0,
    InsufficientBalance,
    InsufficientAllowance,
};

struct AllowanceKey
{
    Address owner;
    Address spender;

    bool operator==(AllowanceKey const &) const = default;
};

struct AllowanceKeyHash
{
    using is_avalanching = void;

    size_t operator()(AllowanceKey const &key) const noexcept
    {
        return hash_bytes(&key, sizeof(key));
    }
};

static_assert(sizeof(AllowanceKey) == 40);

// Fungible token with allowances and vote delegation, every slot versioned
// so it can share the registry's transaction boundary. An allowance of
// UINT256_MAX is never spent down.
class MemoryLedger final : public staking::Ledger
{
    unsigned version_{0};
    VersionedMap<Address, uint256_t> balances_{};
    VersionedMap<AllowanceKey, uint256_t, AllowanceKeyHash> allowances_{};
    VersionedMap<Address, Address> delegates_{};
    VersionStack<uint256_t> total_supply_{uint256_t{0}};
    bool reject_transfers_{false};

    Result<void> move_balance(
        Address const &from, Address const &to, uint256_t const &amount);

public:
    Result<void> mint(Address const &to, uint256_t const &amount);
    void approve(
        Address const &owner, Address const &spender,
        uint256_t const &amount);

    // Makes transfers answer false instead of moving funds
    void set_reject_transfers(bool reject)
    {
        reject_transfers_ = reject;
    }

    uint256_t allowance(Address const &owner, Address const &spender) const;
    std::optional<Address> delegates(Address const &) const;
    // Sum of balances currently delegated to delegatee
    uint256_t get_votes(Address const &delegatee) const;
    uint256_t total_supply() const;

    Result<bool> transfer_from(
        Address const &spender, Address const &payer,
        Address const &recipient, uint256_t const &amount) override;
    Result<bool> transfer(
        Address const &sender, Address const &recipient,
        uint256_t const &amount) override;
    Result<void>
    delegate(Address const &delegator, Address const &delegatee) override;
    uint256_t balance_of(Address const &) const override;

    void push() override;
    void pop_accept() override;
    void pop_reject() override;
};

LOCKSTAKE_SIM_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<lockstake::sim::LedgerError>
    : quick_status_code_from_enum_defaults<lockstake::sim::LedgerError>
{
    static constexpr auto const domain_name = "Ledger Error";
    static constexpr auto const domain_uuid =
        "c2f95d18-6a3e-4b07-8e41-d07b3a6c9e25";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
