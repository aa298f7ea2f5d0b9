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
#include <lockstake/core/int.hpp>
#include <lockstake/core/result.hpp>
#include <lockstake/sim/config.hpp>
#include <lockstake/sim/memory_ledger.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/generic_code.hpp>
#endif

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <initializer_list>
#include <optional>

LOCKSTAKE_SIM_NAMESPACE_BEGIN

Result<void> MemoryLedger::mint(Address const &to, uint256_t const &amount)
{
    BOOST_OUTCOME_TRY(
        auto const supply, checked_add(total_supply_.recent(), amount));
    BOOST_OUTCOME_TRY(auto const balance, checked_add(balance_of(to), amount));
    total_supply_.current(version_) = supply;
    balances_.set(to, balance, version_);
    return outcome::success();
}

void MemoryLedger::approve(
    Address const &owner, Address const &spender, uint256_t const &amount)
{
    allowances_.set({owner, spender}, amount, version_);
}

uint256_t
MemoryLedger::allowance(Address const &owner, Address const &spender) const
{
    auto const *const value = allowances_.find({owner, spender});
    return value == nullptr ? uint256_t{0} : *value;
}

std::optional<Address> MemoryLedger::delegates(Address const &delegator) const
{
    auto const *const delegatee = delegates_.find(delegator);
    if (delegatee == nullptr) {
        return std::nullopt;
    }
    return *delegatee;
}

uint256_t MemoryLedger::get_votes(Address const &delegatee) const
{
    uint256_t votes = 0;
    delegates_.for_each([&](Address const &delegator, Address const &to) {
        if (to == delegatee) {
            votes += balance_of(delegator);
        }
    });
    return votes;
}

uint256_t MemoryLedger::total_supply() const
{
    return total_supply_.recent();
}

uint256_t MemoryLedger::balance_of(Address const &account) const
{
    auto const *const balance = balances_.find(account);
    return balance == nullptr ? uint256_t{0} : *balance;
}

Result<void> MemoryLedger::move_balance(
    Address const &from, Address const &to, uint256_t const &amount)
{
    auto const from_balance = balance_of(from);
    if (from_balance < amount) {
        return LedgerError::InsufficientBalance;
    }
    balances_.set(from, from_balance - amount, version_);
    BOOST_OUTCOME_TRY(auto const to_balance, checked_add(balance_of(to), amount));
    balances_.set(to, to_balance, version_);
    return outcome::success();
}

Result<bool> MemoryLedger::transfer_from(
    Address const &spender, Address const &payer, Address const &recipient,
    uint256_t const &amount)
{
    if (reject_transfers_) {
        return false;
    }
    auto const allowed = allowance(payer, spender);
    if (allowed < amount) {
        return LedgerError::InsufficientAllowance;
    }
    BOOST_OUTCOME_TRY(move_balance(payer, recipient, amount));
    if (allowed != UINT256_MAX) {
        allowances_.set({payer, spender}, allowed - amount, version_);
    }
    return true;
}

Result<bool> MemoryLedger::transfer(
    Address const &sender, Address const &recipient, uint256_t const &amount)
{
    if (reject_transfers_) {
        return false;
    }
    BOOST_OUTCOME_TRY(move_balance(sender, recipient, amount));
    return true;
}

Result<void>
MemoryLedger::delegate(Address const &delegator, Address const &delegatee)
{
    delegates_.set(delegator, delegatee, version_);
    return outcome::success();
}

void MemoryLedger::push()
{
    ++version_;
}

void MemoryLedger::pop_accept()
{
    LOCKSTAKE_ASSERT(version_);

    balances_.pop_accept(version_);
    allowances_.pop_accept(version_);
    delegates_.pop_accept(version_);
    total_supply_.pop_accept(version_);

    --version_;
}

void MemoryLedger::pop_reject()
{
    LOCKSTAKE_ASSERT(version_);

    balances_.pop_reject(version_);
    allowances_.pop_reject(version_);
    delegates_.pop_reject(version_);
    total_supply_.pop_reject(version_);

    --version_;
}

LOCKSTAKE_SIM_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<lockstake::sim::LedgerError>::mapping> const &
quick_status_code_from_enum<lockstake::sim::LedgerError>::value_mappings()
{
    using lockstake::sim::LedgerError;

    static std::initializer_list<mapping> const v = {
        {LedgerError::Success, "success", {errc::success}},
        {LedgerError::InsufficientBalance, "insufficient balance", {}},
        {LedgerError::InsufficientAllowance, "insufficient allowance", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
