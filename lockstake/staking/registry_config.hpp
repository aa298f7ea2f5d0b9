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
#include <lockstake/staking/stake_level.hpp>

#include <nlohmann/json_fwd.hpp>

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

enum class ConfigError
{
    Success = 0,
    MissingField,
    InvalidValue,
};

struct RegistryConfig
{
    // Address the registry acts as towards the ledger and its escrows
    Address registry;
    // Development deployments only
    bool allow_set_expiration{false};
    StakeLevelTable levels;
};

// JSON unsigned number or decimal string
Result<uint256_t> parse_uint256(nlohmann::json const &);

// "0x" prefixed hex string
Result<Address> parse_address(nlohmann::json const &);

// [{"amount": "<decimal>", "lock_period": <seconds>, "points": <n>}, ...]
Result<StakeLevelTable> load_stake_levels(nlohmann::json const &);

// {"registry": "0x..", "allow_set_expiration": bool, "levels": [...]}
// Levels default to default_stake_levels() when absent
Result<RegistryConfig> load_registry_config(nlohmann::json const &);

LOCKSTAKE_STAKING_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<lockstake::staking::ConfigError>
    : quick_status_code_from_enum_defaults<lockstake::staking::ConfigError>
{
    static constexpr auto const domain_name = "Config Error";
    static constexpr auto const domain_uuid =
        "a4c7e2b9-0d85-4f1a-b6e3-58d91c2f7a06";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
