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
#include <lockstake/core/int.hpp>
#include <lockstake/core/result.hpp>
#include <lockstake/staking/config.hpp>
#include <lockstake/staking/registry_config.hpp>
#include <lockstake/staking/stake_level.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/generic_code.hpp>
#endif

#include <boost/outcome/try.hpp>

#include <evmc/hex.hpp>
#include <intx/intx.hpp>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

LOCKSTAKE_STAKING_ANONYMOUS_NAMESPACE_BEGIN

Result<StakeLevel> parse_level(nlohmann::json const &level)
{
    if (!level.is_object()) {
        return ConfigError::InvalidValue;
    }
    if (!level.contains("amount") || !level.contains("lock_period") ||
        !level.contains("points")) {
        return ConfigError::MissingField;
    }
    auto const &lock_period = level.at("lock_period");
    if (!lock_period.is_number_unsigned()) {
        return ConfigError::InvalidValue;
    }
    BOOST_OUTCOME_TRY(auto const amount, parse_uint256(level.at("amount")));
    BOOST_OUTCOME_TRY(auto const points, parse_uint256(level.at("points")));
    return StakeLevel{
        .amount = amount,
        .lock_duration = lock_period.get<uint64_t>(),
        .points = points};
}

LOCKSTAKE_STAKING_ANONYMOUS_NAMESPACE_END

LOCKSTAKE_STAKING_NAMESPACE_BEGIN

Result<uint256_t> parse_uint256(nlohmann::json const &value)
{
    if (value.is_number_unsigned()) {
        return uint256_t{value.get<uint64_t>()};
    }
    if (!value.is_string()) {
        return ConfigError::InvalidValue;
    }
    auto const &str = value.get_ref<std::string const &>();
    if (str.empty()) {
        return ConfigError::InvalidValue;
    }
    try {
        return intx::from_string<uint256_t>(str);
    }
    catch (std::invalid_argument const &) {
        return ConfigError::InvalidValue;
    }
    catch (std::out_of_range const &) {
        return ConfigError::InvalidValue;
    }
}

Result<Address> parse_address(nlohmann::json const &value)
{
    if (!value.is_string()) {
        return ConfigError::InvalidValue;
    }
    auto const address =
        evmc::from_hex<Address>(value.get_ref<std::string const &>());
    if (!address.has_value()) {
        return ConfigError::InvalidValue;
    }
    return *address;
}

Result<StakeLevelTable> load_stake_levels(nlohmann::json const &levels)
{
    if (!levels.is_array()) {
        return ConfigError::InvalidValue;
    }
    std::vector<StakeLevel> parsed;
    parsed.reserve(levels.size());
    for (auto const &level : levels) {
        BOOST_OUTCOME_TRY(auto l, parse_level(level));
        parsed.push_back(std::move(l));
    }
    return StakeLevelTable::create(std::move(parsed));
}

Result<RegistryConfig> load_registry_config(nlohmann::json const &config)
{
    if (!config.is_object()) {
        return ConfigError::InvalidValue;
    }
    if (!config.contains("registry")) {
        return ConfigError::MissingField;
    }
    BOOST_OUTCOME_TRY(auto const address, parse_address(config.at("registry")));
    if (address == Address{}) {
        return ConfigError::InvalidValue;
    }

    bool allow_set_expiration = false;
    if (config.contains("allow_set_expiration")) {
        auto const &flag = config.at("allow_set_expiration");
        if (!flag.is_boolean()) {
            return ConfigError::InvalidValue;
        }
        allow_set_expiration = flag.get<bool>();
    }

    if (!config.contains("levels")) {
        return RegistryConfig{
            .registry = address,
            .allow_set_expiration = allow_set_expiration,
            .levels = default_stake_levels()};
    }
    BOOST_OUTCOME_TRY(auto levels, load_stake_levels(config.at("levels")));
    return RegistryConfig{
        .registry = address,
        .allow_set_expiration = allow_set_expiration,
        .levels = std::move(levels)};
}

LOCKSTAKE_STAKING_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<lockstake::staking::ConfigError>::mapping> const &
quick_status_code_from_enum<lockstake::staking::ConfigError>::value_mappings()
{
    using lockstake::staking::ConfigError;

    static std::initializer_list<mapping> const v = {
        {ConfigError::Success, "success", {errc::success}},
        {ConfigError::MissingField, "missing field", {}},
        {ConfigError::InvalidValue, "invalid value", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
