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
#include <lockstake/core/fmt/address_fmt.hpp> // NOLINT
#include <lockstake/core/int.hpp>
#include <lockstake/core/result.hpp>
#include <lockstake/sim/clock.hpp>
#include <lockstake/sim/config.hpp>
#include <lockstake/sim/memory_ledger.hpp>
#include <lockstake/sim/memory_vehicle_registry.hpp>
#include <lockstake/sim/scenario.hpp>
#include <lockstake/staking/registry_config.hpp>
#include <lockstake/staking/stake_registry.hpp>
#include <lockstake/staking/types.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <nlohmann/json.hpp>
#include <quill/Quill.h>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

LOCKSTAKE_SIM_ANONYMOUS_NAMESPACE_BEGIN

using staking::ConfigError;

Result<nlohmann::json const *>
field(nlohmann::json const &step, char const *const name)
{
    if (!step.contains(name)) {
        return ConfigError::MissingField;
    }
    return &step.at(name);
}

Result<Address> address_field(nlohmann::json const &step, char const *name)
{
    BOOST_OUTCOME_TRY(auto const value, field(step, name));
    return staking::parse_address(*value);
}

Result<uint256_t> uint256_field(nlohmann::json const &step, char const *name)
{
    BOOST_OUTCOME_TRY(auto const value, field(step, name));
    return staking::parse_uint256(*value);
}

Result<uint64_t> uint64_field(nlohmann::json const &step, char const *name)
{
    BOOST_OUTCOME_TRY(auto const value, field(step, name));
    if (!value->is_number_unsigned()) {
        return ConfigError::InvalidValue;
    }
    return value->get<uint64_t>();
}

// Absent means 0
Result<uint256_t>
optional_uint256_field(nlohmann::json const &step, char const *name)
{
    if (!step.contains(name)) {
        return uint256_t{0};
    }
    return staking::parse_uint256(step.at(name));
}

LOCKSTAKE_SIM_ANONYMOUS_NAMESPACE_END

LOCKSTAKE_SIM_NAMESPACE_BEGIN

using namespace staking;

ScenarioRunner::ScenarioRunner(
    StakeRegistry &registry, MemoryLedger &ledger,
    MemoryVehicleRegistry &vehicles, ManualClock *const clock)
    : registry_{registry}
    , ledger_{ledger}
    , vehicles_{vehicles}
    , clock_{clock}
{
}

Result<nlohmann::json> ScenarioRunner::run_step(nlohmann::json const &step)
{
    if (!step.is_object()) {
        return ConfigError::InvalidValue;
    }
    BOOST_OUTCOME_TRY(auto const op_field, field(step, "op"));
    if (!op_field->is_string()) {
        return ConfigError::InvalidValue;
    }
    auto const &op = op_field->get_ref<std::string const &>();

    std::optional<StakeId> stake_id;
    Result<void> res = outcome::success();

    if (op == "mint") {
        BOOST_OUTCOME_TRY(auto const to, address_field(step, "to"));
        BOOST_OUTCOME_TRY(auto const amount, uint256_field(step, "amount"));
        res = ledger_.mint(to, amount);
    }
    else if (op == "approve") {
        BOOST_OUTCOME_TRY(auto const owner, address_field(step, "owner"));
        BOOST_OUTCOME_TRY(auto const amount, uint256_field(step, "amount"));
        ledger_.approve(owner, registry_.address(), amount);
    }
    else if (op == "mint_vehicle") {
        BOOST_OUTCOME_TRY(auto const id, uint256_field(step, "id"));
        BOOST_OUTCOME_TRY(auto const owner, address_field(step, "owner"));
        res = vehicles_.mint(id, owner);
    }
    else if (op == "burn_vehicle") {
        BOOST_OUTCOME_TRY(auto const id, uint256_field(step, "id"));
        res = vehicles_.burn(id);
    }
    else if (op == "advance_time") {
        if (clock_ == nullptr) {
            return ConfigError::InvalidValue;
        }
        BOOST_OUTCOME_TRY(auto const seconds, uint64_field(step, "seconds"));
        res = clock_->advance(seconds);
    }
    else if (op == "stake") {
        BOOST_OUTCOME_TRY(auto const sender, address_field(step, "sender"));
        BOOST_OUTCOME_TRY(auto const level, uint64_field(step, "level"));
        BOOST_OUTCOME_TRY(
            auto const external_id,
            optional_uint256_field(step, "external_id"));
        auto staked = registry_.stake(sender, level, external_id);
        if (staked.has_value()) {
            stake_id = staked.value();
        }
        else {
            res = std::move(staked).as_failure();
        }
    }
    else if (op == "upgrade") {
        BOOST_OUTCOME_TRY(auto const sender, address_field(step, "sender"));
        BOOST_OUTCOME_TRY(auto const id, uint64_field(step, "stake_id"));
        BOOST_OUTCOME_TRY(auto const level, uint64_field(step, "level"));
        BOOST_OUTCOME_TRY(
            auto const external_id,
            optional_uint256_field(step, "external_id"));
        res = registry_.upgrade_stake(sender, id, level, external_id);
    }
    else if (op == "withdraw") {
        BOOST_OUTCOME_TRY(auto const sender, address_field(step, "sender"));
        if (step.contains("stake_ids")) {
            auto const &ids = step.at("stake_ids");
            if (!ids.is_array()) {
                return ConfigError::InvalidValue;
            }
            std::vector<StakeId> stake_ids;
            for (auto const &id : ids) {
                if (!id.is_number_unsigned()) {
                    return ConfigError::InvalidValue;
                }
                stake_ids.push_back(id.get<StakeId>());
            }
            res = registry_.withdraw(sender, stake_ids);
        }
        else {
            BOOST_OUTCOME_TRY(auto const id, uint64_field(step, "stake_id"));
            res = registry_.withdraw(sender, id);
        }
    }
    else if (op == "extend") {
        BOOST_OUTCOME_TRY(auto const sender, address_field(step, "sender"));
        BOOST_OUTCOME_TRY(auto const id, uint64_field(step, "stake_id"));
        res = registry_.extend_staking(sender, id);
    }
    else if (op == "attach") {
        BOOST_OUTCOME_TRY(auto const sender, address_field(step, "sender"));
        BOOST_OUTCOME_TRY(auto const id, uint64_field(step, "stake_id"));
        BOOST_OUTCOME_TRY(
            auto const external_id, uint256_field(step, "external_id"));
        res = registry_.attach_vehicle(sender, id, external_id);
    }
    else if (op == "detach") {
        BOOST_OUTCOME_TRY(auto const sender, address_field(step, "sender"));
        BOOST_OUTCOME_TRY(
            auto const external_id, uint256_field(step, "external_id"));
        res = registry_.detach_vehicle(sender, external_id);
    }
    else if (op == "transfer") {
        BOOST_OUTCOME_TRY(auto const sender, address_field(step, "sender"));
        auto from = sender;
        if (step.contains("from")) {
            BOOST_OUTCOME_TRY(from, staking::parse_address(step.at("from")));
        }
        BOOST_OUTCOME_TRY(auto const to, address_field(step, "to"));
        BOOST_OUTCOME_TRY(auto const id, uint64_field(step, "stake_id"));
        res = registry_.transfer(sender, from, to, id);
    }
    else if (op == "delegate") {
        BOOST_OUTCOME_TRY(auto const sender, address_field(step, "sender"));
        BOOST_OUTCOME_TRY(
            auto const delegatee, address_field(step, "delegatee"));
        res = registry_.delegate(sender, delegatee);
    }
    else if (op == "set_expiration") {
        BOOST_OUTCOME_TRY(auto const sender, address_field(step, "sender"));
        BOOST_OUTCOME_TRY(auto const id, uint64_field(step, "stake_id"));
        BOOST_OUTCOME_TRY(
            auto const lock_end_time, uint64_field(step, "lock_end_time"));
        res = registry_.set_expiration(sender, id, lock_end_time);
    }
    else {
        LOG_WARNING("ScenarioRunner: unknown op {}", op);
        return ConfigError::InvalidValue;
    }

    nlohmann::json record;
    record["op"] = op;
    record["ok"] = !res.has_error();
    std::string outcome_text = "ok";
    if (res.has_error()) {
        outcome_text = res.error().message().c_str();
        record["error"] = outcome_text;
    }
    if (stake_id.has_value()) {
        record["stake_id"] = *stake_id;
    }
    if (step.contains("expect")) {
        auto const &expect = step.at("expect");
        if (!expect.is_string()) {
            return ConfigError::InvalidValue;
        }
        if (expect.get_ref<std::string const &>() != outcome_text) {
            ++unexpected_;
            record["unexpected"] = true;
            LOG_WARNING(
                "ScenarioRunner: {} expected {} but got {}",
                op,
                expect.get_ref<std::string const &>(),
                outcome_text);
        }
    }
    LOG_INFO("ScenarioRunner: {} -- {}", op, outcome_text);
    return record;
}

Result<nlohmann::json> ScenarioRunner::run(nlohmann::json const &scenario)
{
    nlohmann::json const *steps = &scenario;
    if (scenario.is_object()) {
        BOOST_OUTCOME_TRY(steps, field(scenario, "steps"));
    }
    if (!steps->is_array()) {
        return ConfigError::InvalidValue;
    }
    auto records = nlohmann::json::array();
    for (auto const &step : *steps) {
        BOOST_OUTCOME_TRY(auto record, run_step(step));
        records.push_back(std::move(record));
    }
    nlohmann::json result;
    result["steps"] = std::move(records);
    result["unexpected"] = unexpected_;
    return result;
}

LOCKSTAKE_SIM_NAMESPACE_END
