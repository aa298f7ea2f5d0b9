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

#include <lockstake/core/config.hpp>
#include <lockstake/core/fmt/address_fmt.hpp> // NOLINT
#include <lockstake/core/log_level_map.hpp>
#include <lockstake/sim/clock.hpp>
#include <lockstake/sim/event_json.hpp>
#include <lockstake/sim/memory_ledger.hpp>
#include <lockstake/sim/memory_vehicle_registry.hpp>
#include <lockstake/sim/scenario.hpp>
#include <lockstake/staking/events.hpp>
#include <lockstake/staking/registry_config.hpp>
#include <lockstake/staking/stake_registry.hpp>
#include <lockstake/staking/staking_state.hpp>
#include <lockstake/staking/types.hpp>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <quill/LogLevel.h>
#include <quill/Quill.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

LOCKSTAKE_ANONYMOUS_NAMESPACE_BEGIN

enum class ClockKind
{
    Manual,
    System,
};

std::optional<nlohmann::json> read_json(std::filesystem::path const &path)
{
    std::ifstream in{path};
    if (!in) {
        LOG_ERROR("could not open {}", path.string());
        return std::nullopt;
    }
    auto j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded()) {
        LOG_ERROR("{} is not valid json", path.string());
        return std::nullopt;
    }
    return j;
}

LOCKSTAKE_ANONYMOUS_NAMESPACE_END

using namespace lockstake;
using namespace lockstake::staking;
namespace fs = std::filesystem;

int main(int const argc, char const *argv[])
{
    CLI::App cli{"lockstake_sim"};
    cli.option_defaults()->always_capture_default();

    fs::path config_path;
    fs::path scenario_path;
    auto clock_kind = ClockKind::Manual;
    StakeId stake_id = 0;
    Timestamp start_time = 0;
    auto log_level = quill::LogLevel::Info;

    std::unordered_map<std::string, ClockKind> const CLOCK_MAP = {
        {"manual", ClockKind::Manual}, {"system", ClockKind::System}};

    cli.add_option("--config", config_path, "registry configuration json")
        ->required()
        ->check(CLI::ExistingFile);
    cli.add_option("--scenario", scenario_path, "scenario json to replay")
        ->required()
        ->check(CLI::ExistingFile);
    cli.add_option("--clock", clock_kind, "time source")
        ->transform(CLI::CheckedTransformer(CLOCK_MAP, CLI::ignore_case));
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));
    cli.add_option(
        "--stake_id",
        stake_id,
        "only print events of this stake id, 0 prints all");
    cli.add_option(
        "--start_time", start_time, "initial time of the manual clock");

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::CallForHelp const &e) {
        return cli.exit(e);
    }
    catch (CLI::RequiredError const &e) {
        return cli.exit(e);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    // stdout carries the json report
    auto stderr_handler = quill::stderr_handler();
    stderr_handler->set_pattern(
        "%(time) [%(thread_id)] %(file_name):%(line_number) LOG_%(log_level)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stderr_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    auto const config_json = read_json(config_path);
    auto const scenario_json = read_json(scenario_path);
    if (!config_json.has_value() || !scenario_json.has_value()) {
        return 1;
    }

    auto config = load_registry_config(*config_json);
    if (config.has_error()) {
        LOG_ERROR(
            "invalid config {} -- {}",
            config_path.string(),
            config.error().message().c_str());
        return 1;
    }
    LOG_INFO(
        "registry {} with {} stake levels",
        config.value().registry,
        config.value().levels.levels().size());

    sim::MemoryLedger ledger;
    sim::MemoryVehicleRegistry vehicles;
    std::unique_ptr<sim::ManualClock> manual_clock;
    std::unique_ptr<TimeOracle> system_clock;
    TimeOracle *clock = nullptr;
    if (clock_kind == ClockKind::Manual) {
        manual_clock = std::make_unique<sim::ManualClock>(start_time);
        clock = manual_clock.get();
    }
    else {
        system_clock = std::make_unique<sim::SystemClock>();
        clock = system_clock.get();
    }

    StakingState state;
    StakeRegistry registry{
        std::move(config).value(), state, ledger, vehicles, *clock};
    sim::ScenarioRunner runner{
        registry, ledger, vehicles, manual_clock.get()};

    auto report = runner.run(*scenario_json);
    if (report.has_error()) {
        LOG_ERROR(
            "invalid scenario {} -- {}",
            scenario_path.string(),
            report.error().message().c_str());
        return 1;
    }

    auto events = registry.events();
    if (stake_id != 0) {
        events = events_for_stake(events, stake_id);
    }
    auto output = std::move(report).value();
    output["events"] = sim::to_json(events);
    std::cout << output.dump(2) << std::endl;

    return runner.unexpected() == 0 ? 0 : 2;
}
