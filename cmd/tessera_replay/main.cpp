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

#include "script.hpp"

#include <tessera/core/int.hpp>
#include <tessera/core/log_level_map.hpp>
#include <tessera/core/result.hpp>
#include <tessera/sim/sim_environment.hpp>
#include <tessera/staking/util/staking_params.hpp>

#include <CLI/CLI.hpp>

#include <intx/intx.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace tessera;

namespace fs = std::filesystem;

namespace
{
    std::string check_amount(std::string const &s)
    {
        if (s.empty() ||
            s.find_first_not_of("0123456789") != std::string::npos) {
            return "not a decimal amount";
        }
        try {
            (void)intx::from_string<uint256_t>(s);
        }
        catch (std::out_of_range const &) {
            return "amount does not fit in 256 bits";
        }
        return "";
    }
}

int main(int const argc, char const *argv[])
{
    CLI::App cli{"tessera-replay"};
    cli.option_defaults()->always_capture_default();

    fs::path script;
    auto log_level = quill::LogLevel::Info;
    bool print_state = false;
    std::string min_stake = "0";
    uint64_t authorization_ceiling = 0;
    std::string notification_reward = "0";
    std::string discrepancy_penalty = "0";
    std::string discrepancy_reward_multiplier = "100";
    uint64_t legacy_a_ratio = 1;
    uint64_t legacy_a_divisor = 1;
    uint64_t legacy_b_ratio = 1;
    uint64_t legacy_b_divisor = 1;

    cli.add_option("--script", script, "script of ledger operations")
        ->required()
        ->check(CLI::ExistingFile);
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));
    cli.add_flag(
        "--print_state", print_state, "print the ledger state after the run");
    cli.add_option("--min_stake", min_stake, "minimum native stake amount")
        ->check(check_amount, "AMOUNT");
    cli.add_option(
        "--authorization_ceiling",
        authorization_ceiling,
        "max applications per operator, 0 is unlimited");
    cli.add_option(
           "--notification_reward",
           notification_reward,
           "reward per slashing notification")
        ->check(check_amount, "AMOUNT");
    cli.add_option(
           "--discrepancy_penalty",
           discrepancy_penalty,
           "amount seized on a stake discrepancy")
        ->check(check_amount, "AMOUNT");
    cli.add_option(
           "--discrepancy_reward_multiplier",
           discrepancy_reward_multiplier,
           "percentage of the discrepancy reward paid to the notifier")
        ->check(check_amount, "AMOUNT");
    auto *const oracles =
        cli.add_option_group("oracles", "legacy conversion ratios");
    oracles->add_option(
        "--legacy_a_ratio", legacy_a_ratio, "native per legacy A unit");
    oracles->add_option(
        "--legacy_a_divisor", legacy_a_divisor, "legacy A units per ratio");
    oracles->add_option(
        "--legacy_b_ratio", legacy_b_ratio, "native per legacy B unit");
    oracles->add_option(
        "--legacy_b_divisor", legacy_b_divisor, "legacy B units per ratio");

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

    auto stdout_handler = quill::stdout_handler();
    stdout_handler->set_pattern(
        "%(time) [%(thread_id)] %(file_name):%(line_number) LOG_%(log_level)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stdout_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    if (legacy_a_ratio == 0 || legacy_a_divisor == 0 || legacy_b_ratio == 0 ||
        legacy_b_divisor == 0) {
        LOG_ERROR("conversion ratios must be non zero");
        return EXIT_FAILURE;
    }

    staking::LedgerConfig config;
    config.ledger = named_address("ledger").value();
    config.governance = named_address("governance").value();
    config.params.min_stake_amount = intx::from_string<uint256_t>(min_stake);
    config.params.authorization_ceiling = authorization_ceiling;
    config.params.notification_reward =
        intx::from_string<uint256_t>(notification_reward);
    config.params.stake_discrepancy_penalty =
        intx::from_string<uint256_t>(discrepancy_penalty);
    config.params.stake_discrepancy_reward_multiplier =
        intx::from_string<uint256_t>(discrepancy_reward_multiplier);
    if (config.params.stake_discrepancy_reward_multiplier > uint256_t{100}) {
        LOG_ERROR("discrepancy reward multiplier is a percentage");
        return EXIT_FAILURE;
    }

    sim::SimEnvironment env{
        config,
        sim::OracleRatio{legacy_a_ratio, legacy_a_divisor},
        sim::OracleRatio{legacy_b_ratio, legacy_b_divisor}};

    std::ifstream in{script};
    if (!in) {
        LOG_ERROR("could not open {}", script.string());
        return EXIT_FAILURE;
    }

    LOG_INFO("replaying {}", script.string());
    ScriptRunner runner{env, std::cout};
    auto const summary = runner.run(in);
    if (print_state) {
        runner.print_state(std::cout);
    }

    LOG_INFO(
        "Finish running, lines = {}, succeeded = {}, rejected = {}, "
        "mismatched = {}, events = {}",
        summary.lines,
        summary.succeeded,
        summary.rejected,
        summary.mismatched,
        env.ledger.events().size());

    return summary.mismatched == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
