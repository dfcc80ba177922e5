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

#include <lockstake/core/basic_formatter.hpp>
#include <lockstake/core/fmt/address_fmt.hpp>
#include <lockstake/core/log_level_map.hpp>
#include <lockstake/host/call_script.hpp>
#include <lockstake/host/genesis.hpp>
#include <lockstake/host/staking_host.hpp>

#include <CLI/CLI.hpp>

#include <nlohmann/json.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>
#include <quill/detail/LogMacros.h>

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

int main(int const argc, char const *argv[])
{
    using namespace lockstake;

    CLI::App cli{"lockstake"};
    cli.option_defaults()->always_capture_default();

    fs::path genesis_path;
    fs::path calls_path;
    fs::path dump_state_path;
    auto log_level = quill::LogLevel::Info;

    cli.add_option("--genesis", genesis_path, "genesis file")
        ->check(CLI::ExistingFile)
        ->required();
    cli.add_option(
        "--calls", calls_path, "json array of calls and reads to run")
        ->check(CLI::ExistingFile)
        ->required();
    cli.add_option(
        "--dump_state",
        dump_state_path,
        "file to dump the final ledger, balances and events to");
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    // results go to stdout, logs to stderr
    auto stderr_handler = quill::stderr_handler();
    stderr_handler->set_pattern(
        "%(ascii_time) [%(thread)] %(filename):%(lineno) LOG_%(level_name)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stderr_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    Genesis genesis;
    std::vector<Step> steps;
    try {
        genesis = read_genesis(genesis_path);
        steps = read_steps(calls_path);
    }
    catch (std::exception const &e) {
        LOG_ERROR("failed to load input: {}", e.what());
        quill::flush();
        return EXIT_FAILURE;
    }

    StakingHost host{genesis.contract_address, std::move(genesis.pool)};
    try {
        load_genesis(host, genesis);
    }
    catch (std::exception const &e) {
        LOG_ERROR("failed to apply genesis: {}", e.what());
        quill::flush();
        return EXIT_FAILURE;
    }
    LOG_INFO(
        "loaded genesis for contract {} with {} steps",
        host.contract_address(),
        steps.size());

    auto const results = run_steps(host, steps);
    std::cout << results.dump(2) << std::endl;

    if (!dump_state_path.empty()) {
        std::ofstream ofile(dump_state_path);
        if (!ofile) {
            LOG_ERROR("cannot open {}", dump_state_path.string());
            quill::flush();
            return EXIT_FAILURE;
        }
        ofile << dump_state(host).dump(2) << std::endl;
        LOG_INFO("dumped state to {}", dump_state_path.string());
    }

    quill::flush();
    return EXIT_SUCCESS;
}
