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

#include "simulation.hpp"

#include <spool/core/ed25519.hpp>
#include <spool/core/log_level_map.hpp>

#include <CLI/CLI.hpp>

#include <nlohmann/json.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace spool;
namespace fs = std::filesystem;

int main(int const argc, char const *argv[])
{
    CLI::App cli{"spool-sim"};
    cli.option_defaults()->always_capture_default();

    SimulationConfig config;
    unsigned commission = config.commission;
    fs::path report_path;
    auto log_level = quill::LogLevel::Info;

    cli.add_option(
        "--first_stake",
        config.first_stake,
        "lamports staked by the first user");
    cli.add_option(
        "--second_stake",
        config.second_stake,
        "lamports staked by the second user");
    cli.add_option(
        "--reward",
        config.reward_per_epoch,
        "inflation rewards paid to the vote account every epoch");
    cli.add_option(
        "--tip",
        config.tip_per_epoch,
        "lamports sent to the onramp every epoch");
    cli.add_option("--epochs", config.epochs, "number of rewarded epochs");
    cli.add_option(
        "--minimum_delegation",
        config.minimum_delegation,
        "stake program minimum delegation");
    cli.add_option("--commission", commission, "validator commission percent")
        ->check(CLI::Range(0u, 100u));
    cli.add_option("--report", report_path, "write the JSON report here");
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }
    config.commission = static_cast<uint8_t>(commission);

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

    ensure_sodium_initialized();

    Simulation simulation{config};
    auto const res = simulation.run();
    if (res.has_error()) {
        LOG_ERROR("simulation failed: {}", res.error().message().c_str());
        quill::flush();
        return EXIT_FAILURE;
    }

    auto const report = simulation.report().dump(2);
    if (report_path.empty()) {
        quill::flush();
        std::cout << report << std::endl;
    }
    else {
        std::ofstream out{report_path};
        if (!out) {
            LOG_ERROR("could not open {}", report_path.string());
            quill::flush();
            return EXIT_FAILURE;
        }
        out << report << '\n';
        LOG_INFO("report written to {}", report_path.string());
    }

    quill::flush();
    return EXIT_SUCCESS;
}
