/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "solvency/check/SolvencyCheck.hpp"
#include "solvency/config/Snapshot.hpp"
#include "solvency/serialization/json_util.hpp"
#include "solvency/util/Logging.hpp"
#include "solvency/util/common.hpp"

#include <CLI/CLI.hpp>
#include <fmt/format.h>

#include <exception>
#include <optional>
#include <string>

//-------------------------------------------------------------------------

int main(int argc, char* argv[])
{
    using namespace solvency;

    CLI::App app{"solvency-check: subaccount risk and undercollateralized update gate"};

    fs::path snapshotPath;
    app.add_option("-f,--snapshot-file", snapshotPath, "Snapshot config file")
        ->required()
        ->check(CLI::ExistingFile);

    bool asJson = false;
    app.add_flag("--json", asJson, "Print the result as JSON");

    std::optional<std::string> logLevel;
    app.add_option(
        "--log-level",
        logLevel,
        "Overrides the snapshot's log level (trace, debug, info, warn, error, critical, off)");

    CLI11_PARSE(app, argc, argv);

    try {
        auto snapshot = config::loadSnapshot(snapshotPath);
        if (logLevel.has_value()) {
            snapshot.logging.level = log::parseLevel(*logLevel);
        }
        log::configure(snapshot.logging);

        const auto result = check::runCheck(snapshot);

        if (asJson) {
            fmt::print(
                "{}\n",
                json::jsonSerializable2str(result, {.indent = json::IndentOptions{}}));
        } else {
            fmt::print("{}\n", result);
        }

        return result.rejected() ? 1 : 0;
    }
    catch (const std::exception& exc) {
        log::logger().critical("{}", exc.what());
        return 2;
    }
}

//-------------------------------------------------------------------------
