/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "solvency/util/common.hpp"

#include <pugixml.hpp>
#include <spdlog/spdlog.h>

#include <optional>
#include <string_view>

//-------------------------------------------------------------------------

namespace solvency::log
{

inline constexpr std::string_view kLoggerName = "solvency";

struct LoggingConfig
{
    spdlog::level::level_enum level = spdlog::level::warn;
    std::optional<fs::path> filepath;

    [[nodiscard]] static LoggingConfig fromXML(pugi::xml_node node);
};

[[nodiscard]] spdlog::level::level_enum parseLevel(std::string_view name);

// Not synchronized with concurrent logging; apply once at start-up.
void configure(const LoggingConfig& config);

[[nodiscard]] spdlog::logger& logger();

}  // namespace solvency::log

//-------------------------------------------------------------------------
