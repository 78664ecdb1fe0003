/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "solvency/util/Logging.hpp"

#include <fmt/format.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>

#include <memory>
#include <source_location>
#include <stdexcept>
#include <string>

//-------------------------------------------------------------------------

namespace solvency::log
{

//-------------------------------------------------------------------------

namespace
{

constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v";

[[nodiscard]] std::shared_ptr<spdlog::logger> makeLogger()
{
    auto logger = std::make_shared<spdlog::logger>(
        std::string{kLoggerName}, std::make_shared<spdlog::sinks::stderr_sink_mt>());
    logger->set_level(spdlog::level::warn);
    logger->set_pattern(kPattern);
    return logger;
}

}  // namespace

//-------------------------------------------------------------------------

LoggingConfig LoggingConfig::fromXML(pugi::xml_node node)
{
    LoggingConfig config;
    if (!node) return config;

    if (pugi::xml_attribute attr = node.attribute("level")) {
        config.level = parseLevel(attr.as_string());
    }
    if (pugi::xml_attribute attr = node.attribute("file"); attr && *attr.as_string() != '\0') {
        config.filepath = fs::path{attr.as_string()};
    }
    return config;
}

//-------------------------------------------------------------------------

spdlog::level::level_enum parseLevel(std::string_view name)
{
    const auto level = spdlog::level::from_str(std::string{name});
    // from_str maps unknown names to off.
    if (level == spdlog::level::off && name != "off") {
        throw std::invalid_argument{fmt::format(
            "{}: Unknown log level '{}'",
            std::source_location::current().function_name(),
            name)};
    }
    return level;
}

//-------------------------------------------------------------------------

void configure(const LoggingConfig& config)
{
    auto& instance = logger();
    auto& sinks = instance.sinks();
    sinks.clear();
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_sink_mt>());
    if (config.filepath.has_value()) {
        sinks.push_back(
            std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.filepath->string()));
    }
    instance.set_pattern(kPattern);
    instance.set_level(config.level);
}

//-------------------------------------------------------------------------

spdlog::logger& logger()
{
    static const std::shared_ptr<spdlog::logger> s_logger = makeLogger();
    return *s_logger;
}

//-------------------------------------------------------------------------

}  // namespace solvency::log

//-------------------------------------------------------------------------
