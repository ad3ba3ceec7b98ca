/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "souk/logging/logging.hpp"

#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <source_location>
#include <stdexcept>
#include <string>

//-------------------------------------------------------------------------

namespace souk::logging
{

//-------------------------------------------------------------------------

std::shared_ptr<spdlog::logger> logger()
{
    static const std::shared_ptr<spdlog::logger> s_logger = [] {
        const std::string name{kLoggerName};
        if (auto existing = spdlog::get(name)) {
            return existing;
        }
        auto created = spdlog::stdout_color_mt(name);
        created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        return created;
    }();
    return s_logger;
}

//-------------------------------------------------------------------------

spdlog::level::level_enum parseLevel(std::string_view name)
{
    const auto level = spdlog::level::from_str(std::string{name});
    // from_str maps anything it does not know to "off".
    if (level == spdlog::level::off && name != "off") {
        throw std::invalid_argument{fmt::format(
            "{}: Unknown log level '{}'", std::source_location::current().function_name(), name)};
    }
    return level;
}

//-------------------------------------------------------------------------

void setLevel(spdlog::level::level_enum level)
{
    logger()->set_level(level);
}

//-------------------------------------------------------------------------

}  // namespace souk::logging

//-------------------------------------------------------------------------
