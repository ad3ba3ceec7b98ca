/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "souk/util/Timestamp.hpp"

#include <date/date.h>
#include <fmt/format.h>

#include <source_location>
#include <sstream>
#include <stdexcept>

//-------------------------------------------------------------------------

namespace souk::util
{

//-------------------------------------------------------------------------

std::string formatTimestamp(Timestamp ts)
{
    return date::format("%FT%TZ", ts);
}

//-------------------------------------------------------------------------

Timestamp parseTimestamp(std::string_view str)
{
    Timestamp ts;
    {
        std::istringstream in{std::string{str}};
        in >> date::parse("%FT%T", ts);
        if (!in.fail()) return ts;
    }
    {
        std::istringstream in{std::string{str}};
        date::sys_days day;
        in >> date::parse("%F", day);
        if (!in.fail()) return Timestamp{day};
    }
    throw std::invalid_argument{fmt::format(
        "{}: Unable to parse timestamp '{}'",
        std::source_location::current().function_name(),
        str)};
}

//-------------------------------------------------------------------------

}  // namespace souk::util

//-------------------------------------------------------------------------
