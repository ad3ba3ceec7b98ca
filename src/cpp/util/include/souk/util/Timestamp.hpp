/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <chrono>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

namespace souk
{

using Timestamp = std::chrono::sys_time<std::chrono::milliseconds>;

}  // namespace souk

//-------------------------------------------------------------------------

namespace souk::util
{

// ISO-8601, UTC, millisecond precision: 2025-03-01T12:00:00.000Z
[[nodiscard]] std::string formatTimestamp(Timestamp ts);

// Accepts "YYYY-MM-DD" or "YYYY-MM-DDTHH:MM:SS[.fff]" (UTC).
[[nodiscard]] Timestamp parseTimestamp(std::string_view str);

}  // namespace souk::util

//-------------------------------------------------------------------------
