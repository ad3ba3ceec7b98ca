/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string_view>

//-------------------------------------------------------------------------

namespace souk::logging
{

inline constexpr std::string_view kLoggerName{"souk"};

// Diagnostics logger, created on first use with a colored stdout sink.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

// Throws std::invalid_argument on an unknown level name.
[[nodiscard]] spdlog::level::level_enum parseLevel(std::string_view name);

void setLevel(spdlog::level::level_enum level);

}  // namespace souk::logging

//-------------------------------------------------------------------------
