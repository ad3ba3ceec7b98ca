/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "souk/decimal/decimal.hpp"
#include "souk/util/Timestamp.hpp"

#include <boost/signals2.hpp>
#include <fmt/core.h>
#include <fmt/format.h>
#include <magic_enum.hpp>
#include <range/v3/all.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

//-------------------------------------------------------------------------

namespace fs = std::filesystem;

namespace bs2 = boost::signals2;
namespace views = ranges::views;

using namespace souk::literals;

//-------------------------------------------------------------------------

namespace souk
{

using VendorId = uint64_t;
using OrderRef = uint64_t;
using CategoryId = std::string;
using ZoneId = std::string;

}  // namespace souk

//-------------------------------------------------------------------------
