/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "souk/decimal/decimal.hpp"
#include "souk/util/JsonSerializable.hpp"

#include <pugixml.hpp>

#include <cstdint>
#include <source_location>

//-------------------------------------------------------------------------

namespace souk::config
{

//-------------------------------------------------------------------------

struct PolicyConfig
{
    decimal_t vatRate = DEC(0.14);
    decimal_t cooperativeFeeRate = DEC(0.05);
    decimal_t logisticsSurcharge = DEC(10);
    uint32_t escrowHoldDays = 14;
    decimal_t minimumPayoutThreshold = DEC(500);
    decimal_t defaultDeviationThreshold = DEC(0.20);

    uint32_t roundingDecimals = 2;
    // Zero disables the floor.
    decimal_t minimumFixedUplift{};
    decimal_t lowPriceThreshold{};
    decimal_t lowPriceFixedMarkup{};
    decimal_t friendlyPriceIncrement = DEC(5);
    uint32_t maxCommitRetries = 8;

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;
};

[[nodiscard]] PolicyConfig makePolicyConfig(pugi::xml_node node);

//-------------------------------------------------------------------------

[[nodiscard]] decimal_t checkRate(
    decimal_t rate,
    std::string_view name,
    std::source_location sl = std::source_location::current());

[[nodiscard]] decimal_t checkNonNegative(
    decimal_t amount,
    std::string_view name,
    std::source_location sl = std::source_location::current());

[[nodiscard]] decimal_t checkPositive(
    decimal_t amount,
    std::string_view name,
    std::source_location sl = std::source_location::current());

// Reads an optional decimal attribute exactly (no detour through double).
[[nodiscard]] decimal_t decimalAttribute(
    pugi::xml_node node, const char* name, decimal_t fallback);

//-------------------------------------------------------------------------

}  // namespace souk::config

//-------------------------------------------------------------------------
