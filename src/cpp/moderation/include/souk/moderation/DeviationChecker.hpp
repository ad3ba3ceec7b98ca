/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "souk/config/PolicyConfig.hpp"
#include "souk/util/common.hpp"

//-------------------------------------------------------------------------

namespace souk::moderation
{

//-------------------------------------------------------------------------

class InvalidBenchmark : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

//-------------------------------------------------------------------------

enum class DeviationDirection : uint32_t
{
    NORMAL,
    ABOVE,
    BELOW
};

//-------------------------------------------------------------------------

struct PriceDeviationResult
{
    decimal_t price;
    decimal_t benchmark;
    // |price - benchmark| / benchmark, rounded for display.
    decimal_t deviation;
    decimal_t threshold;
    bool flagged;
    DeviationDirection direction;

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;
};

//-------------------------------------------------------------------------

class DeviationChecker
{
public:
    static constexpr uint32_t kDeviationDecimalPlaces = 4;

    explicit DeviationChecker(const config::PolicyConfig& policy) noexcept;

    // Throws InvalidBenchmark if the benchmark is not positive.
    [[nodiscard]] PriceDeviationResult checkDeviation(
        decimal_t price,
        decimal_t benchmark,
        std::optional<decimal_t> threshold = {}) const;

private:
    decimal_t m_defaultThreshold;
};

//-------------------------------------------------------------------------

}  // namespace souk::moderation

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<souk::moderation::DeviationDirection>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(souk::moderation::DeviationDirection direction, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", magic_enum::enum_name(direction));
    }
};

//-------------------------------------------------------------------------
