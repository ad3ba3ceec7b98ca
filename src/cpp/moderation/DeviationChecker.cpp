/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "souk/moderation/DeviationChecker.hpp"

//-------------------------------------------------------------------------

namespace souk::moderation
{

//-------------------------------------------------------------------------

void PriceDeviationResult::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json::addDecimalMember(json, "price", price);
        json::addDecimalMember(json, "benchmark", benchmark);
        json::addDecimalMember(json, "deviation", deviation);
        json::addDecimalMember(json, "threshold", threshold);
        json.AddMember("flagged", rapidjson::Value{flagged}, allocator);
        json.AddMember(
            "direction",
            rapidjson::Value{std::string{magic_enum::enum_name(direction)}.c_str(), allocator},
            allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

DeviationChecker::DeviationChecker(const config::PolicyConfig& policy) noexcept
    : m_defaultThreshold{policy.defaultDeviationThreshold}
{}

//-------------------------------------------------------------------------

PriceDeviationResult DeviationChecker::checkDeviation(
    decimal_t price, decimal_t benchmark, std::optional<decimal_t> threshold) const
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (!(benchmark > 0_dec)) {
        throw InvalidBenchmark{fmt::format(
            "{}: Benchmark price should be positive; was {}", ctx, benchmark)};
    }
    const decimal_t limit = threshold.value_or(m_defaultThreshold);
    if (limit < 0_dec) {
        throw std::invalid_argument{fmt::format(
            "{}: Deviation threshold cannot be negative; was {}", ctx, limit)};
    }

    const decimal_t deviation = util::abs(price - benchmark) / benchmark;
    const bool flagged = deviation > limit;

    return {
        .price = price,
        .benchmark = benchmark,
        .deviation = util::round(deviation, kDeviationDecimalPlaces),
        .threshold = limit,
        .flagged = flagged,
        .direction = [&] {
            if (!flagged) return DeviationDirection::NORMAL;
            return price > benchmark ? DeviationDirection::ABOVE : DeviationDirection::BELOW;
        }()
    };
}

//-------------------------------------------------------------------------

}  // namespace souk::moderation

//-------------------------------------------------------------------------
