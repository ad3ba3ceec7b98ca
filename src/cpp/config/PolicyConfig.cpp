/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "souk/config/PolicyConfig.hpp"

#include "souk/util/common.hpp"

#include <fmt/format.h>

//-------------------------------------------------------------------------

namespace souk::config
{

//-------------------------------------------------------------------------

void PolicyConfig::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json::addDecimalMember(json, "vatRate", vatRate);
        json::addDecimalMember(json, "cooperativeFeeRate", cooperativeFeeRate);
        json::addDecimalMember(json, "logisticsSurcharge", logisticsSurcharge);
        json.AddMember("escrowHoldDays", rapidjson::Value{escrowHoldDays}, allocator);
        json::addDecimalMember(json, "minimumPayoutThreshold", minimumPayoutThreshold);
        json::addDecimalMember(json, "defaultDeviationThreshold", defaultDeviationThreshold);
        json.AddMember("roundingDecimals", rapidjson::Value{roundingDecimals}, allocator);
        json::addDecimalMember(json, "minimumFixedUplift", minimumFixedUplift);
        json::addDecimalMember(json, "lowPriceThreshold", lowPriceThreshold);
        json::addDecimalMember(json, "lowPriceFixedMarkup", lowPriceFixedMarkup);
        json::addDecimalMember(json, "friendlyPriceIncrement", friendlyPriceIncrement);
        json.AddMember("maxCommitRetries", rapidjson::Value{maxCommitRetries}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

PolicyConfig makePolicyConfig(pugi::xml_node node)
{
    static constexpr auto sl = std::source_location::current();

    const PolicyConfig defaults;

    const auto holdDays = node.attribute("escrowHoldDays").as_uint(defaults.escrowHoldDays);
    if (holdDays == 0) {
        throw std::invalid_argument{fmt::format(
            "{}: 'escrowHoldDays' should be > 0", sl.function_name())};
    }

    const auto roundingDecimals =
        node.attribute("roundingDecimals").as_uint(defaults.roundingDecimals);
    if (roundingDecimals == 0) {
        throw std::invalid_argument{fmt::format(
            "{}: 'roundingDecimals' should be > 0", sl.function_name())};
    }

    return {
        .vatRate = checkRate(
            decimalAttribute(node, "vatRate", defaults.vatRate), "vatRate", sl),
        .cooperativeFeeRate = checkRate(
            decimalAttribute(node, "cooperativeFeeRate", defaults.cooperativeFeeRate),
            "cooperativeFeeRate",
            sl),
        .logisticsSurcharge = checkNonNegative(
            decimalAttribute(node, "logisticsSurcharge", defaults.logisticsSurcharge),
            "logisticsSurcharge",
            sl),
        .escrowHoldDays = holdDays,
        .minimumPayoutThreshold = checkNonNegative(
            decimalAttribute(node, "minimumPayoutThreshold", defaults.minimumPayoutThreshold),
            "minimumPayoutThreshold",
            sl),
        .defaultDeviationThreshold = checkNonNegative(
            decimalAttribute(
                node, "defaultDeviationThreshold", defaults.defaultDeviationThreshold),
            "defaultDeviationThreshold",
            sl),
        .roundingDecimals = roundingDecimals,
        .minimumFixedUplift = checkNonNegative(
            decimalAttribute(node, "minimumFixedUplift", defaults.minimumFixedUplift),
            "minimumFixedUplift",
            sl),
        .lowPriceThreshold = checkNonNegative(
            decimalAttribute(node, "lowPriceThreshold", defaults.lowPriceThreshold),
            "lowPriceThreshold",
            sl),
        .lowPriceFixedMarkup = checkNonNegative(
            decimalAttribute(node, "lowPriceFixedMarkup", defaults.lowPriceFixedMarkup),
            "lowPriceFixedMarkup",
            sl),
        .friendlyPriceIncrement = checkPositive(
            decimalAttribute(node, "friendlyPriceIncrement", defaults.friendlyPriceIncrement),
            "friendlyPriceIncrement",
            sl),
        .maxCommitRetries = node.attribute("maxCommitRetries").as_uint(defaults.maxCommitRetries)
    };
}

//-------------------------------------------------------------------------

decimal_t checkRate(decimal_t rate, std::string_view name, std::source_location sl)
{
    if (!(0_dec <= rate && rate < 1_dec)) {
        throw std::invalid_argument{fmt::format(
            "{}: '{}' should be within [0, 1); was {}", sl.function_name(), name, rate)};
    }
    return rate;
}

//-------------------------------------------------------------------------

decimal_t checkNonNegative(decimal_t amount, std::string_view name, std::source_location sl)
{
    if (amount < 0_dec) {
        throw std::invalid_argument{fmt::format(
            "{}: '{}' should be non-negative; was {}", sl.function_name(), name, amount)};
    }
    return amount;
}

//-------------------------------------------------------------------------

decimal_t checkPositive(decimal_t amount, std::string_view name, std::source_location sl)
{
    if (!(amount > 0_dec)) {
        throw std::invalid_argument{fmt::format(
            "{}: '{}' should be positive; was {}", sl.function_name(), name, amount)};
    }
    return amount;
}

//-------------------------------------------------------------------------

decimal_t decimalAttribute(pugi::xml_node node, const char* name, decimal_t fallback)
{
    if (pugi::xml_attribute attr = node.attribute(name)) {
        return util::str2decimal(attr.as_string());
    }
    return fallback;
}

//-------------------------------------------------------------------------

}  // namespace souk::config

//-------------------------------------------------------------------------
