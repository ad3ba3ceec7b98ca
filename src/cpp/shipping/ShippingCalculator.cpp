/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "souk/shipping/ShippingCalculator.hpp"

//-------------------------------------------------------------------------

namespace souk::shipping
{

//-------------------------------------------------------------------------

void ShippingQuote::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json::addDecimalMember(json, "actualWeightKg", actualWeightKg);
        json::addDecimalMember(json, "volumetricWeightKg", volumetricWeightKg);
        json::addDecimalMember(json, "chargeableWeightKg", chargeableWeightKg);
        json::addDecimalMember(json, "baseFee", baseFee);
        json::addDecimalMember(json, "extraWeightFee", extraWeightFee);
        json::addDecimalMember(json, "totalFee", totalFee);
        json::addDecimalMember(json, "platformSubsidy", platformSubsidy);
        json::addDecimalMember(json, "customerFee", customerFee);
        json.AddMember(
            "estimatedDeliveryDays", rapidjson::Value{estimatedDeliveryDays}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

ShippingCalculator::ShippingCalculator(
    const config::PolicyConfig& policy, const RateCardBook* rateCards) noexcept
    : m_policy{policy},
      m_rateCards{rateCards}
{}

//-------------------------------------------------------------------------

ShippingQuote ShippingCalculator::calculateShippingFee(const ShippingInput& input) const
{
    validate(input);

    const auto& shippingPolicy = m_rateCards->policy();
    const auto destination = m_rateCards->zone(input.destinationZone).value();

    // Rounded for the quote only; the chargeable weight uses the exact value.
    const decimal_t volumetric = volumetricWeight(input);
    const decimal_t chargeable = util::ceil(util::max(input.actualWeightKg, volumetric));
    const decimal_t extraWeight = util::max(chargeable - shippingPolicy.baseWeightKg, 0_dec);

    const auto [baseFee, perKgRate] = [&]() -> std::pair<decimal_t, decimal_t> {
        if (auto card = m_rateCards->rateCard(input.originZone, input.destinationZone)) {
            return {card->baseFee, card->perKgRate};
        }
        return {shippingPolicy.defaultBaseFee, shippingPolicy.defaultPerKgRate};
    }();

    const decimal_t extraWeightFee = util::round(extraWeight * perKgRate, m_policy.roundingDecimals);
    const decimal_t totalFee = baseFee + extraWeightFee;

    // Any subsidy is capped by the logistics surcharge collected in the platform bucket.
    const decimal_t customerFee = util::round(
        util::max(
            totalFee - m_policy.logisticsSurcharge,
            totalFee * (1_dec - shippingPolicy.maxSubsidyRate)),
        m_policy.roundingDecimals);

    return {
        .actualWeightKg = input.actualWeightKg,
        .volumetricWeightKg = util::round(volumetric, m_policy.roundingDecimals),
        .chargeableWeightKg = chargeable,
        .baseFee = baseFee,
        .extraWeightFee = extraWeightFee,
        .totalFee = totalFee,
        .platformSubsidy = totalFee - customerFee,
        .customerFee = customerFee,
        .estimatedDeliveryDays = destination.estimatedDeliveryDays
    };
}

//-------------------------------------------------------------------------

decimal_t ShippingCalculator::volumetricWeight(const ShippingInput& input) const
{
    return input.lengthCm * input.widthCm * input.heightCm / m_rateCards->policy().volumetricDivisor;
}

//-------------------------------------------------------------------------

void ShippingCalculator::validate(const ShippingInput& input) const
{
    static constexpr auto ctx = std::source_location::current().function_name();

    const std::pair<std::string_view, decimal_t> measures[]{
        {"actualWeightKg", input.actualWeightKg},
        {"lengthCm", input.lengthCm},
        {"widthCm", input.widthCm},
        {"heightCm", input.heightCm}};
    for (const auto& [name, value] : measures) {
        if (!(value > 0_dec)) {
            throw InvalidShippingInput{fmt::format(
                "{}: '{}' should be positive; was {}", ctx, name, value)};
        }
    }

    for (const auto& zoneId : {input.originZone, input.destinationZone}) {
        if (!m_rateCards->zone(zoneId).has_value()) {
            throw InvalidShippingInput{fmt::format("{}: Unknown zone '{}'", ctx, zoneId)};
        }
    }
}

//-------------------------------------------------------------------------

}  // namespace souk::shipping

//-------------------------------------------------------------------------
