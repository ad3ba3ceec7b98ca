/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "souk/config/PolicyConfig.hpp"
#include "souk/shipping/RateCardBook.hpp"
#include "souk/util/JsonSerializable.hpp"

//-------------------------------------------------------------------------

namespace souk::shipping
{

//-------------------------------------------------------------------------

class InvalidShippingInput : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

//-------------------------------------------------------------------------

struct ShippingInput
{
    decimal_t actualWeightKg;
    decimal_t lengthCm;
    decimal_t widthCm;
    decimal_t heightCm;
    ZoneId originZone;
    ZoneId destinationZone;
};

//-------------------------------------------------------------------------

struct ShippingQuote
{
    decimal_t actualWeightKg;
    decimal_t volumetricWeightKg;
    decimal_t chargeableWeightKg;
    decimal_t baseFee;
    decimal_t extraWeightFee;
    decimal_t totalFee;
    decimal_t platformSubsidy;
    decimal_t customerFee;
    uint32_t estimatedDeliveryDays;

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;
};

//-------------------------------------------------------------------------

class ShippingCalculator
{
public:
    ShippingCalculator(const config::PolicyConfig& policy, const RateCardBook* rateCards) noexcept;

    // Throws InvalidShippingInput.
    [[nodiscard]] ShippingQuote calculateShippingFee(const ShippingInput& input) const;

    [[nodiscard]] decimal_t volumetricWeight(const ShippingInput& input) const;

private:
    void validate(const ShippingInput& input) const;

    config::PolicyConfig m_policy;
    const RateCardBook* m_rateCards;
};

//-------------------------------------------------------------------------

}  // namespace souk::shipping

//-------------------------------------------------------------------------
