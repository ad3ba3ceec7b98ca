/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "souk/pricing/PricingBreakdown.hpp"

//-------------------------------------------------------------------------

namespace souk::pricing
{

//-------------------------------------------------------------------------

void PricingBreakdown::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        json::addDecimalMember(json, "basePrice", basePrice);
        json::addDecimalMember(json, "cooperativeFee", cooperativeFee);
        json::addDecimalMember(json, "parentUpliftAmount", parentUpliftAmount);
        json::addDecimalMember(json, "marketplaceUplift", marketplaceUplift);
        json::addDecimalMember(json, "logisticsSurcharge", logisticsSurcharge);
        json::serializeHelper(
            json,
            "buckets",
            [this](rapidjson::Document& json) {
                json.SetObject();
                json::addDecimalMember(json, "vendorRevenue", bucketA);
                json::addDecimalMember(json, "vendorVat", bucketB);
                json::addDecimalMember(json, "platformRevenue", bucketC);
                json::addDecimalMember(json, "platformVat", bucketD);
            });
        json::addDecimalMember(json, "finalPrice", finalPrice);
        json::addDecimalMember(json, "vendorNetPayout", vendorNetPayout);
        json::addDecimalMember(json, "commissionRate", commissionRate);
        json::addDecimalMember(json, "vatRate", vatRate);
        json::addDecimalMember(json, "totalVat", totalVat);
        json::addDecimalMember(json, "platformMargin", platformMargin);
        json::addDecimalMember(json, "marginPercent", marginPercent);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace souk::pricing

//-------------------------------------------------------------------------
