/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "souk/util/JsonSerializable.hpp"
#include "souk/util/common.hpp"

//-------------------------------------------------------------------------

namespace souk::pricing
{

//-------------------------------------------------------------------------

struct PricingBreakdown
{
    decimal_t basePrice;
    decimal_t cooperativeFee;
    decimal_t parentUpliftAmount;
    decimal_t marketplaceUplift;
    decimal_t logisticsSurcharge;

    // A: vendor revenue, B: vendor VAT, C: platform revenue, D: platform VAT.
    decimal_t bucketA;
    decimal_t bucketB;
    decimal_t bucketC;
    decimal_t bucketD;

    decimal_t finalPrice;
    decimal_t vendorNetPayout;
    decimal_t commissionRate;
    decimal_t vatRate;
    decimal_t totalVat;
    decimal_t platformMargin;
    decimal_t marginPercent;

    [[nodiscard]] decimal_t bucketSum() const noexcept { return bucketA + bucketB + bucketC + bucketD; }

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;
};

//-------------------------------------------------------------------------

}  // namespace souk::pricing

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<souk::pricing::PricingBreakdown>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const souk::pricing::PricingBreakdown& breakdown, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "{} = A {} + B {} + C {} + D {}",
            breakdown.finalPrice,
            breakdown.bucketA,
            breakdown.bucketB,
            breakdown.bucketC,
            breakdown.bucketD);
    }
};

//-------------------------------------------------------------------------
