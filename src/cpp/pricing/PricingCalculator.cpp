/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "souk/pricing/PricingCalculator.hpp"

//-------------------------------------------------------------------------

namespace souk::pricing
{

//-------------------------------------------------------------------------

PricingCalculator::PricingCalculator(
    const config::PolicyConfig& policy, const CategoryLookup* categories) noexcept
    : m_policy{policy},
      m_categories{categories}
{}

//-------------------------------------------------------------------------

PricingBreakdown PricingCalculator::calculatePrice(const PricingInput& input) const
{
    const Category category = validate(input);

    const decimal_t basePrice = input.vendorBasePrice;
    const decimal_t coopFee = cooperativeFee(input);
    const decimal_t parentUplift = parentUpliftAmount(input);
    const decimal_t rate = commissionRate(input, category);
    const decimal_t uplift = marketplaceUplift(input, parentUplift, rate);
    const decimal_t logistics = m_policy.logisticsSurcharge;

    // Rounding happens once per bucket; the components above stay exact.
    const decimal_t bucketA = roundMoney(basePrice + parentUplift);
    const decimal_t bucketB =
        input.vendorVatRegistered ? roundMoney(bucketA * m_policy.vatRate) : 0_dec;
    const decimal_t bucketC = roundMoney(coopFee + uplift + logistics);
    const decimal_t bucketD = roundMoney(bucketC * m_policy.vatRate);

    const decimal_t finalPrice = bucketA + bucketB + bucketC + bucketD;

    return {
        .basePrice = basePrice,
        .cooperativeFee = roundMoney(coopFee),
        .parentUpliftAmount = roundMoney(parentUplift),
        .marketplaceUplift = roundMoney(uplift),
        .logisticsSurcharge = logistics,
        .bucketA = bucketA,
        .bucketB = bucketB,
        .bucketC = bucketC,
        .bucketD = bucketD,
        .finalPrice = finalPrice,
        .vendorNetPayout = bucketA + bucketB,
        .commissionRate = rate,
        .vatRate = m_policy.vatRate,
        .totalVat = bucketB + bucketD,
        .platformMargin = bucketC,
        .marginPercent =
            finalPrice > 0_dec ? roundMoney(bucketC / finalPrice * 100_dec) : 0_dec
    };
}

//-------------------------------------------------------------------------

decimal_t PricingCalculator::friendlyPrice(decimal_t price) const
{
    if (price < 0_dec) {
        throw InvalidPricingInput{
            "price",
            fmt::format(
                "{}: Price cannot be negative, was {}",
                std::source_location::current().function_name(),
                price)};
    }
    return util::ceilToMultiple(price, m_policy.friendlyPriceIncrement);
}

//-------------------------------------------------------------------------

Category PricingCalculator::validate(const PricingInput& input) const
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (!(input.vendorBasePrice > 0_dec)) {
        throw InvalidPricingInput{
            "vendorBasePrice",
            fmt::format("{}: Vendor base price must be positive, was {}",
                ctx, input.vendorBasePrice)};
    }

    if (input.parentUplift.has_value()) {
        const auto [kind, value] = input.parentUplift.value();
        if (value < 0_dec) {
            throw InvalidPricingInput{
                "parentUplift",
                fmt::format("{}: Parent uplift cannot be negative, was {} ({})",
                    ctx, value, kind)};
        }
        if (kind == UpliftKind::PERCENTAGE && value > 1_dec) {
            throw InvalidPricingInput{
                "parentUplift",
                fmt::format("{}: Percentage parent uplift is a fraction within [0, 1], was {}",
                    ctx, value)};
        }
    }

    if (input.upliftOverride.has_value()) {
        const decimal_t rate = input.upliftOverride.value();
        if (rate < 0_dec || rate > 1_dec) {
            throw InvalidPricingInput{
                "upliftOverride",
                fmt::format("{}: Uplift override must lie within [0, 1], was {}", ctx, rate)};
        }
    }

    auto category = m_categories->find(input.categoryId);
    if (!category.has_value()) {
        throw InvalidPricingInput{
            "categoryId",
            fmt::format("{}: Unknown category '{}'", ctx, input.categoryId)};
    }
    return category.value();
}

//-------------------------------------------------------------------------

decimal_t PricingCalculator::cooperativeFee(const PricingInput& input) const noexcept
{
    return input.vendorLegalized ? 0_dec : input.vendorBasePrice * m_policy.cooperativeFeeRate;
}

//-------------------------------------------------------------------------

decimal_t PricingCalculator::parentUpliftAmount(const PricingInput& input) const noexcept
{
    if (!input.parentUplift.has_value()) {
        return 0_dec;
    }
    const auto& [kind, value] = input.parentUplift.value();
    switch (kind) {
        case UpliftKind::FIXED:
            return value;
        case UpliftKind::PERCENTAGE:
            return input.vendorBasePrice * value;
        default:
            std::unreachable();
    }
}

//-------------------------------------------------------------------------

decimal_t PricingCalculator::commissionRate(
    const PricingInput& input, const Category& category) const noexcept
{
    return input.upliftOverride.value_or(category.defaultUpliftRate);
}

//-------------------------------------------------------------------------

decimal_t PricingCalculator::marketplaceUplift(
    const PricingInput& input, decimal_t parentUplift, decimal_t rate) const noexcept
{
    decimal_t uplift = (input.vendorBasePrice + parentUplift) * rate;

    if (input.upliftOverride.has_value()) {
        return uplift;
    }
    if (m_policy.minimumFixedUplift > 0_dec) {
        uplift = util::max(uplift, m_policy.minimumFixedUplift);
    }
    if (m_policy.lowPriceThreshold > 0_dec && input.vendorBasePrice < m_policy.lowPriceThreshold) {
        uplift = util::max(uplift, m_policy.lowPriceFixedMarkup);
    }
    return uplift;
}

//-------------------------------------------------------------------------

decimal_t PricingCalculator::roundMoney(decimal_t amount) const
{
    return util::round(amount, m_policy.roundingDecimals);
}

//-------------------------------------------------------------------------

}  // namespace souk::pricing

//-------------------------------------------------------------------------
