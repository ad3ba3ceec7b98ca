/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "souk/config/PolicyConfig.hpp"
#include "souk/pricing/Category.hpp"
#include "souk/pricing/PricingBreakdown.hpp"
#include "souk/pricing/PricingErrors.hpp"
#include "souk/pricing/PricingInput.hpp"

//-------------------------------------------------------------------------

namespace souk::pricing
{

//-------------------------------------------------------------------------

/**
 * Turns a vendor's quoted price into the customer-facing price and its four
 * revenue buckets. Vendor prices are never reduced: every fee is an uplift on
 * top of the quote.
 *
 * Stateless apart from the injected policy; safe to share between threads as
 * long as the category lookup is.
 */
class PricingCalculator
{
public:
    PricingCalculator(const config::PolicyConfig& policy, const CategoryLookup* categories) noexcept;

    [[nodiscard]] const config::PolicyConfig& policy() const noexcept { return m_policy; }

    // Throws InvalidPricingInput.
    [[nodiscard]] PricingBreakdown calculatePrice(const PricingInput& input) const;

    // Customer-friendly display price: rounded up to the configured increment.
    [[nodiscard]] decimal_t friendlyPrice(decimal_t price) const;

private:
    [[nodiscard]] Category validate(const PricingInput& input) const;

    [[nodiscard]] decimal_t cooperativeFee(const PricingInput& input) const noexcept;
    [[nodiscard]] decimal_t parentUpliftAmount(const PricingInput& input) const noexcept;
    [[nodiscard]] decimal_t commissionRate(
        const PricingInput& input, const Category& category) const noexcept;
    [[nodiscard]] decimal_t marketplaceUplift(
        const PricingInput& input, decimal_t parentUplift, decimal_t rate) const noexcept;
    [[nodiscard]] decimal_t roundMoney(decimal_t amount) const;

    config::PolicyConfig m_policy;
    const CategoryLookup* m_categories;
};

//-------------------------------------------------------------------------

}  // namespace souk::pricing

//-------------------------------------------------------------------------
