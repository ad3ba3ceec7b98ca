/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "souk/pricing/PricingInput.hpp"

#include "souk/pricing/PricingErrors.hpp"

//-------------------------------------------------------------------------

namespace souk::pricing
{

//-------------------------------------------------------------------------

UpliftKind parseUpliftKind(std::string_view str)
{
    if (auto kind = magic_enum::enum_cast<UpliftKind>(str, magic_enum::case_insensitive)) {
        return *kind;
    }
    throw InvalidPricingInput{
        "parentUplift",
        fmt::format(
            "{}: Unknown uplift kind '{}', expected 'fixed' or 'percentage'",
            std::source_location::current().function_name(),
            str)};
}

}  // namespace souk::pricing

//-------------------------------------------------------------------------
