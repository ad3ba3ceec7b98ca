/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "souk/util/common.hpp"

//-------------------------------------------------------------------------

namespace souk::pricing
{

//-------------------------------------------------------------------------

enum class UpliftKind : uint32_t
{
    FIXED,
    PERCENTAGE
};

// Throws InvalidPricingInput on anything but "fixed" or "percentage" (any case).
[[nodiscard]] UpliftKind parseUpliftKind(std::string_view str);

//-------------------------------------------------------------------------

struct ParentUplift
{
    UpliftKind kind;
    // Currency amount for FIXED, fraction of the base price for PERCENTAGE.
    decimal_t value;
};

//-------------------------------------------------------------------------

struct PricingInput
{
    decimal_t vendorBasePrice;
    CategoryId categoryId;
    bool vendorVatRegistered{};
    bool vendorLegalized = true;
    std::optional<ParentUplift> parentUplift;
    // Replaces the category-derived commission rate entirely.
    std::optional<decimal_t> upliftOverride;
};

//-------------------------------------------------------------------------

}  // namespace souk::pricing

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<souk::pricing::UpliftKind>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(souk::pricing::UpliftKind kind, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", magic_enum::enum_name(kind));
    }
};

//-------------------------------------------------------------------------
