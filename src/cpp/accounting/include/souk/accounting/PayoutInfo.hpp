/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "souk/util/common.hpp"

//-------------------------------------------------------------------------

namespace souk::accounting
{

//-------------------------------------------------------------------------

enum class PayoutErrorCode : uint32_t
{
    VALID,
    INVALID_AMOUNT,
    BELOW_MINIMUM_THRESHOLD,
    INSUFFICIENT_BALANCE
};

//-------------------------------------------------------------------------

struct PayoutInfo
{
    VendorId vendorId;
    decimal_t amount;
    decimal_t availableBalance;
    decimal_t minimumThreshold;
    PayoutErrorCode status;

    [[nodiscard]] bool valid() const noexcept { return status == PayoutErrorCode::VALID; }
    [[nodiscard]] std::string toString() const;
};

//-------------------------------------------------------------------------

}  // namespace souk::accounting

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<souk::accounting::PayoutErrorCode>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(souk::accounting::PayoutErrorCode ec, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", magic_enum::enum_name(ec));
    }
};

//-------------------------------------------------------------------------
