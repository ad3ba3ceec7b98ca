/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <bdldfp_decimal.h>
#include <bdldfp_decimalutil.h>
#include <fmt/format.h>

#include <cstdint>
#include <source_location>
#include <spanstream>
#include <stdexcept>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

#define DEC(lit) BDLDFP_DECIMAL_DD(lit)

//-------------------------------------------------------------------------

namespace souk
{

using decimal_t = BloombergLP::bdldfp::Decimal64;

}  // namespace souk

//-------------------------------------------------------------------------

namespace souk::util
{

inline constexpr uint32_t kMoneyDecimalPlaces = 2;

// Half-way cases are rounded away from zero.
[[nodiscard]] inline decimal_t round(
    decimal_t val, uint32_t decimalPlaces = kMoneyDecimalPlaces)
{
    return BloombergLP::bdldfp::DecimalUtil::round(val, decimalPlaces);
}

[[nodiscard]] inline decimal_t ceil(decimal_t val)
{
    return BloombergLP::bdldfp::DecimalUtil::ceil(val);
}

[[nodiscard]] inline decimal_t ceilToMultiple(decimal_t val, decimal_t increment)
{
    return ceil(val / increment) * increment;
}

[[nodiscard]] inline decimal_t str2decimal(std::string_view str)
{
    decimal_t val;
    const std::string buf{str};
    if (BloombergLP::bdldfp::DecimalUtil::parseDecimal64(&val, buf.c_str()) != 0
        || BloombergLP::bdldfp::DecimalUtil::isNan(val)
        || BloombergLP::bdldfp::DecimalUtil::isInf(val)) {
        throw std::invalid_argument{fmt::format(
            "{}: '{}' is not a decimal number",
            std::source_location::current().function_name(),
            str)};
    }
    return val;
}

[[nodiscard]] inline decimal_t abs(decimal_t val) noexcept
{
    return val < decimal_t{} ? -val : val;
}

[[nodiscard]] inline decimal_t max(decimal_t lhs, decimal_t rhs) noexcept
{
    return lhs < rhs ? rhs : lhs;
}

}  // namespace souk::util

//-------------------------------------------------------------------------

namespace souk::literals
{

[[nodiscard]] constexpr decimal_t operator"" _dec(unsigned long long int val)
{
    return decimal_t{val};
}

}  // namespace souk::literals

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<souk::decimal_t>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(souk::decimal_t val, FormatContext& ctx) const
    {
        using namespace souk::literals;
        char buf[32]{};
        std::ospanstream oss{buf};
        if (val == 0_dec) [[unlikely]] {
            oss << "0.00";
        } else {
            oss << val;
        }
        return fmt::format_to(ctx.out(), "{}", buf);
    }
};

//-------------------------------------------------------------------------
