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

enum class BalanceStatus : uint32_t
{
    PENDING,
    AVAILABLE,
    WITHDRAWN
};

enum class TransactionType : uint32_t
{
    SALE,
    COMMISSION,
    VAT,
    SHIPPING,
    REFUND,
    PAYOUT
};

//-------------------------------------------------------------------------

template<typename E>
requires std::is_enum_v<E>
[[nodiscard]] E parseEnum(std::string_view name)
{
    if (auto val = magic_enum::enum_cast<E>(name, magic_enum::case_insensitive)) {
        return *val;
    }
    throw std::invalid_argument{fmt::format(
        "{}: Unknown {} '{}'",
        std::source_location::current().function_name(),
        magic_enum::enum_type_name<E>(),
        name)};
}

//-------------------------------------------------------------------------

}  // namespace souk::accounting

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<souk::accounting::BalanceStatus>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(souk::accounting::BalanceStatus status, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", magic_enum::enum_name(status));
    }
};

template<>
struct fmt::formatter<souk::accounting::TransactionType>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(souk::accounting::TransactionType type, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", magic_enum::enum_name(type));
    }
};

//-------------------------------------------------------------------------
