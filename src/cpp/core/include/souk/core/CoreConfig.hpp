/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "souk/config/PolicyConfig.hpp"
#include "souk/pricing/Category.hpp"
#include "souk/shipping/RateCardBook.hpp"

#include <spdlog/common.h>

//-------------------------------------------------------------------------

namespace souk::core
{

//-------------------------------------------------------------------------

struct LoggingConfig
{
    // Empty disables the ledger journal.
    fs::path directory;
    spdlog::level::level_enum level = spdlog::level::info;

    [[nodiscard]] static LoggingConfig fromXML(pugi::xml_node node);
};

//-------------------------------------------------------------------------

/**
 * Everything a deployment tunes without recompiling:
 *
 * <Souk>
 *   <Policy vatRate="0.14" escrowHoldDays="14" .../>
 *   <Categories>
 *     <Category id="fashion-apparel" defaultRate="0.22" minRate="0.22" maxRate="0.25" risk="HIGH"/>
 *   </Categories>
 *   <Shipping volumetricDivisor="5000" ...>
 *     <Zone id="cairo" estimatedDeliveryDays="2"/>
 *     <RateCard from="cairo" to="cairo" baseFee="35" perKgRate="8"/>
 *   </Shipping>
 *   <Logging directory="logs" level="info"/>
 * </Souk>
 */
struct CoreConfig
{
    config::PolicyConfig policy;
    pricing::CategoryCatalog categories;
    shipping::RateCardBook shipping;
    LoggingConfig logging;

    [[nodiscard]] static CoreConfig fromXML(pugi::xml_node node);
    [[nodiscard]] static CoreConfig fromXML(const fs::path& path);
};

//-------------------------------------------------------------------------

}  // namespace souk::core

//-------------------------------------------------------------------------
