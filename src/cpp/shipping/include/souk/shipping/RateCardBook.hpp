/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "souk/util/common.hpp"

#include <pugixml.hpp>

//-------------------------------------------------------------------------

namespace souk::shipping
{

//-------------------------------------------------------------------------

struct ShippingZone
{
    ZoneId id;
    std::string name;
    uint32_t estimatedDeliveryDays = 3;
};

//-------------------------------------------------------------------------

struct RateCard
{
    ZoneId originZone;
    ZoneId destinationZone;
    decimal_t baseFee;
    decimal_t perKgRate;
    bool active = true;
};

//-------------------------------------------------------------------------

struct ShippingPolicy
{
    decimal_t volumetricDivisor = DEC(5000);
    decimal_t baseWeightKg = DEC(2);
    decimal_t defaultBaseFee = DEC(45);
    decimal_t defaultPerKgRate = DEC(10);
    // Largest share of the fee the platform absorbs; customers pay the full fee at 0.
    decimal_t maxSubsidyRate = DEC(0);

    [[nodiscard]] static ShippingPolicy fromXML(pugi::xml_node node);
};

//-------------------------------------------------------------------------

class RateCardBook
{
public:
    RateCardBook() noexcept = default;
    explicit RateCardBook(ShippingPolicy policy) noexcept;

    [[nodiscard]] const ShippingPolicy& policy() const noexcept { return m_policy; }
    [[nodiscard]] const std::map<ZoneId, ShippingZone, std::less<>>& zones() const noexcept
    {
        return m_zones;
    }
    [[nodiscard]] const std::vector<RateCard>& rateCards() const noexcept { return m_rateCards; }

    void addZone(ShippingZone zone);
    void addRateCard(RateCard card);

    [[nodiscard]] std::optional<ShippingZone> zone(std::string_view id) const;
    // First active card for the ordered zone pair.
    [[nodiscard]] std::optional<RateCard> rateCard(
        std::string_view originZone, std::string_view destinationZone) const;

    [[nodiscard]] static RateCardBook fromXML(pugi::xml_node node);

private:
    ShippingPolicy m_policy;
    std::map<ZoneId, ShippingZone, std::less<>> m_zones;
    std::vector<RateCard> m_rateCards;
};

//-------------------------------------------------------------------------

}  // namespace souk::shipping

//-------------------------------------------------------------------------
