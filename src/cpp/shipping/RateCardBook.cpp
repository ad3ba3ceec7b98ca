/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "souk/shipping/RateCardBook.hpp"

#include "souk/config/PolicyConfig.hpp"

//-------------------------------------------------------------------------

namespace souk::shipping
{

//-------------------------------------------------------------------------

ShippingPolicy ShippingPolicy::fromXML(pugi::xml_node node)
{
    static constexpr auto sl = std::source_location::current();

    const ShippingPolicy defaults;

    return {
        .volumetricDivisor = config::checkPositive(
            config::decimalAttribute(node, "volumetricDivisor", defaults.volumetricDivisor),
            "volumetricDivisor",
            sl),
        .baseWeightKg = config::checkNonNegative(
            config::decimalAttribute(node, "baseWeightKg", defaults.baseWeightKg),
            "baseWeightKg",
            sl),
        .defaultBaseFee = config::checkNonNegative(
            config::decimalAttribute(node, "defaultBaseFee", defaults.defaultBaseFee),
            "defaultBaseFee",
            sl),
        .defaultPerKgRate = config::checkNonNegative(
            config::decimalAttribute(node, "defaultPerKgRate", defaults.defaultPerKgRate),
            "defaultPerKgRate",
            sl),
        .maxSubsidyRate = config::checkRate(
            config::decimalAttribute(node, "maxSubsidyRate", defaults.maxSubsidyRate),
            "maxSubsidyRate",
            sl)
    };
}

//-------------------------------------------------------------------------

RateCardBook::RateCardBook(ShippingPolicy policy) noexcept
    : m_policy{std::move(policy)}
{}

//-------------------------------------------------------------------------

void RateCardBook::addZone(ShippingZone zone)
{
    if (zone.id.empty()) {
        throw std::invalid_argument{fmt::format(
            "{}: Zone id cannot be empty", std::source_location::current().function_name())};
    }
    const ZoneId id = zone.id;
    if (!m_zones.emplace(id, std::move(zone)).second) {
        throw std::invalid_argument{fmt::format(
            "{}: Duplicate zone '{}'", std::source_location::current().function_name(), id)};
    }
}

//-------------------------------------------------------------------------

void RateCardBook::addRateCard(RateCard card)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    for (const auto& zoneId : {card.originZone, card.destinationZone}) {
        if (!m_zones.contains(zoneId)) {
            throw std::invalid_argument{fmt::format(
                "{}: Rate card refers to unknown zone '{}'", ctx, zoneId)};
        }
    }
    card.baseFee = config::checkNonNegative(card.baseFee, "baseFee");
    card.perKgRate = config::checkNonNegative(card.perKgRate, "perKgRate");
    m_rateCards.push_back(std::move(card));
}

//-------------------------------------------------------------------------

std::optional<ShippingZone> RateCardBook::zone(std::string_view id) const
{
    if (auto it = m_zones.find(id); it != m_zones.end()) {
        return it->second;
    }
    return std::nullopt;
}

//-------------------------------------------------------------------------

std::optional<RateCard> RateCardBook::rateCard(
    std::string_view originZone, std::string_view destinationZone) const
{
    auto matching = m_rateCards | views::filter([&](const RateCard& card) {
        return card.active
            && card.originZone == originZone
            && card.destinationZone == destinationZone;
    });
    if (auto it = ranges::begin(matching); it != ranges::end(matching)) {
        return *it;
    }
    return std::nullopt;
}

//-------------------------------------------------------------------------

RateCardBook RateCardBook::fromXML(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    auto getAttr = [](pugi::xml_node node, const char* name) {
        if (pugi::xml_attribute attr = node.attribute(name)) {
            return attr;
        }
        throw std::invalid_argument{fmt::format(
            "{}: Missing required argument '{}'", ctx, name)};
    };

    RateCardBook book{ShippingPolicy::fromXML(node)};

    for (pugi::xml_node zoneNode : node.children("Zone")) {
        const std::string id = getAttr(zoneNode, "id").as_string();
        book.addZone({
            .id = id,
            .name = zoneNode.attribute("name").as_string(id.c_str()),
            .estimatedDeliveryDays = zoneNode.attribute("estimatedDeliveryDays").as_uint(3)
        });
    }

    for (pugi::xml_node cardNode : node.children("RateCard")) {
        book.addRateCard({
            .originZone = getAttr(cardNode, "from").as_string(),
            .destinationZone = getAttr(cardNode, "to").as_string(),
            .baseFee = util::str2decimal(getAttr(cardNode, "baseFee").as_string()),
            .perKgRate = util::str2decimal(getAttr(cardNode, "perKgRate").as_string()),
            .active = cardNode.attribute("active").as_bool(true)
        });
    }

    return book;
}

//-------------------------------------------------------------------------

}  // namespace souk::shipping

//-------------------------------------------------------------------------
