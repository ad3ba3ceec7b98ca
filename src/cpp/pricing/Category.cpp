/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "souk/pricing/Category.hpp"

#include "souk/config/PolicyConfig.hpp"

//-------------------------------------------------------------------------

namespace souk::pricing
{

//-------------------------------------------------------------------------

std::optional<Category> CategoryCatalog::find(std::string_view id) const
{
    if (auto it = m_categories.find(id); it != m_categories.end()) {
        return it->second;
    }
    return std::nullopt;
}

//-------------------------------------------------------------------------

void CategoryCatalog::add(Category category)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (category.id.empty()) {
        throw std::invalid_argument{fmt::format("{}: Category id cannot be empty", ctx)};
    }

    category.defaultUpliftRate =
        config::checkRate(category.defaultUpliftRate, "defaultUpliftRate");
    category.minUpliftRate = config::checkRate(category.minUpliftRate, "minUpliftRate");
    category.maxUpliftRate = config::checkRate(category.maxUpliftRate, "maxUpliftRate");

    if (!(category.minUpliftRate <= category.defaultUpliftRate
        && category.defaultUpliftRate <= category.maxUpliftRate)) {
        throw std::invalid_argument{fmt::format(
            "{}: Category '{}' default uplift {} lies outside [{}, {}]",
            ctx,
            category.id,
            category.defaultUpliftRate,
            category.minUpliftRate,
            category.maxUpliftRate)};
    }

    if (!m_categories.emplace(category.id, category).second) {
        throw std::invalid_argument{fmt::format(
            "{}: Duplicate category '{}'", ctx, category.id)};
    }
}

//-------------------------------------------------------------------------

bool CategoryCatalog::contains(std::string_view id) const
{
    return m_categories.contains(id);
}

//-------------------------------------------------------------------------

CategoryCatalog CategoryCatalog::fromXML(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    auto getAttr = [](pugi::xml_node node, const char* name) {
        if (pugi::xml_attribute attr = node.attribute(name)) {
            return attr;
        }
        throw std::invalid_argument{fmt::format(
            "{}: Missing required argument '{}'", ctx, name)};
    };

    CategoryCatalog catalog;
    for (pugi::xml_node categoryNode : node.children("Category")) {
        const auto defaultRate = util::str2decimal(getAttr(categoryNode, "defaultRate").as_string());
        const auto risk = [&] {
            const std::string_view name = categoryNode.attribute("risk").as_string("MEDIUM");
            if (auto risk = magic_enum::enum_cast<RiskLevel>(
                    name, magic_enum::case_insensitive)) {
                return *risk;
            }
            throw std::invalid_argument{fmt::format(
                "{}: Unknown risk level '{}'", ctx, name)};
        }();
        catalog.add({
            .id = getAttr(categoryNode, "id").as_string(),
            .defaultUpliftRate = defaultRate,
            .minUpliftRate = config::decimalAttribute(categoryNode, "minRate", defaultRate),
            .maxUpliftRate = config::decimalAttribute(categoryNode, "maxRate", defaultRate),
            .risk = risk
        });
    }
    return catalog;
}

//-------------------------------------------------------------------------

}  // namespace souk::pricing

//-------------------------------------------------------------------------
