/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "souk/util/common.hpp"

#include <pugixml.hpp>

//-------------------------------------------------------------------------

namespace souk::pricing
{

//-------------------------------------------------------------------------

enum class RiskLevel : uint32_t
{
    LOW,
    MEDIUM,
    HIGH
};

//-------------------------------------------------------------------------

struct Category
{
    CategoryId id;
    decimal_t defaultUpliftRate;
    decimal_t minUpliftRate;
    decimal_t maxUpliftRate;
    RiskLevel risk = RiskLevel::MEDIUM;
};

//-------------------------------------------------------------------------

struct CategoryLookup
{
    virtual ~CategoryLookup() noexcept = default;

    [[nodiscard]] virtual std::optional<Category> find(std::string_view id) const = 0;
};

//-------------------------------------------------------------------------

class CategoryCatalog : public CategoryLookup
{
public:
    using ContainerType = std::map<CategoryId, Category, std::less<>>;

    CategoryCatalog() noexcept = default;

    [[nodiscard]] virtual std::optional<Category> find(std::string_view id) const override;

    void add(Category category);

    [[nodiscard]] bool contains(std::string_view id) const;
    [[nodiscard]] size_t size() const noexcept { return m_categories.size(); }
    [[nodiscard]] const ContainerType& categories() const noexcept { return m_categories; }

    [[nodiscard]] static CategoryCatalog fromXML(pugi::xml_node node);

private:
    ContainerType m_categories;
};

//-------------------------------------------------------------------------

}  // namespace souk::pricing

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<souk::pricing::RiskLevel>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(souk::pricing::RiskLevel risk, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", magic_enum::enum_name(risk));
    }
};

//-------------------------------------------------------------------------
