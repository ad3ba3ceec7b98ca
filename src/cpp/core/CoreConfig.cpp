/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "souk/core/CoreConfig.hpp"

#include "souk/logging/logging.hpp"

//-------------------------------------------------------------------------

namespace souk::core
{

//-------------------------------------------------------------------------

LoggingConfig LoggingConfig::fromXML(pugi::xml_node node)
{
    return {
        .directory = node.attribute("directory").as_string(),
        .level = logging::parseLevel(node.attribute("level").as_string("info"))
    };
}

//-------------------------------------------------------------------------

CoreConfig CoreConfig::fromXML(pugi::xml_node node)
{
    return {
        .policy = config::makePolicyConfig(node.child("Policy")),
        .categories = pricing::CategoryCatalog::fromXML(node.child("Categories")),
        .shipping = shipping::RateCardBook::fromXML(node.child("Shipping")),
        .logging = LoggingConfig::fromXML(node.child("Logging"))
    };
}

//-------------------------------------------------------------------------

CoreConfig CoreConfig::fromXML(const fs::path& path)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(path.c_str());
    if (!result) {
        throw std::invalid_argument{fmt::format(
            "{}: Unable to load '{}': {} at offset {}",
            ctx,
            path.string(),
            result.description(),
            result.offset)};
    }
    pugi::xml_node node = doc.child("Souk");
    if (!node) {
        throw std::invalid_argument{fmt::format(
            "{}: '{}' has no <Souk> root element", ctx, path.string())};
    }
    auto config = fromXML(node);
    logging::logger()->info(
        "Loaded '{}' with {} categories and {} shipping zones",
        path.string(),
        config.categories.size(),
        config.shipping.zones().size());
    return config;
}

//-------------------------------------------------------------------------

}  // namespace souk::core

//-------------------------------------------------------------------------
