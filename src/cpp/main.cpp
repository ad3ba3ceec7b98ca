/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "souk/core/FinancialCore.hpp"
#include "souk/logging/logging.hpp"

#include <CLI/CLI.hpp>

using namespace souk;

//-------------------------------------------------------------------------

namespace
{

const json::FormatOptions kPrettyPrint{.indent = json::IndentOptions{}};

void printJson(const json::IsJsonSerializable auto& serializable)
{
    fmt::print("{}\n", json::jsonSerializable2str(serializable, kPrettyPrint));
}

std::optional<decimal_t> optionalDecimal(const std::optional<std::string>& str)
{
    return str.transform([](const std::string& s) { return util::str2decimal(s); });
}

}  // namespace

//-------------------------------------------------------------------------

int main(int argc, char* argv[])
{
    CLI::App app{"souk: marketplace pricing, escrow and payout core"};
    app.require_subcommand(1);

    fs::path configFile;
    app.add_option("-f,--config-file", configFile, "Marketplace configuration file")
        ->check(CLI::ExistingFile);

    auto price = app.add_subcommand("price", "Price a line item");
    std::string basePrice, category;
    bool vatRegistered{}, nonLegalized{}, friendly{};
    std::optional<std::string> parentUpliftKind, parentUplift, upliftOverride;
    price->add_option("--base-price", basePrice, "Vendor base price")->required();
    price->add_option("--category", category, "Category identifier")->required();
    price->add_flag("--vat-registered", vatRegistered, "Vendor is VAT-registered");
    price->add_flag("--non-legalized", nonLegalized, "Vendor transacts through the cooperative");
    auto optUpliftKind = price->add_option(
        "--parent-uplift-kind", parentUpliftKind, "Parent vendor uplift kind (fixed|percentage)");
    price->add_option("--parent-uplift", parentUplift, "Parent vendor uplift value")
        ->needs(optUpliftKind);
    price->add_option("--uplift-override", upliftOverride, "Commission rate override");
    price->add_flag("--friendly", friendly, "Also print the customer-friendly display price");

    auto ship = app.add_subcommand("shipping", "Quote a shipping fee");
    std::string weight, length, width, height;
    ZoneId fromZone, toZone;
    ship->add_option("--weight", weight, "Actual weight in kg")->required();
    ship->add_option("--length", length, "Length in cm")->required();
    ship->add_option("--width", width, "Width in cm")->required();
    ship->add_option("--height", height, "Height in cm")->required();
    ship->add_option("--from", fromZone, "Origin zone")->required();
    ship->add_option("--to", toZone, "Destination zone")->required();

    auto escrowCmd = app.add_subcommand("escrow", "Compute the escrow release of a delivery");
    std::string deliveryDate;
    escrowCmd->add_option("--delivery-date", deliveryDate, "Delivery date (ISO-8601, UTC)")
        ->required();

    auto deviationCmd = app.add_subcommand("deviation", "Check a price against its benchmark");
    std::string observedPrice, benchmark;
    std::optional<std::string> threshold;
    deviationCmd->add_option("--price", observedPrice, "Observed price")->required();
    deviationCmd->add_option("--benchmark", benchmark, "Category benchmark price")->required();
    deviationCmd->add_option("--threshold", threshold, "Flagging threshold");

    CLI11_PARSE(app, argc, argv);

    try {
        core::FinancialCore financialCore{
            !configFile.empty() ? core::CoreConfig::fromXML(configFile) : core::CoreConfig{}};

        if (*price) {
            const pricing::PricingInput input{
                .vendorBasePrice = util::str2decimal(basePrice),
                .categoryId = category,
                .vendorVatRegistered = vatRegistered,
                .vendorLegalized = !nonLegalized,
                .parentUplift = parentUpliftKind.transform([&](const std::string& kind) {
                    return pricing::ParentUplift{
                        .kind = pricing::parseUpliftKind(kind),
                        .value = util::str2decimal(parentUplift.value_or("0"))
                    };
                }),
                .upliftOverride = optionalDecimal(upliftOverride)
            };
            const auto breakdown = financialCore.pricing().calculatePrice(input);
            printJson(breakdown);
            if (friendly) {
                fmt::print(
                    "Display price: {}\n",
                    financialCore.pricing().friendlyPrice(breakdown.finalPrice));
            }
        }
        else if (*ship) {
            printJson(financialCore.shipping().calculateShippingFee({
                .actualWeightKg = util::str2decimal(weight),
                .lengthCm = util::str2decimal(length),
                .widthCm = util::str2decimal(width),
                .heightCm = util::str2decimal(height),
                .originZone = fromZone,
                .destinationZone = toZone
            }));
        }
        else if (*escrowCmd) {
            const auto result =
                financialCore.escrow().computeRelease(util::parseTimestamp(deliveryDate));
            rapidjson::Document json;
            result.jsonSerialize(json, financialCore.clock().now());
            fmt::print("{}\n", json::json2str(json, kPrettyPrint));
        }
        else if (*deviationCmd) {
            printJson(financialCore.deviation().checkDeviation(
                util::str2decimal(observedPrice),
                util::str2decimal(benchmark),
                optionalDecimal(threshold)));
        }
    }
    catch (const std::exception& e) {
        logging::logger()->error("{}", e.what());
        return 1;
    }

    return 0;
}

//-------------------------------------------------------------------------
