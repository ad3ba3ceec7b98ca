/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "souk/pricing/PricingCalculator.hpp"
#include "test-common/formatting.hpp"
#include "test-common/mocks.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace souk;
using namespace souk::literals;
using namespace souk::pricing;

using namespace testing;

//-------------------------------------------------------------------------

namespace
{

CategoryCatalog makeCatalog()
{
    CategoryCatalog catalog;
    catalog.add({
        .id = "home-decor-fragile",
        .defaultUpliftRate = DEC(0.25),
        .minUpliftRate = DEC(0.25),
        .maxUpliftRate = DEC(0.30),
        .risk = RiskLevel::HIGH
    });
    catalog.add({
        .id = "leather-goods",
        .defaultUpliftRate = DEC(0.20),
        .minUpliftRate = DEC(0.20),
        .maxUpliftRate = DEC(0.20)
    });
    catalog.add({
        .id = "food-essentials",
        .defaultUpliftRate = DEC(0.12),
        .minUpliftRate = DEC(0.10),
        .maxUpliftRate = DEC(0.15),
        .risk = RiskLevel::LOW
    });
    return catalog;
}

}  // namespace

//-------------------------------------------------------------------------

struct PricingCalculatorTest : Test
{
    config::PolicyConfig policy;
    CategoryCatalog catalog = makeCatalog();
    PricingCalculator calculator{policy, &catalog};
};

TEST_F(PricingCalculatorTest, LegalizedVatRegisteredVendor)
{
    const auto breakdown = calculator.calculatePrice({
        .vendorBasePrice = 500_dec,
        .categoryId = "home-decor-fragile",
        .vendorVatRegistered = true,
        .vendorLegalized = true
    });

    EXPECT_EQ(breakdown.basePrice, 500_dec);
    EXPECT_EQ(breakdown.cooperativeFee, 0_dec);
    EXPECT_EQ(breakdown.parentUpliftAmount, 0_dec);
    EXPECT_EQ(breakdown.marketplaceUplift, 125_dec);
    EXPECT_EQ(breakdown.logisticsSurcharge, 10_dec);
    EXPECT_EQ(breakdown.bucketA, 500_dec);
    EXPECT_EQ(breakdown.bucketB, 70_dec);
    EXPECT_EQ(breakdown.bucketC, 135_dec);
    EXPECT_EQ(breakdown.bucketD, DEC(18.9));
    EXPECT_EQ(breakdown.finalPrice, DEC(723.9));
    EXPECT_EQ(breakdown.vendorNetPayout, 570_dec);
    EXPECT_EQ(breakdown.commissionRate, DEC(0.25));
    EXPECT_EQ(breakdown.vatRate, DEC(0.14));
    EXPECT_EQ(breakdown.totalVat, DEC(88.9));
    EXPECT_EQ(breakdown.platformMargin, 135_dec);
    EXPECT_EQ(breakdown.marginPercent, DEC(18.65));
}

TEST_F(PricingCalculatorTest, NonLegalizedUnregisteredVendor)
{
    const auto breakdown = calculator.calculatePrice({
        .vendorBasePrice = 500_dec,
        .categoryId = "home-decor-fragile",
        .vendorVatRegistered = false,
        .vendorLegalized = false
    });

    EXPECT_EQ(breakdown.cooperativeFee, 25_dec);
    EXPECT_EQ(breakdown.bucketA, 500_dec);
    EXPECT_EQ(breakdown.bucketB, 0_dec);
    EXPECT_EQ(breakdown.bucketC, 160_dec);
    EXPECT_EQ(breakdown.bucketD, DEC(22.4));
    EXPECT_EQ(breakdown.finalPrice, DEC(682.4));
    EXPECT_EQ(breakdown.vendorNetPayout, 500_dec);
    EXPECT_EQ(breakdown.totalVat, DEC(22.4));
    EXPECT_EQ(breakdown.marginPercent, DEC(23.45));
}

TEST_F(PricingCalculatorTest, PercentageParentUplift)
{
    const auto breakdown = calculator.calculatePrice({
        .vendorBasePrice = 200_dec,
        .categoryId = "leather-goods",
        .parentUplift = ParentUplift{.kind = UpliftKind::PERCENTAGE, .value = DEC(0.10)}
    });

    EXPECT_EQ(breakdown.parentUpliftAmount, 20_dec);
    EXPECT_EQ(breakdown.bucketA, 220_dec);
    EXPECT_EQ(breakdown.marketplaceUplift, 44_dec);
    EXPECT_EQ(breakdown.bucketC, 54_dec);
    EXPECT_EQ(breakdown.bucketD, DEC(7.56));
    EXPECT_EQ(breakdown.finalPrice, DEC(281.56));
}

TEST_F(PricingCalculatorTest, FixedParentUplift)
{
    const auto breakdown = calculator.calculatePrice({
        .vendorBasePrice = 100_dec,
        .categoryId = "food-essentials",
        .parentUplift = ParentUplift{.kind = UpliftKind::FIXED, .value = 30_dec}
    });

    EXPECT_EQ(breakdown.parentUpliftAmount, 30_dec);
    EXPECT_EQ(breakdown.bucketA, 130_dec);
    EXPECT_EQ(breakdown.marketplaceUplift, DEC(15.6));
    EXPECT_EQ(breakdown.bucketC, DEC(25.6));
    EXPECT_EQ(breakdown.bucketD, DEC(3.58));
    EXPECT_EQ(breakdown.finalPrice, DEC(159.18));
}

TEST_F(PricingCalculatorTest, OverrideReplacesCategoryRate)
{
    const auto breakdown = calculator.calculatePrice({
        .vendorBasePrice = 100_dec,
        .categoryId = "food-essentials",
        .upliftOverride = DEC(0.5)
    });

    EXPECT_EQ(breakdown.commissionRate, DEC(0.5));
    EXPECT_EQ(breakdown.marketplaceUplift, 50_dec);
    EXPECT_EQ(breakdown.bucketC, 60_dec);
}

TEST_F(PricingCalculatorTest, RoundsAtBucketBoundaries)
{
    const auto breakdown = calculator.calculatePrice({
        .vendorBasePrice = DEC(10.01),
        .categoryId = "food-essentials",
        .vendorVatRegistered = true,
        .vendorLegalized = false
    });

    EXPECT_EQ(breakdown.bucketA, DEC(10.01));
    EXPECT_EQ(breakdown.bucketB, DEC(1.40));
    EXPECT_EQ(breakdown.bucketC, DEC(11.70));
    EXPECT_EQ(breakdown.bucketD, DEC(1.64));
    EXPECT_EQ(breakdown.finalPrice, DEC(24.75));
    EXPECT_EQ(breakdown.cooperativeFee, DEC(0.50));
    EXPECT_EQ(breakdown.marketplaceUplift, DEC(1.20));
}

TEST_F(PricingCalculatorTest, FriendlyPrice)
{
    EXPECT_EQ(calculator.friendlyPrice(DEC(723.9)), 725_dec);
    EXPECT_EQ(calculator.friendlyPrice(DEC(682.4)), 685_dec);
    EXPECT_EQ(calculator.friendlyPrice(720_dec), 720_dec);
    EXPECT_THROW((void)calculator.friendlyPrice(-1_dec), InvalidPricingInput);
}

TEST_F(PricingCalculatorTest, UsesCategoryLookup)
{
    StrictMock<test::MockCategoryLookup> lookup;
    EXPECT_CALL(lookup, find(Eq("custom")))
        .WillOnce(Return(Category{
            .id = "custom",
            .defaultUpliftRate = DEC(0.10),
            .minUpliftRate = DEC(0.10),
            .maxUpliftRate = DEC(0.10)
        }));

    const PricingCalculator custom{policy, &lookup};
    const auto breakdown =
        custom.calculatePrice({.vendorBasePrice = 100_dec, .categoryId = "custom"});
    EXPECT_EQ(breakdown.marketplaceUplift, 10_dec);
}

//-------------------------------------------------------------------------

struct UpliftFloorTest : PricingCalculatorTest
{
    virtual void SetUp() override
    {
        policy.minimumFixedUplift = 5_dec;
        policy.lowPriceThreshold = 100_dec;
        policy.lowPriceFixedMarkup = 15_dec;
        calculator = PricingCalculator{policy, &catalog};
    }
};

TEST_F(UpliftFloorTest, LowPriceMarkupApplies)
{
    const auto breakdown =
        calculator.calculatePrice({.vendorBasePrice = 50_dec, .categoryId = "food-essentials"});
    EXPECT_EQ(breakdown.marketplaceUplift, 15_dec);
}

TEST_F(UpliftFloorTest, MinimumFixedUpliftApplies)
{
    policy.lowPriceThreshold = 0_dec;
    calculator = PricingCalculator{policy, &catalog};
    const auto breakdown =
        calculator.calculatePrice({.vendorBasePrice = 20_dec, .categoryId = "food-essentials"});
    EXPECT_EQ(breakdown.marketplaceUplift, 5_dec);
}

TEST_F(UpliftFloorTest, AboveFloorsUnchanged)
{
    const auto breakdown =
        calculator.calculatePrice({.vendorBasePrice = 200_dec, .categoryId = "food-essentials"});
    EXPECT_EQ(breakdown.marketplaceUplift, 24_dec);
}

TEST_F(UpliftFloorTest, OverrideBypassesFloors)
{
    const auto breakdown = calculator.calculatePrice({
        .vendorBasePrice = 50_dec,
        .categoryId = "food-essentials",
        .upliftOverride = DEC(0.12)
    });
    EXPECT_EQ(breakdown.marketplaceUplift, 6_dec);
}

//-------------------------------------------------------------------------

struct InvariantTestParams
{
    PricingInput input;
};

void PrintTo(const InvariantTestParams& params, std::ostream* os)
{
    const auto& input = params.input;
    *os << fmt::format(
        "{{.vendorBasePrice = {}, .categoryId = {}, .vat = {}, .legalized = {}, "
        ".parentUplift = {}, .upliftOverride = {}}}",
        input.vendorBasePrice,
        input.categoryId,
        input.vendorVatRegistered,
        input.vendorLegalized,
        input.parentUplift
            ? fmt::format("{} {}", input.parentUplift->kind, input.parentUplift->value)
            : "none",
        input.upliftOverride ? fmt::format("{}", *input.upliftOverride) : "none");
}

struct PricingInvariantTest : TestWithParam<InvariantTestParams>
{
    config::PolicyConfig policy;
    CategoryCatalog catalog = makeCatalog();
    PricingCalculator calculator{policy, &catalog};
};

TEST_P(PricingInvariantTest, BucketsBalance)
{
    const auto& input = GetParam().input;
    const auto breakdown = calculator.calculatePrice(input);

    EXPECT_LE(util::abs(breakdown.bucketSum() - breakdown.finalPrice), DEC(0.01));
    EXPECT_EQ(breakdown.vendorNetPayout, breakdown.bucketA + breakdown.bucketB);
    EXPECT_EQ(breakdown.totalVat, breakdown.bucketB + breakdown.bucketD);
    EXPECT_EQ(breakdown.platformMargin, breakdown.bucketC);

    for (const auto bucket :
        {breakdown.bucketA, breakdown.bucketB, breakdown.bucketC, breakdown.bucketD}) {
        EXPECT_GE(bucket, 0_dec);
    }
    if (breakdown.bucketC > 0_dec) {
        EXPECT_GT(breakdown.bucketD, 0_dec);
    }
    if (!input.vendorVatRegistered) {
        EXPECT_EQ(breakdown.bucketB, 0_dec);
    }
    if (input.vendorLegalized) {
        EXPECT_EQ(breakdown.cooperativeFee, 0_dec);
    } else {
        EXPECT_EQ(breakdown.cooperativeFee, util::round(input.vendorBasePrice * DEC(0.05)));
    }
    // Uplifts only ever add to the quoted price.
    EXPECT_GE(breakdown.bucketA, input.vendorBasePrice);
}

INSTANTIATE_TEST_SUITE_P(
    PricingCalculatorTest,
    PricingInvariantTest,
    Values(
        InvariantTestParams{{.vendorBasePrice = DEC(0.01), .categoryId = "food-essentials"}},
        InvariantTestParams{{
            .vendorBasePrice = DEC(99.99),
            .categoryId = "leather-goods",
            .vendorVatRegistered = true,
            .vendorLegalized = false
        }},
        InvariantTestParams{{
            .vendorBasePrice = DEC(1234.56),
            .categoryId = "home-decor-fragile",
            .vendorVatRegistered = true,
            .parentUplift = ParentUplift{.kind = UpliftKind::PERCENTAGE, .value = DEC(0.075)}
        }},
        InvariantTestParams{{
            .vendorBasePrice = DEC(333.33),
            .categoryId = "food-essentials",
            .vendorLegalized = false,
            .parentUplift = ParentUplift{.kind = UpliftKind::FIXED, .value = DEC(12.345)},
            .upliftOverride = DEC(0.333)
        }},
        InvariantTestParams{{
            .vendorBasePrice = DEC(7.77),
            .categoryId = "home-decor-fragile",
            .vendorVatRegistered = true,
            .vendorLegalized = false,
            .upliftOverride = 0_dec
        }},
        InvariantTestParams{{
            .vendorBasePrice = DEC(98765.43),
            .categoryId = "leather-goods",
            .vendorVatRegistered = true,
            .vendorLegalized = false,
            .parentUplift = ParentUplift{.kind = UpliftKind::PERCENTAGE, .value = 1_dec}
        }}));

//-------------------------------------------------------------------------

struct InvalidInputTestParams
{
    PricingInput input;
    std::string field;
};

void PrintTo(const InvalidInputTestParams& params, std::ostream* os)
{
    *os << fmt::format(
        "{{.vendorBasePrice = {}, .categoryId = {}, .field = {}}}",
        params.input.vendorBasePrice,
        params.input.categoryId,
        params.field);
}

struct InvalidInputTest : TestWithParam<InvalidInputTestParams>
{
    config::PolicyConfig policy;
    CategoryCatalog catalog = makeCatalog();
    PricingCalculator calculator{policy, &catalog};
};

TEST_P(InvalidInputTest, NamesOffendingField)
{
    const auto& [input, field] = GetParam();
    try {
        (void)calculator.calculatePrice(input);
        FAIL() << "Expected InvalidPricingInput";
    }
    catch (const InvalidPricingInput& e) {
        EXPECT_EQ(e.field(), field);
    }
}

INSTANTIATE_TEST_SUITE_P(
    PricingCalculatorTest,
    InvalidInputTest,
    Values(
        InvalidInputTestParams{
            .input = {.vendorBasePrice = 0_dec, .categoryId = "food-essentials"},
            .field = "vendorBasePrice"
        },
        InvalidInputTestParams{
            .input = {.vendorBasePrice = -10_dec, .categoryId = "food-essentials"},
            .field = "vendorBasePrice"
        },
        InvalidInputTestParams{
            .input = {.vendorBasePrice = 100_dec, .categoryId = "spaceships"},
            .field = "categoryId"
        },
        InvalidInputTestParams{
            .input = {
                .vendorBasePrice = 100_dec,
                .categoryId = "spaceships",
                .upliftOverride = DEC(0.2)
            },
            .field = "categoryId"
        },
        InvalidInputTestParams{
            .input = {
                .vendorBasePrice = 100_dec,
                .categoryId = "food-essentials",
                .upliftOverride = DEC(1.5)
            },
            .field = "upliftOverride"
        },
        InvalidInputTestParams{
            .input = {
                .vendorBasePrice = 100_dec,
                .categoryId = "food-essentials",
                .upliftOverride = DEC(-0.1)
            },
            .field = "upliftOverride"
        },
        InvalidInputTestParams{
            .input = {
                .vendorBasePrice = 100_dec,
                .categoryId = "food-essentials",
                .parentUplift = ParentUplift{.kind = UpliftKind::FIXED, .value = -5_dec}
            },
            .field = "parentUplift"
        },
        InvalidInputTestParams{
            .input = {
                .vendorBasePrice = 100_dec,
                .categoryId = "food-essentials",
                .parentUplift = ParentUplift{.kind = UpliftKind::PERCENTAGE, .value = DEC(1.5)}
            },
            .field = "parentUplift"
        }));

//-------------------------------------------------------------------------

TEST(UpliftKindTest, Parse)
{
    EXPECT_EQ(parseUpliftKind("fixed"), UpliftKind::FIXED);
    EXPECT_EQ(parseUpliftKind("Percentage"), UpliftKind::PERCENTAGE);
    EXPECT_THROW((void)parseUpliftKind("bogus"), InvalidPricingInput);
}

//-------------------------------------------------------------------------
