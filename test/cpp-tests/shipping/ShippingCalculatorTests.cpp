/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "souk/shipping/ShippingCalculator.hpp"
#include "test-common/formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace souk;
using namespace souk::literals;
using namespace souk::shipping;

using namespace testing;

//-------------------------------------------------------------------------

struct ShippingCalculatorTest : Test
{
    virtual void SetUp() override
    {
        book.addZone({.id = "cairo", .name = "Greater Cairo", .estimatedDeliveryDays = 2});
        book.addZone({.id = "sinai", .name = "Sinai", .estimatedDeliveryDays = 7});
        book.addRateCard({
            .originZone = "cairo", .destinationZone = "cairo", .baseFee = 35_dec, .perKgRate = 8_dec
        });
        book.addRateCard({
            .originZone = "cairo",
            .destinationZone = "sinai",
            .baseFee = 75_dec,
            .perKgRate = 15_dec,
            .active = false
        });
    }

    config::PolicyConfig policy;
    RateCardBook book;
    ShippingCalculator calculator{policy, &book};
};

//-------------------------------------------------------------------------

TEST_F(ShippingCalculatorTest, LightParcelPaysBaseFee)
{
    const auto quote = calculator.calculateShippingFee({
        .actualWeightKg = DEC(1.2),
        .lengthCm = 30_dec,
        .widthCm = 20_dec,
        .heightCm = 10_dec,
        .originZone = "cairo",
        .destinationZone = "cairo"
    });

    EXPECT_EQ(quote.volumetricWeightKg, DEC(1.2));
    EXPECT_EQ(quote.chargeableWeightKg, 2_dec);
    EXPECT_EQ(quote.extraWeightFee, 0_dec);
    EXPECT_EQ(quote.totalFee, 35_dec);
    EXPECT_EQ(quote.customerFee, 35_dec);
    EXPECT_EQ(quote.platformSubsidy, 0_dec);
    EXPECT_EQ(quote.estimatedDeliveryDays, 2);
}

TEST_F(ShippingCalculatorTest, HeavyParcelPaysPerKg)
{
    const auto quote = calculator.calculateShippingFee({
        .actualWeightKg = DEC(3.4),
        .lengthCm = 10_dec,
        .widthCm = 10_dec,
        .heightCm = 10_dec,
        .originZone = "cairo",
        .destinationZone = "cairo"
    });

    EXPECT_EQ(quote.volumetricWeightKg, DEC(0.2));
    EXPECT_EQ(quote.chargeableWeightKg, 4_dec);
    EXPECT_EQ(quote.extraWeightFee, 16_dec);
    EXPECT_EQ(quote.totalFee, 51_dec);
    EXPECT_EQ(quote.customerFee, 51_dec);
    EXPECT_EQ(quote.platformSubsidy, 0_dec);
}

TEST_F(ShippingCalculatorTest, BulkyParcelChargedByVolume)
{
    const auto quote = calculator.calculateShippingFee({
        .actualWeightKg = 5_dec,
        .lengthCm = 50_dec,
        .widthCm = 40_dec,
        .heightCm = 30_dec,
        .originZone = "cairo",
        .destinationZone = "sinai"
    });

    // The Cairo-Sinai card is inactive, so the default rates apply.
    EXPECT_EQ(quote.volumetricWeightKg, 12_dec);
    EXPECT_EQ(quote.chargeableWeightKg, 12_dec);
    EXPECT_EQ(quote.baseFee, 45_dec);
    EXPECT_EQ(quote.extraWeightFee, 100_dec);
    EXPECT_EQ(quote.totalFee, 145_dec);
    EXPECT_EQ(quote.customerFee, 145_dec);
    EXPECT_EQ(quote.platformSubsidy, 0_dec);
    EXPECT_EQ(quote.estimatedDeliveryDays, 7);
}

TEST_F(ShippingCalculatorTest, VolumetricWeightRoundedForDisplayOnly)
{
    const ShippingInput input{
        .actualWeightKg = 1_dec,
        .lengthCm = 33_dec,
        .widthCm = 22_dec,
        .heightCm = 11_dec,
        .originZone = "cairo",
        .destinationZone = "cairo"
    };
    EXPECT_EQ(calculator.volumetricWeight(input), DEC(1.5972));
    EXPECT_EQ(calculator.calculateShippingFee(input).volumetricWeightKg, DEC(1.60));
}

TEST_F(ShippingCalculatorTest, VolumeJustAboveWholeKilogramRoundsUp)
{
    const auto quote = calculator.calculateShippingFee({
        .actualWeightKg = 1_dec,
        .lengthCm = 10_dec,
        .widthCm = 10_dec,
        .heightCm = DEC(100.05),
        .originZone = "cairo",
        .destinationZone = "cairo"
    });

    // 2.001 kg shows as 2.00 but is charged as 3 kg.
    EXPECT_EQ(quote.volumetricWeightKg, DEC(2.00));
    EXPECT_EQ(quote.chargeableWeightKg, 3_dec);
    EXPECT_EQ(quote.extraWeightFee, 8_dec);
    EXPECT_EQ(quote.totalFee, 43_dec);
    EXPECT_EQ(quote.customerFee, 43_dec);
}

TEST_F(ShippingCalculatorTest, ConfiguredSubsidyCappedBySurcharge)
{
    RateCardBook subsidized{ShippingPolicy{.maxSubsidyRate = DEC(0.25)}};
    subsidized.addZone({.id = "cairo", .name = "Greater Cairo", .estimatedDeliveryDays = 2});
    subsidized.addRateCard({
        .originZone = "cairo", .destinationZone = "cairo", .baseFee = 35_dec, .perKgRate = 8_dec
    });
    const ShippingCalculator subsidizedCalculator{policy, &subsidized};

    ShippingInput input{
        .actualWeightKg = DEC(1.2),
        .lengthCm = 30_dec,
        .widthCm = 20_dec,
        .heightCm = 10_dec,
        .originZone = "cairo",
        .destinationZone = "cairo"
    };
    const auto light = subsidizedCalculator.calculateShippingFee(input);
    EXPECT_EQ(light.customerFee, DEC(26.25));
    EXPECT_EQ(light.platformSubsidy, DEC(8.75));

    input.actualWeightKg = DEC(3.4);
    const auto heavy = subsidizedCalculator.calculateShippingFee(input);
    EXPECT_EQ(heavy.totalFee, 51_dec);
    EXPECT_EQ(heavy.customerFee, 41_dec);
    EXPECT_EQ(heavy.platformSubsidy, 10_dec);
}

TEST_F(ShippingCalculatorTest, RejectsInvalidInput)
{
    const ShippingInput valid{
        .actualWeightKg = 1_dec,
        .lengthCm = 10_dec,
        .widthCm = 10_dec,
        .heightCm = 10_dec,
        .originZone = "cairo",
        .destinationZone = "cairo"
    };
    EXPECT_NO_THROW((void)calculator.calculateShippingFee(valid));

    auto zeroWeight = valid;
    zeroWeight.actualWeightKg = 0_dec;
    EXPECT_THROW((void)calculator.calculateShippingFee(zeroWeight), InvalidShippingInput);

    auto negativeHeight = valid;
    negativeHeight.heightCm = -1_dec;
    EXPECT_THROW((void)calculator.calculateShippingFee(negativeHeight), InvalidShippingInput);

    auto unknownZone = valid;
    unknownZone.destinationZone = "atlantis";
    EXPECT_THROW((void)calculator.calculateShippingFee(unknownZone), InvalidShippingInput);
}

TEST_F(ShippingCalculatorTest, RateCardsNeedKnownZones)
{
    EXPECT_THROW(
        book.addRateCard({
            .originZone = "cairo",
            .destinationZone = "atlantis",
            .baseFee = 1_dec,
            .perKgRate = 1_dec
        }),
        std::invalid_argument);
    EXPECT_THROW(book.addZone({.id = "cairo"}), std::invalid_argument);
}

TEST_F(ShippingCalculatorTest, LooksUpActiveCardsOnly)
{
    EXPECT_TRUE(book.rateCard("cairo", "cairo").has_value());
    EXPECT_FALSE(book.rateCard("cairo", "sinai").has_value());
    EXPECT_FALSE(book.rateCard("sinai", "cairo").has_value());
}

//-------------------------------------------------------------------------
