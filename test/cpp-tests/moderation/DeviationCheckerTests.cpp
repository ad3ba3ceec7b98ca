/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "souk/moderation/DeviationChecker.hpp"
#include "test-common/formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace souk;
using namespace souk::literals;
using namespace souk::moderation;

using namespace testing;

//-------------------------------------------------------------------------

struct DeviationTestParams
{
    decimal_t price;
    decimal_t benchmark;
    std::optional<decimal_t> threshold;
    decimal_t expectedDeviation;
    bool expectedFlagged;
    DeviationDirection expectedDirection;
};

void PrintTo(const DeviationTestParams& params, std::ostream* os)
{
    *os << fmt::format(
        "{{.price = {}, .benchmark = {}, .threshold = {}}}",
        params.price,
        params.benchmark,
        params.threshold.has_value() ? fmt::format("{}", *params.threshold) : "default");
}

//-------------------------------------------------------------------------

struct DeviationCheckerTest : TestWithParam<DeviationTestParams>
{
    config::PolicyConfig policy;
    DeviationChecker checker{policy};
};

TEST_P(DeviationCheckerTest, Classification)
{
    const auto& params = GetParam();

    const auto result = checker.checkDeviation(params.price, params.benchmark, params.threshold);

    EXPECT_EQ(result.price, params.price);
    EXPECT_EQ(result.benchmark, params.benchmark);
    EXPECT_EQ(result.deviation, params.expectedDeviation);
    EXPECT_EQ(result.threshold, params.threshold.value_or(policy.defaultDeviationThreshold));
    EXPECT_EQ(result.flagged, params.expectedFlagged);
    EXPECT_EQ(result.direction, params.expectedDirection);
}

INSTANTIATE_TEST_SUITE_P(
    DeviationChecker,
    DeviationCheckerTest,
    Values(
        DeviationTestParams{
            .price = 130_dec,
            .benchmark = 100_dec,
            .expectedDeviation = DEC(0.3),
            .expectedFlagged = true,
            .expectedDirection = DeviationDirection::ABOVE
        },
        DeviationTestParams{
            .price = 110_dec,
            .benchmark = 100_dec,
            .expectedDeviation = DEC(0.1),
            .expectedFlagged = false,
            .expectedDirection = DeviationDirection::NORMAL
        },
        DeviationTestParams{
            .price = 70_dec,
            .benchmark = 100_dec,
            .expectedDeviation = DEC(0.3),
            .expectedFlagged = true,
            .expectedDirection = DeviationDirection::BELOW
        },
        DeviationTestParams{
            .price = 120_dec,
            .benchmark = 100_dec,
            .threshold = DEC(0.20),
            .expectedDeviation = DEC(0.2),
            .expectedFlagged = false,
            .expectedDirection = DeviationDirection::NORMAL
        },
        DeviationTestParams{
            .price = 120_dec,
            .benchmark = 100_dec,
            .threshold = DEC(0.1),
            .expectedDeviation = DEC(0.2),
            .expectedFlagged = true,
            .expectedDirection = DeviationDirection::ABOVE
        },
        DeviationTestParams{
            .price = 100_dec,
            .benchmark = 100_dec,
            .threshold = 0_dec,
            .expectedDeviation = 0_dec,
            .expectedFlagged = false,
            .expectedDirection = DeviationDirection::NORMAL
        },
        DeviationTestParams{
            .price = 0_dec,
            .benchmark = 100_dec,
            .expectedDeviation = 1_dec,
            .expectedFlagged = true,
            .expectedDirection = DeviationDirection::BELOW
        }));

//-------------------------------------------------------------------------

TEST(DeviationCheckerRoundingTest, DeviationIsRoundedToFourPlaces)
{
    const DeviationChecker checker{config::PolicyConfig{}};

    const auto result = checker.checkDeviation(100_dec, 3_dec);
    EXPECT_EQ(result.deviation, DEC(32.3333));
    EXPECT_TRUE(result.flagged);
    EXPECT_EQ(result.direction, DeviationDirection::ABOVE);
}

TEST(DeviationCheckerRejectTest, NonPositiveBenchmark)
{
    const DeviationChecker checker{config::PolicyConfig{}};

    EXPECT_THROW((void)checker.checkDeviation(100_dec, 0_dec), InvalidBenchmark);
    EXPECT_THROW((void)checker.checkDeviation(100_dec, -5_dec), InvalidBenchmark);
}

TEST(DeviationCheckerRejectTest, NegativeThreshold)
{
    const DeviationChecker checker{config::PolicyConfig{}};

    EXPECT_THROW(
        (void)checker.checkDeviation(100_dec, 100_dec, -DEC(0.1)), std::invalid_argument);
}

TEST(DeviationCheckerFormatTest, Direction)
{
    EXPECT_EQ(fmt::format("{}", DeviationDirection::ABOVE), "ABOVE");
    EXPECT_EQ(fmt::format("{}", DeviationDirection::NORMAL), "NORMAL");
}

//-------------------------------------------------------------------------
