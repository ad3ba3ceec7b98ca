/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "souk/decimal/decimal.hpp"
#include "souk/util/json_util.hpp"
#include "test-common/formatting.hpp"

#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace souk;
using namespace souk::literals;

using namespace testing;

//-------------------------------------------------------------------------

struct RoundTestParams
{
    decimal_t value;
    uint32_t decimalPlaces;
    decimal_t refValue;
};

void PrintTo(const RoundTestParams& params, std::ostream* os)
{
    *os << fmt::format(
        "{{.value = {}, .decimalPlaces = {}, .refValue = {}}}",
        params.value,
        params.decimalPlaces,
        params.refValue);
}

struct RoundTest : TestWithParam<RoundTestParams> {};

TEST_P(RoundTest, HalfAwayFromZero)
{
    const auto [value, decimalPlaces, refValue] = GetParam();
    EXPECT_EQ(util::round(value, decimalPlaces), refValue);
}

INSTANTIATE_TEST_SUITE_P(
    DecimalTests,
    RoundTest,
    Values(
        RoundTestParams{.value = DEC(2.345), .decimalPlaces = 2, .refValue = DEC(2.35)},
        RoundTestParams{.value = DEC(-2.345), .decimalPlaces = 2, .refValue = DEC(-2.35)},
        RoundTestParams{.value = DEC(2.344999), .decimalPlaces = 2, .refValue = DEC(2.34)},
        RoundTestParams{.value = DEC(18.9), .decimalPlaces = 2, .refValue = DEC(18.90)},
        RoundTestParams{.value = DEC(1.638), .decimalPlaces = 2, .refValue = DEC(1.64)},
        RoundTestParams{.value = DEC(0.5005), .decimalPlaces = 2, .refValue = DEC(0.50)},
        RoundTestParams{.value = DEC(0.30000), .decimalPlaces = 4, .refValue = DEC(0.3)},
        RoundTestParams{.value = DEC(32.33335), .decimalPlaces = 4, .refValue = DEC(32.3334)}));

//-------------------------------------------------------------------------

TEST(DecimalTests, CeilToMultiple)
{
    EXPECT_EQ(util::ceilToMultiple(DEC(723.9), 5_dec), 725_dec);
    EXPECT_EQ(util::ceilToMultiple(DEC(682.4), 5_dec), 685_dec);
    EXPECT_EQ(util::ceilToMultiple(720_dec, 5_dec), 720_dec);
    EXPECT_EQ(util::ceilToMultiple(DEC(0.01), 10_dec), 10_dec);
}

TEST(DecimalTests, AbsAndMax)
{
    EXPECT_EQ(util::abs(DEC(-12.5)), DEC(12.5));
    EXPECT_EQ(util::abs(DEC(12.5)), DEC(12.5));
    EXPECT_EQ(util::max(3_dec, DEC(3.01)), DEC(3.01));
}

TEST(DecimalTests, StrToDecimal)
{
    EXPECT_EQ(util::str2decimal("12.50"), DEC(12.5));
    EXPECT_EQ(util::str2decimal("0.14"), DEC(0.14));
    EXPECT_THROW((void)util::str2decimal("abc"), std::invalid_argument);
    EXPECT_THROW((void)util::str2decimal("NaN"), std::invalid_argument);
    EXPECT_THROW((void)util::str2decimal("inf"), std::invalid_argument);
}

TEST(DecimalTests, Format)
{
    EXPECT_EQ(fmt::format("{}", 0_dec), "0.00");
    EXPECT_EQ(util::str2decimal(fmt::format("{}", DEC(723.9))), DEC(723.9));
}

//-------------------------------------------------------------------------

TEST(DecimalTests, JsonDecimalsAreStrings)
{
    rapidjson::Document json;
    json.SetObject();
    json::addDecimalMember(json, "amount", DEC(312.45));
    ASSERT_TRUE(json["amount"].IsString());
    EXPECT_EQ(json::getDecimal(json["amount"]), DEC(312.45));

    json.AddMember("raw", rapidjson::Value{uint64_t{31245}}, json.GetAllocator());
    EXPECT_THROW((void)json::getDecimal(json["raw"]), std::invalid_argument);
}

//-------------------------------------------------------------------------
