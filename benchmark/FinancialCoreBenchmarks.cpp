/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include <benchmark/benchmark.h>
#include <fmt/format.h>

#include "souk/core/FinancialCore.hpp"

//-------------------------------------------------------------------------

using namespace souk;
using namespace souk::literals;

//-------------------------------------------------------------------------

static const fs::path kConfigPath{
    fs::path{__FILE__}.parent_path().parent_path() / "data" / "souk.xml"};

static const pricing::CategoryId kCategoryIds[]{
    "jewelry-accessories", "home-decor-fragile", "food-essentials"};

//-------------------------------------------------------------------------

struct CoreFixture : benchmark::Fixture
{
    void SetUp(benchmark::State&) override
    {
        auto config = core::CoreConfig::fromXML(kConfigPath);
        config.logging.directory.clear();
        config.logging.level = spdlog::level::err;
        financialCore = std::make_unique<core::FinancialCore>(std::move(config));
    }

    void TearDown(benchmark::State&) override
    {
        financialCore.reset();
    }

    std::unique_ptr<core::FinancialCore> financialCore;
};

//-------------------------------------------------------------------------

BENCHMARK_DEFINE_F(CoreFixture, CalculatePrice)(benchmark::State& state)
{
    const pricing::PricingInput input{
        .vendorBasePrice = decimal_t{state.range(0)},
        .categoryId = kCategoryIds[state.range(1)],
        .vendorVatRegistered = true,
        .parentUplift = pricing::ParentUplift{
            .kind = pricing::UpliftKind::PERCENTAGE, .value = DEC(0.05)}
    };
    for (auto _ : state) {
        benchmark::DoNotOptimize(financialCore->pricing().calculatePrice(input));
    }
}
BENCHMARK_REGISTER_F(CoreFixture, CalculatePrice)
    ->Args({50, 0})
    ->Args({600, 1})
    ->Args({12000, 2});

//-------------------------------------------------------------------------

BENCHMARK_DEFINE_F(CoreFixture, CalculateShippingFee)(benchmark::State& state)
{
    const shipping::ShippingInput input{
        .actualWeightKg = decimal_t{state.range(0)},
        .lengthCm = 50_dec,
        .widthCm = 40_dec,
        .heightCm = 30_dec,
        .originZone = "cairo",
        .destinationZone = "upper-egypt"
    };
    for (auto _ : state) {
        benchmark::DoNotOptimize(financialCore->shipping().calculateShippingFee(input));
    }
}
BENCHMARK_REGISTER_F(CoreFixture, CalculateShippingFee)->Arg(1)->Arg(25);

//-------------------------------------------------------------------------

BENCHMARK_DEFINE_F(CoreFixture, ApplyEntry)(benchmark::State& state)
{
    const VendorId vendorId = 1;
    auto& accountant = financialCore->accountant();
    accountant.provisionWallet(vendorId);
    const accounting::LedgerEntryDraft draft{
        .vendorId = vendorId,
        .orderRef = OrderRef{vendorId},
        .type = accounting::TransactionType::SALE,
        .amount = DEC(123.45),
        .vendorAmount = DEC(123.45),
        .description = "Benchmark sale",
        .status = accounting::BalanceStatus::PENDING
    };
    for (auto _ : state) {
        benchmark::DoNotOptimize(accountant.applyEntry(draft));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK_REGISTER_F(CoreFixture, ApplyEntry);

//-------------------------------------------------------------------------

BENCHMARK_MAIN();

//-------------------------------------------------------------------------
