/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "souk/accounting/LedgerAccountant.hpp"
#include "souk/accounting/LedgerLogger.hpp"
#include "souk/accounting/PayoutProcessor.hpp"
#include "souk/core/CoreConfig.hpp"
#include "souk/escrow/EscrowScheduler.hpp"
#include "souk/moderation/DeviationChecker.hpp"
#include "souk/pricing/PricingCalculator.hpp"
#include "souk/shipping/ShippingCalculator.hpp"

//-------------------------------------------------------------------------

namespace souk::core
{

//-------------------------------------------------------------------------

// Owns the configuration and wires every component to it.
class FinancialCore
{
public:
    explicit FinancialCore(
        CoreConfig config,
        std::unique_ptr<accounting::WalletRepository> repository = {},
        std::unique_ptr<escrow::Clock> clock = {});

    FinancialCore(const FinancialCore&) = delete;
    FinancialCore& operator=(const FinancialCore&) = delete;

    [[nodiscard]] const CoreConfig& config() const noexcept { return m_config; }
    [[nodiscard]] const escrow::Clock& clock() const noexcept { return *m_clock; }

    [[nodiscard]] const pricing::PricingCalculator& pricing() const noexcept { return m_pricing; }
    [[nodiscard]] const shipping::ShippingCalculator& shipping() const noexcept { return m_shipping; }
    [[nodiscard]] const escrow::EscrowScheduler& escrow() const noexcept { return m_escrow; }
    [[nodiscard]] const moderation::DeviationChecker& deviation() const noexcept
    {
        return m_deviation;
    }
    [[nodiscard]] accounting::LedgerAccountant& accountant() noexcept { return m_accountant; }
    [[nodiscard]] accounting::PayoutProcessor& payouts() noexcept { return m_payouts; }
    [[nodiscard]] const accounting::LedgerLogger* ledgerLogger() const noexcept
    {
        return m_ledgerLogger.get();
    }

private:
    CoreConfig m_config;
    std::unique_ptr<accounting::WalletRepository> m_repository;
    std::unique_ptr<escrow::Clock> m_clock;
    pricing::PricingCalculator m_pricing;
    shipping::ShippingCalculator m_shipping;
    escrow::EscrowScheduler m_escrow;
    moderation::DeviationChecker m_deviation;
    accounting::LedgerAccountant m_accountant;
    accounting::PayoutProcessor m_payouts;
    std::unique_ptr<accounting::LedgerLogger> m_ledgerLogger;
};

//-------------------------------------------------------------------------

}  // namespace souk::core

//-------------------------------------------------------------------------
