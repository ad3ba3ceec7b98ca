/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "souk/core/FinancialCore.hpp"

#include "souk/accounting/InMemoryWalletRepository.hpp"
#include "souk/logging/logging.hpp"

//-------------------------------------------------------------------------

namespace souk::core
{

//-------------------------------------------------------------------------

FinancialCore::FinancialCore(
    CoreConfig config,
    std::unique_ptr<accounting::WalletRepository> repository,
    std::unique_ptr<escrow::Clock> clock)
    : m_config{std::move(config)},
      m_repository{
          repository ? std::move(repository)
                     : std::unique_ptr<accounting::WalletRepository>{
                           std::make_unique<accounting::InMemoryWalletRepository>()}},
      m_clock{
          clock ? std::move(clock)
                : std::unique_ptr<escrow::Clock>{std::make_unique<escrow::SystemClock>()}},
      m_pricing{m_config.policy, &m_config.categories},
      m_shipping{m_config.policy, &m_config.shipping},
      m_escrow{m_config.policy, m_clock.get()},
      m_deviation{m_config.policy},
      m_accountant{m_config.policy, m_repository.get(), m_clock.get()},
      m_payouts{m_config.policy, &m_accountant}
{
    logging::setLevel(m_config.logging.level);
    if (!m_config.logging.directory.empty()) {
        m_ledgerLogger = std::make_unique<accounting::LedgerLogger>(
            m_config.logging.directory, m_accountant.signals(), m_clock.get());
    }
}

//-------------------------------------------------------------------------

}  // namespace souk::core

//-------------------------------------------------------------------------
