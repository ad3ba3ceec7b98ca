/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "souk/accounting/LedgerSignals.hpp"
#include "souk/escrow/Clock.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <memory>

//-------------------------------------------------------------------------

namespace souk::accounting
{

//-------------------------------------------------------------------------

/**
 * Journals committed ledger entries and rejected ones as CSV, giving manual
 * reconciliation a durable trail independent of the wallet store.
 */
class LedgerLogger
{
public:
    LedgerLogger(
        const fs::path& directory, LedgerSignals& signals, const escrow::Clock* clock);

    [[nodiscard]] const fs::path& ledgerFilepath() const noexcept { return m_ledgerFilepath; }
    [[nodiscard]] const fs::path& reconciliationFilepath() const noexcept
    {
        return m_reconciliationFilepath;
    }

    static constexpr std::string_view s_ledgerFilename = "ledger.csv";
    static constexpr std::string_view s_reconciliationFilename = "reconciliation.csv";

    static constexpr std::string_view s_ledgerHeader =
        "Date,Time,EntryId,VendorId,OrderRef,Type,Status,Amount,VendorAmount,"
        "CommissionAmount,VatAmount,Description";
    static constexpr std::string_view s_reconciliationHeader =
        "Date,Time,VendorId,OrderRef,Type,Status,VendorAmount,Pending,Available,"
        "LifetimeEarnings,LifetimePayouts,Reason";

private:
    void logEntry(const LedgerEntry& entry);
    void logViolation(
        const LedgerEntryDraft& draft, const VendorWallet& wallet, const std::string& reason);

    [[nodiscard]] static std::unique_ptr<spdlog::logger> makeLogger(
        const std::string& name, const fs::path& filepath, std::string_view header);

    fs::path m_ledgerFilepath;
    fs::path m_reconciliationFilepath;
    std::unique_ptr<spdlog::logger> m_ledgerLogger;
    std::unique_ptr<spdlog::logger> m_reconciliationLogger;
    const escrow::Clock* m_clock;
    bs2::scoped_connection m_entryFeed;
    bs2::scoped_connection m_violationFeed;
};

//-------------------------------------------------------------------------

}  // namespace souk::accounting

//-------------------------------------------------------------------------
