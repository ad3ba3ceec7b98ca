/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "souk/accounting/LedgerLogger.hpp"

#include <boost/algorithm/string/replace.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <date/date.h>

//-------------------------------------------------------------------------

namespace souk::accounting
{

//-------------------------------------------------------------------------

namespace
{

[[nodiscard]] std::string csvQuote(const std::string& text)
{
    return fmt::format("\"{}\"", boost::algorithm::replace_all_copy(text, "\"", "\"\""));
}

[[nodiscard]] std::string formatOrderRef(std::optional<OrderRef> orderRef)
{
    return orderRef.has_value() ? std::to_string(orderRef.value()) : std::string{};
}

}  // namespace

//-------------------------------------------------------------------------

LedgerLogger::LedgerLogger(
    const fs::path& directory, LedgerSignals& signals, const escrow::Clock* clock)
    : m_ledgerFilepath{directory / s_ledgerFilename},
      m_reconciliationFilepath{directory / s_reconciliationFilename},
      m_clock{clock}
{
    fs::create_directories(directory);

    m_ledgerLogger = makeLogger("LedgerLogger", m_ledgerFilepath, s_ledgerHeader);
    m_reconciliationLogger =
        makeLogger("ReconciliationLogger", m_reconciliationFilepath, s_reconciliationHeader);

    m_entryFeed = signals.entryApplied.connect(
        [this](const LedgerEntry& entry, const VendorWallet&) { logEntry(entry); });
    m_violationFeed = signals.invariantViolation.connect(
        [this](const LedgerEntryDraft& draft, const VendorWallet& wallet, const std::string& reason) {
            logViolation(draft, wallet, reason);
        });
}

//-------------------------------------------------------------------------

void LedgerLogger::logEntry(const LedgerEntry& entry)
{
    m_ledgerLogger->trace(
        "{},{},{},{},{},{},{},{},{},{},{}",
        date::format("%F,%T", entry.createdAt()),
        boost::uuids::to_string(entry.id()),
        entry.vendorId(),
        formatOrderRef(entry.orderRef()),
        entry.type(),
        entry.status(),
        entry.amount(),
        entry.vendorAmount(),
        entry.commissionAmount(),
        entry.vatAmount(),
        csvQuote(entry.description()));
    m_ledgerLogger->flush();
}

//-------------------------------------------------------------------------

void LedgerLogger::logViolation(
    const LedgerEntryDraft& draft, const VendorWallet& wallet, const std::string& reason)
{
    m_reconciliationLogger->trace(
        "{},{},{},{},{},{},{},{},{},{},{}",
        date::format("%F,%T", m_clock->now()),
        draft.vendorId,
        formatOrderRef(draft.orderRef),
        draft.type,
        draft.status,
        draft.vendorAmount,
        wallet.pendingBalance(),
        wallet.availableBalance(),
        wallet.lifetimeEarnings(),
        wallet.lifetimePayouts(),
        csvQuote(reason));
    m_reconciliationLogger->flush();
}

//-------------------------------------------------------------------------

std::unique_ptr<spdlog::logger> LedgerLogger::makeLogger(
    const std::string& name, const fs::path& filepath, std::string_view header)
{
    const bool fresh = !fs::exists(filepath) || fs::is_empty(filepath);
    auto logger = std::make_unique<spdlog::logger>(
        name, std::make_shared<spdlog::sinks::basic_file_sink_mt>(filepath.string()));
    logger->set_level(spdlog::level::trace);
    logger->set_pattern("%v");
    if (fresh) {
        logger->trace(header);
        logger->flush();
    }
    return logger;
}

//-------------------------------------------------------------------------

}  // namespace souk::accounting

//-------------------------------------------------------------------------
