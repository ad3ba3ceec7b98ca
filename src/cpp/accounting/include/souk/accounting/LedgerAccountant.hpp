/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "souk/accounting/LedgerSignals.hpp"
#include "souk/accounting/WalletRepository.hpp"
#include "souk/config/PolicyConfig.hpp"
#include "souk/escrow/Clock.hpp"

#include <mutex>
#include <shared_mutex>

//-------------------------------------------------------------------------

namespace souk::accounting
{

//-------------------------------------------------------------------------

struct ReconciliationReport
{
    VendorWallet stored;
    VendorWallet replayed;
    size_t entryCount;

    [[nodiscard]] bool consistent() const noexcept { return stored.sameBalances(replayed); }

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;
};

//-------------------------------------------------------------------------

/**
 * Applies ledger entries to vendor wallets.
 *
 * | status    | effect                                                        |
 * |-----------|---------------------------------------------------------------|
 * | PENDING   | pending += vendorAmount, earnings += vendorAmount if positive |
 * | AVAILABLE | available += vendorAmount, earnings += vendorAmount if positive|
 * | WITHDRAWN | available -= |vendorAmount|, payouts += |vendorAmount|        |
 *
 * Every application is checked against the wallet invariants before it is
 * committed; a violating entry is never written. Mutations of one wallet made
 * through the same accountant are serialized by a per-vendor lock. The
 * repository's version check catches writers from outside it, and only those
 * are retried.
 */
class LedgerAccountant
{
public:
    LedgerAccountant(
        const config::PolicyConfig& policy,
        WalletRepository* repository,
        const escrow::Clock* clock) noexcept;

    VendorWallet provisionWallet(VendorId vendorId);

    // Throws WalletNotFound.
    [[nodiscard]] VendorWallet wallet(VendorId vendorId) const;
    [[nodiscard]] std::vector<LedgerEntry> entries(VendorId vendorId) const;

    // Throws WalletNotFound, NegativeBalanceViolation or AccountingIdentityViolation.
    // ConcurrencyConflict only if writers outside this accountant keep winning.
    LedgerEntry applyEntry(const LedgerEntryDraft& draft);

    // Held across read-validate-commit by every mutation of the vendor's wallet.
    [[nodiscard]] std::unique_lock<std::mutex> lockWallet(VendorId vendorId);

    // Single attempt against the given snapshot; empty if the wallet moved on.
    std::optional<LedgerEntry> tryApplyEntry(
        const VendorWallet& snapshot, const LedgerEntryDraft& draft);

    [[nodiscard]] ReconciliationReport reconcile(VendorId vendorId) const;

    [[nodiscard]] LedgerSignals& signals() noexcept { return m_signals; }
    [[nodiscard]] WalletRepository* repository() const noexcept { return m_repository; }
    [[nodiscard]] uint32_t maxCommitRetries() const noexcept { return m_maxCommitRetries; }

    // Pure: the wallet after the entry, or an invariant violation.
    [[nodiscard]] static VendorWallet applyToWallet(VendorWallet wallet, const LedgerEntry& entry);

private:
    [[nodiscard]] LedgerEntry makeEntry(const LedgerEntryDraft& draft) const;

    uint32_t m_maxCommitRetries;
    WalletRepository* m_repository;
    const escrow::Clock* m_clock;
    LedgerSignals m_signals;

    // Guards the lock map only.
    std::unique_ptr<std::shared_mutex> m_walletLocksMtx;
    std::map<VendorId, std::unique_ptr<std::mutex>> m_walletLocks;
};

//-------------------------------------------------------------------------

}  // namespace souk::accounting

//-------------------------------------------------------------------------
