/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "souk/accounting/LedgerEntry.hpp"
#include "souk/accounting/VendorWallet.hpp"

//-------------------------------------------------------------------------

namespace souk::accounting
{

//-------------------------------------------------------------------------

/**
 * Wallet and ledger persistence. A commit stores the updated wallet and
 * appends its ledger entry as one unit, and only if nobody else committed
 * against the wallet since the snapshot was loaded.
 */
class WalletRepository
{
public:
    virtual ~WalletRepository() noexcept = default;

    // Throws std::invalid_argument if the vendor already has a wallet.
    virtual VendorWallet provision(VendorId vendorId, Timestamp createdAt) = 0;

    [[nodiscard]] virtual std::optional<VendorWallet> load(VendorId vendorId) const = 0;

    // False if the stored version differs from the snapshot's; nothing is written then.
    [[nodiscard]] virtual bool commit(const VendorWallet& updated, const LedgerEntry& entry) = 0;

    [[nodiscard]] virtual std::vector<LedgerEntry> entries(VendorId vendorId) const = 0;

protected:
    WalletRepository() noexcept = default;

    static void advanceVersion(VendorWallet& wallet) noexcept { ++wallet.m_version; }
};

//-------------------------------------------------------------------------

}  // namespace souk::accounting

//-------------------------------------------------------------------------
