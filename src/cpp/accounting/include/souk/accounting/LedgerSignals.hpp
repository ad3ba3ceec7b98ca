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

struct LedgerSignals
{
    // Emitted after a successful commit with the wallet as stored.
    bs2::signal<void(const LedgerEntry&, const VendorWallet&)> entryApplied;
    // Emitted with the rejected entry, the untouched wallet and the reason.
    bs2::signal<void(const LedgerEntryDraft&, const VendorWallet&, const std::string&)>
        invariantViolation;
};

//-------------------------------------------------------------------------

}  // namespace souk::accounting

//-------------------------------------------------------------------------
