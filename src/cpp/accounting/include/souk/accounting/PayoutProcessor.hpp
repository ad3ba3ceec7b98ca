/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "souk/accounting/LedgerAccountant.hpp"
#include "souk/accounting/PayoutInfo.hpp"

#include <expected>

//-------------------------------------------------------------------------

namespace souk::accounting
{

//-------------------------------------------------------------------------

class PayoutProcessor
{
public:
    using Result = std::expected<LedgerEntry, PayoutErrorCode>;

    PayoutProcessor(const config::PolicyConfig& policy, LedgerAccountant* accountant) noexcept;

    // Checks in order: amount > 0, amount >= minimum, amount <= available.
    [[nodiscard]] PayoutInfo canPayout(const VendorWallet& wallet, decimal_t amount) const noexcept;

    // Rejections leave the wallet untouched. Throws WalletNotFound or ConcurrencyConflict.
    Result payout(VendorId vendorId, decimal_t amount, std::optional<std::string> note = {});

    [[nodiscard]] decimal_t minimumThreshold() const noexcept { return m_minimumThreshold; }

private:
    [[nodiscard]] LedgerEntryDraft makeDraft(
        VendorId vendorId, decimal_t amount, std::optional<std::string> note) const;

    decimal_t m_minimumThreshold;
    LedgerAccountant* m_accountant;
};

//-------------------------------------------------------------------------

}  // namespace souk::accounting

//-------------------------------------------------------------------------
