/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "souk/accounting/PayoutProcessor.hpp"

#include "souk/logging/logging.hpp"

//-------------------------------------------------------------------------

namespace souk::accounting
{

//-------------------------------------------------------------------------

PayoutProcessor::PayoutProcessor(
    const config::PolicyConfig& policy, LedgerAccountant* accountant) noexcept
    : m_minimumThreshold{policy.minimumPayoutThreshold},
      m_accountant{accountant}
{}

//-------------------------------------------------------------------------

PayoutInfo PayoutProcessor::canPayout(const VendorWallet& wallet, decimal_t amount) const noexcept
{
    PayoutInfo info{
        .vendorId = wallet.vendorId(),
        .amount = amount,
        .availableBalance = wallet.availableBalance(),
        .minimumThreshold = m_minimumThreshold,
        .status = PayoutErrorCode::VALID
    };
    if (!(amount > 0_dec)) {
        info.status = PayoutErrorCode::INVALID_AMOUNT;
    }
    else if (amount < m_minimumThreshold) {
        info.status = PayoutErrorCode::BELOW_MINIMUM_THRESHOLD;
    }
    else if (amount > wallet.availableBalance()) {
        info.status = PayoutErrorCode::INSUFFICIENT_BALANCE;
    }
    return info;
}

//-------------------------------------------------------------------------

PayoutProcessor::Result PayoutProcessor::payout(
    VendorId vendorId, decimal_t amount, std::optional<std::string> note)
{
    const auto draft = makeDraft(vendorId, amount, std::move(note));
    const uint32_t maxAttempts = m_accountant->maxCommitRetries();
    const auto walletLock = m_accountant->lockWallet(vendorId);

    for (uint32_t attempt = 1; attempt <= maxAttempts; ++attempt) {
        // Validated against every fresh snapshot.
        const VendorWallet snapshot = m_accountant->wallet(vendorId);
        if (const auto info = canPayout(snapshot, amount); !info.valid()) {
            logging::logger()->info("Payout rejected: {}", info.toString());
            return std::unexpected{info.status};
        }
        if (auto entry = m_accountant->tryApplyEntry(snapshot, draft)) {
            logging::logger()->info("Paid out {} to vendor #{}", amount, vendorId);
            return std::move(entry).value();
        }
        logging::logger()->debug(
            "Payout of {} for vendor #{} lost a commit race (attempt {}/{})",
            amount,
            vendorId,
            attempt,
            maxAttempts);
    }
    throw ConcurrencyConflict{vendorId, maxAttempts};
}

//-------------------------------------------------------------------------

LedgerEntryDraft PayoutProcessor::makeDraft(
    VendorId vendorId, decimal_t amount, std::optional<std::string> note) const
{
    return {
        .vendorId = vendorId,
        .orderRef = std::nullopt,
        .type = TransactionType::PAYOUT,
        .amount = -amount,
        .vendorAmount = -amount,
        .commissionAmount = 0_dec,
        .vatAmount = 0_dec,
        .description = std::move(note).value_or(
            fmt::format("Payout of {} to vendor bank account", amount)),
        .status = BalanceStatus::WITHDRAWN
    };
}

//-------------------------------------------------------------------------

}  // namespace souk::accounting

//-------------------------------------------------------------------------
