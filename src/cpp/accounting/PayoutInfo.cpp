/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "souk/accounting/PayoutInfo.hpp"

//-------------------------------------------------------------------------

namespace souk::accounting
{

//-------------------------------------------------------------------------

std::string PayoutInfo::toString() const
{
    switch (status) {
        case PayoutErrorCode::VALID:
            return fmt::format("Vendor #{} can withdraw {} of {}", vendorId, amount, availableBalance);
        case PayoutErrorCode::INVALID_AMOUNT:
            return fmt::format(
                "Attempt withdrawing non-positive amount of {} for vendor #{}", amount, vendorId);
        case PayoutErrorCode::BELOW_MINIMUM_THRESHOLD:
            return fmt::format(
                "Attempt withdrawing {} below the minimum payout of {} for vendor #{}",
                amount,
                minimumThreshold,
                vendorId);
        case PayoutErrorCode::INSUFFICIENT_BALANCE:
            return fmt::format(
                "Attempt withdrawing {} exceeding available balance of {} for vendor #{}",
                amount,
                availableBalance,
                vendorId);
        default:
            return fmt::format("Unknown payout status code {}", std::to_underlying(status));
    }
}

//-------------------------------------------------------------------------

}  // namespace souk::accounting

//-------------------------------------------------------------------------
