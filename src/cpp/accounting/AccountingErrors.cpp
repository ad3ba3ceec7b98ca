/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "souk/accounting/AccountingErrors.hpp"

//-------------------------------------------------------------------------

namespace souk::accounting
{

//-------------------------------------------------------------------------

WalletNotFound::WalletNotFound(VendorId vendorId)
    : std::out_of_range{fmt::format("No wallet provisioned for vendor #{}", vendorId)},
      m_vendorId{vendorId}
{}

//-------------------------------------------------------------------------

ConcurrencyConflict::ConcurrencyConflict(VendorId vendorId, uint32_t attempts)
    : std::runtime_error{fmt::format(
        "Wallet of vendor #{} kept changing underneath {} commit attempts", vendorId, attempts)},
      m_vendorId{vendorId},
      m_attempts{attempts}
{}

//-------------------------------------------------------------------------

}  // namespace souk::accounting

//-------------------------------------------------------------------------
