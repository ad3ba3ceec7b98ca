/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "souk/util/common.hpp"

//-------------------------------------------------------------------------

namespace souk::accounting
{

//-------------------------------------------------------------------------

class WalletNotFound : public std::out_of_range
{
public:
    explicit WalletNotFound(VendorId vendorId);

    [[nodiscard]] VendorId vendorId() const noexcept { return m_vendorId; }

private:
    VendorId m_vendorId;
};

//-------------------------------------------------------------------------

// Invariant violations: the operation is aborted before anything is committed.

class NegativeBalanceViolation : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class AccountingIdentityViolation : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

//-------------------------------------------------------------------------

class ConcurrencyConflict : public std::runtime_error
{
public:
    ConcurrencyConflict(VendorId vendorId, uint32_t attempts);

    [[nodiscard]] VendorId vendorId() const noexcept { return m_vendorId; }
    [[nodiscard]] uint32_t attempts() const noexcept { return m_attempts; }

private:
    VendorId m_vendorId;
    uint32_t m_attempts;
};

//-------------------------------------------------------------------------

}  // namespace souk::accounting

//-------------------------------------------------------------------------
