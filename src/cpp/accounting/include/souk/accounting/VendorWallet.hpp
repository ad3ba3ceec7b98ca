/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "souk/accounting/AccountingErrors.hpp"
#include "souk/util/JsonSerializable.hpp"
#include "souk/util/common.hpp"

//-------------------------------------------------------------------------

namespace souk::accounting
{

//-------------------------------------------------------------------------

/**
 * Running balances of one vendor. Only the accountant changes the balances
 * and only the repository advances the version; everyone else works on
 * snapshots.
 */
class VendorWallet : public JsonSerializable
{
public:
    VendorWallet(VendorId vendorId, Timestamp createdAt) noexcept;

    [[nodiscard]] VendorId vendorId() const noexcept { return m_vendorId; }
    [[nodiscard]] decimal_t pendingBalance() const noexcept { return m_pendingBalance; }
    [[nodiscard]] decimal_t availableBalance() const noexcept { return m_availableBalance; }
    [[nodiscard]] decimal_t lifetimeEarnings() const noexcept { return m_lifetimeEarnings; }
    [[nodiscard]] decimal_t lifetimePayouts() const noexcept { return m_lifetimePayouts; }
    [[nodiscard]] Timestamp createdAt() const noexcept { return m_createdAt; }
    // Optimistic concurrency token.
    [[nodiscard]] uint64_t version() const noexcept { return m_version; }

    // Throws NegativeBalanceViolation or AccountingIdentityViolation.
    void checkConsistency(std::source_location sl = std::source_location::current()) const;

    // Same balances, regardless of version.
    [[nodiscard]] bool sameBalances(const VendorWallet& other) const noexcept;

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

    [[nodiscard]] static VendorWallet fromJson(const rapidjson::Value& json);

private:
    VendorId m_vendorId;
    decimal_t m_pendingBalance{};
    decimal_t m_availableBalance{};
    decimal_t m_lifetimeEarnings{};
    decimal_t m_lifetimePayouts{};
    Timestamp m_createdAt;
    uint64_t m_version{};

    friend class LedgerAccountant;
    friend class WalletRepository;
};

//-------------------------------------------------------------------------

}  // namespace souk::accounting

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<souk::accounting::VendorWallet>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const souk::accounting::VendorWallet& wallet, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "#{} v{} (pending {} | available {} | earned {} | paid {})",
            wallet.vendorId(),
            wallet.version(),
            wallet.pendingBalance(),
            wallet.availableBalance(),
            wallet.lifetimeEarnings(),
            wallet.lifetimePayouts());
    }
};

//-------------------------------------------------------------------------
