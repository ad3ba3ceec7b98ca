/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "souk/accounting/WalletRepository.hpp"

#include <mutex>
#include <shared_mutex>

//-------------------------------------------------------------------------

namespace souk::accounting
{

//-------------------------------------------------------------------------

class InMemoryWalletRepository : public WalletRepository
{
public:
    InMemoryWalletRepository() noexcept;

    virtual VendorWallet provision(VendorId vendorId, Timestamp createdAt) override;
    [[nodiscard]] virtual std::optional<VendorWallet> load(VendorId vendorId) const override;
    [[nodiscard]] virtual bool commit(
        const VendorWallet& updated, const LedgerEntry& entry) override;
    [[nodiscard]] virtual std::vector<LedgerEntry> entries(VendorId vendorId) const override;

    [[nodiscard]] size_t size() const;

    void checkpointSerialize(rapidjson::Document& json, const std::string& key = {}) const;

    [[nodiscard]] static std::unique_ptr<InMemoryWalletRepository> fromCheckpoint(
        const rapidjson::Value& json);

private:
    struct Slot
    {
        explicit Slot(VendorWallet wallet) noexcept : wallet{std::move(wallet)} {}

        mutable std::mutex mtx;
        VendorWallet wallet;
        std::vector<LedgerEntry> entries;
    };

    [[nodiscard]] Slot* slot(VendorId vendorId) const;

    // Guards the slot map only; each slot carries its own lock.
    std::unique_ptr<std::shared_mutex> m_mtx;
    std::map<VendorId, std::unique_ptr<Slot>> m_slots;
};

//-------------------------------------------------------------------------

}  // namespace souk::accounting

//-------------------------------------------------------------------------
