/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "souk/accounting/InMemoryWalletRepository.hpp"

//-------------------------------------------------------------------------

namespace souk::accounting
{

//-------------------------------------------------------------------------

InMemoryWalletRepository::InMemoryWalletRepository() noexcept
    : m_mtx{std::make_unique<std::shared_mutex>()}
{}

//-------------------------------------------------------------------------

VendorWallet InMemoryWalletRepository::provision(VendorId vendorId, Timestamp createdAt)
{
    std::unique_lock lock{*m_mtx};
    auto [it, inserted] = m_slots.try_emplace(vendorId);
    if (!inserted) {
        throw std::invalid_argument{fmt::format(
            "{}: Wallet of vendor #{} already provisioned",
            std::source_location::current().function_name(),
            vendorId)};
    }
    it->second = std::make_unique<Slot>(VendorWallet{vendorId, createdAt});
    return it->second->wallet;
}

//-------------------------------------------------------------------------

std::optional<VendorWallet> InMemoryWalletRepository::load(VendorId vendorId) const
{
    Slot* s = slot(vendorId);
    if (s == nullptr) return std::nullopt;
    std::scoped_lock lock{s->mtx};
    return s->wallet;
}

//-------------------------------------------------------------------------

bool InMemoryWalletRepository::commit(const VendorWallet& updated, const LedgerEntry& entry)
{
    Slot* s = slot(updated.vendorId());
    if (s == nullptr) {
        throw WalletNotFound{updated.vendorId()};
    }
    if (entry.vendorId() != updated.vendorId()) {
        throw std::invalid_argument{fmt::format(
            "{}: Entry of vendor #{} cannot be committed against wallet of vendor #{}",
            std::source_location::current().function_name(),
            entry.vendorId(),
            updated.vendorId())};
    }

    std::scoped_lock lock{s->mtx};
    if (s->wallet.version() != updated.version()) {
        return false;
    }
    s->entries.push_back(entry);
    s->wallet = updated;
    advanceVersion(s->wallet);
    return true;
}

//-------------------------------------------------------------------------

std::vector<LedgerEntry> InMemoryWalletRepository::entries(VendorId vendorId) const
{
    Slot* s = slot(vendorId);
    if (s == nullptr) {
        throw WalletNotFound{vendorId};
    }
    std::scoped_lock lock{s->mtx};
    return s->entries;
}

//-------------------------------------------------------------------------

size_t InMemoryWalletRepository::size() const
{
    std::shared_lock lock{*m_mtx};
    return m_slots.size();
}

//-------------------------------------------------------------------------

void InMemoryWalletRepository::checkpointSerialize(
    rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetArray();
        auto& allocator = json.GetAllocator();
        std::shared_lock lock{*m_mtx};
        for (const auto& [vendorId, s] : m_slots) {
            std::scoped_lock slotLock{s->mtx};
            rapidjson::Document slotJson{rapidjson::kObjectType, &allocator};
            s->wallet.jsonSerialize(slotJson, "wallet");
            rapidjson::Document entriesJson{rapidjson::kArrayType, &allocator};
            for (const auto& entry : s->entries) {
                rapidjson::Document entryJson{&allocator};
                entry.jsonSerialize(entryJson);
                entriesJson.PushBack(entryJson, allocator);
            }
            slotJson.AddMember("entries", entriesJson, allocator);
            json.PushBack(slotJson, allocator);
        }
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

std::unique_ptr<InMemoryWalletRepository> InMemoryWalletRepository::fromCheckpoint(
    const rapidjson::Value& json)
{
    auto repository = std::make_unique<InMemoryWalletRepository>();
    for (const auto& slotJson : json.GetArray()) {
        auto wallet = VendorWallet::fromJson(slotJson["wallet"]);
        const VendorId vendorId = wallet.vendorId();
        auto s = std::make_unique<Slot>(std::move(wallet));
        for (const auto& entryJson : slotJson["entries"].GetArray()) {
            s->entries.push_back(LedgerEntry::fromJson(entryJson));
        }
        if (!repository->m_slots.emplace(vendorId, std::move(s)).second) {
            throw std::invalid_argument{fmt::format(
                "{}: Duplicate wallet of vendor #{} in checkpoint",
                std::source_location::current().function_name(),
                vendorId)};
        }
    }
    return repository;
}

//-------------------------------------------------------------------------

InMemoryWalletRepository::Slot* InMemoryWalletRepository::slot(VendorId vendorId) const
{
    std::shared_lock lock{*m_mtx};
    if (auto it = m_slots.find(vendorId); it != m_slots.end()) {
        return it->second.get();
    }
    return nullptr;
}

//-------------------------------------------------------------------------

}  // namespace souk::accounting

//-------------------------------------------------------------------------
