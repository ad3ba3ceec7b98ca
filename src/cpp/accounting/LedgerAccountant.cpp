/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "souk/accounting/LedgerAccountant.hpp"

#include "souk/logging/logging.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

//-------------------------------------------------------------------------

namespace souk::accounting
{

//-------------------------------------------------------------------------

void ReconciliationReport::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        stored.jsonSerialize(json, "stored");
        replayed.jsonSerialize(json, "replayed");
        json.AddMember("entryCount", rapidjson::Value{uint64_t{entryCount}}, allocator);
        json.AddMember("consistent", rapidjson::Value{consistent()}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

LedgerAccountant::LedgerAccountant(
    const config::PolicyConfig& policy,
    WalletRepository* repository,
    const escrow::Clock* clock) noexcept
    : m_maxCommitRetries{std::max(policy.maxCommitRetries, 1u)},
      m_repository{repository},
      m_clock{clock},
      m_walletLocksMtx{std::make_unique<std::shared_mutex>()}
{}

//-------------------------------------------------------------------------

VendorWallet LedgerAccountant::provisionWallet(VendorId vendorId)
{
    auto wallet = m_repository->provision(vendorId, m_clock->now());
    logging::logger()->debug("Provisioned wallet for vendor #{}", vendorId);
    return wallet;
}

//-------------------------------------------------------------------------

VendorWallet LedgerAccountant::wallet(VendorId vendorId) const
{
    if (auto wallet = m_repository->load(vendorId)) {
        return std::move(wallet).value();
    }
    throw WalletNotFound{vendorId};
}

//-------------------------------------------------------------------------

std::vector<LedgerEntry> LedgerAccountant::entries(VendorId vendorId) const
{
    return m_repository->entries(vendorId);
}

//-------------------------------------------------------------------------

std::unique_lock<std::mutex> LedgerAccountant::lockWallet(VendorId vendorId)
{
    {
        std::shared_lock lock{*m_walletLocksMtx};
        if (auto it = m_walletLocks.find(vendorId); it != m_walletLocks.end()) {
            return std::unique_lock{*it->second};
        }
    }
    std::unique_lock lock{*m_walletLocksMtx};
    auto [it, inserted] = m_walletLocks.try_emplace(vendorId);
    if (inserted) {
        it->second = std::make_unique<std::mutex>();
    }
    return std::unique_lock{*it->second};
}

//-------------------------------------------------------------------------

LedgerEntry LedgerAccountant::applyEntry(const LedgerEntryDraft& draft)
{
    const auto walletLock = lockWallet(draft.vendorId);
    for (uint32_t attempt = 1; attempt <= m_maxCommitRetries; ++attempt) {
        if (auto entry = tryApplyEntry(wallet(draft.vendorId), draft)) {
            return std::move(entry).value();
        }
        logging::logger()->debug(
            "Commit conflict on wallet of vendor #{} (attempt {}/{})",
            draft.vendorId,
            attempt,
            m_maxCommitRetries);
    }
    logging::logger()->error(
        "Giving up on {} {} entry for vendor #{} after {} conflicting commits",
        draft.type,
        draft.status,
        draft.vendorId,
        m_maxCommitRetries);
    throw ConcurrencyConflict{draft.vendorId, m_maxCommitRetries};
}

//-------------------------------------------------------------------------

std::optional<LedgerEntry> LedgerAccountant::tryApplyEntry(
    const VendorWallet& snapshot, const LedgerEntryDraft& draft)
{
    if (snapshot.vendorId() != draft.vendorId) {
        throw std::invalid_argument{fmt::format(
            "{}: Entry for vendor #{} applied to wallet of vendor #{}",
            std::source_location::current().function_name(),
            draft.vendorId,
            snapshot.vendorId())};
    }

    LedgerEntry entry = makeEntry(draft);

    const VendorWallet updated = [&] {
        try {
            return applyToWallet(snapshot, entry);
        }
        catch (const std::runtime_error& e) {
            logging::logger()->error("Rejected ledger entry {}: {}", entry, e.what());
            m_signals.invariantViolation(draft, snapshot, e.what());
            throw;
        }
    }();

    if (!m_repository->commit(updated, entry)) {
        return std::nullopt;
    }

    logging::logger()->debug(
        "Applied entry {} to wallet of vendor #{}",
        boost::uuids::to_string(entry.id()),
        entry.vendorId());
    VendorWallet committed = updated;
    ++committed.m_version;
    m_signals.entryApplied(entry, committed);
    return entry;
}

//-------------------------------------------------------------------------

ReconciliationReport LedgerAccountant::reconcile(VendorId vendorId) const
{
    const VendorWallet stored = wallet(vendorId);
    const auto history = entries(vendorId);

    const VendorWallet replayed = ranges::accumulate(
        history,
        VendorWallet{vendorId, stored.createdAt()},
        [](VendorWallet acc, const LedgerEntry& entry) {
            return applyToWallet(std::move(acc), entry);
        });

    ReconciliationReport report{
        .stored = stored,
        .replayed = replayed,
        .entryCount = history.size()
    };
    if (!report.consistent()) {
        logging::logger()->warn(
            "Wallet {} drifted from its ledger history, which replays to {}", stored, replayed);
    }
    return report;
}

//-------------------------------------------------------------------------

// A negative PENDING or AVAILABLE amount (a REFUND, a correction) lowers the balance but
// not the earnings, so checkConsistency rejects it; such entries cannot be posted.
VendorWallet LedgerAccountant::applyToWallet(VendorWallet wallet, const LedgerEntry& entry)
{
    const decimal_t vendorAmount = entry.vendorAmount();

    switch (entry.status()) {
        case BalanceStatus::PENDING:
            wallet.m_pendingBalance += vendorAmount;
            if (vendorAmount > 0_dec) {
                wallet.m_lifetimeEarnings += vendorAmount;
            }
            break;
        case BalanceStatus::AVAILABLE:
            wallet.m_availableBalance += vendorAmount;
            if (vendorAmount > 0_dec) {
                wallet.m_lifetimeEarnings += vendorAmount;
            }
            break;
        case BalanceStatus::WITHDRAWN:
            wallet.m_availableBalance -= util::abs(vendorAmount);
            wallet.m_lifetimePayouts += util::abs(vendorAmount);
            break;
        default:
            throw std::invalid_argument{fmt::format(
                "{}: Unknown balance status {}",
                std::source_location::current().function_name(),
                std::to_underlying(entry.status()))};
    }

    wallet.checkConsistency();
    return wallet;
}

//-------------------------------------------------------------------------

LedgerEntry LedgerAccountant::makeEntry(const LedgerEntryDraft& draft) const
{
    thread_local boost::uuids::random_generator s_generator;
    return LedgerEntry{s_generator(), draft, m_clock->now()};
}

//-------------------------------------------------------------------------

}  // namespace souk::accounting

//-------------------------------------------------------------------------
