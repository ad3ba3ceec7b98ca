/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "souk/accounting/common.hpp"
#include "souk/util/JsonSerializable.hpp"

#include <boost/uuid/uuid.hpp>

//-------------------------------------------------------------------------

namespace souk::accounting
{

//-------------------------------------------------------------------------

using EntryId = boost::uuids::uuid;

//-------------------------------------------------------------------------

struct LedgerEntryDraft
{
    VendorId vendorId;
    std::optional<OrderRef> orderRef;
    TransactionType type;
    decimal_t amount;
    decimal_t vendorAmount;
    decimal_t commissionAmount{};
    decimal_t vatAmount{};
    std::string description;
    BalanceStatus status;
};

//-------------------------------------------------------------------------

// Written once, never edited. Corrections are offsetting entries.
class LedgerEntry : public JsonSerializable
{
public:
    LedgerEntry(EntryId id, LedgerEntryDraft draft, Timestamp createdAt) noexcept;

    [[nodiscard]] const EntryId& id() const noexcept { return m_id; }
    [[nodiscard]] VendorId vendorId() const noexcept { return m_draft.vendorId; }
    [[nodiscard]] std::optional<OrderRef> orderRef() const noexcept { return m_draft.orderRef; }
    [[nodiscard]] TransactionType type() const noexcept { return m_draft.type; }
    [[nodiscard]] decimal_t amount() const noexcept { return m_draft.amount; }
    [[nodiscard]] decimal_t vendorAmount() const noexcept { return m_draft.vendorAmount; }
    [[nodiscard]] decimal_t commissionAmount() const noexcept { return m_draft.commissionAmount; }
    [[nodiscard]] decimal_t vatAmount() const noexcept { return m_draft.vatAmount; }
    [[nodiscard]] const std::string& description() const noexcept { return m_draft.description; }
    [[nodiscard]] BalanceStatus status() const noexcept { return m_draft.status; }
    [[nodiscard]] Timestamp createdAt() const noexcept { return m_createdAt; }

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

    [[nodiscard]] static LedgerEntry fromJson(const rapidjson::Value& json);

private:
    EntryId m_id;
    LedgerEntryDraft m_draft;
    Timestamp m_createdAt;
};

//-------------------------------------------------------------------------

}  // namespace souk::accounting

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<souk::accounting::LedgerEntry>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const souk::accounting::LedgerEntry& entry, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "{} {} {} for vendor #{} ({})",
            entry.type(),
            entry.status(),
            entry.vendorAmount(),
            entry.vendorId(),
            entry.description());
    }
};

//-------------------------------------------------------------------------
