/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "souk/accounting/LedgerEntry.hpp"

#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

//-------------------------------------------------------------------------

namespace souk::accounting
{

//-------------------------------------------------------------------------

LedgerEntry::LedgerEntry(EntryId id, LedgerEntryDraft draft, Timestamp createdAt) noexcept
    : m_id{id},
      m_draft{std::move(draft)},
      m_createdAt{createdAt}
{}

//-------------------------------------------------------------------------

void LedgerEntry::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember(
            "id", rapidjson::Value{boost::uuids::to_string(m_id).c_str(), allocator}, allocator);
        json.AddMember("vendorId", rapidjson::Value{m_draft.vendorId}, allocator);
        json::setOptionalMember(json, "orderRef", m_draft.orderRef);
        json.AddMember(
            "type",
            rapidjson::Value{std::string{magic_enum::enum_name(m_draft.type)}.c_str(), allocator},
            allocator);
        json::addDecimalMember(json, "amount", m_draft.amount);
        json::addDecimalMember(json, "vendorAmount", m_draft.vendorAmount);
        json::addDecimalMember(json, "commissionAmount", m_draft.commissionAmount);
        json::addDecimalMember(json, "vatAmount", m_draft.vatAmount);
        json.AddMember(
            "description", rapidjson::Value{m_draft.description.c_str(), allocator}, allocator);
        json.AddMember(
            "status",
            rapidjson::Value{
                std::string{magic_enum::enum_name(m_draft.status)}.c_str(), allocator},
            allocator);
        json.AddMember(
            "createdAt",
            rapidjson::Value{util::formatTimestamp(m_createdAt).c_str(), allocator},
            allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

LedgerEntry LedgerEntry::fromJson(const rapidjson::Value& json)
{
    return LedgerEntry{
        boost::uuids::string_generator{}(std::string{json["id"].GetString()}),
        LedgerEntryDraft{
            .vendorId = json["vendorId"].GetUint64(),
            .orderRef = !json["orderRef"].IsNull()
                ? std::make_optional<OrderRef>(json["orderRef"].GetUint64())
                : std::nullopt,
            .type = parseEnum<TransactionType>(json["type"].GetString()),
            .amount = json::getDecimal(json["amount"]),
            .vendorAmount = json::getDecimal(json["vendorAmount"]),
            .commissionAmount = json::getDecimal(json["commissionAmount"]),
            .vatAmount = json::getDecimal(json["vatAmount"]),
            .description = json["description"].GetString(),
            .status = parseEnum<BalanceStatus>(json["status"].GetString())
        },
        util::parseTimestamp(json["createdAt"].GetString())};
}

//-------------------------------------------------------------------------

}  // namespace souk::accounting

//-------------------------------------------------------------------------
