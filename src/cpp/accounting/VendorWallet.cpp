/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "souk/accounting/VendorWallet.hpp"

//-------------------------------------------------------------------------

namespace souk::accounting
{

//-------------------------------------------------------------------------

VendorWallet::VendorWallet(VendorId vendorId, Timestamp createdAt) noexcept
    : m_vendorId{vendorId},
      m_createdAt{createdAt}
{}

//-------------------------------------------------------------------------

void VendorWallet::checkConsistency(std::source_location sl) const
{
    if (m_pendingBalance < 0_dec || m_availableBalance < 0_dec) {
        throw NegativeBalanceViolation{fmt::format(
            "{}: Negative balance in wallet {}", sl.function_name(), *this)};
    }
    if (m_lifetimeEarnings - m_lifetimePayouts != m_pendingBalance + m_availableBalance) {
        throw AccountingIdentityViolation{fmt::format(
            "{}: Inconsistent accounting in wallet {} where earnings - payouts = {}"
            " is not equal to pending + available = {}",
            sl.function_name(),
            *this,
            m_lifetimeEarnings - m_lifetimePayouts,
            m_pendingBalance + m_availableBalance)};
    }
}

//-------------------------------------------------------------------------

bool VendorWallet::sameBalances(const VendorWallet& other) const noexcept
{
    return m_vendorId == other.m_vendorId
        && m_pendingBalance == other.m_pendingBalance
        && m_availableBalance == other.m_availableBalance
        && m_lifetimeEarnings == other.m_lifetimeEarnings
        && m_lifetimePayouts == other.m_lifetimePayouts;
}

//-------------------------------------------------------------------------

void VendorWallet::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("vendorId", rapidjson::Value{m_vendorId}, allocator);
        json::addDecimalMember(json, "pendingBalance", m_pendingBalance);
        json::addDecimalMember(json, "availableBalance", m_availableBalance);
        json::addDecimalMember(json, "lifetimeEarnings", m_lifetimeEarnings);
        json::addDecimalMember(json, "lifetimePayouts", m_lifetimePayouts);
        json.AddMember(
            "createdAt",
            rapidjson::Value{util::formatTimestamp(m_createdAt).c_str(), allocator},
            allocator);
        json.AddMember("version", rapidjson::Value{m_version}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

VendorWallet VendorWallet::fromJson(const rapidjson::Value& json)
{
    VendorWallet wallet{
        json["vendorId"].GetUint64(), util::parseTimestamp(json["createdAt"].GetString())};
    wallet.m_pendingBalance = json::getDecimal(json["pendingBalance"]);
    wallet.m_availableBalance = json::getDecimal(json["availableBalance"]);
    wallet.m_lifetimeEarnings = json::getDecimal(json["lifetimeEarnings"]);
    wallet.m_lifetimePayouts = json::getDecimal(json["lifetimePayouts"]);
    wallet.m_version = json["version"].GetUint64();
    wallet.checkConsistency();
    return wallet;
}

//-------------------------------------------------------------------------

}  // namespace souk::accounting

//-------------------------------------------------------------------------
