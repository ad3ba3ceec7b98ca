/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "souk/escrow/EscrowScheduler.hpp"

//-------------------------------------------------------------------------

namespace souk::escrow
{

//-------------------------------------------------------------------------

uint32_t EscrowResult::daysRemaining(Timestamp now) const noexcept
{
    if (isReleased(now)) return 0;
    return static_cast<uint32_t>(
        std::chrono::ceil<std::chrono::days>(releaseDate - now).count());
}

//-------------------------------------------------------------------------

void EscrowResult::jsonSerialize(
    rapidjson::Document& json, Timestamp now, const std::string& key) const
{
    auto serialize = [this, now](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember(
            "deliveryDate",
            rapidjson::Value{util::formatTimestamp(deliveryDate).c_str(), allocator},
            allocator);
        json.AddMember(
            "releaseDate",
            rapidjson::Value{util::formatTimestamp(releaseDate).c_str(), allocator},
            allocator);
        json.AddMember("holdDays", rapidjson::Value{holdDays}, allocator);
        json.AddMember("isReleased", rapidjson::Value{isReleased(now)}, allocator);
        json.AddMember("daysRemaining", rapidjson::Value{daysRemaining(now)}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

EscrowScheduler::EscrowScheduler(const config::PolicyConfig& policy, const Clock* clock) noexcept
    : m_holdDays{policy.escrowHoldDays},
      m_clock{clock}
{}

//-------------------------------------------------------------------------

EscrowResult EscrowScheduler::computeRelease(Timestamp deliveryDate) const noexcept
{
    return {
        .deliveryDate = deliveryDate,
        .releaseDate = deliveryDate + std::chrono::days{m_holdDays},
        .holdDays = m_holdDays
    };
}

//-------------------------------------------------------------------------

bool EscrowScheduler::isReleased(const EscrowResult& result) const
{
    return result.isReleased(m_clock->now());
}

//-------------------------------------------------------------------------

uint32_t EscrowScheduler::daysRemaining(const EscrowResult& result) const
{
    return result.daysRemaining(m_clock->now());
}

//-------------------------------------------------------------------------

}  // namespace souk::escrow

//-------------------------------------------------------------------------
