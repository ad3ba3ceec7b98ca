/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "souk/config/PolicyConfig.hpp"
#include "souk/escrow/Clock.hpp"
#include "souk/util/common.hpp"
#include "souk/util/json_util.hpp"

//-------------------------------------------------------------------------

namespace souk::escrow
{

//-------------------------------------------------------------------------

struct EscrowResult
{
    Timestamp deliveryDate;
    Timestamp releaseDate;
    uint32_t holdDays;

    // Never stored: "now" keeps moving.
    [[nodiscard]] bool isReleased(Timestamp now) const noexcept { return now >= releaseDate; }
    [[nodiscard]] uint32_t daysRemaining(Timestamp now) const noexcept;

    void jsonSerialize(
        rapidjson::Document& json, Timestamp now, const std::string& key = {}) const;
};

//-------------------------------------------------------------------------

class EscrowScheduler
{
public:
    EscrowScheduler(const config::PolicyConfig& policy, const Clock* clock) noexcept;

    [[nodiscard]] EscrowResult computeRelease(Timestamp deliveryDate) const noexcept;
    [[nodiscard]] bool isReleased(const EscrowResult& result) const;
    [[nodiscard]] uint32_t daysRemaining(const EscrowResult& result) const;

    [[nodiscard]] const Clock* clock() const noexcept { return m_clock; }

private:
    uint32_t m_holdDays;
    const Clock* m_clock;
};

//-------------------------------------------------------------------------

}  // namespace souk::escrow

//-------------------------------------------------------------------------
