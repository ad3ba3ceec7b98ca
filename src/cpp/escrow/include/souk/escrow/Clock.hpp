/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "souk/util/Timestamp.hpp"

//-------------------------------------------------------------------------

namespace souk::escrow
{

//-------------------------------------------------------------------------

struct Clock
{
    virtual ~Clock() noexcept = default;

    [[nodiscard]] virtual Timestamp now() const = 0;
};

//-------------------------------------------------------------------------

struct SystemClock : Clock
{
    [[nodiscard]] virtual Timestamp now() const override
    {
        return std::chrono::time_point_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now());
    }
};

//-------------------------------------------------------------------------

}  // namespace souk::escrow

//-------------------------------------------------------------------------
