/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <stdexcept>
#include <string>

//-------------------------------------------------------------------------

namespace souk::pricing
{

//-------------------------------------------------------------------------

class InvalidPricingInput : public std::invalid_argument
{
public:
    InvalidPricingInput(std::string field, const std::string& msg);

    [[nodiscard]] const std::string& field() const noexcept { return m_field; }

private:
    std::string m_field;
};

//-------------------------------------------------------------------------

}  // namespace souk::pricing

//-------------------------------------------------------------------------
