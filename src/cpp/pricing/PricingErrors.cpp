/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "souk/pricing/PricingErrors.hpp"

//-------------------------------------------------------------------------

namespace souk::pricing
{

//-------------------------------------------------------------------------

InvalidPricingInput::InvalidPricingInput(std::string field, const std::string& msg)
    : std::invalid_argument{msg},
      m_field{std::move(field)}
{}

//-------------------------------------------------------------------------

}  // namespace souk::pricing

//-------------------------------------------------------------------------
