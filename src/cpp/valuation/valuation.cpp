/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "solvency/valuation/valuation.hpp"

//-------------------------------------------------------------------------

namespace solvency::valuation
{

//-------------------------------------------------------------------------

bigint_t notional(
    const bigint_t& quantums,
    int32_t atomicResolution,
    const prices::MarketPrice& price,
    int32_t quoteAtomicResolution)
{
    const int64_t exponent = int64_t{atomicResolution} + price.exponent - quoteAtomicResolution;

    bigint_t value = quantums * price.price;
    if (exponent >= 0) {
        value *= util::pow10(static_cast<uint32_t>(exponent));
    } else {
        value /= util::pow10(static_cast<uint32_t>(-exponent));
    }
    return value;
}

//-------------------------------------------------------------------------

bigint_t initialMargin(const bigint_t& notional, uint32_t initialMarginPpm)
{
    return util::mulPpm(util::abs(notional), initialMarginPpm);
}

//-------------------------------------------------------------------------

bigint_t maintenanceMargin(const bigint_t& initialMargin, uint32_t maintenanceFractionPpm)
{
    return util::mulPpm(initialMargin, maintenanceFractionPpm);
}

//-------------------------------------------------------------------------

}  // namespace solvency::valuation

//-------------------------------------------------------------------------
