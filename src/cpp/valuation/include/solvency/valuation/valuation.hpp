/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "solvency/bigint/bigint.hpp"
#include "solvency/prices/MarketPrice.hpp"

//-------------------------------------------------------------------------

namespace solvency::valuation
{

/**
 * Quote-currency value of a quantity of an asset or perpetual:
 *
 *   quantums * price.price * 10^(atomicResolution + price.exponent - quoteAtomicResolution)
 *
 * computed exactly. A negative combined exponent divides by the power of ten,
 * truncating toward zero.
 */
[[nodiscard]] bigint_t notional(
    const bigint_t& quantums,
    int32_t atomicResolution,
    const prices::MarketPrice& price,
    int32_t quoteAtomicResolution);

// |notional| * initialMarginPpm / 1'000'000, truncated toward zero.
[[nodiscard]] bigint_t initialMargin(const bigint_t& notional, uint32_t initialMarginPpm);

// initialMargin * maintenanceFractionPpm / 1'000'000, truncated toward zero.
[[nodiscard]] bigint_t maintenanceMargin(
    const bigint_t& initialMargin, uint32_t maintenanceFractionPpm);

}  // namespace solvency::valuation

//-------------------------------------------------------------------------
