/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "solvency/perpetuals/PerpInfo.hpp"

#include "solvency/valuation/valuation.hpp"

#include <utility>

//-------------------------------------------------------------------------

namespace solvency::perpetuals
{

//-------------------------------------------------------------------------

bigint_t PerpInfo::netNotional(const bigint_t& quantums, int32_t quoteAtomicResolution) const
{
    return valuation::notional(
        quantums, perpetual.params.atomicResolution, price, quoteAtomicResolution);
}

//-------------------------------------------------------------------------

uint32_t PerpInfo::initialMarginPpm(const margin::RiskParameters& params) const
{
    if (!params.scaleInitialMarginWithOpenInterest) {
        return liquidityTier.initialMarginPpm;
    }
    return liquidityTier.effectiveInitialMarginPpm(
        util::abs(netNotional(perpetual.openInterest, params.quoteAtomicResolution)));
}

//-------------------------------------------------------------------------

margin::Risk PerpInfo::positionRisk(
    const bigint_t& quantums, const margin::RiskParameters& params) const
{
    bigint_t notional = netNotional(quantums, params.quoteAtomicResolution);
    bigint_t imr = valuation::initialMargin(notional, initialMarginPpm(params));
    // Open interest only raises the initial requirement; maintenance stays a
    // fraction of the base initial margin.
    bigint_t mmr = valuation::maintenanceMargin(
        valuation::initialMargin(notional, liquidityTier.initialMarginPpm),
        liquidityTier.maintenanceFractionPpm);
    return {.nc = std::move(notional), .imr = std::move(imr), .mmr = std::move(mmr)};
}

//-------------------------------------------------------------------------

}  // namespace solvency::perpetuals

//-------------------------------------------------------------------------
