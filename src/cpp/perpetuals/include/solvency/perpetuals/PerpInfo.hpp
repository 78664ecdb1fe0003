/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "solvency/margin/Risk.hpp"
#include "solvency/margin/RiskParameters.hpp"
#include "solvency/perpetuals/LiquidityTier.hpp"
#include "solvency/perpetuals/Perpetual.hpp"
#include "solvency/prices/MarketPrice.hpp"

#include <map>

//-------------------------------------------------------------------------

namespace solvency::perpetuals
{

//-------------------------------------------------------------------------

// Everything needed to value and margin positions in one perpetual.
struct PerpInfo
{
    Perpetual perpetual;
    prices::MarketPrice price;
    LiquidityTier liquidityTier;

    [[nodiscard]] bigint_t netNotional(
        const bigint_t& quantums, int32_t quoteAtomicResolution) const;

    [[nodiscard]] uint32_t initialMarginPpm(const margin::RiskParameters& params) const;

    // Contribution of a position of the given size: its notional to NC and
    // its margin requirements to IMR and MMR.
    [[nodiscard]] margin::Risk positionRisk(
        const bigint_t& quantums, const margin::RiskParameters& params) const;
};

using PerpInfos = std::map<PerpetualId, PerpInfo>;

//-------------------------------------------------------------------------

}  // namespace solvency::perpetuals

//-------------------------------------------------------------------------
