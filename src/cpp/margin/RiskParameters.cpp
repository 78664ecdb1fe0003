/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "solvency/margin/RiskParameters.hpp"

//-------------------------------------------------------------------------

namespace solvency::margin
{

//-------------------------------------------------------------------------

RiskParameters RiskParameters::fromXML(pugi::xml_node node)
{
    const RiskParameters defaults;
    return {
        .quoteAssetId = node.attribute("quoteAssetId").as_uint(defaults.quoteAssetId),
        .quoteAtomicResolution =
            node.attribute("quoteAtomicResolution").as_int(defaults.quoteAtomicResolution),
        .scaleInitialMarginWithOpenInterest = node.attribute("scaleInitialMarginWithOpenInterest")
            .as_bool(defaults.scaleInitialMarginWithOpenInterest)
    };
}

//-------------------------------------------------------------------------

}  // namespace solvency::margin

//-------------------------------------------------------------------------
