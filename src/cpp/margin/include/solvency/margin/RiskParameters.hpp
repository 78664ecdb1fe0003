/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "solvency/assets/Asset.hpp"

#include <pugixml.hpp>

//-------------------------------------------------------------------------

namespace solvency::margin
{

// Protocol-wide constants of one risk computation.
struct RiskParameters
{
    AssetId quoteAssetId = assets::kQuoteAssetId;
    int32_t quoteAtomicResolution = assets::kQuoteAtomicResolution;
    bool scaleInitialMarginWithOpenInterest = false;

    [[nodiscard]] static RiskParameters fromXML(pugi::xml_node node);
};

}  // namespace solvency::margin

//-------------------------------------------------------------------------
