/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "solvency/prices/MarketPrice.hpp"
#include "solvency/util/common.hpp"

#include <fmt/format.h>
#include <pugixml.hpp>

#include <map>
#include <optional>
#include <string>

//-------------------------------------------------------------------------

namespace solvency::assets
{

//-------------------------------------------------------------------------

// The quote asset (USDC) is valued 1:1 against net collateral.
inline constexpr AssetId kQuoteAssetId = 0;
inline constexpr int32_t kQuoteAtomicResolution = -6;

//-------------------------------------------------------------------------

struct Asset
{
    AssetId id{};
    std::string symbol;
    int32_t atomicResolution{};
    std::optional<MarketId> marketId;

    void validate(AssetId quoteAssetId = kQuoteAssetId) const;

    [[nodiscard]] static Asset fromXML(pugi::xml_node node);
};

//-------------------------------------------------------------------------

// Price/resolution pairing for a non-quote collateral asset.
struct AssetInfo
{
    Asset asset;
    prices::MarketPrice price;
};

using AssetInfos = std::map<AssetId, AssetInfo>;

//-------------------------------------------------------------------------

}  // namespace solvency::assets

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<solvency::assets::Asset>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const solvency::assets::Asset& asset, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "Asset{{.id = {}, .symbol = {}, .atomicResolution = {}}}",
            asset.id,
            asset.symbol,
            asset.atomicResolution);
    }
};

//-------------------------------------------------------------------------
