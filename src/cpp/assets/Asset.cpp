/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "solvency/assets/Asset.hpp"

#include <source_location>
#include <stdexcept>

//-------------------------------------------------------------------------

namespace solvency::assets
{

//-------------------------------------------------------------------------

void Asset::validate(AssetId quoteAssetId) const
{
    static constexpr auto sl = std::source_location::current();

    if (symbol.empty()) {
        throw std::invalid_argument{fmt::format(
            "{}: Asset {} has an empty symbol", sl.function_name(), id)};
    }
    if (id != quoteAssetId && !marketId.has_value()) {
        throw std::invalid_argument{fmt::format(
            "{}: Non-quote asset {} ({}) must reference a market",
            sl.function_name(),
            id,
            symbol)};
    }
}

//-------------------------------------------------------------------------

Asset Asset::fromXML(pugi::xml_node node)
{
    return {
        .id = node.attribute("id").as_uint(),
        .symbol = node.attribute("symbol").as_string(),
        .atomicResolution = node.attribute("atomicResolution").as_int(),
        .marketId = node.attribute("marketId")
            ? std::make_optional<MarketId>(node.attribute("marketId").as_uint())
            : std::nullopt
    };
}

//-------------------------------------------------------------------------

}  // namespace solvency::assets

//-------------------------------------------------------------------------
