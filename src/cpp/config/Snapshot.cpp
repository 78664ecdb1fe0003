/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "solvency/config/Snapshot.hpp"

#include <fmt/format.h>

#include <map>
#include <source_location>
#include <stdexcept>
#include <utility>

//-------------------------------------------------------------------------

namespace solvency::config
{

//-------------------------------------------------------------------------

namespace
{

[[nodiscard]] pugi::xml_node requireChild(
    pugi::xml_node node, const char* name, const std::source_location& sl)
{
    pugi::xml_node child = node.child(name);
    if (!child) {
        throw std::invalid_argument{fmt::format(
            "{}: Missing required node '{}' under '{}'", sl.function_name(), name, node.name())};
    }
    return child;
}

//-------------------------------------------------------------------------

template<typename T>
[[nodiscard]] std::map<uint32_t, T> parseUniqueById(
    pugi::xml_node section,
    const char* childName,
    auto&& idOf,
    const std::source_location& sl)
{
    std::map<uint32_t, T> items;
    for (pugi::xml_node child : section.children(childName)) {
        T item = T::fromXML(child);
        const uint32_t id = idOf(item);
        if (!items.try_emplace(id, std::move(item)).second) {
            throw std::invalid_argument{fmt::format(
                "{}: Duplicate {} id {}", sl.function_name(), childName, id)};
        }
    }
    return items;
}

//-------------------------------------------------------------------------

using MarketPrices = std::map<MarketId, prices::MarketPrice>;

[[nodiscard]] MarketPrices makeMarketPrices(pugi::xml_node node)
{
    static constexpr auto sl = std::source_location::current();

    return parseUniqueById<prices::MarketPrice>(
        requireChild(node, "MarketPrices", sl),
        "MarketPrice",
        [](const auto& price) { return price.id; },
        sl);
}

//-------------------------------------------------------------------------

[[nodiscard]] perpetuals::PerpInfos makePerpInfos(
    pugi::xml_node node, const MarketPrices& pricesById)
{
    static constexpr auto sl = std::source_location::current();

    const auto tiersById = parseUniqueById<perpetuals::LiquidityTier>(
        requireChild(node, "LiquidityTiers", sl),
        "LiquidityTier",
        [](const auto& tier) { return tier.id; },
        sl);
    auto perpsById = parseUniqueById<perpetuals::Perpetual>(
        requireChild(node, "Perpetuals", sl),
        "Perpetual",
        [](const auto& perp) { return perp.id(); },
        sl);

    perpetuals::PerpInfos perpInfos;
    for (auto& [perpetualId, perp] : perpsById) {
        auto tierIt = tiersById.find(perp.params.liquidityTierId);
        if (tierIt == tiersById.end()) {
            throw std::invalid_argument{fmt::format(
                "{}: Perpetual {} references unknown liquidity tier {}",
                sl.function_name(),
                perpetualId,
                perp.params.liquidityTierId)};
        }
        auto priceIt = pricesById.find(perp.params.marketId);
        if (priceIt == pricesById.end()) {
            throw std::invalid_argument{fmt::format(
                "{}: Perpetual {} references unknown market {}",
                sl.function_name(),
                perpetualId,
                perp.params.marketId)};
        }
        perpInfos.emplace(
            perpetualId,
            perpetuals::PerpInfo{
                .perpetual = std::move(perp),
                .price = priceIt->second,
                .liquidityTier = tierIt->second
            });
    }

    return perpInfos;
}

//-------------------------------------------------------------------------

[[nodiscard]] assets::AssetInfos makeAssetInfos(
    pugi::xml_node node,
    const MarketPrices& pricesById,
    const margin::RiskParameters& riskParameters)
{
    static constexpr auto sl = std::source_location::current();

    assets::AssetInfos assetInfos;
    pugi::xml_node assetsNode = node.child("Assets");
    if (!assetsNode) return assetInfos;

    auto assetsById = parseUniqueById<assets::Asset>(
        assetsNode, "Asset", [](const auto& asset) { return asset.id; }, sl);

    for (auto& [assetId, asset] : assetsById) {
        asset.validate(riskParameters.quoteAssetId);
        // The quote asset counts 1:1 and needs no price.
        if (assetId == riskParameters.quoteAssetId) continue;
        auto priceIt = pricesById.find(asset.marketId.value());
        if (priceIt == pricesById.end()) {
            throw std::invalid_argument{fmt::format(
                "{}: Asset {} references unknown market {}",
                sl.function_name(),
                asset,
                asset.marketId.value())};
        }
        assetInfos.emplace(
            assetId, assets::AssetInfo{.asset = std::move(asset), .price = priceIt->second});
    }

    return assetInfos;
}

//-------------------------------------------------------------------------

[[nodiscard]] subaccounts::SettledUpdate makeSettledUpdate(pugi::xml_node node)
{
    static constexpr auto sl = std::source_location::current();

    subaccounts::SettledUpdate settledUpdate{
        .settledSubaccount =
            subaccounts::Subaccount::fromXML(requireChild(node, "Subaccount", sl))
    };

    pugi::xml_node updatesNode = node.child("Updates");
    for (pugi::xml_node child : updatesNode.children("PerpetualUpdate")) {
        settledUpdate.perpetualUpdates.push_back(subaccounts::PerpetualUpdate::fromXML(child));
    }
    for (pugi::xml_node child : updatesNode.children("AssetUpdate")) {
        settledUpdate.assetUpdates.push_back(subaccounts::AssetUpdate::fromXML(child));
    }

    return settledUpdate;
}

}  // namespace

//-------------------------------------------------------------------------

Snapshot Snapshot::fromXML(pugi::xml_node node)
{
    static constexpr auto sl = std::source_location::current();

    if (!node) {
        throw std::invalid_argument{fmt::format("{}: Missing snapshot node", sl.function_name())};
    }

    auto riskParameters = margin::RiskParameters::fromXML(node.child("Protocol"));
    const auto pricesById = makeMarketPrices(node);
    auto assetInfos = makeAssetInfos(node, pricesById, riskParameters);

    return {
        .logging = log::LoggingConfig::fromXML(node.child("Logging")),
        .riskParameters = std::move(riskParameters),
        .perpInfos = makePerpInfos(node, pricesById),
        .assetInfos = std::move(assetInfos),
        .settledUpdate = makeSettledUpdate(node)
    };
}

//-------------------------------------------------------------------------

Snapshot loadSnapshot(const fs::path& path)
{
    static constexpr auto sl = std::source_location::current();

    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(path.c_str());
    if (!result) {
        throw std::invalid_argument{fmt::format(
            "{}: Failed to load '{}': {} (offset {})",
            sl.function_name(),
            path.string(),
            result.description(),
            result.offset)};
    }
    log::logger().info("'{}' loaded successfully", path.string());

    return Snapshot::fromXML(doc.child("Solvency"));
}

//-------------------------------------------------------------------------

}  // namespace solvency::config

//-------------------------------------------------------------------------
