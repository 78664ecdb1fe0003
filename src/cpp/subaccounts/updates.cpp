/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "solvency/subaccounts/updates.hpp"

#include "solvency/util/ContractViolation.hpp"
#include "solvency/util/Logging.hpp"
#include "solvency/valuation/valuation.hpp"

#include <map>
#include <source_location>
#include <string>
#include <utility>

//-------------------------------------------------------------------------

namespace solvency::subaccounts
{

//-------------------------------------------------------------------------

namespace
{

// Held + delta for every perpetual either held or updated.
[[nodiscard]] std::map<PerpetualId, bigint_t> effectivePerpetualQuantums(
    const SettledUpdate& update)
{
    const auto& subaccount = update.settledSubaccount;
    std::map<PerpetualId, bigint_t> quantums;
    for (const auto& perpetualUpdate : update.perpetualUpdates) {
        quantums[perpetualUpdate.perpetualId] += perpetualUpdate.quantumsDelta;
    }
    for (auto& [perpetualId, delta] : quantums) {
        delta += subaccount.perpetualQuantums(perpetualId);
    }
    for (PerpetualId perpetualId : subaccount.perpetualPositions | views::keys) {
        quantums.try_emplace(perpetualId, subaccount.perpetualQuantums(perpetualId));
    }
    return quantums;
}

//-------------------------------------------------------------------------

[[nodiscard]] std::map<AssetId, bigint_t> effectiveAssetQuantums(const SettledUpdate& update)
{
    const auto& subaccount = update.settledSubaccount;
    std::map<AssetId, bigint_t> quantums;
    for (const auto& assetUpdate : update.assetUpdates) {
        quantums[assetUpdate.assetId] += assetUpdate.quantumsDelta;
    }
    for (auto& [assetId, delta] : quantums) {
        delta += subaccount.assetQuantums(assetId);
    }
    for (AssetId assetId : subaccount.assetPositions | views::keys) {
        quantums.try_emplace(assetId, subaccount.assetQuantums(assetId));
    }
    return quantums;
}

//-------------------------------------------------------------------------

[[nodiscard]] const perpetuals::PerpInfo& lookupPerpInfo(
    const perpetuals::PerpInfos& perpInfos,
    PerpetualId perpetualId,
    const SubaccountId& subaccountId,
    const std::source_location& sl)
{
    if (auto it = perpInfos.find(perpetualId); it != perpInfos.end()) {
        return it->second;
    }
    const std::string msg = fmt::format(
        "{}: No PerpInfo for perpetual {} referenced by subaccount {}",
        sl.function_name(),
        perpetualId,
        subaccountId);
    log::logger().critical(msg);
    throw ContractViolation{msg};
}

//-------------------------------------------------------------------------

[[nodiscard]] margin::Risk computeRisk(
    const SettledUpdate& update,
    const perpetuals::PerpInfos& perpInfos,
    const assets::AssetInfos* assetInfos,
    const margin::RiskParameters& params,
    const std::source_location& sl)
{
    const auto& subaccountId = update.settledSubaccount.id;
    auto& logger = log::logger();

    margin::Risk risk;

    for (const auto& [perpetualId, quantums] : effectivePerpetualQuantums(update)) {
        const auto& perpInfo = lookupPerpInfo(perpInfos, perpetualId, subaccountId, sl);
        const margin::Risk positionRisk = perpInfo.positionRisk(quantums, params);
        logger.trace(
            "{} perpetual {} @ {} quantums: {}", subaccountId, perpetualId, quantums, positionRisk);
        risk += positionRisk;
    }

    for (const auto& [assetId, quantums] : effectiveAssetQuantums(update)) {
        if (assetId == params.quoteAssetId) {
            logger.trace("{} quote asset {} @ {} quantums", subaccountId, assetId, quantums);
            risk.nc += quantums;
            continue;
        }
        if (assetInfos == nullptr) continue;
        auto it = assetInfos->find(assetId);
        if (it == assetInfos->end()) {
            logger.trace("{} asset {} has no price, left unvalued", subaccountId, assetId);
            continue;
        }
        const auto& [asset, price] = it->second;
        bigint_t notional = valuation::notional(
            quantums, asset.atomicResolution, price, params.quoteAtomicResolution);
        logger.trace(
            "{} asset {} @ {} quantums: notional {}", subaccountId, asset, quantums, notional);
        risk.nc += notional;
    }

    logger.debug("{} risk: {}", subaccountId, risk);

    return risk;
}

}  // namespace

//-------------------------------------------------------------------------

margin::Risk getRiskForSubaccount(
    const SettledUpdate& update,
    const perpetuals::PerpInfos& perpInfos,
    const margin::RiskParameters& params)
{
    return computeRisk(update, perpInfos, nullptr, params, std::source_location::current());
}

//-------------------------------------------------------------------------

margin::Risk getRiskForSubaccount(
    const SettledUpdate& update,
    const perpetuals::PerpInfos& perpInfos,
    const assets::AssetInfos& assetInfos,
    const margin::RiskParameters& params)
{
    return computeRisk(update, perpInfos, &assetInfos, params, std::source_location::current());
}

//-------------------------------------------------------------------------

UpdateResult isValidStateTransitionForUndercollateralizedSubaccount(
    const margin::Risk& curRisk, const margin::Risk& newRisk) noexcept
{
    const UpdateResult result = [&] {
        if (curRisk.mmr.sign() == 0) {
            return newRisk.mmr.sign() == 0 && newRisk.nc > curRisk.nc
                ? UpdateResult::SUCCESS
                : UpdateResult::STILL_UNDERCOLLATERALIZED;
        }
        return newRisk.nc.sign() >= 0
            ? UpdateResult::SUCCESS
            : UpdateResult::STILL_UNDERCOLLATERALIZED;
    }();

    log::logger().debug(
        "Undercollateralized transition {} -> {}: {}", curRisk, newRisk, result);

    return result;
}

//-------------------------------------------------------------------------

Subaccount applyUpdates(const SettledUpdate& update, const perpetuals::PerpInfos& perpInfos)
{
    static constexpr auto ctx = std::source_location::current();

    const auto& settled = update.settledSubaccount;
    Subaccount result{.id = settled.id};

    for (auto&& [perpetualId, quantums] : effectivePerpetualQuantums(update)) {
        if (quantums.sign() == 0) continue;
        auto it = settled.perpetualPositions.find(perpetualId);
        bigint_t fundingIndex = it != settled.perpetualPositions.end()
            ? it->second.fundingIndex
            : lookupPerpInfo(perpInfos, perpetualId, settled.id, ctx).perpetual.fundingIndex;
        result.addPerpetualPosition({
            .perpetualId = perpetualId,
            .quantums = std::move(quantums),
            .fundingIndex = std::move(fundingIndex)
        });
    }

    for (auto&& [assetId, quantums] : effectiveAssetQuantums(update)) {
        if (quantums.sign() == 0) continue;
        result.addAssetPosition({.assetId = assetId, .quantums = std::move(quantums)});
    }

    return result;
}

//-------------------------------------------------------------------------

}  // namespace solvency::subaccounts

//-------------------------------------------------------------------------
