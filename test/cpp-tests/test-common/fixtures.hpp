/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "solvency/perpetuals/PerpInfo.hpp"
#include "solvency/subaccounts/Update.hpp"

#include <fmt/format.h>

//-------------------------------------------------------------------------

namespace solvency::test
{

struct PerpInfoParams
{
    PerpetualId id{};
    uint64_t price{};
    int32_t exponent{};
    int32_t atomicResolution = -6;
    uint32_t initialMarginPpm = 100'000;
    uint32_t maintenanceFractionPpm = 500'000;
};

[[nodiscard]] inline perpetuals::PerpInfo makePerpInfo(const PerpInfoParams& params)
{
    return {
        .perpetual = {
            .params = {
                .id = params.id,
                .ticker = fmt::format("PERP{}-USD", params.id),
                .marketId = params.id,
                .atomicResolution = params.atomicResolution,
                .liquidityTierId = 0
            }
        },
        .price = {.id = params.id, .exponent = params.exponent, .price = params.price},
        .liquidityTier = {
            .id = 0,
            .initialMarginPpm = params.initialMarginPpm,
            .maintenanceFractionPpm = params.maintenanceFractionPpm
        }
    };
}

// Perpetuals 1 (price 100) and 2 (price 200), both at resolution -6 in a
// 10% initial / 50% maintenance fraction tier.
[[nodiscard]] inline perpetuals::PerpInfos makeDefaultPerpInfos()
{
    perpetuals::PerpInfos perpInfos;
    perpInfos.emplace(1, makePerpInfo({.id = 1, .price = 100}));
    perpInfos.emplace(2, makePerpInfo({.id = 2, .price = 200}));
    return perpInfos;
}

[[nodiscard]] inline subaccounts::Subaccount makeSubaccount(
    std::map<PerpetualId, bigint_t> perpetuals, std::map<AssetId, bigint_t> assets)
{
    subaccounts::Subaccount subaccount{.id = {.owner = "alice", .number = 0}};
    for (auto& [perpetualId, quantums] : perpetuals) {
        subaccount.addPerpetualPosition({.perpetualId = perpetualId, .quantums = quantums});
    }
    for (auto& [assetId, quantums] : assets) {
        subaccount.addAssetPosition({.assetId = assetId, .quantums = quantums});
    }
    return subaccount;
}

}  // namespace solvency::test

//-------------------------------------------------------------------------
