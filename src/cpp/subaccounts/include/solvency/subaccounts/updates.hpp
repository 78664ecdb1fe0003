/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "solvency/assets/Asset.hpp"
#include "solvency/margin/Risk.hpp"
#include "solvency/margin/RiskParameters.hpp"
#include "solvency/perpetuals/PerpInfo.hpp"
#include "solvency/subaccounts/Subaccount.hpp"
#include "solvency/subaccounts/Update.hpp"
#include "solvency/subaccounts/UpdateResult.hpp"

//-------------------------------------------------------------------------

namespace solvency::subaccounts
{

//-------------------------------------------------------------------------

/**
 * Aggregate risk of the subaccount as it would stand after the update.
 *
 * Every perpetual either held or updated is valued once at held + delta and
 * contributes its notional to NC and its margin requirements to IMR and MMR.
 * Quote asset quantums (held + delta) count 1:1 towards NC. Other assets are
 * not valued by this overload.
 *
 * Throws ContractViolation if a referenced perpetual has no PerpInfo.
 */
[[nodiscard]] margin::Risk getRiskForSubaccount(
    const SettledUpdate& update,
    const perpetuals::PerpInfos& perpInfos,
    const margin::RiskParameters& params = {});

/**
 * As above, additionally valuing non-quote assets that have an entry in
 * assetInfos at their market price. Such assets add to NC only.
 */
[[nodiscard]] margin::Risk getRiskForSubaccount(
    const SettledUpdate& update,
    const perpetuals::PerpInfos& perpInfos,
    const assets::AssetInfos& assetInfos,
    const margin::RiskParameters& params = {});

/**
 * Gate for an update against a subaccount that is currently
 * undercollateralized (curRisk not maintenance-collateralized):
 *   - without maintenance requirement, the update must keep it so and
 *     strictly raise NC;
 *   - otherwise NC must not go negative.
 * curRisk.imr is not consulted.
 */
[[nodiscard]] UpdateResult isValidStateTransitionForUndercollateralizedSubaccount(
    const margin::Risk& curRisk, const margin::Risk& newRisk) noexcept;

// The subaccount with the update applied; zeroed positions are dropped and
// newly opened perpetual positions take the current funding index.
[[nodiscard]] Subaccount applyUpdates(
    const SettledUpdate& update, const perpetuals::PerpInfos& perpInfos);

//-------------------------------------------------------------------------

}  // namespace solvency::subaccounts

//-------------------------------------------------------------------------
