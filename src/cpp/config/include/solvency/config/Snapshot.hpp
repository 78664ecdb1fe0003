/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "solvency/assets/Asset.hpp"
#include "solvency/margin/RiskParameters.hpp"
#include "solvency/perpetuals/PerpInfo.hpp"
#include "solvency/subaccounts/Update.hpp"
#include "solvency/util/Logging.hpp"
#include "solvency/util/common.hpp"

#include <pugixml.hpp>

//-------------------------------------------------------------------------

namespace solvency::config
{

//-------------------------------------------------------------------------

/**
 * Every input of one risk computation, as read from a <Solvency> document.
 * Perpetuals are joined with their liquidity tier and market price, and
 * non-quote assets with their market price, at load time.
 */
struct Snapshot
{
    log::LoggingConfig logging;
    margin::RiskParameters riskParameters;
    perpetuals::PerpInfos perpInfos;
    assets::AssetInfos assetInfos;
    subaccounts::SettledUpdate settledUpdate;

    [[nodiscard]] static Snapshot fromXML(pugi::xml_node node);
};

[[nodiscard]] Snapshot loadSnapshot(const fs::path& path);

//-------------------------------------------------------------------------

}  // namespace solvency::config

//-------------------------------------------------------------------------
