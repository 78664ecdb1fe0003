/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <range/v3/view/map.hpp>
#include <range/v3/view/transform.hpp>

#include <cstdint>
#include <filesystem>

//-------------------------------------------------------------------------

namespace fs = std::filesystem;

namespace views = ranges::views;

//-------------------------------------------------------------------------

namespace solvency
{

using AssetId = uint32_t;
using MarketId = uint32_t;
using PerpetualId = uint32_t;
using LiquidityTierId = uint32_t;

}  // namespace solvency

//-------------------------------------------------------------------------
