/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "solvency/bigint/bigint.hpp"
#include "solvency/util/common.hpp"

#include <fmt/format.h>
#include <pugixml.hpp>

//-------------------------------------------------------------------------

namespace solvency::perpetuals
{

//-------------------------------------------------------------------------

struct LiquidityTier
{
    LiquidityTierId id{};
    uint32_t initialMarginPpm{};
    // Fraction of the initial margin, so maintenance never exceeds initial.
    uint32_t maintenanceFractionPpm{};
    // Open interest caps in quote quantums. An upper cap of zero disables
    // open-interest-based initial margin scaling.
    uint64_t openInterestLowerCap{};
    uint64_t openInterestUpperCap{};

    void validate() const;

    /**
     * Initial margin ppm after open interest scaling: the base ppm up to the
     * lower cap, 100% from the upper cap on, linear (truncated) in between.
     */
    [[nodiscard]] uint32_t effectiveInitialMarginPpm(const bigint_t& openInterestNotional) const;

    [[nodiscard]] static LiquidityTier fromXML(pugi::xml_node node);
};

//-------------------------------------------------------------------------

}  // namespace solvency::perpetuals

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<solvency::perpetuals::LiquidityTier>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const solvency::perpetuals::LiquidityTier& tier, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "LiquidityTier{{.id = {}, .initialMarginPpm = {}, .maintenanceFractionPpm = {}, "
            ".openInterestLowerCap = {}, .openInterestUpperCap = {}}}",
            tier.id,
            tier.initialMarginPpm,
            tier.maintenanceFractionPpm,
            tier.openInterestLowerCap,
            tier.openInterestUpperCap);
    }
};

//-------------------------------------------------------------------------
