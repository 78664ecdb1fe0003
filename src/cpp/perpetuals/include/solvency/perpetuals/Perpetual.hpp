/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "solvency/bigint/bigint.hpp"
#include "solvency/util/common.hpp"

#include <fmt/format.h>
#include <pugixml.hpp>

#include <string>

//-------------------------------------------------------------------------

namespace solvency::perpetuals
{

//-------------------------------------------------------------------------

struct PerpetualParams
{
    PerpetualId id{};
    std::string ticker;
    MarketId marketId{};
    int32_t atomicResolution{};
    LiquidityTierId liquidityTierId{};

    void validate() const;

    [[nodiscard]] static PerpetualParams fromXML(pugi::xml_node node);
};

//-------------------------------------------------------------------------

struct Perpetual
{
    PerpetualParams params;
    bigint_t fundingIndex{};
    // In base quantums.
    bigint_t openInterest{};

    [[nodiscard]] PerpetualId id() const noexcept { return params.id; }

    [[nodiscard]] static Perpetual fromXML(pugi::xml_node node);
};

//-------------------------------------------------------------------------

}  // namespace solvency::perpetuals

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<solvency::perpetuals::Perpetual>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const solvency::perpetuals::Perpetual& perp, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "Perpetual{{.id = {}, .ticker = {}, .marketId = {}, .atomicResolution = {}, "
            ".liquidityTierId = {}, .fundingIndex = {}, .openInterest = {}}}",
            perp.params.id,
            perp.params.ticker,
            perp.params.marketId,
            perp.params.atomicResolution,
            perp.params.liquidityTierId,
            perp.fundingIndex,
            perp.openInterest);
    }
};

//-------------------------------------------------------------------------
