/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "solvency/util/common.hpp"

#include <fmt/format.h>
#include <pugixml.hpp>

#include <cstdint>

//-------------------------------------------------------------------------

namespace solvency::prices
{

//-------------------------------------------------------------------------

// Price of one standard unit in the quote currency: price * 10^exponent.
struct MarketPrice
{
    MarketId id{};
    int32_t exponent{};
    uint64_t price{};

    [[nodiscard]] bool operator==(const MarketPrice& other) const noexcept = default;

    void validate() const;

    [[nodiscard]] static MarketPrice fromXML(pugi::xml_node node);
};

//-------------------------------------------------------------------------

}  // namespace solvency::prices

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<solvency::prices::MarketPrice>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const solvency::prices::MarketPrice& price, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "MarketPrice{{.id = {}, .exponent = {}, .price = {}}}",
            price.id,
            price.exponent,
            price.price);
    }
};

//-------------------------------------------------------------------------
