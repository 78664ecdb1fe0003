/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "solvency/perpetuals/LiquidityTier.hpp"

#include <source_location>
#include <stdexcept>

//-------------------------------------------------------------------------

namespace solvency::perpetuals
{

//-------------------------------------------------------------------------

void LiquidityTier::validate() const
{
    static constexpr auto sl = std::source_location::current();

    if (initialMarginPpm > util::kOneMillion) {
        throw std::invalid_argument{fmt::format(
            "{}: Liquidity tier {}: initialMarginPpm should be <= {}, was {}",
            sl.function_name(), id, util::kOneMillion, initialMarginPpm)};
    }
    if (maintenanceFractionPpm > util::kOneMillion) {
        throw std::invalid_argument{fmt::format(
            "{}: Liquidity tier {}: maintenanceFractionPpm should be <= {}, was {}",
            sl.function_name(), id, util::kOneMillion, maintenanceFractionPpm)};
    }
    if (openInterestLowerCap > openInterestUpperCap) {
        throw std::invalid_argument{fmt::format(
            "{}: Liquidity tier {}: openInterestLowerCap ({}) exceeds openInterestUpperCap ({})",
            sl.function_name(), id, openInterestLowerCap, openInterestUpperCap)};
    }
}

//-------------------------------------------------------------------------

uint32_t LiquidityTier::effectiveInitialMarginPpm(const bigint_t& openInterestNotional) const
{
    if (openInterestUpperCap == 0 || openInterestNotional <= openInterestLowerCap) {
        return initialMarginPpm;
    }
    // A base already at (or, unvalidated, above) 100% has nothing to scale.
    if (initialMarginPpm >= util::kOneMillion) {
        return initialMarginPpm;
    }
    if (openInterestNotional >= openInterestUpperCap) {
        return util::kOneMillion;
    }

    bigint_t scaled = openInterestNotional - openInterestLowerCap;
    scaled *= util::kOneMillion - initialMarginPpm;
    scaled /= openInterestUpperCap - openInterestLowerCap;
    return initialMarginPpm + scaled.convert_to<uint32_t>();
}

//-------------------------------------------------------------------------

LiquidityTier LiquidityTier::fromXML(pugi::xml_node node)
{
    LiquidityTier tier{
        .id = node.attribute("id").as_uint(),
        .initialMarginPpm = node.attribute("initialMarginPpm").as_uint(),
        .maintenanceFractionPpm = node.attribute("maintenanceFractionPpm").as_uint(),
        .openInterestLowerCap = node.attribute("openInterestLowerCap").as_ullong(),
        .openInterestUpperCap = node.attribute("openInterestUpperCap").as_ullong()
    };
    tier.validate();
    return tier;
}

//-------------------------------------------------------------------------

}  // namespace solvency::perpetuals

//-------------------------------------------------------------------------
