/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "solvency/perpetuals/Perpetual.hpp"

#include <source_location>
#include <stdexcept>

//-------------------------------------------------------------------------

namespace solvency::perpetuals
{

//-------------------------------------------------------------------------

void PerpetualParams::validate() const
{
    if (ticker.empty()) {
        throw std::invalid_argument{fmt::format(
            "{}: Perpetual {} has an empty ticker",
            std::source_location::current().function_name(),
            id)};
    }
}

//-------------------------------------------------------------------------

PerpetualParams PerpetualParams::fromXML(pugi::xml_node node)
{
    PerpetualParams params{
        .id = node.attribute("id").as_uint(),
        .ticker = node.attribute("ticker").as_string(),
        .marketId = node.attribute("marketId").as_uint(),
        .atomicResolution = node.attribute("atomicResolution").as_int(),
        .liquidityTierId = node.attribute("liquidityTier").as_uint()
    };
    params.validate();
    return params;
}

//-------------------------------------------------------------------------

Perpetual Perpetual::fromXML(pugi::xml_node node)
{
    return {
        .params = PerpetualParams::fromXML(node),
        .fundingIndex = util::str2bigint(node.attribute("fundingIndex").as_string("0")),
        .openInterest = util::str2bigint(node.attribute("openInterest").as_string("0"))
    };
}

//-------------------------------------------------------------------------

}  // namespace solvency::perpetuals

//-------------------------------------------------------------------------
