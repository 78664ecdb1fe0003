/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "solvency/prices/MarketPrice.hpp"

#include <source_location>
#include <stdexcept>

//-------------------------------------------------------------------------

namespace solvency::prices
{

//-------------------------------------------------------------------------

void MarketPrice::validate() const
{
    if (price == 0) {
        throw std::invalid_argument{fmt::format(
            "{}: Market {} has a zero price",
            std::source_location::current().function_name(),
            id)};
    }
}

//-------------------------------------------------------------------------

MarketPrice MarketPrice::fromXML(pugi::xml_node node)
{
    MarketPrice marketPrice{
        .id = node.attribute("id").as_uint(),
        .exponent = node.attribute("exponent").as_int(),
        .price = node.attribute("price").as_ullong()
    };
    marketPrice.validate();
    return marketPrice;
}

//-------------------------------------------------------------------------

}  // namespace solvency::prices

//-------------------------------------------------------------------------
