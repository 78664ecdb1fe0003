/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "solvency/subaccounts/Update.hpp"

//-------------------------------------------------------------------------

namespace solvency::subaccounts
{

//-------------------------------------------------------------------------

PerpetualUpdate PerpetualUpdate::fromXML(pugi::xml_node node)
{
    return {
        .perpetualId = node.attribute("perpetualId").as_uint(),
        .quantumsDelta = util::str2bigint(node.attribute("quantumsDelta").as_string())
    };
}

//-------------------------------------------------------------------------

AssetUpdate AssetUpdate::fromXML(pugi::xml_node node)
{
    return {
        .assetId = node.attribute("assetId").as_uint(),
        .quantumsDelta = util::str2bigint(node.attribute("quantumsDelta").as_string())
    };
}

//-------------------------------------------------------------------------

}  // namespace solvency::subaccounts

//-------------------------------------------------------------------------
