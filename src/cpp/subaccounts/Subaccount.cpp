/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "solvency/subaccounts/Subaccount.hpp"

#include "solvency/serialization/json_util.hpp"

#include <source_location>
#include <stdexcept>
#include <utility>

//-------------------------------------------------------------------------

namespace solvency::subaccounts
{

//-------------------------------------------------------------------------

void SubaccountId::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("owner", rapidjson::Value{owner.c_str(), allocator}, allocator);
        json.AddMember("number", rapidjson::Value{number}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

PerpetualPosition PerpetualPosition::fromXML(pugi::xml_node node)
{
    return {
        .perpetualId = node.attribute("perpetualId").as_uint(),
        .quantums = util::str2bigint(node.attribute("quantums").as_string()),
        .fundingIndex = util::str2bigint(node.attribute("fundingIndex").as_string("0"))
    };
}

//-------------------------------------------------------------------------

AssetPosition AssetPosition::fromXML(pugi::xml_node node)
{
    return {
        .assetId = node.attribute("assetId").as_uint(),
        .quantums = util::str2bigint(node.attribute("quantums").as_string())
    };
}

//-------------------------------------------------------------------------

bigint_t Subaccount::perpetualQuantums(PerpetualId perpetualId) const
{
    auto it = perpetualPositions.find(perpetualId);
    return it != perpetualPositions.end() ? it->second.quantums : bigint_t{};
}

//-------------------------------------------------------------------------

bigint_t Subaccount::assetQuantums(AssetId assetId) const
{
    auto it = assetPositions.find(assetId);
    return it != assetPositions.end() ? it->second.quantums : bigint_t{};
}

//-------------------------------------------------------------------------

void Subaccount::addPerpetualPosition(PerpetualPosition position)
{
    const auto perpetualId = position.perpetualId;
    if (!perpetualPositions.try_emplace(perpetualId, std::move(position)).second) {
        throw std::invalid_argument{fmt::format(
            "{}: Subaccount {} already holds a position in perpetual {}",
            std::source_location::current().function_name(),
            id,
            perpetualId)};
    }
}

//-------------------------------------------------------------------------

void Subaccount::addAssetPosition(AssetPosition position)
{
    const auto assetId = position.assetId;
    if (!assetPositions.try_emplace(assetId, std::move(position)).second) {
        throw std::invalid_argument{fmt::format(
            "{}: Subaccount {} already holds a position in asset {}",
            std::source_location::current().function_name(),
            id,
            assetId)};
    }
}

//-------------------------------------------------------------------------

Subaccount Subaccount::fromXML(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current();

    if (!node) {
        throw std::invalid_argument{fmt::format(
            "{}: Missing subaccount node", ctx.function_name())};
    }

    Subaccount subaccount{
        .id = {
            .owner = node.attribute("owner").as_string(),
            .number = node.attribute("number").as_uint()
        }
    };
    if (subaccount.id.owner.empty()) {
        throw std::invalid_argument{fmt::format(
            "{}: Subaccount owner must be non-empty", ctx.function_name())};
    }

    for (pugi::xml_node child : node.children("PerpetualPosition")) {
        subaccount.addPerpetualPosition(PerpetualPosition::fromXML(child));
    }
    for (pugi::xml_node child : node.children("AssetPosition")) {
        subaccount.addAssetPosition(AssetPosition::fromXML(child));
    }

    return subaccount;
}

//-------------------------------------------------------------------------

}  // namespace solvency::subaccounts

//-------------------------------------------------------------------------
