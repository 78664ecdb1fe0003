/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "solvency/bigint/bigint.hpp"
#include "solvency/util/common.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <pugixml.hpp>
#include <rapidjson/document.h>

#include <compare>
#include <map>
#include <string>

//-------------------------------------------------------------------------

namespace solvency::subaccounts
{

//-------------------------------------------------------------------------

struct SubaccountId
{
    std::string owner;
    uint32_t number{};

    [[nodiscard]] auto operator<=>(const SubaccountId& other) const = default;

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;
};

//-------------------------------------------------------------------------

struct PerpetualPosition
{
    PerpetualId perpetualId{};
    bigint_t quantums{};
    bigint_t fundingIndex{};

    [[nodiscard]] bool operator==(const PerpetualPosition& other) const = default;

    [[nodiscard]] static PerpetualPosition fromXML(pugi::xml_node node);
};

struct AssetPosition
{
    AssetId assetId{};
    bigint_t quantums{};

    [[nodiscard]] bool operator==(const AssetPosition& other) const = default;

    [[nodiscard]] static AssetPosition fromXML(pugi::xml_node node);
};

//-------------------------------------------------------------------------

// Settled (funding already applied) holdings of one subaccount.
struct Subaccount
{
    using PerpetualPositions = std::map<PerpetualId, PerpetualPosition>;
    using AssetPositions = std::map<AssetId, AssetPosition>;

    SubaccountId id;
    PerpetualPositions perpetualPositions;
    AssetPositions assetPositions;

    [[nodiscard]] bool operator==(const Subaccount& other) const = default;

    // Zero when no position is held.
    [[nodiscard]] bigint_t perpetualQuantums(PerpetualId perpetualId) const;
    [[nodiscard]] bigint_t assetQuantums(AssetId assetId) const;

    void addPerpetualPosition(PerpetualPosition position);
    void addAssetPosition(AssetPosition position);

    [[nodiscard]] static Subaccount fromXML(pugi::xml_node node);
};

//-------------------------------------------------------------------------

}  // namespace solvency::subaccounts

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<solvency::subaccounts::SubaccountId>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const solvency::subaccounts::SubaccountId& id, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}/{}", id.owner, id.number);
    }
};

template<>
struct fmt::formatter<solvency::subaccounts::Subaccount>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const solvency::subaccounts::Subaccount& subaccount, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "Subaccount{{.id = {}, .perpetualPositions = [{}], .assetPositions = [{}]}}",
            subaccount.id,
            fmt::join(
                subaccount.perpetualPositions
                | views::values
                | views::transform([](const auto& position) {
                    return fmt::format(
                        "{}:{}@{}",
                        position.perpetualId,
                        position.quantums,
                        position.fundingIndex);
                }),
                ", "),
            fmt::join(
                subaccount.assetPositions
                | views::values
                | views::transform([](const auto& position) {
                    return fmt::format("{}:{}", position.assetId, position.quantums);
                }),
                ", "));
    }
};

//-------------------------------------------------------------------------
