/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "solvency/subaccounts/Subaccount.hpp"

#include <fmt/format.h>
#include <pugixml.hpp>

#include <vector>

//-------------------------------------------------------------------------

namespace solvency::subaccounts
{

//-------------------------------------------------------------------------

struct PerpetualUpdate
{
    PerpetualId perpetualId{};
    bigint_t quantumsDelta{};

    [[nodiscard]] bool operator==(const PerpetualUpdate& other) const = default;

    [[nodiscard]] static PerpetualUpdate fromXML(pugi::xml_node node);
};

struct AssetUpdate
{
    AssetId assetId{};
    bigint_t quantumsDelta{};

    [[nodiscard]] bool operator==(const AssetUpdate& other) const = default;

    [[nodiscard]] static AssetUpdate fromXML(pugi::xml_node node);
};

//-------------------------------------------------------------------------

/**
 * A settled subaccount paired with the deltas proposed against it. Several
 * deltas for the same id add up.
 */
struct SettledUpdate
{
    Subaccount settledSubaccount;
    std::vector<PerpetualUpdate> perpetualUpdates;
    std::vector<AssetUpdate> assetUpdates;

    [[nodiscard]] bool operator==(const SettledUpdate& other) const = default;
};

//-------------------------------------------------------------------------

}  // namespace solvency::subaccounts

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<solvency::subaccounts::PerpetualUpdate>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const solvency::subaccounts::PerpetualUpdate& update, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "PerpetualUpdate{{.perpetualId = {}, .quantumsDelta = {}}}",
            update.perpetualId,
            update.quantumsDelta);
    }
};

template<>
struct fmt::formatter<solvency::subaccounts::AssetUpdate>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const solvency::subaccounts::AssetUpdate& update, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "AssetUpdate{{.assetId = {}, .quantumsDelta = {}}}",
            update.assetId,
            update.quantumsDelta);
    }
};

//-------------------------------------------------------------------------
