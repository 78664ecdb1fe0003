/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "solvency/bigint/bigint.hpp"

#include <fmt/format.h>
#include <rapidjson/document.h>

#include <string>

//-------------------------------------------------------------------------

namespace solvency::margin
{

//-------------------------------------------------------------------------

/**
 * Collateralization of a subaccount, in quote quantums:
 *   - nc: net collateral (collateral plus position notional)
 *   - imr: initial margin requirement
 *   - mmr: maintenance margin requirement
 */
struct Risk
{
    bigint_t nc{};
    bigint_t imr{};
    bigint_t mmr{};

    Risk& operator+=(const Risk& other);

    [[nodiscard]] bool operator==(const Risk& other) const = default;

    [[nodiscard]] bool isInitialCollateralized() const noexcept { return nc >= imr; }
    [[nodiscard]] bool isMaintenanceCollateralized() const noexcept { return nc >= mmr; }
    [[nodiscard]] bool isLiquidatable() const noexcept { return mmr.sign() > 0 && nc < mmr; }

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;

    [[nodiscard]] static Risk zero() { return {}; }
};

[[nodiscard]] Risk operator+(Risk lhs, const Risk& rhs);

//-------------------------------------------------------------------------

}  // namespace solvency::margin

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<solvency::margin::Risk>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const solvency::margin::Risk& risk, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "Risk{{.nc = {}, .imr = {}, .mmr = {}}}",
            risk.nc,
            risk.imr,
            risk.mmr);
    }
};

//-------------------------------------------------------------------------
