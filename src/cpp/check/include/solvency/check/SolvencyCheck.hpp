/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "solvency/config/Snapshot.hpp"
#include "solvency/margin/Risk.hpp"
#include "solvency/subaccounts/Subaccount.hpp"
#include "solvency/subaccounts/UpdateResult.hpp"

#include <fmt/format.h>
#include <rapidjson/document.h>

#include <optional>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

namespace solvency::check
{

//-------------------------------------------------------------------------

struct CheckResult
{
    subaccounts::SubaccountId subaccountId;
    margin::Risk oldRisk;
    margin::Risk newRisk;
    // Empty when the subaccount is maintenance-collateralized before the
    // update and the undercollateralized gate does not apply.
    std::optional<subaccounts::UpdateResult> verdict;

    [[nodiscard]] bool undercollateralized() const noexcept { return verdict.has_value(); }
    [[nodiscard]] bool rejected() const noexcept
    {
        return verdict.has_value() && !subaccounts::isSuccess(*verdict);
    }

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;
};

/**
 * Risk of the snapshot's subaccount before and after its updates, with the
 * undercollateralized-transition verdict where it applies. Non-quote assets
 * with a configured price are valued.
 */
[[nodiscard]] CheckResult runCheck(const config::Snapshot& snapshot);

//-------------------------------------------------------------------------

}  // namespace solvency::check

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<solvency::check::CheckResult>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const solvency::check::CheckResult& result, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "subaccount: {}\nold risk:   {}\nnew risk:   {}\nverdict:    {}",
            result.subaccountId,
            result.oldRisk,
            result.newRisk,
            result.verdict.has_value()
                ? solvency::subaccounts::UpdateResult2StrView(*result.verdict)
                : std::string_view{"collateralized, gate not applied"});
    }
};

//-------------------------------------------------------------------------
