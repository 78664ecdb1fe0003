/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <fmt/format.h>
#include <magic_enum.hpp>

#include <cstdint>
#include <string_view>

//-------------------------------------------------------------------------

namespace solvency::subaccounts
{

// Open-ended; other rejection reasons may be added after the existing ones.
enum class UpdateResult : uint32_t
{
    SUCCESS,
    STILL_UNDERCOLLATERALIZED
};

[[nodiscard]] constexpr std::string_view UpdateResult2StrView(UpdateResult result) noexcept
{
    return magic_enum::enum_name(result);
}

[[nodiscard]] constexpr bool isSuccess(UpdateResult result) noexcept
{
    return result == UpdateResult::SUCCESS;
}

}  // namespace solvency::subaccounts

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<solvency::subaccounts::UpdateResult>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(solvency::subaccounts::UpdateResult result, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(), "{}", solvency::subaccounts::UpdateResult2StrView(result));
    }
};

//-------------------------------------------------------------------------
