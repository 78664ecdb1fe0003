/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <boost/multiprecision/cpp_int.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <cstdint>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

namespace solvency
{

// Every quantum, notional and margin amount. Arithmetic on it never wraps.
using bigint_t = boost::multiprecision::cpp_int;

}  // namespace solvency

//-------------------------------------------------------------------------

namespace solvency::util
{

inline constexpr uint32_t kOneMillion = 1'000'000;

[[nodiscard]] inline bigint_t pow10(uint32_t exponent)
{
    return boost::multiprecision::pow(bigint_t{10}, exponent);
}

[[nodiscard]] inline bigint_t abs(const bigint_t& val)
{
    return val.sign() < 0 ? bigint_t{-val} : val;
}

// val * ppm / 1'000'000, truncated toward zero.
[[nodiscard]] inline bigint_t mulPpm(const bigint_t& val, uint32_t ppm)
{
    bigint_t scaled = val * ppm;
    scaled /= kOneMillion;
    return scaled;
}

[[nodiscard]] inline std::string bigint2str(const bigint_t& val)
{
    return val.str();
}

// Accepts an optionally signed run of decimal digits. Leading zeros are
// stripped before handing the digits to cpp_int, which would otherwise read
// them as an octal prefix.
[[nodiscard]] inline bigint_t str2bigint(std::string_view str)
{
    const bool negative = str.starts_with('-');
    const std::string_view digits =
        negative || str.starts_with('+') ? str.substr(1) : str;
    if (digits.empty()
        || !std::ranges::all_of(digits, [](char c) { return '0' <= c && c <= '9'; })) {
        throw std::invalid_argument{fmt::format(
            "{}: Ill-formed integer '{}'",
            std::source_location::current().function_name(),
            str)};
    }
    const auto first = digits.find_first_not_of('0');
    const bigint_t magnitude{
        std::string{first == std::string_view::npos ? "0" : digits.substr(first)}};
    return negative ? bigint_t{-magnitude} : magnitude;
}

}  // namespace solvency::util

//-------------------------------------------------------------------------

namespace solvency::literals
{

[[nodiscard]] inline bigint_t operator""_big(unsigned long long int val)
{
    return bigint_t{val};
}

}  // namespace solvency::literals

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<solvency::bigint_t>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const solvency::bigint_t& val, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", val.str());
    }
};

//-------------------------------------------------------------------------
