/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "solvency/bigint/bigint.hpp"

#include <rapidjson/document.h>

//-------------------------------------------------------------------------

namespace solvency::json
{

// Rendered as a decimal string: Json numbers cannot hold every quantum exactly.
[[nodiscard]] inline rapidjson::Value bigint2json(
    const bigint_t& val, rapidjson::Document::AllocatorType& allocator)
{
    const std::string str = util::bigint2str(val);
    return rapidjson::Value{
        str.c_str(), static_cast<rapidjson::SizeType>(str.size()), allocator};
}

}  // namespace solvency::json

//-------------------------------------------------------------------------
