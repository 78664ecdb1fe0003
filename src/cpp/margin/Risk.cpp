/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "solvency/margin/Risk.hpp"

#include "solvency/bigint/serialization/bigint.hpp"
#include "solvency/serialization/json_util.hpp"

//-------------------------------------------------------------------------

namespace solvency::margin
{

//-------------------------------------------------------------------------

Risk& Risk::operator+=(const Risk& other)
{
    nc += other.nc;
    imr += other.imr;
    mmr += other.mmr;
    return *this;
}

//-------------------------------------------------------------------------

void Risk::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("nc", json::bigint2json(nc, allocator), allocator);
        json.AddMember("imr", json::bigint2json(imr, allocator), allocator);
        json.AddMember("mmr", json::bigint2json(mmr, allocator), allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

Risk operator+(Risk lhs, const Risk& rhs)
{
    lhs += rhs;
    return lhs;
}

//-------------------------------------------------------------------------

}  // namespace solvency::margin

//-------------------------------------------------------------------------
