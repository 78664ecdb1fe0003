/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "solvency/check/SolvencyCheck.hpp"

#include "solvency/serialization/json_util.hpp"
#include "solvency/subaccounts/updates.hpp"
#include "solvency/util/Logging.hpp"

//-------------------------------------------------------------------------

namespace solvency::check
{

//-------------------------------------------------------------------------

void CheckResult::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        subaccountId.jsonSerialize(json, "subaccount");
        oldRisk.jsonSerialize(json, "oldRisk");
        newRisk.jsonSerialize(json, "newRisk");
        json.AddMember("undercollateralized", rapidjson::Value{undercollateralized()}, allocator);
        json.AddMember(
            "verdict",
            verdict.has_value()
                ? rapidjson::Value{
                    subaccounts::UpdateResult2StrView(*verdict).data(), allocator}
                : rapidjson::Value{},
            allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

CheckResult runCheck(const config::Snapshot& snapshot)
{
    const auto& settled = snapshot.settledUpdate.settledSubaccount;

    CheckResult result{
        .subaccountId = settled.id,
        .oldRisk = subaccounts::getRiskForSubaccount(
            subaccounts::SettledUpdate{.settledSubaccount = settled},
            snapshot.perpInfos,
            snapshot.assetInfos,
            snapshot.riskParameters),
        .newRisk = subaccounts::getRiskForSubaccount(
            snapshot.settledUpdate,
            snapshot.perpInfos,
            snapshot.assetInfos,
            snapshot.riskParameters)
    };

    if (!result.oldRisk.isMaintenanceCollateralized()) {
        result.verdict = subaccounts::isValidStateTransitionForUndercollateralizedSubaccount(
            result.oldRisk, result.newRisk);
    }

    log::logger().info(
        "{}: {} -> {}, verdict {}",
        result.subaccountId,
        result.oldRisk,
        result.newRisk,
        result.verdict.has_value()
            ? subaccounts::UpdateResult2StrView(*result.verdict)
            : std::string_view{"n/a"});

    return result;
}

//-------------------------------------------------------------------------

}  // namespace solvency::check

//-------------------------------------------------------------------------
