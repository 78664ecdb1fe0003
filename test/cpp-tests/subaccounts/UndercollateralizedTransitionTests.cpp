/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "solvency/subaccounts/updates.hpp"
#include "formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace solvency;
using namespace solvency::literals;
using namespace solvency::subaccounts;

using margin::Risk;

using namespace testing;

//-------------------------------------------------------------------------

struct TransitionTestParams
{
    Risk curRisk;
    Risk newRisk;
    UpdateResult refResult;
};

void PrintTo(const TransitionTestParams& params, std::ostream* os)
{
    *os << fmt::format(
        "{{.curRisk = {}, .newRisk = {}, .refResult = {}}}",
        params.curRisk,
        params.newRisk,
        params.refResult);
}

struct UndercollateralizedTransitionTest : TestWithParam<TransitionTestParams>
{};

TEST_P(UndercollateralizedTransitionTest, WorksCorrectly)
{
    const auto& [curRisk, newRisk, refResult] = GetParam();
    EXPECT_EQ(
        isValidStateTransitionForUndercollateralizedSubaccount(curRisk, newRisk), refResult);
}

// Without a maintenance requirement the update must keep it at zero and
// strictly raise net collateral.
INSTANTIATE_TEST_SUITE_P(
    WithoutMaintenanceRequirement,
    UndercollateralizedTransitionTest,
    Values(
        TransitionTestParams{
            .curRisk = {.nc = bigint_t{-1}},
            .newRisk = {.nc = bigint_t{-2}, .mmr = 1_big},
            .refResult = UpdateResult::STILL_UNDERCOLLATERALIZED
        },
        TransitionTestParams{
            .curRisk = {.nc = bigint_t{-1}},
            .newRisk = {.nc = bigint_t{-1}, .mmr = 1_big},
            .refResult = UpdateResult::STILL_UNDERCOLLATERALIZED
        },
        TransitionTestParams{
            .curRisk = {.nc = bigint_t{-1}},
            .newRisk = {.nc = 100_big, .mmr = 1_big},
            .refResult = UpdateResult::STILL_UNDERCOLLATERALIZED
        },
        TransitionTestParams{
            .curRisk = {.nc = bigint_t{-1}},
            .newRisk = {.nc = bigint_t{-1}},
            .refResult = UpdateResult::STILL_UNDERCOLLATERALIZED
        },
        TransitionTestParams{
            .curRisk = {.nc = bigint_t{-1}},
            .newRisk = {.nc = bigint_t{-2}},
            .refResult = UpdateResult::STILL_UNDERCOLLATERALIZED
        },
        TransitionTestParams{
            .curRisk = {.nc = bigint_t{-2}},
            .newRisk = {.nc = bigint_t{-1}},
            .refResult = UpdateResult::SUCCESS
        },
        // Initial margin is not consulted.
        TransitionTestParams{
            .curRisk = {.nc = bigint_t{-2}, .imr = 50_big},
            .newRisk = {.nc = bigint_t{-1}, .imr = 70_big},
            .refResult = UpdateResult::SUCCESS
        }));

// With a maintenance requirement the update only has to leave net
// collateral non-negative.
INSTANTIATE_TEST_SUITE_P(
    WithMaintenanceRequirement,
    UndercollateralizedTransitionTest,
    Values(
        TransitionTestParams{
            .curRisk = {.nc = bigint_t{-2}, .imr = 1_big, .mmr = 1_big},
            .newRisk = {.nc = bigint_t{-1}},
            .refResult = UpdateResult::STILL_UNDERCOLLATERALIZED
        },
        TransitionTestParams{
            .curRisk = {.nc = 400_big, .imr = 1'000_big, .mmr = 500_big},
            .newRisk = {.nc = 0_big, .imr = 1'000_big, .mmr = 500_big},
            .refResult = UpdateResult::SUCCESS
        },
        TransitionTestParams{
            .curRisk = {.nc = 400_big, .imr = 1'000_big, .mmr = 500_big},
            .newRisk = {.nc = bigint_t{-100}, .imr = 1'000_big, .mmr = 500_big},
            .refResult = UpdateResult::STILL_UNDERCOLLATERALIZED
        },
        TransitionTestParams{
            .curRisk = {.nc = 400_big, .imr = 1'000_big, .mmr = 500_big},
            .newRisk = {.nc = 1_big, .imr = 8'000_big, .mmr = 4'000_big},
            .refResult = UpdateResult::SUCCESS
        },
        TransitionTestParams{
            .curRisk = {.nc = bigint_t{-10}, .imr = 20_big, .mmr = 10_big},
            .newRisk = {.nc = bigint_t{-5}},
            .refResult = UpdateResult::STILL_UNDERCOLLATERALIZED
        }));

//-------------------------------------------------------------------------

TEST(UpdateResultTests, Names)
{
    EXPECT_EQ(UpdateResult2StrView(UpdateResult::SUCCESS), "SUCCESS");
    EXPECT_EQ(
        fmt::format("{}", UpdateResult::STILL_UNDERCOLLATERALIZED), "STILL_UNDERCOLLATERALIZED");
    EXPECT_TRUE(isSuccess(UpdateResult::SUCCESS));
    EXPECT_FALSE(isSuccess(UpdateResult::STILL_UNDERCOLLATERALIZED));
}

//-------------------------------------------------------------------------
