/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "solvency/bigint/bigint.hpp"
#include "formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>

//-------------------------------------------------------------------------

using namespace solvency;
using namespace solvency::literals;

using namespace testing;

//-------------------------------------------------------------------------

struct Str2BigIntTestParams
{
    std::string str;
    bigint_t refValue;
};

void PrintTo(const Str2BigIntTestParams& params, std::ostream* os)
{
    *os << fmt::format("{{.str = '{}', .refValue = {}}}", params.str, params.refValue);
}

struct Str2BigIntTest : TestWithParam<Str2BigIntTestParams>
{
    virtual void SetUp() override
    {
        str = GetParam().str;
        refValue = GetParam().refValue;
    }

    std::string str;
    bigint_t refValue;
};

TEST_P(Str2BigIntTest, WorksCorrectly)
{
    EXPECT_EQ(util::str2bigint(str), refValue);
}

INSTANTIATE_TEST_SUITE_P(
    BigIntTests,
    Str2BigIntTest,
    Values(
        Str2BigIntTestParams{.str = "0", .refValue = 0_big},
        Str2BigIntTestParams{.str = "0000", .refValue = 0_big},
        Str2BigIntTestParams{.str = "-0", .refValue = 0_big},
        Str2BigIntTestParams{.str = "42", .refValue = 42_big},
        Str2BigIntTestParams{.str = "+42", .refValue = 42_big},
        Str2BigIntTestParams{.str = "0012", .refValue = 12_big},
        Str2BigIntTestParams{.str = "-007", .refValue = bigint_t{-7}},
        Str2BigIntTestParams{
            .str = "123456789012345678901234567890",
            .refValue = 1234567890_big * util::pow10(20) + 12345678901234567890_big
        },
        Str2BigIntTestParams{
            .str = "-100000000000000000000000000000000000000",
            .refValue = bigint_t{-util::pow10(38)}
        }));

//-------------------------------------------------------------------------

struct Str2BigIntInvalidTest : TestWithParam<std::string>
{};

TEST_P(Str2BigIntInvalidTest, Throws)
{
    EXPECT_THROW(static_cast<void>(util::str2bigint(GetParam())), std::invalid_argument);
}

INSTANTIATE_TEST_SUITE_P(
    BigIntTests,
    Str2BigIntInvalidTest,
    Values("", "-", "+", "1a", "0x10", "1.5", " 1", "1e6", "--1"));

//-------------------------------------------------------------------------

TEST(BigIntTests, Bigint2Str)
{
    EXPECT_EQ(util::bigint2str(bigint_t{-12345}), "-12345");
    EXPECT_EQ(util::bigint2str(util::pow10(25)), "10000000000000000000000000");
    EXPECT_EQ(fmt::format("{}", bigint_t{-3}), "-3");
}

TEST(BigIntTests, Pow10)
{
    EXPECT_EQ(util::pow10(0), 1_big);
    EXPECT_EQ(util::pow10(6), 1'000'000_big);
    EXPECT_EQ(util::pow10(20), util::str2bigint("100000000000000000000"));
}

TEST(BigIntTests, Abs)
{
    EXPECT_EQ(util::abs(bigint_t{-17}), 17_big);
    EXPECT_EQ(util::abs(17_big), 17_big);
    EXPECT_EQ(util::abs(0_big), 0_big);
}

//-------------------------------------------------------------------------

struct MulPpmTestParams
{
    bigint_t value;
    uint32_t ppm;
    bigint_t refValue;
};

void PrintTo(const MulPpmTestParams& params, std::ostream* os)
{
    *os << fmt::format(
        "{{.value = {}, .ppm = {}, .refValue = {}}}", params.value, params.ppm, params.refValue);
}

struct MulPpmTest : TestWithParam<MulPpmTestParams>
{};

TEST_P(MulPpmTest, TruncatesTowardZero)
{
    const auto& [value, ppm, refValue] = GetParam();
    EXPECT_EQ(util::mulPpm(value, ppm), refValue);
}

INSTANTIATE_TEST_SUITE_P(
    BigIntTests,
    MulPpmTest,
    Values(
        MulPpmTestParams{.value = 10'000_big, .ppm = 100'000, .refValue = 1'000_big},
        MulPpmTestParams{.value = 999_big, .ppm = 1'000, .refValue = 0_big},
        MulPpmTestParams{.value = bigint_t{-999}, .ppm = 1'000, .refValue = 0_big},
        MulPpmTestParams{.value = 1'999'999_big, .ppm = 1, .refValue = 1_big},
        MulPpmTestParams{.value = bigint_t{-1'999'999}, .ppm = 1, .refValue = bigint_t{-1}},
        MulPpmTestParams{.value = 1'235_big, .ppm = 500'000, .refValue = 617_big},
        MulPpmTestParams{.value = 42_big, .ppm = 1'000'000, .refValue = 42_big},
        MulPpmTestParams{.value = 42_big, .ppm = 0, .refValue = 0_big}));

//-------------------------------------------------------------------------
