// test_output.cpp
#include "utils/io/output.hpp"
#include <gtest/gtest.h>

TEST(OutputTest, FormatsNumbersWithPrecision)
{
    EXPECT_EQ(formatNumber(3.0L, DEFAULT_PRECISION), "3");
    EXPECT_EQ(formatNumber(-0.25L, DEFAULT_PRECISION), "-0.25");
    EXPECT_EQ(formatNumber(1.850219859070546L, 6), "1.85022");
}

TEST(OutputTest, FormatsComplexValueWithSign)
{
    EXPECT_EQ(formatValue(Complex(2, 3), DEFAULT_PRECISION), "2+3i");
    EXPECT_EQ(formatValue(Complex(-2, -3), DEFAULT_PRECISION), "-2-3i");
    EXPECT_EQ(formatValue(Complex(1, 0), DEFAULT_PRECISION), "1+0i");
    EXPECT_EQ(formatValue(Complex(1, -0.0L), DEFAULT_PRECISION), "1-0i");
}

TEST(OutputTest, FormatsScalarAsBareNumber)
{
    OperationResult result = 3.0L;
    EXPECT_EQ(formatValue(result, DEFAULT_PRECISION), "3");
    EXPECT_EQ(formatText(result, DEFAULT_PRECISION), "3");
}

TEST(OutputTest, TextIncludesMagnitudeAndPhase)
{
    OperationResult result = Complex(3, 4);
    EXPECT_EQ(formatText(result, 4), "3+4i  (magnitude 5, phase 0.9273)");
}

TEST(OutputTest, JsonForComplexResult)
{
    nlohmann::json json = toJson(Complex(3, 4));

    ASSERT_TRUE(json.is_object());
    EXPECT_DOUBLE_EQ(json["real"].get<double>(), 3.0);
    EXPECT_DOUBLE_EQ(json["imaginary"].get<double>(), 4.0);
    EXPECT_DOUBLE_EQ(json["magnitude"].get<double>(), 5.0);
    EXPECT_NEAR(json["phase"].get<double>(), 0.927295218, 1e-9);
}

TEST(OutputTest, JsonForScalarResult)
{
    nlohmann::json json = toJson(5.0L);

    ASSERT_TRUE(json.is_number());
    EXPECT_DOUBLE_EQ(json.get<double>(), 5.0);
}

TEST(OutputTest, ErrorJson)
{
    nlohmann::json json = errorJson("reciprocal of zero");
    EXPECT_EQ(json["error"], "reciprocal of zero");
}
