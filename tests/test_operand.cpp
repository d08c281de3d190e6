// test_operand.cpp
#include "errors/errors.hpp"
#include "operand/operand.hpp"
#include "operations/operations.hpp"
#include <gtest/gtest.h>
#include <limits>
#include <string>

TEST(ParseComplexTest, RealNumbers)
{
    EXPECT_EQ(parseComplex("2"), Complex(2, 0));
    EXPECT_EQ(parseComplex("-1.5"), Complex(-1.5, 0));
    EXPECT_EQ(parseComplex("  4  "), Complex(4, 0));
    EXPECT_EQ(parseComplex("1e-3"), Complex(1e-3L, 0));
}

TEST(ParseComplexTest, ImaginaryNumbers)
{
    EXPECT_EQ(parseComplex("3i"), Complex(0, 3));
    EXPECT_EQ(parseComplex("-2.5i"), Complex(0, -2.5));
    EXPECT_EQ(parseComplex("i"), Complex(0, 1));
    EXPECT_EQ(parseComplex("-i"), Complex(0, -1));
    EXPECT_EQ(parseComplex("+i"), Complex(0, 1));
}

TEST(ParseComplexTest, RectangularForm)
{
    EXPECT_EQ(parseComplex("2+3i"), Complex(2, 3));
    EXPECT_EQ(parseComplex("2-3i"), Complex(2, -3));
    EXPECT_EQ(parseComplex("-2-3i"), Complex(-2, -3));
    EXPECT_EQ(parseComplex("2+i"), Complex(2, 1));
    EXPECT_EQ(parseComplex("1e2-4e-1i"), Complex(100, -0.4L));
}

TEST(ParseComplexTest, PairForm)
{
    EXPECT_EQ(parseComplex("(2,3)"), Complex(2, 3));
    EXPECT_EQ(parseComplex("(2, -3)"), Complex(2, -3));
    EXPECT_EQ(parseComplex(" ( -1.5 , 0 ) "), Complex(-1.5, 0));
}

TEST(ParseComplexTest, RejectsMalformedText)
{
    EXPECT_THROW(parseComplex(""), InputConversionError);
    EXPECT_THROW(parseComplex("   "), InputConversionError);
    EXPECT_THROW(parseComplex("abc"), InputConversionError);
    EXPECT_THROW(parseComplex("2+3j"), InputConversionError);
    EXPECT_THROW(parseComplex("2x"), InputConversionError);
    EXPECT_THROW(parseComplex("1e"), InputConversionError);
    EXPECT_THROW(parseComplex("(1,2,3)"), InputConversionError);
    EXPECT_THROW(parseComplex("(1)"), InputConversionError);
    EXPECT_THROW(parseComplex("(,)"), InputConversionError);
    EXPECT_THROW(parseComplex("xi"), InputConversionError);
}

TEST(ParseComplexTest, RejectsNonFiniteValues)
{
    EXPECT_THROW(parseComplex("nan"), InputConversionError);
    EXPECT_THROW(parseComplex("inf"), InputConversionError);
    EXPECT_THROW(parseComplex("1+infi"), InputConversionError);
}

TEST(CoerceOperandTest, ComplexPassesThrough)
{
    Operand operand = Complex(1, -2);
    EXPECT_EQ(coerceOperand(operand), Complex(1, -2));
}

TEST(CoerceOperandTest, RealBecomesComplex)
{
    Operand operand = 2.5L;
    EXPECT_EQ(coerceOperand(operand), Complex(2.5, 0));
}

TEST(CoerceOperandTest, NumericStringMatchesNumber)
{
    Operand text = std::string("2");
    Operand number = 2.0L;
    EXPECT_EQ(coerceOperand(text), coerceOperand(number));
}

TEST(CoerceOperandTest, RejectsUnconvertibleOperands)
{
    Operand text = std::string("two");
    EXPECT_THROW(coerceOperand(text), InputConversionError);

    Operand infinite = std::numeric_limits<long double>::infinity();
    EXPECT_THROW(coerceOperand(infinite), InputConversionError);
}

TEST(CoerceOperandTest, PowWithNumericStringEqualsPowWithNumber)
{
    Complex z(2, 3);
    BinarySelector fromText{ BinaryOperation::Pow, coerceOperand(Operand(std::string("2"))) };
    BinarySelector fromNumber{ BinaryOperation::Pow, coerceOperand(Operand(2.0L)) };

    EXPECT_EQ(std::get<Complex>(apply(z, fromText)), std::get<Complex>(apply(z, fromNumber)));
}
