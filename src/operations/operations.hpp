#ifndef OPERATIONS_H
#define OPERATIONS_H

#include <variant>

#include "../complex/complex.hpp"

enum class UnaryOperation {
    Conjugate,
    Reciprocal,
    Negate,
    Abs,
    Acos,
    Asin,
    Atan,
    Cos,
    Cosh,
    Exp,
    Log10,
    Sin,
    Sinh,
    Sqrt,
    Tan,
    Tanh
};

enum class BinaryOperation {
    Pow,
    Log
};

// A binary selector always carries its second operand
struct BinarySelector {
    BinaryOperation op;
    Complex argument;
};

using Selector = std::variant<UnaryOperation, BinarySelector>;

// Abs yields a bare magnitude, every other operation a complex value
using OperationResult = std::variant<Complex, long double>;

const UnaryOperation DEFAULT_OPERATION = UnaryOperation::Conjugate;

// Throws ComputationError when the underlying primitive rejects its input
OperationResult apply(const Complex& object, const Selector& selector);

bool isScalar(const OperationResult& result);

#endif
