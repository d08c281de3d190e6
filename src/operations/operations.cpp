#include <stdexcept>

#include "operations.hpp"
#include "../errors/errors.hpp"

namespace {
    Complex applyUnary(const Complex& z, UnaryOperation op) {
        switch (op) {
            case UnaryOperation::Conjugate:  return Complex::conj(z);
            case UnaryOperation::Reciprocal: return Complex::reciprocal(z);
            case UnaryOperation::Negate:     return -z;
            case UnaryOperation::Abs:        throw std::invalid_argument("magnitude is a scalar result");
            case UnaryOperation::Acos:       return Complex::acos(z);
            case UnaryOperation::Asin:       return Complex::asin(z);
            case UnaryOperation::Atan:       return Complex::atan(z);
            case UnaryOperation::Cos:        return Complex::cos(z);
            case UnaryOperation::Cosh:       return Complex::cosh(z);
            case UnaryOperation::Exp:        return Complex::exp(z);
            case UnaryOperation::Log10:      return Complex::log10(z);
            case UnaryOperation::Sin:        return Complex::sin(z);
            case UnaryOperation::Sinh:       return Complex::sinh(z);
            case UnaryOperation::Sqrt:       return Complex::sqrt(z);
            case UnaryOperation::Tan:        return Complex::tan(z);
            case UnaryOperation::Tanh:       return Complex::tanh(z);
        }

        throw std::invalid_argument("unhandled unary operation");
    }

    Complex applyBinary(const Complex& z, BinaryOperation op, const Complex& argument) {
        switch (op) {
            case BinaryOperation::Pow: return Complex::pow(z, argument);
            case BinaryOperation::Log: return Complex::log(z, argument);
        }

        throw std::invalid_argument("unhandled binary operation");
    }
}

OperationResult apply(const Complex& object, const Selector& selector) {
    try {
        if (const UnaryOperation* op = std::get_if<UnaryOperation>(&selector)) {
            if (*op == UnaryOperation::Abs)
                return Complex::mag(object);

            return applyUnary(object, *op);
        }

        const BinarySelector& binary = std::get<BinarySelector>(selector);
        return applyBinary(object, binary.op, binary.argument);
    }
    catch (const std::domain_error& e) {
        throw ComputationError(e.what());
    }
}

bool isScalar(const OperationResult& result) {
    return std::holds_alternative<long double>(result);
}
