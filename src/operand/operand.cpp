#include <cctype>
#include <cmath>
#include <stdexcept>

#include "operand.hpp"
#include "../errors/errors.hpp"

namespace {
    std::string trim(const std::string& text) {
        size_t start = 0;
        size_t end = text.size();

        while (start < end && std::isspace(static_cast<unsigned char>(text[start])))
            start++;
        while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1])))
            end--;

        return text.substr(start, end - start);
    }

    InputConversionError conversionError(const std::string& text) {
        return InputConversionError("'" + text + "' is not a complex value or a real number");
    }

    long double parseReal(const std::string& text, const std::string& literal) {
        std::string trimmed = trim(text);
        if (trimmed.empty())
            throw conversionError(literal);

        long double value = 0.0;
        size_t consumed = 0;
        try {
            value = std::stold(trimmed, &consumed);
        }
        catch (const std::invalid_argument&) {
            throw conversionError(literal);
        }
        catch (const std::out_of_range&) {
            throw InputConversionError("'" + literal + "' is out of range");
        }

        if (consumed != trimmed.size() || !std::isfinite(value))
            throw conversionError(literal);

        return value;
    }

    // Coefficient of i, where a bare sign means +/-1
    long double parseImaginary(const std::string& text, const std::string& literal) {
        if (text.empty() || text == "+")
            return 1.0;
        if (text == "-")
            return -1.0;

        return parseReal(text, literal);
    }
}

Complex parseComplex(const std::string& text) {
    std::string literal = trim(text);
    if (literal.empty())
        throw InputConversionError("empty operand");

    // Pair form (re, im)
    if (literal.front() == '(' && literal.back() == ')') {
        std::string inner = literal.substr(1, literal.size() - 2);
        size_t comma = inner.find(',');
        if (comma == std::string::npos || inner.find(',', comma + 1) != std::string::npos)
            throw conversionError(literal);

        return Complex(parseReal(inner.substr(0, comma), literal), parseReal(inner.substr(comma + 1), literal));
    }

    if (literal.back() != 'i')
        return Complex(parseReal(literal, literal));

    std::string body = literal.substr(0, literal.size() - 1);

    // Split at the last sign that is neither leading nor part of an exponent
    for (size_t k = body.size(); k-- > 1;) {
        if (body[k] != '+' && body[k] != '-')
            continue;

        char prev = body[k - 1];
        if (prev == 'e' || prev == 'E')
            continue;

        return Complex(parseReal(body.substr(0, k), literal), parseImaginary(body.substr(k), literal));
    }

    return Complex(0.0, parseImaginary(body, literal));
}

Complex coerceOperand(const Operand& operand) {
    if (const Complex* z = std::get_if<Complex>(&operand))
        return *z;

    if (const long double* value = std::get_if<long double>(&operand)) {
        if (!std::isfinite(*value))
            throw InputConversionError("operand must be a finite number");

        return Complex(*value);
    }

    return parseComplex(std::get<std::string>(operand));
}
