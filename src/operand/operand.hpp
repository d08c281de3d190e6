#ifndef OPERAND_H
#define OPERAND_H

#include <string>
#include <variant>

#include "../complex/complex.hpp"

// Second operand of a binary operation before coercion
using Operand = std::variant<Complex, long double, std::string>;

/*
    Parses a complex literal. Accepted forms:
        2   -1.5   1e-3            real
        3i  -2.5i  i  -i           imaginary
        2+3i  2-3i  2+i            rectangular
        (2,3)  (2, -3)             pair
    Throws InputConversionError on anything else.
*/
Complex parseComplex(const std::string& text);

Complex coerceOperand(const Operand& operand);

#endif
