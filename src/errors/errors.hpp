#ifndef ERRORS_H
#define ERRORS_H

#include <stdexcept>
#include <string>

class ComplexOpError : public std::runtime_error {
    public:
        explicit ComplexOpError(const std::string& message) : std::runtime_error(message) {}
};

// Bad flag combination or missing/superfluous operand on the command line
class ConfigurationError : public ComplexOpError {
    public:
        explicit ConfigurationError(const std::string& message) : ComplexOpError(message) {}
};

// Operand that is neither a complex value nor convertible to a real number
class InputConversionError : public ComplexOpError {
    public:
        explicit InputConversionError(const std::string& message) : ComplexOpError(message) {}
};

// Failure raised by a complex primitive (reciprocal of zero, log in base 1, ...)
class ComputationError : public ComplexOpError {
    public:
        explicit ComputationError(const std::string& message) : ComplexOpError(message) {}
};

#endif
