#ifndef OPERATION_OPTION_H
#define OPERATION_OPTION_H

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "../complex/complex.hpp"
#include "../operations/operations.hpp"

using OperationTag = std::variant<UnaryOperation, BinaryOperation>;

struct operationOption {
    std::string name;
    std::string flag;
    OperationTag tag;
};

const std::vector<operationOption>& operationOptions();

// nullptr when no operation uses this flag
const operationOption* findOperationOption(const std::string& flag);

const operationOption& defaultOperationOption();

bool requiresArgument(const operationOption& option);

// Pairs the chosen operation with its second operand, throwing ConfigurationError
// when a binary operation has none or a unary one is given one
Selector makeSelector(const operationOption& option, const std::optional<Complex>& argument);

#endif
