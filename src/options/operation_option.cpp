#include "operation_option.hpp"
#include "../errors/errors.hpp"

const std::vector<operationOption>& operationOptions() {
    static const std::vector<operationOption> options = {
        { "Conjugate", "--conjugate", UnaryOperation::Conjugate },
        { "Reciprocal", "--reciprocal", UnaryOperation::Reciprocal },
        { "Negate", "--negate", UnaryOperation::Negate },
        { "Abs", "--abs", UnaryOperation::Abs },
        { "Acos", "--acos", UnaryOperation::Acos },
        { "Asin", "--asin", UnaryOperation::Asin },
        { "Atan", "--atan", UnaryOperation::Atan },
        { "Cos", "--cos", UnaryOperation::Cos },
        { "Cosh", "--cosh", UnaryOperation::Cosh },
        { "Exp", "--exp", UnaryOperation::Exp },
        { "Log10", "--log10", UnaryOperation::Log10 },
        { "Sin", "--sin", UnaryOperation::Sin },
        { "Sinh", "--sinh", UnaryOperation::Sinh },
        { "Sqrt", "--sqrt", UnaryOperation::Sqrt },
        { "Tan", "--tan", UnaryOperation::Tan },
        { "Tanh", "--tanh", UnaryOperation::Tanh },
        { "Pow", "--pow", BinaryOperation::Pow },
        { "Log", "--log", BinaryOperation::Log },
    };

    return options;
}

const operationOption* findOperationOption(const std::string& flag) {
    for (const operationOption& option : operationOptions()) {
        if (option.flag == flag)
            return &option;
    }

    return nullptr;
}

const operationOption& defaultOperationOption() {
    for (const operationOption& option : operationOptions()) {
        const UnaryOperation* op = std::get_if<UnaryOperation>(&option.tag);
        if (op != nullptr && *op == DEFAULT_OPERATION)
            return option;
    }

    return operationOptions().front();
}

bool requiresArgument(const operationOption& option) {
    return std::holds_alternative<BinaryOperation>(option.tag);
}

Selector makeSelector(const operationOption& option, const std::optional<Complex>& argument) {
    if (const BinaryOperation* op = std::get_if<BinaryOperation>(&option.tag)) {
        if (!argument)
            throw ConfigurationError(option.flag + " requires a second operand");

        return BinarySelector{ *op, *argument };
    }

    if (argument)
        throw ConfigurationError(option.flag + " does not take a second operand");

    return std::get<UnaryOperation>(option.tag);
}
