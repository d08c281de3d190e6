#include <stdexcept>

#include <SDL2/SDL.h>

#include "cli.hpp"
#include "../errors/errors.hpp"
#include "../operand/operand.hpp"
#include "../utils/io/batch_input.hpp"

#ifndef COMPLEXOP_VERSION
#define COMPLEXOP_VERSION "1.0.0"
#endif

namespace {
    bool isOption(const std::string& arg) {
        // Negative operands such as "-2" or "-i" are positional
        return arg == "--" || arg == "-h" || (arg.size() > 2 && arg[0] == '-' && arg[1] == '-');
    }

    std::string optionValue(const std::vector<std::string>& args, size_t& i, const std::string& name, const std::string& inlineValue, bool hasInline) {
        if (hasInline)
            return inlineValue;

        if (i + 1 >= args.size())
            throw ConfigurationError(name + " requires a value");

        return args[++i];
    }

    OutputFormat parseFormat(const std::string& value) {
        if (value == "text")
            return OutputFormat::Text;
        if (value == "json")
            return OutputFormat::Json;

        throw ConfigurationError("unknown output format '" + value + "', expected text or json");
    }

    int parsePrecision(const std::string& value) {
        int precision = 0;
        size_t consumed = 0;
        try {
            precision = std::stoi(value, &consumed);
        }
        catch (const std::logic_error&) {
            throw ConfigurationError("--precision expects an integer, got '" + value + "'");
        }

        if (consumed != value.size() || precision < MIN_PRECISION || precision > MAX_PRECISION)
            throw ConfigurationError("--precision must be an integer between " + std::to_string(MIN_PRECISION) + " and " + std::to_string(MAX_PRECISION));

        return precision;
    }

    OperationResult applyOperand(const Operand& operand, const Selector& selector, const std::string& operationName) {
        Complex object = coerceOperand(operand);

        SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "%s(%Lg, %Lg)", operationName.c_str(), object.real(), object.imag());

        return apply(object, selector);
    }

    int runSingle(const RunConfig& config, const Selector& selector, std::ostream& out) {
        OperationResult result = applyOperand(*config.object, selector, config.operation->name);

        if (config.format == OutputFormat::Json)
            out << toJson(result).dump() << "\n";
        else
            out << formatText(result, config.precision) << "\n";

        return EXIT_OK;
    }

    int runBatch(const RunConfig& config, const Selector& selector, std::istream& in, std::ostream& out) {
        std::vector<nlohmann::json> items = readBatchFile(*config.inputPath, in);
        SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "Read %zu batch items from %s", items.size(), config.inputPath->c_str());

        nlohmann::json results = nlohmann::json::array();
        unsigned int failures = 0;

        for (size_t i = 0; i < items.size(); i++) {
            try {
                OperationResult result = applyOperand(operandFromJson(items[i]), selector, config.operation->name);

                if (config.format == OutputFormat::Json)
                    results.push_back(toJson(result));
                else
                    out << formatText(result, config.precision) << "\n";
            }
            catch (const ComplexOpError& e) {
                // A failing item does not abort the rest of the batch
                SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Item %zu: %s", i, e.what());
                failures++;

                if (config.format == OutputFormat::Json)
                    results.push_back(errorJson(e.what()));
                else
                    out << "error: " << e.what() << "\n";
            }
        }

        if (config.format == OutputFormat::Json)
            out << results.dump() << "\n";

        return failures == 0 ? EXIT_OK : EXIT_OPERATION_FAILED;
    }
}

RunConfig parseArguments(const std::vector<std::string>& args) {
    RunConfig config;
    bool operationSelected = false;
    bool endOfOptions = false;
    std::vector<std::string> positionals;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];

        if (endOfOptions || !isOption(arg)) {
            positionals.push_back(arg);
            continue;
        }

        // Split "--name=value"
        size_t equals = arg.find('=');
        bool hasInline = equals != std::string::npos;
        std::string name = hasInline ? arg.substr(0, equals) : arg;
        std::string inlineValue = hasInline ? arg.substr(equals + 1) : "";

        if (name == "--") {
            endOfOptions = true;
        }
        else if (name == "--help" || name == "-h") {
            config.showHelp = true;
        }
        else if (name == "--version") {
            config.showVersion = true;
        }
        else if (name == "--verbose") {
            config.verbose = true;
        }
        else if (name == "--format") {
            config.format = parseFormat(optionValue(args, i, name, inlineValue, hasInline));
        }
        else if (name == "--precision") {
            config.precision = parsePrecision(optionValue(args, i, name, inlineValue, hasInline));
        }
        else if (name == "--input") {
            config.inputPath = optionValue(args, i, name, inlineValue, hasInline);
        }
        else {
            const operationOption* option = findOperationOption(name);
            if (option == nullptr || hasInline)
                throw ConfigurationError("unknown option '" + arg + "'");

            if (operationSelected && option != config.operation)
                throw ConfigurationError("only one operation may be selected, got " + config.operation->flag + " and " + option->flag);

            config.operation = option;
            operationSelected = true;
        }
    }

    if (config.showHelp || config.showVersion)
        return config;

    size_t next = 0;
    if (!config.inputPath) {
        if (positionals.empty())
            throw ConfigurationError("missing operand");

        config.object = positionals[next++];
    }

    if (next < positionals.size())
        config.argument = positionals[next++];

    if (next < positionals.size())
        throw ConfigurationError("unexpected operand '" + positionals[next] + "'");

    if (requiresArgument(*config.operation) && !config.argument)
        throw ConfigurationError(config.operation->flag + " requires a second operand");

    if (!requiresArgument(*config.operation) && config.argument)
        throw ConfigurationError(config.operation->flag + " does not take a second operand");

    return config;
}

std::string usage() {
    std::string text =
        "Usage: complexop [OPERATION] [OPTIONS] <object> [<argument>]\n"
        "       complexop [OPERATION] [OPTIONS] --input <file|-> [<argument>]\n"
        "\n"
        "Operands are complex literals: 2, -1.5, 3i, 2+3i, 2-3i, (2,3)\n"
        "\n"
        "Operations (at most one, default --conjugate):\n";

    for (const operationOption& option : operationOptions()) {
        text += "  " + option.flag;
        if (requiresArgument(option))
            text += " <argument>";
        text += "\n";
    }

    text +=
        "\n"
        "Options:\n"
        "  --input <file|->      read a JSON array of operands\n"
        "  --format text|json    output format (default text)\n"
        "  --precision <n>       significant digits in text output (default 15)\n"
        "  --verbose             log each operation\n"
        "  --help, --version\n";

    return text;
}

int run(const RunConfig& config, std::istream& in, std::ostream& out) {
    if (config.showHelp) {
        out << usage();
        return EXIT_OK;
    }

    if (config.showVersion) {
        out << "complexop " << COMPLEXOP_VERSION << "\n";
        return EXIT_OK;
    }

    if (config.verbose)
        SDL_LogSetPriority(SDL_LOG_CATEGORY_APPLICATION, SDL_LOG_PRIORITY_DEBUG);

    try {
        std::optional<Complex> argument;
        if (config.argument)
            argument = coerceOperand(*config.argument);

        Selector selector = makeSelector(*config.operation, argument);

        if (config.inputPath)
            return runBatch(config, selector, in, out);

        return runSingle(config, selector, out);
    }
    catch (const ConfigurationError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "%s", e.what());
        return EXIT_USAGE;
    }
    catch (const ComplexOpError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "%s", e.what());
        return EXIT_OPERATION_FAILED;
    }
}

int runCommandLine(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    RunConfig config;
    try {
        config = parseArguments(args);
    }
    catch (const ConfigurationError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "%s (see --help)", e.what());
        return EXIT_USAGE;
    }

    return run(config, std::cin, std::cout);
}
