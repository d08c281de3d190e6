#ifndef CLI_H
#define CLI_H

#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "../options/operation_option.hpp"
#include "../utils/io/output.hpp"

const int EXIT_OK = 0;
const int EXIT_OPERATION_FAILED = 1;
const int EXIT_USAGE = 2;

enum class OutputFormat {
    Text,
    Json
};

struct RunConfig {
    const operationOption* operation = &defaultOperationOption();
    std::optional<std::string> object;
    std::optional<std::string> argument;
    std::optional<std::string> inputPath;
    OutputFormat format = OutputFormat::Text;
    int precision = DEFAULT_PRECISION;
    bool verbose = false;
    bool showHelp = false;
    bool showVersion = false;
};

// Throws ConfigurationError for conflicting operations, unknown options and
// missing or superfluous operands
RunConfig parseArguments(const std::vector<std::string>& args);

std::string usage();

int run(const RunConfig& config, std::istream& in, std::ostream& out);

int runCommandLine(int argc, char** argv);

#endif
