#ifndef BATCH_INPUT_H
#define BATCH_INPUT_H

#include <istream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../../operand/operand.hpp"

// Reads a JSON array of operands, a lone operand becomes a one-item batch.
// Throws InputConversionError when the document cannot be parsed.
std::vector<nlohmann::json> readBatch(std::istream& in);

// "-" reads standard input
std::vector<nlohmann::json> readBatchFile(const std::string& path, std::istream& stdinStream);

// Number, complex literal string, or {"real": .., "imaginary": ..} object
Operand operandFromJson(const nlohmann::json& item);

#endif
