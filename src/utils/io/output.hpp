#ifndef OUTPUT_H
#define OUTPUT_H

#include <string>

#include <nlohmann/json.hpp>

#include "../../operations/operations.hpp"

const int DEFAULT_PRECISION = 15;
const int MIN_PRECISION = 1;
const int MAX_PRECISION = 21;

std::string formatNumber(long double value, int precision);

// "re+imi" for complex values, the bare number for scalars
std::string formatValue(const OperationResult& result, int precision);

// Value followed by magnitude and phase for complex results
std::string formatText(const OperationResult& result, int precision);

// {"real", "imaginary", "magnitude", "phase"} for complex results, a number for scalars
nlohmann::json toJson(const OperationResult& result);

nlohmann::json errorJson(const std::string& message);

#endif
