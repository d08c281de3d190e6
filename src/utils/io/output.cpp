#include <cmath>
#include <iomanip>
#include <sstream>

#include "./output.hpp"

std::string formatNumber(long double value, int precision) {
    std::ostringstream stream;
    stream << std::setprecision(precision) << value;
    return stream.str();
}

std::string formatValue(const OperationResult& result, int precision) {
    if (isScalar(result))
        return formatNumber(std::get<long double>(result), precision);

    const Complex& z = std::get<Complex>(result);
    long double imag = z.imag();

    std::string text = formatNumber(z.real(), precision);
    if (std::signbit(imag))
        text += "-" + formatNumber(-imag, precision);
    else
        text += "+" + formatNumber(imag, precision);

    return text + "i";
}

std::string formatText(const OperationResult& result, int precision) {
    if (isScalar(result))
        return formatValue(result, precision);

    const Complex& z = std::get<Complex>(result);

    return formatValue(result, precision)
        + "  (magnitude " + formatNumber(Complex::mag(z), precision)
        + ", phase " + formatNumber(Complex::phase(z), precision) + ")";
}

nlohmann::json toJson(const OperationResult& result) {
    if (isScalar(result))
        return static_cast<double>(std::get<long double>(result));

    const Complex& z = std::get<Complex>(result);

    return {
        { "real", static_cast<double>(z.real()) },
        { "imaginary", static_cast<double>(z.imag()) },
        { "magnitude", static_cast<double>(Complex::mag(z)) },
        { "phase", static_cast<double>(Complex::phase(z)) },
    };
}

nlohmann::json errorJson(const std::string& message) {
    return { { "error", message } };
}
