#include <fstream>

#include "./batch_input.hpp"
#include "../../errors/errors.hpp"

namespace {
    long double component(const nlohmann::json& item, const char* key, const char* alias) {
        auto it = item.find(key);
        if (it == item.end())
            it = item.find(alias);
        if (it == item.end())
            return 0.0;

        if (!it->is_number())
            throw InputConversionError(std::string("'") + it.key() + "' must be a number");

        return it->get<double>();
    }
}

std::vector<nlohmann::json> readBatch(std::istream& in) {
    nlohmann::json document;
    try {
        document = nlohmann::json::parse(in);
    }
    catch (const nlohmann::json::exception& e) {
        throw InputConversionError(std::string("malformed batch input: ") + e.what());
    }

    if (!document.is_array())
        return { document };

    return document.get<std::vector<nlohmann::json>>();
}

std::vector<nlohmann::json> readBatchFile(const std::string& path, std::istream& stdinStream) {
    if (path == "-")
        return readBatch(stdinStream);

    std::ifstream file(path);
    if (!file)
        throw InputConversionError("cannot open input file '" + path + "'");

    return readBatch(file);
}

Operand operandFromJson(const nlohmann::json& item) {
    if (item.is_number())
        return static_cast<long double>(item.get<double>());

    if (item.is_string())
        return item.get<std::string>();

    if (item.is_object()) {
        bool hasComponent = item.contains("real") || item.contains("re") || item.contains("imaginary") || item.contains("imag");
        if (!hasComponent)
            throw InputConversionError("batch item " + item.dump() + " has neither a real nor an imaginary part");

        return Complex(component(item, "real", "re"), component(item, "imaginary", "imag"));
    }

    throw InputConversionError("batch item " + item.dump() + " is not an operand");
}
