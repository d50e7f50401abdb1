#include "text_normalize.hpp"
#include "utils.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/common/types/data_chunk.hpp"
#include "duckdb/common/vector_operations/vector_operations.hpp"
#include <unordered_map>

namespace duckdb {
namespace brkit {

// Accent to ASCII mapping, keyed by the UTF-8 sequence of the accented letter
static const std::unordered_map<std::string, char> ACCENT_MAP = {
    {"á", 'a'}, {"à", 'a'}, {"ã", 'a'}, {"â", 'a'}, {"ä", 'a'},
    {"é", 'e'}, {"è", 'e'}, {"ê", 'e'}, {"ë", 'e'},
    {"í", 'i'}, {"ì", 'i'}, {"î", 'i'}, {"ï", 'i'},
    {"ó", 'o'}, {"ò", 'o'}, {"õ", 'o'}, {"ô", 'o'}, {"ö", 'o'},
    {"ú", 'u'}, {"ù", 'u'}, {"û", 'u'}, {"ü", 'u'},
    {"ç", 'c'}, {"ñ", 'n'},
    {"Á", 'A'}, {"À", 'A'}, {"Ã", 'A'}, {"Â", 'A'}, {"Ä", 'A'},
    {"É", 'E'}, {"È", 'E'}, {"Ê", 'E'}, {"Ë", 'E'},
    {"Í", 'I'}, {"Ì", 'I'}, {"Î", 'I'}, {"Ï", 'I'},
    {"Ó", 'O'}, {"Ò", 'O'}, {"Õ", 'O'}, {"Ô", 'O'}, {"Ö", 'O'},
    {"Ú", 'U'}, {"Ù", 'U'}, {"Û", 'U'}, {"Ü", 'U'},
    {"Ç", 'C'}, {"Ñ", 'N'},
};

std::string remove_accents(const std::string& input) {
    std::string result;
    result.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        size_t len = utf8_char_length(static_cast<unsigned char>(input[i]));
        if (i + len > input.size()) {
            len = input.size() - i;
        }

        if (len == 1) {
            result += input[i];
        } else {
            auto it = ACCENT_MAP.find(input.substr(i, len));
            if (it != ACCENT_MAP.end()) {
                result += it->second;
            } else {
                result.append(input, i, len);
            }
        }
        i += len;
    }

    return result;
}

// DuckDB scalar function wrappers
static void BrkitRemoveAccentsFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    UnaryExecutor::Execute<string_t, string_t>(
        args.data[0], result, args.size(),
        [&](string_t input) {
            std::string input_str = input.GetString();
            std::string output = remove_accents(input_str);
            return StringVector::AddString(result, output);
        });
}

void RegisterTextNormalizeFunctions(ExtensionLoader &loader) {
    // brkit_remove_accents
    auto remove_accents_func = ScalarFunction({LogicalType::VARCHAR}, LogicalType::VARCHAR,
                                              BrkitRemoveAccentsFunction);
    remove_accents_func.description = "Replaces accented letters (á, ã, ç, ñ, ...) with their ASCII base letter.\n"
                                      "Usage: SELECT brkit_remove_accents('João Conceição');\n"
                                      "Returns: VARCHAR (e.g., 'Joao Conceicao')";
    ScalarFunctionSet remove_accents_set("brkit_remove_accents");
    remove_accents_set.AddFunction(remove_accents_func);
    loader.RegisterFunction(remove_accents_set);
}

} // namespace brkit
} // namespace duckdb
