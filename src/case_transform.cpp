#include "case_transform.hpp"
#include "utils.hpp"
#include "utf8proc.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/common/types/data_chunk.hpp"
#include "duckdb/common/vector_operations/vector_operations.hpp"

namespace duckdb {
namespace brkit {

static constexpr int32_t CAPITAL_SIGMA = 0x03A3;
static constexpr int32_t FINAL_SIGMA = 0x03C2;

std::string to_title_case(const std::string& input) {
    auto words = split_whitespace(input);

    for (auto& word : words) {
        std::string cased;
        cased.reserve(word.size());

        size_t first_len = 0;
        size_t pos = 0;
        while (pos < word.size()) {
            size_t len;
            int32_t codepoint = utf8_decode(word, pos, len);
            if (codepoint < 0) {
                cased.append(word, pos, len);
            } else if (pos == 0) {
                first_len = len;
                utf8_append(cased, utf8proc_toupper(codepoint));
            } else if (codepoint == CAPITAL_SIGMA && pos > first_len && pos + len == word.size()) {
                // Word-final sigma after other lowercased letters
                utf8_append(cased, FINAL_SIGMA);
            } else {
                utf8_append(cased, utf8proc_tolower(codepoint));
            }
            pos += len;
        }

        word = cased;
    }

    return join_strings(words, " ");
}

// "hello" -> "ellohay": first character moved to the end, then "ay"
std::string to_pig_latin(const std::string& input) {
    if (input.empty()) {
        return input;
    }

    size_t first_len = utf8_char_length(static_cast<unsigned char>(input[0]));
    if (first_len > input.size()) {
        first_len = input.size();
    }

    return input.substr(first_len) + input.substr(0, first_len) + "ay";
}

// DuckDB scalar function wrappers
static void BrkitTitleCaseFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    UnaryExecutor::Execute<string_t, string_t>(
        args.data[0], result, args.size(),
        [&](string_t input) {
            std::string input_str = input.GetString();
            std::string output = to_title_case(input_str);
            return StringVector::AddString(result, output);
        });
}

static void BrkitPigLatinFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    UnaryExecutor::Execute<string_t, string_t>(
        args.data[0], result, args.size(),
        [&](string_t input) {
            std::string input_str = input.GetString();
            std::string output = to_pig_latin(input_str);
            return StringVector::AddString(result, output);
        });
}

void RegisterCaseTransformFunctions(ExtensionLoader &loader) {
    auto title_case_func = ScalarFunction({LogicalType::VARCHAR}, LogicalType::VARCHAR, BrkitTitleCaseFunction);
    title_case_func.description = "Capitalizes the first letter of each whitespace-separated word and lowercases the rest.\n"
                                  "Usage: SELECT brkit_title_case('MARIA da silva');\n"
                                  "Returns: VARCHAR (e.g., 'Maria Da Silva')";
    ScalarFunctionSet title_case_set("brkit_title_case");
    title_case_set.AddFunction(title_case_func);
    loader.RegisterFunction(title_case_set);

    auto pig_latin_func = ScalarFunction({LogicalType::VARCHAR}, LogicalType::VARCHAR, BrkitPigLatinFunction);
    pig_latin_func.description = "Moves the first character to the end and appends 'ay'.\n"
                                 "Usage: SELECT brkit_pig_latin('hello');\n"
                                 "Returns: VARCHAR (e.g., 'ellohay')";
    ScalarFunctionSet pig_latin_set("brkit_pig_latin");
    pig_latin_set.AddFunction(pig_latin_func);
    loader.RegisterFunction(pig_latin_set);
}

} // namespace brkit
} // namespace duckdb
