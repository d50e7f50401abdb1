#include "phone_validation.hpp"
#include "utils.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/common/types/data_chunk.hpp"
#include "duckdb/common/vector_operations/vector_operations.hpp"
#include <regex>
#include <vector>

namespace duckdb {
namespace brkit {

static const std::regex& StrictPhonePattern() {
    static const std::regex pattern(R"(^\+55\d{2}9?\d{8}$)");
    return pattern;
}

// Accepted layouts after separators are stripped
static const std::vector<std::regex>& FlexiblePhonePatterns() {
    static const std::vector<std::regex> patterns = {
        std::regex(R"(^\+55\d{2}9\d{8}$)"), // +5516997184720
        std::regex(R"(^\+55\d{2}\d{8}$)"),  // +551687184720 (landline, no 9)
        std::regex(R"(^55\d{2}9\d{8}$)"),   // 5516997184720
        std::regex(R"(^0\d{2}9\d{8}$)"),    // 016997184720
        std::regex(R"(^\d{2}9\d{8}$)"),     // 16997184720
    };
    return patterns;
}

static std::string strip_phone_separators(const std::string& phone) {
    std::string cleaned;
    cleaned.reserve(phone.size());
    for (char c : phone) {
        if (c == ' ' || c == '-' || c == '(' || c == ')' || c == '.') {
            continue;
        }
        cleaned += c;
    }
    return cleaned;
}

bool validate_phone(const std::string& phone) {
    return std::regex_match(phone, StrictPhonePattern());
}

bool validate_phone_flexible(const std::string& phone) {
    std::string cleaned = strip_phone_separators(phone);

    for (const auto& pattern : FlexiblePhonePatterns()) {
        if (std::regex_match(cleaned, pattern)) {
            return true;
        }
    }
    return false;
}

static std::string build_phone(const std::string& area, const std::string& prefix, const std::string& line) {
    return "+55 (" + area + ") " + prefix + "-" + line;
}

std::string format_phone(const std::string& phone) {
    if (!validate_phone_flexible(phone)) {
        return phone;
    }

    std::string digits = extract_digits(phone);

    // 5516997184720 -> +55 (16) 99718-4720
    if (digits.length() == 13 && digits.compare(0, 2, "55") == 0) {
        return build_phone(digits.substr(2, 2), digits.substr(4, 5), digits.substr(9, 4));
    }
    // 16997184720 -> +55 (16) 99718-4720
    if (digits.length() == 11) {
        return build_phone(digits.substr(0, 2), digits.substr(2, 5), digits.substr(7, 4));
    }
    // 016997184720 -> +55 (16) 99718-4720
    if (digits.length() == 12 && digits[0] == '0') {
        return build_phone(digits.substr(1, 2), digits.substr(3, 5), digits.substr(8, 4));
    }

    return phone;
}

// DuckDB scalar function wrappers
static void BrkitIsValidPhoneFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    UnaryExecutor::Execute<string_t, bool>(
        args.data[0], result, args.size(),
        [&](string_t input) {
            return validate_phone(input.GetString());
        });
}

static void BrkitIsValidPhoneFlexibleFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    UnaryExecutor::Execute<string_t, bool>(
        args.data[0], result, args.size(),
        [&](string_t input) {
            return validate_phone_flexible(input.GetString());
        });
}

static void BrkitFormatPhoneFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    UnaryExecutor::Execute<string_t, string_t>(
        args.data[0], result, args.size(),
        [&](string_t input) {
            return StringVector::AddString(result, format_phone(input.GetString()));
        });
}

void RegisterPhoneValidationFunctions(ExtensionLoader &loader) {
    // brkit_is_valid_phone(phone VARCHAR) -> BOOLEAN
    auto is_valid_phone_func = ScalarFunction({LogicalType::VARCHAR}, LogicalType::BOOLEAN, BrkitIsValidPhoneFunction);
    is_valid_phone_func.description = "Validates a Brazilian phone number in the strict +55AANNNNNNNNN format.\n"
                                      "Usage: SELECT brkit_is_valid_phone('+5516997184720');\n"
                                      "Returns: BOOLEAN";
    ScalarFunctionSet is_valid_phone_set("brkit_is_valid_phone");
    is_valid_phone_set.AddFunction(is_valid_phone_func);
    loader.RegisterFunction(is_valid_phone_set);

    // brkit_is_valid_phone_flexible(phone VARCHAR) -> BOOLEAN
    auto flexible_func = ScalarFunction({LogicalType::VARCHAR}, LogicalType::BOOLEAN, BrkitIsValidPhoneFlexibleFunction);
    flexible_func.description = "Validates a Brazilian phone number, ignoring spaces, dashes, dots and parentheses.\n"
                                "Usage: SELECT brkit_is_valid_phone_flexible('(16) 99718-4720');\n"
                                "Returns: BOOLEAN";
    ScalarFunctionSet flexible_set("brkit_is_valid_phone_flexible");
    flexible_set.AddFunction(flexible_func);
    loader.RegisterFunction(flexible_set);

    // brkit_format_phone(phone VARCHAR) -> VARCHAR
    auto format_phone_func = ScalarFunction({LogicalType::VARCHAR}, LogicalType::VARCHAR, BrkitFormatPhoneFunction);
    format_phone_func.description = "Formats a Brazilian phone number as +55 (AA) NNNNN-NNNN; invalid values are returned unchanged.\n"
                                    "Usage: SELECT brkit_format_phone('16997184720');\n"
                                    "Returns: VARCHAR (e.g., '+55 (16) 99718-4720')";
    ScalarFunctionSet format_phone_set("brkit_format_phone");
    format_phone_set.AddFunction(format_phone_func);
    loader.RegisterFunction(format_phone_set);
}

} // namespace brkit
} // namespace duckdb
