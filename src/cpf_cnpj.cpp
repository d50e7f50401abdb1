#include "cpf_cnpj.hpp"
#include "brkit_config.hpp"
#include "utils.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/common/types/data_chunk.hpp"
#include "duckdb/common/vector_operations/vector_operations.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

namespace duckdb {
namespace brkit {

using cadastro::CheckDigits;
using cadastro::DocumentType;

bool validate_cpf(const std::string& input) {
    return CheckDigits::ValidateCpf(extract_digits(input));
}

bool validate_cnpj(const std::string& input) {
    return CheckDigits::ValidateCnpj(extract_digits(input));
}

bool validate_cpf_cnpj(const std::string& input) {
    return CheckDigits::Classify(extract_digits(input)) != DocumentType::NONE;
}

DocumentType identify_cpf_cnpj(const std::string& input) {
    return CheckDigits::Classify(extract_digits(input));
}

// DDD.DDD.DDD-DD
std::string format_cpf(const std::string& input, bool require_valid) {
    std::string digits = extract_digits(input);
    if (digits.length() != CheckDigits::CPF_LENGTH) {
        return input;
    }
    if (require_valid && !CheckDigits::ValidateCpf(digits)) {
        return input;
    }

    return digits.substr(0, 3) + "." + digits.substr(3, 3) + "." + digits.substr(6, 3) + "-" +
           digits.substr(9, 2);
}

// DD.DDD.DDD/DDDD-DD
std::string format_cnpj(const std::string& input, bool require_valid) {
    std::string digits = extract_digits(input);
    if (digits.length() != CheckDigits::CNPJ_LENGTH) {
        return input;
    }
    if (require_valid && !CheckDigits::ValidateCnpj(digits)) {
        return input;
    }

    return digits.substr(0, 2) + "." + digits.substr(2, 3) + "." + digits.substr(5, 3) + "/" +
           digits.substr(8, 4) + "-" + digits.substr(12, 2);
}

std::string format_cpf_cnpj(const std::string& input) {
    switch (identify_cpf_cnpj(input)) {
        case DocumentType::CPF:
            return format_cpf(input);
        case DocumentType::CNPJ:
            return format_cnpj(input);
        default:
            return input;
    }
}

// DuckDB scalar function wrappers
static void BrkitExtractDigitsFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    UnaryExecutor::Execute<string_t, string_t>(
        args.data[0], result, args.size(),
        [&](string_t input) {
            return StringVector::AddString(result, extract_digits(input.GetString()));
        });
}

static void BrkitIsValidCpfFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    UnaryExecutor::Execute<string_t, bool>(
        args.data[0], result, args.size(),
        [&](string_t input) {
            return validate_cpf(input.GetString());
        });
}

static void BrkitIsValidCnpjFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    UnaryExecutor::Execute<string_t, bool>(
        args.data[0], result, args.size(),
        [&](string_t input) {
            return validate_cnpj(input.GetString());
        });
}

static void BrkitValidateCpfCnpjFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    UnaryExecutor::Execute<string_t, bool>(
        args.data[0], result, args.size(),
        [&](string_t input) {
            return validate_cpf_cnpj(input.GetString());
        });
}

// Returns 'CPF', 'CNPJ' or NULL when the value is neither
static void BrkitCpfCnpjTypeFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    UnaryExecutor::ExecuteWithNulls<string_t, string_t>(
        args.data[0], result, args.size(),
        [&](string_t input, ValidityMask &mask, idx_t idx) {
            auto doc_type = identify_cpf_cnpj(input.GetString());
            if (doc_type == DocumentType::NONE) {
                mask.SetInvalid(idx);
                return string_t();
            }
            return StringVector::AddString(result, cadastro::DocumentTypeName(doc_type));
        });
}

static void BrkitFormatCpfFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    bool require_valid = !BrkitConfig::GetInstance().FormatUnvalidated();
    UnaryExecutor::Execute<string_t, string_t>(
        args.data[0], result, args.size(),
        [&](string_t input) {
            return StringVector::AddString(result, format_cpf(input.GetString(), require_valid));
        });
}

static void BrkitFormatCnpjFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    bool require_valid = !BrkitConfig::GetInstance().FormatUnvalidated();
    UnaryExecutor::Execute<string_t, string_t>(
        args.data[0], result, args.size(),
        [&](string_t input) {
            return StringVector::AddString(result, format_cnpj(input.GetString(), require_valid));
        });
}

static void BrkitFormatCpfCnpjFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    UnaryExecutor::Execute<string_t, string_t>(
        args.data[0], result, args.size(),
        [&](string_t input) {
            return StringVector::AddString(result, format_cpf_cnpj(input.GetString()));
        });
}

void RegisterCpfCnpjFunctions(ExtensionLoader &loader) {
    auto extract_digits_func = ScalarFunction({LogicalType::VARCHAR}, LogicalType::VARCHAR, BrkitExtractDigitsFunction);
    extract_digits_func.description = "Keeps only the ASCII digits of a string.\n"
                                      "Usage: SELECT brkit_extract_digits('505.429.838-00');\n"
                                      "Returns: VARCHAR (e.g., '50542983800')";
    ScalarFunctionSet extract_digits_set("brkit_extract_digits");
    extract_digits_set.AddFunction(extract_digits_func);
    loader.RegisterFunction(extract_digits_set);

    // brkit_is_valid_cpf(value) - Returns true if the CPF check digits match
    auto is_valid_cpf_func = ScalarFunction({LogicalType::VARCHAR}, LogicalType::BOOLEAN, BrkitIsValidCpfFunction);
    is_valid_cpf_func.description = "Validates a CPF (11 digits, punctuation ignored) using both check digits.\n"
                                    "Usage: SELECT brkit_is_valid_cpf('505.429.838-00');\n"
                                    "Returns: BOOLEAN";
    ScalarFunctionSet is_valid_cpf_set("brkit_is_valid_cpf");
    is_valid_cpf_set.AddFunction(is_valid_cpf_func);
    loader.RegisterFunction(is_valid_cpf_set);

    // brkit_is_valid_cnpj(value) - Returns true if the CNPJ check digits match
    auto is_valid_cnpj_func = ScalarFunction({LogicalType::VARCHAR}, LogicalType::BOOLEAN, BrkitIsValidCnpjFunction);
    is_valid_cnpj_func.description = "Validates a CNPJ (14 digits, punctuation ignored) using both check digits.\n"
                                     "Usage: SELECT brkit_is_valid_cnpj('60.204.424/0001-08');\n"
                                     "Returns: BOOLEAN";
    ScalarFunctionSet is_valid_cnpj_set("brkit_is_valid_cnpj");
    is_valid_cnpj_set.AddFunction(is_valid_cnpj_func);
    loader.RegisterFunction(is_valid_cnpj_set);

    // brkit_validate_cpf_cnpj(value) - CPF or CNPJ depending on the digit count
    auto validate_func = ScalarFunction({LogicalType::VARCHAR}, LogicalType::BOOLEAN, BrkitValidateCpfCnpjFunction);
    validate_func.description = "Validates a value as CPF (11 digits) or CNPJ (14 digits); any other length is invalid.\n"
                                "Usage: SELECT brkit_validate_cpf_cnpj('60204424000108');\n"
                                "Returns: BOOLEAN";
    ScalarFunctionSet validate_set("brkit_validate_cpf_cnpj");
    validate_set.AddFunction(validate_func);
    loader.RegisterFunction(validate_set);

    auto type_func = ScalarFunction({LogicalType::VARCHAR}, LogicalType::VARCHAR, BrkitCpfCnpjTypeFunction);
    type_func.description = "Identifies a value as a valid CPF or CNPJ.\n"
                            "Usage: SELECT brkit_cpf_cnpj_type('50542983800');\n"
                            "Returns: VARCHAR ('CPF', 'CNPJ' or NULL)";
    ScalarFunctionSet type_set("brkit_cpf_cnpj_type");
    type_set.AddFunction(type_func);
    loader.RegisterFunction(type_set);

    auto format_cpf_func = ScalarFunction({LogicalType::VARCHAR}, LogicalType::VARCHAR, BrkitFormatCpfFunction);
    format_cpf_func.description = "Formats a valid CPF as DDD.DDD.DDD-DD; other values are returned unchanged.\n"
                                  "Usage: SELECT brkit_format_cpf('50542983800');\n"
                                  "Returns: VARCHAR (e.g., '505.429.838-00')";
    ScalarFunctionSet format_cpf_set("brkit_format_cpf");
    format_cpf_set.AddFunction(format_cpf_func);
    loader.RegisterFunction(format_cpf_set);

    auto format_cnpj_func = ScalarFunction({LogicalType::VARCHAR}, LogicalType::VARCHAR, BrkitFormatCnpjFunction);
    format_cnpj_func.description = "Formats a valid CNPJ as DD.DDD.DDD/DDDD-DD; other values are returned unchanged.\n"
                                   "Usage: SELECT brkit_format_cnpj('60204424000108');\n"
                                   "Returns: VARCHAR (e.g., '60.204.424/0001-08')";
    ScalarFunctionSet format_cnpj_set("brkit_format_cnpj");
    format_cnpj_set.AddFunction(format_cnpj_func);
    loader.RegisterFunction(format_cnpj_set);

    auto format_func = ScalarFunction({LogicalType::VARCHAR}, LogicalType::VARCHAR, BrkitFormatCpfCnpjFunction);
    format_func.description = "Formats a valid CPF or CNPJ with its canonical punctuation; other values are returned unchanged.\n"
                              "Usage: SELECT brkit_format_cpf_cnpj('60204424000108');\n"
                              "Returns: VARCHAR (e.g., '60.204.424/0001-08')";
    ScalarFunctionSet format_set("brkit_format_cpf_cnpj");
    format_set.AddFunction(format_func);
    loader.RegisterFunction(format_set);
}

} // namespace brkit
} // namespace duckdb
