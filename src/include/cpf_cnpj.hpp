#pragma once

#include "duckdb/main/extension/extension_loader.hpp"
#include "cadastro/check_digits.hpp"
#include <string>

namespace duckdb {
namespace brkit {

// CPF/CNPJ validation on raw input (punctuation is ignored)
bool validate_cpf(const std::string& input);
bool validate_cnpj(const std::string& input);
bool validate_cpf_cnpj(const std::string& input);
cadastro::DocumentType identify_cpf_cnpj(const std::string& input);

// Formatting; invalid input is returned unchanged.
// require_valid = false only checks the digit count.
std::string format_cpf(const std::string& input, bool require_valid = true);
std::string format_cnpj(const std::string& input, bool require_valid = true);
std::string format_cpf_cnpj(const std::string& input);

// Register CPF/CNPJ scalar functions
void RegisterCpfCnpjFunctions(ExtensionLoader &loader);

} // namespace brkit
} // namespace duckdb
