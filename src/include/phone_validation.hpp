#pragma once

#include "duckdb/main/extension/extension_loader.hpp"
#include <string>

namespace duckdb {
namespace brkit {

// Strict Brazilian phone format: +55 + area code (2 digits) + optional 9 + 8 digits
bool validate_phone(const std::string& phone);

// Accepts spaces, '-', '(', ')' and '.' plus the common national prefixes
bool validate_phone_flexible(const std::string& phone);

// +55 (AA) NNNNN-NNNN; anything not flexibly valid is returned unchanged
std::string format_phone(const std::string& phone);

void RegisterPhoneValidationFunctions(ExtensionLoader &loader);

} // namespace brkit
} // namespace duckdb
