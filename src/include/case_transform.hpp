#pragma once

#include "duckdb/main/extension/extension_loader.hpp"
#include <string>

namespace duckdb {
namespace brkit {

// Case transformation functions
std::string to_title_case(const std::string& input);
std::string to_pig_latin(const std::string& input);

// Register case transformation scalar functions
void RegisterCaseTransformFunctions(ExtensionLoader &loader);

} // namespace brkit
} // namespace duckdb
