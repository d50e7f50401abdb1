#pragma once

#include "duckdb/main/extension/extension_loader.hpp"
#include <string>

namespace duckdb {
namespace brkit {

// Replace accented Latin letters (Portuguese/Spanish set) with their ASCII base letter
std::string remove_accents(const std::string& input);

// Register text normalization scalar functions
void RegisterTextNormalizeFunctions(ExtensionLoader &loader);

} // namespace brkit
} // namespace duckdb
