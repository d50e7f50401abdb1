#pragma once

#include "duckdb/main/extension/extension_loader.hpp"
#include <atomic>
#include <string>
#include <vector>

namespace duckdb {
namespace brkit {

// Process-wide extension options, set from SQL with brkit_set_option()
class BrkitConfig {
public:
    static BrkitConfig& GetInstance();

    bool IsVerbose() const { return verbose_.load(); }
    void SetVerbose(bool verbose) { verbose_.store(verbose); }

    // Format CPF/CNPJ by digit count alone, skipping the checksum
    bool FormatUnvalidated() const { return format_unvalidated_.load(); }
    void SetFormatUnvalidated(bool enabled) { format_unvalidated_.store(enabled); }

    // Generic access by option name; throws InvalidInputException on unknown
    // names or unparsable values
    void SetOption(const std::string& name, const std::string& value);
    std::string GetOption(const std::string& name) const;
    static std::vector<std::string> OptionNames();

    // Restore defaults
    void Reset();

private:
    BrkitConfig();
    BrkitConfig(const BrkitConfig&) = delete;
    BrkitConfig& operator=(const BrkitConfig&) = delete;

    std::atomic<bool> verbose_;
    std::atomic<bool> format_unvalidated_;

    static constexpr const char* OPTION_VERBOSE = "verbose";
    static constexpr const char* OPTION_FORMAT_UNVALIDATED = "format_unvalidated";
};

bool parse_bool_option(const std::string& value, bool& out);

// Informational output, only when the verbose option is on
void log_info(const std::string& message);

void RegisterConfigFunctions(ExtensionLoader &loader);

} // namespace brkit
} // namespace duckdb
