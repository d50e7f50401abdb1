#include "brkit_config.hpp"
#include "utils.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/common/types/data_chunk.hpp"
#include "duckdb/common/vector_operations/vector_operations.hpp"
#include <iostream>

namespace duckdb {
namespace brkit {

BrkitConfig::BrkitConfig() : verbose_(false), format_unvalidated_(false) {
}

BrkitConfig& BrkitConfig::GetInstance() {
    static BrkitConfig instance;
    return instance;
}

void BrkitConfig::Reset() {
    verbose_.store(false);
    format_unvalidated_.store(false);
}

std::vector<std::string> BrkitConfig::OptionNames() {
    return {OPTION_VERBOSE, OPTION_FORMAT_UNVALIDATED};
}

bool parse_bool_option(const std::string& value, bool& out) {
    std::string normalized = to_lower(trim(value));

    if (normalized == "true" || normalized == "1" || normalized == "on" || normalized == "yes") {
        out = true;
        return true;
    }
    if (normalized == "false" || normalized == "0" || normalized == "off" || normalized == "no") {
        out = false;
        return true;
    }
    return false;
}

void BrkitConfig::SetOption(const std::string& name, const std::string& value) {
    std::string key = to_lower(trim(name));

    bool parsed;
    if (key != OPTION_VERBOSE && key != OPTION_FORMAT_UNVALIDATED) {
        throw InvalidInputException("Unknown brkit option '%s' (expected one of: %s)", name,
                                    join_strings(OptionNames(), ", "));
    }
    if (!parse_bool_option(value, parsed)) {
        throw InvalidInputException("Invalid value '%s' for brkit option '%s': expected true or false", value, key);
    }

    if (key == OPTION_VERBOSE) {
        SetVerbose(parsed);
    } else {
        SetFormatUnvalidated(parsed);
    }

    log_info("option " + key + " set to " + (parsed ? "true" : "false"));
}

std::string BrkitConfig::GetOption(const std::string& name) const {
    std::string key = to_lower(trim(name));

    if (key == OPTION_VERBOSE) {
        return IsVerbose() ? "true" : "false";
    }
    if (key == OPTION_FORMAT_UNVALIDATED) {
        return FormatUnvalidated() ? "true" : "false";
    }

    throw InvalidInputException("Unknown brkit option '%s' (expected one of: %s)", name,
                                join_strings(OptionNames(), ", "));
}

void log_info(const std::string& message) {
    if (BrkitConfig::GetInstance().IsVerbose()) {
        std::cout << "brkit: " << message << std::endl;
    }
}

// brkit_set_option(name VARCHAR, value VARCHAR) -> VARCHAR
static void BrkitSetOptionFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    BinaryExecutor::Execute<string_t, string_t, string_t>(
        args.data[0], args.data[1], result, args.size(),
        [&](string_t name, string_t value) {
            auto& config = BrkitConfig::GetInstance();
            config.SetOption(name.GetString(), value.GetString());
            std::string key = to_lower(trim(name.GetString()));
            return StringVector::AddString(result, "brkit option " + key + " set to: " + config.GetOption(key));
        });
}

// brkit_get_option(name VARCHAR) -> VARCHAR
static void BrkitGetOptionFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    UnaryExecutor::Execute<string_t, string_t>(
        args.data[0], result, args.size(),
        [&](string_t name) {
            return StringVector::AddString(result, BrkitConfig::GetInstance().GetOption(name.GetString()));
        });
}

void RegisterConfigFunctions(ExtensionLoader &loader) {
    ScalarFunctionSet set_option_set("brkit_set_option");
    ScalarFunction set_option_func({LogicalType::VARCHAR, LogicalType::VARCHAR},
                                   LogicalType::VARCHAR, BrkitSetOptionFunction);
    set_option_func.stability = FunctionStability::VOLATILE;
    set_option_func.description = "Sets a brkit extension option (verbose, format_unvalidated).\n"
                                  "Usage: SELECT brkit_set_option('format_unvalidated', 'true');\n"
                                  "Returns: VARCHAR (confirmation message)";
    set_option_set.AddFunction(set_option_func);
    loader.RegisterFunction(set_option_set);

    ScalarFunctionSet get_option_set("brkit_get_option");
    ScalarFunction get_option_func({LogicalType::VARCHAR}, LogicalType::VARCHAR, BrkitGetOptionFunction);
    get_option_func.stability = FunctionStability::VOLATILE;
    get_option_func.description = "Returns the current value of a brkit extension option.\n"
                                  "Usage: SELECT brkit_get_option('verbose');\n"
                                  "Returns: VARCHAR ('true' or 'false')";
    get_option_set.AddFunction(get_option_func);
    loader.RegisterFunction(get_option_set);
}

} // namespace brkit
} // namespace duckdb
