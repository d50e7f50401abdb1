#define DUCKDB_EXTENSION_MAIN
#include "brkit_extension.hpp"
#include "brkit_config.hpp"
#include "cpf_cnpj.hpp"
#include "phone_validation.hpp"
#include "text_normalize.hpp"
#include "case_transform.hpp"

namespace duckdb {

void BrkitExtension::Load(ExtensionLoader &loader) {
    // Brazilian documents
    brkit::RegisterCpfCnpjFunctions(loader);
    brkit::RegisterPhoneValidationFunctions(loader);

    // Text utilities
    brkit::RegisterTextNormalizeFunctions(loader);
    brkit::RegisterCaseTransformFunctions(loader);

    // brkit_set_option / brkit_get_option
    brkit::RegisterConfigFunctions(loader);

    brkit::log_info("extension " + Version() + " loaded");
}

std::string BrkitExtension::Name() {
    return "brkit";
}

std::string BrkitExtension::Version() const {
#ifdef EXT_VERSION
    return EXT_VERSION;
#else
    return "v0.1.0";
#endif
}

} // namespace duckdb

// Entry point for the loadable extension
extern "C" {
DUCKDB_CPP_EXTENSION_ENTRY(brkit, loader) {
    duckdb::BrkitExtension ext;
    ext.Load(loader);
}
}
