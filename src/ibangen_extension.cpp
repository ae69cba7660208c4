#define DUCKDB_EXTENSION_MAIN
#include "ibangen_extension.hpp"
#include "iban_functions.hpp"
#include "ibangen_log.hpp"
#include "duckdb/main/config.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

namespace duckdb {

static void SetIbangenLogLevel(ClientContext &context, SetScope scope, Value &parameter) {
    if (parameter.IsNull()) {
        ibangen::Log::SetLevel(ibangen::LogLevel::WARN);
        return;
    }
    auto level = ibangen::LogLevelFromString(StringValue::Get(parameter));
    ibangen::Log::SetLevel(level);
    ibangen::Log::Info(std::string("Log level set to ") + ibangen::LogLevelToString(level));
}

static void RegisterIbangenSettings(ExtensionLoader &loader) {
    auto &config = DBConfig::GetConfig(loader.GetDatabaseInstance());

    config.AddExtensionOption("ibangen_log_level",
                              "Minimum level of ibangen diagnostics for the whole process, not reverted by RESET: "
                              "debug, info, warn, error or off",
                              LogicalType::VARCHAR, Value("warn"), SetIbangenLogLevel);

    config.AddExtensionOption("ibangen_warnings",
                              "Warn when a country has no dedicated account number rule",
                              LogicalType::BOOLEAN, Value::BOOLEAN(true));
}

void IbangenExtension::Load(ExtensionLoader &loader) {
    RegisterIbangenSettings(loader);
    ibangen::RegisterIbanFunctions(loader);
}

std::string IbangenExtension::Name() {
    return "ibangen";
}

std::string IbangenExtension::Version() const {
#ifdef EXT_VERSION
    return EXT_VERSION;
#else
    return "v0.1.0";
#endif
}

} // namespace duckdb

// Entry point for the loadable extension
extern "C" {
DUCKDB_CPP_EXTENSION_ENTRY(ibangen, loader) {
    duckdb::IbangenExtension ext;
    ext.Load(loader);
}
}
