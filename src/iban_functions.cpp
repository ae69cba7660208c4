#include "iban_functions.hpp"
#include "iban_registry.hpp"
#include "ibangen_log.hpp"
#include "random_digits.hpp"
#include "utils.hpp"
#include "accountgen/account_generator.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/common/types/data_chunk.hpp"
#include "duckdb/common/vector_operations/unary_executor.hpp"
#include "duckdb/common/vector_operations/binary_executor.hpp"
#include "duckdb/main/client_context.hpp"
#include "duckdb/main/extension/extension_loader.hpp"
#include <string>
#include <unordered_map>

namespace duckdb {
namespace ibangen {

using accountgen::AccountGenerator;
using accountgen::CountryRule;

// Generators for the rows of one vector. Generators of most countries are
// stateless and shared per country; a Swedish generator remembers the bank of
// the first account it sees, so every Swedish row gets a fresh one.
class GeneratorCache {
public:
    explicit GeneratorCache(bool warnings_p) : warnings(warnings_p) {
    }

    AccountGenerator &Get(const std::string &country) {
        std::string country_code = to_upper(trim(country));
        if (AccountGenerator::RuleFor(country_code) == CountryRule::SWEDEN) {
            swedish = Create(country_code);
            return *swedish;
        }
        auto it = generators.find(country_code);
        if (it == generators.end()) {
            it = generators.emplace(country_code, Create(country_code)).first;
        }
        return *it->second;
    }

private:
    unique_ptr<AccountGenerator> Create(const std::string &country_code) {
        auto generator = make_uniq<AccountGenerator>(country_code, seeds.NextSeed());
        if (!warnings) {
            generator->DisableWarnings();
        }
        return generator;
    }

    bool warnings;
    RandomDigits seeds;
    std::unordered_map<std::string, unique_ptr<AccountGenerator>> generators;
    unique_ptr<AccountGenerator> swedish;
};

static bool WarningsEnabled(ExpressionState &state) {
    Value value;
    auto &context = state.GetContext();
    if (context.TryGetCurrentSetting("ibangen_warnings", value) && !value.IsNull()) {
        return BooleanValue::Get(value);
    }
    return true;
}

//===--------------------------------------------------------------------===//
// Generation
//===--------------------------------------------------------------------===//

// ibangen_regenerate_iban(iban VARCHAR) -> VARCHAR
static void RegenerateIbanFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    GeneratorCache cache(WarningsEnabled(state));
    UnaryExecutor::Execute<string_t, string_t>(
        args.data[0], result, args.size(),
        [&](string_t input) {
            std::string old_iban = input.GetString();
            unique_ptr<Iban> iban;
            try {
                iban = make_uniq<Iban>(Iban::Parse(old_iban));
            } catch (const InvalidInputException &e) {
                Log::Warning("Old IBAN is invalid, leaving it unmodified. IBAN: " + old_iban + ", error: " +
                             ErrorMessage(e));
                return StringVector::AddString(result, old_iban);
            }
            auto &generator = cache.Get(iban->GetCountryCode());
            return StringVector::AddString(result, generator.RegenerateIban(*iban).GetCompact());
        });
}

// ibangen_generate_iban(country VARCHAR) -> VARCHAR
static void GenerateIbanFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    GeneratorCache cache(WarningsEnabled(state));
    UnaryExecutor::Execute<string_t, string_t>(
        args.data[0], result, args.size(),
        [&](string_t country) {
            auto &generator = cache.Get(country.GetString());
            return StringVector::AddString(result, generator.GenerateIban().GetCompact());
        });
}

// ibangen_regenerate_bban(country VARCHAR, bban VARCHAR) -> VARCHAR
static void RegenerateBbanFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    GeneratorCache cache(WarningsEnabled(state));
    BinaryExecutor::Execute<string_t, string_t, string_t>(
        args.data[0], args.data[1], result, args.size(),
        [&](string_t country, string_t bban) {
            auto &generator = cache.Get(country.GetString());
            return StringVector::AddString(result, generator.RegenerateBban(bban.GetString()));
        });
}

//===--------------------------------------------------------------------===//
// Conversion
//===--------------------------------------------------------------------===//

// ibangen_bban_to_iban(country VARCHAR, bban VARCHAR) -> VARCHAR, NULL when not convertible
static void BbanToIbanFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    GeneratorCache cache(false);
    BinaryExecutor::ExecuteWithNulls<string_t, string_t, string_t>(
        args.data[0], args.data[1], result, args.size(),
        [&](string_t country, string_t bban, ValidityMask &mask, idx_t idx) {
            auto &generator = cache.Get(country.GetString());
            try {
                return StringVector::AddString(result, generator.BbanToIban(bban.GetString()).GetCompact());
            } catch (const InvalidInputException &e) {
                Log::Debug("BBAN not convertible: " + ErrorMessage(e));
                mask.SetInvalid(idx);
                return string_t();
            }
        });
}

// ibangen_iban_to_bban(iban VARCHAR) -> VARCHAR, national form, NULL for invalid IBANs
static void IbanToBbanFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    GeneratorCache cache(false);
    UnaryExecutor::ExecuteWithNulls<string_t, string_t>(
        args.data[0], result, args.size(),
        [&](string_t input, ValidityMask &mask, idx_t idx) {
            unique_ptr<Iban> iban;
            try {
                iban = make_uniq<Iban>(Iban::Parse(input.GetString()));
            } catch (const InvalidInputException &) {
                mask.SetInvalid(idx);
                return string_t();
            }
            auto &generator = cache.Get(iban->GetCountryCode());
            return StringVector::AddString(result, generator.IbanToBban(*iban));
        });
}

//===--------------------------------------------------------------------===//
// Inspection
//===--------------------------------------------------------------------===//

// ibangen_is_valid_iban(iban VARCHAR) -> BOOLEAN
static void IsValidIbanFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    UnaryExecutor::Execute<string_t, bool>(
        args.data[0], result, args.size(),
        [&](string_t iban) {
            return Iban::IsValid(iban.GetString());
        });
}

// ibangen_format_iban(iban VARCHAR) -> VARCHAR
static void FormatIbanFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    UnaryExecutor::Execute<string_t, string_t>(
        args.data[0], result, args.size(),
        [&](string_t iban) {
            return StringVector::AddString(result, Iban::Format(iban.GetString()));
        });
}

typedef std::string (Iban::*IbanField)() const;

template <IbanField FIELD>
static void IbanFieldFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    UnaryExecutor::ExecuteWithNulls<string_t, string_t>(
        args.data[0], result, args.size(),
        [&](string_t input, ValidityMask &mask, idx_t idx) {
            try {
                auto iban = Iban::Parse(input.GetString());
                return StringVector::AddString(result, (iban.*FIELD)());
            } catch (const InvalidInputException &) {
                mask.SetInvalid(idx);
                return string_t();
            }
        });
}

static void RegisterVarcharFunction(ExtensionLoader &loader, const std::string &name,
                                    vector<LogicalType> arguments, scalar_function_t function,
                                    bool is_volatile) {
    ScalarFunctionSet set(name);
    ScalarFunction scalar(std::move(arguments), LogicalType::VARCHAR, std::move(function));
    if (is_volatile) {
        scalar.stability = FunctionStability::VOLATILE;
    }
    set.AddFunction(scalar);
    loader.RegisterFunction(set);
}

void RegisterIbanFunctions(ExtensionLoader &loader) {
    // ibangen_regenerate_iban(iban) - New account number, same country and bank
    RegisterVarcharFunction(loader, "ibangen_regenerate_iban", {LogicalType::VARCHAR},
                            RegenerateIbanFunction, true);

    // ibangen_generate_iban(country) - Random IBAN, the bank need not exist
    RegisterVarcharFunction(loader, "ibangen_generate_iban", {LogicalType::VARCHAR},
                            GenerateIbanFunction, true);

    // ibangen_regenerate_bban(country, bban) - New account number for a national BBAN
    RegisterVarcharFunction(loader, "ibangen_regenerate_bban", {LogicalType::VARCHAR, LogicalType::VARCHAR},
                            RegenerateBbanFunction, true);

    RegisterVarcharFunction(loader, "ibangen_bban_to_iban", {LogicalType::VARCHAR, LogicalType::VARCHAR},
                            BbanToIbanFunction, false);
    RegisterVarcharFunction(loader, "ibangen_iban_to_bban", {LogicalType::VARCHAR}, IbanToBbanFunction, false);

    ScalarFunctionSet is_valid_iban_set("ibangen_is_valid_iban");
    is_valid_iban_set.AddFunction(ScalarFunction({LogicalType::VARCHAR},
                                                 LogicalType::BOOLEAN,
                                                 IsValidIbanFunction));
    loader.RegisterFunction(is_valid_iban_set);

    RegisterVarcharFunction(loader, "ibangen_format_iban", {LogicalType::VARCHAR}, FormatIbanFunction, false);
    RegisterVarcharFunction(loader, "ibangen_iban_country_code", {LogicalType::VARCHAR},
                            IbanFieldFunction<&Iban::GetCountryCode>, false);
    RegisterVarcharFunction(loader, "ibangen_iban_check_digits", {LogicalType::VARCHAR},
                            IbanFieldFunction<&Iban::GetCheckDigits>, false);
    RegisterVarcharFunction(loader, "ibangen_iban_bank_code", {LogicalType::VARCHAR},
                            IbanFieldFunction<&Iban::GetBankCode>, false);
    RegisterVarcharFunction(loader, "ibangen_iban_account_code", {LogicalType::VARCHAR},
                            IbanFieldFunction<&Iban::GetAccountCode>, false);
}

} // namespace ibangen
} // namespace duckdb
