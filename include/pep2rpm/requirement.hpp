#pragma once

#include <pep2rpm/config.hpp>
#include <pep2rpm/marker.hpp>
#include <pep2rpm/name.hpp>
#include <pep2rpm/result.hpp>
#include <pep2rpm/specifier.hpp>
#include <pep2rpm/template.hpp>
#include <optional>
#include <string>
#include <vector>

namespace pep2rpm {

// PEP 508 dependency: name [extras] (specifiers | @ url) [; marker]
//   "requests[socks] (>=2.8.1,!=2.9.0) ; python_version < '3.8'"
struct Requirement {
    PkgName name;
    std::vector<std::string> extras;
    SpecifierSet specifiers;
    std::string url;
    std::optional<MarkerExpr> marker;

    static Result<Requirement> parse(const std::string& s);
    std::string to_string() const;
};

// Converts requirement strings into RPM dependency clauses.
//
// Per requirement the marker is evaluated first: statically false drops the
// requirement, statically true emits the versioned capability, and a
// residual condition wraps it as "(<capability clauses> <condition>)".
// Output order follows input order and is byte-for-byte reproducible.
//
// A converter is immutable once built and may be shared between threads.
class RequirementConverter {
public:
    RequirementConverter(NameTemplate package_template,
                         Environment environment,
                         DynamicVariableMap dynamic,
                         SpecifierTranslator translator = SpecifierTranslator());

    static Result<RequirementConverter> from_config(const Config& cfg);

    // One requirement; std::nullopt when its marker is statically false
    Result<std::optional<std::string>> convert_one(const Requirement& req,
                                                   const ExtraSet& extras) const;
    Result<std::optional<std::string>> convert_one(const std::string& req,
                                                   const ExtraSet& extras) const;

    // Stops at the first failing requirement
    Result<std::vector<std::string>> convert(const std::vector<std::string>& reqs,
                                             const ExtraSet& extras) const;

    // One result per input, so callers can skip individual failures
    std::vector<Result<std::optional<std::string>>> convert_each(
        const std::vector<std::string>& reqs, const ExtraSet& extras) const;

    // Same output as convert(), with requirements spread over worker threads.
    // workers == 0 picks std::thread::hardware_concurrency().
    Result<std::vector<std::string>> convert_parallel(const std::vector<std::string>& reqs,
                                                      const ExtraSet& extras,
                                                      unsigned workers = 0) const;

    // Version clauses for a fixed capability, e.g. python(abi) from
    // Requires-Python; empty text when specifiers is empty
    Result<std::string> constrain(const std::string& capability,
                                  const std::string& specifiers) const;

    Result<TranslationResult> evaluate(const MarkerExpr& marker, const ExtraSet& extras) const;

    const NameTemplate& package_template() const { return package_template_; }
    const Environment& environment() const { return environment_; }
    const DynamicVariableMap& dynamic() const { return dynamic_; }
    const SpecifierTranslator& translator() const { return translator_; }

private:
    NameTemplate package_template_;
    Environment environment_;
    DynamicVariableMap dynamic_;
    SpecifierTranslator translator_;
};

} // namespace pep2rpm
