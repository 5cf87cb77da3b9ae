#pragma once

#include <pep2rpm/config.hpp>
#include <pep2rpm/marker.hpp>
#include <pep2rpm/requirement.hpp>
#include <pep2rpm/result.hpp>
#include <string>
#include <vector>

namespace pep2rpm {

// Dependency-related core metadata of one Python distribution, as a
// metadata extractor hands it over
struct PackageMetadata {
    std::string version;                     // Version
    std::vector<std::string> requires_dist;  // Requires-Dist
    std::vector<std::string> provides_extra; // Provides-Extra
    std::vector<std::string> build_requires; // [build-system] requires
    std::string requires_python;             // Requires-Python
};

// One spec file dependency line: "Requires: a, b"
struct DependencyTag {
    std::string tag;
    std::vector<std::string> entries;

    std::string to_string() const;
};

struct DependencyPlan {
    std::string rpm_version;  // Version as the clauses write it, empty when not given
    std::vector<DependencyTag> tags;
};

// Works out the BuildRequires, Requires and optional dependency lines of a
// package from its metadata and the [dependencies] configuration.
class DependencyPlanner {
public:
    DependencyPlanner(RequirementConverter converter, DependencyOptions options);

    static Result<DependencyPlanner> from_config(const Config& cfg);

    Result<DependencyPlan> plan(const PackageMetadata& meta) const;

    // Extras from provided selected by patterns, normalized
    static ExtraSet select_extras(const std::vector<std::string>& provided,
                                  const std::vector<std::string>& patterns);

private:
    RequirementConverter converter_;
    DependencyOptions options_;
};

} // namespace pep2rpm
