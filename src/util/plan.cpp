#include <pep2rpm/plan.hpp>
#include <pep2rpm/glob.hpp>
#include <pep2rpm/log.hpp>
#include <pep2rpm/name.hpp>
#include <algorithm>

namespace pep2rpm {

std::string DependencyTag::to_string() const {
    return tag + ": " + join_clauses(entries);
}

DependencyPlanner::DependencyPlanner(RequirementConverter converter,
                                     DependencyOptions options)
    : converter_(std::move(converter)),
      options_(std::move(options)) {}

Result<DependencyPlanner> DependencyPlanner::from_config(const Config& cfg) {
    auto converter = RequirementConverter::from_config(cfg);
    if (converter.is_err()) return std::move(converter).error();
    return Result<DependencyPlanner>::ok(DependencyPlanner(
        std::move(converter).value(), cfg.dependencies));
}

ExtraSet DependencyPlanner::select_extras(const std::vector<std::string>& provided,
                                          const std::vector<std::string>& patterns) {
    std::vector<std::string> normalized;
    normalized.reserve(provided.size());
    for (const auto& extra : provided) {
        normalized.push_back(normalize_name(extra));
    }
    auto selected = glob_filter(patterns, normalized);
    return ExtraSet(selected.begin(), selected.end());
}

static void append(std::vector<std::string>& dst, std::vector<std::string> src) {
    dst.insert(dst.end(), std::make_move_iterator(src.begin()), std::make_move_iterator(src.end()));
}

Result<DependencyPlan> DependencyPlanner::plan(const PackageMetadata& meta) const {
    DependencyPlan out;

    // Same rendering as the clauses, so "pkg >= 1.0" holds for version 1.0
    if (!meta.version.empty()) {
        auto v = converter_.translator().render_version(meta.version);
        if (v.is_err()) return std::move(v).error();
        out.rpm_version = std::move(v).value();
    }

    const bool extract = options_.extract_dependencies.value_or(true);
    const std::vector<std::string> none;
    const auto& deps = extract ? meta.requires_dist : none;
    const auto& provided = extract ? meta.provides_extra : none;

    // Build requirements never see extras
    auto build = converter_.convert(meta.build_requires, ExtraSet{});
    if (build.is_err()) return std::move(build).error();
    if (!build.value().empty()) {
        out.tags.push_back({"BuildRequires", std::move(build).value()});
    }

    std::vector<std::string> required = options_.requires_list.value_or(none);
    auto requires_extras = select_extras(provided, options_.requires_extras.value_or(none));
    auto converted = converter_.convert(deps, requires_extras);
    if (converted.is_err()) return std::move(converted).error();
    append(required, std::move(converted).value());

    std::string python = options_.python_version.value_or(meta.requires_python);
    if (!python.empty()) {
        std::string abi = "python(abi)";
        const DynamicCapability* cap = converter_.dynamic().find("python_version");
        if (cap && cap->kind == CapabilityKind::Ordered) {
            abi = cap->capability.text();
        }
        auto clauses = converter_.constrain(abi, python);
        if (clauses.is_err()) return std::move(clauses).error();
        if (!clauses.value().empty()) {
            required.push_back(std::move(clauses).value());
        }
    }

    std::vector<std::string> optional = options_.suggests_list.value_or(none);
    auto suggests_extras = select_extras(provided, options_.suggests_extras.value_or(none));
    auto suggested = converter_.convert(deps, suggests_extras);
    if (suggested.is_err()) return std::move(suggested).error();
    append(optional, std::move(suggested).value());

    // Only what Requires does not already pull in
    optional.erase(std::remove_if(optional.begin(), optional.end(),
        [&](const std::string& dep) {
            return std::find(required.begin(), required.end(), dep) != required.end();
        }), optional.end());

    if (!required.empty()) {
        out.tags.push_back({"Requires", std::move(required)});
    }

    std::string tag = options_.optional_dependency_tag.value_or("Suggests");
    if (!tag.empty() && !optional.empty()) {
        out.tags.push_back({tag, std::move(optional)});
    } else if (tag.empty() && !optional.empty()) {
        log::debug("no optional dependency tag configured, dropping %zu suggestions",
                   optional.size());
    }

    return Result<DependencyPlan>::ok(std::move(out));
}

} // namespace pep2rpm
