#include <pep2rpm/config.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace pep2rpm {

namespace {

Pep2RpmError type_error(const std::string& key, const char* expected) {
    return Pep2RpmError{Pep2RpmError::Config,
        "config key '" + key + "' must be " + expected};
}

// A string or an array of strings
Result<std::vector<std::string>> string_list(const toml::node& node, const std::string& key) {
    std::vector<std::string> out;
    if (auto s = node.value<std::string>()) {
        out.push_back(*s);
        return Result<std::vector<std::string>>::ok(std::move(out));
    }
    auto arr = node.as_array();
    if (!arr) return type_error(key, "a string or an array of strings");
    for (const auto& el : *arr) {
        auto s = el.value<std::string>();
        if (!s) return type_error(key, "an array of strings");
        out.push_back(*s);
    }
    return Result<std::vector<std::string>>::ok(std::move(out));
}

Result<std::string> string_value(const toml::node& node, const std::string& key) {
    auto s = node.value<std::string>();
    if (!s) return type_error(key, "a string");
    return Result<std::string>::ok(*s);
}

Result<bool> bool_value(const toml::node& node, const std::string& key) {
    auto b = node.value<bool>();
    if (!b) return type_error(key, "a boolean");
    return Result<bool>::ok(*b);
}

Status parse_dependencies(const toml::table& tbl, DependencyOptions& deps) {
    for (const auto& [k, v] : tbl) {
        std::string key(k);
        std::string qualified = "dependencies." + key;

        if (key == "requires" || key == "suggests" ||
            key == "requires_extras" || key == "suggests_extras") {
            auto list = string_list(v, qualified);
            if (list.is_err()) return std::move(list).error();
            if (key == "requires") deps.requires_list = std::move(list).value();
            else if (key == "suggests") deps.suggests_list = std::move(list).value();
            else if (key == "requires_extras") deps.requires_extras = std::move(list).value();
            else deps.suggests_extras = std::move(list).value();
        } else if (key == "python_version" || key == "optional_dependency_tag") {
            auto s = string_value(v, qualified);
            if (s.is_err()) return std::move(s).error();
            if (key == "python_version") deps.python_version = std::move(s).value();
            else deps.optional_dependency_tag = std::move(s).value();
        } else if (key == "extract_dependencies") {
            auto b = bool_value(v, qualified);
            if (b.is_err()) return std::move(b).error();
            deps.extract_dependencies = b.value();
        } else {
            return Pep2RpmError{Pep2RpmError::Config,
                "unknown config key '" + qualified + "'"};
        }
    }
    return ok_status();
}

Status parse_dynamic(const toml::table& tbl, DynamicVariableMap& dynamic) {
    for (const auto& [k, v] : tbl) {
        std::string variable(k);
        auto entry = v.as_table();
        if (!entry) return type_error("dynamic." + variable, "a table");

        auto kind_text = (*entry)["kind"].value<std::string>();
        auto capability = (*entry)["capability"].value<std::string>();
        if (!kind_text || !capability) {
            return Pep2RpmError{Pep2RpmError::Config,
                "[dynamic." + variable + "] needs string keys 'kind' and 'capability'"};
        }

        CapabilityKind kind;
        if (*kind_text == "equality" || *kind_text == "equality-only") {
            kind = CapabilityKind::EqualityOnly;
        } else if (*kind_text == "ordered") {
            kind = CapabilityKind::Ordered;
        } else {
            return Pep2RpmError{Pep2RpmError::Config,
                "unknown capability kind '" + *kind_text + "' for " + variable,
                "expected \"equality\" or \"ordered\""};
        }

        PEP2RPM_TRY(dynamic.add(variable, kind, *capability));
    }
    return ok_status();
}

} // anonymous namespace

Config Config::defaults() {
    Config cfg;
    cfg.environment = Environment::defaults();
    cfg.dynamic = DynamicVariableMap::defaults();
    cfg.package_template = "python-{name}";
    cfg.version_style = VersionStyle::Literal;
    cfg.strict_local = false;
    cfg.log_level = log::Info;
    cfg.dependencies.requires_list = std::vector<std::string>{};
    cfg.dependencies.suggests_list = std::vector<std::string>{};
    cfg.dependencies.requires_extras = std::vector<std::string>{};
    cfg.dependencies.suggests_extras = std::vector<std::string>{};
    cfg.dependencies.optional_dependency_tag = "Suggests";
    cfg.dependencies.extract_dependencies = true;
    return cfg;
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return Pep2RpmError{Pep2RpmError::Parse,
            std::string("config TOML parse error: ") + std::string(e.description()),
            "", "", static_cast<int>(e.source().begin.line)};
    }

    Config cfg;

    // [environment] section
    if (auto env = doc["environment"].as_table()) {
        for (const auto& [k, v] : *env) {
            std::string key(k);
            auto s = string_value(v, "environment." + key);
            if (s.is_err()) return std::move(s).error();
            cfg.environment.variables[key] = std::move(s).value();
        }
    } else if (doc.contains("environment")) {
        return type_error("environment", "a table");
    }

    // [templates] section
    if (auto templates = doc["templates"].as_table()) {
        if (auto node = templates->get("python_package")) {
            auto s = string_value(*node, "templates.python_package");
            if (s.is_err()) return std::move(s).error();
            auto tmpl = NameTemplate::parse(s.value());
            if (tmpl.is_err()) return std::move(tmpl).error();
            cfg.package_template = std::move(s).value();
        }
    }

    // [dynamic.<variable>] sections
    if (auto dynamic = doc["dynamic"].as_table()) {
        PEP2RPM_TRY(parse_dynamic(*dynamic, cfg.dynamic));
    }

    // [dependencies] section
    if (auto deps = doc["dependencies"].as_table()) {
        PEP2RPM_TRY(parse_dependencies(*deps, cfg.dependencies));
    }

    // [conversion] section
    if (auto conv = doc["conversion"].as_table()) {
        if (auto node = conv->get("version_style")) {
            auto s = string_value(*node, "conversion.version_style");
            if (s.is_err()) return std::move(s).error();
            if (s.value() == "literal") {
                cfg.version_style = VersionStyle::Literal;
            } else if (s.value() == "encoded") {
                cfg.version_style = VersionStyle::Encoded;
            } else {
                return Pep2RpmError{Pep2RpmError::Config,
                    "unknown version_style '" + s.value() + "'",
                    "expected \"literal\" or \"encoded\""};
            }
        }
        if (auto node = conv->get("strict_local")) {
            auto b = bool_value(*node, "conversion.strict_local");
            if (b.is_err()) return std::move(b).error();
            cfg.strict_local = b.value();
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto node = lg->get("level")) {
            auto s = string_value(*node, "log.level");
            if (s.is_err()) return std::move(s).error();
            auto lvl = log::parse_level(s.value());
            if (lvl.is_err()) return std::move(lvl).error();
            cfg.log_level = lvl.value();
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Pep2RpmError{Pep2RpmError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) {
        Pep2RpmError err = std::move(cfg).error();
        err.file = path;
        return err;
    }
    return cfg;
}

template<typename T>
static void override_with(std::optional<T>& dst, const std::optional<T>& src) {
    if (src.has_value()) dst = src;
}

void Config::merge(const Config& other) {
    for (const auto& [k, v] : other.environment.variables) {
        environment.variables[k] = v;
    }
    dynamic.merge(other.dynamic);

    override_with(package_template, other.package_template);
    override_with(version_style, other.version_style);
    override_with(strict_local, other.strict_local);
    override_with(log_level, other.log_level);

    const auto& od = other.dependencies;
    override_with(dependencies.requires_list, od.requires_list);
    override_with(dependencies.suggests_list, od.suggests_list);
    override_with(dependencies.requires_extras, od.requires_extras);
    override_with(dependencies.suggests_extras, od.suggests_extras);
    override_with(dependencies.python_version, od.python_version);
    override_with(dependencies.optional_dependency_tag, od.optional_dependency_tag);
    override_with(dependencies.extract_dependencies, od.extract_dependencies);
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& project,
                         const std::optional<Config>& overrides) {
    Config result = defaults();
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    if (overrides.has_value()) result.merge(overrides.value());
    return result;
}

std::string Config::package_template_text() const {
    return package_template.value_or("python-{name}");
}

LocalPolicy Config::local_policy() const {
    return strict_local.value_or(false) ? LocalPolicy::Strict : LocalPolicy::BestEffort;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.pep2rpm/config.toml";
}

} // namespace pep2rpm
