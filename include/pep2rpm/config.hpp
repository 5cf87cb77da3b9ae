#pragma once

#include <pep2rpm/log.hpp>
#include <pep2rpm/marker.hpp>
#include <pep2rpm/result.hpp>
#include <pep2rpm/specifier.hpp>
#include <optional>
#include <string>
#include <vector>

namespace pep2rpm {

// [dependencies] table. Unset fields fall through to lower layers.
struct DependencyOptions {
    std::optional<std::vector<std::string>> requires_list;   // "requires"
    std::optional<std::vector<std::string>> suggests_list;   // "suggests"
    std::optional<std::vector<std::string>> requires_extras;
    std::optional<std::vector<std::string>> suggests_extras;
    std::optional<std::string> python_version;
    std::optional<std::string> optional_dependency_tag;
    std::optional<bool> extract_dependencies;
};

// Layered configuration: defaults < global < project < command line.
// Later layers override earlier ones key by key.
struct Config {
    Environment environment;
    DynamicVariableMap dynamic;
    std::optional<std::string> package_template;  // [templates] python_package
    std::optional<VersionStyle> version_style;
    std::optional<bool> strict_local;
    std::optional<log::Level> log_level;
    DependencyOptions dependencies;

    // Built-in values for every key
    static Config defaults();

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string; only keys present in the text are set
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's values override this)
    void merge(const Config& other);

    // defaults -> global -> project -> overrides
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project,
                            const std::optional<Config>& overrides);

    std::string package_template_text() const;
    LocalPolicy local_policy() const;
};

// Discover the global config file path: ~/.pep2rpm/config.toml
std::string global_config_path();

} // namespace pep2rpm
