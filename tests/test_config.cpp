#include <catch2/catch.hpp>
#include <pep2rpm/config.hpp>
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

using namespace pep2rpm;

using Strings = std::vector<std::string>;

// ===== Parsing =====

TEST_CASE("parse environment section", "[config]") {
    auto r = Config::parse(R"toml(
[environment]
os_name = "posix"
python_full_version = "3.12.1"
)toml");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().environment.variables.at("os_name") == "posix");
    REQUIRE(r.value().environment.variables.at("python_full_version") == "3.12.1");
}

TEST_CASE("parse templates section", "[config]") {
    auto r = Config::parse(R"toml(
[templates]
python_package = "python3dist({name})"
)toml");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().package_template_text() == "python3dist({name})");
}

TEST_CASE("parse rejects a bad package template", "[config]") {
    auto r = Config::parse(R"toml(
[templates]
python_package = "python-{name"
)toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == Pep2RpmError::Config);
}

TEST_CASE("parse dynamic variables", "[config]") {
    auto r = Config::parse(R"toml(
[dynamic.platform_version]
kind = "ordered"
capability = "kernel-version"

[dynamic.implementation_name]
kind = "equality"
capability = "python-implementation({impl})"
)toml");
    REQUIRE(r.is_ok());
    const auto& dynamic = r.value().dynamic;
    REQUIRE(dynamic.find("platform_version")->kind == CapabilityKind::Ordered);
    REQUIRE(dynamic.find("platform_version")->capability.text() == "kernel-version");
    REQUIRE(dynamic.find("implementation_name")->kind == CapabilityKind::EqualityOnly);
}

TEST_CASE("parse rejects unknown capability kind", "[config]") {
    auto r = Config::parse(R"toml(
[dynamic.platform_version]
kind = "fuzzy"
capability = "kernel-version"
)toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == Pep2RpmError::Config);
}

TEST_CASE("parse rejects incomplete dynamic entry", "[config]") {
    auto r = Config::parse(R"toml(
[dynamic.platform_version]
kind = "ordered"
)toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == Pep2RpmError::Config);
}

TEST_CASE("parse dependencies section", "[config]") {
    auto r = Config::parse(R"toml(
[dependencies]
requires = ["python3-libs"]
suggests = "python3-docs"
requires_extras = ["socks"]
suggests_extras = ["*", "!test"]
python_version = ">=3.8"
optional_dependency_tag = "Recommends"
extract_dependencies = false
)toml");
    REQUIRE(r.is_ok());
    const auto& deps = r.value().dependencies;
    REQUIRE(*deps.requires_list == Strings{"python3-libs"});
    REQUIRE(*deps.suggests_list == Strings{"python3-docs"});
    REQUIRE(*deps.requires_extras == Strings{"socks"});
    REQUIRE(*deps.suggests_extras == Strings{"*", "!test"});
    REQUIRE(*deps.python_version == ">=3.8");
    REQUIRE(*deps.optional_dependency_tag == "Recommends");
    REQUIRE(*deps.extract_dependencies == false);
}

TEST_CASE("parse rejects unknown dependency keys", "[config]") {
    auto r = Config::parse(R"toml(
[dependencies]
requirez = ["x"]
)toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == Pep2RpmError::Config);
    REQUIRE(r.error().message.find("dependencies.requirez") != std::string::npos);
}

TEST_CASE("parse rejects mistyped values", "[config]") {
    auto r = Config::parse(R"toml(
[dependencies]
extract_dependencies = "no"
)toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == Pep2RpmError::Config);

    auto env = Config::parse(R"toml(
[environment]
os_name = 3
)toml");
    REQUIRE(env.is_err());
    REQUIRE(env.error().code == Pep2RpmError::Config);
}

TEST_CASE("parse conversion and log sections", "[config]") {
    auto r = Config::parse(R"toml(
[conversion]
version_style = "encoded"
strict_local = true

[log]
level = "debug"
)toml");
    REQUIRE(r.is_ok());
    REQUIRE(*r.value().version_style == VersionStyle::Encoded);
    REQUIRE(r.value().local_policy() == LocalPolicy::Strict);
    REQUIRE(*r.value().log_level == log::Debug);
}

TEST_CASE("parse rejects unknown version style and log level", "[config]") {
    auto style = Config::parse(R"toml(
[conversion]
version_style = "fancy"
)toml");
    REQUIRE(style.is_err());
    REQUIRE(style.error().code == Pep2RpmError::Config);

    auto level = Config::parse(R"toml(
[log]
level = "loud"
)toml");
    REQUIRE(level.is_err());
}

TEST_CASE("parse empty config sets nothing", "[config]") {
    auto r = Config::parse("");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().environment.variables.empty());
    REQUIRE(r.value().dynamic.entries().empty());
    REQUIRE_FALSE(r.value().package_template.has_value());
    REQUIRE_FALSE(r.value().dependencies.requires_list.has_value());
}

TEST_CASE("parse invalid TOML config", "[config]") {
    auto r = Config::parse("not valid [toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == Pep2RpmError::Parse);
}

// ===== Defaults and merge =====

TEST_CASE("defaults", "[config]") {
    Config cfg = Config::defaults();
    REQUIRE(cfg.package_template_text() == "python-{name}");
    REQUIRE(cfg.environment.variables.at("sys_platform") == "linux");
    REQUIRE(cfg.dynamic.find("python_version") != nullptr);
    REQUIRE(*cfg.version_style == VersionStyle::Literal);
    REQUIRE(cfg.local_policy() == LocalPolicy::BestEffort);
    REQUIRE(*cfg.dependencies.optional_dependency_tag == "Suggests");
    REQUIRE(*cfg.dependencies.extract_dependencies);
}

TEST_CASE("merge overrides key by key", "[config]") {
    auto base = Config::parse(R"toml(
[environment]
os_name = "posix"
sys_platform = "linux"

[dependencies]
requires = ["a"]
suggests = ["b"]
)toml").value();

    auto overlay = Config::parse(R"toml(
[environment]
os_name = "nt"

[dependencies]
requires = ["c"]
)toml").value();

    base.merge(overlay);
    REQUIRE(base.environment.variables.at("os_name") == "nt");       // overridden
    REQUIRE(base.environment.variables.at("sys_platform") == "linux"); // preserved
    REQUIRE(*base.dependencies.requires_list == Strings{"c"});
    REQUIRE(*base.dependencies.suggests_list == Strings{"b"});
}

TEST_CASE("effective config layering", "[config]") {
    auto global = Config::parse(R"toml(
[templates]
python_package = "python3-{name}"

[dynamic.platform_release]
kind = "ordered"
capability = "linux-kernel"
)toml").value();

    auto project = Config::parse(R"toml(
[templates]
python_package = "python3dist({name})"
)toml").value();

    Config overrides;
    overrides.strict_local = true;

    auto eff = Config::effective(global, project, overrides);
    REQUIRE(eff.package_template_text() == "python3dist({name})");
    REQUIRE(eff.dynamic.find("platform_release")->capability.text() == "linux-kernel");
    REQUIRE(eff.dynamic.find("platform_machine") != nullptr);  // from defaults
    REQUIRE(eff.local_policy() == LocalPolicy::Strict);
    REQUIRE(eff.environment.variables.at("os_name") == "posix");
}

TEST_CASE("effective with no layers is the defaults", "[config]") {
    auto eff = Config::effective({}, {}, {});
    REQUIRE(eff.package_template_text() == "python-{name}");
    REQUIRE(eff.dynamic.entries().size() == 3);
}

// ===== Files =====

TEST_CASE("load reports missing file", "[config]") {
    auto r = Config::load("/nonexistent/pep2rpm.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == Pep2RpmError::IO);
}

TEST_CASE("load tags errors with the file name", "[config]") {
    std::string path = "pep2rpm_test_bad_config.toml";
    {
        std::ofstream out(path);
        out << "[dependencies]\nbogus = 1\n";
    }
    auto r = Config::load(path);
    std::remove(path.c_str());
    REQUIRE(r.is_err());
    REQUIRE(r.error().file == path);
}

TEST_CASE("global config path contains .pep2rpm", "[config]") {
    auto path = global_config_path();
    // May be empty if HOME is not set, but if set, should contain .pep2rpm
    if (!path.empty()) {
        REQUIRE(path.find(".pep2rpm/config.toml") != std::string::npos);
    }
}
