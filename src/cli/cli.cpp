#include <pep2rpm/cli.hpp>
#include <pep2rpm/encoder.hpp>
#include <pep2rpm/marker.hpp>
#include <pep2rpm/requirement.hpp>
#include <pep2rpm/specifier.hpp>

#include <filesystem>

namespace fs = std::filesystem;

namespace pep2rpm::cli {

const char* usage() {
    return
        "usage: pep2rpm [options] <command> [args]\n"
        "\n"
        "commands:\n"
        "  convert REQ...            translate PEP 508 requirements\n"
        "  marker MARKER             evaluate an environment marker\n"
        "  version VERSION...        encode PEP 440 versions as RPM labels\n"
        "  specifier CAP SPECS       translate a specifier set for a capability\n"
        "  plan REQ...               print BuildRequires/Requires/optional tags\n"
        "\n"
        "options:\n"
        "  --config FILE             project config (default: ./pep2rpm.toml if present)\n"
        "  --extra NAME              extra being installed (repeatable)\n"
        "  --strict-local            reject mixed letter/digit local segments\n"
        "  --encoded                 write versions in encoded RPM form\n"
        "  --version V               package version (plan)\n"
        "  --requires-python S       Requires-Python specifiers (plan)\n"
        "  --extra-provided NAME     Provides-Extra entry (plan, repeatable)\n"
        "  --build-requires REQ      build requirement (plan, repeatable)\n"
        "  -v, -q, --log-level LVL   trace, debug, info, warn or error\n";
}

Result<Options> parse_args(const std::vector<std::string>& args) {
    Options opts;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-h" || arg == "--help") {
            opts.command = "help";
            return Result<Options>::ok(std::move(opts));
        }
        if (arg == "-v") {
            opts.level = log::Debug;
        } else if (arg == "-q") {
            opts.level = log::Error;
        } else if (arg == "--strict-local") {
            opts.strict_local = true;
        } else if (arg == "--encoded") {
            opts.encoded = true;
        } else if (arg == "--log-level" || arg == "--config" || arg == "--extra" ||
                   arg == "--version" || arg == "--requires-python" ||
                   arg == "--extra-provided" || arg == "--build-requires") {
            if (i + 1 >= args.size()) {
                return Pep2RpmError{Pep2RpmError::InvalidArg,
                    "option " + arg + " needs a value"};
            }
            const std::string& v = args[++i];
            if (arg == "--log-level") {
                auto lvl = log::parse_level(v);
                if (lvl.is_err()) return std::move(lvl).error();
                opts.level = lvl.value();
            } else if (arg == "--config") {
                opts.config_path = v;
            } else if (arg == "--extra") {
                opts.extras.push_back(v);
            } else if (arg == "--version") {
                opts.meta.version = v;
            } else if (arg == "--requires-python") {
                opts.meta.requires_python = v;
            } else if (arg == "--extra-provided") {
                opts.meta.provides_extra.push_back(v);
            } else {
                opts.meta.build_requires.push_back(v);
            }
        } else if (arg.size() > 1 && arg[0] == '-' && opts.command.empty()) {
            return Pep2RpmError{Pep2RpmError::InvalidArg,
                "unknown option '" + arg + "'", "run pep2rpm --help"};
        } else if (opts.command.empty()) {
            opts.command = arg;
        } else {
            opts.args.push_back(arg);
        }
    }

    if (opts.command.empty()) {
        return Pep2RpmError{Pep2RpmError::InvalidArg, "no command given", "run pep2rpm --help"};
    }
    return Result<Options>::ok(std::move(opts));
}

Result<Config> load_config(const Options& opts) {
    std::optional<Config> global;
    std::string global_path = global_config_path();
    if (!global_path.empty() && fs::exists(global_path)) {
        auto cfg = Config::load(global_path);
        if (cfg.is_err()) return std::move(cfg).error();
        global = std::move(cfg).value();
    }

    std::optional<Config> project;
    std::string project_path = opts.config_path.value_or("pep2rpm.toml");
    if (opts.config_path || fs::exists(project_path)) {
        auto cfg = Config::load(project_path);
        if (cfg.is_err()) return std::move(cfg).error();
        project = std::move(cfg).value();
    }

    Config overrides;
    if (opts.strict_local) overrides.strict_local = true;
    if (opts.encoded) overrides.version_style = VersionStyle::Encoded;
    if (opts.level) overrides.log_level = opts.level;

    return Result<Config>::ok(Config::effective(global, project, overrides));
}

namespace {

Status run_convert(const Options& opts, const Config& cfg, std::ostream& out) {
    auto converter = RequirementConverter::from_config(cfg);
    PEP2RPM_TRY(converter);
    auto lines = converter.value().convert(opts.args, make_extra_set(opts.extras));
    PEP2RPM_TRY(lines);
    for (const auto& line : lines.value()) {
        out << line << "\n";
    }
    return ok_status();
}

Status run_marker(const Options& opts, const Config& cfg, std::ostream& out) {
    if (opts.args.size() != 1) {
        return Pep2RpmError{Pep2RpmError::InvalidArg, "marker takes exactly one expression"};
    }
    auto converter = RequirementConverter::from_config(cfg);
    PEP2RPM_TRY(converter);
    auto expr = MarkerExpr::parse(opts.args[0]);
    PEP2RPM_TRY(expr);
    auto result = converter.value().evaluate(expr.value(), make_extra_set(opts.extras));
    PEP2RPM_TRY(result);
    out << result.value().to_string() << "\n";
    return ok_status();
}

Status run_version(const Options& opts, const Config& cfg, std::ostream& out) {
    if (opts.args.empty()) {
        return Pep2RpmError{Pep2RpmError::InvalidArg, "version needs at least one version"};
    }
    VersionOrderEncoder encoder(cfg.local_policy());
    for (const auto& literal : opts.args) {
        auto label = encoder.encode(literal);
        PEP2RPM_TRY(label);
        out << label.value() << "\n";
    }
    return ok_status();
}

Status run_specifier(const Options& opts, const Config& cfg, std::ostream& out) {
    if (opts.args.size() != 2) {
        return Pep2RpmError{Pep2RpmError::InvalidArg,
            "specifier takes a capability and a specifier set",
            "e.g. pep2rpm specifier python-foo '>=1.0,!=1.3'"};
    }
    SpecifierTranslator translator(cfg.version_style.value_or(VersionStyle::Literal),
                                   cfg.local_policy());
    auto clauses = translator.translate(opts.args[0], opts.args[1]);
    PEP2RPM_TRY(clauses);
    out << join_clauses(clauses.value()) << "\n";
    return ok_status();
}

Status run_plan(const Options& opts, const Config& cfg, std::ostream& out) {
    auto planner = DependencyPlanner::from_config(cfg);
    PEP2RPM_TRY(planner);
    PackageMetadata meta = opts.meta;
    meta.requires_dist = opts.args;
    auto plan = planner.value().plan(meta);
    PEP2RPM_TRY(plan);
    if (!plan.value().rpm_version.empty()) {
        out << "Version: " << plan.value().rpm_version << "\n";
    }
    for (const auto& tag : plan.value().tags) {
        out << tag.to_string() << "\n";
    }
    return ok_status();
}

} // anonymous namespace

int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    auto opts = parse_args(args);
    if (opts.is_err()) {
        err << opts.error().format() << "\n\n" << usage();
        return 2;
    }
    if (opts.value().command == "help") {
        out << usage();
        return 0;
    }

    auto cfg = load_config(opts.value());
    if (cfg.is_err()) {
        err << cfg.error().format() << "\n";
        return 1;
    }
    log::set_level(cfg.value().log_level.value_or(log::Info));
    log::debug("running '%s' with %zu argument(s)",
               opts.value().command.c_str(), opts.value().args.size());

    const std::string& cmd = opts.value().command;
    Status status = ok_status();
    if (cmd == "convert") {
        status = run_convert(opts.value(), cfg.value(), out);
    } else if (cmd == "marker") {
        status = run_marker(opts.value(), cfg.value(), out);
    } else if (cmd == "version") {
        status = run_version(opts.value(), cfg.value(), out);
    } else if (cmd == "specifier") {
        status = run_specifier(opts.value(), cfg.value(), out);
    } else if (cmd == "plan") {
        status = run_plan(opts.value(), cfg.value(), out);
    } else {
        err << Pep2RpmError{Pep2RpmError::InvalidArg,
            "unknown command '" + cmd + "'"}.format() << "\n\n" << usage();
        return 2;
    }

    if (status.is_err()) {
        err << status.error().format() << "\n";
        return status.error().code == Pep2RpmError::InvalidArg ? 2 : 1;
    }
    return 0;
}

} // namespace pep2rpm::cli
