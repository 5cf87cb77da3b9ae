#pragma once

#include <pep2rpm/config.hpp>
#include <pep2rpm/log.hpp>
#include <pep2rpm/plan.hpp>
#include <pep2rpm/result.hpp>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace pep2rpm::cli {

// Parsed command line of the pep2rpm tool
struct Options {
    std::string command;  // "help" for -h / --help
    std::vector<std::string> args;
    std::vector<std::string> extras;
    std::optional<std::string> config_path;
    bool strict_local = false;
    bool encoded = false;
    std::optional<log::Level> level;
    PackageMetadata meta;  // --version, --requires-python, ... for plan
};

const char* usage();

// Arguments without the program name. Options may appear anywhere; an
// unknown option before the command fails with InvalidArg.
Result<Options> parse_args(const std::vector<std::string>& args);

// defaults < ~/.pep2rpm/config.toml < project file < command line.
// The project file is --config, else ./pep2rpm.toml when it exists.
Result<Config> load_config(const Options& opts);

// Runs one invocation and returns the exit status: 0 on success, 1 on a
// conversion or configuration error, 2 on a usage error
int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

} // namespace pep2rpm::cli
