// pep2rpm: translate Python package dependencies into RPM dependency clauses.
//
//     pep2rpm convert [--extra NAME]... REQUIREMENT...
//     pep2rpm marker [--extra NAME]... MARKER
//     pep2rpm version VERSION...
//     pep2rpm specifier CAPABILITY SPECIFIERS
//     pep2rpm plan [--version V] [--requires-python S] [--extra-provided NAME]...
//                  [--build-requires REQ]... REQUIREMENT...
//
// Global options: --config FILE, --strict-local, --encoded,
//                 -v / -q / --log-level LEVEL
//
// Results go to stdout, one per line. Errors are printed to stderr in the
// library's error format and exit with status 1; usage errors exit with 2.

#include <pep2rpm/cli.hpp>

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    return pep2rpm::cli::run(args, std::cout, std::cerr);
}
