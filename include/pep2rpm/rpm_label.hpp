#pragma once

#include <string>

namespace pep2rpm {

// RPM label comparison, same semantics as librpm's rpmvercmp():
// alphanumeric runs compare segment by segment, numeric segments beat alpha
// ones, '~' sorts before anything (including the end of the string) and '^'
// sorts after the end of the string but before anything else.
// Returns -1, 0 or 1.
int rpmvercmp(const std::string& a, const std::string& b);

// [epoch:]version[-release] as RPM writes it in dependency clauses
struct Evr {
    unsigned long long epoch = 0;
    std::string version;
    std::string release;

    static Evr split(const std::string& label);
};

// Compare two EVR labels: epoch numerically, then version and release with
// rpmvercmp(). A missing release on either side is not compared.
int rpm_compare(const std::string& a, const std::string& b);

} // namespace pep2rpm
