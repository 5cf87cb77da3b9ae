#pragma once

#include <pep2rpm/result.hpp>
#include <string>

namespace pep2rpm {

// Project or extra name: [A-Za-z0-9] at both ends, [A-Za-z0-9._-] inside.
// Normalized form: lowercase with runs of '-', '_' and '.' collapsed to '-'
struct PkgName {
    static Result<PkgName> parse(const std::string& raw);

    const std::string& raw() const;
    const std::string& normalized() const;

    bool operator==(const PkgName& o) const;
    bool operator!=(const PkgName& o) const;

private:
    std::string raw_;
    std::string normalized_;
};

bool is_valid_name(const std::string& name);

// Normalize without validating; used for extras coming from the command line
std::string normalize_name(const std::string& name);

} // namespace pep2rpm
