#include <pep2rpm/name.hpp>
#include <cctype>

namespace pep2rpm {

static bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.';
}

bool is_valid_name(const std::string& name) {
    if (name.empty()) return false;
    if (!std::isalnum(static_cast<unsigned char>(name.front()))) return false;
    if (!std::isalnum(static_cast<unsigned char>(name.back()))) return false;
    for (char c : name) {
        if (!is_name_char(c)) return false;
    }
    return true;
}

std::string normalize_name(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        if (c == '-' || c == '_' || c == '.') {
            if (out.empty() || out.back() != '-') out.push_back('-');
        } else {
            out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    return out;
}

Result<PkgName> PkgName::parse(const std::string& raw) {
    if (raw.empty()) {
        return Pep2RpmError{Pep2RpmError::InvalidArg, "empty package name"};
    }

    for (char c : raw) {
        if (!is_name_char(c)) {
            return Pep2RpmError{Pep2RpmError::InvalidArg,
                "invalid character '" + std::string(1, c) +
                "' in name '" + raw + "'",
                "allowed: [A-Za-z0-9._-]"};
        }
    }

    if (!is_valid_name(raw)) {
        return Pep2RpmError{Pep2RpmError::InvalidArg,
            "invalid name '" + raw + "'",
            "names must start and end with a letter or digit"};
    }

    PkgName name;
    name.raw_ = raw;
    name.normalized_ = normalize_name(raw);
    return Result<PkgName>::ok(std::move(name));
}

const std::string& PkgName::raw() const { return raw_; }
const std::string& PkgName::normalized() const { return normalized_; }

bool PkgName::operator==(const PkgName& o) const {
    return normalized_ == o.normalized_;
}

bool PkgName::operator!=(const PkgName& o) const {
    return !(*this == o);
}

} // namespace pep2rpm
