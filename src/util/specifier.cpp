#include <pep2rpm/specifier.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace pep2rpm {

const char* spec_op_symbol(SpecOp op) {
    switch (op) {
    case SpecOp::Equal:        return "==";
    case SpecOp::NotEqual:     return "!=";
    case SpecOp::LessEqual:    return "<=";
    case SpecOp::GreaterEqual: return ">=";
    case SpecOp::Less:         return "<";
    case SpecOp::Greater:      return ">";
    case SpecOp::Compatible:   return "~=";
    case SpecOp::Arbitrary:    return "===";
    }
    return "";
}

// RPM spelling of a plain comparison
static const char* rpm_op_symbol(SpecOp op) {
    switch (op) {
    case SpecOp::LessEqual:    return "<=";
    case SpecOp::GreaterEqual: return ">=";
    case SpecOp::Less:         return "<";
    case SpecOp::Greater:      return ">";
    default:                   return "=";
    }
}

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// ---------------------------------------------------------------------------
// VersionSpecifier
// ---------------------------------------------------------------------------

Result<VersionSpecifier> VersionSpecifier::parse(const std::string& s) {
    std::string text = trim(s);
    if (text.empty()) {
        return Pep2RpmError{Pep2RpmError::Parse, "empty version specifier"};
    }

    // Longest operators first so "===" is not read as "=="
    static const std::pair<const char*, SpecOp> operators[] = {
        {"===", SpecOp::Arbitrary},
        {"~=", SpecOp::Compatible},
        {"==", SpecOp::Equal},
        {"!=", SpecOp::NotEqual},
        {"<=", SpecOp::LessEqual},
        {">=", SpecOp::GreaterEqual},
        {"<", SpecOp::Less},
        {">", SpecOp::Greater},
    };

    VersionSpecifier spec;
    size_t pos = std::string::npos;
    for (const auto& [symbol, op] : operators) {
        size_t len = std::char_traits<char>::length(symbol);
        if (text.compare(0, len, symbol) == 0) {
            spec.op = op;
            pos = len;
            break;
        }
    }
    if (pos == std::string::npos) {
        size_t end = 0;
        while (end < text.size() && !std::isalnum(static_cast<unsigned char>(text[end])) &&
               !std::isspace(static_cast<unsigned char>(text[end]))) {
            ++end;
        }
        return Pep2RpmError{Pep2RpmError::InvalidSpecifierOperator,
            "unknown operator '" + text.substr(0, end) + "' in specifier '" + text + "'",
            "valid operators: ==, !=, <=, >=, <, >, ~=, ==="};
    }

    spec.literal = trim(text.substr(pos));
    if (spec.literal.empty()) {
        return Pep2RpmError{Pep2RpmError::MalformedVersion,
            "missing version in specifier '" + text + "'"};
    }

    if (spec.op == SpecOp::Arbitrary) {
        for (char c : spec.literal) {
            if (std::isspace(static_cast<unsigned char>(c)) || c == ',' || c == ';') {
                return Pep2RpmError{Pep2RpmError::MalformedVersion,
                    "invalid arbitrary version '" + spec.literal + "'"};
            }
        }
        return Result<VersionSpecifier>::ok(std::move(spec));
    }

    if (spec.literal.size() >= 2 && spec.literal.compare(spec.literal.size() - 2, 2, ".*") == 0) {
        if (spec.op != SpecOp::Equal && spec.op != SpecOp::NotEqual) {
            return Pep2RpmError{Pep2RpmError::InvalidSpecifierOperator,
                std::string("wildcard versions are not allowed with '") +
                spec_op_symbol(spec.op) + "' in '" + text + "'",
                "only == and != accept a trailing .*"};
        }
        spec.wildcard = true;
        spec.literal = spec.literal.substr(0, spec.literal.size() - 2);
    }

    auto v = Version::parse(spec.literal);
    if (v.is_err()) return std::move(v).error();
    spec.version = std::move(v).value();

    if (spec.wildcard && (spec.version->pre || spec.version->post ||
                          spec.version->dev || !spec.version->local.empty())) {
        return Pep2RpmError{Pep2RpmError::MalformedVersion,
            "wildcard prefix '" + spec.literal + "' must be a plain release",
            "write e.g. ==1.5.* or !=2.*"};
    }

    switch (spec.op) {
    case SpecOp::Compatible:
        if (spec.version->release.size() < 2) {
            return Pep2RpmError{Pep2RpmError::InvalidSpecifierOperator,
                "'~=' needs at least two release segments in '" + text + "'",
                "write ~=" + spec.literal + ".0 instead"};
        }
        [[fallthrough]];
    case SpecOp::LessEqual:
    case SpecOp::GreaterEqual:
    case SpecOp::Less:
    case SpecOp::Greater:
        if (!spec.version->local.empty()) {
            return Pep2RpmError{Pep2RpmError::InvalidSpecifierOperator,
                std::string("local versions are not allowed with '") +
                spec_op_symbol(spec.op) + "' in '" + text + "'"};
        }
        break;
    default:
        break;
    }

    return Result<VersionSpecifier>::ok(std::move(spec));
}

std::string VersionSpecifier::to_string() const {
    std::string s = spec_op_symbol(op);
    s += literal;
    if (wildcard) s += ".*";
    return s;
}

// ---------------------------------------------------------------------------
// SpecifierSet
// ---------------------------------------------------------------------------

Result<SpecifierSet> SpecifierSet::parse(const std::string& s) {
    SpecifierSet set;
    if (trim(s).empty()) {
        return Result<SpecifierSet>::ok(std::move(set));
    }

    std::istringstream stream(s);
    std::string token;
    while (std::getline(stream, token, ',')) {
        if (trim(token).empty()) {
            return Pep2RpmError{Pep2RpmError::Parse,
                "empty specifier in '" + s + "'",
                "check for consecutive commas or trailing commas"};
        }
        auto spec = VersionSpecifier::parse(token);
        if (spec.is_err()) return std::move(spec).error();
        set.specifiers.push_back(std::move(spec).value());
    }
    if (!s.empty() && s.back() == ',') {
        return Pep2RpmError{Pep2RpmError::Parse,
            "trailing comma in specifier set '" + s + "'"};
    }

    return Result<SpecifierSet>::ok(std::move(set));
}

std::string SpecifierSet::to_string() const {
    std::string s;
    for (size_t i = 0; i < specifiers.size(); ++i) {
        if (i > 0) s += ",";
        s += specifiers[i].to_string();
    }
    return s;
}

// ---------------------------------------------------------------------------
// Translation
// ---------------------------------------------------------------------------

Result<Version> compatible_upper_bound(const Version& v) {
    if (v.release.size() < 2) {
        return Pep2RpmError{Pep2RpmError::InvalidSpecifierOperator,
            "'~=' needs at least two release segments, got '" + v.to_string() + "'"};
    }
    Version upper;
    upper.epoch = v.epoch;
    upper.release.assign(v.release.begin(), v.release.end() - 1);
    upper.release.back() += 1;
    return Result<Version>::ok(std::move(upper));
}

std::string rpm_literal(const std::string& literal) {
    std::string out = literal;
    size_t bang = out.find('!');
    if (bang != std::string::npos) {
        std::string epoch = out.substr(0, bang);
        if (!epoch.empty() && (epoch[0] == 'v' || epoch[0] == 'V')) epoch.erase(0, 1);
        out = epoch + ":" + out.substr(bang + 1);
    }
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

Result<std::string> SpecifierTranslator::render_version(const std::string& literal) const {
    auto v = Version::parse(literal);
    if (v.is_err()) return std::move(v).error();
    if (style_ == VersionStyle::Encoded) {
        return encoder_.encode(v.value());
    }
    return Result<std::string>::ok(rpm_literal(trim(literal)));
}

Result<std::string> SpecifierTranslator::render(const VersionSpecifier& spec) const {
    if (style_ == VersionStyle::Literal || !spec.version) {
        return Result<std::string>::ok(rpm_literal(spec.literal));
    }
    return encoder_.encode(*spec.version);
}

Result<std::string> SpecifierTranslator::render_upper_bound(const Version& v) const {
    if (style_ == VersionStyle::Literal) {
        return Result<std::string>::ok(rpm_literal(v.to_string()));
    }
    return encoder_.encode(v);
}

Result<std::vector<std::string>> SpecifierTranslator::translate(
    const std::string& capability, const SpecifierSet& specs) const
{
    std::vector<std::string> clauses;

    for (const auto& spec : specs.specifiers) {
        auto rendered = render(spec);
        if (rendered.is_err()) return std::move(rendered).error();
        const std::string& v = rendered.value();

        switch (spec.op) {
        case SpecOp::NotEqual:
            clauses.push_back(capability + " < " + v + " or " + capability + " > " + v);
            break;

        case SpecOp::Compatible: {
            auto upper = compatible_upper_bound(*spec.version);
            if (upper.is_err()) return std::move(upper).error();
            auto bound = render_upper_bound(upper.value());
            if (bound.is_err()) return std::move(bound).error();
            clauses.push_back(capability + " >= " + v);
            clauses.push_back(capability + " < " + bound.value());
            break;
        }

        default:
            clauses.push_back(capability + " " + rpm_op_symbol(spec.op) + " " + v);
            break;
        }
    }

    return Result<std::vector<std::string>>::ok(std::move(clauses));
}

Result<std::vector<std::string>> SpecifierTranslator::translate(
    const std::string& capability, const std::string& specs) const
{
    auto set = SpecifierSet::parse(specs);
    if (set.is_err()) return std::move(set).error();
    return translate(capability, set.value());
}

std::string join_clauses(const std::vector<std::string>& clauses) {
    std::string s;
    for (size_t i = 0; i < clauses.size(); ++i) {
        if (i > 0) s += ", ";
        s += clauses[i];
    }
    return s;
}

} // namespace pep2rpm
