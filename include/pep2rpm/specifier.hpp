#pragma once

#include <pep2rpm/encoder.hpp>
#include <pep2rpm/result.hpp>
#include <pep2rpm/version.hpp>
#include <optional>
#include <string>
#include <vector>

namespace pep2rpm {

enum class SpecOp {
    Equal,        // ==
    NotEqual,     // !=
    LessEqual,    // <=
    GreaterEqual, // >=
    Less,         // <
    Greater,      // >
    Compatible,   // ~=
    Arbitrary     // ===
};

const char* spec_op_symbol(SpecOp op);

struct VersionSpecifier {
    SpecOp op = SpecOp::Equal;
    std::string literal;             // version as written, without ".*"
    std::optional<Version> version;  // unset for ===
    bool wildcard = false;           // "==1.5.*" / "!=1.5.*"

    static Result<VersionSpecifier> parse(const std::string& s);
    std::string to_string() const;
};

// Comma-separated specifiers, implicitly conjoined, in declaration order
struct SpecifierSet {
    std::vector<VersionSpecifier> specifiers;

    // An empty (or all-whitespace) string is the empty set
    static Result<SpecifierSet> parse(const std::string& s);
    bool empty() const { return specifiers.empty(); }
    std::string to_string() const;
};

// How versions are written into RPM clauses
enum class VersionStyle {
    Literal,  // as the specifier spelled them, through rpm_literal()
    Encoded   // through VersionOrderEncoder
};

// A version literal as spelled, made legal in an RPM EVR field: the epoch
// "N!" becomes "N:" and '-' becomes '_'.
//   "1!2.0" -> "1:2.0", "1.0-1" -> "1.0_1", "2.1.3a0" -> "2.1.3a0"
std::string rpm_literal(const std::string& literal);

// Translates specifier sets into RPM comparison clauses for one capability:
//
//   ==V, ==V.*  -> "cap = V"
//   !=V, !=V.*  -> "cap < V or cap > V"
//   <V <=V >V >=V -> "cap OP V"
//   ~=V         -> "cap >= V", "cap < U"  (U: V's release with the
//                  second-to-last segment bumped and the rest dropped)
//   ===S        -> "cap = S"
//
// RPM has no prefix match, so wildcards only keep the prefix: "==1.5.*"
// becomes "= 1.5" and 1.5.2 no longer satisfies it.
class SpecifierTranslator {
public:
    explicit SpecifierTranslator(VersionStyle style = VersionStyle::Literal,
                                 LocalPolicy local = LocalPolicy::BestEffort)
        : style_(style), encoder_(local) {}

    Result<std::vector<std::string>> translate(const std::string& capability,
                                               const SpecifierSet& specs) const;
    Result<std::vector<std::string>> translate(const std::string& capability,
                                               const std::string& specs) const;

    // One version as this translator writes it into clauses, so a package's
    // own Version field compares against them consistently
    Result<std::string> render_version(const std::string& literal) const;

    VersionStyle style() const { return style_; }

private:
    Result<std::string> render(const VersionSpecifier& spec) const;
    Result<std::string> render_upper_bound(const Version& v) const;

    VersionStyle style_;
    VersionOrderEncoder encoder_;
};

// Upper bound of "~=V": release of V with the second-to-last segment
// incremented and later segments dropped, keeping the epoch.
// Fails with InvalidSpecifierOperator for single-segment releases.
Result<Version> compatible_upper_bound(const Version& v);

// Join clauses with ", " as RPM dependency tags expect
std::string join_clauses(const std::vector<std::string>& clauses);

} // namespace pep2rpm
