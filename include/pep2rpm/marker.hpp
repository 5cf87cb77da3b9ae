#pragma once

#include <pep2rpm/result.hpp>
#include <pep2rpm/template.hpp>
#include <map>
#include <string>
#include <unordered_set>
#include <variant>
#include <vector>

namespace pep2rpm {

// Normalized names of the extras being installed
using ExtraSet = std::unordered_set<std::string>;

// Build an ExtraSet from names as written ("Socks_Proxy" -> "socks-proxy")
ExtraSet make_extra_set(const std::vector<std::string>& names);

enum class MarkerOp {
    Less,         // <
    LessEqual,    // <=
    Equal,        // ==
    NotEqual,     // !=
    GreaterEqual, // >=
    Greater,      // >
    Compatible,   // ~=
    Arbitrary,    // ===
    In,           // in
    NotIn         // not in
};

const char* marker_op_symbol(MarkerOp op);

// PEP 508 environment marker as a binary tree. Leaves compare one variable
// with one string literal; the literal may be written on either side.
class MarkerExpr {
public:
    enum Kind { Compare, And, Or };

    static MarkerExpr compare(std::string variable, MarkerOp op, std::string literal,
                              bool variable_first = true);
    static MarkerExpr conjunction(MarkerExpr left, MarkerExpr right);
    static MarkerExpr disjunction(MarkerExpr left, MarkerExpr right);

    // Parse marker text: 'os_name == "nt" and (python_version < "3.8" or extra == "x")'
    static Result<MarkerExpr> parse(const std::string& input);

    // Canonical serialization, parenthesizing 'or' under 'and'
    std::string to_string() const;

    Kind kind() const { return kind_; }

    // Compare leaves
    const std::string& variable() const { return variable_; }
    MarkerOp op() const { return op_; }
    const std::string& literal() const { return literal_; }
    bool variable_first() const { return variable_first_; }

    // And / Or nodes
    const MarkerExpr& left() const { return children_[0]; }
    const MarkerExpr& right() const { return children_[1]; }

private:
    Kind kind_ = Compare;
    std::string variable_;
    MarkerOp op_ = MarkerOp::Equal;
    std::string literal_;
    bool variable_first_ = true;
    std::vector<MarkerExpr> children_;
};

// Marker variables whose values are fixed for the target distribution
struct Environment {
    std::map<std::string, std::string> variables;

    // os_name=posix, sys_platform=linux, platform_system=Linux,
    // implementation_name=cpython, platform_python_implementation=CPython
    static Environment defaults();
};

// How a variable only known on the installing machine becomes a capability
enum class CapabilityKind {
    EqualityOnly,  // template filled with the literal, == and != only
    Ordered        // fixed capability name compared against the literal
};

const char* capability_kind_name(CapabilityKind kind);

struct DynamicCapability {
    CapabilityKind kind = CapabilityKind::Ordered;
    NameTemplate capability;
};

class DynamicVariableMap {
public:
    // platform_machine -> python({arch}), platform_release -> kernel,
    // python_version -> python(abi)
    static DynamicVariableMap defaults();

    // Validates the template once; equality-only capabilities need a
    // placeholder, ordered ones must not have one.
    Status add(const std::string& variable, CapabilityKind kind, const std::string& capability);
    void remove(const std::string& variable);
    // Entries of other replace entries of this with the same variable
    void merge(const DynamicVariableMap& other);

    const DynamicCapability* find(const std::string& variable) const;
    const std::map<std::string, DynamicCapability>& entries() const { return entries_; }

private:
    std::map<std::string, DynamicCapability> entries_;
};

// Three-valued marker result: statically true, statically false, or a rich
// dependency condition ("with kernel > 3.4") left for the installing machine.
class TranslationResult {
public:
    static TranslationResult constant(bool value);
    static TranslationResult condition(std::string text);

    bool is_constant() const { return std::holds_alternative<bool>(value_); }
    bool is_true() const { return is_constant() && std::get<bool>(value_); }
    bool is_false() const { return is_constant() && !std::get<bool>(value_); }
    bool is_condition() const { return !is_constant(); }

    // Condition text; only valid when is_condition()
    const std::string& text() const { return std::get<std::string>(value_); }

    std::string to_string() const;

    bool operator==(const TranslationResult& o) const { return value_ == o.value_; }
    bool operator!=(const TranslationResult& o) const { return !(*this == o); }

private:
    std::variant<bool, std::string> value_;
};

// Evaluate a marker. 'extra' tests membership in extras, environment
// variables evaluate to constants, dynamic variables become conditions and
// anything else fails with UnsupportedMarkerVariable. Conjunctions and
// disjunctions short-circuit: a constant operand that decides the result
// makes errors in the other operand irrelevant.
Result<TranslationResult> evaluate_marker(const MarkerExpr& expr,
                                          const Environment& env,
                                          const ExtraSet& extras,
                                          const DynamicVariableMap& dynamic);

} // namespace pep2rpm
