#include <pep2rpm/marker.hpp>
#include <pep2rpm/log.hpp>
#include <pep2rpm/name.hpp>
#include <pep2rpm/specifier.hpp>
#include <pep2rpm/version.hpp>
#include <cctype>

namespace pep2rpm {

const char* marker_op_symbol(MarkerOp op) {
    switch (op) {
    case MarkerOp::Less:         return "<";
    case MarkerOp::LessEqual:    return "<=";
    case MarkerOp::Equal:        return "==";
    case MarkerOp::NotEqual:     return "!=";
    case MarkerOp::GreaterEqual: return ">=";
    case MarkerOp::Greater:      return ">";
    case MarkerOp::Compatible:   return "~=";
    case MarkerOp::Arbitrary:    return "===";
    case MarkerOp::In:           return "in";
    case MarkerOp::NotIn:        return "not in";
    }
    return "";
}

const char* capability_kind_name(CapabilityKind kind) {
    switch (kind) {
    case CapabilityKind::EqualityOnly: return "equality";
    case CapabilityKind::Ordered:      return "ordered";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// MarkerExpr constructors
// ---------------------------------------------------------------------------

MarkerExpr MarkerExpr::compare(std::string variable, MarkerOp op, std::string literal,
                               bool variable_first) {
    MarkerExpr e;
    e.kind_ = Compare;
    e.variable_ = std::move(variable);
    e.op_ = op;
    e.literal_ = std::move(literal);
    e.variable_first_ = variable_first;
    return e;
}

MarkerExpr MarkerExpr::conjunction(MarkerExpr left, MarkerExpr right) {
    MarkerExpr e;
    e.kind_ = And;
    e.children_.push_back(std::move(left));
    e.children_.push_back(std::move(right));
    return e;
}

MarkerExpr MarkerExpr::disjunction(MarkerExpr left, MarkerExpr right) {
    MarkerExpr e;
    e.kind_ = Or;
    e.children_.push_back(std::move(left));
    e.children_.push_back(std::move(right));
    return e;
}

// ---------------------------------------------------------------------------
// to_string
// ---------------------------------------------------------------------------

static std::string quote(const std::string& s) {
    if (s.find('"') != std::string::npos) return "'" + s + "'";
    return "\"" + s + "\"";
}

std::string MarkerExpr::to_string() const {
    switch (kind_) {
    case Compare:
        if (variable_first_) {
            return variable_ + " " + marker_op_symbol(op_) + " " + quote(literal_);
        }
        return quote(literal_) + " " + marker_op_symbol(op_) + " " + variable_;
    case And: {
        std::string l = left().to_string();
        std::string r = right().to_string();
        if (left().kind() == Or) l = "(" + l + ")";
        if (right().kind() != Compare) r = "(" + r + ")";
        return l + " and " + r;
    }
    case Or: {
        std::string r = right().to_string();
        if (right().kind() == Or) r = "(" + r + ")";
        return left().to_string() + " or " + r;
    }
    }
    return ""; // unreachable
}

// ---------------------------------------------------------------------------
// Recursive descent parser
// ---------------------------------------------------------------------------

namespace {

// Pre-PEP 508 spellings still found in metadata
std::string canonical_variable(const std::string& name) {
    if (name == "os.name") return "os_name";
    if (name == "sys.platform") return "sys_platform";
    if (name == "platform.version") return "platform_version";
    if (name == "platform.machine") return "platform_machine";
    if (name == "platform.python_implementation") return "platform_python_implementation";
    if (name == "python_implementation") return "platform_python_implementation";
    return name;
}

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.';
}

struct Operand {
    bool is_literal = false;
    std::string text;
};

struct Parser {
    const std::string& input;
    size_t pos;

    Parser(const std::string& s) : input(s), pos(0) {}

    void skip_ws() {
        while (pos < input.size() && std::isspace(static_cast<unsigned char>(input[pos]))) {
            ++pos;
        }
    }

    bool at_end() const {
        return pos >= input.size();
    }

    char peek() const {
        return input[pos];
    }

    Pep2RpmError error(const std::string& msg) const {
        return Pep2RpmError{Pep2RpmError::Parse,
            msg + " in marker '" + input + "'",
            "at position " + std::to_string(pos)};
    }

    // Keyword followed by a non-identifier character
    bool try_keyword(const char* word) {
        size_t len = std::char_traits<char>::length(word);
        if (input.compare(pos, len, word) != 0) return false;
        if (pos + len < input.size() && is_ident_char(input[pos + len])) return false;
        pos += len;
        return true;
    }

    Result<MarkerExpr> parse_or() {
        auto left = parse_and();
        if (left.is_err()) return left;
        MarkerExpr expr = std::move(left).value();

        skip_ws();
        while (try_keyword("or")) {
            auto right = parse_and();
            if (right.is_err()) return right;
            expr = MarkerExpr::disjunction(std::move(expr), std::move(right).value());
            skip_ws();
        }
        return Result<MarkerExpr>::ok(std::move(expr));
    }

    Result<MarkerExpr> parse_and() {
        auto left = parse_atom();
        if (left.is_err()) return left;
        MarkerExpr expr = std::move(left).value();

        skip_ws();
        while (try_keyword("and")) {
            auto right = parse_atom();
            if (right.is_err()) return right;
            expr = MarkerExpr::conjunction(std::move(expr), std::move(right).value());
            skip_ws();
        }
        return Result<MarkerExpr>::ok(std::move(expr));
    }

    Result<MarkerExpr> parse_atom() {
        skip_ws();
        if (at_end()) {
            return error("unexpected end of input");
        }

        if (peek() == '(') {
            ++pos;
            auto inner = parse_or();
            if (inner.is_err()) return inner;
            skip_ws();
            if (at_end() || peek() != ')') {
                return error("expected ')'");
            }
            ++pos;
            return inner;
        }

        auto lhs = parse_operand();
        if (lhs.is_err()) return lhs.error();

        skip_ws();
        auto op = parse_op();
        if (op.is_err()) return op.error();

        auto rhs = parse_operand();
        if (rhs.is_err()) return rhs.error();

        const Operand& l = lhs.value();
        const Operand& r = rhs.value();
        if (l.is_literal == r.is_literal) {
            return error(l.is_literal ? "comparison between two strings"
                                      : "comparison between two variables");
        }
        if (l.is_literal) {
            return Result<MarkerExpr>::ok(
                MarkerExpr::compare(canonical_variable(r.text), op.value(), l.text, false));
        }
        return Result<MarkerExpr>::ok(
            MarkerExpr::compare(canonical_variable(l.text), op.value(), r.text, true));
    }

    Result<Operand> parse_operand() {
        skip_ws();
        if (at_end()) {
            return error("expected a variable or a quoted string");
        }

        Operand operand;
        char c = peek();
        if (c == '"' || c == '\'') {
            size_t close = input.find(c, pos + 1);
            if (close == std::string::npos) {
                return error("unterminated string");
            }
            operand.is_literal = true;
            operand.text = input.substr(pos + 1, close - pos - 1);
            pos = close + 1;
            return Result<Operand>::ok(std::move(operand));
        }

        if (!std::isalpha(static_cast<unsigned char>(c)) && c != '_') {
            return error(std::string("unexpected character '") + c + "'");
        }
        size_t start = pos;
        while (pos < input.size() && is_ident_char(input[pos])) ++pos;
        operand.text = input.substr(start, pos - start);
        return Result<Operand>::ok(std::move(operand));
    }

    Result<MarkerOp> parse_op() {
        static const std::pair<const char*, MarkerOp> symbols[] = {
            {"===", MarkerOp::Arbitrary},
            {"==", MarkerOp::Equal},
            {"!=", MarkerOp::NotEqual},
            {"<=", MarkerOp::LessEqual},
            {">=", MarkerOp::GreaterEqual},
            {"~=", MarkerOp::Compatible},
            {"<", MarkerOp::Less},
            {">", MarkerOp::Greater},
        };
        for (const auto& [symbol, op] : symbols) {
            size_t len = std::char_traits<char>::length(symbol);
            if (input.compare(pos, len, symbol) == 0) {
                pos += len;
                return Result<MarkerOp>::ok(op);
            }
        }
        if (try_keyword("in")) {
            return Result<MarkerOp>::ok(MarkerOp::In);
        }
        size_t saved = pos;
        if (try_keyword("not")) {
            skip_ws();
            if (try_keyword("in")) {
                return Result<MarkerOp>::ok(MarkerOp::NotIn);
            }
            pos = saved;
        }
        return error("expected a comparison operator");
    }
};

} // anonymous namespace

Result<MarkerExpr> MarkerExpr::parse(const std::string& input) {
    Parser parser(input);
    parser.skip_ws();
    if (parser.at_end()) {
        return Pep2RpmError{Pep2RpmError::Parse, "empty marker expression"};
    }

    auto result = parser.parse_or();
    if (result.is_err()) return result;

    parser.skip_ws();
    if (!parser.at_end()) {
        return parser.error("unexpected characters after marker expression");
    }
    return result;
}

ExtraSet make_extra_set(const std::vector<std::string>& names) {
    ExtraSet set;
    for (const auto& n : names) {
        set.insert(normalize_name(n));
    }
    return set;
}

// ---------------------------------------------------------------------------
// Environment and dynamic variables
// ---------------------------------------------------------------------------

Environment Environment::defaults() {
    Environment env;
    env.variables = {
        {"os_name", "posix"},
        {"sys_platform", "linux"},
        {"platform_system", "Linux"},
        {"implementation_name", "cpython"},
        {"platform_python_implementation", "CPython"},
    };
    return env;
}

static DynamicCapability builtin_capability(CapabilityKind kind, const char* text) {
    DynamicCapability cap;
    cap.kind = kind;
    // Built-in templates are well-formed
    cap.capability = NameTemplate::parse(text).value();
    return cap;
}

DynamicVariableMap DynamicVariableMap::defaults() {
    DynamicVariableMap map;
    map.entries_["platform_machine"] = builtin_capability(CapabilityKind::EqualityOnly, "python({arch})");
    map.entries_["platform_release"] = builtin_capability(CapabilityKind::Ordered, "kernel");
    map.entries_["python_version"] = builtin_capability(CapabilityKind::Ordered, "python(abi)");
    return map;
}

Status DynamicVariableMap::add(const std::string& variable, CapabilityKind kind,
                               const std::string& capability) {
    if (variable.empty() || variable == "extra") {
        return Pep2RpmError{Pep2RpmError::Config,
            "cannot map marker variable '" + variable + "' to a capability"};
    }
    auto tmpl = NameTemplate::parse(capability);
    if (tmpl.is_err()) return std::move(tmpl).error();

    if (kind == CapabilityKind::EqualityOnly && !tmpl.value().has_placeholder()) {
        return Pep2RpmError{Pep2RpmError::Config,
            "equality capability '" + capability + "' for " + variable + " has no placeholder",
            "write e.g. \"python({arch})\""};
    }
    if (kind == CapabilityKind::Ordered && tmpl.value().has_placeholder()) {
        return Pep2RpmError{Pep2RpmError::Config,
            "ordered capability '" + capability + "' for " + variable + " must be a fixed name",
            "the literal is compared against the capability's version"};
    }

    DynamicCapability cap;
    cap.kind = kind;
    cap.capability = std::move(tmpl).value();
    entries_[variable] = std::move(cap);
    return ok_status();
}

void DynamicVariableMap::remove(const std::string& variable) {
    entries_.erase(variable);
}

void DynamicVariableMap::merge(const DynamicVariableMap& other) {
    for (const auto& [variable, cap] : other.entries_) {
        entries_[variable] = cap;
    }
}

const DynamicCapability* DynamicVariableMap::find(const std::string& variable) const {
    auto it = entries_.find(variable);
    return it == entries_.end() ? nullptr : &it->second;
}

// ---------------------------------------------------------------------------
// TranslationResult
// ---------------------------------------------------------------------------

TranslationResult TranslationResult::constant(bool value) {
    TranslationResult r;
    r.value_ = value;
    return r;
}

TranslationResult TranslationResult::condition(std::string text) {
    TranslationResult r;
    r.value_ = std::move(text);
    return r;
}

std::string TranslationResult::to_string() const {
    if (is_constant()) return is_true() ? "true" : "false";
    return text();
}

// ---------------------------------------------------------------------------
// Evaluator
// ---------------------------------------------------------------------------

namespace {

using Eval = Result<TranslationResult>;

Eval constant(bool value) {
    return Eval::ok(TranslationResult::constant(value));
}

// "literal OP variable" read as "variable OP' literal"
Result<MarkerOp> variable_side_op(const MarkerExpr& leaf) {
    if (leaf.variable_first()) return Result<MarkerOp>::ok(leaf.op());
    switch (leaf.op()) {
    case MarkerOp::Less:         return Result<MarkerOp>::ok(MarkerOp::Greater);
    case MarkerOp::LessEqual:    return Result<MarkerOp>::ok(MarkerOp::GreaterEqual);
    case MarkerOp::Greater:      return Result<MarkerOp>::ok(MarkerOp::Less);
    case MarkerOp::GreaterEqual: return Result<MarkerOp>::ok(MarkerOp::LessEqual);
    case MarkerOp::Equal:
    case MarkerOp::NotEqual:
    case MarkerOp::Arbitrary:
        return Result<MarkerOp>::ok(leaf.op());
    default:
        return Pep2RpmError{Pep2RpmError::InvalidSpecifierOperator,
            std::string("operator '") + marker_op_symbol(leaf.op()) +
            "' cannot take a string on its left in '" + leaf.to_string() + "'"};
    }
}

Pep2RpmError unsupported_operator(const MarkerExpr& leaf, const std::string& why) {
    return Pep2RpmError{Pep2RpmError::InvalidSpecifierOperator,
        std::string("operator '") + marker_op_symbol(leaf.op()) + "' " + why +
        " in '" + leaf.to_string() + "'"};
}

Eval evaluate_extra(const MarkerExpr& leaf, const ExtraSet& extras) {
    bool present = extras.count(normalize_name(leaf.literal())) > 0;
    switch (leaf.op()) {
    case MarkerOp::Equal:
    case MarkerOp::In:
        return constant(present);
    case MarkerOp::NotEqual:
    case MarkerOp::NotIn:
        return constant(!present);
    default:
        return unsupported_operator(leaf, "cannot test extras");
    }
}

Eval compare_versions(const MarkerExpr& leaf, MarkerOp op, const std::string& value) {
    auto lhs = Version::parse(value);
    auto rhs = Version::parse(leaf.literal());
    if (lhs.is_err() || rhs.is_err()) {
        return unsupported_operator(leaf, "needs PEP 440 versions on both sides");
    }
    const Version& a = lhs.value();
    const Version& b = rhs.value();

    switch (op) {
    case MarkerOp::Less:         return constant(a < b);
    case MarkerOp::LessEqual:    return constant(a <= b);
    case MarkerOp::Greater:      return constant(a > b);
    case MarkerOp::GreaterEqual: return constant(a >= b);
    case MarkerOp::Compatible: {
        auto upper = compatible_upper_bound(b);
        if (upper.is_err()) return std::move(upper).error();
        return constant(a >= b && a < upper.value());
    }
    default:
        return unsupported_operator(leaf, "is not an ordering");
    }
}

Eval evaluate_known(const MarkerExpr& leaf, const std::string& value) {
    const std::string& lit = leaf.literal();
    switch (leaf.op()) {
    case MarkerOp::Equal:
    case MarkerOp::Arbitrary:
        return constant(value == lit);
    case MarkerOp::NotEqual:
        return constant(value != lit);
    case MarkerOp::In:
    case MarkerOp::NotIn: {
        // Substring test in the direction it was written
        bool found = leaf.variable_first()
            ? lit.find(value) != std::string::npos
            : value.find(lit) != std::string::npos;
        return constant(leaf.op() == MarkerOp::In ? found : !found);
    }
    default: {
        auto op = variable_side_op(leaf);
        if (op.is_err()) return std::move(op).error();
        return compare_versions(leaf, op.value(), value);
    }
    }
}

Eval evaluate_dynamic(const MarkerExpr& leaf, const DynamicCapability& cap) {
    auto op_result = variable_side_op(leaf);
    if (op_result.is_err()) return std::move(op_result).error();
    MarkerOp op = op_result.value();
    const std::string& lit = leaf.literal();

    if (cap.kind == CapabilityKind::EqualityOnly) {
        std::string name = cap.capability.format(lit);
        if (op == MarkerOp::Equal || op == MarkerOp::Arbitrary) {
            return Eval::ok(TranslationResult::condition("with " + name));
        }
        if (op == MarkerOp::NotEqual) {
            return Eval::ok(TranslationResult::condition("without " + name));
        }
        return unsupported_operator(leaf, "cannot be used on " + leaf.variable() +
                                          ", which only supports == and !=");
    }

    const std::string& name = cap.capability.text();
    switch (op) {
    case MarkerOp::Equal:
    case MarkerOp::Arbitrary:
        return Eval::ok(TranslationResult::condition("with " + name + " = " + lit));
    case MarkerOp::NotEqual:
        return Eval::ok(TranslationResult::condition("without " + name + " = " + lit));
    case MarkerOp::Less:
    case MarkerOp::LessEqual:
    case MarkerOp::Greater:
    case MarkerOp::GreaterEqual:
        return Eval::ok(TranslationResult::condition(
            "with " + name + " " + marker_op_symbol(op) + " " + lit));
    case MarkerOp::Compatible: {
        auto v = Version::parse(lit);
        if (v.is_err()) return std::move(v).error();
        auto upper = compatible_upper_bound(v.value());
        if (upper.is_err()) return std::move(upper).error();
        return Eval::ok(TranslationResult::condition(
            "with " + name + " >= " + lit + " with " + name + " < " + upper.value().to_string()));
    }
    default:
        return unsupported_operator(leaf, "cannot be deferred to install time");
    }
}

Eval evaluate_leaf(const MarkerExpr& leaf, const Environment& env, const ExtraSet& extras,
                   const DynamicVariableMap& dynamic) {
    const std::string& var = leaf.variable();
    if (var == "extra") {
        return evaluate_extra(leaf, extras);
    }

    auto known = env.variables.find(var);
    if (known != env.variables.end()) {
        return evaluate_known(leaf, known->second);
    }

    if (const DynamicCapability* cap = dynamic.find(var)) {
        return evaluate_dynamic(leaf, *cap);
    }

    return Pep2RpmError{Pep2RpmError::UnsupportedMarkerVariable,
        "marker variable '" + var + "' is neither in the environment nor mapped to a capability",
        "add it under [environment] or [dynamic." + var + "] in the configuration"};
}

Eval evaluate(const MarkerExpr& expr, const Environment& env, const ExtraSet& extras,
              const DynamicVariableMap& dynamic) {
    if (expr.kind() == MarkerExpr::Compare) {
        return evaluate_leaf(expr, env, extras, dynamic);
    }

    // The constant that decides the node on its own: false for 'and', true for 'or'
    const bool is_and = expr.kind() == MarkerExpr::And;
    const bool absorbing = !is_and;

    auto left = evaluate(expr.left(), env, extras, dynamic);
    if (left.is_ok() && left.value().is_constant()) {
        if (left.value().is_true() == absorbing) return left;
        return evaluate(expr.right(), env, extras, dynamic);
    }

    auto right = evaluate(expr.right(), env, extras, dynamic);
    if (right.is_ok() && right.value().is_constant()) {
        if (right.value().is_true() == absorbing) {
            if (left.is_err()) {
                log::debug("ignoring '%s': %s decides '%s'",
                           expr.left().to_string().c_str(),
                           right.value().to_string().c_str(),
                           expr.to_string().c_str());
            }
            return right;
        }
        return left;
    }

    if (left.is_err()) return left;
    if (right.is_err()) return right;

    const char* joiner = is_and ? " " : " or ";
    return Eval::ok(TranslationResult::condition(
        left.value().text() + joiner + right.value().text()));
}

} // anonymous namespace

Result<TranslationResult> evaluate_marker(const MarkerExpr& expr,
                                          const Environment& env,
                                          const ExtraSet& extras,
                                          const DynamicVariableMap& dynamic) {
    return evaluate(expr, env, extras, dynamic);
}

} // namespace pep2rpm
