#include <catch2/catch.hpp>
#include <pep2rpm/marker.hpp>
#include <string>
#include <vector>

using namespace pep2rpm;

static Result<TranslationResult> eval(const char* text,
                                      const std::vector<std::string>& extras = {}) {
    auto expr = MarkerExpr::parse(text);
    REQUIRE(expr.is_ok());
    return evaluate_marker(expr.value(), Environment::defaults(), make_extra_set(extras),
                           DynamicVariableMap::defaults());
}

static TranslationResult ok(const char* text, const std::vector<std::string>& extras = {}) {
    auto r = eval(text, extras);
    INFO(text << (r.is_err() ? "\n" + r.error().format() : std::string()));
    REQUIRE(r.is_ok());
    return r.value();
}

static TranslationResult cond(const char* text) {
    return TranslationResult::condition(text);
}

static const TranslationResult True = TranslationResult::constant(true);
static const TranslationResult False = TranslationResult::constant(false);

// ===== Parsing =====

TEST_CASE("parse single comparison", "[marker]") {
    auto r = MarkerExpr::parse("os_name == 'nt'");
    REQUIRE(r.is_ok());
    const MarkerExpr& e = r.value();
    REQUIRE(e.kind() == MarkerExpr::Compare);
    REQUIRE(e.variable() == "os_name");
    REQUIRE(e.op() == MarkerOp::Equal);
    REQUIRE(e.literal() == "nt");
    REQUIRE(e.variable_first());
}

TEST_CASE("parse literal on the left", "[marker]") {
    auto r = MarkerExpr::parse("'3.4' < python_version");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().variable() == "python_version");
    REQUIRE(r.value().literal() == "3.4");
    REQUIRE_FALSE(r.value().variable_first());
    REQUIRE(r.value().to_string() == "\"3.4\" < python_version");
}

TEST_CASE("and binds tighter than or", "[marker]") {
    auto r = MarkerExpr::parse("a == '1' or b == '2' and c == '3'");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().kind() == MarkerExpr::Or);
    REQUIRE(r.value().left().kind() == MarkerExpr::Compare);
    REQUIRE(r.value().right().kind() == MarkerExpr::And);
}

TEST_CASE("parentheses group", "[marker]") {
    auto r = MarkerExpr::parse("(a == '1' or b == '2') and c == '3'");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().kind() == MarkerExpr::And);
    REQUIRE(r.value().left().kind() == MarkerExpr::Or);
    REQUIRE(r.value().to_string() == "(a == \"1\" or b == \"2\") and c == \"3\"");
}

TEST_CASE("parse in and not in", "[marker]") {
    auto in = MarkerExpr::parse("'linux' in sys_platform");
    REQUIRE(in.is_ok());
    REQUIRE(in.value().op() == MarkerOp::In);

    auto not_in = MarkerExpr::parse("sys_platform not   in 'win32 cygwin'");
    REQUIRE(not_in.is_ok());
    REQUIRE(not_in.value().op() == MarkerOp::NotIn);
    REQUIRE(not_in.value().to_string() == "sys_platform not in \"win32 cygwin\"");
}

TEST_CASE("parse legacy variable names", "[marker]") {
    auto r = MarkerExpr::parse("os.name == 'posix'");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().variable() == "os_name");
}

TEST_CASE("parse errors", "[marker]") {
    for (const char* bad : {"", "os_name ==", "os_name 'nt'", "'a' == 'b'",
                            "os_name == sys_platform", "(os_name == 'nt'",
                            "os_name == 'nt' garbage", "os_name == \"nt"}) {
        auto r = MarkerExpr::parse(bad);
        INFO(bad);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == Pep2RpmError::Parse);
    }
}

// ===== Single leaves =====

TEST_CASE("dynamic equality-only variable", "[marker]") {
    REQUIRE(ok("platform_machine == \"x86-64\"") == cond("with python(x86-64)"));
    REQUIRE(ok("platform_machine != \"x86\"") == cond("without python(x86)"));
    REQUIRE(ok("\"x86\" != platform_machine") == cond("without python(x86)"));
}

TEST_CASE("dynamic equality-only variable rejects ordering", "[marker]") {
    auto r = eval("platform_machine > \"x86\"");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == Pep2RpmError::InvalidSpecifierOperator);
}

TEST_CASE("dynamic ordered variable", "[marker]") {
    REQUIRE(ok("platform_release > \"3.4\"") == cond("with kernel > 3.4"));
    REQUIRE(ok("python_version < \"3.4\"") == cond("with python(abi) < 3.4"));
    REQUIRE(ok("python_version >= \"3.8\"") == cond("with python(abi) >= 3.8"));
    REQUIRE(ok("python_version == \"3.8\"") == cond("with python(abi) = 3.8"));
    REQUIRE(ok("python_version != \"2.7\"") == cond("without python(abi) = 2.7"));
    REQUIRE(ok("python_version ~= \"3.8\"") ==
            cond("with python(abi) >= 3.8 with python(abi) < 4"));
}

TEST_CASE("literal on the left flips the operator", "[marker]") {
    REQUIRE(ok("\"3.4\" < platform_release") == cond("with kernel > 3.4"));
    REQUIRE(ok("\"3.4\" >= python_version") == cond("with python(abi) <= 3.4"));
}

TEST_CASE("extra membership", "[marker]") {
    REQUIRE(ok("extra == \"micro\"") == False);
    REQUIRE(ok("extra == \"micro\"", {"micro"}) == True);
    REQUIRE(ok("extra != \"micro\"", {"micro"}) == False);
    REQUIRE(ok("extra == \"Socks_Proxy\"", {"socks-proxy"}) == True);
}

TEST_CASE("known variables evaluate statically", "[marker]") {
    REQUIRE(ok("os_name == \"nt\"") == False);
    REQUIRE(ok("os_name == \"posix\"") == True);
    REQUIRE(ok("os_name != \"nt\"") == True);
    REQUIRE(ok("platform_python_implementation === \"CPython\"") == True);
}

TEST_CASE("in tests substrings", "[marker]") {
    REQUIRE(ok("\"lin\" in sys_platform") == True);
    REQUIRE(ok("sys_platform in \"linux darwin\"") == True);
    REQUIRE(ok("sys_platform not in \"win32 cygwin\"") == True);
    REQUIRE(ok("\"win\" in sys_platform") == False);
}

TEST_CASE("ordered comparison on a known variable compares versions", "[marker]") {
    Environment env = Environment::defaults();
    env.variables["python_full_version"] = "3.11.4";
    auto expr = MarkerExpr::parse("python_full_version >= '3.9'").value();
    auto r = evaluate_marker(expr, env, {}, DynamicVariableMap::defaults());
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == True);
}

TEST_CASE("ordered comparison on a non-version value fails", "[marker]") {
    auto r = eval("os_name < \"nt\"");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == Pep2RpmError::InvalidSpecifierOperator);
}

TEST_CASE("unknown variable fails", "[marker]") {
    auto r = eval("platform_version == \"1\"");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == Pep2RpmError::UnsupportedMarkerVariable);
    REQUIRE(r.error().message.find("platform_version") != std::string::npos);
}

TEST_CASE("environment takes priority over dynamic variables", "[marker]") {
    Environment env = Environment::defaults();
    env.variables["python_version"] = "3.12";
    auto expr = MarkerExpr::parse("python_version < '3.4'").value();
    auto r = evaluate_marker(expr, env, {}, DynamicVariableMap::defaults());
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == False);
}

// ===== Combination =====

TEST_CASE("extras combined with other markers", "[marker]") {
    REQUIRE(ok("extra == \"micro\" and os_name == \"nt\"") == False);
    REQUIRE(ok("extra == \"micro\" and os_name == \"nt\"", {"micro"}) == False);
    REQUIRE(ok("extra == \"micro\" and os_name == \"posix\"") == False);
    REQUIRE(ok("extra == \"micro\" and os_name == \"posix\"", {"micro"}) == True);
    REQUIRE(ok("extra == \"micro\" or platform_machine == \"x86-64\"") ==
            cond("with python(x86-64)"));
    REQUIRE(ok("extra == \"micro\" or platform_machine == \"x86-64\"", {"micro"}) == True);
}

TEST_CASE("complex markers", "[marker]") {
    REQUIRE(ok("os_name != \"nt\" and implementation_name == \"cpython\"") == True);
    REQUIRE(ok("platform_machine == \"x86-64\" and platform_release > \"3.4\"") ==
            cond("with python(x86-64) with kernel > 3.4"));
    REQUIRE(ok("os_name == \"nt\" and platform_machine == \"x86-64\" or platform_release > \"3.4\"") ==
            cond("with kernel > 3.4"));
    REQUIRE(ok("platform_machine != \"x86\" and platform_release > \"5.14\"") ==
            cond("without python(x86) with kernel > 5.14"));
    REQUIRE(ok("platform_machine == \"x86-64\" or platform_machine == \"aarch64\"") ==
            cond("with python(x86-64) or with python(aarch64)"));
}

TEST_CASE("constant operand decides regardless of the other side", "[marker]") {
    // The unsupported variable never matters
    REQUIRE(ok("os_name == \"nt\" and platform_version == \"1\"") == False);
    REQUIRE(ok("platform_version == \"1\" and os_name == \"nt\"") == False);
    REQUIRE(ok("os_name == \"posix\" or platform_version == \"1\"") == True);
    REQUIRE(ok("platform_version == \"1\" or os_name == \"posix\"") == True);
}

TEST_CASE("neutral constant operand does not hide errors", "[marker]") {
    auto r = eval("os_name == \"posix\" and platform_version == \"1\"");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == Pep2RpmError::UnsupportedMarkerVariable);

    auto r2 = eval("platform_version == \"1\" or os_name == \"nt\"");
    REQUIRE(r2.is_err());
}

TEST_CASE("evaluation leaves its inputs untouched", "[marker]") {
    Environment env = Environment::defaults();
    DynamicVariableMap dynamic = DynamicVariableMap::defaults();
    auto expr = MarkerExpr::parse("os_name == 'posix' and platform_release > '4'").value();
    auto first = evaluate_marker(expr, env, {}, dynamic);
    auto second = evaluate_marker(expr, env, {}, dynamic);
    REQUIRE(first.is_ok());
    REQUIRE(first.value() == second.value());
    REQUIRE(env.variables == Environment::defaults().variables);
    REQUIRE(dynamic.entries().size() == 3);
}

// ===== TranslationResult =====

TEST_CASE("TranslationResult keeps false and empty condition apart", "[marker]") {
    auto f = TranslationResult::constant(false);
    auto empty = TranslationResult::condition("");
    REQUIRE(f.is_false());
    REQUIRE_FALSE(empty.is_false());
    REQUIRE(empty.is_condition());
    REQUIRE(f != empty);
    REQUIRE(f.to_string() == "false");
    REQUIRE(True.to_string() == "true");
    REQUIRE(cond("with kernel").to_string() == "with kernel");
}

// ===== Dynamic variable map =====

TEST_CASE("dynamic map defaults", "[marker]") {
    auto map = DynamicVariableMap::defaults();
    const DynamicCapability* machine = map.find("platform_machine");
    REQUIRE(machine != nullptr);
    REQUIRE(machine->kind == CapabilityKind::EqualityOnly);
    REQUIRE(machine->capability.format("x86_64") == "python(x86_64)");
    REQUIRE(map.find("platform_release")->capability.text() == "kernel");
    REQUIRE(map.find("python_version")->kind == CapabilityKind::Ordered);
    REQUIRE(map.find("sys_platform") == nullptr);
}

TEST_CASE("dynamic map add validates templates", "[marker]") {
    DynamicVariableMap map;
    REQUIRE(map.add("platform_version", CapabilityKind::Ordered, "kernel-version").is_ok());
    REQUIRE(map.add("implementation_version", CapabilityKind::EqualityOnly, "impl({v})").is_ok());

    auto no_placeholder = map.add("a", CapabilityKind::EqualityOnly, "fixed");
    REQUIRE(no_placeholder.is_err());
    REQUIRE(no_placeholder.error().code == Pep2RpmError::Config);

    auto placeholder = map.add("b", CapabilityKind::Ordered, "cap({x})");
    REQUIRE(placeholder.is_err());

    REQUIRE(map.add("extra", CapabilityKind::Ordered, "x").is_err());
    REQUIRE(map.entries().size() == 2);
}

TEST_CASE("dynamic map merge and remove", "[marker]") {
    auto map = DynamicVariableMap::defaults();
    DynamicVariableMap other;
    REQUIRE(other.add("platform_release", CapabilityKind::Ordered, "linux-kernel").is_ok());
    map.merge(other);
    REQUIRE(map.find("platform_release")->capability.text() == "linux-kernel");

    map.remove("platform_machine");
    REQUIRE(map.find("platform_machine") == nullptr);
}

TEST_CASE("user-added dynamic variable is used", "[marker]") {
    auto map = DynamicVariableMap::defaults();
    REQUIRE(map.add("platform_version", CapabilityKind::Ordered, "kernel-version").is_ok());
    auto expr = MarkerExpr::parse("platform_version >= '6.1'").value();
    auto r = evaluate_marker(expr, Environment::defaults(), {}, map);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == cond("with kernel-version >= 6.1"));
}

TEST_CASE("make_extra_set normalizes names", "[marker]") {
    auto set = make_extra_set({"Socks_Proxy", "TEST"});
    REQUIRE(set.count("socks-proxy") == 1);
    REQUIRE(set.count("test") == 1);
}
