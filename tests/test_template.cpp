#include <catch2/catch.hpp>
#include <pep2rpm/template.hpp>

using namespace pep2rpm;

TEST_CASE("template with one placeholder", "[template]") {
    auto r = NameTemplate::parse("python-{name}");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().has_placeholder());
    REQUIRE(r.value().placeholder() == "name");
    REQUIRE(r.value().text() == "python-{name}");
    REQUIRE(r.value().format("requests") == "python-requests");
}

TEST_CASE("template without placeholder is a fixed name", "[template]") {
    auto r = NameTemplate::parse("python(abi)");
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().has_placeholder());
    REQUIRE(r.value().format("ignored") == "python(abi)");
}

TEST_CASE("template placeholder may repeat", "[template]") {
    auto r = NameTemplate::parse("{arch}-{arch}");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().format("x86_64") == "x86_64-x86_64");
}

TEST_CASE("template brace escapes", "[template]") {
    auto r = NameTemplate::parse("{{literal}}-{name}");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().format("pkg") == "{literal}-pkg");
}

TEST_CASE("template errors", "[template]") {
    for (const char* bad : {"python-{name", "python-name}", "{}", "{1abc}", "{a-b}",
                            "{name}-{arch}"}) {
        auto r = NameTemplate::parse(bad);
        INFO(bad);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == Pep2RpmError::Config);
    }
}
