#include <catch2/catch.hpp>
#include <pep2rpm/requirement.hpp>
#include <chrono>
#include <string>
#include <vector>

using namespace pep2rpm;

static std::vector<std::string> make_requirements(int count) {
    std::vector<std::string> reqs;
    reqs.reserve(count);
    for (int i = 0; i < count; ++i) {
        std::string name = "package-" + std::to_string(i);
        switch (i % 5) {
        case 0: reqs.push_back(name + " (!=2.0.4,!=2.1.2,>=2.0.1)"); break;
        case 1: reqs.push_back(name + " ~=1.4.2 ; python_version < '3.10'"); break;
        case 2: reqs.push_back(name + " ; os_name == 'nt' or platform_release > '5.14'"); break;
        case 3: reqs.push_back(name + " ==3.* ; extra == 'test'"); break;
        default: reqs.push_back(name + " >=1.0rc1"); break;
        }
    }
    return reqs;
}

static RequirementConverter make_converter() {
    return RequirementConverter(NameTemplate::parse("python3dist({name})").value(),
                                Environment::defaults(),
                                DynamicVariableMap::defaults());
}

TEST_CASE("convert perf: 10K requirements under 500ms", "[requirement][bench]") {
    auto reqs = make_requirements(10000);
    auto converter = make_converter();

    auto start = std::chrono::high_resolution_clock::now();
    auto r = converter.convert(reqs, make_extra_set({"test"}));
    auto end = std::chrono::high_resolution_clock::now();

    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 10000);

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    INFO("Convert 10K requirements: " << ms << " ms");
    REQUIRE(ms < 500);
}

TEST_CASE("convert perf: parallel conversion of 10K requirements", "[requirement][bench]") {
    auto reqs = make_requirements(10000);
    auto converter = make_converter();

    auto start = std::chrono::high_resolution_clock::now();
    auto r = converter.convert_parallel(reqs, {}, 4);
    auto end = std::chrono::high_resolution_clock::now();

    REQUIRE(r.is_ok());
    // Requirements behind extra == 'test' are dropped
    REQUIRE(r.value().size() == 8000);

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    INFO("Parallel convert 10K requirements: " << ms << " ms");
    REQUIRE(ms < 500);
}
