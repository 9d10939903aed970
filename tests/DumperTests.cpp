#include "ry/yaml/Dumper.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <limits>
#include <string>

using ry::yaml::Dumper;
using ry::yaml::Mapping;
using ry::yaml::Sequence;
using ry::yaml::Value;

TEST_CASE("Dumper renders scalars", "[yaml][dumper]") {
    const Dumper dumper;

    REQUIRE(dumper.Dump(Value()) == "null");
    REQUIRE(dumper.Dump(Value(true)) == "true");
    REQUIRE(dumper.Dump(Value(false)) == "false");
    REQUIRE(dumper.Dump(Value(42)) == "42");
    REQUIRE(dumper.Dump(Value(std::int64_t{-9000000000})) == "-9000000000");
    REQUIRE(dumper.Dump(Value(3.14)) == "3.14");
    REQUIRE(dumper.Dump(Value(1.0)) == "1.0");
    REQUIRE(dumper.Dump(Value(-2.0)) == "-2.0");
    REQUIRE(dumper.Dump(Value(1e20)) == "1e+20");
    REQUIRE(dumper.Dump(Value(std::numeric_limits<double>::infinity())) == "inf");
    REQUIRE(dumper.Dump(Value("plain text")) == "plain text");
}

TEST_CASE("Dumper quotes strings with reserved characters", "[yaml][dumper]") {
    REQUIRE(Dumper::NeedsQuoting("a: b"));
    REQUIRE(Dumper::NeedsQuoting("#tag"));
    REQUIRE(Dumper::NeedsQuoting("[x]"));
    REQUIRE(Dumper::NeedsQuoting("50%"));
    REQUIRE(Dumper::NeedsQuoting("user@host"));
    REQUIRE(Dumper::NeedsQuoting("`cmd`"));
    REQUIRE_FALSE(Dumper::NeedsQuoting("http//host"));
    REQUIRE_FALSE(Dumper::NeedsQuoting("hello world"));

    REQUIRE(Dumper::FormatScalar(Value("http://host")) == "\"http://host\"");
    REQUIRE(Dumper::FormatScalar(Value("it's")) == "\"it's\"");
    // No escaping is applied to embedded double quotes.
    REQUIRE(Dumper::FormatScalar(Value("say \"hi\"")) == "\"say \"hi\"\"");
}

TEST_CASE("Dumper renders empty collections inline", "[yaml][dumper]") {
    Mapping mapping;
    mapping.Set("a", Sequence{});
    mapping.Set("b", Mapping{});

    REQUIRE(Dumper().Dump(Value(mapping)) == "a: []\nb: {}");
    REQUIRE(Dumper().Dump(Value(Sequence{})) == "[]");
    REQUIRE(Dumper().Dump(Value(Mapping{})) == "{}");
}

TEST_CASE("Dumper renders nested mappings and sequences", "[yaml][dumper]") {
    Mapping settings;
    settings.Set("enabled", true);
    settings.Set("count", 42);

    Mapping root;
    root.Set("app", "myapp");
    root.Set("settings", settings);
    root.Set("items", Sequence{Value("one"), Value("two"), Value("three")});

    const std::string expected =
        "app: myapp\n"
        "settings:\n"
        "  enabled: true\n"
        "  count: 42\n"
        "items:\n"
        "  - one\n"
        "  - two\n"
        "  - three";
    REQUIRE(Dumper().Dump(Value(root)) == expected);
}

TEST_CASE("Dumper honours the indent width", "[yaml][dumper]") {
    Mapping inner;
    inner.Set("leaf", 1);
    Mapping root;
    root.Set("outer", inner);

    REQUIRE(Dumper(4).Dump(Value(root)) == "outer:\n    leaf: 1");
    REQUIRE(Dumper(0).Dump(Value(root)) == "outer:\nleaf: 1");
}

TEST_CASE("Dumper clamps a negative indent width", "[yaml][dumper]") {
    const Dumper dumper(-3);
    REQUIRE(dumper.IndentWidth() == 0);
}

TEST_CASE("Dumper collapses collection items onto the dash line", "[yaml][dumper]") {
    Mapping person;
    person.Set("name", "ada");
    person.Set("age", 36);

    Sequence items;
    items.push_back(person);
    items.push_back(Sequence{Value(1), Value(2)});
    items.push_back(Sequence{});
    items.push_back("tail");

    const std::string expected =
        "- name: ada\n"
        "  age: 36\n"
        "- - 1\n"
        "  - 2\n"
        "- []\n"
        "- tail";
    REQUIRE(Dumper().Dump(Value(items)) == expected);
}
