#include "ry/yaml/ScalarCoercion.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <cstdint>
#include <string>

using ry::yaml::CoerceScalar;
using ry::yaml::ValueType;

TEST_CASE("Empty and null words coerce to null", "[yaml][scalar]") {
    REQUIRE(CoerceScalar("").IsNull());
    REQUIRE(CoerceScalar("   ").IsNull());
    REQUIRE(CoerceScalar("~").IsNull());
    REQUIRE(CoerceScalar("null").IsNull());
    REQUIRE(CoerceScalar("NULL").IsNull());
    REQUIRE(CoerceScalar("Null").IsNull());
}

TEST_CASE("Boolean words are matched case-insensitively", "[yaml][scalar]") {
    for (const char* word : {"true", "True", "YES", "yes", "on", "ON", "oN"}) {
        const auto value = CoerceScalar(word);
        REQUIRE(value.IsBool());
        REQUIRE(value.AsBool());
    }
    for (const char* word : {"false", "FALSE", "no", "No", "off", "OFF"}) {
        const auto value = CoerceScalar(word);
        REQUIRE(value.IsBool());
        REQUIRE_FALSE(value.AsBool());
    }
}

TEST_CASE("Quoted fragments keep their contents verbatim", "[yaml][scalar]") {
    REQUIRE(CoerceScalar("\"42\"").AsString() == "42");
    REQUIRE(CoerceScalar("'true'").AsString() == "true");
    REQUIRE(CoerceScalar("\"a: b # c\"").AsString() == "a: b # c");
    REQUIRE(CoerceScalar("\"\"").AsString().empty());
    REQUIRE(CoerceScalar("\"say \"hi\"\"").AsString() == "say \"hi\"");
    REQUIRE(CoerceScalar("  'padded'  ").AsString() == "padded");
    REQUIRE(CoerceScalar("\"").AsString().empty());
}

TEST_CASE("Mismatched quotes stay plain strings", "[yaml][scalar]") {
    REQUIRE(CoerceScalar("\"open").AsString() == "\"open");
    REQUIRE(CoerceScalar("'mixed\"").AsString() == "'mixed\"");
}

TEST_CASE("Integer literals coerce to integers", "[yaml][scalar]") {
    REQUIRE(CoerceScalar("42").AsInteger() == 42);
    REQUIRE(CoerceScalar("-17").AsInteger() == -17);
    REQUIRE(CoerceScalar("+8").AsInteger() == 8);
    REQUIRE(CoerceScalar("007").AsInteger() == 7);
    REQUIRE(CoerceScalar("9223372036854775807").AsInteger() == INT64_MAX);
}

TEST_CASE("Integers too large for 64 bits become floats", "[yaml][scalar]") {
    const auto value = CoerceScalar("123456789012345678901234567890");
    REQUIRE(value.IsFloat());
    REQUIRE(value.AsFloat() == Catch::Approx(1.2345678901234568e29));

    const auto huge = CoerceScalar("1" + std::string(400, '0'));
    REQUIRE(huge.IsFloat());
    REQUIRE(std::isinf(huge.AsFloat()));
}

TEST_CASE("Out-of-range float literals saturate", "[yaml][scalar]") {
    const auto overflow = CoerceScalar("1e400");
    REQUIRE(overflow.IsFloat());
    REQUIRE(std::isinf(overflow.AsFloat()));
    REQUIRE(overflow.AsFloat() > 0.0);

    const auto negative = CoerceScalar("-1e400");
    REQUIRE(negative.IsFloat());
    REQUIRE(std::isinf(negative.AsFloat()));
    REQUIRE(negative.AsFloat() < 0.0);

    const auto underflow = CoerceScalar("1e-400");
    REQUIRE(underflow.IsFloat());
    REQUIRE(underflow.AsFloat() == 0.0);
}

TEST_CASE("Floating-point literals coerce to floats", "[yaml][scalar]") {
    using Catch::Approx;

    REQUIRE(CoerceScalar("3.14").AsFloat() == Approx(3.14));
    REQUIRE(CoerceScalar("1.0").AsFloat() == Approx(1.0));
    REQUIRE(CoerceScalar("-0.5").AsFloat() == Approx(-0.5));
    REQUIRE(CoerceScalar("+2.5").AsFloat() == Approx(2.5));
    REQUIRE(CoerceScalar("1e3").AsFloat() == Approx(1000.0));
    REQUIRE(CoerceScalar(".5").AsFloat() == Approx(0.5));
    REQUIRE(std::isinf(CoerceScalar("inf").AsFloat()));
    REQUIRE(std::isnan(CoerceScalar("nan").AsFloat()));
}

TEST_CASE("Everything else is a trimmed string", "[yaml][scalar]") {
    REQUIRE(CoerceScalar("hello").AsString() == "hello");
    REQUIRE(CoerceScalar("  hello world  ").AsString() == "hello world");
    REQUIRE(CoerceScalar("1.2.3").AsString() == "1.2.3");
    REQUIRE(CoerceScalar("12abc").AsString() == "12abc");
    REQUIRE(CoerceScalar("-").AsString() == "-");
    REQUIRE(CoerceScalar("+-1").AsString() == "+-1");
    REQUIRE(CoerceScalar("0x10").AsString() == "0x10");
    REQUIRE(CoerceScalar("nan(abc)").AsString() == "nan(abc)");
    REQUIRE(CoerceScalar("-nan(1)").AsString() == "-nan(1)");
    REQUIRE(CoerceScalar("yes please").Type() == ValueType::String);
}
