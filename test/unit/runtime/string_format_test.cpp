#include <catch2/catch_test_macros.hpp>
#include "runtime/execution/script_error.h"
#include "runtime/execution/string_format.h"
#include "runtime/script_harness.h"

using namespace signal_lambda::runtime;
using namespace signal_lambda::runtime::test;

namespace {

std::string Format(std::string_view pattern, std::vector<Value> args = {},
                   std::vector<std::pair<std::string, Value>> kwargs = {}) {
    return FormatString(pattern, args, kwargs);
}

} // namespace

TEST_CASE("Format specs", "[runtime][format]") {

    SECTION("Fixed point, exponent and percent") {
        REQUIRE(FormatValue(Value::Float(1.2345), ".2f") == "1.23");
        REQUIRE(FormatValue(Value::Int(2), ".1f") == "2.0");
        REQUIRE(FormatValue(Value::Float(12345.678), "e") == "1.234568e+04");
        REQUIRE(FormatValue(Value::Float(0.256), ".1%") == "25.6%");
        REQUIRE(FormatValue(Value::Float(-0.5), ".0f") == "-0");
    }

    SECTION("Width, fill, alignment and sign") {
        REQUIRE(FormatValue(Value::Str("a"), ">5") == "    a");
        REQUIRE(FormatValue(Value::Str("a"), "*^5") == "**a**");
        REQUIRE(FormatValue(Value::Str("ab"), "5") == "ab   ");
        REQUIRE(FormatValue(Value::Int(42), "05d") == "00042");
        REQUIRE(FormatValue(Value::Int(-42), "06") == "-00042");
        REQUIRE(FormatValue(Value::Int(42), "+") == "+42");
        REQUIRE(FormatValue(Value::Float(2.0), "+.1f") == "+2.0");
    }

    SECTION("Thousands separators") {
        REQUIRE(FormatValue(Value::Int(1234567), ",") == "1,234,567");
        REQUIRE(FormatValue(Value::Float(1234.5), ",.2f") == "1,234.50");
    }

    SECTION("Empty spec is str()") {
        REQUIRE(FormatValue(Value::Float(0.1), "") == "0.1");
        REQUIRE(FormatValue(Value::Bool(true), "") == "True");
        REQUIRE(FormatValue(Value::None(), "") == "None");
    }

    SECTION("Spec errors") {
        REQUIRE_THROWS_WITH(FormatValue(Value::Float(1.5), "d"),
                            "ValueError: Unknown format code 'd' for object of type 'float'");
        REQUIRE_THROWS_WITH(FormatValue(Value::Int(1), "s"),
                            "ValueError: Unknown format code 's' for object of type 'int'");
        REQUIRE_THROWS_WITH(FormatValue(Value::Str("a"), "f"),
                            "ValueError: Unknown format code 'f' for object of type 'str'");
        REQUIRE_THROWS_WITH(FormatValue(Value::Float(1.0), "."), "ValueError: Format specifier missing precision");
        REQUIRE_THROWS_WITH(FormatValue(Value::Int(1), ".2d"),
                            "ValueError: Precision not allowed in integer format specifier");
    }
}

TEST_CASE("Replacement fields", "[runtime][format]") {
    REQUIRE(Format("{} and {}", {Value::Int(1), Value::Str("x")}) == "1 and x");
    REQUIRE(Format("{0}-{0}-{1}", {Value::Str("a"), Value::Str("b")}) == "a-a-b");
    REQUIRE(Format("{name}: {value:.1f}", {}, {{"name", Value::Str("AAPL")}, {"value", Value::Float(0.96)}}) ==
            "AAPL: 1.0");
    REQUIRE(Format("{{}} {}", {Value::Int(1)}) == "{} 1");

    SECTION("Field errors") {
        REQUIRE_THROWS_WITH(Format("{"), "ValueError: Single '{' encountered in format string");
        REQUIRE_THROWS_WITH(Format("}"), "ValueError: Single '}' encountered in format string");
        REQUIRE_THROWS_WITH(Format("{} {}", {Value::Int(1)}),
                            "IndexError: Replacement index 1 out of range for positional args tuple");
        REQUIRE_THROWS_WITH(Format("{x}"), "KeyError: 'x'");
        REQUIRE_THROWS_WITH(Format("{0} {}", {Value::Int(1), Value::Int(2)}),
                            "ValueError: cannot switch from manual field specification to automatic field numbering");
        REQUIRE_THROWS_AS(Format("{0.attr}", {Value::Int(1)}), ScriptError);
    }

    SECTION("Through str.format in a program") {
        REQUIRE(Eval("result = '{}: {:.2f}'.format('AAPL', 0.9 * 2)\n") == "'AAPL: 1.80'");
    }
}
