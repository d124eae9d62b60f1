#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "runtime/script_harness.h"

using namespace signal_lambda;
using namespace signal_lambda::runtime;
using namespace signal_lambda::runtime::test;

TEST_CASE("Interpreter evaluates expressions", "[runtime][interpreter]") {

    SECTION("Arithmetic precedence") {
        REQUIRE(Eval("result = 1 + 2 * 3\n") == "7");
        REQUIRE(Eval("result = (1 + 2) * 3\n") == "9");
        REQUIRE(Eval("result = -2 ** 2\n") == "-4");
        REQUIRE(Eval("result = 7 / 2\n") == "3.5");
        REQUIRE(Eval("result = 0.9 * 2\n") == "1.8");
    }

    SECTION("Boolean operators return the deciding operand") {
        REQUIRE(Eval("result = 0 or 'x'\n") == "'x'");
        REQUIRE(Eval("result = [] and 1\n") == "[]");
        REQUIRE(Eval("result = not 0\n") == "True");
        // The right operand is never evaluated
        REQUIRE(Eval("result = True or 1 / 0\n") == "True");
    }

    SECTION("Chained comparisons") {
        REQUIRE(Eval("result = 1 < 2 < 3\n") == "True");
        REQUIRE(Eval("result = 1 < 3 < 2\n") == "False");
        REQUIRE(Eval("result = 'a' in 'abc' and 2 not in [1, 3]\n") == "True");
        REQUIRE(Eval("result = None is None\n") == "True");
    }

    SECTION("Conditional expressions") {
        REQUIRE(Eval("x = 0.7\nresult = 'BUY' if x > 0.5 else 'HOLD'\n") == "'BUY'");
    }

    SECTION("Subscripts and slices") {
        REQUIRE(Eval("a = [0, 1, 2, 3, 4]\nresult = a[1:4:2]\n") == "[1, 3]");
        REQUIRE(Eval("result = 'signal'[::-1]\n") == "'langis'");
        REQUIRE(Eval("result = {'a': {'b': 2}}['a']['b']\n") == "2");
    }

    SECTION("Math namespace") {
        REQUIRE(Eval("result = math.pi\n") == "3.141592653589793");
        REQUIRE(Eval("result = math.floor(2.5)\n") == "2");
    }
}

TEST_CASE("Interpreter executes statements", "[runtime][interpreter]") {

    SECTION("Loops with break and continue") {
        const char* code = R"(
total = 0
for i in range(10):
    if i % 2 == 0:
        continue
    if i > 7:
        break
    total += i
result = total
)";
        REQUIRE(Eval(code) == "16");
    }

    SECTION("Nested loops break only the inner loop") {
        const char* code = R"(
pairs = []
for i in range(3):
    for j in range(3):
        if j > i:
            break
        pairs.append((i, j))
result = len(pairs)
)";
        REQUIRE(Eval(code) == "6");
    }

    SECTION("Tuple unpacking and swaps") {
        REQUIRE(Eval("a, b = 1, 2\na, b = b, a\nresult = [a, b]\n") == "[2, 1]");
        REQUIRE(Eval("result = 0\nfor k, v in {'x': 1, 'y': 2}.items():\n    result += v\n") == "3");
        REQUIRE(Eval("[a, (b, c)] = [1, (2, 3)]\nresult = a + b + c\n") == "6");
    }

    SECTION("Chained assignment shares the value") {
        REQUIRE(Eval("a = b = []\na.append(1)\nresult = b\n") == "[1]");
    }

    SECTION("Augmented assignment") {
        REQUIRE(Eval("a = [1]\nb = a\na += [2]\nresult = b\n") == "[1, 2]");
        REQUIRE(Eval("d = {'n': 1}\nd['n'] *= 5\nresult = d\n") == "{'n': 5}");
        REQUIRE(Eval("s = 'ab'\ns += 'c'\nresult = s\n") == "'abc'");
    }

    SECTION("Slice assignment and deletion") {
        REQUIRE(Eval("a = [0, 1, 2, 3]\na[1:3] = ['x']\nresult = a\n") == "[0, 'x', 3]");
        REQUIRE(Eval("a = [0, 1, 2, 3]\na[::2] = [8, 9]\nresult = a\n") == "[8, 1, 9, 3]");
        REQUIRE(Eval("a = [0, 1, 2, 3]\ndel a[::2]\nresult = a\n") == "[1, 3]");
        REQUIRE(Eval("d = {'a': 1, 'b': 2}\ndel d['a']\nresult = d\n") == "{'b': 2}");
    }

    SECTION("Lists grown by the loop body are visited") {
        const char* code = R"(
a = [1]
for x in a:
    if len(a) < 3:
        a.append(x + 1)
result = a
)";
        REQUIRE(Eval(code) == "[1, 2, 3]");
    }

    SECTION("Comprehension variables do not leak") {
        REQUIRE(Eval("x = 'outer'\ny = [x for x in range(3)]\nresult = (x, y)\n") == "('outer', [0, 1, 2])");
        REQUIRE(ErrorOf("y = [k for k in range(2)]\nresult = k\n") == "NameError: name 'k' is not defined");
    }

    SECTION("Nested comprehensions and dict comprehensions") {
        REQUIRE(Eval("result = [i * j for i in range(1, 3) for j in range(1, 3) if i != j]\n") == "[2, 2]");
        REQUIRE(Eval("result = {k: len(k) for k in ['a', 'bb']}\n") == "{'a': 1, 'bb': 2}");
        REQUIRE(Eval("result = sum(x for x in range(4))\n") == "6");
    }

    SECTION("print goes to the output capture") {
        ScriptHarness harness;
        harness.Run("print('a', 1, sep='-')\nprint([1.5, None])\n");
        const auto& lines = harness.Output().GetLines();
        REQUIRE(lines.size() == 2);
        REQUIRE(lines[0].text == "a-1");
        REQUIRE(lines[1].text == "[1.5, None]");
    }

    SECTION("print splits text on newlines") {
        ScriptHarness harness;
        harness.Run("print('a\\nb')\nprint('c', 'd', sep='\\n')\n");
        const auto& lines = harness.Output().GetLines();
        REQUIRE(lines.size() == 4);
        REQUIRE(lines[1].text == "b");
        REQUIRE(lines[3].text == "d");
    }

    SECTION("Slice bounds in augmented assignment are evaluated once") {
        REQUIRE(Eval("bounds = [2, 1]\na = [1, 2, 3]\na[bounds.pop():] += [9]\nresult = (a, bounds)\n") ==
                "([1, 2, 3, 9], [2])");
    }
}

TEST_CASE("Interpreter raises script errors", "[runtime][interpreter][errors]") {

    SECTION("Python error kinds and messages") {
        REQUIRE(ErrorOf("result = 1 / 0\n") == "ZeroDivisionError: division by zero");
        REQUIRE(ErrorOf("result = [1][5]\n") == "IndexError: list index out of range");
        REQUIRE(ErrorOf("result = {}['x']\n") == "KeyError: 'x'");
        REQUIRE(ErrorOf("result = 'a' + 1\n") == "TypeError: can only concatenate str (not \"int\") to str");
        REQUIRE(ErrorOf("result = int('abc')\n") == "ValueError: invalid literal for int() with base 10: 'abc'");
        REQUIRE_THAT(ErrorOf("result = 2 ** 64\n"), Catch::Matchers::StartsWith("OverflowError"));
    }

    SECTION("Unpacking mismatches") {
        REQUIRE(ErrorOf("a, b = [1]\n") == "ValueError: not enough values to unpack (expected 2, got 1)");
        REQUIRE(ErrorOf("a, b = [1, 2, 3]\n") == "ValueError: too many values to unpack (expected 2)");
    }

    SECTION("Tuples are immutable") {
        REQUIRE(ErrorOf("t = (1, 2)\nt[0] = 5\n") == "TypeError: 'tuple' object does not support item assignment");
        REQUIRE(ErrorOf("t = (1, 2)\ndel t[0]\n") == "TypeError: 'tuple' object doesn't support item deletion");
        REQUIRE(ErrorOf("t = (1,)\nt.append(2)\n") == "AttributeError: 'tuple' object has no attribute 'append'");
    }

    SECTION("Extended slice size mismatch") {
        REQUIRE(ErrorOf("a = [0, 1, 2, 3]\na[::2] = [9]\n") ==
                "ValueError: attempt to assign sequence of size 1 to extended slice of size 2");
    }

    SECTION("Dict size change during iteration") {
        REQUIRE(ErrorOf("d = {'a': 1}\nfor k in d:\n    d['b'] = 2\n") ==
                "RuntimeError: dictionary changed size during iteration");
    }

    SECTION("Names bound only on a path not taken") {
        REQUIRE(ErrorOf("if False:\n    y = 1\nresult = y\n") == "NameError: name 'y' is not defined");
    }

    SECTION("Errors are pinned to the innermost statement") {
        ScriptHarness harness;
        try {
            harness.Run("x = 1\nfor i in range(3):\n    y = 1 / (i - 1)\n");
            FAIL("expected a ZeroDivisionError");
        } catch (const ScriptError& e) {
            REQUIRE(e.GetKind() == "ZeroDivisionError");
            REQUIRE(e.GetLine() == 3);
            REQUIRE(e.GetColumn() == 5);
        }
        // State before the failure is kept
        REQUIRE(harness.Repr("y") == "-1.0");
    }
}

TEST_CASE("Interpreter enforces the resource budget", "[runtime][interpreter][budget]") {

    SECTION("Step limit stops long loops") {
        ScriptHarness harness(BudgetLimits{.max_steps = 1000});
        REQUIRE_THROWS_AS(harness.Run("for i in range(1000000):\n    pass\n"), ResourceLimitExceeded);
    }

    SECTION("Nested loops over large ranges") {
        ScriptHarness harness(BudgetLimits{.max_steps = 10000});
        REQUIRE_THROWS_WITH(harness.Run("n = 0\nfor i in range(1000):\n    for j in range(1000):\n        n += 1\n"),
                            "Step limit exceeded (10000 steps)");
    }

    SECTION("Heap limit stops unbounded growth") {
        ScriptHarness harness(BudgetLimits{.max_heap_elements = 100});
        REQUIRE_THROWS_AS(harness.Run("a = []\nfor i in range(1000):\n    a.append(i)\n"), ResourceLimitExceeded);
    }

    SECTION("List repetition is charged up front") {
        ScriptHarness harness(BudgetLimits{.max_heap_elements = 1000});
        REQUIRE_THROWS_AS(harness.Run("a = [0] * 100000\n"), ResourceLimitExceeded);
    }

    SECTION("String size limit") {
        ScriptHarness harness(BudgetLimits{.max_string_length = 10});
        REQUIRE_THROWS_AS(harness.Run("s = 'x' * 100\n"), ResourceLimitExceeded);
    }

    SECTION("Doubling strings hits the limit") {
        ScriptHarness harness(BudgetLimits{.max_string_length = 1000});
        REQUIRE_THROWS_AS(harness.Run("s = 'ab'\nfor i in range(20):\n    s = s + s\n"), ResourceLimitExceeded);
    }

    SECTION("Distinct large strings exhaust string memory") {
        ScriptHarness harness;
        REQUIRE_THROWS_WITH(harness.Run("s = 'a' * 1000000\nl = [s + str(i) for i in range(100)]\n"),
                            "Memory limit exceeded (67108864 bytes of string data)");
    }

    SECTION("Strings shared across a list are stored once") {
        ScriptHarness harness;
        harness.Run("s = 'a' * 1000000\nl = [s] * 600\nn = len(l)\n");
        REQUIRE(harness.Get("n").AsInt() == 600);
        REQUIRE(harness.Budget().GetStringBytes() < 2000000);
    }

    SECTION("Text conversion of shared strings is bounded") {
        const std::string setup = "s = 'a' * 1000000\nl = [s] * 600\n";
        const std::string tooLong = "String too long (more than 1048576 characters)";

        ScriptHarness converting;
        REQUIRE_THROWS_WITH(converting.Run(setup + "t = str(l)\n"), tooLong);

        ScriptHarness printing;
        REQUIRE_THROWS_WITH(printing.Run(setup + "print(l)\n"), tooLong);
        REQUIRE(printing.Output().GetLines().empty());

        ScriptHarness formatting;
        REQUIRE_THROWS_AS(formatting.Run(setup + "t = '{}'.format(l)\n"), ResourceLimitExceeded);
    }

    SECTION("Released strings return their bytes") {
        ScriptHarness harness;
        harness.Run("for i in range(200):\n    s = 'a' * 1000000\n");
        REQUIRE(harness.Budget().GetStringBytes() < 2000000);
    }

    SECTION("Steps are counted") {
        ScriptHarness harness;
        harness.Run("x = 1\n");
        REQUIRE(harness.Budget().GetSteps() > 0);
    }
}
