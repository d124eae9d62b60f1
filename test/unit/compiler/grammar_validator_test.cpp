#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <signal_lambda/compiler/grammar_validator.h>
#include <signal_lambda/core/constants.h>

using namespace signal_lambda;

namespace {

std::string RejectionOf(std::string_view code) {
    GrammarValidator validator;
    auto result = validator.Validate(code);
    REQUIRE_FALSE(result.valid);
    REQUIRE(result.error.has_value());
    return result.error->message;
}

} // namespace

TEST_CASE("GrammarValidator accepts the lambda language", "[compiler][validator]") {
    GrammarValidator validator;

    SECTION("Batch filter and transform") {
        const char* code = R"(
filtered = [s for s in signals if s.get('confidence', 0) > 0.5]
result = [dict(s, value=s['value'] * 2) for s in filtered]
)";
        auto result = validator.Validate(code);
        REQUIRE(result.valid);
        REQUIRE_FALSE(result.error.has_value());
    }

    SECTION("Per-record mutation with math and string methods") {
        const char* code = R"(
signal['score'] = round(math.sqrt(abs(signal['value'])), 3)
signal['label'] = 'BUY' if signal['score'] > 0.5 else 'HOLD'
signal['note'] = '{}: {:.2f}'.format(signal['ticker'].upper(), math.pi)
)";
        REQUIRE(validator.Validate(code).valid);
    }

    SECTION("map and filter take builtins by name") {
        REQUIRE(validator.Validate("result = list(map(str, [1, 2]))\n").valid);
        REQUIRE(validator.Validate("result = filter(None, signals)\n").valid);
        REQUIRE(validator.Validate("result = filter(bool, [s['value'] for s in signals])\n").valid);
    }

    SECTION("Loops with break and continue, del and tuple unpacking") {
        const char* code = R"(
ranked = sorted(signals, reverse=True) if False else signals
for i, s in enumerate(ranked):
    if i > 10:
        break
    if 'debug' in s:
        del s['debug']
        continue
    print(i, s['ticker'])
)";
        REQUIRE(validator.Validate(code).valid);
    }
}

TEST_CASE("GrammarValidator determines the execution mode", "[compiler][validator][mode]") {
    GrammarValidator validator;

    REQUIRE(validator.Compile("result = signals\n").mode == ExecutionMode::Batch);
    REQUIRE(validator.Compile("signal['x'] = 1\n").mode == ExecutionMode::PerRecord);
    REQUIRE(validator.Compile("x = signal\n").mode == ExecutionMode::PerRecord);
    // Neither name: the program runs once over the batch
    REQUIRE(validator.Compile("result = []\n").mode == ExecutionMode::Batch);

    SECTION("Referencing both names is rejected at the later use") {
        GrammarValidator v;
        auto result = v.Validate("x = signals\ny = signal\n");
        REQUIRE_FALSE(result.valid);
        REQUIRE_THAT(result.error->message, Catch::Matchers::ContainsSubstring("not both"));
        REQUIRE(result.error->line == 2);
    }
}

TEST_CASE("GrammarValidator rejects forbidden names and attributes", "[compiler][validator][security]") {

    SECTION("Denied builtins") {
        REQUIRE(RejectionOf("x = eval('1')\n") == "Forbidden function: eval");
        REQUIRE(RejectionOf("x = compile\n") == "Forbidden name: compile");
        REQUIRE(RejectionOf("x = open('/etc/passwd')\n") == "Forbidden function: open");
        REQUIRE(RejectionOf("x = getattr(signals, 'x')\n") == "Forbidden function: getattr");
        REQUIRE(RejectionOf("x = type(signals)\n") == "Forbidden function: type");
    }

    SECTION("Dunder names and attributes") {
        REQUIRE(RejectionOf("x = __builtins__\n") == "Forbidden name: __builtins__");
        REQUIRE(RejectionOf("x = signals.__class__\n") == "Forbidden attribute access: __class__");
        REQUIRE(RejectionOf("x = ''.__class__.__mro__\n") == "Forbidden attribute access: __mro__");
        REQUIRE(RejectionOf("x = signals._private\n") == "Forbidden attribute access: _private");
    }

    SECTION("Module-like names") {
        REQUIRE(RejectionOf("x = os\n") == "Forbidden name: os");
        REQUIRE(RejectionOf("x = sys.modules\n") == "Forbidden name: sys");
    }

    SECTION("Predefined names cannot be rebound") {
        REQUIRE(RejectionOf("len = 1\n") == "Cannot assign to predefined name: len");
        REQUIRE(RejectionOf("math = 1\n") == "Cannot assign to predefined name: math");
    }

    SECTION("Builtins and math must be used directly") {
        REQUIRE(RejectionOf("f = len\n") == "Builtin 'len' can only be called directly");
        REQUIRE(RejectionOf("x = map([1], len)\n") == "Builtin 'len' can only be called directly");
        REQUIRE(RejectionOf("x = map(eval, ['1'])\n") == "Forbidden name: eval");
        REQUIRE(RejectionOf("m = math\n") == "'math' can only be used as math.<name>");
        REQUIRE(RejectionOf("f = math.sqrt\n") == "Math function 'math.sqrt' can only be called directly");
        REQUIRE(RejectionOf("x = math.pi()\n") == "'math.pi' is not callable");
        REQUIRE(RejectionOf("x = math.system\n") == "Unknown math member: math.system");
        REQUIRE(RejectionOf("f = signals.append\n") == "Method 'append' can only be called directly");
    }

    SECTION("Unknown attributes and call targets") {
        REQUIRE(RejectionOf("x = signals.mro()\n") == "Unsupported attribute: mro");
        REQUIRE(RejectionOf("x = signals[0](1)\n") == "Only builtins and methods can be called");
        REQUIRE(RejectionOf("x = 1\ny = x()\n") == "'x' is not callable");
        REQUIRE(RejectionOf("x = Decimal('1.5')\n") == "'Decimal' is not callable");
        REQUIRE(RejectionOf("signals.x = 1\n") == "Attribute assignment is not allowed: x");
    }

    SECTION("Forbidden keyword arguments") {
        REQUIRE(RejectionOf("x = dict(__class__=1)\n") == "Forbidden keyword argument: __class__");
    }

    SECTION("Only subscripts can be deleted") {
        REQUIRE(RejectionOf("x = 1\ndel x\n") == "Only subscripts can be deleted (del x[key])");
    }
}

TEST_CASE("GrammarValidator reports unknown identifiers", "[compiler][validator]") {
    GrammarValidator validator;

    SECTION("With a suggestion for near misses") {
        auto result = validator.Validate("result = signalz\n");
        REQUIRE_FALSE(result.valid);
        REQUIRE(result.error->message == "Unknown identifier: signalz (did you mean 'signals'?)");
        REQUIRE(result.error->line == 1);
        REQUIRE(result.error->column == 10);
    }

    SECTION("Without one when nothing is close") {
        REQUIRE(RejectionOf("result = completely_unrelated\n") == "Unknown identifier: completely_unrelated");
    }

    SECTION("Names bound anywhere in the program are known") {
        // Binding after use is a runtime NameError, not a grammar violation
        REQUIRE(validator.Validate("if False:\n    y = 1\nresult = y\n").valid);
        REQUIRE(validator.Validate("for k in []:\n    pass\nresult = k\n").valid);
    }
}

TEST_CASE("GrammarValidator bounds the code size", "[compiler][validator]") {
    GrammarValidator validator;

    SECTION("Empty and blank code") {
        REQUIRE(RejectionOf("") == "Empty code provided");
        REQUIRE(RejectionOf("  \n\t\n") == "Empty code provided");
    }

    SECTION("Code over the length limit") {
        std::string code = "x = 1\n";
        code.resize(constants::kMaxCodeLength + 1, ' ');
        REQUIRE_THAT(RejectionOf(code), Catch::Matchers::StartsWith("Code too long"));
    }

    SECTION("Code at the length limit") {
        std::string code = "x = 1\n";
        code.resize(constants::kMaxCodeLength, '\n');
        REQUIRE(validator.Validate(code).valid);
    }

    SECTION("Compile throws where Validate reports") {
        REQUIRE_THROWS_AS(validator.Compile("import os\n"), GrammarViolation);
    }
}
