#include <catch2/catch_test_macros.hpp>
#include "runtime/execution/script_error.h"
#include "runtime/execution/value_ops.h"

#include <cmath>
#include <limits>

using namespace signal_lambda;
using namespace signal_lambda::runtime;

TEST_CASE("Truthiness", "[runtime][values]") {
    ResourceBudget budget;
    Heap heap(budget);

    REQUIRE_FALSE(Truthy(Value::None()));
    REQUIRE_FALSE(Truthy(Value::Int(0)));
    REQUIRE_FALSE(Truthy(Value::Float(0.0)));
    REQUIRE_FALSE(Truthy(Value::Str("")));
    REQUIRE_FALSE(Truthy(Value::List(heap.NewList())));
    REQUIRE_FALSE(Truthy(Value::Dict(heap.NewDict())));
    REQUIRE_FALSE(Truthy(Value::Range(RangeValue{0, 0, 1})));

    REQUIRE(Truthy(Value::Int(-1)));
    REQUIRE(Truthy(Value::Str("0")));
    REQUIRE(Truthy(Value::List(heap.NewList({Value::None()}))));
    REQUIRE(Truthy(Value::Float(std::numeric_limits<double>::quiet_NaN())));
}

TEST_CASE("Equality and ordering", "[runtime][values]") {
    ResourceBudget budget;
    Heap heap(budget);

    SECTION("Numbers compare across int, float and bool") {
        REQUIRE(Equals(Value::Int(1), Value::Float(1.0)));
        REQUIRE(Equals(Value::Bool(true), Value::Int(1)));
        REQUIRE_FALSE(Equals(Value::Int(1), Value::Str("1")));
        REQUIRE(runtime::Compare(BinOpType::Lt, Value::Int(1), Value::Float(1.5)));
        REQUIRE_FALSE(Equals(Value::Float(std::nan("")), Value::Float(std::nan(""))));
    }

    SECTION("Sequences compare element-wise") {
        auto a = Value::List(heap.NewList({Value::Int(1), Value::Int(2)}));
        auto b = Value::List(heap.NewList({Value::Int(1), Value::Int(3)}));
        REQUIRE(runtime::Compare(BinOpType::Lt, a, b));
        REQUIRE_FALSE(Equals(a, Value::List(heap.NewTuple({Value::Int(1), Value::Int(2)}))));
    }

    SECTION("Mixed types cannot be ordered") {
        REQUIRE_THROWS_WITH(runtime::Compare(BinOpType::Lt, Value::Int(1), Value::Str("a")),
                            "TypeError: '<' not supported between instances of 'int' and 'str'");
    }

    SECTION("Identity") {
        auto list = Value::List(heap.NewList());
        REQUIRE(runtime::Compare(BinOpType::Is, list, list));
        REQUIRE_FALSE(runtime::Compare(BinOpType::Is, list, Value::List(heap.NewList())));
        REQUIRE(runtime::Compare(BinOpType::Is, Value::None(), Value::None()));
        REQUIRE(runtime::Compare(BinOpType::IsNot, Value::Int(0), Value::None()));
    }

    SECTION("Membership") {
        auto dict = heap.NewDict();
        dict->Set(DictKey{std::string{"ticker"}}, Value::Str("ticker"), Value::Str("AAPL"));
        REQUIRE(Contains(Value::Dict(dict), Value::Str("ticker")));
        REQUIRE_FALSE(Contains(Value::Dict(dict), Value::Str("AAPL")));
        REQUIRE(Contains(Value::Str("signal"), Value::Str("gna")));
        REQUIRE(Contains(Value::Range(RangeValue{0, 10, 2}), Value::Int(4)));
        REQUIRE_FALSE(Contains(Value::Range(RangeValue{0, 10, 2}), Value::Int(5)));
        REQUIRE_THROWS_AS(Contains(Value::Int(1), Value::Int(1)), ScriptError);
    }
}

TEST_CASE("Arithmetic", "[runtime][values]") {
    ResourceBudget budget;
    Heap heap(budget);

    auto op = [&heap](BinOpType type, const Value& a, const Value& b) { return BinaryOp(type, a, b, heap); };

    SECTION("Python division semantics") {
        REQUIRE(op(BinOpType::Div, Value::Int(7), Value::Int(2)).AsFloat() == 3.5);
        REQUIRE(op(BinOpType::FloorDiv, Value::Int(-7), Value::Int(2)).AsInt() == -4);
        REQUIRE(op(BinOpType::Mod, Value::Int(-7), Value::Int(3)).AsInt() == 2);
        REQUIRE(op(BinOpType::Mod, Value::Float(-7.0), Value::Float(3.0)).AsFloat() == 2.0);
        REQUIRE(op(BinOpType::Pow, Value::Int(2), Value::Int(-1)).AsFloat() == 0.5);
        REQUIRE(op(BinOpType::Pow, Value::Int(2), Value::Int(10)).AsInt() == 1024);
    }

    SECTION("Division by zero") {
        REQUIRE_THROWS_WITH(op(BinOpType::Div, Value::Int(1), Value::Int(0)), "ZeroDivisionError: division by zero");
        REQUIRE_THROWS_WITH(op(BinOpType::Div, Value::Float(1.0), Value::Int(0)),
                            "ZeroDivisionError: float division by zero");
        REQUIRE_THROWS_WITH(op(BinOpType::Mod, Value::Int(1), Value::Int(0)),
                            "ZeroDivisionError: integer division or modulo by zero");
    }

    SECTION("Integer overflow is an error, not wraparound") {
        auto max = Value::Int(std::numeric_limits<std::int64_t>::max());
        REQUIRE_THROWS_AS(op(BinOpType::Add, max, Value::Int(1)), ScriptError);
        REQUIRE_THROWS_AS(op(BinOpType::Pow, Value::Int(10), Value::Int(30)), ScriptError);
    }

    SECTION("Concatenation and repetition") {
        REQUIRE(op(BinOpType::Add, Value::Str("ab"), Value::Str("cd")).AsStr() == "abcd");
        REQUIRE(op(BinOpType::Mult, Value::Str("ab"), Value::Int(3)).AsStr() == "ababab");
        REQUIRE(op(BinOpType::Mult, Value::Str("ab"), Value::Int(-1)).AsStr().empty());
        auto list = op(BinOpType::Add, Value::List(heap.NewList({Value::Int(1)})),
                       Value::List(heap.NewList({Value::Int(2)})));
        REQUIRE(Repr(list) == "[1, 2]");
        REQUIRE_THROWS_WITH(op(BinOpType::Add, Value::Str("a"), Value::Int(1)),
                            "TypeError: can only concatenate str (not \"int\") to str");
    }

    SECTION("Unsupported operands") {
        REQUIRE_THROWS_WITH(op(BinOpType::Sub, Value::Str("a"), Value::Str("b")),
                            "TypeError: unsupported operand type(s) for -: 'str' and 'str'");
        REQUIRE_THROWS_WITH(runtime::UnaryOp(UnaryOpType::USub, Value::Str("a")),
                            "TypeError: bad operand type for unary -: 'str'");
    }
}

TEST_CASE("Indexing and slicing", "[runtime][values]") {
    ResourceBudget budget;
    Heap heap(budget);
    auto list = Value::List(heap.NewList({Value::Int(0), Value::Int(1), Value::Int(2), Value::Int(3)}));

    REQUIRE(GetItem(list, Value::Int(-1)).AsInt() == 3);
    REQUIRE_THROWS_WITH(GetItem(list, Value::Int(4)), "IndexError: list index out of range");
    REQUIRE_THROWS_WITH(GetItem(list, Value::Str("a")),
                        "TypeError: list indices must be integers or slices, not str");
    REQUIRE(GetItem(Value::Str("abc"), Value::Int(1)).AsStr() == "b");

    REQUIRE(Repr(GetSlice(list, 1, std::nullopt, std::nullopt, heap)) == "[1, 2, 3]");
    REQUIRE(Repr(GetSlice(list, std::nullopt, std::nullopt, -1, heap)) == "[3, 2, 1, 0]");
    REQUIRE(Repr(GetSlice(list, -10, 10, 2, heap)) == "[0, 2]");
    REQUIRE(GetSlice(Value::Str("signal"), 1, 4, std::nullopt, heap).AsStr() == "ign");
    REQUIRE_THROWS_WITH(GetSlice(list, std::nullopt, std::nullopt, 0, heap), "ValueError: slice step cannot be zero");

    auto bounds = ResolveSlice(std::nullopt, std::nullopt, -2, 5);
    REQUIRE(bounds.start == 4);
    REQUIRE(bounds.length == 3);

    SECTION("Missing dict keys") {
        auto* dict = heap.NewDict();
        REQUIRE_THROWS_WITH(GetItem(Value::Dict(dict), Value::Str("x")), "KeyError: 'x'");
        REQUIRE_THROWS_WITH(GetItem(Value::Dict(dict), Value::List(heap.NewList())),
                            "TypeError: unhashable type: 'list'");
    }
}

TEST_CASE("Text conversion", "[runtime][values]") {
    ResourceBudget budget;
    Heap heap(budget);

    SECTION("Floats print like Python") {
        REQUIRE(FormatFloat(1.0) == "1.0");
        REQUIRE(FormatFloat(0.1) == "0.1");
        REQUIRE(FormatFloat(1.8) == "1.8");
        REQUIRE(FormatFloat(-2.5) == "-2.5");
        REQUIRE(FormatFloat(1e16) == "1e+16");
        REQUIRE(FormatFloat(1.5e-5) == "1.5e-05");
        REQUIRE(FormatFloat(std::numeric_limits<double>::infinity()) == "inf");
        REQUIRE(FormatFloat(std::nan("")) == "nan");
    }

    SECTION("repr and str") {
        auto* dict = heap.NewDict();
        dict->Set(DictKey{std::string{"a"}}, Value::Str("a"), Value::List(heap.NewTuple({Value::Int(1)})));
        dict->Set(DictKey{std::int64_t{2}}, Value::Int(2), Value::None());
        REQUIRE(Repr(Value::Dict(dict)) == "{'a': (1,), 2: None}");
        REQUIRE(Repr(Value::Str("it's")) == "\"it's\"");
        REQUIRE(Repr(Value::Str("a\nb")) == "'a\\nb'");
        REQUIRE(ToStr(Value::Str("plain")) == "plain");
        REQUIRE(ToStr(Value::Bool(true)) == "True");
        REQUIRE(Repr(Value::Range(RangeValue{0, 5, 1})) == "range(0, 5)");
    }

    SECTION("Self-referencing containers") {
        auto* list = heap.NewList();
        list->items.push_back(Value::List(list));
        REQUIRE(Repr(Value::List(list)) == "[[...]]");
    }
}

TEST_CASE("Dict keys are normalized", "[runtime][values]") {
    ResourceBudget budget;
    Heap heap(budget);
    auto* dict = heap.NewDict();

    REQUIRE(dict->Set(MakeDictKey(Value::Int(1)), Value::Int(1), Value::Str("int")));
    REQUIRE_FALSE(dict->Set(MakeDictKey(Value::Bool(true)), Value::Bool(true), Value::Str("bool")));
    REQUIRE_FALSE(dict->Set(MakeDictKey(Value::Float(1.0)), Value::Float(1.0), Value::Str("float")));
    REQUIRE(dict->Size() == 1);
    // The first key object is kept, the value is replaced
    REQUIRE(Repr(Value::Dict(dict)) == "{1: 'float'}");
    REQUIRE_THROWS_AS(MakeDictKey(Value::Dict(heap.NewDict())), ScriptError);
}
