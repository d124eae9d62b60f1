#include <catch2/catch_test_macros.hpp>
#include "runtime/execution/heap.h"
#include "runtime/execution/resource_budget.h"

#include <thread>

using namespace signal_lambda;
using namespace signal_lambda::runtime;

TEST_CASE("ResourceBudget step limit", "[runtime][budget]") {
    ResourceBudget budget(BudgetLimits{.max_steps = 10});

    budget.Tick(10);
    REQUIRE(budget.GetSteps() == 10);
    REQUIRE_THROWS_AS(budget.Tick(), ResourceLimitExceeded);
    REQUIRE_THROWS_WITH(budget.Tick(), "Step limit exceeded (10 steps)");
}

TEST_CASE("ResourceBudget deadline", "[runtime][budget]") {
    ResourceBudget budget(BudgetLimits{.timeout = std::chrono::milliseconds{1}});
    std::this_thread::sleep_for(std::chrono::milliseconds{5});

    REQUIRE_THROWS_WITH(budget.CheckDeadline(), "Execution timed out after 1 ms");

    SECTION("Ticks check the deadline periodically") {
        ResourceBudget ticking(BudgetLimits{.timeout = std::chrono::milliseconds{1}});
        std::this_thread::sleep_for(std::chrono::milliseconds{5});
        REQUIRE_THROWS_AS(ticking.Tick(constants::kDeadlineCheckInterval), ResourceLimitExceeded);
    }
}

TEST_CASE("ResourceBudget heap accounting", "[runtime][budget]") {
    ResourceBudget budget(BudgetLimits{.max_heap_elements = 100});

    SECTION("Charges accumulate up to the limit") {
        budget.ChargeElements(60);
        budget.ChargeElements(40);
        REQUIRE(budget.GetHeapElements() == 100);
        REQUIRE_THROWS_WITH(budget.ChargeElements(1), "Memory limit exceeded (100 container elements)");
        REQUIRE(budget.GetHeapElements() == 100);
    }

    SECTION("Releases never underflow") {
        budget.ChargeElements(10);
        budget.ReleaseElements(25);
        REQUIRE(budget.GetHeapElements() == 0);
    }

    SECTION("A destroyed heap returns what it charged") {
        {
            Heap heap(budget);
            heap.NewList({Value::Int(1), Value::Int(2), Value::Int(3)});
            REQUIRE(budget.GetHeapElements() >= 3);
        }
        REQUIRE(budget.GetHeapElements() == 0);
    }
}

TEST_CASE("ResourceBudget string length", "[runtime][budget]") {
    ResourceBudget budget(BudgetLimits{.max_string_length = 8});
    REQUIRE_NOTHROW(budget.CheckStringLength(8));
    REQUIRE_THROWS_WITH(budget.CheckStringLength(9), "String too long (9 characters, limit 8)");
}

TEST_CASE("ResourceBudget string data", "[runtime][budget]") {
    ResourceBudget budget(BudgetLimits{.max_string_length = 8, .max_string_bytes = 20});

    SECTION("Live strings are charged until released") {
        Heap heap(budget);
        {
            Value first = heap.NewStr("abcdefgh");
            Value second = heap.NewStr("abcdefgh");
            REQUIRE(budget.GetStringBytes() == 16);
            REQUIRE_THROWS_WITH(heap.NewStr("abcdefgh"), "Memory limit exceeded (20 bytes of string data)");

            // Copies share the text
            Value copy = first;
            REQUIRE(budget.GetStringBytes() == 16);
        }
        REQUIRE(budget.GetStringBytes() == 0);
        REQUIRE_NOTHROW(heap.NewStr("abcdefgh"));
    }

    SECTION("Over-long strings are rejected before they are charged") {
        Heap heap(budget);
        REQUIRE_THROWS_WITH(heap.NewStr("abcdefghi"), "String too long (9 characters, limit 8)");
        REQUIRE(budget.GetStringBytes() == 0);
    }

    SECTION("Output copied out is bounded") {
        budget.ChargeOutput(15);
        REQUIRE_THROWS_WITH(budget.ChargeOutput(6), "Result too large (more than 20 bytes of string data)");
    }
}

TEST_CASE("ResourceBudget output nodes", "[runtime][budget]") {
    ResourceBudget budget(BudgetLimits{.max_heap_elements = 3});
    budget.ChargeOutput(0);
    budget.ChargeOutput(0);
    budget.ChargeOutput(0);
    REQUIRE_THROWS_WITH(budget.ChargeOutput(0), "Result too large (4 values, limit 3)");
}

TEST_CASE("Heap write guards", "[runtime][heap]") {
    ResourceBudget budget;
    Heap heap(budget);
    Heap other(budget);

    auto* list = heap.NewList();
    auto* tuple = heap.NewTuple({Value::Int(1)});
    auto* foreign = other.NewDict();

    REQUIRE(heap.Owns(*list));
    REQUIRE_FALSE(heap.Owns(*foreign));
    REQUIRE_NOTHROW(heap.GuardWrite(*list));
    REQUIRE_THROWS_WITH(heap.GuardWrite(*tuple), "TypeError: 'tuple' object does not support item assignment");
    REQUIRE_THROWS_AS(heap.GuardWrite(*foreign), std::logic_error);
}
