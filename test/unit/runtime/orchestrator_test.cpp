/**
 * @file orchestrator_test.cpp
 * @brief End-to-end tests for LambdaOrchestrator: modes, failure policy, trace contents
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "common/signal_test_utils.h"
#include "runtime/orchestrator.h"
#include "runtime/trace_builder.h"

#include <thread>

using namespace signal_lambda;
using namespace signal_lambda::runtime;
using namespace signal_lambda::test;

namespace {

LambdaOrchestrator MakeOrchestrator(BudgetLimits limits = {}) {
    return LambdaOrchestrator(SandboxAvailability::Ready(), limits);
}

const TraceEntry& RequireEntry(const ExecutionTrace& trace, std::string_view kind) {
    const TraceEntry* entry = trace.FindFirst(kind);
    REQUIRE(entry != nullptr);
    return *entry;
}

} // namespace

TEST_CASE("Batch lambda filters and transforms signals", "[runtime][orchestrator][batch]") {
    auto orchestrator = MakeOrchestrator();
    const SignalBatch input = ScenarioBatch();

    const char* code = R"(
filtered = [s for s in signals if s['confidence'] > 0.5]
result = [dict(s, value=s['value'] * 2) for s in filtered]
)";
    auto outcome = orchestrator.Apply(code, input);

    REQUIRE(outcome.Succeeded());
    REQUIRE(outcome.signals.has_value());
    REQUIRE(outcome.signals->size() == 1);

    const SignalRecord& aapl = outcome.signals->front();
    REQUIRE(aapl.GetTicker() == "AAPL");
    REQUIRE(NumberField(aapl, "value") == Catch::Approx(1.8));
    REQUIRE(NumberField(aapl, "confidence") == Catch::Approx(0.8));

    SECTION("The caller's batch is never modified") {
        REQUIRE(input == ScenarioBatch());
    }

    SECTION("Trace records input, result and status") {
        const auto& trace = outcome.trace;
        const auto& in = RequireEntry(trace, "input");
        REQUIRE(in.record_count == 2u);
        REQUIRE(in.mode == "batch");

        const auto& result = RequireEntry(trace, "result");
        REQUIRE(result.record_count == 1u);
        REQUIRE(result.modified_count == 1u);
        REQUIRE(result.samples.has_value());
        REQUIRE(result.samples->size() == 1);

        const RecordDiff& diff = result.samples->front();
        REQUIRE(diff.index == 0);
        REQUIRE(diff.source_index == 0u);
        REQUIRE(diff.ticker == "AAPL");
        REQUIRE(diff.changes.size() == 1);
        REQUIRE(diff.changes[0].field == "value");
        REQUIRE(diff.changes[0].before.has_value());
        REQUIRE(diff.changes[0].after.has_value());

        REQUIRE(trace.GetFinalStatus() == "success");
        REQUIRE(trace.FindFirst("error") == nullptr);
    }
}

TEST_CASE("Batch lambda result handling", "[runtime][orchestrator][batch]") {
    auto orchestrator = MakeOrchestrator();

    SECTION("Unset result returns the mutated input") {
        auto outcome = orchestrator.Apply("for s in signals:\n    s['seen'] = True\n", ScenarioBatch());
        REQUIRE(outcome.Succeeded());
        REQUIRE(outcome.signals->size() == 2);
        REQUIRE(BoolField((*outcome.signals)[1], "seen"));
        REQUIRE(RequireEntry(outcome.trace, "result").modified_count == 2u);
    }

    SECTION("Unchanged records are not counted as modified") {
        auto outcome = orchestrator.Apply("result = signals\n", ScenarioBatch());
        REQUIRE(outcome.Succeeded());
        REQUIRE(*outcome.signals == ScenarioBatch());
        REQUIRE(RequireEntry(outcome.trace, "result").modified_count == 0u);
        REQUIRE(RequireEntry(outcome.trace, "result").samples->empty());
    }

    SECTION("New records have no source") {
        auto outcome = orchestrator.Apply("result = signals + [{'ticker': 'NEW', 'value': 1}]\n", ScenarioBatch());
        REQUIRE(outcome.Succeeded());
        REQUIRE(outcome.signals->size() == 3);
        REQUIRE(NumberField((*outcome.signals)[2], "value") == 1.0);

        const auto& result = RequireEntry(outcome.trace, "result");
        REQUIRE(result.modified_count == 1u);
        REQUIRE_FALSE(result.samples->front().source_index.has_value());
        REQUIRE(result.samples->front().changes.size() == 2);
    }

    SECTION("Reordering keeps the link to the source record") {
        auto outcome = orchestrator.Apply(
            "result = [signals[1], signals[0]]\n", ScenarioBatch());
        REQUIRE(outcome.Succeeded());
        REQUIRE(outcome.signals->front().GetTicker() == "MSFT");
        REQUIRE(RequireEntry(outcome.trace, "result").modified_count == 0u);
    }

    SECTION("Result must be a list") {
        auto outcome = orchestrator.Apply("result = 5\n", ScenarioBatch());
        REQUIRE_FALSE(outcome.Succeeded());
        REQUIRE(outcome.error->kind == SandboxErrorKind::RuntimeExecutionError);
        REQUIRE(outcome.error->message == "TypeError: result must be a list of signal dicts, got int");
        REQUIRE_FALSE(outcome.signals.has_value());

        auto tuple = orchestrator.Apply("result = tuple(signals)\n", ScenarioBatch());
        REQUIRE(tuple.error->message == "TypeError: result must be a list of signal dicts, got tuple");
    }

    SECTION("Result items must be dicts") {
        auto outcome = orchestrator.Apply("result = signals + [1]\n", ScenarioBatch());
        REQUIRE_FALSE(outcome.Succeeded());
        REQUIRE(outcome.error->message == "TypeError: result[2] must be a dict (signal), got int");
    }

    SECTION("Result values must be JSON-representable") {
        auto outcome = orchestrator.Apply("result = [{'ticker': 'X', 'v': range(3)}]\n", ScenarioBatch());
        REQUIRE_FALSE(outcome.Succeeded());
        REQUIRE(outcome.error->kind == SandboxErrorKind::RuntimeExecutionError);
    }

    SECTION("Empty batch") {
        auto outcome = orchestrator.Apply("result = signals\n", {});
        REQUIRE(outcome.Succeeded());
        REQUIRE(outcome.signals->empty());
        REQUIRE(RequireEntry(outcome.trace, "input").record_count == 0u);
    }
}

TEST_CASE("Per-record lambda", "[runtime][orchestrator][per_record]") {
    auto orchestrator = MakeOrchestrator();

    SECTION("Each record is transformed in place") {
        auto outcome = orchestrator.Apply("signal['value'] = signal['value'] * 2\n", ScenarioBatch());
        REQUIRE(outcome.Succeeded());
        REQUIRE(outcome.signals->size() == 2);
        REQUIRE(NumberField((*outcome.signals)[0], "value") == Catch::Approx(1.8));
        REQUIRE(NumberField((*outcome.signals)[1], "value") == Catch::Approx(1.0));
        REQUIRE(RequireEntry(outcome.trace, "input").mode == "per_record");
        REQUIRE(RequireEntry(outcome.trace, "result").modified_count == 2u);
    }

    SECTION("result replaces the record") {
        auto outcome = orchestrator.Apply("result = {'ticker': signal['ticker'], 'score': 3}\n", ScenarioBatch());
        REQUIRE(outcome.Succeeded());
        const auto& first = (*outcome.signals)[0];
        REQUIRE(first.Size() == 2);
        REQUIRE(NumberField(first, "score") == 3.0);
    }

    SECTION("The ticker cannot be rewritten") {
        auto outcome = orchestrator.Apply("signal['ticker'] = 'HACKED'\n", ScenarioBatch());
        REQUIRE(outcome.Succeeded());
        REQUIRE((*outcome.signals)[0].GetTicker() == "AAPL");
        REQUIRE((*outcome.signals)[1].GetTicker() == "MSFT");
        REQUIRE(RequireEntry(outcome.trace, "result").modified_count == 0u);
    }

    SECTION("Dropping the ticker fails the call") {
        auto outcome = orchestrator.Apply("del signal['ticker']\n", ScenarioBatch());
        REQUIRE_FALSE(outcome.Succeeded());
        REQUIRE(outcome.error->kind == SandboxErrorKind::RuntimeExecutionError);
        REQUIRE(outcome.error->message == "ValueError: Result missing required 'ticker' field");
        REQUIRE(outcome.error->record_index == 0u);
        REQUIRE(outcome.error->ticker == "AAPL");
    }

    SECTION("Records without a ticker need none in the result") {
        SignalBatch batch{MakeSignal({{"value", Json(1.0)}})};
        auto outcome = orchestrator.Apply("result = {'value': signal['value'] + 1}\n", batch);
        REQUIRE(outcome.Succeeded());
        REQUIRE(NumberField(outcome.signals->front(), "value") == 2.0);
    }

    SECTION("The result must be a dict") {
        auto outcome = orchestrator.Apply("x = signal\nresult = [1]\n", ScenarioBatch());
        REQUIRE_FALSE(outcome.Succeeded());
        REQUIRE(outcome.error->message == "TypeError: Lambda must return a dict (signal), got list");
    }

    SECTION("State does not carry over between records") {
        const char* code = R"(
signal['first'] = result is None
result = signal
)";
        auto outcome = orchestrator.Apply(code, ScenarioBatch());
        REQUIRE(outcome.Succeeded());
        REQUIRE(BoolField((*outcome.signals)[0], "first"));
        REQUIRE(BoolField((*outcome.signals)[1], "first"));
    }

    SECTION("Empty batch never runs the program") {
        auto outcome = orchestrator.Apply("signal['x'] = 1 / 0\n", {});
        REQUIRE(outcome.Succeeded());
        REQUIRE(outcome.signals->empty());
    }
}

TEST_CASE("One failing record fails the whole batch", "[runtime][orchestrator][errors]") {
    auto orchestrator = MakeOrchestrator();

    const char* code = R"(
print(signal['ticker'])
signal['ratio'] = 1 / (signal['value'] - 0.5)
)";
    auto outcome = orchestrator.Apply(code, ScenarioBatch());

    REQUIRE_FALSE(outcome.Succeeded());
    REQUIRE_FALSE(outcome.signals.has_value());

    const SandboxError& error = *outcome.error;
    REQUIRE(error.kind == SandboxErrorKind::RuntimeExecutionError);
    REQUIRE(error.message == "ZeroDivisionError: float division by zero");
    REQUIRE(error.record_index == 1u);
    REQUIRE(error.ticker == "MSFT");
    REQUIRE(error.location.has_value());
    REQUIRE(error.location->line == 3);

    const auto prints = outcome.trace.FindAll("print");
    REQUIRE(prints.size() == 2);
    REQUIRE(prints[0]->text == "AAPL");
    REQUIRE(prints[0]->record_index == 0u);
    REQUIRE(prints[1]->text == "MSFT");

    const auto& entry = RequireEntry(outcome.trace, "error");
    REQUIRE(entry.error_kind == "RuntimeExecutionError");
    REQUIRE(entry.ticker == "MSFT");
    REQUIRE(outcome.trace.FindFirst("result") == nullptr);
    REQUIRE(outcome.trace.GetFinalStatus() == "runtime_error");
}

TEST_CASE("Rejected and unavailable calls", "[runtime][orchestrator][errors]") {

    SECTION("Grammar violations never execute") {
        auto orchestrator = MakeOrchestrator();
        auto outcome = orchestrator.Apply("import os\n", ScenarioBatch());
        REQUIRE_FALSE(outcome.Succeeded());
        REQUIRE(outcome.error->kind == SandboxErrorKind::GrammarViolation);
        REQUIRE(outcome.error->message == "Forbidden operation: import");
        REQUIRE(outcome.trace.FindFirst("input") == nullptr);
        REQUIRE(outcome.trace.GetFinalStatus() == "validation_error");
    }

    SECTION("Code before a violation produces no output") {
        auto orchestrator = MakeOrchestrator();
        auto outcome = orchestrator.Apply("print('x')\nimport os\n", ScenarioBatch());
        REQUIRE(outcome.error->kind == SandboxErrorKind::GrammarViolation);
        REQUIRE(outcome.error->location->line == 2);
        REQUIRE(outcome.trace.FindFirst("print") == nullptr);
        REQUIRE_FALSE(outcome.signals.has_value());
    }

    SECTION("An unavailable sandbox fails closed") {
        LambdaOrchestrator orchestrator(SandboxAvailability::Unavailable("disabled by configuration"));
        auto outcome = orchestrator.Apply("result = signals\n", ScenarioBatch());
        REQUIRE_FALSE(outcome.Succeeded());
        REQUIRE_FALSE(outcome.signals.has_value());
        REQUIRE(outcome.error->kind == SandboxErrorKind::SandboxUnavailable);
        REQUIRE(outcome.error->message == "sandbox unavailable: disabled by configuration");
        REQUIRE(outcome.trace.FindFirst("input") == nullptr);
        REQUIRE(outcome.trace.GetFinalStatus() == "internal_error");
    }

    SECTION("Validate works regardless of the input") {
        auto orchestrator = MakeOrchestrator();
        REQUIRE(orchestrator.Validate("result = signals\n").valid);
        REQUIRE_FALSE(orchestrator.Validate("x = eval('1')\n").valid);
    }

    SECTION("Validate is repeatable") {
        auto orchestrator = MakeOrchestrator();
        for (const char* code : {"result = signals\n", "x = eval('1')\n", "def f(:\n"}) {
            const ValidationResult first = orchestrator.Validate(code);
            REQUIRE(orchestrator.Validate(code) == first);
            REQUIRE(orchestrator.Validate(code) == first);
        }
    }
}

TEST_CASE("The resource budget spans the whole call", "[runtime][orchestrator][budget]") {

    SECTION("Steps across records add up") {
        auto orchestrator = MakeOrchestrator(BudgetLimits{.max_steps = 2000});
        SignalBatch batch;
        for (int i = 0; i < 20; ++i) {
            batch.push_back(MakeSignal({{"ticker", Json("T")}, {"value", Json(static_cast<double>(i))}}));
        }
        auto outcome = orchestrator.Apply("for i in range(50):\n    signal['value'] += 1\n", batch);
        REQUIRE_FALSE(outcome.Succeeded());
        REQUIRE(outcome.error->kind == SandboxErrorKind::ResourceLimitExceeded);
        REQUIRE(outcome.error->record_index.has_value());
        REQUIRE(*outcome.error->record_index > 0);
        REQUIRE(outcome.trace.GetFinalStatus() == "resource_error");
    }

    SECTION("Per-record namespaces release their heap") {
        auto orchestrator = MakeOrchestrator(BudgetLimits{.max_heap_elements = 500});
        SignalBatch batch(50, MakeSignal({{"ticker", Json("T")}}));
        auto outcome = orchestrator.Apply("signal['bucket'] = list(range(20))\n", batch);
        REQUIRE(outcome.Succeeded());
    }

    SECTION("Runaway loops end in a resource error") {
        auto orchestrator = MakeOrchestrator(BudgetLimits{.max_steps = 10000});
        auto outcome = orchestrator.Apply("x = 0\nfor i in range(10 ** 9):\n    x += i\n", ScenarioBatch());
        REQUIRE(outcome.error->kind == SandboxErrorKind::ResourceLimitExceeded);
        REQUIRE(outcome.error->message == "Step limit exceeded (10000 steps)");
    }

    SECTION("Slow programs end at the wall-clock limit") {
        auto orchestrator = MakeOrchestrator(
            BudgetLimits{.max_steps = 1'000'000'000'000, .timeout = std::chrono::milliseconds{50}});
        auto outcome = orchestrator.Apply("x = 0\nfor i in range(10 ** 12):\n    x += i\n", ScenarioBatch());
        REQUIRE(outcome.error->kind == SandboxErrorKind::ResourceLimitExceeded);
        REQUIRE(outcome.error->message == "Execution timed out after 50 ms");
        REQUIRE(outcome.trace.GetFinalStatus() == "resource_error");
    }

    SECTION("Distinct large strings exhaust string memory") {
        auto orchestrator = MakeOrchestrator();
        auto outcome = orchestrator.Apply(
            "s = 'a' * 1000000\nparts = [s + str(i) for i in range(100)]\nresult = signals\n", ScenarioBatch());
        REQUIRE(outcome.error->kind == SandboxErrorKind::ResourceLimitExceeded);
        REQUIRE(outcome.error->message == "Memory limit exceeded (67108864 bytes of string data)");
    }

    SECTION("Results that share large strings cannot inflate the output") {
        auto orchestrator = MakeOrchestrator();
        auto outcome = orchestrator.Apply(
            "s = 'a' * 1000000\nresult = [{'ticker': 'A', 'x': [s] * 100}] + signals\n", ScenarioBatch());
        REQUIRE(outcome.error->kind == SandboxErrorKind::ResourceLimitExceeded);
        REQUIRE(outcome.error->message == "Result too large (more than 67108864 bytes of string data)");
    }

    SECTION("Nested shared lists cannot inflate the output") {
        auto orchestrator = MakeOrchestrator();
        auto outcome = orchestrator.Apply(
            "a = [0] * 100\nb = [a] * 100\nc = [b] * 100\nresult = [{'ticker': 'A', 'x': c}] + signals\n",
            ScenarioBatch());
        REQUIRE(outcome.error->kind == SandboxErrorKind::ResourceLimitExceeded);
        REQUIRE_FALSE(outcome.signals.has_value());
    }

    SECTION("Output beyond the line limit is counted") {
        auto orchestrator = MakeOrchestrator();
        auto outcome = orchestrator.Apply("for i in range(150):\n    print(i)\nresult = signals\n", ScenarioBatch());
        REQUIRE(outcome.Succeeded());
        REQUIRE(outcome.trace.FindAll("print").size() == constants::kMaxOutputLines);
        REQUIRE(outcome.trace.GetEntries().back().dropped_output_lines == 50u);
    }
}

TEST_CASE("Concurrent calls are isolated", "[runtime][orchestrator][concurrency]") {
    auto orchestrator = MakeOrchestrator();
    constexpr int kThreads = 8;

    std::vector<ApplyOutcome> outcomes(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&orchestrator, &outcomes, t]() {
            SignalBatch batch{MakeSignal({{"ticker", Json("T")}, {"value", Json(static_cast<double>(t))}})};
            outcomes[t] = orchestrator.Apply("signal['value'] = signal['value'] * 10\nprint(signal['value'])\n",
                                             batch);
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (int t = 0; t < kThreads; ++t) {
        REQUIRE(outcomes[t].Succeeded());
        REQUIRE(NumberField(outcomes[t].signals->front(), "value") == t * 10.0);
        const auto prints = outcomes[t].trace.FindAll("print");
        REQUIRE(prints.size() == 1);
        REQUIRE(prints[0]->text == std::to_string(t * 10));
    }
}

TEST_CASE("Result summaries", "[runtime][trace_builder]") {

    SECTION("DiffRecords reports added, removed and changed fields in name order") {
        auto before = MakeSignal({{"a", Json(1.0)}, {"b", Json(2.0)}, {"c", Json(3.0)}});
        auto after = MakeSignal({{"b", Json(5.0)}, {"c", Json(3.0)}, {"d", Json(true)}});
        auto changes = DiffRecords(before, after, 20);

        REQUIRE(changes.size() == 3);
        REQUIRE(changes[0].field == "a");
        REQUIRE_FALSE(changes[0].after.has_value());
        REQUIRE(changes[1].field == "b");
        REQUIRE(changes[1].before.has_value());
        REQUIRE(changes[1].after.has_value());
        REQUIRE(changes[2].field == "d");
        REQUIRE_FALSE(changes[2].before.has_value());
    }

    SECTION("DiffRecords stops at the field cap") {
        auto after = MakeSignal({{"a", Json(1.0)}, {"b", Json(1.0)}, {"c", Json(1.0)}});
        REQUIRE(DiffRecords(SignalRecord{}, after, 2).size() == 2);
    }

    SECTION("Samples are capped but every modification is counted") {
        SignalBatch input(10, MakeSignal({{"ticker", Json("T")}, {"v", Json(1.0)}}));
        SignalBatch output(10, MakeSignal({{"ticker", Json("T")}, {"v", Json(2.0)}}));
        std::vector<std::optional<std::size_t>> origins;
        for (std::size_t i = 0; i < 10; ++i) {
            origins.emplace_back(i);
        }
        auto summary = SummarizeResult(input, output, origins);
        REQUIRE(summary.modified_count == 10);
        REQUIRE(summary.samples.size() == constants::kMaxSampleDiffs);
        REQUIRE(summary.samples[4].index == 4);
    }
}
