#include "orchestrator.h"
#include "trace_builder.h"
#include "execution/json_bridge.h"
#include "execution/script_error.h"
#include <signal_lambda/core/constants.h>

#include <format>
#include <spdlog/spdlog.h>

namespace signal_lambda::runtime {

namespace {

// First non-None of `result` and the input name
const Value& ResultOrInput(const ExecutionNamespace& ns, const char* inputName) {
    const Value& result = ns.Get(constants::kResultName);
    return result.IsNone() ? ns.Get(inputName) : result;
}

void FinishTrace(ExecutionTrace& trace, const OutputCapture& output, const std::optional<SandboxError>& error,
                 const ResourceBudget& budget) {
    for (const auto& line : output.GetLines()) {
        trace.AddPrint(line.text, line.record_index);
    }
    if (error) {
        trace.AddError(*error);
    }
    trace.AddStatus(error ? TraceStatusFromErrorKind(error->kind) : TraceStatus::Success,
                    budget.GetElapsed().count(), budget.GetSteps(), output.GetDroppedCount());
}

} // namespace

LambdaOrchestrator::LambdaOrchestrator(SandboxAvailability availability, BudgetLimits limits)
    : m_availability(std::move(availability)), m_limits(limits) {}

ValidationResult LambdaOrchestrator::Validate(std::string_view code) const {
    return m_validator.Validate(code);
}

ApplyOutcome LambdaOrchestrator::Apply(std::string_view code, const SignalBatch& signals) const {
    ApplyOutcome outcome;
    ResourceBudget budget(m_limits);

    if (!m_availability.IsReady()) {
        SPDLOG_WARN("Rejecting lambda apply: sandbox unavailable ({})", m_availability.GetReason());
        outcome.error = SandboxUnavailableError(m_availability.GetReason()).ToError();
        outcome.trace.AddError(*outcome.error);
        outcome.trace.AddStatus(TraceStatus::InternalError, budget.GetElapsed().count(), 0, 0);
        return outcome;
    }

    CompiledLambda program;
    try {
        program = m_validator.Compile(code);
    } catch (const GrammarViolation& e) {
        SPDLOG_WARN("Lambda rejected by grammar validator: {}", e.what());
        outcome.error = e.ToError();
        outcome.trace.AddError(*outcome.error);
        outcome.trace.AddStatus(TraceStatus::ValidationError, budget.GetElapsed().count(), 0, 0);
        return outcome;
    }

    outcome.trace.AddInput(signals.size(), program.mode);

    OutputCapture output;
    RunOutput result;
    std::optional<SandboxError> error = program.mode == ExecutionMode::PerRecord
                                            ? RunPerRecord(program, signals, budget, output, result)
                                            : RunBatch(program, signals, budget, output, result);

    if (error) {
        SPDLOG_WARN("Lambda execution failed ({}): {}", SandboxErrorKindToString(error->kind), error->message);
        FinishTrace(outcome.trace, output, error, budget);
        outcome.error = std::move(error);
        return outcome;
    }

    ResultSummary summary = SummarizeResult(signals, result.records, result.origins);
    outcome.trace.AddResult(result.records.size(), summary.modified_count, std::move(summary.samples));
    FinishTrace(outcome.trace, output, std::nullopt, budget);

    SPDLOG_DEBUG("Lambda applied: {} -> {} signals, {} modified, {} steps", signals.size(), result.records.size(),
                 summary.modified_count, budget.GetSteps());
    outcome.signals = std::move(result.records);
    return outcome;
}

std::optional<SandboxError> LambdaOrchestrator::RunBatch(const CompiledLambda& program, const SignalBatch& signals,
                                                         ResourceBudget& budget, OutputCapture& output,
                                                         RunOutput& result) const {
    ExecutionNamespace ns(budget);
    Heap& heap = ns.GetHeap();

    auto error = Contain([&]() {
        std::vector<Value> records;
        records.reserve(signals.size());
        for (std::size_t i = 0; i < signals.size(); ++i) {
            records.push_back(Value::Dict(RecordToDict(signals[i], i, heap)));
        }
        ConfinementRuntime::Seed(ns, constants::kSignalsName, Value::List(heap.NewList(std::move(records))));
    });
    if (error) {
        return error;
    }

    error = m_runtime.Execute(*program.module, ns, output);
    if (error) {
        return error;
    }

    return Contain([&]() {
        const Value& value = ResultOrInput(ns, constants::kSignalsName);
        if (!value.IsList()) {
            throw TypeError(std::format("result must be a list of signal dicts, got {}", value.TypeName()));
        }
        const auto& items = value.AsList()->items;
        for (std::size_t i = 0; i < items.size(); ++i) {
            if (!items[i].IsDict()) {
                throw TypeError(std::format("result[{}] must be a dict (signal), got {}", i, items[i].TypeName()));
            }
            result.records.push_back(DictToRecord(items[i], budget));
            result.origins.push_back(items[i].AsDict()->origin);
        }
    });
}

std::optional<SandboxError> LambdaOrchestrator::RunPerRecord(const CompiledLambda& program,
                                                             const SignalBatch& signals, ResourceBudget& budget,
                                                             OutputCapture& output, RunOutput& result) const {
    for (std::size_t i = 0; i < signals.size(); ++i) {
        const SignalRecord& original = signals[i];
        const std::optional<std::string> ticker = original.GetTicker();

        // Fresh namespace per record; the budget spans the whole batch
        ExecutionNamespace ns(budget);

        auto error = Contain(
            [&]() {
                ConfinementRuntime::Seed(ns, constants::kSignalName,
                                         Value::Dict(RecordToDict(original, i, ns.GetHeap())));
            },
            i);

        if (!error) {
            error = m_runtime.Execute(*program.module, ns, output, i);
        }

        if (!error) {
            error = Contain(
                [&]() {
                    const Value& value = ResultOrInput(ns, constants::kSignalName);
                    if (!value.IsDict()) {
                        throw TypeError(std::format("Lambda must return a dict (signal), got {}", value.TypeName()));
                    }
                    SignalRecord record = DictToRecord(value, budget);
                    if (original.Contains(constants::kTickerField)) {
                        if (!record.Contains(constants::kTickerField)) {
                            throw ValueError("Result missing required 'ticker' field");
                        }
                        // The ticker identifies the signal and is never rewritten
                        FieldMap fields = record.GetFields();
                        fields.insert_or_assign(constants::kTickerField, *original.Find(constants::kTickerField));
                        record = SignalRecord{std::move(fields)};
                    }
                    result.records.push_back(std::move(record));
                    result.origins.push_back(i);
                },
                i);
        }

        if (error) {
            // Whole-batch policy: one failing record fails the call
            error->ticker = ticker;
            return error;
        }
    }
    return std::nullopt;
}

std::unique_ptr<ILambdaOrchestrator> CreateLambdaOrchestrator(SandboxAvailability availability) {
    return std::make_unique<LambdaOrchestrator>(std::move(availability));
}

} // namespace signal_lambda::runtime
