#pragma once
//
// LambdaOrchestrator - runs one lambda over one signal batch
//
// Each Apply() call owns everything it touches: the compiled program, the
// namespaces and their heaps, the output capture and the resource budget. Only
// the immutable SandboxAvailability is shared, so concurrent calls need no
// locking.
//

#include "confinement_runtime.h"
#include "execution/resource_budget.h"
#include <signal_lambda/runtime/iorchestrator.h>

#include <cstddef>
#include <optional>
#include <vector>

namespace signal_lambda::runtime {

class LambdaOrchestrator final : public ILambdaOrchestrator {
public:
    // Limits are fixed per process; tests pass tighter ones
    explicit LambdaOrchestrator(SandboxAvailability availability, BudgetLimits limits = {});

    ValidationResult Validate(std::string_view code) const override;

    ApplyOutcome Apply(std::string_view code, const SignalBatch& signals) const override;

    const SandboxAvailability& GetAvailability() const override { return m_availability; }

private:
    SandboxAvailability m_availability;
    BudgetLimits m_limits;
    GrammarValidator m_validator;
    ConfinementRuntime m_runtime;

    struct RunOutput {
        SignalBatch records;
        std::vector<std::optional<std::size_t>> origins;
    };

    std::optional<SandboxError> RunBatch(const CompiledLambda& program, const SignalBatch& signals,
                                         ResourceBudget& budget, OutputCapture& output, RunOutput& result) const;

    std::optional<SandboxError> RunPerRecord(const CompiledLambda& program, const SignalBatch& signals,
                                             ResourceBudget& budget, OutputCapture& output,
                                             RunOutput& result) const;
};

} // namespace signal_lambda::runtime
