#pragma once

#include <signal_lambda/compiler/grammar_validator.h>
#include <signal_lambda/core/execution_trace.h>
#include <signal_lambda/core/sandbox_error.h>
#include <signal_lambda/core/signal_record.h>
#include <signal_lambda/runtime/availability.h>
#include <memory>
#include <optional>
#include <string_view>

namespace signal_lambda::runtime {

struct ApplyOutcome {
    std::optional<SignalBatch> signals;  // withheld on any failure
    ExecutionTrace trace;
    std::optional<SandboxError> error;

    [[nodiscard]] bool Succeeded() const noexcept { return !error.has_value(); }
};

struct ILambdaOrchestrator {
    using Ptr = std::unique_ptr<ILambdaOrchestrator>;

    virtual ValidationResult Validate(std::string_view code) const = 0;

    // Never throws for anything the code or the batch can cause
    virtual ApplyOutcome Apply(std::string_view code, const SignalBatch& signals) const = 0;

    virtual const SandboxAvailability& GetAvailability() const = 0;

    virtual ~ILambdaOrchestrator() = default;
};

std::unique_ptr<ILambdaOrchestrator> CreateLambdaOrchestrator(SandboxAvailability availability);

} // namespace signal_lambda::runtime
