#pragma once
//
// ConfinementRuntime - the boundary around the interpreter
//
// Runs one validated program inside a prepared ExecutionNamespace. Whatever the
// program does, nothing but a SandboxError value leaves Execute(): script errors
// become RuntimeExecutionError, budget overruns ResourceLimitExceeded, and any
// host exception an opaque InternalError.
//

#include "execution/execution_namespace.h"
#include "execution/output_capture.h"
#include "execution/value.h"
#include <signal_lambda/core/sandbox_error.h>
#include "../compiler/parser/ast_nodes.h"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace signal_lambda::runtime {

class ConfinementRuntime {
public:
    // Binds the input under `inputName` and `result` to None
    static void Seed(ExecutionNamespace& ns, const std::string& inputName, Value input);

    // recordIndex tags print() output and errors in per-record mode
    [[nodiscard]] std::optional<SandboxError> Execute(const Module& program, ExecutionNamespace& ns,
                                                      OutputCapture& output,
                                                      std::optional<std::size_t> recordIndex = std::nullopt) const;
};

// Runs host-side work on runtime values (input conversion, result extraction)
// under the same error containment as Execute()
std::optional<SandboxError> Contain(const std::function<void()>& work,
                                    std::optional<std::size_t> recordIndex = std::nullopt);

// Truncates caller-facing error text to the trace bound
std::string SanitizeErrorMessage(std::string message);

} // namespace signal_lambda::runtime
