#include "confinement_runtime.h"
#include "execution/interpreter.h"
#include "execution/script_error.h"
#include <signal_lambda/core/constants.h>

#include <new>
#include <spdlog/spdlog.h>

namespace signal_lambda::runtime {

std::string SanitizeErrorMessage(std::string message) {
    if (message.size() > constants::kMaxErrorMessageLength) {
        message.resize(constants::kMaxErrorMessageLength);
        message += "...";
    }
    return message;
}

std::optional<SandboxError> Contain(const std::function<void()>& work, std::optional<std::size_t> recordIndex) {
    SandboxError error;

    try {
        work();
        return std::nullopt;
    } catch (const ScriptError& e) {
        error.kind = SandboxErrorKind::RuntimeExecutionError;
        error.message = SanitizeErrorMessage(e.what());
        if (e.GetLine()) {
            error.location = SourceLocation{*e.GetLine(), e.GetColumn().value_or(0)};
        }
    } catch (const SandboxException& e) {
        // Budget overruns surface here as ResourceLimitExceeded
        error = e.ToError();
        error.message = SanitizeErrorMessage(error.message);
    } catch (const std::bad_alloc&) {
        error.kind = SandboxErrorKind::ResourceLimitExceeded;
        error.message = "Memory limit exceeded";
    } catch (const std::exception& e) {
        SPDLOG_ERROR("Confinement runtime failed with host exception: {}", e.what());
        error.kind = SandboxErrorKind::InternalError;
        error.message = "internal error";
    }

    error.record_index = recordIndex;
    return error;
}

void ConfinementRuntime::Seed(ExecutionNamespace& ns, const std::string& inputName, Value input) {
    ns.Bind(inputName, std::move(input));
    ns.Bind(constants::kResultName, Value::None());
}

std::optional<SandboxError> ConfinementRuntime::Execute(const Module& program, ExecutionNamespace& ns,
                                                         OutputCapture& output,
                                                         std::optional<std::size_t> recordIndex) const {
    return Contain(
        [&]() {
            Interpreter interpreter(ns, output, recordIndex);
            interpreter.Execute(program);
        },
        recordIndex);
}

} // namespace signal_lambda::runtime
