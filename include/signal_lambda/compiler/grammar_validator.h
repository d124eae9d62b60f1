#pragma once
//
// GrammarValidator - static admission check for submitted lambda code
//
// Validate() is a pure function over the text: it parses, walks the tree and
// reports the first construct outside the allow-listed grammar. Compile() does
// the same work and hands back the checked program for execution.
//

#include <signal_lambda/core/execution_trace.h>
#include <signal_lambda/core/sandbox_error.h>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace signal_lambda {

struct Module;

struct ValidationDiagnostic {
    std::string message;
    std::optional<int> line{};
    std::optional<int> column{};

    bool operator==(const ValidationDiagnostic&) const = default;
};

struct ValidationResult {
    bool valid{false};
    std::optional<ValidationDiagnostic> error{};

    bool operator==(const ValidationResult&) const = default;
};

// A program that passed validation. Immutable and safe to share between threads.
struct CompiledLambda {
    std::shared_ptr<const Module> module;
    ExecutionMode mode{ExecutionMode::Batch};
};

class GrammarValidator {
public:
    [[nodiscard]] ValidationResult Validate(std::string_view code) const;

    // Throws GrammarViolation
    [[nodiscard]] CompiledLambda Compile(std::string_view code) const;
};

} // namespace signal_lambda
