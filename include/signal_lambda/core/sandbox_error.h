#pragma once
//
// Sandbox error taxonomy
//
// Internally the validator and the interpreter throw the exception types below.
// They are caught at the confinement runtime / orchestrator boundary and turned
// into a SandboxError value, which is what callers ever see.
//

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace signal_lambda {

enum class SandboxErrorKind {
    GrammarViolation,
    RuntimeExecutionError,
    ResourceLimitExceeded,
    SandboxUnavailable,
    InternalError
};

std::string_view SandboxErrorKindToString(SandboxErrorKind kind);

struct SourceLocation {
    int line{0};
    int column{0};

    bool operator==(const SourceLocation&) const = default;
};

struct SandboxError {
    SandboxErrorKind kind{SandboxErrorKind::InternalError};
    std::string message;
    std::optional<SourceLocation> location{};

    // Set in per-record mode when the failure belongs to one record
    std::optional<std::size_t> record_index{};
    std::optional<std::string> ticker{};
};

class SandboxException : public std::runtime_error {
public:
    SandboxException(SandboxErrorKind kind, const std::string& message,
                     std::optional<SourceLocation> location = std::nullopt)
        : std::runtime_error(message), m_kind(kind), m_location(location) {}

    [[nodiscard]] SandboxErrorKind GetKind() const noexcept { return m_kind; }
    [[nodiscard]] const std::optional<SourceLocation>& GetLocation() const noexcept { return m_location; }

    [[nodiscard]] SandboxError ToError() const {
        return SandboxError{.kind = m_kind, .message = what(), .location = m_location};
    }

private:
    SandboxErrorKind m_kind;
    std::optional<SourceLocation> m_location;
};

// Static rejection of the submitted code
class GrammarViolation : public SandboxException {
public:
    explicit GrammarViolation(const std::string& message,
                              std::optional<SourceLocation> location = std::nullopt)
        : SandboxException(SandboxErrorKind::GrammarViolation, message, location) {}

    GrammarViolation(const std::string& message, int line, int column)
        : GrammarViolation(message, SourceLocation{line, column}) {}
};

// The submitted code raised while running
class RuntimeExecutionError : public SandboxException {
public:
    explicit RuntimeExecutionError(const std::string& message,
                                   std::optional<SourceLocation> location = std::nullopt)
        : SandboxException(SandboxErrorKind::RuntimeExecutionError, message, location) {}
};

// Step ceiling, wall-clock timeout or heap ceiling exceeded
class ResourceLimitExceeded : public SandboxException {
public:
    explicit ResourceLimitExceeded(const std::string& message,
                                   std::optional<SourceLocation> location = std::nullopt)
        : SandboxException(SandboxErrorKind::ResourceLimitExceeded, message, location) {}
};

class SandboxUnavailableError : public SandboxException {
public:
    explicit SandboxUnavailableError(const std::string& reason)
        : SandboxException(SandboxErrorKind::SandboxUnavailable, "sandbox unavailable: " + reason) {}
};

} // namespace signal_lambda
