#pragma once
//
// SandboxAvailability - process-wide readiness of the lambda sandbox
//
// Computed once at startup by ProbeSandbox() and never changed afterwards. An
// unavailable sandbox fails every apply call closed; it never falls back to an
// unconfined path.
//

#include <optional>
#include <string>

namespace signal_lambda::runtime {

class SandboxAvailability {
public:
    static SandboxAvailability Ready() { return SandboxAvailability{std::nullopt}; }
    static SandboxAvailability Unavailable(std::string reason) {
        return SandboxAvailability{std::move(reason)};
    }

    [[nodiscard]] bool IsReady() const noexcept { return !m_reason.has_value(); }

    // Why the sandbox is unavailable; empty when ready
    [[nodiscard]] std::string GetReason() const { return m_reason.value_or(""); }

private:
    explicit SandboxAvailability(std::optional<std::string> reason) : m_reason(std::move(reason)) {}

    std::optional<std::string> m_reason;
};

// Checks that the parser grammar loads and that a smoke program runs end to end.
// Disabled by configuration yields Unavailable without probing.
SandboxAvailability ProbeSandbox(bool enabled);

} // namespace signal_lambda::runtime
