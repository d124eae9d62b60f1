#include <signal_lambda/runtime/availability.h>
#include "orchestrator.h"
#include "../compiler/parser/python_parser.h"
#include <signal_lambda/core/constants.h>

#include <format>
#include <spdlog/spdlog.h>
#include <tree_sitter/api.h>

namespace signal_lambda::runtime {

namespace {

constexpr const char* kProbeCode = "result = [dict(s, probed=True) for s in signals]";

SandboxAvailability RunProbe() {
    const std::uint32_t abi = PythonParser::languageVersion();
    if (abi < TREE_SITTER_MIN_COMPATIBLE_LANGUAGE_VERSION || abi > TREE_SITTER_LANGUAGE_VERSION) {
        return SandboxAvailability::Unavailable(
            std::format("tree-sitter-python ABI {} is incompatible with the tree-sitter runtime", abi));
    }

    JsonValue ticker;
    ticker.data = std::string{"PROBE"};
    FieldMap fields;
    fields.emplace(constants::kTickerField, std::move(ticker));
    const SignalBatch batch{SignalRecord{std::move(fields)}};

    LambdaOrchestrator orchestrator(SandboxAvailability::Ready());
    ApplyOutcome outcome = orchestrator.Apply(kProbeCode, batch);
    if (!outcome.Succeeded()) {
        return SandboxAvailability::Unavailable(std::format("smoke program failed: {}", outcome.error->message));
    }
    if (!outcome.signals || outcome.signals->size() != 1 || !outcome.signals->front().Contains("probed")) {
        return SandboxAvailability::Unavailable("smoke program produced an unexpected result");
    }
    return SandboxAvailability::Ready();
}

} // namespace

SandboxAvailability ProbeSandbox(bool enabled) {
    if (!enabled) {
        SPDLOG_WARN("Lambda sandbox disabled by configuration");
        return SandboxAvailability::Unavailable("disabled by configuration");
    }

    SandboxAvailability availability = SandboxAvailability::Unavailable("probe did not run");
    try {
        availability = RunProbe();
    } catch (const std::exception& e) {
        availability = SandboxAvailability::Unavailable(e.what());
    }

    if (availability.IsReady()) {
        SPDLOG_INFO("Lambda sandbox ready (tree-sitter-python ABI {})", PythonParser::languageVersion());
    } else {
        SPDLOG_CRITICAL("Lambda sandbox unavailable: {}", availability.GetReason());
    }
    return availability;
}

} // namespace signal_lambda::runtime
