#include <signal_lambda/core/execution_trace.h>

namespace signal_lambda {

std::string_view SandboxErrorKindToString(SandboxErrorKind kind) {
    switch (kind) {
        case SandboxErrorKind::GrammarViolation: return "GrammarViolation";
        case SandboxErrorKind::RuntimeExecutionError: return "RuntimeExecutionError";
        case SandboxErrorKind::ResourceLimitExceeded: return "ResourceLimitExceeded";
        case SandboxErrorKind::SandboxUnavailable: return "SandboxUnavailableError";
        case SandboxErrorKind::InternalError: return "InternalError";
    }
    return "InternalError";
}

std::string_view ExecutionModeToString(ExecutionMode mode) {
    return mode == ExecutionMode::PerRecord ? "per_record" : "batch";
}

std::string_view TraceStatusToString(TraceStatus status) {
    switch (status) {
        case TraceStatus::Success: return "success";
        case TraceStatus::ValidationError: return "validation_error";
        case TraceStatus::RuntimeError: return "runtime_error";
        case TraceStatus::ResourceError: return "resource_error";
        case TraceStatus::InternalError: return "internal_error";
    }
    return "internal_error";
}

TraceStatus TraceStatusFromErrorKind(SandboxErrorKind kind) {
    switch (kind) {
        case SandboxErrorKind::GrammarViolation: return TraceStatus::ValidationError;
        case SandboxErrorKind::RuntimeExecutionError: return TraceStatus::RuntimeError;
        case SandboxErrorKind::ResourceLimitExceeded: return TraceStatus::ResourceError;
        case SandboxErrorKind::SandboxUnavailable:
        case SandboxErrorKind::InternalError: return TraceStatus::InternalError;
    }
    return TraceStatus::InternalError;
}

void ExecutionTrace::AddInput(std::size_t record_count, ExecutionMode mode) {
    TraceEntry entry{.kind = "input"};
    entry.record_count = record_count;
    entry.mode = std::string{ExecutionModeToString(mode)};
    m_entries.push_back(std::move(entry));
}

void ExecutionTrace::AddPrint(std::string text, std::optional<std::size_t> record_index) {
    TraceEntry entry{.kind = "print"};
    entry.text = std::move(text);
    entry.record_index = record_index;
    m_entries.push_back(std::move(entry));
}

void ExecutionTrace::AddResult(std::size_t record_count, std::size_t modified_count,
                               std::vector<RecordDiff> samples) {
    TraceEntry entry{.kind = "result"};
    entry.record_count = record_count;
    entry.modified_count = modified_count;
    entry.samples = std::move(samples);
    m_entries.push_back(std::move(entry));
}

void ExecutionTrace::AddError(const SandboxError& error) {
    TraceEntry entry{.kind = "error"};
    entry.error_kind = std::string{SandboxErrorKindToString(error.kind)};
    entry.message = error.message;
    if (error.location) {
        entry.line = error.location->line;
        entry.column = error.location->column;
    }
    entry.record_index = error.record_index;
    entry.ticker = error.ticker;
    m_entries.push_back(std::move(entry));
}

void ExecutionTrace::AddStatus(TraceStatus status, double execution_time_ms, std::uint64_t steps,
                               std::size_t dropped_output_lines) {
    TraceEntry entry{.kind = "status"};
    entry.status = std::string{TraceStatusToString(status)};
    entry.execution_time_ms = execution_time_ms;
    entry.steps = steps;
    if (dropped_output_lines > 0) {
        entry.dropped_output_lines = dropped_output_lines;
    }
    m_entries.push_back(std::move(entry));
}

std::vector<const TraceEntry*> ExecutionTrace::FindAll(std::string_view kind) const {
    std::vector<const TraceEntry*> found;
    for (const auto& entry : m_entries) {
        if (entry.kind == kind) {
            found.push_back(&entry);
        }
    }
    return found;
}

const TraceEntry* ExecutionTrace::FindFirst(std::string_view kind) const {
    for (const auto& entry : m_entries) {
        if (entry.kind == kind) {
            return &entry;
        }
    }
    return nullptr;
}

std::optional<std::string> ExecutionTrace::GetFinalStatus() const {
    if (m_entries.empty() || m_entries.back().kind != "status") {
        return std::nullopt;
    }
    return m_entries.back().status;
}

} // namespace signal_lambda
