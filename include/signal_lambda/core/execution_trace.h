#pragma once
//
// ExecutionTrace - bounded, ordered record of what one sandboxed run did
//
// Entry kinds, in the order they are appended:
//   input   - record count and execution mode before the transform
//   print   - one per captured output line
//   result  - record count after the transform, modified count, sample diffs
//   error   - error kind, message, source location, record index / ticker
//   status  - terminal status, elapsed time, steps, dropped output lines
//

#include <signal_lambda/core/sandbox_error.h>
#include <signal_lambda/core/signal_record.h>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace signal_lambda {

enum class ExecutionMode {
    Batch,     // program runs once with `signals` bound to the whole batch
    PerRecord  // program runs once per record with `signal` bound
};

std::string_view ExecutionModeToString(ExecutionMode mode);

enum class TraceStatus {
    Success,
    ValidationError,
    RuntimeError,
    ResourceError,
    InternalError
};

std::string_view TraceStatusToString(TraceStatus status);
TraceStatus TraceStatusFromErrorKind(SandboxErrorKind kind);

struct FieldChange {
    std::string field;
    std::optional<JsonValue> before{};  // absent when the field was added
    std::optional<JsonValue> after{};   // absent when the field was removed
};

struct RecordDiff {
    std::size_t index{};                        // position in the output batch
    std::optional<std::size_t> source_index{};  // position in the input batch, absent for new records
    std::optional<std::string> ticker{};
    std::vector<FieldChange> changes{};
};

struct TraceEntry {
    std::string kind;
    std::optional<std::string> mode{};
    std::optional<std::size_t> record_count{};
    std::optional<std::size_t> modified_count{};
    std::optional<std::string> text{};
    std::optional<std::size_t> record_index{};
    std::optional<std::string> ticker{};
    std::optional<std::string> error_kind{};
    std::optional<std::string> message{};
    std::optional<int> line{};
    std::optional<int> column{};
    std::optional<std::vector<RecordDiff>> samples{};
    std::optional<std::string> status{};
    std::optional<double> execution_time_ms{};
    std::optional<std::uint64_t> steps{};
    std::optional<std::size_t> dropped_output_lines{};
};

class ExecutionTrace {
public:
    void AddInput(std::size_t record_count, ExecutionMode mode);
    void AddPrint(std::string text, std::optional<std::size_t> record_index = std::nullopt);
    void AddResult(std::size_t record_count, std::size_t modified_count, std::vector<RecordDiff> samples);
    void AddError(const SandboxError& error);
    void AddStatus(TraceStatus status, double execution_time_ms, std::uint64_t steps,
                   std::size_t dropped_output_lines);

    [[nodiscard]] const std::vector<TraceEntry>& GetEntries() const { return m_entries; }
    [[nodiscard]] std::size_t Size() const { return m_entries.size(); }
    [[nodiscard]] bool Empty() const { return m_entries.empty(); }

    // Entries of a given kind, in trace order
    [[nodiscard]] std::vector<const TraceEntry*> FindAll(std::string_view kind) const;
    [[nodiscard]] const TraceEntry* FindFirst(std::string_view kind) const;

    // Status of the trailing status entry, if any
    [[nodiscard]] std::optional<std::string> GetFinalStatus() const;

private:
    std::vector<TraceEntry> m_entries;
};

} // namespace signal_lambda
