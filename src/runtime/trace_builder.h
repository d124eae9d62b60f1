#pragma once
//
// Sample diffs for the `result` trace entry
//

#include <signal_lambda/core/execution_trace.h>
#include <signal_lambda/core/signal_record.h>
#include <cstddef>
#include <optional>
#include <vector>

namespace signal_lambda::runtime {

struct ResultSummary {
    std::size_t modified_count{0};
    std::vector<RecordDiff> samples;
};

// Field-level changes between a record and the record it was derived from.
// Fields are visited in name order; at most maxFields changes are kept.
std::vector<FieldChange> DiffRecords(const SignalRecord& before, const SignalRecord& after, std::size_t maxFields);

// origins[i] is the input position output[i] was derived from, if any. A record
// counts as modified when it is new or differs from its origin.
ResultSummary SummarizeResult(const SignalBatch& input, const SignalBatch& output,
                              const std::vector<std::optional<std::size_t>>& origins);

} // namespace signal_lambda::runtime
