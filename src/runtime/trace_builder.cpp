#include "trace_builder.h"
#include <signal_lambda/core/constants.h>

namespace signal_lambda::runtime {

std::vector<FieldChange> DiffRecords(const SignalRecord& before, const SignalRecord& after, std::size_t maxFields) {
    std::vector<FieldChange> changes;
    const auto& lhs = before.GetFields();
    const auto& rhs = after.GetFields();

    // Merge walk over the two name-ordered field maps
    auto l = lhs.begin();
    auto r = rhs.begin();
    while ((l != lhs.end() || r != rhs.end()) && changes.size() < maxFields) {
        if (r == rhs.end() || (l != lhs.end() && l->first < r->first)) {
            changes.push_back(FieldChange{.field = l->first, .before = l->second});
            ++l;
        } else if (l == lhs.end() || r->first < l->first) {
            changes.push_back(FieldChange{.field = r->first, .after = r->second});
            ++r;
        } else {
            if (!JsonEquals(l->second, r->second)) {
                changes.push_back(FieldChange{.field = l->first, .before = l->second, .after = r->second});
            }
            ++l;
            ++r;
        }
    }
    return changes;
}

ResultSummary SummarizeResult(const SignalBatch& input, const SignalBatch& output,
                              const std::vector<std::optional<std::size_t>>& origins) {
    ResultSummary summary;
    static const SignalRecord kEmpty;

    for (std::size_t i = 0; i < output.size(); ++i) {
        std::optional<std::size_t> origin = i < origins.size() ? origins[i] : std::nullopt;
        if (origin && *origin >= input.size()) {
            origin.reset();
        }

        const SignalRecord& source = origin ? input[*origin] : kEmpty;
        if (origin && source == output[i]) {
            continue;
        }

        ++summary.modified_count;
        if (summary.samples.size() < constants::kMaxSampleDiffs) {
            RecordDiff diff;
            diff.index = i;
            diff.source_index = origin;
            diff.ticker = output[i].GetTicker();
            diff.changes = DiffRecords(source, output[i], constants::kMaxFieldChangesPerSample);
            summary.samples.push_back(std::move(diff));
        }
    }
    return summary;
}

} // namespace signal_lambda::runtime
