#pragma once
//
// Conversion between host JSON (glz::generic) and interpreter values.
// FromJson copies into the namespace heap; ToJson copies back out, so no
// runtime value ever aliases caller data.
//

#include "heap.h"
#include "value.h"
#include <signal_lambda/core/signal_record.h>
#include <optional>

namespace signal_lambda::runtime {

// Integral JSON numbers within +/-2^53 become ints, all others floats
Value FromJson(const JsonValue& json, Heap& heap);

// Builds a dict holding the record's fields, tagged with its batch position
DictObject* RecordToDict(const SignalRecord& record, std::size_t origin, Heap& heap);

// Throws ScriptError for values JSON cannot represent. Every node copied out
// is charged to the budget, so shared containers cannot inflate the result.
JsonValue ToJson(const Value& value, ResourceBudget& budget);

// Throws ScriptError unless the value is a dict with str keys
SignalRecord DictToRecord(const Value& value, ResourceBudget& budget);

} // namespace signal_lambda::runtime
