#pragma once
//
// Builtin functions, methods and the math namespace of the lambda language.
// Names are checked against the grammar tables before a program ever runs;
// dispatch here still rejects anything unknown.
//

#include "heap.h"
#include "output_capture.h"
#include "resource_budget.h"
#include "value.h"
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace signal_lambda::runtime {

struct CallContext {
    Heap& heap;
    ResourceBudget& budget;
    OutputCapture& output;
    std::optional<std::size_t> record_index;
};

using PositionalArgs = std::vector<Value>;
using KeywordArgs = std::vector<std::pair<std::string, Value>>;

Value CallBuiltin(std::string_view name, PositionalArgs& args, KeywordArgs& kwargs, CallContext& ctx);

Value CallMethod(const Value& self, std::string_view name, PositionalArgs& args, KeywordArgs& kwargs,
                 CallContext& ctx);

Value CallMath(std::string_view name, PositionalArgs& args, KeywordArgs& kwargs, CallContext& ctx);

Value GetMathConstant(std::string_view name);

// In-place stable sort shared by sorted() and list.sort()
void SortValues(std::vector<Value>& items, bool descending, ResourceBudget& budget);

// Shared argument checking
namespace args {

void CheckCount(std::string_view function, const PositionalArgs& args, std::size_t min, std::size_t max);

// Rejects any keyword not in the allowed list
void CheckKeywords(std::string_view function, const KeywordArgs& kwargs,
                   std::initializer_list<std::string_view> allowed);

// Removes and returns the keyword argument if present
std::optional<Value> TakeKeyword(KeywordArgs& kwargs, std::string_view name);

std::int64_t RequireInt(std::string_view function, const Value& value);
double RequireReal(std::string_view function, const Value& value);
const std::string& RequireStr(std::string_view function, const Value& value);

} // namespace args

} // namespace signal_lambda::runtime
