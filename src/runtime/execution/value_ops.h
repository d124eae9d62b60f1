#pragma once
//
// Python semantics of the lambda value model: truthiness, equality, ordering,
// arithmetic, indexing and text conversion. Every function throws ScriptError
// for errors the program can cause.
//

#include "heap.h"
#include "value.h"
#include "../../compiler/parser/ast_nodes.h"
#include <signal_lambda/core/constants.h>
#include <optional>
#include <string>
#include <vector>

namespace signal_lambda::runtime {

bool Truthy(const Value& value);

bool Equals(const Value& lhs, const Value& rhs, std::size_t depth = 0);

// Comparison and membership operators (<, ==, in, is, ...)
bool Compare(BinOpType op, const Value& lhs, const Value& rhs);

// Arithmetic operators (+, -, *, /, //, %, **)
Value BinaryOp(BinOpType op, const Value& lhs, const Value& rhs, Heap& heap);

Value UnaryOp(UnaryOpType op, const Value& operand);

bool Contains(const Value& container, const Value& item);

// Key lookup that treats unsupported-but-hashable keys as absent
std::optional<DictKey> TryMakeDictKey(const Value& key);

// Every item of an iterable, in iteration order. Dicts yield their keys,
// strings their characters.
std::vector<Value> Materialize(const Value& iterable, Heap& heap);

// container[key]
Value GetItem(const Value& container, const Value& key);

// container[lower:upper:step]
Value GetSlice(const Value& container, const std::optional<std::int64_t>& lower,
               const std::optional<std::int64_t>& upper, const std::optional<std::int64_t>& step, Heap& heap);

struct SliceBounds {
    std::int64_t start;
    std::int64_t stop;
    std::int64_t step;
    std::size_t length;
};

// Python's slice.indices() for a sequence of the given length
SliceBounds ResolveSlice(const std::optional<std::int64_t>& lower, const std::optional<std::int64_t>& upper,
                         const std::optional<std::int64_t>& step, std::size_t length);

// Resolves a possibly negative index; throws IndexError naming the container type
std::size_t NormalizeIndex(std::int64_t index, std::size_t size, std::string_view typeName);

// str(value). Container text longer than maxLength throws ResourceLimitExceeded.
std::string ToStr(const Value& value, std::size_t maxLength = constants::kMaxStringLength);

// repr(value)
std::string Repr(const Value& value, std::size_t maxLength = constants::kMaxStringLength);

// Shortest round-trip float text, as Python prints it
std::string FormatFloat(double value);

} // namespace signal_lambda::runtime
