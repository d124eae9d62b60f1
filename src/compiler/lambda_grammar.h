#pragma once
//
// Lambda grammar tables
//
// The fixed vocabulary of the restricted language: builtins, the math namespace,
// container/string methods and the names that are never allowed to appear.
// Shared by the validator, the interpreter and the lambda-help document.
//

#include <span>
#include <string_view>

namespace signal_lambda::grammar {

struct NamedEntry {
    std::string_view name;
    std::string_view description;
};

// Builtin functions callable by name
std::span<const NamedEntry> Builtins();

// Constants and functions reachable as math.<name>
std::span<const NamedEntry> MathConstants();
std::span<const NamedEntry> MathFunctions();

// Methods per receiver type
std::span<const NamedEntry> DictMethods();
std::span<const NamedEntry> ListMethods();
std::span<const NamedEntry> StringMethods();

// Names rejected wherever they appear
std::span<const std::string_view> DeniedNames();

bool IsBuiltin(std::string_view name);
// Builtins whose first argument names another builtin (map, filter)
bool TakesFunctionArgument(std::string_view name);
bool IsMathConstant(std::string_view name);
bool IsMathFunction(std::string_view name);
bool IsMethod(std::string_view name);
bool IsDeniedName(std::string_view name);

} // namespace signal_lambda::grammar
