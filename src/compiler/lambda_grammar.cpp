#include "lambda_grammar.h"
#include <algorithm>

namespace signal_lambda::grammar {

namespace {

constexpr NamedEntry kBuiltins[] = {
    {"len", "len(x) - number of items"},
    {"abs", "abs(x) - absolute value"},
    {"min", "min(a, b, ...) or min(iterable) - smallest value"},
    {"max", "max(a, b, ...) or max(iterable) - largest value"},
    {"round", "round(x, ndigits=0) - round half to even"},
    {"str", "str(x) - convert to string"},
    {"int", "int(x) - convert to integer"},
    {"float", "float(x) - convert to float"},
    {"bool", "bool(x) - truth value"},
    {"list", "list(iterable) - new list"},
    {"dict", "dict(mapping) - shallow copy of a dict"},
    {"tuple", "tuple(iterable) - immutable sequence"},
    {"range", "range(stop) / range(start, stop, step)"},
    {"sum", "sum(iterable, start=0)"},
    {"any", "any(iterable) - True if any item is truthy"},
    {"all", "all(iterable) - True if every item is truthy"},
    {"pow", "pow(base, exp)"},
    {"sorted", "sorted(iterable, reverse=False)"},
    {"enumerate", "enumerate(iterable, start=0) - (index, item) pairs"},
    {"zip", "zip(a, b, ...) - tuples of parallel items"},
    {"map", "map(function, iterable, ...) - list of results; function is a builtin name"},
    {"filter", "filter(function, iterable) - list of items the builtin (or None: truthiness) accepts"},
    {"print", "print(*values) - captured into the execution trace"},
};

constexpr NamedEntry kMathConstants[] = {
    {"pi", "3.141592653589793"},
    {"e", "2.718281828459045"},
    {"inf", "positive infinity"},
    {"nan", "not a number"},
};

constexpr NamedEntry kMathFunctions[] = {
    {"sqrt", "math.sqrt(x)"},
    {"log", "math.log(x, base=e)"},
    {"log10", "math.log10(x)"},
    {"log2", "math.log2(x)"},
    {"exp", "math.exp(x)"},
    {"pow", "math.pow(x, y) - always a float"},
    {"floor", "math.floor(x) - integer"},
    {"ceil", "math.ceil(x) - integer"},
    {"trunc", "math.trunc(x) - integer"},
    {"fabs", "math.fabs(x) - float absolute value"},
    {"sin", "math.sin(x)"},
    {"cos", "math.cos(x)"},
    {"tan", "math.tan(x)"},
    {"asin", "math.asin(x)"},
    {"acos", "math.acos(x)"},
    {"atan", "math.atan(x)"},
    {"atan2", "math.atan2(y, x)"},
    {"degrees", "math.degrees(x)"},
    {"radians", "math.radians(x)"},
    {"isnan", "math.isnan(x)"},
    {"isinf", "math.isinf(x)"},
    {"isfinite", "math.isfinite(x)"},
};

constexpr NamedEntry kDictMethods[] = {
    {"get", "d.get(key, default=None)"},
    {"keys", "d.keys() - list of keys"},
    {"values", "d.values() - list of values"},
    {"items", "d.items() - list of (key, value) tuples"},
    {"copy", "d.copy() - shallow copy"},
    {"update", "d.update(other)"},
    {"pop", "d.pop(key, default)"},
};

constexpr NamedEntry kListMethods[] = {
    {"append", "l.append(x)"},
    {"extend", "l.extend(iterable)"},
    {"pop", "l.pop(index=-1)"},
    {"insert", "l.insert(index, x)"},
    {"index", "l.index(x)"},
    {"count", "l.count(x)"},
    {"copy", "l.copy() - shallow copy"},
    {"reverse", "l.reverse()"},
    {"sort", "l.sort(reverse=False)"},
};

constexpr NamedEntry kStringMethods[] = {
    {"upper", "s.upper()"},
    {"lower", "s.lower()"},
    {"strip", "s.strip(chars=None)"},
    {"lstrip", "s.lstrip(chars=None)"},
    {"rstrip", "s.rstrip(chars=None)"},
    {"startswith", "s.startswith(prefix)"},
    {"endswith", "s.endswith(suffix)"},
    {"replace", "s.replace(old, new)"},
    {"split", "s.split(sep=None)"},
    {"join", "sep.join(iterable of str)"},
    {"find", "s.find(sub) - index or -1"},
    {"count", "s.count(sub)"},
    {"format", "s.format(*args) - {} / {0} / {:.2f} fields"},
};

constexpr std::string_view kDeniedNames[] = {
    "eval", "exec", "compile", "open", "__import__", "globals", "locals", "vars", "dir",
    "getattr", "setattr", "delattr", "hasattr", "input", "breakpoint", "exit", "quit",
    "help", "type", "object", "super", "memoryview", "bytes", "bytearray", "classmethod",
    "staticmethod", "property", "callable", "isinstance", "issubclass", "iter", "next",
    "os", "sys", "subprocess", "socket", "shutil", "pathlib", "builtins", "importlib",
    "ctypes", "pickle", "marshal", "threading", "multiprocessing", "asyncio", "inspect",
    "gc", "requests", "urllib",
};

bool Contains(std::span<const NamedEntry> entries, std::string_view name) {
    return std::ranges::any_of(entries, [name](const NamedEntry& entry) { return entry.name == name; });
}

} // namespace

std::span<const NamedEntry> Builtins() { return kBuiltins; }
std::span<const NamedEntry> MathConstants() { return kMathConstants; }
std::span<const NamedEntry> MathFunctions() { return kMathFunctions; }
std::span<const NamedEntry> DictMethods() { return kDictMethods; }
std::span<const NamedEntry> ListMethods() { return kListMethods; }
std::span<const NamedEntry> StringMethods() { return kStringMethods; }
std::span<const std::string_view> DeniedNames() { return kDeniedNames; }

bool IsBuiltin(std::string_view name) { return Contains(kBuiltins, name); }
bool TakesFunctionArgument(std::string_view name) { return name == "map" || name == "filter"; }
bool IsMathConstant(std::string_view name) { return Contains(kMathConstants, name); }
bool IsMathFunction(std::string_view name) { return Contains(kMathFunctions, name); }

bool IsMethod(std::string_view name) {
    return Contains(kDictMethods, name) || Contains(kListMethods, name) || Contains(kStringMethods, name);
}

bool IsDeniedName(std::string_view name) {
    return std::ranges::find(kDeniedNames, name) != std::ranges::end(kDeniedNames);
}

} // namespace signal_lambda::grammar
