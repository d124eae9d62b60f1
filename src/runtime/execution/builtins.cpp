#include "builtins.h"
#include "script_error.h"
#include "value_ops.h"
#include "../../compiler/error_formatting/argument_error.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <format>
#include <limits>
#include <numbers>

namespace signal_lambda::runtime {

namespace args {

void CheckCount(std::string_view function, const PositionalArgs& args, std::size_t min, std::size_t max) {
    if (args.size() < min || args.size() > max) {
        throw TypeError(error_formatting::ArgumentCountError(std::string{function}, min, max, args.size()).Format());
    }
}

void CheckKeywords(std::string_view function, const KeywordArgs& kwargs,
                   std::initializer_list<std::string_view> allowed) {
    for (const auto& [name, _] : kwargs) {
        if (std::ranges::find(allowed, name) == allowed.end()) {
            throw TypeError(error_formatting::UnexpectedKeywordError(std::string{function}, name).Format());
        }
    }
}

std::optional<Value> TakeKeyword(KeywordArgs& kwargs, std::string_view name) {
    auto it = std::ranges::find_if(kwargs, [name](const auto& kw) { return kw.first == name; });
    if (it == kwargs.end()) {
        return std::nullopt;
    }
    Value value = std::move(it->second);
    kwargs.erase(it);
    return value;
}

std::int64_t RequireInt(std::string_view function, const Value& value) {
    if (!value.IsIntegral()) {
        throw TypeError(std::format("{}: '{}' object cannot be interpreted as an integer", function, value.TypeName()));
    }
    return value.ToInteger();
}

double RequireReal(std::string_view function, const Value& value) {
    if (!value.IsNumber()) {
        throw TypeError(std::format("{}: must be real number, not {}", function, value.TypeName()));
    }
    return value.ToDouble();
}

const std::string& RequireStr(std::string_view function, const Value& value) {
    if (!value.IsStr()) {
        throw TypeError(std::format("{}: argument must be str, not {}", function, value.TypeName()));
    }
    return value.AsStr();
}

} // namespace args

namespace {

constexpr double kInt64Limit = 9223372036854775808.0;  // 2^63

std::int64_t FloatToInt(double value) {
    if (std::isnan(value)) {
        throw ValueError("cannot convert float NaN to integer");
    }
    if (std::isinf(value)) {
        throw OverflowError("cannot convert float infinity to integer");
    }
    if (value >= kInt64Limit || value < -kInt64Limit) {
        throw OverflowError("integer overflow (values are limited to 64 bits)");
    }
    return static_cast<std::int64_t>(value);
}

std::string_view Trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

std::int64_t ParseInt(const std::string& text, int base) {
    std::string_view trimmed = Trim(text);
    auto invalid = [&]() {
        return ValueError(std::format("invalid literal for int() with base {}: {}", base, Repr(Value::Str(text))));
    };

    bool negative = false;
    if (!trimmed.empty() && (trimmed.front() == '+' || trimmed.front() == '-')) {
        negative = trimmed.front() == '-';
        trimmed.remove_prefix(1);
    }

    std::string digits;
    for (std::size_t i = 0; i < trimmed.size(); ++i) {
        if (trimmed[i] == '_' && i > 0 && i + 1 < trimmed.size() && trimmed[i - 1] != '_') {
            continue;
        }
        digits.push_back(trimmed[i]);
    }
    if (digits.empty()) {
        throw invalid();
    }
    if (negative) {
        digits.insert(digits.begin(), '-');
    }

    std::int64_t value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value, base);
    if (ec == std::errc::result_out_of_range) {
        throw OverflowError("integer overflow (values are limited to 64 bits)");
    }
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        throw invalid();
    }
    return value;
}

double ParseFloat(const std::string& text) {
    std::string_view trimmed = Trim(text);
    auto invalid = [&]() {
        return ValueError(std::format("could not convert string to float: {}", Repr(Value::Str(text))));
    };

    double sign = 1.0;
    if (!trimmed.empty() && (trimmed.front() == '+' || trimmed.front() == '-')) {
        sign = trimmed.front() == '-' ? -1.0 : 1.0;
        trimmed.remove_prefix(1);
    }

    std::string lowered{trimmed};
    std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) { return std::tolower(c); });
    if (lowered == "nan") {
        return std::numeric_limits<double>::quiet_NaN();
    }
    if (lowered == "inf" || lowered == "infinity") {
        return sign * std::numeric_limits<double>::infinity();
    }
    if (lowered.empty() || lowered.front() == '+' || lowered.front() == '-') {
        throw invalid();
    }

    double value = 0.0;
    auto [ptr, ec] = std::from_chars(lowered.data(), lowered.data() + lowered.size(), value);
    if (ec == std::errc::result_out_of_range) {
        return sign * (lowered.find('e') != std::string::npos && lowered.find("e-") != std::string::npos
                           ? 0.0
                           : std::numeric_limits<double>::infinity());
    }
    if (ec != std::errc{} || ptr != lowered.data() + lowered.size()) {
        throw invalid();
    }
    return sign * value;
}

Value RoundValue(const Value& number, const std::optional<Value>& ndigits) {
    if (!number.IsNumber()) {
        throw TypeError(std::format("type {} doesn't define __round__ method", number.TypeName()));
    }

    if (!ndigits || ndigits->IsNone()) {
        if (number.IsIntegral()) {
            return Value::Int(number.ToInteger());
        }
        // Default rounding mode is round-half-to-even
        return Value::Int(FloatToInt(std::nearbyint(number.AsFloat())));
    }

    std::int64_t digits = args::RequireInt("round", *ndigits);

    if (number.IsIntegral()) {
        std::int64_t value = number.ToInteger();
        if (digits >= 0) {
            return Value::Int(value);
        }
        if (digits < -18) {
            return Value::Int(0);
        }
        std::int64_t factor = 1;
        for (std::int64_t i = 0; i < -digits; ++i) {
            factor *= 10;
        }
        std::int64_t quotient = value / factor;
        std::int64_t remainder = value % factor;
        if (remainder < 0) {
            remainder += factor;
            --quotient;
        }
        if (remainder * 2 > factor || (remainder * 2 == factor && (quotient % 2) != 0)) {
            ++quotient;
        }
        return Value::Int(quotient * factor);
    }

    double value = number.AsFloat();
    if (!std::isfinite(value) || digits > 300) {
        return Value::Float(value);
    }
    if (digits >= 0) {
        // Correctly rounded decimal conversion, then back
        char buffer[512];
        auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value, std::chars_format::fixed,
                                       static_cast<int>(digits));
        if (ec != std::errc{}) {
            return Value::Float(value);
        }
        double rounded = value;
        std::from_chars(buffer, end, rounded);
        return Value::Float(rounded);
    }
    if (digits < -308) {
        return Value::Float(std::copysign(0.0, value));
    }
    double factor = std::pow(10.0, static_cast<double>(-digits));
    return Value::Float(std::nearbyint(value / factor) * factor);
}

Value MinMax(std::string_view name, PositionalArgs& args, KeywordArgs& kwargs, CallContext& ctx, bool wantMax) {
    args::CheckKeywords(name, kwargs, {"default"});
    std::optional<Value> fallback = args::TakeKeyword(kwargs, "default");

    if (args.empty()) {
        throw TypeError(std::format("{} expected at least 1 argument, got 0", name));
    }
    if (fallback && args.size() > 1) {
        throw TypeError(std::format("Cannot specify a default for {}() with multiple positional arguments", name));
    }

    std::vector<Value> candidates = args.size() == 1 ? Materialize(args[0], ctx.heap) : args;
    if (candidates.empty()) {
        if (fallback) {
            return *fallback;
        }
        throw ValueError(std::format("{}() arg is an empty sequence", name));
    }

    ctx.budget.Tick(candidates.size());
    std::size_t best = 0;
    for (std::size_t i = 1; i < candidates.size(); ++i) {
        bool better = wantMax ? Compare(BinOpType::Gt, candidates[i], candidates[best])
                              : Compare(BinOpType::Lt, candidates[i], candidates[best]);
        if (better) {
            best = i;
        }
    }
    return candidates[best];
}

Value MakeDict(PositionalArgs& args, KeywordArgs& kwargs, CallContext& ctx) {
    args::CheckCount("dict", args, 0, 1);
    DictObject* dict = ctx.heap.NewDict();

    if (!args.empty()) {
        const Value& source = args[0];
        if (source.IsDict()) {
            const DictObject* original = source.AsDict();
            ctx.heap.Charge(original->Size());
            ctx.budget.Tick(1 + original->Size() / 16);
            dict->entries = original->entries;
            dict->index = original->index;
            dict->origin = original->origin;
        } else {
            for (const auto& pair : Materialize(source, ctx.heap)) {
                if (!pair.IsSequenceObject() || pair.AsList()->items.size() != 2) {
                    throw TypeError("cannot convert dictionary update sequence element to a (key, value) pair");
                }
                const auto& items = pair.AsList()->items;
                if (dict->Set(MakeDictKey(items[0]), items[0], items[1])) {
                    ctx.heap.Charge(1);
                }
            }
        }
    }

    for (auto& [name, value] : kwargs) {
        if (dict->Set(DictKey{name}, ctx.heap.NewStr(name), value)) {
            ctx.heap.Charge(1);
        }
    }
    return Value::Dict(dict);
}

Value MakeRange(PositionalArgs& args) {
    args::CheckCount("range", args, 1, 3);
    RangeValue range;
    if (args.size() == 1) {
        range.stop = args::RequireInt("range", args[0]);
    } else {
        range.start = args::RequireInt("range", args[0]);
        range.stop = args::RequireInt("range", args[1]);
        if (args.size() == 3) {
            range.step = args::RequireInt("range", args[2]);
            if (range.step == 0) {
                throw ValueError("range() arg 3 must not be zero");
            }
        }
    }
    return Value::Range(range);
}

Value Sum(PositionalArgs& args, KeywordArgs& kwargs, CallContext& ctx) {
    args::CheckKeywords("sum", kwargs, {"start"});
    std::optional<Value> start = args::TakeKeyword(kwargs, "start");
    args::CheckCount("sum", args, 1, start ? 1 : 2);
    if (args.size() == 2) {
        start = args[1];
    }

    Value total = start.value_or(Value::Int(0));
    if (total.IsStr()) {
        throw TypeError("sum() can't sum strings [use ''.join(seq) instead]");
    }
    for (const auto& item : Materialize(args[0], ctx.heap)) {
        ctx.budget.Tick();
        total = BinaryOp(BinOpType::Add, total, item, ctx.heap);
    }
    return total;
}

Value Sorted(PositionalArgs& args, KeywordArgs& kwargs, CallContext& ctx) {
    args::CheckCount("sorted", args, 1, 1);
    args::CheckKeywords("sorted", kwargs, {"reverse"});
    std::optional<Value> reverse = args::TakeKeyword(kwargs, "reverse");

    std::vector<Value> items = Materialize(args[0], ctx.heap);
    SortValues(items, reverse && Truthy(*reverse), ctx.budget);
    return Value::List(ctx.heap.NewList(std::move(items)));
}

Value Print(PositionalArgs& args, KeywordArgs& kwargs, CallContext& ctx) {
    args::CheckKeywords("print", kwargs, {"sep", "end"});
    std::optional<Value> sep = args::TakeKeyword(kwargs, "sep");
    std::optional<Value> end = args::TakeKeyword(kwargs, "end");

    std::string separator = " ";
    if (sep && !sep->IsNone()) {
        separator = args::RequireStr("print", *sep);
    }

    std::string line;
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (i > 0) {
            line += separator;
        }
        line += ToStr(args[i], ctx.budget.GetLimits().max_string_length);
        ctx.budget.CheckStringLength(line.size());
    }
    if (end && !end->IsNone() && args::RequireStr("print", *end) != "\n") {
        line += end->AsStr();
    }

    ctx.budget.Tick(1 + line.size() / 64);
    ctx.output.Write(std::move(line), ctx.record_index);
    return Value::None();
}

using UnaryMathFn = double (*)(double);

double CheckedMathResult(double input, double result) {
    if (std::isnan(result) && !std::isnan(input)) {
        throw ValueError("math domain error");
    }
    if (std::isinf(result) && std::isfinite(input)) {
        throw OverflowError("math range error");
    }
    return result;
}

Value UnaryMath(std::string_view name, PositionalArgs& args, UnaryMathFn fn) {
    args::CheckCount(name, args, 1, 1);
    double x = args::RequireReal(name, args[0]);
    return Value::Float(CheckedMathResult(x, fn(x)));
}

Value RoundingMath(std::string_view name, PositionalArgs& args, UnaryMathFn fn) {
    args::CheckCount(name, args, 1, 1);
    if (args[0].IsIntegral()) {
        return Value::Int(args[0].ToInteger());
    }
    double x = args::RequireReal(name, args[0]);
    return Value::Int(FloatToInt(fn(x)));
}

double CheckPositive(double x) {
    if (x <= 0.0) {
        throw ValueError("math domain error");
    }
    return x;
}

double Log(double x) {
    return std::log(CheckPositive(x));
}

} // namespace

void SortValues(std::vector<Value>& items, bool descending, ResourceBudget& budget) {
    const auto n = static_cast<double>(items.size());
    budget.Tick(1 + static_cast<std::uint64_t>(n * std::log2(n + 1.0)));

    if (descending) {
        std::stable_sort(items.begin(), items.end(),
                         [](const Value& a, const Value& b) { return Compare(BinOpType::Lt, b, a); });
    } else {
        std::stable_sort(items.begin(), items.end(),
                         [](const Value& a, const Value& b) { return Compare(BinOpType::Lt, a, b); });
    }
}

Value CallBuiltin(std::string_view name, PositionalArgs& args, KeywordArgs& kwargs, CallContext& ctx) {
    ctx.budget.Tick();

    if (name == "print") {
        return Print(args, kwargs, ctx);
    }
    if (name == "min" || name == "max") {
        return MinMax(name, args, kwargs, ctx, name == "max");
    }
    if (name == "dict") {
        return MakeDict(args, kwargs, ctx);
    }
    if (name == "sum") {
        return Sum(args, kwargs, ctx);
    }
    if (name == "sorted") {
        return Sorted(args, kwargs, ctx);
    }
    if (name == "round") {
        args::CheckKeywords(name, kwargs, {"ndigits"});
        std::optional<Value> ndigits = args::TakeKeyword(kwargs, "ndigits");
        args::CheckCount(name, args, 1, ndigits ? 1 : 2);
        if (args.size() == 2) {
            ndigits = args[1];
        }
        return RoundValue(args[0], ndigits);
    }
    if (name == "enumerate") {
        args::CheckKeywords(name, kwargs, {"start"});
        std::optional<Value> start = args::TakeKeyword(kwargs, "start");
        args::CheckCount(name, args, 1, start ? 1 : 2);
        if (args.size() == 2) {
            start = args[1];
        }
        std::int64_t index = start ? args::RequireInt(name, *start) : 0;

        std::vector<Value> pairs;
        for (auto& item : Materialize(args[0], ctx.heap)) {
            pairs.push_back(Value::List(ctx.heap.NewTuple({Value::Int(index++), std::move(item)})));
        }
        return Value::List(ctx.heap.NewList(std::move(pairs)));
    }

    args::CheckKeywords(name, kwargs, {});

    if (name == "len") {
        args::CheckCount(name, args, 1, 1);
        const Value& x = args[0];
        if (x.IsStr()) return Value::Int(static_cast<std::int64_t>(x.AsStr().size()));
        if (x.IsSequenceObject()) return Value::Int(static_cast<std::int64_t>(x.AsList()->items.size()));
        if (x.IsDict()) return Value::Int(static_cast<std::int64_t>(x.AsDict()->Size()));
        if (x.IsRange()) return Value::Int(static_cast<std::int64_t>(x.AsRange().Size()));
        throw TypeError(std::format("object of type '{}' has no len()", x.TypeName()));
    }
    if (name == "abs") {
        args::CheckCount(name, args, 1, 1);
        const Value& x = args[0];
        if (x.IsIntegral()) {
            std::int64_t value = x.ToInteger();
            return value < 0 ? UnaryOp(UnaryOpType::USub, Value::Int(value)) : Value::Int(value);
        }
        if (x.IsFloat()) return Value::Float(std::fabs(x.AsFloat()));
        throw TypeError(std::format("bad operand type for abs(): '{}'", x.TypeName()));
    }
    if (name == "str") {
        args::CheckCount(name, args, 0, 1);
        if (args.empty()) return ctx.heap.NewStr("");
        return ctx.heap.NewStr(ToStr(args[0], ctx.budget.GetLimits().max_string_length));
    }
    if (name == "int") {
        args::CheckCount(name, args, 0, 2);
        if (args.empty()) return Value::Int(0);
        const Value& x = args[0];
        if (args.size() == 2) {
            std::int64_t base = args::RequireInt(name, args[1]);
            if (base < 2 || base > 36) {
                throw ValueError("int() base must be >= 2 and <= 36");
            }
            return Value::Int(ParseInt(args::RequireStr(name, x), static_cast<int>(base)));
        }
        if (x.IsIntegral()) return Value::Int(x.ToInteger());
        if (x.IsFloat()) return Value::Int(FloatToInt(std::trunc(x.AsFloat())));
        if (x.IsStr()) return Value::Int(ParseInt(x.AsStr(), 10));
        throw TypeError(std::format("int() argument must be a string or a real number, not '{}'", x.TypeName()));
    }
    if (name == "float") {
        args::CheckCount(name, args, 0, 1);
        if (args.empty()) return Value::Float(0.0);
        const Value& x = args[0];
        if (x.IsNumber()) return Value::Float(x.ToDouble());
        if (x.IsStr()) return Value::Float(ParseFloat(x.AsStr()));
        throw TypeError(std::format("float() argument must be a string or a real number, not '{}'", x.TypeName()));
    }
    if (name == "bool") {
        args::CheckCount(name, args, 0, 1);
        return Value::Bool(!args.empty() && Truthy(args[0]));
    }
    if (name == "list") {
        args::CheckCount(name, args, 0, 1);
        return Value::List(ctx.heap.NewList(args.empty() ? std::vector<Value>{} : Materialize(args[0], ctx.heap)));
    }
    if (name == "tuple") {
        args::CheckCount(name, args, 0, 1);
        if (!args.empty() && args[0].IsTuple()) return args[0];
        return Value::List(ctx.heap.NewTuple(args.empty() ? std::vector<Value>{} : Materialize(args[0], ctx.heap)));
    }
    if (name == "range") {
        return MakeRange(args);
    }
    if (name == "any" || name == "all") {
        args::CheckCount(name, args, 1, 1);
        const bool wantAny = name == "any";
        for (const auto& item : Materialize(args[0], ctx.heap)) {
            if (Truthy(item) == wantAny) {
                return Value::Bool(wantAny);
            }
        }
        return Value::Bool(!wantAny);
    }
    if (name == "pow") {
        args::CheckCount(name, args, 2, 2);
        return BinaryOp(BinOpType::Pow, args[0], args[1], ctx.heap);
    }
    if (name == "zip") {
        std::vector<std::vector<Value>> columns;
        std::size_t shortest = std::numeric_limits<std::size_t>::max();
        for (const auto& iterable : args) {
            columns.push_back(Materialize(iterable, ctx.heap));
            shortest = std::min(shortest, columns.back().size());
        }
        if (columns.empty()) {
            shortest = 0;
        }

        std::vector<Value> rows;
        rows.reserve(shortest);
        for (std::size_t i = 0; i < shortest; ++i) {
            std::vector<Value> row;
            row.reserve(columns.size());
            for (auto& column : columns) {
                row.push_back(column[i]);
            }
            rows.push_back(Value::List(ctx.heap.NewTuple(std::move(row))));
        }
        return Value::List(ctx.heap.NewList(std::move(rows)));
    }

    throw NameError(std::format("name '{}' is not defined", name));
}

Value GetMathConstant(std::string_view name) {
    if (name == "pi") return Value::Float(std::numbers::pi);
    if (name == "e") return Value::Float(std::numbers::e);
    if (name == "inf") return Value::Float(std::numeric_limits<double>::infinity());
    if (name == "nan") return Value::Float(std::numeric_limits<double>::quiet_NaN());
    throw AttributeError(std::format("module 'math' has no attribute '{}'", name));
}

Value CallMath(std::string_view name, PositionalArgs& args, KeywordArgs& kwargs, CallContext& ctx) {
    ctx.budget.Tick();
    args::CheckKeywords(name, kwargs, {});

    if (name == "sqrt") return UnaryMath(name, args, [](double x) { return std::sqrt(x); });
    if (name == "exp") return UnaryMath(name, args, [](double x) { return std::exp(x); });
    if (name == "log10") return UnaryMath(name, args, [](double x) { return std::log10(CheckPositive(x)); });
    if (name == "log2") return UnaryMath(name, args, [](double x) { return std::log2(CheckPositive(x)); });
    if (name == "fabs") return UnaryMath(name, args, [](double x) { return std::fabs(x); });
    if (name == "sin") return UnaryMath(name, args, [](double x) { return std::sin(x); });
    if (name == "cos") return UnaryMath(name, args, [](double x) { return std::cos(x); });
    if (name == "tan") return UnaryMath(name, args, [](double x) { return std::tan(x); });
    if (name == "asin") return UnaryMath(name, args, [](double x) { return std::asin(x); });
    if (name == "acos") return UnaryMath(name, args, [](double x) { return std::acos(x); });
    if (name == "atan") return UnaryMath(name, args, [](double x) { return std::atan(x); });
    if (name == "degrees") return UnaryMath(name, args, [](double x) { return x * 180.0 / std::numbers::pi; });
    if (name == "radians") return UnaryMath(name, args, [](double x) { return x * std::numbers::pi / 180.0; });
    if (name == "floor") return RoundingMath(name, args, [](double x) { return std::floor(x); });
    if (name == "ceil") return RoundingMath(name, args, [](double x) { return std::ceil(x); });
    if (name == "trunc") return RoundingMath(name, args, [](double x) { return std::trunc(x); });

    if (name == "log") {
        args::CheckCount(name, args, 1, 2);
        double x = args::RequireReal(name, args[0]);
        double result = Log(x);
        if (args.size() == 2) {
            double base = args::RequireReal(name, args[1]);
            double denominator = Log(base);
            if (denominator == 0.0) {
                throw ZeroDivisionError("float division by zero");
            }
            result /= denominator;
        }
        return Value::Float(result);
    }
    if (name == "pow") {
        args::CheckCount(name, args, 2, 2);
        double x = args::RequireReal(name, args[0]);
        double y = args::RequireReal(name, args[1]);
        if (x == 0.0 && y < 0.0) {
            throw ValueError("math domain error");
        }
        double result = std::pow(x, y);
        if (std::isnan(result) && !std::isnan(x) && !std::isnan(y)) {
            throw ValueError("math domain error");
        }
        if (std::isinf(result) && std::isfinite(x) && std::isfinite(y)) {
            throw OverflowError("math range error");
        }
        return Value::Float(result);
    }
    if (name == "atan2") {
        args::CheckCount(name, args, 2, 2);
        return Value::Float(std::atan2(args::RequireReal(name, args[0]), args::RequireReal(name, args[1])));
    }
    if (name == "isnan" || name == "isinf" || name == "isfinite") {
        args::CheckCount(name, args, 1, 1);
        double x = args::RequireReal(name, args[0]);
        if (name == "isnan") return Value::Bool(std::isnan(x));
        if (name == "isinf") return Value::Bool(std::isinf(x));
        return Value::Bool(std::isfinite(x));
    }

    throw AttributeError(std::format("module 'math' has no attribute '{}'", name));
}

} // namespace signal_lambda::runtime
