#include "value_ops.h"
#include "script_error.h"
#include <signal_lambda/core/constants.h>
#include <signal_lambda/core/sandbox_error.h>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <compare>
#include <format>
#include <limits>

namespace signal_lambda::runtime {

namespace {

constexpr const char* kIntegerOverflow = "integer overflow (values are limited to 64 bits)";

std::int64_t CheckedAdd(std::int64_t a, std::int64_t b) {
    std::int64_t result;
    if (__builtin_add_overflow(a, b, &result)) {
        throw OverflowError(kIntegerOverflow);
    }
    return result;
}

std::int64_t CheckedSub(std::int64_t a, std::int64_t b) {
    std::int64_t result;
    if (__builtin_sub_overflow(a, b, &result)) {
        throw OverflowError(kIntegerOverflow);
    }
    return result;
}

std::int64_t CheckedMul(std::int64_t a, std::int64_t b) {
    std::int64_t result;
    if (__builtin_mul_overflow(a, b, &result)) {
        throw OverflowError(kIntegerOverflow);
    }
    return result;
}

std::int64_t IntPow(std::int64_t base, std::int64_t exponent) {
    std::int64_t result = 1;
    while (exponent > 0) {
        if (exponent & 1) {
            result = CheckedMul(result, base);
        }
        exponent >>= 1;
        if (exponent > 0) {
            base = CheckedMul(base, base);
        }
    }
    return result;
}

std::int64_t FloorDivInt(std::int64_t a, std::int64_t b) {
    if (b == 0) {
        throw ZeroDivisionError("integer division or modulo by zero");
    }
    if (a == std::numeric_limits<std::int64_t>::min() && b == -1) {
        throw OverflowError(kIntegerOverflow);
    }
    std::int64_t quotient = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --quotient;
    }
    return quotient;
}

std::int64_t ModInt(std::int64_t a, std::int64_t b) {
    if (b == 0) {
        throw ZeroDivisionError("integer division or modulo by zero");
    }
    if (b == -1) {
        return 0;
    }
    std::int64_t remainder = a % b;
    if (remainder != 0 && ((remainder < 0) != (b < 0))) {
        remainder += b;
    }
    return remainder;
}

double ModFloat(double a, double b) {
    if (b == 0.0) {
        throw ZeroDivisionError("float modulo by zero");
    }
    double remainder = std::fmod(a, b);
    if (remainder != 0.0) {
        if ((b < 0) != (remainder < 0)) {
            remainder += b;
        }
    } else {
        remainder = std::copysign(0.0, b);
    }
    return remainder;
}

double FloorDivFloat(double a, double b) {
    if (b == 0.0) {
        throw ZeroDivisionError("float floor division by zero");
    }
    double mod = std::fmod(a, b);
    double div = (a - mod) / b;
    if (mod != 0.0 && ((b < 0) != (mod < 0))) {
        div -= 1.0;
    }
    if (div == 0.0) {
        return std::copysign(0.0, a / b);
    }
    double floored = std::floor(div);
    if (div - floored > 0.5) {
        floored += 1.0;
    }
    return floored;
}

double PowFloat(double base, double exponent) {
    if (base == 0.0 && exponent < 0.0) {
        throw ZeroDivisionError("0.0 cannot be raised to a negative power");
    }
    if (base < 0.0 && std::isfinite(exponent) && std::trunc(exponent) != exponent) {
        throw ValueError("negative number cannot be raised to a fractional power");
    }
    double result = std::pow(base, exponent);
    if (std::isinf(result) && std::isfinite(base) && std::isfinite(exponent)) {
        throw OverflowError("Numerical result out of range");
    }
    return result;
}

[[noreturn]] void ThrowUnsupportedOperands(BinOpType op, const Value& lhs, const Value& rhs) {
    throw TypeError(std::format("unsupported operand type(s) for {}: '{}' and '{}'", BinOpSymbol(op),
                                lhs.TypeName(), rhs.TypeName()));
}

Value ArithmeticOp(BinOpType op, const Value& lhs, const Value& rhs) {
    const bool integral = lhs.IsIntegral() && rhs.IsIntegral();

    if (integral) {
        std::int64_t a = lhs.ToInteger();
        std::int64_t b = rhs.ToInteger();
        switch (op) {
            case BinOpType::Add: return Value::Int(CheckedAdd(a, b));
            case BinOpType::Sub: return Value::Int(CheckedSub(a, b));
            case BinOpType::Mult: return Value::Int(CheckedMul(a, b));
            case BinOpType::Div:
                if (b == 0) {
                    throw ZeroDivisionError("division by zero");
                }
                return Value::Float(static_cast<double>(a) / static_cast<double>(b));
            case BinOpType::FloorDiv: return Value::Int(FloorDivInt(a, b));
            case BinOpType::Mod: return Value::Int(ModInt(a, b));
            case BinOpType::Pow:
                if (b < 0) {
                    return Value::Float(PowFloat(static_cast<double>(a), static_cast<double>(b)));
                }
                return Value::Int(IntPow(a, b));
            default: break;
        }
    } else {
        double a = lhs.ToDouble();
        double b = rhs.ToDouble();
        switch (op) {
            case BinOpType::Add: return Value::Float(a + b);
            case BinOpType::Sub: return Value::Float(a - b);
            case BinOpType::Mult: return Value::Float(a * b);
            case BinOpType::Div:
                if (b == 0.0) {
                    throw ZeroDivisionError("float division by zero");
                }
                return Value::Float(a / b);
            case BinOpType::FloorDiv: return Value::Float(FloorDivFloat(a, b));
            case BinOpType::Mod: return Value::Float(ModFloat(a, b));
            case BinOpType::Pow: return Value::Float(PowFloat(a, b));
            default: break;
        }
    }
    ThrowUnsupportedOperands(op, lhs, rhs);
}

Value RepeatSequence(const Value& sequence, std::int64_t count, Heap& heap) {
    ResourceBudget& budget = heap.GetBudget();
    const std::size_t times = count > 0 ? static_cast<std::size_t>(count) : 0;

    if (sequence.IsStr()) {
        const std::string& text = sequence.AsStr();
        if (!text.empty() && times > budget.GetLimits().max_string_length / text.size()) {
            budget.CheckStringLength(budget.GetLimits().max_string_length + 1);
        }
        budget.CheckStringLength(text.size() * times);
        budget.Tick(1 + text.size() * times / 64);

        std::string repeated;
        repeated.reserve(text.size() * times);
        for (std::size_t i = 0; i < times; ++i) {
            repeated += text;
        }
        return heap.NewStr(std::move(repeated));
    }

    const ListObject* source = sequence.AsList();
    const std::size_t size = source->items.size();
    if (size != 0 && times > budget.GetLimits().max_heap_elements / size) {
        budget.ChargeElements(budget.GetLimits().max_heap_elements + 1);
    }
    budget.Tick(1 + size * times / 16);

    std::vector<Value> items;
    items.reserve(size * times);
    for (std::size_t i = 0; i < times; ++i) {
        items.insert(items.end(), source->items.begin(), source->items.end());
    }
    return Value::List(source->frozen ? heap.NewTuple(std::move(items)) : heap.NewList(std::move(items)));
}

Value ConcatSequences(const Value& lhs, const Value& rhs, Heap& heap) {
    ResourceBudget& budget = heap.GetBudget();

    if (lhs.IsStr()) {
        budget.CheckStringLength(lhs.AsStr().size() + rhs.AsStr().size());
        budget.Tick(1 + (lhs.AsStr().size() + rhs.AsStr().size()) / 64);
        return heap.NewStr(lhs.AsStr() + rhs.AsStr());
    }

    const ListObject* left = lhs.AsList();
    const ListObject* right = rhs.AsList();
    budget.Tick(1 + (left->items.size() + right->items.size()) / 16);

    std::vector<Value> items;
    items.reserve(left->items.size() + right->items.size());
    items.insert(items.end(), left->items.begin(), left->items.end());
    items.insert(items.end(), right->items.begin(), right->items.end());
    return Value::List(left->frozen ? heap.NewTuple(std::move(items)) : heap.NewList(std::move(items)));
}

std::partial_ordering Order(BinOpType op, const Value& lhs, const Value& rhs, std::size_t depth);

std::partial_ordering OrderSequences(BinOpType op, const ListObject& lhs, const ListObject& rhs, std::size_t depth) {
    std::size_t common = std::min(lhs.items.size(), rhs.items.size());
    for (std::size_t i = 0; i < common; ++i) {
        if (!Equals(lhs.items[i], rhs.items[i], depth + 1)) {
            return Order(op, lhs.items[i], rhs.items[i], depth + 1);
        }
    }
    return lhs.items.size() <=> rhs.items.size();
}

std::partial_ordering Order(BinOpType op, const Value& lhs, const Value& rhs, std::size_t depth) {
    if (depth > constants::kMaxValueDepth) {
        throw RecursionError("maximum recursion depth exceeded in comparison");
    }

    if (lhs.IsNumber() && rhs.IsNumber()) {
        if (lhs.IsIntegral() && rhs.IsIntegral()) {
            return lhs.ToInteger() <=> rhs.ToInteger();
        }
        return lhs.ToDouble() <=> rhs.ToDouble();
    }
    if (lhs.IsStr() && rhs.IsStr()) {
        return lhs.AsStr().compare(rhs.AsStr()) <=> 0;
    }
    if ((lhs.IsList() && rhs.IsList()) || (lhs.IsTuple() && rhs.IsTuple())) {
        return OrderSequences(op, *lhs.AsList(), *rhs.AsList(), depth);
    }

    throw TypeError(std::format("'{}' not supported between instances of '{}' and '{}'", BinOpSymbol(op),
                                lhs.TypeName(), rhs.TypeName()));
}

bool Identical(const Value& lhs, const Value& rhs) {
    if (lhs.IsNone() || rhs.IsNone()) {
        return lhs.IsNone() && rhs.IsNone();
    }
    if (lhs.GetData().index() != rhs.GetData().index()) {
        return false;
    }
    if (lhs.IsSequenceObject()) {
        return lhs.AsList() == rhs.AsList();
    }
    if (lhs.IsDict()) {
        return lhs.AsDict() == rhs.AsDict();
    }
    return Equals(lhs, rhs);
}

std::string ReprString(const std::string& text) {
    const bool useDouble = text.find('\'') != std::string::npos && text.find('"') == std::string::npos;
    const char quote = useDouble ? '"' : '\'';

    std::string out;
    out.reserve(text.size() + 2);
    out.push_back(quote);
    for (char c : text) {
        auto uc = static_cast<unsigned char>(c);
        if (c == quote || c == '\\') {
            out.push_back('\\');
            out.push_back(c);
        } else if (c == '\n') {
            out += "\\n";
        } else if (c == '\r') {
            out += "\\r";
        } else if (c == '\t') {
            out += "\\t";
        } else if (uc < 0x20 || uc == 0x7f) {
            out += std::format("\\x{:02x}", uc);
        } else {
            out.push_back(c);
        }
    }
    out.push_back(quote);
    return out;
}

struct ReprState {
    std::vector<const void*> stack;
    std::size_t maxLength;
};

void CheckReprLength(std::size_t length, const ReprState& state) {
    if (length > state.maxLength) {
        throw ResourceLimitExceeded(std::format("String too long (more than {} characters)", state.maxLength));
    }
}

void AppendRepr(std::string& out, const Value& value, ReprState& state);

void AppendContainerRepr(std::string& out, const Value& value, ReprState& state) {
    auto& stack = state.stack;
    if (stack.size() > constants::kMaxValueDepth) {
        throw RecursionError("maximum recursion depth exceeded while getting the repr of an object");
    }

    if (value.IsDict()) {
        const DictObject* dict = value.AsDict();
        if (std::ranges::find(stack, dict) != stack.end()) {
            out += "{...}";
            return;
        }
        stack.push_back(dict);
        out.push_back('{');
        bool first = true;
        for (const auto& [key, item] : dict->entries) {
            if (!first) {
                out += ", ";
            }
            first = false;
            AppendRepr(out, key, state);
            out += ": ";
            AppendRepr(out, item, state);
        }
        out.push_back('}');
        stack.pop_back();
        return;
    }

    const ListObject* list = value.AsList();
    if (std::ranges::find(stack, list) != stack.end()) {
        out += list->frozen ? "(...)" : "[...]";
        return;
    }
    stack.push_back(list);
    out.push_back(list->frozen ? '(' : '[');
    for (std::size_t i = 0; i < list->items.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        AppendRepr(out, list->items[i], state);
    }
    if (list->frozen && list->items.size() == 1) {
        out.push_back(',');
    }
    out.push_back(list->frozen ? ')' : ']');
    stack.pop_back();
}

void AppendRepr(std::string& out, const Value& value, ReprState& state) {
    if (value.IsStr()) {
        CheckReprLength(out.size() + value.AsStr().size(), state);
        out += ReprString(value.AsStr());
    } else if (value.IsDict() || value.IsSequenceObject()) {
        AppendContainerRepr(out, value, state);
    } else {
        out += ToStr(value, state.maxLength);
    }
    CheckReprLength(out.size(), state);
}

std::optional<std::int64_t> RequireIndex(const Value& key, std::string_view typeName) {
    if (key.IsIntegral()) {
        return key.ToInteger();
    }
    throw TypeError(std::format("{} indices must be integers or slices, not {}", typeName, key.TypeName()));
}

} // namespace

bool Truthy(const Value& value) {
    return std::visit(
        [](const auto& v) -> bool {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return false;
            } else if constexpr (std::is_same_v<T, bool>) {
                return v;
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                return v != 0;
            } else if constexpr (std::is_same_v<T, double>) {
                return v != 0.0;
            } else if constexpr (std::is_same_v<T, Value::StrPtr>) {
                return !v->empty();
            } else if constexpr (std::is_same_v<T, ListObject*>) {
                return !v->items.empty();
            } else if constexpr (std::is_same_v<T, DictObject*>) {
                return v->Size() != 0;
            } else {
                return v.Size() != 0;
            }
        },
        value.GetData());
}

bool Equals(const Value& lhs, const Value& rhs, std::size_t depth) {
    if (depth > constants::kMaxValueDepth) {
        throw RecursionError("maximum recursion depth exceeded in comparison");
    }

    if (lhs.IsNumber() && rhs.IsNumber()) {
        if (lhs.IsIntegral() && rhs.IsIntegral()) {
            return lhs.ToInteger() == rhs.ToInteger();
        }
        return lhs.ToDouble() == rhs.ToDouble();
    }
    if (lhs.IsNone() || rhs.IsNone()) {
        return lhs.IsNone() && rhs.IsNone();
    }
    if (lhs.IsStr() && rhs.IsStr()) {
        return lhs.AsStr() == rhs.AsStr();
    }
    if ((lhs.IsList() && rhs.IsList()) || (lhs.IsTuple() && rhs.IsTuple())) {
        const ListObject* left = lhs.AsList();
        const ListObject* right = rhs.AsList();
        if (left == right) {
            return true;
        }
        if (left->items.size() != right->items.size()) {
            return false;
        }
        for (std::size_t i = 0; i < left->items.size(); ++i) {
            if (!Equals(left->items[i], right->items[i], depth + 1)) {
                return false;
            }
        }
        return true;
    }
    if (lhs.IsDict() && rhs.IsDict()) {
        const DictObject* left = lhs.AsDict();
        const DictObject* right = rhs.AsDict();
        if (left == right) {
            return true;
        }
        if (left->Size() != right->Size()) {
            return false;
        }
        for (const auto& [key, value] : left->entries) {
            const Value* other = right->Find(MakeDictKey(key));
            if (!other || !Equals(value, *other, depth + 1)) {
                return false;
            }
        }
        return true;
    }
    if (lhs.IsRange() && rhs.IsRange()) {
        const RangeValue& left = lhs.AsRange();
        const RangeValue& right = rhs.AsRange();
        std::size_t size = left.Size();
        if (size != right.Size()) {
            return false;
        }
        return size == 0 || (left.start == right.start && (size == 1 || left.step == right.step));
    }
    return false;
}

bool Compare(BinOpType op, const Value& lhs, const Value& rhs) {
    switch (op) {
        case BinOpType::Eq: return Equals(lhs, rhs);
        case BinOpType::NotEq: return !Equals(lhs, rhs);
        case BinOpType::Lt: return Order(op, lhs, rhs, 0) < 0;
        case BinOpType::LtE: return Order(op, lhs, rhs, 0) <= 0;
        case BinOpType::Gt: return Order(op, lhs, rhs, 0) > 0;
        case BinOpType::GtE: return Order(op, lhs, rhs, 0) >= 0;
        case BinOpType::In: return Contains(rhs, lhs);
        case BinOpType::NotIn: return !Contains(rhs, lhs);
        case BinOpType::Is: return Identical(lhs, rhs);
        case BinOpType::IsNot: return !Identical(lhs, rhs);
        default: break;
    }
    throw std::logic_error(std::format("'{}' is not a comparison operator", BinOpSymbol(op)));
}

Value BinaryOp(BinOpType op, const Value& lhs, const Value& rhs, Heap& heap) {
    if (lhs.IsNumber() && rhs.IsNumber()) {
        return ArithmeticOp(op, lhs, rhs);
    }

    if (op == BinOpType::Add) {
        if ((lhs.IsStr() && rhs.IsStr()) || (lhs.IsList() && rhs.IsList()) || (lhs.IsTuple() && rhs.IsTuple())) {
            return ConcatSequences(lhs, rhs, heap);
        }
        if (lhs.IsStr() || rhs.IsStr()) {
            const Value& other = lhs.IsStr() ? rhs : lhs;
            throw TypeError(std::format("can only concatenate str (not \"{}\") to str", other.TypeName()));
        }
    }

    if (op == BinOpType::Mult) {
        auto isRepeatable = [](const Value& v) { return v.IsStr() || v.IsSequenceObject(); };
        if (isRepeatable(lhs) && rhs.IsIntegral()) {
            return RepeatSequence(lhs, rhs.ToInteger(), heap);
        }
        if (lhs.IsIntegral() && isRepeatable(rhs)) {
            return RepeatSequence(rhs, lhs.ToInteger(), heap);
        }
    }

    ThrowUnsupportedOperands(op, lhs, rhs);
}

Value UnaryOp(UnaryOpType op, const Value& operand) {
    switch (op) {
        case UnaryOpType::Not:
            return Value::Bool(!Truthy(operand));
        case UnaryOpType::USub:
            if (operand.IsIntegral()) {
                return Value::Int(CheckedSub(0, operand.ToInteger()));
            }
            if (operand.IsFloat()) {
                return Value::Float(-operand.AsFloat());
            }
            throw TypeError(std::format("bad operand type for unary -: '{}'", operand.TypeName()));
        case UnaryOpType::UAdd:
            if (operand.IsIntegral()) {
                return Value::Int(operand.ToInteger());
            }
            if (operand.IsFloat()) {
                return operand;
            }
            throw TypeError(std::format("bad operand type for unary +: '{}'", operand.TypeName()));
    }
    throw std::logic_error("unknown unary operator");
}

std::optional<DictKey> TryMakeDictKey(const Value& key) {
    if (key.IsList() || key.IsDict()) {
        throw TypeError(std::format("unhashable type: '{}'", key.TypeName()));
    }
    if (key.IsStr() || key.IsIntegral()) {
        return MakeDictKey(key);
    }
    if (key.IsFloat()) {
        double value = key.AsFloat();
        if (std::isfinite(value) && std::trunc(value) == value && std::fabs(value) <= 9.2e18) {
            return MakeDictKey(key);
        }
    }
    return std::nullopt;
}

bool Contains(const Value& container, const Value& item) {
    if (container.IsSequenceObject()) {
        const ListObject* list = container.AsList();
        return std::ranges::any_of(list->items, [&item](const Value& v) { return Equals(v, item); });
    }
    if (container.IsDict()) {
        auto key = TryMakeDictKey(item);
        return key && container.AsDict()->Find(*key) != nullptr;
    }
    if (container.IsStr()) {
        if (!item.IsStr()) {
            throw TypeError(std::format("'in <string>' requires string as left operand, not {}", item.TypeName()));
        }
        return container.AsStr().find(item.AsStr()) != std::string::npos;
    }
    if (container.IsRange()) {
        if (!item.IsNumber()) {
            return false;
        }
        if (item.IsFloat() && std::trunc(item.AsFloat()) != item.AsFloat()) {
            return false;
        }
        const RangeValue& range = container.AsRange();
        std::int64_t value = item.IsFloat() ? static_cast<std::int64_t>(item.AsFloat()) : item.ToInteger();
        if (range.step > 0 ? (value < range.start || value >= range.stop)
                           : (value > range.start || value <= range.stop)) {
            return false;
        }
        return (value - range.start) % range.step == 0;
    }
    throw TypeError(std::format("argument of type '{}' is not iterable", container.TypeName()));
}

std::vector<Value> Materialize(const Value& iterable, Heap& heap) {
    ResourceBudget& budget = heap.GetBudget();

    if (iterable.IsSequenceObject()) {
        const auto& items = iterable.AsList()->items;
        budget.Tick(1 + items.size() / 16);
        return items;
    }
    if (iterable.IsDict()) {
        const DictObject* dict = iterable.AsDict();
        budget.Tick(1 + dict->Size() / 16);
        std::vector<Value> keys;
        keys.reserve(dict->Size());
        for (const auto& [key, _] : dict->entries) {
            keys.push_back(key);
        }
        return keys;
    }
    if (iterable.IsStr()) {
        const std::string& text = iterable.AsStr();
        budget.Tick(1 + text.size() / 16);
        std::vector<Value> chars;
        chars.reserve(text.size());
        for (char c : text) {
            chars.push_back(heap.NewStr(std::string(1, c)));
        }
        return chars;
    }
    if (iterable.IsRange()) {
        const RangeValue& range = iterable.AsRange();
        std::size_t size = range.Size();
        heap.Charge(size);
        budget.Tick(1 + size / 16);
        std::vector<Value> numbers;
        numbers.reserve(size);
        for (std::size_t i = 0; i < size; ++i) {
            numbers.push_back(Value::Int(range.At(i)));
        }
        return numbers;
    }
    throw TypeError(std::format("'{}' object is not iterable", iterable.TypeName()));
}

std::size_t NormalizeIndex(std::int64_t index, std::size_t size, std::string_view typeName) {
    std::int64_t resolved = index < 0 ? index + static_cast<std::int64_t>(size) : index;
    if (resolved < 0 || resolved >= static_cast<std::int64_t>(size)) {
        throw IndexError(std::format("{} index out of range", typeName));
    }
    return static_cast<std::size_t>(resolved);
}

Value GetItem(const Value& container, const Value& key) {
    if (container.IsDict()) {
        auto dictKey = TryMakeDictKey(key);
        const Value* found = dictKey ? container.AsDict()->Find(*dictKey) : nullptr;
        if (!found) {
            throw KeyError(Repr(key));
        }
        return *found;
    }
    if (container.IsSequenceObject()) {
        const ListObject* list = container.AsList();
        auto index = RequireIndex(key, container.TypeName());
        return list->items[NormalizeIndex(*index, list->items.size(), container.TypeName())];
    }
    if (container.IsStr()) {
        if (!key.IsIntegral()) {
            throw TypeError(std::format("string indices must be integers, not '{}'", key.TypeName()));
        }
        const std::string& text = container.AsStr();
        return Value::Str(std::string(1, text[NormalizeIndex(key.ToInteger(), text.size(), "string")]));
    }
    if (container.IsRange()) {
        auto index = RequireIndex(key, "range");
        const RangeValue& range = container.AsRange();
        return Value::Int(range.At(NormalizeIndex(*index, range.Size(), "range object")));
    }
    throw TypeError(std::format("'{}' object is not subscriptable", container.TypeName()));
}

SliceBounds ResolveSlice(const std::optional<std::int64_t>& lower, const std::optional<std::int64_t>& upper,
                         const std::optional<std::int64_t>& step, std::size_t length) {
    std::int64_t stride = step.value_or(1);
    if (stride == 0) {
        throw ValueError("slice step cannot be zero");
    }

    auto len = static_cast<std::int64_t>(length);
    std::int64_t low = stride > 0 ? 0 : -1;
    std::int64_t high = stride > 0 ? len : len - 1;

    auto clamp = [&](const std::optional<std::int64_t>& bound, std::int64_t fallback) {
        if (!bound) {
            return fallback;
        }
        std::int64_t value = *bound;
        if (value < 0) {
            value = value < -len ? low : std::max(value + len, low);
        } else if (value > high) {
            value = high;
        }
        return value;
    };

    SliceBounds bounds{};
    bounds.step = stride;
    bounds.start = clamp(lower, stride > 0 ? low : high);
    bounds.stop = clamp(upper, stride > 0 ? high : low);

    if (stride > 0) {
        bounds.length = bounds.start < bounds.stop
                            ? static_cast<std::size_t>((bounds.stop - bounds.start - 1) / stride + 1)
                            : 0;
    } else {
        bounds.length = bounds.start > bounds.stop
                            ? static_cast<std::size_t>((bounds.start - bounds.stop - 1) / -stride + 1)
                            : 0;
    }
    return bounds;
}

Value GetSlice(const Value& container, const std::optional<std::int64_t>& lower,
               const std::optional<std::int64_t>& upper, const std::optional<std::int64_t>& step, Heap& heap) {
    if (container.IsStr()) {
        const std::string& text = container.AsStr();
        SliceBounds bounds = ResolveSlice(lower, upper, step, text.size());
        heap.GetBudget().Tick(1 + bounds.length / 64);
        std::string out;
        out.reserve(bounds.length);
        for (std::size_t i = 0; i < bounds.length; ++i) {
            out.push_back(text[static_cast<std::size_t>(bounds.start + static_cast<std::int64_t>(i) * bounds.step)]);
        }
        return heap.NewStr(std::move(out));
    }
    if (container.IsSequenceObject()) {
        const ListObject* list = container.AsList();
        SliceBounds bounds = ResolveSlice(lower, upper, step, list->items.size());
        heap.GetBudget().Tick(1 + bounds.length / 16);
        std::vector<Value> items;
        items.reserve(bounds.length);
        for (std::size_t i = 0; i < bounds.length; ++i) {
            items.push_back(list->items[static_cast<std::size_t>(bounds.start + static_cast<std::int64_t>(i) * bounds.step)]);
        }
        return Value::List(list->frozen ? heap.NewTuple(std::move(items)) : heap.NewList(std::move(items)));
    }
    if (container.IsRange()) {
        const RangeValue& range = container.AsRange();
        SliceBounds bounds = ResolveSlice(lower, upper, step, range.Size());
        RangeValue sliced;
        sliced.start = range.start + bounds.start * range.step;
        sliced.step = range.step * bounds.step;
        sliced.stop = sliced.start + static_cast<std::int64_t>(bounds.length) * sliced.step;
        return Value::Range(sliced);
    }
    throw TypeError(std::format("'{}' object is not subscriptable", container.TypeName()));
}

std::string FormatFloat(double value) {
    if (std::isnan(value)) {
        return "nan";
    }
    if (std::isinf(value)) {
        return value > 0 ? "inf" : "-inf";
    }

    char buffer[64];
    auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value, std::chars_format::scientific);
    if (ec != std::errc{}) {
        return std::format("{}", value);
    }
    std::string_view text{buffer, static_cast<std::size_t>(end - buffer)};

    // text is "[-]d[.ddd]e(+|-)XX"
    std::string sign;
    if (text.front() == '-') {
        sign = "-";
        text.remove_prefix(1);
    }
    std::size_t ePos = text.find('e');
    std::string digits;
    for (char c : text.substr(0, ePos)) {
        if (c != '.') {
            digits.push_back(c);
        }
    }
    int exponent = 0;
    std::string_view expText = text.substr(ePos + 1);
    if (expText.front() == '+') {
        expText.remove_prefix(1);
    }
    std::from_chars(expText.data(), expText.data() + expText.size(), exponent);

    if (exponent >= -4 && exponent < 16) {
        const int point = exponent + 1;
        const int count = static_cast<int>(digits.size());
        if (point <= 0) {
            return sign + "0." + std::string(static_cast<std::size_t>(-point), '0') + digits;
        }
        if (point >= count) {
            return sign + digits + std::string(static_cast<std::size_t>(point - count), '0') + ".0";
        }
        return sign + digits.substr(0, static_cast<std::size_t>(point)) + "." +
               digits.substr(static_cast<std::size_t>(point));
    }

    std::string mantissa = digits.substr(0, 1);
    if (digits.size() > 1) {
        mantissa += "." + digits.substr(1);
    }
    return std::format("{}{}e{}{:02}", sign, mantissa, exponent < 0 ? '-' : '+', std::abs(exponent));
}

std::string ToStr(const Value& value, std::size_t maxLength) {
    return std::visit(
        [&value, maxLength](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return "None";
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "True" : "False";
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                return std::to_string(v);
            } else if constexpr (std::is_same_v<T, double>) {
                return FormatFloat(v);
            } else if constexpr (std::is_same_v<T, Value::StrPtr>) {
                return *v;
            } else if constexpr (std::is_same_v<T, RangeValue>) {
                if (v.step == 1) {
                    return std::format("range({}, {})", v.start, v.stop);
                }
                return std::format("range({}, {}, {})", v.start, v.stop, v.step);
            } else {
                return Repr(value, maxLength);
            }
        },
        value.GetData());
}

std::string Repr(const Value& value, std::size_t maxLength) {
    std::string out;
    ReprState state{{}, maxLength};
    AppendRepr(out, value, state);
    return out;
}

} // namespace signal_lambda::runtime
