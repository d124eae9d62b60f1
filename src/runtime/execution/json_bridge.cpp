#include "json_bridge.h"
#include "script_error.h"
#include <signal_lambda/core/constants.h>
#include <algorithm>
#include <cmath>
#include <format>
#include <type_traits>

namespace signal_lambda::runtime {

namespace {

constexpr double kMaxExactInteger = 9007199254740992.0;  // 2^53

Value FromJsonAt(const JsonValue& json, Heap& heap, std::size_t depth) {
    if (depth > constants::kMaxValueDepth) {
        throw ValueError("input JSON is nested too deeply");
    }

    return std::visit(
        [&heap, depth](const auto& v) -> Value {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) {
                return Value::None();
            } else if constexpr (std::is_same_v<T, bool>) {
                return Value::Bool(v);
            } else if constexpr (std::is_floating_point_v<T>) {
                double number = static_cast<double>(v);
                if (std::trunc(number) == number && std::fabs(number) <= kMaxExactInteger) {
                    return Value::Int(static_cast<std::int64_t>(number));
                }
                return Value::Float(number);
            } else if constexpr (std::is_integral_v<T>) {
                return Value::Int(static_cast<std::int64_t>(v));
            } else if constexpr (std::is_same_v<T, std::string>) {
                return heap.NewStr(v);
            } else if constexpr (std::is_same_v<T, JsonValue::array_t>) {
                std::vector<Value> items;
                items.reserve(v.size());
                for (const auto& item : v) {
                    items.push_back(FromJsonAt(item, heap, depth + 1));
                }
                return Value::List(heap.NewList(std::move(items)));
            } else {
                DictObject* dict = heap.NewDict();
                heap.Charge(v.size());
                for (const auto& [key, item] : v) {
                    dict->Set(DictKey{key}, heap.NewStr(key), FromJsonAt(item, heap, depth + 1));
                }
                return Value::Dict(dict);
            }
        },
        json.data);
}

std::string JsonKey(const Value& key) {
    if (key.IsStr()) {
        return key.AsStr();
    }
    if (key.IsBool()) {
        return key.AsBool() ? "true" : "false";
    }
    if (key.IsInt()) {
        return std::to_string(key.AsInt());
    }
    throw TypeError(std::format("keys must be str or int, not {}", key.TypeName()));
}

JsonValue ToJsonAt(const Value& value, std::vector<const void*>& stack, ResourceBudget& budget) {
    if (stack.size() > constants::kMaxValueDepth) {
        throw ValueError("result is nested too deeply");
    }

    budget.ChargeOutput(value.IsStr() ? value.AsStr().size() : 0);
    JsonValue json;
    if (value.IsNone()) {
        json.data = nullptr;
    } else if (value.IsBool()) {
        json.data = value.AsBool();
    } else if (value.IsInt()) {
        json.data = static_cast<double>(value.AsInt());
    } else if (value.IsFloat()) {
        if (!std::isfinite(value.AsFloat())) {
            throw ValueError("Out of range float values are not JSON compliant");
        }
        json.data = value.AsFloat();
    } else if (value.IsStr()) {
        json.data = value.AsStr();
    } else if (value.IsSequenceObject()) {
        const ListObject* list = value.AsList();
        if (std::ranges::find(stack, list) != stack.end()) {
            throw ValueError("Circular reference detected");
        }
        stack.push_back(list);
        JsonValue::array_t array;
        array.reserve(list->items.size());
        for (const auto& item : list->items) {
            array.push_back(ToJsonAt(item, stack, budget));
        }
        stack.pop_back();
        json.data = std::move(array);
    } else if (value.IsDict()) {
        const DictObject* dict = value.AsDict();
        if (std::ranges::find(stack, dict) != stack.end()) {
            throw ValueError("Circular reference detected");
        }
        stack.push_back(dict);
        JsonValue::object_t object;
        for (const auto& [key, item] : dict->entries) {
            std::string name = JsonKey(key);
            budget.ChargeOutput(name.size());
            object.insert_or_assign(std::move(name), ToJsonAt(item, stack, budget));
        }
        stack.pop_back();
        json.data = std::move(object);
    } else {
        throw TypeError(std::format("Object of type {} is not JSON serializable", value.TypeName()));
    }
    return json;
}

} // namespace

Value FromJson(const JsonValue& json, Heap& heap) {
    return FromJsonAt(json, heap, 0);
}

DictObject* RecordToDict(const SignalRecord& record, std::size_t origin, Heap& heap) {
    DictObject* dict = heap.NewDict();
    heap.Charge(record.Size());
    dict->origin = origin;
    for (const auto& [field, json] : record.GetFields()) {
        dict->Set(DictKey{field}, heap.NewStr(field), FromJsonAt(json, heap, 1));
    }
    return dict;
}

JsonValue ToJson(const Value& value, ResourceBudget& budget) {
    std::vector<const void*> stack;
    return ToJsonAt(value, stack, budget);
}

SignalRecord DictToRecord(const Value& value, ResourceBudget& budget) {
    if (!value.IsDict()) {
        throw TypeError(std::format("each signal must be a dict, got {}", value.TypeName()));
    }

    const DictObject* dict = value.AsDict();
    std::vector<const void*> stack{dict};
    FieldMap fields;
    for (const auto& [key, item] : dict->entries) {
        if (!key.IsStr()) {
            throw TypeError(std::format("signal field names must be str, got {}", key.TypeName()));
        }
        budget.ChargeOutput(key.AsStr().size());
        fields.insert_or_assign(key.AsStr(), ToJsonAt(item, stack, budget));
    }
    return SignalRecord{std::move(fields)};
}

} // namespace signal_lambda::runtime
