#include "value.h"
#include "script_error.h"
#include <cmath>
#include <format>
#include <limits>

namespace signal_lambda::runtime {

std::size_t RangeValue::Size() const {
    if (step > 0 && start < stop) {
        auto span = static_cast<std::uint64_t>(stop) - static_cast<std::uint64_t>(start);
        return static_cast<std::size_t>((span - 1) / static_cast<std::uint64_t>(step) + 1);
    }
    if (step < 0 && start > stop) {
        auto span = static_cast<std::uint64_t>(start) - static_cast<std::uint64_t>(stop);
        auto stride = static_cast<std::uint64_t>(-(step + 1)) + 1;
        return static_cast<std::size_t>((span - 1) / stride + 1);
    }
    return 0;
}

bool Value::IsList() const {
    auto* list = std::get_if<ListObject*>(&m_data);
    return list && !(*list)->frozen;
}

bool Value::IsTuple() const {
    auto* list = std::get_if<ListObject*>(&m_data);
    return list && (*list)->frozen;
}

double Value::ToDouble() const {
    if (IsFloat()) {
        return AsFloat();
    }
    return static_cast<double>(ToInteger());
}

std::string_view Value::TypeName() const {
    return std::visit(
        [](const auto& value) -> std::string_view {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return "NoneType";
            } else if constexpr (std::is_same_v<T, bool>) {
                return "bool";
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                return "int";
            } else if constexpr (std::is_same_v<T, double>) {
                return "float";
            } else if constexpr (std::is_same_v<T, StrPtr>) {
                return "str";
            } else if constexpr (std::is_same_v<T, ListObject*>) {
                return value->frozen ? "tuple" : "list";
            } else if constexpr (std::is_same_v<T, DictObject*>) {
                return "dict";
            } else {
                return "range";
            }
        },
        m_data);
}

Value* DictObject::Find(const DictKey& key) {
    auto it = index.find(key);
    return it == index.end() ? nullptr : &entries[it->second].second;
}

const Value* DictObject::Find(const DictKey& key) const {
    auto it = index.find(key);
    return it == index.end() ? nullptr : &entries[it->second].second;
}

bool DictObject::Set(const DictKey& key, Value keyValue, Value value) {
    auto it = index.find(key);
    if (it != index.end()) {
        entries[it->second].second = std::move(value);
        return false;
    }
    index.emplace(key, entries.size());
    entries.emplace_back(std::move(keyValue), std::move(value));
    return true;
}

bool DictObject::Erase(const DictKey& key) {
    auto it = index.find(key);
    if (it == index.end()) {
        return false;
    }

    std::size_t position = it->second;
    entries.erase(entries.begin() + static_cast<std::ptrdiff_t>(position));
    index.erase(it);
    for (auto& [_, slot] : index) {
        if (slot > position) {
            --slot;
        }
    }
    return true;
}

DictKey MakeDictKey(const Value& key) {
    if (key.IsStr()) {
        return key.AsStr();
    }
    if (key.IsIntegral()) {
        return key.ToInteger();
    }
    if (key.IsFloat()) {
        double value = key.AsFloat();
        if (std::isfinite(value) && std::trunc(value) == value &&
            value >= -9.2e18 && value <= 9.2e18) {
            return static_cast<std::int64_t>(value);
        }
    }
    if (key.IsList() || key.IsDict()) {
        throw TypeError(std::format("unhashable type: '{}'", key.TypeName()));
    }
    throw TypeError(std::format("dict keys must be str or int, not '{}'", key.TypeName()));
}

} // namespace signal_lambda::runtime
