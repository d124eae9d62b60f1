#pragma once
//
// Runtime values of the lambda interpreter
//
// Scalars are held inline. Strings are immutable and shared between copies of a
// Value. Lists, tuples and dicts live in the per-call Heap and are referenced by
// raw pointer; the heap outlives every Value that points into it, and nothing
// outside the namespace can hold such a pointer.
//

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace signal_lambda::runtime {

class Heap;
struct ListObject;
struct DictObject;

struct RangeValue {
    std::int64_t start{0};
    std::int64_t stop{0};
    std::int64_t step{1};

    [[nodiscard]] std::size_t Size() const;
    [[nodiscard]] std::int64_t At(std::size_t index) const {
        return start + static_cast<std::int64_t>(index) * step;
    }
};

class Value {
public:
    using StrPtr = std::shared_ptr<const std::string>;
    using Data = std::variant<std::monostate, bool, std::int64_t, double, StrPtr,
                              ListObject*, DictObject*, RangeValue>;

    Value() = default;

    static Value None() { return Value{}; }
    static Value Bool(bool value) { return Value{Data{value}}; }
    static Value Int(std::int64_t value) { return Value{Data{value}}; }
    static Value Float(double value) { return Value{Data{value}}; }
    // Unaccounted string; program-created text goes through Heap::NewStr
    static Value Str(std::string value) {
        return Value{Data{std::make_shared<const std::string>(std::move(value))}};
    }
    static Value Str(StrPtr value) { return Value{Data{std::move(value)}}; }
    static Value List(ListObject* list) { return Value{Data{list}}; }
    static Value Dict(DictObject* dict) { return Value{Data{dict}}; }
    static Value Range(RangeValue range) { return Value{Data{range}}; }

    [[nodiscard]] bool IsNone() const { return std::holds_alternative<std::monostate>(m_data); }
    [[nodiscard]] bool IsBool() const { return std::holds_alternative<bool>(m_data); }
    [[nodiscard]] bool IsInt() const { return std::holds_alternative<std::int64_t>(m_data); }
    [[nodiscard]] bool IsFloat() const { return std::holds_alternative<double>(m_data); }
    [[nodiscard]] bool IsStr() const { return std::holds_alternative<StrPtr>(m_data); }
    [[nodiscard]] bool IsDict() const { return std::holds_alternative<DictObject*>(m_data); }
    [[nodiscard]] bool IsRange() const { return std::holds_alternative<RangeValue>(m_data); }

    // Lists and tuples share a representation
    [[nodiscard]] bool IsSequenceObject() const { return std::holds_alternative<ListObject*>(m_data); }
    [[nodiscard]] bool IsList() const;
    [[nodiscard]] bool IsTuple() const;

    // bool, int or float
    [[nodiscard]] bool IsNumber() const { return IsBool() || IsInt() || IsFloat(); }
    // bool or int
    [[nodiscard]] bool IsIntegral() const { return IsBool() || IsInt(); }

    [[nodiscard]] bool AsBool() const { return std::get<bool>(m_data); }
    [[nodiscard]] std::int64_t AsInt() const { return std::get<std::int64_t>(m_data); }
    [[nodiscard]] double AsFloat() const { return std::get<double>(m_data); }
    [[nodiscard]] const std::string& AsStr() const { return *std::get<StrPtr>(m_data); }
    [[nodiscard]] ListObject* AsList() const { return std::get<ListObject*>(m_data); }
    [[nodiscard]] DictObject* AsDict() const { return std::get<DictObject*>(m_data); }
    [[nodiscard]] const RangeValue& AsRange() const { return std::get<RangeValue>(m_data); }

    // bool or int widened to int64
    [[nodiscard]] std::int64_t ToInteger() const { return IsBool() ? (AsBool() ? 1 : 0) : AsInt(); }
    // any number widened to double
    [[nodiscard]] double ToDouble() const;

    [[nodiscard]] const Data& GetData() const { return m_data; }

    // Python type name, as used in error messages
    [[nodiscard]] std::string_view TypeName() const;

private:
    explicit Value(Data data) : m_data(std::move(data)) {}

    Data m_data;
};

struct ListObject {
    std::vector<Value> items;
    bool frozen{false};  // tuple
    Heap* owner{nullptr};
};

// Dict keys are normalized so that True, 1 and 1.0 address the same entry
using DictKey = std::variant<std::int64_t, std::string>;

struct DictObject {
    std::vector<std::pair<Value, Value>> entries;  // insertion order
    std::map<DictKey, std::size_t> index;
    Heap* owner{nullptr};

    // Input record this dict was derived from, carried through copies
    std::optional<std::size_t> origin;

    [[nodiscard]] std::size_t Size() const { return entries.size(); }
    [[nodiscard]] Value* Find(const DictKey& key);
    [[nodiscard]] const Value* Find(const DictKey& key) const;

    // Returns true when the key was new
    bool Set(const DictKey& key, Value keyValue, Value value);
    bool Erase(const DictKey& key);
};

// Throws TypeError for values that cannot be dict keys
DictKey MakeDictKey(const Value& key);

} // namespace signal_lambda::runtime
