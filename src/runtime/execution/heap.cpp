#include "heap.h"
#include "script_error.h"
#include <format>
#include <stdexcept>

namespace signal_lambda::runtime {

ListObject* Heap::NewList(std::vector<Value> items) {
    Charge(items.size() + 1);
    auto list = std::make_unique<ListObject>();
    list->items = std::move(items);
    list->owner = this;
    m_lists.push_back(std::move(list));
    return m_lists.back().get();
}

ListObject* Heap::NewTuple(std::vector<Value> items) {
    ListObject* tuple = NewList(std::move(items));
    tuple->frozen = true;
    return tuple;
}

DictObject* Heap::NewDict() {
    Charge(1);
    auto dict = std::make_unique<DictObject>();
    dict->owner = this;
    m_dicts.push_back(std::move(dict));
    return m_dicts.back().get();
}

Value Heap::NewStr(std::string text) {
    auto owned = std::make_unique<const std::string>(std::move(text));
    const std::size_t bytes = owned->size();
    m_budget.ChargeStringBytes(bytes);

    ResourceBudget* budget = &m_budget;
    return Value::Str(Value::StrPtr(owned.release(), [budget, bytes](const std::string* released) {
        budget->ReleaseStringBytes(bytes);
        delete released;
    }));
}

void Heap::GuardWrite(const ListObject& list) const {
    if (!Owns(list)) {
        throw std::logic_error("write into a list owned by another execution namespace");
    }
    if (list.frozen) {
        throw TypeError("'tuple' object does not support item assignment");
    }
}

void Heap::GuardWrite(const DictObject& dict) const {
    if (!Owns(dict)) {
        throw std::logic_error("write into a dict owned by another execution namespace");
    }
}

} // namespace signal_lambda::runtime
