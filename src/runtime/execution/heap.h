#pragma once
//
// Heap - owner of every list, tuple and dict created during one execution
//
// All container writes go through GuardWrite(), which rejects writes into
// immutable containers and into containers this heap does not own. Element
// allocations and string data are charged against the call's ResourceBudget.
// Strings are released when their last Value goes away, which may be after the
// heap itself but always before the budget.
//

#include "value.h"
#include "resource_budget.h"
#include <memory>
#include <vector>

namespace signal_lambda::runtime {

class Heap {
public:
    explicit Heap(ResourceBudget& budget) : m_budget(budget) {}
    ~Heap() { m_budget.ReleaseElements(m_charged); }

    Heap(const Heap&) = delete;
    Heap& operator=(const Heap&) = delete;

    ListObject* NewList(std::vector<Value> items = {});
    ListObject* NewTuple(std::vector<Value> items);
    DictObject* NewDict();

    // Throws ResourceLimitExceeded for over-long strings or when live string
    // data would exceed the budget
    Value NewStr(std::string text);

    // Throws TypeError for tuples; std::logic_error for foreign containers
    void GuardWrite(const ListObject& list) const;
    void GuardWrite(const DictObject& dict) const;

    [[nodiscard]] bool Owns(const ListObject& list) const { return list.owner == this; }
    [[nodiscard]] bool Owns(const DictObject& dict) const { return dict.owner == this; }

    void Charge(std::size_t elements) {
        m_budget.ChargeElements(elements);
        m_charged += elements;
    }

    [[nodiscard]] ResourceBudget& GetBudget() const { return m_budget; }

private:
    ResourceBudget& m_budget;
    std::size_t m_charged{0};
    std::vector<std::unique_ptr<ListObject>> m_lists;
    std::vector<std::unique_ptr<DictObject>> m_dicts;
};

} // namespace signal_lambda::runtime
