#pragma once
//
// ExecutionNamespace - the only state a lambda program can see
//
// Holds the variable bindings and the heap their containers live in. Builtins
// and the math namespace are not bindings: they are resolved by the
// interpreter from the fixed grammar tables and cannot be rebound.
//

#include "heap.h"
#include "value.h"
#include <string>
#include <string_view>
#include <unordered_map>

namespace signal_lambda::runtime {

class ExecutionNamespace {
public:
    explicit ExecutionNamespace(ResourceBudget& budget) : m_heap(budget) {}

    ExecutionNamespace(const ExecutionNamespace&) = delete;
    ExecutionNamespace& operator=(const ExecutionNamespace&) = delete;

    void Bind(const std::string& name, Value value);
    void Unbind(std::string_view name);

    // nullptr when unbound
    [[nodiscard]] const Value* Lookup(std::string_view name) const;

    // Throws NameError when unbound
    [[nodiscard]] const Value& Get(std::string_view name) const;

    [[nodiscard]] Heap& GetHeap() { return m_heap; }

private:
    Heap m_heap;
    std::unordered_map<std::string, Value> m_variables;
};

} // namespace signal_lambda::runtime
