#include "execution_namespace.h"
#include "script_error.h"
#include <format>

namespace signal_lambda::runtime {

void ExecutionNamespace::Bind(const std::string& name, Value value) {
    m_variables.insert_or_assign(name, std::move(value));
}

void ExecutionNamespace::Unbind(std::string_view name) {
    m_variables.erase(std::string{name});
}

const Value* ExecutionNamespace::Lookup(std::string_view name) const {
    auto it = m_variables.find(std::string{name});
    return it == m_variables.end() ? nullptr : &it->second;
}

const Value& ExecutionNamespace::Get(std::string_view name) const {
    const Value* value = Lookup(name);
    if (!value) {
        throw NameError(std::format("name '{}' is not defined", name));
    }
    return *value;
}

} // namespace signal_lambda::runtime
