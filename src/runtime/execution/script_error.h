#pragma once
//
// ScriptError - an exception raised by the submitted program itself
//
// Carries a Python-style kind ("TypeError", "ZeroDivisionError", ...) and the
// source line of the statement that raised it. Never leaves the confinement
// runtime: it is converted to a RuntimeExecutionError at that boundary.
//

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace signal_lambda::runtime {

class ScriptError : public std::runtime_error {
public:
    ScriptError(std::string kind, const std::string& message)
        : std::runtime_error(kind + ": " + message), m_kind(std::move(kind)), m_message(message) {}

    [[nodiscard]] const std::string& GetKind() const noexcept { return m_kind; }
    [[nodiscard]] const std::string& GetMessage() const noexcept { return m_message; }

    [[nodiscard]] const std::optional<int>& GetLine() const noexcept { return m_line; }
    [[nodiscard]] const std::optional<int>& GetColumn() const noexcept { return m_column; }

    // First statement to see the error pins its location
    void SetLocationIfUnset(int line, int column) {
        if (!m_line) {
            m_line = line;
            m_column = column;
        }
    }

private:
    std::string m_kind;
    std::string m_message;
    std::optional<int> m_line;
    std::optional<int> m_column;
};

inline ScriptError TypeError(const std::string& message) { return {"TypeError", message}; }
inline ScriptError ValueError(const std::string& message) { return {"ValueError", message}; }
inline ScriptError IndexError(const std::string& message) { return {"IndexError", message}; }
inline ScriptError KeyError(const std::string& message) { return {"KeyError", message}; }
inline ScriptError NameError(const std::string& message) { return {"NameError", message}; }
inline ScriptError ZeroDivisionError(const std::string& message) { return {"ZeroDivisionError", message}; }
inline ScriptError OverflowError(const std::string& message) { return {"OverflowError", message}; }
inline ScriptError RecursionError(const std::string& message) { return {"RecursionError", message}; }
inline ScriptError AttributeError(const std::string& message) { return {"AttributeError", message}; }
inline ScriptError RuntimeError(const std::string& message) { return {"RuntimeError", message}; }

} // namespace signal_lambda::runtime
