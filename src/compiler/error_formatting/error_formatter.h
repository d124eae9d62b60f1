#pragma once

#include <string>

namespace signal_lambda {
namespace error_formatting {

/**
 * Base class for diagnostics that need more than a one-line message.
 * Location is carried separately by the exception, so Format() only
 * renders the text.
 */
class ErrorFormatter {
public:
    virtual ~ErrorFormatter() = default;

    virtual std::string Format() const = 0;

protected:
    static std::string Indent(const std::string& text, int spaces = 2) {
        return std::string(static_cast<std::size_t>(spaces), ' ') + text;
    }
};

} // namespace error_formatting
} // namespace signal_lambda
