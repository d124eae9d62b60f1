#pragma once

#include "error_formatter.h"
#include <cstddef>
#include <string>
#include <vector>

namespace signal_lambda {
namespace error_formatting {

/**
 * Formats wrong-arity calls of builtins, math functions and methods, in the
 * wording Python uses: "len() takes exactly one argument (2 given)".
 */
class ArgumentCountError : public ErrorFormatter {
public:
    ArgumentCountError(
        const std::string& function_name,
        std::size_t min_count,
        std::size_t max_count,
        std::size_t received_count
    ) : function_name_(function_name),
        min_count_(min_count),
        max_count_(max_count),
        received_count_(received_count) {}

    std::string Format() const override;

private:
    std::string function_name_;
    std::size_t min_count_;
    std::size_t max_count_;
    std::size_t received_count_;
};

/**
 * Formats references to names the program never binds, with the closest
 * known name as a suggestion when one is near enough.
 */
class UnknownIdentifierError : public ErrorFormatter {
public:
    UnknownIdentifierError(
        const std::string& name,
        const std::vector<std::string>& known_names
    ) : name_(name),
        known_names_(known_names) {}

    std::string Format() const override;

private:
    std::string name_;
    std::vector<std::string> known_names_;

    static std::size_t EditDistance(const std::string& a, const std::string& b);
};

/**
 * Formats keyword arguments a function does not accept.
 */
class UnexpectedKeywordError : public ErrorFormatter {
public:
    UnexpectedKeywordError(
        const std::string& function_name,
        const std::string& keyword
    ) : function_name_(function_name),
        keyword_(keyword) {}

    std::string Format() const override;

private:
    std::string function_name_;
    std::string keyword_;
};

} // namespace error_formatting
} // namespace signal_lambda
